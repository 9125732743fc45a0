/*
 * BrowserJar - Browser Cookie Extraction Engine
 * Copyright (C) 2026 BrowserJar Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "../src/Browser/LinuxCookieDecryptor.hpp"
#include "../src/Browser/MacCookieDecryptor.hpp"
#include "../src/Browser/WindowsCookieDecryptor.hpp"

using namespace BrowserJar;
using namespace BrowserJar::Browser;
using Testing::EncryptChromiumCbc;
using Testing::EncryptChromiumGcm;

namespace {

std::vector<uint8_t> Bytes(std::string_view s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> WithHashPrefix(std::string_view value) {
    std::vector<uint8_t> out(ChromiumCrypto::HASH_PREFIX_LENGTH, 0xAB);
    out.insert(out.end(), value.begin(), value.end());
    return out;
}

DataUnprotector IdentityUnprotector() {
    return [](const uint8_t* data, size_t len, std::vector<uint8_t>& out) {
        out.assign(data, data + len);
        return true;
    };
}

}  // namespace

// ============================================================================
// SHARED HELPERS
// ============================================================================

TEST(ChromiumCryptoTest, VersionTag) {
    EXPECT_TRUE(HasVersionTag(Bytes("v10abc"), "v10"));
    EXPECT_FALSE(HasVersionTag(Bytes("v11abc"), "v10"));
    EXPECT_FALSE(HasVersionTag(Bytes("v1"), "v10"));
}

TEST(ChromiumCryptoTest, DerivedKeyIsSixteenBytes) {
    std::vector<uint8_t> key;
    ASSERT_TRUE(DeriveChromiumKey("peanuts", ChromiumCrypto::LINUX_ITERATIONS, key));
    EXPECT_EQ(key.size(), ChromiumCrypto::CBC_KEY_LENGTH);

    std::vector<uint8_t> other;
    ASSERT_TRUE(DeriveChromiumKey("peanuts", ChromiumCrypto::MAC_ITERATIONS, other));
    EXPECT_NE(key, other);
}

TEST(ChromiumCryptoTest, PlaintextDecodingTrimsHashForNewSchemas) {
    const auto plain = WithHashPrefix("value");
    EXPECT_EQ(DecodeCookiePlaintext(plain, 24), "value");
    EXPECT_EQ(DecodeCookiePlaintext(Bytes("value"), 23), "value");
}

TEST(ChromiumCryptoTest, InvalidUtf8IsRejected) {
    const std::vector<uint8_t> bad = { 'a', 0xC3, 0x28 };
    EXPECT_FALSE(DecodeCookiePlaintext(bad, 0));
}

// ============================================================================
// LINUX
// ============================================================================

TEST(LinuxDecryptorTest, V10WithDefaultPassword) {
    LinuxCookieDecryptor decryptor(std::nullopt, 0);
    const auto encrypted = EncryptChromiumCbc("v10", "peanuts", 1, "hello");
    EXPECT_EQ(decryptor.Decrypt(encrypted), "hello");
}

TEST(LinuxDecryptorTest, V10FallsBackToEmptyPassword) {
    LinuxCookieDecryptor decryptor(std::nullopt, 0);
    const auto encrypted = EncryptChromiumCbc("v10", "", 1, "from-empty-key");
    EXPECT_EQ(decryptor.Decrypt(encrypted), "from-empty-key");
}

TEST(LinuxDecryptorTest, V11UsesKeyringPassword) {
    LinuxCookieDecryptor decryptor(std::string("keyring-secret"), 0);
    EXPECT_TRUE(decryptor.HasKeyringKey());
    const auto encrypted = EncryptChromiumCbc("v11", "keyring-secret", 1, "session=42");
    EXPECT_EQ(decryptor.Decrypt(encrypted), "session=42");
}

TEST(LinuxDecryptorTest, V11FallsBackToEmptyPassword) {
    LinuxCookieDecryptor decryptor(std::nullopt, 0);
    EXPECT_FALSE(decryptor.HasKeyringKey());
    const auto encrypted = EncryptChromiumCbc("v11", "", 1, "empty-v11");
    EXPECT_EQ(decryptor.Decrypt(encrypted), "empty-v11");
}

TEST(LinuxDecryptorTest, MetaVersion24DropsHashPrefix) {
    LinuxCookieDecryptor decryptor(std::nullopt, 24);
    const auto encrypted = EncryptChromiumCbc("v10", "peanuts", 1, WithHashPrefix("trimmed"));
    EXPECT_EQ(decryptor.Decrypt(encrypted), "trimmed");
}

TEST(LinuxDecryptorTest, UnknownVersionTagGivesNothing) {
    LinuxCookieDecryptor decryptor(std::nullopt, 0);
    EXPECT_FALSE(decryptor.Decrypt(Bytes("v99xxxxxxxxxxxxxxxx")));
    EXPECT_FALSE(decryptor.Decrypt(Bytes("v1")));
}

// ============================================================================
// MACOS
// ============================================================================

TEST(MacDecryptorTest, V10WithKeychainPassword) {
    MacCookieDecryptor decryptor(std::string("mac-password"), 0);
    const auto encrypted = EncryptChromiumCbc("v10", "mac-password", ChromiumCrypto::MAC_ITERATIONS, "mac-value");
    EXPECT_EQ(decryptor.Decrypt(encrypted), "mac-value");
}

TEST(MacDecryptorTest, MissingPasswordDropsValue) {
    MacCookieDecryptor decryptor(std::nullopt, 0);
    const auto encrypted = EncryptChromiumCbc("v10", "whatever", ChromiumCrypto::MAC_ITERATIONS, "hidden");
    EXPECT_EQ(decryptor.Decrypt(encrypted), std::nullopt);
}

TEST(MacDecryptorTest, OnlyV10IsKnown) {
    MacCookieDecryptor decryptor(std::string("pw"), 0);
    const auto encrypted = EncryptChromiumCbc("v11", "pw", ChromiumCrypto::MAC_ITERATIONS, "x");
    EXPECT_FALSE(decryptor.Decrypt(encrypted));
}

// ============================================================================
// WINDOWS
// ============================================================================

TEST(WindowsDecryptorTest, V10UsesAesGcmMasterKey) {
    const std::vector<uint8_t> key(WindowsCookieDecryptor::MASTER_KEY_LENGTH, 0x11);
    WindowsCookieDecryptor decryptor(key, 0, IdentityUnprotector());
    EXPECT_EQ(decryptor.Decrypt(EncryptChromiumGcm(key, "gcm-value")), "gcm-value");
}

TEST(WindowsDecryptorTest, V10TrimsHashPrefix) {
    const std::vector<uint8_t> key(WindowsCookieDecryptor::MASTER_KEY_LENGTH, 0x22);
    WindowsCookieDecryptor decryptor(key, 24, IdentityUnprotector());
    const auto prefixed = WithHashPrefix("after-hash");
    const std::string plain(prefixed.begin(), prefixed.end());
    EXPECT_EQ(decryptor.Decrypt(EncryptChromiumGcm(key, plain)), "after-hash");
}

TEST(WindowsDecryptorTest, TamperedTagFails) {
    const std::vector<uint8_t> key(WindowsCookieDecryptor::MASTER_KEY_LENGTH, 0x33);
    WindowsCookieDecryptor decryptor(key, 0, IdentityUnprotector());
    auto encrypted = EncryptChromiumGcm(key, "gcm-value");
    encrypted.back() ^= 0x01;
    EXPECT_FALSE(decryptor.Decrypt(encrypted));
}

TEST(WindowsDecryptorTest, ShortPayloadFails) {
    const std::vector<uint8_t> key(WindowsCookieDecryptor::MASTER_KEY_LENGTH, 0x44);
    WindowsCookieDecryptor decryptor(key, 0, IdentityUnprotector());
    EXPECT_FALSE(decryptor.Decrypt(Bytes("v10short")));
}

TEST(WindowsDecryptorTest, WrongKeyLengthIsIgnored) {
    const std::vector<uint8_t> key(16, 0x55);
    WindowsCookieDecryptor decryptor(key, 0, IdentityUnprotector());
    const std::vector<uint8_t> realKey(WindowsCookieDecryptor::MASTER_KEY_LENGTH, 0x55);
    EXPECT_FALSE(decryptor.Decrypt(EncryptChromiumGcm(realKey, "x")));
}

TEST(WindowsDecryptorTest, LegacyValuesGoThroughUnprotect) {
    WindowsCookieDecryptor decryptor(std::nullopt, 0, IdentityUnprotector());
    EXPECT_EQ(decryptor.Decrypt(Bytes("legacy-blob")), "legacy-blob");
}

TEST(WindowsDecryptorTest, FailedUnprotectDropsValue) {
    DataUnprotector failing = [](const uint8_t*, size_t, std::vector<uint8_t>&) { return false; };
    WindowsCookieDecryptor decryptor(std::nullopt, 0, failing);
    EXPECT_FALSE(decryptor.Decrypt(Bytes("legacy-blob")));
}
