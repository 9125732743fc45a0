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
#include "CookieDecryptor.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>

namespace BrowserJar {
namespace Browser {

namespace CryptoUtils = Utils::CryptoUtils;

bool DeriveChromiumKey(std::string_view password, uint32_t iterations, std::vector<uint8_t>& key) {
    CryptoUtils::Error cerr;
    if (!CryptoUtils::KeyDerivation::PBKDF2(password, ChromiumCrypto::KEY_SALT, iterations,
            CryptoUtils::KDFHash::SHA1, ChromiumCrypto::CBC_KEY_LENGTH, key, &cerr)) {
        BJ_LOG_ERROR("Decrypt", "Key derivation failed: %s", cerr.message.c_str());
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> DecryptChromiumCbc(const std::vector<uint8_t>& key,
                                                       const uint8_t* ciphertext, size_t len) {
    CryptoUtils::SymmetricCipher cipher(CryptoUtils::SymmetricAlgorithm::AES_128_CBC);
    CryptoUtils::Error cerr;
    if (!cipher.SetKey(key, &cerr) ||
        !cipher.SetIV(ChromiumCrypto::CBC_IV, sizeof(ChromiumCrypto::CBC_IV), &cerr)) {
        BJ_LOG_DEBUG("Decrypt", "Cipher setup failed: %s", cerr.message.c_str());
        return std::nullopt;
    }

    std::vector<uint8_t> plain;
    if (!cipher.Decrypt(ciphertext, len, plain, &cerr)) {
        BJ_LOG_TRACE("Decrypt", "CBC decrypt failed: %s", cerr.message.c_str());
        return std::nullopt;
    }
    return plain;
}

std::optional<std::string> DecodeCookiePlaintext(const std::vector<uint8_t>& plaintext, int64_t metaVersion) {
    size_t offset = 0;
    if (metaVersion >= ChromiumCrypto::HASH_PREFIX_META_VERSION &&
        plaintext.size() > ChromiumCrypto::HASH_PREFIX_LENGTH) {
        offset = ChromiumCrypto::HASH_PREFIX_LENGTH;
    }

    const uint8_t* data = plaintext.data() + offset;
    const size_t len = plaintext.size() - offset;
    if (!Utils::StringUtils::IsValidUtf8(data, len)) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(data), len);
}

bool HasVersionTag(const std::vector<uint8_t>& encrypted, std::string_view tag) noexcept {
    return encrypted.size() >= tag.size() &&
           std::equal(tag.begin(), tag.end(), encrypted.begin(),
               [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; });
}

}  // namespace Browser
}  // namespace BrowserJar
