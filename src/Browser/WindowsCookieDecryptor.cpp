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
#include "WindowsCookieDecryptor.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/Logger.hpp"

namespace BrowserJar {
namespace Browser {

namespace CryptoUtils = Utils::CryptoUtils;

DataUnprotector SystemDataUnprotector() {
    return [](const uint8_t* data, size_t len, std::vector<uint8_t>& out) {
        CryptoUtils::Error cerr;
        if (!CryptoUtils::DPAPIUnprotect(data, len, out, &cerr)) {
            BJ_LOG_DEBUG("Decrypt", "DPAPI unwrap failed: %s", cerr.message.c_str());
            return false;
        }
        return true;
    };
}

WindowsCookieDecryptor::WindowsCookieDecryptor(std::optional<std::vector<uint8_t>> masterKey,
                                               int64_t metaVersion,
                                               DataUnprotector unprotect)
    : m_masterKey(std::move(masterKey))
    , m_metaVersion(metaVersion)
    , m_unprotect(std::move(unprotect)) {
    if (m_masterKey && m_masterKey->size() != MASTER_KEY_LENGTH) {
        BJ_LOG_WARN("Decrypt", "Ignoring master key of unexpected length %zu", m_masterKey->size());
        CryptoUtils::SecureZero(*m_masterKey);
        m_masterKey.reset();
    }
}

WindowsCookieDecryptor::~WindowsCookieDecryptor() {
    if (m_masterKey) CryptoUtils::SecureZero(*m_masterKey);
}

std::optional<std::string> WindowsCookieDecryptor::Decrypt(const std::vector<uint8_t>& encrypted) {
    if (encrypted.size() < ChromiumCrypto::VERSION_TAG_LENGTH) {
        return std::nullopt;
    }

    std::optional<std::vector<uint8_t>> plain;
    if (HasVersionTag(encrypted, "v10")) {
        if (!m_masterKey) {
            BJ_LOG_DEBUG("Decrypt", "v10 cookie without a master key");
            return std::nullopt;
        }
        plain = DecryptGcm(encrypted.data() + ChromiumCrypto::VERSION_TAG_LENGTH,
                           encrypted.size() - ChromiumCrypto::VERSION_TAG_LENGTH);
    }
    else {
        std::vector<uint8_t> out;
        if (m_unprotect && m_unprotect(encrypted.data(), encrypted.size(), out)) {
            plain = std::move(out);
        }
    }

    if (!plain) {
        BJ_LOG_WARN("Decrypt", "Failed to decrypt Chrome cookie");
        return std::nullopt;
    }

    auto value = DecodeCookiePlaintext(*plain, m_metaVersion);
    CryptoUtils::SecureZero(*plain);
    return value;
}

std::optional<std::vector<uint8_t>> WindowsCookieDecryptor::DecryptGcm(const uint8_t* data, size_t len) const {
    if (len < CryptoUtils::GCM_NONCE_SIZE + CryptoUtils::GCM_TAG_SIZE) {
        BJ_LOG_DEBUG("Decrypt", "AES-GCM payload too short (%zu bytes)", len);
        return std::nullopt;
    }

    const uint8_t* nonce = data;
    const uint8_t* ciphertext = data + CryptoUtils::GCM_NONCE_SIZE;
    const size_t ciphertextLen = len - CryptoUtils::GCM_NONCE_SIZE - CryptoUtils::GCM_TAG_SIZE;
    const uint8_t* tag = ciphertext + ciphertextLen;

    CryptoUtils::SymmetricCipher cipher(CryptoUtils::SymmetricAlgorithm::AES_256_GCM);
    CryptoUtils::Error cerr;
    if (!cipher.SetKey(*m_masterKey, &cerr) ||
        !cipher.SetIV(nonce, CryptoUtils::GCM_NONCE_SIZE, &cerr)) {
        BJ_LOG_DEBUG("Decrypt", "AES-GCM setup failed: %s", cerr.message.c_str());
        return std::nullopt;
    }

    std::vector<uint8_t> plain;
    if (!cipher.DecryptAEAD(ciphertext, ciphertextLen, nullptr, 0, tag, CryptoUtils::GCM_TAG_SIZE, plain, &cerr)) {
        BJ_LOG_DEBUG("Decrypt", "AES-GCM decrypt failed: %s", cerr.message.c_str());
        return std::nullopt;
    }
    return plain;
}

}  // namespace Browser
}  // namespace BrowserJar
