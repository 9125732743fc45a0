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
#include "LinuxCookieDecryptor.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/Logger.hpp"

namespace BrowserJar {
namespace Browser {

LinuxCookieDecryptor::LinuxCookieDecryptor(const std::optional<std::string>& keyringPassword, int64_t metaVersion)
    : m_metaVersion(metaVersion) {
    if (!DeriveChromiumKey(ChromiumCrypto::LINUX_V10_PASSWORD, ChromiumCrypto::LINUX_ITERATIONS, m_v10Key)) {
        m_v10Key.clear();
    }
    if (!DeriveChromiumKey("", ChromiumCrypto::LINUX_ITERATIONS, m_emptyKey)) {
        m_emptyKey.clear();
    }
    if (keyringPassword) {
        if (!DeriveChromiumKey(*keyringPassword, ChromiumCrypto::LINUX_ITERATIONS, m_v11Key)) {
            m_v11Key.clear();
        }
    }
}

LinuxCookieDecryptor::~LinuxCookieDecryptor() {
    Utils::CryptoUtils::SecureZero(m_v10Key);
    Utils::CryptoUtils::SecureZero(m_emptyKey);
    Utils::CryptoUtils::SecureZero(m_v11Key);
}

std::optional<std::string> LinuxCookieDecryptor::Decrypt(const std::vector<uint8_t>& encrypted) {
    if (encrypted.size() < ChromiumCrypto::VERSION_TAG_LENGTH) {
        return std::nullopt;
    }
    const uint8_t* body = encrypted.data() + ChromiumCrypto::VERSION_TAG_LENGTH;
    const size_t bodyLen = encrypted.size() - ChromiumCrypto::VERSION_TAG_LENGTH;

    if (HasVersionTag(encrypted, "v10")) {
        return DecryptWithKeys(body, bodyLen, { &m_v10Key, &m_emptyKey });
    }
    if (HasVersionTag(encrypted, "v11")) {
        return DecryptWithKeys(body, bodyLen, { &m_v11Key, &m_emptyKey });
    }

    BJ_LOG_WARN("Decrypt", "Unknown Chrome cookie version: %.3s",
        reinterpret_cast<const char*>(encrypted.data()));
    return std::nullopt;
}

std::optional<std::string> LinuxCookieDecryptor::DecryptWithKeys(
    const uint8_t* ciphertext, size_t len,
    const std::vector<const std::vector<uint8_t>*>& keys) const {
    for (const auto* key : keys) {
        if (key->empty()) continue;

        auto plain = DecryptChromiumCbc(*key, ciphertext, len);
        if (!plain) continue;

        auto value = DecodeCookiePlaintext(*plain, m_metaVersion);
        Utils::CryptoUtils::SecureZero(*plain);
        if (value) return value;
    }

    BJ_LOG_WARN("Decrypt", "Failed to decrypt Chrome cookie with any known key");
    return std::nullopt;
}

}  // namespace Browser
}  // namespace BrowserJar
