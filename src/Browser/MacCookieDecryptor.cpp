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
#include "MacCookieDecryptor.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/Logger.hpp"

namespace BrowserJar {
namespace Browser {

MacCookieDecryptor::MacCookieDecryptor(const std::optional<std::string>& keychainPassword, int64_t metaVersion)
    : m_metaVersion(metaVersion) {
    if (keychainPassword) {
        if (!DeriveChromiumKey(*keychainPassword, ChromiumCrypto::MAC_ITERATIONS, m_key)) {
            m_key.clear();
        }
    }
    else {
        BJ_LOG_WARN("Decrypt", "No keychain password; encrypted cookies will be dropped");
    }
}

MacCookieDecryptor::~MacCookieDecryptor() {
    Utils::CryptoUtils::SecureZero(m_key);
}

std::optional<std::string> MacCookieDecryptor::Decrypt(const std::vector<uint8_t>& encrypted) {
    if (encrypted.size() < ChromiumCrypto::VERSION_TAG_LENGTH) {
        return std::nullopt;
    }

    if (!HasVersionTag(encrypted, "v10")) {
        BJ_LOG_WARN("Decrypt", "Unknown Chrome cookie version: %.3s",
            reinterpret_cast<const char*>(encrypted.data()));
        return std::nullopt;
    }

    if (m_key.empty()) {
        BJ_LOG_WARN("Decrypt", "Cannot decrypt Chrome cookie without a keychain password");
        return std::nullopt;
    }

    auto plain = DecryptChromiumCbc(m_key,
        encrypted.data() + ChromiumCrypto::VERSION_TAG_LENGTH,
        encrypted.size() - ChromiumCrypto::VERSION_TAG_LENGTH);
    if (!plain) {
        BJ_LOG_WARN("Decrypt", "Failed to decrypt Chrome cookie (bad key or padding)");
        return std::nullopt;
    }

    auto value = DecodeCookiePlaintext(*plain, m_metaVersion);
    Utils::CryptoUtils::SecureZero(*plain);
    if (!value) {
        BJ_LOG_WARN("Decrypt", "Failed to decrypt Chrome cookie: UTF-8 decode failed");
    }
    return value;
}

}  // namespace Browser
}  // namespace BrowserJar
