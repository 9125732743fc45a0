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
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CookieDecryptor.hpp"

namespace BrowserJar {
namespace Browser {

/**
 * @brief macOS Chromium decryptor (v10, keychain password, 1003 iterations).
 *
 * Without a keychain password every v10 value decrypts to an empty string so
 * the cookie names still reach the caller.
 */
class MacCookieDecryptor final : public ICookieDecryptor {
public:
    MacCookieDecryptor(const std::optional<std::string>& keychainPassword, int64_t metaVersion);
    ~MacCookieDecryptor() override;

    MacCookieDecryptor(const MacCookieDecryptor&) = delete;
    MacCookieDecryptor& operator=(const MacCookieDecryptor&) = delete;

    [[nodiscard]] std::optional<std::string> Decrypt(const std::vector<uint8_t>& encrypted) override;

private:
    std::vector<uint8_t> m_key;   // empty without a password
    int64_t m_metaVersion = 0;
};

}  // namespace Browser
}  // namespace BrowserJar
