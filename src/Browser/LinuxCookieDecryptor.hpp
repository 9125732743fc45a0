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
 * @brief Linux Chromium decryptor.
 *
 * v10 values try the "peanuts" key then the empty-password key. v11 values
 * try the keyring key (when a password was found) then the empty-password
 * key. The first key producing valid UTF-8 wins.
 */
class LinuxCookieDecryptor final : public ICookieDecryptor {
public:
    /**
     * @param keyringPassword Password read from the keyring, std::nullopt for BasicText
     * @param metaVersion Cookie database meta version
     */
    LinuxCookieDecryptor(const std::optional<std::string>& keyringPassword, int64_t metaVersion);
    ~LinuxCookieDecryptor() override;

    LinuxCookieDecryptor(const LinuxCookieDecryptor&) = delete;
    LinuxCookieDecryptor& operator=(const LinuxCookieDecryptor&) = delete;

    [[nodiscard]] std::optional<std::string> Decrypt(const std::vector<uint8_t>& encrypted) override;

    [[nodiscard]] bool HasKeyringKey() const noexcept { return !m_v11Key.empty(); }

private:
    std::optional<std::string> DecryptWithKeys(const uint8_t* ciphertext, size_t len,
                                               const std::vector<const std::vector<uint8_t>*>& keys) const;

    std::vector<uint8_t> m_v10Key;
    std::vector<uint8_t> m_emptyKey;
    std::vector<uint8_t> m_v11Key;
    int64_t m_metaVersion = 0;
};

}  // namespace Browser
}  // namespace BrowserJar
