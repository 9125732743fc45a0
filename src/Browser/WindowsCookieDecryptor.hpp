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

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "CookieDecryptor.hpp"

namespace BrowserJar {
namespace Browser {

/**
 * @brief Unwraps a DPAPI blob. Returns false when the blob cannot be opened.
 */
using DataUnprotector = std::function<bool(const uint8_t* data, size_t len, std::vector<uint8_t>& out)>;

/// @brief DataUnprotector backed by CryptUnprotectData
[[nodiscard]] DataUnprotector SystemDataUnprotector();

/**
 * @brief Windows Chromium decryptor.
 *
 * "v10" values are [12-byte nonce][ciphertext][16-byte tag] under AES-256-GCM
 * with the key from "Local State". Anything else is a legacy DPAPI blob.
 */
class WindowsCookieDecryptor final : public ICookieDecryptor {
public:
    inline static constexpr size_t MASTER_KEY_LENGTH = 32;

    /**
     * @param masterKey Unwrapped AES-256 key, std::nullopt when unavailable
     * @param unprotect DPAPI unwrap used for legacy values
     */
    WindowsCookieDecryptor(std::optional<std::vector<uint8_t>> masterKey,
                           int64_t metaVersion,
                           DataUnprotector unprotect = SystemDataUnprotector());
    ~WindowsCookieDecryptor() override;

    WindowsCookieDecryptor(const WindowsCookieDecryptor&) = delete;
    WindowsCookieDecryptor& operator=(const WindowsCookieDecryptor&) = delete;

    [[nodiscard]] std::optional<std::string> Decrypt(const std::vector<uint8_t>& encrypted) override;

private:
    std::optional<std::vector<uint8_t>> DecryptGcm(const uint8_t* data, size_t len) const;

    std::optional<std::vector<uint8_t>> m_masterKey;
    int64_t m_metaVersion = 0;
    DataUnprotector m_unprotect;
};

}  // namespace Browser
}  // namespace BrowserJar
