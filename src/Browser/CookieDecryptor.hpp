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
/**
 * @file CookieDecryptor.hpp
 * @brief Common interface for Chromium encrypted_value decryption.
 *
 * Encrypted values carry a 3-byte version tag ("v10", "v11"). The key
 * material depends on the OS:
 *
 *   macOS    PBKDF2-SHA1(keychain password, "saltysalt", 1003) -> AES-128-CBC
 *   Linux    PBKDF2-SHA1(keyring password or "peanuts", "saltysalt", 1) -> AES-128-CBC
 *   Windows  DPAPI-wrapped AES-256 key from "Local State" -> AES-256-GCM
 *
 * Cookie databases with meta version >= 24 prefix every plaintext with the
 * SHA-256 of the host key, which is stripped before UTF-8 decoding.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BrowserJar {
namespace Browser {

namespace ChromiumCrypto {

    inline constexpr std::string_view KEY_SALT = "saltysalt";
    inline constexpr size_t CBC_KEY_LENGTH = 16;
    inline constexpr uint32_t LINUX_ITERATIONS = 1;
    inline constexpr uint32_t MAC_ITERATIONS = 1003;
    inline constexpr std::string_view LINUX_V10_PASSWORD = "peanuts";

    /// @brief CBC IV: sixteen ASCII spaces
    inline constexpr uint8_t CBC_IV[16] = {
        ' ', ' ', ' ', ' ', ' ', ' ', ' ', ' ',
        ' ', ' ', ' ', ' ', ' ', ' ', ' ', ' '
    };

    inline constexpr size_t VERSION_TAG_LENGTH = 3;
    inline constexpr int64_t HASH_PREFIX_META_VERSION = 24;
    inline constexpr size_t HASH_PREFIX_LENGTH = 32;

}  // namespace ChromiumCrypto

/**
 * @brief Decrypts one encrypted_value blob.
 *
 * Failure is per row: std::nullopt means "drop this cookie", never "abort".
 */
class ICookieDecryptor {
public:
    virtual ~ICookieDecryptor() = default;

    [[nodiscard]] virtual std::optional<std::string> Decrypt(const std::vector<uint8_t>& encrypted) = 0;
};

/**
 * @brief PBKDF2-HMAC-SHA1(password, "saltysalt", iterations) -> 16-byte key.
 */
[[nodiscard]] bool DeriveChromiumKey(std::string_view password, uint32_t iterations, std::vector<uint8_t>& key);

/**
 * @brief AES-128-CBC/PKCS7 decryption with the fixed space IV.
 * @return std::nullopt on bad padding
 */
[[nodiscard]] std::optional<std::vector<uint8_t>> DecryptChromiumCbc(const std::vector<uint8_t>& key,
                                                                     const uint8_t* ciphertext, size_t len);

/**
 * @brief Drop the hash prefix (meta version >= 24, plaintext > 32 bytes)
 *        and require valid UTF-8.
 */
[[nodiscard]] std::optional<std::string> DecodeCookiePlaintext(const std::vector<uint8_t>& plaintext, int64_t metaVersion);

/// @brief True when @p encrypted starts with @p tag
[[nodiscard]] bool HasVersionTag(const std::vector<uint8_t>& encrypted, std::string_view tag) noexcept;

}  // namespace Browser
}  // namespace BrowserJar
