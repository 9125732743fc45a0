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
/*
 * ============================================================================
 * BrowserJar Base64 Implementation
 * ============================================================================
 *
 * RFC 4648 Standard and URL-safe alphabets. Used to unwrap the
 * os_crypt.encrypted_key blob stored in Chromium's "Local State".
 *
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace BrowserJar {
    namespace Utils {

        // ============================================================================
        // Options
        // ============================================================================

        enum class Base64Alphabet : uint8_t {
            Standard = 0,   ///< A-Z a-z 0-9 + /
            UrlSafe = 1     ///< A-Z a-z 0-9 - _
        };

        struct Base64EncodeOptions final {
            Base64Alphabet alphabet = Base64Alphabet::Standard; ///< Alphabet variant
            bool omitPadding = false;                           ///< Drop trailing '='
        };

        struct Base64DecodeOptions final {
            Base64Alphabet alphabet = Base64Alphabet::Standard; ///< Alphabet variant
            bool ignoreWhitespace = true;                       ///< Skip whitespace characters
            bool acceptMissingPadding = true;                   ///< Allow input without '=' padding
        };

        // ============================================================================
        // Error Codes
        // ============================================================================

        enum class Base64DecodeError : uint8_t {
            None = 0,              ///< No error - operation succeeded
            InvalidCharacter = 1,  ///< Input contains invalid Base64 character
            InvalidPadding = 2,    ///< Padding characters are malformed
            TrailingData = 3,      ///< Non-whitespace data after padding
            InputTooLarge = 4      ///< Input exceeds safe processing limits
        };

        [[nodiscard]] constexpr const char* Base64DecodeErrorToString(Base64DecodeError err) noexcept {
            switch (err) {
                case Base64DecodeError::None:             return "No error";
                case Base64DecodeError::InvalidCharacter: return "Invalid Base64 character";
                case Base64DecodeError::InvalidPadding:   return "Invalid padding";
                case Base64DecodeError::TrailingData:     return "Trailing data after padding";
                case Base64DecodeError::InputTooLarge:    return "Input exceeds safe size limits";
            }
            return "Unknown error";
        }

        // ============================================================================
        // Encode / Decode
        // ============================================================================

        /**
         * @brief Encode binary data to Base64.
         * @return true on success
         */
        [[nodiscard]] bool Base64Encode(
            const uint8_t* data,
            size_t len,
            std::string& out,
            const Base64EncodeOptions& opt = {}
        ) noexcept;

        [[nodiscard]] inline bool Base64Encode(
            const std::vector<uint8_t>& bytes,
            std::string& out,
            const Base64EncodeOptions& opt = {}
        ) noexcept {
            return Base64Encode(bytes.data(), bytes.size(), out, opt);
        }

        /**
         * @brief Decode Base64 text.
         *
         * @param text Encoded input
         * @param out Output bytes (cleared and populated on success)
         * @param err Error code set on failure
         * @param opt Decoding options
         * @return true on success, false on failure (check err for details)
         */
        [[nodiscard]] bool Base64Decode(
            std::string_view text,
            std::vector<uint8_t>& out,
            Base64DecodeError& err,
            const Base64DecodeOptions& opt = {}
        ) noexcept;

    } // namespace Utils
} // namespace BrowserJar
