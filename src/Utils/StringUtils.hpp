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
#include <string>
#include <string_view>
#include <vector>

namespace BrowserJar {
	namespace Utils {
		namespace StringUtils {

			// ============================================================================
			// Case and whitespace
			// ============================================================================

			/// @brief ASCII lower-casing; bytes >= 0x80 are left as they are
			[[nodiscard]] std::string ToLowerAscii(std::string_view s);

			[[nodiscard]] bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;

			[[nodiscard]] std::string_view TrimView(std::string_view s) noexcept;

			[[nodiscard]] std::string Trim(std::string_view s);

			/// @brief Remove every trailing '\n' and '\r'
			[[nodiscard]] std::string_view TrimTrailingNewlines(std::string_view s) noexcept;

			// ============================================================================
			// Splitting
			// ============================================================================

			/**
			 * @brief Split on every occurrence of @p delimiter.
			 *
			 * Empty fields are kept: Split("a::b", ":") yields {"a", "", "b"}.
			 */
			[[nodiscard]] std::vector<std::string> Split(std::string_view s, std::string_view delimiter);

			/**
			 * @brief Split once at the first occurrence of @p delimiter.
			 * @return true if the delimiter was found
			 */
			[[nodiscard]] bool SplitOnce(std::string_view s, std::string_view delimiter,
			                             std::string_view& head, std::string_view& tail) noexcept;

			// ============================================================================
			// Encoding
			// ============================================================================

			/**
			 * @brief Strict UTF-8 validation (rejects overlongs, surrogates, > U+10FFFF).
			 */
			[[nodiscard]] bool IsValidUtf8(const uint8_t* data, size_t len) noexcept;

			[[nodiscard]] inline bool IsValidUtf8(std::string_view s) noexcept {
				return IsValidUtf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
			}

		} // namespace StringUtils
	} // namespace Utils
} // namespace BrowserJar
