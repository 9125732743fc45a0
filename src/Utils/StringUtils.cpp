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
#include "StringUtils.hpp"

namespace BrowserJar {
	namespace Utils {
		namespace StringUtils {

			namespace {
				constexpr char AsciiLower(char c) noexcept {
					return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
				}

				constexpr bool IsSpace(char c) noexcept {
					return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
				}

				/// Length of the valid UTF-8 sequence at data[i], 0 if invalid
				size_t Utf8SequenceLength(const uint8_t* data, size_t len, size_t i) noexcept {
					const uint8_t b0 = data[i];
					if (b0 < 0x80) return 1;

					size_t need = 0;
					uint32_t cp = 0;
					uint32_t minCp = 0;
					if ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; minCp = 0x80; }
					else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; minCp = 0x800; }
					else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; minCp = 0x10000; }
					else return 0;

					if (i + need >= len) return 0;                  // truncated
					for (size_t k = 1; k <= need; ++k) {
						const uint8_t b = data[i + k];
						if ((b & 0xC0) != 0x80) return 0;
						cp = (cp << 6) | (b & 0x3F);
					}
					if (cp < minCp) return 0;                       // overlong
					if (cp > 0x10FFFF) return 0;                    // out of range
					if (cp >= 0xD800 && cp <= 0xDFFF) return 0;     // surrogate
					return need + 1;
				}
			}

			std::string ToLowerAscii(std::string_view s) {
				std::string out(s);
				for (auto& c : out) c = AsciiLower(c);
				return out;
			}

			bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) return false;
				for (size_t i = 0; i < a.size(); ++i) {
					if (AsciiLower(a[i]) != AsciiLower(b[i])) return false;
				}
				return true;
			}

			std::string_view TrimView(std::string_view s) noexcept {
				size_t begin = 0;
				size_t end = s.size();
				while (begin < end && IsSpace(s[begin])) ++begin;
				while (end > begin && IsSpace(s[end - 1])) --end;
				return s.substr(begin, end - begin);
			}

			std::string Trim(std::string_view s) {
				return std::string(TrimView(s));
			}

			std::string_view TrimTrailingNewlines(std::string_view s) noexcept {
				while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
					s.remove_suffix(1);
				}
				return s;
			}

			std::vector<std::string> Split(std::string_view s, std::string_view delimiter) {
				std::vector<std::string> parts;
				if (delimiter.empty()) {
					parts.emplace_back(s);
					return parts;
				}

				size_t start = 0;
				for (;;) {
					const size_t pos = s.find(delimiter, start);
					if (pos == std::string_view::npos) {
						parts.emplace_back(s.substr(start));
						break;
					}
					parts.emplace_back(s.substr(start, pos - start));
					start = pos + delimiter.size();
				}
				return parts;
			}

			bool SplitOnce(std::string_view s, std::string_view delimiter,
			               std::string_view& head, std::string_view& tail) noexcept {
				const size_t pos = delimiter.empty() ? std::string_view::npos : s.find(delimiter);
				if (pos == std::string_view::npos) {
					head = s;
					tail = std::string_view();
					return false;
				}
				head = s.substr(0, pos);
				tail = s.substr(pos + delimiter.size());
				return true;
			}

			bool IsValidUtf8(const uint8_t* data, size_t len) noexcept {
				if (!data) return len == 0;
				size_t i = 0;
				while (i < len) {
					const size_t n = Utf8SequenceLength(data, len, i);
					if (n == 0) return false;
					i += n;
				}
				return true;
			}

		} // namespace StringUtils
	} // namespace Utils
} // namespace BrowserJar
