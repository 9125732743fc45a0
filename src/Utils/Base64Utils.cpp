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
#include "Base64Utils.hpp"

#include <array>
#include <limits>
#include <new>

namespace BrowserJar {
    namespace Utils {

        namespace {

            constexpr char kStandardAlphabet[] =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
            constexpr char kUrlSafeAlphabet[] =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

            constexpr uint8_t kInvalid = 0xFF;

            constexpr std::array<uint8_t, 256> BuildDecodeTable(const char* alphabet) {
                std::array<uint8_t, 256> table{};
                for (auto& v : table) v = kInvalid;
                for (uint8_t i = 0; i < 64; ++i) {
                    table[static_cast<uint8_t>(alphabet[i])] = i;
                }
                return table;
            }

            constexpr auto kStandardTable = BuildDecodeTable(kStandardAlphabet);
            constexpr auto kUrlSafeTable = BuildDecodeTable(kUrlSafeAlphabet);

            constexpr bool IsWhitespace(char c) noexcept {
                return c == ' ' || c == '\t' || c == '\r' || c == '\n';
            }

            /// Largest input handled without risking size_t overflow in the output estimate
            constexpr size_t kMaxInput = (std::numeric_limits<size_t>::max() / 4) * 3 - 3;

        } // anonymous namespace

        bool Base64Encode(const uint8_t* data, size_t len, std::string& out, const Base64EncodeOptions& opt) noexcept {
            out.clear();
            if (len == 0) return true;
            if (!data || len > kMaxInput) return false;

            const char* alphabet = opt.alphabet == Base64Alphabet::UrlSafe ? kUrlSafeAlphabet : kStandardAlphabet;

            try {
                out.reserve(((len + 2) / 3) * 4);
            }
            catch (const std::bad_alloc&) {
                return false;
            }

            size_t i = 0;
            for (; i + 3 <= len; i += 3) {
                const uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
                out.push_back(alphabet[(v >> 18) & 0x3F]);
                out.push_back(alphabet[(v >> 12) & 0x3F]);
                out.push_back(alphabet[(v >> 6) & 0x3F]);
                out.push_back(alphabet[v & 0x3F]);
            }

            const size_t rest = len - i;
            if (rest == 1) {
                const uint32_t v = uint32_t(data[i]) << 16;
                out.push_back(alphabet[(v >> 18) & 0x3F]);
                out.push_back(alphabet[(v >> 12) & 0x3F]);
                if (!opt.omitPadding) out.append("==");
            }
            else if (rest == 2) {
                const uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
                out.push_back(alphabet[(v >> 18) & 0x3F]);
                out.push_back(alphabet[(v >> 12) & 0x3F]);
                out.push_back(alphabet[(v >> 6) & 0x3F]);
                if (!opt.omitPadding) out.push_back('=');
            }
            return true;
        }

        bool Base64Decode(std::string_view text, std::vector<uint8_t>& out, Base64DecodeError& err,
                          const Base64DecodeOptions& opt) noexcept {
            out.clear();
            err = Base64DecodeError::None;
            if (text.size() > kMaxInput) {
                err = Base64DecodeError::InputTooLarge;
                return false;
            }

            const auto& table = opt.alphabet == Base64Alphabet::UrlSafe ? kUrlSafeTable : kStandardTable;

            try {
                out.reserve((text.size() / 4) * 3 + 3);
            }
            catch (const std::bad_alloc&) {
                err = Base64DecodeError::InputTooLarge;
                return false;
            }

            uint32_t accum = 0;
            size_t quantum = 0;     // symbols in the current 4-symbol group
            size_t padding = 0;

            for (const char c : text) {
                if (opt.ignoreWhitespace && IsWhitespace(c)) continue;

                if (c == '=') {
                    ++padding;
                    if (padding > 2 || quantum < 2) {
                        err = Base64DecodeError::InvalidPadding;
                        out.clear();
                        return false;
                    }
                    continue;
                }

                if (padding > 0) {
                    err = Base64DecodeError::TrailingData;
                    out.clear();
                    return false;
                }

                const uint8_t v = table[static_cast<uint8_t>(c)];
                if (v == kInvalid) {
                    err = Base64DecodeError::InvalidCharacter;
                    out.clear();
                    return false;
                }

                accum = (accum << 6) | v;
                if (++quantum == 4) {
                    out.push_back(static_cast<uint8_t>(accum >> 16));
                    out.push_back(static_cast<uint8_t>(accum >> 8));
                    out.push_back(static_cast<uint8_t>(accum));
                    accum = 0;
                    quantum = 0;
                }
            }

            if (quantum == 1) {
                err = Base64DecodeError::InvalidPadding;
                out.clear();
                return false;
            }
            if (quantum > 0) {
                if (!opt.acceptMissingPadding && quantum + padding != 4) {
                    err = Base64DecodeError::InvalidPadding;
                    out.clear();
                    return false;
                }
                if (padding > 0 && quantum + padding != 4) {
                    err = Base64DecodeError::InvalidPadding;
                    out.clear();
                    return false;
                }
                accum <<= 6 * (4 - quantum);
                out.push_back(static_cast<uint8_t>(accum >> 16));
                if (quantum == 3) {
                    out.push_back(static_cast<uint8_t>(accum >> 8));
                }
            }
            else if (padding > 0) {
                err = Base64DecodeError::InvalidPadding;
                out.clear();
                return false;
            }
            return true;
        }

    } // namespace Utils
} // namespace BrowserJar
