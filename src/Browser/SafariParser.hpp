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
 * @file SafariParser.hpp
 * @brief Reader for Safari's Cookies.binarycookies format.
 *
 * Layout:
 *   "cook" | u32 BE page count | u32 BE page size * count | pages...
 *   page:   00 00 01 00 | u32 LE record count | u32 LE record offset * count
 *   record: u32 size | 4 | u32 flags | 4 | u32 domain, name, path, value offsets
 *           | 8 | f64 expiry | f64 creation | NUL-terminated strings
 *
 * Record offsets are relative to the page, string offsets to the record.
 * Times are seconds since 2001-01-01 (Core Foundation absolute time).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../Cookies/Cookie.hpp"
#include "ExtractionOptions.hpp"

namespace BrowserJar {
namespace Browser {

/// @brief Record flag bit for Secure cookies
inline constexpr uint32_t SAFARI_FLAG_SECURE = 0x1;

/**
 * @brief Parse a whole binarycookies buffer into @p store.
 *
 * Any truncation, bad signature or out-of-bounds offset fails with a
 * BrowserCookie error. Records with an empty domain or name are skipped.
 * Usable on every platform.
 */
[[nodiscard]] bool ParseSafariCookies(const uint8_t* data, size_t size,
                                      Cookies::CookieStore& store,
                                      Cookies::CookieError* err = nullptr);

[[nodiscard]] inline bool ParseSafariCookies(const std::vector<uint8_t>& data,
                                             Cookies::CookieStore& store,
                                             Cookies::CookieError* err = nullptr) {
    return ParseSafariCookies(data.data(), data.size(), store, err);
}

/**
 * @brief Core Foundation absolute time to Unix seconds.
 *
 * Values beyond the representable range saturate (so +inf and absurd
 * expiries never expire); NaN yields std::nullopt, a session cookie.
 */
[[nodiscard]] std::optional<int64_t> MacAbsoluteToUnix(double timestamp) noexcept;

/**
 * @brief Pick the cookie file: the profile path when given, else the
 * default location, else the sandboxed container location.
 */
[[nodiscard]] bool FindSafariCookieFile(const std::optional<std::string>& profile,
                                        const std::filesystem::path& home,
                                        std::filesystem::path& out,
                                        Cookies::CookieError* err = nullptr);

/**
 * @brief Read Safari cookies into @p store.
 *
 * Fails with Unsupported unless @p options targets macOS. An empty result
 * is a BrowserCookie error.
 */
[[nodiscard]] bool ExtractSafariCookies(const Cookies::BrowserCookieConfig& config,
                                        Cookies::CookieStore& store,
                                        Cookies::CookieError* err = nullptr,
                                        const ExtractionOptions& options = {});

}  // namespace Browser
}  // namespace BrowserJar
