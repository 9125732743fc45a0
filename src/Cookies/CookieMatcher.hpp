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
 * @file CookieMatcher.hpp
 * @brief Selects the cookies that apply to a request URL.
 *
 * Matching follows RFC 6265 section 5.1.3 (domain) and 5.1.4 (path) with
 * browser-stored host keys: a leading '.' on the cookie domain allows
 * subdomain matches, otherwise the host must match exactly.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "Cookie.hpp"

namespace BrowserJar {
namespace Cookies {

/**
 * @brief Domain match between a cookie host key and a request host.
 *
 * Both sides are trimmed and lower-cased. ".example.com" matches
 * "example.com" and "a.example.com" but not "badexample.com".
 */
[[nodiscard]] bool DomainMatches(std::string_view cookieDomain, std::string_view requestHost);

/**
 * @brief Path match. An empty cookie path is "/".
 */
[[nodiscard]] bool PathMatches(std::string_view cookiePath, std::string_view requestPath) noexcept;

/**
 * @brief True when the cookie has expired at @p now (Unix seconds).
 *
 * Session cookies and expiries beyond FAR_FUTURE_EXPIRY never expire.
 */
[[nodiscard]] bool IsExpired(const Cookie& cookie, int64_t now) noexcept;

/// @brief Current wall-clock time in Unix seconds
[[nodiscard]] int64_t CurrentUnixTime() noexcept;

/**
 * @brief Cookies from @p store that should be sent with a request to @p url.
 *
 * Order follows the store: buckets by domain key, insertion order inside
 * each bucket. A URL without a host yields nothing.
 */
[[nodiscard]] std::vector<Cookie> CookiesForUrl(const CookieStore& store, std::string_view url);

/// @brief Same as above with an explicit clock
[[nodiscard]] std::vector<Cookie> CookiesForUrl(const CookieStore& store, std::string_view url, int64_t now);

/**
 * @brief Render "n1=v1; n2=v2". Empty input yields an empty string.
 */
[[nodiscard]] std::string CookiesToHeader(const std::vector<Cookie>& cookies);

/**
 * @brief Combine an existing Cookie header value with browser cookies.
 *
 * Returns "existing; extra" when both are non-empty, otherwise whichever
 * is non-empty.
 */
[[nodiscard]] std::string MergeCookieHeader(std::string_view existing, std::string_view extra);

}  // namespace Cookies
}  // namespace BrowserJar
