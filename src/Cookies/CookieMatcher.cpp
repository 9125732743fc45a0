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
#include "CookieMatcher.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

namespace BrowserJar {
namespace Cookies {

namespace StringUtils = Utils::StringUtils;
namespace NetworkUtils = Utils::NetworkUtils;

bool DomainMatches(std::string_view cookieDomain, std::string_view requestHost) {
    const std::string domain = StringUtils::ToLowerAscii(StringUtils::TrimView(cookieDomain));
    const std::string host = StringUtils::ToLowerAscii(StringUtils::TrimView(requestHost));

    if (domain.empty() || host.empty()) return false;

    if (domain.front() == '.') {
        const std::string_view bare = std::string_view(domain).substr(1);
        if (host == bare) return true;
        // dot-bounded suffix: host ends with ".bare"
        return host.size() > domain.size() &&
               host.compare(host.size() - domain.size(), domain.size(), domain) == 0;
    }
    return host == domain;
}

bool PathMatches(std::string_view cookiePath, std::string_view requestPath) noexcept {
    if (cookiePath.empty()) cookiePath = "/";
    if (requestPath.empty()) requestPath = "/";

    if (requestPath == cookiePath) return true;
    if (requestPath.size() <= cookiePath.size()) return false;
    if (requestPath.compare(0, cookiePath.size(), cookiePath) != 0) return false;

    return cookiePath.back() == '/' || requestPath[cookiePath.size()] == '/';
}

bool IsExpired(const Cookie& cookie, int64_t now) noexcept {
    if (!cookie.expires) return false;
    const int64_t expires = *cookie.expires;
    if (expires > CookieConstants::FAR_FUTURE_EXPIRY) return false;
    return expires <= now;
}

int64_t CurrentUnixTime() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<Cookie> CookiesForUrl(const CookieStore& store, std::string_view url) {
    return CookiesForUrl(store, url, CurrentUnixTime());
}

std::vector<Cookie> CookiesForUrl(const CookieStore& store, std::string_view url, int64_t now) {
    std::vector<Cookie> matched;

    NetworkUtils::UrlComponents parsed;
    NetworkUtils::Error urlErr;
    if (!NetworkUtils::ParseUrl(url, parsed, &urlErr)) {
        BJ_LOG_DEBUG("Matcher", "Cannot parse URL for cookie matching: %s", urlErr.message.c_str());
        return matched;
    }
    if (parsed.host.empty()) return matched;

    const bool isHttps = parsed.scheme == "https";

    for (const auto& [domainKey, cookies] : store) {
        for (const auto& cookie : cookies) {
            if (cookie.secure && !isHttps) continue;
            if (IsExpired(cookie, now)) continue;
            if (!DomainMatches(cookie.domain, parsed.host)) continue;
            if (!PathMatches(cookie.path, parsed.path)) continue;
            matched.push_back(cookie);
        }
    }

    BJ_LOG_TRACE("Matcher", "%zu cookie(s) match %s", matched.size(), parsed.host.c_str());
    return matched;
}

std::string CookiesToHeader(const std::vector<Cookie>& cookies) {
    std::string header;
    for (const auto& cookie : cookies) {
        if (!header.empty()) header += "; ";
        header += cookie.name;
        header += '=';
        header += cookie.value;
    }
    return header;
}

std::string MergeCookieHeader(std::string_view existing, std::string_view extra) {
    existing = StringUtils::TrimView(existing);
    extra = StringUtils::TrimView(extra);
    if (existing.empty()) return std::string(extra);
    if (extra.empty()) return std::string(existing);

    std::string merged(existing);
    merged += "; ";
    merged += extra;
    return merged;
}

}  // namespace Cookies
}  // namespace BrowserJar
