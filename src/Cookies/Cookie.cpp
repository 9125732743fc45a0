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
#include "Cookie.hpp"

#include "../Utils/StringUtils.hpp"

namespace BrowserJar {
namespace Cookies {

namespace StringUtils = Utils::StringUtils;

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

const char* BrowserToString(Browser browser) noexcept {
    switch (browser) {
        case Browser::Chrome:  return "chrome";
        case Browser::Firefox: return "firefox";
        case Browser::Safari:  return "safari";
        case Browser::Edge:    return "edge";
        case Browser::Brave:   return "brave";
        case Browser::Opera:   return "opera";
        case Browser::Vivaldi: return "vivaldi";
        case Browser::Whale:   return "whale";
    }
    return "unknown";
}

std::optional<Browser> ParseBrowser(std::string_view name) noexcept {
    struct Entry {
        std::string_view name;
        Browser browser;
    };
    static constexpr Entry kBrowsers[] = {
        {"chrome",   Browser::Chrome},
        {"chromium", Browser::Chrome},
        {"firefox",  Browser::Firefox},
        {"safari",   Browser::Safari},
        {"edge",     Browser::Edge},
        {"brave",    Browser::Brave},
        {"opera",    Browser::Opera},
        {"vivaldi",  Browser::Vivaldi},
        {"whale",    Browser::Whale},
    };

    for (const auto& entry : kBrowsers) {
        if (StringUtils::EqualsIgnoreCase(name, entry.name)) {
            return entry.browser;
        }
    }
    return std::nullopt;
}

const char* CookieErrorKindToString(CookieErrorKind kind) noexcept {
    switch (kind) {
        case CookieErrorKind::None:          return "None";
        case CookieErrorKind::FileNotFound:  return "FileNotFound";
        case CookieErrorKind::BrowserCookie: return "BrowserCookie";
        case CookieErrorKind::Config:        return "Config";
        case CookieErrorKind::Unsupported:   return "Unsupported";
    }
    return "Unknown";
}

bool IsChromiumBased(Browser browser) noexcept {
    return browser != Browser::Firefox && browser != Browser::Safari;
}

// ============================================================================
// ERRORS
// ============================================================================

std::string CookieError::ToString() const {
    std::string out = CookieErrorKindToString(kind);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

bool SetCookieError(CookieError* err, CookieErrorKind kind, std::string message, std::string context) {
    if (err) {
        err->kind = kind;
        err->message = std::move(message);
        err->context = std::move(context);
    }
    return false;
}

int ExitCodeForError(CookieErrorKind kind) noexcept {
    switch (kind) {
        case CookieErrorKind::None:          return 0;
        case CookieErrorKind::Config:        return 2;
        case CookieErrorKind::Unsupported:   return 4;
        case CookieErrorKind::FileNotFound:  return 37;
        case CookieErrorKind::BrowserCookie: return 43;
    }
    return 1;
}

// ============================================================================
// STORE
// ============================================================================

void AddCookie(CookieStore& store, Cookie cookie) {
    auto& bucket = store[cookie.domain];
    bucket.push_back(std::move(cookie));
}

size_t CountCookies(const CookieStore& store) noexcept {
    size_t total = 0;
    for (const auto& [domain, cookies] : store) {
        total += cookies.size();
    }
    return total;
}

// ============================================================================
// CONFIG
// ============================================================================

bool IsPathLike(std::string_view profile) noexcept {
    return profile.find('/') != std::string_view::npos ||
           profile.find('\\') != std::string_view::npos ||
           (!profile.empty() && profile.front() == '~');
}

bool BrowserCookieConfig::Parse(std::string_view text, BrowserCookieConfig& out, CookieError* err) {
    out = BrowserCookieConfig{};

    auto toOptional = [](std::string_view s) -> std::optional<std::string> {
        if (s.empty()) return std::nullopt;
        return std::string(s);
    };

    std::string_view browserPart = text;
    std::string_view tail;
    if (StringUtils::SplitOnce(text, "::", browserPart, tail)) {
        out.container = toOptional(tail);
    }

    std::string_view browserKeyring = browserPart;
    if (StringUtils::SplitOnce(browserPart, ":", browserKeyring, tail)) {
        out.profile = toOptional(tail);
    }

    std::string_view browserName = browserKeyring;
    if (StringUtils::SplitOnce(browserKeyring, "+", browserName, tail)) {
        out.keyring = toOptional(tail);
    }

    const auto browser = ParseBrowser(StringUtils::TrimView(browserName));
    if (!browser) {
        return SetCookieError(err, CookieErrorKind::Config,
            "Unsupported browser: " + std::string(browserName), "BrowserCookieConfig::Parse");
    }
    out.browser = *browser;
    return true;
}

std::string BrowserCookieConfig::ToString() const {
    std::string out = BrowserToString(browser);
    if (keyring) {
        out += '+';
        out += *keyring;
    }
    if (profile) {
        out += ':';
        out += *profile;
    }
    if (container) {
        out += "::";
        out += *container;
    }
    return out;
}

}  // namespace Cookies
}  // namespace BrowserJar
