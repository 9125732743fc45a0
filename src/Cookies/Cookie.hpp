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
 * ============================================================================
 * BrowserJar - COOKIE DOMAIN MODEL
 * ============================================================================
 *
 * @file Cookie.hpp
 * @brief Uniform cookie model shared by every browser extractor and the
 *        request matcher.
 *
 * A CookieStore is built once per extraction and handed to the caller, who
 * owns it. The matcher only reads it.
 *
 * ============================================================================
 */

#pragma once

// ============================================================================
// STANDARD LIBRARY INCLUDES
// ============================================================================

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BrowserJar {
namespace Cookies {

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace CookieConstants {

    /// @brief Expiry values above this are treated as "never expires"
    inline constexpr int64_t FAR_FUTURE_EXPIRY = 100'000'000'000LL;

    /// @brief Seconds between 1601-01-01 and 1970-01-01 (Chromium epoch offset)
    inline constexpr int64_t WINDOWS_EPOCH_OFFSET = 11'644'473'600LL;

    /// @brief Seconds between 1970-01-01 and 2001-01-01 (Core Foundation epoch)
    inline constexpr int64_t MAC_EPOCH_OFFSET = 978'307'200LL;

}  // namespace CookieConstants

// ============================================================================
// ENUMERATIONS
// ============================================================================

/**
 * @brief Supported browser families.
 */
enum class Browser : uint8_t {
    Chrome      = 0,
    Firefox     = 1,
    Safari      = 2,
    Edge        = 3,
    Brave       = 4,
    Opera       = 5,
    Vivaldi     = 6,
    Whale       = 7
};

/**
 * @brief Failure categories surfaced to the caller.
 */
enum class CookieErrorKind : uint8_t {
    None            = 0,
    FileNotFound    = 1,    ///< Browser data or cookie store missing
    BrowserCookie   = 2,    ///< Store unreadable, malformed, or empty
    Config          = 3,    ///< Invalid browser string, keyring or container
    Unsupported     = 4     ///< Browser not available on this OS
};

[[nodiscard]] const char* BrowserToString(Browser browser) noexcept;

/**
 * @brief Parse a browser name (case-insensitive, "chromium" aliases Chrome).
 */
[[nodiscard]] std::optional<Browser> ParseBrowser(std::string_view name) noexcept;

[[nodiscard]] const char* CookieErrorKindToString(CookieErrorKind kind) noexcept;

/// @brief True for Chrome, Edge, Brave, Opera, Vivaldi and Whale
[[nodiscard]] bool IsChromiumBased(Browser browser) noexcept;

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Error information for cookie operations.
 */
struct CookieError {
    CookieErrorKind kind = CookieErrorKind::None;
    std::string message;
    std::string context;

    [[nodiscard]] bool HasError() const noexcept { return kind != CookieErrorKind::None; }

    void Clear() noexcept {
        kind = CookieErrorKind::None;
        message.clear();
        context.clear();
    }

    /// @brief "FileNotFound: message"
    [[nodiscard]] std::string ToString() const;
};

/**
 * @brief Fill @p err (when non-null). Always returns false.
 */
bool SetCookieError(CookieError* err, CookieErrorKind kind, std::string message, std::string context = {});

/**
 * @brief Process exit code for an error kind.
 *
 * Config 2, Unsupported 4, FileNotFound 37, BrowserCookie 43, None 0.
 */
[[nodiscard]] int ExitCodeForError(CookieErrorKind kind) noexcept;

/**
 * @brief A single browser cookie.
 */
struct Cookie {
    /// @brief Cookie name (non-empty)
    std::string name;

    /// @brief Plaintext value
    std::string value;

    /// @brief Host key as stored; a leading '.' means subdomains match
    std::string domain;

    /// @brief Path scope; empty is treated as "/"
    std::string path;

    /// @brief Only sent over https
    bool secure = false;

    /// @brief HttpOnly flag (informational)
    bool httpOnly = false;

    /// @brief Unix seconds; std::nullopt for session cookies
    std::optional<int64_t> expires;

    bool operator==(const Cookie& other) const = default;
};

/**
 * @brief Cookies grouped by domain key, insertion order preserved per bucket.
 */
using CookieStore = std::map<std::string, std::vector<Cookie>>;

/// @brief Append @p cookie to the bucket for its domain
void AddCookie(CookieStore& store, Cookie cookie);

/// @brief Total number of cookies across all buckets
[[nodiscard]] size_t CountCookies(const CookieStore& store) noexcept;

/**
 * @brief Which browser store to read and how.
 *
 * Text form: BROWSER[+KEYRING][:PROFILE][::CONTAINER]
 */
struct BrowserCookieConfig {
    /// @brief Browser family
    Browser browser = Browser::Chrome;

    /// @brief Profile name or path (path-like when it has '/' or '\' or starts with '~')
    std::optional<std::string> profile;

    /// @brief Firefox container name, or "none" for cookies outside any container
    std::optional<std::string> container;

    /// @brief Linux keyring override (kwallet, kwallet5, kwallet6, gnome, basic)
    std::optional<std::string> keyring;

    /**
     * @brief Parse the text form.
     *
     * "::" separates the container, then the first ':' separates the profile
     * (so Windows drive paths survive), then '+' separates the keyring.
     * Empty fields are treated as absent.
     *
     * @return false with a Config error for an unknown browser
     */
    [[nodiscard]] static bool Parse(std::string_view text, BrowserCookieConfig& out, CookieError* err = nullptr);

    [[nodiscard]] std::string ToString() const;
};

/**
 * @brief True when @p profile names a filesystem location rather than a profile.
 */
[[nodiscard]] bool IsPathLike(std::string_view profile) noexcept;

}  // namespace Cookies
}  // namespace BrowserJar
