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
 * @file FirefoxExtractor.hpp
 * @brief Cookie extraction from Firefox "cookies.sqlite" (moz_cookies).
 *
 * Cookies of a contextual identity (container) carry
 * "userContextId=<id>" in originAttributes. Container names are resolved
 * through containers.json in the same profile directory.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../Cookies/Cookie.hpp"
#include "ExtractionOptions.hpp"

namespace BrowserJar {
namespace Browser {

/// @brief Newest moz_cookies schema this reader has been checked against
inline constexpr int64_t FIREFOX_MAX_SCHEMA_VERSION = 17;

/// @brief From this schema version on, expiry is stored in milliseconds
inline constexpr int64_t FIREFOX_MILLISECOND_EXPIRY_SCHEMA = 16;

enum class ContainerMode {
    Any,        ///< No filter
    NoneOnly,   ///< Only cookies outside every container
    Specific    ///< Only cookies of one userContextId
};

struct ContainerFilter {
    ContainerMode mode = ContainerMode::Any;
    int64_t userContextId = 0;   ///< Valid for ContainerMode::Specific
};

/**
 * @brief Directories (or a single file) searched for cookies.sqlite.
 *
 * A path-like profile is used as given after '~' expansion; a profile name
 * is joined onto the per-OS profiles directory.
 */
[[nodiscard]] std::vector<std::filesystem::path> FirefoxSearchRoots(const std::optional<std::string>& profile,
                                                                    Utils::SystemUtils::Platform platform,
                                                                    const Utils::SystemUtils::EnvironmentLookup& env);

/// @brief True for l10nID "userContext<container>.label"
[[nodiscard]] bool L10nMatches(std::string_view container, std::string_view l10nId) noexcept;

/**
 * @brief Turn the "::CONTAINER" part of the config into a row filter.
 *
 * "none" selects cookies outside every container. Any other name is looked
 * up in containers.json next to @p cookieDb.
 */
[[nodiscard]] bool ResolveFirefoxContainer(const std::filesystem::path& cookieDb,
                                           const std::optional<std::string>& container,
                                           ContainerFilter& out,
                                           Cookies::CookieError* err = nullptr);

/// @brief Convert a stored expiry to Unix seconds; non-positive results are session cookies
[[nodiscard]] std::optional<int64_t> FirefoxExpiryToUnix(int64_t expiry, int64_t schemaVersion) noexcept;

/**
 * @brief Read Firefox cookies into @p store.
 *
 * An empty result is a BrowserCookie error.
 */
[[nodiscard]] bool ExtractFirefoxCookies(const Cookies::BrowserCookieConfig& config,
                                         Cookies::CookieStore& store,
                                         Cookies::CookieError* err = nullptr,
                                         const ExtractionOptions& options = {});

}  // namespace Browser
}  // namespace BrowserJar
