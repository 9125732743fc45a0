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
 * @file ChromiumExtractor.hpp
 * @brief Cookie extraction for Chrome, Edge, Brave, Opera, Vivaldi and Whale.
 *
 * The "cookies" table has changed column names across releases
 * (secure/is_secure, httponly/is_httponly); the query is built from
 * PRAGMA table_info. expires_utc is in microseconds since 1601-01-01.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "../Cookies/Cookie.hpp"
#include "ChromiumSettings.hpp"
#include "CookieDecryptor.hpp"
#include "ExtractionOptions.hpp"

namespace BrowserJar {
namespace Browser {

/**
 * @brief Convert expires_utc to Unix seconds. 0 and non-positive results are session cookies.
 */
[[nodiscard]] std::optional<int64_t> ChromiumExpiresToUnix(int64_t expiresUtc) noexcept;

/**
 * @brief Locate the newest "Cookies" database for @p settings and @p profile.
 */
[[nodiscard]] bool FindChromiumDatabase(const ChromiumSettings& settings,
                                        const std::optional<std::string>& profile,
                                        const std::filesystem::path& home,
                                        std::filesystem::path& out,
                                        Cookies::CookieError* err = nullptr);

/**
 * @brief Build the decryptor for the platform in @p options.
 *
 * May fail for an invalid keyring override (Config) or an unreadable
 * Local State (BrowserCookie). A missing secret is not a failure.
 */
[[nodiscard]] std::unique_ptr<ICookieDecryptor> CreateCookieDecryptor(const ChromiumSettings& settings,
                                                                      int64_t metaVersion,
                                                                      const std::optional<std::string>& keyringOverride,
                                                                      const ExtractionOptions& options,
                                                                      Cookies::CookieError* err = nullptr);

/**
 * @brief Read every cookie of a Chromium-family browser into @p store.
 *
 * An empty result is a BrowserCookie error.
 */
[[nodiscard]] bool ExtractChromiumCookies(Cookies::Browser browser,
                                          const Cookies::BrowserCookieConfig& config,
                                          Cookies::CookieStore& store,
                                          Cookies::CookieError* err = nullptr,
                                          const ExtractionOptions& options = {});

}  // namespace Browser
}  // namespace BrowserJar
