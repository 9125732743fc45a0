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
 * @file BrowserCookieExtractor.hpp
 * @brief Entry point: extract a browser's cookies from a BrowserCookieConfig.
 *
 * Usage:
 * @code
 *   Cookies::BrowserCookieConfig config;
 *   Cookies::CookieError err;
 *   Cookies::CookieStore store;
 *   if (Cookies::BrowserCookieConfig::Parse("firefox::Work", config, &err) &&
 *       Browser::ExtractCookies(config, store, &err)) {
 *       auto header = Cookies::CookiesToHeader(Cookies::CookiesForUrl(store, url));
 *   }
 * @endcode
 */

#pragma once

#include <future>

#include "../Cookies/Cookie.hpp"
#include "ExtractionOptions.hpp"

namespace BrowserJar {
namespace Browser {

/// @brief Result of an asynchronous extraction
struct ExtractionResult {
    bool ok = false;
    Cookies::CookieStore store;
    Cookies::CookieError error;
};

/**
 * @brief Extract every cookie of @p config.browser.
 *
 * Blocking: copies the store, may query the OS keyring and spawn helper
 * processes. @p store is empty on failure.
 */
[[nodiscard]] bool ExtractCookies(const Cookies::BrowserCookieConfig& config,
                                  Cookies::CookieStore& store,
                                  Cookies::CookieError* err = nullptr,
                                  const ExtractionOptions& options = {});

/// @brief Run ExtractCookies on its own thread
[[nodiscard]] std::future<ExtractionResult> ExtractCookiesAsync(Cookies::BrowserCookieConfig config,
                                                                ExtractionOptions options = {});

}  // namespace Browser
}  // namespace BrowserJar
