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
#include "BrowserCookieExtractor.hpp"

#include "ChromiumExtractor.hpp"
#include "FirefoxExtractor.hpp"
#include "SafariParser.hpp"
#include "../Utils/Logger.hpp"

namespace BrowserJar {
namespace Browser {

using Cookies::Browser;

bool ExtractCookies(const Cookies::BrowserCookieConfig& config,
                    Cookies::CookieStore& store,
                    Cookies::CookieError* err,
                    const ExtractionOptions& options) {
    if (err) err->Clear();
    BJ_LOG_INFO("Extractor", "Extracting cookies for %s on %s",
        config.ToString().c_str(), Utils::SystemUtils::PlatformToString(options.platform));

    switch (config.browser) {
        case Browser::Firefox:
            return ExtractFirefoxCookies(config, store, err, options);
        case Browser::Safari:
            return ExtractSafariCookies(config, store, err, options);
        case Browser::Chrome:
        case Browser::Edge:
        case Browser::Brave:
        case Browser::Opera:
        case Browser::Vivaldi:
        case Browser::Whale:
            return ExtractChromiumCookies(config.browser, config, store, err, options);
    }

    store.clear();
    return Cookies::SetCookieError(err, Cookies::CookieErrorKind::Unsupported,
        "Unsupported browser", "ExtractCookies");
}

std::future<ExtractionResult> ExtractCookiesAsync(Cookies::BrowserCookieConfig config, ExtractionOptions options) {
    return std::async(std::launch::async,
        [config = std::move(config), options = std::move(options)]() {
            ExtractionResult result;
            result.ok = ExtractCookies(config, result.store, &result.error, options);
            return result;
        });
}

}  // namespace Browser
}  // namespace BrowserJar
