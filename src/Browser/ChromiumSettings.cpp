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
#include "ChromiumSettings.hpp"

namespace BrowserJar {
namespace Browser {

using Cookies::Browser;
using Cookies::CookieErrorKind;
using Cookies::SetCookieError;
using Utils::SystemUtils::Platform;
namespace SystemUtils = Utils::SystemUtils;

namespace {

struct SettingsRow {
    Browser browser;
    const char* relativeDir;
    const char* keyringName;
    bool supportsProfiles;
};

constexpr SettingsRow kLinuxTable[] = {
    {Browser::Chrome,  "google-chrome",               "Chrome",   true},
    {Browser::Edge,    "microsoft-edge",              "Chromium", true},
    {Browser::Brave,   "BraveSoftware/Brave-Browser", "Brave",    true},
    {Browser::Opera,   "opera",                       "Chromium", false},
    {Browser::Vivaldi, "vivaldi",                     "Chrome",   true},
    {Browser::Whale,   "naver-whale",                 "Whale",    true},
};

constexpr SettingsRow kMacTable[] = {
    {Browser::Chrome,  "Google/Chrome",               "Chrome",         true},
    {Browser::Edge,    "Microsoft Edge",              "Microsoft Edge", true},
    {Browser::Brave,   "BraveSoftware/Brave-Browser", "Brave",          true},
    {Browser::Opera,   "com.operasoftware.Opera",     "Opera",          false},
    {Browser::Vivaldi, "Vivaldi",                     "Vivaldi",        true},
    {Browser::Whale,   "Naver/Whale",                 "Whale",          true},
};

// Windows keys come from "Local State", keyringName is informational only
constexpr SettingsRow kWindowsTable[] = {
    {Browser::Chrome,  "Google/Chrome/User Data",               "Chrome",         true},
    {Browser::Edge,    "Microsoft/Edge/User Data",              "Microsoft Edge", true},
    {Browser::Brave,   "BraveSoftware/Brave-Browser/User Data", "Brave",          true},
    {Browser::Opera,   "Opera Software/Opera Stable",           "Opera",          false},
    {Browser::Vivaldi, "Vivaldi/User Data",                     "Vivaldi",        true},
    {Browser::Whale,   "Naver/Naver Whale/User Data",           "Whale",          true},
};

template <size_t N>
const SettingsRow* FindRow(const SettingsRow (&table)[N], Browser browser) noexcept {
    for (const auto& row : table) {
        if (row.browser == browser) return &row;
    }
    return nullptr;
}

}  // namespace

bool ResolveChromiumSettings(Browser browser,
                             Platform platform,
                             const SystemUtils::EnvironmentLookup& env,
                             ChromiumSettings& out,
                             Cookies::CookieError* err) {
    out = ChromiumSettings{};

    const SettingsRow* row = nullptr;
    std::filesystem::path base;

    switch (platform) {
        case Platform::Linux: {
            row = FindRow(kLinuxTable, browser);
            if (auto xdg = SystemUtils::GetEnv(env, "XDG_CONFIG_HOME")) {
                base = *xdg;
            }
            else {
                const auto home = SystemUtils::HomeDirectory(env);
                if (home.empty()) {
                    return SetCookieError(err, CookieErrorKind::Config,
                        "Cannot determine config directory", "ResolveChromiumSettings");
                }
                base = home / ".config";
            }
            break;
        }
        case Platform::MacOS: {
            row = FindRow(kMacTable, browser);
            const auto home = SystemUtils::HomeDirectory(env);
            if (home.empty()) {
                return SetCookieError(err, CookieErrorKind::Config,
                    "Cannot determine home directory", "ResolveChromiumSettings");
            }
            base = home / "Library" / "Application Support";
            break;
        }
        case Platform::Windows: {
            row = FindRow(kWindowsTable, browser);
            const char* var = browser == Browser::Opera ? "APPDATA" : "LOCALAPPDATA";
            auto root = SystemUtils::GetEnv(env, var);
            if (!root) {
                return SetCookieError(err, CookieErrorKind::Config,
                    std::string(var) + " is not set", "ResolveChromiumSettings");
            }
            base = *root;
            break;
        }
    }

    if (!row) {
        return SetCookieError(err, CookieErrorKind::Config,
            std::string("Not a Chromium based browser: ") + Cookies::BrowserToString(browser),
            "ResolveChromiumSettings");
    }

    out.userDataDir = base / std::filesystem::path(row->relativeDir);
    out.keyringName = row->keyringName;
    out.supportsProfiles = row->supportsProfiles;
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
