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
#pragma once

#include <filesystem>
#include <string>

#include "../Cookies/Cookie.hpp"
#include "../Utils/SystemUtils.hpp"

namespace BrowserJar {
namespace Browser {

/**
 * @brief Where a Chromium-family browser keeps its data on one OS.
 */
struct ChromiumSettings {
    /// @brief Root of the browser's "User Data" tree
    std::filesystem::path userDataDir;

    /// @brief Name used for the OS secret ("<name> Safe Storage")
    std::string keyringName;

    /// @brief False for browsers with a single flat profile (Opera)
    bool supportsProfiles = true;
};

/**
 * @brief Resolve settings for @p browser from the static per-OS tables.
 *
 * Linux: $XDG_CONFIG_HOME or ~/.config. macOS: ~/Library/Application Support.
 * Windows: %LOCALAPPDATA% (%APPDATA% for Opera).
 *
 * @return false with a Config error when the environment root is unset, or
 *         when @p browser is not Chromium based
 */
[[nodiscard]] bool ResolveChromiumSettings(Cookies::Browser browser,
                                           Utils::SystemUtils::Platform platform,
                                           const Utils::SystemUtils::EnvironmentLookup& env,
                                           ChromiumSettings& out,
                                           Cookies::CookieError* err = nullptr);

}  // namespace Browser
}  // namespace BrowserJar
