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

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../Utils/ProcessUtils.hpp"
#include "../Utils/SystemUtils.hpp"
#include "WindowsCookieDecryptor.hpp"

namespace BrowserJar {
namespace Browser {

/// @brief Looks up the "<name> Safe Storage" keychain password
using KeychainLookup = std::function<std::optional<std::string>(std::string_view keyringName)>;

/**
 * @brief Host facilities used by one extraction call.
 *
 * Defaults describe the running machine. Every member can be replaced, which
 * lets one OS exercise another OS's layout and key handling.
 */
struct ExtractionOptions {
    /// @brief Which per-OS tables and key scheme to use
    Utils::SystemUtils::Platform platform = Utils::SystemUtils::CurrentPlatform();

    /// @brief HOME, APPDATA, XDG_* and desktop session variables
    Utils::SystemUtils::EnvironmentLookup env = Utils::SystemUtils::ProcessEnvironment();

    /// @brief Runner for dbus-send / kwallet-query; nullptr means the system runner
    std::shared_ptr<Utils::ProcessUtils::CommandRunner> commandRunner;

    /// @brief macOS keychain access; empty means the real keychain
    KeychainLookup keychainLookup;

    /// @brief Windows DPAPI access; empty means CryptUnprotectData
    DataUnprotector dataUnprotector;

    [[nodiscard]] Utils::ProcessUtils::CommandRunner& Runner() const {
        return commandRunner ? *commandRunner : Utils::ProcessUtils::DefaultCommandRunner();
    }
};

}  // namespace Browser
}  // namespace BrowserJar
