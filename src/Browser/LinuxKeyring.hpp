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
 * @file LinuxKeyring.hpp
 * @brief Chromium "Safe Storage" password lookup on Linux desktops.
 *
 * Backends:
 * - KWallet (4, 5, 6) through the dbus-send and kwallet-query helpers
 * - GNOME Keyring / Secret Service through libsecret
 * - BasicText: no password, Chromium falls back to its built-in key
 *
 * A missing or unreadable secret is never fatal. Only an invalid keyring
 * name given by the user is an error.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../Cookies/Cookie.hpp"
#include "../Utils/ProcessUtils.hpp"
#include "../Utils/SystemUtils.hpp"

namespace BrowserJar {
namespace Browser {

enum class LinuxDesktopEnvironment : uint8_t {
    Other,
    Cinnamon,
    Deepin,
    Gnome,
    Kde3,
    Kde4,
    Kde5,
    Kde6,
    Pantheon,
    Ukui,
    Unity,
    Xfce,
    Lxqt
};

enum class LinuxKeyring : uint8_t {
    KWallet,
    KWallet5,
    KWallet6,
    GnomeKeyring,
    BasicText
};

[[nodiscard]] const char* LinuxDesktopEnvironmentToString(LinuxDesktopEnvironment de) noexcept;
[[nodiscard]] const char* LinuxKeyringToString(LinuxKeyring keyring) noexcept;

/**
 * @brief Detect the desktop from XDG_CURRENT_DESKTOP, DESKTOP_SESSION,
 *        GNOME_DESKTOP_SESSION_ID and KDE_FULL_SESSION / KDE_SESSION_VERSION.
 */
[[nodiscard]] LinuxDesktopEnvironment DetectDesktopEnvironment(const Utils::SystemUtils::EnvironmentLookup& env);

/**
 * @brief Default keyring for a desktop.
 *
 * KDE 4/5/6 map to the matching KWallet; KDE 3, LXQt and unknown desktops use
 * BasicText; everything else uses GNOME Keyring.
 */
[[nodiscard]] LinuxKeyring ChooseLinuxKeyring(LinuxDesktopEnvironment de) noexcept;

/**
 * @brief Parse a user keyring override (case-insensitive).
 *
 * Accepts kwallet, kwallet5, kwallet6, gnome, gnomekeyring, basic, basictext.
 */
[[nodiscard]] bool ParseLinuxKeyring(std::string_view text, LinuxKeyring& out, Cookies::CookieError* err = nullptr);

/**
 * @brief Ask kwalletd for the network wallet name. Falls back to "kdewallet".
 */
[[nodiscard]] std::string GetKWalletNetworkWallet(LinuxKeyring keyring, Utils::ProcessUtils::CommandRunner& runner);

/**
 * @brief Read "<name> Safe Storage" from folder "<name> Keys" via kwallet-query.
 *
 * Returns std::nullopt when the helper fails, exits non-zero or reports
 * "failed to read". An empty stored password is returned as "".
 */
[[nodiscard]] std::optional<std::string> GetKWalletPassword(std::string_view keyringName, LinuxKeyring keyring,
                                                            Utils::ProcessUtils::CommandRunner& runner);

/**
 * @brief Read "<name> Safe Storage" from the Secret Service default collection.
 *
 * Returns std::nullopt when the service, collection or item is unavailable,
 * or when the build has no libsecret support.
 */
[[nodiscard]] std::optional<std::string> GetGnomeKeyringPassword(std::string_view keyringName);

/**
 * @brief Resolve the keyring (override or detection) and read the password.
 *
 * @param out Set to the password, or std::nullopt for BasicText and for a
 *            keyring that could not be read
 * @return false only for an invalid @p keyringOverride (Config error)
 */
[[nodiscard]] bool GetLinuxKeyringPassword(std::string_view keyringName,
                                           const std::optional<std::string>& keyringOverride,
                                           const Utils::SystemUtils::EnvironmentLookup& env,
                                           Utils::ProcessUtils::CommandRunner& runner,
                                           std::optional<std::string>& out,
                                           Cookies::CookieError* err = nullptr);

}  // namespace Browser
}  // namespace BrowserJar
