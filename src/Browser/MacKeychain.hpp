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

#include <optional>
#include <string>
#include <string_view>

namespace BrowserJar {
namespace Browser {

/**
 * @brief Read a generic password from the login keychain.
 *
 * Used with service "<Account> Safe Storage" and account "<Account>".
 * Returns std::nullopt when the item is missing, access is denied, or the
 * build is not for macOS.
 */
[[nodiscard]] std::optional<std::string> FindKeychainPassword(std::string_view service, std::string_view account);

/// @brief Convenience wrapper for a Chromium "Safe Storage" entry
[[nodiscard]] std::optional<std::string> FindSafeStoragePassword(std::string_view keyringName);

}  // namespace Browser
}  // namespace BrowserJar
