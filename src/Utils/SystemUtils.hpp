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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace BrowserJar {
    namespace Utils {
        namespace SystemUtils {

            enum class Platform : uint8_t {
                Linux,
                MacOS,
                Windows
            };

            /// Platform this binary was compiled for
            [[nodiscard]] constexpr Platform CurrentPlatform() noexcept {
#if defined(_WIN32)
                return Platform::Windows;
#elif defined(__APPLE__)
                return Platform::MacOS;
#else
                return Platform::Linux;
#endif
            }

            [[nodiscard]] const char* PlatformToString(Platform p) noexcept;

            /**
             * @brief Environment variable lookup.
             *
             * Returns std::nullopt for unset variables. Components that read the
             * environment take one of these so tests can supply a fixed map.
             */
            using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

            /// Lookup backed by the real process environment
            [[nodiscard]] EnvironmentLookup ProcessEnvironment();

            /// Lookup backed by a fixed map (unlisted names are unset)
            [[nodiscard]] EnvironmentLookup FixedEnvironment(std::map<std::string, std::string> vars);

            /**
             * @brief Read a variable through @p env, treating empty values as unset.
             */
            [[nodiscard]] std::optional<std::string> GetEnv(const EnvironmentLookup& env, std::string_view name);

            /**
             * @brief Current user's home directory.
             *
             * HOME first, then USERPROFILE on Windows. Empty path when neither is set.
             */
            [[nodiscard]] std::filesystem::path HomeDirectory(const EnvironmentLookup& env);

        } // namespace SystemUtils
    } // namespace Utils
} // namespace BrowserJar
