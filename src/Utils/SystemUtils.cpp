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
#include "SystemUtils.hpp"

#include <cstdlib>

namespace BrowserJar {
    namespace Utils {
        namespace SystemUtils {

            const char* PlatformToString(Platform p) noexcept {
                switch (p) {
                case Platform::Linux:   return "linux";
                case Platform::MacOS:   return "macos";
                case Platform::Windows: return "windows";
                }
                return "unknown";
            }

            EnvironmentLookup ProcessEnvironment() {
                return [](std::string_view name) -> std::optional<std::string> {
                    const std::string key(name);
#ifdef _WIN32
                    char* value = nullptr;
                    size_t len = 0;
                    if (_dupenv_s(&value, &len, key.c_str()) != 0 || !value) return std::nullopt;
                    std::string out(value);
                    std::free(value);
                    return out;
#else
                    const char* value = std::getenv(key.c_str());
                    if (!value) return std::nullopt;
                    return std::string(value);
#endif
                };
            }

            EnvironmentLookup FixedEnvironment(std::map<std::string, std::string> vars) {
                return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
                    const auto it = vars.find(std::string(name));
                    if (it == vars.end()) return std::nullopt;
                    return it->second;
                };
            }

            std::optional<std::string> GetEnv(const EnvironmentLookup& env, std::string_view name) {
                if (!env) return std::nullopt;
                auto value = env(name);
                if (!value || value->empty()) return std::nullopt;
                return value;
            }

            std::filesystem::path HomeDirectory(const EnvironmentLookup& env) {
                if (auto home = GetEnv(env, "HOME")) return std::filesystem::path(*home);
#ifdef _WIN32
                if (auto profile = GetEnv(env, "USERPROFILE")) return std::filesystem::path(*profile);
#endif
                return {};
            }

        } // namespace SystemUtils
    } // namespace Utils
} // namespace BrowserJar
