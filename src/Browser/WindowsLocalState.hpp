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
 * @file WindowsLocalState.hpp
 * @brief Chromium master key from the "Local State" JSON file.
 *
 * Layout: {"os_crypt": {"encrypted_key": base64("DPAPI" + dpapi_blob)}}
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include "../Cookies/Cookie.hpp"
#include "WindowsCookieDecryptor.hpp"

namespace BrowserJar {
namespace Browser {

inline constexpr std::string_view LOCAL_STATE_FILE_NAME = "Local State";
inline constexpr std::string_view DPAPI_KEY_PREFIX = "DPAPI";

/**
 * @brief Extract the DPAPI-wrapped master key from Local State text.
 *
 * @return The blob with the "DPAPI" prefix removed, or std::nullopt when the
 *         JSON is invalid, the key is missing, base64 decoding fails, or the
 *         prefix is absent
 */
[[nodiscard]] std::optional<std::vector<uint8_t>> ParseLocalStateKey(std::string_view localStateJson);

/**
 * @brief Find the newest Local State under @p userDataDir and unwrap its key.
 *
 * A missing file or unusable key leaves @p key empty and succeeds; only a
 * Local State that exists but cannot be read is an error.
 */
[[nodiscard]] bool LoadWindowsMasterKey(const std::filesystem::path& userDataDir,
                                        const DataUnprotector& unprotect,
                                        std::optional<std::vector<uint8_t>>& key,
                                        Cookies::CookieError* err = nullptr);

}  // namespace Browser
}  // namespace BrowserJar
