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
 * @file StoreLocator.hpp
 * @brief Finds browser cookie stores on disk and snapshots them.
 *
 * Browsers keep their cookie database open (and often locked) while running,
 * so extractors never read the live file. The newest matching file is copied
 * into a scoped temporary directory first.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../Cookies/Cookie.hpp"
#include "../Utils/FileUtils.hpp"

namespace BrowserJar {
namespace Browser {

namespace fs = std::filesystem;

/**
 * @brief A cookie store copied away from the browser.
 *
 * Owns the temporary directory; the copy disappears with this object.
 */
struct StoreSnapshot {
    fs::path source;                          ///< Original file
    fs::path copy;                            ///< Copy inside tempDir
    Utils::FileUtils::ScopedTempDirectory tempDir;
};

/**
 * @brief Collect every file named @p fileName under @p roots.
 *
 * A root that is itself a regular file is accepted when its name matches.
 * Missing roots are skipped. When @p failOnUnreadable is set, a directory that
 * cannot be listed aborts the search with a BrowserCookie error; otherwise it
 * is skipped.
 */
[[nodiscard]] bool CollectFiles(const std::vector<fs::path>& roots,
                                std::string_view fileName,
                                bool failOnUnreadable,
                                std::vector<fs::path>& found,
                                Cookies::CookieError* err = nullptr);

/**
 * @brief Pick the most recently modified path.
 * @return std::nullopt when @p candidates is empty or none can be stat'ed
 */
[[nodiscard]] std::optional<fs::path> FindNewestFile(const std::vector<fs::path>& candidates);

/**
 * @brief Locate the newest @p fileName under @p roots.
 *
 * @param notFoundMessage Message for the FileNotFound error when nothing matches
 */
[[nodiscard]] bool FindCookieDatabase(const std::vector<fs::path>& roots,
                                      std::string_view fileName,
                                      bool failOnUnreadable,
                                      std::string_view notFoundMessage,
                                      fs::path& out,
                                      Cookies::CookieError* err = nullptr);

/**
 * @brief Copy @p source into a fresh temporary directory as @p copyName.
 *
 * A copy failure is a BrowserCookie error whose message tells the user to
 * close the browser, since a locked database is the usual cause.
 */
[[nodiscard]] bool CopyToTemp(const fs::path& source,
                              std::string_view copyName,
                              StoreSnapshot& snapshot,
                              Cookies::CookieError* err = nullptr);

}  // namespace Browser
}  // namespace BrowserJar
