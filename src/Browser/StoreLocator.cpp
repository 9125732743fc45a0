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
#include "StoreLocator.hpp"

#include "../Utils/Logger.hpp"

namespace BrowserJar {
namespace Browser {

namespace FileUtils = Utils::FileUtils;
using Cookies::CookieErrorKind;
using Cookies::SetCookieError;

bool CollectFiles(const std::vector<fs::path>& roots,
                  std::string_view fileName,
                  bool failOnUnreadable,
                  std::vector<fs::path>& found,
                  Cookies::CookieError* err) {
    found.clear();

    for (const auto& root : roots) {
        if (FileUtils::IsRegularFile(root)) {
            if (root.filename() == fs::path(fileName)) {
                found.push_back(root);
            }
            continue;
        }
        if (!FileUtils::IsDirectory(root)) {
            BJ_LOG_DEBUG("Locator", "Search root does not exist: %s", root.string().c_str());
            continue;
        }

        FileUtils::WalkOptions opts;
        opts.recursive = true;
        opts.followSymlinks = false;
        opts.stopOnUnreadable = failOnUnreadable;

        FileUtils::Error walkErr;
        const bool ok = FileUtils::WalkDirectory(root, opts,
            [&](const fs::directory_entry& entry) {
                if (entry.path().filename() == fs::path(fileName)) {
                    found.push_back(entry.path());
                }
                return true;
            }, &walkErr);

        if (!ok) {
            BJ_LOG_ERROR("Locator", "Cannot read browser data directory: %s", walkErr.message.c_str());
            return SetCookieError(err, CookieErrorKind::BrowserCookie,
                "Failed to read browser data directory: " + walkErr.message, "CollectFiles");
        }
    }

    BJ_LOG_DEBUG("Locator", "Found %zu candidate(s) named %.*s",
        found.size(), static_cast<int>(fileName.size()), fileName.data());
    return true;
}

std::optional<fs::path> FindNewestFile(const std::vector<fs::path>& candidates) {
    std::optional<fs::path> newest;
    fs::file_time_type newestTime{};

    for (const auto& path : candidates) {
        fs::file_time_type t{};
        if (!FileUtils::GetLastWriteTime(path, t)) {
            BJ_LOG_DEBUG("Locator", "Skipping candidate without mtime: %s", path.string().c_str());
            continue;
        }
        if (!newest || t > newestTime) {
            newest = path;
            newestTime = t;
        }
    }
    return newest;
}

bool FindCookieDatabase(const std::vector<fs::path>& roots,
                        std::string_view fileName,
                        bool failOnUnreadable,
                        std::string_view notFoundMessage,
                        fs::path& out,
                        Cookies::CookieError* err) {
    std::vector<fs::path> candidates;
    if (!CollectFiles(roots, fileName, failOnUnreadable, candidates, err)) {
        return false;
    }

    auto newest = FindNewestFile(candidates);
    if (!newest) {
        return SetCookieError(err, CookieErrorKind::FileNotFound,
            std::string(notFoundMessage), "FindCookieDatabase");
    }

    out = std::move(*newest);
    BJ_LOG_INFO("Locator", "Using cookie store %s", out.string().c_str());
    return true;
}

bool CopyToTemp(const fs::path& source,
                std::string_view copyName,
                StoreSnapshot& snapshot,
                Cookies::CookieError* err) {
    FileUtils::Error ferr;
    if (!snapshot.tempDir.Create("browserjar-", &ferr)) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Failed to create temp dir: " + ferr.message, "CopyToTemp");
    }

    snapshot.source = source;
    snapshot.copy = snapshot.tempDir.Path() / fs::path(std::string(copyName));

    if (!FileUtils::CopyFile(source, snapshot.copy, &ferr)) {
        BJ_LOG_ERROR("Locator", "Copy of %s failed: %s", source.string().c_str(), ferr.message.c_str());
        std::string msg = "Failed to copy cookies DB " + source.string() + ": " + ferr.message +
            ". Close the browser or run without elevation.";
        return SetCookieError(err, CookieErrorKind::BrowserCookie, std::move(msg), "CopyToTemp");
    }
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
