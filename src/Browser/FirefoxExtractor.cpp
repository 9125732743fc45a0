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
#include "FirefoxExtractor.hpp"

#include "StoreLocator.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <SQLiteCpp/SQLiteCpp.h>

#include <set>

namespace BrowserJar {
namespace Browser {

namespace FileUtils = Utils::FileUtils;
namespace JSON = Utils::JSON;
namespace SystemUtils = Utils::SystemUtils;
using Cookies::Cookie;
using Cookies::CookieErrorKind;
using Cookies::CookieStore;
using Cookies::SetCookieError;
using SystemUtils::Platform;

namespace {

constexpr std::string_view kCookiesFileName = "cookies.sqlite";
constexpr std::string_view kContainersFileName = "containers.json";
constexpr std::string_view kTempCopyName = "firefox-cookies.sqlite";

struct FirefoxColumns {
    const char* expiry = "expiry";
    const char* secure = "isSecure";
    const char* httpOnly = "0";
};

bool DetectColumns(SQLite::Database& db, FirefoxColumns& out, Cookies::CookieError* err) {
    std::set<std::string> columns;
    SQLite::Statement query(db, "PRAGMA table_info(moz_cookies)");
    while (query.executeStep()) {
        columns.insert(query.getColumn(1).getString());
    }

    if (columns.count("expiry")) out.expiry = "expiry";
    else if (columns.count("expires")) out.expiry = "expires";
    else {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Firefox cookies table missing expiry column", "DetectColumns");
    }

    out.secure = columns.count("is_secure") && !columns.count("isSecure") ? "is_secure" : "isSecure";

    if (columns.count("isHttpOnly")) out.httpOnly = "isHttpOnly";
    else if (columns.count("is_http_only")) out.httpOnly = "is_http_only";
    else out.httpOnly = "0";
    return true;
}

int64_t ReadSchemaVersion(SQLite::Database& db) {
    try {
        SQLite::Statement query(db, "PRAGMA user_version");
        return query.executeStep() ? query.getColumn(0).getInt64() : 0;
    }
    catch (const SQLite::Exception& ex) {
        BJ_LOG_DEBUG("Firefox", "No user_version: %s", ex.what());
        return 0;
    }
}

}  // namespace

std::vector<fs::path> FirefoxSearchRoots(const std::optional<std::string>& profile,
                                         Platform platform,
                                         const SystemUtils::EnvironmentLookup& env) {
    const fs::path home = SystemUtils::HomeDirectory(env);

    if (profile && Cookies::IsPathLike(*profile)) {
        return { FileUtils::ExpandHome(*profile, home) };
    }

    std::vector<fs::path> bases;
    switch (platform) {
        case Platform::Linux:
            bases.push_back(home / ".mozilla" / "firefox");
            bases.push_back(home / "snap" / "firefox" / "common" / ".mozilla" / "firefox");
            break;
        case Platform::MacOS:
            bases.push_back(home / "Library" / "Application Support" / "Firefox" / "Profiles");
            break;
        case Platform::Windows:
            if (auto appData = SystemUtils::GetEnv(env, "APPDATA")) {
                bases.push_back(fs::path(*appData) / "Mozilla" / "Firefox" / "Profiles");
            }
            else {
                BJ_LOG_WARN("Firefox", "APPDATA is not set");
            }
            break;
    }

    if (profile) {
        for (auto& base : bases) {
            base /= *profile;
        }
    }
    return bases;
}

bool L10nMatches(std::string_view container, std::string_view l10nId) noexcept {
    constexpr std::string_view prefix = "userContext";
    constexpr std::string_view suffix = ".label";
    if (l10nId.size() < prefix.size() + suffix.size()) return false;
    if (l10nId.substr(0, prefix.size()) != prefix) return false;
    if (l10nId.substr(l10nId.size() - suffix.size()) != suffix) return false;
    return l10nId.substr(prefix.size(), l10nId.size() - prefix.size() - suffix.size()) == container;
}

bool ResolveFirefoxContainer(const fs::path& cookieDb,
                             const std::optional<std::string>& container,
                             ContainerFilter& out,
                             Cookies::CookieError* err) {
    out = ContainerFilter{};
    if (!container) return true;

    if (*container == "none") {
        out.mode = ContainerMode::NoneOnly;
        return true;
    }

    const fs::path containersPath = cookieDb.parent_path() / fs::path(std::string(kContainersFileName));
    if (!FileUtils::IsRegularFile(containersPath)) {
        return SetCookieError(err, CookieErrorKind::FileNotFound,
            "Firefox containers.json not found", "ResolveFirefoxContainer");
    }

    JSON::Json doc;
    JSON::Error jerr;
    if (!JSON::LoadFromFile(containersPath, doc, &jerr)) {
        BJ_LOG_ERROR("Firefox", "Cannot load %s: %s", containersPath.string().c_str(), jerr.message.c_str());
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Failed to read containers.json: " + jerr.message, "ResolveFirefoxContainer");
    }

    const auto identities = doc.is_object() ? doc.find("identities") : doc.end();
    if (identities != doc.end() && identities->is_array()) {
        for (const auto& identity : *identities) {
            if (!identity.is_object()) continue;

            const auto name = JSON::GetString(identity, "name");
            const auto l10nId = JSON::GetString(identity, "l10nID");
            const auto userContextId = JSON::GetInt64(identity, "userContextId");

            const bool matches = (name && *name == *container) ||
                                 (l10nId && L10nMatches(*container, *l10nId));
            if (matches && userContextId) {
                out.mode = ContainerMode::Specific;
                out.userContextId = *userContextId;
                BJ_LOG_DEBUG("Firefox", "Container '%s' is userContextId %lld",
                    container->c_str(), static_cast<long long>(*userContextId));
                return true;
            }
        }
    }

    return SetCookieError(err, CookieErrorKind::Config,
        "Firefox container '" + *container + "' not found", "ResolveFirefoxContainer");
}

std::optional<int64_t> FirefoxExpiryToUnix(int64_t expiry, int64_t schemaVersion) noexcept {
    const int64_t seconds = schemaVersion >= FIREFOX_MILLISECOND_EXPIRY_SCHEMA ? expiry / 1000 : expiry;
    if (seconds <= 0) return std::nullopt;
    return seconds;
}

bool ExtractFirefoxCookies(const Cookies::BrowserCookieConfig& config,
                           CookieStore& store,
                           Cookies::CookieError* err,
                           const ExtractionOptions& options) {
    BJ_LOG_SCOPE("Firefox");
    store.clear();

    const auto roots = FirefoxSearchRoots(config.profile, options.platform, options.env);

    fs::path database;
    if (!FindCookieDatabase(roots, kCookiesFileName, false,
            "Firefox cookies database not found", database, err)) {
        return false;
    }

    StoreSnapshot snapshot;
    if (!CopyToTemp(database, kTempCopyName, snapshot, err)) {
        return false;
    }

    try {
        SQLite::Database db(snapshot.copy.string(), SQLite::OPEN_READONLY);

        const int64_t schemaVersion = ReadSchemaVersion(db);
        if (schemaVersion > FIREFOX_MAX_SCHEMA_VERSION) {
            BJ_LOG_WARN("Firefox", "Firefox cookie DB schema version %lld may be unsupported",
                static_cast<long long>(schemaVersion));
        }

        FirefoxColumns columns;
        if (!DetectColumns(db, columns, err)) {
            return false;
        }

        ContainerFilter filter;
        if (!ResolveFirefoxContainer(database, config.container, filter, err)) {
            return false;
        }

        std::string sql = std::string("SELECT host, name, value, path, ") + columns.expiry + ", " +
            columns.secure + ", " + columns.httpOnly + " FROM moz_cookies";
        switch (filter.mode) {
            case ContainerMode::Any:
                break;
            case ContainerMode::NoneOnly:
                sql += " WHERE NOT INSTR(originAttributes, 'userContextId=')";
                break;
            case ContainerMode::Specific:
                sql += " WHERE originAttributes LIKE ? OR originAttributes LIKE ?";
                break;
        }

        SQLite::Statement query(db, sql);
        if (filter.mode == ContainerMode::Specific) {
            const std::string id = std::to_string(filter.userContextId);
            query.bind(1, "%userContextId=" + id);
            query.bind(2, "%userContextId=" + id + "&%");
        }

        size_t dropped = 0;
        while (query.executeStep()) {
            Cookie cookie;
            cookie.domain = query.getColumn(0).getString();
            cookie.name = query.getColumn(1).getString();
            cookie.value = query.getColumn(2).getString();
            cookie.path = query.getColumn(3).getString();

            const SQLite::Column expiry = query.getColumn(4);
            if (!expiry.isNull()) {
                cookie.expires = FirefoxExpiryToUnix(expiry.getInt64(), schemaVersion);
            }
            cookie.secure = query.getColumn(5).getInt64() != 0;
            cookie.httpOnly = query.getColumn(6).getInt64() != 0;

            if (cookie.domain.empty() || cookie.name.empty()) {
                ++dropped;
                continue;
            }
            Cookies::AddCookie(store, std::move(cookie));
        }

        if (dropped > 0) {
            BJ_LOG_WARN("Firefox", "Skipped %zu cookie(s) without host or name", dropped);
        }
    }
    catch (const SQLite::Exception& ex) {
        store.clear();
        BJ_LOG_ERROR("Firefox", "Cookie database error: %s", ex.what());
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            std::string("Failed to read Firefox cookies DB: ") + ex.what(), "ExtractFirefoxCookies");
    }

    if (store.empty()) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "No Firefox cookies could be extracted", "ExtractFirefoxCookies");
    }

    BJ_LOG_INFO("Firefox", "Extracted %zu cookie(s)", Cookies::CountCookies(store));
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
