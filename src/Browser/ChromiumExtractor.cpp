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
#include "ChromiumExtractor.hpp"

#include "LinuxCookieDecryptor.hpp"
#include "LinuxKeyring.hpp"
#include "MacCookieDecryptor.hpp"
#include "MacKeychain.hpp"
#include "StoreLocator.hpp"
#include "WindowsCookieDecryptor.hpp"
#include "WindowsLocalState.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <SQLiteCpp/SQLiteCpp.h>

#include <charconv>
#include <set>

namespace BrowserJar {
namespace Browser {

namespace fs = std::filesystem;
namespace FileUtils = Utils::FileUtils;
namespace SystemUtils = Utils::SystemUtils;
using Cookies::Cookie;
using Cookies::CookieErrorKind;
using Cookies::CookieStore;
using Cookies::SetCookieError;
using SystemUtils::Platform;

namespace {

constexpr std::string_view kCookiesFileName = "Cookies";
constexpr std::string_view kTempCopyName = "chromium-cookies.sqlite";

int64_t ReadMetaVersion(SQLite::Database& db) {
    try {
        SQLite::Statement query(db, "SELECT value FROM meta WHERE key = 'version'");
        if (!query.executeStep()) return 0;

        const SQLite::Column col = query.getColumn(0);
        if (col.isInteger()) return col.getInt64();

        const std::string text = Utils::StringUtils::Trim(col.getString());
        int64_t version = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), version);
        if (ec != std::errc() || ptr != text.data() + text.size()) return 0;
        return version;
    }
    catch (const SQLite::Exception& ex) {
        BJ_LOG_DEBUG("Chromium", "No meta version: %s", ex.what());
        return 0;
    }
}

std::set<std::string> ReadColumnNames(SQLite::Database& db, const char* table) {
    std::set<std::string> columns;
    SQLite::Statement query(db, std::string("PRAGMA table_info(") + table + ")");
    while (query.executeStep()) {
        columns.insert(query.getColumn(1).getString());
    }
    return columns;
}

/// encrypted_value is a BLOB in current schemas but TEXT or NULL in some old ones
bool ReadEncryptedValue(const SQLite::Column& col, std::vector<uint8_t>& out, Cookies::CookieError* err) {
    out.clear();
    if (col.isNull()) return true;
    if (col.isBlob() || col.isText()) {
        const auto* data = static_cast<const uint8_t*>(col.getBlob());
        const int size = col.getBytes();
        if (data && size > 0) out.assign(data, data + size);
        return true;
    }
    return SetCookieError(err, CookieErrorKind::BrowserCookie,
        "Unsupported cookie ciphertext type", "ReadEncryptedValue");
}

}  // namespace

std::optional<int64_t> ChromiumExpiresToUnix(int64_t expiresUtc) noexcept {
    if (expiresUtc == 0) return std::nullopt;
    const int64_t unixSeconds = expiresUtc / 1'000'000 - Cookies::CookieConstants::WINDOWS_EPOCH_OFFSET;
    if (unixSeconds <= 0) return std::nullopt;
    return unixSeconds;
}

bool FindChromiumDatabase(const ChromiumSettings& settings,
                          const std::optional<std::string>& profile,
                          const fs::path& home,
                          fs::path& out,
                          Cookies::CookieError* err) {
    fs::path searchRoot = settings.userDataDir;

    if (profile) {
        if (Cookies::IsPathLike(*profile)) {
            const fs::path expanded = FileUtils::ExpandHome(*profile, home);
            if (FileUtils::IsRegularFile(expanded)) {
                out = expanded;
                return true;
            }
            searchRoot = expanded;
        }
        else if (settings.supportsProfiles) {
            searchRoot = settings.userDataDir / *profile;
        }
        else {
            BJ_LOG_WARN("Chromium", "Profile selection is not supported for this browser");
        }
    }

    if (!FileUtils::Exists(searchRoot)) {
        return SetCookieError(err, CookieErrorKind::FileNotFound,
            "Browser data dir not found: " + searchRoot.string(), "FindChromiumDatabase");
    }

    return FindCookieDatabase({ searchRoot }, kCookiesFileName, true,
        "Chrome cookies database not found", out, err);
}

std::unique_ptr<ICookieDecryptor> CreateCookieDecryptor(const ChromiumSettings& settings,
                                                        int64_t metaVersion,
                                                        const std::optional<std::string>& keyringOverride,
                                                        const ExtractionOptions& options,
                                                        Cookies::CookieError* err) {
    switch (options.platform) {
        case Platform::Linux: {
            std::optional<std::string> password;
            if (!GetLinuxKeyringPassword(settings.keyringName, keyringOverride, options.env,
                    options.Runner(), password, err)) {
                return nullptr;
            }
            return std::make_unique<LinuxCookieDecryptor>(password, metaVersion);
        }
        case Platform::MacOS: {
            const auto password = options.keychainLookup
                ? options.keychainLookup(settings.keyringName)
                : FindSafeStoragePassword(settings.keyringName);
            return std::make_unique<MacCookieDecryptor>(password, metaVersion);
        }
        case Platform::Windows: {
            const DataUnprotector unprotect = options.dataUnprotector
                ? options.dataUnprotector
                : SystemDataUnprotector();
            std::optional<std::vector<uint8_t>> masterKey;
            if (!LoadWindowsMasterKey(settings.userDataDir, unprotect, masterKey, err)) {
                return nullptr;
            }
            return std::make_unique<WindowsCookieDecryptor>(std::move(masterKey), metaVersion, unprotect);
        }
    }

    SetCookieError(err, CookieErrorKind::Unsupported, "Unknown platform", "CreateCookieDecryptor");
    return nullptr;
}

bool ExtractChromiumCookies(Cookies::Browser browser,
                            const Cookies::BrowserCookieConfig& config,
                            CookieStore& store,
                            Cookies::CookieError* err,
                            const ExtractionOptions& options) {
    BJ_LOG_SCOPE("Chromium");
    store.clear();

    ChromiumSettings settings;
    if (!ResolveChromiumSettings(browser, options.platform, options.env, settings, err)) {
        return false;
    }

    fs::path database;
    if (!FindChromiumDatabase(settings, config.profile, SystemUtils::HomeDirectory(options.env), database, err)) {
        return false;
    }

    StoreSnapshot snapshot;
    if (!CopyToTemp(database, kTempCopyName, snapshot, err)) {
        return false;
    }

    try {
        SQLite::Database db(snapshot.copy.string(), SQLite::OPEN_READONLY);

        const int64_t metaVersion = ReadMetaVersion(db);
        BJ_LOG_DEBUG("Chromium", "Cookie database meta version %lld", static_cast<long long>(metaVersion));

        const auto columns = ReadColumnNames(db, "cookies");
        if (columns.empty()) {
            return SetCookieError(err, CookieErrorKind::BrowserCookie,
                "Chromium cookies table not found", "ExtractChromiumCookies");
        }
        const char* secureColumn = columns.count("is_secure") ? "is_secure" : "secure";
        const char* httpOnlyColumn = columns.count("is_httponly") ? "is_httponly"
                                   : columns.count("httponly") ? "httponly" : "0";

        auto decryptor = CreateCookieDecryptor(settings, metaVersion, config.keyring, options, err);
        if (!decryptor) {
            return false;
        }

        const std::string sql =
            std::string("SELECT host_key, name, value, encrypted_value, path, expires_utc, ") +
            secureColumn + ", " + httpOnlyColumn + " FROM cookies";
        SQLite::Statement query(db, sql);

        size_t dropped = 0;
        while (query.executeStep()) {
            Cookie cookie;
            cookie.domain = query.getColumn(0).getString();
            cookie.name = query.getColumn(1).getString();
            std::string plainValue = query.getColumn(2).getString();

            std::vector<uint8_t> encrypted;
            if (!ReadEncryptedValue(query.getColumn(3), encrypted, err)) {
                store.clear();
                return false;
            }

            cookie.path = query.getColumn(4).getString();
            cookie.expires = ChromiumExpiresToUnix(query.getColumn(5).getInt64());
            cookie.secure = query.getColumn(6).getInt64() != 0;
            cookie.httpOnly = query.getColumn(7).getInt64() != 0;

            if (cookie.domain.empty() || cookie.name.empty()) {
                ++dropped;
                continue;
            }

            if (!plainValue.empty()) {
                cookie.value = std::move(plainValue);
            }
            else if (!encrypted.empty()) {
                auto decrypted = decryptor->Decrypt(encrypted);
                if (!decrypted) {
                    ++dropped;
                    continue;
                }
                cookie.value = std::move(*decrypted);
            }
            else {
                ++dropped;
                continue;
            }

            Cookies::AddCookie(store, std::move(cookie));
        }

        if (dropped > 0) {
            BJ_LOG_WARN("Chromium", "Skipped %zu cookie(s) that could not be decrypted", dropped);
        }
    }
    catch (const SQLite::Exception& ex) {
        store.clear();
        BJ_LOG_ERROR("Chromium", "Cookie database error: %s", ex.what());
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            std::string("Failed to read Chromium cookies DB: ") + ex.what(), "ExtractChromiumCookies");
    }

    if (store.empty()) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "No Chromium cookies could be extracted", "ExtractChromiumCookies");
    }

    BJ_LOG_INFO("Chromium", "Extracted %zu cookie(s) from %s",
        Cookies::CountCookies(store), Cookies::BrowserToString(browser));
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
