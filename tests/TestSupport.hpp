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
 * @file TestSupport.hpp
 * @brief Fixtures shared by the extractor tests: temp trees, SQLite stores
 * built with SQLiteCpp, and Chromium-style encryption.
 */

#pragma once

#include <gtest/gtest.h>
#include <SQLiteCpp/SQLiteCpp.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../src/Browser/CookieDecryptor.hpp"
#include "../src/Utils/CryptoUtils.hpp"
#include "../src/Utils/FileUtils.hpp"
#include "../src/Utils/SystemUtils.hpp"

namespace BrowserJar {
namespace Testing {

namespace fs = std::filesystem;

/// @brief Temp directory that fails the test when it cannot be created
class TempTree {
public:
    TempTree() {
        Utils::FileUtils::Error err;
        if (!m_dir.Create("browserjar-test-", &err)) {
            ADD_FAILURE() << "cannot create temp dir: " << err.message;
        }
    }

    [[nodiscard]] const fs::path& Root() const noexcept { return m_dir.Path(); }

    fs::path MakeDir(const fs::path& relative) const {
        const fs::path dir = Root() / relative;
        Utils::FileUtils::Error err;
        EXPECT_TRUE(Utils::FileUtils::CreateDirectories(dir, &err)) << err.message;
        return dir;
    }

    fs::path WriteFile(const fs::path& relative, std::string_view content) const {
        const fs::path file = Root() / relative;
        MakeDir(relative.parent_path());
        EXPECT_TRUE(Utils::FileUtils::WriteAllTextUtf8(file, content));
        return file;
    }

private:
    Utils::FileUtils::ScopedTempDirectory m_dir;
};

struct ChromiumRow {
    std::string hostKey;
    std::string name;
    std::string value;
    std::vector<uint8_t> encryptedValue;
    std::string path = "/";
    int64_t expiresUtc = 0;
    bool secure = false;
    bool httpOnly = false;
};

/**
 * @brief Write a Chromium "Cookies" database.
 * @param modernColumns is_secure/is_httponly when true, secure/httponly otherwise
 */
inline void CreateChromiumDatabase(const fs::path& file,
                                   const std::vector<ChromiumRow>& rows,
                                   std::optional<int64_t> metaVersion = std::nullopt,
                                   bool modernColumns = true) {
    EXPECT_TRUE(Utils::FileUtils::CreateDirectories(file.parent_path()));

    SQLite::Database db(file.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    db.exec("CREATE TABLE meta (key LONGVARCHAR NOT NULL UNIQUE PRIMARY KEY, value LONGVARCHAR)");
    if (metaVersion) {
        SQLite::Statement meta(db, "INSERT INTO meta (key, value) VALUES ('version', ?)");
        meta.bind(1, std::to_string(*metaVersion));
        meta.exec();
    }

    const std::string secureCol = modernColumns ? "is_secure" : "secure";
    const std::string httpOnlyCol = modernColumns ? "is_httponly" : "httponly";
    db.exec("CREATE TABLE cookies (creation_utc INTEGER NOT NULL DEFAULT 0, host_key TEXT NOT NULL, "
            "name TEXT NOT NULL, value TEXT NOT NULL, encrypted_value BLOB, path TEXT NOT NULL, "
            "expires_utc INTEGER NOT NULL, " + secureCol + " INTEGER NOT NULL, " +
            httpOnlyCol + " INTEGER NOT NULL)");

    SQLite::Statement insert(db,
        "INSERT INTO cookies (host_key, name, value, encrypted_value, path, expires_utc, " +
        secureCol + ", " + httpOnlyCol + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto& row : rows) {
        insert.bind(1, row.hostKey);
        insert.bind(2, row.name);
        insert.bind(3, row.value);
        if (row.encryptedValue.empty()) {
            insert.bind(4);
        }
        else {
            insert.bind(4, row.encryptedValue.data(), static_cast<int>(row.encryptedValue.size()));
        }
        insert.bind(5, row.path);
        insert.bind(6, static_cast<int64_t>(row.expiresUtc));
        insert.bind(7, row.secure ? 1 : 0);
        insert.bind(8, row.httpOnly ? 1 : 0);
        insert.exec();
        insert.reset();
    }
}

struct FirefoxRow {
    std::string host;
    std::string name;
    std::string value;
    std::string path = "/";
    int64_t expiry = 0;
    bool secure = false;
    bool httpOnly = false;
    std::string originAttributes;
};

/// @brief Write a Firefox "cookies.sqlite" with the given user_version
inline void CreateFirefoxDatabase(const fs::path& file,
                                  const std::vector<FirefoxRow>& rows,
                                  int schemaVersion) {
    EXPECT_TRUE(Utils::FileUtils::CreateDirectories(file.parent_path()));

    SQLite::Database db(file.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    db.exec("PRAGMA user_version = " + std::to_string(schemaVersion));
    db.exec("CREATE TABLE moz_cookies (id INTEGER PRIMARY KEY, originAttributes TEXT NOT NULL DEFAULT '', "
            "name TEXT, value TEXT, host TEXT, path TEXT, expiry INTEGER, lastAccessed INTEGER, "
            "creationTime INTEGER, isSecure INTEGER, isHttpOnly INTEGER)");

    SQLite::Statement insert(db,
        "INSERT INTO moz_cookies (originAttributes, name, value, host, path, expiry, isSecure, isHttpOnly) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    for (const auto& row : rows) {
        insert.bind(1, row.originAttributes);
        insert.bind(2, row.name);
        insert.bind(3, row.value);
        insert.bind(4, row.host);
        insert.bind(5, row.path);
        insert.bind(6, static_cast<int64_t>(row.expiry));
        insert.bind(7, row.secure ? 1 : 0);
        insert.bind(8, row.httpOnly ? 1 : 0);
        insert.exec();
        insert.reset();
    }
}

/// @brief "<tag>" + AES-128-CBC(PBKDF2-SHA1(password, saltysalt, iterations), IV of spaces)
inline std::vector<uint8_t> EncryptChromiumCbc(std::string_view tag,
                                               std::string_view password,
                                               uint32_t iterations,
                                               const std::vector<uint8_t>& plaintext) {
    std::vector<uint8_t> key;
    EXPECT_TRUE(Browser::DeriveChromiumKey(password, iterations, key));

    Utils::CryptoUtils::SymmetricCipher cipher(Utils::CryptoUtils::SymmetricAlgorithm::AES_128_CBC);
    EXPECT_TRUE(cipher.SetKey(key));
    EXPECT_TRUE(cipher.SetIV(Browser::ChromiumCrypto::CBC_IV, sizeof(Browser::ChromiumCrypto::CBC_IV)));

    std::vector<uint8_t> ciphertext;
    EXPECT_TRUE(cipher.Encrypt(plaintext.data(), plaintext.size(), ciphertext));

    std::vector<uint8_t> out(tag.begin(), tag.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    return out;
}

inline std::vector<uint8_t> EncryptChromiumCbc(std::string_view tag,
                                               std::string_view password,
                                               uint32_t iterations,
                                               std::string_view plaintext) {
    return EncryptChromiumCbc(tag, password, iterations, std::vector<uint8_t>(plaintext.begin(), plaintext.end()));
}

/// @brief "v10" + nonce + AES-256-GCM(plaintext) + tag
inline std::vector<uint8_t> EncryptChromiumGcm(const std::vector<uint8_t>& key, std::string_view plaintext) {
    const std::vector<uint8_t> nonce(Utils::CryptoUtils::GCM_NONCE_SIZE, 0x42);

    Utils::CryptoUtils::SymmetricCipher cipher(Utils::CryptoUtils::SymmetricAlgorithm::AES_256_GCM);
    EXPECT_TRUE(cipher.SetKey(key));
    EXPECT_TRUE(cipher.SetIV(nonce));

    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
    EXPECT_TRUE(cipher.EncryptAEAD(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size(),
        nullptr, 0, ciphertext, tag));

    std::vector<uint8_t> out = { 'v', '1', '0' };
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

/// @brief Microseconds since 1601-01-01 for a Unix time
constexpr int64_t ToChromiumTime(int64_t unixSeconds) noexcept {
    return (unixSeconds + 11644473600LL) * 1000000LL;
}

}  // namespace Testing
}  // namespace BrowserJar
