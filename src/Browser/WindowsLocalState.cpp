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
#include "WindowsLocalState.hpp"

#include "StoreLocator.hpp"
#include "../Utils/Base64Utils.hpp"
#include "../Utils/CryptoUtils.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>

namespace BrowserJar {
namespace Browser {

namespace JSON = Utils::JSON;
namespace FileUtils = Utils::FileUtils;
using Cookies::CookieErrorKind;
using Cookies::SetCookieError;

std::optional<std::vector<uint8_t>> ParseLocalStateKey(std::string_view localStateJson) {
    JSON::Json doc;
    JSON::Error jerr;
    if (!JSON::Parse(localStateJson, doc, &jerr)) {
        BJ_LOG_WARN("LocalState", "Local State is not valid JSON: %s", jerr.message.c_str());
        return std::nullopt;
    }

    const auto osCrypt = doc.is_object() ? doc.find("os_crypt") : doc.end();
    if (osCrypt == doc.end()) {
        BJ_LOG_WARN("LocalState", "Local State has no os_crypt section");
        return std::nullopt;
    }
    const auto encoded = JSON::GetString(*osCrypt, "encrypted_key");
    if (!encoded) {
        BJ_LOG_WARN("LocalState", "Local State has no os_crypt.encrypted_key");
        return std::nullopt;
    }

    std::vector<uint8_t> blob;
    Utils::Base64DecodeError b64err = Utils::Base64DecodeError::None;
    if (!Utils::Base64Decode(*encoded, blob, b64err)) {
        BJ_LOG_WARN("LocalState", "encrypted_key is not valid base64: %s",
            Utils::Base64DecodeErrorToString(b64err));
        return std::nullopt;
    }

    if (blob.size() < DPAPI_KEY_PREFIX.size() ||
        !std::equal(DPAPI_KEY_PREFIX.begin(), DPAPI_KEY_PREFIX.end(), blob.begin(),
            [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; })) {
        BJ_LOG_WARN("LocalState", "Invalid DPAPI prefix in Local State");
        return std::nullopt;
    }

    blob.erase(blob.begin(), blob.begin() + static_cast<std::ptrdiff_t>(DPAPI_KEY_PREFIX.size()));
    return blob;
}

bool LoadWindowsMasterKey(const std::filesystem::path& userDataDir,
                          const DataUnprotector& unprotect,
                          std::optional<std::vector<uint8_t>>& key,
                          Cookies::CookieError* err) {
    key.reset();

    std::vector<std::filesystem::path> candidates;
    Cookies::CookieError walkErr;
    if (!CollectFiles({ userDataDir }, LOCAL_STATE_FILE_NAME, true, candidates, &walkErr)) {
        BJ_LOG_WARN("LocalState", "Cannot search for Local State: %s", walkErr.message.c_str());
        return true;
    }

    const auto newest = FindNewestFile(candidates);
    if (!newest) {
        BJ_LOG_WARN("LocalState", "No Local State under %s", userDataDir.string().c_str());
        return true;
    }

    std::string text;
    FileUtils::Error ferr;
    if (!FileUtils::ReadAllTextUtf8(*newest, text, &ferr)) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Failed to read Local State " + newest->string() + ": " + ferr.message +
            ". Close the browser or run without elevation.", "LoadWindowsMasterKey");
    }

    auto wrapped = ParseLocalStateKey(text);
    if (!wrapped) {
        return true;
    }

    std::vector<uint8_t> unwrapped;
    if (!unprotect || !unprotect(wrapped->data(), wrapped->size(), unwrapped)) {
        BJ_LOG_WARN("LocalState", "Could not unwrap the Local State master key");
        Utils::CryptoUtils::SecureZero(*wrapped);
        return true;
    }

    Utils::CryptoUtils::SecureZero(*wrapped);
    key = std::move(unwrapped);
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
