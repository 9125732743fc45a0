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
#include "SafariParser.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace BrowserJar {
namespace Browser {

namespace fs = std::filesystem;
namespace FileUtils = Utils::FileUtils;
using Cookies::Cookie;
using Cookies::CookieErrorKind;
using Cookies::CookieStore;
using Cookies::SetCookieError;

namespace {

constexpr uint8_t kFileMagic[4] = { 'c', 'o', 'o', 'k' };
constexpr uint8_t kPageMagic[4] = { 0x00, 0x00, 0x01, 0x00 };

/// Bounds-checked reader over one region of the file
class ByteCursor {
public:
    ByteCursor(const uint8_t* data, size_t size) noexcept : m_data(data), m_size(size) {}

    [[nodiscard]] size_t Position() const noexcept { return m_pos; }

    bool Read(size_t len, const uint8_t*& out, Cookies::CookieError* err) {
        if (len > m_size - m_pos) {
            return SetCookieError(err, CookieErrorKind::BrowserCookie, "Safari cookies truncated", "ByteCursor");
        }
        out = m_data + m_pos;
        m_pos += len;
        return true;
    }

    bool Skip(size_t len, Cookies::CookieError* err) {
        const uint8_t* ignored = nullptr;
        return Read(len, ignored, err);
    }

    bool Expect(const uint8_t (&magic)[4], const char* label, Cookies::CookieError* err) {
        const uint8_t* p = nullptr;
        if (!Read(4, p, err)) return false;
        if (std::memcmp(p, magic, 4) != 0) {
            return SetCookieError(err, CookieErrorKind::BrowserCookie,
                std::string("Safari cookies invalid ") + label, "ByteCursor");
        }
        return true;
    }

    bool ReadU32BE(uint32_t& out, Cookies::CookieError* err) {
        const uint8_t* p = nullptr;
        if (!Read(4, p, err)) return false;
        out = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
        return true;
    }

    bool ReadU32LE(uint32_t& out, Cookies::CookieError* err) {
        const uint8_t* p = nullptr;
        if (!Read(4, p, err)) return false;
        out = uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
        return true;
    }

    bool ReadF64LE(double& out, Cookies::CookieError* err) {
        const uint8_t* p = nullptr;
        if (!Read(8, p, err)) return false;
        uint64_t bits = 0;
        for (int i = 7; i >= 0; --i) {
            bits = (bits << 8) | p[i];
        }
        static_assert(sizeof(double) == sizeof(uint64_t));
        std::memcpy(&out, &bits, sizeof(out));
        return true;
    }

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos = 0;
};

bool ReadCStringAt(const uint8_t* data, size_t size, size_t offset, std::string& out, Cookies::CookieError* err) {
    if (offset >= size) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Safari cookie offset out of bounds", "ReadCStringAt");
    }
    const auto* begin = data + offset;
    const auto* end = static_cast<const uint8_t*>(std::memchr(begin, 0, size - offset));
    if (!end) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Safari cookie string not terminated", "ReadCStringAt");
    }
    if (!Utils::StringUtils::IsValidUtf8(begin, static_cast<size_t>(end - begin))) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Safari cookie string decode failed", "ReadCStringAt");
    }
    out.assign(reinterpret_cast<const char*>(begin), static_cast<size_t>(end - begin));
    return true;
}

/// @p data runs from the record start to the end of its page
bool ParseRecord(const uint8_t* data, size_t size, CookieStore& store, Cookies::CookieError* err) {
    ByteCursor cur(data, size);

    uint32_t recordSize = 0, flags = 0;
    uint32_t domainOff = 0, nameOff = 0, pathOff = 0, valueOff = 0;
    double expiry = 0, creation = 0;

    if (!cur.ReadU32LE(recordSize, err) || !cur.Skip(4, err) ||
        !cur.ReadU32LE(flags, err) || !cur.Skip(4, err) ||
        !cur.ReadU32LE(domainOff, err) || !cur.ReadU32LE(nameOff, err) ||
        !cur.ReadU32LE(pathOff, err) || !cur.ReadU32LE(valueOff, err) ||
        !cur.Skip(8, err) ||
        !cur.ReadF64LE(expiry, err) || !cur.ReadF64LE(creation, err)) {
        return false;
    }

    Cookie cookie;
    if (!ReadCStringAt(data, size, domainOff, cookie.domain, err) ||
        !ReadCStringAt(data, size, nameOff, cookie.name, err) ||
        !ReadCStringAt(data, size, pathOff, cookie.path, err) ||
        !ReadCStringAt(data, size, valueOff, cookie.value, err)) {
        return false;
    }

    if (cookie.domain.empty() || cookie.name.empty()) {
        BJ_LOG_DEBUG("Safari", "Skipping record without domain or name");
        return true;
    }

    cookie.secure = (flags & SAFARI_FLAG_SECURE) != 0;
    cookie.httpOnly = false;
    cookie.expires = MacAbsoluteToUnix(expiry);

    Cookies::AddCookie(store, std::move(cookie));
    return true;
}

bool ParsePage(const uint8_t* data, size_t size, CookieStore& store, Cookies::CookieError* err) {
    ByteCursor cur(data, size);
    if (!cur.Expect(kPageMagic, "page signature", err)) return false;

    uint32_t recordCount = 0;
    if (!cur.ReadU32LE(recordCount, err)) return false;

    std::vector<uint32_t> offsets;
    offsets.reserve(std::min<size_t>(recordCount, size / 4));
    for (uint32_t i = 0; i < recordCount; ++i) {
        uint32_t offset = 0;
        if (!cur.ReadU32LE(offset, err)) return false;
        offsets.push_back(offset);
    }

    for (const uint32_t offset : offsets) {
        if (offset >= size) {
            return SetCookieError(err, CookieErrorKind::BrowserCookie,
                "Safari cookie offset out of bounds", "ParsePage");
        }
        if (!ParseRecord(data + offset, size - offset, store, err)) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<int64_t> MacAbsoluteToUnix(double timestamp) noexcept {
    constexpr double limit = static_cast<double>(std::numeric_limits<int32_t>::max()) * 1000.0;
    if (std::isnan(timestamp)) return std::nullopt;
    if (timestamp > limit) return std::numeric_limits<int64_t>::max();
    if (timestamp < -limit) return std::numeric_limits<int64_t>::min();
    return Cookies::CookieConstants::MAC_EPOCH_OFFSET + static_cast<int64_t>(timestamp);
}

bool ParseSafariCookies(const uint8_t* data, size_t size, CookieStore& store, Cookies::CookieError* err) {
    ByteCursor cur(data, size);
    if (!cur.Expect(kFileMagic, "database signature", err)) return false;

    uint32_t pageCount = 0;
    if (!cur.ReadU32BE(pageCount, err)) return false;

    std::vector<uint32_t> pageSizes;
    pageSizes.reserve(std::min<size_t>(pageCount, size / 4));
    for (uint32_t i = 0; i < pageCount; ++i) {
        uint32_t pageSize = 0;
        if (!cur.ReadU32BE(pageSize, err)) return false;
        pageSizes.push_back(pageSize);
    }

    size_t pageStart = cur.Position();
    for (const uint32_t pageSize : pageSizes) {
        if (pageSize > size - pageStart) {
            return SetCookieError(err, CookieErrorKind::BrowserCookie,
                "Invalid Safari page size", "ParseSafariCookies");
        }
        if (!ParsePage(data + pageStart, pageSize, store, err)) {
            return false;
        }
        pageStart += pageSize;
    }

    BJ_LOG_DEBUG("Safari", "Parsed %zu page(s), %zu cookie(s)", pageSizes.size(), Cookies::CountCookies(store));
    return true;
}

bool FindSafariCookieFile(const std::optional<std::string>& profile,
                          const fs::path& home,
                          fs::path& out,
                          Cookies::CookieError* err) {
    if (profile) {
        const fs::path custom = FileUtils::ExpandHome(*profile, home);
        if (FileUtils::IsRegularFile(custom)) {
            out = custom;
            return true;
        }
        return SetCookieError(err, CookieErrorKind::FileNotFound,
            "Custom Safari cookies path not found", "FindSafariCookieFile");
    }

    const fs::path candidates[] = {
        home / "Library" / "Cookies" / "Cookies.binarycookies",
        home / "Library" / "Containers" / "com.apple.Safari" / "Data" / "Library" / "Cookies" / "Cookies.binarycookies",
    };
    for (const auto& candidate : candidates) {
        if (FileUtils::IsRegularFile(candidate)) {
            out = candidate;
            return true;
        }
    }

    return SetCookieError(err, CookieErrorKind::FileNotFound,
        "Safari cookies database not found", "FindSafariCookieFile");
}

bool ExtractSafariCookies(const Cookies::BrowserCookieConfig& config,
                          CookieStore& store,
                          Cookies::CookieError* err,
                          const ExtractionOptions& options) {
    BJ_LOG_SCOPE("Safari");
    store.clear();

    if (options.platform != Utils::SystemUtils::Platform::MacOS) {
        return SetCookieError(err, CookieErrorKind::Unsupported,
            "Safari is only available on macOS", "ExtractSafariCookies");
    }

    fs::path cookieFile;
    if (!FindSafariCookieFile(config.profile, Utils::SystemUtils::HomeDirectory(options.env), cookieFile, err)) {
        return false;
    }

    std::vector<uint8_t> data;
    FileUtils::Error ferr;
    if (!FileUtils::ReadAllBytes(cookieFile, data, &ferr)) {
        BJ_LOG_ERROR("Safari", "Cannot read %s: %s", cookieFile.string().c_str(), ferr.message.c_str());
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "Failed to read Safari cookies: " + ferr.message, "ExtractSafariCookies");
    }

    if (!ParseSafariCookies(data, store, err)) {
        store.clear();
        return false;
    }

    if (store.empty()) {
        return SetCookieError(err, CookieErrorKind::BrowserCookie,
            "No Safari cookies could be extracted", "ExtractSafariCookies");
    }

    BJ_LOG_INFO("Safari", "Extracted %zu cookie(s)", Cookies::CountCookies(store));
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
