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
#include <gtest/gtest.h>

#include <limits>

#include "TestSupport.hpp"
#include "../src/Browser/SafariParser.hpp"
#include "../src/Cookies/CookieMatcher.hpp"

using namespace BrowserJar;
using namespace BrowserJar::Browser;
using Cookies::CookieErrorKind;

namespace {

constexpr size_t kRecordHeaderSize = 56;

void PutU32LE(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

void PutU32BE(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 3; i >= 0; --i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

void PutF64LE(std::vector<uint8_t>& out, double d) {
    uint64_t bits = 0;
    std::memcpy(&bits, &d, sizeof(bits));
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
}

struct SafariRecord {
    std::string domain;
    std::string name;
    std::string path = "/";
    std::string value;
    uint32_t flags = 0;
    double expiry = 0;
};

std::vector<uint8_t> BuildRecord(const SafariRecord& r) {
    std::vector<uint8_t> strings;
    auto append = [&](const std::string& s) {
        const uint32_t offset = static_cast<uint32_t>(kRecordHeaderSize + strings.size());
        strings.insert(strings.end(), s.begin(), s.end());
        strings.push_back(0);
        return offset;
    };
    const uint32_t domainOff = append(r.domain);
    const uint32_t nameOff = append(r.name);
    const uint32_t pathOff = append(r.path);
    const uint32_t valueOff = append(r.value);

    std::vector<uint8_t> out;
    PutU32LE(out, static_cast<uint32_t>(kRecordHeaderSize + strings.size()));
    PutU32LE(out, 0);
    PutU32LE(out, r.flags);
    PutU32LE(out, 0);
    PutU32LE(out, domainOff);
    PutU32LE(out, nameOff);
    PutU32LE(out, pathOff);
    PutU32LE(out, valueOff);
    PutU32LE(out, 0);
    PutU32LE(out, 0);
    PutF64LE(out, r.expiry);
    PutF64LE(out, 0.0);
    out.insert(out.end(), strings.begin(), strings.end());
    return out;
}

std::vector<uint8_t> BuildPage(const std::vector<SafariRecord>& records) {
    std::vector<std::vector<uint8_t>> bodies;
    for (const auto& r : records) bodies.push_back(BuildRecord(r));

    std::vector<uint8_t> page = { 0x00, 0x00, 0x01, 0x00 };
    PutU32LE(page, static_cast<uint32_t>(bodies.size()));
    uint32_t offset = static_cast<uint32_t>(8 + 4 * bodies.size() + 4);
    for (const auto& b : bodies) {
        PutU32LE(page, offset);
        offset += static_cast<uint32_t>(b.size());
    }
    PutU32LE(page, 0);  // page footer
    for (const auto& b : bodies) page.insert(page.end(), b.begin(), b.end());
    return page;
}

std::vector<uint8_t> BuildFile(const std::vector<std::vector<uint8_t>>& pages) {
    std::vector<uint8_t> file = { 'c', 'o', 'o', 'k' };
    PutU32BE(file, static_cast<uint32_t>(pages.size()));
    for (const auto& p : pages) PutU32BE(file, static_cast<uint32_t>(p.size()));
    for (const auto& p : pages) file.insert(file.end(), p.begin(), p.end());
    return file;
}

}  // namespace

TEST(SafariParserTest, MinimalBufferYieldsOneCookie) {
    SafariRecord r;
    r.domain = ".example.com";
    r.name = "sid";
    r.value = "abc";
    r.flags = SAFARI_FLAG_SECURE;
    r.expiry = 100.0;
    const auto file = BuildFile({ BuildPage({ r }) });

    Cookies::CookieStore store;
    Cookies::CookieError err;
    ASSERT_TRUE(ParseSafariCookies(file, store, &err)) << err.ToString();
    ASSERT_EQ(Cookies::CountCookies(store), 1u);

    const auto& cookie = store.at(".example.com").front();
    EXPECT_EQ(cookie.name, "sid");
    EXPECT_EQ(cookie.value, "abc");
    EXPECT_EQ(cookie.path, "/");
    EXPECT_TRUE(cookie.secure);
    EXPECT_FALSE(cookie.httpOnly);
    EXPECT_EQ(cookie.expires, 978307200 + 100);
}

TEST(SafariParserTest, MultiplePagesAndRecords) {
    SafariRecord a{ "a.com", "one", "/", "1" };
    SafariRecord b{ "b.com", "two", "/x", "2" };
    SafariRecord c{ "a.com", "three", "/", "3" };
    const auto file = BuildFile({ BuildPage({ a, b }), BuildPage({ c }) });

    Cookies::CookieStore store;
    ASSERT_TRUE(ParseSafariCookies(file, store));
    EXPECT_EQ(Cookies::CountCookies(store), 3u);
    ASSERT_EQ(store.at("a.com").size(), 2u);
    EXPECT_EQ(store.at("a.com")[1].name, "three");
    EXPECT_FALSE(store.at("b.com")[0].secure);
}

TEST(SafariParserTest, RecordWithoutNameIsSkipped) {
    SafariRecord nameless{ "a.com", "", "/", "1" };
    SafariRecord ok{ "a.com", "kept", "/", "2" };
    const auto file = BuildFile({ BuildPage({ nameless, ok }) });

    Cookies::CookieStore store;
    ASSERT_TRUE(ParseSafariCookies(file, store));
    ASSERT_EQ(Cookies::CountCookies(store), 1u);
    EXPECT_EQ(store.at("a.com")[0].name, "kept");
}

TEST(SafariParserTest, TruncatedBufferIsAnError) {
    SafariRecord r{ "a.com", "n", "/", "v" };
    auto file = BuildFile({ BuildPage({ r }) });
    file.resize(file.size() - 10);

    Cookies::CookieStore store;
    Cookies::CookieError err;
    EXPECT_FALSE(ParseSafariCookies(file, store, &err));
    EXPECT_EQ(err.kind, CookieErrorKind::BrowserCookie);
}

TEST(SafariParserTest, TruncatedHeaderIsAnError) {
    const std::vector<uint8_t> file = { 'c', 'o', 'o', 'k', 0, 0 };
    Cookies::CookieStore store;
    Cookies::CookieError err;
    EXPECT_FALSE(ParseSafariCookies(file, store, &err));
    EXPECT_EQ(err.message, "Safari cookies truncated");
}

TEST(SafariParserTest, BadMagicIsAnError) {
    auto file = BuildFile({});
    file[0] = 'x';
    Cookies::CookieStore store;
    Cookies::CookieError err;
    EXPECT_FALSE(ParseSafariCookies(file, store, &err));
    EXPECT_EQ(err.kind, CookieErrorKind::BrowserCookie);
}

TEST(SafariParserTest, UnterminatedStringIsAnError) {
    SafariRecord r{ "a.com", "n", "/", "v" };
    auto page = BuildPage({ r });
    page.pop_back();  // drop the NUL after the value
    const auto file = BuildFile({ page });

    Cookies::CookieStore store;
    Cookies::CookieError err;
    EXPECT_FALSE(ParseSafariCookies(file, store, &err));
    EXPECT_EQ(err.message, "Safari cookie string not terminated");
}

TEST(SafariParserTest, RecordOffsetOutsidePageIsAnError) {
    SafariRecord r{ "a.com", "n", "/", "v" };
    auto page = BuildPage({ r });
    // first record offset lives right after the magic and count
    page[8] = 0xFF;
    page[9] = 0xFF;
    const auto file = BuildFile({ page });

    Cookies::CookieStore store;
    Cookies::CookieError err;
    EXPECT_FALSE(ParseSafariCookies(file, store, &err));
    EXPECT_EQ(err.message, "Safari cookie offset out of bounds");
}

TEST(SafariParserTest, MacAbsoluteTime) {
    EXPECT_EQ(MacAbsoluteToUnix(0.0), 978307200);
    EXPECT_EQ(MacAbsoluteToUnix(1.9), 978307201);
    EXPECT_EQ(MacAbsoluteToUnix(std::numeric_limits<double>::infinity()), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(MacAbsoluteToUnix(-1e300), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(MacAbsoluteToUnix(std::numeric_limits<double>::quiet_NaN()), std::nullopt);
}

TEST(SafariParserTest, AbsurdExpiryNeverExpires) {
    const auto file = BuildFile({ BuildPage({
        { ".far.test", "huge", "/", "a", 0, 1e300 },
        { ".far.test", "big", "/", "b", 0, 3e12 },
    }) });

    Cookies::CookieStore store;
    Cookies::CookieError err;
    ASSERT_TRUE(ParseSafariCookies(file, store, &err)) << err.ToString();
    const auto& cookies = store.at(".far.test");
    ASSERT_EQ(cookies.size(), 2u);

    const int64_t now = 1'700'000'000;
    for (const auto& cookie : cookies) {
        ASSERT_TRUE(cookie.expires) << cookie.name;
        EXPECT_GT(*cookie.expires, Cookies::CookieConstants::FAR_FUTURE_EXPIRY) << cookie.name;
        EXPECT_FALSE(Cookies::IsExpired(cookie, now)) << cookie.name;
    }
}

TEST(SafariExtractTest, UnsupportedOffMacOS) {
    ExtractionOptions options;
    options.platform = Utils::SystemUtils::Platform::Linux;

    Cookies::BrowserCookieConfig cfg;
    cfg.browser = Cookies::Browser::Safari;
    Cookies::CookieStore store;
    Cookies::CookieError err;
    EXPECT_FALSE(ExtractSafariCookies(cfg, store, &err, options));
    EXPECT_EQ(err.kind, CookieErrorKind::Unsupported);
}

TEST(SafariExtractTest, ReadsCustomFileWhenTargetingMacOS) {
    Testing::TempTree tree;
    SafariRecord r{ ".example.com", "sid", "/", "abc" };
    const auto file = BuildFile({ BuildPage({ r }) });
    const auto path = tree.Root() / "Cookies.binarycookies";
    ASSERT_TRUE(Utils::FileUtils::WriteAllBytes(path, file));

    ExtractionOptions options;
    options.platform = Utils::SystemUtils::Platform::MacOS;
    options.env = Utils::SystemUtils::FixedEnvironment({ { "HOME", tree.Root().string() } });

    Cookies::BrowserCookieConfig cfg;
    cfg.browser = Cookies::Browser::Safari;
    cfg.profile = path.string();

    Cookies::CookieStore store;
    Cookies::CookieError err;
    ASSERT_TRUE(ExtractSafariCookies(cfg, store, &err, options)) << err.ToString();
    EXPECT_EQ(Cookies::CountCookies(store), 1u);
}

TEST(SafariExtractTest, DefaultLocationUnderHome) {
    Testing::TempTree tree;
    SafariRecord r{ "example.com", "a", "/", "b" };
    const auto dir = tree.MakeDir("Library/Containers/com.apple.Safari/Data/Library/Cookies");
    ASSERT_TRUE(Utils::FileUtils::WriteAllBytes(dir / "Cookies.binarycookies", BuildFile({ BuildPage({ r }) })));

    std::filesystem::path found;
    ASSERT_TRUE(FindSafariCookieFile(std::nullopt, tree.Root(), found));
    EXPECT_EQ(found, dir / "Cookies.binarycookies");
}

TEST(SafariExtractTest, MissingCustomFileIsFileNotFound) {
    std::filesystem::path found;
    Cookies::CookieError err;
    EXPECT_FALSE(FindSafariCookieFile(std::string("/nonexistent/Cookies.binarycookies"), "/nonexistent", found, &err));
    EXPECT_EQ(err.kind, CookieErrorKind::FileNotFound);
}
