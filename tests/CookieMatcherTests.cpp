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

#include "../src/Cookies/CookieMatcher.hpp"

using namespace BrowserJar::Cookies;

namespace {

constexpr int64_t kNow = 1'700'000'000;

Cookie MakeCookie(std::string name, std::string value, std::string domain,
                  std::string path = "/", bool secure = false,
                  std::optional<int64_t> expires = std::nullopt) {
    Cookie c;
    c.name = std::move(name);
    c.value = std::move(value);
    c.domain = std::move(domain);
    c.path = std::move(path);
    c.secure = secure;
    c.expires = expires;
    return c;
}

}  // namespace

// ============================================================================
// DOMAIN MATCHING
// ============================================================================

TEST(DomainMatchTest, LeadingDotMatchesApexAndSubdomains) {
    EXPECT_TRUE(DomainMatches(".example.com", "example.com"));
    EXPECT_TRUE(DomainMatches(".example.com", "www.example.com"));
    EXPECT_TRUE(DomainMatches(".example.com", "a.b.example.com"));
}

TEST(DomainMatchTest, LeadingDotRequiresDotBoundary) {
    EXPECT_FALSE(DomainMatches(".example.com", "badexample.com"));
    EXPECT_FALSE(DomainMatches(".example.com", "example.org"));
}

TEST(DomainMatchTest, HostOnlyCookieMatchesExactly) {
    EXPECT_TRUE(DomainMatches("example.com", "example.com"));
    EXPECT_FALSE(DomainMatches("example.com", "www.example.com"));
}

TEST(DomainMatchTest, CaseAndWhitespaceAreIgnored) {
    EXPECT_TRUE(DomainMatches("  .Example.COM ", "WWW.example.com"));
    EXPECT_TRUE(DomainMatches("Example.com", "example.COM"));
}

TEST(DomainMatchTest, EmptyNeverMatches) {
    EXPECT_FALSE(DomainMatches("", "example.com"));
    EXPECT_FALSE(DomainMatches(".example.com", ""));
}

// ============================================================================
// PATH MATCHING
// ============================================================================

TEST(PathMatchTest, EmptyCookiePathIsRoot) {
    EXPECT_TRUE(PathMatches("", "/"));
    EXPECT_TRUE(PathMatches("", "/anything/below"));
}

TEST(PathMatchTest, PrefixNeedsSlashBoundary) {
    EXPECT_TRUE(PathMatches("/docs", "/docs"));
    EXPECT_TRUE(PathMatches("/docs", "/docs/page"));
    EXPECT_TRUE(PathMatches("/docs/", "/docs/page"));
    EXPECT_FALSE(PathMatches("/docs", "/docsearch"));
    EXPECT_FALSE(PathMatches("/docs/page", "/docs"));
}

// ============================================================================
// EXPIRY
// ============================================================================

TEST(ExpiryTest, SessionCookieNeverExpires) {
    EXPECT_FALSE(IsExpired(MakeCookie("a", "1", "x.com"), kNow));
}

TEST(ExpiryTest, PastAndPresentAreExpired) {
    EXPECT_TRUE(IsExpired(MakeCookie("a", "1", "x.com", "/", false, kNow - 1), kNow));
    EXPECT_TRUE(IsExpired(MakeCookie("a", "1", "x.com", "/", false, kNow), kNow));
    EXPECT_FALSE(IsExpired(MakeCookie("a", "1", "x.com", "/", false, kNow + 1), kNow));
}

TEST(ExpiryTest, FarFutureSentinelNeverExpires) {
    const auto cookie = MakeCookie("a", "1", "x.com", "/", false, 100'000'000'001LL);
    EXPECT_FALSE(IsExpired(cookie, 200'000'000'000LL));
}

// ============================================================================
// URL SELECTION
// ============================================================================

TEST(CookiesForUrlTest, PlaintextSecureSessionCookieOverHttps) {
    CookieStore store;
    AddCookie(store, MakeCookie("sid", "abc", ".example.com", "/", true));

    const auto cookies = CookiesForUrl(store, "https://www.example.com/", kNow);
    ASSERT_EQ(cookies.size(), 1u);
    EXPECT_EQ(CookiesToHeader(cookies), "sid=abc");
}

TEST(CookiesForUrlTest, HttpExcludesSecureCookies) {
    CookieStore store;
    AddCookie(store, MakeCookie("secure_one", "s", "example.com", "/", true));
    AddCookie(store, MakeCookie("plain", "p", "example.com", "/", false));

    const auto cookies = CookiesForUrl(store, "http://example.com/", kNow);
    ASSERT_EQ(cookies.size(), 1u);
    EXPECT_EQ(cookies[0].name, "plain");
}

TEST(CookiesForUrlTest, FiltersByExpiryDomainAndPath) {
    CookieStore store;
    AddCookie(store, MakeCookie("old", "1", "example.com", "/", false, kNow - 10));
    AddCookie(store, MakeCookie("other", "2", "other.com"));
    AddCookie(store, MakeCookie("api", "3", "example.com", "/api"));
    AddCookie(store, MakeCookie("keep", "4", "example.com", "/", false, kNow + 3600));

    const auto cookies = CookiesForUrl(store, "https://example.com/app?x=1", kNow);
    ASSERT_EQ(cookies.size(), 1u);
    EXPECT_EQ(cookies[0].name, "keep");
}

TEST(CookiesForUrlTest, KeepsInsertionOrderWithinDomain) {
    CookieStore store;
    AddCookie(store, MakeCookie("first", "1", "example.com"));
    AddCookie(store, MakeCookie("second", "2", "example.com"));

    EXPECT_EQ(CookiesToHeader(CookiesForUrl(store, "http://example.com/", kNow)), "first=1; second=2");
}

TEST(CookiesForUrlTest, UrlWithoutHostMatchesNothing) {
    CookieStore store;
    AddCookie(store, MakeCookie("a", "1", "example.com"));

    EXPECT_TRUE(CookiesForUrl(store, "not a url", kNow).empty());
    EXPECT_TRUE(CookiesForUrl(store, "file:///etc/hosts", kNow).empty());
}

TEST(CookieHeaderTest, EmptyListGivesEmptyHeader) {
    EXPECT_EQ(CookiesToHeader({}), "");
}

TEST(CookieHeaderTest, MergeKeepsExistingFirst) {
    EXPECT_EQ(MergeCookieHeader("a=1", "b=2"), "a=1; b=2");
    EXPECT_EQ(MergeCookieHeader("", "b=2"), "b=2");
    EXPECT_EQ(MergeCookieHeader(" a=1 ", ""), "a=1");
}
