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

#include "../src/Cookies/Cookie.hpp"

using namespace BrowserJar::Cookies;

TEST(BrowserCookieConfigTest, BareBrowser) {
    BrowserCookieConfig cfg;
    CookieError err;
    ASSERT_TRUE(BrowserCookieConfig::Parse("chrome", cfg, &err)) << err.ToString();
    EXPECT_EQ(cfg.browser, Browser::Chrome);
    EXPECT_FALSE(cfg.profile);
    EXPECT_FALSE(cfg.container);
    EXPECT_FALSE(cfg.keyring);
}

TEST(BrowserCookieConfigTest, AllParts) {
    BrowserCookieConfig cfg;
    ASSERT_TRUE(BrowserCookieConfig::Parse("Firefox+gnome:default-release::Work", cfg));
    EXPECT_EQ(cfg.browser, Browser::Firefox);
    EXPECT_EQ(cfg.keyring, "gnome");
    EXPECT_EQ(cfg.profile, "default-release");
    EXPECT_EQ(cfg.container, "Work");
    EXPECT_EQ(cfg.ToString(), "firefox+gnome:default-release::Work");
}

TEST(BrowserCookieConfigTest, ProfilePathKeepsDriveColon) {
    BrowserCookieConfig cfg;
    ASSERT_TRUE(BrowserCookieConfig::Parse("edge:C:\\Users\\me\\Edge\\Default", cfg));
    EXPECT_EQ(cfg.browser, Browser::Edge);
    EXPECT_EQ(cfg.profile, "C:\\Users\\me\\Edge\\Default");
}

TEST(BrowserCookieConfigTest, ChromiumAliasAndCaseInsensitivity) {
    BrowserCookieConfig cfg;
    ASSERT_TRUE(BrowserCookieConfig::Parse("CHROMIUM", cfg));
    EXPECT_EQ(cfg.browser, Browser::Chrome);
    ASSERT_TRUE(BrowserCookieConfig::Parse("Whale", cfg));
    EXPECT_EQ(cfg.browser, Browser::Whale);
}

TEST(BrowserCookieConfigTest, EmptyPartsAreAbsent) {
    BrowserCookieConfig cfg;
    ASSERT_TRUE(BrowserCookieConfig::Parse("firefox::none", cfg));
    EXPECT_FALSE(cfg.profile);
    EXPECT_EQ(cfg.container, "none");

    ASSERT_TRUE(BrowserCookieConfig::Parse("chrome+:", cfg));
    EXPECT_FALSE(cfg.keyring);
    EXPECT_FALSE(cfg.profile);
}

TEST(BrowserCookieConfigTest, UnknownBrowserIsConfigError) {
    BrowserCookieConfig cfg;
    CookieError err;
    EXPECT_FALSE(BrowserCookieConfig::Parse("netscape:Default", cfg, &err));
    EXPECT_EQ(err.kind, CookieErrorKind::Config);
    EXPECT_NE(err.message.find("netscape"), std::string::npos);
}

TEST(CookieTypesTest, PathLikeProfiles) {
    EXPECT_TRUE(IsPathLike("~/Library"));
    EXPECT_TRUE(IsPathLike("C:\\Users\\user"));
    EXPECT_TRUE(IsPathLike("/tmp/file"));
    EXPECT_FALSE(IsPathLike("Profile 1"));
    EXPECT_FALSE(IsPathLike(""));
}

TEST(CookieTypesTest, ChromiumFamily) {
    EXPECT_TRUE(IsChromiumBased(Browser::Brave));
    EXPECT_TRUE(IsChromiumBased(Browser::Opera));
    EXPECT_FALSE(IsChromiumBased(Browser::Firefox));
    EXPECT_FALSE(IsChromiumBased(Browser::Safari));
}

TEST(CookieTypesTest, ExitCodes) {
    EXPECT_EQ(ExitCodeForError(CookieErrorKind::None), 0);
    EXPECT_EQ(ExitCodeForError(CookieErrorKind::Config), 2);
    EXPECT_EQ(ExitCodeForError(CookieErrorKind::Unsupported), 4);
    EXPECT_EQ(ExitCodeForError(CookieErrorKind::FileNotFound), 37);
    EXPECT_EQ(ExitCodeForError(CookieErrorKind::BrowserCookie), 43);
}

TEST(CookieTypesTest, StoreKeepsBucketsByDomain) {
    CookieStore store;
    Cookie a; a.name = "a"; a.domain = ".x.com";
    Cookie b; b.name = "b"; b.domain = "x.com";
    Cookie c; c.name = "c"; c.domain = ".x.com";
    AddCookie(store, a);
    AddCookie(store, b);
    AddCookie(store, c);

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(CountCookies(store), 3u);
    ASSERT_EQ(store[".x.com"].size(), 2u);
    EXPECT_EQ(store[".x.com"][1].name, "c");
}

TEST(CookieTypesTest, SetCookieErrorAlwaysFails) {
    CookieError err;
    EXPECT_FALSE(SetCookieError(&err, CookieErrorKind::FileNotFound, "gone", "ctx"));
    EXPECT_TRUE(err.HasError());
    EXPECT_EQ(err.ToString(), "FileNotFound: gone");
    EXPECT_FALSE(SetCookieError(nullptr, CookieErrorKind::Config, "ignored"));
    err.Clear();
    EXPECT_FALSE(err.HasError());
}
