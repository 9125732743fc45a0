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
#include <gmock/gmock.h>

#include "MockCommandRunner.hpp"
#include "../src/Browser/LinuxKeyring.hpp"

using namespace BrowserJar;
using namespace BrowserJar::Browser;
using Testing::Exits;
using Testing::MockCommandRunner;
using Utils::SystemUtils::FixedEnvironment;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;

// ============================================================================
// DESKTOP DETECTION
// ============================================================================

TEST(DesktopDetectionTest, XdgCurrentDesktopTokens) {
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "XDG_CURRENT_DESKTOP", "ubuntu:GNOME" } })),
        LinuxDesktopEnvironment::Gnome);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "XDG_CURRENT_DESKTOP", "X-Cinnamon" } })),
        LinuxDesktopEnvironment::Cinnamon);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "XDG_CURRENT_DESKTOP", "LXQt" } })),
        LinuxDesktopEnvironment::Lxqt);
}

TEST(DesktopDetectionTest, KdeVersionFromSession) {
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({
        { "XDG_CURRENT_DESKTOP", "KDE" }, { "KDE_SESSION_VERSION", "5" } })), LinuxDesktopEnvironment::Kde5);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({
        { "XDG_CURRENT_DESKTOP", "KDE" }, { "KDE_SESSION_VERSION", "6" } })), LinuxDesktopEnvironment::Kde6);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "XDG_CURRENT_DESKTOP", "KDE" } })),
        LinuxDesktopEnvironment::Kde4);
}

TEST(DesktopDetectionTest, UnityWithGnomeFallbackSession) {
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({
        { "XDG_CURRENT_DESKTOP", "Unity" }, { "DESKTOP_SESSION", "gnome-fallback" } })),
        LinuxDesktopEnvironment::Gnome);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "XDG_CURRENT_DESKTOP", "Unity" } })),
        LinuxDesktopEnvironment::Unity);
}

TEST(DesktopDetectionTest, DesktopSessionFallbacks) {
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "DESKTOP_SESSION", "mate" } })),
        LinuxDesktopEnvironment::Gnome);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "DESKTOP_SESSION", "xubuntu" } })),
        LinuxDesktopEnvironment::Xfce);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "DESKTOP_SESSION", "kde" } })),
        LinuxDesktopEnvironment::Kde3);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "GNOME_DESKTOP_SESSION_ID", "this-is-deprecated" } })),
        LinuxDesktopEnvironment::Gnome);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({ { "KDE_FULL_SESSION", "true" } })),
        LinuxDesktopEnvironment::Kde3);
    EXPECT_EQ(DetectDesktopEnvironment(FixedEnvironment({})), LinuxDesktopEnvironment::Other);
}

TEST(DesktopDetectionTest, KeyringChoice) {
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Kde4), LinuxKeyring::KWallet);
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Kde5), LinuxKeyring::KWallet5);
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Kde6), LinuxKeyring::KWallet6);
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Gnome), LinuxKeyring::GnomeKeyring);
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Xfce), LinuxKeyring::GnomeKeyring);
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Other), LinuxKeyring::BasicText);
    EXPECT_EQ(ChooseLinuxKeyring(LinuxDesktopEnvironment::Lxqt), LinuxKeyring::BasicText);
}

TEST(DesktopDetectionTest, KeyringOverrideParsing) {
    LinuxKeyring keyring = LinuxKeyring::BasicText;
    EXPECT_TRUE(ParseLinuxKeyring("KWallet6", keyring));
    EXPECT_EQ(keyring, LinuxKeyring::KWallet6);
    EXPECT_TRUE(ParseLinuxKeyring("gnomekeyring", keyring));
    EXPECT_EQ(keyring, LinuxKeyring::GnomeKeyring);
    EXPECT_TRUE(ParseLinuxKeyring("BASICTEXT", keyring));
    EXPECT_EQ(keyring, LinuxKeyring::BasicText);

    Cookies::CookieError err;
    EXPECT_FALSE(ParseLinuxKeyring("pass", keyring, &err));
    EXPECT_EQ(err.kind, Cookies::CookieErrorKind::Config);
    EXPECT_EQ(err.message, "Unsupported keyring: pass");
}

// ============================================================================
// KWALLET
// ============================================================================

TEST(KWalletTest, NetworkWalletFromDbus) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send",
            ElementsAre("--session", "--print-reply=literal", "--dest=org.kde.kwalletd6",
                        "/modules/kwalletd6", "org.kde.KWallet.networkWallet"), _, _))
        .WillOnce(Exits(0, "   string \"work-wallet\"\n"));

    EXPECT_EQ(GetKWalletNetworkWallet(LinuxKeyring::KWallet6, runner), "work-wallet");
}

TEST(KWalletTest, NetworkWalletFallsBackToDefault) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Return(false));
    EXPECT_EQ(GetKWalletNetworkWallet(LinuxKeyring::KWallet, runner), "kdewallet");

    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(1, ""));
    EXPECT_EQ(GetKWalletNetworkWallet(LinuxKeyring::KWallet5, runner), "kdewallet");
}

TEST(KWalletTest, PasswordIsReadFromWallet) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(0, "string \"kdewallet\""));
    EXPECT_CALL(runner, Run("kwallet-query",
            ElementsAre("--read-password", "Brave Safe Storage", "--folder", "Brave Keys", "kdewallet"), _, _))
        .WillOnce(Exits(0, "s3cret\n"));

    EXPECT_EQ(GetKWalletPassword("Brave", LinuxKeyring::KWallet5, runner), "s3cret");
}

TEST(KWalletTest, FailedToReadMeansNoPassword) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(0, "string \"kdewallet\""));
    EXPECT_CALL(runner, Run("kwallet-query", _, _, _))
        .WillOnce(Exits(0, "Failed to read entry Chrome Safe Storage value from the kdewallet wallet.\n"));

    EXPECT_FALSE(GetKWalletPassword("Chrome", LinuxKeyring::KWallet5, runner).has_value());
}

TEST(KWalletTest, NonZeroExitMeansNoPassword) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(0, "string \"kdewallet\""));
    EXPECT_CALL(runner, Run("kwallet-query", _, _, _)).WillOnce(Exits(1, "whatever"));

    EXPECT_FALSE(GetKWalletPassword("Chrome", LinuxKeyring::KWallet5, runner).has_value());
}

// ============================================================================
// DISPATCH
// ============================================================================

TEST(LinuxKeyringPasswordTest, BasicTextNeedsNoHelpers) {
    StrictMock<MockCommandRunner> runner;
    std::optional<std::string> password = std::string("stale");
    ASSERT_TRUE(GetLinuxKeyringPassword("Chrome", std::string("basic"), FixedEnvironment({}), runner, password));
    EXPECT_FALSE(password);
}

TEST(LinuxKeyringPasswordTest, DetectedKdeUsesKWallet) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(0, "string \"kdewallet\""));
    EXPECT_CALL(runner, Run("kwallet-query", _, _, _)).WillOnce(Exits(0, "pw"));

    std::optional<std::string> password;
    const auto env = FixedEnvironment({ { "XDG_CURRENT_DESKTOP", "KDE" }, { "KDE_SESSION_VERSION", "5" } });
    ASSERT_TRUE(GetLinuxKeyringPassword("Chrome", std::nullopt, env, runner, password));
    EXPECT_EQ(password, "pw");
}

TEST(KWalletTest, EmptyStoredPasswordIsStillAPassword) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(0, "string \"kdewallet\""));
    EXPECT_CALL(runner, Run("kwallet-query", _, _, _)).WillOnce(Exits(0, "\n"));

    const auto password = GetKWalletPassword("Chrome", LinuxKeyring::KWallet5, runner);
    ASSERT_TRUE(password.has_value());
    EXPECT_EQ(*password, "");
}

TEST(LinuxKeyringPasswordTest, UnreadableWalletLeavesNoPassword) {
    StrictMock<MockCommandRunner> runner;
    EXPECT_CALL(runner, Run("dbus-send", _, _, _)).WillOnce(Exits(0, "string \"kdewallet\""));
    EXPECT_CALL(runner, Run("kwallet-query", _, _, _)).WillOnce(Return(false));

    std::optional<std::string> password = std::string("stale");
    ASSERT_TRUE(GetLinuxKeyringPassword("Chrome", std::string("kwallet6"), FixedEnvironment({}), runner, password));
    EXPECT_FALSE(password.has_value());
}

TEST(LinuxKeyringPasswordTest, InvalidOverrideFails) {
    StrictMock<MockCommandRunner> runner;
    std::optional<std::string> password;
    Cookies::CookieError err;
    EXPECT_FALSE(GetLinuxKeyringPassword("Chrome", std::string("vault"), FixedEnvironment({}), runner, password, &err));
    EXPECT_EQ(err.kind, Cookies::CookieErrorKind::Config);
}
