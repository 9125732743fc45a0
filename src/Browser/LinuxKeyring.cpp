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
#include "LinuxKeyring.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#ifdef BROWSERJAR_HAVE_LIBSECRET
#  include <libsecret/secret.h>
#endif

namespace BrowserJar {
namespace Browser {

namespace StringUtils = Utils::StringUtils;
namespace SystemUtils = Utils::SystemUtils;
namespace ProcessUtils = Utils::ProcessUtils;
using Cookies::CookieErrorKind;
using Cookies::SetCookieError;

namespace {

constexpr const char* kDefaultWallet = "kdewallet";

/// Presence check; an empty value still counts as set
bool IsSet(const SystemUtils::EnvironmentLookup& env, std::string_view name) {
    return env && env(name).has_value();
}

std::string EnvOrEmpty(const SystemUtils::EnvironmentLookup& env, std::string_view name) {
    if (!env) return {};
    return env(name).value_or(std::string{});
}

}  // namespace

const char* LinuxDesktopEnvironmentToString(LinuxDesktopEnvironment de) noexcept {
    switch (de) {
        case LinuxDesktopEnvironment::Other:    return "Other";
        case LinuxDesktopEnvironment::Cinnamon: return "Cinnamon";
        case LinuxDesktopEnvironment::Deepin:   return "Deepin";
        case LinuxDesktopEnvironment::Gnome:    return "Gnome";
        case LinuxDesktopEnvironment::Kde3:     return "Kde3";
        case LinuxDesktopEnvironment::Kde4:     return "Kde4";
        case LinuxDesktopEnvironment::Kde5:     return "Kde5";
        case LinuxDesktopEnvironment::Kde6:     return "Kde6";
        case LinuxDesktopEnvironment::Pantheon: return "Pantheon";
        case LinuxDesktopEnvironment::Ukui:     return "Ukui";
        case LinuxDesktopEnvironment::Unity:    return "Unity";
        case LinuxDesktopEnvironment::Xfce:     return "Xfce";
        case LinuxDesktopEnvironment::Lxqt:     return "Lxqt";
    }
    return "Unknown";
}

const char* LinuxKeyringToString(LinuxKeyring keyring) noexcept {
    switch (keyring) {
        case LinuxKeyring::KWallet:      return "KWallet";
        case LinuxKeyring::KWallet5:     return "KWallet5";
        case LinuxKeyring::KWallet6:     return "KWallet6";
        case LinuxKeyring::GnomeKeyring: return "GnomeKeyring";
        case LinuxKeyring::BasicText:    return "BasicText";
    }
    return "Unknown";
}

// ============================================================================
// DESKTOP DETECTION
// ============================================================================

LinuxDesktopEnvironment DetectDesktopEnvironment(const SystemUtils::EnvironmentLookup& env) {
    const std::string desktopSession = EnvOrEmpty(env, "DESKTOP_SESSION");

    if (auto xdg = env ? env("XDG_CURRENT_DESKTOP") : std::nullopt) {
        for (const auto& rawPart : StringUtils::Split(*xdg, ":")) {
            const std::string_view part = StringUtils::TrimView(rawPart);
            if (part == "Unity") {
                if (desktopSession.find("gnome-fallback") != std::string::npos) {
                    return LinuxDesktopEnvironment::Gnome;
                }
                return LinuxDesktopEnvironment::Unity;
            }
            if (part == "Deepin") return LinuxDesktopEnvironment::Deepin;
            if (part == "GNOME") return LinuxDesktopEnvironment::Gnome;
            if (part == "X-Cinnamon") return LinuxDesktopEnvironment::Cinnamon;
            if (part == "KDE") {
                const std::string version = EnvOrEmpty(env, "KDE_SESSION_VERSION");
                if (version == "5") return LinuxDesktopEnvironment::Kde5;
                if (version == "6") return LinuxDesktopEnvironment::Kde6;
                return LinuxDesktopEnvironment::Kde4;
            }
            if (part == "Pantheon") return LinuxDesktopEnvironment::Pantheon;
            if (part == "XFCE") return LinuxDesktopEnvironment::Xfce;
            if (part == "UKUI") return LinuxDesktopEnvironment::Ukui;
            if (part == "LXQt") return LinuxDesktopEnvironment::Lxqt;
        }
    }

    if (desktopSession == "deepin") return LinuxDesktopEnvironment::Deepin;
    if (desktopSession == "mate" || desktopSession == "gnome") return LinuxDesktopEnvironment::Gnome;
    if (desktopSession == "kde4" || desktopSession == "kde-plasma") return LinuxDesktopEnvironment::Kde4;
    if (desktopSession == "kde") {
        return IsSet(env, "KDE_SESSION_VERSION") ? LinuxDesktopEnvironment::Kde4 : LinuxDesktopEnvironment::Kde3;
    }
    if (desktopSession == "ukui") return LinuxDesktopEnvironment::Ukui;

    if (desktopSession.find("xfce") != std::string::npos || desktopSession == "xubuntu") {
        return LinuxDesktopEnvironment::Xfce;
    }

    if (IsSet(env, "GNOME_DESKTOP_SESSION_ID")) return LinuxDesktopEnvironment::Gnome;
    if (IsSet(env, "KDE_FULL_SESSION")) {
        return IsSet(env, "KDE_SESSION_VERSION") ? LinuxDesktopEnvironment::Kde4 : LinuxDesktopEnvironment::Kde3;
    }

    return LinuxDesktopEnvironment::Other;
}

LinuxKeyring ChooseLinuxKeyring(LinuxDesktopEnvironment de) noexcept {
    switch (de) {
        case LinuxDesktopEnvironment::Kde4: return LinuxKeyring::KWallet;
        case LinuxDesktopEnvironment::Kde5: return LinuxKeyring::KWallet5;
        case LinuxDesktopEnvironment::Kde6: return LinuxKeyring::KWallet6;
        case LinuxDesktopEnvironment::Kde3:
        case LinuxDesktopEnvironment::Lxqt:
        case LinuxDesktopEnvironment::Other:
            return LinuxKeyring::BasicText;
        default:
            return LinuxKeyring::GnomeKeyring;
    }
}

bool ParseLinuxKeyring(std::string_view text, LinuxKeyring& out, Cookies::CookieError* err) {
    const std::string lower = StringUtils::ToLowerAscii(text);
    if (lower == "kwallet") out = LinuxKeyring::KWallet;
    else if (lower == "kwallet5") out = LinuxKeyring::KWallet5;
    else if (lower == "kwallet6") out = LinuxKeyring::KWallet6;
    else if (lower == "gnome" || lower == "gnomekeyring") out = LinuxKeyring::GnomeKeyring;
    else if (lower == "basic" || lower == "basictext") out = LinuxKeyring::BasicText;
    else {
        return SetCookieError(err, CookieErrorKind::Config,
            "Unsupported keyring: " + std::string(text), "ParseLinuxKeyring");
    }
    return true;
}

// ============================================================================
// KWALLET
// ============================================================================

std::string GetKWalletNetworkWallet(LinuxKeyring keyring, ProcessUtils::CommandRunner& runner) {
    const char* service = nullptr;
    const char* walletPath = nullptr;
    switch (keyring) {
        case LinuxKeyring::KWallet:
            service = "org.kde.kwalletd";
            walletPath = "/modules/kwalletd";
            break;
        case LinuxKeyring::KWallet5:
            service = "org.kde.kwalletd5";
            walletPath = "/modules/kwalletd5";
            break;
        case LinuxKeyring::KWallet6:
            service = "org.kde.kwalletd6";
            walletPath = "/modules/kwalletd6";
            break;
        default:
            return kDefaultWallet;
    }

    ProcessUtils::CommandResult result;
    ProcessUtils::Error perr;
    const std::vector<std::string> args = {
        "--session",
        "--print-reply=literal",
        std::string("--dest=") + service,
        walletPath,
        "org.kde.KWallet.networkWallet",
    };

    if (!runner.Run("dbus-send", args, result, &perr)) {
        BJ_LOG_WARN("Keyring", "dbus-send failed: %s", perr.message.c_str());
        return kDefaultWallet;
    }
    if (!result.Succeeded()) {
        BJ_LOG_WARN("Keyring", "dbus-send failed with status %d", result.exitCode);
        return kDefaultWallet;
    }

    static constexpr std::string_view kMarker = "string \"";
    for (const auto& line : StringUtils::Split(result.stdoutText, "\n")) {
        const size_t start = line.find(kMarker);
        if (start == std::string::npos) continue;
        const std::string_view rest = std::string_view(line).substr(start + kMarker.size());
        const size_t end = rest.find('"');
        if (end != std::string_view::npos) {
            return std::string(rest.substr(0, end));
        }
    }
    return kDefaultWallet;
}

std::optional<std::string> GetKWalletPassword(std::string_view keyringName, LinuxKeyring keyring,
                                              ProcessUtils::CommandRunner& runner) {
    const std::string wallet = GetKWalletNetworkWallet(keyring, runner);
    const std::string name(keyringName);

    ProcessUtils::CommandResult result;
    ProcessUtils::Error perr;
    const std::vector<std::string> args = {
        "--read-password", name + " Safe Storage",
        "--folder", name + " Keys",
        wallet,
    };

    if (!runner.Run("kwallet-query", args, result, &perr)) {
        BJ_LOG_WARN("Keyring", "kwallet-query command failed: %s", perr.message.c_str());
        return std::nullopt;
    }
    if (!result.Succeeded()) {
        BJ_LOG_WARN("Keyring", "kwallet-query failed with status %d", result.exitCode);
        return std::nullopt;
    }

    const std::string lowered = StringUtils::ToLowerAscii(result.stdoutText);
    if (lowered.rfind("failed to read", 0) == 0) {
        BJ_LOG_DEBUG("Keyring", "Failed to read password from kwallet");
        return std::nullopt;
    }

    return std::string(StringUtils::TrimTrailingNewlines(result.stdoutText));
}

// ============================================================================
// SECRET SERVICE
// ============================================================================

#ifdef BROWSERJAR_HAVE_LIBSECRET

namespace {

struct GErrorGuard {
    GError* error = nullptr;
    ~GErrorGuard() { if (error) g_error_free(error); }
    const char* Message() const { return error && error->message ? error->message : "unknown error"; }
};

template <typename T>
struct GObjectRef {
    T* ptr = nullptr;
    ~GObjectRef() { if (ptr) g_object_unref(ptr); }
};

std::optional<std::string> ReadItemSecret(SecretService* service, SecretItem* item) {
    if (secret_item_get_locked(item)) {
        GList* objects = g_list_append(nullptr, item);
        GErrorGuard unlockErr;
        const gint unlocked = secret_service_unlock_sync(service, objects, nullptr, nullptr, &unlockErr.error);
        g_list_free(objects);
        if (unlocked <= 0) {
            BJ_LOG_WARN("Keyring", "Failed to unlock keyring item: %s", unlockErr.Message());
        }
    }

    GErrorGuard loadErr;
    if (!secret_item_load_secret_sync(item, nullptr, &loadErr.error)) {
        BJ_LOG_WARN("Keyring", "Failed to read keyring secret: %s", loadErr.Message());
        return std::nullopt;
    }

    SecretValue* value = secret_item_get_secret(item);
    if (!value) {
        BJ_LOG_WARN("Keyring", "Keyring item has no secret");
        return std::nullopt;
    }
    gsize length = 0;
    const gchar* data = secret_value_get(value, &length);
    std::string secret(data ? data : "", data ? length : 0);
    secret_value_unref(value);
    return secret;
}

}  // namespace

std::optional<std::string> GetGnomeKeyringPassword(std::string_view keyringName) {
    GErrorGuard serviceErr;
    GObjectRef<SecretService> service{
        secret_service_get_sync(SECRET_SERVICE_LOAD_COLLECTIONS, nullptr, &serviceErr.error) };
    if (!service.ptr) {
        BJ_LOG_WARN("Keyring", "Failed to connect to secret service: %s", serviceErr.Message());
        return std::nullopt;
    }

    GErrorGuard aliasErr;
    GObjectRef<SecretCollection> collection{
        secret_collection_for_alias_sync(service.ptr, SECRET_COLLECTION_DEFAULT,
                                         SECRET_COLLECTION_LOAD_ITEMS, nullptr, &aliasErr.error) };

    if (!collection.ptr) {
        // No default alias; take any collection
        GList* collections = secret_service_get_collections(service.ptr);
        if (collections) {
            collection.ptr = SECRET_COLLECTION(g_object_ref(collections->data));
            g_list_free_full(collections, g_object_unref);

            GErrorGuard loadErr;
            if (!secret_collection_load_items_sync(collection.ptr, nullptr, &loadErr.error)) {
                BJ_LOG_WARN("Keyring", "Failed to read keyring items: %s", loadErr.Message());
                return std::nullopt;
            }
        }
    }
    if (!collection.ptr) {
        BJ_LOG_WARN("Keyring", "Failed to read keyring collection: %s", aliasErr.Message());
        return std::nullopt;
    }

    const std::string label = std::string(keyringName) + " Safe Storage";
    std::optional<std::string> secret;
    bool found = false;

    GList* items = secret_collection_get_items(collection.ptr);
    for (GList* it = items; it != nullptr; it = it->next) {
        auto* item = static_cast<SecretItem*>(it->data);
        gchar* itemLabel = secret_item_get_label(item);
        const bool matches = itemLabel && label == itemLabel;
        g_free(itemLabel);
        if (matches) {
            secret = ReadItemSecret(service.ptr, item);
            found = true;
            break;
        }
    }
    g_list_free_full(items, g_object_unref);

    if (!found) {
        BJ_LOG_WARN("Keyring", "Failed to read from keyring");
    }
    return secret;
}

#else

std::optional<std::string> GetGnomeKeyringPassword(std::string_view keyringName) {
    BJ_LOG_WARN("Keyring", "GNOME keyring support is not compiled in; no password for %.*s",
        static_cast<int>(keyringName.size()), keyringName.data());
    return std::nullopt;
}

#endif

// ============================================================================
// DISPATCH
// ============================================================================

bool GetLinuxKeyringPassword(std::string_view keyringName,
                             const std::optional<std::string>& keyringOverride,
                             const SystemUtils::EnvironmentLookup& env,
                             ProcessUtils::CommandRunner& runner,
                             std::optional<std::string>& out,
                             Cookies::CookieError* err) {
    out.reset();

    LinuxKeyring keyring = LinuxKeyring::BasicText;
    if (keyringOverride) {
        if (!ParseLinuxKeyring(*keyringOverride, keyring, err)) {
            return false;
        }
    }
    else {
        const auto de = DetectDesktopEnvironment(env);
        keyring = ChooseLinuxKeyring(de);
        BJ_LOG_DEBUG("Keyring", "Detected desktop %s, using %s",
            LinuxDesktopEnvironmentToString(de), LinuxKeyringToString(keyring));
    }

    switch (keyring) {
        case LinuxKeyring::KWallet:
        case LinuxKeyring::KWallet5:
        case LinuxKeyring::KWallet6:
            out = GetKWalletPassword(keyringName, keyring, runner);
            break;
        case LinuxKeyring::GnomeKeyring:
            out = GetGnomeKeyringPassword(keyringName);
            break;
        case LinuxKeyring::BasicText:
            break;
    }
    return true;
}

}  // namespace Browser
}  // namespace BrowserJar
