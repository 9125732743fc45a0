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
 * @file Main.cpp
 * @brief browserjar: print the Cookie header a browser would send for a URL.
 *
 *   browserjar [--list] [-H "Cookie: a=b"] BROWSER[+KEYRING][:PROFILE][::CONTAINER] URL
 *
 * BROWSERJAR_LOG selects the log level (trace, debug, info, warn, error).
 */
#include "pch.h"

#include <iostream>

#include "../Browser/BrowserCookieExtractor.hpp"
#include "../Cookies/CookieMatcher.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"
#include "../Utils/SystemUtils.hpp"

using namespace BrowserJar;
using namespace BrowserJar::Utils;

namespace {

constexpr std::string_view kCookieHeaderPrefix = "cookie:";

void PrintUsage(std::ostream& os) {
    os << "usage: browserjar [--list] [-H \"Cookie: ...\"] "
          "BROWSER[+KEYRING][:PROFILE][::CONTAINER] URL\n"
          "browsers: chrome, chromium, edge, brave, opera, vivaldi, whale, firefox, safari\n";
}

struct CommandLine {
    bool list = false;
    std::string existingHeader;
    std::string browserConfig;
    std::string url;
};

bool ParseCommandLine(int argc, char** argv, CommandLine& out, std::string& error) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--list") {
            out.list = true;
        }
        else if (arg == "-H" || arg == "--header") {
            if (i + 1 >= argc) {
                error = "missing value for " + std::string(arg);
                return false;
            }
            const std::string_view header = StringUtils::TrimView(argv[++i]);
            if (header.size() < kCookieHeaderPrefix.size() ||
                !StringUtils::EqualsIgnoreCase(header.substr(0, kCookieHeaderPrefix.size()), kCookieHeaderPrefix)) {
                error = "only Cookie headers can be merged";
                return false;
            }
            out.existingHeader = StringUtils::Trim(header.substr(kCookieHeaderPrefix.size()));
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option " + std::string(arg);
            return false;
        }
        else {
            positional.emplace_back(arg);
        }
    }

    if (positional.size() != 2) {
        error = "expected a browser and a URL";
        return false;
    }
    out.browserConfig = std::move(positional[0]);
    out.url = std::move(positional[1]);
    return true;
}

void InitializeLogging() {
    LoggerConfig cfg{};
    cfg.toConsole = true;
    cfg.toFile = false;
    cfg.async = false;
    cfg.minimalLevel = LogLevel::Warn;

    const auto env = SystemUtils::ProcessEnvironment();
    if (auto name = SystemUtils::GetEnv(env, "BROWSERJAR_LOG")) {
        if (auto level = ParseLogLevel(*name)) {
            cfg.minimalLevel = *level;
        }
        else {
            std::cerr << "browserjar: ignoring unknown BROWSERJAR_LOG level '" << *name << "'\n";
        }
    }

    // A log directory moves logging off the console and onto a worker thread
    if (auto dir = SystemUtils::GetEnv(env, "BROWSERJAR_LOG_DIR"); dir && !dir->empty()) {
        cfg.toConsole = false;
        cfg.toFile = true;
        cfg.async = true;
        cfg.logDirectory = *dir;
    }
    if (auto format = SystemUtils::GetEnv(env, "BROWSERJAR_LOG_FORMAT")) {
        cfg.jsonLines = StringUtils::EqualsIgnoreCase(*format, "json");
    }
    Logger::Instance().Initialize(cfg);
}

}  // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    std::string usageError;
    if (!ParseCommandLine(argc, argv, cmd, usageError)) {
        std::cerr << "browserjar: " << usageError << "\n";
        PrintUsage(std::cerr);
        return Cookies::ExitCodeForError(Cookies::CookieErrorKind::Config);
    }

    try {
        InitializeLogging();
    }
    catch (const std::exception& ex) {
        std::cerr << "[FATAL] Logger exception: " << ex.what() << "\n";
        return 1;
    }

    Cookies::CookieError err;
    Cookies::BrowserCookieConfig config;
    Cookies::CookieStore store;

    int exitCode = 0;
    if (!Cookies::BrowserCookieConfig::Parse(cmd.browserConfig, config, &err) ||
        !Browser::ExtractCookies(config, store, &err)) {
        std::cerr << "browserjar: " << err.ToString() << "\n";
        exitCode = Cookies::ExitCodeForError(err.kind);
    }
    else {
        const auto matched = Cookies::CookiesForUrl(store, cmd.url);
        if (cmd.list) {
            for (const auto& cookie : matched) {
                std::cout << cookie.domain << "\t" << cookie.path << "\t"
                          << (cookie.secure ? "secure" : "-") << "\t"
                          << (cookie.expires ? std::to_string(*cookie.expires) : std::string("session")) << "\t"
                          << cookie.name << "=" << cookie.value << "\n";
            }
        }
        else {
            std::cout << Cookies::MergeCookieHeader(cmd.existingHeader, Cookies::CookiesToHeader(matched)) << "\n";
        }
    }

    Logger::Instance().ShutDown();
    return exitCode;
}
