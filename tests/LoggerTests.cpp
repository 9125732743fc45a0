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
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "../src/Utils/FileUtils.hpp"
#include "../src/Utils/Logger.hpp"
#include "../src/Utils/StringUtils.hpp"

using namespace BrowserJar;
using namespace BrowserJar::Utils;

namespace fs = std::filesystem;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Same configuration tests/Main.cpp starts with
        LoggerConfig cfg{};
        cfg.toConsole = true;
        cfg.toFile = false;
        cfg.async = false;
        cfg.flushLevel = LogLevel::Error;
        cfg.minimalLevel = LogLevel::Warn;
        Logger::Instance().Initialize(cfg);
    }

    LoggerConfig FileConfig() const {
        LoggerConfig cfg{};
        cfg.toConsole = false;
        cfg.toFile = true;
        cfg.async = false;
        cfg.includeThreadId = false;
        cfg.minimalLevel = LogLevel::Info;
        cfg.logDirectory = LogDir().string();
        cfg.baseFileName = "unit";
        cfg.maxFileSizeBytes = 0;
        return cfg;
    }

    fs::path LogDir() const { return tree.Root() / "logs"; }

    std::vector<std::string> ReadLines(const fs::path& file) const {
        std::string text;
        EXPECT_TRUE(FileUtils::ReadAllTextUtf8(file, text)) << file;
        std::vector<std::string> lines;
        for (auto& line : StringUtils::Split(text, "\n")) {
            if (!line.empty()) lines.push_back(std::move(line));
        }
        return lines;
    }

    Testing::TempTree tree;
};

}  // namespace

TEST_F(LoggerTest, PlainLinesCarryLevelCategoryAndSource) {
    auto cfg = FileConfig();
    cfg.includeSrcLocation = true;
    Logger::Instance().Initialize(cfg);

    BJ_LOG_DEBUG("Chromium", "filtered %d", 1);
    BJ_LOG_WARN("Chromium", "kept %d", 2);
    Logger::Instance().ShutDown();

    const auto lines = ReadLines(LogDir() / "unit.log");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[WARN] [Chromium] kept 2"), std::string::npos) << lines[0];
    EXPECT_NE(lines[0].find("(LoggerTests.cpp:"), std::string::npos) << lines[0];
    EXPECT_EQ(lines[0].find("filtered"), std::string::npos);
}

TEST_F(LoggerTest, JsonLinesEscapeMessages) {
    auto cfg = FileConfig();
    cfg.jsonLines = true;
    Logger::Instance().Initialize(cfg);

    const std::string message = "value \"quoted\"\n\tnext\x01";
    Logger::Instance().LogMessage(LogLevel::Error, "Safari", message);
    Logger::Instance().ShutDown();

    const auto lines = ReadLines(LogDir() / "unit.log");
    ASSERT_EQ(lines.size(), 1u);
    const auto parsed = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(parsed.at("level").get<std::string>(), "ERROR");
    EXPECT_EQ(parsed.at("category").get<std::string>(), "Safari");
    EXPECT_EQ(parsed.at("message").get<std::string>(), message);
    EXPECT_EQ(parsed.at("ts").get<std::string>().back(), 'Z');
    EXPECT_FALSE(parsed.contains("tid"));
}

TEST_F(LoggerTest, FileRotationKeepsBoundedHistory) {
    auto cfg = FileConfig();
    cfg.jsonLines = true;
    cfg.maxFileSizeBytes = 200;
    cfg.maxFileCount = 3;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 10; ++i) {
        Logger::Instance().LogMessage(LogLevel::Info, "Test", "entry " + std::to_string(i));
    }
    Logger::Instance().ShutDown();

    const fs::path base = LogDir() / "unit.log";
    EXPECT_TRUE(fs::exists(base));
    EXPECT_TRUE(fs::exists(base.string() + ".1"));
    EXPECT_TRUE(fs::exists(base.string() + ".2"));
    EXPECT_FALSE(fs::exists(base.string() + ".3"));

    for (const auto& file : { base.string(), base.string() + ".1", base.string() + ".2" }) {
        EXPECT_LE(fs::file_size(file), cfg.maxFileSizeBytes) << file;
    }

    const auto current = ReadLines(base);
    ASSERT_FALSE(current.empty());
    EXPECT_EQ(nlohmann::json::parse(current.back()).at("message").get<std::string>(), "entry 9");
}

TEST_F(LoggerTest, AsyncQueueIsDrainedOnShutDown) {
    auto cfg = FileConfig();
    cfg.async = true;
    cfg.maxQueueSize = 4;
    cfg.bpPolicy = LoggerConfig::BackPressurePolicy::Block;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 100; ++i) {
        BJ_LOG_INFO("Async", "message %d", i);
    }
    Logger::Instance().ShutDown();

    const auto lines = ReadLines(LogDir() / "unit.log");
    ASSERT_EQ(lines.size(), 100u);
    EXPECT_NE(lines.front().find("message 0"), std::string::npos);
    EXPECT_NE(lines.back().find("message 99"), std::string::npos);
}

TEST_F(LoggerTest, DropNewestNeverLosesTheFirstMessage) {
    auto cfg = FileConfig();
    cfg.async = true;
    cfg.maxQueueSize = 1;
    cfg.bpPolicy = LoggerConfig::BackPressurePolicy::DropNewest;
    Logger::Instance().Initialize(cfg);

    for (int i = 0; i < 50; ++i) {
        BJ_LOG_INFO("Async", "burst %d", i);
    }
    Logger::Instance().Flush();
    Logger::Instance().ShutDown();

    const auto lines = ReadLines(LogDir() / "unit.log");
    ASSERT_GE(lines.size(), 1u);
    EXPECT_LE(lines.size(), 50u);
    EXPECT_NE(lines.front().find("burst 0"), std::string::npos);
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_FALSE(ParseLogLevel("verbose"));
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}
