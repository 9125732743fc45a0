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
#pragma once

#include <gmock/gmock.h>

#include "../src/Utils/ProcessUtils.hpp"

namespace BrowserJar {
namespace Testing {

class MockCommandRunner : public Utils::ProcessUtils::CommandRunner {
public:
    MOCK_METHOD(bool, Run,
        (const std::string& program,
         const std::vector<std::string>& args,
         Utils::ProcessUtils::CommandResult& result,
         Utils::ProcessUtils::Error* err),
        (override));
};

/// @brief Action that reports a finished process with the given status and stdout
inline auto Exits(int exitCode, std::string stdoutText) {
    return [exitCode, stdoutText = std::move(stdoutText)](
        const std::string&, const std::vector<std::string>&,
        Utils::ProcessUtils::CommandResult& result, Utils::ProcessUtils::Error*) {
        result.exitCode = exitCode;
        result.stdoutText = stdoutText;
        return true;
    };
}

}  // namespace Testing
}  // namespace BrowserJar
