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

#include <string>
#include <string_view>
#include <vector>

namespace BrowserJar {
    namespace Utils {
        namespace ProcessUtils {

            // ============================================================================
            // Error Handling
            // ============================================================================

            struct Error {
                int sysErrno = 0;
                std::string message;
                std::string context;

                bool HasError() const noexcept { return sysErrno != 0 || !message.empty(); }
                void Clear() noexcept { sysErrno = 0; message.clear(); context.clear(); }
            };

            // ============================================================================
            // Command Execution
            // ============================================================================

            struct CommandResult {
                int exitCode = -1;          ///< Process exit status, -1 if killed by a signal
                std::string stdoutText;
                std::string stderrText;

                bool Succeeded() const noexcept { return exitCode == 0; }
            };

            /**
             * @brief Runs an external helper program and captures its output.
             *
             * Implementations block until the child exits. There is no timeout.
             */
            class CommandRunner {
            public:
                virtual ~CommandRunner() = default;

                /**
                 * @brief Execute @p program (looked up in PATH) with @p args.
                 * @return false only when the process could not be started;
                 *         a non-zero exit status is reported through @p result.
                 */
                virtual bool Run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 CommandResult& result,
                                 Error* err = nullptr) = 0;
            };

            /// fork/exec backed runner (POSIX). On Windows, Run always fails.
            class SystemCommandRunner final : public CommandRunner {
            public:
                bool Run(const std::string& program,
                         const std::vector<std::string>& args,
                         CommandResult& result,
                         Error* err = nullptr) override;
            };

            /// Shared process-wide runner instance
            CommandRunner& DefaultCommandRunner() noexcept;

        } // namespace ProcessUtils
    } // namespace Utils
} // namespace BrowserJar
