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
#include "ProcessUtils.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>

#ifndef _WIN32
#  include <poll.h>
#  include <signal.h>
#  include <sys/types.h>
#  include <sys/wait.h>
#  include <unistd.h>
#endif

namespace BrowserJar {
    namespace Utils {
        namespace ProcessUtils {

            namespace {

                void setError(Error* err, int code, std::string msg, std::string ctx) {
                    if (!err) return;
                    err->sysErrno = code;
                    err->message = std::move(msg);
                    err->context = std::move(ctx);
                }

#ifndef _WIN32
                /// Closes a file descriptor on scope exit
                struct FdGuard {
                    int fd = -1;
                    ~FdGuard() { Reset(); }
                    void Reset() noexcept {
                        if (fd >= 0) {
                            ::close(fd);
                            fd = -1;
                        }
                    }
                };

                /// Drain both pipes until EOF on each
                bool DrainPipes(FdGuard& out, FdGuard& errp, CommandResult& result) {
                    char buf[4096];
                    while (out.fd >= 0 || errp.fd >= 0) {
                        pollfd fds[2];
                        nfds_t n = 0;
                        if (out.fd >= 0) fds[n++] = { out.fd, POLLIN, 0 };
                        if (errp.fd >= 0) fds[n++] = { errp.fd, POLLIN, 0 };

                        if (::poll(fds, n, -1) < 0) {
                            if (errno == EINTR) continue;
                            return false;
                        }

                        for (nfds_t i = 0; i < n; ++i) {
                            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                            const bool isOut = fds[i].fd == out.fd;
                            const ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
                            if (got > 0) {
                                (isOut ? result.stdoutText : result.stderrText).append(buf, static_cast<size_t>(got));
                            }
                            else if (got == 0 || errno != EINTR) {
                                (isOut ? out : errp).Reset();
                            }
                        }
                    }
                    return true;
                }
#endif

            } // anonymous namespace

            bool SystemCommandRunner::Run(const std::string& program,
                                          const std::vector<std::string>& args,
                                          CommandResult& result,
                                          Error* err) {
                result = CommandResult{};
#ifdef _WIN32
                (void)args;
                setError(err, 0, "External helper execution is not supported on Windows: " + program,
                    "SystemCommandRunner::Run");
                return false;
#else
                int outPipe[2];
                int errPipe[2];
                if (::pipe(outPipe) != 0) {
                    setError(err, errno, std::string("pipe failed: ") + std::strerror(errno), "SystemCommandRunner::Run");
                    return false;
                }
                FdGuard outRead{ outPipe[0] }, outWrite{ outPipe[1] };
                if (::pipe(errPipe) != 0) {
                    setError(err, errno, std::string("pipe failed: ") + std::strerror(errno), "SystemCommandRunner::Run");
                    return false;
                }
                FdGuard errRead{ errPipe[0] }, errWrite{ errPipe[1] };

                std::vector<char*> argv;
                argv.reserve(args.size() + 2);
                argv.push_back(const_cast<char*>(program.c_str()));
                for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
                argv.push_back(nullptr);

                const pid_t pid = ::fork();
                if (pid < 0) {
                    setError(err, errno, std::string("fork failed: ") + std::strerror(errno), "SystemCommandRunner::Run");
                    return false;
                }

                if (pid == 0) {
                    // child
                    ::dup2(outPipe[1], STDOUT_FILENO);
                    ::dup2(errPipe[1], STDERR_FILENO);
                    ::close(outPipe[0]);
                    ::close(outPipe[1]);
                    ::close(errPipe[0]);
                    ::close(errPipe[1]);
                    ::execvp(program.c_str(), argv.data());
                    _exit(127);
                }

                outWrite.Reset();
                errWrite.Reset();

                BJ_LOG_DEBUG("Process", "Started %s (pid %d)", program.c_str(), static_cast<int>(pid));

                const bool drained = DrainPipes(outRead, errRead, result);

                int status = 0;
                pid_t waited;
                do {
                    waited = ::waitpid(pid, &status, 0);
                } while (waited < 0 && errno == EINTR);

                if (waited < 0) {
                    setError(err, errno, std::string("waitpid failed: ") + std::strerror(errno), "SystemCommandRunner::Run");
                    return false;
                }
                if (!drained) {
                    setError(err, errno, "Failed to read helper output", "SystemCommandRunner::Run");
                    return false;
                }

                result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                if (result.exitCode == 127 && result.stdoutText.empty()) {
                    setError(err, ENOENT, "Could not execute " + program, "SystemCommandRunner::Run");
                    return false;
                }
                return true;
#endif
            }

            CommandRunner& DefaultCommandRunner() noexcept {
                static SystemCommandRunner runner;
                return runner;
            }

        } // namespace ProcessUtils
    } // namespace Utils
} // namespace BrowserJar
