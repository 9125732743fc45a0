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
#include "FileUtils.hpp"

#include <fstream>
#include <random>
#include <utility>

namespace BrowserJar {

	namespace Utils {

		namespace FileUtils {

			namespace {

				void setError(Error* err, const std::error_code& ec, const std::string& what, const fs::path& path) {
					if (!err) return;
					err->code = ec;
					err->message = what + " '" + path.string() + "'";
					if (ec) {
						err->message += ": " + ec.message();
					}
				}

				void setError(Error* err, std::errc cond, const std::string& what, const fs::path& path) {
					setError(err, std::make_error_code(cond), what, path);
				}

				std::string RandomSuffix() {
					static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
					thread_local std::mt19937_64 rng{ std::random_device{}() };
					std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
					std::string out(12, '0');
					for (auto& c : out) c = kAlphabet[dist(rng)];
					return out;
				}

			} // anonymous namespace

			// ============================================================================
			// Path Helpers
			// ============================================================================

			fs::path ExpandHome(std::string_view path, const fs::path& home) {
				if (path.empty() || path.front() != '~') {
					return fs::path(std::string(path));
				}
				if (path.size() == 1) {
					return home;
				}
				if (path[1] == '/' || path[1] == '\\') {
					return home / std::string(path.substr(2));
				}
				// "~user" forms are not expanded
				return fs::path(std::string(path));
			}

			// ============================================================================
			// File Existence and Status
			// ============================================================================

			bool Exists(const fs::path& path, Error* err) {
				std::error_code ec;
				const bool result = fs::exists(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					setError(err, ec, "Cannot stat", path);
					return false;
				}
				return result;
			}

			bool IsDirectory(const fs::path& path, Error* err) {
				std::error_code ec;
				const bool result = fs::is_directory(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					setError(err, ec, "Cannot stat", path);
					return false;
				}
				return result;
			}

			bool IsRegularFile(const fs::path& path, Error* err) {
				std::error_code ec;
				const bool result = fs::is_regular_file(path, ec);
				if (ec && ec != std::errc::no_such_file_or_directory) {
					setError(err, ec, "Cannot stat", path);
					return false;
				}
				return result;
			}

			bool GetLastWriteTime(const fs::path& path, fs::file_time_type& out, Error* err) {
				std::error_code ec;
				out = fs::last_write_time(path, ec);
				if (ec) {
					setError(err, ec, "Cannot read modification time of", path);
					return false;
				}
				return true;
			}

			// ============================================================================
			// Read / Write
			// ============================================================================

			bool ReadAllBytes(const fs::path& path, std::vector<uint8_t>& out, Error* err) {
				out.clear();

				std::error_code ec;
				const auto size = fs::file_size(path, ec);
				if (ec) {
					setError(err, ec, "Cannot read", path);
					return false;
				}
				if (size > MAX_READ_FILE_SIZE) {
					setError(err, std::errc::file_too_large, "File too large", path);
					return false;
				}

				std::ifstream in(path, std::ios::binary);
				if (!in) {
					setError(err, std::error_code(errno, std::generic_category()), "Cannot open", path);
					return false;
				}

				out.resize(static_cast<size_t>(size));
				if (size > 0 && !in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
					out.clear();
					setError(err, std::errc::io_error, "Short read from", path);
					return false;
				}
				return true;
			}

			bool ReadAllTextUtf8(const fs::path& path, std::string& out, Error* err) {
				std::vector<uint8_t> bytes;
				if (!ReadAllBytes(path, bytes, err)) return false;

				size_t offset = 0;
				// Skip UTF-8 BOM
				if (bytes.size() >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
					offset = 3;
				}
				out.assign(reinterpret_cast<const char*>(bytes.data()) + offset, bytes.size() - offset);
				return true;
			}

			bool WriteAllBytes(const fs::path& path, const uint8_t* data, size_t len, Error* err) {
				std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
				if (!outFile) {
					setError(err, std::error_code(errno, std::generic_category()), "Cannot create", path);
					return false;
				}
				if (len > 0 && !outFile.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len))) {
					setError(err, std::errc::io_error, "Short write to", path);
					return false;
				}
				outFile.flush();
				if (!outFile) {
					setError(err, std::errc::io_error, "Cannot flush", path);
					return false;
				}
				return true;
			}

			bool WriteAllBytes(const fs::path& path, const std::vector<uint8_t>& data, Error* err) {
				return WriteAllBytes(path, data.data(), data.size(), err);
			}

			bool WriteAllTextUtf8(const fs::path& path, std::string_view utf8, Error* err) {
				return WriteAllBytes(path, reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size(), err);
			}

			bool CopyFile(const fs::path& src, const fs::path& dst, Error* err) {
				std::error_code ec;
				fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
				if (ec) {
					setError(err, ec, "Cannot copy", src);
					return false;
				}
				return true;
			}

			bool CreateDirectories(const fs::path& dir, Error* err) {
				std::error_code ec;
				fs::create_directories(dir, ec);
				if (ec) {
					setError(err, ec, "Cannot create directory", dir);
					return false;
				}
				return true;
			}

			// ============================================================================
			// Directory Walking
			// ============================================================================

			bool WalkDirectory(const fs::path& root, const WalkOptions& opts, const WalkCallback& cb, Error* err) {
				if (!cb) {
					setError(err, std::errc::invalid_argument, "No walk callback for", root);
					return false;
				}

				struct Pending {
					fs::path dir;
					size_t depth;
				};
				std::vector<Pending> stack;
				stack.push_back({ root, 0 });

				while (!stack.empty()) {
					Pending current = std::move(stack.back());
					stack.pop_back();

					std::error_code ec;
					fs::directory_iterator it(current.dir, fs::directory_options::skip_permission_denied, ec);
					if (ec) {
						if (opts.stopOnUnreadable) {
							setError(err, ec, "Cannot read directory", current.dir);
							return false;
						}
						BJ_LOG_DEBUG("FileUtils", "Skipping unreadable directory %s: %s",
							current.dir.string().c_str(), ec.message().c_str());
						continue;
					}

					for (const fs::directory_iterator end; it != end; it.increment(ec)) {
						if (ec) break;
						const fs::directory_entry& entry = *it;

						std::error_code typeEc;
						const bool isSymlink = entry.is_symlink(typeEc);
						const bool isDir = entry.is_directory(typeEc);

						if (isDir) {
							if (opts.includeDirs && !cb(entry)) return true;
							if (opts.recursive && current.depth + 1 <= opts.maxDepth &&
								(!isSymlink || opts.followSymlinks)) {
								stack.push_back({ entry.path(), current.depth + 1 });
							}
							continue;
						}

						if (!cb(entry)) return true;
					}

					if (ec) {
						if (opts.stopOnUnreadable) {
							setError(err, ec, "Cannot read directory entry in", current.dir);
							return false;
						}
						BJ_LOG_DEBUG("FileUtils", "Stopped listing %s: %s",
							current.dir.string().c_str(), ec.message().c_str());
					}
				}
				return true;
			}

			// ============================================================================
			// Temporary Directories
			// ============================================================================

			ScopedTempDirectory::~ScopedTempDirectory() {
				Reset();
			}

			ScopedTempDirectory::ScopedTempDirectory(ScopedTempDirectory&& other) noexcept
				: m_path(std::exchange(other.m_path, fs::path())) {
			}

			ScopedTempDirectory& ScopedTempDirectory::operator=(ScopedTempDirectory&& other) noexcept {
				if (this != &other) {
					Reset();
					m_path = std::exchange(other.m_path, fs::path());
				}
				return *this;
			}

			bool ScopedTempDirectory::Create(std::string_view prefix, Error* err) {
				Reset();

				std::error_code ec;
				const fs::path base = fs::temp_directory_path(ec);
				if (ec) {
					setError(err, ec, "Cannot resolve temp directory", fs::path());
					return false;
				}

				// Retry a few times in case of a name collision
				for (int attempt = 0; attempt < 8; ++attempt) {
					fs::path candidate = base / (std::string(prefix) + RandomSuffix());
					if (fs::create_directory(candidate, ec)) {
						m_path = std::move(candidate);
						return true;
					}
					if (ec) {
						setError(err, ec, "Cannot create temp directory", candidate);
						return false;
					}
				}

				setError(err, std::errc::file_exists, "Cannot allocate unique temp directory under", base);
				return false;
			}

			void ScopedTempDirectory::Reset() noexcept {
				if (m_path.empty()) return;

				std::error_code ec;
				fs::remove_all(m_path, ec);
				if (ec) {
					BJ_LOG_WARN("FileUtils", "Cannot remove temp directory %s: %s",
						m_path.string().c_str(), ec.message().c_str());
				}
				m_path.clear();
			}

		}  // namespace FileUtils

	}  // namespace Utils

}  // namespace BrowserJar
