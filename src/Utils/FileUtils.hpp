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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "Logger.hpp"

namespace BrowserJar {

	namespace Utils {

		namespace FileUtils {

			namespace fs = std::filesystem;

			/// Maximum file size for in-memory operations (256MB)
			inline constexpr uint64_t MAX_READ_FILE_SIZE = 256ULL * 1024 * 1024;

			/**
			 * @brief Error information structure for file operations.
			 *
			 * Captures the OS error condition and a human-readable message.
			 */
			struct Error {
				std::error_code code;       ///< OS error condition (ENOENT, EACCES, ...)
				std::string message;        ///< Human-readable error description

				/// @brief Check if error is set
				[[nodiscard]] bool hasError() const noexcept { return code || !message.empty(); }

				/// @brief True when the failure was a missing file or directory
				[[nodiscard]] bool isNotFound() const noexcept {
					return code == std::errc::no_such_file_or_directory;
				}

				/// @brief Clear the error state
				void clear() noexcept { code.clear(); message.clear(); }
			};

			/**
			 * @brief Options for directory traversal operations.
			 */
			struct WalkOptions {
				bool recursive = true;              ///< Recurse into subdirectories
				bool followSymlinks = false;        ///< Descend into symlinked directories
				bool includeDirs = false;           ///< Include directories in callback
				bool stopOnUnreadable = true;       ///< Fail the walk when a directory cannot be listed
				size_t maxDepth = SIZE_MAX;         ///< Maximum recursion depth
			};

			/// Return false to stop the walk early.
			using WalkCallback = std::function<bool(const fs::directory_entry& entry)>;

			// ============================================================================
			// Path Helpers
			// ============================================================================

			/**
			 * @brief Expand a leading "~" to the given home directory.
			 *
			 * "~" alone maps to @p home, "~/x" and "~\x" to home/x. Other inputs
			 * are returned unchanged.
			 */
			[[nodiscard]] fs::path ExpandHome(std::string_view path, const fs::path& home);

			// ============================================================================
			// File Existence and Status
			// ============================================================================

			[[nodiscard]] bool Exists(const fs::path& path, Error* err = nullptr);

			[[nodiscard]] bool IsDirectory(const fs::path& path, Error* err = nullptr);

			[[nodiscard]] bool IsRegularFile(const fs::path& path, Error* err = nullptr);

			/**
			 * @brief Read a file's last modification time.
			 * @return true on success
			 */
			[[nodiscard]] bool GetLastWriteTime(const fs::path& path, fs::file_time_type& out, Error* err = nullptr);

			// ============================================================================
			// Read / Write
			// ============================================================================

			/**
			 * @brief Read an entire file into memory.
			 *
			 * Fails for files larger than MAX_READ_FILE_SIZE.
			 */
			[[nodiscard]] bool ReadAllBytes(const fs::path& path, std::vector<uint8_t>& out, Error* err = nullptr);

			[[nodiscard]] bool ReadAllTextUtf8(const fs::path& path, std::string& out, Error* err = nullptr);

			[[nodiscard]] bool WriteAllBytes(const fs::path& path, const uint8_t* data, size_t len, Error* err = nullptr);

			[[nodiscard]] bool WriteAllBytes(const fs::path& path, const std::vector<uint8_t>& data, Error* err = nullptr);

			[[nodiscard]] bool WriteAllTextUtf8(const fs::path& path, std::string_view utf8, Error* err = nullptr);

			/**
			 * @brief Copy a single file, overwriting the destination.
			 */
			[[nodiscard]] bool CopyFile(const fs::path& src, const fs::path& dst, Error* err = nullptr);

			[[nodiscard]] bool CreateDirectories(const fs::path& dir, Error* err = nullptr);

			// ============================================================================
			// Directory Walking
			// ============================================================================

			/**
			 * @brief Walk a directory tree without native recursion.
			 *
			 * Pending directories are kept on an explicit stack so deep profile
			 * trees cannot exhaust the call stack. Entries are reported in
			 * directory listing order; no ordering guarantee across directories.
			 *
			 * @param root Directory to walk
			 * @param opts Traversal options
			 * @param cb Callback invoked for each file (and directory if requested)
			 * @param err Optional error output
			 * @return true if the walk completed (or was stopped by the callback)
			 */
			[[nodiscard]] bool WalkDirectory(const fs::path& root, const WalkOptions& opts, const WalkCallback& cb, Error* err = nullptr);

			// ============================================================================
			// Temporary Directories
			// ============================================================================

			/**
			 * @brief Uniquely named temporary directory removed on destruction.
			 *
			 * @code
			 *   FileUtils::ScopedTempDirectory tmp;
			 *   if (!tmp.Create("browserjar-", &err)) return false;
			 *   auto copy = tmp.Path() / "Cookies";
			 * @endcode
			 */
			class ScopedTempDirectory {
			public:
				ScopedTempDirectory() = default;
				~ScopedTempDirectory();

				ScopedTempDirectory(const ScopedTempDirectory&) = delete;
				ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;
				ScopedTempDirectory(ScopedTempDirectory&& other) noexcept;
				ScopedTempDirectory& operator=(ScopedTempDirectory&& other) noexcept;

				/**
				 * @brief Create the directory under the system temp path.
				 * @param prefix Name prefix, a random suffix is appended
				 */
				[[nodiscard]] bool Create(std::string_view prefix, Error* err = nullptr);

				[[nodiscard]] const fs::path& Path() const noexcept { return m_path; }
				[[nodiscard]] bool IsValid() const noexcept { return !m_path.empty(); }

				/// @brief Remove the directory now (also done by the destructor)
				void Reset() noexcept;

			private:
				fs::path m_path;
			};

		}  // namespace FileUtils

	}  // namespace Utils

}  // namespace BrowserJar
