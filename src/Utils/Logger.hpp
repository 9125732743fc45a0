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
/**
 * @file Logger.hpp
 * @brief Thread-safe asynchronous logging system for BrowserJar.
 *
 * Provides:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console (stderr) and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 *
 * @note Thread-safe for all public methods.
 * @warning Messages are dropped until Initialize() has been called.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace BrowserJar {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/// @brief Short upper-case name of a level ("INFO", "WARN", ...)
		[[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

		/**
		 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal").
		 * @return Level, or std::nullopt for an unknown name
		 */
		[[nodiscard]] std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = false;///< Include source file/line/function
			bool includeThreadId = true;    ///< Include thread ID

			std::string logDirectory = "logs";          ///< Log file directory
			std::string baseFileName = "browserjar";    ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 5;                    ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;     ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;      ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.minimalLevel = LogLevel::Debug;
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   BJ_LOG_INFO("Chromium", "Found %zu cookies", count);
		 *   BJ_LOG_WARN("Keyring", "kwallet-query exited with %d", status);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note Call ShutDown() before application exit to flush pending logs.
		 */
		class Logger {
		public:
			/**
			 * @brief Get the singleton Logger instance.
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Re-initializing an already running logger first shuts it down.
			 *
			 * @param cfg Logger configuration
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			/**
			 * @brief Check if a log level is enabled.
			 * @param level Level to check
			 * @return true if level would be logged
			 */
			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			/**
			 * @brief Flush all pending log messages.
			 */
			void Flush();

			/**
			 * @brief Format a message with va_list.
			 */
			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				// Non-copyable, non-movable
				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			// Non-copyable singleton
			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				size_t tid = 0;
				std::chrono::system_clock::time_point ts;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			void Write(const LogItem& item);

			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatLine(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(std::string_view s);
			[[nodiscard]] std::string FormatTimestamp(std::chrono::system_clock::time_point ts) const;

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::string BaseLogPath() const;

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			/// Logger configuration
			LoggerConfig m_cfg{};

			/// Serializes writes to the sinks
			std::mutex m_writeMutex;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;
			std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;

			/// Async worker thread
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };

			/// Log file stream
			std::FILE* m_file = nullptr;
			uint64_t m_currentSize = 0;
		};

	}  // namespace Utils
}  // namespace BrowserJar

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   BJ_LOG_INFO("Category", "Message with %d format", value);
//   BJ_LOG_ERROR("Category", "Error occurred: %s", errorMsg.c_str());
//   BJ_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define BJ_LOG_AT(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::BrowserJar::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __FUNCTION__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define BJ_LOG_TRACE(category, fmt, ...) BJ_LOG_AT(::BrowserJar::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define BJ_LOG_DEBUG(category, fmt, ...) BJ_LOG_AT(::BrowserJar::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define BJ_LOG_INFO(category, fmt, ...)  BJ_LOG_AT(::BrowserJar::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define BJ_LOG_WARN(category, fmt, ...)  BJ_LOG_AT(::BrowserJar::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define BJ_LOG_ERROR(category, fmt, ...) BJ_LOG_AT(::BrowserJar::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define BJ_LOG_FATAL(category, fmt, ...) BJ_LOG_AT(::BrowserJar::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define BJ_LOG_CONCAT_INNER(a, b) a##b
#define BJ_LOG_CONCAT(a, b) BJ_LOG_CONCAT_INNER(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define BJ_LOG_SCOPE(category) \
    ::BrowserJar::Utils::Logger::Scope BJ_LOG_CONCAT(_bj_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __FUNCTION__)
