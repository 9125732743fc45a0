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
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <vector>

namespace BrowserJar {
	namespace Utils {

		namespace fs = std::filesystem;

		const char* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			}
			return "UNKNOWN";
		}

		std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept {
			std::string lower(name);
			std::transform(lower.begin(), lower.end(), lower.begin(),
				[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

			if (lower == "trace") return LogLevel::Trace;
			if (lower == "debug") return LogLevel::Debug;
			if (lower == "info") return LogLevel::Info;
			if (lower == "warn" || lower == "warning") return LogLevel::Warn;
			if (lower == "error") return LogLevel::Error;
			if (lower == "fatal") return LogLevel::Fatal;
			return std::nullopt;
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			if (m_initialized.load(std::memory_order_acquire)) {
				ShutDown();
			}

			{
				std::lock_guard<std::mutex> lock(m_writeMutex);
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) m_cfg.maxQueueSize = 1;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				if (m_cfg.toFile) {
					OpenLogFileIfNeeded();
				}
			}

			m_stop.store(false, std::memory_order_release);
			if (m_cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}
			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}

			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();
			m_spaceCv.notify_all();
			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Drain whatever the worker did not get to
			std::deque<LogItem> remaining;
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				remaining.swap(m_queue);
			}
			for (const auto& item : remaining) {
				Write(item);
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return std::string();

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);
			if (needed <= 0) return std::string();

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsInitialized() || !IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!IsInitialized() || !IsEnabled(level)) return;

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
			item.ts = std::chrono::system_clock::now();

			if (m_cfg.async) {
				Enqueue(std::move(item));
			}
			else {
				Write(item);
			}
		}

		void Logger::Flush() {
			if (m_cfg.async) {
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_spaceCv.wait(lock, [this] { return m_queue.empty() || m_stop.load(std::memory_order_acquire); });
			}
			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file) std::fflush(m_file);
			std::fflush(stderr);
		}

		// ============================================================================
		// Async queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (m_queue.size() >= m_cfg.maxQueueSize) {
					switch (m_cfg.bpPolicy) {
					case LoggerConfig::BackPressurePolicy::Block:
						m_spaceCv.wait(lock, [this] {
							return m_queue.size() < m_cfg.maxQueueSize || m_stop.load(std::memory_order_acquire);
						});
						break;
					case LoggerConfig::BackPressurePolicy::DropOldest:
						m_queue.pop_front();
						break;
					case LoggerConfig::BackPressurePolicy::DropNewest:
						return;
					}
				}
				m_queue.push_back(std::move(item));
			}
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] { return !m_queue.empty() || m_stop.load(std::memory_order_acquire); });
					if (m_queue.empty()) {
						if (m_stop.load(std::memory_order_acquire)) break;
						continue;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();
				Write(item);
			}
			m_spaceCv.notify_all();
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			const std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatLine(item);

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_cfg.toConsole) {
				WriteConsole(line);
			}
			if (m_cfg.toFile) {
				WriteFile(line);
			}
			if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				if (m_file) std::fflush(m_file);
				std::fflush(stderr);
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			OpenLogFileIfNeeded();
			if (!m_file) return;

			RotateIfNeeded(line.size() + 1);
			if (!m_file) return;

			std::fwrite(line.data(), 1, line.size(), m_file);
			std::fputc('\n', m_file);
			m_currentSize += line.size() + 1;
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatTimestamp(std::chrono::system_clock::time_point ts) const {
			const auto secs = std::chrono::system_clock::to_time_t(ts);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
				ts.time_since_epoch()).count() % 1000;

			std::tm tmv{};
#ifdef _WIN32
			if (m_cfg.useUtcTime) gmtime_s(&tmv, &secs); else localtime_s(&tmv, &secs);
#else
			if (m_cfg.useUtcTime) gmtime_r(&secs, &tmv); else localtime_r(&secs, &tmv);
#endif
			char buf[64];
			const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
			char out[96];
			std::snprintf(out, sizeof(out), "%.*s.%03d%s", static_cast<int>(n), buf,
				static_cast<int>(millis), m_cfg.useUtcTime ? "Z" : "");
			return out;
		}

		std::string Logger::FormatLine(const LogItem& item) const {
			std::string line;
			line.reserve(item.message.size() + 96);
			line += FormatTimestamp(item.ts);
			line += " [";
			line += LogLevelToString(item.level);
			line += "]";
			if (m_cfg.includeThreadId) {
				char tid[32];
				std::snprintf(tid, sizeof(tid), " [tid:%zx]", item.tid & 0xFFFFFF);
				line += tid;
			}
			if (!item.category.empty()) {
				line += " [";
				line += item.category;
				line += "]";
			}
			line += ' ';
			line += item.message;
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				line += " (";
				line += fs::path(item.file).filename().string();
				line += ':';
				line += std::to_string(item.line);
				if (!item.function.empty()) {
					line += ' ';
					line += item.function;
				}
				line += ')';
			}
			return line;
		}

		std::string Logger::EscapeJson(std::string_view s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (const char ch : s) {
				const auto c = static_cast<unsigned char>(ch);
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (c < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", c);
						out += buf;
					}
					else {
						out += ch;
					}
				}
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string out = "{\"ts\":\"" + FormatTimestamp(item.ts) + "\"";
			out += ",\"level\":\"";
			out += LogLevelToString(item.level);
			out += "\",\"category\":\"" + EscapeJson(item.category) + "\"";
			out += ",\"message\":\"" + EscapeJson(item.message) + "\"";
			if (m_cfg.includeThreadId) {
				out += ",\"tid\":" + std::to_string(item.tid & 0xFFFFFF);
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += ",\"file\":\"" + EscapeJson(item.file) + "\"";
				out += ",\"line\":" + std::to_string(item.line);
				out += ",\"function\":\"" + EscapeJson(item.function) + "\"";
			}
			out += '}';
			return out;
		}

		// ============================================================================
		// File rotation
		// ============================================================================

		std::string Logger::BaseLogPath() const {
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			std::error_code ec;
			fs::create_directories(m_cfg.logDirectory, ec);
			if (ec) {
				std::cerr << "[browserjar] cannot create log directory " << m_cfg.logDirectory
					<< ": " << ec.message() << "\n";
				return;
			}

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::cerr << "[browserjar] cannot open log file " << path << "\n";
				return;
			}
			m_currentSize = fs::file_size(path, ec);
			if (ec) m_currentSize = 0;
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;
			PerformRotation();
		}

		void Logger::PerformRotation() {
			if (m_file) {
				std::fclose(m_file);
				m_file = nullptr;
			}

			const std::string base = BaseLogPath();
			std::error_code ec;
			if (m_cfg.maxFileCount > 1) {
				// browserjar.log.N is dropped, every other index moves up by one
				fs::remove(base + "." + std::to_string(m_cfg.maxFileCount - 1), ec);
				for (size_t i = m_cfg.maxFileCount - 1; i > 1; --i) {
					const std::string from = base + "." + std::to_string(i - 1);
					if (fs::exists(from, ec)) {
						fs::rename(from, base + "." + std::to_string(i), ec);
					}
				}
				fs::rename(base, base + ".1", ec);
			}
			else {
				fs::remove(base, ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category,
					std::string(messageOnEnter ? messageOnEnter : "Enter") + " " + (m_function ? m_function : ""),
					m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			char buf[64];
			std::snprintf(buf, sizeof(buf), " (%lld us)", static_cast<long long>(elapsed));
			lg.LogMessage(m_level, m_category,
				std::string("Exit ") + (m_function ? m_function : "") + buf,
				m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace BrowserJar
