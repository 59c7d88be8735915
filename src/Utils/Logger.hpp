/*
 * SamAudit - Offline Windows Credential Audit
 * Copyright (C) 2026 SamAudit Developers
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
 * @brief Thread-safe asynchronous logging system for SamAudit.
 *
 * Provides:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 * - Thread-safe singleton pattern
 *
 * @note Thread-safe for all public methods.
 * @warning Must call Initialize() before logging. Macros are no-ops until then.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdarg>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

namespace SamAudit {
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

		/**
		 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal").
		 * @param name Case-insensitive level name
		 * @param out Parsed level (unchanged on failure)
		 * @return true if the name is a known level
		 */
		[[nodiscard]] bool ParseLogLevel(std::string_view name, LogLevel& out) noexcept;

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
			bool toConsole = true;          ///< Output to console (stderr)
			bool toFile = true;             ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::wstring logDirectory = L"logs";          ///< Log file directory
			std::wstring baseFileName = L"SamAudit";      ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                     ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;       ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;        ///< Level that triggers flush
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
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = L"logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   SA_LOG_INFO(L"MyCategory", L"Hello %ls", L"World");
		 *   SA_LOG_ERROR(L"MyCategory", L"Error code: %d", 42);
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
			 * @return Reference to the global Logger instance
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Re-initializing an active logger shuts it down first.
			 *
			 * @param cfg Logger configuration
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 *
			 * Stops the async worker thread and writes remaining messages.
			 */
			void ShutDown();

			/**
			 * @brief Check if logger is initialized.
			 * @return true if initialized, false otherwise
			 */
			[[nodiscard]] bool IsInitialized() const noexcept;

			/**
			 * @brief Set the minimum log level.
			 * @param level New minimum level
			 */
			void setMinimalLevel(LogLevel level) noexcept;

			/**
			 * @brief Check if a log level is enabled.
			 * @param level Level to check
			 * @return true if level would be logged
			 */
			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const wchar_t* category,
			           const wchar_t* file,
			           int line,
			           const wchar_t* function,
			           const wchar_t* format, ...);

			/**
			 * @brief Log a system (errno) error with context.
			 */
			void LogErrnoEx(LogLevel level,
			                const wchar_t* category,
			                const wchar_t* file,
			                int line,
			                const wchar_t* function,
			                int errorCode,
			                const wchar_t* contextFormat, ...);

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const wchar_t* category,
			                const std::wstring& message,
			                const wchar_t* file = nullptr,
			                int line = 0,
			                const wchar_t* function = nullptr,
			                int sysError = 0);

			/**
			 * @brief Flush all pending log messages.
			 */
			void Flush();

			/**
			 * @brief Convert narrow string to wide string (thread-local buffer).
			 * @param s Narrow string to convert
			 * @return Wide string pointer (thread-local, do not store)
			 */
			[[nodiscard]] static const wchar_t* NarrowToWideTLS(const char* s);

			/**
			 * @brief Format a message with va_list.
			 * @param fmt Format string
			 * @param args Variable arguments
			 * @return Formatted string
			 */
			[[nodiscard]] static std::wstring FormatMessageV(const wchar_t* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const wchar_t* category,
				      const wchar_t* file,
				      int line,
				      const wchar_t* function,
				      const wchar_t* messageOnEnter = L"Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				// Non-copyable, non-movable
				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				std::wstring m_category;
				std::wstring m_file;
				std::wstring m_function;
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

			/**
			 * @brief Internal log item structure.
			 */
			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::wstring category;
				std::wstring message;
				std::wstring file;
				std::wstring function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts{};
				int sysError = 0;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void WriteItem(const LogItem& item);

			void WriteConsole(const LogItem& item, const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::wstring FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::wstring FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::wstring EscapeJson(const std::wstring& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::wstring CurrentLogPath() const;
			[[nodiscard]] std::wstring RotatedLogPath(size_t index) const;

			[[nodiscard]] std::wstring FormatIso8601(std::chrono::system_clock::time_point tp) const;
			[[nodiscard]] static std::wstring FormatSysError(int err);

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Flag indicating logger is accepting messages
			std::atomic<bool> m_accepting{ false };

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			/// Logger configuration
			LoggerConfig m_cfg{};

			/// Mutex protecting configuration and sink access
			mutable std::mutex m_cfgMutex;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;

			/// Mutex protecting queue access
			mutable std::mutex m_queueMutex;

			/// Condition variable for queue signaling
			std::condition_variable m_queueCv;

			/// Condition variable signaled when the queue drains or gains space
			std::condition_variable m_spaceCv;

			/// Async worker thread
			std::thread m_worker;

			/// Stop flag for worker thread
			std::atomic<bool> m_stop{ false };

			/// Log file stream
			std::ofstream m_file;

			/// Current log file size
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace SamAudit

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   SA_LOG_INFO(L"Category", L"Message with %d format", value);
//   SA_LOG_ERROR(L"Category", L"Error occurred: %ls", errorMsg);
//   SA_LOG_ERRNO(L"Category", L"open() failed");
//   SA_LOG_SCOPE(L"Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define SA_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::SamAudit::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), \
                ::SamAudit::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::SamAudit::Utils::Logger::NarrowToWideTLS(__func__), (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define SA_LOG_TRACE(category, fmt, ...) SA_LOG_AT_LEVEL_(::SamAudit::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define SA_LOG_DEBUG(category, fmt, ...) SA_LOG_AT_LEVEL_(::SamAudit::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define SA_LOG_INFO(category, fmt, ...) SA_LOG_AT_LEVEL_(::SamAudit::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define SA_LOG_WARN(category, fmt, ...) SA_LOG_AT_LEVEL_(::SamAudit::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define SA_LOG_ERROR(category, fmt, ...) SA_LOG_AT_LEVEL_(::SamAudit::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define SA_LOG_FATAL(category, fmt, ...) SA_LOG_AT_LEVEL_(::SamAudit::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

/// @brief Log errno with context message
#define SA_LOG_ERRNO(category, fmt, ...) \
    do { \
        const int _sa_errno = errno; \
        auto& _lg = ::SamAudit::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(::SamAudit::Utils::LogLevel::Error)) { \
            _lg.LogErrnoEx(::SamAudit::Utils::LogLevel::Error, (category), \
                ::SamAudit::Utils::Logger::NarrowToWideTLS(__FILE__), __LINE__, \
                ::SamAudit::Utils::Logger::NarrowToWideTLS(__func__), \
                _sa_errno, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define SA_LOG_CONCAT_INNER_(a, b) a##b
#define SA_LOG_CONCAT_(a, b) SA_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define SA_LOG_SCOPE(category) \
    ::SamAudit::Utils::Logger::Scope SA_LOG_CONCAT_(_sa_scope_obj_, __LINE__)( \
        (category), \
        ::SamAudit::Utils::Logger::NarrowToWideTLS(__FILE__), \
        __LINE__, \
        ::SamAudit::Utils::Logger::NarrowToWideTLS(__func__))
