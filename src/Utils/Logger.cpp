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
#include "pch.h"
#include "Logger.hpp"
#include "StringUtils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cwchar>
#include <ctime>
#include <functional>
#include <system_error>

#include <unistd.h>

namespace SamAudit {
	namespace Utils {

		namespace {

			/// Maximum formatted message length; longer messages are truncated with a marker
			constexpr size_t MAX_MESSAGE_CHARS = 16 * 1024;

			const wchar_t* LevelName(LogLevel level) noexcept {
				switch (level) {
				case LogLevel::Trace: return L"TRACE";
				case LogLevel::Debug: return L"DEBUG";
				case LogLevel::Info:  return L"INFO";
				case LogLevel::Warn:  return L"WARN";
				case LogLevel::Error: return L"ERROR";
				case LogLevel::Fatal: return L"FATAL";
				}
				return L"UNKNOWN";
			}

			const char* LevelColor(LogLevel level) noexcept {
				switch (level) {
				case LogLevel::Trace: return "\x1b[90m";
				case LogLevel::Debug: return "\x1b[36m";
				case LogLevel::Info:  return "\x1b[0m";
				case LogLevel::Warn:  return "\x1b[33m";
				case LogLevel::Error: return "\x1b[31m";
				case LogLevel::Fatal: return "\x1b[1;31m";
				}
				return "\x1b[0m";
			}

			/// Strip directories from a source path for compact output
			std::wstring BaseName(const std::wstring& path) {
				const size_t pos = path.find_last_of(L"/\\");
				return pos == std::wstring::npos ? path : path.substr(pos + 1);
			}

		}  // namespace

		bool ParseLogLevel(std::string_view name, LogLevel& out) noexcept {
			struct Entry { std::string_view name; LogLevel level; };
			static constexpr Entry kLevels[] = {
				{ "trace", LogLevel::Trace }, { "debug", LogLevel::Debug },
				{ "info", LogLevel::Info },   { "warn", LogLevel::Warn },
				{ "warning", LogLevel::Warn },{ "error", LogLevel::Error },
				{ "fatal", LogLevel::Fatal },
			};
			for (const auto& e : kLevels) {
				if (StringUtils::EqualsIgnoreCaseAscii(name, e.name)) {
					out = e.level;
					return true;
				}
			}
			return false;
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
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) m_cfg.maxQueueSize = 1;
				if (m_cfg.maxFileCount == 0) m_cfg.maxFileCount = 1;
				m_currentSize = 0;
				if (m_cfg.toFile) {
					OpenLogFileIfNeeded();
				}
			}

			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			m_stop.store(false, std::memory_order_release);

			if (cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_accepting.store(true, std::memory_order_release);
			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}
			m_accepting.store(false, std::memory_order_release);

			{
				std::lock_guard<std::mutex> lk(m_queueMutex);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Drain anything enqueued after the worker observed the stop flag
			LogItem item;
			while (Dequeue(item)) {
				WriteItem(item);
			}

			std::lock_guard<std::mutex> lk(m_cfgMutex);
			if (m_file.is_open()) {
				m_file.flush();
				m_file.close();
			}
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
		// Logging Entry Points
		// ============================================================================

		void Logger::LogEx(LogLevel level,
		                   const wchar_t* category,
		                   const wchar_t* file,
		                   int line,
		                   const wchar_t* function,
		                   const wchar_t* format, ...) {
			if (!IsEnabled(level) || !m_accepting.load(std::memory_order_acquire)) return;

			va_list args;
			va_start(args, format);
			std::wstring msg = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, msg, file, line, function, 0);
		}

		void Logger::LogErrnoEx(LogLevel level,
		                        const wchar_t* category,
		                        const wchar_t* file,
		                        int line,
		                        const wchar_t* function,
		                        int errorCode,
		                        const wchar_t* contextFormat, ...) {
			if (!IsEnabled(level) || !m_accepting.load(std::memory_order_acquire)) return;

			va_list args;
			va_start(args, contextFormat);
			std::wstring msg = FormatMessageV(contextFormat, args);
			va_end(args);

			LogMessage(level, category, msg, file, line, function, errorCode);
		}

		void Logger::LogMessage(LogLevel level,
		                        const wchar_t* category,
		                        const std::wstring& message,
		                        const wchar_t* file,
		                        int line,
		                        const wchar_t* function,
		                        int sysError) {
			if (!IsEnabled(level) || !m_accepting.load(std::memory_order_acquire)) return;

			LogItem item;
			item.level = level;
			item.category = category ? category : L"";
			item.message = message;
			item.file = file ? BaseName(file) : L"";
			item.function = function ? function : L"";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();
			item.sysError = sysError;

			bool async = false;
			{
				std::lock_guard<std::mutex> lk(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async && m_worker.joinable()) {
				Enqueue(std::move(item));
			}
			else {
				WriteItem(item);
			}
		}

		void Logger::Flush() {
			if (m_worker.joinable()) {
				std::unique_lock<std::mutex> lk(m_queueMutex);
				m_spaceCv.wait_for(lk, std::chrono::seconds(5), [this] { return m_queue.empty(); });
			}
			std::lock_guard<std::mutex> lk(m_cfgMutex);
			if (m_file.is_open()) m_file.flush();
			std::fflush(stderr);
		}

		// ============================================================================
		// Async Queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lk(m_queueMutex);
			size_t maxQueue = 0;
			LoggerConfig::BackPressurePolicy policy{};
			{
				std::lock_guard<std::mutex> cfgLk(m_cfgMutex);
				maxQueue = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			if (m_queue.size() >= maxQueue) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lk, [&] { return m_queue.size() < maxQueue || m_stop.load(); });
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.push_back(std::move(item));
			lk.unlock();
			m_queueCv.notify_one();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lk(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			return true;
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lk(m_queueMutex);
					m_queueCv.wait(lk, [this] { return !m_queue.empty() || m_stop.load(); });
					if (m_queue.empty()) {
						return;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();
				WriteItem(item);
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::WriteItem(const LogItem& item) {
			std::lock_guard<std::mutex> lk(m_cfgMutex);

			const std::wstring text = m_cfg.jsonLines ? FormatAsJson(item) : FormatPrefix(item);
			const std::string line = StringUtils::ToNarrow(text) + "\n";

			if (m_cfg.toConsole) {
				WriteConsole(item, line);
			}
			if (m_cfg.toFile) {
				WriteFile(line);
				if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel) && m_file.is_open()) {
					m_file.flush();
				}
			}
		}

		void Logger::WriteConsole(const LogItem& item, const std::string& line) {
			const bool color = ::isatty(STDERR_FILENO) != 0 && !m_cfg.jsonLines;
			if (color) {
				std::fputs(LevelColor(item.level), stderr);
				std::fputs(line.c_str(), stderr);
				std::fputs("\x1b[0m", stderr);
			}
			else {
				std::fputs(line.c_str(), stderr);
			}
		}

		void Logger::WriteFile(const std::string& line) {
			OpenLogFileIfNeeded();
			if (!m_file.is_open()) return;

			RotateIfNeeded(line.size());
			m_file.write(line.data(), static_cast<std::streamsize>(line.size()));
			m_currentSize += line.size();
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::wstring Logger::FormatPrefix(const LogItem& item) const {
			std::wstring out;
			out.reserve(item.message.size() + 96);
			out += FormatIso8601(item.ts);
			out += L" [";
			out += LevelName(item.level);
			out += L"]";

			if (m_cfg.includeProcThreadId) {
				wchar_t ids[64];
				std::swprintf(ids, 64, L" [%u:%llx]", item.pid, static_cast<unsigned long long>(item.tid));
				out += ids;
			}
			if (!item.category.empty()) {
				out += L" [";
				out += item.category;
				out += L"]";
			}
			out += L" ";
			out += item.message;

			if (item.sysError != 0) {
				out += L" (errno=";
				out += std::to_wstring(item.sysError);
				out += L": ";
				out += FormatSysError(item.sysError);
				out += L")";
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += L" (";
				out += item.file;
				out += L":";
				out += std::to_wstring(item.line);
				if (!item.function.empty()) {
					out += L" ";
					out += item.function;
				}
				out += L")";
			}
			return out;
		}

		std::wstring Logger::FormatAsJson(const LogItem& item) const {
			std::wstring out;
			out.reserve(item.message.size() + 160);
			out += L"{\"ts\":\"";
			out += FormatIso8601(item.ts);
			out += L"\",\"level\":\"";
			out += LevelName(item.level);
			out += L"\",\"category\":\"";
			out += EscapeJson(item.category);
			out += L"\",\"message\":\"";
			out += EscapeJson(item.message);
			out += L"\"";
			if (m_cfg.includeProcThreadId) {
				out += L",\"pid\":" + std::to_wstring(item.pid);
				out += L",\"tid\":" + std::to_wstring(item.tid);
			}
			if (item.sysError != 0) {
				out += L",\"errno\":" + std::to_wstring(item.sysError);
				out += L",\"errnoText\":\"" + EscapeJson(FormatSysError(item.sysError)) + L"\"";
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += L",\"file\":\"" + EscapeJson(item.file) + L"\"";
				out += L",\"line\":" + std::to_wstring(item.line);
				out += L",\"function\":\"" + EscapeJson(item.function) + L"\"";
			}
			out += L"}";
			return out;
		}

		std::wstring Logger::EscapeJson(const std::wstring& s) {
			std::wstring out;
			out.reserve(s.size() + 8);
			for (const wchar_t c : s) {
				switch (c) {
				case L'"':  out += L"\\\""; break;
				case L'\\': out += L"\\\\"; break;
				case L'\b': out += L"\\b"; break;
				case L'\f': out += L"\\f"; break;
				case L'\n': out += L"\\n"; break;
				case L'\r': out += L"\\r"; break;
				case L'\t': out += L"\\t"; break;
				default:
					if (static_cast<uint32_t>(c) < 0x20) {
						wchar_t buf[8];
						std::swprintf(buf, 8, L"\\u%04x", static_cast<unsigned>(c));
						out += buf;
					}
					else {
						out.push_back(c);
					}
				}
			}
			return out;
		}

		std::wstring Logger::FormatIso8601(std::chrono::system_clock::time_point tp) const {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(secs);

			std::tm tm{};
			if (m_cfg.useUtcTime) {
				::gmtime_r(&t, &tm);
			}
			else {
				::localtime_r(&t, &tm);
			}

			wchar_t buf[40];
			std::swprintf(buf, 40, L"%04d-%02d-%02dT%02d:%02d:%02d.%03lld%ls",
				tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
				tm.tm_hour, tm.tm_min, tm.tm_sec,
				static_cast<long long>(millis), m_cfg.useUtcTime ? L"Z" : L"");
			return buf;
		}

		std::wstring Logger::FormatSysError(int err) {
			return StringUtils::ToWide(std::generic_category().message(err));
		}

		std::wstring Logger::FormatMessageV(const wchar_t* fmt, va_list args) {
			if (!fmt) return {};

			std::vector<wchar_t> buf(256);
			for (;;) {
				va_list copy;
				va_copy(copy, args);
				const int n = std::vswprintf(buf.data(), buf.size(), fmt, copy);
				va_end(copy);

				if (n >= 0 && static_cast<size_t>(n) < buf.size()) {
					return std::wstring(buf.data(), static_cast<size_t>(n));
				}
				// vswprintf reports overflow as -1 without the required size
				if (buf.size() >= MAX_MESSAGE_CHARS) {
					std::wstring truncated(buf.data(), wcsnlen(buf.data(), buf.size() - 1));
					truncated += L"...[truncated]";
					return truncated;
				}
				buf.assign(buf.size() * 2, L'\0');
			}
		}

		const wchar_t* Logger::NarrowToWideTLS(const char* s) {
			// A ring of buffers lets one statement convert several strings (file and function).
			thread_local std::wstring ring[4];
			thread_local size_t next = 0;

			std::wstring& slot = ring[next];
			next = (next + 1) % 4;
			slot = s ? StringUtils::ToWide(s) : std::wstring();
			return slot.c_str();
		}

		// ============================================================================
		// File Rotation
		// ============================================================================

		std::wstring Logger::CurrentLogPath() const {
			return m_cfg.logDirectory + L"/" + m_cfg.baseFileName + L".log";
		}

		std::wstring Logger::RotatedLogPath(size_t index) const {
			return m_cfg.logDirectory + L"/" + m_cfg.baseFileName + L"." + std::to_wstring(index) + L".log";
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file.is_open()) return;

			const std::filesystem::path dir(StringUtils::ToNarrow(m_cfg.logDirectory));
			std::error_code ec;
			std::filesystem::create_directories(dir, ec);
			if (ec) {
				std::fprintf(stderr, "[Logger] cannot create log directory %s: %s\n",
					dir.string().c_str(), ec.message().c_str());
				return;
			}

			const std::filesystem::path path(StringUtils::ToNarrow(CurrentLogPath()));
			m_file.open(path, std::ios::out | std::ios::app | std::ios::binary);
			if (!m_file.is_open()) {
				std::fprintf(stderr, "[Logger] cannot open log file %s\n", path.string().c_str());
				return;
			}
			m_currentSize = std::filesystem::file_size(path, ec);
			if (ec) m_currentSize = 0;
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;
			PerformRotation();
		}

		void Logger::PerformRotation() {
			m_file.flush();
			m_file.close();

			std::error_code ec;
			const auto narrow = [](const std::wstring& w) { return std::filesystem::path(StringUtils::ToNarrow(w)); };

			// base.(N-1).log is dropped, every other archive shifts up by one
			std::filesystem::remove(narrow(RotatedLogPath(m_cfg.maxFileCount - 1)), ec);
			for (size_t i = m_cfg.maxFileCount - 1; i > 1; --i) {
				std::filesystem::rename(narrow(RotatedLogPath(i - 1)), narrow(RotatedLogPath(i)), ec);
			}
			if (m_cfg.maxFileCount > 1) {
				std::filesystem::rename(narrow(CurrentLogPath()), narrow(RotatedLogPath(1)), ec);
			}
			else {
				std::filesystem::remove(narrow(CurrentLogPath()), ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const wchar_t* category,
		                     const wchar_t* file,
		                     int line,
		                     const wchar_t* function,
		                     const wchar_t* messageOnEnter,
		                     LogLevel level)
			: m_category(category ? category : L"")
			, m_file(file ? file : L"")
			, m_function(function ? function : L"")
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category.c_str(),
					messageOnEnter ? messageOnEnter : L"Enter",
					m_file.c_str(), m_line, m_function.c_str());
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			lg.LogMessage(m_level, m_category.c_str(),
				L"Exit (" + std::to_wstring(elapsed) + L" us)",
				m_file.c_str(), m_line, m_function.c_str());
		}

	}  // namespace Utils
}  // namespace SamAudit
