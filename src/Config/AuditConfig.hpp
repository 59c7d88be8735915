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
/**
 * ============================================================================
 * SamAudit Config - AUDIT CONFIGURATION
 * ============================================================================
 *
 * @file AuditConfig.hpp
 * @brief JSON configuration for logging, dictionaries, scan and report.
 *
 * FORMAT:
 * =======
 *
 * {
 *   "log":          { "level", "toConsole", "toFile", "directory", "jsonLines", "async" },
 *   "dictionaries": { "lm", "nt" },
 *   "scan":         { "skipDisabled", "failFast", "deleteHivesAfterScan" },
 *   "report":       { "format", "includeHashes", "output" }
 * }
 *
 * Missing keys keep their defaults; unknown keys are ignored. A value of the
 * wrong JSON type is an error, as is an unknown log level or report format.
 * Dictionaries default to the tables under BundledDataDirectory().
 * ============================================================================
 */

#pragma once

#include "../Detection/ReportWriter.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <filesystem>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Config {

enum class ErrorCode : uint8_t {
    None = 0,
    IoError,            ///< Config file unreadable
    ParseError,         ///< Not valid JSON
    InvalidConfig       ///< Valid JSON with an invalid setting
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::wstring message;
    std::wstring context;              ///< Setting path, e.g. "log.level"

    [[nodiscard]] bool HasError() const noexcept { return code != ErrorCode::None; }

    void Clear() noexcept {
        code = ErrorCode::None;
        message.clear();
        context.clear();
    }

    void Set(ErrorCode c, std::wstring_view msg, std::wstring_view ctx = L"") noexcept {
        code = c;
        try {
            message = msg;
            context = ctx;
        }
        catch (const std::bad_alloc&) {
            message.clear();
            context.clear();
        }
    }
};

struct LogSettings {
    Utils::LogLevel level = Utils::LogLevel::Info;
    bool toConsole = true;
    bool toFile = false;
    std::string directory = "logs";
    bool jsonLines = false;
    bool async = true;
};

/**
 * @brief First candidate that is an existing directory
 * @return The first candidate when none exists (empty path for an empty list)
 */
[[nodiscard]] std::filesystem::path FirstExistingDirectory(const std::vector<std::filesystem::path>& candidates);

/**
 * @brief Directory of the bundled hash dictionaries
 *
 * Searched in order: the install data directory, <exe dir>/data and
 * <exe dir>/../share/samaudit/data. Resolved once per process.
 */
[[nodiscard]] const std::filesystem::path& BundledDataDirectory();

struct DictionarySettings {
    std::string lm = (BundledDataDirectory() / "lm_hashes.txt").string();
    std::string nt = (BundledDataDirectory() / "nt_hashes.txt").string();
};

struct ScanSettings {
    bool skipDisabled = true;
    bool failFast = false;
    bool deleteHivesAfterScan = false;
};

struct ReportSettings {
    Detection::ReportFormat format = Detection::ReportFormat::Text;
    bool includeHashes = false;
    std::string output;                ///< Empty writes to stdout
};

/**
 * @brief Complete audit configuration
 */
struct AuditConfig {
    LogSettings log;
    DictionarySettings dictionaries;
    ScanSettings scan;
    ReportSettings report;

    /**
     * @brief Overlay settings found in a JSON document
     * @param err InvalidConfig on a bad value
     */
    [[nodiscard]] bool Apply(const Utils::JSON::Json& json, Error* err = nullptr);

    /**
     * @brief Parse JSON text and overlay it
     */
    [[nodiscard]] bool LoadFromText(std::string_view text, Error* err = nullptr);

    /**
     * @brief Load a JSON file and overlay it
     */
    [[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Error* err = nullptr);

    /**
     * @brief Serialize the effective configuration
     */
    [[nodiscard]] Utils::JSON::Json ToJson() const;

    /**
     * @brief Logger configuration for these settings
     */
    [[nodiscard]] Utils::LoggerConfig ToLoggerConfig() const;
};

[[nodiscard]] const char* LogLevelName(Utils::LogLevel level) noexcept;

}  // namespace Config
}  // namespace SamAudit
