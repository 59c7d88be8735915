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
#include "AuditConfig.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/StringUtils.hpp"

#ifndef SAMAUDIT_DATA_DIR
#define SAMAUDIT_DATA_DIR "/usr/local/share/samaudit/data"
#endif

namespace SamAudit {
namespace Config {

using Utils::JSON::Json;

namespace {

    /// Read an optional setting; a present value of the wrong type fails
    template <typename T>
    bool Optional(const Json& json, std::string_view path, T& out, Error* err) {
        if (!Utils::JSON::Contains(json, path)) return true;
        if (!Utils::JSON::Get<T>(json, path, out)) {
            if (err) {
                err->Set(ErrorCode::InvalidConfig, L"Setting has the wrong type",
                         Utils::StringUtils::ToWide(path));
            }
            return false;
        }
        return true;
    }

}  // namespace

std::filesystem::path FirstExistingDirectory(const std::vector<std::filesystem::path>& candidates) {
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!candidate.empty() && std::filesystem::is_directory(candidate, ec)) {
            return candidate;
        }
    }
    return candidates.empty() ? std::filesystem::path{} : candidates.front();
}

const std::filesystem::path& BundledDataDirectory() {
    static const std::filesystem::path dir = [] {
        std::vector<std::filesystem::path> candidates{ SAMAUDIT_DATA_DIR };
        const auto exeDir = Utils::FileUtils::ExecutableDirectory();
        if (!exeDir.empty()) {
            candidates.push_back(exeDir / "data");
            candidates.push_back(exeDir.parent_path() / "share" / "samaudit" / "data");
        }
        return FirstExistingDirectory(candidates);
    }();
    return dir;
}

const char* LogLevelName(Utils::LogLevel level) noexcept {
    switch (level) {
        case Utils::LogLevel::Trace: return "trace";
        case Utils::LogLevel::Debug: return "debug";
        case Utils::LogLevel::Info:  return "info";
        case Utils::LogLevel::Warn:  return "warn";
        case Utils::LogLevel::Error: return "error";
        case Utils::LogLevel::Fatal: return "fatal";
    }
    return "info";
}

bool AuditConfig::Apply(const Json& json, Error* err) {
    if (!json.is_object()) {
        if (err) err->Set(ErrorCode::InvalidConfig, L"Configuration root must be an object");
        return false;
    }

    AuditConfig next = *this;

    std::string level;
    if (!Optional(json, "log.level", level, err)) return false;
    if (!level.empty() && !Utils::ParseLogLevel(level, next.log.level)) {
        if (err) {
            err->Set(ErrorCode::InvalidConfig, L"Unknown log level: " + Utils::StringUtils::ToWide(level),
                     L"log.level");
        }
        return false;
    }
    if (!Optional(json, "log.toConsole", next.log.toConsole, err) ||
        !Optional(json, "log.toFile", next.log.toFile, err) ||
        !Optional(json, "log.directory", next.log.directory, err) ||
        !Optional(json, "log.jsonLines", next.log.jsonLines, err) ||
        !Optional(json, "log.async", next.log.async, err)) {
        return false;
    }

    if (!Optional(json, "dictionaries.lm", next.dictionaries.lm, err) ||
        !Optional(json, "dictionaries.nt", next.dictionaries.nt, err)) {
        return false;
    }

    if (!Optional(json, "scan.skipDisabled", next.scan.skipDisabled, err) ||
        !Optional(json, "scan.failFast", next.scan.failFast, err) ||
        !Optional(json, "scan.deleteHivesAfterScan", next.scan.deleteHivesAfterScan, err)) {
        return false;
    }

    std::string format;
    if (!Optional(json, "report.format", format, err)) return false;
    if (!format.empty() && !Detection::ParseReportFormat(format, next.report.format)) {
        if (err) {
            err->Set(ErrorCode::InvalidConfig, L"Unknown report format: " + Utils::StringUtils::ToWide(format),
                     L"report.format");
        }
        return false;
    }
    if (!Optional(json, "report.includeHashes", next.report.includeHashes, err) ||
        !Optional(json, "report.output", next.report.output, err)) {
        return false;
    }

    *this = std::move(next);
    return true;
}

bool AuditConfig::LoadFromText(std::string_view text, Error* err) {
    Json json;
    Utils::JSON::Error jerr;
    if (!Utils::JSON::Parse(text, json, &jerr)) {
        if (err) {
            wchar_t where[48] = {};
            std::swprintf(where, 48, L"line %zu, column %zu", jerr.line, jerr.column);
            err->Set(ErrorCode::ParseError, Utils::StringUtils::ToWide(jerr.message), where);
        }
        return false;
    }
    return Apply(json, err);
}

bool AuditConfig::LoadFromFile(const std::filesystem::path& path, Error* err) {
    Json json;
    Utils::JSON::Error jerr;
    if (!Utils::JSON::LoadFromFile(path, json, &jerr)) {
        if (err) {
            const bool parseFailure = jerr.line != 0;
            err->Set(parseFailure ? ErrorCode::ParseError : ErrorCode::IoError,
                     Utils::StringUtils::ToWide(jerr.message), path.wstring());
        }
        return false;
    }
    if (!Apply(json, err)) {
        if (err) err->context = path.wstring() + L": " + err->context;
        return false;
    }
    SA_LOG_INFO(L"Config", L"Loaded configuration from %ls", path.wstring().c_str());
    return true;
}

Json AuditConfig::ToJson() const {
    return Json{
        { "log", {
            { "level", LogLevelName(log.level) },
            { "toConsole", log.toConsole },
            { "toFile", log.toFile },
            { "directory", log.directory },
            { "jsonLines", log.jsonLines },
            { "async", log.async } } },
        { "dictionaries", {
            { "lm", dictionaries.lm },
            { "nt", dictionaries.nt } } },
        { "scan", {
            { "skipDisabled", scan.skipDisabled },
            { "failFast", scan.failFast },
            { "deleteHivesAfterScan", scan.deleteHivesAfterScan } } },
        { "report", {
            { "format", report.format == Detection::ReportFormat::Json ? "json" : "text" },
            { "includeHashes", report.includeHashes },
            { "output", report.output } } }
    };
}

Utils::LoggerConfig AuditConfig::ToLoggerConfig() const {
    Utils::LoggerConfig cfg;
    cfg.minimalLevel = log.level;
    cfg.toConsole = log.toConsole;
    cfg.toFile = log.toFile;
    cfg.logDirectory = Utils::StringUtils::ToWide(log.directory);
    cfg.jsonLines = log.jsonLines;
    cfg.async = log.async;
    return cfg;
}

}  // namespace Config
}  // namespace SamAudit
