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
#include "ReportWriter.hpp"

#include "../Utils/FileUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <ctime>

namespace SamAudit {
namespace Detection {

using Utils::JSON::Json;

namespace {

    std::string Iso8601(std::chrono::system_clock::time_point tp) {
        if (tp == std::chrono::system_clock::time_point{}) return {};
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32] = {};
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    Json HiveJson(const HiveSource& hive) {
        Json j = Json::object();
        j["path"] = hive.path;
        j["sha256"] = hive.sha256;
        j["deleted"] = hive.deleted;
        return j;
    }

    Json FindingJson(const Finding& f) {
        Json j = Json::object();
        j["reference"] = f.reference;
        j["title"] = f.title;
        j["severity"] = SeverityName(f.severity);
        j["description"] = f.description;
        j["recommendation"] = f.recommendation;
        j["users"] = f.users;
        if (!f.weak.empty()) {
            Json weak = Json::array();
            for (const auto& w : f.weak) {
                weak.push_back({
                    { "username", w.username },
                    { "rid", w.rid },
                    { "matchedHash", w.matchedHash == Credentials::HashKind::LM ? "LM" : "NT" },
                    { "password", w.cleartext }
                });
            }
            j["weakPasswords"] = std::move(weak);
        }
        return j;
    }

}  // namespace

bool ParseReportFormat(std::string_view name, ReportFormat& out) noexcept {
    if (Utils::StringUtils::EqualsIgnoreCaseAscii(name, "text")) {
        out = ReportFormat::Text;
        return true;
    }
    if (Utils::StringUtils::EqualsIgnoreCaseAscii(name, "json")) {
        out = ReportFormat::Json;
        return true;
    }
    return false;
}

Json ReportWriter::ToJson(const ScanReport& report, const ReportOptions& options) {
    Json j = Json::object();
    j["sam"] = HiveJson(report.sam);
    j["system"] = HiveJson(report.system);
    j["startedAt"] = Iso8601(report.startedAt);
    j["finishedAt"] = Iso8601(report.finishedAt);

    j["stats"] = {
        { "usersSeen", report.stats.usersSeen },
        { "usersDecoded", report.stats.usersDecoded },
        { "disabledSkipped", report.stats.disabledSkipped },
        { "noHashInfo", report.stats.noHashInfo },
        { "userErrors", report.stats.userErrors },
        { "cancelled", report.stats.cancelled }
    };

    Json users = Json::array();
    for (const auto& u : report.users) {
        Json ju = {
            { "rid", u.rid },
            { "username", u.username },
            { "enabled", u.enabled },
            { "hasLmHash", !u.lmHash.empty() },
            { "hasNtHash", !u.ntHash.empty() }
        };
        if (options.includeHashes) {
            ju["lmHash"] = u.LmHashHex();
            ju["ntHash"] = u.NtHashHex();
        }
        users.push_back(std::move(ju));
    }
    j["users"] = std::move(users);

    Json errors = Json::array();
    for (const auto& e : report.userErrors) {
        errors.push_back({
            { "rid", e.ridKey },
            { "code", Utils::StringUtils::ToNarrow(Credentials::ErrorCodeName(e.code)) },
            { "message", Utils::StringUtils::ToNarrow(e.message) }
        });
    }
    j["errors"] = std::move(errors);

    Json findings = Json::array();
    for (const auto& f : report.findings) {
        findings.push_back(FindingJson(f));
    }
    j["findings"] = std::move(findings);
    return j;
}

std::string ReportWriter::ToText(const ScanReport& report, const ReportOptions& options) {
    std::ostringstream os;
    os << "SamAudit local credential report\n";
    os << "  SAM:    " << report.sam.path;
    if (!report.sam.sha256.empty()) os << " (sha256 " << report.sam.sha256 << ")";
    os << "\n  SYSTEM: " << report.system.path;
    if (!report.system.sha256.empty()) os << " (sha256 " << report.system.sha256 << ")";
    os << "\n  Accounts: " << report.stats.usersDecoded << " decoded, "
       << report.stats.disabledSkipped << " disabled skipped, "
       << report.stats.userErrors << " errors";
    if (report.stats.cancelled) os << " (cancelled)";
    os << "\n\n";

    if (options.includeHashes && !report.users.empty()) {
        os << "Recovered hashes\n";
        for (const auto& u : report.users) {
            os << "  " << u.username << ":" << u.rid << ":"
               << (u.lmHash.empty() ? "-" : u.LmHashHex()) << ":"
               << (u.ntHash.empty() ? "-" : u.NtHashHex())
               << (u.enabled ? "" : " [disabled]") << "\n";
        }
        os << "\n";
    }

    if (!report.userErrors.empty()) {
        os << "Skipped accounts\n";
        for (const auto& e : report.userErrors) {
            os << "  RID " << e.ridKey << ": " << Utils::StringUtils::ToNarrow(e.message)
               << " [" << Utils::StringUtils::ToNarrow(Credentials::ErrorCodeName(e.code)) << "]\n";
        }
        os << "\n";
    }

    if (report.findings.empty()) {
        os << "No findings.\n";
        return os.str();
    }

    for (const auto& f : report.findings) {
        os << "[" << SeverityName(f.severity) << "] " << f.reference << ": " << f.title << "\n";
        os << "  " << f.description << "\n";
        if (f.weak.empty()) {
            os << "  Users:";
            for (const auto& u : f.users) os << " " << u;
            os << "\n";
        }
        for (const auto& w : f.weak) {
            os << "  " << w.username << " (RID " << w.rid << ", "
               << (w.matchedHash == Credentials::HashKind::LM ? "LM" : "NT")
               << "): " << w.cleartext << "\n";
        }
        os << "  Recommendation: " << f.recommendation << "\n\n";
    }
    return os.str();
}

bool ReportWriter::Render(const ScanReport& report, const ReportOptions& options,
                          std::string& out, Error* err) {
    if (options.format == ReportFormat::Text) {
        out = ToText(report, options);
        return true;
    }

    Utils::JSON::StringifyOptions so;
    so.pretty = options.pretty;
    if (!Utils::JSON::Stringify(ToJson(report, options), out, so)) {
        if (err) err->Set(ErrorCode::ReportFailure, L"JSON serialization of report failed");
        return false;
    }
    out.push_back('\n');
    return true;
}

bool ReportWriter::WriteToFile(const ScanReport& report, const ReportOptions& options,
                               const std::filesystem::path& path, Error* err) {
    std::string text;
    if (!Render(report, options, text, err)) return false;

    Utils::FileUtils::Error ferr;
    if (!Utils::FileUtils::WriteAllTextUtf8Atomic(path, text, &ferr)) {
        if (err) {
            err->Set(ErrorCode::IoError, L"Cannot write report: " + Utils::StringUtils::ToWide(ferr.message),
                     path.wstring());
        }
        return false;
    }
    return true;
}

}  // namespace Detection
}  // namespace SamAudit
