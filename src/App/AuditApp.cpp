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
#include "AuditApp.hpp"

#include "../Detection/HashDictionary.hpp"
#include "../Detection/ReportWriter.hpp"
#include "../Detection/WeakCredentialDetector.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace App {

namespace {

    std::string Narrow(const std::wstring& s) {
        return Utils::StringUtils::ToNarrow(s);
    }

}  // namespace

bool ResolveConfig(const CommandLine& cl, Config::AuditConfig& out, std::ostream& errors) {
    Config::AuditConfig config;
    if (!cl.configPath.empty()) {
        Config::Error err;
        if (!config.LoadFromFile(cl.configPath, &err)) {
            errors << "samaudit: invalid configuration: " << Narrow(err.message);
            if (!err.context.empty()) errors << " (" << Narrow(err.context) << ")";
            errors << "\n";
            return false;
        }
    }
    cl.ApplyTo(config);
    out = std::move(config);
    return true;
}

int RunAudit(const CommandLine& cl, const Config::AuditConfig& config,
             const std::atomic<bool>* cancel, std::ostream& report, std::ostream& errors) {
    SA_LOG_SCOPE(L"AuditApp");

    Detection::HashDictionary lm;
    Detection::HashDictionary nt;
    Detection::Error derr;
    if (!lm.LoadFromFile(config.dictionaries.lm, &derr) ||
        !nt.LoadFromFile(config.dictionaries.nt, &derr)) {
        errors << "samaudit: " << Narrow(derr.message) << " (" << Narrow(derr.context) << ")\n";
        SA_LOG_ERROR(L"AuditApp", L"%ls", derr.message.c_str());
        return EXIT_USAGE;
    }

    Detection::DetectorOptions options;
    options.enumeration.skipDisabled = config.scan.skipDisabled;
    options.enumeration.failFast = config.scan.failFast;
    options.enumeration.cancel = cancel;
    options.deleteHivesAfterScan = config.scan.deleteHivesAfterScan;

    Detection::WeakCredentialDetector detector(lm, nt);
    Detection::ScanReport scan;
    if (!detector.Scan(cl.samPath, cl.systemPath, options, scan, &derr)) {
        errors << "samaudit: scan failed: " << Narrow(derr.message);
        if (!derr.context.empty()) errors << " (" << Narrow(derr.context) << ")";
        errors << "\n";
        SA_LOG_ERROR(L"AuditApp", L"Scan failed [%ls]: %ls", Detection::ErrorCodeName(derr.code),
                     derr.message.c_str());
        return EXIT_SCAN_FATAL;
    }

    Detection::ReportOptions ro;
    ro.format = config.report.format;
    ro.includeHashes = config.report.includeHashes;

    if (!config.report.output.empty()) {
        if (!Detection::ReportWriter::WriteToFile(scan, ro, config.report.output, &derr)) {
            errors << "samaudit: " << Narrow(derr.message) << "\n";
            return EXIT_SCAN_FATAL;
        }
        SA_LOG_INFO(L"AuditApp", L"Report written to %ls",
                    Utils::StringUtils::ToWide(config.report.output).c_str());
    }
    else {
        std::string text;
        if (!Detection::ReportWriter::Render(scan, ro, text, &derr)) {
            errors << "samaudit: " << Narrow(derr.message) << "\n";
            return EXIT_SCAN_FATAL;
        }
        report << text;
        report.flush();
    }

    if (scan.stats.cancelled) {
        errors << "samaudit: scan cancelled; report is partial\n";
        return EXIT_SCAN_FATAL;
    }
    return scan.HasFindings() ? EXIT_FINDINGS : EXIT_CLEAN;
}

}  // namespace App
}  // namespace SamAudit
