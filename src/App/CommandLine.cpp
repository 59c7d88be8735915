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
#include "CommandLine.hpp"

namespace SamAudit {
namespace App {

std::string UsageText() {
    return
        "Usage: samaudit --sam <file> --system <file> [options]\n"
        "\n"
        "Recovers local account hashes from offline SAM and SYSTEM hive copies and\n"
        "reports LM hash storage and passwords found in the known-hash dictionaries.\n"
        "\n"
        "Options:\n"
        "  --sam <file>          SAM hive copy (required)\n"
        "  --system <file>       SYSTEM hive copy (required)\n"
        "  --config <file>       JSON configuration file\n"
        "  --lm-dict <file>      LM hash dictionary (hash;cleartext per line)\n"
        "  --nt-dict <file>      NT hash dictionary (hash;cleartext per line)\n"
        "  --format text|json    Report format\n"
        "  --output <file>       Write the report to a file instead of stdout\n"
        "  --include-hashes      Include recovered hashes in the report\n"
        "  --include-disabled    Also audit disabled accounts\n"
        "  --fail-fast           Stop at the first account that cannot be decoded\n"
        "  --delete-hives        Delete the hive copies after the scan\n"
        "  --verbose             Debug logging\n"
        "  --help                Show this help\n"
        "\n"
        "Exit codes: 0 no findings, 1 findings, 2 usage or configuration error,\n"
        "3 scan failed.\n";
}

bool CommandLine::Parse(const std::vector<std::string>& args, CommandLine& out, std::string& error) {
    CommandLine cl;
    error.clear();

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto takeValue = [&](std::string& value) -> bool {
            if (i + 1 >= args.size() || args[i + 1].empty()) {
                error = "missing value for " + arg;
                return false;
            }
            value = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            cl.showHelp = true;
        }
        else if (arg == "--sam") {
            if (!takeValue(cl.samPath)) return false;
        }
        else if (arg == "--system") {
            if (!takeValue(cl.systemPath)) return false;
        }
        else if (arg == "--config") {
            if (!takeValue(cl.configPath)) return false;
        }
        else if (arg == "--lm-dict") {
            if (!takeValue(value)) return false;
            cl.lmDictionary = value;
        }
        else if (arg == "--nt-dict") {
            if (!takeValue(value)) return false;
            cl.ntDictionary = value;
        }
        else if (arg == "--format") {
            if (!takeValue(value)) return false;
            Detection::ReportFormat format;
            if (!Detection::ParseReportFormat(value, format)) {
                error = "unknown report format: " + value;
                return false;
            }
            cl.format = format;
        }
        else if (arg == "--output") {
            if (!takeValue(value)) return false;
            cl.output = value;
        }
        else if (arg == "--include-hashes") {
            cl.includeHashes = true;
        }
        else if (arg == "--include-disabled") {
            cl.includeDisabled = true;
        }
        else if (arg == "--fail-fast") {
            cl.failFast = true;
        }
        else if (arg == "--delete-hives") {
            cl.deleteHives = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            cl.verbose = true;
        }
        else {
            error = "unknown argument: " + arg;
            return false;
        }
    }

    if (!cl.showHelp && (cl.samPath.empty() || cl.systemPath.empty())) {
        error = "--sam and --system are required";
        return false;
    }

    out = std::move(cl);
    return true;
}

void CommandLine::ApplyTo(Config::AuditConfig& config) const {
    if (lmDictionary) config.dictionaries.lm = *lmDictionary;
    if (ntDictionary) config.dictionaries.nt = *ntDictionary;
    if (format) config.report.format = *format;
    if (output) config.report.output = *output;
    if (includeHashes) config.report.includeHashes = true;
    if (includeDisabled) config.scan.skipDisabled = false;
    if (failFast) config.scan.failFast = true;
    if (deleteHives) config.scan.deleteHivesAfterScan = true;
    if (verbose) config.log.level = Utils::LogLevel::Debug;
}

}  // namespace App
}  // namespace SamAudit
