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
 * SamAudit App - COMMAND LINE
 * ============================================================================
 *
 * @file CommandLine.hpp
 * @brief Parsing of samaudit arguments into overrides for AuditConfig.
 * ============================================================================
 */

#pragma once

#include "../Config/AuditConfig.hpp"

#include <optional>
#include <string>
#include <vector>

namespace SamAudit {
namespace App {

/// Process exit codes
enum ExitCode : int {
    EXIT_CLEAN = 0,         ///< Scan finished, no findings
    EXIT_FINDINGS = 1,      ///< Scan finished with findings
    EXIT_USAGE = 2,         ///< Bad arguments or configuration
    EXIT_SCAN_FATAL = 3     ///< Scan could not run to completion
};

/**
 * @brief Parsed command line; unset optionals keep the configuration value
 */
struct CommandLine {
    std::string samPath;
    std::string systemPath;
    std::string configPath;
    std::optional<std::string> lmDictionary;
    std::optional<std::string> ntDictionary;
    std::optional<Detection::ReportFormat> format;
    std::optional<std::string> output;
    bool includeHashes = false;
    bool includeDisabled = false;
    bool failFast = false;
    bool deleteHives = false;
    bool verbose = false;
    bool showHelp = false;

    /**
     * @brief Parse argv (argv[0] is skipped)
     * @param error Message describing the first invalid argument
     */
    [[nodiscard]] static bool Parse(const std::vector<std::string>& args, CommandLine& out,
                                    std::string& error);

    /**
     * @brief Apply flags on top of a loaded configuration
     */
    void ApplyTo(Config::AuditConfig& config) const;
};

[[nodiscard]] std::string UsageText();

}  // namespace App
}  // namespace SamAudit
