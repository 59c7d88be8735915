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
 * SamAudit App - AUDIT RUNNER
 * ============================================================================
 *
 * @file AuditApp.hpp
 * @brief Ties configuration, dictionaries, the detector and the report
 *        together and maps the outcome to an exit code.
 * ============================================================================
 */

#pragma once

#include "CommandLine.hpp"
#include "../Config/AuditConfig.hpp"

#include <atomic>
#include <ostream>

namespace SamAudit {
namespace App {

/**
 * @brief Build the effective configuration: file (if any), then flags
 * @param errors Receives a diagnostic on failure
 */
[[nodiscard]] bool ResolveConfig(const CommandLine& cl, Config::AuditConfig& out, std::ostream& errors);

/**
 * @brief Run one audit
 * @param cancel Cooperative cancellation flag (may be null)
 * @param report Report destination when no output file is configured
 * @param errors Diagnostics
 * @return ExitCode
 */
[[nodiscard]] int RunAudit(const CommandLine& cl, const Config::AuditConfig& config,
                           const std::atomic<bool>* cancel, std::ostream& report, std::ostream& errors);

}  // namespace App
}  // namespace SamAudit
