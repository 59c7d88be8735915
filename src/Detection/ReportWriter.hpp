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
 * SamAudit Detection - REPORT SERIALIZATION
 * ============================================================================
 *
 * @file ReportWriter.hpp
 * @brief Renders a ScanReport as JSON (nlohmann/json) or as plain text.
 *
 * Recovered hashes are omitted unless includeHashes is set. Recovered
 * cleartexts of weak passwords are always part of the weak password finding.
 * ============================================================================
 */

#pragma once

#include "DetectionTypes.hpp"
#include "../Utils/JSONUtils.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace SamAudit {
namespace Detection {

enum class ReportFormat : uint8_t {
    Text = 0,
    Json = 1
};

[[nodiscard]] bool ParseReportFormat(std::string_view name, ReportFormat& out) noexcept;

struct ReportOptions {
    ReportFormat format = ReportFormat::Text;
    bool includeHashes = false;
    bool pretty = true;
};

class ReportWriter final {
public:
    [[nodiscard]] static Utils::JSON::Json ToJson(const ScanReport& report, const ReportOptions& options);

    [[nodiscard]] static std::string ToText(const ScanReport& report, const ReportOptions& options);

    /**
     * @brief Render in the configured format
     * @param err ReportFailure when serialization fails
     */
    [[nodiscard]] static bool Render(const ScanReport& report, const ReportOptions& options,
                                     std::string& out, Error* err = nullptr);

    /**
     * @brief Render and write to a file (atomic replace)
     * @param err ReportFailure or IoError
     */
    [[nodiscard]] static bool WriteToFile(const ScanReport& report, const ReportOptions& options,
                                          const std::filesystem::path& path, Error* err = nullptr);
};

}  // namespace Detection
}  // namespace SamAudit
