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
#include "DetectionTypes.hpp"

namespace SamAudit {
namespace Detection {

const wchar_t* ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:          return L"None";
        case ErrorCode::IoError:       return L"IoError";
        case ErrorCode::HiveLoad:      return L"HiveLoad";
        case ErrorCode::ScanFatal:     return L"ScanFatal";
        case ErrorCode::UserFailure:   return L"UserFailure";
        case ErrorCode::ReportFailure: return L"ReportFailure";
    }
    return L"Unknown";
}

const char* SeverityName(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "LOW";
        case Severity::Medium:   return "MEDIUM";
        case Severity::High:     return "HIGH";
        case Severity::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

}  // namespace Detection
}  // namespace SamAudit
