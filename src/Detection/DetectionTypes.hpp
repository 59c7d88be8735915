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
 * SamAudit Detection - FINDINGS AND REPORT TYPES
 * ============================================================================
 *
 * @file DetectionTypes.hpp
 * @brief Findings, weak credential matches and the scan report model.
 * ============================================================================
 */

#pragma once

#include "../Credentials/CredentialTypes.hpp"
#include "../Credentials/UserEnumerator.hpp"

#include <chrono>
#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Detection {

// ============================================================================
// ERROR HANDLING
// ============================================================================

enum class ErrorCode : uint8_t {
    None = 0,
    IoError,            ///< Dictionary, hive or report file I/O failed
    HiveLoad,           ///< Hive file is not a readable registry hive
    ScanFatal,          ///< No usable key material; see credentialCode
    UserFailure,        ///< Per-user failure under fail-fast
    ReportFailure       ///< Report serialization failed
};

struct Error {
    ErrorCode code = ErrorCode::None;
    Credentials::ErrorCode credentialCode = Credentials::ErrorCode::None;
    std::wstring message;
    std::wstring context;

    [[nodiscard]] bool HasError() const noexcept { return code != ErrorCode::None; }

    void Clear() noexcept {
        code = ErrorCode::None;
        credentialCode = Credentials::ErrorCode::None;
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

[[nodiscard]] const wchar_t* ErrorCodeName(ErrorCode code) noexcept;

// ============================================================================
// FINDINGS
// ============================================================================

enum class Severity : uint8_t {
    Low = 0,
    Medium,
    High,
    Critical
};

[[nodiscard]] const char* SeverityName(Severity severity) noexcept;

inline constexpr std::string_view FINDING_LM_FORMAT = "PASSWORD_HASH_LM_FORMAT";
inline constexpr std::string_view FINDING_WEAK_PASSWORD = "WINDOWS_WEAK_PASSWORD";

/**
 * @brief A dictionary hit for one account
 */
struct WeakCredential {
    std::string username;
    uint32_t rid = 0;
    Credentials::HashKind matchedHash = Credentials::HashKind::NT;
    std::string cleartext;
};

/**
 * @brief One advisory raised by the scan
 */
struct Finding {
    std::string reference;              ///< Stable identifier
    std::string title;
    Severity severity = Severity::Low;
    std::string description;
    std::string recommendation;
    std::vector<std::string> users;     ///< Affected account names
    std::vector<WeakCredential> weak;   ///< Dictionary hits (weak password finding only)
};

// ============================================================================
// REPORT
// ============================================================================

/**
 * @brief Hive file identity
 */
struct HiveSource {
    std::string path;
    std::string sha256;                 ///< Lowercase hex; empty for in-memory hives
    bool deleted = false;
};

/**
 * @brief Everything a scan produced
 */
struct ScanReport {
    HiveSource sam;
    HiveSource system;
    std::chrono::system_clock::time_point startedAt{};
    std::chrono::system_clock::time_point finishedAt{};
    std::vector<Credentials::UserRecord> users;
    std::vector<Credentials::UserError> userErrors;
    Credentials::ScanStats stats;
    std::vector<Finding> findings;

    [[nodiscard]] bool HasFindings() const noexcept { return !findings.empty(); }
};

}  // namespace Detection
}  // namespace SamAudit
