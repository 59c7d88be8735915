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
 * SamAudit Credentials - SHARED TYPES
 * ============================================================================
 *
 * @file CredentialTypes.hpp
 * @brief Key material, hash descriptors, user records and the credential
 *        error taxonomy shared by the SAM decryption pipeline.
 *
 * ERROR SCOPES:
 * =============
 *
 * Scan-fatal (no usable key material, nothing downstream can proceed):
 *   KeyNotFound, NoCurrentControlSet, MalformedKey (bootkey), DomainNotFound,
 *   DomainFNotFound, DomainFTooShort, VerifierMismatch, UnsupportedRevision
 *
 * User-scoped (the user is skipped, the scan continues):
 *   UserRecordMissing, AccountFTooShort, AccountVTooShort, OutOfBounds,
 *   InvalidRIDSize, BlockAlignment, CryptoFailure
 *
 * Sentinel (not an error for the enumerator): NoHashInfo
 * ============================================================================
 */

#pragma once

#include <array>
#include <cstdint>
#include <new>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Credentials {

// ============================================================================
// CONSTANTS
// ============================================================================

namespace CredentialConstants {
    inline constexpr size_t BOOT_KEY_SIZE = 16;
    inline constexpr size_t DERIVED_KEY_SIZE = 16;
    inline constexpr size_t HASH_SIZE = 16;
    inline constexpr size_t RID_SIZE = 4;
    inline constexpr size_t DES_KEY_SIZE = 8;
    inline constexpr size_t AES_IV_SIZE = 16;
}

// ============================================================================
// ERROR HANDLING
// ============================================================================

/**
 * @brief Credential pipeline failure categories
 */
enum class ErrorCode : uint8_t {
    None = 0,
    KeyNotFound,            ///< Required hive key is absent
    NoCurrentControlSet,    ///< SYSTEM\Select\Current missing or unreadable
    MalformedKey,           ///< Key material has the wrong size or encoding
    DomainNotFound,         ///< SAM\Domains\Account missing
    DomainFNotFound,        ///< Domain F value missing
    DomainFTooShort,        ///< Domain F shorter than the fields read
    VerifierMismatch,       ///< RC4 syskey checksum failed
    UnsupportedRevision,    ///< Unknown domain key revision
    BlockAlignment,         ///< Cipher input not a multiple of the block size
    AccountFTooShort,       ///< User F record shorter than 0x39 bytes
    AccountVTooShort,       ///< User V record shorter than its header
    OutOfBounds,            ///< V field range exceeds the record
    NoHashInfo,             ///< NT hash length is zero (sentinel)
    InvalidRIDSize,         ///< RID is not exactly 4 bytes
    UserNotFound,           ///< RID key string is not a valid RID
    UserRecordMissing,      ///< User key, F or V value missing
    CryptoFailure,          ///< OpenSSL primitive failed
    Cancelled               ///< Scan cancelled by the caller
};

/**
 * @brief Short name for an error code
 */
[[nodiscard]] const wchar_t* ErrorCodeName(ErrorCode code) noexcept;

/**
 * @brief True for errors that leave no usable key material for the scan
 */
[[nodiscard]] bool IsScanFatal(ErrorCode code) noexcept;

/**
 * @brief Credential error information
 */
struct Error {
    ErrorCode code = ErrorCode::None;
    std::wstring message;              ///< Human-readable error message
    std::wstring context;              ///< Key path, RID or operation context

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

/// Fill err (when non-null) and return false
inline bool Fail(Error* err, ErrorCode code, std::wstring_view msg, std::wstring_view ctx = L"") noexcept {
    if (err) err->Set(code, msg, ctx);
    return false;
}

// ============================================================================
// KEY MATERIAL
// ============================================================================

/// Descrambled SYSTEM bootkey
using BootKey = std::array<uint8_t, CredentialConstants::BOOT_KEY_SIZE>;

/// SAM hashed bootkey; 16 bytes for real databases
using DerivedKey = std::vector<uint8_t>;

/// Little-endian RID bytes
using RidBytes = std::vector<uint8_t>;

/// DES key pair derived from a RID
struct RidKeys {
    std::array<uint8_t, CredentialConstants::DES_KEY_SIZE> key1{};
    std::array<uint8_t, CredentialConstants::DES_KEY_SIZE> key2{};
};

/**
 * @brief Outer cipher protecting a user hash
 */
enum class HashAlgorithm : uint8_t {
    RC4 = 0,    ///< Pre-Windows 10 1607 hash blob
    AES = 1     ///< AES-CBC hash blob
};

/**
 * @brief Which hash a blob holds (selects the RC4 key constant)
 */
enum class HashKind : uint8_t {
    LM = 0,
    NT = 1
};

[[nodiscard]] const wchar_t* HashKindName(HashKind kind) noexcept;

/**
 * @brief One encrypted hash as stored in the V record
 */
struct EncryptedHash {
    HashAlgorithm algorithm = HashAlgorithm::RC4;
    std::vector<uint8_t> data;          ///< Cipher text; empty when the hash is absent
    std::vector<uint8_t> iv;            ///< AES IV (salt); empty for RC4

    [[nodiscard]] bool Present() const noexcept { return !data.empty(); }
};

/**
 * @brief LM and NT blobs of one user
 */
struct EncryptedHashes {
    EncryptedHash lm;
    EncryptedHash nt;
};

// ============================================================================
// ENUMERATION RESULTS
// ============================================================================

/**
 * @brief A fully decoded local account
 */
struct UserRecord {
    uint32_t rid = 0;
    std::string username;               ///< UTF-8
    bool enabled = true;
    bool hasHashInfo = true;            ///< False when V carries no hash entries
    std::vector<uint8_t> lmHash;        ///< 16 bytes, or empty when absent
    std::vector<uint8_t> ntHash;        ///< 16 bytes, or empty when absent

    [[nodiscard]] std::string LmHashHex() const;
    [[nodiscard]] std::string NtHashHex() const;
};

/**
 * @brief Failure scoped to a single RID
 */
struct UserError {
    std::string ridKey;                 ///< Users subkey name the failure belongs to
    uint32_t rid = 0;                   ///< 0 if the key name did not parse
    ErrorCode code = ErrorCode::None;
    std::wstring message;
};

}  // namespace Credentials
}  // namespace SamAudit
