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
 * SamAudit Credentials - SAM USER RECORDS
 * ============================================================================
 *
 * @file SamRecords.hpp
 * @brief Decoders for the per-user F (fixed) and V (variable) SAM records.
 *
 * V RECORD LAYOUT:
 * ================
 *
 * A 0xCC-byte header of (offset u32, length u32, unknown u32) triples,
 * followed by the data area. Offsets are relative to the end of the header.
 *
 *   0x0C/0x10  user name (UTF-16LE)
 *   0x9C/0xA0  LM hash blob
 *   0xA8/0xAC  NT hash blob
 *
 * Hash blob: PekID u16 | Revision u16 | ...
 *   Revision 1: Hash[16]                       (RC4, field length 20)
 *   otherwise:  DataOffset u32 | IV[16] | Hash (AES, length 24 = empty)
 * ============================================================================
 */

#pragma once

#include "CredentialTypes.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace SamAudit {
namespace Credentials {

namespace SamRecordLayout {
    inline constexpr size_t F_FLAGS_OFFSET = 0x38;           ///< Account control byte
    inline constexpr size_t F_MIN_SIZE = F_FLAGS_OFFSET + 1;
    inline constexpr uint8_t F_DISABLED_BIT = 0x01;

    inline constexpr size_t V_HEADER_SIZE = 0xCC;
    inline constexpr size_t V_NAME_OFFSET = 0x0C;
    inline constexpr size_t V_NAME_LENGTH = 0x10;
    inline constexpr size_t V_LM_OFFSET = 0x9C;
    inline constexpr size_t V_LM_LENGTH = 0xA0;
    inline constexpr size_t V_NT_OFFSET = 0xA8;
    inline constexpr size_t V_NT_LENGTH = 0xAC;

    inline constexpr uint16_t HASH_REVISION_RC4 = 1;
    inline constexpr size_t HASH_HEADER_SIZE = 4;
    inline constexpr size_t RC4_BLOB_SIZE = HASH_HEADER_SIZE + 16;
    inline constexpr size_t AES_IV_OFFSET = 8;
    inline constexpr size_t AES_HASH_OFFSET = 24;
}

/**
 * @class UserF
 * @brief Fixed-length account record; only the disabled flag is decoded
 */
class UserF final {
public:
    /**
     * @param data Raw F value
     * @param err AccountFTooShort when shorter than 0x39 bytes
     */
    [[nodiscard]] static bool Parse(std::span<const uint8_t> data, UserF& out,
                                    Error* err = nullptr) noexcept;

    /// Bit 0 of byte 0x38 set means the account is disabled
    [[nodiscard]] bool Enabled() const noexcept { return m_enabled; }

private:
    bool m_enabled = true;
};

/**
 * @class UserV
 * @brief Variable-length account record
 */
class UserV final {
public:
    /**
     * @param data Raw V value (copied)
     * @param err AccountVTooShort when shorter than the header
     */
    [[nodiscard]] static bool Parse(std::span<const uint8_t> data, UserV& out, Error* err = nullptr);

    /**
     * @brief Read a field from the data area
     * @param offset Offset relative to the end of the header
     * @param size Field length in bytes
     * @param err OutOfBounds when 0xCC + offset + size exceeds the record
     */
    [[nodiscard]] bool Read(uint32_t offset, uint32_t size, std::span<const uint8_t>& out,
                            Error* err = nullptr) const noexcept;

    /**
     * @brief Account name decoded from UTF-16LE into UTF-8
     */
    [[nodiscard]] bool Username(std::string& out, Error* err = nullptr) const;

    /**
     * @brief LM and NT blobs with their outer cipher
     * @param err NoHashInfo when the NT length is zero, OutOfBounds on a bad field
     */
    [[nodiscard]] bool Hashes(EncryptedHashes& out, Error* err = nullptr) const;

    [[nodiscard]] size_t Size() const noexcept { return m_data.size(); }

private:
    [[nodiscard]] uint32_t HeaderU32(size_t pos) const noexcept;
    [[nodiscard]] bool ReadField(size_t offsetPos, size_t lengthPos, std::span<const uint8_t>& out,
                                 Error* err) const noexcept;

    std::vector<uint8_t> m_data;
};

/**
 * @brief Split a raw hash blob into algorithm, IV and cipher text
 * @param blob Field bytes from the V record (may be empty)
 * @param out Descriptor; data left empty when the blob holds no hash
 */
[[nodiscard]] bool ParseHashBlob(std::span<const uint8_t> blob, EncryptedHash& out,
                                 Error* err = nullptr);

}  // namespace Credentials
}  // namespace SamAudit
