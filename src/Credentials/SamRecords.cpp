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
#include "SamRecords.hpp"

#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Credentials {

using namespace SamRecordLayout;

namespace {

    std::wstring RangeContext(uint32_t offset, uint32_t size, size_t total) {
        wchar_t buf[96] = {};
        std::swprintf(buf, 96, L"offset 0x%X + size 0x%X > record 0x%zX", offset, size, total);
        return buf;
    }

}  // namespace

// ============================================================================
// UserF
// ============================================================================

bool UserF::Parse(std::span<const uint8_t> data, UserF& out, Error* err) noexcept {
    if (data.size() < F_MIN_SIZE) {
        return Fail(err, ErrorCode::AccountFTooShort, L"User F record too short");
    }
    out.m_enabled = (data[F_FLAGS_OFFSET] & F_DISABLED_BIT) == 0;
    return true;
}

// ============================================================================
// UserV
// ============================================================================

bool UserV::Parse(std::span<const uint8_t> data, UserV& out, Error* err) {
    if (data.size() < V_HEADER_SIZE) {
        return Fail(err, ErrorCode::AccountVTooShort, L"User V record shorter than its header");
    }
    out.m_data.assign(data.begin(), data.end());
    return true;
}

uint32_t UserV::HeaderU32(size_t pos) const noexcept {
    const uint8_t* p = m_data.data() + pos;
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

bool UserV::Read(uint32_t offset, uint32_t size, std::span<const uint8_t>& out, Error* err) const noexcept {
    const uint64_t start = V_HEADER_SIZE + static_cast<uint64_t>(offset);
    const uint64_t end = start + size;
    if (end > m_data.size()) {
        try {
            return Fail(err, ErrorCode::OutOfBounds, L"V record field out of bounds",
                        RangeContext(offset, size, m_data.size()));
        }
        catch (const std::bad_alloc&) {
            return Fail(err, ErrorCode::OutOfBounds, L"V record field out of bounds");
        }
    }
    out = std::span<const uint8_t>(m_data.data() + start, size);
    return true;
}

bool UserV::ReadField(size_t offsetPos, size_t lengthPos, std::span<const uint8_t>& out, Error* err) const noexcept {
    return Read(HeaderU32(offsetPos), HeaderU32(lengthPos), out, err);
}

bool UserV::Username(std::string& out, Error* err) const {
    std::span<const uint8_t> raw;
    if (!ReadField(V_NAME_OFFSET, V_NAME_LENGTH, raw, err)) return false;
    out = Utils::StringUtils::Utf16LeToUtf8(raw, true);
    return true;
}

bool UserV::Hashes(EncryptedHashes& out, Error* err) const {
    if (HeaderU32(V_NT_LENGTH) == 0) {
        return Fail(err, ErrorCode::NoHashInfo, L"Account has no hash information");
    }

    std::span<const uint8_t> lm;
    std::span<const uint8_t> nt;
    if (!ReadField(V_LM_OFFSET, V_LM_LENGTH, lm, err)) return false;
    if (!ReadField(V_NT_OFFSET, V_NT_LENGTH, nt, err)) return false;

    EncryptedHashes hashes;
    if (!ParseHashBlob(lm, hashes.lm, err)) return false;
    if (!ParseHashBlob(nt, hashes.nt, err)) return false;
    out = std::move(hashes);
    return true;
}

// ============================================================================
// Hash blobs
// ============================================================================

bool ParseHashBlob(std::span<const uint8_t> blob, EncryptedHash& out, Error* err) {
    out = EncryptedHash{};
    if (blob.empty()) return true;
    if (blob.size() < HASH_HEADER_SIZE) {
        return Fail(err, ErrorCode::OutOfBounds, L"Hash blob shorter than its header");
    }

    const uint16_t revision = static_cast<uint16_t>(blob[2] | (blob[3] << 8));
    if (revision == HASH_REVISION_RC4) {
        out.algorithm = HashAlgorithm::RC4;
        if (blob.size() == RC4_BLOB_SIZE) {
            out.data.assign(blob.begin() + HASH_HEADER_SIZE, blob.end());
        }
        return true;
    }

    out.algorithm = HashAlgorithm::AES;
    if (blob.size() < AES_HASH_OFFSET) {
        return Fail(err, ErrorCode::OutOfBounds, L"AES hash blob shorter than its header");
    }
    out.iv.assign(blob.begin() + AES_IV_OFFSET, blob.begin() + AES_HASH_OFFSET);
    out.data.assign(blob.begin() + AES_HASH_OFFSET, blob.end());
    return true;
}

}  // namespace Credentials
}  // namespace SamAudit
