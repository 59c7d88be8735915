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
#include "SamFixtures.hpp"

namespace SamAudit {
namespace Testing {
namespace Fixtures {

namespace {

    constexpr size_t V_HEADER = 0xCC;

    void PutEntry(std::vector<uint8_t>& v, size_t field, std::vector<uint8_t>& tail,
                  const std::vector<uint8_t>& bytes) {
        PutU32(v, field, static_cast<uint32_t>(tail.size()));
        PutU32(v, field + 4, static_cast<uint32_t>(bytes.size()));
        tail.insert(tail.end(), bytes.begin(), bytes.end());
        while (tail.size() % 4 != 0) tail.push_back(0);
    }

}  // namespace

std::vector<uint8_t> DomainF(Revision revision) {
    if (revision == Revision::RC4) return Hex(DOMAIN_F_RC4_HEX);
    std::vector<uint8_t> f(0x68, 0);
    const auto key = Hex(DOMAIN_KEY_AES_HEX);
    f.insert(f.end(), key.begin(), key.end());
    return f;
}

std::vector<uint8_t> UserF(bool disabled) {
    std::vector<uint8_t> f(0x50, 0);
    PutU16(f, 0x30, 1);
    f[0x38] = disabled ? 0x11 : 0x10;
    return f;
}

std::vector<uint8_t> UserV(std::string_view username, const std::vector<uint8_t>& lmBlob,
                           const std::vector<uint8_t>& ntBlob) {
    std::vector<uint8_t> v(V_HEADER, 0);
    std::vector<uint8_t> tail;
    PutEntry(v, 0x0C, tail, Utf16(username));
    PutEntry(v, 0x9C, tail, lmBlob);
    PutEntry(v, 0xA8, tail, ntBlob);
    v.insert(v.end(), tail.begin(), tail.end());
    return v;
}

std::vector<uint8_t> Rc4Blob(std::string_view encryptedHex) {
    std::vector<uint8_t> blob = { 0x02, 0x00, 0x01, 0x00 };
    const auto data = Hex(encryptedHex);
    blob.insert(blob.end(), data.begin(), data.end());
    return blob;
}

std::vector<uint8_t> AesBlob(std::string_view ivHex, std::string_view encryptedHex) {
    const auto iv = Hex(ivHex);
    const auto data = Hex(encryptedHex);
    std::vector<uint8_t> blob = { 0x02, 0x00, 0x02, 0x00 };
    blob.resize(8, 0);
    PutU32(blob, 4, 0x10);
    blob.insert(blob.end(), iv.begin(), iv.end());
    blob.insert(blob.end(), data.begin(), data.end());
    return blob;
}

std::string RidKey(uint32_t rid) {
    char buf[16] = {};
    std::snprintf(buf, sizeof(buf), "%08X", rid);
    return buf;
}

}  // namespace Fixtures
}  // namespace Testing
}  // namespace SamAudit
