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
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Testing {

/// Decode hex test data; whitespace is ignored
inline std::vector<uint8_t> Hex(std::string_view hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    int hi = -1;
    for (const char c : hex) {
        if (c == ' ' || c == '\n') continue;
        const int v = nibble(c);
        if (v < 0) throw std::invalid_argument("bad hex in test data");
        if (hi < 0) {
            hi = v;
        }
        else {
            out.push_back(static_cast<uint8_t>((hi << 4) | v));
            hi = -1;
        }
    }
    if (hi >= 0) throw std::invalid_argument("odd hex length in test data");
    return out;
}

/// ASCII text as UTF-16LE bytes
inline std::vector<uint8_t> Utf16(std::string_view ascii) {
    std::vector<uint8_t> out;
    out.reserve(ascii.size() * 2);
    for (const char c : ascii) {
        out.push_back(static_cast<uint8_t>(c));
        out.push_back(0);
    }
    return out;
}

inline void PutU16(std::vector<uint8_t>& buf, size_t pos, uint16_t v) {
    buf[pos] = static_cast<uint8_t>(v);
    buf[pos + 1] = static_cast<uint8_t>(v >> 8);
}

inline void PutU32(std::vector<uint8_t>& buf, size_t pos, uint32_t v) {
    for (int i = 0; i < 4; ++i) buf[pos + i] = static_cast<uint8_t>(v >> (8 * i));
}

inline std::vector<uint8_t> U32(uint32_t v) {
    std::vector<uint8_t> out(4);
    PutU32(out, 0, v);
    return out;
}

}  // namespace Testing
}  // namespace SamAudit
