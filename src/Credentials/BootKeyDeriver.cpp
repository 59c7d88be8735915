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
#include "BootKeyDeriver.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/HashUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Credentials {

namespace {

    constexpr std::string_view SELECT_KEY = "Select";
    constexpr std::string_view CURRENT_VALUE = "Current";

    std::string LsaKeyPath(uint32_t controlSet, std::string_view part) {
        char buf[64] = {};
        std::snprintf(buf, sizeof(buf), "ControlSet%03u\\Control\\Lsa\\", controlSet);
        std::string path(buf);
        path.append(part);
        return path;
    }

}  // namespace

BootKeyDeriver::BootKeyDeriver(const Registry::Hive& systemHive) noexcept
    : m_system(systemHive) {}

bool BootKeyDeriver::CurrentControlSet(uint32_t& out, Error* err) const {
    Registry::Error rerr;
    auto select = m_system.OpenKey(SELECT_KEY, &rerr);
    if (!select) {
        return Fail(err, ErrorCode::NoCurrentControlSet,
                    L"SYSTEM hive: failed to open Select key", rerr.message);
    }

    Registry::HiveValue value;
    if (!select->GetValue(CURRENT_VALUE, value, &rerr) || value.data.empty()) {
        return Fail(err, ErrorCode::NoCurrentControlSet,
                    L"SYSTEM hive: failed to read Select\\Current", rerr.message);
    }

    uint32_t current = 0;
    const size_t n = std::min<size_t>(value.data.size(), 4);
    for (size_t i = 0; i < n; ++i) {
        current |= static_cast<uint32_t>(value.data[i]) << (8 * i);
    }
    out = current;
    return true;
}

bool BootKeyDeriver::ReadScrambledKey(std::string& out, Error* err) const {
    uint32_t controlSet = 0;
    if (!CurrentControlSet(controlSet, err)) return false;

    SA_LOG_DEBUG(L"BootKey", L"Using ControlSet%03u", controlSet);

    std::string scrambled;
    for (const auto part : BOOT_KEY_PARTS) {
        const std::string path = LsaKeyPath(controlSet, part);
        Registry::Error rerr;
        auto key = m_system.OpenKey(path, &rerr);
        if (!key) {
            return Fail(err, ErrorCode::KeyNotFound, L"SYSTEM hive: failed to open key",
                        Utils::StringUtils::ToWide(path));
        }
        scrambled += Utils::StringUtils::Utf16LeToUtf8(key->ClassName());
    }
    out = std::move(scrambled);
    return true;
}

bool BootKeyDeriver::Derive(BootKey& out, Error* err) const {
    std::string scrambled;
    if (!ReadScrambledKey(scrambled, err)) return false;
    if (!Descramble(scrambled, out, err)) return false;
    SA_LOG_INFO(L"BootKey", L"Bootkey recovered from SYSTEM hive");
    return true;
}

bool BootKeyDeriver::Descramble(std::string_view scrambledHex, BootKey& out, Error* err) noexcept {
    std::vector<uint8_t> raw;
    try {
        if (!Utils::HashUtils::FromHex(scrambledHex, raw)) {
            return Fail(err, ErrorCode::MalformedKey, L"Bootkey class names are not valid hex");
        }
    }
    catch (const std::bad_alloc&) {
        return Fail(err, ErrorCode::MalformedKey, L"Out of memory decoding bootkey");
    }
    if (raw.size() != out.size()) {
        Utils::CryptoUtils::SecureZeroMemory(raw.data(), raw.size());
        return Fail(err, ErrorCode::MalformedKey, L"Bootkey must decode to exactly 16 bytes");
    }

    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = raw[BOOT_KEY_PERMUTATION[i]];
    }
    Utils::CryptoUtils::SecureZeroMemory(raw.data(), raw.size());
    return true;
}

}  // namespace Credentials
}  // namespace SamAudit
