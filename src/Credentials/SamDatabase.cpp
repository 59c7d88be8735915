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
#include "SamDatabase.hpp"
#include "SyskeyDeriver.hpp"

#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Credentials {

SamDatabase::SamDatabase(const Registry::Hive& samHive) noexcept
    : m_sam(samHive) {}

bool SamDatabase::UserRIDs(std::vector<std::string>& out, Error* err) const {
    Registry::Error rerr;
    auto users = m_sam.OpenKey(SAM_USERS_PATH, &rerr);
    if (!users) {
        return Fail(err, ErrorCode::KeyNotFound, L"SAM hive: failed to open Users key", rerr.context);
    }

    std::vector<std::string> rids;
    rids.reserve(users->SubkeyNames().size());
    for (const auto& name : users->SubkeyNames()) {
        if (Utils::StringUtils::EqualsIgnoreCaseAscii(name, SAM_NAMES_SUBKEY)) continue;
        rids.push_back(name);
    }
    out = std::move(rids);
    return true;
}

bool SamDatabase::UserInfo(std::string_view ridKey, UserF& f, UserV& v, Error* err) const {
    std::string path(SAM_USERS_PATH);
    path.push_back('\\');
    path.append(ridKey);

    const std::wstring wideRid = Utils::StringUtils::ToWide(ridKey);

    Registry::Error rerr;
    auto user = m_sam.OpenKey(path, &rerr);
    if (!user) {
        return Fail(err, ErrorCode::UserRecordMissing,
                    L"SAM hive: failed to load user registry for RID", wideRid);
    }

    Registry::HiveValue fValue;
    Registry::HiveValue vValue;
    if (!user->GetValue("F", fValue, &rerr) || !user->GetValue("V", vValue, &rerr)) {
        return Fail(err, ErrorCode::UserRecordMissing,
                    L"SAM hive: failed to find V or F structures for RID", wideRid);
    }

    if (!UserF::Parse(fValue.data, f, err)) {
        if (err) err->context = wideRid;
        return false;
    }
    if (!UserV::Parse(vValue.data, v, err)) {
        if (err) err->context = wideRid;
        return false;
    }
    return true;
}

bool SamDatabase::DeriveSyskey(const BootKey& bootKey, DerivedKey& out, Error* err) const {
    return SyskeyDeriver::Derive(m_sam, bootKey, out, err);
}

bool SamDatabase::ParseRid(std::string_view ridKey, uint32_t& out) noexcept {
    if (ridKey.empty() || ridKey.size() > 8) return false;
    uint32_t value = 0;
    for (const char c : ridKey) {
        uint32_t digit = 0;
        if (c >= '0' && c <= '9') digit = static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<uint32_t>(c - 'A' + 10);
        else return false;
        value = (value << 4) | digit;
    }
    out = value;
    return true;
}

}  // namespace Credentials
}  // namespace SamAudit
