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
#include "RegistryHive.hpp"

#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Registry {

const wchar_t* ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:          return L"None";
        case ErrorCode::IoError:       return L"IoError";
        case ErrorCode::NotAHive:      return L"NotAHive";
        case ErrorCode::CorruptHive:   return L"CorruptHive";
        case ErrorCode::KeyNotFound:   return L"KeyNotFound";
        case ErrorCode::ValueNotFound: return L"ValueNotFound";
    }
    return L"Unknown";
}

std::vector<std::string> SplitKeyPath(std::string_view path) {
    return Utils::StringUtils::Split(path, '\\', true);
}

}  // namespace Registry
}  // namespace SamAudit
