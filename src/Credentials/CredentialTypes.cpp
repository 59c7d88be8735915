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
#include "CredentialTypes.hpp"

#include "../Utils/HashUtils.hpp"

namespace SamAudit {
namespace Credentials {

const wchar_t* ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:                return L"None";
        case ErrorCode::KeyNotFound:         return L"KeyNotFound";
        case ErrorCode::NoCurrentControlSet: return L"NoCurrentControlSet";
        case ErrorCode::MalformedKey:        return L"MalformedKey";
        case ErrorCode::DomainNotFound:      return L"DomainNotFound";
        case ErrorCode::DomainFNotFound:     return L"DomainFNotFound";
        case ErrorCode::DomainFTooShort:     return L"DomainFTooShort";
        case ErrorCode::VerifierMismatch:    return L"VerifierMismatch";
        case ErrorCode::UnsupportedRevision: return L"UnsupportedRevision";
        case ErrorCode::BlockAlignment:      return L"BlockAlignment";
        case ErrorCode::AccountFTooShort:    return L"AccountFTooShort";
        case ErrorCode::AccountVTooShort:    return L"AccountVTooShort";
        case ErrorCode::OutOfBounds:         return L"OutOfBounds";
        case ErrorCode::NoHashInfo:          return L"NoHashInfo";
        case ErrorCode::InvalidRIDSize:      return L"InvalidRIDSize";
        case ErrorCode::UserNotFound:        return L"UserNotFound";
        case ErrorCode::UserRecordMissing:   return L"UserRecordMissing";
        case ErrorCode::CryptoFailure:       return L"CryptoFailure";
        case ErrorCode::Cancelled:           return L"Cancelled";
    }
    return L"Unknown";
}

bool IsScanFatal(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::KeyNotFound:
        case ErrorCode::NoCurrentControlSet:
        case ErrorCode::DomainNotFound:
        case ErrorCode::DomainFNotFound:
        case ErrorCode::DomainFTooShort:
        case ErrorCode::VerifierMismatch:
        case ErrorCode::UnsupportedRevision:
            return true;
        default:
            return false;
    }
}

const wchar_t* HashKindName(HashKind kind) noexcept {
    return kind == HashKind::LM ? L"LM" : L"NT";
}

std::string UserRecord::LmHashHex() const {
    return Utils::HashUtils::ToHexUpper(lmHash);
}

std::string UserRecord::NtHashHex() const {
    return Utils::HashUtils::ToHexUpper(ntHash);
}

}  // namespace Credentials
}  // namespace SamAudit
