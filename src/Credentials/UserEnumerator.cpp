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
#include "UserEnumerator.hpp"
#include "BootKeyDeriver.hpp"
#include "HashDecryptor.hpp"
#include "SamDatabase.hpp"
#include "SamRecords.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace SamAudit {
namespace Credentials {

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class UserEnumeratorImpl {
public:
    UserEnumeratorImpl(const Registry::Hive& samHive, const Registry::Hive& systemHive) noexcept
        : m_sam(samHive), m_system(systemHive) {}

    ~UserEnumeratorImpl() {
        WipeKeys();
    }

    void WipeKeys() noexcept {
        Utils::CryptoUtils::SecureZeroMemory(m_bootKey.data(), m_bootKey.size());
        Utils::CryptoUtils::SecureZeroMemory(m_derivedKey.data(), m_derivedKey.size());
        m_prepared = false;
    }

    [[nodiscard]] UserError MakeError(std::string_view ridKey, uint32_t rid, const Error& err) const {
        UserError ue;
        ue.ridKey = std::string(ridKey);
        ue.rid = rid;
        ue.code = err.code;
        ue.message = err.message;
        if (!err.context.empty()) {
            ue.message += L" (" + err.context + L")";
        }
        return ue;
    }

    [[nodiscard]] bool DecryptHash(const RidBytes& rid, const EncryptedHash& blob, HashKind kind,
                                   std::vector<uint8_t>& out, Error* err) const {
        if (!HashDecryptor::Decrypt(rid, m_derivedKey, blob, kind, out, err)) {
            if (err) {
                err->context = std::wstring(HashKindName(kind)) + L" hash";
            }
            return false;
        }
        return true;
    }

    SamDatabase m_sam;
    BootKeyDeriver m_system;
    BootKey m_bootKey{};
    DerivedKey m_derivedKey;
    bool m_prepared = false;
};

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

UserEnumerator::UserEnumerator(const Registry::Hive& samHive, const Registry::Hive& systemHive)
    : m_impl(std::make_unique<UserEnumeratorImpl>(samHive, systemHive)) {}

UserEnumerator::~UserEnumerator() = default;

bool UserEnumerator::Prepare(Error* err) {
    SA_LOG_SCOPE(L"UserEnumerator");
    m_impl->WipeKeys();

    if (!m_impl->m_system.Derive(m_impl->m_bootKey, err)) {
        SA_LOG_ERROR(L"UserEnumerator", L"Bootkey derivation failed: %ls",
                     err ? err->message.c_str() : L"");
        return false;
    }
    if (!m_impl->m_sam.DeriveSyskey(m_impl->m_bootKey, m_impl->m_derivedKey, err)) {
        SA_LOG_ERROR(L"UserEnumerator", L"Domain key derivation failed: %ls",
                     err ? err->message.c_str() : L"");
        m_impl->WipeKeys();
        return false;
    }
    m_impl->m_prepared = true;
    return true;
}

bool UserEnumerator::IsPrepared() const noexcept {
    return m_impl->m_prepared;
}

UserResult UserEnumerator::DecodeUser(std::string_view ridKey, bool skipDisabled) const {
    Error err;
    uint32_t rid = 0;

    if (!m_impl->m_prepared) {
        err.Set(ErrorCode::MalformedKey, L"Domain key not derived");
        return m_impl->MakeError(ridKey, rid, err);
    }
    if (!SamDatabase::ParseRid(ridKey, rid)) {
        err.Set(ErrorCode::UserNotFound, L"Users subkey is not a hexadecimal RID",
                Utils::StringUtils::ToWide(ridKey));
        return m_impl->MakeError(ridKey, rid, err);
    }

    UserF f;
    UserV v;
    if (!m_impl->m_sam.UserInfo(ridKey, f, v, &err)) {
        return m_impl->MakeError(ridKey, rid, err);
    }

    UserRecord record;
    record.rid = rid;
    record.enabled = f.Enabled();
    if (!record.enabled && skipDisabled) {
        return record;
    }
    if (!v.Username(record.username, &err)) {
        return m_impl->MakeError(ridKey, rid, err);
    }

    EncryptedHashes hashes;
    if (!v.Hashes(hashes, &err)) {
        if (err.code == ErrorCode::NoHashInfo) {
            record.hasHashInfo = false;
            return record;
        }
        return m_impl->MakeError(ridKey, rid, err);
    }

    const RidBytes ridBytes = HashDecryptor::RidToBytes(rid);
    if (!m_impl->DecryptHash(ridBytes, hashes.lm, HashKind::LM, record.lmHash, &err) ||
        !m_impl->DecryptHash(ridBytes, hashes.nt, HashKind::NT, record.ntHash, &err)) {
        return m_impl->MakeError(ridKey, rid, err);
    }
    return record;
}

bool UserEnumerator::Enumerate(const EnumerationOptions& options, EnumerationResult& out, Error* err) {
    SA_LOG_SCOPE(L"UserEnumerator");
    out = EnumerationResult{};

    if (!m_impl->m_prepared && !Prepare(err)) {
        return false;
    }

    std::vector<std::string> rids;
    if (!m_impl->m_sam.UserRIDs(rids, err)) {
        return false;
    }
    SA_LOG_INFO(L"UserEnumerator", L"Enumerating %zu accounts", rids.size());

    for (const auto& ridKey : rids) {
        if (options.cancel && options.cancel->load(std::memory_order_relaxed)) {
            out.stats.cancelled = true;
            SA_LOG_WARN(L"UserEnumerator", L"Enumeration cancelled after %zu of %zu accounts",
                        out.stats.usersSeen, rids.size());
            break;
        }
        ++out.stats.usersSeen;

        UserResult result = DecodeUser(ridKey, options.skipDisabled);
        if (auto* failure = std::get_if<UserError>(&result)) {
            ++out.stats.userErrors;
            SA_LOG_WARN(L"UserEnumerator", L"Skipping RID %ls: %ls [%ls]", Utils::StringUtils::ToWide(ridKey).c_str(),
                        failure->message.c_str(), ErrorCodeName(failure->code));
            if (options.failFast) {
                if (err) err->Set(failure->code, failure->message, Utils::StringUtils::ToWide(ridKey));
                out.users.push_back(std::move(result));
                return false;
            }
            out.users.push_back(std::move(result));
            continue;
        }

        auto& record = std::get<UserRecord>(result);
        if (!record.enabled && options.skipDisabled) {
            ++out.stats.disabledSkipped;
            SA_LOG_DEBUG(L"UserEnumerator", L"Skipping disabled account RID %u", record.rid);
            continue;
        }
        if (!record.hasHashInfo) {
            ++out.stats.noHashInfo;
        }
        ++out.stats.usersDecoded;
        SA_LOG_DEBUG(L"UserEnumerator", L"Decoded RID %u (LM %ls, NT %ls)", record.rid,
                     record.lmHash.empty() ? L"absent" : L"present",
                     record.ntHash.empty() ? L"absent" : L"present");
        out.users.push_back(std::move(result));
    }

    SA_LOG_INFO(L"UserEnumerator", L"Decoded %zu accounts, %zu errors, %zu disabled skipped",
                out.stats.usersDecoded, out.stats.userErrors, out.stats.disabledSkipped);
    return true;
}

}  // namespace Credentials
}  // namespace SamAudit
