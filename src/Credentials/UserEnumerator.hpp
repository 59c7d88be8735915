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
 * SamAudit Credentials - LOCAL ACCOUNT ENUMERATION
 * ============================================================================
 *
 * @file UserEnumerator.hpp
 * @brief Drives the whole recovery pipeline over a SAM/SYSTEM hive pair.
 *
 * PIPELINE:
 * =========
 *
 *   SYSTEM --BootKeyDeriver--> BootKey
 *   SAM F  --SyskeyDeriver---> DerivedKey
 *   for each RID under SAM\Domains\Account\Users:
 *       F/V records --HashDecryptor--> UserRecord | UserError
 *
 * Key derivation failures abort the scan (Prepare). Everything after that
 * is scoped to one RID: a bad record yields a UserError and enumeration
 * continues, unless failFast is requested.
 *
 * THREAD SAFETY: Not thread-safe. Cancellation may be requested from any
 * thread through the atomic flag in EnumerationOptions; it is honored
 * between users.
 * ============================================================================
 */

#pragma once

#include "CredentialTypes.hpp"
#include "../Registry/RegistryHive.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

namespace SamAudit {
namespace Credentials {

class UserEnumeratorImpl;

/// Per-RID outcome
using UserResult = std::variant<UserRecord, UserError>;

/**
 * @brief Enumeration behaviour
 */
struct EnumerationOptions {
    bool skipDisabled = true;                       ///< Omit disabled accounts from results
    bool failFast = false;                          ///< Stop at the first per-user error
    const std::atomic<bool>* cancel = nullptr;      ///< Cooperative cancellation flag
};

/**
 * @brief Scan statistics
 */
struct ScanStats {
    size_t usersSeen = 0;           ///< RIDs visited
    size_t usersDecoded = 0;        ///< UserRecord results
    size_t disabledSkipped = 0;     ///< Disabled accounts left out
    size_t noHashInfo = 0;          ///< Accounts without credential material
    size_t userErrors = 0;          ///< UserError results
    bool cancelled = false;
};

/**
 * @brief Results of one enumeration
 */
struct EnumerationResult {
    std::vector<UserResult> users;
    ScanStats stats;
};

/**
 * @class UserEnumerator
 * @brief Recovers LM/NT hashes of every local account
 *
 * USAGE:
 * @code
 *     UserEnumerator enumerator(*sam, *system);
 *     Credentials::Error err;
 *     if (!enumerator.Prepare(&err)) return false;        // scan-fatal
 *     EnumerationResult result;
 *     if (!enumerator.Enumerate({}, result, &err)) return false;
 * @endcode
 *
 * Both hives must outlive the enumerator.
 */
class UserEnumerator final {
public:
    UserEnumerator(const Registry::Hive& samHive, const Registry::Hive& systemHive);
    ~UserEnumerator();

    UserEnumerator(const UserEnumerator&) = delete;
    UserEnumerator& operator=(const UserEnumerator&) = delete;

    /**
     * @brief Derive the bootkey and the domain key
     * @param err Scan-fatal error on failure
     */
    [[nodiscard]] bool Prepare(Error* err = nullptr);

    /**
     * @brief True once Prepare succeeded
     */
    [[nodiscard]] bool IsPrepared() const noexcept;

    /**
     * @brief Decode one account
     *
     * Requires Prepare. Disabled accounts are returned with enabled=false.
     * With skipDisabled the V record of a disabled account is not read, so
     * its username and hashes stay empty and a damaged V is not an error.
     */
    [[nodiscard]] UserResult DecodeUser(std::string_view ridKey, bool skipDisabled = false) const;

    /**
     * @brief Visit every RID
     * @param out Per-RID results and statistics
     * @param err Set when enumeration cannot start, or on the first
     *            user error under failFast
     * @return false on those errors; true otherwise, including on cancellation
     */
    [[nodiscard]] bool Enumerate(const EnumerationOptions& options, EnumerationResult& out,
                                 Error* err = nullptr);

private:
    std::unique_ptr<UserEnumeratorImpl> m_impl;
};

}  // namespace Credentials
}  // namespace SamAudit
