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
 * SamAudit Credentials - SAM HIVE ACCESS
 * ============================================================================
 *
 * @file SamDatabase.hpp
 * @brief Locates the account domain and per-user records in a SAM hive.
 * ============================================================================
 */

#pragma once

#include "CredentialTypes.hpp"
#include "SamRecords.hpp"
#include "../Registry/RegistryHive.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace SamAudit {
namespace Credentials {

inline constexpr std::string_view SAM_USERS_PATH = "SAM\\Domains\\Account\\Users";

/// Users subkey holding the name-to-RID index, not an account
inline constexpr std::string_view SAM_NAMES_SUBKEY = "Names";

/**
 * @class SamDatabase
 * @brief Read-only view of the account domain of a SAM hive
 *
 * The hive must outlive this object.
 */
class SamDatabase final {
public:
    explicit SamDatabase(const Registry::Hive& samHive) noexcept;

    /**
     * @brief Users subkey names, "Names" excluded, in hive order
     * @param err KeyNotFound when the Users key is missing
     */
    [[nodiscard]] bool UserRIDs(std::vector<std::string>& out, Error* err = nullptr) const;

    /**
     * @brief Load and decode the F and V values of one user
     * @param ridKey Users subkey name (8 hex digits)
     * @param err UserRecordMissing, AccountFTooShort or AccountVTooShort
     */
    [[nodiscard]] bool UserInfo(std::string_view ridKey, UserF& f, UserV& v,
                                Error* err = nullptr) const;

    /**
     * @brief Derive the domain key from this hive's account domain
     */
    [[nodiscard]] bool DeriveSyskey(const BootKey& bootKey, DerivedKey& out,
                                    Error* err = nullptr) const;

    /**
     * @brief Parse a Users subkey name as a hexadecimal RID
     */
    [[nodiscard]] static bool ParseRid(std::string_view ridKey, uint32_t& out) noexcept;

private:
    const Registry::Hive& m_sam;
};

}  // namespace Credentials
}  // namespace SamAudit
