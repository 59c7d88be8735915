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
 * SamAudit Credentials - SAM DOMAIN KEY DERIVATION
 * ============================================================================
 *
 * @file SyskeyDeriver.hpp
 * @brief Unwraps the SAM domain key (hashed bootkey) from the domain F value.
 *
 * KEY STRUCTURE (at F + 0x68):
 * ============================
 *
 * Revision 1 (RC4):  Revision | Length | Salt[16] | Key[16] | Checksum[16]
 *   rc4Key = MD5(Salt || QWERTY || BootKey || DIGITS)
 *   dec    = RC4(rc4Key, Key || Checksum)
 *   valid iff MD5(dec[0:16] || DIGITS || dec[0:16] || QWERTY) == dec[16:32]
 *
 * Revision 2 (AES):  Revision | Length | ChecksumLength | DataLength | Salt[16] | Data
 *   key = AES-128-CBC-Decrypt(BootKey, iv = Salt, Data)[0:16]
 * ============================================================================
 */

#pragma once

#include "CredentialTypes.hpp"
#include "../Registry/RegistryHive.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace SamAudit {
namespace Credentials {

/// Offset of the key structure inside the domain F value
inline constexpr size_t DOMAIN_KEY_OFFSET = 0x68;

/// Key structure revisions
inline constexpr uint32_t DOMAIN_KEY_REVISION_RC4 = 1;
inline constexpr uint32_t DOMAIN_KEY_REVISION_AES = 2;

/// Key-schedule constants; sizeof includes the terminating NUL, which is hashed
inline constexpr char SAM_QWERTY[] = "!@#$%^&*()qwertyUIOPAzxcvbnmQQQQQQQQQQQQ)(*@&%";
inline constexpr char SAM_DIGITS[] = "0123456789012345678901234567890123456789";

/// Path of the account domain inside the SAM hive
inline constexpr std::string_view SAM_ACCOUNT_DOMAIN_PATH = "SAM\\Domains\\Account";

/**
 * @class SyskeyDeriver
 * @brief Derives the SAM domain key from the bootkey
 */
class SyskeyDeriver final {
public:
    /**
     * @brief Read the domain F value and derive the key
     * @param samHive SAM hive
     * @param bootKey Descrambled SYSTEM bootkey
     * @param out 16-byte domain key
     * @param err DomainNotFound, DomainFNotFound or any FromDomainF error
     */
    [[nodiscard]] static bool Derive(const Registry::Hive& samHive, const BootKey& bootKey,
                                     DerivedKey& out, Error* err = nullptr);

    /**
     * @brief Derive the key from a raw domain F value
     * @param err DomainFTooShort, VerifierMismatch, UnsupportedRevision,
     *            BlockAlignment or CryptoFailure
     */
    [[nodiscard]] static bool FromDomainF(std::span<const uint8_t> domainF, const BootKey& bootKey,
                                          DerivedKey& out, Error* err = nullptr) noexcept;

    /**
     * @brief Key structure revision stored in a domain F value
     */
    [[nodiscard]] static bool Revision(std::span<const uint8_t> domainF, uint32_t& out,
                                       Error* err = nullptr) noexcept;

private:
    [[nodiscard]] static bool DeriveRc4(std::span<const uint8_t> domainF, const BootKey& bootKey,
                                        DerivedKey& out, Error* err) noexcept;
    [[nodiscard]] static bool DeriveAes(std::span<const uint8_t> domainF, const BootKey& bootKey,
                                        DerivedKey& out, Error* err) noexcept;
};

}  // namespace Credentials
}  // namespace SamAudit
