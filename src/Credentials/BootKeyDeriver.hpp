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
 * SamAudit Credentials - BOOTKEY DERIVATION
 * ============================================================================
 *
 * @file BootKeyDeriver.hpp
 * @brief Recovers the 16-byte bootkey (syskey) from a SYSTEM hive.
 *
 * The bootkey is split across the class names of four LSA subkeys
 * (JD, Skew1, GBG, Data) under the current control set. Each class name
 * holds 8 hex digits; the 16 decoded bytes are then descrambled with a fixed
 * permutation.
 * ============================================================================
 */

#pragma once

#include "CredentialTypes.hpp"
#include "../Registry/RegistryHive.hpp"

#include <array>
#include <string>
#include <string_view>

namespace SamAudit {
namespace Credentials {

/// bootKey[i] = scrambled[BOOT_KEY_PERMUTATION[i]]
inline constexpr std::array<uint8_t, 16> BOOT_KEY_PERMUTATION = {
    8, 5, 4, 2, 11, 9, 13, 3, 0, 6, 1, 12, 14, 10, 15, 7
};

/// LSA subkeys carrying the scrambled bootkey, in concatenation order
inline constexpr std::array<std::string_view, 4> BOOT_KEY_PARTS = { "JD", "Skew1", "GBG", "Data" };

/**
 * @class BootKeyDeriver
 * @brief Reads the bootkey from a SYSTEM hive
 *
 * The hive must outlive the deriver.
 */
class BootKeyDeriver final {
public:
    explicit BootKeyDeriver(const Registry::Hive& systemHive) noexcept;

    /**
     * @brief Resolve Select\Current
     * @param out Control set number (e.g. 1 for ControlSet001)
     * @param err NoCurrentControlSet on failure
     */
    [[nodiscard]] bool CurrentControlSet(uint32_t& out, Error* err = nullptr) const;

    /**
     * @brief Concatenate the four LSA class names as hex text
     * @param out 32 hex characters for a well-formed hive
     * @param err NoCurrentControlSet or KeyNotFound on failure
     */
    [[nodiscard]] bool ReadScrambledKey(std::string& out, Error* err = nullptr) const;

    /**
     * @brief Full derivation: read, hex-decode and descramble
     * @param err Any of the errors above, or MalformedKey
     */
    [[nodiscard]] bool Derive(BootKey& out, Error* err = nullptr) const;

    /**
     * @brief Hex-decode and descramble a 32-character class name concatenation
     * @param err MalformedKey when the text is not exactly 16 bytes of hex
     */
    [[nodiscard]] static bool Descramble(std::string_view scrambledHex, BootKey& out,
                                         Error* err = nullptr) noexcept;

private:
    const Registry::Hive& m_system;
};

}  // namespace Credentials
}  // namespace SamAudit
