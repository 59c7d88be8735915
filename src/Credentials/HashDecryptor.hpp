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
 * SamAudit Credentials - HASH DECRYPTION
 * ============================================================================
 *
 * @file HashDecryptor.hpp
 * @brief Removes the two encryption layers Windows applies to stored LM/NT
 *        hashes.
 *
 * OUTER LAYER:
 * ============
 *
 * RC4: rc4Key = MD5(DerivedKey || RID || "LMPASSWORD\0" | "NTPASSWORD\0")
 *      obf    = RC4(rc4Key, blob)
 * AES: obf    = AES-CBC-Decrypt(DerivedKey, IV, blob)[0:16]
 *
 * INNER LAYER:
 * ============
 *
 * The RID is expanded into two DES keys: seq1 = r0 r1 r2 r3 r0 r1 r2,
 * seq2 = r3 r0 r1 r2 r3 r0 r1, each spread from 56 to 64 bits. The low bit
 * of every key byte is zeroed, not set to DES odd parity; OpenSSL's
 * unchecked key schedule ignores parity, which matches what Windows does.
 *
 *   hash = DES-ECB-Decrypt(key1, obf[0:8]) || DES-ECB-Decrypt(key2, obf[8:16])
 *
 * All functions are pure. Intermediate key material is wiped before return.
 * ============================================================================
 */

#pragma once

#include "CredentialTypes.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace SamAudit {
namespace Credentials {
namespace HashDecryptor {

/// RC4 key constants, NUL included
inline constexpr char LM_PASSWORD_CONSTANT[] = "LMPASSWORD";
inline constexpr char NT_PASSWORD_CONSTANT[] = "NTPASSWORD";

/**
 * @brief Little-endian RID bytes
 */
[[nodiscard]] RidBytes RidToBytes(uint32_t rid);

/**
 * @brief Spread 7 key bytes over 8 DES key bytes, low bit of each cleared
 */
[[nodiscard]] std::array<uint8_t, 8> TransformRID(const std::array<uint8_t, 7>& in) noexcept;

/**
 * @brief Derive the DES key pair for a RID
 * @param rid 4 little-endian bytes
 * @param err InvalidRIDSize for any other length
 */
[[nodiscard]] bool DeriveRIDKeys(std::span<const uint8_t> rid, RidKeys& out,
                                 Error* err = nullptr) noexcept;

/**
 * @brief Inner DES layer over a 16-byte obfuscated hash
 * @param err InvalidRIDSize, or MalformedKey when data is not 16 bytes
 */
[[nodiscard]] bool DecryptDES(std::span<const uint8_t> rid, std::span<const uint8_t> data,
                              std::vector<uint8_t>& out, Error* err = nullptr);

/**
 * @brief Legacy RC4 outer layer followed by the DES layer
 * @param derivedKey 16-byte domain key
 * @param encrypted 16-byte cipher text
 * @param err InvalidRIDSize, MalformedKey or CryptoFailure
 */
[[nodiscard]] bool DecryptRC4Hash(std::span<const uint8_t> rid, std::span<const uint8_t> derivedKey,
                                  std::span<const uint8_t> encrypted, HashKind kind,
                                  std::vector<uint8_t>& out, Error* err = nullptr);

/**
 * @brief AES-CBC outer layer followed by the DES layer
 *
 * An empty blob yields an empty result and no error.
 *
 * @param derivedKey 16, 24 or 32 bytes (selects AES-128/192/256)
 * @param iv 16 bytes
 * @param err BlockAlignment, InvalidRIDSize, MalformedKey or CryptoFailure
 */
[[nodiscard]] bool DecryptAESHash(std::span<const uint8_t> rid, std::span<const uint8_t> derivedKey,
                                  std::span<const uint8_t> encrypted, std::span<const uint8_t> iv,
                                  std::vector<uint8_t>& out, Error* err = nullptr);

/**
 * @brief Decrypt a V-record hash, selecting the path from blob.algorithm
 *
 * An absent hash yields an empty result and no error.
 */
[[nodiscard]] bool Decrypt(std::span<const uint8_t> rid, std::span<const uint8_t> derivedKey,
                           const EncryptedHash& blob, HashKind kind,
                           std::vector<uint8_t>& out, Error* err = nullptr);

}  // namespace HashDecryptor
}  // namespace Credentials
}  // namespace SamAudit
