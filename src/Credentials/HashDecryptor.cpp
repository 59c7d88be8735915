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
#include "HashDecryptor.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/HashUtils.hpp"

namespace SamAudit {
namespace Credentials {
namespace HashDecryptor {

namespace Crypto = Utils::CryptoUtils;
namespace Hash = Utils::HashUtils;

using CredentialConstants::HASH_SIZE;
using CredentialConstants::RID_SIZE;

namespace {

    bool RidSizeError(Error* err, size_t size) noexcept {
        wchar_t ctx[32] = {};
        std::swprintf(ctx, 32, L"%zu bytes", size);
        return Fail(err, ErrorCode::InvalidRIDSize, L"RID must be exactly 4 bytes", ctx);
    }

    void Wipe(std::vector<uint8_t>& v) noexcept {
        Crypto::SecureZeroMemory(v.data(), v.size());
    }

}  // namespace

RidBytes RidToBytes(uint32_t rid) {
    return RidBytes{
        static_cast<uint8_t>(rid & 0xFF),
        static_cast<uint8_t>((rid >> 8) & 0xFF),
        static_cast<uint8_t>((rid >> 16) & 0xFF),
        static_cast<uint8_t>((rid >> 24) & 0xFF)
    };
}

std::array<uint8_t, 8> TransformRID(const std::array<uint8_t, 7>& in) noexcept {
    std::array<uint8_t, 8> out{};
    out[0] = static_cast<uint8_t>(in[0] >> 1);
    out[1] = static_cast<uint8_t>(((in[0] & 0x01) << 6) | (in[1] >> 2));
    out[2] = static_cast<uint8_t>(((in[1] & 0x03) << 5) | (in[2] >> 3));
    out[3] = static_cast<uint8_t>(((in[2] & 0x07) << 4) | (in[3] >> 4));
    out[4] = static_cast<uint8_t>(((in[3] & 0x0F) << 3) | (in[4] >> 5));
    out[5] = static_cast<uint8_t>(((in[4] & 0x1F) << 2) | (in[5] >> 6));
    out[6] = static_cast<uint8_t>(((in[5] & 0x3F) << 1) | (in[6] >> 7));
    out[7] = static_cast<uint8_t>(in[6] & 0x7F);
    for (auto& b : out) {
        b = static_cast<uint8_t>((b << 1) & 0xFE);
    }
    return out;
}

bool DeriveRIDKeys(std::span<const uint8_t> rid, RidKeys& out, Error* err) noexcept {
    if (rid.size() != RID_SIZE) {
        return RidSizeError(err, rid.size());
    }
    const std::array<uint8_t, 7> seq1 = { rid[0], rid[1], rid[2], rid[3], rid[0], rid[1], rid[2] };
    const std::array<uint8_t, 7> seq2 = { rid[3], rid[0], rid[1], rid[2], rid[3], rid[0], rid[1] };
    out.key1 = TransformRID(seq1);
    out.key2 = TransformRID(seq2);
    return true;
}

bool DecryptDES(std::span<const uint8_t> rid, std::span<const uint8_t> data,
                std::vector<uint8_t>& out, Error* err) {
    RidKeys keys;
    if (!DeriveRIDKeys(rid, keys, err)) return false;
    if (data.size() != HASH_SIZE) {
        return Fail(err, ErrorCode::MalformedKey, L"DES layer input must be 16 bytes");
    }

    std::vector<uint8_t> plain(HASH_SIZE);
    Crypto::DesEcbDecryptBlock(keys.key1, data.data(), plain.data());
    Crypto::DesEcbDecryptBlock(keys.key2, data.data() + Crypto::DES_BLOCK_SIZE,
                               plain.data() + Crypto::DES_BLOCK_SIZE);
    Crypto::SecureZeroMemory(&keys, sizeof(keys));
    out = std::move(plain);
    return true;
}

bool DecryptRC4Hash(std::span<const uint8_t> rid, std::span<const uint8_t> derivedKey,
                    std::span<const uint8_t> encrypted, HashKind kind,
                    std::vector<uint8_t>& out, Error* err) {
    if (rid.size() != RID_SIZE) {
        return RidSizeError(err, rid.size());
    }
    if (derivedKey.size() != CredentialConstants::DERIVED_KEY_SIZE) {
        return Fail(err, ErrorCode::MalformedKey, L"RC4 path requires a 16-byte derived key");
    }
    if (encrypted.size() != HASH_SIZE) {
        return Fail(err, ErrorCode::MalformedKey, L"RC4 hash blob must hold 16 bytes");
    }

    const char* constant = kind == HashKind::LM ? LM_PASSWORD_CONSTANT : NT_PASSWORD_CONSTANT;
    const size_t constantLen = kind == HashKind::LM ? sizeof(LM_PASSWORD_CONSTANT)
                                                    : sizeof(NT_PASSWORD_CONSTANT);

    Hash::Error herr;
    Hash::Hasher md5(Hash::Algorithm::MD5);
    std::vector<uint8_t> rc4Key;
    if (!md5.Init(&herr) ||
        !md5.Update(derivedKey.data(), derivedKey.size(), &herr) ||
        !md5.Update(rid.data(), rid.size(), &herr) ||
        !md5.Update(constant, constantLen, &herr) ||
        !md5.Final(rc4Key, &herr)) {
        return Fail(err, ErrorCode::CryptoFailure, L"MD5 failed deriving hash RC4 key", herr.message);
    }

    Crypto::Error cerr;
    std::vector<uint8_t> obfuscated;
    const bool ok = Crypto::Rc4Transform(rc4Key.data(), rc4Key.size(), encrypted.data(),
                                         encrypted.size(), obfuscated, &cerr);
    Wipe(rc4Key);
    if (!ok) {
        return Fail(err, ErrorCode::CryptoFailure, L"RC4 failed decrypting hash", cerr.message);
    }

    const bool desOk = DecryptDES(rid, obfuscated, out, err);
    Wipe(obfuscated);
    return desOk;
}

bool DecryptAESHash(std::span<const uint8_t> rid, std::span<const uint8_t> derivedKey,
                    std::span<const uint8_t> encrypted, std::span<const uint8_t> iv,
                    std::vector<uint8_t>& out, Error* err) {
    if (encrypted.empty()) {
        out.clear();
        return true;
    }
    if (encrypted.size() % Crypto::AES_BLOCK_SIZE != 0) {
        wchar_t ctx[32] = {};
        std::swprintf(ctx, 32, L"%zu bytes", encrypted.size());
        return Fail(err, ErrorCode::BlockAlignment, L"AES hash blob is not block aligned", ctx);
    }
    if (rid.size() != RID_SIZE) {
        return RidSizeError(err, rid.size());
    }

    Crypto::SymmetricAlgorithm algorithm;
    if (!Crypto::AesCbcForKeySize(derivedKey.size(), algorithm)) {
        return Fail(err, ErrorCode::MalformedKey, L"Derived key must be 16, 24 or 32 bytes for AES");
    }
    if (iv.size() != Crypto::AES_BLOCK_SIZE) {
        return Fail(err, ErrorCode::MalformedKey, L"AES IV must be 16 bytes");
    }

    Crypto::Error cerr;
    Crypto::SymmetricCipher aes(algorithm);
    aes.SetPaddingMode(Crypto::PaddingMode::None);
    std::vector<uint8_t> plain;
    if (!aes.SetKey(derivedKey.data(), derivedKey.size(), &cerr) ||
        !aes.SetIV(iv.data(), iv.size(), &cerr) ||
        !aes.Decrypt(encrypted.data(), encrypted.size(), plain, &cerr)) {
        Wipe(plain);
        return Fail(err, ErrorCode::CryptoFailure, L"AES failed decrypting hash", cerr.message);
    }

    // Bytes past the first 16 are CBC padding.
    const bool ok = DecryptDES(rid, std::span<const uint8_t>(plain.data(), HASH_SIZE), out, err);
    Wipe(plain);
    return ok;
}

bool Decrypt(std::span<const uint8_t> rid, std::span<const uint8_t> derivedKey,
             const EncryptedHash& blob, HashKind kind,
             std::vector<uint8_t>& out, Error* err) {
    if (!blob.Present()) {
        out.clear();
        return true;
    }
    switch (blob.algorithm) {
        case HashAlgorithm::RC4:
            return DecryptRC4Hash(rid, derivedKey, blob.data, kind, out, err);
        case HashAlgorithm::AES:
            return DecryptAESHash(rid, derivedKey, blob.data, blob.iv, out, err);
    }
    return Fail(err, ErrorCode::CryptoFailure, L"Unknown hash algorithm");
}

}  // namespace HashDecryptor
}  // namespace Credentials
}  // namespace SamAudit
