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
#include "SyskeyDeriver.hpp"

#include "../Utils/CryptoUtils.hpp"
#include "../Utils/HashUtils.hpp"
#include "../Utils/Logger.hpp"

namespace SamAudit {
namespace Credentials {

namespace {

    // Revision 1 layout, relative to DOMAIN_KEY_OFFSET
    constexpr size_t RC4_SALT = 0x08;
    constexpr size_t RC4_KEY = 0x18;
    constexpr size_t RC4_CHECKSUM = 0x28;
    constexpr size_t RC4_END = 0x38;

    // Revision 2 layout, relative to DOMAIN_KEY_OFFSET
    constexpr size_t AES_DATA_LENGTH = 0x0C;
    constexpr size_t AES_SALT = 0x10;
    constexpr size_t AES_DATA = 0x20;

    [[nodiscard]] uint32_t ReadU32(const uint8_t* p) noexcept {
        return static_cast<uint32_t>(p[0]) |
               (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) |
               (static_cast<uint32_t>(p[3]) << 24);
    }

    /// Wipes a buffer on scope exit
    class ScopedWipe {
    public:
        explicit ScopedWipe(std::vector<uint8_t>& buf) noexcept : m_buf(buf) {}
        ~ScopedWipe() { Utils::CryptoUtils::SecureZeroMemory(m_buf.data(), m_buf.size()); }
        ScopedWipe(const ScopedWipe&) = delete;
        ScopedWipe& operator=(const ScopedWipe&) = delete;
    private:
        std::vector<uint8_t>& m_buf;
    };

}  // namespace

bool SyskeyDeriver::Derive(const Registry::Hive& samHive, const BootKey& bootKey,
                           DerivedKey& out, Error* err) {
    Registry::Error rerr;
    auto domain = samHive.OpenKey(SAM_ACCOUNT_DOMAIN_PATH, &rerr);
    if (!domain) {
        return Fail(err, ErrorCode::DomainNotFound, L"SAM hive: failed to open account domain",
                    rerr.context);
    }

    Registry::HiveValue f;
    if (!domain->GetValue("F", f, &rerr)) {
        return Fail(err, ErrorCode::DomainFNotFound, L"SAM hive: account domain has no F value",
                    rerr.message);
    }
    ScopedWipe wipe(f.data);
    return FromDomainF(f.data, bootKey, out, err);
}

bool SyskeyDeriver::Revision(std::span<const uint8_t> domainF, uint32_t& out, Error* err) noexcept {
    if (domainF.size() < DOMAIN_KEY_OFFSET + 4) {
        return Fail(err, ErrorCode::DomainFTooShort, L"Domain F too short for key revision");
    }
    out = ReadU32(domainF.data() + DOMAIN_KEY_OFFSET);
    return true;
}

bool SyskeyDeriver::FromDomainF(std::span<const uint8_t> domainF, const BootKey& bootKey,
                                DerivedKey& out, Error* err) noexcept {
    uint32_t revision = 0;
    if (!Revision(domainF, revision, err)) return false;

    switch (revision) {
        case DOMAIN_KEY_REVISION_RC4:
            SA_LOG_DEBUG(L"Syskey", L"Domain key revision 1 (RC4)");
            return DeriveRc4(domainF, bootKey, out, err);
        case DOMAIN_KEY_REVISION_AES:
            SA_LOG_DEBUG(L"Syskey", L"Domain key revision 2 (AES)");
            return DeriveAes(domainF, bootKey, out, err);
        default:
            break;
    }

    wchar_t ctx[32] = {};
    std::swprintf(ctx, 32, L"revision %u", revision);
    return Fail(err, ErrorCode::UnsupportedRevision, L"Unsupported domain key revision", ctx);
}

bool SyskeyDeriver::DeriveRc4(std::span<const uint8_t> domainF, const BootKey& bootKey,
                              DerivedKey& out, Error* err) noexcept {
    namespace Hash = Utils::HashUtils;
    namespace Crypto = Utils::CryptoUtils;

    if (domainF.size() < DOMAIN_KEY_OFFSET + RC4_END) {
        return Fail(err, ErrorCode::DomainFTooShort, L"Domain F too short for revision 1 key");
    }
    const uint8_t* key = domainF.data() + DOMAIN_KEY_OFFSET;

    Hash::Error herr;
    Hash::Hasher md5(Hash::Algorithm::MD5);
    std::vector<uint8_t> rc4Key;
    ScopedWipe wipeRc4Key(rc4Key);
    if (!md5.Init(&herr) ||
        !md5.Update(key + RC4_SALT, 16, &herr) ||
        !md5.Update(SAM_QWERTY, sizeof(SAM_QWERTY), &herr) ||
        !md5.Update(bootKey.data(), bootKey.size(), &herr) ||
        !md5.Update(SAM_DIGITS, sizeof(SAM_DIGITS), &herr) ||
        !md5.Final(rc4Key, &herr)) {
        return Fail(err, ErrorCode::CryptoFailure, L"MD5 failed deriving RC4 key", herr.message);
    }

    Crypto::Error cerr;
    std::vector<uint8_t> dec;
    ScopedWipe wipeDec(dec);
    if (!Crypto::Rc4Transform(rc4Key.data(), rc4Key.size(), key + RC4_KEY, RC4_END - RC4_KEY, dec, &cerr)) {
        return Fail(err, ErrorCode::CryptoFailure, L"RC4 failed decrypting domain key", cerr.message);
    }

    std::vector<uint8_t> check;
    if (!md5.Init(&herr) ||
        !md5.Update(dec.data(), 16, &herr) ||
        !md5.Update(SAM_DIGITS, sizeof(SAM_DIGITS), &herr) ||
        !md5.Update(dec.data(), 16, &herr) ||
        !md5.Update(SAM_QWERTY, sizeof(SAM_QWERTY), &herr) ||
        !md5.Final(check, &herr)) {
        return Fail(err, ErrorCode::CryptoFailure, L"MD5 failed verifying domain key", herr.message);
    }

    if (check.size() != 16 || !Hash::Equal(check.data(), dec.data() + 16, 16)) {
        return Fail(err, ErrorCode::VerifierMismatch,
                    L"Domain key checksum mismatch (wrong bootkey or corrupt SAM)");
    }

    try {
        out.assign(dec.begin(), dec.begin() + CredentialConstants::DERIVED_KEY_SIZE);
    }
    catch (const std::bad_alloc&) {
        return Fail(err, ErrorCode::CryptoFailure, L"Out of memory");
    }
    return true;
}

bool SyskeyDeriver::DeriveAes(std::span<const uint8_t> domainF, const BootKey& bootKey,
                              DerivedKey& out, Error* err) noexcept {
    namespace Crypto = Utils::CryptoUtils;

    if (domainF.size() < DOMAIN_KEY_OFFSET + AES_DATA) {
        return Fail(err, ErrorCode::DomainFTooShort, L"Domain F too short for revision 2 key");
    }
    const uint8_t* key = domainF.data() + DOMAIN_KEY_OFFSET;
    const uint32_t dataLength = ReadU32(key + AES_DATA_LENGTH);

    if (dataLength == 0 || dataLength % Crypto::AES_BLOCK_SIZE != 0) {
        return Fail(err, ErrorCode::BlockAlignment, L"Domain key data is not AES block aligned");
    }
    if (domainF.size() - DOMAIN_KEY_OFFSET - AES_DATA < dataLength) {
        return Fail(err, ErrorCode::DomainFTooShort, L"Domain F too short for revision 2 key data");
    }

    Crypto::Error cerr;
    Crypto::SymmetricCipher aes(Crypto::SymmetricAlgorithm::AES_128_CBC);
    aes.SetPaddingMode(Crypto::PaddingMode::None);
    std::vector<uint8_t> plain;
    ScopedWipe wipePlain(plain);
    if (!aes.SetKey(bootKey.data(), bootKey.size(), &cerr) ||
        !aes.SetIV(key + AES_SALT, Crypto::AES_BLOCK_SIZE, &cerr) ||
        !aes.Decrypt(key + AES_DATA, dataLength, plain, &cerr)) {
        return Fail(err, ErrorCode::CryptoFailure, L"AES failed decrypting domain key", cerr.message);
    }
    if (plain.size() < CredentialConstants::DERIVED_KEY_SIZE) {
        return Fail(err, ErrorCode::MalformedKey, L"Decrypted domain key shorter than 16 bytes");
    }

    try {
        out.assign(plain.begin(), plain.begin() + CredentialConstants::DERIVED_KEY_SIZE);
    }
    catch (const std::bad_alloc&) {
        return Fail(err, ErrorCode::CryptoFailure, L"Out of memory");
    }
    return true;
}

}  // namespace Credentials
}  // namespace SamAudit
