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

#include "Credentials/HashDecryptor.hpp"
#include "Support/SamFixtures.hpp"

using namespace SamAudit::Credentials;
using namespace SamAudit::Testing;

namespace {

    const std::vector<uint8_t> kAdminRid = { 0xF4, 0x01, 0x00, 0x00 };

}  // namespace

TEST(HashDecryptorTest, RidBytesAreLittleEndian) {
    EXPECT_EQ(HashDecryptor::RidToBytes(0x1F4), kAdminRid);
    EXPECT_EQ(HashDecryptor::RidToBytes(0x3E9), (std::vector<uint8_t>{ 0xE9, 0x03, 0x00, 0x00 }));
}

TEST(HashDecryptorTest, DerivesRidKeys) {
    RidKeys keys;
    ASSERT_TRUE(HashDecryptor::DeriveRIDKeys(kAdminRid, keys));
    EXPECT_EQ(std::vector<uint8_t>(keys.key1.begin(), keys.key1.end()), Hex("f40040000ea00400"));
    EXPECT_EQ(std::vector<uint8_t>(keys.key2.begin(), keys.key2.end()), Hex("007a00200006d002"));

    ASSERT_TRUE(HashDecryptor::DeriveRIDKeys(HashDecryptor::RidToBytes(0x3E9), keys));
    EXPECT_EQ(std::vector<uint8_t>(keys.key1.begin(), keys.key1.end()), Hex("e880c0000e480c00"));
    EXPECT_EQ(std::vector<uint8_t>(keys.key2.begin(), keys.key2.end()), Hex("007440600006a406"));
}

TEST(HashDecryptorTest, TransformRidClearsLowBit) {
    const auto out = HashDecryptor::TransformRID({ 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF });
    for (const uint8_t b : out) {
        EXPECT_EQ(b, 0xFE);
    }
}

class HashDecryptorRidSizeTest : public ::testing::TestWithParam<size_t> {};

TEST_P(HashDecryptorRidSizeTest, RejectsRidsThatAreNotFourBytes) {
    const std::vector<uint8_t> rid(GetParam(), 0x01);
    RidKeys keys;
    Error err;
    EXPECT_FALSE(HashDecryptor::DeriveRIDKeys(rid, keys, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidRIDSize);

    std::vector<uint8_t> out;
    err.Clear();
    EXPECT_FALSE(HashDecryptor::DecryptRC4Hash(rid, Hex(Fixtures::DERIVED_KEY_RC4_HEX),
                                               Hex(Fixtures::ADMIN_NT_RC4_ENC), HashKind::NT, out, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidRIDSize);

    err.Clear();
    EXPECT_FALSE(HashDecryptor::DecryptAESHash(rid, Hex(Fixtures::DERIVED_KEY_AES_HEX),
                                               Hex(Fixtures::ADMIN_NT_AES_ENC), Hex(Fixtures::ADMIN_NT_AES_IV),
                                               out, &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidRIDSize);
}

INSTANTIATE_TEST_SUITE_P(Sizes, HashDecryptorRidSizeTest, ::testing::Values(0u, 1u, 3u, 5u, 8u));

TEST(HashDecryptorTest, Rc4NtKnownAnswer) {
    std::vector<uint8_t> out;
    Error err;
    ASSERT_TRUE(HashDecryptor::DecryptRC4Hash(kAdminRid, Hex(Fixtures::DERIVED_KEY_RC4_HEX),
                                              Hex(Fixtures::ADMIN_NT_RC4_ENC), HashKind::NT, out, &err));
    EXPECT_EQ(out, Hex(Fixtures::ADMIN_NT_HEX));

    std::vector<uint8_t> again;
    ASSERT_TRUE(HashDecryptor::DecryptRC4Hash(kAdminRid, Hex(Fixtures::DERIVED_KEY_RC4_HEX),
                                              Hex(Fixtures::ADMIN_NT_RC4_ENC), HashKind::NT, again, &err));
    EXPECT_EQ(again, out);
}

TEST(HashDecryptorTest, Rc4LmUsesLmConstant) {
    const auto rid = HashDecryptor::RidToBytes(Fixtures::ALICE_RID);
    const auto key = Hex(Fixtures::DERIVED_KEY_RC4_HEX);
    std::vector<uint8_t> lm;
    ASSERT_TRUE(HashDecryptor::DecryptRC4Hash(rid, key, Hex(Fixtures::ALICE_LM_RC4_ENC), HashKind::LM, lm));
    EXPECT_EQ(lm, Hex(Fixtures::ALICE_LM_HEX));

    std::vector<uint8_t> wrongKind;
    ASSERT_TRUE(HashDecryptor::DecryptRC4Hash(rid, key, Hex(Fixtures::ALICE_LM_RC4_ENC), HashKind::NT, wrongKind));
    EXPECT_NE(wrongKind, lm);
}

TEST(HashDecryptorTest, AesNtKnownAnswer) {
    std::vector<uint8_t> out;
    Error err;
    ASSERT_TRUE(HashDecryptor::DecryptAESHash(kAdminRid, Hex(Fixtures::DERIVED_KEY_AES_HEX),
                                              Hex(Fixtures::ADMIN_NT_AES_ENC), Hex(Fixtures::ADMIN_NT_AES_IV),
                                              out, &err));
    EXPECT_EQ(out, Hex(Fixtures::ADMIN_NT_HEX));
    EXPECT_EQ(out.size(), 16u);

    // Same input twice gives the same answer
    std::vector<uint8_t> again;
    ASSERT_TRUE(HashDecryptor::DecryptAESHash(kAdminRid, Hex(Fixtures::DERIVED_KEY_AES_HEX),
                                              Hex(Fixtures::ADMIN_NT_AES_ENC), Hex(Fixtures::ADMIN_NT_AES_IV),
                                              again, &err));
    EXPECT_EQ(again, out);
}

TEST(HashDecryptorTest, AesEmptyInputIsEmptyOutput) {
    std::vector<uint8_t> out{ 1, 2, 3 };
    ASSERT_TRUE(HashDecryptor::DecryptAESHash(kAdminRid, Hex(Fixtures::DERIVED_KEY_AES_HEX), {},
                                              Hex(Fixtures::ADMIN_NT_AES_IV), out));
    EXPECT_TRUE(out.empty());
}

TEST(HashDecryptorTest, AesRejectsMisalignedInput) {
    auto enc = Hex(Fixtures::ADMIN_NT_AES_ENC);
    enc.pop_back();
    std::vector<uint8_t> out;
    Error err;
    EXPECT_FALSE(HashDecryptor::DecryptAESHash(kAdminRid, Hex(Fixtures::DERIVED_KEY_AES_HEX), enc,
                                               Hex(Fixtures::ADMIN_NT_AES_IV), out, &err));
    EXPECT_EQ(err.code, ErrorCode::BlockAlignment);
}

TEST(HashDecryptorTest, RejectsMalformedKeysAndBlobs) {
    std::vector<uint8_t> out;
    Error err;
    EXPECT_FALSE(HashDecryptor::DecryptRC4Hash(kAdminRid, Hex("0011"), Hex(Fixtures::ADMIN_NT_RC4_ENC),
                                               HashKind::NT, out, &err));
    EXPECT_EQ(err.code, ErrorCode::MalformedKey);

    err.Clear();
    EXPECT_FALSE(HashDecryptor::DecryptRC4Hash(kAdminRid, Hex(Fixtures::DERIVED_KEY_RC4_HEX), Hex("00112233"),
                                               HashKind::NT, out, &err));
    EXPECT_EQ(err.code, ErrorCode::MalformedKey);

    err.Clear();
    EXPECT_FALSE(HashDecryptor::DecryptAESHash(kAdminRid, Hex("0011"), Hex(Fixtures::ADMIN_NT_AES_ENC),
                                               Hex(Fixtures::ADMIN_NT_AES_IV), out, &err));
    EXPECT_EQ(err.code, ErrorCode::MalformedKey);

    err.Clear();
    EXPECT_FALSE(HashDecryptor::DecryptAESHash(kAdminRid, Hex(Fixtures::DERIVED_KEY_AES_HEX),
                                               Hex(Fixtures::ADMIN_NT_AES_ENC), Hex("0011"), out, &err));
    EXPECT_EQ(err.code, ErrorCode::MalformedKey);
}

TEST(HashDecryptorTest, DecryptDispatchesOnAlgorithm) {
    EncryptedHash rc4;
    rc4.algorithm = HashAlgorithm::RC4;
    rc4.data = Hex(Fixtures::ALICE_NT_RC4_ENC);
    const auto rid = HashDecryptor::RidToBytes(Fixtures::ALICE_RID);

    std::vector<uint8_t> out;
    ASSERT_TRUE(HashDecryptor::Decrypt(rid, Hex(Fixtures::DERIVED_KEY_RC4_HEX), rc4, HashKind::NT, out));
    EXPECT_EQ(out, Hex(Fixtures::ALICE_NT_HEX));

    EncryptedHash aes;
    aes.algorithm = HashAlgorithm::AES;
    aes.iv = Hex(Fixtures::ALICE_NT_AES_IV);
    aes.data = Hex(Fixtures::ALICE_NT_AES_ENC);
    ASSERT_TRUE(HashDecryptor::Decrypt(rid, Hex(Fixtures::DERIVED_KEY_AES_HEX), aes, HashKind::NT, out));
    EXPECT_EQ(out, Hex(Fixtures::ALICE_NT_HEX));

    ASSERT_TRUE(HashDecryptor::Decrypt(rid, Hex(Fixtures::DERIVED_KEY_AES_HEX), EncryptedHash{}, HashKind::LM, out));
    EXPECT_TRUE(out.empty());
}
