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

#include "Utils/CryptoUtils.hpp"
#include "Utils/HashUtils.hpp"
#include "Support/TestBytes.hpp"

using namespace SamAudit::Utils;
using SamAudit::Testing::Hex;

// ============================================================================
// HashUtils
// ============================================================================

TEST(HashUtilsTest, KnownDigests) {
    std::vector<uint8_t> digest;
    ASSERT_TRUE(HashUtils::Compute(HashUtils::Algorithm::MD5, "", 0, digest));
    EXPECT_EQ(HashUtils::ToHexLower(digest), "d41d8cd98f00b204e9800998ecf8427e");

    ASSERT_TRUE(HashUtils::Compute(HashUtils::Algorithm::MD5, "abc", 3, digest));
    EXPECT_EQ(HashUtils::ToHexLower(digest), "900150983cd24fb0d6963f7d28e17f72");

    std::string hex;
    ASSERT_TRUE(HashUtils::ComputeHex(HashUtils::Algorithm::SHA256, "abc", 3, hex));
    EXPECT_EQ(hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, IncrementalMatchesOneShot) {
    HashUtils::Hasher h(HashUtils::Algorithm::MD5);
    ASSERT_TRUE(h.Init());
    ASSERT_TRUE(h.Update("a", 1));
    ASSERT_TRUE(h.Update("bc", 2));
    std::string hex;
    ASSERT_TRUE(h.FinalHex(hex, true));
    EXPECT_EQ(hex, "900150983CD24FB0D6963F7D28E17F72");
    EXPECT_EQ(h.GetDigestSize(), 16u);
}

TEST(HashUtilsTest, HexDecodeRejectsBadInput) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(HashUtils::FromHex("00aAfF", out));
    EXPECT_EQ(out, (std::vector<uint8_t>{ 0x00, 0xAA, 0xFF }));
    EXPECT_FALSE(HashUtils::FromHex("abc", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(HashUtils::FromHex("zz", out));
}

TEST(HashUtilsTest, ComputeFileMissingPathFails) {
    std::vector<uint8_t> out;
    HashUtils::Error err;
    EXPECT_FALSE(HashUtils::ComputeFile(HashUtils::Algorithm::SHA256,
                                        std::filesystem::temp_directory_path() / "samaudit_no_such_file.bin",
                                        out, &err));
    EXPECT_TRUE(err.hasError());
}

// ============================================================================
// CryptoUtils
// ============================================================================

TEST(CryptoUtilsTest, Rc4KnownAnswer) {
    const std::string key = "Key";
    const std::string text = "Plaintext";
    std::vector<uint8_t> out;
    ASSERT_TRUE(CryptoUtils::Rc4Transform(reinterpret_cast<const uint8_t*>(key.data()), key.size(),
                                          reinterpret_cast<const uint8_t*>(text.data()), text.size(), out));
    EXPECT_EQ(out, Hex("bbf316e8d940af0ad3"));
}

TEST(CryptoUtilsTest, Rc4RejectsEmptyKey) {
    std::vector<uint8_t> out;
    CryptoUtils::Error err;
    const uint8_t data[1] = { 0 };
    EXPECT_FALSE(CryptoUtils::Rc4Transform(data, 0, data, 1, out, &err));
    EXPECT_TRUE(err.HasError());
}

TEST(CryptoUtilsTest, DesKnownAnswer) {
    std::array<uint8_t, CryptoUtils::DES_BLOCK_SIZE> key{};
    const auto k = Hex("133457799BBCDFF1");
    std::copy(k.begin(), k.end(), key.begin());
    const auto cipher = Hex("85E813540F0AB405");

    uint8_t plain[8] = {};
    CryptoUtils::DesEcbDecryptBlock(key, cipher.data(), plain);
    EXPECT_EQ(std::vector<uint8_t>(plain, plain + 8), Hex("0123456789ABCDEF"));
}

TEST(CryptoUtilsTest, AesCbcNoPaddingKnownAnswer) {
    CryptoUtils::SymmetricCipher cipher(CryptoUtils::SymmetricAlgorithm::AES_128_CBC);
    cipher.SetPaddingMode(CryptoUtils::PaddingMode::None);
    ASSERT_TRUE(cipher.SetKey(Hex("2b7e151628aed2a6abf7158809cf4f3c")));
    ASSERT_TRUE(cipher.SetIV(Hex("000102030405060708090a0b0c0d0e0f")));

    const auto ct = Hex("7649abac8119b246cee98e9b12e9197d");
    std::vector<uint8_t> pt;
    ASSERT_TRUE(cipher.Decrypt(ct.data(), ct.size(), pt));
    EXPECT_EQ(pt, Hex("6bc1bee22e409f96e93d7e117393172a"));

    std::vector<uint8_t> again;
    ASSERT_TRUE(cipher.Encrypt(pt.data(), pt.size(), again));
    EXPECT_EQ(again, ct);
}

TEST(CryptoUtilsTest, AesRejectsWrongKeyLength) {
    CryptoUtils::SymmetricCipher cipher(CryptoUtils::SymmetricAlgorithm::AES_128_CBC);
    CryptoUtils::Error err;
    EXPECT_FALSE(cipher.SetKey(Hex("0011"), &err));
    EXPECT_TRUE(err.HasError());

    CryptoUtils::SymmetricAlgorithm alg{};
    EXPECT_TRUE(CryptoUtils::AesCbcForKeySize(32, alg));
    EXPECT_EQ(alg, CryptoUtils::SymmetricAlgorithm::AES_256_CBC);
    EXPECT_FALSE(CryptoUtils::AesCbcForKeySize(15, alg));
}

TEST(CryptoUtilsTest, SecureCompare) {
    const uint8_t a[4] = { 1, 2, 3, 4 };
    const uint8_t b[4] = { 1, 2, 3, 5 };
    EXPECT_TRUE(CryptoUtils::SecureCompare(a, a, 4));
    EXPECT_FALSE(CryptoUtils::SecureCompare(a, b, 4));
}
