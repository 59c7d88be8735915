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

#include "Credentials/SyskeyDeriver.hpp"
#include "Support/FakeHive.hpp"
#include "Support/SamFixtures.hpp"

using namespace SamAudit::Credentials;
using namespace SamAudit::Testing;

namespace {

    BootKey FixtureBootKey() {
        BootKey key{};
        const auto bytes = Hex(Fixtures::BOOT_KEY_HEX);
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return key;
    }

}  // namespace

TEST(SyskeyDeriverTest, Revision1Rc4) {
    DerivedKey key;
    Error err;
    ASSERT_TRUE(SyskeyDeriver::FromDomainF(Fixtures::DomainF(Fixtures::Revision::RC4), FixtureBootKey(), key, &err));
    EXPECT_EQ(key, Hex(Fixtures::DERIVED_KEY_RC4_HEX));
}

TEST(SyskeyDeriverTest, Revision2Aes) {
    DerivedKey key;
    Error err;
    ASSERT_TRUE(SyskeyDeriver::FromDomainF(Fixtures::DomainF(Fixtures::Revision::AES), FixtureBootKey(), key, &err));
    EXPECT_EQ(key, Hex(Fixtures::DERIVED_KEY_AES_HEX));
}

TEST(SyskeyDeriverTest, WrongBootKeyFailsVerifier) {
    BootKey wrong = FixtureBootKey();
    wrong[0] ^= 0x01;
    DerivedKey key;
    Error err;
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(Fixtures::DomainF(Fixtures::Revision::RC4), wrong, key, &err));
    EXPECT_EQ(err.code, ErrorCode::VerifierMismatch);
    EXPECT_TRUE(key.empty());
}

TEST(SyskeyDeriverTest, UnknownRevision) {
    auto f = Fixtures::DomainF(Fixtures::Revision::RC4);
    f[0x68] = 3;
    uint32_t revision = 0;
    ASSERT_TRUE(SyskeyDeriver::Revision(f, revision));
    EXPECT_EQ(revision, 3u);

    DerivedKey key;
    Error err;
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(f, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::UnsupportedRevision);
    EXPECT_EQ(err.context, L"revision 3");
}

TEST(SyskeyDeriverTest, TruncatedDomainF) {
    DerivedKey key;
    Error err;
    const std::vector<uint8_t> tiny(0x40, 0);
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(tiny, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::DomainFTooShort);

    auto rc4 = Fixtures::DomainF(Fixtures::Revision::RC4);
    rc4.resize(0x68 + 0x20);
    err.Clear();
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(rc4, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::DomainFTooShort);

    auto aes = Fixtures::DomainF(Fixtures::Revision::AES);
    aes.resize(aes.size() - 8);
    err.Clear();
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(aes, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::DomainFTooShort);
}

TEST(SyskeyDeriverTest, AesDataLengthMustBeBlockAligned) {
    auto f = Fixtures::DomainF(Fixtures::Revision::AES);
    PutU32(f, 0x68 + 0x0C, 0x18);
    DerivedKey key;
    Error err;
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(f, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::BlockAlignment);

    PutU32(f, 0x68 + 0x0C, 0);
    err.Clear();
    EXPECT_FALSE(SyskeyDeriver::FromDomainF(f, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::BlockAlignment);
}

TEST(SyskeyDeriverTest, ReadsDomainFromHive) {
    FakeHive sam;
    Fixtures::PopulateDomain(sam, Fixtures::Revision::AES);
    DerivedKey key;
    Error err;
    ASSERT_TRUE(SyskeyDeriver::Derive(sam, FixtureBootKey(), key, &err));
    EXPECT_EQ(key, Hex(Fixtures::DERIVED_KEY_AES_HEX));
}

TEST(SyskeyDeriverTest, MissingDomainOrF) {
    FakeHive empty;
    DerivedKey key;
    Error err;
    EXPECT_FALSE(SyskeyDeriver::Derive(empty, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::DomainNotFound);

    FakeHive noF;
    noF.AddKey("SAM\\Domains\\Account\\Users");
    err.Clear();
    EXPECT_FALSE(SyskeyDeriver::Derive(noF, FixtureBootKey(), key, &err));
    EXPECT_EQ(err.code, ErrorCode::DomainFNotFound);
}
