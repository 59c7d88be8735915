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

#include "Credentials/SamDatabase.hpp"
#include "Support/FakeHive.hpp"
#include "Support/SamFixtures.hpp"

using namespace SamAudit::Credentials;
using namespace SamAudit::Testing;

TEST(SamDatabaseTest, ListsRidsWithoutNames) {
    FakeHive sam;
    Fixtures::PopulateSam(sam, Fixtures::Revision::RC4);
    sam.AddKey("SAM\\Domains\\Account\\Users\\NAMES");

    SamDatabase db(sam);
    std::vector<std::string> rids;
    ASSERT_TRUE(db.UserRIDs(rids));
    EXPECT_THAT(rids, ::testing::ElementsAre("000001F4", "000003E9"));
}

TEST(SamDatabaseTest, MissingUsersKey) {
    FakeHive sam;
    sam.AddKey("SAM\\Domains\\Account");
    SamDatabase db(sam);
    std::vector<std::string> rids;
    Error err;
    EXPECT_FALSE(db.UserRIDs(rids, &err));
    EXPECT_EQ(err.code, ErrorCode::KeyNotFound);
    EXPECT_TRUE(IsScanFatal(err.code));
}

TEST(SamDatabaseTest, LoadsUserRecords) {
    FakeHive sam;
    Fixtures::PopulateSam(sam, Fixtures::Revision::RC4);
    SamDatabase db(sam);

    UserF f;
    UserV v;
    ASSERT_TRUE(db.UserInfo("000003E9", f, v));
    EXPECT_TRUE(f.Enabled());
    std::string name;
    ASSERT_TRUE(v.Username(name));
    EXPECT_EQ(name, "alice");
}

TEST(SamDatabaseTest, MissingUserKeyOrValues) {
    FakeHive sam;
    Fixtures::PopulateDomain(sam, Fixtures::Revision::RC4);
    sam.SetValue("SAM\\Domains\\Account\\Users\\000003EA", "F", Fixtures::UserF(false));
    SamDatabase db(sam);

    UserF f;
    UserV v;
    Error err;
    EXPECT_FALSE(db.UserInfo("000003EB", f, v, &err));
    EXPECT_EQ(err.code, ErrorCode::UserRecordMissing);
    EXPECT_EQ(err.message, L"SAM hive: failed to load user registry for RID");
    EXPECT_EQ(err.context, L"000003EB");

    err.Clear();
    EXPECT_FALSE(db.UserInfo("000003EA", f, v, &err));
    EXPECT_EQ(err.code, ErrorCode::UserRecordMissing);
    EXPECT_EQ(err.message, L"SAM hive: failed to find V or F structures for RID");
    EXPECT_FALSE(IsScanFatal(err.code));
}

TEST(SamDatabaseTest, ParseErrorsCarryTheRid) {
    FakeHive sam;
    Fixtures::PopulateDomain(sam, Fixtures::Revision::RC4);
    sam.SetValue("SAM\\Domains\\Account\\Users\\000003EC", "F", std::vector<uint8_t>(4, 0));
    sam.SetValue("SAM\\Domains\\Account\\Users\\000003EC", "V", Fixtures::UserV("bob", {}, {}));
    SamDatabase db(sam);

    UserF f;
    UserV v;
    Error err;
    EXPECT_FALSE(db.UserInfo("000003EC", f, v, &err));
    EXPECT_EQ(err.code, ErrorCode::AccountFTooShort);
    EXPECT_EQ(err.context, L"000003EC");
}

TEST(SamDatabaseTest, DerivesDomainKey) {
    FakeHive sam;
    Fixtures::PopulateDomain(sam, Fixtures::Revision::RC4);
    SamDatabase db(sam);

    BootKey bootKey{};
    const auto bytes = Hex(Fixtures::BOOT_KEY_HEX);
    std::copy(bytes.begin(), bytes.end(), bootKey.begin());
    DerivedKey key;
    ASSERT_TRUE(db.DeriveSyskey(bootKey, key));
    EXPECT_EQ(key, Hex(Fixtures::DERIVED_KEY_RC4_HEX));
}

TEST(SamDatabaseTest, ParseRid) {
    uint32_t rid = 0;
    EXPECT_TRUE(SamDatabase::ParseRid("000001F4", rid));
    EXPECT_EQ(rid, 500u);
    EXPECT_TRUE(SamDatabase::ParseRid("3e9", rid));
    EXPECT_EQ(rid, 1001u);
    EXPECT_FALSE(SamDatabase::ParseRid("Names", rid));
    EXPECT_FALSE(SamDatabase::ParseRid("", rid));
    EXPECT_FALSE(SamDatabase::ParseRid("0000001F4", rid));
}
