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

#include "Credentials/UserEnumerator.hpp"
#include "Registry/HiveParser.hpp"
#include "Support/FakeHive.hpp"
#include "Support/RegfBuilder.hpp"
#include "Support/SamFixtures.hpp"
#include "Support/TestBytes.hpp"
#include "Utils/StringUtils.hpp"

using namespace SamAudit;
using namespace SamAudit::Credentials;
using namespace SamAudit::Testing;

namespace {

    const UserRecord* FindUser(const EnumerationResult& result, uint32_t rid) {
        for (const auto& entry : result.users) {
            if (const auto* record = std::get_if<UserRecord>(&entry)) {
                if (record->rid == rid) return record;
            }
        }
        return nullptr;
    }

    const UserError* FindError(const EnumerationResult& result, std::string_view ridKey) {
        for (const auto& entry : result.users) {
            if (const auto* failure = std::get_if<UserError>(&entry)) {
                if (failure->ridKey == ridKey) return failure;
            }
        }
        return nullptr;
    }

}  // namespace

class UserEnumeratorTest : public ::testing::TestWithParam<Fixtures::Revision> {
protected:
    void SetUp() override {
        Fixtures::PopulateSystem(m_system);
        Fixtures::PopulateSam(m_sam, GetParam());
    }

    FakeHive m_system;
    FakeHive m_sam;
};

TEST_P(UserEnumeratorTest, RecoversEveryHash) {
    UserEnumerator enumerator(m_sam, m_system);
    EXPECT_FALSE(enumerator.IsPrepared());

    EnumerationResult result;
    Error err;
    ASSERT_TRUE(enumerator.Enumerate({}, result, &err));
    EXPECT_TRUE(enumerator.IsPrepared());
    ASSERT_EQ(result.users.size(), 2u);
    EXPECT_EQ(result.stats.usersSeen, 2u);
    EXPECT_EQ(result.stats.usersDecoded, 2u);
    EXPECT_EQ(result.stats.userErrors, 0u);

    const auto* admin = FindUser(result, Fixtures::ADMIN_RID);
    ASSERT_NE(admin, nullptr);
    EXPECT_EQ(admin->username, "Administrator");
    EXPECT_TRUE(admin->enabled);
    EXPECT_TRUE(admin->lmHash.empty());
    EXPECT_EQ(admin->NtHashHex(), Fixtures::ADMIN_NT_HEX);

    const auto* alice = FindUser(result, Fixtures::ALICE_RID);
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->username, "alice");
    EXPECT_EQ(alice->NtHashHex(), Fixtures::ALICE_NT_HEX);
    if (GetParam() == Fixtures::Revision::RC4) {
        EXPECT_EQ(alice->LmHashHex(), Fixtures::ALICE_LM_HEX);
    }
    else {
        EXPECT_TRUE(alice->lmHash.empty());
    }
}

TEST_P(UserEnumeratorTest, OneBrokenUserDoesNotStopTheScan) {
    m_sam.SetValue("SAM\\Domains\\Account\\Users\\000003EA", "F", Fixtures::UserF(false));

    UserEnumerator enumerator(m_sam, m_system);
    EnumerationResult result;
    Error err;
    ASSERT_TRUE(enumerator.Enumerate({}, result, &err));
    EXPECT_FALSE(err.HasError());
    EXPECT_EQ(result.stats.usersDecoded, 2u);
    EXPECT_EQ(result.stats.userErrors, 1u);

    const auto* failure = FindError(result, "000003EA");
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->rid, 0x3EAu);
    EXPECT_EQ(failure->code, ErrorCode::UserRecordMissing);
    EXPECT_THAT(failure->message, ::testing::HasSubstr(L"failed to find V or F structures for RID"));
}

TEST_P(UserEnumeratorTest, FailFastStopsAtFirstUserError) {
    // The broken account is listed before alice
    FakeHive sam;
    Fixtures::PopulateDomain(sam, GetParam());
    sam.SetValue("SAM\\Domains\\Account\\Users\\000001F5", "V", Fixtures::UserV("Guest", {}, {}));
    Fixtures::AddUser(sam, Fixtures::ALICE_RID, "alice", false, {}, Fixtures::Rc4Blob(Fixtures::ALICE_NT_RC4_ENC));

    UserEnumerator enumerator(sam, m_system);
    EnumerationOptions options;
    options.failFast = true;
    EnumerationResult result;
    Error err;
    EXPECT_FALSE(enumerator.Enumerate(options, result, &err));
    EXPECT_EQ(err.code, ErrorCode::UserRecordMissing);
    EXPECT_EQ(result.stats.usersSeen, 1u);
    ASSERT_EQ(result.users.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<UserError>(result.users.front()));
}

TEST_P(UserEnumeratorTest, DisabledAccountsAreSkippedByDefault) {
    Fixtures::AddUser(m_sam, 0x1F5, "Guest", true, {}, {});

    UserEnumerator enumerator(m_sam, m_system);
    EnumerationResult result;
    ASSERT_TRUE(enumerator.Enumerate({}, result));
    EXPECT_EQ(result.stats.disabledSkipped, 1u);
    EXPECT_EQ(FindUser(result, 0x1F5), nullptr);

    EnumerationOptions all;
    all.skipDisabled = false;
    ASSERT_TRUE(enumerator.Enumerate(all, result));
    const auto* guest = FindUser(result, 0x1F5);
    ASSERT_NE(guest, nullptr);
    EXPECT_FALSE(guest->enabled);
    EXPECT_TRUE(guest->ntHash.empty());
    EXPECT_FALSE(guest->hasHashInfo);
    EXPECT_EQ(result.stats.noHashInfo, 1u);
    EXPECT_TRUE(FindUser(result, Fixtures::ADMIN_RID)->hasHashInfo);
}

TEST_P(UserEnumeratorTest, DisabledAccountVRecordIsNotRead) {
    auto v = Fixtures::UserV("Guest", {}, Fixtures::Rc4Blob(Fixtures::ADMIN_NT_RC4_ENC));
    PutU32(v, 0xA8, 0xFFFF);
    const std::string key = "SAM\\Domains\\Account\\Users\\000001F5";
    m_sam.AddKey(key);
    m_sam.SetValue(key, "F", Fixtures::UserF(true));
    m_sam.SetValue(key, "V", v);

    UserEnumerator enumerator(m_sam, m_system);
    EnumerationOptions options;
    options.failFast = true;
    EnumerationResult result;
    Error err;
    ASSERT_TRUE(enumerator.Enumerate(options, result, &err)) << Utils::StringUtils::ToNarrow(err.message);
    EXPECT_EQ(result.stats.disabledSkipped, 1u);
    EXPECT_EQ(result.stats.userErrors, 0u);
    EXPECT_EQ(result.stats.usersDecoded, 2u);

    auto skipped = enumerator.DecodeUser("000001F5", true);
    ASSERT_TRUE(std::holds_alternative<UserRecord>(skipped));
    EXPECT_FALSE(std::get<UserRecord>(skipped).enabled);
    EXPECT_TRUE(std::get<UserRecord>(skipped).username.empty());

    EXPECT_TRUE(std::holds_alternative<UserError>(enumerator.DecodeUser("000001F5", false)));

    EnumerationOptions all;
    all.skipDisabled = false;
    ASSERT_TRUE(enumerator.Enumerate(all, result, &err));
    EXPECT_EQ(result.stats.userErrors, 1u);
    EXPECT_NE(FindError(result, "000001F5"), nullptr);
}

TEST_P(UserEnumeratorTest, CancellationStopsBeforeNextUser) {
    std::atomic<bool> cancel{ true };
    UserEnumerator enumerator(m_sam, m_system);
    EnumerationOptions options;
    options.cancel = &cancel;
    EnumerationResult result;
    Error err;
    EXPECT_TRUE(enumerator.Enumerate(options, result, &err));
    EXPECT_TRUE(result.stats.cancelled);
    EXPECT_EQ(result.stats.usersSeen, 0u);
    EXPECT_TRUE(result.users.empty());
}

TEST_P(UserEnumeratorTest, DecodeUserRequiresPrepare) {
    UserEnumerator enumerator(m_sam, m_system);
    auto before = enumerator.DecodeUser("000001F4");
    ASSERT_TRUE(std::holds_alternative<UserError>(before));

    Error err;
    ASSERT_TRUE(enumerator.Prepare(&err));
    auto after = enumerator.DecodeUser("000001F4");
    ASSERT_TRUE(std::holds_alternative<UserRecord>(after));
    EXPECT_EQ(std::get<UserRecord>(after).NtHashHex(), Fixtures::ADMIN_NT_HEX);

    auto bogus = enumerator.DecodeUser("Names");
    ASSERT_TRUE(std::holds_alternative<UserError>(bogus));
    EXPECT_EQ(std::get<UserError>(bogus).code, ErrorCode::UserNotFound);
}

INSTANTIATE_TEST_SUITE_P(Revisions, UserEnumeratorTest,
                         ::testing::Values(Fixtures::Revision::RC4, Fixtures::Revision::AES),
                         [](const ::testing::TestParamInfo<Fixtures::Revision>& info) {
                             return std::string(info.param == Fixtures::Revision::RC4 ? "Rc4" : "Aes");
                         });

TEST(UserEnumeratorPrepareTest, MissingSystemKeysAreScanFatal) {
    FakeHive system;
    FakeHive sam;
    Fixtures::PopulateSam(sam, Fixtures::Revision::RC4);

    UserEnumerator enumerator(sam, system);
    Error err;
    EXPECT_FALSE(enumerator.Prepare(&err));
    EXPECT_EQ(err.code, ErrorCode::NoCurrentControlSet);
    EXPECT_TRUE(IsScanFatal(err.code));
    EXPECT_FALSE(enumerator.IsPrepared());
}

TEST(UserEnumeratorPrepareTest, MissingDomainIsScanFatal) {
    FakeHive system;
    Fixtures::PopulateSystem(system);
    FakeHive sam;

    UserEnumerator enumerator(sam, system);
    EnumerationResult result;
    Error err;
    EXPECT_FALSE(enumerator.Enumerate({}, result, &err));
    EXPECT_EQ(err.code, ErrorCode::DomainNotFound);
}

TEST(UserEnumeratorHiveTest, EndToEndThroughRegfImages) {
    RegfBuilder systemBuilder;
    Fixtures::PopulateSystem(systemBuilder);
    RegfBuilder::Options samOptions;
    samOptions.index = RegfBuilder::IndexKind::LH;
    RegfBuilder samBuilder(samOptions);
    Fixtures::PopulateSam(samBuilder, Fixtures::Revision::AES);

    Registry::Error rerr;
    auto system = Registry::HiveParser::FromBuffer(systemBuilder.Build(), &rerr);
    auto sam = Registry::HiveParser::FromBuffer(samBuilder.Build(), &rerr);
    ASSERT_NE(system, nullptr);
    ASSERT_NE(sam, nullptr);

    UserEnumerator enumerator(*sam, *system);
    EnumerationResult result;
    Error err;
    ASSERT_TRUE(enumerator.Enumerate({}, result, &err));
    ASSERT_EQ(result.users.size(), 2u);
    const auto* alice = FindUser(result, Fixtures::ALICE_RID);
    ASSERT_NE(alice, nullptr);
    EXPECT_EQ(alice->NtHashHex(), Fixtures::ALICE_NT_HEX);
}
