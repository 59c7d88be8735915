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

#include "Detection/WeakCredentialDetector.hpp"
#include "Support/FakeHive.hpp"
#include "Support/RegfBuilder.hpp"
#include "Support/SamFixtures.hpp"
#include "Support/TempDir.hpp"
#include "Utils/FileUtils.hpp"

using namespace SamAudit;
using namespace SamAudit::Detection;
using namespace SamAudit::Testing;

namespace {

    Credentials::UserRecord MakeUser(uint32_t rid, std::string name, std::string_view lmHex, std::string_view ntHex) {
        Credentials::UserRecord u;
        u.rid = rid;
        u.username = std::move(name);
        u.lmHash = Hex(lmHex);
        u.ntHash = Hex(ntHex);
        return u;
    }

}  // namespace

class WeakCredentialDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_lm.Add("E52CAC67419A9A224A3B108F3FA6CB6D", "PASSWORD");
        m_nt.Add("8846F7EAEE8FB117AD06BDD830B7586C", "password");
        m_nt.Add("209C6174DA490CAEB422F3FA5A7AE634", "admin");
    }

    HashDictionary m_lm;
    HashDictionary m_nt;
};

TEST_F(WeakCredentialDetectorTest, CrackPrefersLm) {
    WeakCredentialDetector detector(m_lm, m_nt);
    WeakCredential hit;
    ASSERT_TRUE(detector.Crack(MakeUser(0x3E9, "alice", Fixtures::ALICE_LM_HEX, Fixtures::ALICE_NT_HEX), hit));
    EXPECT_EQ(hit.matchedHash, Credentials::HashKind::LM);
    EXPECT_EQ(hit.cleartext, "PASSWORD");
    EXPECT_EQ(hit.username, "alice");
    EXPECT_EQ(hit.rid, 0x3E9u);

    ASSERT_TRUE(detector.Crack(MakeUser(0x3EA, "bob", "", "209C6174DA490CAEB422F3FA5A7AE634"), hit));
    EXPECT_EQ(hit.matchedHash, Credentials::HashKind::NT);
    EXPECT_EQ(hit.cleartext, "admin");

    EXPECT_FALSE(detector.Crack(MakeUser(0x1F4, "Administrator", "", Fixtures::ADMIN_NT_HEX), hit));
    EXPECT_FALSE(detector.Crack(MakeUser(0x1F5, "Guest", "", ""), hit));
}

TEST_F(WeakCredentialDetectorTest, NoFindingsForStrongNtOnlyAccounts) {
    WeakCredentialDetector detector(m_lm, m_nt);
    const auto findings = detector.Evaluate({ MakeUser(0x1F4, "Administrator", "", Fixtures::ADMIN_NT_HEX) });
    EXPECT_TRUE(findings.empty());
}

TEST_F(WeakCredentialDetectorTest, LmStorageAndWeakPasswordFindings) {
    WeakCredentialDetector detector(m_lm, m_nt);
    const auto findings = detector.Evaluate({
        MakeUser(0x1F4, "Administrator", "", Fixtures::ADMIN_NT_HEX),
        MakeUser(0x3E9, "alice", Fixtures::ALICE_LM_HEX, Fixtures::ALICE_NT_HEX),
        MakeUser(0x3EA, "bob", "", "209C6174DA490CAEB422F3FA5A7AE634")
    });
    ASSERT_EQ(findings.size(), 2u);

    EXPECT_EQ(findings[0].reference, FINDING_LM_FORMAT);
    EXPECT_EQ(findings[0].severity, Severity::High);
    EXPECT_THAT(findings[0].users, ::testing::ElementsAre("alice"));

    EXPECT_EQ(findings[1].reference, FINDING_WEAK_PASSWORD);
    EXPECT_EQ(findings[1].severity, Severity::Critical);
    EXPECT_THAT(findings[1].users, ::testing::ElementsAre("alice", "bob"));
    ASSERT_EQ(findings[1].weak.size(), 2u);
    EXPECT_EQ(findings[1].weak[1].cleartext, "admin");
}

TEST_F(WeakCredentialDetectorTest, ScanHivesEndToEnd) {
    FakeHive system;
    FakeHive sam;
    Fixtures::PopulateSystem(system);
    Fixtures::PopulateSam(sam, Fixtures::Revision::RC4);

    WeakCredentialDetector detector(m_lm, m_nt);
    ScanReport report;
    Error err;
    ASSERT_TRUE(detector.ScanHives(sam, system, {}, report, &err));
    EXPECT_EQ(report.users.size(), 2u);
    EXPECT_TRUE(report.userErrors.empty());
    ASSERT_EQ(report.findings.size(), 2u);
    EXPECT_EQ(report.findings[1].weak.front().matchedHash, Credentials::HashKind::LM);
}

TEST_F(WeakCredentialDetectorTest, ScanFatalCarriesCredentialCode) {
    FakeHive system;
    FakeHive sam;
    Fixtures::PopulateSam(sam, Fixtures::Revision::RC4);

    WeakCredentialDetector detector(m_lm, m_nt);
    ScanReport report;
    Error err;
    EXPECT_FALSE(detector.ScanHives(sam, system, {}, report, &err));
    EXPECT_EQ(err.code, ErrorCode::ScanFatal);
    EXPECT_EQ(err.credentialCode, Credentials::ErrorCode::NoCurrentControlSet);
}

TEST_F(WeakCredentialDetectorTest, FailFastUserErrorIsUserFailure) {
    FakeHive system;
    FakeHive sam;
    Fixtures::PopulateSystem(system);
    Fixtures::PopulateDomain(sam, Fixtures::Revision::RC4);
    sam.SetValue("SAM\\Domains\\Account\\Users\\000003EA", "F", Fixtures::UserF(false));

    WeakCredentialDetector detector(m_lm, m_nt);
    DetectorOptions options;
    options.enumeration.failFast = true;
    ScanReport report;
    Error err;
    EXPECT_FALSE(detector.ScanHives(sam, system, options, report, &err));
    EXPECT_EQ(err.code, ErrorCode::UserFailure);
    EXPECT_EQ(err.credentialCode, Credentials::ErrorCode::UserRecordMissing);
    EXPECT_EQ(report.userErrors.size(), 1u);
}

TEST_F(WeakCredentialDetectorTest, ScanFilesFingerprintsAndDeletes) {
    TempDir dir;
    RegfBuilder systemBuilder;
    Fixtures::PopulateSystem(systemBuilder);
    RegfBuilder samBuilder;
    Fixtures::PopulateSam(samBuilder, Fixtures::Revision::AES);
    systemBuilder.WriteTo(dir / "SYSTEM");
    samBuilder.WriteTo(dir / "SAM");

    WeakCredentialDetector detector(m_lm, m_nt);
    DetectorOptions options;
    options.deleteHivesAfterScan = true;
    ScanReport report;
    Error err;
    ASSERT_TRUE(detector.Scan(dir / "SAM", dir / "SYSTEM", options, report, &err));

    EXPECT_EQ(report.sam.sha256.size(), 64u);
    EXPECT_EQ(report.system.sha256.size(), 64u);
    EXPECT_TRUE(report.sam.deleted);
    EXPECT_TRUE(report.system.deleted);
    EXPECT_FALSE(Utils::FileUtils::IsRegularFile(dir / "SAM"));
    EXPECT_FALSE(Utils::FileUtils::IsRegularFile(dir / "SYSTEM"));
    EXPECT_LE(report.startedAt, report.finishedAt);

    ASSERT_EQ(report.findings.size(), 1u);
    EXPECT_EQ(report.findings[0].reference, FINDING_WEAK_PASSWORD);
    EXPECT_THAT(report.findings[0].users, ::testing::ElementsAre("alice"));
}

TEST_F(WeakCredentialDetectorTest, HiveLoadErrorsNameTheHive) {
    TempDir dir;
    RegfBuilder systemBuilder;
    Fixtures::PopulateSystem(systemBuilder);
    systemBuilder.WriteTo(dir / "SYSTEM");
    ASSERT_TRUE(Utils::FileUtils::WriteAllTextUtf8Atomic(dir / "SAM", std::string(8192, 'x')));

    WeakCredentialDetector detector(m_lm, m_nt);
    ScanReport report;
    Error err;
    EXPECT_FALSE(detector.Scan(dir / "SAM", dir / "SYSTEM", {}, report, &err));
    EXPECT_EQ(err.code, ErrorCode::HiveLoad);
    EXPECT_EQ(err.message, L"SAM hive: File does not have registry magic.");
    EXPECT_TRUE(Utils::FileUtils::IsRegularFile(dir / "SAM"));

    err.Clear();
    EXPECT_FALSE(detector.Scan(dir / "SAM", dir / "MISSING", {}, report, &err));
    EXPECT_EQ(err.code, ErrorCode::HiveLoad);
    EXPECT_THAT(err.message, ::testing::StartsWith(L"SYSTEM hive: "));
}
