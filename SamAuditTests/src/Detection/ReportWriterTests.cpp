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

#include "Detection/ReportWriter.hpp"
#include "Detection/WeakCredentialDetector.hpp"
#include "Support/TempDir.hpp"
#include "Support/TestBytes.hpp"
#include "Utils/FileUtils.hpp"
#include "Utils/JSONUtils.hpp"

using namespace SamAudit;
using namespace SamAudit::Detection;
using SamAudit::Testing::Hex;
using SamAudit::Testing::TempDir;

namespace {

    ScanReport SampleReport() {
        ScanReport report;
        report.sam.path = "/evidence/SAM";
        report.sam.sha256 = std::string(64, 'a');
        report.system.path = "/evidence/SYSTEM";
        report.startedAt = std::chrono::system_clock::from_time_t(1700000000);
        report.finishedAt = std::chrono::system_clock::from_time_t(1700000002);

        Credentials::UserRecord alice;
        alice.rid = 0x3E9;
        alice.username = "alice";
        alice.lmHash = Hex("E52CAC67419A9A224A3B108F3FA6CB6D");
        alice.ntHash = Hex("8846F7EAEE8FB117AD06BDD830B7586C");
        report.users.push_back(alice);

        Credentials::UserError broken;
        broken.ridKey = "000003EA";
        broken.rid = 0x3EA;
        broken.code = Credentials::ErrorCode::UserRecordMissing;
        broken.message = L"SAM hive: failed to find V or F structures for RID (000003EA)";
        report.userErrors.push_back(broken);

        report.stats.usersSeen = 2;
        report.stats.usersDecoded = 1;
        report.stats.userErrors = 1;

        Finding lm = WeakCredentialDetector::LmFormatFinding();
        lm.users.push_back("alice");
        report.findings.push_back(lm);

        Finding weak = WeakCredentialDetector::WeakPasswordFinding();
        weak.users.push_back("alice");
        weak.weak.push_back(WeakCredential{ "alice", 0x3E9, Credentials::HashKind::LM, "PASSWORD" });
        report.findings.push_back(weak);
        return report;
    }

}  // namespace

TEST(ReportWriterTest, ParsesFormats) {
    ReportFormat format = ReportFormat::Text;
    EXPECT_TRUE(ParseReportFormat("JSON", format));
    EXPECT_EQ(format, ReportFormat::Json);
    EXPECT_TRUE(ParseReportFormat("text", format));
    EXPECT_EQ(format, ReportFormat::Text);
    EXPECT_FALSE(ParseReportFormat("xml", format));
}

TEST(ReportWriterTest, JsonLayout) {
    const auto j = ReportWriter::ToJson(SampleReport(), ReportOptions{});

    EXPECT_EQ(j["sam"]["path"], "/evidence/SAM");
    EXPECT_EQ(j["sam"]["deleted"], false);
    EXPECT_EQ(j["startedAt"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(j["stats"]["usersDecoded"], 1);
    EXPECT_EQ(j["stats"]["cancelled"], false);

    ASSERT_EQ(j["users"].size(), 1u);
    EXPECT_EQ(j["users"][0]["rid"], 1001);
    EXPECT_EQ(j["users"][0]["hasLmHash"], true);
    EXPECT_FALSE(j["users"][0].contains("ntHash"));

    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["rid"], "000003EA");

    ASSERT_EQ(j["findings"].size(), 2u);
    EXPECT_EQ(j["findings"][0]["severity"], "HIGH");
    EXPECT_FALSE(j["findings"][0].contains("weakPasswords"));
    EXPECT_EQ(j["findings"][1]["reference"], "WINDOWS_WEAK_PASSWORD");
    EXPECT_EQ(j["findings"][1]["weakPasswords"][0]["password"], "PASSWORD");
    EXPECT_EQ(j["findings"][1]["weakPasswords"][0]["matchedHash"], "LM");
}

TEST(ReportWriterTest, JsonHashesOnlyOnRequest) {
    ReportOptions options;
    options.includeHashes = true;
    const auto j = ReportWriter::ToJson(SampleReport(), options);
    EXPECT_EQ(j["users"][0]["ntHash"], "8846F7EAEE8FB117AD06BDD830B7586C");
    EXPECT_EQ(j["users"][0]["lmHash"], "E52CAC67419A9A224A3B108F3FA6CB6D");
}

TEST(ReportWriterTest, TextReport) {
    const auto text = ReportWriter::ToText(SampleReport(), ReportOptions{});
    EXPECT_THAT(text, ::testing::HasSubstr("[HIGH] PASSWORD_HASH_LM_FORMAT: Password hashes are stored in the LM format"));
    EXPECT_THAT(text, ::testing::HasSubstr("[CRITICAL] WINDOWS_WEAK_PASSWORD: Weak passwords on Windows"));
    EXPECT_THAT(text, ::testing::HasSubstr("alice (RID 1001, LM): PASSWORD"));
    EXPECT_THAT(text, ::testing::HasSubstr("RID 000003EA"));
    EXPECT_THAT(text, ::testing::Not(::testing::HasSubstr("8846F7EA")));

    ScanReport clean;
    EXPECT_THAT(ReportWriter::ToText(clean, ReportOptions{}), ::testing::HasSubstr("No findings."));
}

TEST(ReportWriterTest, RenderAndWriteJson) {
    ReportOptions options;
    options.format = ReportFormat::Json;
    options.pretty = false;

    std::string out;
    ASSERT_TRUE(ReportWriter::Render(SampleReport(), options, out));
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.back(), '\n');

    Utils::JSON::Json parsed;
    ASSERT_TRUE(Utils::JSON::Parse(out, parsed));
    EXPECT_EQ(parsed["findings"].size(), 2u);

    TempDir dir;
    const auto path = dir / "out/report.json";
    Error err;
    ASSERT_TRUE(ReportWriter::WriteToFile(SampleReport(), options, path, &err));
    std::string written;
    ASSERT_TRUE(Utils::FileUtils::ReadAllTextUtf8(path, written));
    EXPECT_EQ(written, out);
}
