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

#include "Config/AuditConfig.hpp"
#include "Detection/HashDictionary.hpp"
#include "Support/TempDir.hpp"
#include "Utils/FileUtils.hpp"
#include "Utils/StringUtils.hpp"

using namespace SamAudit;
using namespace SamAudit::Config;
using SamAudit::Testing::TempDir;

TEST(AuditConfigTest, Defaults) {
    AuditConfig config;
    EXPECT_EQ(config.log.level, Utils::LogLevel::Info);
    EXPECT_TRUE(config.log.toConsole);
    EXPECT_FALSE(config.log.toFile);
    EXPECT_EQ(config.dictionaries.lm, (BundledDataDirectory() / "lm_hashes.txt").string());
    EXPECT_EQ(config.dictionaries.nt, (BundledDataDirectory() / "nt_hashes.txt").string());
    EXPECT_TRUE(config.scan.skipDisabled);
    EXPECT_FALSE(config.scan.failFast);
    EXPECT_FALSE(config.scan.deleteHivesAfterScan);
    EXPECT_EQ(config.report.format, Detection::ReportFormat::Text);
    EXPECT_FALSE(config.report.includeHashes);
    EXPECT_TRUE(config.report.output.empty());
}

TEST(AuditConfigTest, OverlaysPresentKeysOnly) {
    AuditConfig config;
    Error err;
    ASSERT_TRUE(config.LoadFromText(R"({
        "log": { "level": "debug", "toFile": true, "directory": "/var/log/samaudit" },
        "dictionaries": { "nt": "/opt/nt.txt" },
        "scan": { "skipDisabled": false, "failFast": true },
        "report": { "format": "json", "includeHashes": true, "output": "out.json" },
        "unrelated": 42
    })", &err)) << Utils::StringUtils::ToNarrow(err.message);

    EXPECT_EQ(config.log.level, Utils::LogLevel::Debug);
    EXPECT_TRUE(config.log.toFile);
    EXPECT_TRUE(config.log.toConsole);
    EXPECT_EQ(config.log.directory, "/var/log/samaudit");
    EXPECT_EQ(config.dictionaries.lm, AuditConfig{}.dictionaries.lm);
    EXPECT_EQ(config.dictionaries.nt, "/opt/nt.txt");
    EXPECT_FALSE(config.scan.skipDisabled);
    EXPECT_TRUE(config.scan.failFast);
    EXPECT_FALSE(config.scan.deleteHivesAfterScan);
    EXPECT_EQ(config.report.format, Detection::ReportFormat::Json);
    EXPECT_TRUE(config.report.includeHashes);
    EXPECT_EQ(config.report.output, "out.json");
}

TEST(AuditConfigTest, WrongTypeNamesTheSetting) {
    AuditConfig config;
    Error err;
    EXPECT_FALSE(config.LoadFromText(R"({ "scan": { "failFast": "yes" } })", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidConfig);
    EXPECT_EQ(err.message, L"Setting has the wrong type");
    EXPECT_EQ(err.context, L"scan.failFast");
}

TEST(AuditConfigTest, UnknownEnumValues) {
    AuditConfig config;
    Error err;
    EXPECT_FALSE(config.LoadFromText(R"({ "log": { "level": "chatty" } })", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidConfig);
    EXPECT_EQ(err.context, L"log.level");

    err.Clear();
    EXPECT_FALSE(config.LoadFromText(R"({ "report": { "format": "xml" } })", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidConfig);
    EXPECT_EQ(err.context, L"report.format");
    EXPECT_EQ(err.message, L"Unknown report format: xml");
}

TEST(AuditConfigTest, FailedApplyLeavesConfigUnchanged) {
    AuditConfig config;
    Error err;
    EXPECT_FALSE(config.LoadFromText(
        R"({ "scan": { "failFast": true }, "report": { "format": "pdf" } })", &err));
    EXPECT_FALSE(config.scan.failFast);
    EXPECT_EQ(config.report.format, Detection::ReportFormat::Text);
}

TEST(AuditConfigTest, RootMustBeObject) {
    AuditConfig config;
    Error err;
    EXPECT_FALSE(config.LoadFromText("[1, 2]", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidConfig);
}

TEST(AuditConfigTest, ParseErrorCarriesPosition) {
    AuditConfig config;
    Error err;
    EXPECT_FALSE(config.LoadFromText("{\n  \"log\": \n}", &err));
    EXPECT_EQ(err.code, ErrorCode::ParseError);
    EXPECT_FALSE(err.message.empty());
    EXPECT_THAT(err.context, ::testing::StartsWith(L"line "));
}

TEST(AuditConfigTest, LoadFromFile) {
    TempDir dir;
    AuditConfig config;
    Error err;

    EXPECT_FALSE(config.LoadFromFile(dir / "missing.json", &err));
    EXPECT_EQ(err.code, ErrorCode::IoError);

    ASSERT_TRUE(Utils::FileUtils::WriteAllTextUtf8Atomic(dir / "bad.json",
        R"({ "log": { "async": 1 } })"));
    err.Clear();
    EXPECT_FALSE(config.LoadFromFile(dir / "bad.json", &err));
    EXPECT_EQ(err.code, ErrorCode::InvalidConfig);
    EXPECT_THAT(err.context, ::testing::EndsWith(L"bad.json: log.async"));

    ASSERT_TRUE(Utils::FileUtils::WriteAllTextUtf8Atomic(dir / "good.json",
        R"({ "log": { "async": false, "level": "warn" } })"));
    err.Clear();
    ASSERT_TRUE(config.LoadFromFile(dir / "good.json", &err));
    EXPECT_FALSE(config.log.async);
    EXPECT_EQ(config.log.level, Utils::LogLevel::Warn);
}

TEST(AuditConfigTest, ToJsonReloadsToSameSettings) {
    AuditConfig config;
    config.log.level = Utils::LogLevel::Error;
    config.log.jsonLines = true;
    config.dictionaries.lm = "lm.txt";
    config.scan.deleteHivesAfterScan = true;
    config.report.format = Detection::ReportFormat::Json;
    config.report.output = "r.json";

    const auto json = config.ToJson();
    EXPECT_EQ(json["log"]["level"], "error");
    EXPECT_EQ(json["report"]["format"], "json");

    AuditConfig reloaded;
    ASSERT_TRUE(reloaded.Apply(json));
    EXPECT_EQ(reloaded.ToJson(), json);
}

TEST(AuditConfigTest, ToLoggerConfig) {
    AuditConfig config;
    config.log.level = Utils::LogLevel::Trace;
    config.log.toConsole = false;
    config.log.toFile = true;
    config.log.directory = "audit-logs";
    config.log.async = false;

    const auto cfg = config.ToLoggerConfig();
    EXPECT_EQ(cfg.minimalLevel, Utils::LogLevel::Trace);
    EXPECT_FALSE(cfg.toConsole);
    EXPECT_TRUE(cfg.toFile);
    EXPECT_EQ(cfg.logDirectory, L"audit-logs");
    EXPECT_FALSE(cfg.async);
}

TEST(AuditConfigTest, LogLevelNames) {
    EXPECT_STREQ(LogLevelName(Utils::LogLevel::Trace), "trace");
    EXPECT_STREQ(LogLevelName(Utils::LogLevel::Warn), "warn");
    EXPECT_STREQ(LogLevelName(Utils::LogLevel::Fatal), "fatal");
}

TEST(AuditConfigTest, FirstExistingDirectoryPicksInOrder) {
    TempDir dir;
    std::filesystem::create_directory(dir / "second");
    std::filesystem::create_directory(dir / "third");

    EXPECT_EQ(FirstExistingDirectory({ dir / "first", dir / "second", dir / "third" }), dir / "second");
    EXPECT_EQ(FirstExistingDirectory({ dir / "first", dir / "missing" }), dir / "first");
    EXPECT_TRUE(FirstExistingDirectory({}).empty());
}

TEST(AuditConfigTest, BundledDictionariesAreFoundWithoutConfiguration) {
    ASSERT_FALSE(Utils::FileUtils::ExecutableDirectory().empty());

    AuditConfig config;
    Detection::HashDictionary lm;
    Detection::HashDictionary nt;
    Detection::Error err;
    ASSERT_TRUE(lm.LoadFromFile(config.dictionaries.lm, &err)) << Utils::StringUtils::ToNarrow(err.message);
    ASSERT_TRUE(nt.LoadFromFile(config.dictionaries.nt, &err)) << Utils::StringUtils::ToNarrow(err.message);

    EXPECT_EQ(lm.SkippedLines(), 0u);
    EXPECT_EQ(nt.SkippedLines(), 0u);
    EXPECT_GE(nt.Size(), 100u);
    EXPECT_GE(lm.Size(), 90u);
    EXPECT_EQ(nt.Lookup("8846F7EAEE8FB117AD06BDD830B7586C"), "password");
    EXPECT_EQ(nt.Lookup("32ED87BDB5FDC5E9CBA88547376818D4"), "123456");
    EXPECT_EQ(lm.Lookup("E52CAC67419A9A224A3B108F3FA6CB6D"), "PASSWORD");
    EXPECT_EQ(lm.Lookup("44EFCE164AB921CAAAD3B435B51404EE"), "123456");
}
