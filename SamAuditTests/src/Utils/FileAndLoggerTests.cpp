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

#include "Utils/FileUtils.hpp"
#include "Utils/Logger.hpp"
#include "Support/TempDir.hpp"

using namespace SamAudit::Utils;
using SamAudit::Testing::TempDir;

TEST(FileUtilsTest, AtomicWriteCreatesParentsAndReadsBack) {
    TempDir dir;
    const auto path = dir / "nested/report.json";
    FileUtils::Error err;
    ASSERT_TRUE(FileUtils::WriteAllTextUtf8Atomic(path, "{\"ok\":true}", &err));
    EXPECT_TRUE(FileUtils::IsRegularFile(path));

    std::string text;
    ASSERT_TRUE(FileUtils::ReadAllTextUtf8(path, text, &err));
    EXPECT_EQ(text, "{\"ok\":true}");

    // Overwrite in place
    ASSERT_TRUE(FileUtils::WriteAllTextUtf8Atomic(path, "x", &err));
    ASSERT_TRUE(FileUtils::ReadAllTextUtf8(path, text, &err));
    EXPECT_EQ(text, "x");
}

TEST(FileUtilsTest, ReadTextDropsBom) {
    TempDir dir;
    const auto path = dir / "bom.txt";
    ASSERT_TRUE(FileUtils::WriteAllTextUtf8Atomic(path, "\xEF\xBB\xBFhello"));
    std::string text;
    ASSERT_TRUE(FileUtils::ReadAllTextUtf8(path, text));
    EXPECT_EQ(text, "hello");
}

TEST(FileUtilsTest, MissingFileReportsError) {
    TempDir dir;
    std::vector<uint8_t> bytes{ 1, 2, 3 };
    FileUtils::Error err;
    EXPECT_FALSE(FileUtils::ReadAllBytes(dir / "absent", bytes, &err));
    EXPECT_TRUE(bytes.empty());
    EXPECT_TRUE(err.hasError());
    EXPECT_FALSE(FileUtils::IsRegularFile(dir / "absent"));
}

TEST(FileUtilsTest, RemoveFileToleratesMissing) {
    TempDir dir;
    const auto path = dir / "hive.bin";
    ASSERT_TRUE(FileUtils::WriteAllTextUtf8Atomic(path, "regf"));
    EXPECT_TRUE(FileUtils::RemoveFile(path));
    EXPECT_FALSE(FileUtils::IsRegularFile(path));
    EXPECT_TRUE(FileUtils::RemoveFile(path));
}

TEST(FileUtilsTest, ExecutableDirectoryHoldsTheTestBinary) {
    const auto dir = FileUtils::ExecutableDirectory();
    ASSERT_FALSE(dir.empty());
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_TRUE(dir.is_absolute());
}

TEST(LoggerTest, ParseLogLevelIsCaseInsensitive) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("warn", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Warn);
}
