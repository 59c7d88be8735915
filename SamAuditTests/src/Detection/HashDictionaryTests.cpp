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

#include "Detection/HashDictionary.hpp"
#include "Support/TempDir.hpp"
#include "Utils/FileUtils.hpp"

using namespace SamAudit::Detection;
using SamAudit::Testing::TempDir;

TEST(HashDictionaryTest, ParsesHashPasswordLines) {
    HashDictionary dict;
    const size_t added = dict.LoadFromText(
        "\xEF\xBB\xBF" "31d6cfe0d16ae931b73c59d7e0c089c0;\r\n"
        "\n"
        "8846F7EAEE8FB117AD06BDD830B7586C;password\r\n"
        "   \r\n"
        "32ED87BDB5FDC5E9CBA88547376818D4;123456");
    EXPECT_EQ(added, 3u);
    EXPECT_EQ(dict.Size(), 3u);
    EXPECT_EQ(dict.SkippedLines(), 0u);

    EXPECT_EQ(dict.Lookup("8846f7eaee8fb117ad06bdd830b7586c"), std::optional<std::string>("password"));
    EXPECT_EQ(dict.Lookup("31D6CFE0D16AE931B73C59D7E0C089C0"), std::optional<std::string>(""));
    EXPECT_EQ(dict.Lookup("32ED87BDB5FDC5E9CBA88547376818D4"), std::optional<std::string>("123456"));
    EXPECT_FALSE(dict.Lookup("00000000000000000000000000000000").has_value());
    EXPECT_FALSE(dict.Lookup("").has_value());
}

TEST(HashDictionaryTest, SkipsLinesWithoutExactlyOneSeparator) {
    HashDictionary dict;
    const size_t added = dict.LoadFromText(
        "no separator here\n"
        "AAD3B435B51404EEAAD3B435B51404EE;a;b\n"
        "44EFCE164AB921CAAAD3B435B51404EE;123456\n");
    EXPECT_EQ(added, 1u);
    EXPECT_EQ(dict.SkippedLines(), 2u);
    EXPECT_TRUE(dict.Lookup("44EFCE164AB921CAAAD3B435B51404EE").has_value());
}

TEST(HashDictionaryTest, LaterEntriesReplaceEarlierOnes) {
    HashDictionary dict;
    dict.Add(" 209c6174da490caeb422f3fa5a7ae634 ", "admin");
    dict.Add("209C6174DA490CAEB422F3FA5A7AE634", "Admin");
    EXPECT_EQ(dict.Size(), 1u);
    EXPECT_EQ(*dict.Lookup("209C6174DA490CAEB422F3FA5A7AE634"), "Admin");

    dict.Clear();
    EXPECT_TRUE(dict.Empty());
    EXPECT_EQ(dict.SkippedLines(), 0u);
}

TEST(HashDictionaryTest, LoadFromFile) {
    TempDir dir;
    const auto path = dir / "nt_hashes.txt";
    ASSERT_TRUE(SamAudit::Utils::FileUtils::WriteAllTextUtf8Atomic(path, "64F12CDDAA88057E06A81B54E73B949B;Password1\n"));

    HashDictionary dict;
    Error err;
    ASSERT_TRUE(dict.LoadFromFile(path, &err));
    EXPECT_EQ(*dict.Lookup("64F12CDDAA88057E06A81B54E73B949B"), "Password1");

    EXPECT_FALSE(dict.LoadFromFile(dir / "missing.txt", &err));
    EXPECT_EQ(err.code, ErrorCode::IoError);
    EXPECT_EQ(dict.Size(), 1u);
}
