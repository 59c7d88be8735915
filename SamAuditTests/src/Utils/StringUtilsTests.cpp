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

#include "Utils/StringUtils.hpp"
#include "Support/TestBytes.hpp"

using namespace SamAudit::Utils::StringUtils;
using SamAudit::Testing::Utf16;

TEST(StringUtilsTest, Utf16LeDecodesAsciiAndSkipsBom) {
    auto bytes = Utf16("Administrator");
    EXPECT_EQ(Utf16LeToUtf8(bytes), "Administrator");

    std::vector<uint8_t> withBom = { 0xFF, 0xFE };
    withBom.insert(withBom.end(), bytes.begin(), bytes.end());
    EXPECT_EQ(Utf16LeToUtf8(withBom), "Administrator");
    EXPECT_EQ(Utf16LeToUtf8(withBom, false), "\xEF\xBB\xBF" "Administrator");
}

TEST(StringUtilsTest, Utf16LeDecodesSurrogatePairs) {
    // U+00E9 followed by U+1F600
    const std::vector<uint8_t> bytes = { 0xE9, 0x00, 0x3D, 0xD8, 0x00, 0xDE };
    EXPECT_EQ(Utf16LeToUtf8(bytes), "\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(StringUtilsTest, Utf16LeReplacesMalformedInput) {
    const std::vector<uint8_t> loneHigh = { 0x3D, 0xD8, 0x41, 0x00 };
    EXPECT_EQ(Utf16LeToUtf8(loneHigh), "\xEF\xBF\xBD" "A");

    const std::vector<uint8_t> oddLength = { 0x41, 0x00, 0x42 };
    EXPECT_EQ(Utf16LeToUtf8(oddLength), "A\xEF\xBF\xBD");
}

TEST(StringUtilsTest, Latin1Widening) {
    const std::vector<uint8_t> bytes = { 'S', 'A', 'M', 0xE9 };
    EXPECT_EQ(Latin1ToUtf8(bytes), "SAM\xC3\xA9");
}

TEST(StringUtilsTest, WideNarrowRoundTrip) {
    const std::string text = "user \xC3\xA9\xF0\x9F\x98\x80";
    EXPECT_EQ(ToNarrow(ToWide(text)), text);
    EXPECT_EQ(ToWide("abc"), L"abc");
}

TEST(StringUtilsTest, CaseHelpers) {
    EXPECT_EQ(ToUpperAscii("Names\\abc"), "NAMES\\ABC");
    EXPECT_EQ(ToLowerAscii("JSON"), "json");
    EXPECT_TRUE(EqualsIgnoreCaseAscii("names", "NAMES"));
    EXPECT_FALSE(EqualsIgnoreCaseAscii("Name", "Names"));
}

TEST(StringUtilsTest, TrimAndSplit) {
    EXPECT_EQ(Trim("  hash;pw \r\n"), "hash;pw");
    EXPECT_EQ(Trim(" \t "), "");

    EXPECT_THAT(Split("a;b;;c", ';'), ::testing::ElementsAre("a", "b", "", "c"));
    EXPECT_THAT(Split("a;b;;c", ';', true), ::testing::ElementsAre("a", "b", "c"));
    EXPECT_THAT(Split("", ';'), ::testing::ElementsAre(""));
}
