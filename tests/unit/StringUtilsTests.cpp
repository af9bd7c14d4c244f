#include <gtest/gtest.h>
#include "Utils/StringUtils.h"
#include "Core/ThreatTypes.h"

using namespace UnifiedScan;
using namespace UnifiedScan::Utils;

// ============================================================================
// Case and Search
// ============================================================================

TEST(StringUtilsTest, ToLower_Wide) {
    EXPECT_EQ(ToLower(std::wstring(L"XMRig.EXE")), L"xmrig.exe");
}

TEST(StringUtilsTest, ToLower_Narrow) {
    EXPECT_EQ(ToLower(std::string("HiGh")), "high");
}

TEST(StringUtilsTest, StartsWithEndsWith) {
    EXPECT_TRUE(StartsWith(L"hklm\\software", L"hklm\\"));
    EXPECT_FALSE(StartsWith(L"hk", L"hklm\\"));
    EXPECT_TRUE(EndsWith(L"photo.png.lnk", L".lnk"));
    EXPECT_FALSE(EndsWith(L"lnk", L".lnk"));
}

TEST(StringUtilsTest, Contains_EmptyNeedleMatches) {
    EXPECT_TRUE(Contains(L"anything", L""));
    EXPECT_FALSE(Contains(L"", L"x"));
}

// ============================================================================
// Trim and Split
// ============================================================================

TEST(StringUtilsTest, Trim_BothSides) {
    EXPECT_EQ(Trim(std::string("  key = value \t")), "key = value");
    EXPECT_EQ(Trim(std::wstring(L"\t  \n")), L"");
}

TEST(StringUtilsTest, Split_KeepsEmptyFields) {
    auto parts = Split(std::string("a||b|"), '|');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST(StringUtilsTest, Split_NoSeparator) {
    auto parts = Split(std::wstring(L"invoice"), L'.');
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], L"invoice");
}

// ============================================================================
// Encoding
// ============================================================================

TEST(StringUtilsTest, Utf8_MultiByte) {
    std::string utf8 = "caf\xC3\xA9";
    std::wstring wide = FromUtf8(utf8);
    ASSERT_EQ(wide.size(), 4u);
    EXPECT_EQ(wide[3], static_cast<wchar_t>(0xE9));
    EXPECT_EQ(ToUtf8(wide), utf8);
}

TEST(StringUtilsTest, Utf8_InvalidLeadByte) {
    std::wstring wide = FromUtf8("a\xFF" "b");
    ASSERT_EQ(wide.size(), 3u);
    EXPECT_EQ(wide[1], static_cast<wchar_t>(0xFFFD));
}

TEST(StringUtilsTest, DecodeText_Utf16LittleEndianBom) {
    std::string bytes("\xFF\xFE" "a\0b\0", 6);
    EXPECT_EQ(DecodeText(bytes), L"ab");
}

TEST(StringUtilsTest, DecodeText_Utf8Bom) {
    EXPECT_EQ(DecodeText("\xEF\xBB\xBF" "task"), L"task");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(StringUtilsTest, FormatCount_Groups) {
    EXPECT_EQ(FormatCount(0), L"0");
    EXPECT_EQ(FormatCount(999), L"999");
    EXPECT_EQ(FormatCount(1000), L"1,000");
    EXPECT_EQ(FormatCount(1234567), L"1,234,567");
}

TEST(StringUtilsTest, FormatDuration_MinutesAndSeconds) {
    EXPECT_EQ(FormatDuration(std::chrono::milliseconds(42500)), L"42s");
    EXPECT_EQ(FormatDuration(std::chrono::milliseconds(125000)), L"2m 5s");
}
