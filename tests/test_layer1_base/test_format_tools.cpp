/**
 * @file test_format_tools.cpp
 * @brief Layer 1 tests for format_tools helpers.
 */
#include "bmc_base.hpp"
#include "test_patterns.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>

using namespace bmapcopy::format_tools;
using namespace ::testing;

class FormatToolsTest : public bmapcopy::tests::PureApiTest
{
};

TEST_F(FormatToolsTest, TrimWhitespace)
{
    EXPECT_EQ(trim_whitespace("  abc \n"), "abc");
    EXPECT_EQ(trim_whitespace("\t\r\n"), "");
    EXPECT_EQ(trim_whitespace(""), "");
    EXPECT_EQ(trim_whitespace("a b"), "a b");
    static_assert(trim_whitespace(" x ") == "x");
}

TEST_F(FormatToolsTest, ParseU64_AcceptsDecimal)
{
    uint64_t v = 0;
    ASSERT_TRUE(parse_u64("4096", v));
    EXPECT_EQ(v, 4096u);
    ASSERT_TRUE(parse_u64("  18446744073709551615\n", v));
    EXPECT_EQ(v, 18446744073709551615ull);
    ASSERT_TRUE(parse_u64("0", v));
    EXPECT_EQ(v, 0u);
}

TEST_F(FormatToolsTest, ParseU64_RejectsGarbage)
{
    uint64_t v = 7;
    EXPECT_FALSE(parse_u64("", v));
    EXPECT_FALSE(parse_u64("-1", v));
    EXPECT_FALSE(parse_u64("+1", v));
    EXPECT_FALSE(parse_u64("12abc", v));
    EXPECT_FALSE(parse_u64("1 2", v));
    EXPECT_FALSE(parse_u64("18446744073709551616", v)); // overflow
    EXPECT_EQ(v, 7u) << "out must be untouched on failure";
}

TEST_F(FormatToolsTest, ToLowerAscii)
{
    EXPECT_EQ(to_lower_ascii("SHA256"), "sha256");
    EXPECT_EQ(to_lower_ascii("MiXeD-09"), "mixed-09");
}

TEST_F(FormatToolsTest, FilenameOnly)
{
    EXPECT_EQ(filename_only("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(filename_only("c.cpp"), "c.cpp");
    static_assert(filename_only("dir/x.hpp") == "x.hpp");
}

TEST_F(FormatToolsTest, MakeBuffer)
{
    auto mb = make_buffer("{}-{}", 10, "x");
    EXPECT_EQ(fmt::to_string(mb), "10-x");
}

TEST_F(FormatToolsTest, FormattedTime_HasMicroseconds)
{
    const std::string s = formatted_time(std::chrono::system_clock::now());
    // YYYY-MM-DD HH:MM:SS.uuuuuu
    ASSERT_EQ(s.size(), 26u) << s;
    EXPECT_EQ(s[4], '-');
    EXPECT_EQ(s[10], ' ');
    EXPECT_EQ(s[19], '.');
}
