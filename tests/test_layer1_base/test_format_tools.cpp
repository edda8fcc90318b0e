/**
 * @file test_format_tools.cpp
 * @brief Layer 1 tests for timestamp and string formatting helpers.
 */
#include "kbh_base.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace kanbanhub::format_tools;
using namespace std::chrono_literals;

TEST(FormatToolsTest, Iso8601_EpochIsUtcWithMillis)
{
    const std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(iso8601(epoch), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(iso8601(epoch + 1500ms), "1970-01-01T00:00:01.500Z");
}

TEST(FormatToolsTest, FormattedTime_HasMicroseconds)
{
    const std::chrono::system_clock::time_point t = std::chrono::system_clock::time_point{} + 86400s + 42us;
    EXPECT_EQ(formatted_time(t), "1970-01-02 00:00:00.000042");
}

TEST(FormatToolsTest, Iso8601Now_SortsChronologically)
{
    const auto a = iso8601_now();
    const auto b = iso8601(std::chrono::system_clock::now() + 1s);
    EXPECT_EQ(a.size(), 24u);
    EXPECT_LT(a, b);
}

TEST(FormatToolsTest, Slugify)
{
    EXPECT_EQ(slugify("Needs Review!"), "needs-review");
    EXPECT_EQ(slugify("  Front--End  "), "front-end");
    EXPECT_EQ(slugify("urgent"), "urgent");
    EXPECT_EQ(slugify("v2.0 Release"), "v2-0-release");
    EXPECT_EQ(slugify("!!!"), "");
}

TEST(FormatToolsTest, ToLower)
{
    EXPECT_EQ(to_lower("MiXeD 123"), "mixed 123");
}

TEST(FormatToolsTest, MakeBuffer)
{
    auto mb = make_buffer("{}-{}", "tx", 7);
    EXPECT_EQ(fmt::to_string(mb), "tx-7");
}
