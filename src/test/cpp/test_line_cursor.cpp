#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "nowiki/line_cursor.hpp"

namespace nowiki {
namespace {

struct Line_Cursor_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;

    [[nodiscard]]
    std::pmr::vector<std::u8string_view> split(std::u8string_view text)
    {
        std::pmr::vector<std::u8string_view> result { &memory };
        split_lines(result, text);
        return result;
    }
};

TEST_F(Line_Cursor_Test, split_lines_terminators)
{
    const std::pmr::vector<std::u8string_view> expected { { u8"a", u8"b", u8"c", u8"d" }, &memory };
    EXPECT_EQ(split(u8"a\nb\r\nc\rd"), expected);
}

TEST_F(Line_Cursor_Test, split_lines_trailing_terminator)
{
    const std::pmr::vector<std::u8string_view> expected { { u8"a", u8"b" }, &memory };
    EXPECT_EQ(split(u8"a\nb\n"), expected);
    EXPECT_EQ(split(u8"a\r\nb\r\n"), expected);
}

TEST_F(Line_Cursor_Test, split_lines_empty_lines)
{
    const std::pmr::vector<std::u8string_view> expected { { u8"", u8"a", u8"" }, &memory };
    EXPECT_EQ(split(u8"\na\n\n"), expected);
}

TEST_F(Line_Cursor_Test, split_lines_empty)
{
    EXPECT_TRUE(split(u8"").empty());
}

TEST_F(Line_Cursor_Test, next_and_peek)
{
    Line_Cursor lines { u8"first\nsecond", &memory };
    EXPECT_FALSE(lines.at_end());
    EXPECT_EQ(lines.peek(), u8"first");
    EXPECT_EQ(lines.next(), u8"first");
    EXPECT_EQ(lines.get_line_number(), 1);
    EXPECT_EQ(lines.next(), u8"second");
    EXPECT_TRUE(lines.at_end());
    EXPECT_EQ(lines.peek(), std::nullopt);
    EXPECT_EQ(lines.next(), std::nullopt);
}

TEST_F(Line_Cursor_Test, push_back)
{
    Line_Cursor lines { u8"a\nb", &memory };
    const std::optional<std::u8string_view> a = lines.next();
    ASSERT_TRUE(a);
    lines.push(*a);
    lines.push(u8"extra");

    EXPECT_EQ(lines.get_line_number(), 1);
    EXPECT_EQ(lines.peek(), u8"a");
    EXPECT_EQ(lines.next(), u8"a");
    EXPECT_EQ(lines.next(), u8"extra");
    EXPECT_EQ(lines.next(), u8"b");
    EXPECT_TRUE(lines.at_end());
}

TEST_F(Line_Cursor_Test, push_back_at_end)
{
    Line_Cursor lines { u8"", &memory };
    EXPECT_TRUE(lines.at_end());
    lines.push(u8"x");
    EXPECT_FALSE(lines.at_end());
    EXPECT_EQ(lines.next(), u8"x");
    EXPECT_TRUE(lines.at_end());
}

TEST_F(Line_Cursor_Test, restart)
{
    Line_Cursor lines { u8"a\nb", &memory };
    EXPECT_EQ(lines.next(), u8"a");
    EXPECT_EQ(lines.next(), u8"b");
    lines.push(u8"pushed");
    lines.restart();

    EXPECT_EQ(lines.get_line_number(), 0);
    EXPECT_EQ(lines.next(), u8"a");
    EXPECT_EQ(lines.next(), u8"b");
    EXPECT_TRUE(lines.at_end());
}

TEST_F(Line_Cursor_Test, from_lines)
{
    static constexpr std::u8string_view source[] { u8"x", u8"y" };
    Line_Cursor lines { source, &memory };
    EXPECT_EQ(lines.next(), u8"x");
    EXPECT_EQ(lines.next(), u8"y");
    EXPECT_TRUE(lines.at_end());
}

} // namespace
} // namespace nowiki
