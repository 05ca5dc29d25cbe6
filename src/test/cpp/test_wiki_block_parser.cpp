#include <memory_resource>
#include <optional>
#include <string_view>
#include <utility>

#include <gtest/gtest.h>

#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/line_cursor.hpp"
#include "nowiki/print.hpp"
#include "nowiki/sub_parsers.hpp"
#include "nowiki/wiki_block_parser.hpp"

namespace nowiki {
namespace {

struct Wiki_Block_Parser_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;

    [[nodiscard]]
    Document_Node parse(std::u8string_view text, std::u8string_view css_class = u8"")
    {
        Line_Cursor lines { text, &memory };
        const Block_Arguments arguments { .positional = {}, .css_class = css_class };
        Result<Document_Node, Sub_Parser_Error> result
            = wiki_block_parser.parse_block(lines, arguments, &memory);
        EXPECT_TRUE(result);
        EXPECT_TRUE(lines.at_end());
        return std::move(*result);
    }
};

TEST(Wiki_Block_Parser, match_nowiki_open)
{
    EXPECT_EQ(match_nowiki_open(u8"{{{"), 3);
    EXPECT_EQ(match_nowiki_open(u8"{{{#!csv"), 3);
    EXPECT_EQ(match_nowiki_open(u8"{{{{{#!wiki"), 5);
    EXPECT_EQ(match_nowiki_open(u8"{{"), 0);
    EXPECT_EQ(match_nowiki_open(u8" {{{"), 0);
    EXPECT_EQ(match_nowiki_open(u8"text"), 0);
    EXPECT_EQ(match_nowiki_open(u8"{{{inline}}}"), 0);
}

TEST(Wiki_Block_Parser, is_nowiki_close)
{
    EXPECT_TRUE(is_nowiki_close(u8"}}}", 3));
    EXPECT_TRUE(is_nowiki_close(u8"}}}  ", 3));
    EXPECT_FALSE(is_nowiki_close(u8"}}}}", 3));
    EXPECT_FALSE(is_nowiki_close(u8"}}}", 4));
    EXPECT_FALSE(is_nowiki_close(u8" }}}", 3));
    EXPECT_FALSE(is_nowiki_close(u8"}}} x", 3));
}

TEST(Wiki_Block_Parser, match_heading)
{
    EXPECT_EQ(match_heading(u8"= Title ="), 1);
    EXPECT_EQ(match_heading(u8"=== Sub title ==="), 3);
    EXPECT_EQ(match_heading(u8"====== Deep ======"), 6);
    EXPECT_EQ(match_heading(u8"======= Too deep ======="), 0);
    EXPECT_EQ(match_heading(u8"== Unbalanced ="), 0);
    EXPECT_EQ(match_heading(u8"== Unbalanced ==="), 0);
    EXPECT_EQ(match_heading(u8"==NoSpace=="), 0);
    EXPECT_EQ(match_heading(u8"=  ="), 0);
    EXPECT_EQ(match_heading(u8"a = b ="), 0);
}

TEST_F(Wiki_Block_Parser_Test, paragraphs)
{
    const Document_Node body = parse(u8"first\nstill first\n\n  \nsecond");

    Document_Node expected { Node_Tag::body, &memory };
    expected.append(Node_Tag::p).append_text(u8"first\nstill first");
    expected.append(Node_Tag::p).append_text(u8"second");
    EXPECT_EQ(body, expected);
}

TEST_F(Wiki_Block_Parser_Test, empty)
{
    const Document_Node body = parse(u8"");
    EXPECT_EQ(body.get_tag(), Node_Tag::body);
    EXPECT_FALSE(body.has_children());
}

TEST_F(Wiki_Block_Parser_Test, heading)
{
    const Document_Node body = parse(u8"intro\n== Title ==\nafter");

    Document_Node expected { Node_Tag::body, &memory };
    expected.append(Node_Tag::p).append_text(u8"intro");
    {
        Document_Node& h = expected.append(Node_Tag::h);
        h.set_attribute(attribute::outline_level, u8"2");
        h.append_text(u8"Title");
    }
    expected.append(Node_Tag::p).append_text(u8"after");
    EXPECT_EQ(body, expected);
}

TEST_F(Wiki_Block_Parser_Test, css_class)
{
    const Document_Node body = parse(u8"text", u8"red solid");
    EXPECT_EQ(body.get_attribute(attribute::class_), u8"red solid");
}

TEST_F(Wiki_Block_Parser_Test, nowiki_block)
{
    const Document_Node body = parse(u8"before\n{{{#!csv ,\na,b\n1,2\n}}}\nafter");

    Document_Node expected { Node_Tag::body, &memory };
    expected.append(Node_Tag::p).append_text(u8"before");
    expected.append(make_nowiki(3, u8"#!csv ,", u8"a,b\n1,2", &memory));
    expected.append(Node_Tag::p).append_text(u8"after");
    EXPECT_EQ(body, expected);
}

TEST_F(Wiki_Block_Parser_Test, nested_nowiki_blocks_use_longer_markers)
{
    const Document_Node body = parse(u8"{{{{#!wiki\n{{{#!csv\na;b\n}}}\n}}}}");

    Document_Node expected { Node_Tag::body, &memory };
    expected.append(make_nowiki(4, u8"#!wiki", u8"{{{#!csv\na;b\n}}}", &memory));
    EXPECT_EQ(body, expected);
}

TEST_F(Wiki_Block_Parser_Test, unterminated_nowiki_block)
{
    const Document_Node body = parse(u8"{{{#!highlight x\nxx\n\nx");

    Document_Node expected { Node_Tag::body, &memory };
    expected.append(make_nowiki(3, u8"#!highlight x", u8"xx\n\nx", &memory));
    EXPECT_EQ(body, expected);
}

TEST_F(Wiki_Block_Parser_Test, nowiki_block_without_directive)
{
    const Document_Node body = parse(u8"{{{\nraw\n}}}");

    Document_Node expected { Node_Tag::body, &memory };
    expected.append(make_nowiki(3, u8"", u8"raw", &memory));
    EXPECT_EQ(body, expected);
}

} // namespace
} // namespace nowiki
