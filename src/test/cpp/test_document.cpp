#include <memory_resource>
#include <optional>
#include <string_view>

#include <gtest/gtest.h>

#include "nowiki/document.hpp"
#include "nowiki/memory_resources.hpp"

namespace nowiki {
namespace {

struct Document_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
};

TEST_F(Document_Test, append_text_merges_adjacent_runs)
{
    Document_Node p { Node_Tag::p, &memory };
    p.append_text(u8"abc");
    p.append_text(u8"");
    p.append_text(u8"def");
    ASSERT_EQ(p.get_children_size(), 1);
    EXPECT_EQ(p.get_children()[0].get_text(), u8"abcdef");

    p.append(Node_Tag::span);
    p.append_text(u8"ghi");
    EXPECT_EQ(p.get_children_size(), 3);
}

TEST_F(Document_Test, append_empty_text_adds_nothing)
{
    Document_Node cell { Node_Tag::table_cell, &memory };
    cell.append_text(u8"");
    EXPECT_FALSE(cell.has_children());
}

TEST_F(Document_Test, set_attribute_replaces)
{
    Document_Node div { Node_Tag::div, &memory };
    EXPECT_EQ(div.get_attribute(attribute::class_), std::nullopt);

    div.set_attribute(attribute::class_, u8"a");
    div.set_attribute(attribute::class_, u8"b");
    EXPECT_EQ(div.get_attributes().size(), 1);
    EXPECT_EQ(div.get_attribute(attribute::class_), u8"b");
}

TEST_F(Document_Test, make_nowiki_structure)
{
    const Document_Node node = make_nowiki(3, u8"#!csv ,  \t", u8"a,b\n1,2", &memory);
    ASSERT_EQ(node.get_tag(), Node_Tag::nowiki);
    ASSERT_EQ(node.get_children_size(), 3);
    EXPECT_EQ(node.get_children()[0].get_text(), u8"3");
    EXPECT_EQ(node.get_children()[1].get_tag(), Node_Tag::nowiki_args);
    EXPECT_EQ(node.get_children()[1].get_children()[0].get_text(), u8"#!csv ,");
    EXPECT_EQ(node.get_children()[2].get_text(), u8"a,b\n1,2");

    const std::optional<Nowiki_View> view = view_nowiki(node);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->marker_length, 3);
    EXPECT_EQ(view->directive_line, u8"#!csv ,");
    EXPECT_EQ(view->body, u8"a,b\n1,2");
}

TEST_F(Document_Test, make_nowiki_empty)
{
    const Document_Node node = make_nowiki(4, u8"", u8"", &memory);
    const std::optional<Nowiki_View> view = view_nowiki(node);
    ASSERT_TRUE(view);
    EXPECT_EQ(view->marker_length, 4);
    EXPECT_EQ(view->directive_line, u8"");
    EXPECT_EQ(view->body, u8"");
}

TEST_F(Document_Test, view_nowiki_rejects_malformed)
{
    Document_Node missing_children { Node_Tag::nowiki, &memory };
    missing_children.append_text(u8"3");
    EXPECT_FALSE(view_nowiki(missing_children));

    Document_Node bad_marker { Node_Tag::nowiki, &memory };
    bad_marker.append(Document_Node::text(u8"three", &memory));
    bad_marker.append(Node_Tag::nowiki_args).append_text(u8"#!csv");
    bad_marker.append(Document_Node::text(u8"body", &memory));
    EXPECT_FALSE(view_nowiki(bad_marker));

    Document_Node bad_args { Node_Tag::nowiki, &memory };
    bad_args.append(Document_Node::text(u8"3", &memory));
    bad_args.append(Node_Tag::p).append_text(u8"#!csv");
    bad_args.append(Document_Node::text(u8"body", &memory));
    EXPECT_FALSE(view_nowiki(bad_args));

    const Document_Node not_nowiki { Node_Tag::p, &memory };
    EXPECT_FALSE(view_nowiki(not_nowiki));
}

TEST_F(Document_Test, equality_is_structural)
{
    const Document_Node a = make_nowiki(3, u8"#!wiki", u8"text", &memory);
    const Document_Node b = make_nowiki(3, u8"#!wiki", u8"text", &memory);
    const Document_Node c = make_nowiki(3, u8"#!wiki", u8"other", &memory);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST_F(Document_Test, count_nodes_and_text_content)
{
    Document_Node page { Node_Tag::page, &memory };
    page.append(Node_Tag::p).append_text(u8"a");
    page.append(make_nowiki(3, u8"#!csv", u8"b", &memory));
    page.append(Node_Tag::p).append_text(u8"c");

    EXPECT_EQ(count_nodes(page, Node_Tag::nowiki), 1);
    EXPECT_EQ(count_nodes(page, Node_Tag::p), 2);
    EXPECT_EQ(count_nodes(page, Node_Tag::page), 1);

    Pmr_U8string text { &memory };
    append_text_content(text, page);
    EXPECT_EQ(text, u8"a3#!csvbc");
}

} // namespace
} // namespace nowiki
