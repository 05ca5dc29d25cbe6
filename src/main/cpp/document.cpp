#include <charconv>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "nowiki/util/assert.hpp"
#include "nowiki/util/strings.hpp"

#include "nowiki/document.hpp"
#include "nowiki/memory_resources.hpp"

namespace nowiki {

Document_Node::Document_Node(Node_Tag tag, std::pmr::memory_resource* memory)
    : m_tag { tag }
    , m_text { memory }
    , m_attributes { memory }
    , m_children { memory }
{
}

Document_Node Document_Node::text(std::u8string_view text, std::pmr::memory_resource* memory)
{
    Document_Node result { Node_Tag::text, memory };
    result.m_text.assign(text);
    return result;
}

Document_Node::Document_Node(const Document_Node&) = default;
Document_Node::Document_Node(Document_Node&&) noexcept = default;

Document_Node& Document_Node::operator=(const Document_Node&) = default;
Document_Node& Document_Node::operator=(Document_Node&&) noexcept = default;

Document_Node::~Document_Node() = default;

bool Document_Node::operator==(const Document_Node& other) const = default;

std::optional<std::u8string_view> Document_Node::get_attribute(std::u8string_view key) const
{
    for (const Attribute& a : m_attributes) {
        if (a.key == key) {
            return std::u8string_view { a.value };
        }
    }
    return {};
}

void Document_Node::set_attribute(std::u8string_view key, std::u8string_view value)
{
    NOWIKI_ASSERT(!is_text());
    for (Attribute& a : m_attributes) {
        if (a.key == key) {
            a.value.assign(value);
            return;
        }
    }
    std::pmr::memory_resource* const memory = get_memory();
    m_attributes.push_back({ Pmr_U8string { key, memory }, Pmr_U8string { value, memory } });
}

Document_Node& Document_Node::append(Document_Node&& child)
{
    NOWIKI_ASSERT(!is_text());
    return m_children.emplace_back(std::move(child));
}

void Document_Node::append_text(std::u8string_view text)
{
    NOWIKI_ASSERT(!is_text());
    if (text.empty()) {
        return;
    }
    if (!m_children.empty() && m_children.back().is_text()) {
        m_children.back().append_to_text(text);
        return;
    }
    m_children.push_back(Document_Node::text(text, get_memory()));
}

void Document_Node::replace_children(Pmr_Vector<Document_Node>&& children)
{
    NOWIKI_ASSERT(!is_text());
    m_children = std::move(children);
}

Document_Node make_nowiki(
    std::size_t marker_length,
    std::u8string_view directive_line,
    std::u8string_view body,
    std::pmr::memory_resource* memory
)
{
    char marker_chars[24];
    const std::to_chars_result marker_result
        = std::to_chars(marker_chars, marker_chars + sizeof(marker_chars), marker_length);
    NOWIKI_ASSERT(marker_result.ec == std::errc {});
    const std::string_view marker_string { marker_chars, marker_result.ptr };

    Document_Node result { Node_Tag::nowiki, memory };
    result.append(Document_Node::text(as_u8string_view(marker_string), memory));
    Document_Node& args = result.append(Node_Tag::nowiki_args);
    args.append(Document_Node::text(trim_ascii_blank_right(directive_line), memory));
    result.append(Document_Node::text(body, memory));
    return result;
}

std::optional<Nowiki_View> view_nowiki(const Document_Node& node)
{
    if (node.get_tag() != Node_Tag::nowiki) {
        return {};
    }
    const std::span<const Document_Node> children = node.get_children();
    if (children.size() != 3) {
        return {};
    }

    const Document_Node& marker = children[0];
    const Document_Node& args = children[1];
    const Document_Node& body = children[2];
    if (!marker.is_text() || !body.is_text() || args.get_tag() != Node_Tag::nowiki_args
        || args.get_children_size() != 1 || !args.get_children()[0].is_text()) {
        return {};
    }

    const std::string_view marker_string = as_string_view(marker.get_text());
    std::size_t marker_length = 0;
    const std::from_chars_result marker_result = std::from_chars(
        marker_string.data(), marker_string.data() + marker_string.size(), marker_length
    );
    if (marker_result.ec != std::errc {}
        || marker_result.ptr != marker_string.data() + marker_string.size()) {
        return {};
    }

    return Nowiki_View {
        .marker_length = marker_length,
        .directive_line = args.get_children()[0].get_text(),
        .body = body.get_text(),
    };
}

std::size_t count_nodes(const Document_Node& root, Node_Tag tag)
{
    std::size_t result = 0;
    std::vector<const Document_Node*> stack { &root };
    while (!stack.empty()) {
        const Document_Node* const node = stack.back();
        stack.pop_back();
        result += node->get_tag() == tag;
        for (const Document_Node& child : node->get_children()) {
            stack.push_back(&child);
        }
    }
    return result;
}

void append_text_content(Pmr_U8string& out, const Document_Node& root)
{
    if (root.is_text()) {
        out.append(root.get_text());
        return;
    }
    for (const Document_Node& child : root.get_children()) {
        append_text_content(out, child);
    }
}

} // namespace nowiki
