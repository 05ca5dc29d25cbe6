#include <cstddef>
#include <ostream>
#include <string_view>

#include "nowiki/util/strings.hpp"

#include "nowiki/document.hpp"
#include "nowiki/memory_resources.hpp"
#include "nowiki/print.hpp"

namespace nowiki {

namespace {

void append_quoted(Pmr_U8string& out, std::u8string_view text)
{
    out.push_back(u8'"');
    for (const char8_t c : text) {
        switch (c) {
        case u8'\\': out.append(u8"\\\\"); break;
        case u8'"': out.append(u8"\\\""); break;
        case u8'\n': out.append(u8"\\n"); break;
        case u8'\r': out.append(u8"\\r"); break;
        case u8'\t': out.append(u8"\\t"); break;
        default: out.push_back(c); break;
        }
    }
    out.push_back(u8'"');
}

void print_node(Pmr_U8string& out, const Document_Node& node, std::size_t depth)
{
    out.append(depth * 2, u8' ');
    if (node.is_text()) {
        append_quoted(out, node.get_text());
        out.push_back(u8'\n');
        return;
    }

    out.append(node_tag_name(node.get_tag()));
    for (const Attribute& a : node.get_attributes()) {
        out.push_back(u8' ');
        out.append(a.key);
        out.push_back(u8'=');
        append_quoted(out, a.value);
    }
    out.push_back(u8'\n');

    for (const Document_Node& child : node.get_children()) {
        print_node(out, child, depth + 1);
    }
}

} // namespace

void print_document(Pmr_U8string& out, const Document_Node& node)
{
    print_node(out, node, 0);
}

std::ostream& operator<<(std::ostream& out, const Document_Node& node)
{
    Pmr_U8string text { node.get_memory() };
    print_document(text, node);
    return out << as_string_view(text);
}

} // namespace nowiki
