#ifndef NOWIKI_DOCUMENT_HPP
#define NOWIKI_DOCUMENT_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>

#include "nowiki/util/assert.hpp"

#include "nowiki/fwd.hpp"
#include "nowiki/memory_resources.hpp"

namespace nowiki {

enum struct Node_Tag : Default_Underlying {
    /// @brief A leaf text run.
    text,
    /// @brief The root of a (sub-)document.
    page,
    /// @brief The body of a parsed block of markup.
    body,
    /// @brief A generic block.
    div,
    /// @brief A paragraph.
    p,
    /// @brief A heading, with an `outline-level` attribute.
    h,
    /// @brief A code block.
    blockcode,
    /// @brief A generic inline element, such as a highlighted token.
    span,
    table,
    table_header,
    table_body,
    table_row,
    table_cell,
    /// @brief An unexpanded raw block, awaiting format-specific expansion.
    /// @see make_nowiki
    nowiki,
    /// @brief The container of the directive line in a `nowiki` node.
    nowiki_args,
    /// @brief A former `nowiki` node whose content has been expanded.
    expansion,
};

[[nodiscard]]
constexpr std::u8string_view node_tag_name(Node_Tag tag)
{
    using enum Node_Tag;
    switch (tag) {
    case text: return u8"text";
    case page: return u8"page";
    case body: return u8"body";
    case div: return u8"div";
    case p: return u8"p";
    case h: return u8"h";
    case blockcode: return u8"blockcode";
    case span: return u8"span";
    case table: return u8"table";
    case table_header: return u8"table-header";
    case table_body: return u8"table-body";
    case table_row: return u8"table-row";
    case table_cell: return u8"table-cell";
    case nowiki: return u8"nowiki";
    case nowiki_args: return u8"nowiki-args";
    case expansion: return u8"expansion";
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid node tag.");
}

namespace attribute {

inline constexpr std::u8string_view class_ = u8"class";
inline constexpr std::u8string_view outline_level = u8"outline-level";

} // namespace attribute

struct Attribute {
    Pmr_U8string key;
    Pmr_U8string value;

    [[nodiscard]]
    friend bool operator==(const Attribute&, const Attribute&)
        = default;
};

/// @brief A node in a document tree.
/// Every node exclusively owns its children.
/// Leaf text runs are nodes with the tag `Node_Tag::text`,
/// which have text but never any children or attributes.
struct Document_Node {
private:
    Node_Tag m_tag;
    Pmr_U8string m_text;
    Pmr_Vector<Attribute> m_attributes;
    Pmr_Vector<Document_Node> m_children;

public:
    [[nodiscard]]
    explicit Document_Node(Node_Tag tag, std::pmr::memory_resource* memory);

    /// @brief Creates a leaf text run.
    [[nodiscard]]
    static Document_Node text(std::u8string_view text, std::pmr::memory_resource* memory);

    [[nodiscard]]
    Document_Node(const Document_Node&);
    [[nodiscard]]
    Document_Node(Document_Node&&) noexcept;

    Document_Node& operator=(const Document_Node&);
    Document_Node& operator=(Document_Node&&) noexcept;

    ~Document_Node();

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return m_children.get_allocator().resource;
    }

    [[nodiscard]]
    Node_Tag get_tag() const
    {
        return m_tag;
    }

    /// @brief Changes the tag of a node.
    /// Neither the old nor the new tag shall be `Node_Tag::text`.
    void set_tag(Node_Tag tag)
    {
        NOWIKI_ASSERT(m_tag != Node_Tag::text && tag != Node_Tag::text);
        m_tag = tag;
    }

    [[nodiscard]]
    bool is_text() const
    {
        return m_tag == Node_Tag::text;
    }

    [[nodiscard]]
    std::u8string_view get_text() const
    {
        NOWIKI_ASSERT(is_text());
        return m_text;
    }

    /// @brief Appends `text` to the text of a leaf text run.
    void append_to_text(std::u8string_view text)
    {
        NOWIKI_ASSERT(is_text());
        m_text.append(text);
    }

    [[nodiscard]]
    std::span<const Attribute> get_attributes() const
    {
        return m_attributes;
    }

    /// @brief Returns the value of the attribute with the given `key`,
    /// or `std::nullopt` if there is no such attribute.
    [[nodiscard]]
    std::optional<std::u8string_view> get_attribute(std::u8string_view key) const;

    /// @brief Sets the attribute with the given `key` to `value`,
    /// replacing the value of any existing attribute with the same key.
    void set_attribute(std::u8string_view key, std::u8string_view value);

    [[nodiscard]]
    std::span<Document_Node> get_children()
    {
        return m_children;
    }

    [[nodiscard]]
    std::span<const Document_Node> get_children() const
    {
        return m_children;
    }

    [[nodiscard]]
    std::size_t get_children_size() const
    {
        return m_children.size();
    }

    [[nodiscard]]
    bool has_children() const
    {
        return !m_children.empty();
    }

    /// @brief Appends `child` and returns a reference to the appended node.
    /// Note that this reference (like references to any other child)
    /// is invalidated by further modification of the children.
    Document_Node& append(Document_Node&& child);

    /// @brief Appends a new child with the given tag.
    Document_Node& append(Node_Tag tag)
    {
        return append(Document_Node { tag, get_memory() });
    }

    /// @brief Appends a leaf text run,
    /// or extends the last child if it is already a text run.
    /// Empty `text` is not appended.
    void append_text(std::u8string_view text);

    void clear_children()
    {
        m_children.clear();
    }

    /// @brief Replaces all children with `children`.
    void replace_children(Pmr_Vector<Document_Node>&& children);

    /// @brief Returns `true` iff both trees have the same tags, texts, attributes
    /// (in the same order), and children.
    [[nodiscard]]
    bool operator==(const Document_Node& other) const;
};

/// @brief The components of a well-formed `nowiki` node.
struct Nowiki_View {
    std::size_t marker_length;
    std::u8string_view directive_line;
    std::u8string_view body;
};

/// @brief Creates a `nowiki` node with three children:
/// a text run holding the decimal `marker_length`,
/// a `nowiki_args` node holding `directive_line` (with trailing blanks removed),
/// and a text run holding the `body`.
[[nodiscard]]
Document_Node make_nowiki(
    std::size_t marker_length,
    std::u8string_view directive_line,
    std::u8string_view body,
    std::pmr::memory_resource* memory
);

/// @brief Inspects a `nowiki` node.
/// @returns The components of `node`,
/// or `std::nullopt` if `node` is not a well-formed `nowiki` node.
[[nodiscard]]
std::optional<Nowiki_View> view_nowiki(const Document_Node& node);

/// @brief Returns the number of nodes with the given `tag` in the tree, including `root`.
[[nodiscard]]
std::size_t count_nodes(const Document_Node& root, Node_Tag tag);

/// @brief Appends the concatenated text of all text runs in the tree to `out`.
void append_text_content(Pmr_U8string& out, const Document_Node& root);

} // namespace nowiki

#endif
