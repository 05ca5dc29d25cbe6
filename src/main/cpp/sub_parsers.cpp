#include <algorithm>
#include <array>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <utility>

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/format.hpp"
#include "nowiki/line_cursor.hpp"
#include "nowiki/memory_resources.hpp"
#include "nowiki/sub_parsers.hpp"

namespace nowiki {

namespace {

// clang-format off
constexpr std::array<Sub_Parser_Descriptor, 6> descriptors {{
    { Sub_Parser_Id::wiki,      Parser_Convention::line_cursor, Argument_Mode::css_class,    {} },
    { Sub_Parser_Id::creole,    Parser_Convention::line_cursor, Argument_Mode::passthrough,  {} },
    { Sub_Parser_Id::rst,       Parser_Convention::whole_text,  Argument_Mode::content_type,
      u8"text/x-rst;charset=utf-8" },
    { Sub_Parser_Id::docbook,   Parser_Convention::whole_text,  Argument_Mode::content_type,
      u8"application/docbook+xml;charset=utf-8" },
    { Sub_Parser_Id::markdown,  Parser_Convention::whole_text,  Argument_Mode::content_type,
      u8"text/x-markdown;charset=utf-8" },
    { Sub_Parser_Id::mediawiki, Parser_Convention::whole_text,  Argument_Mode::passthrough,  {} },
}};
// clang-format on

/// @brief Wraps `root` in a `page` unless it already is one.
[[nodiscard]]
Document_Node to_page(Document_Node&& root, std::pmr::memory_resource* memory)
{
    if (root.get_tag() == Node_Tag::page) {
        return std::move(root);
    }
    Document_Node page { Node_Tag::page, memory };
    page.append(std::move(root));
    return page;
}

/// @brief The common calling convention behind which sub-parsers are invoked.
struct Sub_Parser_Strategy {
    [[nodiscard]]
    virtual Result<Document_Node, Sub_Parser_Error> invoke(
        std::u8string_view text,
        std::optional<std::u8string_view> arguments,
        std::pmr::memory_resource* memory
    ) = 0;
};

struct Line_Cursor_Strategy final : Sub_Parser_Strategy {
private:
    Block_Parser& m_parser;
    const Sub_Parser_Descriptor& m_descriptor;

public:
    [[nodiscard]]
    Line_Cursor_Strategy(Block_Parser& parser, const Sub_Parser_Descriptor& descriptor)
        : m_parser { parser }
        , m_descriptor { descriptor }
    {
    }

    [[nodiscard]]
    Result<Document_Node, Sub_Parser_Error> invoke(
        std::u8string_view text,
        std::optional<std::u8string_view> arguments,
        std::pmr::memory_resource* memory
    ) final
    {
        Line_Cursor lines { text, memory };

        Pmr_U8string css_class { memory };
        Block_Arguments block_arguments;
        switch (m_descriptor.arguments) {
        case Argument_Mode::css_class: {
            if (arguments) {
                css_class.assign(*arguments);
                std::ranges::replace(css_class, u8'/', u8' ');
                block_arguments.css_class = css_class;
            }
            break;
        }
        case Argument_Mode::passthrough: {
            block_arguments.positional = arguments;
            break;
        }
        case Argument_Mode::content_type: {
            NOWIKI_ASSERT_UNREACHABLE(u8"Block parsers take no content type.");
        }
        }

        Result<Document_Node, Sub_Parser_Error> body
            = m_parser.parse_block(lines, block_arguments, memory);
        if (!body) {
            return body.error();
        }
        Document_Node page { Node_Tag::page, memory };
        page.append(std::move(*body));
        return page;
    }
};

struct Whole_Text_Strategy final : Sub_Parser_Strategy {
private:
    Text_Parser& m_parser;
    const Sub_Parser_Descriptor& m_descriptor;

public:
    [[nodiscard]]
    Whole_Text_Strategy(Text_Parser& parser, const Sub_Parser_Descriptor& descriptor)
        : m_parser { parser }
        , m_descriptor { descriptor }
    {
    }

    [[nodiscard]]
    Result<Document_Node, Sub_Parser_Error> invoke(
        std::u8string_view text,
        std::optional<std::u8string_view> arguments,
        std::pmr::memory_resource* memory
    ) final
    {
        const std::u8string_view content_type = [&] -> std::u8string_view {
            switch (m_descriptor.arguments) {
            case Argument_Mode::content_type: return m_descriptor.content_type;
            case Argument_Mode::passthrough: return arguments.value_or(u8"");
            case Argument_Mode::css_class: break;
            }
            NOWIKI_ASSERT_UNREACHABLE(u8"Text parsers take no classes.");
        }();

        Result<Document_Node, Sub_Parser_Error> root = m_parser.parse(text, content_type, memory);
        if (!root) {
            return root.error();
        }
        return to_page(std::move(*root), memory);
    }
};

} // namespace

const Sub_Parser_Descriptor& sub_parser_descriptor(Sub_Parser_Id id)
{
    const auto index = std::size_t(id);
    NOWIKI_ASSERT(index < descriptors.size());
    NOWIKI_DEBUG_ASSERT(descriptors[index].id == id);
    return descriptors[index];
}

Block_Parser* Sub_Parser_Set::get_block_parser(Sub_Parser_Id id) const
{
    switch (id) {
    case Sub_Parser_Id::wiki: return wiki;
    case Sub_Parser_Id::creole: return creole;
    default: break;
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Not a block parser.");
}

Text_Parser* Sub_Parser_Set::get_text_parser(Sub_Parser_Id id) const
{
    switch (id) {
    case Sub_Parser_Id::rst: return rst;
    case Sub_Parser_Id::docbook: return docbook;
    case Sub_Parser_Id::markdown: return markdown;
    case Sub_Parser_Id::mediawiki: return mediawiki;
    default: break;
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Not a text parser.");
}

Result<Document_Node, Sub_Parser_Error> invoke_sub_parser(
    const Sub_Parser_Set& parsers,
    Sub_Parser_Id id,
    std::u8string_view text,
    std::optional<std::u8string_view> arguments,
    std::pmr::memory_resource* memory
)
{
    const Sub_Parser_Descriptor& descriptor = sub_parser_descriptor(id);

    switch (descriptor.convention) {
    case Parser_Convention::line_cursor: {
        Block_Parser* const parser = parsers.get_block_parser(id);
        if (!parser) {
            return Sub_Parser_Error::unavailable;
        }
        Line_Cursor_Strategy strategy { *parser, descriptor };
        return strategy.invoke(text, arguments, memory);
    }
    case Parser_Convention::whole_text: {
        Text_Parser* const parser = parsers.get_text_parser(id);
        if (!parser) {
            return Sub_Parser_Error::unavailable;
        }
        Whole_Text_Strategy strategy { *parser, descriptor };
        return strategy.invoke(text, arguments, memory);
    }
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid convention.");
}

} // namespace nowiki
