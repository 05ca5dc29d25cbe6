#ifndef NOWIKI_SUB_PARSERS_HPP
#define NOWIKI_SUB_PARSERS_HPP

#include <memory_resource>
#include <optional>
#include <string_view>

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/format.hpp"
#include "nowiki/fwd.hpp"
#include "nowiki/line_cursor.hpp"

namespace nowiki {

enum struct Sub_Parser_Error : Default_Underlying {
    /// @brief No parser for the requested language was provided.
    unavailable,
    /// @brief The parser rejected its input.
    bad_input,
    /// @brief Something else went wrong.
    other,
};

[[nodiscard]]
constexpr std::u8string_view sub_parser_error_name(Sub_Parser_Error error)
{
    switch (error) {
        using enum Sub_Parser_Error;
        NOWIKI_ENUM_STRING_CASE8(unavailable);
        NOWIKI_ENUM_STRING_CASE8(bad_input);
        NOWIKI_ENUM_STRING_CASE8(other);
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid error.");
}

/// @brief Arguments passed to a `Block_Parser`.
struct Block_Arguments {
    /// @brief The raw argument string, if any.
    std::optional<std::u8string_view> positional;
    /// @brief The value of the `class` attribute of the parsed body,
    /// or an empty string if none.
    std::u8string_view css_class;
};

/// @brief A line-oriented parser which parses a block of markup from a `Line_Cursor`.
struct Block_Parser {
    /// @brief Parses lines from `lines` until the end of the block.
    /// @returns The parsed body.
    [[nodiscard]]
    virtual Result<Document_Node, Sub_Parser_Error> parse_block(
        Line_Cursor& lines,
        const Block_Arguments& arguments,
        std::pmr::memory_resource* memory
    ) = 0;
};

/// @brief A parser which parses a whole document of markup at once.
struct Text_Parser {
    /// @brief Parses `text`.
    /// @param content_type The content type of `text`,
    /// such as `text/x-rst;charset=utf-8`, or a parser-specific argument string.
    /// @returns The root of the parsed document, typically a `page`.
    [[nodiscard]]
    virtual Result<Document_Node, Sub_Parser_Error> parse(
        std::u8string_view text,
        std::u8string_view content_type,
        std::pmr::memory_resource* memory
    ) = 0;
};

/// @brief The way in which a sub-parser consumes its input.
enum struct Parser_Convention : Default_Underlying {
    /// @brief Via `Block_Parser`.
    line_cursor,
    /// @brief Via `Text_Parser`.
    whole_text,
};

/// @brief The way in which the arguments of a nowiki directive are passed to a sub-parser.
enum struct Argument_Mode : Default_Underlying {
    /// @brief The arguments are a space-separated list of classes,
    /// where `/` is also accepted as a separator.
    css_class,
    /// @brief The arguments are passed as is.
    passthrough,
    /// @brief The arguments are ignored;
    /// a fixed content type is passed instead.
    content_type,
};

struct Sub_Parser_Descriptor {
    Sub_Parser_Id id;
    Parser_Convention convention;
    Argument_Mode arguments;
    /// @brief For `Argument_Mode::content_type`, the content type passed to the parser.
    std::u8string_view content_type;
};

/// @brief Returns the descriptor which determines how the sub-parser with the given `id`
/// is invoked.
[[nodiscard]]
const Sub_Parser_Descriptor& sub_parser_descriptor(Sub_Parser_Id id);

/// @brief The set of sub-parsers available for expansion.
/// This is typically set up once when the host starts,
/// and treated as immutable afterwards.
/// Any parser may be null, in which case it is unavailable.
struct Sub_Parser_Set {
    Block_Parser* wiki = nullptr;
    Block_Parser* creole = nullptr;
    Text_Parser* rst = nullptr;
    Text_Parser* docbook = nullptr;
    Text_Parser* markdown = nullptr;
    Text_Parser* mediawiki = nullptr;

    /// @brief Returns the block parser with the given `id`, or null.
    /// `sub_parser_descriptor(id).convention` shall be `Parser_Convention::line_cursor`.
    [[nodiscard]]
    Block_Parser* get_block_parser(Sub_Parser_Id id) const;

    /// @brief Returns the text parser with the given `id`, or null.
    /// `sub_parser_descriptor(id).convention` shall be `Parser_Convention::whole_text`.
    [[nodiscard]]
    Text_Parser* get_text_parser(Sub_Parser_Id id) const;
};

inline constexpr Sub_Parser_Set empty_sub_parser_set {};

/// @brief Invokes the sub-parser with the given `id` on `text`,
/// passing `arguments` as described by `sub_parser_descriptor(id)`.
/// @returns A `page` node containing the parsed document,
/// `Sub_Parser_Error::unavailable` if `parsers` contains no such parser,
/// or any error returned by the parser.
[[nodiscard]]
Result<Document_Node, Sub_Parser_Error> invoke_sub_parser(
    const Sub_Parser_Set& parsers,
    Sub_Parser_Id id,
    std::u8string_view text,
    std::optional<std::u8string_view> arguments,
    std::pmr::memory_resource* memory
);

} // namespace nowiki

#endif
