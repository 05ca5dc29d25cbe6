#ifndef NOWIKI_WIKI_BLOCK_PARSER_HPP
#define NOWIKI_WIKI_BLOCK_PARSER_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>

#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/fwd.hpp"
#include "nowiki/line_cursor.hpp"
#include "nowiki/sub_parsers.hpp"

namespace nowiki {

/// @brief The minimum number of braces that open a nowiki block, as in `{{{`.
inline constexpr std::size_t min_nowiki_marker_length = 3;

/// @brief If `line` opens a nowiki block, such as `{{{#!csv`,
/// returns the number of leading `{`.
/// Otherwise, returns zero.
[[nodiscard]]
std::size_t match_nowiki_open(std::u8string_view line);

/// @brief Returns `true` if `line` closes a nowiki block that was opened with
/// `marker_length` braces.
/// That is, `line` consists of exactly `marker_length` `}`,
/// possibly followed by blank characters.
[[nodiscard]]
bool is_nowiki_close(std::u8string_view line, std::size_t marker_length);

/// @brief If `line` is a heading, such as `== Title ==`,
/// returns the level of the heading (one to six).
/// Otherwise, returns zero.
[[nodiscard]]
std::size_t match_heading(std::u8string_view line);

/// @brief A `Block_Parser` for the block structure of moin wiki markup.
///
/// The following constructs are recognized:
///   - paragraphs, separated by blank lines,
///   - headings like `= Title =` through `====== Title ======`,
///   - nowiki blocks like `{{{#!format arguments` ... `}}}`,
///     which become `nowiki` nodes to be expanded later.
/// A nowiki block ends at a line with exactly as many `}` as the block was opened with `{`,
/// so blocks can be nested by using longer markers for the outer blocks.
///
/// Inline markup is not interpreted; paragraph text is kept as is.
struct Wiki_Block_Parser final : Block_Parser {
    [[nodiscard]]
    Result<Document_Node, Sub_Parser_Error> parse_block(
        Line_Cursor& lines,
        const Block_Arguments& arguments,
        std::pmr::memory_resource* memory
    ) final;
};

inline constinit Wiki_Block_Parser wiki_block_parser;

/// @brief Returns a `Sub_Parser_Set` containing the parsers built into this library,
/// which is only `wiki_block_parser` at this point.
[[nodiscard]]
inline Sub_Parser_Set builtin_sub_parser_set()
{
    return Sub_Parser_Set { .wiki = &wiki_block_parser };
}

} // namespace nowiki

#endif
