#ifndef NOWIKI_EXPANSION_HPP
#define NOWIKI_EXPANSION_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/fwd.hpp"
#include "nowiki/services.hpp"
#include "nowiki/settings.hpp"
#include "nowiki/sub_parsers.hpp"
#include "nowiki/ulight_highlighter.hpp"
#include "nowiki/wiki_block_parser.hpp"

namespace nowiki {

enum struct Expansion_Error : Default_Underlying {
    /// @brief A `nowiki` node does not have the structure produced by `make_nowiki`.
    malformed_nowiki,
    /// @brief A sub-parser for an embedded markup language failed.
    sub_parser_failed,
    /// @brief Nowiki blocks are nested more deeply than `Expansion_Options::max_depth`.
    depth_exceeded,
};

[[nodiscard]]
constexpr std::u8string_view expansion_error_name(Expansion_Error error)
{
    switch (error) {
        using enum Expansion_Error;
        NOWIKI_ENUM_STRING_CASE8(malformed_nowiki);
        NOWIKI_ENUM_STRING_CASE8(sub_parser_failed);
        NOWIKI_ENUM_STRING_CASE8(depth_exceeded);
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid error.");
}

/// @brief The message of the error block which is inserted when a nowiki block
/// cannot be expanded as requested.
/// Every occurrence of `{arguments}` is replaced with the directive line.
inline constexpr std::u8string_view default_invalid_arguments_template
    = u8"Defaulting to plain text due to invalid arguments: \"{arguments}\"";

/// @brief The class of error blocks inserted into expanded nowiki blocks.
inline constexpr std::u8string_view error_class = u8"error";

struct Expansion_Options {
    /// @brief Used for `highlight` blocks and for plain text fallbacks.
    Syntax_Highlighter& highlighter = ulight_syntax_highlighter;
    /// @brief The parsers for embedded markup languages.
    Sub_Parser_Set parsers = builtin_sub_parser_set();
    Logger& logger = ignorant_logger;
    std::u8string_view invalid_arguments_template = default_invalid_arguments_template;
    /// @brief The greatest number of expanded nowiki blocks
    /// that may enclose a nowiki block which is being expanded.
    std::size_t max_depth = default_max_expansion_depth;
    /// @brief Used for temporary allocations.
    /// New document nodes are allocated with the memory resource of the expanded node.
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
};

/// @brief Expands every `nowiki` node in the tree rooted at `root`, in place.
///
/// The tree is traversed in pre-order, from left to right.
/// Every `nowiki` node keeps its position in the tree,
/// but its children are replaced with the expanded content,
/// and its tag becomes `Node_Tag::expansion`.
/// `nowiki` nodes within the expanded content are expanded as well.
///
/// Bad directives never result in an error.
/// Instead, an error block (`div class="error"`) and the content as plain text
/// are inserted, and a warning is logged.
///
/// If an error is returned, the tree is left partially expanded.
/// Otherwise, the tree contains no `nowiki` nodes,
/// and calling `expand` again has no effect.
Result<void, Expansion_Error> expand(Document_Node& root, const Expansion_Options& options);

/// @brief Appends `message_template` to `out`,
/// with every occurrence of `{arguments}` replaced by `arguments`.
void append_invalid_arguments_message(
    Pmr_U8string& out,
    std::u8string_view message_template,
    std::u8string_view arguments
);

/// @brief Creates an error block: a `div class="error"` containing a `p` with `message`.
[[nodiscard]]
Document_Node make_error_block(std::u8string_view message, std::pmr::memory_resource* memory);

} // namespace nowiki

#endif
