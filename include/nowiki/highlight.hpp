#ifndef NOWIKI_HIGHLIGHT_HPP
#define NOWIKI_HIGHLIGHT_HPP

#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>

#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/fwd.hpp"
#include "nowiki/services.hpp"

namespace nowiki {

/// @brief The class of code blocks produced by syntax highlighting.
inline constexpr std::u8string_view highlight_class = u8"highlight";

enum struct Lexer_Kind : Default_Underlying {
    /// @brief Plain text, which is never highlighted.
    plain_text,
    /// @brief A language supported by a `Syntax_Highlighter`.
    language,
};

/// @brief A resolved lexer.
struct Lexer {
    Lexer_Kind kind;
    /// @brief For `Lexer_Kind::language`,
    /// the name of the language within the `Syntax_Highlighter`.
    std::u8string_view language;

    [[nodiscard]]
    friend constexpr bool operator==(const Lexer&, const Lexer&)
        = default;
};

/// @brief The plain text lexer, which is always available.
inline constexpr Lexer plain_text_lexer { Lexer_Kind::plain_text, u8"text" };

/// @brief Language names that always refer to `plain_text_lexer`.
inline constexpr std::u8string_view plain_text_names[] {
    u8"text",
    u8"txt",
    u8"plain",
    u8"plaintext",
};

/// @brief Resolves a lexer by language name.
/// The names in `plain_text_names` always succeed.
[[nodiscard]]
std::optional<Lexer> find_lexer_by_name(const Syntax_Highlighter& highlighter, std::u8string_view name);

/// @brief Resolves a lexer by mimetype.
/// `text/plain` always succeeds.
[[nodiscard]]
std::optional<Lexer>
find_lexer_by_mimetype(const Syntax_Highlighter& highlighter, std::u8string_view mimetype);

/// @brief Resolves a lexer first by name, then by mimetype.
[[nodiscard]]
inline std::optional<Lexer>
find_lexer(const Syntax_Highlighter& highlighter, std::u8string_view name_or_mimetype)
{
    if (std::optional<Lexer> result = find_lexer_by_name(highlighter, name_or_mimetype)) {
        return result;
    }
    return find_lexer_by_mimetype(highlighter, name_or_mimetype);
}

/// @brief Appends the highlighted `code` to `out`.
/// Every highlighted token becomes a `span` whose `class` is the short name
/// of the µlight highlight type, such as `kw` for keywords,
/// and text between tokens becomes text runs.
/// @param highlights The tokens, sorted by position and non-overlapping.
void append_highlighted(
    Document_Node& out,
    std::u8string_view code,
    std::span<const Highlight_Span> highlights
);

struct Highlight_Result {
    Document_Node block;
    Result<void, Syntax_Highlight_Error> status;
};

/// @brief Produces a `blockcode` node with `class=highlight` containing `code`,
/// highlighted by `lexer`.
/// If highlighting fails, the block contains the code without highlighting,
/// and the error is returned alongside it.
[[nodiscard]]
Highlight_Result highlight_block(
    std::u8string_view code,
    const Lexer& lexer,
    Syntax_Highlighter& highlighter,
    std::pmr::memory_resource* memory
);

} // namespace nowiki

#endif
