#ifndef NOWIKI_FORMAT_HPP
#define NOWIKI_FORMAT_HPP

#include <optional>
#include <string_view>
#include <variant>

#include "nowiki/util/assert.hpp"

#include "nowiki/directive.hpp"
#include "nowiki/fwd.hpp"

namespace nowiki {

/// @brief The formats of nowiki blocks which can be expanded,
/// plus `unknown` for everything else.
enum struct Nowiki_Format : Default_Underlying {
    highlight,
    csv,
    wiki,
    creole,
    rst,
    docbook,
    markdown,
    mediawiki,
    unknown,
};

/// @brief Returns the format with the given `name`.
/// Every format except `highlight` can be named by a short name (e.g. `csv`)
/// or by its mimetype (e.g. `text/csv`).
/// Matching is exact and case-sensitive.
[[nodiscard]]
Nowiki_Format nowiki_format_by_name(std::optional<std::u8string_view> name);

/// @brief The embedded markup languages handled by sub-parsers.
enum struct Sub_Parser_Id : Default_Underlying {
    wiki,
    creole,
    rst,
    docbook,
    markdown,
    mediawiki,
};

[[nodiscard]]
constexpr std::u8string_view sub_parser_id_name(Sub_Parser_Id id)
{
    switch (id) {
        using enum Sub_Parser_Id;
        NOWIKI_ENUM_STRING_CASE8(wiki);
        NOWIKI_ENUM_STRING_CASE8(creole);
        NOWIKI_ENUM_STRING_CASE8(rst);
        NOWIKI_ENUM_STRING_CASE8(docbook);
        NOWIKI_ENUM_STRING_CASE8(markdown);
        NOWIKI_ENUM_STRING_CASE8(mediawiki);
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid sub-parser.");
}

/// @brief Syntax highlighting of the content, with a language name or mimetype hint.
struct Highlight_Spec {
    std::u8string_view language;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlight_Spec&, const Highlight_Spec&)
        = default;
};

/// @brief Conversion of the content from separated values to a table.
struct Table_Spec {
    std::u8string_view separator;

    [[nodiscard]]
    friend constexpr bool operator==(const Table_Spec&, const Table_Spec&)
        = default;
};

/// @brief Parsing of the content by the sub-parser for an embedded markup language.
struct Sub_Parser_Spec {
    Sub_Parser_Id parser;
    std::optional<std::u8string_view> arguments;

    [[nodiscard]]
    friend constexpr bool operator==(const Sub_Parser_Spec&, const Sub_Parser_Spec&)
        = default;
};

/// @brief The format is not known, which results in an error and a plain text fallback.
struct Unknown_Format_Spec {

    [[nodiscard]]
    friend constexpr bool operator==(const Unknown_Format_Spec&, const Unknown_Format_Spec&)
        = default;
};

using Format_Resolution = std::variant<Highlight_Spec, Table_Spec, Sub_Parser_Spec, Unknown_Format_Spec>;

/// @brief Determines how a nowiki block with the given `directive` is expanded.
[[nodiscard]]
Format_Resolution resolve_format(const Directive& directive);

} // namespace nowiki

#endif
