#ifndef NOWIKI_DIAGNOSTIC_HPP
#define NOWIKI_DIAGNOSTIC_HPP

#include <string_view>

#include "nowiki/util/severity.hpp"

#include "nowiki/fwd.hpp"

namespace nowiki {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

/// @brief A nowiki block is about to be expanded.
inline constexpr std::u8string_view expand = u8"nowiki.expand";

/// @brief The format of a nowiki block is not recognized,
/// or the directive line does not begin with `#!`.
inline constexpr std::u8string_view format_unknown = u8"nowiki.format.unknown";

/// @brief In a `highlight` nowiki block,
/// the given language is neither a supported language nor a supported mimetype.
inline constexpr std::u8string_view highlight_language = u8"nowiki.highlight.language";
/// @brief In a `highlight` nowiki block,
/// the code could not be highlighted because it is malformed or highlighting failed otherwise.
inline constexpr std::u8string_view highlight_error = u8"nowiki.highlight.error";

/// @brief The sub-parser for an embedded markup language was not provided.
inline constexpr std::u8string_view parser_unavailable = u8"nowiki.parser.unavailable";
/// @brief The sub-parser for an embedded markup language failed.
inline constexpr std::u8string_view parser_failed = u8"nowiki.parser.failed";

/// @brief A `nowiki` node does not have the expected structure.
inline constexpr std::u8string_view malformed = u8"nowiki.malformed";

/// @brief Nowiki blocks are nested too deeply within the output of other nowiki blocks.
inline constexpr std::u8string_view depth = u8"nowiki.depth";

} // namespace diagnostic

} // namespace nowiki

#endif
