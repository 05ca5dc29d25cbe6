#ifndef NOWIKI_ULIGHT_HIGHLIGHTER_HPP
#define NOWIKI_ULIGHT_HIGHLIGHTER_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "nowiki/fwd.hpp"
#include "nowiki/services.hpp"

namespace nowiki {

/// @brief A `Syntax_Highlighter` that uses the µlight library.
///
/// Besides the language names known to µlight,
/// this understands a few names of the older highlighting conventions in wiki markup
/// (such as `cplusplus`) and common mimetypes (such as `text/x-python`).
struct Ulight_Syntax_Highlighter final : Syntax_Highlighter {

    [[nodiscard]]
    std::span<const std::u8string_view> get_supported_languages() const final;

    [[nodiscard]]
    Distant<std::u8string_view>
    match_supported_language(std::u8string_view language, std::pmr::memory_resource* memory)
        const final;

    [[nodiscard]]
    std::u8string_view find_language(std::u8string_view name) const final;

    [[nodiscard]]
    std::u8string_view find_language_for_mimetype(std::u8string_view mimetype) const final;

    [[nodiscard]]
    Result<void, Syntax_Highlight_Error> operator()( //
        std::pmr::vector<Highlight_Span>& out,
        std::u8string_view code,
        std::u8string_view language,
        std::pmr::memory_resource* memory
    ) final;
};

inline constinit Ulight_Syntax_Highlighter ulight_syntax_highlighter;

} // namespace nowiki

#endif
