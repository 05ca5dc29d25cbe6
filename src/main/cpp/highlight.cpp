#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "ulight/ulight.hpp"

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"

#include "nowiki/document.hpp"
#include "nowiki/highlight.hpp"
#include "nowiki/services.hpp"

namespace nowiki {

std::optional<Lexer> find_lexer_by_name(const Syntax_Highlighter& highlighter, std::u8string_view name)
{
    if (name.empty()) {
        return {};
    }
    if (std::ranges::find(plain_text_names, name) != std::ranges::end(plain_text_names)) {
        return plain_text_lexer;
    }
    const std::u8string_view language = highlighter.find_language(name);
    if (language.empty()) {
        return {};
    }
    return Lexer { Lexer_Kind::language, language };
}

std::optional<Lexer>
find_lexer_by_mimetype(const Syntax_Highlighter& highlighter, std::u8string_view mimetype)
{
    if (mimetype.empty()) {
        return {};
    }
    if (mimetype == u8"text/plain") {
        return plain_text_lexer;
    }
    const std::u8string_view language = highlighter.find_language_for_mimetype(mimetype);
    if (language.empty()) {
        return {};
    }
    return Lexer { Lexer_Kind::language, language };
}

void append_highlighted(
    Document_Node& out,
    std::u8string_view code,
    std::span<const Highlight_Span> highlights
)
{
    std::size_t index = 0;
    for (const Highlight_Span& highlight : highlights) {
        NOWIKI_ASSERT(highlight.begin >= index);
        NOWIKI_ASSERT(highlight.begin + highlight.length <= code.length());
        if (highlight.length == 0) {
            continue;
        }

        // Leading non-highlighted content.
        if (highlight.begin > index) {
            out.append_text(code.substr(index, highlight.begin - index));
        }

        const std::u8string_view id
            = ulight::highlight_type_short_string_u8(ulight::Highlight_Type(highlight.type));
        Document_Node& span = out.append(Node_Tag::span);
        span.set_attribute(attribute::class_, id);
        span.append_text(code.substr(highlight.begin, highlight.length));
        index = highlight.begin + highlight.length;
    }

    if (index < code.length()) {
        out.append_text(code.substr(index));
    }
}

Highlight_Result highlight_block(
    std::u8string_view code,
    const Lexer& lexer,
    Syntax_Highlighter& highlighter,
    std::pmr::memory_resource* memory
)
{
    Highlight_Result result { .block = Document_Node { Node_Tag::blockcode, memory }, .status = {} };
    result.block.set_attribute(attribute::class_, highlight_class);

    if (lexer.kind == Lexer_Kind::plain_text) {
        result.block.append_text(code);
        return result;
    }

    std::pmr::vector<Highlight_Span> highlights { memory };
    result.status = highlighter(highlights, code, lexer.language, memory);
    if (!result.status) {
        result.block.append_text(code);
        return result;
    }
    append_highlighted(result.block, code, highlights);
    return result;
}

} // namespace nowiki
