#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "ulight/ulight.h"
#include "ulight/ulight.hpp"

#include "nowiki/util/typo.hpp"

#include "nowiki/services.hpp"
#include "nowiki/settings.hpp"
#include "nowiki/ulight_highlighter.hpp"

namespace nowiki {

namespace {

struct Name_Mapping {
    std::u8string_view from;
    std::u8string_view to;
};

// Names which µlight does not know under the given name,
// but which are commonly used in wiki pages.
constexpr Name_Mapping language_aliases[] {
    { u8"cplusplus", u8"cpp" },
    { u8"c++", u8"cpp" },
    { u8"sh", u8"bash" },
    { u8"shell", u8"bash" },
    { u8"js", u8"javascript" },
    { u8"py", u8"python" },
    { u8"python3", u8"python" },
    { u8"patch", u8"diff" },
};

// clang-format off
constexpr Name_Mapping mimetype_languages[] {
    { u8"application/javascript", u8"javascript" },
    { u8"application/json",       u8"json" },
    { u8"application/x-sh",       u8"bash" },
    { u8"application/xml",        u8"xml" },
    { u8"text/css",               u8"css" },
    { u8"text/html",              u8"html" },
    { u8"text/javascript",        u8"javascript" },
    { u8"text/x-c",               u8"c" },
    { u8"text/x-c++hdr",          u8"cpp" },
    { u8"text/x-c++src",          u8"cpp" },
    { u8"text/x-chdr",            u8"c" },
    { u8"text/x-csrc",            u8"c" },
    { u8"text/x-diff",            u8"diff" },
    { u8"text/x-java",            u8"java" },
    { u8"text/x-kotlin",          u8"kotlin" },
    { u8"text/x-lua",             u8"lua" },
    { u8"text/x-patch",           u8"diff" },
    { u8"text/x-python",          u8"python" },
    { u8"text/x-rustsrc",         u8"rust" },
    { u8"text/x-sh",              u8"bash" },
    { u8"text/x-tex",             u8"tex" },
    { u8"text/xml",               u8"xml" },
};
// clang-format on

[[nodiscard]]
std::u8string_view find_mapping(std::span<const Name_Mapping> mappings, std::u8string_view from)
{
    for (const auto& [key, value] : mappings) {
        if (key == from) {
            return value;
        }
    }
    return {};
}

[[nodiscard]]
bool is_ulight_language(std::u8string_view name)
{
    return ulight::get_lang(name) != ulight::Lang::none;
}

} // namespace

std::span<const std::u8string_view> Ulight_Syntax_Highlighter::get_supported_languages() const
{
    static const auto data = [] {
        std::vector<std::u8string_view> out;
        const std::span<const ulight_lang_entry> ulight_entries { ulight_lang_list,
                                                                  ulight_lang_list_length };
        for (const auto& [name_data, name_length, _] : ulight_entries) {
            out.push_back({ reinterpret_cast<const char8_t*>(name_data), name_length });
        }
        for (const auto& [alias, _] : language_aliases) {
            out.push_back(alias);
        }
        return out;
    }();
    return data;
}

Distant<std::u8string_view> Ulight_Syntax_Highlighter::match_supported_language(
    std::u8string_view language,
    std::pmr::memory_resource* memory
) const
{
    const std::span<const std::u8string_view> supported = get_supported_languages();
    const Distant<std::size_t> closest = closest_match(supported, language, memory);
    if (!closest) {
        return {};
    }
    return { .value = supported[closest.value], .distance = closest.distance };
}

std::u8string_view Ulight_Syntax_Highlighter::find_language(std::u8string_view name) const
{
    if (is_ulight_language(name)) {
        return name;
    }
    const std::u8string_view alias_target = find_mapping(language_aliases, name);
    if (!alias_target.empty() && is_ulight_language(alias_target)) {
        return alias_target;
    }
    return {};
}

std::u8string_view
Ulight_Syntax_Highlighter::find_language_for_mimetype(std::u8string_view mimetype) const
{
    const std::u8string_view language = find_mapping(mimetype_languages, mimetype);
    if (!language.empty() && is_ulight_language(language)) {
        return language;
    }
    return {};
}

Result<void, Syntax_Highlight_Error> Ulight_Syntax_Highlighter::operator()( //
    std::pmr::vector<Highlight_Span>& out,
    std::u8string_view code,
    std::u8string_view language,
    std::pmr::memory_resource*
)
{
    // TODO: find a way to provide memory for dynamic allocations to ulight
    thread_local ulight::Token token_buffer[highlight_token_buffer_size];

    const ulight::Lang lang = ulight::get_lang(language);
    if (lang == ulight::Lang::none) {
        return Syntax_Highlight_Error::unsupported_language;
    }

    ulight::State state;
    state.set_token_buffer(token_buffer);
    state.set_lang(lang);
    state.set_source(code);

    const std::size_t initial_size = out.size();
    auto on_flush = [&](const ulight::Token* tokens, std::size_t size) {
        out.insert(out.end(), tokens, tokens + size);
    };
    state.on_flush_tokens(on_flush);

    switch (state.source_to_tokens()) {
    case ulight::Status::ok: return {};
    case ulight::Status::bad_code: {
        out.resize(initial_size);
        return Syntax_Highlight_Error::bad_code;
    }
    default: {
        out.resize(initial_size);
        return Syntax_Highlight_Error::other;
    }
    }
}

} // namespace nowiki
