#include <algorithm>
#include <cstddef>
#include <string_view>

#include "nowiki/directive.hpp"

namespace nowiki {

namespace {

[[nodiscard]]
bool is_legacy_highlight_format(std::u8string_view name)
{
    return std::ranges::find(legacy_highlight_formats, name) != legacy_highlight_formats.end();
}

} // namespace

Directive parse_directive(std::u8string_view line)
{
    if (!line.starts_with(directive_sentinel) || line.length() <= directive_sentinel.length()) {
        return {};
    }

    const std::u8string_view rest = line.substr(directive_sentinel.length());
    const std::size_t space = rest.find(u8' ');

    Directive result;
    if (space == std::u8string_view::npos) {
        result.name = rest;
    }
    else {
        result.name = rest.substr(0, space);
        result.arguments = rest.substr(space + 1);
    }

    if (is_legacy_highlight_format(*result.name)) {
        result.arguments = result.name;
        result.name = u8"highlight";
    }
    return result;
}

} // namespace nowiki
