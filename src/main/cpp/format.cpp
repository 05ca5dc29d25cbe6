#include <optional>
#include <string_view>

#include "nowiki/util/assert.hpp"

#include "nowiki/directive.hpp"
#include "nowiki/format.hpp"
#include "nowiki/settings.hpp"

namespace nowiki {

Nowiki_Format nowiki_format_by_name(std::optional<std::u8string_view> name)
{
    if (!name) {
        return Nowiki_Format::unknown;
    }
    const std::u8string_view n = *name;
    if (n == u8"highlight") {
        return Nowiki_Format::highlight;
    }
    if (n == u8"csv" || n == u8"text/csv") {
        return Nowiki_Format::csv;
    }
    if (n == u8"wiki" || n == u8"text/x.moin.wiki") {
        return Nowiki_Format::wiki;
    }
    if (n == u8"creole" || n == u8"text/x.moin.creole") {
        return Nowiki_Format::creole;
    }
    if (n == u8"rst" || n == u8"text/x-rst") {
        return Nowiki_Format::rst;
    }
    if (n == u8"docbook" || n == u8"application/docbook+xml") {
        return Nowiki_Format::docbook;
    }
    if (n == u8"markdown" || n == u8"text/x-markdown") {
        return Nowiki_Format::markdown;
    }
    if (n == u8"mediawiki" || n == u8"text/x-mediawiki") {
        return Nowiki_Format::mediawiki;
    }
    return Nowiki_Format::unknown;
}

Format_Resolution resolve_format(const Directive& directive)
{
    const auto sub_parser = [&](Sub_Parser_Id id) -> Format_Resolution {
        return Sub_Parser_Spec { .parser = id, .arguments = directive.arguments };
    };

    switch (nowiki_format_by_name(directive.name)) {
    case Nowiki_Format::highlight: {
        return Highlight_Spec { .language = directive.arguments.value_or(u8"") };
    }
    case Nowiki_Format::csv: {
        return Table_Spec { .separator = directive.arguments.value_or(default_csv_separator) };
    }
    case Nowiki_Format::wiki: return sub_parser(Sub_Parser_Id::wiki);
    case Nowiki_Format::creole: return sub_parser(Sub_Parser_Id::creole);
    case Nowiki_Format::rst: return sub_parser(Sub_Parser_Id::rst);
    case Nowiki_Format::docbook: return sub_parser(Sub_Parser_Id::docbook);
    case Nowiki_Format::markdown: return sub_parser(Sub_Parser_Id::markdown);
    case Nowiki_Format::mediawiki: return sub_parser(Sub_Parser_Id::mediawiki);
    case Nowiki_Format::unknown: return Unknown_Format_Spec {};
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid format.");
}

} // namespace nowiki
