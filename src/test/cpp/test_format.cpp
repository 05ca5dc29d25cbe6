#include <optional>
#include <string_view>
#include <variant>

#include <gtest/gtest.h>

#include "nowiki/directive.hpp"
#include "nowiki/format.hpp"
#include "nowiki/settings.hpp"

namespace nowiki {
namespace {

TEST(Format, names_and_mimetypes)
{
    struct Case {
        std::u8string_view name;
        Nowiki_Format expected;
    };
    // clang-format off
    static constexpr Case cases[] {
        { u8"highlight",               Nowiki_Format::highlight },
        { u8"csv",                     Nowiki_Format::csv },
        { u8"text/csv",                Nowiki_Format::csv },
        { u8"wiki",                    Nowiki_Format::wiki },
        { u8"text/x.moin.wiki",        Nowiki_Format::wiki },
        { u8"creole",                  Nowiki_Format::creole },
        { u8"text/x.moin.creole",      Nowiki_Format::creole },
        { u8"rst",                     Nowiki_Format::rst },
        { u8"text/x-rst",              Nowiki_Format::rst },
        { u8"docbook",                 Nowiki_Format::docbook },
        { u8"application/docbook+xml", Nowiki_Format::docbook },
        { u8"markdown",                Nowiki_Format::markdown },
        { u8"text/x-markdown",         Nowiki_Format::markdown },
        { u8"mediawiki",               Nowiki_Format::mediawiki },
        { u8"text/x-mediawiki",        Nowiki_Format::mediawiki },
        { u8"CSV",                     Nowiki_Format::unknown },
        { u8"bogus-format",            Nowiki_Format::unknown },
        { u8"",                        Nowiki_Format::unknown },
    };
    // clang-format on

    for (const auto& [name, expected] : cases) {
        EXPECT_EQ(nowiki_format_by_name(name), expected);
    }
    EXPECT_EQ(nowiki_format_by_name(std::nullopt), Nowiki_Format::unknown);
}

TEST(Format, highlight_language)
{
    const Format_Resolution actual = resolve_format(parse_directive(u8"#!highlight python"));
    const Format_Resolution expected = Highlight_Spec { u8"python" };
    EXPECT_EQ(actual, expected);
}

TEST(Format, highlight_without_language)
{
    const Format_Resolution actual = resolve_format(parse_directive(u8"#!highlight"));
    const Format_Resolution expected = Highlight_Spec { u8"" };
    EXPECT_EQ(actual, expected);
}

TEST(Format, legacy_highlight)
{
    const Format_Resolution actual = resolve_format(parse_directive(u8"#!cplusplus"));
    const Format_Resolution expected = Highlight_Spec { u8"cplusplus" };
    EXPECT_EQ(actual, expected);
}

TEST(Format, csv_default_separator)
{
    const Format_Resolution actual = resolve_format(parse_directive(u8"#!csv"));
    const Format_Resolution expected = Table_Spec { default_csv_separator };
    EXPECT_EQ(actual, expected);
}

TEST(Format, csv_explicit_separator)
{
    const Format_Resolution actual = resolve_format(parse_directive(u8"#!text/csv ::"));
    const Format_Resolution expected = Table_Spec { u8"::" };
    EXPECT_EQ(actual, expected);
}

TEST(Format, sub_parsers_keep_arguments)
{
    const Format_Resolution wiki = resolve_format(parse_directive(u8"#!wiki red/solid"));
    const Format_Resolution expected_wiki
        = Sub_Parser_Spec { .parser = Sub_Parser_Id::wiki, .arguments = u8"red/solid" };
    EXPECT_EQ(wiki, expected_wiki);

    const Format_Resolution rst = resolve_format(parse_directive(u8"#!text/x-rst"));
    const Format_Resolution expected_rst
        = Sub_Parser_Spec { .parser = Sub_Parser_Id::rst, .arguments = {} };
    EXPECT_EQ(rst, expected_rst);
}

TEST(Format, unknown)
{
    EXPECT_TRUE(std::holds_alternative<Unknown_Format_Spec>(resolve_format(parse_directive(u8"#!bogus"))));
    EXPECT_TRUE(std::holds_alternative<Unknown_Format_Spec>(resolve_format(parse_directive(u8"plain"))));
    EXPECT_TRUE(std::holds_alternative<Unknown_Format_Spec>(resolve_format(parse_directive(u8""))));
}

} // namespace
} // namespace nowiki
