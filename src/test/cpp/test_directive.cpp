#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "nowiki/directive.hpp"

namespace nowiki {
namespace {

TEST(Directive, name_only)
{
    const Directive expected { u8"csv", {} };
    EXPECT_EQ(parse_directive(u8"#!csv"), expected);
}

TEST(Directive, name_and_arguments)
{
    const Directive expected { u8"highlight", u8"python" };
    EXPECT_EQ(parse_directive(u8"#!highlight python"), expected);
}

TEST(Directive, arguments_are_split_on_first_space_only)
{
    const Directive expected { u8"wiki", u8"red/solid  dashed" };
    EXPECT_EQ(parse_directive(u8"#!wiki red/solid  dashed"), expected);
}

TEST(Directive, empty_arguments_after_space)
{
    const Directive expected { u8"csv", u8"" };
    EXPECT_EQ(parse_directive(u8"#!csv "), expected);
}

TEST(Directive, missing_sentinel)
{
    EXPECT_EQ(parse_directive(u8"csv"), Directive {});
    EXPECT_EQ(parse_directive(u8" #!csv"), Directive {});
    EXPECT_EQ(parse_directive(u8"#csv"), Directive {});
    EXPECT_EQ(parse_directive(u8""), Directive {});
}

TEST(Directive, sentinel_only)
{
    EXPECT_EQ(parse_directive(u8"#!"), Directive {});
}

TEST(Directive, legacy_names_become_highlight)
{
    for (const std::u8string_view legacy : legacy_highlight_formats) {
        std::u8string line = u8"#!";
        line += legacy;
        const Directive expected { u8"highlight", legacy };
        EXPECT_EQ(parse_directive(line), expected);
    }
}

TEST(Directive, legacy_name_discards_arguments)
{
    const Directive expected { u8"highlight", u8"python" };
    EXPECT_EQ(parse_directive(u8"#!python numbers=on"), expected);
}

TEST(Directive, legacy_matching_is_case_sensitive)
{
    const Directive expected { u8"Python", {} };
    EXPECT_EQ(parse_directive(u8"#!Python"), expected);
}

} // namespace
} // namespace nowiki
