#include <charconv>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"
#include "nowiki/util/strings.hpp"

#include "nowiki/document.hpp"
#include "nowiki/line_cursor.hpp"
#include "nowiki/memory_resources.hpp"
#include "nowiki/sub_parsers.hpp"
#include "nowiki/wiki_block_parser.hpp"

namespace nowiki {

namespace {

constexpr std::size_t max_heading_level = 6;

/// @brief Returns `true` if `str` contains a run of at least `length` `}`.
[[nodiscard]]
bool contains_closing_run(std::u8string_view str, std::size_t length)
{
    std::size_t run = 0;
    for (const char8_t c : str) {
        run = c == u8'}' ? run + 1 : 0;
        if (run >= length) {
            return true;
        }
    }
    return false;
}

struct Wiki_Block_Parse_State {
    Line_Cursor& lines;
    Document_Node& body;
    std::pmr::memory_resource* memory;
    Pmr_U8string paragraph { memory };
    bool in_paragraph = false;

    void flush_paragraph()
    {
        if (!in_paragraph) {
            return;
        }
        body.append(Node_Tag::p).append_text(paragraph);
        paragraph.clear();
        in_paragraph = false;
    }

    void append_to_paragraph(std::u8string_view line)
    {
        if (in_paragraph) {
            paragraph.push_back(u8'\n');
        }
        paragraph.append(line);
        in_paragraph = true;
    }

    void consume_nowiki(std::u8string_view opening_line, std::size_t marker_length)
    {
        const std::u8string_view directive_line = opening_line.substr(marker_length);

        Pmr_U8string content { memory };
        bool first = true;
        while (const std::optional<std::u8string_view> line = lines.next()) {
            if (is_nowiki_close(*line, marker_length)) {
                break;
            }
            if (!first) {
                content.push_back(u8'\n');
            }
            content.append(*line);
            first = false;
        }

        body.append(make_nowiki(marker_length, directive_line, content, memory));
    }

    void append_heading(std::u8string_view line, std::size_t level)
    {
        const std::u8string_view trimmed = trim_ascii_blank(line);
        const std::u8string_view title
            = trim_ascii_blank(trimmed.substr(level, trimmed.length() - (2 * level)));

        char level_chars[4];
        const std::to_chars_result level_result
            = std::to_chars(level_chars, level_chars + sizeof(level_chars), level);
        NOWIKI_ASSERT(level_result.ec == std::errc {});

        Document_Node& heading = body.append(Node_Tag::h);
        heading.set_attribute(
            attribute::outline_level,
            as_u8string_view(std::string_view { level_chars, level_result.ptr })
        );
        heading.append_text(title);
    }

    void run()
    {
        while (const std::optional<std::u8string_view> line = lines.next()) {
            if (is_ascii_blank(*line)) {
                flush_paragraph();
                continue;
            }
            if (const std::size_t marker_length = match_nowiki_open(*line)) {
                flush_paragraph();
                consume_nowiki(*line, marker_length);
                continue;
            }
            if (const std::size_t level = match_heading(*line)) {
                flush_paragraph();
                append_heading(*line, level);
                continue;
            }
            append_to_paragraph(*line);
        }
        flush_paragraph();
    }
};

} // namespace

std::size_t match_nowiki_open(std::u8string_view line)
{
    const std::size_t braces = length_of_leading(line, u8'{');
    if (braces < min_nowiki_marker_length) {
        return 0;
    }
    // {{{inline}}} on a single line is not a block.
    if (contains_closing_run(line.substr(braces), braces)) {
        return 0;
    }
    return braces;
}

bool is_nowiki_close(std::u8string_view line, std::size_t marker_length)
{
    const std::u8string_view trimmed = trim_ascii_blank_right(line);
    return trimmed.length() == marker_length && length_of_leading(trimmed, u8'}') == marker_length;
}

std::size_t match_heading(std::u8string_view line)
{
    const std::u8string_view trimmed = trim_ascii_blank(line);
    const std::size_t level = length_of_leading(trimmed, u8'=');
    if (level == 0 || level > max_heading_level) {
        return 0;
    }
    // At least "= x =".
    if (trimmed.length() < (2 * level) + 3) {
        return 0;
    }
    const std::u8string_view inner = trimmed.substr(level, trimmed.length() - (2 * level));
    if (inner.front() != u8' ' || inner.back() != u8' ' || is_ascii_blank(inner)) {
        return 0;
    }
    const std::u8string_view suffix = trimmed.substr(trimmed.length() - level);
    if (length_of_leading(suffix, u8'=') != level) {
        return 0;
    }
    return level;
}

Result<Document_Node, Sub_Parser_Error> Wiki_Block_Parser::parse_block(
    Line_Cursor& lines,
    const Block_Arguments& arguments,
    std::pmr::memory_resource* memory
)
{
    Document_Node body { Node_Tag::body, memory };
    if (!arguments.css_class.empty()) {
        body.set_attribute(attribute::class_, arguments.css_class);
    }

    Wiki_Block_Parse_State state { .lines = lines, .body = body, .memory = memory };
    state.run();

    return body;
}

} // namespace nowiki
