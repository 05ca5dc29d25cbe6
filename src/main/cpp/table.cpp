#include <charconv>
#include <cmath>
#include <memory_resource>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "nowiki/util/strings.hpp"

#include "nowiki/document.hpp"
#include "nowiki/settings.hpp"
#include "nowiki/table.hpp"

namespace nowiki {

namespace {

Document_Node make_cell(std::u8string_view text, std::pmr::memory_resource* memory)
{
    Document_Node cell { Node_Tag::table_cell, memory };
    cell.append_text(text);
    if (is_numeric_cell(text)) {
        cell.set_attribute(attribute::class_, numeric_cell_class);
    }
    return cell;
}

void split_row(
    std::vector<std::u8string_view>& out,
    std::u8string_view line,
    std::u8string_view separator
)
{
    split(line, separator, [&](std::u8string_view cell) { out.push_back(cell); });
}

} // namespace

bool is_numeric_cell(std::u8string_view text)
{
    if (text.empty()) {
        return false;
    }
    const std::string_view chars = as_string_view(text);
    double value;
    const std::from_chars_result result
        = std::from_chars(chars.data(), chars.data() + chars.size(), value);
    return result.ec == std::errc {} && result.ptr == chars.data() + chars.size()
        && std::isfinite(value);
}

Document_Node build_table(
    Table_Row_View head,
    std::span<const std::vector<std::u8string_view>> rows,
    std::u8string_view table_class,
    std::pmr::memory_resource* memory
)
{
    Document_Node table { Node_Tag::table, memory };
    if (!table_class.empty()) {
        table.set_attribute(attribute::class_, table_class);
    }

    {
        Document_Node head_row { Node_Tag::table_row, memory };
        for (std::size_t i = 0; i < head.size(); ++i) {
            Document_Node cell { Node_Tag::table_cell, memory };
            cell.append_text(head[i]);
            // Heading cells are aligned like the cells below them.
            if (!rows.empty() && i < rows.front().size() && is_numeric_cell(rows.front()[i])) {
                cell.set_attribute(attribute::class_, numeric_cell_class);
            }
            head_row.append(std::move(cell));
        }
        table.append(Node_Tag::table_header).append(std::move(head_row));
    }

    Document_Node table_body { Node_Tag::table_body, memory };
    for (const std::vector<std::u8string_view>& row : rows) {
        Document_Node& body_row = table_body.append(Node_Tag::table_row);
        for (const std::u8string_view cell : row) {
            body_row.append(make_cell(cell, memory));
        }
    }
    table.append(std::move(table_body));

    return table;
}

Document_Node build_csv_table(
    std::u8string_view text,
    std::u8string_view separator,
    std::pmr::memory_resource* memory
)
{
    if (separator.empty()) {
        separator = default_csv_separator;
    }

    std::vector<std::u8string_view> head;
    std::vector<std::vector<std::u8string_view>> rows;

    bool first = true;
    split(text, u8"\n", [&](std::u8string_view line) {
        if (first) {
            split_row(head, line, separator);
            first = false;
            return;
        }
        split_row(rows.emplace_back(), line, separator);
    });

    return build_table(head, rows, csv_table_class, memory);
}

} // namespace nowiki
