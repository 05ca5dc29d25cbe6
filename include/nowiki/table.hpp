#ifndef NOWIKI_TABLE_HPP
#define NOWIKI_TABLE_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "nowiki/document.hpp"
#include "nowiki/fwd.hpp"

namespace nowiki {

/// @brief The classes of tables generated from `csv` nowiki blocks.
inline constexpr std::u8string_view csv_table_class = u8"moin-csv-table moin-sortable";

/// @brief The class of table cells whose content is numeric.
inline constexpr std::u8string_view numeric_cell_class = u8"moin-integer";

/// @brief A row of cells, where each cell is plain text.
using Table_Row_View = std::span<const std::u8string_view>;

/// @brief Returns `true` if `text` is a number, like `123` or `-1.5e3`,
/// so that it should be aligned like a number.
[[nodiscard]]
bool is_numeric_cell(std::u8string_view text);

/// @brief Builds a `table` node consisting of a `table_header` with a single row `head`,
/// and a `table_body` with the given `rows`.
/// Rows need not have the same number of cells;
/// no padding or truncation takes place.
/// @param table_class The `class` attribute of the table, or an empty string if none.
[[nodiscard]]
Document_Node build_table(
    Table_Row_View head,
    std::span<const std::vector<std::u8string_view>> rows,
    std::u8string_view table_class,
    std::pmr::memory_resource* memory
);

/// @brief Builds a table from separated values,
/// where the first line is the header and every other line is a body row.
/// @param separator A non-empty separator.
/// An empty separator is treated like `default_csv_separator`.
[[nodiscard]]
Document_Node build_csv_table(
    std::u8string_view text,
    std::u8string_view separator,
    std::pmr::memory_resource* memory
);

} // namespace nowiki

#endif
