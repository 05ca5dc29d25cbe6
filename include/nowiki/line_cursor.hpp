#ifndef NOWIKI_LINE_CURSOR_HPP
#define NOWIKI_LINE_CURSOR_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "nowiki/fwd.hpp"

namespace nowiki {

/// @brief Splits `text` into lines, where any of CRLF, CR, and LF terminate a line.
/// The line terminators are not included in the resulting lines.
/// Like Python's `str.splitlines()`,
/// a terminator at the very end of `text` does not produce an additional empty line,
/// and an empty `text` yields no lines.
void split_lines(std::pmr::vector<std::u8string_view>& out, std::u8string_view text);

/// @brief A cursor over a sequence of lines which is consumed by line-oriented parsers.
/// Parsers that read one line too far can push lines back,
/// and the whole sequence can be restarted from the beginning.
///
/// The cursor does not own the text of the lines.
struct Line_Cursor {
private:
    std::pmr::vector<std::u8string_view> m_lines;
    std::pmr::vector<std::u8string_view> m_pushed;
    std::size_t m_index = 0;

public:
    /// @brief Constructs a cursor over the lines of `text`, as split by `split_lines`.
    [[nodiscard]]
    explicit Line_Cursor(std::u8string_view text, std::pmr::memory_resource* memory);

    /// @brief Constructs a cursor over the given `lines`.
    [[nodiscard]]
    explicit Line_Cursor(std::span<const std::u8string_view> lines, std::pmr::memory_resource* memory);

    /// @brief Returns `true` if there are no more lines, neither pushed back nor remaining.
    [[nodiscard]]
    bool at_end() const
    {
        return m_pushed.empty() && m_index >= m_lines.size();
    }

    /// @brief Consumes the next line and returns it,
    /// or returns `std::nullopt` if the cursor is at the end.
    /// Lines that were pushed back are returned first,
    /// in the order in which they were pushed.
    [[nodiscard]]
    std::optional<std::u8string_view> next();

    /// @brief Returns the next line without consuming it.
    [[nodiscard]]
    std::optional<std::u8string_view> peek() const;

    /// @brief Pushes back `line` so that it is returned by a subsequent `next()`.
    void push(std::u8string_view line);

    /// @brief Returns the number of lines that were consumed from the underlying sequence,
    /// not counting any lines that were pushed back.
    /// This is the one-based number of the last line returned by `next()`.
    [[nodiscard]]
    std::size_t get_line_number() const
    {
        return m_index;
    }

    /// @brief Discards pushed-back lines and starts over from the first line.
    void restart()
    {
        m_pushed.clear();
        m_index = 0;
    }
};

} // namespace nowiki

#endif
