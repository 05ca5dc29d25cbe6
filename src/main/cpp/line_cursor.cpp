#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "nowiki/line_cursor.hpp"

namespace nowiki {

void split_lines(std::pmr::vector<std::u8string_view>& out, std::u8string_view text)
{
    std::size_t begin = 0;
    for (std::size_t i = 0; i < text.length(); ++i) {
        if (text[i] == u8'\n') {
            out.push_back(text.substr(begin, i - begin));
            begin = i + 1;
        }
        else if (text[i] == u8'\r') {
            out.push_back(text.substr(begin, i - begin));
            if (i + 1 < text.length() && text[i + 1] == u8'\n') {
                ++i;
            }
            begin = i + 1;
        }
    }
    if (begin < text.length()) {
        out.push_back(text.substr(begin));
    }
}

Line_Cursor::Line_Cursor(std::u8string_view text, std::pmr::memory_resource* memory)
    : m_lines { memory }
    , m_pushed { memory }
{
    split_lines(m_lines, text);
}

Line_Cursor::Line_Cursor(
    std::span<const std::u8string_view> lines,
    std::pmr::memory_resource* memory
)
    : m_lines { lines.begin(), lines.end(), memory }
    , m_pushed { memory }
{
}

std::optional<std::u8string_view> Line_Cursor::next()
{
    if (!m_pushed.empty()) {
        const std::u8string_view result = m_pushed.front();
        m_pushed.erase(m_pushed.begin());
        return result;
    }
    if (m_index >= m_lines.size()) {
        return {};
    }
    return m_lines[m_index++];
}

std::optional<std::u8string_view> Line_Cursor::peek() const
{
    if (!m_pushed.empty()) {
        return m_pushed.front();
    }
    if (m_index >= m_lines.size()) {
        return {};
    }
    return m_lines[m_index];
}

void Line_Cursor::push(std::u8string_view line)
{
    m_pushed.push_back(line);
}

} // namespace nowiki
