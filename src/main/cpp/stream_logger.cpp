#include <ostream>
#include <string_view>

#include "nowiki/util/ansi.hpp"
#include "nowiki/util/assert.hpp"
#include "nowiki/util/severity.hpp"
#include "nowiki/util/strings.hpp"

#include "nowiki/diagnostic.hpp"
#include "nowiki/stream_logger.hpp"

namespace nowiki {

namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    switch (severity) {
        using enum Severity;
    case min:
    case trace: return ansi::h_black;
    case debug: return ansi::h_white;
    case info: return ansi::h_blue;
    case soft_warning: return ansi::h_green;
    case warning: return ansi::h_yellow;
    case error: return ansi::h_red;
    case fatal: return ansi::h_magenta;
    case none: break;
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid severity.");
}

} // namespace

void Stream_Logger::operator()(const Diagnostic& diagnostic)
{
    m_any_errors |= diagnostic.severity >= Severity::error;

    if (m_colors) {
        m_out << as_string_view(severity_highlight(diagnostic.severity));
    }
    m_out << as_string_view(severity_tag(diagnostic.severity));
    if (m_colors) {
        m_out << as_string_view(ansi::reset);
    }
    m_out << ": " << as_string_view(diagnostic.message);
    if (m_colors) {
        m_out << as_string_view(ansi::h_black);
    }
    m_out << " [" << as_string_view(diagnostic.id) << ']';
    if (m_colors) {
        m_out << as_string_view(ansi::reset);
    }
    m_out << '\n';
}

} // namespace nowiki
