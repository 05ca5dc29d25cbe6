#ifndef NOWIKI_STREAM_LOGGER_HPP
#define NOWIKI_STREAM_LOGGER_HPP

#include <iosfwd>
#include <string_view>

#include "nowiki/diagnostic.hpp"
#include "nowiki/fwd.hpp"
#include "nowiki/services.hpp"

namespace nowiki {

/// @brief A `Logger` which writes one line per diagnostic to a stream,
/// in the form `SEVERITY: message [id]`.
struct Stream_Logger final : Logger {
private:
    std::ostream& m_out;
    bool m_colors;
    bool m_any_errors = false;

public:
    [[nodiscard]]
    explicit Stream_Logger(std::ostream& out, Severity min_severity, bool colors = false)
        : Logger { min_severity }
        , m_out { out }
        , m_colors { colors }
    {
    }

    /// @brief Returns `true` if any diagnostic with at least `Severity::error` was logged.
    [[nodiscard]]
    bool any_errors() const
    {
        return m_any_errors;
    }

    void operator()(const Diagnostic& diagnostic) final;
};

} // namespace nowiki

#endif
