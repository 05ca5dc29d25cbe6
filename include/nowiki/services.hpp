#ifndef NOWIKI_SERVICES_HPP
#define NOWIKI_SERVICES_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "ulight/ulight.hpp"

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"
#include "nowiki/util/severity.hpp"
#include "nowiki/util/typo.hpp"

#include "nowiki/diagnostic.hpp"
#include "nowiki/fwd.hpp"

namespace nowiki {

using Highlight_Span = ulight::Token;
using ulight::Highlight_Type;

enum struct Syntax_Highlight_Error : Default_Underlying {
    unsupported_language,
    bad_code,
    other,
};

[[nodiscard]]
constexpr std::u8string_view syntax_highlight_error_name(Syntax_Highlight_Error error)
{
    switch (error) {
        using enum Syntax_Highlight_Error;
        NOWIKI_ENUM_STRING_CASE8(unsupported_language);
        NOWIKI_ENUM_STRING_CASE8(bad_code);
        NOWIKI_ENUM_STRING_CASE8(other);
    }
    NOWIKI_ASSERT_UNREACHABLE(u8"Invalid error.");
}

struct Syntax_Highlighter {

    /// @brief Returns a set of supported languages in no particular order.
    [[nodiscard]]
    virtual std::span<const std::u8string_view> get_supported_languages() const
        = 0;

    /// @brief Matches `language` against the set of supported language of the syntax highlighter.
    ///
    // This member function is useful for typo detection.
    [[nodiscard]]
    virtual Distant<std::u8string_view>
    match_supported_language(std::u8string_view language, std::pmr::memory_resource* memory) const
        = 0;

    /// @brief Resolves a language name or alias, such as `"c++"`.
    /// @returns The name of the language, which can be passed to `operator()`,
    /// or an empty string if the language is not supported.
    [[nodiscard]]
    virtual std::u8string_view find_language(std::u8string_view name) const
        = 0;

    /// @brief Resolves a mimetype, such as `"text/x-python"`.
    /// @returns The name of the language, which can be passed to `operator()`,
    /// or an empty string if no supported language has that mimetype.
    [[nodiscard]]
    virtual std::u8string_view find_language_for_mimetype(std::u8string_view mimetype) const
        = 0;

    /// @brief Applies syntax highlighting to the given `code`.
    /// Spans of highlighted source code are appended to `out`.
    /// If a failed result is returned,
    /// nothing is appended to `out`.
    /// @param out Where the spans are appended to.
    /// @param code The source code.
    /// @param language A language previously returned by `find_language`
    /// or `find_language_for_mimetype`.
    /// @param memory Additional memory.
    [[nodiscard]]
    virtual Result<void, Syntax_Highlight_Error> operator()(
        std::pmr::vector<Highlight_Span>& out,
        std::u8string_view code,
        std::u8string_view language,
        std::pmr::memory_resource* memory
    ) = 0;
};

/// @brief A `Syntax_Highlighter` that supports no languages.
/// Only plain text can be "highlighted" when this is used.
struct No_Support_Syntax_Highlighter final : Syntax_Highlighter {

    [[nodiscard]]
    std::span<const std::u8string_view> get_supported_languages() const final
    {
        return {};
    }

    [[nodiscard]]
    Distant<std::u8string_view>
    match_supported_language(std::u8string_view, std::pmr::memory_resource*) const final
    {
        return {};
    }

    [[nodiscard]]
    std::u8string_view find_language(std::u8string_view) const final
    {
        return {};
    }

    [[nodiscard]]
    std::u8string_view find_language_for_mimetype(std::u8string_view) const final
    {
        return {};
    }

    [[nodiscard]]
    Result<void, Syntax_Highlight_Error>
    operator()( //
        std::pmr::vector<Highlight_Span>&,
        std::u8string_view,
        std::u8string_view,
        std::pmr::memory_resource*
    ) final
    {
        return Syntax_Highlight_Error::unsupported_language;
    }
};

inline constinit No_Support_Syntax_Highlighter no_support_syntax_highlighter;

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    constexpr virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        NOWIKI_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Logs `diagnostic` if its severity is at least the minimum severity.
    void log(const Diagnostic& diagnostic)
    {
        NOWIKI_ASSERT(severity_is_emittable(diagnostic.severity));
        if (can_log(diagnostic.severity)) {
            (*this)(diagnostic);
        }
    }

    virtual void operator()(const Diagnostic& diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(const Diagnostic&) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace nowiki

#endif
