#ifndef NOWIKI_DIRECTIVE_HPP
#define NOWIKI_DIRECTIVE_HPP

#include <array>
#include <optional>
#include <string_view>

#include "nowiki/fwd.hpp"

namespace nowiki {

/// @brief The sentinel which starts every directive line, as in `#!csv`.
inline constexpr std::u8string_view directive_sentinel = u8"#!";

/// @brief Format names that predate the `highlight` format.
/// `#!python` is treated like `#!highlight python`.
inline constexpr std::array<std::u8string_view, 6> legacy_highlight_formats {
    u8"diff", u8"cplusplus", u8"python", u8"java", u8"pascal", u8"irc",
};

/// @brief The format name and arguments of a nowiki block,
/// as obtained from its directive line.
/// For example, the directive line `#!highlight python` has the
/// name `highlight` and the arguments `python`.
struct Directive {
    std::optional<std::u8string_view> name;
    std::optional<std::u8string_view> arguments;

    [[nodiscard]]
    friend constexpr bool operator==(const Directive&, const Directive&)
        = default;
};

/// @brief Parses a directive line such as `#!csv ,`.
/// Lines which do not start with `#!`, or which contain nothing after `#!`,
/// yield a directive with neither name nor arguments.
/// Legacy format names (see `legacy_highlight_formats`) are rewritten
/// so that the name becomes `highlight` and the arguments become the legacy name.
///
/// The returned views point into `line`.
[[nodiscard]]
Directive parse_directive(std::u8string_view line);

} // namespace nowiki

#endif
