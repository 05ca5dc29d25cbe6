#ifndef NOWIKI_SETTINGS_HPP
#define NOWIKI_SETTINGS_HPP

#include <cstddef>
#include <string_view>

namespace nowiki {

/// @brief The default limit for how deeply nowiki blocks may be nested within the output
/// of other nowiki blocks before expansion gives up.
/// Sub-parsers can produce new nowiki blocks, so without a limit,
/// a misbehaving sub-parser could make expansion run forever.
inline constexpr std::size_t default_max_expansion_depth = 64;

/// @brief The size of the token buffer used when highlighting with µlight.
inline constexpr std::size_t highlight_token_buffer_size = 1024;

/// @brief The default separator for CSV tables when none is specified.
inline constexpr std::u8string_view default_csv_separator = u8";";

} // namespace nowiki

#endif
