#ifndef NOWIKI_TYPO_HPP
#define NOWIKI_TYPO_HPP

#include <compare>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

namespace nowiki {

template <typename T>
struct Distant {
    T value {};
    std::size_t distance = std::size_t(-1);

    [[nodiscard]]
    constexpr operator bool() const
    {
        return distance != std::size_t(-1);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Distant& x, const Distant& y)
        = default;

    [[nodiscard]]
    friend constexpr std::strong_ordering operator<=>(const Distant& x, const Distant& y) noexcept
    {
        return x.distance <=> y.distance;
    }
};

/// @brief Computes the Levenshtein distance between `x` and `y`, measured in code units.
[[nodiscard]]
std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::pmr::memory_resource* memory
);

/// @brief Searches for the given `needle` in the `haystack` based on Levenshtein distance.
/// There may be multiple equally good matches,
/// in which case earlier elements are preferred over later elements in the `haystack`.
/// If `haystack` is empty, the result is falsy.
[[nodiscard]]
Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
);

/// @brief Returns `true` if a match at the given `distance` to a `needle`
/// is plausibly a typo of the needle,
/// rather than something completely unrelated.
[[nodiscard]]
constexpr bool is_plausible_typo(std::size_t distance, std::u8string_view needle)
{
    return distance != 0 && distance <= 2 && distance < needle.length();
}

} // namespace nowiki

#endif
