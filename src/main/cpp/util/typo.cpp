#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "nowiki/util/typo.hpp"

namespace nowiki {

// https://en.wikipedia.org/wiki/Levenshtein_distance
std::size_t code_unit_levenshtein_distance(
    std::u8string_view x,
    std::u8string_view y,
    std::pmr::memory_resource* memory
)
{
    if (x.empty()) {
        return y.size();
    }
    if (y.empty()) {
        return x.size();
    }

    // Only two rows of the full matrix are needed at any time.
    std::pmr::vector<std::size_t> previous(y.size() + 1, memory);
    std::pmr::vector<std::size_t> current(y.size() + 1, memory);

    for (std::size_t j = 0; j <= y.size(); ++j) {
        previous[j] = j;
    }

    for (std::size_t i = 1; i <= x.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= y.size(); ++j) {
            const std::size_t sub_cost = x[i - 1] == y[j - 1] ? 0 : 1;
            current[j] = std::min({
                previous[j] + 1, // deletion
                current[j - 1] + 1, // insertion
                previous[j - 1] + sub_cost, // substitution
            });
        }
        previous.swap(current);
    }

    return previous[y.size()];
}

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::size_t distance = code_unit_levenshtein_distance(haystack[i], needle, memory);
        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

} // namespace nowiki
