#ifndef NOWIKI_MEMORY_RESOURCES_HPP
#define NOWIKI_MEMORY_RESOURCES_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <type_traits>
#include <vector>

namespace nowiki {

/// @brief Like `std::pmr::polymorphic_allocator`,
/// but propagated whenever possible.
///
/// This matters for document trees:
/// subtrees are routinely moved from one parent to another,
/// and with a non-propagating allocator,
/// a move between containers with "different" allocators degrades into a deep copy.
template <typename T>
struct Propagated_Polymorphic_Allocator {
    using propagate_on_container_copy_assignment = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    using value_type = T;
    std::pmr::memory_resource* resource;

    [[nodiscard]]
    Propagated_Polymorphic_Allocator(
        std::pmr::memory_resource* resource = std::pmr::get_default_resource()
    ) noexcept
        : resource { resource }
    {
    }

    template <typename U>
        requires(!std::is_same_v<T, U>)
    Propagated_Polymorphic_Allocator(const Propagated_Polymorphic_Allocator<U>& other) noexcept
        : resource { other.resource }
    {
    }

    [[nodiscard]]
    T* allocate(std::size_t n)
    {
        return static_cast<T*>(resource->allocate(n * sizeof(T), alignof(T)));
    }

    void deallocate(T* p, std::size_t n)
    {
        resource->deallocate(p, n * sizeof(T), alignof(T));
    }

    friend bool
    operator==(const Propagated_Polymorphic_Allocator& x, const Propagated_Polymorphic_Allocator& y)
        = default;
};

template <typename T>
using Pmr_Vector = std::vector<T, Propagated_Polymorphic_Allocator<T>>;

using Pmr_U8string
    = std::basic_string<char8_t, std::char_traits<char8_t>, Propagated_Polymorphic_Allocator<char8_t>>;

} // namespace nowiki

#endif
