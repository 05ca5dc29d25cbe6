#ifndef NOWIKI_RESULT_HPP
#define NOWIKI_RESULT_HPP

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

#include "nowiki/util/assert.hpp"

#include "nowiki/fwd.hpp"

namespace nowiki {

/// @brief Holds either a value of type `T` or an error of type `E`.
/// Both can be implicitly converted to a `Result`,
/// so functions can simply `return value;` or `return error;`.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>, "Value and error types must be distinguishable.");

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    template <typename U = T>
        requires std::constructible_from<T, U&&> && (!std::same_as<std::remove_cvref_t<U>, E>)
        && (!std::same_as<std::remove_cvref_t<U>, Result>)
    constexpr Result(U&& value)
        : m_data { std::in_place_index<0>, std::forward<U>(value) }
    {
    }

    constexpr Result(E error)
        : m_data { std::in_place_index<1>, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        NOWIKI_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        NOWIKI_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        NOWIKI_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr E error() const
    {
        NOWIKI_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    E m_error {};
    bool m_has_value = true;

public:
    constexpr Result() noexcept = default;

    constexpr Result(E error)
        : m_error { std::move(error) }
        , m_has_value { false }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]]
    constexpr E error() const
    {
        NOWIKI_ASSERT(!m_has_value);
        return m_error;
    }
};

} // namespace nowiki

#endif
