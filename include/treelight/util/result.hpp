#ifndef TREELIGHT_RESULT_HPP
#define TREELIGHT_RESULT_HPP

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

#include "treelight/util/assert.hpp"

#include "treelight/fwd.hpp"

namespace treelight {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

struct Error_Tag { };
inline constexpr Error_Tag error_tag;

/// @brief Holds either a value of type `T` (success) or an error of type `E`.
/// Both can be implicitly converted to a `Result`,
/// unless `T` and `E` are the same type,
/// in which case `success_tag` or `error_tag` have to be used.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>);

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        requires(!std::same_as<T, E>)
        : m_data { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        requires(!std::same_as<T, E>)
        : m_data { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        requires(!std::same_as<T, E>)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        requires(!std::same_as<T, E>)
        : m_data { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_data { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_data { std::in_place_index<1>, std::forward<Args>(args)... }
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
        TREELIGHT_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        TREELIGHT_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        TREELIGHT_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        TREELIGHT_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        TREELIGHT_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        TREELIGHT_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_data));
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
    std::variant<std::monostate, E> m_data;

public:
    [[nodiscard]]
    constexpr Result() noexcept = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::in_place_index<1>, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_data { std::in_place_index<1>, std::move(error) }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_data { std::in_place_index<1>, std::forward<Args>(args)... }
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
    constexpr E& error() &
    {
        TREELIGHT_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        TREELIGHT_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        TREELIGHT_ASSERT(!has_value());
        return std::move(*std::get_if<1>(&m_data));
    }
};

} // namespace treelight

#endif
