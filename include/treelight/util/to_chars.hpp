#ifndef TREELIGHT_TO_CHARS_HPP
#define TREELIGHT_TO_CHARS_HPP

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <limits>
#include <string_view>
#include <system_error>

#include "treelight/util/assert.hpp"

namespace treelight {

/// @brief The decimal representation of an integer, stored in place.
struct Characters8 {
    static constexpr std::size_t capacity = std::numeric_limits<unsigned long long>::digits10 + 2;

    std::array<char8_t, capacity> chars {};
    std::size_t length = 0;

    [[nodiscard]]
    constexpr std::u8string_view as_string() const noexcept
    {
        return { chars.data(), length };
    }

    [[nodiscard]]
    constexpr operator std::u8string_view() const noexcept
    {
        return as_string();
    }
};

template <std::integral T>
[[nodiscard]]
constexpr Characters8 to_characters8(T x)
{
    std::array<char, Characters8::capacity> buffer {};
    const std::to_chars_result result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), x);
    TREELIGHT_ASSERT(result.ec == std::errc {});

    Characters8 out;
    out.length = std::size_t(result.ptr - buffer.data());
    for (std::size_t i = 0; i < out.length; ++i) {
        out.chars[i] = char8_t(buffer[i]);
    }
    return out;
}

} // namespace treelight

#endif
