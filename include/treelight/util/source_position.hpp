#ifndef TREELIGHT_SOURCE_POSITION_HPP
#define TREELIGHT_SOURCE_POSITION_HPP

#include <cstddef>
#include <string_view>

#include "treelight/util/assert.hpp"

#include "treelight/fwd.hpp"

namespace treelight {

/// Represents a position in a source file.
struct Source_Position {
    /// Line number.
    std::size_t line;
    /// Column number.
    std::size_t column;
    /// First index in the source file that is part of the syntactical element.
    std::size_t begin;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Position, Source_Position)
        = default;

    [[nodiscard]]
    constexpr Source_Position to_right(std::size_t offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }
};

constexpr void advance(Source_Position& pos, char8_t c)
{
    switch (c) {
    case '\r': pos.column = 0; break;
    case '\n':
        pos.column = 0;
        pos.line += 1;
        break;
    default: pos.column += 1;
    }
    pos.begin += 1;
}

constexpr void advance(Source_Position& pos, std::u8string_view str)
{
    for (const char8_t c : str) {
        advance(pos, c);
    }
}

/// @brief Returns the position of the code unit at index `offset` in `source`.
/// `offset` may be equal to `source.size()`.
[[nodiscard]]
constexpr Source_Position position_of(std::u8string_view source, std::size_t offset)
{
    TREELIGHT_ASSERT(offset <= source.size());
    Source_Position result {};
    advance(result, source.substr(0, offset));
    return result;
}

/// Represents a position in a source file.
struct Source_Span : Source_Position {
    std::size_t length;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Span, Source_Span)
        = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]]
    constexpr Source_Span with_length(std::size_t l) const
    {
        return { Source_Position { *this }, l }; // NOLINT(cppcoreguidelines-slicing)
    }

    [[nodiscard]]
    constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }

    [[nodiscard]]
    constexpr bool contains(std::size_t pos) const
    {
        return pos >= begin && pos < end();
    }
};

} // namespace treelight

#endif
