#ifndef TREELIGHT_CHARS_HPP
#define TREELIGHT_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace treelight {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::is_ascii_lower_alpha;
using ulight::is_ascii_upper_alpha;
using ulight::to_ascii_lower;
using ulight::to_ascii_upper;

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return c == u8' ' || c == u8'\t' || c == u8'\n' || c == u8'\r' || c == u8'\f' || c == u8'\v';
}

/// @brief Returns true if `c` is a character that can appear in the name of a node kind,
/// a field, a capture, or a predicate in the query language.
/// Besides ASCII alphanumerics, this includes `_`, `-`, `.`, `?`, `!`, and `$`,
/// as well as any non-ASCII code unit.
[[nodiscard]]
constexpr bool is_query_identifier_char(char8_t c)
{
    return is_ascii_alphanumeric(c) || c == u8'_' || c == u8'-' || c == u8'.' || c == u8'?'
        || c == u8'!' || c == u8'$' || !is_ascii(c);
}

} // namespace treelight

#endif
