#ifndef TREELIGHT_HIGHLIGHT_NAMES_HPP
#define TREELIGHT_HIGHLIGHT_NAMES_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/fwd.hpp"

namespace treelight {

/// @brief Returns the capture names that highlights queries are conventionally expected to use,
/// in ascending order.
[[nodiscard]]
std::span<const std::u8string_view> standard_capture_names() noexcept;

/// @brief Maps a full capture name, such as `function.builtin.static`,
/// onto one of the `recognized` names.
/// A recognized name matches if each of its dot-separated parts is also a part of `name`.
/// Among the matching names, the one with the most parts wins,
/// and earlier names win among those with an equal amount of parts.
/// For example, given the recognized names `function` and `function.builtin`,
/// `function.builtin.static` maps onto `function.builtin`,
/// and `function.method` maps onto `function`.
/// @return The index of the matching name within `recognized`,
/// or `std::nullopt` if none matches.
[[nodiscard]]
std::optional<std::size_t>
match_highlight_name(std::span<const std::u8string_view> recognized, std::u8string_view name);

/// @brief Appends the capture names of `query` to `out`
/// which are neither among the given `names` nor private.
/// If `names` is empty, `standard_capture_names()` is used instead.
void nonconformant_capture_names(
    std::pmr::vector<std::u8string_view>& out,
    const Query& query,
    std::span<const std::u8string_view> names = {}
);

} // namespace treelight

#endif
