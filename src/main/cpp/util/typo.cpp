#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treelight/util/typo.hpp"
#include "treelight/util/unicode.hpp"

namespace treelight {

namespace {

void to_utf32(std::pmr::u32string& out, std::u8string_view str)
{
    out.clear();
    out.reserve(str.size());
    while (!str.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(str);
        out.push_back(code_point);
        str.remove_prefix(std::size_t(length));
    }
}

// https://en.wikipedia.org/wiki/Levenshtein_distance
// Only two rows of the matrix are kept at any time.
[[nodiscard]]
std::size_t levenshtein_distance(
    std::u32string_view x,
    std::u32string_view y,
    std::pmr::vector<std::size_t>& rows
)
{
    if (x.empty()) {
        return y.size();
    }
    if (y.empty()) {
        return x.size();
    }

    const std::size_t width = y.size() + 1;
    rows.resize(width * 2);
    std::size_t* previous = rows.data();
    std::size_t* current = rows.data() + width;

    for (std::size_t j = 0; j < width; ++j) {
        previous[j] = j;
    }
    for (std::size_t i = 1; i <= x.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j < width; ++j) {
            const std::size_t sub_cost = x[i - 1] == y[j - 1] ? 0 : 1;
            current[j] = std::min({
                previous[j] + 1, // deletion
                current[j - 1] + 1, // insertion
                previous[j - 1] + sub_cost, // substitution
            });
        }
        std::swap(previous, current);
    }

    return previous[y.size()];
}

} // namespace

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    std::pmr::u32string needle32 { memory };
    to_utf32(needle32, needle);
    std::pmr::u32string hay32 { memory };
    std::pmr::vector<std::size_t> rows { memory };

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        to_utf32(hay32, haystack[i]);
        const std::size_t distance = levenshtein_distance(hay32, needle32, rows);
        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

} // namespace treelight
