#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treelight/highlight_names.hpp"
#include "treelight/language.hpp"
#include "treelight/query.hpp"

namespace treelight {
namespace {

using namespace std::string_view_literals;

constexpr std::u8string_view standard_names[] {
    u8"attribute"sv,
    u8"boolean"sv,
    u8"carriage-return"sv,
    u8"comment"sv,
    u8"comment.documentation"sv,
    u8"constant"sv,
    u8"constant.builtin"sv,
    u8"constructor"sv,
    u8"constructor.builtin"sv,
    u8"embedded"sv,
    u8"error"sv,
    u8"escape"sv,
    u8"function"sv,
    u8"function.builtin"sv,
    u8"keyword"sv,
    u8"markup"sv,
    u8"markup.bold"sv,
    u8"markup.heading"sv,
    u8"markup.italic"sv,
    u8"markup.link"sv,
    u8"markup.link.url"sv,
    u8"markup.list"sv,
    u8"markup.list.checked"sv,
    u8"markup.list.numbered"sv,
    u8"markup.list.unchecked"sv,
    u8"markup.list.unnumbered"sv,
    u8"markup.quote"sv,
    u8"markup.raw"sv,
    u8"markup.raw.block"sv,
    u8"markup.raw.inline"sv,
    u8"markup.strikethrough"sv,
    u8"module"sv,
    u8"number"sv,
    u8"operator"sv,
    u8"property"sv,
    u8"property.builtin"sv,
    u8"punctuation"sv,
    u8"punctuation.bracket"sv,
    u8"punctuation.delimiter"sv,
    u8"punctuation.special"sv,
    u8"string"sv,
    u8"string.escape"sv,
    u8"string.regexp"sv,
    u8"string.special"sv,
    u8"string.special.symbol"sv,
    u8"tag"sv,
    u8"type"sv,
    u8"type.builtin"sv,
    u8"variable"sv,
    u8"variable.builtin"sv,
    u8"variable.member"sv,
    u8"variable.parameter"sv,
};

static_assert(std::ranges::is_sorted(standard_names));

/// @brief Returns `true` if `part` is one of the dot-separated parts of `name`.
[[nodiscard]]
bool has_part(std::u8string_view name, std::u8string_view part)
{
    while (true) {
        const std::size_t dot = name.find(u8'.');
        if (name.substr(0, dot) == part) {
            return true;
        }
        if (dot == std::u8string_view::npos) {
            return false;
        }
        name.remove_prefix(dot + 1);
    }
}

} // namespace

std::span<const std::u8string_view> standard_capture_names() noexcept
{
    return standard_names;
}

std::optional<std::size_t>
match_highlight_name(std::span<const std::u8string_view> recognized, std::u8string_view name)
{
    std::optional<std::size_t> best;
    std::size_t best_parts = 0;

    for (std::size_t i = 0; i < recognized.size(); ++i) {
        std::u8string_view rest = recognized[i];
        std::size_t parts = 0;
        bool matches = true;
        while (true) {
            const std::size_t dot = rest.find(u8'.');
            ++parts;
            if (!has_part(name, rest.substr(0, dot))) {
                matches = false;
                break;
            }
            if (dot == std::u8string_view::npos) {
                break;
            }
            rest.remove_prefix(dot + 1);
        }
        if (matches && parts > best_parts) {
            best = i;
            best_parts = parts;
        }
    }
    return best;
}

void nonconformant_capture_names(
    std::pmr::vector<std::u8string_view>& out,
    const Query& query,
    std::span<const std::u8string_view> names
)
{
    if (names.empty()) {
        names = standard_capture_names();
    }
    for (const std::pmr::u8string& name : query.capture_names) {
        if (is_private_capture_name(name)) {
            continue;
        }
        if (std::ranges::find(names, std::u8string_view { name }) == names.end()) {
            out.push_back(name);
        }
    }
}

} // namespace treelight
