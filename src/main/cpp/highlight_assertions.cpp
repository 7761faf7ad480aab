#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "treelight/util/chars.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/strings.hpp"

#include "treelight/highlight_assertions.hpp"
#include "treelight/span_emitter.hpp"

namespace treelight {
namespace {

struct Line {
    std::size_t number;
    std::size_t begin;
    std::u8string_view text;
};

/// @brief Parses the part of an assertion line after the arrow or carets.
/// @return The expected name and whether it is negated, or `std::nullopt` if there is no name.
[[nodiscard]]
std::optional<std::pair<std::u8string_view, bool>> parse_expectation(std::u8string_view rest)
{
    rest = trim_ascii_blank_left(rest);
    const bool negative = rest.starts_with(u8'!');
    if (negative) {
        rest.remove_prefix(1);
    }
    std::size_t length = 0;
    while (length < rest.size() && !is_ascii_blank(rest[length])) {
        ++length;
    }
    if (length == 0) {
        return {};
    }
    return std::pair { rest.substr(0, length), negative };
}

} // namespace

Result<void, Assertion_Parse_Error> parse_highlight_assertions(
    std::pmr::vector<Highlight_Assertion>& out,
    std::u8string_view source,
    std::u8string_view comment_prefix
)
{
    std::optional<Line> target;

    const auto offset_of = [&](std::size_t column) {
        return column < target->text.size() ? target->begin + column : std::size_t(-1);
    };

    std::size_t line_begin = 0;
    for (std::size_t line = 0; line_begin <= source.size(); ++line) {
        const std::size_t newline = source.find(u8'\n', line_begin);
        const std::size_t line_end = newline == std::u8string_view::npos ? source.size() : newline;
        std::u8string_view text = source.substr(line_begin, line_end - line_begin);
        if (text.ends_with(u8'\r')) {
            text.remove_suffix(1);
        }
        const Line current { line, line_begin, text };
        line_begin = line_end + 1;

        const std::size_t prefix_column = length_blank_left(text);
        const std::u8string_view comment = text.substr(prefix_column);
        if (comment_prefix.empty() || !comment.starts_with(comment_prefix)) {
            target = current;
            continue;
        }
        const std::size_t marker_column = prefix_column + comment_prefix.size()
            + length_blank_left(comment.substr(comment_prefix.size()));
        const std::u8string_view marker = text.substr(marker_column);

        if (marker.starts_with(u8"<-")) {
            if (!target) {
                return Assertion_Parse_Error { Assertion_Parse_Error_Kind::no_target_line, line };
            }
            const auto expectation = parse_expectation(marker.substr(2));
            if (!expectation) {
                return Assertion_Parse_Error { Assertion_Parse_Error_Kind::missing_name, line };
            }
            out.push_back({
                .line = target->number,
                .column = prefix_column,
                .offset = offset_of(prefix_column),
                .expected = expectation->first,
                .negative = expectation->second,
            });
            continue;
        }
        if (marker.starts_with(u8'^')) {
            if (!target) {
                return Assertion_Parse_Error { Assertion_Parse_Error_Kind::no_target_line, line };
            }
            std::size_t carets = 0;
            while (carets < marker.size() && marker[carets] == u8'^') {
                ++carets;
            }
            const auto expectation = parse_expectation(marker.substr(carets));
            if (!expectation) {
                return Assertion_Parse_Error { Assertion_Parse_Error_Kind::missing_name, line };
            }
            for (std::size_t i = 0; i < carets; ++i) {
                out.push_back({
                    .line = target->number,
                    .column = marker_column + i,
                    .offset = offset_of(marker_column + i),
                    .expected = expectation->first,
                    .negative = expectation->second,
                });
            }
            continue;
        }
        target = current;
    }
    return {};
}

void check_highlight_assertions(
    std::pmr::vector<Assertion_Failure>& out,
    std::span<const Highlight_Assertion> assertions,
    std::span<const Highlight_Event> events
)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();
    std::pmr::vector<Highlight_Span> spans { memory };
    events_to_spans(spans, events);

    for (const Highlight_Assertion& assertion : assertions) {
        std::pmr::vector<std::u8string_view> actual { memory };
        if (assertion.offset != std::size_t(-1)) {
            for (const Highlight_Span& span : spans) {
                if (span.begin <= assertion.offset && assertion.offset < span.end) {
                    actual.push_back(span.name);
                }
            }
        }
        const bool found = std::ranges::find(actual, assertion.expected) != actual.end();
        const bool holds = assertion.offset != std::size_t(-1) && found != assertion.negative;
        if (!holds) {
            out.push_back({ .assertion = assertion, .actual = std::move(actual) });
        }
    }
}

} // namespace treelight
