#ifndef TREELIGHT_SPAN_EMITTER_HPP
#define TREELIGHT_SPAN_EMITTER_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/fwd.hpp"
#include "treelight/highlight_resolver.hpp"

namespace treelight {

enum struct Event_Kind : Default_Underlying {
    open,
    close,
};

/// @brief The start or end of a highlighted range.
/// For `close` events, `name` is the name of the range being closed.
struct Highlight_Event {
    std::size_t offset;
    Event_Kind kind;
    std::u8string_view name;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlight_Event&, const Highlight_Event&)
        = default;
};

/// @brief A highlighted range, obtained by pairing open and close events.
struct Highlight_Span {
    std::size_t begin;
    std::size_t end;
    std::u8string_view name;
    /// @brief The amount of spans that this span is nested in.
    std::size_t nesting;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlight_Span&, const Highlight_Span&)
        = default;
};

/// @brief A range of source code with the innermost highlight name that applies to it,
/// or an empty name if no highlight applies.
struct Highlight_Run {
    std::size_t begin;
    std::size_t end;
    std::u8string_view name;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlight_Run&, const Highlight_Run&)
        = default;
};

/// @brief Flattens possibly overlapping assignments into a well-nested event sequence.
///
/// Assignments are ordered by begin (ascending), end (descending),
/// depth (ascending), and priority (ascending).
/// Among assignments with identical range and depth, only the last one in that order is kept.
/// Close events at an offset precede open events at the same offset,
/// and nested open events at the same offset are emitted outermost first.
/// Empty assignments are dropped.
/// @param rejected Assignments that partially overlap another assignment without nesting in it
/// are not emitted, but appended to `rejected`.
void emit_highlight_events(
    std::pmr::vector<Highlight_Event>& out,
    std::pmr::vector<Highlight_Assignment>& rejected,
    std::span<const Highlight_Assignment> assignments
);

/// @brief Pairs the open and close events of a well-nested event sequence into spans.
/// Spans are appended in the order of their open events.
void events_to_spans(std::pmr::vector<Highlight_Span>& out, std::span<const Highlight_Event> events);

/// @brief Converts a well-nested event sequence into runs that cover `[0, length)` exactly once.
/// Runs of zero length are not appended.
void events_to_runs(
    std::pmr::vector<Highlight_Run>& out,
    std::span<const Highlight_Event> events,
    std::size_t length
);

} // namespace treelight

#endif
