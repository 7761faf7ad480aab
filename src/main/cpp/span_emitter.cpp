#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/util/assert.hpp"

#include "treelight/highlight_resolver.hpp"
#include "treelight/span_emitter.hpp"

namespace treelight {
namespace {

[[nodiscard]]
bool assignment_less(const Highlight_Assignment& x, const Highlight_Assignment& y)
{
    if (x.begin != y.begin) {
        return x.begin < y.begin;
    }
    if (x.end != y.end) {
        return x.end > y.end;
    }
    if (x.depth != y.depth) {
        return x.depth < y.depth;
    }
    return x.priority < y.priority;
}

[[nodiscard]]
bool same_slot(const Highlight_Assignment& x, const Highlight_Assignment& y)
{
    return x.begin == y.begin && x.end == y.end && x.depth == y.depth;
}

} // namespace

void emit_highlight_events(
    std::pmr::vector<Highlight_Event>& out,
    std::pmr::vector<Highlight_Assignment>& rejected,
    std::span<const Highlight_Assignment> assignments
)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();

    std::pmr::vector<Highlight_Assignment> sorted { memory };
    sorted.reserve(assignments.size());
    for (const Highlight_Assignment& a : assignments) {
        if (a.begin < a.end) {
            sorted.push_back(a);
        }
    }
    std::ranges::stable_sort(sorted, assignment_less);

    std::pmr::vector<const Highlight_Assignment*> stack { memory };
    const auto close_until = [&](std::size_t offset) {
        while (!stack.empty() && stack.back()->end <= offset) {
            out.push_back({ stack.back()->end, Event_Kind::close, stack.back()->name });
            stack.pop_back();
        }
    };

    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const Highlight_Assignment& a = sorted[i];
        if (i + 1 < sorted.size() && same_slot(a, sorted[i + 1])) {
            continue;
        }
        close_until(a.begin);
        if (!stack.empty() && a.end > stack.back()->end) {
            rejected.push_back(a);
            continue;
        }
        out.push_back({ a.begin, Event_Kind::open, a.name });
        stack.push_back(&a);
    }
    close_until(std::size_t(-1));
}

void events_to_spans(std::pmr::vector<Highlight_Span>& out, std::span<const Highlight_Event> events)
{
    std::pmr::vector<std::size_t> open_spans { out.get_allocator().resource() };
    for (const Highlight_Event& e : events) {
        if (e.kind == Event_Kind::open) {
            open_spans.push_back(out.size());
            out.push_back({ .begin = e.offset, .end = e.offset, .name = e.name, .nesting = open_spans.size() - 1 });
        }
        else {
            TREELIGHT_ASSERT(!open_spans.empty());
            out[open_spans.back()].end = e.offset;
            open_spans.pop_back();
        }
    }
    TREELIGHT_ASSERT(open_spans.empty());
}

void events_to_runs(
    std::pmr::vector<Highlight_Run>& out,
    std::span<const Highlight_Event> events,
    std::size_t length
)
{
    std::pmr::vector<std::u8string_view> names { out.get_allocator().resource() };
    std::size_t position = 0;
    const auto flush = [&](std::size_t offset) {
        TREELIGHT_ASSERT(offset <= length);
        if (offset > position) {
            out.push_back({ position, offset, names.empty() ? std::u8string_view {} : names.back() });
            position = offset;
        }
    };

    for (const Highlight_Event& e : events) {
        flush(e.offset);
        if (e.kind == Event_Kind::open) {
            names.push_back(e.name);
        }
        else {
            TREELIGHT_ASSERT(!names.empty());
            names.pop_back();
        }
    }
    flush(length);
}

} // namespace treelight
