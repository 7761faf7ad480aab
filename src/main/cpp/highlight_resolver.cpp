#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/util/assert.hpp"

#include "treelight/highlight_resolver.hpp"
#include "treelight/language.hpp"
#include "treelight/query.hpp"
#include "treelight/query_match.hpp"
#include "treelight/scope_tracker.hpp"
#include "treelight/syntax_tree.hpp"

namespace treelight {
namespace {

struct Capture_Entry {
    Node_Index node;
    std::size_t begin;
    std::size_t end;
    /// @brief `true` if the capture stems from the locals query,
    /// `false` if it stems from the highlights query.
    bool from_locals;
    std::size_t pattern_index;
    std::size_t match_index;
    Capture_Id id;
};

[[nodiscard]]
bool capture_entry_less(const Capture_Entry& x, const Capture_Entry& y)
{
    if (x.begin != y.begin) {
        return x.begin < y.begin;
    }
    if (x.end != y.end) {
        return x.end > y.end;
    }
    if (x.node != y.node) {
        return x.node < y.node;
    }
    if (x.from_locals != y.from_locals) {
        return x.from_locals;
    }
    return x.pattern_index < y.pattern_index;
}

[[nodiscard]]
bool scope_inherits(const Query_Pattern& pattern)
{
    const Query_Property* const p = pattern.find_property(property::local_scope_inherits);
    return !p || !p->value || *p->value == u8"true";
}

} // namespace

void resolve_highlights(
    Highlight_Resolution& out,
    const Language_Config& language,
    const Syntax_Tree& tree,
    std::u8string_view source,
    std::span<const Query_Match> locals,
    std::span<const Query_Match> highlights
)
{
    std::pmr::memory_resource* const memory = out.assignments.get_allocator().resource();
    const Reserved_Captures& reserved = language.captures();

    std::pmr::vector<Capture_Entry> entries { memory };
    const auto add_entries = [&](std::span<const Query_Match> matches, bool from_locals) {
        for (std::size_t i = 0; i < matches.size(); ++i) {
            for (const Capture& c : matches[i].captures) {
                entries.push_back({
                    .node = c.node,
                    .begin = tree[c.node].begin,
                    .end = tree[c.node].end,
                    .from_locals = from_locals,
                    .pattern_index = matches[i].pattern_index,
                    .match_index = i,
                    .id = c.id,
                });
            }
        }
    };
    add_entries(locals, true);
    add_entries(highlights, false);
    std::ranges::stable_sort(entries, capture_entry_less);

    Scope_Tracker tracker { source.size(), memory };

    for (std::size_t group_begin = 0; group_begin < entries.size();) {
        const Node_Index node = entries[group_begin].node;
        std::size_t group_end = group_begin;
        while (group_end < entries.size() && entries[group_end].node == node) {
            ++group_end;
        }
        const std::span<const Capture_Entry> group
            = std::span { entries }.subspan(group_begin, group_end - group_begin);
        group_begin = group_end;

        const std::size_t begin = group.front().begin;
        const std::size_t end = group.front().end;
        const std::u8string_view text = tree.text(node, source);
        tracker.advance_to(begin);

        std::optional<std::size_t> definition;
        std::optional<std::size_t> reference;
        const Capture_Entry* winner = nullptr;
        bool has_highlight_captures = false;

        for (const Capture_Entry& entry : group) {
            if (!entry.from_locals) {
                continue;
            }
            const Query_Match& match = locals[entry.match_index];
            if (entry.id == reserved.local_scope) {
                const Query_Pattern& pattern = language.locals().patterns[entry.pattern_index];
                tracker.enter_scope(begin, end, scope_inherits(pattern));
                definition.reset();
            }
            else if (entry.id == reserved.local_definition) {
                const Node_Index value = reserved.local_definition_value == Capture_Id::none
                    ? Node_Index::none
                    : match.find(reserved.local_definition_value);
                const std::size_t value_end = value == Node_Index::none ? 0 : tree[value].end;
                definition = tracker.define(text, begin, end, value_end);
                reference.reset();
            }
            else if (entry.id == reserved.local_reference && !definition) {
                reference = tracker.resolve(text, begin);
                out.references.push_back({
                    .name = text,
                    .begin = begin,
                    .end = end,
                    .definition = reference,
                });
            }
        }

        const bool is_local = definition || reference;
        for (const Capture_Entry& entry : group) {
            if (entry.from_locals) {
                continue;
            }
            has_highlight_captures = true;
            const std::u8string_view name = language.highlights().capture_name(entry.id);
            if (is_private_capture_name(name) || is_reserved_capture_name(name)) {
                continue;
            }
            const Pattern_Locality locality = language.highlight_locality(entry.pattern_index);
            if ((locality == Pattern_Locality::non_local && is_local)
                || (locality == Pattern_Locality::local && !is_local)) {
                continue;
            }
            winner = &entry;
        }

        const std::u8string_view winner_name
            = winner ? language.highlights().capture_name(winner->id) : std::u8string_view {};
        if (definition) {
            tracker.set_definition_highlight(*definition, winner_name);
        }
        if (!has_highlight_captures) {
            continue;
        }

        std::u8string_view name = winner_name;
        if (reference && !tracker.definition(*reference).highlight.empty()) {
            name = tracker.definition(*reference).highlight;
        }
        if (name.empty()) {
            continue;
        }
        out.assignments.push_back({
            .begin = begin,
            .end = end,
            .name = name,
            .priority = winner ? winner->pattern_index : 0,
            .depth = 0,
        });
    }

    out.definitions.insert(
        out.definitions.end(), tracker.definitions().begin(), tracker.definitions().end()
    );
}

} // namespace treelight
