#ifndef TREELIGHT_HIGHLIGHT_RESOLVER_HPP
#define TREELIGHT_HIGHLIGHT_RESOLVER_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/fwd.hpp"
#include "treelight/query_match.hpp"
#include "treelight/scope_tracker.hpp"

namespace treelight {

/// @brief The assignment of a highlight name to a range of source code,
/// before overlapping assignments are flattened into events.
struct Highlight_Assignment {
    std::size_t begin;
    std::size_t end;
    /// @brief The full, possibly dot-separated highlight name, such as `function.builtin`.
    std::u8string_view name;
    /// @brief Among assignments with identical ranges and depth, the highest priority wins.
    /// This is the index of the pattern that produced the assignment.
    std::size_t priority;
    /// @brief The injection depth, where zero is the outermost document.
    std::size_t depth = 0;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlight_Assignment&, const Highlight_Assignment&)
        = default;
};

struct Highlight_Resolution {
    std::pmr::vector<Highlight_Assignment> assignments;
    std::pmr::vector<Local_Definition> definitions;
    std::pmr::vector<Local_Reference> references;

    [[nodiscard]]
    explicit Highlight_Resolution(std::pmr::memory_resource* memory)
        : assignments { memory }
        , definitions { memory }
        , references { memory }
    {
    }
};

/// @brief Assigns highlight names to the nodes captured by the highlights query,
/// taking local variables into account.
///
/// Captures are processed in a single walk in document order,
/// with outer nodes preceding inner nodes.
/// For each node, the captures of the locals query are processed first,
/// maintaining a `Scope_Tracker`.
/// Among the highlights captures for the same node, the last one wins,
/// except that patterns with `(#is-not? local)` are skipped for local variables,
/// and patterns with `(#is? local)` are skipped for all other nodes.
/// A reference that resolves to a definition takes on the highlight of that definition,
/// so that all occurrences of a local variable are highlighted alike.
/// @param locals The matches of `language.locals()`.
/// @param highlights The matches of `language.highlights()`.
void resolve_highlights(
    Highlight_Resolution& out,
    const Language_Config& language,
    const Syntax_Tree& tree,
    std::u8string_view source,
    std::span<const Query_Match> locals,
    std::span<const Query_Match> highlights
);

} // namespace treelight

#endif
