#ifndef TREELIGHT_QUERY_MATCH_HPP
#define TREELIGHT_QUERY_MATCH_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/fwd.hpp"
#include "treelight/settings.hpp"

namespace treelight {

struct Capture {
    Capture_Id id;
    Node_Index node;

    [[nodiscard]]
    friend constexpr bool operator==(const Capture&, const Capture&)
        = default;
};

struct Query_Match {
    /// @brief The index of the matched pattern within the query.
    std::size_t pattern_index;
    /// @brief The node that the outermost node of the pattern matched.
    Node_Index node;
    /// @brief The captures, in the order in which they appear in the pattern.
    /// A capture that is quantified can appear multiple times.
    std::pmr::vector<Capture> captures;

    /// @brief Returns the first node bound to the capture with the given `id`,
    /// or `Node_Index::none`.
    [[nodiscard]]
    Node_Index find(Capture_Id id) const
    {
        for (const Capture& c : captures) {
            if (c.id == id) {
                return c.node;
            }
        }
        return Node_Index::none;
    }
};

struct Match_Options {
    /// @brief The amount of steps that may be spent on matching one pattern against one node.
    /// When this limit is exceeded, the remaining ways in which the pattern could match
    /// that node are abandoned.
    std::size_t step_limit = default_match_step_limit;
};

enum struct Match_Status : Default_Underlying {
    /// @brief All matches were found.
    complete,
    /// @brief The step limit was exceeded for some nodes,
    /// so some matches may be missing.
    truncated,
};

/// @brief Matches every pattern of `query` against every node of `tree`.
/// Matches whose predicates fail are discarded.
/// Matches are appended to `out` in document order,
/// i.e. ordered by the earliest captured node
/// (or the matched node if there are no captures),
/// and then by pattern order.
/// @param source The source code that `tree` describes, used by text predicates.
[[nodiscard]]
Match_Status match_query(
    std::pmr::vector<Query_Match>& out,
    const Query& query,
    const Syntax_Tree& tree,
    std::u8string_view source,
    const Match_Options& options = {}
);

/// @brief Returns `true` if the text predicates of `pattern` hold for the given `captures`.
/// `#is?` and `#is-not?` predicates always hold here.
[[nodiscard]]
bool evaluate_predicates(
    const Query_Pattern& pattern,
    std::span<const Capture> captures,
    const Syntax_Tree& tree,
    std::u8string_view source
);

} // namespace treelight

#endif
