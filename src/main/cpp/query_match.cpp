#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/function_ref.hpp"

#include "treelight/query.hpp"
#include "treelight/query_match.hpp"
#include "treelight/syntax_tree.hpp"

namespace treelight {
namespace {

/// @brief Returns `true` if `test` holds for every node bound to `capture`,
/// or for any node if `any` is `true`.
/// A capture that is bound to no nodes satisfies any predicate.
template <typename Test>
[[nodiscard]]
bool test_capture(std::span<const Capture> captures, Capture_Id capture, bool any, Test test)
{
    bool found = false;
    for (const Capture& c : captures) {
        if (c.id != capture) {
            continue;
        }
        found = true;
        const bool result = test(c.node);
        if (any && result) {
            return true;
        }
        if (!any && !result) {
            return false;
        }
    }
    return !any || !found;
}

struct [[nodiscard]] Pattern_Matcher {
private:
    /// @brief Matches a sequence of sibling patterns,
    /// i.e. the children patterns of one pattern node or the elements of a group,
    /// against a sequence of sibling nodes.
    struct [[nodiscard]] Children_Matcher {
        Pattern_Matcher& self;
        std::span<const Anchored_Child> elements;
        std::span<const Node_Index> children;
        bool anchored_last;
        /// @brief If `true`, the first placed element has to match `children[0]`,
        /// and at least one element has to be placed.
        bool pinned;
        /// @brief Called with one past the position of the last placed child
        /// once all elements are placed.
        Function_Ref<bool(std::size_t)> done;
        /// @brief States (element, child, repeating) from which no match was found
        /// for structural reasons.
        /// States whose failure involved rejected matches are not recorded
        /// because predicates depend on the captures bound before reaching the state.
        std::pmr::vector<bool> failed;

        [[nodiscard]]
        std::size_t state_index(std::size_t i, std::size_t j, bool repeating) const
        {
            return (((i * (children.size() + 1)) + j) * 2) + std::size_t(repeating);
        }

        [[nodiscard]]
        bool is_named(std::size_t j) const
        {
            return self.m_tree[children[j]].named;
        }

        /// @brief Returns one past the last position where an element may be placed
        /// if it has to follow position `j` immediately.
        /// Anonymous nodes may be skipped, but not named ones.
        [[nodiscard]]
        std::size_t anchored_limit(std::size_t j) const
        {
            std::size_t c = j;
            while (c < children.size() && !is_named(c)) {
                ++c;
            }
            return std::min(c + 1, children.size());
        }

        /// @brief Returns one past the last position where `elements[i]` may be placed
        /// when the search starts at position `j`.
        [[nodiscard]]
        std::size_t placement_limit(std::size_t i, std::size_t j, bool first_repetition) const
        {
            // Nothing has been placed yet if j == 0.
            if (pinned && j == 0) {
                return std::min(std::size_t(1), children.size());
            }
            return elements[i].anchored && first_repetition ? anchored_limit(j) : children.size();
        }

        void record_failure(std::size_t state, std::size_t rejections)
        {
            if (!self.m_exhausted && self.m_rejections == rejections) {
                failed[state] = true;
            }
        }

        /// @brief Places `elements[i]` at position `c`,
        /// calling `next` with the position that follows the placement.
        bool place(std::size_t i, std::size_t c, Function_Ref<bool(std::size_t)> next)
        {
            const Pattern_Node& element = self.m_pattern.nodes[elements[i].node];
            if (element.kind == Pattern_Node_Kind::group) {
                return self.match_siblings(
                    element, children.subspan(c), [&](std::size_t end) { return next(c + end); }
                );
            }
            const auto next_sibling = [&] { return next(c + 1); };
            return self.match_node(elements[i].node, children[c], next_sibling);
        }

        /// @brief Matches `elements[i..]` against `children[j..]`.
        bool sequence(std::size_t i, std::size_t j)
        {
            if (i == elements.size()) {
                if (pinned && j == 0) {
                    return false;
                }
                if (anchored_last) {
                    for (std::size_t c = j; c < children.size(); ++c) {
                        if (is_named(c)) {
                            return false;
                        }
                    }
                }
                return done(j);
            }
            const std::size_t state = state_index(i, j, false);
            if (failed[state]) {
                return false;
            }
            const std::size_t rejections = self.m_rejections;
            const Pattern_Node& element = self.m_pattern.nodes[elements[i].node];
            const bool result = element.quantifier == Quantifier::one ? single(i, j)
                                                                      : repetition(i, j, 0);
            if (!result) {
                record_failure(state, rejections);
            }
            return result;
        }

        /// @brief Matches an unquantified element.
        /// Every position where the element can be placed yields its own matches.
        bool single(std::size_t i, std::size_t j)
        {
            const std::size_t limit = placement_limit(i, j, true);
            bool any = false;
            for (std::size_t c = j; c < limit; ++c) {
                const auto next = [&](std::size_t end) { return sequence(i + 1, end); };
                any |= place(i, c, next);
                if (self.m_exhausted) {
                    break;
                }
            }
            return any;
        }

        /// @brief Matches a quantified element greedily.
        /// Once a greedy choice leads to an accepted match,
        /// choices with fewer repetitions are not tried.
        bool repetition(std::size_t i, std::size_t j, std::size_t count)
        {
            const bool repeating = count != 0;
            const std::size_t state = state_index(i, j, true);
            if (repeating && failed[state]) {
                return false;
            }
            const std::size_t rejections = self.m_rejections;

            const Pattern_Node& element = self.m_pattern.nodes[elements[i].node];
            const bool can_repeat = count == 0 || quantifier_allows_many(element.quantifier);
            if (can_repeat) {
                const std::size_t limit = placement_limit(i, j, count == 0);
                for (std::size_t c = j; c < limit; ++c) {
                    const auto next = [&](std::size_t end) { return repetition(i, end, count + 1); };
                    if (place(i, c, next)) {
                        return true;
                    }
                    if (self.m_exhausted) {
                        return false;
                    }
                }
            }

            const bool enough = count != 0 || quantifier_allows_zero(element.quantifier);
            const bool result = enough && sequence(i + 1, j);
            if (repeating && !result) {
                record_failure(state, rejections);
            }
            return result;
        }
    };

    const Query_Pattern& m_pattern;
    const Syntax_Tree& m_tree;
    std::pmr::vector<Capture>& m_bindings;
    Function_Ref<bool()> m_accept;
    const std::size_t m_step_limit;
    std::size_t m_steps = 0;
    /// @brief The number of complete structural matches that `m_accept` rejected.
    std::size_t m_rejections = 0;
    bool m_exhausted = false;

public:
    /// @param accept Called for every complete structural match,
    /// with the captures in `bindings`.
    /// Returns `true` if the match is accepted.
    [[nodiscard]]
    Pattern_Matcher(
        const Query_Pattern& pattern,
        const Syntax_Tree& tree,
        std::pmr::vector<Capture>& bindings,
        Function_Ref<bool()> accept,
        std::size_t step_limit
    )
        : m_pattern { pattern }
        , m_tree { tree }
        , m_bindings { bindings }
        , m_accept { accept }
        , m_step_limit { step_limit }
    {
    }

    [[nodiscard]]
    bool is_exhausted() const
    {
        return m_exhausted;
    }

    /// @brief Matches the whole pattern against the node `n`,
    /// passing every complete match to the `accept` function.
    void match_root(Node_Index n)
    {
        const Pattern_Node& root = m_pattern.nodes[m_pattern.root];
        if (root.kind != Pattern_Node_Kind::group) {
            const auto finish = [&] { return accept(); };
            match_node(m_pattern.root, n, finish);
            return;
        }

        // A top-level group matches n followed by its later siblings.
        const auto finish = [&](std::size_t) { return accept(); };
        const Node_Index parent = m_tree[n].parent;
        if (parent == Node_Index::none) {
            match_siblings(root, std::span<const Node_Index> { &n, 1 }, finish);
            return;
        }
        const std::span<const Node_Index> siblings = m_tree.children(parent);
        const auto position = std::size_t(std::ranges::find(siblings, n) - siblings.begin());
        TREELIGHT_ASSERT(position < siblings.size());
        match_siblings(root, siblings.subspan(position), finish);
    }

private:
    bool accept()
    {
        if (m_accept()) {
            return true;
        }
        ++m_rejections;
        return false;
    }

    /// @brief Matches the pattern node at `index` against the syntax node `n`,
    /// calling `next` for every way in which it matches.
    /// @return `true` if any call to `next` returned `true`.
    bool match_node(std::uint32_t index, Node_Index n, Function_Ref<bool()> next)
    {
        if (m_exhausted) {
            return false;
        }
        if (++m_steps > m_step_limit) {
            m_exhausted = true;
            return false;
        }

        const Pattern_Node& p = m_pattern.nodes[index];
        const Syntax_Node& node = m_tree[n];
        if (!p.field.empty() && m_tree.field_name(n) != p.field) {
            return false;
        }

        switch (p.kind) {
        case Pattern_Node_Kind::named: {
            if (!node.named || m_tree.kind_name(n) != p.text) {
                return false;
            }
            break;
        }
        case Pattern_Node_Kind::named_wildcard: {
            if (!node.named) {
                return false;
            }
            break;
        }
        case Pattern_Node_Kind::wildcard: break;
        case Pattern_Node_Kind::anonymous: {
            if (node.named || m_tree.kind_name(n) != p.text) {
                return false;
            }
            break;
        }
        case Pattern_Node_Kind::alternation: {
            const std::size_t initial_size = bind(p, n);
            bool result = false;
            for (const Anchored_Child& alternative : p.children) {
                if (match_node(alternative.node, n, next)) {
                    result = true;
                    break;
                }
                if (m_exhausted) {
                    break;
                }
            }
            m_bindings.resize(initial_size);
            return result;
        }
        case Pattern_Node_Kind::group: {
            TREELIGHT_ASSERT_UNREACHABLE(u8"Groups are matched against siblings, not single nodes.");
        }
        }

        for (const std::u8string_view field : p.negated_fields) {
            for (const Node_Index child : m_tree.children(n)) {
                if (m_tree.field_name(child) == field) {
                    return false;
                }
            }
        }

        const std::size_t initial_size = bind(p, n);
        bool result;
        if (p.children.empty() && !p.anchored_last) {
            result = next();
        }
        else {
            result = match_sequence(p, m_tree.children(n), false, [&](std::size_t) {
                return next();
            });
        }
        m_bindings.resize(initial_size);
        return result;
    }

    /// @brief Matches the elements of the group `p` against consecutive `siblings`,
    /// where the first placed element has to match `siblings[0]`.
    bool match_siblings(
        const Pattern_Node& p,
        std::span<const Node_Index> siblings,
        Function_Ref<bool(std::size_t)> next
    )
    {
        TREELIGHT_DEBUG_ASSERT(p.kind == Pattern_Node_Kind::group);
        return match_sequence(p, siblings, true, next);
    }

    bool match_sequence(
        const Pattern_Node& p,
        std::span<const Node_Index> children,
        bool pinned,
        Function_Ref<bool(std::size_t)> next
    )
    {
        const std::size_t state_count = (p.children.size() + 1) * (children.size() + 1) * 2;
        Children_Matcher matcher {
            .self = *this,
            .elements = p.children,
            .children = children,
            .anchored_last = p.anchored_last,
            .pinned = pinned,
            .done = next,
            .failed = std::pmr::vector<bool>(state_count, false, m_bindings.get_allocator()),
        };
        return matcher.sequence(0, 0);
    }

    std::size_t bind(const Pattern_Node& p, Node_Index n)
    {
        const std::size_t initial_size = m_bindings.size();
        for (const Capture_Id id : p.captures) {
            m_bindings.push_back({ id, n });
        }
        return initial_size;
    }
};

} // namespace

bool evaluate_predicates(
    const Query_Pattern& pattern,
    std::span<const Capture> captures,
    const Syntax_Tree& tree,
    std::u8string_view source
)
{
    const auto text = [&](Node_Index n) { return tree.text(n, source); };

    for (const Predicate& predicate : pattern.predicates) {
        if (const auto* const eq = std::get_if<Text_Equality_Predicate>(&predicate)) {
            bool result;
            if (eq->other == Capture_Id::none) {
                result = test_capture(captures, eq->capture, eq->any, [&](Node_Index x) {
                    return (text(x) == eq->literal) != eq->negated;
                });
            }
            else {
                result = test_capture(captures, eq->capture, eq->any, [&](Node_Index x) {
                    return test_capture(captures, eq->other, eq->any, [&](Node_Index y) {
                        return (text(x) == text(y)) != eq->negated;
                    });
                });
            }
            if (!result) {
                return false;
            }
        }
        else if (const auto* const match = std::get_if<Text_Match_Predicate>(&predicate)) {
            const bool result = test_capture(captures, match->capture, match->any, [&](Node_Index x) {
                const bool found = match->regex.search(text(x)).status == Reg_Exp_Status::matched;
                return found != match->negated;
            });
            if (!result) {
                return false;
            }
        }
        else if (const auto* const any_of = std::get_if<Any_Of_Predicate>(&predicate)) {
            const bool result = test_capture(captures, any_of->capture, false, [&](Node_Index x) {
                const bool found = std::ranges::find(any_of->values, text(x)) != any_of->values.end();
                return found != any_of->negated;
            });
            if (!result) {
                return false;
            }
        }
        else if (std::holds_alternative<Unknown_Predicate>(predicate)) {
            return false;
        }
    }
    return true;
}

Match_Status match_query(
    std::pmr::vector<Query_Match>& out,
    const Query& query,
    const Syntax_Tree& tree,
    std::u8string_view source,
    const Match_Options& options
)
{
    if (tree.empty()) {
        return Match_Status::complete;
    }
    std::pmr::memory_resource* const memory = out.get_allocator().resource();
    const std::size_t initial_size = out.size();
    auto status = Match_Status::complete;

    std::pmr::vector<Capture> bindings { memory };
    for (std::size_t n = 0; n < tree.size(); ++n) {
        for (std::size_t p = 0; p < query.patterns.size(); ++p) {
            const Query_Pattern& pattern = query.patterns[p];
            if (pattern.nodes.empty() || pattern.is_inert()) {
                continue;
            }
            TREELIGHT_ASSERT(bindings.empty());
            const auto on_complete = [&] {
                if (!evaluate_predicates(pattern, bindings, tree, source)) {
                    return false;
                }
                out.push_back(Query_Match {
                    .pattern_index = p,
                    .node = Node_Index(n),
                    .captures = std::pmr::vector<Capture>(bindings, memory),
                });
                return true;
            };
            Pattern_Matcher matcher { pattern, tree, bindings, on_complete, options.step_limit };
            matcher.match_root(Node_Index(n));
            if (matcher.is_exhausted()) {
                status = Match_Status::truncated;
            }
        }
    }

    const auto match_begin = [&](const Query_Match& m) {
        if (m.captures.empty()) {
            return tree[m.node].begin;
        }
        std::size_t result = tree[m.captures.front().node].begin;
        for (const Capture& c : m.captures) {
            result = std::min(result, tree[c.node].begin);
        }
        return result;
    };
    std::stable_sort(
        out.begin() + std::ptrdiff_t(initial_size), out.end(),
        [&](const Query_Match& x, const Query_Match& y) {
            const std::size_t x_begin = match_begin(x);
            const std::size_t y_begin = match_begin(y);
            return x_begin != y_begin ? x_begin < y_begin : x.pattern_index < y.pattern_index;
        }
    );
    return status;
}

} // namespace treelight
