#ifndef TREELIGHT_SYNTAX_TREE_HPP
#define TREELIGHT_SYNTAX_TREE_HPP

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/transparent_comparison.hpp"

#include "treelight/fwd.hpp"

namespace treelight {

struct Syntax_Node {
    /// @brief The kind of the node, such as `identifier`.
    /// For anonymous nodes, this is the literal text of the token, such as `return`.
    Symbol kind;
    /// @brief The name of the field under which the node appears in its parent,
    /// or `Symbol::none`.
    Symbol field;
    /// @brief `true` if the node is named, `false` if anonymous.
    bool named;
    /// @brief The index of the first code unit that belongs to the node.
    std::size_t begin;
    /// @brief The index past the last code unit that belongs to the node.
    std::size_t end;
    /// @brief The parent node, or `Node_Index::none` for the root.
    Node_Index parent;
    /// @brief The index one past the last node in the subtree rooted at this node.
    Node_Index subtree_end;
    std::uint32_t children_begin;
    std::uint32_t children_count;

    [[nodiscard]]
    constexpr std::size_t length() const
    {
        return end - begin;
    }
};

/// @brief An immutable syntax tree, as produced by a `Language_Parser`.
/// Nodes are stored in pre-order, so that `Node_Index` order is document order,
/// with outer nodes preceding inner nodes.
/// The tree does not own the source code that it describes.
struct Syntax_Tree {
private:
    using Symbol_Map = std::pmr::unordered_map<
        std::pmr::u8string,
        Symbol,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>;

    std::pmr::vector<Syntax_Node> m_nodes;
    std::pmr::vector<Node_Index> m_children;
    std::pmr::vector<std::pmr::u8string> m_symbol_names;
    Symbol_Map m_symbols;

public:
    [[nodiscard]]
    explicit Syntax_Tree(std::pmr::memory_resource* memory)
        : m_nodes { memory }
        , m_children { memory }
        , m_symbol_names { memory }
        , m_symbols { memory }
    {
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_nodes.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_nodes.empty();
    }

    [[nodiscard]]
    Node_Index root() const
    {
        TREELIGHT_ASSERT(!empty());
        return Node_Index {};
    }

    [[nodiscard]]
    const Syntax_Node& operator[](Node_Index index) const
    {
        TREELIGHT_DEBUG_ASSERT(std::size_t(index) < m_nodes.size());
        return m_nodes[std::size_t(index)];
    }

    [[nodiscard]]
    std::span<const Syntax_Node> nodes() const noexcept
    {
        return m_nodes;
    }

    [[nodiscard]]
    std::span<const Node_Index> children(Node_Index index) const
    {
        const Syntax_Node& node = (*this)[index];
        return std::span { m_children }.subspan(node.children_begin, node.children_count);
    }

    [[nodiscard]]
    std::u8string_view symbol_name(Symbol symbol) const
    {
        if (symbol == Symbol::none) {
            return {};
        }
        TREELIGHT_DEBUG_ASSERT(std::size_t(symbol) < m_symbol_names.size());
        return m_symbol_names[std::size_t(symbol)];
    }

    /// @brief Returns the symbol with the given `name`,
    /// or `Symbol::none` if no node in this tree uses that name as kind or field.
    [[nodiscard]]
    Symbol find_symbol(std::u8string_view name) const
    {
        const auto it = m_symbols.find(name);
        return it == m_symbols.end() ? Symbol::none : it->second;
    }

    [[nodiscard]]
    std::u8string_view kind_name(Node_Index index) const
    {
        return symbol_name((*this)[index].kind);
    }

    [[nodiscard]]
    std::u8string_view field_name(Node_Index index) const
    {
        return symbol_name((*this)[index].field);
    }

    /// @brief Returns the text of the node within `source`.
    [[nodiscard]]
    std::u8string_view text(Node_Index index, std::u8string_view source) const
    {
        const Syntax_Node& node = (*this)[index];
        TREELIGHT_ASSERT(node.end <= source.size());
        return source.substr(node.begin, node.length());
    }

    /// @brief Returns `true` if `descendant` is contained in the subtree rooted at `ancestor`,
    /// including the case where both are the same node.
    [[nodiscard]]
    bool is_in_subtree(Node_Index descendant, Node_Index ancestor) const
    {
        return descendant >= ancestor && descendant < (*this)[ancestor].subtree_end;
    }

private:
    friend Syntax_Tree_Builder;

    Symbol intern(std::u8string_view name);
};

enum struct Tree_Build_Error : Default_Underlying {
    /// @brief No node was added.
    no_root,
    /// @brief More than one node was added at the outermost level.
    multiple_roots,
    /// @brief `build` was called while nodes were still open.
    unclosed_node,
    /// @brief `close` was called while no node was open.
    unbalanced_close,
    /// @brief A node ends before it begins.
    bad_range,
    /// @brief A node is not contained in the range of its parent.
    outside_parent,
    /// @brief A node begins before its preceding sibling ends.
    overlapping_siblings,
};

[[nodiscard]]
std::u8string_view tree_build_error_message(Tree_Build_Error error);

/// @brief Builds a `Syntax_Tree` from a sequence of `open` and `close` calls in document order.
/// This is the interface through which external parsers hand trees to the engine.
/// Misuse is not checked immediately;
/// instead, the first error is returned by `build`.
struct Syntax_Tree_Builder {
private:
    struct Open_Node {
        Node_Index index;
        std::size_t children_offset;
        std::size_t last_child_end;
    };

    Syntax_Tree m_tree;
    std::pmr::vector<Open_Node> m_open;
    /// @brief The children of all open nodes, stacked.
    std::pmr::vector<Node_Index> m_pending_children;
    std::size_t m_root_count = 0;
    Result<void, Tree_Build_Error> m_status;

public:
    [[nodiscard]]
    explicit Syntax_Tree_Builder(std::pmr::memory_resource* memory)
        : m_tree { memory }
        , m_open { memory }
        , m_pending_children { memory }
    {
    }

    /// @brief Opens a node which becomes the last child of the innermost open node.
    /// @param kind The kind of the node, or the token text for anonymous nodes.
    /// @param begin The index of the first code unit of the node.
    /// @param field The field name under which the node appears in its parent, if any.
    /// @param named `true` if the node is named.
    void open(
        std::u8string_view kind,
        std::size_t begin,
        std::u8string_view field = {},
        bool named = true
    );

    /// @brief Closes the innermost open node.
    void close(std::size_t end);

    /// @brief Equivalent to `open(kind, begin, field, named)` followed by `close(end)`.
    void leaf(
        std::u8string_view kind,
        std::size_t begin,
        std::size_t end,
        std::u8string_view field = {},
        bool named = true
    )
    {
        open(kind, begin, field, named);
        close(end);
    }

    /// @brief Adds an anonymous leaf node whose kind is `text`.
    void token(std::u8string_view text, std::size_t begin, std::u8string_view field = {})
    {
        leaf(text, begin, begin + text.length(), field, false);
    }

    [[nodiscard]]
    Result<Syntax_Tree, Tree_Build_Error> build() &&;

private:
    void fail(Tree_Build_Error error);
};

} // namespace treelight

#endif
