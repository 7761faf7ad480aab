#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "treelight/util/assert.hpp"
#include "treelight/util/result.hpp"

#include "treelight/syntax_tree.hpp"

namespace treelight {

Symbol Syntax_Tree::intern(std::u8string_view name)
{
    if (const auto it = m_symbols.find(name); it != m_symbols.end()) {
        return it->second;
    }
    const auto result = Symbol(m_symbol_names.size());
    m_symbol_names.emplace_back(name);
    m_symbols.emplace(m_symbol_names.back(), result);
    return result;
}

std::u8string_view tree_build_error_message(Tree_Build_Error error)
{
    switch (error) {
        using enum Tree_Build_Error;
    case no_root: return u8"The tree has no nodes.";
    case multiple_roots: return u8"The tree has more than one root node.";
    case unclosed_node: return u8"Some nodes were opened but never closed.";
    case unbalanced_close: return u8"A node was closed while no node was open.";
    case bad_range: return u8"A node ends before it begins.";
    case outside_parent: return u8"A node is not contained in its parent.";
    case overlapping_siblings: return u8"A node begins before its preceding sibling ends.";
    }
    TREELIGHT_ASSERT_UNREACHABLE(u8"Invalid tree build error.");
}

void Syntax_Tree_Builder::fail(Tree_Build_Error error)
{
    if (m_status) {
        m_status = error;
    }
}

void Syntax_Tree_Builder::open(
    std::u8string_view kind,
    std::size_t begin,
    std::u8string_view field,
    bool named
)
{
    const auto index = Node_Index(m_tree.m_nodes.size());
    Node_Index parent = Node_Index::none;

    if (m_open.empty()) {
        ++m_root_count;
        if (m_root_count > 1) {
            fail(Tree_Build_Error::multiple_roots);
        }
    }
    else {
        Open_Node& top = m_open.back();
        parent = top.index;
        if (begin < m_tree[parent].begin) {
            fail(Tree_Build_Error::outside_parent);
        }
        if (begin < top.last_child_end) {
            fail(Tree_Build_Error::overlapping_siblings);
        }
        m_pending_children.push_back(index);
    }

    const Symbol kind_symbol = m_tree.intern(kind);
    const Symbol field_symbol = field.empty() ? Symbol::none : m_tree.intern(field);
    m_tree.m_nodes.push_back({
        .kind = kind_symbol,
        .field = field_symbol,
        .named = named,
        .begin = begin,
        .end = begin,
        .parent = parent,
        .subtree_end = index,
        .children_begin = 0,
        .children_count = 0,
    });
    m_open.push_back({
        .index = index,
        .children_offset = m_pending_children.size(),
        .last_child_end = begin,
    });
}

void Syntax_Tree_Builder::close(std::size_t end)
{
    if (m_open.empty()) {
        fail(Tree_Build_Error::unbalanced_close);
        return;
    }
    const Open_Node top = m_open.back();
    m_open.pop_back();

    Syntax_Node& node = m_tree.m_nodes[std::size_t(top.index)];
    if (end < node.begin) {
        fail(Tree_Build_Error::bad_range);
        end = node.begin;
    }
    if (end < top.last_child_end) {
        fail(Tree_Build_Error::outside_parent);
    }
    node.end = end;
    node.subtree_end = Node_Index(m_tree.m_nodes.size());

    // The children of this node are the last ones on the pending stack.
    // Since children are closed before their parents,
    // the children of every node end up contiguous in the tree.
    node.children_begin = std::uint32_t(m_tree.m_children.size());
    node.children_count = std::uint32_t(m_pending_children.size() - top.children_offset);
    m_tree.m_children.insert(
        m_tree.m_children.end(), m_pending_children.begin() + std::ptrdiff_t(top.children_offset),
        m_pending_children.end()
    );
    m_pending_children.resize(top.children_offset);

    if (!m_open.empty()) {
        m_open.back().last_child_end = end;
    }
}

Result<Syntax_Tree, Tree_Build_Error> Syntax_Tree_Builder::build() &&
{
    if (!m_open.empty()) {
        fail(Tree_Build_Error::unclosed_node);
    }
    if (m_root_count == 0) {
        fail(Tree_Build_Error::no_root);
    }
    if (!m_status) {
        return m_status.error();
    }
    return std::move(m_tree);
}

} // namespace treelight
