#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "treelight/util/result.hpp"

#include "treelight/syntax_tree.hpp"

namespace treelight {
namespace {

TEST(Syntax_Tree, build_simple)
{
    std::pmr::monotonic_buffer_resource memory;
    constexpr std::u8string_view source = u8"let x = 1";

    Syntax_Tree_Builder builder { &memory };
    builder.open(u8"program", 0);
    builder.open(u8"let_declaration", 0);
    builder.token(u8"let", 0);
    builder.leaf(u8"identifier", 4, 5, u8"name");
    builder.token(u8"=", 6);
    builder.leaf(u8"number", 8, 9, u8"value");
    builder.close(9);
    builder.close(9);

    Result<Syntax_Tree, Tree_Build_Error> result = std::move(builder).build();
    ASSERT_TRUE(result);
    const Syntax_Tree& tree = *result;

    ASSERT_EQ(tree.size(), 6);
    const Node_Index root = tree.root();
    EXPECT_EQ(tree.kind_name(root), u8"program");
    ASSERT_EQ(tree.children(root).size(), 1);

    const Node_Index declaration = tree.children(root)[0];
    EXPECT_EQ(tree.kind_name(declaration), u8"let_declaration");
    EXPECT_EQ(tree[declaration].parent, root);
    ASSERT_EQ(tree.children(declaration).size(), 4);

    const Node_Index keyword = tree.children(declaration)[0];
    EXPECT_FALSE(tree[keyword].named);
    EXPECT_EQ(tree.kind_name(keyword), u8"let");

    const Node_Index name = tree.children(declaration)[1];
    EXPECT_TRUE(tree[name].named);
    EXPECT_EQ(tree.field_name(name), u8"name");
    EXPECT_EQ(tree.text(name, source), u8"x");

    const Node_Index value = tree.children(declaration)[3];
    EXPECT_EQ(tree.field_name(value), u8"value");
    EXPECT_EQ(tree.text(value, source), u8"1");
    EXPECT_EQ(tree.text(declaration, source), source);

    EXPECT_TRUE(tree.is_in_subtree(value, root));
    EXPECT_TRUE(tree.is_in_subtree(value, declaration));
    EXPECT_TRUE(tree.is_in_subtree(value, value));
    EXPECT_FALSE(tree.is_in_subtree(declaration, value));
    EXPECT_FALSE(tree.is_in_subtree(name, keyword));
}

TEST(Syntax_Tree, nodes_in_pre_order)
{
    std::pmr::monotonic_buffer_resource memory;

    Syntax_Tree_Builder builder { &memory };
    builder.open(u8"a", 0);
    builder.open(u8"b", 0);
    builder.leaf(u8"c", 0, 1);
    builder.close(1);
    builder.leaf(u8"d", 2, 3);
    builder.close(3);

    Result<Syntax_Tree, Tree_Build_Error> result = std::move(builder).build();
    ASSERT_TRUE(result);
    const Syntax_Tree& tree = *result;

    ASSERT_EQ(tree.size(), 4);
    EXPECT_EQ(tree.kind_name(Node_Index(0)), u8"a");
    EXPECT_EQ(tree.kind_name(Node_Index(1)), u8"b");
    EXPECT_EQ(tree.kind_name(Node_Index(2)), u8"c");
    EXPECT_EQ(tree.kind_name(Node_Index(3)), u8"d");
    EXPECT_EQ(tree[Node_Index(0)].subtree_end, Node_Index(4));
    EXPECT_EQ(tree[Node_Index(1)].subtree_end, Node_Index(3));
}

TEST(Syntax_Tree, symbols_are_interned)
{
    std::pmr::monotonic_buffer_resource memory;

    Syntax_Tree_Builder builder { &memory };
    builder.open(u8"list", 0);
    builder.leaf(u8"item", 0, 1);
    builder.leaf(u8"item", 2, 3);
    builder.close(3);

    Result<Syntax_Tree, Tree_Build_Error> result = std::move(builder).build();
    ASSERT_TRUE(result);
    const Syntax_Tree& tree = *result;

    EXPECT_EQ(tree[Node_Index(1)].kind, tree[Node_Index(2)].kind);
    EXPECT_EQ(tree.find_symbol(u8"item"), tree[Node_Index(1)].kind);
    EXPECT_EQ(tree.find_symbol(u8"nothing"), Symbol::none);
}

TEST(Syntax_Tree, build_errors)
{
    std::pmr::monotonic_buffer_resource memory;

    {
        Syntax_Tree_Builder builder { &memory };
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::no_root);
    }
    {
        Syntax_Tree_Builder builder { &memory };
        builder.leaf(u8"a", 0, 1);
        builder.leaf(u8"b", 1, 2);
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::multiple_roots);
    }
    {
        Syntax_Tree_Builder builder { &memory };
        builder.open(u8"a", 0);
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::unclosed_node);
    }
    {
        Syntax_Tree_Builder builder { &memory };
        builder.leaf(u8"a", 0, 1);
        builder.close(1);
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::unbalanced_close);
    }
    {
        Syntax_Tree_Builder builder { &memory };
        builder.leaf(u8"a", 5, 2);
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::bad_range);
    }
    {
        Syntax_Tree_Builder builder { &memory };
        builder.open(u8"a", 0);
        builder.leaf(u8"b", 0, 10);
        builder.close(5);
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::outside_parent);
    }
    {
        Syntax_Tree_Builder builder { &memory };
        builder.open(u8"a", 0);
        builder.leaf(u8"b", 0, 3);
        builder.leaf(u8"c", 2, 4);
        builder.close(4);
        EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::overlapping_siblings);
    }
}

TEST(Syntax_Tree, first_error_wins)
{
    std::pmr::monotonic_buffer_resource memory;

    Syntax_Tree_Builder builder { &memory };
    builder.open(u8"a", 0);
    builder.leaf(u8"b", 0, 3);
    builder.leaf(u8"c", 2, 1);
    EXPECT_EQ(std::move(builder).build().error(), Tree_Build_Error::overlapping_siblings);
}

} // namespace
} // namespace treelight
