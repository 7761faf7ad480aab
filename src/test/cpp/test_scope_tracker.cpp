#include <cstddef>
#include <memory_resource>
#include <optional>

#include <gtest/gtest.h>

#include "treelight/scope_tracker.hpp"

namespace treelight {
namespace {

TEST(Scope_Tracker, root_scope)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    EXPECT_EQ(tracker.current_scope(), Scope_Index::root);
    EXPECT_EQ(tracker.depth(), 1);
    ASSERT_EQ(tracker.scopes().size(), 1);
    EXPECT_EQ(tracker.scopes()[0].end, 100);

    tracker.advance_to(100);
    EXPECT_EQ(tracker.current_scope(), Scope_Index::root);
}

TEST(Scope_Tracker, resolve_in_same_scope)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    const std::size_t x = tracker.define(u8"x", 0, 1);
    EXPECT_EQ(tracker.resolve(u8"x", 10), x);
    EXPECT_EQ(tracker.resolve(u8"y", 10), std::nullopt);
}

TEST(Scope_Tracker, later_definitions_shadow_earlier)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    tracker.define(u8"x", 0, 1);
    const std::size_t second = tracker.define(u8"x", 10, 11);
    EXPECT_EQ(tracker.resolve(u8"x", 20), second);
}

TEST(Scope_Tracker, inner_scope_inherits)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    const std::size_t outer = tracker.define(u8"x", 0, 1);
    tracker.advance_to(10);
    tracker.enter_scope(10, 50);
    EXPECT_EQ(tracker.depth(), 2);
    EXPECT_EQ(tracker.resolve(u8"x", 20), outer);

    const std::size_t inner = tracker.define(u8"x", 20, 21);
    EXPECT_EQ(tracker.resolve(u8"x", 30), inner);

    tracker.advance_to(50);
    EXPECT_EQ(tracker.depth(), 1);
    EXPECT_EQ(tracker.resolve(u8"x", 60), outer);
}

TEST(Scope_Tracker, non_inheriting_scope)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    tracker.define(u8"x", 0, 1);
    tracker.advance_to(10);
    const Scope_Index scope = tracker.enter_scope(10, 50, false);
    EXPECT_EQ(tracker.current_scope(), scope);
    EXPECT_FALSE(tracker.scopes()[std::size_t(scope)].inherits);
    EXPECT_EQ(tracker.resolve(u8"x", 20), std::nullopt);

    const std::size_t local = tracker.define(u8"x", 20, 21);
    EXPECT_EQ(tracker.resolve(u8"x", 30), local);
}

TEST(Scope_Tracker, definition_value_end)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    const std::size_t outer = tracker.define(u8"x", 0, 1);
    tracker.enter_scope(5, 50);
    // x = x + 1, where the value ends at 20
    const std::size_t inner = tracker.define(u8"x", 10, 11, 20);
    EXPECT_EQ(tracker.resolve(u8"x", 14), outer);
    EXPECT_EQ(tracker.resolve(u8"x", 25), inner);
}

TEST(Scope_Tracker, nested_scopes_pop_together)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    tracker.enter_scope(0, 50);
    tracker.enter_scope(10, 30);
    tracker.enter_scope(20, 30);
    EXPECT_EQ(tracker.depth(), 4);

    tracker.advance_to(29);
    EXPECT_EQ(tracker.depth(), 4);
    tracker.advance_to(30);
    EXPECT_EQ(tracker.depth(), 2);
    tracker.advance_to(70);
    EXPECT_EQ(tracker.depth(), 1);
}

TEST(Scope_Tracker, definition_highlight)
{
    std::pmr::monotonic_buffer_resource memory;
    Scope_Tracker tracker { 100, &memory };

    const std::size_t x = tracker.define(u8"x", 0, 1);
    EXPECT_TRUE(tracker.definition(x).highlight.empty());
    tracker.set_definition_highlight(x, u8"variable");
    EXPECT_EQ(tracker.definition(x).highlight, u8"variable");
    EXPECT_EQ(tracker.definitions().size(), 1);
    EXPECT_EQ(tracker.definition(x).scope, Scope_Index::root);
}

} // namespace
} // namespace treelight
