#include <algorithm>
#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "treelight/util/result.hpp"

#include "treelight/collecting_logger.hpp"
#include "treelight/diagnostic.hpp"
#include "treelight/highlight_resolver.hpp"
#include "treelight/injection.hpp"
#include "treelight/language.hpp"
#include "treelight/query_match.hpp"
#include "treelight/syntax_tree.hpp"

#include "test_language.hpp"

namespace treelight {
namespace {

// <% let x %> text <% x %>
constexpr std::u8string_view template_source = u8"<% let x %> text <% x %>";

[[nodiscard]]
Syntax_Tree make_template_tree(std::pmr::memory_resource* memory)
{
    Syntax_Tree_Builder builder { memory };
    builder.open(u8"template", 0);
    builder.open(u8"directive", 0);
    builder.token(u8"<%", 0);
    builder.leaf(u8"code", 2, 9);
    builder.token(u8"%>", 9);
    builder.close(11);
    builder.leaf(u8"content", 11, 17);
    builder.open(u8"directive", 17);
    builder.token(u8"<%", 17);
    builder.leaf(u8"code", 19, 22);
    builder.token(u8"%>", 22);
    builder.close(24);
    builder.close(24);
    return std::move(builder).build().value();
}

constexpr Node_Index first_code { 3 };
constexpr Node_Index second_code { 8 };

struct Injection_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Test_Parser parser;
    Collecting_Logger logger { &memory };
    Language_Map languages { &memory };
    Syntax_Tree tree = make_template_tree(&memory);
    Language_Config embedded = make_test_language(
                                   u8"test", &parser,
                                   { .highlights = u8"\"let\" @keyword\n(identifier) @variable" },
                                   &memory
    )
                                   .value();
    std::pmr::vector<Injection_Site> sites { &memory };

    Injection_Test()
    {
        languages.insert(embedded);
    }

    void collect(const Language_Config& language)
    {
        std::pmr::vector<Query_Match> matches { &memory };
        ASSERT_EQ(
            match_query(matches, language.injections(), tree, template_source),
            Match_Status::complete
        );
        const Injection_Layer layer {
            .outer = nullptr,
            .fragments = {},
            .language = &language,
            .root_source = template_source,
            .document_name = u8"test.erb",
            .logger = &logger,
            .depth = 0,
        };
        collect_injection_sites(sites, layer, tree, template_source, matches, languages);
    }
};

TEST_F(Injection_Test, separate_sites)
{
    const Language_Config outer = make_test_language(
                                      u8"template", nullptr,
                                      { .injections = u8"((code) @injection.content "
                                                      u8"(#set! injection.language \"test\"))" },
                                      &memory
    )
                                      .value();
    collect(outer);

    ASSERT_EQ(sites.size(), 2);
    EXPECT_EQ(sites[0].language, &embedded);
    ASSERT_EQ(sites[0].content_nodes.size(), 1);
    EXPECT_EQ(sites[0].content_nodes[0], first_code);
    ASSERT_EQ(sites[1].content_nodes.size(), 1);
    EXPECT_EQ(sites[1].content_nodes[0], second_code);
    EXPECT_FALSE(sites[0].include_children);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Injection_Test, combined_site)
{
    const Language_Config outer = make_test_language(
                                      u8"template", nullptr,
                                      { .injections = u8"((code) @injection.content\n"
                                                      u8" (#set! injection.language \"test\")\n"
                                                      u8" (#set! injection.combined))" },
                                      &memory
    )
                                      .value();
    collect(outer);

    ASSERT_EQ(sites.size(), 1);
    EXPECT_EQ(sites[0].language, &embedded);
    const Node_Index expected_nodes[] { first_code, second_code };
    EXPECT_TRUE(std::ranges::equal(sites[0].content_nodes, expected_nodes));

    Sub_Document document { &memory };
    build_sub_document(document, sites[0], tree, template_source);
    EXPECT_EQ(document.text, u8" let x  x ");
    const Fragment expected_fragments[] {
        { .sub_begin = 0, .parent_begin = 2, .length = 7 },
        { .sub_begin = 7, .parent_begin = 19, .length = 3 },
    };
    EXPECT_TRUE(std::ranges::equal(document.fragments, expected_fragments));

    EXPECT_EQ(document.to_parent(0), 2);
    EXPECT_EQ(document.to_parent(6), 8);
    EXPECT_EQ(document.to_parent(7), 19);
    EXPECT_EQ(document.to_parent(10), 22);
}

TEST_F(Injection_Test, self_injection)
{
    const Language_Config outer = make_test_language(
                                      u8"template", nullptr,
                                      { .injections = u8"((content) @injection.content "
                                                      u8"(#set! injection.self))" },
                                      &memory
    )
                                      .value();
    collect(outer);

    ASSERT_EQ(sites.size(), 1);
    EXPECT_EQ(sites[0].language, &outer);
}

TEST_F(Injection_Test, parent_injection_without_parent)
{
    const Language_Config outer = make_test_language(
                                      u8"template", nullptr,
                                      { .injections = u8"((content) @injection.content "
                                                      u8"(#set! injection.parent))" },
                                      &memory
    )
                                      .value();
    collect(outer);
    EXPECT_TRUE(sites.empty());
}

TEST_F(Injection_Test, unknown_language)
{
    const Language_Config outer = make_test_language(
                                      u8"template", nullptr,
                                      { .injections = u8"((code) @injection.content "
                                                      u8"(#set! injection.language \"tset\"))" },
                                      &memory
    )
                                      .value();
    collect(outer);

    EXPECT_TRUE(sites.empty());
    ASSERT_EQ(logger.count(diagnostic::injection_language), 2);
    const Collected_Diagnostic& d = logger.diagnostics[0];
    EXPECT_EQ(d.severity, Severity::warning);
    EXPECT_EQ(d.file, u8"test.erb");
    EXPECT_EQ(d.location.begin, 2);
    EXPECT_EQ(d.location.length, 7);
    EXPECT_EQ(
        d.message, u8"The injected language \"tset\" is not known. Did you mean \"test\"?"
    );
}

TEST_F(Injection_Test, sub_document_excludes_children)
{
    constexpr std::u8string_view source = u8"ab{cd}ef";
    Syntax_Tree_Builder builder { &memory };
    builder.open(u8"outer", 0);
    builder.leaf(u8"inner", 2, 6);
    builder.close(8);
    const Syntax_Tree nested = std::move(builder).build().value();

    Injection_Site site { &memory };
    site.language = &embedded;
    site.content_nodes.push_back(nested.root());

    Sub_Document excluded { &memory };
    build_sub_document(excluded, site, nested, source);
    EXPECT_EQ(excluded.text, u8"abef");
    const Fragment expected_excluded[] {
        { .sub_begin = 0, .parent_begin = 0, .length = 2 },
        { .sub_begin = 2, .parent_begin = 6, .length = 2 },
    };
    EXPECT_TRUE(std::ranges::equal(excluded.fragments, expected_excluded));

    site.include_children = true;
    Sub_Document included { &memory };
    build_sub_document(included, site, nested, source);
    EXPECT_EQ(included.text, source);
    ASSERT_EQ(included.fragments.size(), 1);
    EXPECT_EQ(included.fragments[0].length, 8);
}

TEST_F(Injection_Test, translate_splits_at_fragments)
{
    Sub_Document document { &memory };
    document.text = u8" let x  x ";
    document.fragments.push_back({ .sub_begin = 0, .parent_begin = 2, .length = 7 });
    document.fragments.push_back({ .sub_begin = 7, .parent_begin = 19, .length = 3 });

    const Highlight_Assignment assignments[] {
        { .begin = 1, .end = 4, .name = u8"keyword", .priority = 0 },
        { .begin = 5, .end = 9, .name = u8"comment", .priority = 2, .depth = 1 },
    };
    std::pmr::vector<Highlight_Assignment> translated { &memory };
    translate_assignments(translated, assignments, document);

    const Highlight_Assignment expected[] {
        { .begin = 3, .end = 6, .name = u8"keyword", .priority = 0, .depth = 1 },
        { .begin = 7, .end = 9, .name = u8"comment", .priority = 2, .depth = 2 },
        { .begin = 19, .end = 21, .name = u8"comment", .priority = 2, .depth = 2 },
    };
    EXPECT_TRUE(std::ranges::equal(translated, expected));
}

} // namespace
} // namespace treelight
