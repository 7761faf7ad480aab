#include <algorithm>
#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "treelight/util/result.hpp"

#include "treelight/collecting_logger.hpp"
#include "treelight/diagnostic.hpp"
#include "treelight/highlight.hpp"
#include "treelight/language.hpp"
#include "treelight/span_emitter.hpp"
#include "treelight/syntax_tree.hpp"

#include "test_language.hpp"

namespace treelight {
namespace {

// x = <<~BASH
//   echo hi
// BASH
constexpr std::u8string_view heredoc_source = u8"x = <<~BASH\n  echo hi\nBASH\n";

[[nodiscard]]
Syntax_Tree make_heredoc_tree(std::pmr::memory_resource* memory)
{
    Syntax_Tree_Builder builder { memory };
    builder.open(u8"program", 0);
    builder.leaf(u8"identifier", 0, 1);
    builder.token(u8"=", 2);
    builder.leaf(u8"heredoc_beginning", 4, 11);
    builder.open(u8"heredoc_body", 12);
    builder.leaf(u8"heredoc_content", 12, 22);
    builder.leaf(u8"heredoc_end", 22, 26);
    builder.close(26);
    builder.close(27);
    return std::move(builder).build().value();
}

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

struct Highlight_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Test_Parser parser;
    Collecting_Logger logger { &memory };
    Language_Map languages { &memory };
    Highlight_Options options { .logger = &logger, .languages = &languages };
    std::pmr::vector<Highlight_Event> events { &memory };

    [[nodiscard]]
    Language_Config make_language(
        std::u8string_view name,
        Language_Parser* language_parser,
        const Test_Queries& queries
    )
    {
        Result<Language_Config, Language_Config_Error> result
            = make_test_language(name, language_parser, queries, &memory);
        EXPECT_TRUE(result);
        return std::move(*result);
    }

    [[nodiscard]]
    std::pmr::vector<Highlight_Span> spans()
    {
        return to_spans(events, &memory);
    }
};

TEST_F(Highlight_Test, function_declaration)
{
    const Language_Config go = make_language(
        u8"go", nullptr,
        {
            .highlights = u8"\"func\" @keyword\n"
                          u8"\"return\" @keyword\n"
                          u8"(function_declaration name: (identifier) @function)\n"
                          u8"(type_identifier) @type",
        }
    );
    const Syntax_Tree tree = make_function_tree(&memory);
    highlight(events, tree, function_source, go, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 0, .end = 4, .name = u8"keyword", .nesting = 0 },
        { .begin = 5, .end = 14, .name = u8"function", .nesting = 0 },
        { .begin = 17, .end = 20, .name = u8"type", .nesting = 0 },
        { .begin = 22, .end = 25, .name = u8"type", .nesting = 0 },
        { .begin = 28, .end = 34, .name = u8"keyword", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Highlight_Test, empty_tree)
{
    const Language_Config language = make_language(u8"test", nullptr, { .highlights = u8"(_) @x" });
    const Syntax_Tree tree { &memory };
    highlight(events, tree, u8"", language, options, &memory);
    EXPECT_TRUE(events.empty());
}

TEST_F(Highlight_Test, heredoc_injection_by_capture)
{
    const Language_Config bash = make_language(
        u8"bash", &parser,
        {
            .highlights = u8"(identifier) @variable\n"
                          u8"((identifier) @function.builtin (#eq? @function.builtin \"echo\"))",
        }
    );
    languages.insert(bash);
    const Language_Config ruby = make_language(
        u8"ruby", nullptr,
        {
            .highlights = u8"(heredoc_body) @string",
            .injections = u8"(heredoc_body\n"
                          u8"  (heredoc_content) @injection.content\n"
                          u8"  (heredoc_end) @injection.language)",
        }
    );
    const Syntax_Tree tree = make_heredoc_tree(&memory);
    highlight(events, tree, heredoc_source, ruby, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 12, .end = 26, .name = u8"string", .nesting = 0 },
        { .begin = 14, .end = 18, .name = u8"function.builtin", .nesting = 1 },
        { .begin = 19, .end = 21, .name = u8"variable", .nesting = 1 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 1);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Highlight_Test, injection_language_directive_wins)
{
    const Language_Config bash = make_language(
        u8"bash", &parser, { .highlights = u8"((identifier) @function.builtin (#eq? @function.builtin \"echo\"))" }
    );
    Test_Parser ruby_parser;
    const Language_Config ruby = make_language(
        u8"ruby", &ruby_parser,
        {
            .highlights = u8"(identifier) @variable",
            .injections = u8"((heredoc_body\n"
                          u8"  (heredoc_content) @injection.content\n"
                          u8"  (heredoc_end) @injection.language)\n"
                          u8" (#set! injection.language \"ruby\"))",
        }
    );
    languages.insert(bash);
    languages.insert(ruby);
    const Syntax_Tree tree = make_heredoc_tree(&memory);
    highlight(events, tree, heredoc_source, ruby, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 0, .end = 1, .name = u8"variable", .nesting = 0 },
        { .begin = 14, .end = 18, .name = u8"variable", .nesting = 0 },
        { .begin = 19, .end = 21, .name = u8"variable", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 0);
    EXPECT_EQ(ruby_parser.calls, 1);
}

TEST_F(Highlight_Test, injections_disabled)
{
    const Language_Config bash = make_language(u8"bash", &parser, { .highlights = u8"(identifier) @variable" });
    languages.insert(bash);
    const Language_Config ruby = make_language(
        u8"ruby", nullptr,
        {
            .highlights = u8"(heredoc_body) @string",
            .injections = u8"(heredoc_body\n"
                          u8"  (heredoc_content) @injection.content\n"
                          u8"  (heredoc_end) @injection.language)",
        }
    );
    options.max_injection_depth = 0;
    const Syntax_Tree tree = make_heredoc_tree(&memory);
    highlight(events, tree, heredoc_source, ruby, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 12, .end = 26, .name = u8"string", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 0);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Highlight_Test, combined_injection_shares_locals)
{
    const Language_Config embedded = make_language(
        u8"embedded", &parser,
        {
            .highlights = u8"\"let\" @keyword\n"
                          u8"(identifier) @variable\n"
                          u8"((identifier) @constant (#is-not? local))",
            .locals = u8"(let_declaration name: (identifier) @local.definition)\n"
                      u8"(identifier) @local.reference",
        }
    );
    languages.insert(embedded);
    const Language_Config erb = make_language(
        u8"erb", nullptr,
        {
            .injections = u8"((code) @injection.content\n"
                          u8" (#set! injection.language \"embedded\")\n"
                          u8" (#set! injection.combined))",
        }
    );
    const Syntax_Tree tree = make_template_tree(&memory);
    highlight(events, tree, template_source, erb, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 3, .end = 6, .name = u8"keyword", .nesting = 0 },
        { .begin = 7, .end = 8, .name = u8"variable", .nesting = 0 },
        { .begin = 20, .end = 21, .name = u8"variable", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 1);
}

TEST_F(Highlight_Test, separate_injections_do_not_share_locals)
{
    const Language_Config embedded = make_language(
        u8"embedded", &parser,
        {
            .highlights = u8"\"let\" @keyword\n"
                          u8"(identifier) @variable\n"
                          u8"((identifier) @constant (#is-not? local))",
            .locals = u8"(let_declaration name: (identifier) @local.definition)\n"
                      u8"(identifier) @local.reference",
        }
    );
    languages.insert(embedded);
    const Language_Config erb = make_language(
        u8"erb", nullptr,
        { .injections = u8"((code) @injection.content (#set! injection.language \"embedded\"))" }
    );
    const Syntax_Tree tree = make_template_tree(&memory);
    highlight(events, tree, template_source, erb, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 3, .end = 6, .name = u8"keyword", .nesting = 0 },
        { .begin = 7, .end = 8, .name = u8"variable", .nesting = 0 },
        { .begin = 20, .end = 21, .name = u8"constant", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 2);
}

TEST_F(Highlight_Test, repeated_highlighting_is_identical)
{
    const Language_Config embedded = make_language(
        u8"embedded", &parser,
        {
            .highlights = u8"\"let\" @keyword\n"
                          u8"(identifier) @variable\n"
                          u8"((identifier) @constant (#is-not? local))",
            .locals = u8"(let_declaration name: (identifier) @local.definition)\n"
                      u8"(identifier) @local.reference",
        }
    );
    languages.insert(embedded);
    const Language_Config erb = make_language(
        u8"erb", nullptr,
        {
            .highlights = u8"(content) @string\n"
                          u8"[\"<%\" \"%>\"] @punctuation.special",
            .injections = u8"((code) @injection.content\n"
                          u8" (#set! injection.language \"embedded\")\n"
                          u8" (#set! injection.combined))",
        }
    );
    const Syntax_Tree tree = make_template_tree(&memory);
    highlight(events, tree, template_source, erb, options, &memory);

    std::pmr::vector<Highlight_Event> again { &memory };
    highlight(again, tree, template_source, erb, options, &memory);

    EXPECT_FALSE(events.empty());
    EXPECT_TRUE(std::ranges::equal(events, again));
    EXPECT_EQ(parser.calls, 2);
}

// x = <<~SH
// echo "hi"
// SH
constexpr std::u8string_view shell_heredoc_source = u8"x = <<~SH\necho \"hi\"\nSH\n";

TEST_F(Highlight_Test, injection_parent_uses_enclosing_language)
{
    Syntax_Tree_Builder builder { &memory };
    builder.open(u8"program", 0);
    builder.leaf(u8"identifier", 0, 1);
    builder.token(u8"=", 2);
    builder.leaf(u8"heredoc_beginning", 4, 9);
    builder.open(u8"heredoc_body", 10);
    builder.leaf(u8"heredoc_content", 10, 20);
    builder.leaf(u8"heredoc_end", 20, 22);
    builder.close(22);
    builder.close(23);
    const Syntax_Tree tree = std::move(builder).build().value();

    const Language_Config shell = make_language(
        u8"shell", &parser,
        {
            .highlights = u8"(identifier) @function\n"
                          u8"(string) @string.special",
            .injections = u8"((string_content) @injection.content (#set! injection.parent))",
        }
    );
    languages.insert(shell);
    Test_Parser ruby_parser;
    const Language_Config ruby = make_language(
        u8"ruby", &ruby_parser,
        {
            .highlights = u8"(heredoc_body) @string\n"
                          u8"(identifier) @variable",
            .injections = u8"((heredoc_content) @injection.content\n"
                          u8" (#set! injection.language \"shell\"))",
        }
    );
    languages.insert(ruby);
    highlight(events, tree, shell_heredoc_source, ruby, options, &memory);

    // "hi" is highlighted by ruby, the language that the shell code is embedded in.
    const Highlight_Span expected[] {
        { .begin = 0, .end = 1, .name = u8"variable", .nesting = 0 },
        { .begin = 10, .end = 22, .name = u8"string", .nesting = 0 },
        { .begin = 10, .end = 14, .name = u8"function", .nesting = 1 },
        { .begin = 15, .end = 19, .name = u8"string.special", .nesting = 1 },
        { .begin = 16, .end = 18, .name = u8"variable", .nesting = 2 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 1);
    EXPECT_EQ(ruby_parser.calls, 1);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Highlight_Test, self_injection_depth_limit)
{
    const Language_Config language = make_language(
        u8"test", &parser,
        {
            .highlights = u8"(identifier) @variable",
            .injections = u8"((program) @injection.content\n"
                          u8" (#set! injection.self)\n"
                          u8" (#set! injection.include-children))",
        }
    );
    options.max_injection_depth = 2;
    options.document_name = u8"self.txt";
    ASSERT_TRUE(highlight_source(events, u8"a b", language, options, &memory));

    // Every layer except the innermost one is suppressed by the injection within it.
    const Highlight_Span expected[] {
        { .begin = 0, .end = 1, .name = u8"variable", .nesting = 0 },
        { .begin = 2, .end = 3, .name = u8"variable", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(parser.calls, 3);

    ASSERT_EQ(logger.diagnostics.size(), 1);
    const Collected_Diagnostic& d = logger.diagnostics[0];
    EXPECT_EQ(d.id, diagnostic::injection_depth);
    EXPECT_EQ(d.file, u8"self.txt");
    EXPECT_EQ(d.location.begin, 0);
    EXPECT_EQ(d.location.length, 3);
    EXPECT_EQ(
        d.message,
        u8"The injection of \"test\" was not highlighted "
        u8"because the maximum injection depth of 2 was reached."
    );
}

TEST_F(Highlight_Test, unknown_injected_language)
{
    const Language_Config bash = make_language(u8"bash", &parser, { .highlights = u8"(identifier) @variable" });
    languages.insert(bash);
    const Language_Config ruby = make_language(
        u8"ruby", nullptr,
        {
            .highlights = u8"(heredoc_body) @string",
            .injections = u8"((heredoc_body (heredoc_content) @injection.content)\n"
                          u8" (#set! injection.language \"bsh\"))",
        }
    );
    const Syntax_Tree tree = make_heredoc_tree(&memory);
    highlight(events, tree, heredoc_source, ruby, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 12, .end = 26, .name = u8"string", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::injection_language);
    EXPECT_EQ(
        logger.diagnostics[0].message,
        u8"The injected language \"bsh\" is not known. Did you mean \"bash\"?"
    );
    EXPECT_EQ(logger.diagnostics[0].location.line, 1);
    EXPECT_EQ(logger.diagnostics[0].location.begin, 12);
}

TEST_F(Highlight_Test, injected_parse_failure)
{
    Failing_Parser failing;
    const Language_Config broken = make_language(u8"broken", &failing, { .highlights = u8"(_) @x" });
    const Language_Config unparsed = make_language(u8"unparsed", nullptr, { .highlights = u8"(_) @x" });
    languages.insert(broken);
    languages.insert(unparsed);
    const Language_Config erb = make_language(
        u8"erb", nullptr,
        {
            .highlights = u8"(content) @string",
            .injections = u8"((directive (code) @injection.content) (#set! injection.language \"broken\"))\n"
                          u8"((content) @injection.content (#set! injection.language \"unparsed\"))",
        }
    );
    const Syntax_Tree tree = make_template_tree(&memory);
    highlight(events, tree, template_source, erb, options, &memory);

    const Highlight_Span expected[] {
        { .begin = 11, .end = 17, .name = u8"string", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
    EXPECT_EQ(logger.count(diagnostic::injection_parse), 3);
}

TEST_F(Highlight_Test, highlight_source_errors)
{
    const Language_Config parsed = make_language(u8"test", &parser, { .highlights = u8"(string) @string" });
    const Language_Config unparsed = make_language(u8"test", nullptr, { .highlights = u8"(string) @string" });

    const Result<void, Parse_Error> unsupported
        = highlight_source(events, u8"\"s\"", unparsed, options, &memory);
    ASSERT_FALSE(unsupported);
    EXPECT_EQ(unsupported.error(), Parse_Error::unsupported_language);

    const Result<void, Parse_Error> bad = highlight_source(events, u8"\"s", parsed, options, &memory);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error(), Parse_Error::bad_code);
    EXPECT_TRUE(events.empty());

    ASSERT_TRUE(highlight_source(events, u8"let \"s\"", parsed, options, &memory));
    const Highlight_Span expected[] {
        { .begin = 4, .end = 7, .name = u8"string", .nesting = 0 },
    };
    EXPECT_TRUE(std::ranges::equal(spans(), expected));
}

} // namespace
} // namespace treelight
