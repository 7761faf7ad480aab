#include <algorithm>
#include <memory_resource>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "treelight/util/result.hpp"

#include "treelight/highlight.hpp"
#include "treelight/highlight_assertions.hpp"
#include "treelight/language.hpp"

#include "test_language.hpp"

namespace treelight {
namespace {

TEST(Highlight_Assertions, parse)
{
    constexpr std::u8string_view source = u8"let x \"s\"\n"
                                          u8"// <- keyword\n"
                                          u8"//  ^ !variable\n"
                                          u8"\n"
                                          u8"  //^^ string\n";
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Highlight_Assertion> assertions { &memory };
    ASSERT_TRUE(parse_highlight_assertions(assertions, source, u8"//"));

    const Highlight_Assertion expected[] {
        { .line = 0, .column = 0, .offset = 0, .expected = u8"keyword", .negative = false },
        { .line = 0, .column = 4, .offset = 4, .expected = u8"variable", .negative = true },
        // The empty line is the target, so there is no such column.
        { .line = 3, .column = 4, .offset = std::size_t(-1), .expected = u8"string", .negative = false },
        { .line = 3, .column = 5, .offset = std::size_t(-1), .expected = u8"string", .negative = false },
    };
    EXPECT_TRUE(std::ranges::equal(assertions, expected));
}

TEST(Highlight_Assertions, parse_errors)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Highlight_Assertion> assertions { &memory };

    const Result<void, Assertion_Parse_Error> no_target
        = parse_highlight_assertions(assertions, u8"# <- comment", u8"#");
    ASSERT_FALSE(no_target);
    EXPECT_EQ(no_target.error(), (Assertion_Parse_Error { Assertion_Parse_Error_Kind::no_target_line, 0 }));

    const Result<void, Assertion_Parse_Error> missing_name
        = parse_highlight_assertions(assertions, u8"x\n#   ^^  \n", u8"#");
    ASSERT_FALSE(missing_name);
    EXPECT_EQ(
        missing_name.error(), (Assertion_Parse_Error { Assertion_Parse_Error_Kind::missing_name, 1 })
    );
}

TEST(Highlight_Assertions, ordinary_comments_are_targets)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Highlight_Assertion> assertions { &memory };
    ASSERT_TRUE(parse_highlight_assertions(assertions, u8"x\n// note\n// <- comment", u8"//"));
    ASSERT_EQ(assertions.size(), 1);
    EXPECT_EQ(assertions[0].line, 1);
    EXPECT_EQ(assertions[0].offset, 2);
}

TEST(Highlight_Assertions, check)
{
    constexpr std::u8string_view source = u8"let x \"s\"\n"
                                          u8"// <- keyword\n"
                                          u8"//  ^ variable\n"
                                          u8"//    ^^^ string\n"
                                          u8"//    ^ !keyword\n"
                                          u8"// <- !keyword\n"
                                          u8"//           ^ variable\n";
    std::pmr::monotonic_buffer_resource memory;
    Test_Parser parser;
    const Language_Config language = make_test_language(
                                         u8"test", &parser,
                                         { .highlights = u8"\"let\" @keyword\n"
                                                         u8"(identifier) @variable\n"
                                                         u8"(string) @string" },
                                         &memory
    )
                                         .value();

    // Only the first line is code.
    std::pmr::vector<Highlight_Event> events { &memory };
    ASSERT_TRUE(highlight_source(events, source.substr(0, 9), language, {}, &memory));

    std::pmr::vector<Highlight_Assertion> assertions { &memory };
    ASSERT_TRUE(parse_highlight_assertions(assertions, source, u8"//"));
    ASSERT_EQ(assertions.size(), 8);

    std::pmr::vector<Assertion_Failure> failures { &memory };
    check_highlight_assertions(failures, assertions, events);

    ASSERT_EQ(failures.size(), 2);
    EXPECT_EQ(failures[0].assertion, assertions[6]);
    const std::u8string_view actual_keyword[] { u8"keyword" };
    EXPECT_TRUE(std::ranges::equal(failures[0].actual, actual_keyword));
    EXPECT_EQ(failures[1].assertion, assertions[7]);
    EXPECT_TRUE(failures[1].actual.empty());
}

} // namespace
} // namespace treelight
