#include <memory_resource>
#include <sstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "treelight/util/severity.hpp"
#include "treelight/util/source_position.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/print.hpp"

namespace treelight {
namespace {

// let x = 1;
// let y = ;
constexpr std::u8string_view source = u8"let x = 1;\nlet y = ;\n";

constexpr Diagnostic missing_expression {
    .severity = Severity::error,
    .id = u8"parse.expression",
    .file = u8"test.txt",
    .location = { { .line = 1, .column = 8, .begin = 19 }, 1 },
    .message = u8"Expected an expression.",
};

TEST(Print, find_line)
{
    EXPECT_EQ(find_line(source, 0), u8"let x = 1;");
    EXPECT_EQ(find_line(source, 4), u8"let x = 1;");
    EXPECT_EQ(find_line(source, 10), u8"let x = 1;");
    EXPECT_EQ(find_line(source, 11), u8"let y = ;");
    EXPECT_EQ(find_line(source, source.size()), u8"let y = ;");
    EXPECT_EQ(find_line(u8"", 0), u8"");
}

TEST(Print, file_position)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };
    print_file_position(out, u8"a.rb", Source_Position { .line = 0, .column = 4, .begin = 4 });
    EXPECT_EQ(out, u8"a.rb:1:5:");

    out.clear();
    print_file_position(out, u8"a.rb", Source_Position { .line = 9, .column = 0, .begin = 40 }, false);
    EXPECT_EQ(out, u8"a.rb:10:1");
}

TEST(Print, diagnostic)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };
    print_diagnostic(out, missing_expression, source, false);

    const std::u8string_view expected
        = u8"ERROR: test.txt:2:9: Expected an expression. [parse.expression]\n"
          u8"     2 | let y = ;\n"
          u8"       |         ^\n";
    EXPECT_EQ(out, expected);
}

TEST(Print, diagnostic_without_file_or_source)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };
    Diagnostic d = missing_expression;
    d.severity = Severity::warning;
    d.file = {};
    print_diagnostic(out, d, {}, false);
    EXPECT_EQ(out, u8"WARNING: <input>:2:9: Expected an expression. [parse.expression]\n");
}

TEST(Print, diagnostic_colored)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };
    print_diagnostic(out, missing_expression, {}, true);
    EXPECT_TRUE(out.starts_with(u8"\x1b["));
    EXPECT_NE(out.find(u8"ERROR"), std::u8string::npos);
    EXPECT_NE(out.find(u8"parse.expression"), std::u8string::npos);
}

TEST(Print, ostream_logger)
{
    std::pmr::monotonic_buffer_resource memory;
    std::ostringstream stream;
    Ostream_Logger logger { stream, Severity::warning, false, source, &memory };
    EXPECT_TRUE(logger.can_log(Severity::error));
    EXPECT_FALSE(logger.can_log(Severity::info));

    logger(missing_expression);
    EXPECT_EQ(
        stream.str(),
        "ERROR: test.txt:2:9: Expected an expression. [parse.expression]\n"
        "     2 | let y = ;\n"
        "       |         ^\n"
    );
}

} // namespace
} // namespace treelight
