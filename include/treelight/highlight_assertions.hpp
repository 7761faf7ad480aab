#ifndef TREELIGHT_HIGHLIGHT_ASSERTIONS_HPP
#define TREELIGHT_HIGHLIGHT_ASSERTIONS_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/util/result.hpp"

#include "treelight/fwd.hpp"
#include "treelight/span_emitter.hpp"

namespace treelight {

/// @brief An expectation about the highlighting of a source file,
/// written in a comment below the line it refers to.
///
/// For example, in
/// ```
/// int x = 0;
/// // <- type.builtin
/// //  ^ variable
/// //      ^ !string
/// ```
/// the arrow refers to the column of the comment marker itself (the `i` in `int`),
/// and carets refer to the columns they are written in.
struct Highlight_Assertion {
    /// @brief The zero-based line that the assertion refers to.
    std::size_t line;
    /// @brief The zero-based column that the assertion refers to, in code units.
    std::size_t column;
    /// @brief The offset in the source that the assertion refers to,
    /// or `std::size_t(-1)` if the line has no such column.
    std::size_t offset;
    /// @brief The expected highlight name.
    std::u8string_view expected;
    /// @brief If `true`, the expected name must not apply.
    bool negative;

    [[nodiscard]]
    friend constexpr bool operator==(const Highlight_Assertion&, const Highlight_Assertion&)
        = default;
};

enum struct Assertion_Parse_Error_Kind : Default_Underlying {
    /// @brief An arrow or carets are not followed by a highlight name.
    missing_name,
    /// @brief An assertion has no line above it that it could refer to.
    no_target_line,
};

struct Assertion_Parse_Error {
    Assertion_Parse_Error_Kind kind;
    /// @brief The zero-based line of the offending assertion.
    std::size_t line;

    [[nodiscard]]
    friend constexpr bool operator==(const Assertion_Parse_Error&, const Assertion_Parse_Error&)
        = default;
};

/// @brief Extracts highlight assertions from `source`.
/// A line is an assertion if it consists of optional blanks, `comment_prefix`,
/// optional blanks, and then either `<-` or a run of `^`,
/// followed by a highlight name optionally preceded by `!`.
/// An assertion refers to the closest preceding line that is not an assertion.
/// A caret run yields one assertion per caret.
/// The returned assertions view `source`.
[[nodiscard]]
Result<void, Assertion_Parse_Error> parse_highlight_assertions(
    std::pmr::vector<Highlight_Assertion>& out,
    std::u8string_view source,
    std::u8string_view comment_prefix
);

struct Assertion_Failure {
    Highlight_Assertion assertion;
    /// @brief The names that apply at the position of the assertion, from outermost to innermost.
    std::pmr::vector<std::u8string_view> actual;
};

/// @brief Checks `assertions` against the highlighting result `events`,
/// appending an `Assertion_Failure` to `out` for every assertion that does not hold.
/// A positive assertion holds if the expected name is among the names
/// of all highlights that contain the position.
/// A negative assertion holds if it is not.
/// Assertions that refer to no position always fail.
void check_highlight_assertions(
    std::pmr::vector<Assertion_Failure>& out,
    std::span<const Highlight_Assertion> assertions,
    std::span<const Highlight_Event> events
);

} // namespace treelight

#endif
