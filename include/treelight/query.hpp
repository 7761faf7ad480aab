#ifndef TREELIGHT_QUERY_HPP
#define TREELIGHT_QUERY_HPP

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "treelight/util/result.hpp"
#include "treelight/util/source_position.hpp"

#include "treelight/fwd.hpp"
#include "treelight/regexp.hpp"

namespace treelight {

enum struct Pattern_Node_Kind : Default_Underlying {
    /// @brief `(kind ...)`, matching named nodes of the given kind.
    named,
    /// @brief `(_ ...)`, matching any named node.
    named_wildcard,
    /// @brief `_`, matching any node, named or anonymous.
    wildcard,
    /// @brief `"text"`, matching anonymous nodes whose kind is the given text.
    anonymous,
    /// @brief `[...]`, matching any of the alternatives.
    alternation,
    /// @brief `((a) (b) ...)`, matching a sequence of sibling nodes.
    /// A group is never matched against a single node.
    /// At the top level, its first placed element has to match the node that the pattern is
    /// matched against, and the remaining elements are matched against the following siblings.
    group,
};

enum struct Quantifier : Default_Underlying {
    one,
    /// @brief `?`
    zero_or_one,
    /// @brief `*`
    zero_or_more,
    /// @brief `+`
    one_or_more,
};

[[nodiscard]]
constexpr bool quantifier_allows_zero(Quantifier q)
{
    return q == Quantifier::zero_or_one || q == Quantifier::zero_or_more;
}

[[nodiscard]]
constexpr bool quantifier_allows_many(Quantifier q)
{
    return q == Quantifier::zero_or_more || q == Quantifier::one_or_more;
}

struct Anchored_Child {
    /// @brief The index of the child within `Query_Pattern::nodes`.
    std::uint32_t node;
    /// @brief If `true`, an anchor `.` precedes the child,
    /// so it has to immediately follow the preceding child (or be the first child),
    /// not counting anonymous nodes.
    bool anchored = false;
};

struct Pattern_Node {
    Pattern_Node_Kind kind;
    Quantifier quantifier = Quantifier::one;
    /// @brief The node kind for `named`, or the token text for `anonymous`.
    std::pmr::u8string text;
    /// @brief The field that the matched node has to appear under, or empty.
    std::pmr::u8string field;
    /// @brief Fields that the matched node must not have a child for (`!field`).
    std::pmr::vector<std::pmr::u8string> negated_fields;
    std::pmr::vector<Capture_Id> captures;
    /// @brief The child patterns, the alternatives of an `alternation`,
    /// or the sibling patterns of a `group`.
    std::pmr::vector<Anchored_Child> children;
    /// @brief If `true`, an anchor `.` follows the last child,
    /// so it has to be the last named child.
    bool anchored_last = false;

    [[nodiscard]]
    Pattern_Node(Pattern_Node_Kind kind, std::pmr::memory_resource* memory)
        : kind { kind }
        , text { memory }
        , field { memory }
        , negated_fields { memory }
        , captures { memory }
        , children { memory }
    {
    }
};

/// @brief `#eq?`, `#not-eq?`, `#any-eq?`, `#any-not-eq?`.
struct Text_Equality_Predicate {
    Capture_Id capture;
    /// @brief The capture whose text is compared against,
    /// or `Capture_Id::none` if `literal` is compared against.
    Capture_Id other;
    std::pmr::u8string literal;
    bool negated;
    /// @brief If `true`, one of the captured nodes has to satisfy the predicate,
    /// rather than all of them.
    bool any;
};

/// @brief `#match?`, `#not-match?`, `#any-match?`, `#any-not-match?`.
struct Text_Match_Predicate {
    Capture_Id capture;
    Reg_Exp regex;
    bool negated;
    bool any;
};

/// @brief `#any-of?` and `#not-any-of?`.
struct Any_Of_Predicate {
    Capture_Id capture;
    std::pmr::vector<std::pmr::u8string> values;
    bool negated;
};

/// @brief `#is?` and `#is-not?`.
/// These are not evaluated while matching.
/// The only key with a meaning is `local`,
/// which is tested by the highlight resolver.
struct Property_Predicate {
    std::pmr::u8string key;
    std::pmr::u8string value;
    bool negated;
};

/// @brief A predicate whose name is not known.
/// A pattern that contains such a predicate never matches.
struct Unknown_Predicate {
    std::pmr::u8string name;
};

using Predicate = std::variant<
    Text_Equality_Predicate,
    Text_Match_Predicate,
    Any_Of_Predicate,
    Property_Predicate,
    Unknown_Predicate>;

/// @brief A property set by the `#set!` directive.
struct Query_Property {
    std::pmr::u8string key;
    std::optional<std::pmr::u8string> value;
};

namespace property {

inline constexpr std::u8string_view injection_language = u8"injection.language";
inline constexpr std::u8string_view injection_combined = u8"injection.combined";
inline constexpr std::u8string_view injection_include_children = u8"injection.include-children";
inline constexpr std::u8string_view injection_self = u8"injection.self";
inline constexpr std::u8string_view injection_parent = u8"injection.parent";
inline constexpr std::u8string_view local_scope_inherits = u8"local.scope-inherits";
inline constexpr std::u8string_view local = u8"local";

} // namespace property

struct Query_Pattern {
    /// @brief The nodes of the pattern.
    std::pmr::vector<Pattern_Node> nodes;
    /// @brief The index of the outermost node within `nodes`.
    std::uint32_t root = 0;
    std::pmr::vector<Predicate> predicates;
    std::pmr::vector<Query_Property> properties;
    /// @brief The index of the `Query_Source` that the pattern was parsed from.
    std::size_t source_index = 0;
    /// @brief The location of the pattern within its source.
    Source_Span location {};

    [[nodiscard]]
    explicit Query_Pattern(std::pmr::memory_resource* memory)
        : nodes { memory }
        , predicates { memory }
        , properties { memory }
    {
    }

    /// @brief Returns the last property with the given `key` that was set by `#set!`,
    /// or a null pointer.
    [[nodiscard]]
    const Query_Property* find_property(std::u8string_view key) const;

    [[nodiscard]]
    bool has_property(std::u8string_view key) const
    {
        return find_property(key) != nullptr;
    }

    /// @brief Returns the first `#is?` or `#is-not?` predicate with the given `key`,
    /// or a null pointer.
    [[nodiscard]]
    const Property_Predicate* find_property_predicate(std::u8string_view key) const;

    /// @brief Returns `true` if the pattern contains an unknown predicate,
    /// meaning that it never matches.
    [[nodiscard]]
    bool is_inert() const;
};

struct Query_Source {
    /// @brief The name of the source, such as a file name.
    std::u8string_view name;
    std::u8string_view text;
};

enum struct Query_Warning_Kind : Default_Underlying {
    /// @brief A predicate is not known. The pattern never matches.
    unknown_predicate,
    /// @brief A directive is not known. It has no effect.
    unknown_directive,
};

struct Query_Warning {
    Query_Warning_Kind kind;
    std::size_t source_index;
    std::size_t pattern_index;
    /// @brief The location of the predicate or directive within its source.
    Source_Span location;
    /// @brief The name of the predicate or directive, without leading `#`.
    std::pmr::u8string name;
};

/// @brief A set of patterns, parsed from one or more `Query_Source`s.
/// Patterns are ordered, and the order is significant:
/// later patterns take precedence over earlier ones.
struct Query {
    std::pmr::vector<Query_Pattern> patterns;
    std::pmr::vector<std::pmr::u8string> capture_names;
    std::pmr::vector<std::pmr::u8string> source_names;
    std::pmr::vector<Query_Warning> warnings;

    [[nodiscard]]
    explicit Query(std::pmr::memory_resource* memory)
        : patterns { memory }
        , capture_names { memory }
        , source_names { memory }
        , warnings { memory }
    {
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return patterns.empty();
    }

    /// @brief Returns the id of the capture with the given `name`,
    /// or `Capture_Id::none` if no pattern uses that capture.
    [[nodiscard]]
    Capture_Id find_capture(std::u8string_view name) const;

    [[nodiscard]]
    std::u8string_view capture_name(Capture_Id id) const
    {
        return id == Capture_Id::none ? std::u8string_view {}
                                      : std::u8string_view { capture_names[std::size_t(id)] };
    }
};

enum struct Query_Error_Kind : Default_Underlying {
    /// @brief The query ended in the middle of a pattern.
    unexpected_end,
    /// @brief A character was found that cannot appear at this position.
    unexpected_character,
    /// @brief A string literal was not terminated.
    unterminated_string,
    /// @brief A capture, field, or predicate name is missing.
    missing_name,
    /// @brief An alternation `[]` has no alternatives.
    empty_alternation,
    /// @brief A parenthesized group contains no pattern,
    /// or a sibling group is captured or used as an alternative.
    invalid_group,
    /// @brief A field was used on a pattern that is not a child pattern.
    misplaced_field,
    /// @brief A predicate refers to a capture that the pattern does not define.
    undefined_capture,
    /// @brief A predicate or directive has the wrong number or kind of arguments.
    bad_predicate_arguments,
    /// @brief The regular expression in `#match?` is not valid.
    invalid_regex,
};

[[nodiscard]]
std::u8string_view query_error_kind_message(Query_Error_Kind kind);

struct Query_Error {
    Query_Error_Kind kind;
    std::size_t source_index;
    Source_Span location;
};

/// @brief Parses a query from one or more sources.
/// Patterns from later sources follow those from earlier sources.
/// If parsing fails, no partial query is produced.
[[nodiscard]]
Result<Query, Query_Error>
parse_query(std::span<const Query_Source> sources, std::pmr::memory_resource* memory);

[[nodiscard]]
inline Result<Query, Query_Error>
parse_query(const Query_Source& source, std::pmr::memory_resource* memory)
{
    return parse_query(std::span<const Query_Source> { &source, 1 }, memory);
}

/// @brief Logs the given `error` as a `query.syntax` error.
void log_query_error(
    Logger& logger,
    std::span<const Query_Source> sources,
    const Query_Error& error
);

/// @brief Logs all of the warnings of `query`.
void log_query_warnings(Logger& logger, const Query& query);

} // namespace treelight

#endif
