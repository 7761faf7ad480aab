#include <algorithm>
#include <cstddef>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "treelight/util/assert.hpp"
#include "treelight/util/severity.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/query.hpp"
#include "treelight/services.hpp"

namespace treelight {

const Query_Property* Query_Pattern::find_property(std::u8string_view key) const
{
    for (const Query_Property& p : std::views::reverse(properties)) {
        if (p.key == key) {
            return &p;
        }
    }
    return nullptr;
}

const Property_Predicate* Query_Pattern::find_property_predicate(std::u8string_view key) const
{
    for (const Predicate& p : predicates) {
        if (const auto* const property = std::get_if<Property_Predicate>(&p)) {
            if (property->key == key) {
                return property;
            }
        }
    }
    return nullptr;
}

bool Query_Pattern::is_inert() const
{
    return std::ranges::any_of(predicates, [](const Predicate& p) {
        return std::holds_alternative<Unknown_Predicate>(p);
    });
}

Capture_Id Query::find_capture(std::u8string_view name) const
{
    for (std::size_t i = 0; i < capture_names.size(); ++i) {
        if (capture_names[i] == name) {
            return Capture_Id(i);
        }
    }
    return Capture_Id::none;
}

std::u8string_view query_error_kind_message(Query_Error_Kind kind)
{
    switch (kind) {
        using enum Query_Error_Kind;
    case unexpected_end: return u8"The query ended in the middle of a pattern.";
    case unexpected_character: return u8"Unexpected character.";
    case unterminated_string: return u8"Unterminated string literal.";
    case missing_name: return u8"Expected a name.";
    case empty_alternation: return u8"An alternation has to contain at least one pattern.";
    case invalid_group:
        return u8"A parenthesized group has to contain at least one pattern, "
               u8"and a group of sibling patterns cannot be captured or used as an alternative.";
    case misplaced_field: return u8"Fields can only be used on child patterns.";
    case undefined_capture: return u8"The predicate refers to a capture that the pattern lacks.";
    case bad_predicate_arguments: return u8"Wrong number or kind of predicate arguments.";
    case invalid_regex: return u8"Invalid regular expression.";
    }
    TREELIGHT_ASSERT_UNREACHABLE(u8"Invalid query error kind.");
}

void log_query_error(Logger& logger, std::span<const Query_Source> sources, const Query_Error& error)
{
    if (!logger.can_log(Severity::error)) {
        return;
    }
    TREELIGHT_ASSERT(error.source_index < sources.size());
    logger({
        .severity = Severity::error,
        .id = diagnostic::query_syntax,
        .file = sources[error.source_index].name,
        .location = error.location,
        .message = query_error_kind_message(error.kind),
    });
}

void log_query_warnings(Logger& logger, const Query& query)
{
    if (!logger.can_log(Severity::warning)) {
        return;
    }
    std::u8string message;
    for (const Query_Warning& warning : query.warnings) {
        message.clear();
        std::u8string_view id;
        switch (warning.kind) {
        case Query_Warning_Kind::unknown_predicate: {
            id = diagnostic::query_predicate_unknown;
            message += u8"Unknown predicate \"#";
            message += warning.name;
            message += u8"\". The pattern containing it never matches.";
            break;
        }
        case Query_Warning_Kind::unknown_directive: {
            id = diagnostic::query_directive_unknown;
            message += u8"Unknown directive \"#";
            message += warning.name;
            message += u8"\" has no effect.";
            break;
        }
        }
        TREELIGHT_ASSERT(warning.source_index < query.source_names.size());
        logger({
            .severity = Severity::warning,
            .id = id,
            .file = query.source_names[warning.source_index],
            .location = warning.location,
            .message = message,
        });
    }
}

} // namespace treelight
