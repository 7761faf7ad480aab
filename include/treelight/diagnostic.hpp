#ifndef TREELIGHT_DIAGNOSTIC_HPP
#define TREELIGHT_DIAGNOSTIC_HPP

#include <string_view>

#include "treelight/util/severity.hpp"
#include "treelight/util/source_position.hpp"

#include "treelight/fwd.hpp"

namespace treelight {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The name of the document or query source that the diagnostic concerns.
    std::u8string_view file;
    /// @brief The span of code that is responsible for this diagnostic.
    /// For diagnostics raised within injected languages,
    /// this is a span within the outermost document.
    Source_Span location;
    /// @brief The diagnostic message.
    /// The logger does not retain this view beyond the call.
    std::u8string_view message;
};

namespace diagnostic {

// QUERIES =========================================================================================

/// @brief A query could not be parsed.
inline constexpr std::u8string_view query_syntax = u8"query.syntax";

/// @brief A query uses a predicate that is not known.
/// The pattern that contains it never matches.
inline constexpr std::u8string_view query_predicate_unknown = u8"query.predicate.unknown";

/// @brief A query uses a directive that is not known.
/// The directive has no effect.
inline constexpr std::u8string_view query_directive_unknown = u8"query.directive.unknown";

/// @brief Matching a pattern exceeded the step limit,
/// so some matches may be missing.
inline constexpr std::u8string_view match_step_limit = u8"match.step-limit";

// INJECTIONS ======================================================================================

/// @brief The language of an injection could not be found among the available languages.
inline constexpr std::u8string_view injection_language = u8"injection.language";

/// @brief Parsing the content of an injection failed.
inline constexpr std::u8string_view injection_parse = u8"injection.parse";

/// @brief An injection was not processed because the maximum nesting depth was reached.
inline constexpr std::u8string_view injection_depth = u8"injection.depth";

// HIGHLIGHTING ====================================================================================

/// @brief A highlight range partially overlaps another one without nesting inside it,
/// so it was dropped.
inline constexpr std::u8string_view highlight_overlap = u8"highlight.overlap";

} // namespace diagnostic

} // namespace treelight

#endif
