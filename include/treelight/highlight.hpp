#ifndef TREELIGHT_HIGHLIGHT_HPP
#define TREELIGHT_HIGHLIGHT_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "treelight/util/result.hpp"

#include "treelight/fwd.hpp"
#include "treelight/query_match.hpp"
#include "treelight/services.hpp"
#include "treelight/settings.hpp"
#include "treelight/span_emitter.hpp"

namespace treelight {

struct Highlight_Options {
    /// @brief Receives diagnostics about injections, matching, and overlapping highlights.
    Logger* logger = &ignorant_logger;
    /// @brief The languages that injections can refer to by name.
    const Language_Registry* languages = &empty_language_registry;
    /// @brief The maximum nesting depth of injections.
    /// Zero disables injections entirely.
    std::size_t max_injection_depth = default_max_injection_depth;
    Match_Options match_options {};
    /// @brief The name of the document, used as the file name of diagnostics.
    std::u8string_view document_name;
};

/// @brief Highlights a document for which a syntax tree already exists.
///
/// Matches the locals, highlights, and injections queries of `language` against `tree`,
/// resolves the highlight of every captured node,
/// recursively highlights injected sub-documents,
/// and flattens the result into a well-nested sequence of events, appended to `out`.
/// Failures within injections are reported to `options.logger`
/// and leave the affected content unhighlighted,
/// so this function always succeeds.
/// @param source The source code that `tree` describes.
void highlight(
    std::pmr::vector<Highlight_Event>& out,
    const Syntax_Tree& tree,
    std::u8string_view source,
    const Language_Config& language,
    const Highlight_Options& options,
    std::pmr::memory_resource* memory
);

/// @brief Like `highlight`, but parses `source` using the parser of `language` first.
/// @return The error of the parser, if parsing failed.
/// If `language` has no parser, `Parse_Error::unsupported_language`.
Result<void, Parse_Error> highlight_source(
    std::pmr::vector<Highlight_Event>& out,
    std::u8string_view source,
    const Language_Config& language,
    const Highlight_Options& options,
    std::pmr::memory_resource* memory
);

} // namespace treelight

#endif
