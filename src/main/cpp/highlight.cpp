#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/to_chars.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/highlight.hpp"
#include "treelight/highlight_resolver.hpp"
#include "treelight/injection.hpp"
#include "treelight/language.hpp"
#include "treelight/query_match.hpp"
#include "treelight/services.hpp"
#include "treelight/span_emitter.hpp"
#include "treelight/syntax_tree.hpp"

namespace treelight {
namespace {

struct Suppressed_Range {
    std::size_t begin;
    std::size_t end;

    /// @brief Returns `true` if `a` lies within this range without covering all of it.
    [[nodiscard]]
    bool suppresses(const Highlight_Assignment& a) const
    {
        return begin <= a.begin && a.end <= end && (a.begin != begin || a.end != end);
    }
};

void match_and_log(
    std::pmr::vector<Query_Match>& out,
    Query_Set set,
    const Query& query,
    const Injection_Layer& layer,
    const Syntax_Tree& tree,
    std::u8string_view source,
    const Highlight_Options& options,
    std::pmr::memory_resource* memory
)
{
    const Match_Status status = match_query(out, query, tree, source, options.match_options);
    if (status == Match_Status::truncated && layer.can_log(Severity::warning)) {
        std::pmr::u8string message { u8"Matching the ", memory };
        message += query_set_name(set);
        message += u8" query of \"";
        message += layer.language->name();
        message += u8"\" exceeded the step limit, so some matches may be missing.";
        layer.try_warning(diagnostic::match_step_limit, 0, source.size(), message);
    }
}

/// @brief Computes the highlight assignments of one document and of everything injected into it,
/// in the coordinates of that document.
void highlight_layer(
    std::pmr::vector<Highlight_Assignment>& out,
    const Injection_Layer& layer,
    const Syntax_Tree& tree,
    std::u8string_view source,
    const Highlight_Options& options,
    std::pmr::memory_resource* memory
)
{
    const Language_Config& language = *layer.language;

    std::pmr::vector<Query_Match> locals { memory };
    std::pmr::vector<Query_Match> highlights { memory };
    std::pmr::vector<Query_Match> injections { memory };
    match_and_log(locals, Query_Set::locals, language.locals(), layer, tree, source, options, memory);
    match_and_log(
        highlights, Query_Set::highlights, language.highlights(), layer, tree, source, options, memory
    );
    if (options.max_injection_depth != 0) {
        match_and_log(
            injections, Query_Set::injections, language.injections(), layer, tree, source, options,
            memory
        );
    }

    Highlight_Resolution resolution { memory };
    resolve_highlights(resolution, language, tree, source, locals, highlights);

    std::pmr::vector<Injection_Site> sites { memory };
    collect_injection_sites(sites, layer, tree, source, injections, *options.languages);

    std::pmr::vector<Highlight_Assignment> injected { memory };
    std::pmr::vector<Suppressed_Range> suppressed { memory };

    for (const Injection_Site& site : sites) {
        const Syntax_Node& first = tree[site.content_nodes.front()];
        const Syntax_Node& last = tree[site.content_nodes.back()];

        if (layer.depth + 1 > options.max_injection_depth) {
            if (layer.can_log(Severity::warning)) {
                std::pmr::u8string message { u8"The injection of \"", memory };
                message += site.language->name();
                message += u8"\" was not highlighted because the maximum injection depth of ";
                message += to_characters8(options.max_injection_depth).as_string();
                message += u8" was reached.";
                layer.try_warning(diagnostic::injection_depth, first.begin, last.end, message);
            }
            continue;
        }

        Sub_Document document { memory };
        build_sub_document(document, site, tree, source);
        if (document.text.empty()) {
            continue;
        }

        Language_Parser* const parser = site.language->parser();
        if (!parser) {
            std::pmr::u8string message { u8"The injected language \"", memory };
            message += site.language->name();
            message += u8"\" has no parser.";
            layer.try_warning(diagnostic::injection_parse, first.begin, last.end, message);
            continue;
        }
        Result<Syntax_Tree, Parse_Error> sub_tree = (*parser)(document.text, *site.language, memory);
        if (!sub_tree) {
            std::pmr::u8string message { u8"Parsing the injected language \"", memory };
            message += site.language->name();
            message += u8"\" failed.";
            layer.try_warning(diagnostic::injection_parse, first.begin, last.end, message);
            continue;
        }

        const Injection_Layer inner {
            .outer = &layer,
            .fragments = document.fragments,
            .language = site.language,
            .root_source = layer.root_source,
            .document_name = layer.document_name,
            .logger = layer.logger,
            .depth = layer.depth + 1,
        };
        std::pmr::vector<Highlight_Assignment> sub_assignments { memory };
        highlight_layer(sub_assignments, inner, *sub_tree, document.text, options, memory);
        translate_assignments(injected, sub_assignments, document);

        if (site.include_children) {
            for (const Node_Index n : site.content_nodes) {
                suppressed.push_back({ tree[n].begin, tree[n].end });
            }
        }
    }

    for (const Highlight_Assignment& a : resolution.assignments) {
        const bool is_suppressed = std::ranges::any_of(suppressed, [&](const Suppressed_Range& r) {
            return r.suppresses(a);
        });
        if (!is_suppressed) {
            out.push_back(a);
        }
    }
    out.insert(out.end(), injected.begin(), injected.end());
}

} // namespace

void highlight(
    std::pmr::vector<Highlight_Event>& out,
    const Syntax_Tree& tree,
    std::u8string_view source,
    const Language_Config& language,
    const Highlight_Options& options,
    std::pmr::memory_resource* memory
)
{
    TREELIGHT_ASSERT(options.logger);
    TREELIGHT_ASSERT(options.languages);
    if (tree.empty()) {
        return;
    }

    const Injection_Layer root {
        .outer = nullptr,
        .fragments = {},
        .language = &language,
        .root_source = source,
        .document_name = options.document_name,
        .logger = options.logger,
        .depth = 0,
    };
    std::pmr::vector<Highlight_Assignment> assignments { memory };
    highlight_layer(assignments, root, tree, source, options, memory);

    std::pmr::vector<Highlight_Assignment> rejected { memory };
    emit_highlight_events(out, rejected, assignments);

    if (!root.can_log(Severity::warning)) {
        return;
    }
    for (const Highlight_Assignment& a : rejected) {
        std::pmr::u8string message { u8"The highlight \"", memory };
        message += a.name;
        message += u8"\" partially overlaps another highlight and was dropped.";
        root.try_warning(diagnostic::highlight_overlap, a.begin, a.end, message);
    }
}

Result<void, Parse_Error> highlight_source(
    std::pmr::vector<Highlight_Event>& out,
    std::u8string_view source,
    const Language_Config& language,
    const Highlight_Options& options,
    std::pmr::memory_resource* memory
)
{
    Language_Parser* const parser = language.parser();
    if (!parser) {
        return Parse_Error::unsupported_language;
    }
    Result<Syntax_Tree, Parse_Error> tree = (*parser)(source, language, memory);
    if (!tree) {
        return tree.error();
    }
    highlight(out, *tree, source, language, options, memory);
    return {};
}

} // namespace treelight
