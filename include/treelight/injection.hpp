#ifndef TREELIGHT_INJECTION_HPP
#define TREELIGHT_INJECTION_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treelight/util/severity.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/fwd.hpp"
#include "treelight/highlight_resolver.hpp"
#include "treelight/query_match.hpp"
#include "treelight/services.hpp"

namespace treelight {

/// @brief A contiguous piece of a sub-document,
/// which corresponds to a contiguous piece of the enclosing document.
struct Fragment {
    /// @brief The offset of the fragment within the sub-document.
    std::size_t sub_begin;
    /// @brief The offset of the fragment within the enclosing document.
    std::size_t parent_begin;
    std::size_t length;

    [[nodiscard]]
    friend constexpr bool operator==(const Fragment&, const Fragment&)
        = default;
};

/// @brief The text handed to the parser of an injected language,
/// together with the mapping back into the enclosing document.
struct Sub_Document {
    std::pmr::u8string text;
    /// @brief The fragments of `text`, in ascending order and without gaps.
    std::pmr::vector<Fragment> fragments;

    [[nodiscard]]
    explicit Sub_Document(std::pmr::memory_resource* memory)
        : text { memory }
        , fragments { memory }
    {
    }

    /// @brief Returns the offset in the enclosing document
    /// that corresponds to `offset` in the sub-document.
    /// `offset` may be equal to `text.size()`.
    [[nodiscard]]
    std::size_t to_parent(std::size_t offset) const;
};

/// @brief A place in a document where another language (or the same language) is injected.
struct Injection_Site {
    /// @brief The `@injection.content` nodes, in document order.
    /// For combined injections, these stem from multiple matches.
    std::pmr::vector<Node_Index> content_nodes;
    const Language_Config* language = nullptr;
    /// @brief If `true`, the text of the children of content nodes is part of the sub-document.
    bool include_children = false;

    [[nodiscard]]
    explicit Injection_Site(std::pmr::memory_resource* memory)
        : content_nodes { memory }
    {
    }
};

/// @brief Information about one document in a chain of injections,
/// used to report diagnostics in coordinates of the outermost document.
struct Injection_Layer {
    /// @brief The document that this one is injected into,
    /// or a null pointer for the outermost document.
    const Injection_Layer* outer;
    /// @brief The fragments that map this document into `outer`.
    /// Empty for the outermost document.
    std::span<const Fragment> fragments;
    /// @brief The language of this document.
    const Language_Config* language;
    /// @brief The source code of the outermost document.
    std::u8string_view root_source;
    /// @brief The name of the outermost document, used in diagnostics.
    std::u8string_view document_name;
    Logger* logger;
    /// @brief The depth of injection, where the outermost document has depth zero.
    std::size_t depth;

    /// @brief Returns the offset in the outermost document that corresponds to `offset`.
    [[nodiscard]]
    std::size_t to_root(std::size_t offset) const;

    [[nodiscard]]
    bool can_log(Severity severity) const
    {
        return logger->can_log(severity);
    }

    /// @brief Logs a diagnostic about the range `[begin, end)` of this document.
    void try_log(
        Severity severity,
        std::u8string_view id,
        std::size_t begin,
        std::size_t end,
        std::u8string_view message
    ) const;

    void try_warning(
        std::u8string_view id,
        std::size_t begin,
        std::size_t end,
        std::u8string_view message
    ) const
    {
        try_log(Severity::warning, id, begin, end, message);
    }
};

/// @brief Determines the injections within a document from the matches of
/// the injections query of its language.
///
/// The language of each match is determined by `(#set! injection.language "...")`,
/// or else by the text of the `@injection.language` capture,
/// or else by `(#set! injection.self)`, which is the language of the document itself,
/// or else by `(#set! injection.parent)`, which is the language of the enclosing document.
/// Matches whose language cannot be determined this way are ignored.
/// Language names which cannot be found in `languages` are reported as `injection.language`
/// with a suggestion of the closest known name.
///
/// Matches with `(#set! injection.combined)` are merged into a single site per language.
/// Sites are appended in the order of their first content node.
void collect_injection_sites(
    std::pmr::vector<Injection_Site>& out,
    const Injection_Layer& layer,
    const Syntax_Tree& tree,
    std::u8string_view source,
    std::span<const Query_Match> injections,
    const Language_Registry& languages
);

/// @brief Builds the text for an injection site.
/// Unless `site.include_children` is `true`,
/// the ranges of the children of each content node are left out.
void build_sub_document(
    Sub_Document& out,
    const Injection_Site& site,
    const Syntax_Tree& tree,
    std::u8string_view source
);

/// @brief Translates assignments within a sub-document into the enclosing document,
/// appending them to `out`.
/// Assignments which span multiple fragments are split at fragment boundaries.
/// The depth of each translated assignment is increased by one.
void translate_assignments(
    std::pmr::vector<Highlight_Assignment>& out,
    std::span<const Highlight_Assignment> assignments,
    const Sub_Document& document
);

} // namespace treelight

#endif
