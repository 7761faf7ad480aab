#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/source_position.hpp"
#include "treelight/util/typo.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/injection.hpp"
#include "treelight/language.hpp"
#include "treelight/query.hpp"
#include "treelight/query_match.hpp"
#include "treelight/services.hpp"
#include "treelight/syntax_tree.hpp"

namespace treelight {
namespace {

[[nodiscard]]
std::size_t map_offset(std::span<const Fragment> fragments, std::size_t offset)
{
    if (fragments.empty()) {
        return offset;
    }
    const auto it = std::ranges::upper_bound(fragments, offset, {}, &Fragment::sub_begin);
    const Fragment& f = it == fragments.begin() ? fragments.front() : *(it - 1);
    TREELIGHT_DEBUG_ASSERT(offset >= f.sub_begin);
    return f.parent_begin + (offset - f.sub_begin);
}

void append_fragment(Sub_Document& out, std::u8string_view source, std::size_t begin, std::size_t end)
{
    if (begin >= end) {
        return;
    }
    out.fragments.push_back({ .sub_begin = out.text.size(), .parent_begin = begin, .length = end - begin });
    out.text.append(source.substr(begin, end - begin));
}

} // namespace

std::size_t Sub_Document::to_parent(std::size_t offset) const
{
    TREELIGHT_ASSERT(offset <= text.size());
    return map_offset(fragments, offset);
}

std::size_t Injection_Layer::to_root(std::size_t offset) const
{
    const std::size_t mapped = map_offset(fragments, offset);
    return outer ? outer->to_root(mapped) : mapped;
}

void Injection_Layer::try_log(
    Severity severity,
    std::u8string_view id,
    std::size_t begin,
    std::size_t end,
    std::u8string_view message
) const
{
    if (!can_log(severity)) {
        return;
    }
    const std::size_t root_begin = to_root(begin);
    const std::size_t root_end = end > begin ? to_root(end - 1) + 1 : root_begin;
    const Source_Span location { position_of(root_source, root_begin), root_end - root_begin };
    (*logger)(Diagnostic {
        .severity = severity,
        .id = id,
        .file = document_name,
        .location = location,
        .message = message,
    });
}

void collect_injection_sites(
    std::pmr::vector<Injection_Site>& out,
    const Injection_Layer& layer,
    const Syntax_Tree& tree,
    std::u8string_view source,
    std::span<const Query_Match> injections,
    const Language_Registry& languages
)
{
    TREELIGHT_ASSERT(layer.language);
    std::pmr::memory_resource* const memory = out.get_allocator().resource();
    const Reserved_Captures& reserved = layer.language->captures();
    if (reserved.injection_content == Capture_Id::none) {
        return;
    }
    const Query& query = layer.language->injections();
    const std::size_t initial_size = out.size();
    // Indices into out of the sites that combined matches are merged into.
    std::pmr::vector<std::size_t> combined_sites { memory };

    for (const Query_Match& match : injections) {
        const Query_Pattern& pattern = query.patterns[match.pattern_index];

        const auto first_content = std::ranges::find(match.captures, reserved.injection_content, &Capture::id);
        if (first_content == match.captures.end()) {
            continue;
        }

        std::u8string_view language_name;
        Node_Index language_node = Node_Index::none;
        if (const Query_Property* const p = pattern.find_property(property::injection_language);
            p && p->value) {
            language_name = *p->value;
        }
        else if (reserved.injection_language != Capture_Id::none) {
            language_node = match.find(reserved.injection_language);
            if (language_node != Node_Index::none) {
                language_name = tree.text(language_node, source);
            }
        }

        const Language_Config* language = nullptr;
        if (!language_name.empty()) {
            language = languages.find(language_name);
            if (!language) {
                if (layer.can_log(Severity::warning)) {
                    const Node_Index blame
                        = language_node != Node_Index::none ? language_node : first_content->node;
                    std::pmr::u8string message { u8"The injected language \"", memory };
                    message += language_name;
                    message += u8"\" is not known.";
                    const Distant<std::u8string_view> suggestion
                        = languages.match_language(language_name, memory);
                    if (suggestion) {
                        message += u8" Did you mean \"";
                        message += suggestion.value;
                        message += u8"\"?";
                    }
                    layer.try_warning(
                        diagnostic::injection_language, tree[blame].begin, tree[blame].end, message
                    );
                }
                continue;
            }
        }
        else if (pattern.has_property(property::injection_self)) {
            language = layer.language;
        }
        else if (pattern.has_property(property::injection_parent)) {
            language = layer.outer ? layer.outer->language : nullptr;
        }
        if (!language) {
            continue;
        }

        const bool include_children = pattern.has_property(property::injection_include_children);
        Injection_Site* site = nullptr;
        if (pattern.has_property(property::injection_combined)) {
            for (const std::size_t i : combined_sites) {
                if (out[i].language == language) {
                    site = &out[i];
                    break;
                }
            }
            if (!site) {
                combined_sites.push_back(out.size());
                site = &out.emplace_back(memory);
                site->language = language;
            }
        }
        else {
            site = &out.emplace_back(memory);
            site->language = language;
        }
        site->include_children |= include_children;
        for (const Capture& c : match.captures) {
            if (c.id == reserved.injection_content) {
                site->content_nodes.push_back(c.node);
            }
        }
    }

    for (auto it = out.begin() + std::ptrdiff_t(initial_size); it != out.end(); ++it) {
        std::ranges::sort(it->content_nodes);
        const auto duplicates = std::ranges::unique(it->content_nodes);
        it->content_nodes.erase(duplicates.begin(), duplicates.end());
    }
    std::stable_sort(
        out.begin() + std::ptrdiff_t(initial_size), out.end(),
        [](const Injection_Site& x, const Injection_Site& y) {
            return x.content_nodes.front() < y.content_nodes.front();
        }
    );
}

void build_sub_document(
    Sub_Document& out,
    const Injection_Site& site,
    const Syntax_Tree& tree,
    std::u8string_view source
)
{
    for (const Node_Index n : site.content_nodes) {
        const Syntax_Node& node = tree[n];
        if (site.include_children) {
            append_fragment(out, source, node.begin, node.end);
            continue;
        }
        std::size_t position = node.begin;
        for (const Node_Index child : tree.children(n)) {
            append_fragment(out, source, position, tree[child].begin);
            position = std::max(position, tree[child].end);
        }
        append_fragment(out, source, position, node.end);
    }
}

void translate_assignments(
    std::pmr::vector<Highlight_Assignment>& out,
    std::span<const Highlight_Assignment> assignments,
    const Sub_Document& document
)
{
    for (const Highlight_Assignment& a : assignments) {
        for (const Fragment& f : document.fragments) {
            const std::size_t begin = std::max(a.begin, f.sub_begin);
            const std::size_t end = std::min(a.end, f.sub_begin + f.length);
            if (begin >= end) {
                continue;
            }
            out.push_back({
                .begin = f.parent_begin + (begin - f.sub_begin),
                .end = f.parent_begin + (end - f.sub_begin),
                .name = a.name,
                .priority = a.priority,
                .depth = a.depth + 1,
            });
        }
    }
}

} // namespace treelight
