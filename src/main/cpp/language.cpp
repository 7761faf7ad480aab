#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/strings.hpp"
#include "treelight/util/typo.hpp"

#include "treelight/language.hpp"
#include "treelight/query.hpp"

namespace treelight {
namespace {

[[nodiscard]]
Pattern_Locality pattern_locality(const Query_Pattern& pattern)
{
    const Property_Predicate* const predicate = pattern.find_property_predicate(property::local);
    if (!predicate) {
        return Pattern_Locality::any;
    }
    return predicate->negated ? Pattern_Locality::non_local : Pattern_Locality::local;
}

} // namespace

Language_Config::Language_Config(
    std::u8string_view name,
    Language_Parser* parser,
    Query&& highlights,
    Query&& locals,
    Query&& injections,
    std::pmr::memory_resource* memory
)
    : m_name { name, memory }
    , m_parser { parser }
    , m_highlights { std::move(highlights) }
    , m_locals { std::move(locals) }
    , m_injections { std::move(injections) }
    , m_highlight_locality { memory }
{
    m_highlight_locality.reserve(m_highlights.patterns.size());
    for (const Query_Pattern& pattern : m_highlights.patterns) {
        m_highlight_locality.push_back(pattern_locality(pattern));
    }

    m_captures = {
        .local_scope = m_locals.find_capture(capture::local_scope),
        .local_definition = m_locals.find_capture(capture::local_definition),
        .local_definition_value = m_locals.find_capture(capture::local_definition_value),
        .local_reference = m_locals.find_capture(capture::local_reference),
        .injection_content = m_injections.find_capture(capture::injection_content),
        .injection_language = m_injections.find_capture(capture::injection_language),
    };
}

std::u8string_view query_set_name(Query_Set set)
{
    switch (set) {
    case Query_Set::highlights: return u8"highlights";
    case Query_Set::locals: return u8"locals";
    case Query_Set::injections: return u8"injections";
    }
    TREELIGHT_ASSERT_UNREACHABLE(u8"Invalid query set.");
}

Result<Language_Config, Language_Config_Error> make_language_config(
    std::u8string_view name,
    Language_Parser* parser,
    const Language_Query_Sources& sources,
    std::pmr::memory_resource* memory
)
{
    Result<Query, Query_Error> highlights = parse_query(sources.highlights, memory);
    if (!highlights) {
        return Language_Config_Error { Query_Set::highlights, highlights.error() };
    }
    Result<Query, Query_Error> locals = parse_query(sources.locals, memory);
    if (!locals) {
        return Language_Config_Error { Query_Set::locals, locals.error() };
    }
    Result<Query, Query_Error> injections = parse_query(sources.injections, memory);
    if (!injections) {
        return Language_Config_Error { Query_Set::injections, injections.error() };
    }
    return Language_Config { name,
                             parser,
                             std::move(*highlights),
                             std::move(*locals),
                             std::move(*injections),
                             memory };
}

void Language_Map::insert(std::u8string_view name, const Language_Config& language)
{
    for (Entry& entry : m_entries) {
        if (entry.name == name) {
            entry.language = &language;
            return;
        }
    }
    m_entries.push_back({ std::pmr::u8string { name, m_entries.get_allocator().resource() }, &language });
}

const Language_Config* Language_Map::find(std::u8string_view name) const
{
    for (const Entry& entry : m_entries) {
        if (entry.name == name) {
            return entry.language;
        }
    }
    for (const Entry& entry : m_entries) {
        if (equals_ascii_ignore_case(entry.name, name)) {
            return entry.language;
        }
    }
    return nullptr;
}

Distant<std::u8string_view>
Language_Map::match_language(std::u8string_view name, std::pmr::memory_resource* memory) const
{
    std::pmr::vector<std::u8string_view> names { memory };
    names.reserve(m_entries.size());
    for (const Entry& entry : m_entries) {
        names.push_back(entry.name);
    }
    const Distant<std::size_t> closest = closest_match(names, name, memory);
    if (!closest) {
        return {};
    }
    return { names[closest.value], closest.distance };
}

} // namespace treelight
