#ifndef TREELIGHT_LANGUAGE_HPP
#define TREELIGHT_LANGUAGE_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/typo.hpp"

#include "treelight/fwd.hpp"
#include "treelight/query.hpp"
#include "treelight/services.hpp"

namespace treelight {

namespace capture {

inline constexpr std::u8string_view local_scope = u8"local.scope";
inline constexpr std::u8string_view local_definition = u8"local.definition";
inline constexpr std::u8string_view local_definition_value = u8"local.definition-value";
inline constexpr std::u8string_view local_reference = u8"local.reference";
inline constexpr std::u8string_view injection_content = u8"injection.content";
inline constexpr std::u8string_view injection_language = u8"injection.language";

} // namespace capture

/// @brief Returns `true` if `name` is the name of a capture that has a special meaning
/// in locals or injections queries, or that is reserved for such use.
/// Such captures never produce highlights.
[[nodiscard]]
constexpr bool is_reserved_capture_name(std::u8string_view name)
{
    return name.starts_with(u8"local.") || name.starts_with(u8"injection.");
}

/// @brief Returns `true` if `name` is the name of a private capture,
/// which is only used within predicates and never produces highlights.
[[nodiscard]]
constexpr bool is_private_capture_name(std::u8string_view name)
{
    return name.starts_with(u8'_');
}

/// @brief Whether a highlights pattern applies to local variables.
enum struct Pattern_Locality : Default_Underlying {
    /// @brief The pattern applies to any node.
    any,
    /// @brief `(#is? local)`: the pattern only applies to local variables.
    local,
    /// @brief `(#is-not? local)`: the pattern does not apply to local variables.
    non_local,
};

/// @brief The captures of a language's locals and injections queries
/// that have a special meaning.
/// Captures that the queries do not use are `Capture_Id::none`.
struct Reserved_Captures {
    Capture_Id local_scope = Capture_Id::none;
    Capture_Id local_definition = Capture_Id::none;
    Capture_Id local_definition_value = Capture_Id::none;
    Capture_Id local_reference = Capture_Id::none;
    Capture_Id injection_content = Capture_Id::none;
    Capture_Id injection_language = Capture_Id::none;
};

/// @brief Everything needed to highlight one language:
/// its parser, and its highlights, locals, and injections queries.
struct Language_Config {
private:
    std::pmr::u8string m_name;
    Language_Parser* m_parser;
    Query m_highlights;
    Query m_locals;
    Query m_injections;
    std::pmr::vector<Pattern_Locality> m_highlight_locality;
    Reserved_Captures m_captures;

public:
    /// @param name The name of the language, such as `cpp`.
    /// @param parser The parser used for injections of this language.
    /// May be null, in which case the language can only be highlighted from existing trees.
    [[nodiscard]]
    Language_Config(
        std::u8string_view name,
        Language_Parser* parser,
        Query&& highlights,
        Query&& locals,
        Query&& injections,
        std::pmr::memory_resource* memory
    );

    [[nodiscard]]
    std::u8string_view name() const
    {
        return m_name;
    }

    [[nodiscard]]
    Language_Parser* parser() const
    {
        return m_parser;
    }

    [[nodiscard]]
    const Query& highlights() const
    {
        return m_highlights;
    }

    [[nodiscard]]
    const Query& locals() const
    {
        return m_locals;
    }

    [[nodiscard]]
    const Query& injections() const
    {
        return m_injections;
    }

    [[nodiscard]]
    const Reserved_Captures& captures() const
    {
        return m_captures;
    }

    [[nodiscard]]
    Pattern_Locality highlight_locality(std::size_t pattern_index) const
    {
        TREELIGHT_ASSERT(pattern_index < m_highlight_locality.size());
        return m_highlight_locality[pattern_index];
    }
};

enum struct Query_Set : Default_Underlying {
    highlights,
    locals,
    injections,
};

[[nodiscard]]
std::u8string_view query_set_name(Query_Set set);

struct Language_Config_Error {
    /// @brief The query set that failed to parse.
    Query_Set set;
    Query_Error error;
};

struct Language_Query_Sources {
    std::span<const Query_Source> highlights;
    std::span<const Query_Source> locals;
    std::span<const Query_Source> injections;
};

/// @brief Parses the queries of a language and makes a `Language_Config` from them.
[[nodiscard]]
Result<Language_Config, Language_Config_Error> make_language_config(
    std::u8string_view name,
    Language_Parser* parser,
    const Language_Query_Sources& sources,
    std::pmr::memory_resource* memory
);

/// @brief A `Language_Registry` which maps names (and aliases) to languages.
/// The languages are not owned and have to outlive the map.
struct Language_Map final : Language_Registry {
private:
    struct Entry {
        std::pmr::u8string name;
        const Language_Config* language;
    };

    std::pmr::vector<Entry> m_entries;

public:
    [[nodiscard]]
    explicit Language_Map(std::pmr::memory_resource* memory)
        : m_entries { memory }
    {
    }

    /// @brief Registers `language` under its own name.
    void insert(const Language_Config& language)
    {
        insert(language.name(), language);
    }

    /// @brief Registers `language` under the given `name`,
    /// replacing any language that was previously registered under the same name.
    void insert(std::u8string_view name, const Language_Config& language);

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    [[nodiscard]]
    const Language_Config* find(std::u8string_view name) const final;

    [[nodiscard]]
    Distant<std::u8string_view>
    match_language(std::u8string_view name, std::pmr::memory_resource* memory) const final;
};

} // namespace treelight

#endif
