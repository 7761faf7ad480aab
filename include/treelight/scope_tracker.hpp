#ifndef TREELIGHT_SCOPE_TRACKER_HPP
#define TREELIGHT_SCOPE_TRACKER_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "treelight/util/assert.hpp"

#include "treelight/fwd.hpp"

namespace treelight {

struct Local_Scope {
    /// @brief The enclosing scope, or `Scope_Index::none` for the root scope.
    Scope_Index parent;
    std::size_t begin;
    std::size_t end;
    /// @brief If `false`, references within this scope
    /// do not resolve to definitions in enclosing scopes.
    bool inherits;
};

struct Local_Definition {
    /// @brief The defined name, which is a view into the source code.
    std::u8string_view name;
    std::size_t begin;
    std::size_t end;
    /// @brief References located before this offset do not resolve to this definition.
    /// This is the end of the `@local.definition-value` capture,
    /// or zero if there is none.
    std::size_t value_end;
    Scope_Index scope;
    /// @brief The highlight name that the definition received, or empty.
    std::u8string_view highlight;
};

struct Local_Reference {
    std::u8string_view name;
    std::size_t begin;
    std::size_t end;
    /// @brief The index of the definition that the reference resolved to, if any.
    std::optional<std::size_t> definition;
};

/// @brief Tracks lexical scopes and the definitions within them
/// during a single walk over a document in document order.
/// An implicit root scope spanning the whole document always exists.
struct Scope_Tracker {
private:
    std::pmr::vector<Local_Scope> m_scopes;
    std::pmr::vector<Local_Definition> m_definitions;
    /// @brief For every scope, the indices of its definitions, in order of definition.
    std::pmr::vector<std::pmr::vector<std::size_t>> m_scope_definitions;
    std::pmr::vector<Scope_Index> m_stack;

public:
    [[nodiscard]]
    explicit Scope_Tracker(std::size_t document_length, std::pmr::memory_resource* memory);

    /// @brief Pops every scope that ends at or before `offset`.
    /// Offsets passed to this function shall not decrease.
    void advance_to(std::size_t offset);

    /// @brief Pushes a new scope whose parent is the current scope.
    Scope_Index enter_scope(std::size_t begin, std::size_t end, bool inherits = true);

    /// @brief Adds a definition to the current scope.
    /// @return The index of the new definition.
    std::size_t
    define(std::u8string_view name, std::size_t begin, std::size_t end, std::size_t value_end = 0);

    /// @brief Searches the definition that `name`, referenced at `offset`, resolves to.
    /// Scopes are searched from innermost to outermost,
    /// stopping after the first scope that does not inherit.
    /// Within a scope, later definitions shadow earlier ones.
    [[nodiscard]]
    std::optional<std::size_t> resolve(std::u8string_view name, std::size_t offset) const;

    void set_definition_highlight(std::size_t definition, std::u8string_view highlight)
    {
        TREELIGHT_ASSERT(definition < m_definitions.size());
        m_definitions[definition].highlight = highlight;
    }

    [[nodiscard]]
    Scope_Index current_scope() const
    {
        return m_stack.back();
    }

    [[nodiscard]]
    std::size_t depth() const
    {
        return m_stack.size();
    }

    [[nodiscard]]
    const Local_Definition& definition(std::size_t index) const
    {
        TREELIGHT_ASSERT(index < m_definitions.size());
        return m_definitions[index];
    }

    [[nodiscard]]
    std::span<const Local_Scope> scopes() const
    {
        return m_scopes;
    }

    [[nodiscard]]
    std::span<const Local_Definition> definitions() const
    {
        return m_definitions;
    }
};

} // namespace treelight

#endif
