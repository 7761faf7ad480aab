#include <cstddef>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <string_view>

#include "treelight/util/assert.hpp"

#include "treelight/scope_tracker.hpp"

namespace treelight {

Scope_Tracker::Scope_Tracker(std::size_t document_length, std::pmr::memory_resource* memory)
    : m_scopes { memory }
    , m_definitions { memory }
    , m_scope_definitions { memory }
    , m_stack { memory }
{
    m_scopes.push_back({
        .parent = Scope_Index::none,
        .begin = 0,
        .end = document_length,
        .inherits = false,
    });
    m_scope_definitions.emplace_back();
    m_stack.push_back(Scope_Index::root);
}

void Scope_Tracker::advance_to(std::size_t offset)
{
    // The root scope is never popped.
    while (m_stack.size() > 1 && m_scopes[std::size_t(m_stack.back())].end <= offset) {
        m_stack.pop_back();
    }
}

Scope_Index Scope_Tracker::enter_scope(std::size_t begin, std::size_t end, bool inherits)
{
    TREELIGHT_ASSERT(begin <= end);
    const auto result = Scope_Index(m_scopes.size());
    m_scopes.push_back({
        .parent = current_scope(),
        .begin = begin,
        .end = end,
        .inherits = inherits,
    });
    m_scope_definitions.emplace_back();
    m_stack.push_back(result);
    return result;
}

std::size_t Scope_Tracker::define(
    std::u8string_view name,
    std::size_t begin,
    std::size_t end,
    std::size_t value_end
)
{
    const std::size_t result = m_definitions.size();
    const Scope_Index scope = current_scope();
    m_definitions.push_back({
        .name = name,
        .begin = begin,
        .end = end,
        .value_end = value_end,
        .scope = scope,
        .highlight = {},
    });
    m_scope_definitions[std::size_t(scope)].push_back(result);
    return result;
}

std::optional<std::size_t> Scope_Tracker::resolve(std::u8string_view name, std::size_t offset) const
{
    for (const Scope_Index scope : std::views::reverse(m_stack)) {
        for (const std::size_t d : std::views::reverse(m_scope_definitions[std::size_t(scope)])) {
            const Local_Definition& def = m_definitions[d];
            if (def.name == name && offset >= def.value_end) {
                return d;
            }
        }
        if (!m_scopes[std::size_t(scope)].inherits) {
            break;
        }
    }
    return {};
}

} // namespace treelight
