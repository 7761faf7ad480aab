#ifndef TREELIGHT_SERVICES_HPP
#define TREELIGHT_SERVICES_HPP

#include <memory_resource>
#include <string_view>

#include "treelight/util/assert.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/severity.hpp"
#include "treelight/util/typo.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/fwd.hpp"
#include "treelight/syntax_tree.hpp"

namespace treelight {

enum struct Parse_Error : Default_Underlying {
    /// @brief The parser does not support the requested language.
    unsupported_language,
    /// @brief The source code could not be parsed.
    bad_code,
    other,
};

/// @brief Turns source code into a `Syntax_Tree`.
/// This is the bridge to the external parser (grammar) of a language.
struct Language_Parser {

    /// @brief Parses the given `source` as the given `language`.
    /// @param source The source code.
    /// The resulting tree has byte offsets into `source`.
    /// @param language The language to parse.
    /// @param memory The memory resource used for the returned tree.
    [[nodiscard]]
    virtual Result<Syntax_Tree, Parse_Error> operator()(
        std::u8string_view source,
        const Language_Config& language,
        std::pmr::memory_resource* memory
    ) = 0;
};

/// @brief A set of languages that injections can refer to by name.
struct Language_Registry {

    /// @brief Returns the language with the given `name`,
    /// or a null pointer if there is no such language.
    /// An exact match is preferred over one that only matches when ignoring ASCII case.
    [[nodiscard]]
    virtual const Language_Config* find(std::u8string_view name) const
        = 0;

    /// @brief Returns the known language name that is closest to `name`.
    ///
    // This member function is useful for typo detection.
    [[nodiscard]]
    virtual Distant<std::u8string_view>
    match_language(std::u8string_view name, std::pmr::memory_resource* memory) const
        = 0;
};

/// @brief A `Language_Registry` that contains no languages.
struct Empty_Language_Registry final : Language_Registry {

    [[nodiscard]]
    const Language_Config* find(std::u8string_view) const final
    {
        return nullptr;
    }

    [[nodiscard]]
    Distant<std::u8string_view>
    match_language(std::u8string_view, std::pmr::memory_resource*) const final
    {
        return {};
    }
};

inline constinit Empty_Language_Registry empty_language_registry;

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        TREELIGHT_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    virtual void operator()(const Diagnostic& diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(const Diagnostic&) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace treelight

#endif
