#ifndef TREELIGHT_PRINT_HPP
#define TREELIGHT_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <memory_resource>
#include <string>
#include <string_view>

#include "treelight/util/severity.hpp"
#include "treelight/util/source_position.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/fwd.hpp"
#include "treelight/services.hpp"

namespace treelight {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`, without the terminating newline.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// Lines and columns are printed one-based.
/// @param colon_suffix if `true`, appends a `:`
void print_file_position(
    std::pmr::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colon_suffix = true
);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
void print_affected_line(std::pmr::u8string& out, std::u8string_view source, const Source_Span& pos);

/// @brief Prints a diagnostic in the form `SEVERITY: file:line:column: message [id]`,
/// followed by the affected line if `source` is not empty and the location is not empty.
/// @param colors if `true`, ANSI escape sequences are used to color the output
void print_diagnostic(
    std::pmr::u8string& out,
    const Diagnostic& diagnostic,
    std::u8string_view source,
    bool colors
);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

/// @brief A logger which prints diagnostics to a `std::ostream`.
struct Ostream_Logger final : Logger {
private:
    std::ostream& m_out;
    std::u8string_view m_source;
    bool m_colors;
    std::pmr::u8string m_buffer;

public:
    /// @param source The source of the highlighted document, used to cite affected lines.
    /// May be empty, in which case no lines are cited.
    [[nodiscard]]
    Ostream_Logger(
        std::ostream& out,
        Severity min_severity,
        bool colors,
        std::u8string_view source,
        std::pmr::memory_resource* memory
    )
        : Logger { min_severity }
        , m_out { out }
        , m_source { source }
        , m_colors { colors }
        , m_buffer { memory }
    {
    }

    void operator()(const Diagnostic& diagnostic) final;
};

} // namespace treelight

#endif
