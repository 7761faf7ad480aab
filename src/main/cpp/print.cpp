#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <ostream>
#include <string>
#include <string_view>

#include "treelight/util/ansi.hpp"
#include "treelight/util/assert.hpp"
#include "treelight/util/severity.hpp"
#include "treelight/util/source_position.hpp"
#include "treelight/util/strings.hpp"
#include "treelight/util/to_chars.hpp"

#include "treelight/diagnostic.hpp"
#include "treelight/print.hpp"

namespace treelight {
namespace {

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace       ? ansi::black
        : severity <= Severity::debug        ? ansi::h_black
        : severity <= Severity::info         ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

struct Colored_Output {
    std::pmr::u8string& out;
    bool colors;

    void append(std::u8string_view text, std::u8string_view color)
    {
        if (colors) {
            out += color;
        }
        out += text;
        if (colors) {
            out += ansi::reset;
        }
    }
};

} // namespace

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    TREELIGHT_ASSERT(index <= source.size());
    if (source.empty()) {
        return source;
    }

    if (index == source.size() || source[index] == '\n') {
        // EOF positions and positions of line terminators belong to the line they end.
        if (index == 0) {
            return {};
        }
        --index;
    }

    std::size_t begin = source.rfind('\n', index);
    begin = begin != std::u8string_view::npos ? begin + 1 : 0;

    const std::size_t end = std::min(source.find('\n', index + 1), source.size());

    return source.substr(begin, end - begin);
}

void print_file_position(
    std::pmr::u8string& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colon_suffix
)
{
    out += file;
    out += u8':';
    out += to_characters8(pos.line + 1).as_string();
    out += u8':';
    out += to_characters8(pos.column + 1).as_string();
    if (colon_suffix) {
        out += u8':';
    }
}

void print_affected_line(std::pmr::u8string& out, std::u8string_view source, const Source_Span& pos)
{
    TREELIGHT_ASSERT(!pos.empty());

    const std::u8string_view cited_code = find_line(source, pos.begin);
    const Characters8 line_chars = to_characters8(pos.line + 1);

    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length = pad_max - std::min(line_chars.length, pad_max - 1);
    out.append(pad_length, u8' ');
    out += line_chars.as_string();
    out += u8" | ";
    out += cited_code;
    out += u8'\n';

    const std::size_t align_length = std::max(pad_max, line_chars.length + 1);
    out.append(align_length, u8' ');
    out += u8" | ";
    out.append(pos.column, u8' ');
    const std::size_t indicator_length
        = pos.column < cited_code.length() ? std::min(pos.length, cited_code.length() - pos.column) : 1;
    out += u8'^';
    if (indicator_length > 1) {
        out.append(indicator_length - 1, u8'~');
    }
    out += u8'\n';
}

void print_diagnostic(
    std::pmr::u8string& out,
    const Diagnostic& diagnostic,
    std::u8string_view source,
    bool colors
)
{
    Colored_Output colored { out, colors };
    colored.append(severity_tag(diagnostic.severity), severity_highlight(diagnostic.severity));
    out += u8": ";
    const std::u8string_view file = diagnostic.file.empty() ? u8"<input>" : diagnostic.file;
    print_file_position(out, file, diagnostic.location);
    out += u8' ';
    out += diagnostic.message;
    out += u8' ';
    colored.append(u8"[", ansi::h_black);
    colored.append(diagnostic.id, ansi::h_black);
    colored.append(u8"]", ansi::h_black);
    out += u8'\n';

    if (!source.empty() && !diagnostic.location.empty()
        && diagnostic.location.begin < source.size()) {
        print_affected_line(out, source, diagnostic.location);
    }
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

void Ostream_Logger::operator()(const Diagnostic& diagnostic)
{
    m_buffer.clear();
    print_diagnostic(m_buffer, diagnostic, m_source, m_colors);
    m_out << std::u8string_view { m_buffer };
}

} // namespace treelight
