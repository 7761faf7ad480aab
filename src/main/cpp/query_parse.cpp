#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "treelight/util/assert.hpp"
#include "treelight/util/chars.hpp"
#include "treelight/util/result.hpp"
#include "treelight/util/source_position.hpp"
#include "treelight/util/unicode.hpp"

#include "treelight/query.hpp"
#include "treelight/regexp.hpp"

namespace treelight {
namespace {

/// @brief Returns `true` if `c` can appear in a node kind, field name, or capture name.
/// Unlike predicate names, these cannot contain `?` or `!`,
/// which would be ambiguous with quantifiers and negated fields.
[[nodiscard]]
constexpr bool is_name_char(char8_t c)
{
    return is_query_identifier_char(c) && c != u8'?' && c != u8'!';
}

enum struct Argument_Kind : Default_Underlying {
    /// @brief `@name`
    capture,
    /// @brief `"text"`
    string,
    /// @brief `name`
    symbol,
};

struct Predicate_Argument {
    Argument_Kind kind;
    std::pmr::u8string text;
    Capture_Id capture;
    Source_Span location;
};

struct Capture_Use {
    Capture_Id id;
    Source_Span location;
};

struct [[nodiscard]] Query_Parser {
private:
    Query& m_query;
    const std::u8string_view m_source;
    const std::size_t m_source_index;
    std::pmr::memory_resource* const m_memory;

    Source_Position m_pos {};
    std::optional<Query_Error> m_error;

    Query_Pattern* m_pattern = nullptr;
    std::pmr::vector<Capture_Use> m_predicate_captures;

public:
    [[nodiscard]]
    Query_Parser(
        Query& query,
        std::u8string_view source,
        std::size_t source_index,
        std::pmr::memory_resource* memory
    )
        : m_query { query }
        , m_source { source }
        , m_source_index { source_index }
        , m_memory { memory }
        , m_predicate_captures { memory }
    {
    }

    Result<void, Query_Error> operator()()
    {
        while (true) {
            skip_trivia();
            if (eof()) {
                return {};
            }
            if (!consume_top_level_pattern()) {
                TREELIGHT_ASSERT(m_error);
                return *m_error;
            }
        }
    }

private:
    bool error(Query_Error_Kind kind, const Source_Span& location)
    {
        if (!m_error) {
            m_error = Query_Error { .kind = kind, .source_index = m_source_index, .location = location };
        }
        return false;
    }

    bool error_here(Query_Error_Kind kind)
    {
        const std::size_t length = eof()
            ? 0
            : std::size_t(utf8::decode_and_length_or_replacement(peek_all()).length);
        return error(kind, Source_Span { m_pos, length });
    }

    [[nodiscard]]
    Source_Span span_from(const Source_Position& start) const
    {
        return Source_Span { start, m_pos.begin - start.begin };
    }

    void advance_by(std::size_t n)
    {
        TREELIGHT_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        return m_source.substr(m_pos.begin);
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_pos.begin == m_source.length();
    }

    [[nodiscard]]
    char8_t peek() const
    {
        TREELIGHT_ASSERT(!eof());
        return m_source[m_pos.begin];
    }

    [[nodiscard]]
    bool peek(char8_t c) const
    {
        return !eof() && m_source[m_pos.begin] == c;
    }

    [[nodiscard]]
    bool peek(bool predicate(char8_t)) const
    {
        return !eof() && predicate(m_source[m_pos.begin]);
    }

    [[nodiscard]]
    bool expect(char8_t c)
    {
        if (!peek(c)) {
            return false;
        }
        advance_by(1);
        return true;
    }

    void skip_trivia()
    {
        while (!eof()) {
            if (peek(is_ascii_blank)) {
                advance_by(1);
            }
            else if (peek(u8';')) {
                const std::size_t line_end = peek_all().find(u8'\n');
                advance_by(line_end == std::u8string_view::npos ? peek_all().length() : line_end);
            }
            else {
                break;
            }
        }
    }

    /// @brief Returns `true` if the parser is at `(` and the next token is `#`,
    /// i.e. at the start of a predicate or directive.
    [[nodiscard]]
    bool peek_predicate() const
    {
        if (!peek(u8'(')) {
            return false;
        }
        const std::u8string_view rest = peek_all().substr(1);
        for (const char8_t c : rest) {
            if (!is_ascii_blank(c)) {
                return c == u8'#';
            }
        }
        return false;
    }

    /// @brief Returns `true` if the parser is at a standalone `_`.
    [[nodiscard]]
    bool peek_wildcard() const
    {
        const std::u8string_view rest = peek_all();
        return rest.starts_with(u8'_') && (rest.length() == 1 || !is_name_char(rest[1]));
    }

    /// @brief Returns the length of the field name followed by `:` at the current position,
    /// or zero if there is none.
    [[nodiscard]]
    std::size_t peek_field_length() const
    {
        const std::u8string_view rest = peek_all();
        std::size_t length = 0;
        while (length < rest.length() && is_name_char(rest[length])) {
            ++length;
        }
        return length != 0 && length < rest.length() && rest[length] == u8':' ? length : 0;
    }

    std::u8string_view consume_name(bool predicate(char8_t) = is_name_char)
    {
        const std::size_t begin = m_pos.begin;
        while (peek(predicate)) {
            advance_by(1);
        }
        return m_source.substr(begin, m_pos.begin - begin);
    }

    [[nodiscard]]
    Capture_Id intern_capture(std::u8string_view name)
    {
        const Capture_Id existing = m_query.find_capture(name);
        if (existing != Capture_Id::none) {
            return existing;
        }
        m_query.capture_names.emplace_back(name);
        return Capture_Id(m_query.capture_names.size() - 1);
    }

    [[nodiscard]]
    Pattern_Node& node(std::uint32_t index)
    {
        TREELIGHT_DEBUG_ASSERT(index < m_pattern->nodes.size());
        return m_pattern->nodes[index];
    }

    [[nodiscard]]
    std::uint32_t push_node(Pattern_Node_Kind kind)
    {
        m_pattern->nodes.emplace_back(kind, m_memory);
        return std::uint32_t(m_pattern->nodes.size() - 1);
    }

    bool consume_top_level_pattern()
    {
        const Source_Position start = m_pos;

        Query_Pattern pattern { m_memory };
        pattern.source_index = m_source_index;
        m_pattern = &pattern;
        m_predicate_captures.clear();

        if (const std::size_t field_length = peek_field_length()) {
            return error(Query_Error_Kind::misplaced_field, Source_Span { m_pos, field_length });
        }
        const std::optional<std::uint32_t> root = consume_pattern();
        if (!root) {
            return false;
        }
        pattern.root = *root;
        // Every node is matched individually at the top level,
        // so quantifiers have no effect there.
        node(*root).quantifier = Quantifier::one;

        // Predicates that follow a pattern at the top level belong to that pattern.
        skip_trivia();
        while (peek_predicate()) {
            if (!consume_predicate()) {
                return false;
            }
            skip_trivia();
        }

        for (const Capture_Use& use : m_predicate_captures) {
            const auto defines_capture = [&](const Pattern_Node& n) {
                return std::ranges::find(n.captures, use.id) != n.captures.end();
            };
            if (std::ranges::none_of(pattern.nodes, defines_capture)) {
                return error(Query_Error_Kind::undefined_capture, use.location);
            }
        }

        pattern.location = span_from(start);
        m_pattern = nullptr;
        m_query.patterns.push_back(std::move(pattern));
        return true;
    }

    /// @brief Consumes a pattern, including its quantifier and captures.
    /// @return The index of the outermost node of the pattern.
    std::optional<std::uint32_t> consume_pattern()
    {
        const Source_Position start = m_pos;
        if (eof()) {
            error_here(Query_Error_Kind::unexpected_end);
            return {};
        }

        std::optional<std::uint32_t> result;
        switch (peek()) {
        case u8'(': result = consume_parenthesized(); break;
        case u8'[': result = consume_alternation(); break;
        case u8'"': result = consume_anonymous(); break;
        default: {
            if (!peek_wildcard()) {
                error_here(Query_Error_Kind::unexpected_character);
                return {};
            }
            advance_by(1);
            result = push_node(Pattern_Node_Kind::wildcard);
            break;
        }
        }
        if (!result || !consume_suffix(*result)) {
            return {};
        }
        if (node(*result).kind == Pattern_Node_Kind::group && !node(*result).captures.empty()) {
            error(Query_Error_Kind::invalid_group, span_from(start));
            return {};
        }
        return result;
    }

    bool consume_suffix(std::uint32_t index)
    {
        skip_trivia();
        if (!eof()) {
            const Quantifier quantifier = peek() == u8'?' ? Quantifier::zero_or_one
                : peek() == u8'*'                         ? Quantifier::zero_or_more
                : peek() == u8'+'                         ? Quantifier::one_or_more
                                                          : Quantifier::one;
            if (quantifier != Quantifier::one) {
                advance_by(1);
                node(index).quantifier = quantifier;
                skip_trivia();
            }
        }
        while (peek(u8'@')) {
            const Source_Position start = m_pos;
            advance_by(1);
            const std::u8string_view name = consume_name();
            if (name.empty()) {
                return error(Query_Error_Kind::missing_name, span_from(start));
            }
            const Capture_Id id = intern_capture(name);
            node(index).captures.push_back(id);
            skip_trivia();
        }
        return true;
    }

    std::optional<std::uint32_t> consume_parenthesized()
    {
        const Source_Position start = m_pos;
        advance_by(1);
        skip_trivia();
        if (eof()) {
            error_here(Query_Error_Kind::unexpected_end);
            return {};
        }
        if (peek(u8'(') || peek(u8'[') || peek(u8'"')) {
            return consume_group(start);
        }

        std::uint32_t index;
        if (peek_wildcard()) {
            advance_by(1);
            index = push_node(Pattern_Node_Kind::named_wildcard);
        }
        else if (peek(is_name_char) && !peek(u8'.')) {
            const std::u8string_view kind = consume_name();
            index = push_node(Pattern_Node_Kind::named);
            node(index).text = kind;
        }
        else {
            error_here(Query_Error_Kind::unexpected_character);
            return {};
        }

        if (!consume_children(index)) {
            return {};
        }
        return index;
    }

    bool consume_children(std::uint32_t parent)
    {
        bool pending_anchor = false;
        while (true) {
            skip_trivia();
            if (eof()) {
                return error_here(Query_Error_Kind::unexpected_end);
            }
            if (expect(u8')')) {
                node(parent).anchored_last = pending_anchor;
                return true;
            }
            if (expect(u8'.')) {
                pending_anchor = true;
                continue;
            }
            if (peek(u8'!')) {
                const Source_Position start = m_pos;
                advance_by(1);
                const std::u8string_view field = consume_name();
                if (field.empty()) {
                    return error(Query_Error_Kind::missing_name, span_from(start));
                }
                node(parent).negated_fields.emplace_back(field);
                continue;
            }
            if (peek_predicate()) {
                if (!consume_predicate()) {
                    return false;
                }
                continue;
            }
            const std::optional<Anchored_Child> child = consume_child(pending_anchor);
            if (!child) {
                return false;
            }
            node(parent).children.push_back(*child);
            pending_anchor = false;
        }
    }

    /// @brief Consumes a child pattern, optionally preceded by a field name.
    std::optional<Anchored_Child> consume_child(bool anchored)
    {
        std::u8string_view field;
        const Source_Position field_start = m_pos;
        if (const std::size_t field_length = peek_field_length()) {
            field = peek_all().substr(0, field_length);
            advance_by(field_length + 1);
            skip_trivia();
        }
        const std::optional<std::uint32_t> child = consume_pattern();
        if (!child) {
            return {};
        }
        if (!field.empty()) {
            if (node(*child).kind == Pattern_Node_Kind::group) {
                error(Query_Error_Kind::misplaced_field, Source_Span { field_start, field.length() });
                return {};
            }
            node(*child).field = field;
        }
        return Anchored_Child { .node = *child, .anchored = anchored };
    }

    /// @brief Consumes the remainder of a parenthesized group.
    /// A group that contains a single pattern and no anchors is that pattern.
    /// Otherwise, it is a `group` of sibling patterns.
    /// Predicates in the group belong to the enclosing top-level pattern.
    std::optional<std::uint32_t> consume_group(const Source_Position& start)
    {
        std::pmr::vector<Anchored_Child> elements { m_memory };
        bool pending_anchor = false;
        bool has_anchors = false;
        while (true) {
            skip_trivia();
            if (eof()) {
                error_here(Query_Error_Kind::unexpected_end);
                return {};
            }
            if (expect(u8')')) {
                break;
            }
            if (expect(u8'.')) {
                pending_anchor = true;
                has_anchors = true;
                continue;
            }
            if (peek_predicate()) {
                if (!consume_predicate()) {
                    return {};
                }
                continue;
            }
            const std::optional<Anchored_Child> element = consume_child(pending_anchor);
            if (!element) {
                return {};
            }
            elements.push_back(*element);
            pending_anchor = false;
        }
        if (elements.empty()) {
            error(Query_Error_Kind::invalid_group, span_from(start));
            return {};
        }
        if (elements.size() == 1 && !has_anchors) {
            return elements.front().node;
        }
        const std::uint32_t index = push_node(Pattern_Node_Kind::group);
        node(index).children = std::move(elements);
        node(index).anchored_last = pending_anchor;
        return index;
    }

    std::optional<std::uint32_t> consume_alternation()
    {
        const Source_Position start = m_pos;
        advance_by(1);
        const std::uint32_t index = push_node(Pattern_Node_Kind::alternation);
        while (true) {
            skip_trivia();
            if (eof()) {
                error_here(Query_Error_Kind::unexpected_end);
                return {};
            }
            if (expect(u8']')) {
                break;
            }
            const Source_Position alternative_start = m_pos;
            const std::optional<std::uint32_t> alternative = consume_pattern();
            if (!alternative) {
                return {};
            }
            if (node(*alternative).kind == Pattern_Node_Kind::group) {
                error(Query_Error_Kind::invalid_group, span_from(alternative_start));
                return {};
            }
            node(index).children.push_back({ .node = *alternative });
        }
        if (node(index).children.empty()) {
            error(Query_Error_Kind::empty_alternation, span_from(start));
            return {};
        }
        return index;
    }

    std::optional<std::uint32_t> consume_anonymous()
    {
        std::pmr::u8string text { m_memory };
        if (!consume_string(text)) {
            return {};
        }
        const std::uint32_t index = push_node(Pattern_Node_Kind::anonymous);
        node(index).text = std::move(text);
        return index;
    }

    bool consume_string(std::pmr::u8string& out)
    {
        const Source_Position start = m_pos;
        TREELIGHT_ASSERT(peek(u8'"'));
        advance_by(1);
        while (true) {
            if (eof()) {
                return error(Query_Error_Kind::unterminated_string, span_from(start));
            }
            const char8_t c = peek();
            advance_by(1);
            if (c == u8'"') {
                return true;
            }
            if (c != u8'\\') {
                out += c;
                continue;
            }
            if (eof()) {
                return error(Query_Error_Kind::unterminated_string, span_from(start));
            }
            const char8_t escaped = peek();
            advance_by(1);
            switch (escaped) {
            case u8'n': out += u8'\n'; break;
            case u8't': out += u8'\t'; break;
            case u8'r': out += u8'\r'; break;
            case u8'0': out += u8'\0'; break;
            default: out += escaped; break;
            }
        }
    }

    bool consume_predicate_argument(std::pmr::vector<Predicate_Argument>& out)
    {
        const Source_Position start = m_pos;
        Predicate_Argument argument {
            .kind = Argument_Kind::symbol,
            .text = std::pmr::u8string { m_memory },
            .capture = Capture_Id::none,
            .location = {},
        };
        if (peek(u8'@')) {
            advance_by(1);
            const std::u8string_view name = consume_name();
            if (name.empty()) {
                return error(Query_Error_Kind::missing_name, span_from(start));
            }
            argument.kind = Argument_Kind::capture;
            argument.text = name;
            argument.capture = intern_capture(name);
            m_predicate_captures.push_back({ argument.capture, span_from(start) });
        }
        else if (peek(u8'"')) {
            argument.kind = Argument_Kind::string;
            if (!consume_string(argument.text)) {
                return false;
            }
        }
        else if (peek(is_query_identifier_char)) {
            argument.text = consume_name(is_query_identifier_char);
        }
        else {
            return error_here(Query_Error_Kind::unexpected_character);
        }
        argument.location = span_from(start);
        out.push_back(std::move(argument));
        return true;
    }

    bool consume_predicate()
    {
        const Source_Position start = m_pos;
        advance_by(1);
        skip_trivia();
        const bool has_hash = expect(u8'#');
        TREELIGHT_ASSERT(has_hash);
        const std::u8string_view name = consume_name(is_query_identifier_char);
        if (name.empty()) {
            return error(Query_Error_Kind::missing_name, span_from(start));
        }

        std::pmr::vector<Predicate_Argument> arguments { m_memory };
        while (true) {
            skip_trivia();
            if (eof()) {
                return error_here(Query_Error_Kind::unexpected_end);
            }
            if (expect(u8')')) {
                break;
            }
            if (!consume_predicate_argument(arguments)) {
                return false;
            }
        }

        return add_predicate(name, arguments, span_from(start));
    }

    void warn(Query_Warning_Kind kind, std::u8string_view name, const Source_Span& location)
    {
        m_query.warnings.push_back({
            .kind = kind,
            .source_index = m_source_index,
            .pattern_index = m_query.patterns.size(),
            .location = location,
            .name = std::pmr::u8string { name, m_memory },
        });
    }

    bool add_predicate(
        std::u8string_view name,
        std::span<Predicate_Argument> arguments,
        const Source_Span& location
    )
    {
        const auto bad_arguments = [&] {
            return error(Query_Error_Kind::bad_predicate_arguments, location);
        };
        const auto is_text = [](const Predicate_Argument& a) {
            return a.kind == Argument_Kind::string || a.kind == Argument_Kind::symbol;
        };

        if (name == u8"eq?" || name == u8"not-eq?" || name == u8"any-eq?"
            || name == u8"any-not-eq?") {
            if (arguments.size() != 2 || arguments[0].kind != Argument_Kind::capture
                || arguments[1].kind == Argument_Kind::symbol) {
                return bad_arguments();
            }
            const bool compares_captures = arguments[1].kind == Argument_Kind::capture;
            m_pattern->predicates.emplace_back(Text_Equality_Predicate {
                .capture = arguments[0].capture,
                .other = compares_captures ? arguments[1].capture : Capture_Id::none,
                .literal = compares_captures ? std::pmr::u8string { m_memory }
                                             : std::move(arguments[1].text),
                .negated = name.contains(u8"not-"),
                .any = name.starts_with(u8"any-"),
            });
            return true;
        }

        if (name == u8"match?" || name == u8"not-match?" || name == u8"any-match?"
            || name == u8"any-not-match?") {
            if (arguments.size() != 2 || arguments[0].kind != Argument_Kind::capture
                || arguments[1].kind != Argument_Kind::string) {
                return bad_arguments();
            }
            Result<Reg_Exp, Reg_Exp_Error_Code> regex = Reg_Exp::make(arguments[1].text);
            if (!regex) {
                return error(Query_Error_Kind::invalid_regex, arguments[1].location);
            }
            m_pattern->predicates.emplace_back(Text_Match_Predicate {
                .capture = arguments[0].capture,
                .regex = std::move(*regex),
                .negated = name.contains(u8"not-"),
                .any = name.starts_with(u8"any-"),
            });
            return true;
        }

        if (name == u8"any-of?" || name == u8"not-any-of?") {
            if (arguments.size() < 2 || arguments[0].kind != Argument_Kind::capture) {
                return bad_arguments();
            }
            Any_Of_Predicate predicate {
                .capture = arguments[0].capture,
                .values = std::pmr::vector<std::pmr::u8string> { m_memory },
                .negated = name == u8"not-any-of?",
            };
            for (Predicate_Argument& argument : arguments.subspan(1)) {
                if (argument.kind != Argument_Kind::string) {
                    return bad_arguments();
                }
                predicate.values.push_back(std::move(argument.text));
            }
            m_pattern->predicates.emplace_back(std::move(predicate));
            return true;
        }

        if (name == u8"is?" || name == u8"is-not?") {
            if (!arguments.empty() && arguments[0].kind == Argument_Kind::capture) {
                arguments = arguments.subspan(1);
            }
            if (arguments.empty() || arguments.size() > 2
                || !std::ranges::all_of(arguments, is_text)) {
                return bad_arguments();
            }
            m_pattern->predicates.emplace_back(Property_Predicate {
                .key = std::move(arguments[0].text),
                .value = arguments.size() == 2 ? std::move(arguments[1].text)
                                               : std::pmr::u8string { m_memory },
                .negated = name == u8"is-not?",
            });
            return true;
        }

        if (name == u8"set!") {
            if (!arguments.empty() && arguments[0].kind == Argument_Kind::capture) {
                arguments = arguments.subspan(1);
            }
            if (arguments.empty() || arguments.size() > 2
                || !std::ranges::all_of(arguments, is_text)) {
                return bad_arguments();
            }
            Query_Property property { .key = std::move(arguments[0].text), .value = {} };
            if (arguments.size() == 2) {
                property.value = std::move(arguments[1].text);
            }
            m_pattern->properties.push_back(std::move(property));
            return true;
        }

        if (name.ends_with(u8'!')) {
            warn(Query_Warning_Kind::unknown_directive, name, location);
            return true;
        }
        warn(Query_Warning_Kind::unknown_predicate, name, location);
        m_pattern->predicates.emplace_back(Unknown_Predicate { std::pmr::u8string { name, m_memory } });
        return true;
    }
};

} // namespace

Result<Query, Query_Error>
parse_query(std::span<const Query_Source> sources, std::pmr::memory_resource* memory)
{
    Query result { memory };
    for (std::size_t i = 0; i < sources.size(); ++i) {
        result.source_names.emplace_back(sources[i].name);
        Query_Parser parser { result, sources[i].text, i, memory };
        Result<void, Query_Error> status = parser();
        if (!status) {
            return std::move(status).error();
        }
    }
    return result;
}

} // namespace treelight
