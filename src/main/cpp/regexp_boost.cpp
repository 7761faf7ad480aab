#include <algorithm>
#include <cstddef>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "treelight/util/assert.hpp"
#include "treelight/util/chars.hpp"
#include "treelight/util/unicode.hpp"

#include "treelight/regexp.hpp"

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace treelight {

static_assert(sizeof(Reg_Exp_Impl) == sizeof(boost::u32regex));

template <typename T>
Reg_Exp_Impl::Reg_Exp_Impl(In_Place_Tag, T&& arg) noexcept
{
    new (m_storage) boost::u32regex(std::forward<T>(arg));
}

auto& Reg_Exp_Impl::get()
{
    return *std::launder(reinterpret_cast<boost::u32regex*>(m_storage));
}

const auto& Reg_Exp_Impl::get() const
{
    return *std::launder(reinterpret_cast<const boost::u32regex*>(m_storage));
}

Reg_Exp_Impl::Reg_Exp_Impl() noexcept
{
    new (m_storage) boost::u32regex;
}

Reg_Exp_Impl::Reg_Exp_Impl(const Reg_Exp_Impl& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, other.get() }
{
}

Reg_Exp_Impl::Reg_Exp_Impl(Reg_Exp_Impl&& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, std::move(other.get()) }
{
}

// Self-assignment of boost::basic_regex boils down to std::shared_ptr self-assignment.
// NOLINTNEXTLINE(bugprone-unhandled-self-assignment)
Reg_Exp_Impl& Reg_Exp_Impl::operator=(const Reg_Exp_Impl& other) noexcept
{
    get() = other.get();
    return *this;
}

Reg_Exp_Impl& Reg_Exp_Impl::operator=(Reg_Exp_Impl&& other) noexcept
{
    // boost::basic_regex has no move operations (https://github.com/boostorg/regex/issues/270).
    // NOLINTNEXTLINE(performance-move-const-arg)
    get() = std::move(other.get());
    return *this;
}

Reg_Exp_Impl::~Reg_Exp_Impl()
{
    get().~basic_regex();
}

namespace {

[[nodiscard]]
std::u32string to_utf32(std::u8string_view utf8)
{
    std::u32string result;
    result.reserve(utf8.size());
    while (!utf8.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(utf8);
        result += code_point;
        utf8.remove_prefix(std::size_t(length));
    }
    return result;
}

} // namespace

Result<Reg_Exp, Reg_Exp_Error_Code> Reg_Exp::make(std::u8string_view pattern)
{
    constexpr auto flags = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;

    const std::u32string boost_pattern = ecma_pattern_to_boost_pattern(to_utf32(pattern));
    boost::u32regex result
        = boost::make_u32regex(boost_pattern.data(), boost_pattern.data() + boost_pattern.size(), flags);

    if (result.status() != 0) {
        return Reg_Exp_Error_Code::bad_pattern;
    }
    return Reg_Exp { Reg_Exp_Impl { In_Place_Tag {}, std::move(result) } };
}

Reg_Exp_Status Reg_Exp::match(std::u8string_view string) const
{
    const bool result
        = boost::u32regex_match(string.data(), string.data() + string.size(), m_impl.get());
    return result ? Reg_Exp_Status::matched : Reg_Exp_Status::unmatched;
}

Reg_Exp_Search_Result Reg_Exp::search(std::u8string_view string) const
{
    boost::match_results<const char8_t*> match;
    const bool found
        = boost::u32regex_search(string.data(), string.data() + string.size(), match, m_impl.get());
    if (!found) {
        return { Reg_Exp_Status::unmatched, {} };
    }
    const auto& first = match[0];
    TREELIGHT_ASSERT(first.matched);
    const Reg_Exp_Match result_match {
        .index = std::size_t(first.first - string.data()),
        .length = std::size_t(first.second - first.first),
    };
    return { Reg_Exp_Status::matched, result_match };
}

std::u32string ecma_pattern_to_boost_pattern(std::u32string_view ecma_pattern)
{
    // Even with ECMAScript syntax, Boost.Regex treats \u0030 not as U+0030 DIGIT ZERO,
    // but as any uppercase character, followed by 0030 literally.
    // Such escapes are rewritten to \x{0030}.
    // Appending the code point literally would be wrong because it could be a metacharacter.
    std::u32string result;
    result.reserve(ecma_pattern.size());
    bool escape = false;
    for (std::size_t i = 0; i < ecma_pattern.size(); ++i) {
        const char32_t c = ecma_pattern[i];
        if (!escape) {
            if (c == U'\\') {
                escape = true;
            }
            else {
                result += c;
            }
            continue;
        }
        escape = false;
        if (c != U'u') {
            result += U'\\';
            result += c;
            continue;
        }
        constexpr auto is_hex = [](char32_t d) { return is_ascii_hex_digit(d); };
        const bool is_code_point_escape
            = i + 4 < ecma_pattern.size() && std::ranges::all_of(ecma_pattern.substr(i + 1, 4), is_hex);
        if (is_code_point_escape) {
            result += U"\\x{";
            result += ecma_pattern.substr(i + 1, 4);
            result += U'}';
            i += 4;
        }
        else {
            result += U'u';
        }
    }
    if (escape) {
        result += U'\\';
    }
    return result;
}

} // namespace treelight
