#ifndef TREELIGHT_REGEXP_HPP
#define TREELIGHT_REGEXP_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "treelight/util/result.hpp"

#include "treelight/fwd.hpp"

namespace treelight {

enum struct Reg_Exp_Error_Code : Default_Underlying {
    /// @brief The given pattern is not valid.
    bad_pattern,
};

enum struct Reg_Exp_Status : Default_Underlying {
    /// @brief Execution completed; no match was found.
    unmatched,
    /// @brief Execution completed; a match was found.
    matched,
};

struct Reg_Exp_Match {
    std::size_t index;
    std::size_t length;
};

struct Reg_Exp_Search_Result {
    Reg_Exp_Status status;
    Reg_Exp_Match match;
};

struct In_Place_Tag { };

struct Reg_Exp_Impl {
private:
    alignas(8) unsigned char m_storage[16];

public:
    Reg_Exp_Impl() noexcept;
    Reg_Exp_Impl(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl(Reg_Exp_Impl&&) noexcept;

    Reg_Exp_Impl& operator=(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl& operator=(Reg_Exp_Impl&&) noexcept;

    ~Reg_Exp_Impl();

private:
    template <typename T>
    Reg_Exp_Impl(In_Place_Tag, T&&) noexcept;

    [[nodiscard]]
    auto& get();
    [[nodiscard]]
    const auto& get() const;

    friend Reg_Exp;
};

/// @brief Represents an ECMAScript-flavored regular expression,
/// as used by the `#match?` query predicate.
///
/// A `Reg_Exp` has shared ownership over the underlying compiled regular expression,
/// meaning that copying is relatively inexpensive.
struct Reg_Exp {
public:
    [[nodiscard]]
    static Result<Reg_Exp, Reg_Exp_Error_Code> make(std::u8string_view pattern);

private:
    Reg_Exp_Impl m_impl;

    [[nodiscard]]
    explicit Reg_Exp(Reg_Exp_Impl&& impl) noexcept
        : m_impl { std::move(impl) }
    {
    }

public:
    /// @brief Returns `matched` if `string` matches this regex in its entirety.
    [[nodiscard]]
    Reg_Exp_Status match(std::u8string_view string) const;

    /// @brief Returns `matched` if `string` contains an occurrence of this regex,
    /// as well as the position of the first occurrence.
    [[nodiscard]]
    Reg_Exp_Search_Result search(std::u8string_view string) const;
};

/// @brief Converts the escape sequences of ECMAScript patterns
/// which Boost.Regex does not understand into equivalent ones that it does.
[[nodiscard]]
std::u32string ecma_pattern_to_boost_pattern(std::u32string_view ecma_pattern);

} // namespace treelight

#endif
