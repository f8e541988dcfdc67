#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include <errata/canonical.hpp>
#include <errata/chain.hpp>
#include <errata/foreign.hpp>
#include <errata/fwd.hpp>
#include <errata/group.hpp>

namespace errata
{
/**
 * any error-shaped value
 *
 * A closed variant over the classified (canonical), foreign, aggregate
 * (group) and chain cursor cases. A default constructed error holds the
 * zero canonical error.
 */
class error final
{
public:
    using variant_type = std::variant<canonical, foreign_error_ptr, group, chain>;

    error() = default;
    error(canonical value)
        : mValue(std::move(value))
    {
    }
    //! throws std::invalid_argument if value is null
    error(foreign_error_ptr value);
    error(group value)
        : mValue(std::move(value))
    {
    }
    error(chain value)
        : mValue(std::move(value))
    {
    }

    [[nodiscard]] auto kind() const noexcept -> error_kind;

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> T const *
    {
        return std::get_if<T>(&mValue);
    }
    [[nodiscard]] auto value() const noexcept -> variant_type const &
    {
        return mValue;
    }

    [[nodiscard]] auto message() const -> std::string;
    [[nodiscard]] auto diagnostic_information(error_message_format format) const
            -> std::string;

    //! the next error of the cause chain if there is one
    [[nodiscard]] auto unwrap() const -> std::optional<error>;
    //! single step identity hook, doesn't look at the causes of *this
    [[nodiscard]] auto is(error const &target) const -> bool;

    friend auto operator==(error const &lhs, error const &rhs) -> bool;

private:
    variant_type mValue;
};

[[nodiscard]] auto unwrap(error const &err) -> std::optional<error>;

/**
 * walks the cause chain of err and reports whether one of its steps
 * identifies as target
 */
[[nodiscard]] auto is(error const &err, error const &target) -> bool;

/**
 * walks the cause chain of err and returns a copy of the first step which
 * holds a T; a chain step delegates to its front member
 */
template <typename T>
[[nodiscard]] auto as(error const &err) -> std::optional<T>
{
    static_assert(std::is_same_v<T, canonical>
                          || std::is_same_v<T, foreign_error_ptr>
                          || std::is_same_v<T, group>
                          || std::is_same_v<T, chain>,
                  "errata::as() can only extract an alternative of error");

    for (std::optional<error> step{err}; step; step = step->unwrap())
    {
        if (auto const *value = step->get_if<T>())
        {
            return *value;
        }
        if constexpr (!std::is_same_v<T, chain>)
        {
            if (auto const *cursor = step->get_if<chain>())
            {
                if (auto value = cursor->as<T>())
                {
                    return value;
                }
            }
        }
    }
    return std::nullopt;
}

template <typename T>
inline auto chain::as() const -> std::optional<T>
{
    if (empty())
    {
        return std::nullopt;
    }
    return errata::as<T>(error{front()});
}

auto operator<<(std::ostream &s, error const &e) -> std::ostream &;
} // namespace errata

namespace fmt
{
/**
 * {} / {:!v} single line, {:v} with the whole cause chain of canonical
 * errors
 */
template <>
struct formatter<errata::error>
{
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin())
    {
        constexpr auto errfmt = "invalid error format";

        auto it = ctx.begin();
        auto const end = ctx.end();
        if (it == end || *it == '}')
        {
            return it;
        }
        if (*it == '!')
        {
            ++it;
            error_format = errata::error_message_format::simple;
        }
        else
        {
            error_format = errata::error_message_format::with_diagnostics;
        }
        if (it == end || *it != 'v')
        {
            ctx.on_error(errfmt);
        }
        if (it != end)
        {
            ++it;
        }
        if (it != end && *it != '}')
        {
            ctx.on_error(errfmt);
        }
        return it;
    }

    template <typename FormatContext>
    auto format(errata::error const &e, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        auto const str = e.diagnostic_information(error_format);
        return std::copy(str.cbegin(), str.cend(), ctx.out());
    }

    errata::error_message_format error_format
            = errata::error_message_format::simple;
};
} // namespace fmt
