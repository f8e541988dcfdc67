#pragma once

#include <cstddef>

#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <errata/canonical.hpp>
#include <errata/chain.hpp>
#include <errata/fwd.hpp>

namespace errata
{
//! turns the members of a group into its string representation
using group_formatter
        = std::function<std::string(std::span<canonical const> errors)>;

/**
 * empty string for no errors, the message of a single error or a bullet
 * point list surrounded by blank lines for multiple errors
 */
auto format_group_default(std::span<canonical const> errors) -> std::string;

/**
 * an ordered collection of canonical errors reported as one failure
 *
 * Appending never nests: the members of an appended group are inlined and
 * foreign errors are wrapped with unknown_error(). Appending is not
 * synchronized, concurrent producers feeding one group need to serialize
 * their append() calls.
 */
class group final
{
public:
    using member_list = std::vector<canonical>;
    using value_type = canonical;
    using const_iterator = member_list::const_iterator;

    group();

    //! empty arguments (std::nullopt) are skipped
    template <typename... Errors>
    void append(Errors &&...errs);

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return mErrors.empty();
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mErrors.size();
    }
    [[nodiscard]] auto errors() const noexcept -> member_list const &
    {
        return mErrors;
    }
    [[nodiscard]] auto begin() const noexcept -> const_iterator
    {
        return mErrors.begin();
    }
    [[nodiscard]] auto end() const noexcept -> const_iterator
    {
        return mErrors.end();
    }

    //! the members as a list of errors
    [[nodiscard]] auto slice() const -> std::vector<error>;
    //! the group as an error or empty if there are no members
    [[nodiscard]] auto error_or_nil() const -> std::optional<error>;
    /**
     * nothing for an empty group, the member itself for a group of one and
     * a chain over a snapshot of the members otherwise
     */
    [[nodiscard]] auto unwrap() const -> std::optional<error>;

    //! orders by the single line message
    [[nodiscard]] auto less(std::size_t i, std::size_t j) const -> bool;
    void swap(std::size_t i, std::size_t j) noexcept;
    void sort();

    [[nodiscard]] auto message() const -> std::string;

    [[nodiscard]] auto formatter() const noexcept -> group_formatter const &
    {
        return mFormatter;
    }
    void set_formatter(group_formatter formatter);

    friend auto operator==(group const &lhs, group const &rhs) noexcept
            -> bool
    {
        return lhs.mErrors == rhs.mErrors;
    }

private:
    void append_one(std::optional<error> const &err);
    void append_members(std::span<canonical const> members);

    member_list mErrors;
    group_formatter mFormatter;
};

template <typename... Errors>
inline void group::append(Errors &&...errs)
{
    static_assert(
            (std::is_constructible_v<std::optional<error>, Errors &&> && ...),
            "group::append() only accepts error-shaped arguments");

    (append_one(std::optional<error>(std::forward<Errors>(errs))), ...);
}

//! creates a group and appends the given errors
template <typename... Errors>
inline auto make_group(Errors &&...errs) -> group
{
    group g;
    g.append(std::forward<Errors>(errs)...);
    return g;
}

// an absent group behaves like an empty one
[[nodiscard]] auto is_empty(std::optional<group> const &g) noexcept -> bool;
[[nodiscard]] auto error_or_nil(std::optional<group> const &g)
        -> std::optional<error>;
[[nodiscard]] auto unwrap(std::optional<group> const &g)
        -> std::optional<error>;

auto operator<<(std::ostream &s, group const &g) -> std::ostream &;
} // namespace errata

namespace fmt
{
template <>
struct formatter<errata::group> : formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(errata::group const &g, FormatContext &ctx) const
    {
        auto const str = g.message();
        return formatter<std::string_view>::format(std::string_view(str), ctx);
    }
};
} // namespace fmt
