#include <errata/group.hpp>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include <errata/error.hpp>

namespace errata
{
auto format_group_default(std::span<canonical const> errors) -> std::string
{
    switch (errors.size())
    {
    case 0:
        return {};

    case 1:
        return errors.front().message();

    default:
    {
        fmt::memory_buffer out;
        out.push_back('\n');
        for (auto const &err : errors)
        {
            fmt::format_to(std::back_inserter(out), FMT_STRING("* {}\n"),
                           err.message());
        }
        out.push_back('\n');
        return fmt::to_string(out);
    }
    }
}

group::group()
    : mErrors()
    , mFormatter(format_group_default)
{
}

void group::append_one(std::optional<error> const &err)
{
    if (!err)
    {
        return;
    }

    std::visit(
            [this](auto const &value)
            {
                using alternative = std::remove_cvref_t<decltype(value)>;
                if constexpr (std::is_same_v<alternative, canonical>)
                {
                    mErrors.push_back(value);
                }
                else if constexpr (std::is_same_v<alternative, group>)
                {
                    append_members(value.errors());
                }
                else if constexpr (std::is_same_v<alternative, chain>)
                {
                    // a chain views the remaining members of a group
                    append_members(value.remaining());
                }
                else
                {
                    mErrors.push_back(unknown_error().wrap(error{value}));
                }
            },
            err->value());
}

void group::append_members(std::span<canonical const> members)
{
    // members may alias mErrors if a group is appended to itself
    member_list const snapshot(members.begin(), members.end());
    mErrors.insert(mErrors.end(), snapshot.begin(), snapshot.end());
}

auto group::slice() const -> std::vector<error>
{
    std::vector<error> errs;
    errs.reserve(mErrors.size());
    for (auto const &e : mErrors)
    {
        errs.emplace_back(e);
    }
    return errs;
}

auto group::error_or_nil() const -> std::optional<error>
{
    if (mErrors.empty())
    {
        return std::nullopt;
    }
    return error{*this};
}

auto group::unwrap() const -> std::optional<error>
{
    switch (mErrors.size())
    {
    case 0:
        return std::nullopt;

    case 1:
        return error{mErrors.front()};

    default:
        return error{chain{mErrors}};
    }
}

auto group::less(std::size_t i, std::size_t j) const -> bool
{
    return mErrors[i].message() < mErrors[j].message();
}

void group::swap(std::size_t i, std::size_t j) noexcept
{
    std::swap(mErrors[i], mErrors[j]);
}

void group::sort()
{
    std::stable_sort(mErrors.begin(), mErrors.end(),
                     [](canonical const &lhs, canonical const &rhs)
                     { return lhs.message() < rhs.message(); });
}

auto group::message() const -> std::string
{
    if (!mFormatter)
    {
        return format_group_default(mErrors);
    }
    return mFormatter(mErrors);
}

void group::set_formatter(group_formatter formatter)
{
    mFormatter = std::move(formatter);
}

auto is_empty(std::optional<group> const &g) noexcept -> bool
{
    return !g || g->empty();
}

auto error_or_nil(std::optional<group> const &g) -> std::optional<error>
{
    if (!g)
    {
        return std::nullopt;
    }
    return g->error_or_nil();
}

auto unwrap(std::optional<group> const &g) -> std::optional<error>
{
    if (!g)
    {
        return std::nullopt;
    }
    return g->unwrap();
}

auto operator<<(std::ostream &s, group const &g) -> std::ostream &
{
    return s << g.message();
}
} // namespace errata
