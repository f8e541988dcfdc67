#pragma once

#include <cstddef>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <errata/canonical.hpp>
#include <errata/fwd.hpp>

namespace errata
{
/**
 * cursor over the not yet visited members of an unwrapped group
 *
 * errata::is() and errata::as() expect a single error per unwrap step.
 * A chain presents a flat list of N errors as N sequential unwrap steps,
 * every step only looks at the front member and unwrap() yields a new
 * cursor advanced by one. The member list is shared and never modified.
 */
class chain final
{
public:
    using member_list = std::vector<canonical>;

    chain() noexcept = default;
    explicit chain(member_list members);

    //! number of remaining members
    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mMembers ? mMembers->size() - mOffset : 0U;
    }
    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return size() == 0U;
    }
    //! requires !empty()
    [[nodiscard]] auto front() const noexcept -> canonical const &
    {
        return (*mMembers)[mOffset];
    }

    [[nodiscard]] auto remaining() const noexcept -> std::span<canonical const>
    {
        if (!mMembers)
        {
            return {};
        }
        return std::span<canonical const>(*mMembers).subspan(mOffset);
    }

    //! message of the front member or an empty string
    [[nodiscard]] auto message() const -> std::string;
    //! empty if at most one member remains
    [[nodiscard]] auto unwrap() const -> std::optional<error>;
    [[nodiscard]] auto is(error const &target) const -> bool;
    template <typename T>
    [[nodiscard]] auto as() const -> std::optional<T>;

    friend auto operator==(chain const &lhs, chain const &rhs) noexcept
            -> bool
    {
        return lhs.mMembers == rhs.mMembers && lhs.mOffset == rhs.mOffset;
    }

private:
    chain(std::shared_ptr<member_list const> members,
          std::size_t offset) noexcept;

    std::shared_ptr<member_list const> mMembers;
    std::size_t mOffset{0U};
};
} // namespace errata
