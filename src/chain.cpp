#include <errata/chain.hpp>

#include <utility>

#include <errata/error.hpp>

namespace errata
{
chain::chain(member_list members)
    : mMembers(std::make_shared<member_list const>(std::move(members)))
    , mOffset(0U)
{
}

chain::chain(std::shared_ptr<member_list const> members,
             std::size_t offset) noexcept
    : mMembers(std::move(members))
    , mOffset(offset)
{
}

auto chain::message() const -> std::string
{
    if (empty())
    {
        return {};
    }
    return front().message();
}

auto chain::unwrap() const -> std::optional<error>
{
    if (size() <= 1U)
    {
        return std::nullopt;
    }
    return error{chain{mMembers, mOffset + 1U}};
}

auto chain::is(error const &target) const -> bool
{
    if (empty())
    {
        return false;
    }
    return errata::is(error{front()}, target);
}
} // namespace errata
