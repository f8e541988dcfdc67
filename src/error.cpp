#include <errata/error.hpp>

#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace errata
{
error::error(foreign_error_ptr value)
    : mValue(std::move(value))
{
    if (!std::get<foreign_error_ptr>(mValue))
    {
        throw std::invalid_argument(
                "errata::error cannot be constructed from a null foreign error");
    }
}

auto error::kind() const noexcept -> error_kind
{
    switch (mValue.index())
    {
    case 1:
        return error_kind::foreign;
    case 2:
        return error_kind::aggregate;
    case 3:
        return error_kind::chain;
    default:
        return error_kind::classified;
    }
}

auto error::message() const -> std::string
{
    return std::visit(
            [](auto const &value) -> std::string
            {
                using alternative = std::remove_cvref_t<decltype(value)>;
                if constexpr (std::is_same_v<alternative, foreign_error_ptr>)
                {
                    return value->message();
                }
                else
                {
                    return value.message();
                }
            },
            mValue);
}

auto error::diagnostic_information(error_message_format format) const
        -> std::string
{
    if (auto const *ce = get_if<canonical>())
    {
        return ce->diagnostic_information(format);
    }
    return message();
}

auto error::unwrap() const -> std::optional<error>
{
    return std::visit(
            [](auto const &value) -> std::optional<error>
            {
                using alternative = std::remove_cvref_t<decltype(value)>;
                if constexpr (std::is_same_v<alternative, foreign_error_ptr>)
                {
                    return std::nullopt;
                }
                else
                {
                    return value.unwrap();
                }
            },
            mValue);
}

auto error::is(error const &target) const -> bool
{
    switch (kind())
    {
    case error_kind::classified:
        return std::get<canonical>(mValue).is(target);

    case error_kind::foreign:
    {
        auto const *other = target.get_if<foreign_error_ptr>();
        auto const &self = std::get<foreign_error_ptr>(mValue);
        return other != nullptr
               && (self == *other || self->equivalent(**other));
    }

    case error_kind::aggregate:
    {
        auto const *other = target.get_if<group>();
        return other != nullptr && std::get<group>(mValue) == *other;
    }

    case error_kind::chain:
        return std::get<chain>(mValue).is(target);
    }
    return false;
}

auto operator==(error const &lhs, error const &rhs) -> bool
{
    if (lhs.kind() != rhs.kind())
    {
        return false;
    }
    if (lhs.kind() == error_kind::foreign)
    {
        auto const &l = std::get<foreign_error_ptr>(lhs.mValue);
        auto const &r = std::get<foreign_error_ptr>(rhs.mValue);
        return l == r || l->equivalent(*r);
    }
    return lhs.mValue == rhs.mValue;
}

auto unwrap(error const &err) -> std::optional<error>
{
    return err.unwrap();
}

auto is(error const &err, error const &target) -> bool
{
    for (std::optional<error> step{err}; step; step = step->unwrap())
    {
        if (step->is(target))
        {
            return true;
        }
    }
    return false;
}

auto operator<<(std::ostream &s, error const &e) -> std::ostream &
{
    return s << e.message();
}
} // namespace errata
