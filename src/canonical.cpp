#include <errata/canonical.hpp>

#include <memory>
#include <ostream>
#include <utility>

#include <fmt/format.h>

#include <errata/error.hpp>
#include <errata/foreign.hpp>
#include <errata/group.hpp>

namespace errata
{
canonical::canonical(std::string ns,
                     std::string code,
                     std::string message,
                     errata::flags flags,
                     errata::extras extras)
    : mCode(std::move(code))
    , mNamespace(std::move(ns))
    , mMessage(std::move(message))
    , mFlags(flags)
    , mExtras(std::move(extras))
    , mWrapped()
{
}

auto canonical::unwrap() const -> std::optional<error>
{
    if (!mWrapped)
    {
        return std::nullopt;
    }
    return *mWrapped;
}

auto canonical::key() const -> std::string
{
    return fmt::format(FMT_STRING("{}/{}"), mNamespace, mCode);
}

auto canonical::is_zero() const noexcept -> bool
{
    return mCode.empty() && mNamespace.empty() && mMessage.empty()
           && mFlags == errata::flags{} && mExtras.empty() && !mWrapped;
}

auto canonical::equal(canonical const &other) const noexcept -> bool
{
    return mCode == other.mCode && mMessage == other.mMessage
           && mNamespace == other.mNamespace && mFlags == other.mFlags
           && mExtras == other.mExtras;
}

auto canonical::equal(error const &other) const -> bool
{
    auto const ce = as<canonical>(other);
    return ce && equal(*ce);
}

auto canonical::is(error const &target) const -> bool
{
    return equal(target);
}

auto canonical::copy() const -> canonical
{
    if (mWrapped)
    {
        if (auto const *wrapped = mWrapped->get_if<canonical>())
        {
            return with_wrapped(std::make_shared<error const>(wrapped->copy()));
        }
    }
    return *this;
}

auto canonical::wrap(std::optional<error> const &err) const -> canonical
{
    if (!err)
    {
        return *this;
    }
    if (is_zero())
    {
        // groups and chains yield their first canonical member
        if (auto const ce = as<canonical>(*err))
        {
            return ce->copy();
        }
    }
    return with_wrapped(std::make_shared<error const>(*err));
}

auto canonical::wrap_message(std::string message) const -> canonical
{
    return wrap(error{make_foreign_error(std::move(message))});
}

auto canonical::with_extras(errata::extras extras) const -> canonical
{
    canonical updated{*this};
    updated.mExtras = std::move(extras);
    return updated;
}

auto canonical::with_flags(errata::flags bits) const -> canonical
{
    canonical updated{*this};
    updated.mFlags = mFlags.set(bits);
    return updated;
}

auto canonical::with_tags(std::initializer_list<std::string> tags) const
        -> canonical
{
    canonical updated{*this};
    updated.mExtras = mExtras.with_tags(tags);
    return updated;
}

auto canonical::with_tags(std::span<std::string const> tags) const
        -> canonical
{
    canonical updated{*this};
    updated.mExtras = mExtras.with_tags(tags);
    return updated;
}

auto canonical::with_wrapped(std::shared_ptr<error const> cause) const
        -> canonical
{
    canonical updated{*this};
    updated.mWrapped = std::move(cause);
    return updated;
}

auto canonical::as_group() const -> group
{
    auto chainGroup = make_group(*this);

    for (auto const *link = this; link->mWrapped;)
    {
        chainGroup.append(*link->mWrapped);

        link = link->mWrapped->get_if<canonical>();
        if (link == nullptr)
        {
            break;
        }
    }
    return chainGroup;
}

auto canonical::message() const -> std::string
{
    if (mWrapped)
    {
        return fmt::format(FMT_STRING("[{}:{}] {}\n-> {}"), mNamespace, mCode,
                           mMessage, mWrapped->message());
    }
    return fmt::format(FMT_STRING("[{}:{}] {}"), mNamespace, mCode, mMessage);
}

auto canonical::diagnostic_information(error_message_format format) const
        -> std::string
{
    if (format == error_message_format::with_diagnostics)
    {
        return as_group().message();
    }
    return message();
}

auto unknown_error() -> canonical const &
{
    static canonical const sInstance{std::string(default_namespace),
                                     "unknown", "wrapped error is unknown",
                                     flag_unknown};
    return sInstance;
}

auto operator<<(std::ostream &s, canonical const &c) -> std::ostream &
{
    return s << c.message();
}
} // namespace errata
