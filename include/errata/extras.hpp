#pragma once

#include <chrono>
#include <initializer_list>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <errata/fwd.hpp>

namespace errata
{
/**
 * optional diagnostic payload attached to an error instance
 *
 * The builders leave the receiver untouched and return an updated copy.
 * Links and tags can only be appended to.
 */
class extras final
{
public:
    using duration = std::chrono::nanoseconds;
    using string_list = std::vector<std::string>;

    extras() = default;

    //! time to wait before retrying the failed operation
    [[nodiscard]] auto delay() const noexcept -> duration
    {
        return mDelay;
    }
    //! links to documentation regarding the error
    [[nodiscard]] auto links() const noexcept -> string_list const &
    {
        return mLinks;
    }
    [[nodiscard]] auto stack_trace() const noexcept -> std::string const &
    {
        return mStackTrace;
    }
    //! additional labels used to categorize errors
    [[nodiscard]] auto tags() const noexcept -> string_list const &
    {
        return mTags;
    }

    [[nodiscard]] auto empty() const noexcept -> bool
    {
        return mDelay == duration::zero() && mLinks.empty()
               && mStackTrace.empty() && mTags.empty();
    }

    [[nodiscard]] auto with_delay(duration delay) const -> extras;
    [[nodiscard]] auto with_stack_trace(std::string trace) const -> extras;

    [[nodiscard]] auto with_links(std::initializer_list<std::string> links) const
            -> extras;
    [[nodiscard]] auto with_links(std::span<std::string const> links) const
            -> extras;

    [[nodiscard]] auto with_tags(std::initializer_list<std::string> tags) const
            -> extras;
    [[nodiscard]] auto with_tags(std::span<std::string const> tags) const
            -> extras;

    friend auto operator==(extras const &lhs, extras const &rhs) -> bool
            = default;

private:
    duration mDelay{duration::zero()};
    string_list mLinks;
    std::string mStackTrace;
    string_list mTags;
};

inline auto extras::with_delay(duration delay) const -> extras
{
    extras updated{*this};
    updated.mDelay = delay;
    return updated;
}

inline auto extras::with_stack_trace(std::string trace) const -> extras
{
    extras updated{*this};
    updated.mStackTrace = std::move(trace);
    return updated;
}

inline auto extras::with_links(std::initializer_list<std::string> links) const
        -> extras
{
    return with_links(std::span<std::string const>(links.begin(), links.size()));
}

inline auto extras::with_links(std::span<std::string const> links) const
        -> extras
{
    extras updated{*this};
    updated.mLinks.insert(updated.mLinks.end(), links.begin(), links.end());
    return updated;
}

inline auto extras::with_tags(std::initializer_list<std::string> tags) const
        -> extras
{
    return with_tags(std::span<std::string const>(tags.begin(), tags.size()));
}

inline auto extras::with_tags(std::span<std::string const> tags) const
        -> extras
{
    extras updated{*this};
    updated.mTags.insert(updated.mTags.end(), tags.begin(), tags.end());
    return updated;
}
} // namespace errata
