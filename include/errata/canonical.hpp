#pragma once

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <errata/extras.hpp>
#include <errata/flags.hpp>
#include <errata/fwd.hpp>

namespace errata
{
/**
 * a known/defined application error
 *
 * A canonical error is identified by its namespace and code; the message
 * is meant for humans. Taxonomy authors define them as named sentinels and
 * specialize them per failure via wrap() and the with_*() functions, each
 * of which returns a new value, a canonical is never modified after
 * construction.
 *
 * The wrapped cause is excluded from equality: two errors of the same kind
 * compare equal regardless of their causes.
 *
 * errata::error is only forward declared here; wrap(), unwrap() and the
 * equal()/is() overloads taking an error need <errata/error.hpp> or the
 * umbrella header <errata/errata.hpp>.
 */
class canonical final
{
public:
    canonical() = default;
    canonical(std::string ns,
              std::string code,
              std::string message,
              errata::flags flags = {},
              errata::extras extras = {});

    //! machine-readable identifier of the error, unique within a namespace
    [[nodiscard]] auto code() const noexcept -> std::string const &
    {
        return mCode;
    }
    //! bucket of errors, commonly the producing package/service
    [[nodiscard]] auto ns() const noexcept -> std::string const &
    {
        return mNamespace;
    }
    //! human-readable description without the namespace/code prefix
    [[nodiscard]] auto message_text() const noexcept -> std::string const &
    {
        return mMessage;
    }
    [[nodiscard]] auto flags() const noexcept -> errata::flags
    {
        return mFlags;
    }
    [[nodiscard]] auto extras() const noexcept -> errata::extras const &
    {
        return mExtras;
    }
    //! the cause or nullptr
    [[nodiscard]] auto wrapped() const noexcept -> error const *
    {
        return mWrapped.get();
    }
    [[nodiscard]] auto unwrap() const -> std::optional<error>;

    //! namespace + "/" + code
    [[nodiscard]] auto key() const -> std::string;
    [[nodiscard]] auto is_zero() const noexcept -> bool;

    [[nodiscard]] auto equal(canonical const &other) const noexcept -> bool;
    [[nodiscard]] auto equal(error const &other) const -> bool;
    //! identity hook used by errata::is()
    [[nodiscard]] auto is(error const &target) const -> bool;

    //! deep copy of the error and every canonical error in its cause chain
    [[nodiscard]] auto copy() const -> canonical;

    /**
     * returns a copy of this error with the given cause
     *
     * Returns *this if err is empty. If *this is the zero value and err
     * holds a canonical error, a copy of the latter is returned instead,
     * therefore call sites can wrap any error without checking whether it
     * is already classified.
     */
    [[nodiscard]] auto wrap(std::optional<error> const &err) const
            -> canonical;
    //! wraps a foreign error with the formatted message
    template <typename... Args>
    [[nodiscard]] auto wrapf(fmt::format_string<Args...> format,
                             Args &&...args) const -> canonical;

    [[nodiscard]] auto with_extras(errata::extras extras) const -> canonical;
    //! the given bits are merged into the existing ones
    [[nodiscard]] auto with_flags(errata::flags bits) const -> canonical;
    [[nodiscard]] auto with_tags(std::initializer_list<std::string> tags) const
            -> canonical;
    [[nodiscard]] auto with_tags(std::span<std::string const> tags) const
            -> canonical;

    //! this error followed by each error of its cause chain
    [[nodiscard]] auto as_group() const -> group;

    //! "[ns:code] message", followed by "\n-> <cause>" if there is one
    [[nodiscard]] auto message() const -> std::string;
    [[nodiscard]] auto diagnostic_information(error_message_format format) const
            -> std::string;

    [[nodiscard]] auto is_retryable() const noexcept -> bool
    {
        return mFlags.has(flag_retryable);
    }
    [[nodiscard]] auto is_timeout() const noexcept -> bool
    {
        return mFlags.has(flag_timeout);
    }
    // tests the unknown bit, there is no dedicated transient bit
    [[nodiscard]] auto is_transient() const noexcept -> bool
    {
        return mFlags.has(flag_unknown);
    }

    friend auto operator==(canonical const &lhs, canonical const &rhs) noexcept
            -> bool
    {
        return lhs.equal(rhs);
    }

private:
    [[nodiscard]] auto with_wrapped(std::shared_ptr<error const> cause) const
            -> canonical;
    [[nodiscard]] auto wrap_message(std::string message) const -> canonical;

    std::string mCode;
    std::string mNamespace;
    std::string mMessage;
    errata::flags mFlags;
    errata::extras mExtras;
    std::shared_ptr<error const> mWrapped;
};

template <typename... Args>
inline auto canonical::wrapf(fmt::format_string<Args...> format,
                             Args &&...args) const -> canonical
{
    return wrap_message(fmt::format(format, std::forward<Args>(args)...));
}

//! "[errata:unknown] wrapped error is unknown", used for foreign errors
auto unknown_error() -> canonical const &;

auto operator<<(std::ostream &s, canonical const &c) -> std::ostream &;
} // namespace errata

namespace fmt
{
/**
 * {} / {:!v} single line, {:q} quoted single line, {:v} whole cause chain
 */
template <>
struct formatter<errata::canonical>
{
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin())
    {
        constexpr auto errfmt = "invalid canonical error format";

        auto it = ctx.begin();
        auto const end = ctx.end();
        if (it == end || *it == '}')
        {
            return it;
        }
        switch (*it)
        {
        case '!':
            if (++it == end || *it != 'v')
            {
                ctx.on_error(errfmt);
            }
            error_format = errata::error_message_format::simple;
            break;

        case 'v':
            error_format = errata::error_message_format::with_diagnostics;
            break;

        case 'q':
            quoted = true;
            break;

        default:
            ctx.on_error(errfmt);
            break;
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
    auto format(errata::canonical const &c, FormatContext &ctx) const
            -> decltype(ctx.out())
    {
        auto const str = c.diagnostic_information(error_format);
        if (quoted)
        {
            return fmt::format_to(ctx.out(), FMT_STRING("{:?}"), str);
        }
        return std::copy(str.cbegin(), str.cend(), ctx.out());
    }

    errata::error_message_format error_format
            = errata::error_message_format::simple;
    bool quoted = false;
};
} // namespace fmt
