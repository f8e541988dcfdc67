#pragma once

#include <cstdint>

#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <errata/fwd.hpp>

namespace errata
{
/**
 * classification bitmask attached to every canonical error
 *
 * All operations return a new value, a flags object is never modified in
 * place. Bits beyond the named ones are reserved for extension.
 */
class flags final
{
public:
    using value_type = std::uint8_t;

    constexpr flags() noexcept = default;
    constexpr explicit flags(value_type bits) noexcept
        : mValue(bits)
    {
    }

    [[nodiscard]] constexpr auto value() const noexcept -> value_type
    {
        return mValue;
    }

    //! true if any of the given bits is set
    [[nodiscard]] constexpr auto has(flags bits) const noexcept -> bool
    {
        return (mValue & bits.mValue) != 0;
    }
    [[nodiscard]] constexpr auto set(flags bits) const noexcept -> flags
    {
        return flags(static_cast<value_type>(mValue | bits.mValue));
    }
    [[nodiscard]] constexpr auto clear(flags bits) const noexcept -> flags
    {
        return flags(static_cast<value_type>(mValue & ~bits.mValue));
    }
    [[nodiscard]] constexpr auto toggle(flags bits) const noexcept -> flags
    {
        return flags(static_cast<value_type>(mValue ^ bits.mValue));
    }

    //! base 2 representation without padding, e.g. "110"
    [[nodiscard]] auto to_string() const -> std::string
    {
        return fmt::format(FMT_STRING("{:b}"), mValue);
    }

    friend constexpr auto operator==(flags lhs, flags rhs) noexcept -> bool
            = default;

    friend constexpr auto operator|(flags lhs, flags rhs) noexcept -> flags
    {
        return lhs.set(rhs);
    }

private:
    value_type mValue{0};
};

//! the error didn't originate from a known taxonomy
inline constexpr flags flag_unknown{0b001};
//! the failed operation is safe to retry
inline constexpr flags flag_retryable{0b010};
//! the failure was caused by an exceeded deadline
inline constexpr flags flag_timeout{0b100};

inline auto operator<<(std::ostream &s, flags f) -> std::ostream &
{
    return s << f.to_string();
}
} // namespace errata

namespace fmt
{
template <>
struct formatter<errata::flags> : formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(errata::flags const &f, FormatContext &ctx) const
    {
        auto const str = f.to_string();
        return formatter<std::string_view>::format(std::string_view(str), ctx);
    }
};
} // namespace fmt
