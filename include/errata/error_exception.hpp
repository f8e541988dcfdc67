#pragma once

#include <exception>
#include <string>
#include <utility>

#include <errata/error.hpp>

namespace errata
{
/**
 * carries an error through exception based code paths, e.g. when the
 * value of a failed result is accessed
 */
class error_exception final : public std::exception
{
public:
    error_exception() = delete;
    explicit error_exception(errata::error err) noexcept;

    [[nodiscard]] auto what() const noexcept -> char const * override;

    [[nodiscard]] auto error() const noexcept -> errata::error const &
    {
        return mErr;
    }

private:
    errata::error mErr;
    mutable std::string mErrDesc;
};

inline error_exception::error_exception(errata::error err) noexcept
    : mErr{std::move(err)}
    , mErrDesc{}
{
}
} // namespace errata
