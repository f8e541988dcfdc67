#pragma once

#include <exception>
#include <string>
#include <system_error>
#include <type_traits>

#include <errata/fwd.hpp>

namespace errata
{
/**
 * an error which wasn't produced by this library
 *
 * Foreign errors are opaque: they are only ever rendered and compared,
 * never inspected. They are shared by reference and treated as immutable.
 */
class foreign_error
{
public:
    foreign_error(foreign_error const &) = delete;
    foreign_error &operator=(foreign_error const &) = delete;
    virtual ~foreign_error() noexcept = default;

    [[nodiscard]] virtual auto message() const -> std::string = 0;

    //! object identity unless an adapter knows better
    [[nodiscard]] virtual auto equivalent(foreign_error const &other) const noexcept
            -> bool
    {
        return this == &other;
    }

protected:
    foreign_error() noexcept = default;
};
static_assert(!std::is_copy_constructible_v<foreign_error>);
static_assert(!std::is_move_constructible_v<foreign_error>);

/**
 * adapts a std::error_code; two adapters are equivalent if their codes are
 */
class std_error_code_foreign final : public foreign_error
{
public:
    explicit std_error_code_foreign(std::error_code ec) noexcept
        : mCode(ec)
    {
    }

    [[nodiscard]] auto code() const noexcept -> std::error_code
    {
        return mCode;
    }

    [[nodiscard]] auto message() const -> std::string override;
    [[nodiscard]] auto equivalent(foreign_error const &other) const noexcept
            -> bool override;

private:
    std::error_code mCode;
};

//! a plain message without any further structure
auto make_foreign_error(std::string message) -> foreign_error_ptr;
auto make_foreign_error(char const *message) -> foreign_error_ptr;
auto make_foreign_error(std::error_code ec) -> foreign_error_ptr;
auto make_foreign_error(std::errc ec) -> foreign_error_ptr;
//! captures the what() string of the exception
auto make_foreign_error(std::exception const &e) -> foreign_error_ptr;
/**
 * captures the exception currently held by the pointer, intended for
 * catch (...) boundaries, i.e. make_foreign_error(std::current_exception())
 */
auto make_foreign_error(std::exception_ptr const &eptr) -> foreign_error_ptr;
} // namespace errata
