#include <errata/foreign.hpp>

#include <memory>
#include <new>
#include <string>
#include <utility>

namespace errata
{
namespace
{
class message_foreign final : public foreign_error
{
public:
    explicit message_foreign(std::string message) noexcept
        : mMessage(std::move(message))
    {
    }

    [[nodiscard]] auto message() const -> std::string override
    {
        return mMessage;
    }

private:
    std::string mMessage;
};
} // namespace

auto std_error_code_foreign::message() const -> std::string
{
    return mCode.message();
}

auto std_error_code_foreign::equivalent(
        foreign_error const &other) const noexcept -> bool
{
    if (auto const *ec = dynamic_cast<std_error_code_foreign const *>(&other))
    {
        return mCode == ec->mCode;
    }
    return false;
}

auto make_foreign_error(std::string message) -> foreign_error_ptr
{
    return std::make_shared<message_foreign const>(std::move(message));
}

auto make_foreign_error(char const *message) -> foreign_error_ptr
{
    return make_foreign_error(std::string(message != nullptr ? message : ""));
}

auto make_foreign_error(std::error_code ec) -> foreign_error_ptr
{
    return std::make_shared<std_error_code_foreign const>(ec);
}

auto make_foreign_error(std::errc ec) -> foreign_error_ptr
{
    return make_foreign_error(std::make_error_code(ec));
}

auto make_foreign_error(std::exception const &e) -> foreign_error_ptr
{
    return make_foreign_error(std::string(e.what()));
}

auto make_foreign_error(std::exception_ptr const &eptr) -> foreign_error_ptr
{
    using namespace std::string_literals;

    if (!eptr)
    {
        return make_foreign_error("<no exception>"s);
    }
    try
    {
        std::rethrow_exception(eptr);
    }
    catch (std::system_error const &e)
    {
        return make_foreign_error(e.code());
    }
    catch (std::exception const &e)
    {
        return make_foreign_error(e);
    }
    catch (...)
    {
        return make_foreign_error("<unknown exception>"s);
    }
}
} // namespace errata
