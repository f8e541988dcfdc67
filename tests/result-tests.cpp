#include <errata/result.hpp>
#include "boost-unit-test.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <errata/errata.hpp>

#include "test-utils.hpp"

BOOST_AUTO_TEST_SUITE(result_tests)

using errata::error;
using errata::error_exception;
using errata::result;
using errata_tests::conflict;
using errata_tests::not_found;

namespace
{
auto parse_digit(char c) -> result<int>
{
    if (c < '0' || c > '9')
    {
        return error{not_found.wrapf("'{}' is not a digit", c)};
    }
    return c - '0';
}

auto parse_pair(std::string_view s) -> result<int>
{
    if (s.size() != 2)
    {
        return error{conflict};
    }
    ERRATA_TRY(tens, parse_digit(s[0]));
    ERRATA_TRY(ones, parse_digit(s[1]));
    return tens * 10 + ones;
}

class unrenderable_foreign final : public errata::foreign_error
{
public:
    [[nodiscard]] auto message() const -> std::string override
    {
        throw 42;
    }
};

auto check_pair(std::string_view s) -> result<void>
{
    ERRATA_TRY(parse_pair(s));
    return errata::success();
}
} // namespace

BOOST_AUTO_TEST_CASE(success_holds_the_value)
{
    auto const rx = parse_pair("42");

    BOOST_TEST_REQUIRE(rx.has_value());
    BOOST_TEST(rx.value() == 42);
    BOOST_TEST(check_pair("42").has_value());
}

BOOST_AUTO_TEST_CASE(try_propagates_the_error)
{
    auto const rx = parse_pair("4x");

    BOOST_TEST_REQUIRE(rx.has_error());
    BOOST_TEST(errata::is(rx.error(), error{not_found}));
    BOOST_TEST(rx.error().message()
               == "[svc:not-found] missing\n-> 'x' is not a digit");

    auto const vrx = check_pair("123");
    BOOST_TEST_REQUIRE(vrx.has_error());
    BOOST_TEST(vrx.error() == error{conflict});
}

BOOST_AUTO_TEST_CASE(value_of_a_failure_throws_error_exception)
{
    auto const rx = parse_pair("x1");

    BOOST_CHECK_THROW((void)rx.value(), error_exception);
    try
    {
        (void)rx.value();
    }
    catch (error_exception const &exc)
    {
        BOOST_TEST(exc.error() == rx.error());
        BOOST_TEST(std::string(exc.what())
                   == rx.error().diagnostic_information(
                           errata::error_message_format::with_diagnostics));
    }
}

BOOST_AUTO_TEST_CASE(error_of_a_success_throws_bad_result_access)
{
    auto const rx = parse_pair("10");

    BOOST_CHECK_THROW((void)rx.error(), errata::outcome::bad_result_access);
}

BOOST_AUTO_TEST_CASE(failure_helper)
{
    result<int> const rx = errata::failure(error{conflict});

    BOOST_TEST(rx.has_error());
    BOOST_TEST(rx.error() == error{conflict});
}

BOOST_AUTO_TEST_CASE(error_exception_describes_the_whole_chain)
{
    error_exception const exc{error{conflict.wrap(not_found)}};

    BOOST_TEST(std::string(exc.what())
               == conflict.wrap(not_found).as_group().message());
    // the description is cached
    BOOST_TEST(static_cast<void const *>(exc.what())
               == static_cast<void const *>(exc.what()));
}

BOOST_AUTO_TEST_CASE(error_exception_what_survives_any_rendering_failure)
{
    errata::foreign_error_ptr const cause
            = std::make_shared<unrenderable_foreign const>();
    error_exception const exc{error{not_found.wrap(cause)}};

    BOOST_TEST(std::string(exc.what())
               == "<error_exception|failed to retrieve the diagnostic "
                  "information from the error>");
}

BOOST_AUTO_TEST_SUITE_END()
