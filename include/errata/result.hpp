#pragma once

#include <utility>

#include <boost/predef.h>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(push, 3)
#pragma warning(disable : 6285)
#endif

#include <boost/outcome/bad_access.hpp>
#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/base.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#if defined BOOST_COMP_MSVC_AVAILABLE
#pragma warning(pop)
#endif

#include <errata/error.hpp>
#include <errata/error_exception.hpp>

namespace errata
{
namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace detail
{
class result_no_value_policy : public outcome::policy::base
{
public:
    //! Performs a narrow check of state, used in the assume_value()
    //! functions.
    using base::narrow_value_check;

    //! Performs a narrow check of state, used in the assume_error()
    //! functions.
    using base::narrow_error_check;

    //! Performs a wide check of state, used in the value() functions.
    template <class Impl>
    static constexpr void wide_value_check(Impl &&self)
    {
        if (!base::_has_value(self))
        {
            if (base::_has_error(self))
            {
                // moving lvalues is expected in this case.
                // NOLINTNEXTLINE(bugprone-move-forwarding-reference)
                throw error_exception(errata::error(
                        base::_error(std::forward<Impl>(self))));
            }
            throw outcome::bad_result_access("no value");
        }
    }

    //! Performs a wide check of state, used in the error() functions.
    template <class Impl>
    static constexpr void wide_error_check(Impl &&self)
    {
        if (!base::_has_error(self))
        {
            throw outcome::bad_result_access("no error");
        }
    }
};

} // namespace detail

using outcome::failure;
using outcome::success;

template <typename R, typename E = error>
using result = outcome::basic_result<R, E, detail::result_no_value_policy>;

} // namespace errata

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define ERRATA_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
