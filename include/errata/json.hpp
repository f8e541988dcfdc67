#pragma once

#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>

#include <errata/canonical.hpp>
#include <errata/extras.hpp>
#include <errata/flags.hpp>
#include <errata/group.hpp>

namespace errata
{
// boost::json::value_from() customizations
//
// Fields at their zero value are omitted, except code, namespace and
// message. Wrapped causes and group formatters are never serialized.

//! base 2 digit string, e.g. "110"
void tag_invoke(boost::json::value_from_tag, boost::json::value &jv, flags f);
//! {delay?, links?, stack_trace?, tags?}, the delay in nanoseconds
void tag_invoke(boost::json::value_from_tag,
                boost::json::value &jv,
                extras const &x);
//! {code, namespace, message, flags?, extras?}
void tag_invoke(boost::json::value_from_tag,
                boost::json::value &jv,
                canonical const &c);
//! {errors: [...]}
void tag_invoke(boost::json::value_from_tag,
                boost::json::value &jv,
                group const &g);
} // namespace errata
