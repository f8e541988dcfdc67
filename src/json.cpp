#include <errata/json.hpp>

#include <cstdint>
#include <string>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/string_view.hpp>
#include <boost/predef.h>

#if defined BOOST_COMP_GNUC_AVAILABLE
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Warray-bounds"
#pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#include <boost/json/src.hpp>
#if defined BOOST_COMP_GNUC_AVAILABLE
#pragma GCC diagnostic pop
#endif

namespace errata
{
namespace
{
auto json_string(std::string const &s) noexcept -> boost::json::string_view
{
    return boost::json::string_view(s.data(), s.size());
}

auto json_array(extras::string_list const &strings) -> boost::json::array
{
    boost::json::array arr;
    arr.reserve(strings.size());
    for (auto const &s : strings)
    {
        arr.emplace_back(json_string(s));
    }
    return arr;
}
} // namespace

void tag_invoke(boost::json::value_from_tag, boost::json::value &jv, flags f)
{
    auto const bits = f.to_string();
    jv.emplace_string().assign(bits.data(), bits.size());
}

void tag_invoke(boost::json::value_from_tag,
                boost::json::value &jv,
                extras const &x)
{
    auto &obj = jv.emplace_object();
    if (x.delay() != extras::duration::zero())
    {
        obj["delay"] = static_cast<std::int64_t>(x.delay().count());
    }
    if (!x.links().empty())
    {
        obj["links"] = json_array(x.links());
    }
    if (!x.stack_trace().empty())
    {
        obj["stack_trace"] = json_string(x.stack_trace());
    }
    if (!x.tags().empty())
    {
        obj["tags"] = json_array(x.tags());
    }
}

void tag_invoke(boost::json::value_from_tag,
                boost::json::value &jv,
                canonical const &c)
{
    auto &obj = jv.emplace_object();
    obj["code"] = json_string(c.code());
    obj["namespace"] = json_string(c.ns());
    obj["message"] = json_string(c.message_text());
    if (c.flags() != flags{})
    {
        obj["flags"] = boost::json::value_from(c.flags());
    }
    if (!c.extras().empty())
    {
        obj["extras"] = boost::json::value_from(c.extras());
    }
}

void tag_invoke(boost::json::value_from_tag,
                boost::json::value &jv,
                group const &g)
{
    auto &obj = jv.emplace_object();
    auto &errors = obj["errors"].emplace_array();
    errors.reserve(g.size());
    for (auto const &member : g)
    {
        errors.push_back(boost::json::value_from(member));
    }
}
} // namespace errata
