#include <errata/group.hpp>
#include "boost-unit-test.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <errata/errata.hpp>

#include "test-utils.hpp"

BOOST_AUTO_TEST_SUITE(group_tests)

using errata::canonical;
using errata::error;
using errata::error_kind;
using errata::group;
using errata::make_group;
using errata_tests::conflict;
using errata_tests::deadline;
using errata_tests::not_found;

namespace
{
auto messages_of(group const &g) -> std::vector<std::string>
{
    std::vector<std::string> messages;
    for (auto const &member : g)
    {
        messages.push_back(member.message());
    }
    return messages;
}
} // namespace

BOOST_AUTO_TEST_CASE(new_group_is_empty)
{
    group const g;

    BOOST_TEST(g.empty());
    BOOST_TEST(g.size() == 0u);
    BOOST_TEST(g.message().empty());
    BOOST_TEST(!g.error_or_nil().has_value());
    BOOST_TEST(!g.unwrap().has_value());
}

BOOST_AUTO_TEST_CASE(append_keeps_order)
{
    group g;
    g.append(not_found);
    g.append(conflict, deadline);

    BOOST_TEST(g.size() == 3u);
    BOOST_TEST(g.errors()[0] == not_found);
    BOOST_TEST(g.errors()[1] == conflict);
    BOOST_TEST(g.errors()[2] == deadline);
}

BOOST_AUTO_TEST_CASE(append_skips_empty_arguments)
{
    group g;
    g.append(std::nullopt, not_found, std::optional<error>{});

    BOOST_TEST(g.size() == 1u);
}

BOOST_AUTO_TEST_CASE(append_wraps_foreign_errors_with_unknown)
{
    auto const cause = errata::make_foreign_error("disk full");
    auto const g = make_group(cause);

    BOOST_TEST_REQUIRE(g.size() == 1u);
    auto const &member = g.errors().front();
    BOOST_TEST(member == errata::unknown_error());
    BOOST_TEST(member.is_transient());
    BOOST_TEST_REQUIRE(member.wrapped() != nullptr);
    BOOST_TEST(member.wrapped()->get_if<errata::foreign_error_ptr>()->get()
               == cause.get());
    BOOST_TEST(member.message()
               == "[errata:unknown] wrapped error is unknown\n-> disk full");
}

BOOST_AUTO_TEST_CASE(append_flattens_nested_groups)
{
    auto const inner = make_group(conflict, deadline);
    auto const middle = make_group(not_found, inner);
    auto const outer = make_group(middle, errata::make_foreign_error("x"));

    BOOST_TEST_REQUIRE(outer.size() == 4u);
    BOOST_TEST(outer.errors()[0] == not_found);
    BOOST_TEST(outer.errors()[1] == conflict);
    BOOST_TEST(outer.errors()[2] == deadline);
    BOOST_TEST(outer.errors()[3] == errata::unknown_error());

    // a group held by an error is flattened as well
    auto const viaError = make_group(error{inner});
    BOOST_TEST(viaError.size() == 2u);
}

BOOST_AUTO_TEST_CASE(append_flattens_the_remaining_chain_members)
{
    auto const g = make_group(not_found, conflict, deadline);
    auto const cursor = g.unwrap()->get_if<errata::chain>()->unwrap();

    auto const flattened = make_group(*cursor);

    BOOST_TEST_REQUIRE(flattened.size() == 2u);
    BOOST_TEST(flattened.errors()[0] == conflict);
    BOOST_TEST(flattened.errors()[1] == deadline);
}

BOOST_AUTO_TEST_CASE(append_to_self_duplicates_the_members)
{
    auto g = make_group(not_found, conflict);
    g.append(g);

    std::vector<std::string> const expected{
            not_found.message(), conflict.message(), not_found.message(),
            conflict.message()};
    BOOST_TEST(messages_of(g) == expected);
}

BOOST_AUTO_TEST_CASE(error_or_nil)
{
    auto const g = make_group(not_found);

    auto const e = g.error_or_nil();
    BOOST_TEST_REQUIRE(e.has_value());
    BOOST_TEST(e->kind() == error_kind::aggregate);
    BOOST_TEST(*e->get_if<group>() == g);
}

BOOST_AUTO_TEST_CASE(absent_group_behaves_like_an_empty_one)
{
    std::optional<group> const absent;

    BOOST_TEST(errata::is_empty(absent));
    BOOST_TEST(!errata::error_or_nil(absent).has_value());
    BOOST_TEST(!errata::unwrap(absent).has_value());

    std::optional<group> const present{make_group(not_found)};
    BOOST_TEST(!errata::is_empty(present));
    BOOST_TEST(errata::error_or_nil(present).has_value());
    BOOST_TEST(errata::is_empty(std::optional<group>{group{}}));
}

BOOST_AUTO_TEST_CASE(slice_lists_the_members_as_errors)
{
    auto const errs = make_group(not_found, conflict).slice();

    BOOST_TEST_REQUIRE(errs.size() == 2u);
    BOOST_TEST(errs[0] == error{not_found});
    BOOST_TEST(errs[1] == error{conflict});
    BOOST_TEST(errs[1].kind() == error_kind::classified);
}

BOOST_AUTO_TEST_CASE(unwrap_single_member)
{
    auto const next = make_group(not_found.wrapf("io")).unwrap();

    BOOST_TEST_REQUIRE(next.has_value());
    BOOST_TEST(next->kind() == error_kind::classified);
    BOOST_TEST(next->message() == "[svc:not-found] missing\n-> io");
}

BOOST_AUTO_TEST_CASE(unwrap_multiple_members_is_a_snapshot)
{
    auto g = make_group(not_found, conflict);
    auto const next = g.unwrap();
    g.append(deadline);

    BOOST_TEST_REQUIRE(next.has_value());
    auto const *cursor = next->get_if<errata::chain>();
    BOOST_TEST_REQUIRE(cursor != nullptr);
    BOOST_TEST(cursor->size() == 2u);
    BOOST_TEST(cursor->front() == not_found);
}

BOOST_AUTO_TEST_CASE(default_formatter)
{
    BOOST_TEST(errata::format_group_default({}).empty());
    BOOST_TEST(make_group(not_found).message() == "[svc:not-found] missing");
    BOOST_TEST(make_group(canonical{"t", "a", "a"}, canonical{"t", "b", "b"})
                       .message()
               == "\n* [t:a] a\n* [t:b] b\n\n");
}

BOOST_AUTO_TEST_CASE(custom_formatter)
{
    auto g = make_group(not_found, conflict);
    g.set_formatter(
            [](std::span<canonical const> errors)
            { return fmt::format("{} errors", errors.size()); });

    BOOST_TEST(g.message() == "2 errors");
    BOOST_TEST(fmt::format("{}", g) == "2 errors");
    BOOST_TEST(error{g}.message() == "2 errors");
}

BOOST_AUTO_TEST_CASE(cleared_formatter_falls_back_to_the_default)
{
    auto g = make_group(not_found);
    g.set_formatter(nullptr);

    BOOST_TEST(g.message() == not_found.message());
}

BOOST_AUTO_TEST_CASE(less_and_swap)
{
    auto g = make_group(canonical{"t", "b", "b"}, canonical{"t", "a", "a"});

    BOOST_TEST(!g.less(0, 1));
    BOOST_TEST(g.less(1, 0));

    g.swap(0, 1);
    BOOST_TEST(g.errors()[0].code() == "a");
    BOOST_TEST(g.less(0, 1));
}

BOOST_AUTO_TEST_CASE(sort_orders_by_message)
{
    auto g = make_group(canonical{"t", "c", "c"}, canonical{"t", "a", "a"},
                        canonical{"t", "b", "b"});
    g.sort();

    std::vector<std::string> const expected{"[t:a] a", "[t:b] b", "[t:c] c"};
    BOOST_TEST(messages_of(g) == expected);
}

BOOST_AUTO_TEST_CASE(groups_compare_member_wise)
{
    BOOST_TEST(make_group(not_found, conflict) == make_group(not_found, conflict));
    BOOST_TEST(!(make_group(not_found) == make_group(not_found, conflict)));
    BOOST_TEST(group{} == group{});
}

BOOST_AUTO_TEST_SUITE_END()
