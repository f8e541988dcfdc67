#pragma once

#include <optional>
#include <utility>

#include <errata/canonical.hpp>
#include <errata/chain.hpp>
#include <errata/error.hpp>
#include <errata/error_exception.hpp>
#include <errata/extras.hpp>
#include <errata/flags.hpp>
#include <errata/foreign.hpp>
#include <errata/fwd.hpp>
#include <errata/group.hpp>
#include <errata/result.hpp>

namespace errata
{
/**
 * joins one or more errors into a group
 *
 * If err already holds a group, errs are appended to a copy of it,
 * otherwise a new group is started with err. Groups within errs are
 * flattened and empty arguments are skipped.
 */
template <typename... Errors>
inline auto join(std::optional<error> const &err, Errors &&...errs) -> group
{
    group joined;
    if (auto const *g = err ? err->get_if<group>() : nullptr)
    {
        joined = *g;
    }
    else
    {
        joined.append(err);
    }
    joined.append(std::forward<Errors>(errs)...);
    return joined;
}
} // namespace errata
