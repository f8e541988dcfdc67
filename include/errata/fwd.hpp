#pragma once

#include <memory>
#include <string_view>

namespace errata
{
class flags;
class extras;
class foreign_error;
class canonical;
class chain;
class group;
class error;
class error_exception;

using foreign_error_ptr = std::shared_ptr<foreign_error const>;

enum class error_message_format
{
    simple,
    with_diagnostics,
};

enum class error_kind
{
    classified,
    foreign,
    aggregate,
    chain,
};

//! namespace of the errors defined by this library
inline constexpr std::string_view default_namespace = "errata";
} // namespace errata
