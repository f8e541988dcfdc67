#include <errata/log.hpp>

#include <span>
#include <string_view>

namespace errata::log
{
namespace
{
void report_members(spdlog::logger &logger,
                    spdlog::level::level_enum level,
                    std::span<canonical const> members,
                    error_message_format format)
{
    for (auto const &member : members)
    {
        logger.log(level, "{}", member.diagnostic_information(format));
    }
}
} // namespace

void report(spdlog::logger &logger,
            spdlog::level::level_enum level,
            error const &err,
            error_message_format format)
{
    if (!logger.should_log(level))
    {
        return;
    }

    if (auto const *g = err.get_if<group>())
    {
        report_members(logger, level, g->errors(), format);
    }
    else if (auto const *cursor = err.get_if<chain>())
    {
        report_members(logger, level, cursor->remaining(), format);
    }
    else
    {
        logger.log(level, "{}", err.diagnostic_information(format));
    }
}
} // namespace errata::log
