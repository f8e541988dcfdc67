#pragma once

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/logger.h>

#include <errata/error.hpp>

namespace errata::log
{
/**
 * writes one log record per failure held by err
 *
 * Classified and foreign errors produce a single record, aggregates and
 * chains produce one record per member in member order.
 */
void report(spdlog::logger &logger,
            spdlog::level::level_enum level,
            error const &err,
            error_message_format format = error_message_format::simple);
} // namespace errata::log
