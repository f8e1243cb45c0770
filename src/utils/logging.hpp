/**
 * @file    logging.hpp
 * @brief   One-time logger setup
 * @license MIT
 */

#pragma once

#include <spdlog/common.h>

namespace pdfshrink {

inline constexpr const char* kLoggerName = "pdfshrink";

/**
 * Map the command line verbosity to a log level
 *
 *   quiet -> err, 0 -> info, 1 -> debug, 2+ -> trace
 */
[[nodiscard]] spdlog::level::level_enum level_for(int verbose_count, bool quiet) noexcept;

/**
 * Install the colour stderr logger as spdlog's default and set its level
 *
 * Safe to call more than once; the logger is created on the first call.
 */
void init_logging(spdlog::level::level_enum level);

}  // namespace pdfshrink
