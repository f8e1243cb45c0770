/**
 * @file    logging.cpp
 * @brief   One-time logger setup
 * @license MIT
 *
 * @details
 * Log lines go to stderr so that stdout only carries dry-run command
 * lines and results, which keeps `pdfshrink -n a.pdf > cmds.sh` usable.
 */

#include "utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pdfshrink {

spdlog::level::level_enum level_for(int verbose_count, bool quiet) noexcept {
    if (quiet) {
        return spdlog::level::err;
    }
    if (verbose_count >= 2) {
        return spdlog::level::trace;
    }
    if (verbose_count == 1) {
        return spdlog::level::debug;
    }
    return spdlog::level::info;
}

void init_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%^%5l%$] %v");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

}  // namespace pdfshrink
