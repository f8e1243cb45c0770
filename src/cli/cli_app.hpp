/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @license MIT
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pdfshrink {
class ProcessExecutor;
}

namespace pdfshrink::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;       // At least one file failed
inline constexpr int kExitConfigError = 2;   // Nothing was processed

/**
 * Parsed command line
 */
struct CliOptions {
    std::vector<std::string> inputs;
    bool dry_run = false;
    bool inplace = false;
    bool rename = false;
    std::optional<std::string> subdir;
    std::optional<std::string> suffix;
    std::string engine;
    int verbose = 0;
    bool quiet = false;
    bool debug = false;
};

/**
 * Run the CLI application with Ghostscript as a real subprocess
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = every file succeeded)
 */
int run(int argc, char** argv);

/**
 * Run the CLI application with a caller supplied executor
 */
int run(int argc, const char* const* argv, ProcessExecutor& executor);

}  // namespace pdfshrink::cli
