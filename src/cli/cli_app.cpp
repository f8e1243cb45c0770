/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for PDF Shrink Tool.
 * Every input is shrunk independently; one bad file never stops the batch.
 *
 * Usage:
 *   pdfshrink scan.pdf                  (scan.shrunk.pdf)
 *   pdfshrink -i scan.pdf               (replace scan.pdf)
 *   pdfshrink -d small a.pdf b.pdf      (small/a.pdf, small/b.pdf)
 *   pdfshrink -n scan.pdf               (print the gs command only)
 */

#include "cli/cli_app.hpp"
#include "core/ghostscript_command.hpp"
#include "core/placement.hpp"
#include "core/process_executor.hpp"
#include "core/shrinker.hpp"
#include "utils/logging.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <fmt/ranges.h>

#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#ifndef PDFSHRINK_VERSION
#define PDFSHRINK_VERSION "0.2.0"
#endif

namespace fs = std::filesystem;

namespace pdfshrink::cli {

namespace {

// =============================================================================
// Option definitions
// =============================================================================

void configure_app(CLI::App& app, CliOptions& options) {
    app.footer("\nThe options --inplace, --rename and --subdir are mutually exclusive.");
    app.set_version_flag("-V,--version", PDFSHRINK_VERSION);

    app.add_option("INPUT", options.inputs, "Input PDF files to shrink")
        ->required();

    app.add_flag("-n,--dry-run", options.dry_run,
        "Do not actually run the commands, just show them");

    // Output placement
    app.add_flag("-i,--inplace", options.inplace, "Replace the original file");
    app.add_flag("-r,--rename", options.rename,
        "Save the output to a renamed file: *.pdf -> *.shrunk.pdf (default)");
    app.add_option("-d,--subdir", options.subdir, "Save the output in a subdirectory")
        ->type_name("DIR");
    app.add_option("-s,--suffix", options.suffix, "Tag inserted by --rename (default: shrunk)")
        ->type_name("TAG");

    // Engine
    options.engine = kDefaultEngine;
    app.add_option("--gs", options.engine, "Ghostscript executable")
        ->envname("PDFSHRINK_GS")
        ->capture_default_str();

    // Verbosity
    auto* verbose = app.add_flag("-v,--verbose", options.verbose,
        "Increase the level of verbosity (repeatable)");
    app.add_flag("-q,--quiet", options.quiet, "Suppress all output except errors")
        ->excludes(verbose);

    app.add_flag("--debug", options.debug, "Debug the command line")
        ->group("");
}

void dump_options(const CliOptions& options) {
    fmt::print(stderr, "inputs  : [{}]\n", fmt::join(options.inputs, ", "));
    fmt::print(stderr, "dry-run : {}\n", options.dry_run);
    fmt::print(stderr, "inplace : {}\n", options.inplace);
    fmt::print(stderr, "rename  : {}\n", options.rename);
    fmt::print(stderr, "subdir  : {}\n", options.subdir.value_or("<none>"));
    fmt::print(stderr, "suffix  : {}\n", options.suffix.value_or("<none>"));
    fmt::print(stderr, "gs      : {}\n", options.engine);
    fmt::print(stderr, "verbose : {}\n", options.verbose);
    fmt::print(stderr, "quiet   : {}\n", options.quiet);
    fmt::print(stderr, "---\n");
}

// =============================================================================
// Batch bookkeeping
// =============================================================================

struct BatchResult {
    int success = 0;
    std::vector<FileOutcome> failures;

    void add(FileOutcome outcome) {
        if (outcome.ok()) {
            success++;
        } else {
            failures.push_back(std::move(outcome));
        }
    }

    int fail() const { return static_cast<int>(failures.size()); }

    void print(bool quiet) const {
        if (!quiet && success + fail() > 1) {
            fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", success);
            if (fail() > 0) {
                fmt::print(fmt::fg(fmt::color::red), ", {} failed", fail());
            }
            fmt::print("\n");
        }
        std::fflush(stdout);

        if (failures.empty()) {
            return;
        }
        fmt::print(stderr, fmt::fg(fmt::color::red), "[FAILED] {} file(s):\n", fail());
        for (const auto& f : failures) {
            if (f.code == ResultCode::EngineNonZeroExit) {
                fmt::print(stderr, "  {}: {} (exit code {})\n", f.input, to_string(f.code), f.engine_exit_code);
            } else {
                fmt::print(stderr, "  {}: {}\n", f.input, to_string(f.code));
            }
        }
    }
};

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    PosixProcessExecutor executor;
    return run(argc, argv, executor);
}

int run(int argc, const char* const* argv, ProcessExecutor& executor) {
    CLI::App app{"PDF Shrink Tool - Shrink PDF files using Ghostscript"};
    app.name("pdfshrink");

    CliOptions options;
    configure_app(app, options);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    init_logging(level_for(options.verbose, options.quiet));

    if (options.debug) {
        dump_options(options);
    }

    // Placement flags are checked before any file is touched
    PlacementMode mode;
    try {
        mode = placement_from_flags(options.inplace, options.rename, options.subdir, options.suffix);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return kExitConfigError;
    }

    if (!options.inplace && !options.rename && !options.subdir) {
        spdlog::debug("No output mode specified, defaulting to --rename");
    }
    spdlog::debug("Output mode: {}", mode_name(mode));

    ShrinkSettings settings;
    settings.engine = options.engine;

    RunOptions run_options;
    run_options.dry_run = options.dry_run;
    run_options.verbosity = options.quiet ? -1 : options.verbose;

    try {
        Shrinker shrinker(settings, run_options, executor);
        BatchResult result;

        for (const auto& input : options.inputs) {
            spdlog::debug("Processing {}", input);
            result.add(shrinker.process(fs::path(input), mode));
        }

        result.print(options.quiet);
        return (result.fail() > 0) ? kExitFailure : kExitOk;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailure;
    }
}

}  // namespace pdfshrink::cli
