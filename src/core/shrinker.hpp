/**
 * @file    shrinker.hpp
 * @brief   Per-file shrink pipeline
 * @license MIT
 *
 * @details
 * Takes one input through
 *
 *   Pending -> Resolving -> CommandBuilt -> DryPrinted | Spawned
 *           -> Succeeded | Failed | ResolutionError
 *
 * Every failure is scoped to the file being processed and reported in the
 * returned FileOutcome; nothing here throws for a bad input.
 */

#pragma once

#include "core/ghostscript_command.hpp"
#include "core/placement.hpp"
#include "core/process_executor.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace pdfshrink {

/**
 * Options shared by every file of a batch
 */
struct RunOptions {
    bool dry_run = false;   // Print the command instead of running it
    int verbosity = 0;      // -1 quiet, 0 normal, 1 debug, 2+ trace
};

/**
 * Result of processing one input file
 */
struct FileOutcome {
    std::filesystem::path input;
    std::filesystem::path output;       // Final location (input itself for in-place)
    FileState state = FileState::Pending;
    ResultCode code = ResultCode::Success;
    int engine_exit_code = 0;           // Valid for EngineNonZeroExit
    std::string command_line;           // Escaped display form, empty before CommandBuilt
    std::string message;                // Error detail
    std::uintmax_t size_before = 0;
    std::uintmax_t size_after = 0;

    bool ok() const noexcept { return state == FileState::Succeeded; }
};

class Shrinker {
public:
    /**
     * @param settings  Engine parameters
     * @param options   Dry run and verbosity
     * @param executor  Used to run the engine, must outlive the Shrinker
     */
    Shrinker(ShrinkSettings settings, RunOptions options, ProcessExecutor& executor);

    /**
     * Shrink one file according to `mode`
     *
     * In-place runs write to a temporary next to the input, which replaces
     * the original only after the engine exited successfully.
     */
    FileOutcome process(const std::filesystem::path& input, const PlacementMode& mode);

private:
    ShrinkSettings settings_;
    RunOptions options_;
    ProcessExecutor& executor_;
};

/**
 * "1.4 MiB" style size for reports
 */
std::string human_size(std::uintmax_t bytes);

}  // namespace pdfshrink
