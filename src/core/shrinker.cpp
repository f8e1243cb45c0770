/**
 * @file    shrinker.cpp
 * @brief   Per-file shrink pipeline
 * @license MIT
 */

#include "core/shrinker.hpp"
#include "utils/path_formatter.hpp"
#include "utils/temp_file.hpp"

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <optional>
#include <system_error>
#include <utility>
#include <variant>

namespace fs = std::filesystem;

namespace pdfshrink {

namespace {

// Length of ".tmp" after the XXXXXX of the in-place pattern
constexpr int kTempSuffixLen = 4;

void advance(FileOutcome& outcome, FileState next) {
    spdlog::trace("{}: {} -> {}", outcome.input, to_string(outcome.state), to_string(next));
    outcome.state = next;
}

FileOutcome& finish(FileOutcome& outcome, FileState state, ResultCode code, std::string message = {}) {
    advance(outcome, state);
    outcome.code = code;
    outcome.message = std::move(message);
    if (state != FileState::Succeeded) {
        spdlog::error("{}: {}", outcome.input, outcome.message.empty() ? to_string(code) : outcome.message);
    }
    return outcome;
}

std::uintmax_t size_or_zero(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

bool ensure_directory(const fs::path& dir, std::error_code& ec) {
    ec.clear();
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    if (fs::create_directories(dir, ec)) {
        spdlog::debug("Created directory {}", dir);
        return true;
    }
    // create_directories reports false without an error if it already exists
    return !ec && fs::is_directory(dir, ec);
}

// Drop what a failed engine run left behind, unless it was there before
void remove_partial(const fs::path& output, bool existed_before) {
    if (existed_before) {
        spdlog::warn("{} may have been partially overwritten", output);
        return;
    }
    std::error_code ec;
    if (fs::remove(output, ec)) {
        spdlog::debug("Removed partial output {}", output);
    } else if (ec) {
        spdlog::warn("Cannot remove partial output {}: {}", output, ec.message());
    }
}

}  // anonymous namespace

std::string human_size(std::uintmax_t bytes) {
    constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

Shrinker::Shrinker(ShrinkSettings settings, RunOptions options, ProcessExecutor& executor)
    : settings_(std::move(settings)), options_(options), executor_(executor) {}

FileOutcome Shrinker::process(const fs::path& input, const PlacementMode& mode) {
    FileOutcome outcome;
    outcome.input = input;

    // =========================================================================
    // Resolve
    // =========================================================================
    advance(outcome, FileState::Resolving);

    std::error_code ec;
    auto status = fs::status(input, ec);
    if (!fs::exists(status)) {
        return finish(outcome, FileState::ResolutionError, ResultCode::InputNotFound,
                      fmt::format("File not found: {}", input));
    }
    if (!fs::is_regular_file(status)) {
        return finish(outcome, FileState::ResolutionError, ResultCode::NotARegularFile,
                      fmt::format("Skipping {}: not a regular file", input));
    }

    Resolution resolution = resolve_output(input, mode);
    if (!resolution.ok()) {
        return finish(outcome, FileState::ResolutionError, resolution.code, resolution.message);
    }
    outcome.output = resolution.output;

    const bool inplace = std::holds_alternative<InPlace>(mode);

    // In-place replaces the file behind a symlink, not the link itself
    fs::path replace_target = input;
    if (inplace) {
        fs::path canonical = fs::canonical(input, ec);
        if (!ec) {
            replace_target = canonical;
        }
    }

    if (const auto* subdir = std::get_if<Subdir>(&mode); subdir && !options_.dry_run) {
        if (!ensure_directory(subdir->dir, ec)) {
            return finish(outcome, FileState::ResolutionError, ResultCode::DirectoryCreationFailed,
                          fmt::format("Cannot create {}: {}", subdir->dir,
                                      ec ? ec.message() : "not a directory"));
        }
    }

    // Catches a subdir symlinked to the input's directory and hard links
    if (!inplace) {
        std::error_code alias_ec;
        if (fs::exists(outcome.output, alias_ec) && fs::equivalent(outcome.output, input, alias_ec)) {
            return finish(outcome, FileState::ResolutionError, ResultCode::NamingCollision,
                          fmt::format("{} is the same file as {}", outcome.output, input));
        }
    }

    // =========================================================================
    // Build
    // =========================================================================
    std::optional<TempFile> temp;
    fs::path engine_output = outcome.output;

    if (inplace) {
        fs::path pattern = inplace_temp_pattern(replace_target);
        if (options_.dry_run) {
            engine_output = pattern;
        } else {
            temp = TempFile::create(pattern, kTempSuffixLen, ec);
            if (!temp) {
                return finish(outcome, FileState::Failed, ResultCode::TempFileFailed,
                              fmt::format("Cannot create temporary file next to {}: {}",
                                          replace_target, ec.message()));
            }
            engine_output = temp->path();
        }
    }

    const auto argv = build_command(settings_, input, engine_output);
    outcome.command_line = format_command_line(argv);
    advance(outcome, FileState::CommandBuilt);

    spdlog::info("Compressing {} -> {}", input, outcome.output);
    spdlog::debug("{}", outcome.command_line);

    if (options_.dry_run) {
        fmt::print("{}\n", outcome.command_line);
        std::fflush(stdout);
        advance(outcome, FileState::DryPrinted);
        return finish(outcome, FileState::Succeeded, ResultCode::Success);
    }

    // =========================================================================
    // Run
    // =========================================================================
    outcome.size_before = size_or_zero(input);
    std::error_code exists_ec;
    const bool output_existed = !inplace && fs::exists(outcome.output, exists_ec);
    if (exists_ec) {
        spdlog::debug("Cannot stat {}: {}", outcome.output, exists_ec.message());
    }

    advance(outcome, FileState::Spawned);
    ExecResult exec = executor_.run(argv);

    if (!exec.spawned) {
        if (!inplace) {
            remove_partial(outcome.output, output_existed);
        }
        return finish(outcome, FileState::Failed, ResultCode::EngineSpawnFailed, exec.error);
    }

    if (exec.exit_code != 0) {
        outcome.engine_exit_code = exec.exit_code;
        if (!inplace) {
            remove_partial(outcome.output, output_existed);
        }
        std::string message = exec.term_signal != 0
            ? fmt::format("{} killed by signal {}", settings_.engine, exec.term_signal)
            : fmt::format("{} exited with status {}", settings_.engine, exec.exit_code);
        if (inplace) {
            message += ", original left untouched";
        }
        return finish(outcome, FileState::Failed, ResultCode::EngineNonZeroExit, std::move(message));
    }

    if (inplace) {
        outcome.size_after = size_or_zero(temp->path());
        if (outcome.size_after == 0) {
            return finish(outcome, FileState::Failed, ResultCode::ReplaceFailed,
                          fmt::format("{} left {} empty, original left untouched",
                                      settings_.engine, temp->path()));
        }
        if (!temp->commit(replace_target, ec)) {
            return finish(outcome, FileState::Failed, ResultCode::ReplaceFailed,
                          fmt::format("Cannot replace {}: {}", replace_target, ec.message()));
        }
    } else {
        outcome.size_after = size_or_zero(outcome.output);
        if (outcome.size_after == 0) {
            remove_partial(outcome.output, output_existed);
            return finish(outcome, FileState::Failed, ResultCode::EmptyOutput,
                          fmt::format("{} exited successfully but {} is missing or empty",
                                      settings_.engine, outcome.output));
        }
    }

    finish(outcome, FileState::Succeeded, ResultCode::Success);

    if (options_.verbosity >= 0) {
        const double ratio = outcome.size_before > 0
            ? 100.0 * static_cast<double>(outcome.size_after) / static_cast<double>(outcome.size_before)
            : 100.0;
        fmt::print(fmt::fg(fmt::color::green), "[OK] {} -> {} ({} -> {}, {:.0f}%)\n",
                   input, outcome.output,
                   human_size(outcome.size_before), human_size(outcome.size_after), ratio);
    }
    return outcome;
}

}  // namespace pdfshrink
