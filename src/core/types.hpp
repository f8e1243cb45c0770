/**
 * @file    types.hpp
 * @brief   Shared type definitions for PDF Shrink Tool
 * @license MIT
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pdfshrink {

// Result type for operations
enum class [[nodiscard]] ResultCode {
    Success,
    MutuallyExclusiveOptions,
    InvalidSuffix,
    InvalidDirectory,
    InputNotFound,
    NotARegularFile,
    NamingCollision,
    DirectoryCreationFailed,
    TempFileFailed,
    EngineSpawnFailed,
    EngineNonZeroExit,
    EmptyOutput,
    ReplaceFailed
};

// Convert result code to string
[[nodiscard]] constexpr const char* to_string(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::Success:                  return "Success";
        case ResultCode::MutuallyExclusiveOptions: return "Mutually exclusive options";
        case ResultCode::InvalidSuffix:            return "Invalid suffix";
        case ResultCode::InvalidDirectory:         return "Invalid directory";
        case ResultCode::InputNotFound:            return "Input not found";
        case ResultCode::NotARegularFile:          return "Not a regular file";
        case ResultCode::NamingCollision:          return "Output would overwrite input";
        case ResultCode::DirectoryCreationFailed:  return "Directory creation failed";
        case ResultCode::TempFileFailed:           return "Temporary file creation failed";
        case ResultCode::EngineSpawnFailed:        return "Engine could not be started";
        case ResultCode::EngineNonZeroExit:        return "Engine failed";
        case ResultCode::EmptyOutput:              return "Engine produced no output";
        case ResultCode::ReplaceFailed:            return "Replacing original failed";
        default:                                   return "Unknown";
    }
}

/**
 * Global configuration error (fatal, raised before any file is processed)
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(ResultCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ResultCode code() const noexcept { return code_; }

private:
    ResultCode code_;
};

/**
 * Per-file processing state
 *
 *   Pending -> Resolving -> CommandBuilt -> DryPrinted | Spawned
 *           -> Succeeded | Failed | ResolutionError
 */
enum class FileState {
    Pending,
    Resolving,
    CommandBuilt,
    DryPrinted,
    Spawned,
    Succeeded,
    Failed,
    ResolutionError
};

[[nodiscard]] constexpr const char* to_string(FileState state) noexcept {
    switch (state) {
        case FileState::Pending:         return "pending";
        case FileState::Resolving:       return "resolving";
        case FileState::CommandBuilt:    return "command-built";
        case FileState::DryPrinted:      return "dry-printed";
        case FileState::Spawned:         return "spawned";
        case FileState::Succeeded:       return "succeeded";
        case FileState::Failed:          return "failed";
        case FileState::ResolutionError: return "resolution-error";
        default:                         return "unknown";
    }
}

}  // namespace pdfshrink
