/**
 * @file    process_executor.hpp
 * @brief   Subprocess execution seam
 * @license MIT
 *
 * @details
 * The shrinker only needs "run this argv and tell me how it ended".
 * Keeping that behind an interface lets the tests script the engine's
 * behaviour without Ghostscript installed.
 */

#pragma once

#include <string>
#include <vector>

namespace pdfshrink {

/**
 * How a subprocess ended
 */
struct ExecResult {
    bool spawned = false;   // The program could be started
    int exit_code = -1;     // Exit status (128 + signal when killed)
    int term_signal = 0;    // Terminating signal, 0 if it exited normally
    std::string error;      // Why spawning failed

    bool success() const noexcept { return spawned && exit_code == 0; }
};

class ProcessExecutor {
public:
    virtual ~ProcessExecutor() = default;

    /**
     * Run argv[0] with arguments argv[1..] and wait for it to finish
     *
     * Standard streams are inherited. No shell is involved.
     */
    virtual ExecResult run(const std::vector<std::string>& argv) = 0;
};

/**
 * fork/execvp/waitpid implementation, PATH lookup included
 */
class PosixProcessExecutor final : public ProcessExecutor {
public:
    ExecResult run(const std::vector<std::string>& argv) override;
};

}  // namespace pdfshrink
