/**
 * @file ProcessRunner.hpp
 * @brief Blocking child-process execution with captured output and resource limits.
 */

#pragma once

#include "domain/CancellationToken.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace codeshift::infrastructure {

/**
 * @struct ProcessLimits
 * @brief Caps applied to the child. Zero values mean "no limit".
 */
struct ProcessLimits {
    std::chrono::milliseconds timeout{0};
    int cpuSeconds = 0;
    int memoryMb = 0;
    int fileSizeMb = 0;
    bool isolateNetwork = false; ///< New network namespace (Linux, needs privileges).
};

struct ProcessOptions {
    std::filesystem::path workingDir; ///< Empty keeps the current directory.
    bool captureStdout = true;        ///< False lets the child inherit our stdout.
    ProcessLimits limits;
};

struct ProcessResult {
    int exitCode = -1;       ///< Exit status, or 128 + signal when killed by a signal.
    std::string stdoutText;
    std::string stderrText;
    bool timedOut = false;
    bool cancelled = false;
};

/**
 * @class ProcessRunner
 * @brief Forks and execs argv, waiting for the child to exit.
 *
 * stdin is /dev/null. The child runs in its own process group so that a
 * deadline or cancellation kills the whole tree (e.g. the compiler driver and
 * its backends).
 */
class ProcessRunner {
public:
    explicit ProcessRunner(domain::CancellationToken cancel = {});

    /**
     * @brief Runs @p args[0] (looked up on PATH) with the remaining arguments.
     * @throws std::runtime_error when pipes or the fork cannot be created.
     */
    ProcessResult run(const std::vector<std::string>& args, const ProcessOptions& options = {}) const;

private:
    domain::CancellationToken m_cancel;
};

} // namespace codeshift::infrastructure
