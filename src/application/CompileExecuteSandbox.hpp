/**
 * @file CompileExecuteSandbox.hpp
 * @brief Builds a persisted artifact with the native toolchain and runs the binary.
 */

#pragma once

#include "domain/Conversion.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codeshift::application {

/**
 * @struct ToolchainSettings
 * @brief Compiler location and where the binary is produced and run.
 */
struct ToolchainSettings {
    std::string compiler = "c++";
    std::string binaryName = "optimized";
    std::filesystem::path workDir;          ///< Empty means the current directory.
    infrastructure::ProcessLimits compileLimits;
    infrastructure::ProcessLimits runLimits;
};

/**
 * @struct SandboxReport
 * @brief Outcome of compile-then-run. execution is set only after a successful compile.
 */
struct SandboxReport {
    domain::CompileOutcome compile;
    std::optional<domain::ExecutionOutcome> execution;

    bool succeeded() const { return compile.success && execution && execution->exitCode == 0; }

    /** @brief Diagnostics on compile failure, stderr on run failure, stdout otherwise. */
    std::string displayText() const;
};

/**
 * @class CompileExecuteSandbox
 * @brief Two strictly sequential stages: compile with fixed flags, then execute without arguments.
 */
class CompileExecuteSandbox {
public:
    CompileExecuteSandbox(ToolchainSettings settings, infrastructure::ProcessRunner runner);

    /** @brief Optimization, language standard and -march selection. Not configurable. */
    static std::vector<std::string> FixedFlags();

    /** @brief Full compiler command line for @p artifactPath. */
    std::vector<std::string> compileCommand(const std::string& artifactPath) const;

    domain::CompileOutcome compile(const std::string& artifactPath) const;

    /** @brief Runs the binary produced by the last successful compile(). */
    domain::ExecutionOutcome execute() const;

    /** @brief compile() and, only if it succeeded, execute(). */
    SandboxReport run(const std::string& artifactPath) const;

    std::filesystem::path binaryPath() const;

private:
    std::filesystem::path workDir() const;

    ToolchainSettings m_settings;
    infrastructure::ProcessRunner m_runner;
};

} // namespace codeshift::application
