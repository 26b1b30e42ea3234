/**
 * @file CompileExecuteSandbox.cpp
 * @brief Implementation of CompileExecuteSandbox.
 */
#include "application/CompileExecuteSandbox.hpp"
#include "infrastructure/Logger.hpp"

namespace codeshift::application {

using infrastructure::Logger;
using infrastructure::ProcessOptions;
using infrastructure::ProcessResult;

std::string SandboxReport::displayText() const {
    if (!compile.success) {
        return compile.diagnostics;
    }
    if (!execution) {
        return {};
    }
    if (execution->exitCode != 0) {
        if (!execution->stderrText.empty()) {
            return execution->stderrText;
        }
        return "Program exited with code " + std::to_string(execution->exitCode);
    }
    return execution->stdoutText;
}

CompileExecuteSandbox::CompileExecuteSandbox(ToolchainSettings settings, infrastructure::ProcessRunner runner)
    : m_settings(std::move(settings)), m_runner(std::move(runner)) {}

std::vector<std::string> CompileExecuteSandbox::FixedFlags() {
    return {
        "-O3",
        "-std=c++17",
#if defined(__APPLE__) && defined(__aarch64__)
        "-march=armv8.3-a",
#else
        "-march=native",
#endif
    };
}

std::filesystem::path CompileExecuteSandbox::workDir() const {
    if (m_settings.workDir.empty()) {
        return std::filesystem::current_path();
    }
    return std::filesystem::absolute(m_settings.workDir);
}

std::filesystem::path CompileExecuteSandbox::binaryPath() const {
    return workDir() / m_settings.binaryName;
}

std::vector<std::string> CompileExecuteSandbox::compileCommand(const std::string& artifactPath) const {
    std::vector<std::string> command{m_settings.compiler};
    for (auto& flag : FixedFlags()) {
        command.push_back(flag);
    }
    command.push_back("-o");
    command.push_back(binaryPath().string());
    command.push_back(artifactPath);
    return command;
}

domain::CompileOutcome CompileExecuteSandbox::compile(const std::string& artifactPath) const {
    Logger::Info("CompileExecuteSandbox", "Compiling " + artifactPath + " with " + m_settings.compiler);

    ProcessOptions options;
    options.workingDir = workDir();
    options.limits = m_settings.compileLimits;

    ProcessResult result = m_runner.run(compileCommand(artifactPath), options);

    domain::CompileOutcome outcome;
    outcome.exitCode = result.exitCode;
    outcome.success = result.exitCode == 0;
    outcome.diagnostics = result.stderrText;
    outcome.timedOut = result.timedOut;

    if (!outcome.success) {
        Logger::Warn("CompileExecuteSandbox", "Compilation failed with exit code " + std::to_string(result.exitCode));
    }
    return outcome;
}

domain::ExecutionOutcome CompileExecuteSandbox::execute() const {
    std::filesystem::path binary = binaryPath();
    Logger::Info("CompileExecuteSandbox", "Running " + binary.string());

    ProcessOptions options;
    options.workingDir = workDir();
    options.limits = m_settings.runLimits;

    ProcessResult result = m_runner.run({binary.string()}, options);

    domain::ExecutionOutcome outcome;
    outcome.stdoutText = std::move(result.stdoutText);
    outcome.stderrText = std::move(result.stderrText);
    outcome.exitCode = result.exitCode;
    outcome.timedOut = result.timedOut;

    if (outcome.exitCode != 0) {
        Logger::Warn("CompileExecuteSandbox", "Program exited with code " + std::to_string(outcome.exitCode));
    }
    return outcome;
}

SandboxReport CompileExecuteSandbox::run(const std::string& artifactPath) const {
    SandboxReport report;
    report.compile = compile(artifactPath);
    if (report.compile.success) {
        report.execution = execute();
    }
    return report;
}

} // namespace codeshift::application
