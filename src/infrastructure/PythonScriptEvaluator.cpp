#include "infrastructure/PythonScriptEvaluator.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PathUtils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace codeshift::infrastructure {

namespace {

std::string TrimTrailing(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

} // namespace

PythonScriptEvaluator::PythonScriptEvaluator(std::string interpreterPath, ProcessRunner runner, ProcessLimits limits)
    : m_interpreterPath(std::move(interpreterPath))
    , m_runner(std::move(runner))
    , m_limits(limits)
{}

void PythonScriptEvaluator::evaluate(const std::string& sourceText) {
    namespace fs = std::filesystem;

    fs::path scriptPath = PathUtils::MakeTempPath("codeshift_reference_", ".py");
    {
        std::ofstream script(scriptPath);
        if (!script.is_open()) {
            throw std::runtime_error("Cannot write reference script: " + scriptPath.string());
        }
        script << sourceText;
    }

    Logger::Debug("PythonScriptEvaluator", "Running " + m_interpreterPath + " " + scriptPath.string());

    ProcessOptions options;
    options.captureStdout = false;
    options.limits = m_limits;

    ProcessResult result;
    try {
        result = m_runner.run({m_interpreterPath, scriptPath.string()}, options);
    } catch (...) {
        std::error_code ignored;
        fs::remove(scriptPath, ignored);
        throw;
    }
    std::error_code ignored;
    fs::remove(scriptPath, ignored);

    if (result.exitCode != 0) {
        std::string details = TrimTrailing(result.stderrText);
        if (details.empty()) {
            details = "interpreter exited with code " + std::to_string(result.exitCode);
        }
        throw std::runtime_error(details);
    }
}

} // namespace codeshift::infrastructure
