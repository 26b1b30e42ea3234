#pragma once

#include "domain/ScriptEvaluator.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include <string>

namespace codeshift::infrastructure {

/**
 * @class PythonScriptEvaluator
 * @brief Runs source text in a fresh interpreter process that inherits our stdout.
 */
class PythonScriptEvaluator : public domain::ScriptEvaluator {
public:
    PythonScriptEvaluator(std::string interpreterPath, ProcessRunner runner, ProcessLimits limits = {});
    ~PythonScriptEvaluator() override = default;

    /** @throws std::runtime_error carrying the interpreter's stderr when the script fails. */
    void evaluate(const std::string& sourceText) override;

private:
    std::string m_interpreterPath;
    ProcessRunner m_runner;
    ProcessLimits m_limits;
};

} // namespace codeshift::infrastructure
