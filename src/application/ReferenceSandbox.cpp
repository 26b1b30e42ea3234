#include "application/ReferenceSandbox.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/StdoutCapture.hpp"

namespace codeshift::application {

using infrastructure::Logger;

ReferenceSandbox::ReferenceSandbox(std::shared_ptr<domain::ScriptEvaluator> evaluator)
    : m_evaluator(std::move(evaluator)) {}

domain::ReferenceOutcome ReferenceSandbox::evaluate(const std::string& sourceText) const {
    domain::ReferenceOutcome outcome;
    try {
        infrastructure::StdoutCapture capture;
        m_evaluator->evaluate(sourceText);
        outcome.stdoutText = capture.text();
    } catch (const std::exception& e) {
        outcome.error = std::string("Error: ") + e.what();
        Logger::Warn("ReferenceSandbox", *outcome.error);
    } catch (...) {
        outcome.error = "Error: unknown failure during evaluation.";
        Logger::Warn("ReferenceSandbox", *outcome.error);
    }
    return outcome;
}

} // namespace codeshift::application
