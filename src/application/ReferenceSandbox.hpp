/**
 * @file ReferenceSandbox.hpp
 * @brief Baseline evaluation of the original, untransformed source.
 */

#pragma once

#include "domain/Conversion.hpp"
#include "domain/ScriptEvaluator.hpp"
#include <memory>
#include <string>

namespace codeshift::application {

/**
 * @class ReferenceSandbox
 * @brief Evaluates source with process-wide stdout captured, for manual comparison.
 *
 * No comparison with the compiled artifact's output is attempted.
 */
class ReferenceSandbox {
public:
    explicit ReferenceSandbox(std::shared_ptr<domain::ScriptEvaluator> evaluator);

    /**
     * @brief Runs @p sourceText. Never throws for evaluation failures.
     * @return Captured stdout on success; an "Error: ..." string otherwise.
     */
    domain::ReferenceOutcome evaluate(const std::string& sourceText) const;

private:
    std::shared_ptr<domain::ScriptEvaluator> m_evaluator;
};

} // namespace codeshift::application
