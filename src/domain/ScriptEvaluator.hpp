/**
 * @file ScriptEvaluator.hpp
 * @brief Interface for evaluating original (untransformed) source code.
 */

#pragma once
#include <string>

namespace codeshift::domain {

/**
 * @class ScriptEvaluator
 * @brief Runs source text, writing any program output to the process stdout.
 *
 * Implementations throw std::exception subclasses when the evaluated code fails.
 */
class ScriptEvaluator {
public:
    virtual ~ScriptEvaluator() = default;

    virtual void evaluate(const std::string& sourceText) = 0;
};

} // namespace codeshift::domain
