/**
 * @file PromptCatalog.hpp
 * @brief Fixed instruction template sent with every conversion.
 */

#pragma once

#include <string>

namespace codeshift::infrastructure {

class PromptCatalog {
public:
    /** @brief Returns the system message. */
    static std::string GetSystemPrompt();

    /** @brief Returns the user message: instruction prefix followed by @p sourceText. */
    static std::string GetUserPrompt(const std::string& sourceText);
};

} // namespace codeshift::infrastructure
