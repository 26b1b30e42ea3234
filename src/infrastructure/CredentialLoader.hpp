/**
 * @file CredentialLoader.hpp
 * @brief Resolution of the backend API keys from the environment and a .env file.
 */

#pragma once

#include <map>
#include <string>

namespace codeshift::infrastructure {

struct Credentials {
    std::string openaiApiKey;
    std::string anthropicApiKey;
};

class CredentialLoader {
public:
    static constexpr const char* kOpenAIKeyName = "OPENAI_API_KEY";
    static constexpr const char* kAnthropicKeyName = "ANTHROPIC_API_KEY";

    /**
     * @brief Loads both keys. Environment variables take precedence over @p dotenvPath.
     * @throws domain::ConfigurationError when either key is missing or empty.
     */
    static Credentials Load(const std::string& dotenvPath = ".env");

    /**
     * @brief Parses KEY=VALUE lines. Supports '#' comments, an "export " prefix
     *        and single or double quoted values.
     */
    static std::map<std::string, std::string> ParseDotenv(const std::string& text);
};

} // namespace codeshift::infrastructure
