#include "infrastructure/CredentialLoader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace codeshift::infrastructure {

namespace {

std::string Trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto first = value.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = value.find_last_not_of(ws);
    return value.substr(first, last - first + 1);
}

std::string Resolve(const std::string& name, const std::map<std::string, std::string>& dotenv) {
    const char* fromEnv = std::getenv(name.c_str());
    if (fromEnv && *fromEnv) {
        return fromEnv;
    }
    auto it = dotenv.find(name);
    return it != dotenv.end() ? it->second : std::string{};
}

} // namespace

std::map<std::string, std::string> CredentialLoader::ParseDotenv(const std::string& text) {
    std::map<std::string, std::string> values;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = Trim(line.substr(7));
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = Trim(line.substr(0, eq));
        std::string value = Trim(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            auto comment = value.find(" #");
            if (comment != std::string::npos) {
                value = Trim(value.substr(0, comment));
            }
        }
        values[key] = value;
    }
    return values;
}

Credentials CredentialLoader::Load(const std::string& dotenvPath) {
    std::map<std::string, std::string> dotenv;
    if (!dotenvPath.empty() && std::filesystem::exists(dotenvPath)) {
        std::ifstream f(dotenvPath);
        std::stringstream buffer;
        buffer << f.rdbuf();
        dotenv = ParseDotenv(buffer.str());
        Logger::Debug("CredentialLoader", "Loaded " + std::to_string(dotenv.size()) + " entries from " + dotenvPath);
    }

    Credentials credentials;
    credentials.openaiApiKey = Resolve(kOpenAIKeyName, dotenv);
    credentials.anthropicApiKey = Resolve(kAnthropicKeyName, dotenv);

    if (credentials.openaiApiKey.empty()) {
        throw domain::ConfigurationError(std::string(kOpenAIKeyName) + " not found in environment variables");
    }
    if (credentials.anthropicApiKey.empty()) {
        throw domain::ConfigurationError(std::string(kAnthropicKeyName) + " not found in environment variables");
    }
    return credentials;
}

} // namespace codeshift::infrastructure
