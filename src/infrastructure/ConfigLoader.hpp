/**
 * @file ConfigLoader.hpp
 * @brief Loading of application settings (settings.json).
 *
 * Keys are nested JSON objects ("openai": {"model": ...}); any key that is
 * missing keeps its default below.
 */

#pragma once

#include <string>
#include <optional>

namespace codeshift::infrastructure {

/**
 * @struct HttpSettings
 * @brief Endpoint and timeouts for one backend.
 */
struct HttpSettings {
    std::string host;
    int port = 443;
    std::string model;
    int connectTimeoutSec = 10;
    int readTimeoutSec = 600;
};

/**
 * @struct SandboxSettings
 * @brief Limits applied to the compile and run child processes. 0 disables a limit.
 */
struct SandboxSettings {
    int compileTimeoutMs = 120000;
    int runTimeoutMs = 60000;
    int cpuSeconds = 0;
    int memoryMb = 0;
    int fileSizeMb = 0;
    bool isolateNetwork = false;
};

struct AppConfig {
    HttpSettings openai{"api.openai.com", 443, "gpt-4o"};
    HttpSettings anthropic{"api.anthropic.com", 443, "claude-3-5-sonnet-20240620"};
    std::string anthropicVersion = "2023-06-01";

    std::string outputDir = "generated";
#if defined(__APPLE__)
    std::string compiler = "clang++";
#else
    std::string compiler = "c++";
#endif
    std::string binaryName = "optimized";
    SandboxSettings sandbox;

    std::string interpreter = "python3";
    int maxTokens = 2000;
};

class ConfigLoader {
public:
    /**
     * @brief Loads settings from the first existing file among @p explicitPath,
     *        ./settings.json and the user config file.
     * @return Defaults when no file exists or the file is unreadable.
     */
    static AppConfig Load(const std::optional<std::string>& explicitPath = std::nullopt);

    /** @brief Parses one settings file. Returns nullopt (and logs) on malformed JSON. */
    static std::optional<AppConfig> LoadFile(const std::string& path);

    /** @brief Overlays the keys of @p jsonText onto @p base. Throws on malformed JSON. */
    static AppConfig Parse(const std::string& jsonText, AppConfig base = AppConfig{});
};

} // namespace codeshift::infrastructure
