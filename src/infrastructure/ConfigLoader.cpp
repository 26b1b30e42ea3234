/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace codeshift::infrastructure {

using json = nlohmann::json;

namespace {

void ApplyHttp(const json& node, HttpSettings& http) {
    if (!node.is_object()) return;
    http.host = node.value("host", http.host);
    http.port = node.value("port", http.port);
    http.model = node.value("model", http.model);
}

} // namespace

AppConfig ConfigLoader::Parse(const std::string& jsonText, AppConfig base) {
    json j = json::parse(jsonText);
    if (!j.is_object()) {
        throw std::runtime_error("settings root must be a JSON object");
    }

    if (j.contains("openai")) ApplyHttp(j["openai"], base.openai);
    if (j.contains("anthropic")) {
        ApplyHttp(j["anthropic"], base.anthropic);
        if (j["anthropic"].is_object()) {
            base.anthropicVersion = j["anthropic"].value("version", base.anthropicVersion);
        }
    }

    if (j.contains("http") && j["http"].is_object()) {
        const auto& http = j["http"];
        int connectTimeout = http.value("connect_timeout_s", base.openai.connectTimeoutSec);
        int readTimeout = http.value("read_timeout_s", base.openai.readTimeoutSec);
        base.openai.connectTimeoutSec = base.anthropic.connectTimeoutSec = connectTimeout;
        base.openai.readTimeoutSec = base.anthropic.readTimeoutSec = readTimeout;
    }

    base.outputDir = j.value("output_dir", base.outputDir);
    base.maxTokens = j.value("max_tokens", base.maxTokens);

    if (j.contains("toolchain") && j["toolchain"].is_object()) {
        const auto& toolchain = j["toolchain"];
        base.compiler = toolchain.value("compiler", base.compiler);
        base.binaryName = toolchain.value("binary_name", base.binaryName);
    }

    if (j.contains("sandbox") && j["sandbox"].is_object()) {
        const auto& sandbox = j["sandbox"];
        base.sandbox.compileTimeoutMs = sandbox.value("compile_timeout_ms", base.sandbox.compileTimeoutMs);
        base.sandbox.runTimeoutMs = sandbox.value("run_timeout_ms", base.sandbox.runTimeoutMs);
        base.sandbox.cpuSeconds = sandbox.value("cpu_seconds", base.sandbox.cpuSeconds);
        base.sandbox.memoryMb = sandbox.value("memory_mb", base.sandbox.memoryMb);
        base.sandbox.fileSizeMb = sandbox.value("file_size_mb", base.sandbox.fileSizeMb);
        base.sandbox.isolateNetwork = sandbox.value("isolate_network", base.sandbox.isolateNetwork);
    }

    if (j.contains("reference") && j["reference"].is_object()) {
        base.interpreter = j["reference"].value("interpreter", base.interpreter);
    }

    return base;
}

std::optional<AppConfig> ConfigLoader::LoadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        Logger::Warn("ConfigLoader", "Cannot open " + path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << f.rdbuf();
    try {
        return Parse(buffer.str());
    } catch (const std::exception& e) {
        Logger::Error("ConfigLoader", "Error reading " + path + ": " + e.what());
    }
    return std::nullopt;
}

AppConfig ConfigLoader::Load(const std::optional<std::string>& explicitPath) {
    std::vector<std::filesystem::path> candidates;
    if (explicitPath) {
        if (!std::filesystem::exists(*explicitPath)) {
            Logger::Warn("ConfigLoader", "Settings file not found: " + *explicitPath + ", trying the default locations.");
        }
        candidates.emplace_back(*explicitPath);
    }
    candidates.emplace_back(std::filesystem::current_path() / "settings.json");
    candidates.push_back(PathUtils::GetUserConfigFile());

    for (const auto& candidate : candidates) {
        if (!std::filesystem::exists(candidate)) continue;
        Logger::Debug("ConfigLoader", "Using settings from " + candidate.string());
        if (auto config = LoadFile(candidate.string())) {
            return *config;
        }
        break;
    }
    return AppConfig{};
}

} // namespace codeshift::infrastructure
