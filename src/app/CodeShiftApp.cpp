/**
 * @file CodeShiftApp.cpp
 * @brief Implementation of the CodeShiftApp class.
 */
#include "app/CodeShiftApp.hpp"

#include "application/CompileExecuteSandbox.hpp"
#include "application/ConversionService.hpp"
#include "application/ReferenceSandbox.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AnthropicGateway.hpp"
#include "infrastructure/ArtifactStore.hpp"
#include "infrastructure/CredentialLoader.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/OpenAIGateway.hpp"
#include "infrastructure/PythonScriptEvaluator.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace codeshift::app {

using infrastructure::Logger;

namespace {

infrastructure::ProcessLimits CompileLimits(const infrastructure::SandboxSettings& sandbox) {
    infrastructure::ProcessLimits limits;
    limits.timeout = std::chrono::milliseconds(sandbox.compileTimeoutMs);
    limits.memoryMb = sandbox.memoryMb;
    limits.fileSizeMb = sandbox.fileSizeMb;
    return limits;
}

infrastructure::ProcessLimits RunLimits(const infrastructure::SandboxSettings& sandbox) {
    infrastructure::ProcessLimits limits;
    limits.timeout = std::chrono::milliseconds(sandbox.runTimeoutMs);
    limits.cpuSeconds = sandbox.cpuSeconds;
    limits.memoryMb = sandbox.memoryMb;
    limits.fileSizeMb = sandbox.fileSizeMb;
    limits.isolateNetwork = sandbox.isolateNetwork;
    return limits;
}

void PrintSection(const std::string& title, const std::string& body) {
    std::cout << "\n=== " << title << " ===\n" << body;
    if (!body.empty() && body.back() != '\n') std::cout << '\n';
    std::cout.flush();
}

} // namespace

CodeShiftApp::CodeShiftApp(domain::CancellationToken cancel) : m_cancel(std::move(cancel)) {}

std::optional<std::string> CodeShiftApp::ReadSource(const CliOptions& options) const {
    if (options.code) {
        return *options.code;
    }
    if (!options.file) {
        return std::nullopt;
    }

    std::ifstream file(*options.file);
    if (!file.is_open()) {
        Logger::Error("CodeShiftApp", "Could not open input file: " + *options.file);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void CodeShiftApp::RunReference(const std::string& source) const {
    infrastructure::ProcessLimits limits = RunLimits(m_config.sandbox);
    limits.isolateNetwork = false;
    auto evaluator = std::make_shared<infrastructure::PythonScriptEvaluator>(
        m_config.interpreter, infrastructure::ProcessRunner(m_cancel), limits);
    application::ReferenceSandbox reference(evaluator);

    domain::ReferenceOutcome outcome = reference.evaluate(source);
    if (outcome.error) {
        PrintSection("Reference (" + m_config.interpreter + ") error", *outcome.error);
        return;
    }
    PrintSection("Reference (" + m_config.interpreter + ") output", outcome.stdoutText);
}

int CodeShiftApp::Run(const CliOptions& options) {
    Logger::SetVerbose(options.verbose);
    m_config = infrastructure::ConfigLoader::Load(options.configPath);

    auto source = ReadSource(options);
    if (!source) {
        return 1;
    }
    if (source->find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::Error("CodeShiftApp", "Please enter some Python code to convert.");
        return 1;
    }

    infrastructure::Credentials credentials;
    try {
        credentials = infrastructure::CredentialLoader::Load();
    } catch (const domain::ConfigurationError& e) {
        Logger::Error("CodeShiftApp", std::string("Configuration error: ") + e.what());
        return 1;
    }

    // Composition root: every client is created here and passed down by reference.
    infrastructure::OpenAIGateway gpt(credentials.openaiApiKey, m_config.openai, m_cancel);
    infrastructure::AnthropicGateway claude(credentials.anthropicApiKey, m_config.anthropic,
                                            m_config.anthropicVersion, m_cancel);
    infrastructure::ArtifactStore store(m_config.outputDir);

    application::ToolchainSettings toolchain;
    toolchain.compiler = m_config.compiler;
    toolchain.binaryName = m_config.binaryName;
    toolchain.compileLimits = CompileLimits(m_config.sandbox);
    toolchain.runLimits = RunLimits(m_config.sandbox);
    application::CompileExecuteSandbox sandbox(toolchain, infrastructure::ProcessRunner(m_cancel));

    application::ConversionService service({&gpt, &claude}, store, sandbox,
        [](domain::Backend backend, application::ConversionStage stage) {
            if (stage == application::ConversionStage::Submitted) {
                Logger::Info("CodeShiftApp", "Converting with " + domain::BackendDisplayName(backend) + "...");
            }
        });

    int maxTokens = options.maxTokens.value_or(m_config.maxTokens);

    try {
        auto reports = service.convertSelection(*source, options.selection, maxTokens, options.run,
            [](const domain::Fragment& fragment, const std::string&) {
                std::cout << fragment.text << std::flush;
            });

        for (const auto& report : reports) {
            std::cout << std::endl;
            Logger::Info("CodeShiftApp", domain::BackendDisplayName(report.artifact.backend) +
                                         " code written to " + report.artifact.path);
            if (report.sandbox) {
                const auto& sandboxReport = *report.sandbox;
                std::string title = domain::BackendDisplayName(report.artifact.backend);
                if (!sandboxReport.compile.success) {
                    title += " compile error";
                } else if (sandboxReport.execution && sandboxReport.execution->exitCode != 0) {
                    title += " runtime error";
                } else {
                    title += " output";
                }
                PrintSection(title, sandboxReport.displayText());
            }
        }
    } catch (const domain::RequestError& e) {
        if (e.kind() == domain::RequestError::Kind::Cancelled) {
            Logger::Error("CodeShiftApp", "Conversion interrupted by user.");
        } else {
            Logger::Error("CodeShiftApp", "Error during conversion (" +
                          domain::RequestError::KindToString(e.kind()) + "): " + e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        Logger::Error("CodeShiftApp", std::string("Error during conversion: ") + e.what());
        return 1;
    }

    if (options.reference && !m_cancel.isCancelled()) {
        RunReference(*source);
    }

    if (m_cancel.isCancelled()) {
        Logger::Error("CodeShiftApp", "Interrupted by user.");
        return 1;
    }
    return 0;
}

} // namespace codeshift::app
