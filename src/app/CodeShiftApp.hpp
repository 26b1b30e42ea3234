/**
 * @file CodeShiftApp.hpp
 * @brief Batch front-end: wires the services together and runs one invocation.
 */

#pragma once

#include "domain/CancellationToken.hpp"
#include "domain/Conversion.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <optional>
#include <string>

namespace codeshift::app {

/**
 * @struct CliOptions
 * @brief Parsed command line. Exactly one of file/code is set.
 */
struct CliOptions {
    std::optional<std::string> file;
    std::optional<std::string> code;
    domain::BackendSelection selection = domain::BackendSelection::Gpt;
    std::optional<int> maxTokens;
    bool verbose = false;
    bool run = false;       ///< Compile and execute each artifact.
    bool reference = false; ///< Evaluate the original source as a baseline.
    std::optional<std::string> configPath;
};

/**
 * @class CodeShiftApp
 * @brief Composition root for the command-line harness.
 */
class CodeShiftApp {
public:
    explicit CodeShiftApp(domain::CancellationToken cancel);

    /**
     * @brief Executes one batch invocation.
     * @return 0 on success, 1 on input error, interruption or a failed backend call.
     */
    int Run(const CliOptions& options);

private:
    std::optional<std::string> ReadSource(const CliOptions& options) const;
    /** @brief Prints the baseline output, or its error text. */
    void RunReference(const std::string& source) const;

    domain::CancellationToken m_cancel;
    infrastructure::AppConfig m_config;
};

} // namespace codeshift::app
