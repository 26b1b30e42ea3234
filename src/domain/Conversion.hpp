/**
 * @file Conversion.hpp
 * @brief Value types flowing through one conversion-and-verify cycle.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace codeshift::domain {

/**
 * @enum Backend
 * @brief Generative backends a conversion can target.
 */
enum class Backend {
    Gpt,    ///< Streaming chat-completions backend.
    Claude  ///< Single-shot messages backend.
};

/**
 * @enum BackendSelection
 * @brief Front-end choice of backends, expanded by ExpandSelection().
 */
enum class BackendSelection {
    Gpt,
    Claude,
    Both
};

/** @brief Short identifier embedded in artifact names ("gpt", "claude"). */
inline std::string BackendId(Backend backend) {
    switch (backend) {
        case Backend::Gpt: return "gpt";
        case Backend::Claude: return "claude";
    }
    return "gpt";
}

inline std::string BackendDisplayName(Backend backend) {
    switch (backend) {
        case Backend::Gpt: return "GPT";
        case Backend::Claude: return "Claude";
    }
    return "GPT";
}

/** @brief Backends to run for a selection, in execution order. */
inline std::vector<Backend> ExpandSelection(BackendSelection selection) {
    switch (selection) {
        case BackendSelection::Gpt: return {Backend::Gpt};
        case BackendSelection::Claude: return {Backend::Claude};
        case BackendSelection::Both: return {Backend::Gpt, Backend::Claude};
    }
    return {};
}

/**
 * @class ConversionRequest
 * @brief Immutable input of a single conversion.
 */
class ConversionRequest {
public:
    ConversionRequest(std::string sourceText, Backend backend, int maxOutputTokens)
        : m_sourceText(std::move(sourceText)), m_backend(backend), m_maxOutputTokens(maxOutputTokens) {}

    const std::string& sourceText() const { return m_sourceText; }
    Backend backend() const { return m_backend; }

    /** @brief Upper bound on generated tokens; honoured by the single-shot backend only. */
    int maxOutputTokens() const { return m_maxOutputTokens; }

private:
    const std::string m_sourceText;
    const Backend m_backend;
    const int m_maxOutputTokens;
};

/**
 * @struct Fragment
 * @brief One incremental chunk of generated text.
 */
struct Fragment {
    std::string text;
    std::size_t sequence = 0; ///< Arrival index, starting at 0.
};

/**
 * @struct ConversionResult
 * @brief Aggregated backend output plus its normalized code.
 */
struct ConversionResult {
    std::string rawText;
    std::string normalizedCode;
    Backend backend = Backend::Gpt;
    std::chrono::system_clock::time_point producedAt;
};

/**
 * @struct ArtifactRecord
 * @brief A persisted artifact. At most one exists per backend.
 */
struct ArtifactRecord {
    std::string path;
    Backend backend = Backend::Gpt;
    std::string code;
};

struct CompileOutcome {
    bool success = false;
    std::string diagnostics; ///< Compiler stderr, verbatim.
    int exitCode = -1;
    bool timedOut = false;
};

struct ExecutionOutcome {
    std::string stdoutText;
    std::string stderrText;
    int exitCode = -1;
    bool timedOut = false;
};

struct ReferenceOutcome {
    std::string stdoutText;
    std::optional<std::string> error;
};

} // namespace codeshift::domain
