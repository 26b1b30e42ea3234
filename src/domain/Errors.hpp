/**
 * @file Errors.hpp
 * @brief Exception types raised by the conversion pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace codeshift::domain {

/**
 * @class ConfigurationError
 * @brief Missing or unusable startup configuration (e.g. absent credential).
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class RequestError
 * @brief A backend call failed. The conversion is aborted and no partial result is kept.
 */
class RequestError : public std::runtime_error {
public:
    enum class Kind {
        Credential,        ///< Missing or rejected API key; raised before any network call when missing.
        Transport,         ///< Connection failure or broken stream.
        Backend,           ///< Non-200 status or error payload.
        MalformedResponse, ///< Body could not be parsed or had an unexpected shape.
        Cancelled          ///< Cancellation token fired mid-call.
    };

    RequestError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

    static std::string KindToString(Kind kind) {
        switch (kind) {
            case Kind::Credential: return "credential";
            case Kind::Transport: return "transport";
            case Kind::Backend: return "backend";
            case Kind::MalformedResponse: return "malformed-response";
            case Kind::Cancelled: return "cancelled";
        }
        return "backend";
    }

private:
    Kind m_kind;
};

/**
 * @class ArtifactError
 * @brief Persisting an artifact to disk failed.
 */
class ArtifactError : public std::runtime_error {
public:
    explicit ArtifactError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace codeshift::domain
