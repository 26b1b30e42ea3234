/**
 * @file OpenAIGateway.hpp
 * @brief Streaming gateway for the OpenAI chat-completions API.
 */

#pragma once
#include "domain/ProviderGateway.hpp"
#include "infrastructure/BackendHttpClient.hpp"
#include <optional>
#include <string>

namespace codeshift::infrastructure {

/**
 * @class OpenAIGateway
 * @brief Implements ProviderGateway over server-sent events; every content delta is one Fragment.
 */
class OpenAIGateway : public domain::ProviderGateway {
public:
    /**
     * @struct StreamEvent
     * @brief Decoded payload of one "data:" event.
     */
    struct StreamEvent {
        bool done = false;                  ///< "[DONE]" sentinel.
        bool finished = false;              ///< A finish_reason was reported.
        std::optional<std::string> content; ///< Delta text, when present.
    };

    OpenAIGateway(std::string apiKey, HttpSettings settings, domain::CancellationToken cancel);

    domain::Backend backend() const override { return domain::Backend::Gpt; }

    /** @brief Streams the completion. @see domain::ProviderGateway::submit */
    domain::FragmentStream submit(const domain::ConversionRequest& request) override;

    /** @brief Builds the JSON request body. */
    std::string buildRequestBody(const domain::ConversionRequest& request) const;

    /**
     * @brief Decodes one event payload.
     * @throws domain::RequestError (Backend) for an error payload, (MalformedResponse) for bad JSON.
     */
    static StreamEvent ParseStreamEvent(const std::string& data);

private:
    void stream(const std::string& body, const domain::FragmentStream::Sink& sink);

    std::string m_apiKey;
    BackendHttpClient m_client;
};

} // namespace codeshift::infrastructure
