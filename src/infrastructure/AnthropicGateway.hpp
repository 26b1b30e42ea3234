/**
 * @file AnthropicGateway.hpp
 * @brief Single-shot gateway for the Anthropic messages API.
 */

#pragma once
#include "domain/ProviderGateway.hpp"
#include "infrastructure/BackendHttpClient.hpp"
#include <string>

namespace codeshift::infrastructure {

/**
 * @class AnthropicGateway
 * @brief Implements ProviderGateway with one blocking call; the whole reply becomes one Fragment.
 */
class AnthropicGateway : public domain::ProviderGateway {
public:
    AnthropicGateway(std::string apiKey, HttpSettings settings, std::string apiVersion,
                     domain::CancellationToken cancel);

    domain::Backend backend() const override { return domain::Backend::Claude; }

    /** @brief Wraps the full reply as a one-fragment stream. @see domain::ProviderGateway::submit */
    domain::FragmentStream submit(const domain::ConversionRequest& request) override;

    /** @brief Builds the JSON request body; max_tokens comes from the request. */
    std::string buildRequestBody(const domain::ConversionRequest& request) const;

    /**
     * @brief Concatenates the text blocks of a messages response.
     * @throws domain::RequestError (Backend) for an error payload, (MalformedResponse) otherwise.
     */
    static std::string ParseMessageResponse(const std::string& body);

private:
    std::string m_apiKey;
    std::string m_apiVersion;
    BackendHttpClient m_client;
};

} // namespace codeshift::infrastructure
