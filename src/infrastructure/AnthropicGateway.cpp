/**
 * @file AnthropicGateway.cpp
 * @brief Implementation of the AnthropicGateway class.
 */
#include "infrastructure/AnthropicGateway.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace codeshift::infrastructure {

using domain::RequestError;

namespace {
constexpr const char* kMessagesPath = "/v1/messages";
}

AnthropicGateway::AnthropicGateway(std::string apiKey, HttpSettings settings, std::string apiVersion,
                                   domain::CancellationToken cancel)
    : m_apiKey(std::move(apiKey)),
      m_apiVersion(std::move(apiVersion)),
      m_client(std::move(settings), std::move(cancel)) {}

std::string AnthropicGateway::buildRequestBody(const domain::ConversionRequest& request) const {
    json requestData = {
        {"model", m_client.settings().model},
        {"max_tokens", request.maxOutputTokens()},
        {"system", PromptCatalog::GetSystemPrompt()},
        {"messages", json::array({
            {{"role", "user"}, {"content", PromptCatalog::GetUserPrompt(request.sourceText())}}
        })}
    };
    return requestData.dump();
}

std::string AnthropicGateway::ParseMessageResponse(const std::string& body) {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::exception& e) {
        throw RequestError(RequestError::Kind::MalformedResponse,
                           std::string("Response is not valid JSON: ") + e.what());
    }

    if (!parsed.is_object()) {
        throw RequestError(RequestError::Kind::MalformedResponse, "Response JSON is not an object.");
    }
    if (parsed.contains("error") || (parsed.contains("type") && parsed["type"] == "error")) {
        throw RequestError(RequestError::Kind::Backend,
                           "Backend reported an error: " + BackendHttpClient::ExtractErrorMessage(body));
    }
    if (!parsed.contains("content") || !parsed["content"].is_array()) {
        throw RequestError(RequestError::Kind::MalformedResponse, "Response JSON missing 'content' array.");
    }

    std::string text;
    for (const auto& block : parsed["content"]) {
        if (!block.is_object() || !block.contains("type") || block["type"] != "text") continue;
        if (block.contains("text") && block["text"].is_string()) {
            text += block["text"].get<std::string>();
        }
    }
    return text;
}

domain::FragmentStream AnthropicGateway::submit(const domain::ConversionRequest& request) {
    if (m_apiKey.empty()) {
        throw RequestError(RequestError::Kind::Credential, "Anthropic API key is not configured.");
    }
    std::string body = buildRequestBody(request);
    return domain::FragmentStream([this, body](const domain::FragmentStream::Sink& sink) {
        Logger::Debug("AnthropicGateway", "Sending request to " + m_client.settings().model);

        std::string responseBody;
        m_client.postJson(kMessagesPath,
                          {{"x-api-key", m_apiKey}, {"anthropic-version", m_apiVersion}},
                          body,
                          [&responseBody](const char* data, std::size_t length) {
                              responseBody.append(data, length);
                          });

        Logger::Debug("AnthropicGateway", "Response received (" + std::to_string(responseBody.size()) + " bytes)");
        sink(domain::Fragment{ParseMessageResponse(responseBody)});
    });
}

} // namespace codeshift::infrastructure
