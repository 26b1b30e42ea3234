/**
 * @file OpenAIGateway.cpp
 * @brief Implementation of the OpenAIGateway class.
 */
#include "infrastructure/OpenAIGateway.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/SseDecoder.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace codeshift::infrastructure {

using domain::RequestError;

namespace {
constexpr const char* kCompletionsPath = "/v1/chat/completions";
}

OpenAIGateway::OpenAIGateway(std::string apiKey, HttpSettings settings, domain::CancellationToken cancel)
    : m_apiKey(std::move(apiKey)), m_client(std::move(settings), std::move(cancel)) {}

std::string OpenAIGateway::buildRequestBody(const domain::ConversionRequest& request) const {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", PromptCatalog::GetSystemPrompt()}});
    messages.push_back({{"role", "user"}, {"content", PromptCatalog::GetUserPrompt(request.sourceText())}});

    json requestData = {
        {"model", m_client.settings().model},
        {"messages", messages},
        {"stream", true}
    };
    return requestData.dump();
}

OpenAIGateway::StreamEvent OpenAIGateway::ParseStreamEvent(const std::string& data) {
    StreamEvent event;
    if (data == "[DONE]") {
        event.done = true;
        return event;
    }

    json body;
    try {
        body = json::parse(data);
    } catch (const json::exception& e) {
        throw RequestError(RequestError::Kind::MalformedResponse,
                           std::string("Stream event is not valid JSON: ") + e.what());
    }

    if (body.contains("error")) {
        throw RequestError(RequestError::Kind::Backend,
                           "Backend reported an error: " + BackendHttpClient::ExtractErrorMessage(data));
    }
    if (!body.contains("choices") || !body["choices"].is_array()) {
        throw RequestError(RequestError::Kind::MalformedResponse, "Stream event has no 'choices' array: " + data);
    }
    if (body["choices"].empty()) {
        return event;
    }

    const auto& choice = body["choices"][0];
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        event.finished = true;
    }
    if (choice.contains("delta") && choice["delta"].is_object()) {
        const auto& delta = choice["delta"];
        if (delta.contains("content") && delta["content"].is_string()) {
            event.content = delta["content"].get<std::string>();
        }
    }
    return event;
}

domain::FragmentStream OpenAIGateway::submit(const domain::ConversionRequest& request) {
    if (m_apiKey.empty()) {
        throw RequestError(RequestError::Kind::Credential, "OpenAI API key is not configured.");
    }
    std::string body = buildRequestBody(request);
    return domain::FragmentStream([this, body](const domain::FragmentStream::Sink& sink) {
        stream(body, sink);
    });
}

void OpenAIGateway::stream(const std::string& body, const domain::FragmentStream::Sink& sink) {
    Logger::Debug("OpenAIGateway", "Streaming from " + m_client.settings().model);

    SseDecoder decoder;
    bool completed = false;
    std::size_t fragments = 0;

    auto handleEvents = [&](const std::vector<std::string>& events) {
        for (const auto& data : events) {
            if (completed) return;
            StreamEvent event = ParseStreamEvent(data);
            if (event.content && !event.content->empty()) {
                ++fragments;
                sink(domain::Fragment{*event.content});
            }
            if (event.done) completed = true;
            if (event.finished) completed = true;
        }
    };

    m_client.postJson(kCompletionsPath,
                      {{"Authorization", "Bearer " + m_apiKey}, {"Accept", "text/event-stream"}},
                      body,
                      [&](const char* data, std::size_t length) {
                          handleEvents(decoder.feed(data, length));
                      });
    handleEvents(decoder.finish());

    if (!completed) {
        throw RequestError(RequestError::Kind::Transport, "Stream ended before the completion finished.");
    }
    Logger::Debug("OpenAIGateway", "Stream complete (" + std::to_string(fragments) + " fragments)");
}

} // namespace codeshift::infrastructure
