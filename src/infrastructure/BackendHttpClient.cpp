#include "infrastructure/BackendHttpClient.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <optional>
#include <thread>

namespace codeshift::infrastructure {

using json = nlohmann::json;
using domain::RequestError;

namespace {
constexpr std::size_t kMaxErrorBodyInMessage = 512;
constexpr int kCancelPollMs = 50;
}

BackendHttpClient::BackendHttpClient(HttpSettings settings, domain::CancellationToken cancel)
    : m_settings(std::move(settings)), m_cancel(std::move(cancel)) {}

std::string BackendHttpClient::SchemeHostPort(const HttpSettings& settings) {
    if (settings.port == 443) {
        return "https://" + settings.host;
    }
    return "http://" + settings.host + ":" + std::to_string(settings.port);
}

std::string BackendHttpClient::ExtractErrorMessage(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.contains("error")) {
            const auto& error = parsed["error"];
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                return error["message"].get<std::string>();
            }
            if (error.is_string()) {
                return error.get<std::string>();
            }
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body.
    }
    if (body.size() > kMaxErrorBodyInMessage) {
        return body.substr(0, kMaxErrorBodyInMessage) + "...";
    }
    return body;
}

void BackendHttpClient::postJson(const std::string& path,
                                 const std::map<std::string, std::string>& headers,
                                 const std::string& body,
                                 const ChunkHandler& onChunk) {
    if (m_cancel.isCancelled()) {
        throw RequestError(RequestError::Kind::Cancelled, "Request cancelled before sending.");
    }

    httplib::Client cli(SchemeHostPort(m_settings));
    cli.set_connection_timeout(m_settings.connectTimeoutSec, 0);
    cli.set_read_timeout(m_settings.readTimeoutSec, 0);

    int status = 0;
    std::string errorBody;
    std::exception_ptr handlerFailure;

    httplib::Request req;
    req.method = "POST";
    req.path = path;
    for (const auto& header : headers) {
        req.set_header(header.first, header.second);
    }
    req.set_header("Content-Type", "application/json");
    req.body = body;

    req.response_handler = [this, &status](const httplib::Response& response) {
        status = response.status;
        return !m_cancel.isCancelled();
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (m_cancel.isCancelled()) return false;
        if (status != 200) {
            errorBody.append(data, length);
            return true;
        }
        try {
            onChunk(data, length);
        } catch (...) {
            handlerFailure = std::current_exception();
            return false;
        }
        return true;
    };

    Logger::Debug("BackendHttpClient", "POST " + SchemeHostPort(m_settings) + path +
                                       " (" + std::to_string(body.size()) + " bytes)");

    // The transfer runs on a worker so that a cancel can stop a call that receives nothing.
    std::optional<httplib::Result> res;
    std::atomic<bool> finished{false};
    std::thread worker([&cli, &req, &res, &finished] {
        res.emplace(cli.send(req));
        finished = true;
    });
    while (!finished) {
        if (m_cancel.isCancelled()) {
            cli.stop();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kCancelPollMs));
    }
    worker.join();

    if (handlerFailure) {
        std::rethrow_exception(handlerFailure);
    }
    if (m_cancel.isCancelled()) {
        throw RequestError(RequestError::Kind::Cancelled, "Request cancelled.");
    }
    if (!res || !*res) {
        auto err = res ? res->error() : httplib::Error::Unknown;
        throw RequestError(RequestError::Kind::Transport,
                           "Connection to " + m_settings.host + " failed. Error code: " +
                           std::to_string(static_cast<int>(err)));
    }
    if (status != 200) {
        std::string message = ExtractErrorMessage(errorBody);
        auto kind = (status == 401 || status == 403) ? RequestError::Kind::Credential
                                                     : RequestError::Kind::Backend;
        throw RequestError(kind, "HTTP Error " + std::to_string(status) + ": " + message);
    }
}

} // namespace codeshift::infrastructure
