/**
 * @file BackendHttpClient.hpp
 * @brief Low-level HTTP client shared by the backend gateways.
 */

#pragma once

#include "domain/CancellationToken.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <functional>
#include <map>
#include <string>

namespace codeshift::infrastructure {

class BackendHttpClient {
public:
    using ChunkHandler = std::function<void(const char* data, std::size_t length)>;

    BackendHttpClient(HttpSettings settings, domain::CancellationToken cancel);

    /**
     * @brief POSTs a JSON body, delivering the 200-response body chunk by chunk.
     *
     * Exceptions thrown by @p onChunk abort the transfer and are rethrown as-is.
     * @p onChunk runs on a worker thread. The calling thread polls the
     * cancellation token and stops the transfer even while no bytes arrive.
     * @throws domain::RequestError on transport failure, cancellation or a non-200 status.
     */
    void postJson(const std::string& path,
                  const std::map<std::string, std::string>& headers,
                  const std::string& body,
                  const ChunkHandler& onChunk);

    /** @brief "https://host" for port 443, "http://host:port" otherwise. */
    static std::string SchemeHostPort(const HttpSettings& settings);

    /** @brief Pulls a readable message out of an error body ({"error": {"message": ...}}). */
    static std::string ExtractErrorMessage(const std::string& body);

    const HttpSettings& settings() const { return m_settings; }

private:
    HttpSettings m_settings;
    domain::CancellationToken m_cancel;
};

} // namespace codeshift::infrastructure
