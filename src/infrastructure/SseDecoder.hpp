/**
 * @file SseDecoder.hpp
 * @brief Incremental decoder for text/event-stream bodies.
 */

#pragma once

#include <string>
#include <vector>

namespace codeshift::infrastructure {

/**
 * @class SseDecoder
 * @brief Splits arbitrarily chunked server-sent-event bytes into event payloads.
 *
 * Only "data:" fields are kept; multiple data lines of one event are joined
 * with '\n'. Comment lines (":") and other fields are ignored.
 */
class SseDecoder {
public:
    /** @brief Feeds raw bytes and returns the payloads of every event completed by them. */
    std::vector<std::string> feed(const char* data, std::size_t length);

    /** @brief Flushes a trailing event that was not terminated by a blank line. */
    std::vector<std::string> finish();

private:
    void processLine(std::string line, std::vector<std::string>& out);
    void dispatch(std::vector<std::string>& out);

    std::string m_buffer;
    std::string m_eventData;
    bool m_hasData = false;
};

} // namespace codeshift::infrastructure
