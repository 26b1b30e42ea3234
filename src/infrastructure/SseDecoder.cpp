#include "infrastructure/SseDecoder.hpp"

namespace codeshift::infrastructure {

std::vector<std::string> SseDecoder::feed(const char* data, std::size_t length) {
    std::vector<std::string> events;
    m_buffer.append(data, length);

    std::size_t start = 0;
    std::size_t newline;
    while ((newline = m_buffer.find('\n', start)) != std::string::npos) {
        processLine(m_buffer.substr(start, newline - start), events);
        start = newline + 1;
    }
    m_buffer.erase(0, start);
    return events;
}

std::vector<std::string> SseDecoder::finish() {
    std::vector<std::string> events;
    if (!m_buffer.empty()) {
        processLine(m_buffer, events);
        m_buffer.clear();
    }
    dispatch(events);
    return events;
}

void SseDecoder::processLine(std::string line, std::vector<std::string>& out) {
    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line[0] == ':') return;

    const std::string prefix = "data:";
    if (line.compare(0, prefix.size(), prefix) != 0) return;

    std::string value = line.substr(prefix.size());
    if (!value.empty() && value[0] == ' ') value.erase(0, 1);

    if (m_hasData) m_eventData.push_back('\n');
    m_eventData += value;
    m_hasData = true;
}

void SseDecoder::dispatch(std::vector<std::string>& out) {
    if (!m_hasData) return;
    out.push_back(m_eventData);
    m_eventData.clear();
    m_hasData = false;
}

} // namespace codeshift::infrastructure
