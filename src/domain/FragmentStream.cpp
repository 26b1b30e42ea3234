/**
 * @file FragmentStream.cpp
 * @brief Implementation of FragmentStream.
 */
#include "domain/FragmentStream.hpp"
#include <stdexcept>

namespace codeshift::domain {

FragmentStream::FragmentStream(Producer producer)
    : m_producer(std::move(producer)) {}

void FragmentStream::consume(const Sink& sink) {
    if (m_consumed) {
        throw std::logic_error("FragmentStream: already consumed, submit a new request.");
    }
    m_consumed = true;

    std::size_t sequence = 0;
    Producer producer = std::move(m_producer);
    m_producer = nullptr;
    producer([&sink, &sequence](const Fragment& fragment) {
        Fragment ordered{fragment.text, sequence++};
        if (sink) sink(ordered);
    });
}

} // namespace codeshift::domain
