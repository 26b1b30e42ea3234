/**
 * @file FragmentStream.hpp
 * @brief Lazy, single-use sequence of fragments produced by a backend call.
 */

#pragma once
#include "domain/Conversion.hpp"
#include <functional>

namespace codeshift::domain {

/**
 * @class FragmentStream
 * @brief Defers the backend call until consume() and allows it to run only once.
 *
 * Fragments reach the sink strictly in arrival order. Failures propagate out of
 * consume() as exceptions; nothing is buffered for a later retry.
 */
class FragmentStream {
public:
    using Sink = std::function<void(const Fragment&)>;
    using Producer = std::function<void(const Sink&)>;

    explicit FragmentStream(Producer producer);

    FragmentStream(FragmentStream&&) = default;
    FragmentStream& operator=(FragmentStream&&) = default;
    FragmentStream(const FragmentStream&) = delete;
    FragmentStream& operator=(const FragmentStream&) = delete;

    /**
     * @brief Runs the backend call, pushing each fragment to @p sink.
     * @throws std::logic_error when the stream was already consumed.
     */
    void consume(const Sink& sink);

    /** @brief True once consume() has been entered. */
    bool consumed() const { return m_consumed; }

private:
    Producer m_producer;
    bool m_consumed = false;
};

} // namespace codeshift::domain
