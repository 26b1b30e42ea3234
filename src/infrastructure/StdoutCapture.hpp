/**
 * @file StdoutCapture.hpp
 * @brief Scoped redirection of the process-wide standard output into a buffer.
 */

#pragma once

#include <string>

namespace codeshift::infrastructure {

/**
 * @class StdoutCapture
 * @brief Redirects file descriptor 1 (and with it printf, std::cout and child
 *        processes that inherit stdout) into an anonymous temp file.
 *
 * The original descriptor is restored in the destructor, so every exit path,
 * exceptions included, leaves stdout where it was. Not reentrant across threads.
 */
class StdoutCapture {
public:
    /** @throws std::runtime_error when the redirection cannot be set up. */
    StdoutCapture();
    ~StdoutCapture();

    StdoutCapture(const StdoutCapture&) = delete;
    StdoutCapture& operator=(const StdoutCapture&) = delete;

    /** @brief Flushes pending output and returns everything captured so far. */
    std::string text() const;

    /** @brief Restores the original stdout early. Safe to call more than once. */
    void restore();

    bool active() const { return m_savedFd >= 0; }

private:
    int m_savedFd = -1;
    int m_captureFd = -1;
};

} // namespace codeshift::infrastructure
