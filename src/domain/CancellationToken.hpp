/**
 * @file CancellationToken.hpp
 * @brief Shared flag used to abort an in-flight backend call or child process.
 */

#pragma once
#include <atomic>
#include <memory>

namespace codeshift::domain {

class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    /** @brief Requests cancellation. Safe to call from a signal handler. */
    void cancel() const { m_flag->store(true); }

    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace codeshift::domain
