/**
 * @file InterruptHandler.hpp
 * @brief Routes SIGINT to a cancellation token.
 */

#pragma once

#include "domain/CancellationToken.hpp"

namespace codeshift::infrastructure {

/**
 * @class InterruptHandler
 * @brief The first SIGINT cancels the installed token; a second one ends the process with exit code 1.
 */
class InterruptHandler {
public:
    static void Install(const domain::CancellationToken& token);

    /** @brief Restores the default SIGINT disposition. */
    static void Uninstall();
};

} // namespace codeshift::infrastructure
