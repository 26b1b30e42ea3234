/**
 * @file Logger.hpp
 * @brief Tagged console logging with a process-wide verbosity switch.
 */

#pragma once
#include <string>

namespace codeshift::infrastructure {

/**
 * @class Logger
 * @brief Writes "[Tag] message" lines. Info goes to stdout, warnings and errors to stderr.
 *
 * While stdout is being captured (see StdoutCapture) info lines are routed to
 * stderr so they never end up in captured program output.
 */
class Logger {
public:
    static void SetVerbose(bool verbose);
    static bool IsVerbose();

    static void Debug(const std::string& tag, const std::string& message);
    static void Info(const std::string& tag, const std::string& message);
    static void Warn(const std::string& tag, const std::string& message);
    static void Error(const std::string& tag, const std::string& message);

    /** @brief Toggled by StdoutCapture while a redirection is active. */
    static void SetStdoutCaptured(bool captured);
};

} // namespace codeshift::infrastructure
