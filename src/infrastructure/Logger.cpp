#include "infrastructure/Logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace codeshift::infrastructure {

namespace {
std::atomic<bool> g_verbose{false};
std::atomic<bool> g_stdoutCaptured{false};
std::mutex g_writeMutex;

void Write(std::ostream& os, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_writeMutex);
    os << "[" << tag << "] " << message << std::endl;
}
} // namespace

void Logger::SetVerbose(bool verbose) { g_verbose = verbose; }

bool Logger::IsVerbose() { return g_verbose; }

void Logger::SetStdoutCaptured(bool captured) { g_stdoutCaptured = captured; }

void Logger::Debug(const std::string& tag, const std::string& message) {
    if (!g_verbose) return;
    Write(std::cerr, tag, message);
}

void Logger::Info(const std::string& tag, const std::string& message) {
    Write(g_stdoutCaptured ? std::cerr : std::cout, tag, message);
}

void Logger::Warn(const std::string& tag, const std::string& message) {
    Write(std::cerr, tag, "Warning: " + message);
}

void Logger::Error(const std::string& tag, const std::string& message) {
    Write(std::cerr, tag, "Error: " + message);
}

} // namespace codeshift::infrastructure
