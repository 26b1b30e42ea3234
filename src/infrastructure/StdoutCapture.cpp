#include "infrastructure/StdoutCapture.hpp"
#include "infrastructure/Logger.hpp"

extern "C" {
#include <unistd.h>
}

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace codeshift::infrastructure {

namespace {

void FlushStdStreams() {
    std::cout.flush();
    std::fflush(stdout);
}

} // namespace

StdoutCapture::StdoutCapture() {
    FlushStdStreams();

    std::error_code ec;
    std::filesystem::path tempDir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw std::runtime_error("StdoutCapture: no temp directory: " + ec.message());
    }
    std::string pattern = (tempDir / "codeshift_stdout_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    m_captureFd = ::mkstemp(buffer.data());
    if (m_captureFd < 0) {
        throw std::runtime_error("StdoutCapture: mkstemp in " + tempDir.string() + " failed: " +
                                 std::strerror(errno));
    }
    ::unlink(buffer.data());

    m_savedFd = ::dup(STDOUT_FILENO);
    if (m_savedFd < 0) {
        int err = errno;
        ::close(m_captureFd);
        m_captureFd = -1;
        throw std::runtime_error(std::string("StdoutCapture: dup failed: ") + std::strerror(err));
    }
    if (::dup2(m_captureFd, STDOUT_FILENO) < 0) {
        int err = errno;
        ::close(m_savedFd);
        ::close(m_captureFd);
        m_savedFd = m_captureFd = -1;
        throw std::runtime_error(std::string("StdoutCapture: dup2 failed: ") + std::strerror(err));
    }
    Logger::SetStdoutCaptured(true);
}

StdoutCapture::~StdoutCapture() {
    restore();
    if (m_captureFd >= 0) {
        ::close(m_captureFd);
    }
}

void StdoutCapture::restore() {
    if (m_savedFd < 0) return;
    FlushStdStreams();
    ::dup2(m_savedFd, STDOUT_FILENO);
    ::close(m_savedFd);
    m_savedFd = -1;
    Logger::SetStdoutCaptured(false);
}

std::string StdoutCapture::text() const {
    if (m_captureFd < 0) return {};
    if (m_savedFd >= 0) FlushStdStreams();

    std::string captured;
    char chunk[4096];
    off_t offset = 0;
    for (;;) {
        ssize_t n = ::pread(m_captureFd, chunk, sizeof(chunk), offset);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        captured.append(chunk, static_cast<std::size_t>(n));
        offset += n;
    }
    return captured;
}

} // namespace codeshift::infrastructure
