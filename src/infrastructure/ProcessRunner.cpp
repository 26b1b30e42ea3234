/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner (POSIX fork/exec with poll-driven capture).
 */

#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/Logger.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#if defined(__linux__)
#include <sched.h>
#endif
}

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace codeshift::infrastructure {

namespace {

constexpr int kPollSliceMs = 100;
constexpr int kExecFailedCode = 127;
constexpr int kSetupFailedCode = 126;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void WriteChildError(const std::string& message) {
    std::string line = message + ": " + std::strerror(errno) + "\n";
    ssize_t ignored = ::write(STDERR_FILENO, line.data(), line.size());
    (void)ignored;
}

void ApplyLimit(int resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = value;
    limit.rlim_max = value;
    ::setrlimit(resource, &limit);
}

[[noreturn]] void RunChild(const std::vector<std::string>& args, const ProcessOptions& options,
                           int stdoutWrite, int stderrWrite) {
    ::setpgid(0, 0);

    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
        ::close(devNull);
    }
    if (stdoutWrite >= 0) {
        ::dup2(stdoutWrite, STDOUT_FILENO);
        ::close(stdoutWrite);
    }
    ::dup2(stderrWrite, STDERR_FILENO);
    ::close(stderrWrite);

    if (!options.workingDir.empty() && ::chdir(options.workingDir.c_str()) != 0) {
        WriteChildError("chdir(" + options.workingDir.string() + ") failed");
        _exit(kSetupFailedCode);
    }

    const ProcessLimits& limits = options.limits;
    if (limits.cpuSeconds > 0) {
        ApplyLimit(RLIMIT_CPU, static_cast<rlim_t>(limits.cpuSeconds));
    }
    if (limits.memoryMb > 0) {
        ApplyLimit(RLIMIT_AS, static_cast<rlim_t>(limits.memoryMb) * 1024 * 1024);
    }
    if (limits.fileSizeMb > 0) {
        ApplyLimit(RLIMIT_FSIZE, static_cast<rlim_t>(limits.fileSizeMb) * 1024 * 1024);
    }
    if (limits.isolateNetwork) {
#if defined(__linux__)
        if (::unshare(CLONE_NEWNET) != 0) {
            WriteChildError("unshare(CLONE_NEWNET) failed");
            _exit(kSetupFailedCode);
        }
#else
        WriteChildError("network isolation is only supported on Linux");
        _exit(kSetupFailedCode);
#endif
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    ::execvp(argv[0], argv.data());
    WriteChildError("exec " + args[0] + " failed");
    _exit(kExecFailedCode);
}

} // namespace

ProcessRunner::ProcessRunner(domain::CancellationToken cancel) : m_cancel(std::move(cancel)) {}

ProcessResult ProcessRunner::run(const std::vector<std::string>& args, const ProcessOptions& options) const {
    if (args.empty()) {
        throw std::invalid_argument("ProcessRunner: empty command line");
    }

    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    if (options.captureStdout && ::pipe(stdoutPipe) != 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe(stderrPipe) != 0) {
        CloseFd(stdoutPipe[0]);
        CloseFd(stdoutPipe[1]);
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }

    Logger::Debug("ProcessRunner", "Running: " + args[0] + " (" + std::to_string(args.size() - 1) + " args)");

    std::fflush(stdout);
    pid_t pid = ::fork();
    if (pid < 0) {
        CloseFd(stdoutPipe[0]);
        CloseFd(stdoutPipe[1]);
        CloseFd(stderrPipe[0]);
        CloseFd(stderrPipe[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (stdoutPipe[0] >= 0) ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        RunChild(args, options, stdoutPipe[1], stderrPipe[1]);
    }

    ::setpgid(pid, pid);
    CloseFd(stdoutPipe[1]);
    CloseFd(stderrPipe[1]);

    ProcessResult result;
    pollfd fds[2] = {
        {stdoutPipe[0], POLLIN, 0},
        {stderrPipe[0], POLLIN, 0},
    };
    int openCount = (fds[0].fd >= 0 ? 1 : 0) + 1;

    const bool hasDeadline = options.limits.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + options.limits.timeout;
    bool killed = false;

    // Returns the next wait slice, or -1 once the child must be killed.
    auto nextSliceMs = [&]() -> int {
        if (m_cancel.isCancelled()) {
            result.cancelled = true;
            return -1;
        }
        int waitMs = kPollSliceMs;
        if (hasDeadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timedOut = true;
                return -1;
            }
            if (remaining < waitMs) waitMs = static_cast<int>(remaining);
        }
        return waitMs;
    };

    while (openCount > 0) {
        int waitMs = nextSliceMs();
        if (waitMs < 0) {
            killed = true;
            break;
        }

        int ret = ::poll(fds, 2, waitMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            Logger::Error("ProcessRunner", std::string("poll() failed: ") + std::strerror(errno));
            killed = true;
            break;
        }
        if (ret == 0) continue;

        char chunk[4096];
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                (i == 0 ? result.stdoutText : result.stderrText).append(chunk, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                CloseFd(fds[i].fd);
                --openCount;
            }
        }
    }
    CloseFd(fds[0].fd);
    CloseFd(fds[1].fd);

    // The pipes can close while the child keeps running; limits still apply.
    int status = 0;
    bool reaped = false;
    while (!killed && !reaped) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            int err = errno;
            ::kill(-pid, SIGKILL);
            throw std::runtime_error(std::string("waitpid() failed: ") + std::strerror(err));
        }
        int waitMs = nextSliceMs();
        if (waitMs < 0) {
            killed = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
    }

    if (killed) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
    }

    while (!reaped && ::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = 1;
    }

    if (result.timedOut) {
        result.stderrText += "\n[ProcessRunner] Killed after " +
                             std::to_string(options.limits.timeout.count()) + " ms time limit.";
    } else if (result.cancelled) {
        result.stderrText += "\n[ProcessRunner] Cancelled.";
    }
    return result;
}

} // namespace codeshift::infrastructure
