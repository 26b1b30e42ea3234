#include <cassert>
#include <csignal>
#include <iostream>

extern "C" {
#include <sys/wait.h>
#include <unistd.h>
}

#include "domain/CancellationToken.hpp"
#include "infrastructure/InterruptHandler.hpp"

using namespace codeshift;
using infrastructure::InterruptHandler;

int main() {
    std::cout << "[Test] Starting InterruptHandler Test..." << std::endl;

    std::cout << "[Test] First interrupt cancels the token..." << std::endl;
    {
        domain::CancellationToken token;
        InterruptHandler::Install(token);
        assert(!token.isCancelled());
        std::raise(SIGINT);
        assert(token.isCancelled());
        InterruptHandler::Uninstall();
    }

    std::cout << "[Test] Reinstalling resets the interrupt count..." << std::endl;
    {
        domain::CancellationToken token;
        InterruptHandler::Install(token);
        std::raise(SIGINT);
        assert(token.isCancelled());
        InterruptHandler::Uninstall();
    }

    std::cout << "[Test] Second interrupt terminates with exit code 1..." << std::endl;
    {
        std::cout.flush();
        pid_t pid = ::fork();
        assert(pid >= 0);
        if (pid == 0) {
            domain::CancellationToken token;
            InterruptHandler::Install(token);
            std::raise(SIGINT);
            if (!token.isCancelled()) _exit(2);
            std::raise(SIGINT);
            _exit(0);
        }
        int status = 0;
        pid_t waited = ::waitpid(pid, &status, 0);
        assert(waited == pid);
        (void)waited;
        assert(WIFEXITED(status));
        assert(WEXITSTATUS(status) == 1);
    }

    std::cout << "[PASS] InterruptHandler Test." << std::endl;
    return 0;
}
