#include "infrastructure/InterruptHandler.hpp"

#include <atomic>
#include <csignal>

extern "C" {
#include <unistd.h>
}

namespace codeshift::infrastructure {

namespace {

constexpr int kInterruptedExitCode = 1;

domain::CancellationToken g_token;
std::atomic<const domain::CancellationToken*> g_activeToken{nullptr};
volatile std::sig_atomic_t g_interrupts = 0;

void HandleInterrupt(int) {
    if (g_interrupts != 0) {
        _exit(kInterruptedExitCode);
    }
    g_interrupts = 1;
    const domain::CancellationToken* token = g_activeToken.load();
    if (token) token->cancel();
}

} // namespace

void InterruptHandler::Install(const domain::CancellationToken& token) {
    g_activeToken.store(nullptr);
    g_token = token;
    g_interrupts = 0;
    g_activeToken.store(&g_token);
    std::signal(SIGINT, HandleInterrupt);
}

void InterruptHandler::Uninstall() {
    std::signal(SIGINT, SIG_DFL);
    g_activeToken.store(nullptr);
}

} // namespace codeshift::infrastructure
