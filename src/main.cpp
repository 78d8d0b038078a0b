#include "core/cli.hpp"

#include <atomic>
#include <signal.h>

static std::atomic<bool> g_cancel{false};

static void signal_handler(int /*sig*/) {
    g_cancel.store(true);
}

int main(int argc, char* argv[]) {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    return CLI::run(argc, argv, &g_cancel);
}
