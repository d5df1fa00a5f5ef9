// Main entry: read an Ising / QUBO problem, anneal it, print the samples
#include <atomic>
#include <cstdio>
#include <iostream>
#include <string>

#include <signal.h>

#include "app/run.hpp"
#include "cli/cli.hpp"

namespace {

// Set by SIGINT; the driver checks it between reads.
std::atomic<bool> g_cancel{false};

void install_sigint() {
    struct sigaction sa{};
    sa.sa_handler = [](int) { g_cancel.store(true, std::memory_order_relaxed); };
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
}

} // namespace

int main(int argc, char** argv) {
    // Parse CLI
    bool want_help = false; std::string help_text, error;
    cli::Options opt = cli::parse_args(argc, argv, want_help, help_text, error);
    if (!error.empty()) { std::fprintf(stderr, "error: %s\n\n%s", error.c_str(), help_text.c_str()); return 2; }
    if (want_help) { std::cout << help_text; return 0; }

    install_sigint();
    return app::run(opt, std::cin, std::cout, std::cerr, &g_cancel);
}
