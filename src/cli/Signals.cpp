#include "cli/Signals.hpp"

#include <csignal>
#include <cstdlib>

namespace {

std::atomic<bool> interrupted{false};
std::atomic<int> signalsSeen{0};

void signalHandler(const int) {
    // Second signal: stop waiting for in-flight uploads
    if (signalsSeen.fetch_add(1) > 0) std::_Exit(lb::cli::EXIT_INTERRUPTED);
    interrupted.store(true);
}

}

std::shared_ptr<std::atomic<bool>> lb::cli::installInterruptHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // Non-owning: aliases the static flag
    return {std::shared_ptr<void>{}, &interrupted};
}
