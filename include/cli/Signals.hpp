#pragma once

#include <atomic>
#include <memory>

namespace lb::cli {

inline constexpr int EXIT_INTERRUPTED = 130;

// Installs SIGINT/SIGTERM handlers and returns the flag the first signal raises.
// A second signal exits immediately with EXIT_INTERRUPTED. The flag has static storage,
// so it outlives every run that holds it.
std::shared_ptr<std::atomic<bool>> installInterruptHandlers();

}
