#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lb::upload::model {

enum class Phase : uint8_t { Idle, Scanning, Dispatching, Draining, Completed, Aborted };

enum class AbortReason : uint8_t { None, BudgetExceeded, CancellationRequested };

std::string to_string(Phase p);
std::string to_string(AbortReason r);

struct RunResult {
    Phase phase = Phase::Idle;
    AbortReason reason = AbortReason::None;

    size_t candidates = 0;
    size_t dispatched = 0;
    size_t uploaded = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t errorBudget = 0;

    [[nodiscard]] bool completed() const { return phase == Phase::Completed; }
    [[nodiscard]] bool aborted() const { return phase == Phase::Aborted; }

    // 0 completed, 1 aborted
    [[nodiscard]] int exitCode() const { return completed() ? 0 : 1; }

    [[nodiscard]] std::string summary() const;
};

}
