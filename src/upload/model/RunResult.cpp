#include "upload/model/RunResult.hpp"

#include <fmt/format.h>

namespace lb::upload::model {

std::string to_string(const Phase p) {
    switch (p) {
    case Phase::Idle: return "idle";
    case Phase::Scanning: return "scanning";
    case Phase::Dispatching: return "dispatching";
    case Phase::Draining: return "draining";
    case Phase::Completed: return "completed";
    case Phase::Aborted: return "aborted";
    }
    return "unknown";
}

std::string to_string(const AbortReason r) {
    switch (r) {
    case AbortReason::None: return "none";
    case AbortReason::BudgetExceeded: return "error budget exceeded";
    case AbortReason::CancellationRequested: return "cancellation requested";
    }
    return "unknown";
}

std::string RunResult::summary() const {
    auto out = fmt::format("{} candidates, {} dispatched, {} uploaded, {} skipped, {} failed (budget {}), {}",
                           candidates, dispatched, uploaded, skipped, failed, errorBudget, to_string(phase));
    if (reason != AbortReason::None) out += fmt::format(": {}", to_string(reason));
    return out;
}

}
