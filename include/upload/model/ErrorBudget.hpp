#pragma once

#include <cstddef>
#include <optional>

namespace lb::upload::model {

// Failures tolerated before a run aborts. The absolute cap, when set, replaces the percentage.
struct ErrorBudget {
    double max_error_percent = 2.0;
    std::optional<unsigned int> max_errors;

    // ceil(candidates * max_error_percent / 100), or max_errors.
    [[nodiscard]] size_t allowedFor(size_t candidates) const;

    [[nodiscard]] static bool exceeded(const size_t errors, const size_t allowed) { return errors > allowed; }
};

}
