#include "upload/model/ErrorBudget.hpp"

#include <cmath>

using namespace lb::upload::model;

size_t ErrorBudget::allowedFor(const size_t candidates) const {
    if (max_errors) return *max_errors;
    if (max_error_percent <= 0.0 || candidates == 0) return 0;

    // Round away float noise before taking the ceiling, so 50 * 2% is 1 and not 2
    const double raw = static_cast<double>(candidates) * max_error_percent / 100.0;
    const double rounded = std::round(raw * 1e9) / 1e9;
    return static_cast<size_t>(std::ceil(rounded));
}
