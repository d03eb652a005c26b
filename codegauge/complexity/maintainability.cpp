#include "maintainability.hpp"
#include <algorithm>
#include <cmath>

namespace codegauge::complexity {

double round_to_hundredths(double value) {
    return std::round(value * 100.0) / 100.0;
}

double maintainability_index(double halstead_volume,
                             std::size_t cyclomatic_complexity,
                             std::size_t lines_of_code) {
    double v = std::max(halstead_volume, 1.0);
    double loc = static_cast<double>(std::max<std::size_t>(lines_of_code, 1));
    double cc = static_cast<double>(std::max<std::size_t>(cyclomatic_complexity, 1));

    double raw = 171.0 - 5.2 * std::log(v) - 0.23 * cc - 16.2 * std::log(loc);
    double normalized = std::clamp(raw * 100.0 / 171.0, 0.0, 100.0);
    return round_to_hundredths(normalized);
}

double sqale_debt_hours(std::size_t cognitive_complexity) {
    return round_to_hundredths(static_cast<double>(cognitive_complexity) * kDebtHoursPerPoint);
}

} // namespace codegauge::complexity
