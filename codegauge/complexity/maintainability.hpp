#ifndef CODEGAUGE_COMPLEXITY_MAINTAINABILITY_HPP
#define CODEGAUGE_COMPLEXITY_MAINTAINABILITY_HPP

#pragma once

#include <cstddef>

namespace codegauge::complexity {

// Remediation cost per cognitive complexity point, about nine minutes
constexpr double kDebtHoursPerPoint = 0.15;

double round_to_hundredths(double value);

// Maintainability Index normalized to 0-100, higher is better.
//
//   MI = (171 - 5.2 ln(V) - 0.23 CC - 16.2 ln(LOC)) * 100 / 171
//
// V, CC and LOC are floored at 1 so the logarithms stay defined. CC is
// the unweighted control-flow count, not cognitive complexity. The
// result is clamped to [0, 100] and rounded to two decimals.
double maintainability_index(double halstead_volume,
                             std::size_t cyclomatic_complexity,
                             std::size_t lines_of_code);

// SQALE remediation estimate in hours, rounded to two decimals
double sqale_debt_hours(std::size_t cognitive_complexity);

} // namespace codegauge::complexity

#endif // CODEGAUGE_COMPLEXITY_MAINTAINABILITY_HPP
