#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

constexpr double DEFAULT_ALPHA = 0.1;

// ---------------------------------------------------------------------------
// temporal_weight - exponential recency weight for an observation
//
//   weight = exp(-alpha * age_days),  age_days = cutoff - observation date
//
// age 0 maps to 1.0 and the weight decays toward (never to) zero as the
// observation ages. Underflow is clamped to the smallest positive double,
// so ages past roughly 708/alpha all map to the same weight. Ratios between
// old rows should be taken on ages rebased to the newest row.
// ---------------------------------------------------------------------------
inline double temporal_weight(double age_days, double alpha = DEFAULT_ALPHA) {
    if (!std::isfinite(alpha) || alpha <= 0.0) {
        throw std::invalid_argument("Decay rate alpha must be positive and finite, got " +
                                    std::to_string(alpha));
    }
    if (!std::isfinite(age_days) || age_days < 0.0) {
        throw std::invalid_argument("Observation age must be non-negative and finite, got " +
                                    std::to_string(age_days));
    }
    double w = std::exp(-alpha * age_days);
    if (w <= 0.0) return std::numeric_limits<double>::min();
    return w;
}
