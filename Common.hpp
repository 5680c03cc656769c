// File: Common.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

inline double clampValue(double value, double lo, double hi) {
    return std::min(hi, std::max(lo, value));
}

// Round half away from zero to |places| decimal places.
inline double roundTo(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

// Rounds to the nearest integer, saturating at the int64 range. NaN maps to 0.
inline int64_t saturatingRound(double value) {
    const double limit = 9223372036854775808.0;   // 2^63
    if (std::isnan(value)) return 0;
    if (value >= limit) return std::numeric_limits<int64_t>::max();
    if (value <= -limit) return std::numeric_limits<int64_t>::min();
    return std::llround(value);
}

inline double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / values.size();
}

// Nearest-rank percentile over an ascending |sorted| array, indexed at
// floor(q * n). Returns |fallback| when the index is out of range.
inline double nearestRankPercentile(const std::vector<double>& sorted, double q, double fallback) {
    if (sorted.empty()) return fallback;
    size_t idx = static_cast<size_t>(std::floor(q * sorted.size()));
    if (idx >= sorted.size()) return fallback;
    return sorted[idx];
}

inline int64_t epochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
