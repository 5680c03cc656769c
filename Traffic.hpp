// File: Traffic.hpp
#pragma once

#include <string>

enum class TrafficPattern {
    CONSTANT, GRADUAL, SPIKE, RAMP, WAVE
};

// Unknown names fall back to CONSTANT. |recognized| reports whether the
// name matched a pattern.
TrafficPattern parseTrafficPattern(const std::string& text, bool* recognized = nullptr);
std::string trafficPatternName(TrafficPattern pattern);

// Instantaneous request-rate multiplier for a run |progress| in [0,1].
//   constant: 1
//   gradual:  1 + 3p (ramps to 4x)
//   spike:    1 -> 5 over the first 10%, holds 5, back to 1 over the last 10%
//   ramp:     p (zero to full rate)
//   wave:     1 + 0.5 sin(6 pi p)
double trafficMultiplier(TrafficPattern pattern, double progress);
