#include "Traffic.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

TrafficPattern parseTrafficPattern(const std::string& text, bool* recognized) {
    std::string key;
    for (char c : text) key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    bool ok = true;
    TrafficPattern pattern = TrafficPattern::CONSTANT;
    if (key == "constant") pattern = TrafficPattern::CONSTANT;
    else if (key == "gradual") pattern = TrafficPattern::GRADUAL;
    else if (key == "spike") pattern = TrafficPattern::SPIKE;
    else if (key == "ramp") pattern = TrafficPattern::RAMP;
    else if (key == "wave") pattern = TrafficPattern::WAVE;
    else ok = false;

    if (recognized) *recognized = ok;
    return pattern;
}

std::string trafficPatternName(TrafficPattern pattern) {
    switch (pattern) {
        case TrafficPattern::GRADUAL: return "gradual";
        case TrafficPattern::SPIKE:   return "spike";
        case TrafficPattern::RAMP:    return "ramp";
        case TrafficPattern::WAVE:    return "wave";
        default:                      return "constant";
    }
}

double trafficMultiplier(TrafficPattern pattern, double progress) {
    const double PI = 3.14159265358979323846;
    double p = std::min(1.0, std::max(0.0, progress));

    switch (pattern) {
        case TrafficPattern::GRADUAL:
            return 1.0 + 3.0 * p;
        case TrafficPattern::SPIKE:
            if (p < 0.1) return 1.0 + 40.0 * p;
            if (p > 0.9) return 5.0 - 40.0 * (p - 0.9);
            return 5.0;
        case TrafficPattern::RAMP:
            return p;
        case TrafficPattern::WAVE:
            return 1.0 + 0.5 * std::sin(2.0 * PI * 3.0 * p);
        default:
            return 1.0;
    }
}
