#include "Metrics.hpp"

std::string bottleneckCategoryName(BottleneckCategory category) {
    switch (category) {
        case BottleneckCategory::CPU:        return "cpu";
        case BottleneckCategory::MEMORY:     return "memory";
        case BottleneckCategory::ERROR_RATE: return "error_rate";
        case BottleneckCategory::NETWORK:    return "network";
    }
    return "unknown";
}

std::string severityName(Severity severity) {
    return severity == Severity::HIGH ? "high" : "medium";
}

std::string recommendationCategoryName(RecommendationCategory category) {
    switch (category) {
        case RecommendationCategory::CPU:           return "cpu";
        case RecommendationCategory::MEMORY:        return "memory";
        case RecommendationCategory::ERROR_RATE:    return "error_rate";
        case RecommendationCategory::NETWORK:       return "network";
        case RecommendationCategory::DATABASE:      return "database";
        case RecommendationCategory::CACHING:       return "caching";
        case RecommendationCategory::OBSERVABILITY: return "observability";
    }
    return "unknown";
}
