#include "Config.hpp"
#include <cctype>
#include <cmath>
#include <sstream>

FailureType parseFailureType(const std::string& text) {
    std::string key;
    for (char c : text) {
        if (c == '-') key.push_back('_');
        else key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (key == "network_partition") return FailureType::NETWORK_PARTITION;
    if (key == "service_failure") return FailureType::SERVICE_FAILURE;
    return FailureType::UNKNOWN;
}

std::string failureTypeName(FailureType type) {
    switch (type) {
        case FailureType::NETWORK_PARTITION: return "network_partition";
        case FailureType::SERVICE_FAILURE:   return "service_failure";
        default:                             return "unknown";
    }
}

CostModel CostModel::forProvider(const std::string& provider, bool* recognized) {
    CostModel model;
    bool ok = true;
    if (provider == "aws" || provider.empty()) {
        // defaults
    } else if (provider == "gcp") {
        model.cpu_per_hour = 0.048;
        model.memory_per_gb_hour = 0.009;
        model.storage_per_gb_hour = 0.0009;
    } else if (provider == "azure") {
        model.cpu_per_hour = 0.052;
        model.memory_per_gb_hour = 0.011;
        model.storage_per_gb_hour = 0.0011;
    } else {
        ok = false;
    }
    if (recognized) *recognized = ok;
    return model;
}

void validateRunConfig(const RunConfig& config) {
    std::ostringstream err;
    if (!std::isfinite(config.duration) || config.duration <= 0.0) {
        err << "duration must be a positive number of seconds (got " << config.duration << ")";
    } else if (config.users < 0) {
        err << "users must be non-negative (got " << config.users << ")";
    } else if (!std::isfinite(config.requests_per_second) || config.requests_per_second < 0.0) {
        err << "requestsPerSecond must be non-negative (got " << config.requests_per_second << ")";
    } else {
        for (const auto& fs : config.failure_scenarios) {
            if (!(fs.probability >= 0.0 && fs.probability <= 1.0)) {
                err << "failure scenario '" << fs.type_name
                    << "' probability must lie in [0,1] (got " << fs.probability << ")";
                break;
            }
        }
    }

    std::string message = err.str();
    if (!message.empty()) {
        throw SimulationError(ErrorKind::INVALID_CONFIG, message);
    }
}

void validateEngineParameters(const EngineParameters& params) {
    if (params.max_steps < 1) {
        throw SimulationError(ErrorKind::INVALID_CONFIG, "maxSteps must be at least 1");
    }
    if (params.latency_jitter_ms < 0.0 || params.cpu_jitter_pct < 0.0 || params.memory_jitter_pct < 0.0) {
        throw SimulationError(ErrorKind::INVALID_CONFIG, "jitter widths must be non-negative");
    }
    if (!(params.error_rate_cap >= 0.0 && params.error_rate_cap <= 1.0)) {
        throw SimulationError(ErrorKind::INVALID_CONFIG, "errorRateCap must lie in [0,1]");
    }
    if (params.retention_seconds < 0) {
        throw SimulationError(ErrorKind::INVALID_CONFIG, "retentionSeconds must be non-negative");
    }
}
