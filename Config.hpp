// File: Config.hpp
#pragma once

#include "Traffic.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

enum class FailureType {
    NETWORK_PARTITION, SERVICE_FAILURE, UNKNOWN
};

FailureType parseFailureType(const std::string& text);
std::string failureTypeName(FailureType type);

struct FailureScenario {
    FailureType type = FailureType::UNKNOWN;
    std::string type_name;
    std::string component_id;   // informational, the penalty applies system-wide
    double probability = 1.0;   // scales the error penalty
};

struct RunConfig {
    std::string id;
    std::string system_id;
    double duration = 60.0;             // seconds
    int users = 100;
    double requests_per_second = 10.0;
    TrafficPattern traffic_pattern = TrafficPattern::CONSTANT;
    std::vector<FailureScenario> failure_scenarios;

    bool has_seed = false;
    uint64_t seed = 0;
};

// Hourly USD rates of the linear cost model.
struct CostModel {
    double cpu_per_hour = 0.05;          // per 100% of a core
    double memory_per_gb_hour = 0.01;
    double storage_per_gb_hour = 0.001;
    double network_per_mb_hour = 0.02;   // per MB/s of sustained bandwidth

    static CostModel forProvider(const std::string& provider, bool* recognized = nullptr);
};

// Tunable coefficients of the model. The defaults are heuristics, not
// derived from any measurement.
struct EngineParameters {
    int max_steps = 300;
    double latency_jitter_ms = 10.0;
    double cpu_jitter_pct = 5.0;
    double memory_jitter_pct = 2.5;
    double error_rate_cap = 0.5;
    double connection_latency_ms = 2.0;
    int retention_seconds = 3600;
    CostModel cost_model;
    bool verbose = false;
};

enum class ErrorKind {
    INVALID_CONFIG, INVALID_INPUT
};

class SimulationError : public std::runtime_error {
public:
    SimulationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), error_kind(kind) {}

    ErrorKind kind() const { return error_kind; }

private:
    ErrorKind error_kind;
};

// Throws SimulationError(INVALID_CONFIG) describing the first violation.
void validateRunConfig(const RunConfig& config);
void validateEngineParameters(const EngineParameters& params);
