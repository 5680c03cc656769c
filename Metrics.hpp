// File: Metrics.hpp
#pragma once

#include "Topology.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct MetricSample {
    int64_t timestamp = 0;       // epoch milliseconds
    double latency_ms = 0.0;
    double throughput_rps = 0.0;
    double error_rate = 0.0;     // [0,1]
    double cpu_pct = 0.0;        // [0,100]
    double memory_pct = 0.0;     // [0,100]
    double network_kbps = 0.0;
};

struct AggregateMetrics {
    int64_t total_requests = 0;
    int64_t successful_requests = 0;
    int64_t failed_requests = 0;
    double average_latency = 0.0;
    double p95_latency = 0.0;
    double p99_latency = 0.0;
    double throughput = 0.0;
    double error_rate = 0.0;
    double average_cpu = 0.0;
    double average_memory = 0.0;
    double average_network = 0.0;
};

enum class BottleneckCategory {
    CPU, MEMORY, ERROR_RATE, NETWORK
};

enum class Severity {
    MEDIUM, HIGH
};

std::string bottleneckCategoryName(BottleneckCategory category);
std::string severityName(Severity severity);

struct ComponentFinding {
    BottleneckCategory category;
    std::string message;
};

struct ComponentPerformance {
    std::string component_id;
    ComponentType type = ComponentType::UNKNOWN;
    double load_factor = 0.0;
    int64_t requests_handled = 0;
    double average_latency_ms = 0.0;
    double error_rate = 0.0;
    double cpu_pct = 0.0;
    double memory_pct = 0.0;
    double network_in_kbps = 0.0;
    double network_out_kbps = 0.0;
    std::vector<ComponentFinding> bottlenecks;
    std::vector<std::string> recommendations;
};

// A system-level finding. target_id is set only for NETWORK findings, where
// component_id is the source of the connection.
struct Bottleneck {
    BottleneckCategory category;
    Severity severity = Severity::MEDIUM;
    std::string component_id;
    std::string target_id;
    double value = 0.0;
    std::string description;
};

enum class RecommendationCategory {
    CPU, MEMORY, ERROR_RATE, NETWORK, DATABASE, CACHING, OBSERVABILITY
};

std::string recommendationCategoryName(RecommendationCategory category);

struct Recommendation {
    RecommendationCategory category;
    std::string advice;
};

struct ResourceUtilization {
    double total_cpu = 0.0;              // percent
    int64_t total_memory_mb = 0;
    int64_t total_storage_gb = 0;
    int64_t network_bandwidth_kbps = 0;
    int active_connections = 0;
    double hourly_rate = 0.0;            // USD
    double estimated_cost = 0.0;         // USD over the run duration
};

struct SimulationResult {
    std::string id;
    std::string config_id;
    std::string system_id;
    uint64_t seed = 0;
    int64_t executed_at = 0;             // epoch milliseconds
    double duration = 0.0;               // seconds
    int steps = 0;

    AggregateMetrics metrics;
    std::map<std::string, ComponentPerformance> component_metrics;
    ResourceUtilization resources;
    std::vector<Bottleneck> bottlenecks;
    std::vector<Recommendation> recommendations;
    double performance_score = 0.0;
};
