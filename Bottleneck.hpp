// File: Bottleneck.hpp
#pragma once

#include "Metrics.hpp"
#include "Topology.hpp"
#include <map>
#include <string>
#include <vector>

// System-level thresholds. Stricter on error rate than the per-component rules.
struct BottleneckThresholds {
    double cpu_pct = 80.0;
    double memory_pct = 80.0;
    double error_rate = 0.1;
    double network_out_kbps = 1000.0;
};

// Flat scan of the component map, then of each connection independently,
// looking up the source component's outbound traffic.
std::vector<Bottleneck> detectBottlenecks(
    const std::map<std::string, ComponentPerformance>& components,
    const Topology& topology,
    const BottleneckThresholds& thresholds = BottleneckThresholds{});

// At most one recommendation per category, in category order of first
// appearance: findings first, then the structural heuristics.
std::vector<Recommendation> synthesizeRecommendations(
    const std::vector<Bottleneck>& bottlenecks,
    const std::map<std::string, ComponentPerformance>& components,
    const Topology& topology);

std::string adviceFor(RecommendationCategory category);

int countComponentBottlenecks(const std::map<std::string, ComponentPerformance>& components);

// 100 minus latency, error-rate, throughput-shortfall and bottleneck
// deductions, clamped to [0,100].
double calculatePerformanceScore(const AggregateMetrics& metrics, double duration, int bottleneck_count);
