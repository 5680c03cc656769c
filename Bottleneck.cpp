#include "Bottleneck.hpp"
#include "Common.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace {
    const double SEVERITY_HIGH_RATIO = 1.2;
    const double DATABASE_CPU_THRESHOLD = 70.0;
    const size_t CACHE_SUGGESTION_MIN_COMPONENTS = 4;
    const size_t OBSERVABILITY_MIN_FINDINGS = 3;

    Severity severityFor(double value, double threshold) {
        return value >= threshold * SEVERITY_HIGH_RATIO ? Severity::HIGH : Severity::MEDIUM;
    }

    RecommendationCategory recommendationFor(BottleneckCategory category) {
        switch (category) {
            case BottleneckCategory::CPU:        return RecommendationCategory::CPU;
            case BottleneckCategory::MEMORY:     return RecommendationCategory::MEMORY;
            case BottleneckCategory::ERROR_RATE: return RecommendationCategory::ERROR_RATE;
            case BottleneckCategory::NETWORK:    return RecommendationCategory::NETWORK;
        }
        return RecommendationCategory::OBSERVABILITY;
    }

    std::string describeComponent(const ComponentPerformance& perf, const Topology& topology) {
        const Component* comp = topology.findComponent(perf.component_id);
        if (comp && !comp->name.empty() && comp->name != comp->id) {
            return comp->name + " (" + comp->id + ")";
        }
        return perf.component_id;
    }
}

std::vector<Bottleneck> detectBottlenecks(
    const std::map<std::string, ComponentPerformance>& components,
    const Topology& topology,
    const BottleneckThresholds& thresholds)
{
    std::vector<Bottleneck> found;

    for (const auto& kv : components) {
        const ComponentPerformance& perf = kv.second;
        std::string who = describeComponent(perf, topology);

        if (perf.cpu_pct > thresholds.cpu_pct) {
            std::ostringstream msg;
            msg << who << ": high CPU usage at " << std::fixed << std::setprecision(1) << perf.cpu_pct << "%";
            found.push_back({BottleneckCategory::CPU, severityFor(perf.cpu_pct, thresholds.cpu_pct),
                             perf.component_id, "", perf.cpu_pct, msg.str()});
        }
        if (perf.memory_pct > thresholds.memory_pct) {
            std::ostringstream msg;
            msg << who << ": high memory usage at " << std::fixed << std::setprecision(1) << perf.memory_pct << "%";
            found.push_back({BottleneckCategory::MEMORY, severityFor(perf.memory_pct, thresholds.memory_pct),
                             perf.component_id, "", perf.memory_pct, msg.str()});
        }
        if (perf.error_rate > thresholds.error_rate) {
            std::ostringstream msg;
            msg << who << ": high error rate at " << std::fixed << std::setprecision(1)
                << (perf.error_rate * 100.0) << "%";
            found.push_back({BottleneckCategory::ERROR_RATE, severityFor(perf.error_rate, thresholds.error_rate),
                             perf.component_id, "", perf.error_rate, msg.str()});
        }
    }

    for (const auto& conn : topology.connections) {
        auto it = components.find(conn.source);
        if (it == components.end()) continue;

        double out = it->second.network_out_kbps;
        if (out > thresholds.network_out_kbps) {
            std::ostringstream msg;
            msg << "High network traffic from " << conn.source << " to " << conn.target
                << ": " << std::fixed << std::setprecision(0) << out << " KB/s";
            found.push_back({BottleneckCategory::NETWORK, severityFor(out, thresholds.network_out_kbps),
                             conn.source, conn.target, out, msg.str()});
        }
    }

    return found;
}

std::string adviceFor(RecommendationCategory category) {
    switch (category) {
        case RecommendationCategory::CPU:
            return "Enable horizontal autoscaling for CPU-bound components and optimize their hot algorithms";
        case RecommendationCategory::MEMORY:
            return "Cache frequently accessed data and raise memory limits on memory-bound components";
        case RecommendationCategory::ERROR_RATE:
            return "Add circuit breakers and retries with exponential backoff around failing dependencies";
        case RecommendationCategory::NETWORK:
            return "Compress payloads, reduce response sizes and use connection pooling on high-traffic links";
        case RecommendationCategory::DATABASE:
            return "Add database read replicas and connection pooling to relieve database CPU load";
        case RecommendationCategory::CACHING:
            return "Add a caching layer in front of frequently read services and data stores";
        case RecommendationCategory::OBSERVABILITY:
            return "Adopt a service mesh with distributed tracing to follow cross-component bottlenecks";
    }
    return "";
}

std::vector<Recommendation> synthesizeRecommendations(
    const std::vector<Bottleneck>& bottlenecks,
    const std::map<std::string, ComponentPerformance>& components,
    const Topology& topology)
{
    std::vector<Recommendation> recs;
    std::unordered_set<int> seen;

    auto add = [&](RecommendationCategory category) {
        if (seen.insert(static_cast<int>(category)).second) {
            recs.push_back({category, adviceFor(category)});
        }
    };

    for (const auto& b : bottlenecks) {
        add(recommendationFor(b.category));
    }

    for (const auto& kv : components) {
        if (kv.second.type == ComponentType::DATABASE && kv.second.cpu_pct > DATABASE_CPU_THRESHOLD) {
            add(RecommendationCategory::DATABASE);
            break;
        }
    }

    if (topology.components.size() >= CACHE_SUGGESTION_MIN_COMPONENTS &&
        topology.countOfType(ComponentType::CACHE) == 0) {
        add(RecommendationCategory::CACHING);
    }

    if (bottlenecks.size() >= OBSERVABILITY_MIN_FINDINGS) {
        add(RecommendationCategory::OBSERVABILITY);
    }

    return recs;
}

int countComponentBottlenecks(const std::map<std::string, ComponentPerformance>& components) {
    int count = 0;
    for (const auto& kv : components) {
        count += static_cast<int>(kv.second.bottlenecks.size());
    }
    return count;
}

double calculatePerformanceScore(const AggregateMetrics& metrics, double duration, int bottleneck_count) {
    double score = 100.0;

    if (metrics.average_latency > 500.0) score -= 20.0;
    else if (metrics.average_latency > 200.0) score -= 10.0;

    if (metrics.error_rate > 0.1) score -= 30.0;
    else if (metrics.error_rate > 0.05) score -= 15.0;

    double expected = duration > 0.0 ? static_cast<double>(metrics.total_requests) / duration : 0.0;
    if (metrics.throughput < 0.8 * expected) score -= 20.0;

    score -= 5.0 * bottleneck_count;

    return clampValue(score, 0.0, 100.0);
}
