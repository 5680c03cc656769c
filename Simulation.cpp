// File: Simulation.cpp
#include "Simulation.hpp"
#include "Bottleneck.hpp"
#include "Common.hpp"
#include "Traffic.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

PerformanceSimulator::PerformanceSimulator(const EngineParameters& parameters, SeriesStore* series_store)
    : params(parameters), store(series_store) {
    validateEngineParameters(params);
}

double PerformanceSimulator::jitter(std::mt19937& rng, double half_width) const {
    if (half_width <= 0.0) return 0.0;
    std::uniform_real_distribution<double> dist(-half_width, half_width);
    return dist(rng);
}

std::string PerformanceSimulator::nextSimulationId() const {
    static std::atomic<uint64_t> counter{0};
    return "sim-" + std::to_string(epochMillis()) + "-" + std::to_string(++counter);
}

int PerformanceSimulator::stepCount(double duration) const {
    double capped = std::min(duration, static_cast<double>(params.max_steps));
    return std::max(1, static_cast<int>(std::floor(capped)));
}

double PerformanceSimulator::stepErrorRate(const RunConfig& config, double rps, double progress) const {
    double error_rate = BASE_ERROR_RATE;
    if (rps > MODERATE_LOAD_RPS) error_rate += MODERATE_LOAD_ERROR;
    if (rps > HEAVY_LOAD_RPS) error_rate += HEAVY_LOAD_ERROR;

    for (const auto& fs : config.failure_scenarios) {
        if (fs.type == FailureType::NETWORK_PARTITION &&
            progress > PARTITION_START && progress < PARTITION_END) {
            error_rate += PARTITION_ERROR * fs.probability;
        } else if (fs.type == FailureType::SERVICE_FAILURE &&
                   progress > SERVICE_FAILURE_START && progress < SERVICE_FAILURE_END) {
            error_rate += SERVICE_FAILURE_ERROR * fs.probability;
        }
    }

    return clampValue(error_rate, 0.0, params.error_rate_cap);
}

std::vector<MetricSample> PerformanceSimulator::generateSeries(const RunConfig& config, const Topology& topology,
                                                               std::mt19937& rng, int64_t start_ms) const {
    const int steps = stepCount(config.duration);
    const double step_duration = config.duration / steps;
    const double base_latency = topology.baseLatencySum(params.connection_latency_ms);

    std::vector<MetricSample> samples;
    samples.reserve(steps);

    for (int s = 0; s < steps; ++s) {
        MetricSample sample;
        sample.timestamp = saturatingRound(static_cast<double>(start_ms) + s * step_duration * 1000.0);

        // Nothing to load in an empty design; keep the series well-formed.
        if (topology.empty()) {
            samples.push_back(sample);
            continue;
        }

        double progress = static_cast<double>(s) / steps;
        double rps = config.requests_per_second * trafficMultiplier(config.traffic_pattern, progress);
        double load_factor = std::max(1.0, rps / 100.0);

        sample.latency_ms = std::max(0.0, base_latency * load_factor + jitter(rng, params.latency_jitter_ms));
        sample.throughput_rps = rps;
        sample.error_rate = stepErrorRate(config, rps, progress);
        sample.cpu_pct = clampValue(rps / 10.0 + jitter(rng, params.cpu_jitter_pct), 0.0, 100.0);
        sample.memory_pct = clampValue(30.0 + rps / 20.0 + jitter(rng, params.memory_jitter_pct), 0.0, 100.0);
        sample.network_kbps = rps * 1.5;

        if (params.verbose && (s % 60 == 0 || s == steps - 1)) {
            std::ostringstream line;
            line << "  Step " << s << "/" << steps
                 << ": rps=" << std::fixed << std::setprecision(1) << rps
                 << " latency=" << sample.latency_ms << "ms"
                 << " errors=" << (sample.error_rate * 100.0) << "%\n";
            std::cout << line.str();
        }

        samples.push_back(sample);
    }

    return samples;
}

AggregateMetrics PerformanceSimulator::aggregate(const std::vector<MetricSample>& samples,
                                                 const RunConfig& config, const Topology& topology) const {
    AggregateMetrics m;
    if (samples.empty()) return m;

    std::vector<double> latencies, throughputs, errors, cpus, memories, networks;
    for (const auto& s : samples) {
        latencies.push_back(s.latency_ms);
        throughputs.push_back(s.throughput_rps);
        errors.push_back(s.error_rate);
        cpus.push_back(s.cpu_pct);
        memories.push_back(s.memory_pct);
        networks.push_back(s.network_kbps);
    }

    m.average_latency = mean(latencies);
    m.throughput = mean(throughputs);
    m.error_rate = mean(errors);
    m.average_cpu = mean(cpus);
    m.average_memory = mean(memories);
    m.average_network = mean(networks);

    std::sort(latencies.begin(), latencies.end());
    m.p95_latency = nearestRankPercentile(latencies, 0.95, m.average_latency);
    m.p99_latency = nearestRankPercentile(latencies, 0.99, m.average_latency);

    // Coarse request count, deliberately not integrated from the sampled series.
    // Saturates rather than wrapping on huge configurations.
    if (!topology.empty()) {
        m.total_requests = saturatingRound(config.users * config.requests_per_second * config.duration);
    }
    m.failed_requests = std::min(m.total_requests,
                                 saturatingRound(static_cast<double>(m.total_requests) * m.error_rate));
    m.successful_requests = m.total_requests - m.failed_requests;

    return m;
}

std::map<std::string, ComponentPerformance> PerformanceSimulator::analyzeComponents(
    const RunConfig& config, const Topology& topology) const
{
    std::map<std::string, ComponentPerformance> result;
    const double rps = config.requests_per_second;

    for (const auto& comp : topology.components) {
        ComponentPerformance perf;
        perf.component_id = comp.id;
        perf.type = comp.type;

        int incoming = topology.incomingConnectionCount(comp.id);
        perf.load_factor = std::min(1.0, 0.3 + 0.2 * incoming + 0.3 * (rps / 100.0));

        perf.requests_handled = saturatingRound(rps * config.duration * perf.load_factor);
        perf.average_latency_ms = std::round(baseLatencyMs(comp.type) * (1.0 + perf.load_factor));
        perf.error_rate = std::min(COMPONENT_ERROR_CEILING, baseErrorRate(comp.type) * (1.0 + perf.load_factor));
        perf.cpu_pct = std::min(100.0, 20.0 + 60.0 * perf.load_factor);
        perf.memory_pct = std::min(100.0, 15.0 + 40.0 * perf.load_factor);
        perf.network_in_kbps = std::round(rps * perf.load_factor * 2.0);
        perf.network_out_kbps = std::round(rps * perf.load_factor * 1.5);

        if (perf.cpu_pct > COMPONENT_CPU_LIMIT) {
            perf.bottlenecks.push_back({BottleneckCategory::CPU, "High CPU usage"});
            perf.recommendations.push_back("Scale " + comp.id + " horizontally or optimize its CPU-intensive work");
        }
        if (perf.memory_pct > COMPONENT_MEMORY_LIMIT) {
            perf.bottlenecks.push_back({BottleneckCategory::MEMORY, "High memory usage"});
            perf.recommendations.push_back("Increase the memory allocation of " + comp.id + " or shrink its working set");
        }
        if (perf.error_rate > COMPONENT_ERROR_LIMIT) {
            perf.bottlenecks.push_back({BottleneckCategory::ERROR_RATE, "High error rate"});
            perf.recommendations.push_back("Add retry logic for " + comp.id + " and investigate the source of its errors");
        }

        result[comp.id] = perf;
    }

    return result;
}

ResourceUtilization PerformanceSimulator::estimateResources(const RunConfig& config, const Topology& topology) const {
    ResourceUtilization res;
    if (topology.empty()) return res;

    const double n = static_cast<double>(topology.components.size());
    const double load = config.requests_per_second / 100.0;

    res.total_cpu = std::min(100.0, 20.0 + 15.0 * n + 20.0 * load);
    res.total_memory_mb = saturatingRound(512.0 + 256.0 * n + 512.0 * load);
    res.total_storage_gb = saturatingRound(10.0 + 5.0 * n + 2.0 * load);
    res.network_bandwidth_kbps = saturatingRound(config.requests_per_second * 2.0);
    res.active_connections = config.users;

    const CostModel& rates = params.cost_model;
    double cpu_cost = (res.total_cpu / 100.0) * rates.cpu_per_hour;
    double memory_cost = (res.total_memory_mb / 1024.0) * rates.memory_per_gb_hour;
    double storage_cost = (res.total_storage_gb / 1024.0) * rates.storage_per_gb_hour;
    double network_cost = (res.network_bandwidth_kbps / 1024.0) * rates.network_per_mb_hour;

    double hourly = cpu_cost + memory_cost + storage_cost + network_cost;
    res.hourly_rate = roundTo(hourly, 2);
    res.estimated_cost = roundTo(hourly * (config.duration / 3600.0), 2);

    return res;
}

SimulationResult PerformanceSimulator::runSimulation(const RunConfig& config, const Topology& topology) const {
    validateRunConfig(config);

    SimulationResult result;
    result.id = config.id.empty() ? nextSimulationId() : config.id;
    result.config_id = config.id;
    result.system_id = config.system_id;
    result.duration = config.duration;
    result.seed = config.has_seed ? config.seed
        : static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
    result.executed_at = epochMillis();

    if (params.verbose) {
        std::ostringstream banner;
        banner << "=== Starting Performance Simulation ===\n";
        banner << "Simulation " << result.id << " (system " << config.system_id << ")\n";
        banner << "Components: " << topology.components.size()
               << ", Connections: " << topology.connections.size()
               << ", Pattern: " << trafficPatternName(config.traffic_pattern)
               << ", Duration: " << config.duration << "s, Seed: " << result.seed << "\n";
        if (topology.empty()) {
            banner << "Empty topology, producing a zero-valued result\n";
        }
        std::cout << banner.str();
    }

    std::mt19937 rng(static_cast<std::mt19937::result_type>(result.seed));
    std::vector<MetricSample> samples = generateSeries(config, topology, rng, result.executed_at);
    result.steps = static_cast<int>(samples.size());

    result.metrics = aggregate(samples, config, topology);
    result.component_metrics = analyzeComponents(config, topology);
    result.bottlenecks = detectBottlenecks(result.component_metrics, topology);
    result.recommendations = synthesizeRecommendations(result.bottlenecks, result.component_metrics, topology);
    result.resources = estimateResources(config, topology);
    result.performance_score = calculatePerformanceScore(
        result.metrics, config.duration, countComponentBottlenecks(result.component_metrics));

    if (store) {
        store->put(result.id, std::move(samples));
    }

    if (params.verbose) {
        printSummary(result);
        std::cout << "\n=== Simulation Complete ===\n";
    }

    return result;
}

bool PerformanceSimulator::getSimulationSeries(const std::string& simulation_id,
                                               std::vector<MetricSample>& out) const {
    if (!store) return false;
    return store->get(simulation_id, out);
}

size_t PerformanceSimulator::purgeOlderThan(int max_age_seconds) const {
    if (!store) return 0;
    size_t removed = store->purgeOlderThan(max_age_seconds);
    if (params.verbose && removed > 0) {
        std::cout << "Purged " << removed << " simulation series older than " << max_age_seconds << "s\n";
    }
    return removed;
}

size_t PerformanceSimulator::purgeExpired() const {
    return purgeOlderThan(params.retention_seconds);
}

void PerformanceSimulator::printSummary(const SimulationResult& result) const {
    const auto& m = result.metrics;
    const auto& r = result.resources;
    std::ostringstream out;

    out << "\n=== Final Statistics ===\n";
    out << "Steps Simulated: " << result.steps << "\n";
    out << "Total Requests: " << m.total_requests << "\n";
    out << "Successful Requests: " << m.successful_requests << "\n";
    out << "Failed Requests: " << m.failed_requests << "\n";
    out << "Average Latency: " << m.average_latency << " ms\n";
    out << "P95 Latency: " << m.p95_latency << " ms\n";
    out << "P99 Latency: " << m.p99_latency << " ms\n";
    out << "Throughput: " << m.throughput << " req/s\n";
    out << "Error Rate: " << (m.error_rate * 100.0) << "%\n";
    out << "Total CPU: " << r.total_cpu << "%\n";
    out << "Total Memory: " << r.total_memory_mb << " MB\n";
    out << "Total Storage: " << r.total_storage_gb << " GB\n";
    out << "Network Bandwidth: " << r.network_bandwidth_kbps << " KB/s\n";
    out << "Hourly Rate: $" << r.hourly_rate << "\n";
    out << "Estimated Cost: $" << r.estimated_cost << "\n";
    out << "Performance Score: " << result.performance_score << "/100\n";

    out << "\n--- Components ---\n";
    for (const auto& kv : result.component_metrics) {
        const auto& c = kv.second;
        out << std::left << std::setw(20) << c.component_id
            << std::setw(16) << componentTypeName(c.type)
            << "CPU " << std::setw(8) << c.cpu_pct
            << "Mem " << std::setw(8) << c.memory_pct
            << "Lat " << std::setw(8) << c.average_latency_ms
            << "Err " << (c.error_rate * 100.0) << "%";
        for (const auto& b : c.bottlenecks) out << " [" << b.message << "]";
        out << "\n";
    }

    if (!result.bottlenecks.empty()) {
        out << "\n--- Bottlenecks ---\n";
        for (const auto& b : result.bottlenecks) {
            out << "  (" << severityName(b.severity) << ") " << b.description << "\n";
        }
    }
    if (!result.recommendations.empty()) {
        out << "\n--- Recommendations ---\n";
        for (const auto& rec : result.recommendations) {
            out << "  - " << rec.advice << "\n";
        }
    }

    std::cout << out.str();
}

bool PerformanceSimulator::saveSeriesCsv(const std::vector<MetricSample>& samples, const std::string& filename) {
    std::ofstream out(filename);
    if (!out) return false;

    out << "Timestamp,LatencyMs,ThroughputRps,ErrorRate,CpuPct,MemoryPct,NetworkKBps\n";
    for (const auto& s : samples) {
        out << s.timestamp << ","
            << s.latency_ms << ","
            << s.throughput_rps << ","
            << s.error_rate << ","
            << s.cpu_pct << ","
            << s.memory_pct << ","
            << s.network_kbps << "\n";
    }
    return static_cast<bool>(out);
}

bool PerformanceSimulator::saveStatistics(const SimulationResult& result, const std::string& filename) {
    std::ofstream out(filename);
    if (!out) return false;

    const auto& m = result.metrics;
    const auto& r = result.resources;
    out << "Metric,Value\n"
        << "Simulation_ID," << result.id << "\n"
        << "Steps," << result.steps << "\n"
        << "Total_Requests," << m.total_requests << "\n"
        << "Successful_Requests," << m.successful_requests << "\n"
        << "Failed_Requests," << m.failed_requests << "\n"
        << "Avg_Latency_Ms," << m.average_latency << "\n"
        << "P95_Latency_Ms," << m.p95_latency << "\n"
        << "P99_Latency_Ms," << m.p99_latency << "\n"
        << "Throughput_Rps," << m.throughput << "\n"
        << "Error_Rate," << m.error_rate << "\n"
        << "Total_CPU_Pct," << r.total_cpu << "\n"
        << "Total_Memory_MB," << r.total_memory_mb << "\n"
        << "Total_Storage_GB," << r.total_storage_gb << "\n"
        << "Network_Bandwidth_KBps," << r.network_bandwidth_kbps << "\n"
        << "Active_Connections," << r.active_connections << "\n"
        << "Hourly_Rate_USD," << r.hourly_rate << "\n"
        << "Estimated_Cost_USD," << r.estimated_cost << "\n"
        << "Bottlenecks," << result.bottlenecks.size() << "\n"
        << "Performance_Score," << result.performance_score << "\n";
    return static_cast<bool>(out);
}
