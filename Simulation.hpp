// File: Simulation.hpp
#pragma once

#include "Config.hpp"
#include "Metrics.hpp"
#include "SeriesStore.hpp"
#include "Topology.hpp"
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

class PerformanceSimulator {
private:
    // Error-rate escalation by instantaneous request rate.
    static constexpr double BASE_ERROR_RATE = 0.01;
    static constexpr double MODERATE_LOAD_RPS = 200.0;
    static constexpr double MODERATE_LOAD_ERROR = 0.02;
    static constexpr double HEAVY_LOAD_RPS = 500.0;
    static constexpr double HEAVY_LOAD_ERROR = 0.03;

    // Failure windows, as fractions of run progress.
    static constexpr double PARTITION_START = 0.3;
    static constexpr double PARTITION_END = 0.7;
    static constexpr double PARTITION_ERROR = 0.10;
    static constexpr double SERVICE_FAILURE_START = 0.5;
    static constexpr double SERVICE_FAILURE_END = 0.6;
    static constexpr double SERVICE_FAILURE_ERROR = 0.20;

    // Per-component rules.
    static constexpr double COMPONENT_CPU_LIMIT = 80.0;
    static constexpr double COMPONENT_MEMORY_LIMIT = 80.0;
    static constexpr double COMPONENT_ERROR_LIMIT = 0.05;
    static constexpr double COMPONENT_ERROR_CEILING = 0.2;

    EngineParameters params;
    SeriesStore* store;

    double jitter(std::mt19937& rng, double half_width) const;
    double stepErrorRate(const RunConfig& config, double rps, double progress) const;
    std::string nextSimulationId() const;

public:
    // |series_store| may be null, in which case step series are not retained.
    explicit PerformanceSimulator(const EngineParameters& parameters = EngineParameters{},
                                  SeriesStore* series_store = nullptr);

    // Runs the whole pipeline. Throws SimulationError on an invalid config.
    // Safe to call concurrently; each run owns its random engine and formats
    // verbose output into its own buffer before writing it out.
    SimulationResult runSimulation(const RunConfig& config, const Topology& topology) const;

    bool getSimulationSeries(const std::string& simulation_id, std::vector<MetricSample>& out) const;
    size_t purgeOlderThan(int max_age_seconds) const;
    size_t purgeExpired() const;

    int stepCount(double duration) const;
    std::vector<MetricSample> generateSeries(const RunConfig& config, const Topology& topology,
                                             std::mt19937& rng, int64_t start_ms) const;
    AggregateMetrics aggregate(const std::vector<MetricSample>& samples,
                               const RunConfig& config, const Topology& topology) const;
    std::map<std::string, ComponentPerformance> analyzeComponents(const RunConfig& config,
                                                                  const Topology& topology) const;
    ResourceUtilization estimateResources(const RunConfig& config, const Topology& topology) const;

    const EngineParameters& getParameters() const { return params; }

    void printSummary(const SimulationResult& result) const;
    static bool saveStatistics(const SimulationResult& result, const std::string& filename);
    static bool saveSeriesCsv(const std::vector<MetricSample>& samples, const std::string& filename);
};
