// File: main.cpp
#include "JsonIO.hpp"
#include "Simulation.hpp"
#include "SeriesStore.hpp"
#include <getopt.h>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " --topology FILE [options]\n"
              << "  -t, --topology FILE     system design (components + connections)\n"
              << "  -c, --config FILE       run configuration\n"
              << "  -p, --params FILE       engine parameters\n"
              << "  -s, --seed N            random seed for jitter\n"
              << "  -P, --pattern NAME      constant|gradual|spike|ramp|wave\n"
              << "  -r, --provider NAME     aws|gcp|azure cost rates\n"
              << "  -o, --output FILE       write the result as JSON\n"
              << "  -S, --series-csv FILE   write the step series as CSV\n"
              << "  -T, --stats-csv FILE    write summary statistics as CSV\n"
              << "  -C, --compare           run every traffic pattern and compare\n"
              << "  -v, --verbose           progress output\n";
}

void printComparison(const std::vector<SimulationResult>& results, const std::vector<TrafficPattern>& patterns) {
    std::ostringstream out;
    out << "\n=== Traffic Pattern Comparison ===\n";
    out << std::left << std::setw(25) << "Metric";
    for (auto p : patterns) out << std::setw(14) << trafficPatternName(p);
    out << "\n" << std::string(25 + 14 * patterns.size(), '-') << "\n";

    out << std::fixed << std::setprecision(2);
    auto printRow = [&results, &out](const std::string& metric, double (*value)(const SimulationResult&)) {
        out << std::setw(25) << metric;
        for (const auto& r : results) {
            out << std::setw(14) << value(r);
        }
        out << "\n";
    };

    printRow("Avg Latency (ms)", [](const SimulationResult& r) { return r.metrics.average_latency; });
    printRow("P95 Latency (ms)", [](const SimulationResult& r) { return r.metrics.p95_latency; });
    printRow("P99 Latency (ms)", [](const SimulationResult& r) { return r.metrics.p99_latency; });
    printRow("Avg Throughput (rps)", [](const SimulationResult& r) { return r.metrics.throughput; });
    printRow("Error Rate (%)", [](const SimulationResult& r) { return r.metrics.error_rate * 100.0; });
    printRow("Avg CPU (%)", [](const SimulationResult& r) { return r.metrics.average_cpu; });
    printRow("Estimated Cost ($)", [](const SimulationResult& r) { return r.resources.estimated_cost; });
    printRow("Performance Score", [](const SimulationResult& r) { return r.performance_score; });
    std::cout << out.str();
}

}

int main(int argc, char** argv) {
    std::string topology_path;
    std::string config_path;
    std::string params_path;
    std::string pattern_override;
    std::string provider;
    std::string output_path;
    std::string series_csv;
    std::string stats_csv;
    bool compare = false;
    bool verbose = false;
    bool has_seed = false;
    uint64_t seed = 0;

    static option longopts[] = {
        {"topology", required_argument, 0, 't'},
        {"config", required_argument, 0, 'c'},
        {"params", required_argument, 0, 'p'},
        {"seed", required_argument, 0, 's'},
        {"pattern", required_argument, 0, 'P'},
        {"provider", required_argument, 0, 'r'},
        {"output", required_argument, 0, 'o'},
        {"series-csv", required_argument, 0, 'S'},
        {"stats-csv", required_argument, 0, 'T'},
        {"compare", no_argument, 0, 'C'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt, idx = 0;
    while ((opt = getopt_long(argc, argv, "t:c:p:s:P:r:o:S:T:Cvh", longopts, &idx)) != -1) {
        if (opt == 't') topology_path = optarg;
        else if (opt == 'c') config_path = optarg;
        else if (opt == 'p') params_path = optarg;
        else if (opt == 's') { seed = std::strtoull(optarg, nullptr, 10); has_seed = true; }
        else if (opt == 'P') pattern_override = optarg;
        else if (opt == 'r') provider = optarg;
        else if (opt == 'o') output_path = optarg;
        else if (opt == 'S') series_csv = optarg;
        else if (opt == 'T') stats_csv = optarg;
        else if (opt == 'C') compare = true;
        else if (opt == 'v') verbose = true;
        else if (opt == 'h') { printUsage(argv[0]); return 0; }
        else { printUsage(argv[0]); return 2; }
    }

    if (topology_path.empty()) {
        std::cerr << "Error: --topology is required\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        Topology topology = loadTopology(topology_path);
        RunConfig config = config_path.empty() ? RunConfig{} : loadRunConfig(config_path);
        EngineParameters params = params_path.empty() ? EngineParameters{} : loadEngineParameters(params_path);

        if (has_seed) {
            config.seed = seed;
            config.has_seed = true;
        }
        if (!pattern_override.empty()) {
            bool recognized = true;
            config.traffic_pattern = parseTrafficPattern(pattern_override, &recognized);
            if (!recognized) {
                std::cerr << "Warning: unknown traffic pattern '" << pattern_override << "', using constant\n";
            }
        }
        if (!provider.empty()) {
            bool recognized = true;
            params.cost_model = CostModel::forProvider(provider, &recognized);
            if (!recognized) {
                std::cerr << "Warning: unknown cost provider '" << provider << "', using aws rates\n";
            }
        }
        if (verbose) params.verbose = true;

        SeriesStore store;
        PerformanceSimulator simulator(params, &store);

        std::cout << "Loaded " << topology.components.size() << " components and "
                  << topology.connections.size() << " connections from " << topology_path << "\n";

        if (compare) {
            // One seed for all patterns so only the traffic shape differs.
            if (!config.has_seed) {
                config.seed = static_cast<uint64_t>(std::chrono::system_clock::now().time_since_epoch().count());
                config.has_seed = true;
            }
            const std::vector<TrafficPattern> patterns = {
                TrafficPattern::CONSTANT, TrafficPattern::GRADUAL, TrafficPattern::SPIKE,
                TrafficPattern::RAMP, TrafficPattern::WAVE
            };
            std::vector<SimulationResult> results;
            for (auto p : patterns) {
                RunConfig run = config;
                run.traffic_pattern = p;
                if (!run.id.empty()) run.id += "-" + trafficPatternName(p);
                std::cout << "Running pattern " << trafficPatternName(p) << "...\r" << std::flush;
                results.push_back(simulator.runSimulation(run, topology));
            }
            std::cout << "\nCompleted " << results.size() << " runs (seed " << config.seed << ").\n";
            printComparison(results, patterns);

            if (!output_path.empty()) {
                json arr = json::array();
                for (const auto& r : results) arr.push_back(toJson(r));
                if (!saveJson(arr, output_path)) {
                    std::cerr << "Error: cannot write " << output_path << "\n";
                    return 1;
                }
            }
            return 0;
        }

        SimulationResult result = simulator.runSimulation(config, topology);
        if (!verbose) simulator.printSummary(result);

        if (!output_path.empty() && !saveJson(toJson(result), output_path)) {
            std::cerr << "Error: cannot write " << output_path << "\n";
            return 1;
        }
        if (!series_csv.empty()) {
            std::vector<MetricSample> samples;
            if (!simulator.getSimulationSeries(result.id, samples) ||
                !PerformanceSimulator::saveSeriesCsv(samples, series_csv)) {
                std::cerr << "Error: cannot write " << series_csv << "\n";
                return 1;
            }
        }
        if (!stats_csv.empty() && !PerformanceSimulator::saveStatistics(result, stats_csv)) {
            std::cerr << "Error: cannot write " << stats_csv << "\n";
            return 1;
        }
    } catch (const SimulationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
