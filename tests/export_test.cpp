/**
 * @file export_test.cpp
 * @brief CSV exports of the step series and the summary statistics.
 */

#include "Simulation.hpp"
#include "test_common.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

static std::vector<std::string> readLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static int fieldCount(const std::string& line) {
    int fields = 1;
    for (char c : line) {
        if (c == ',') ++fields;
    }
    return fields;
}

static SimulationResult seededRun(SeriesStore& store) {
    PerformanceSimulator sim(EngineParameters{}, &store);
    RunConfig cfg;
    cfg.id = "export";
    cfg.has_seed = true;
    cfg.seed = 17;
    return sim.runSimulation(cfg, sampleTopology());
}

static void test_series_csv() {
    std::printf("  test_series_csv...\n");
    SeriesStore store;
    SimulationResult r = seededRun(store);
    std::vector<MetricSample> samples;
    CHECK(store.get(r.id, samples));

    const std::string path = "export_test_series.csv";
    CHECK(PerformanceSimulator::saveSeriesCsv(samples, path));
    std::vector<std::string> lines = readLines(path);
    std::remove(path.c_str());

    CHECK(lines.size() == static_cast<size_t>(r.steps) + 1);
    CHECK(lines[0] == "Timestamp,LatencyMs,ThroughputRps,ErrorRate,CpuPct,MemoryPct,NetworkKBps");
    for (size_t i = 1; i < lines.size(); ++i) CHECK(fieldCount(lines[i]) == 7);

    std::ostringstream first;
    first << samples[0].timestamp << ",";
    CHECK(lines[1].compare(0, first.str().size(), first.str()) == 0);
    std::printf("    %zu rows written\n", lines.size() - 1);
}

static void test_statistics_csv() {
    std::printf("  test_statistics_csv...\n");
    SeriesStore store;
    SimulationResult r = seededRun(store);

    const std::string path = "export_test_stats.csv";
    CHECK(PerformanceSimulator::saveStatistics(r, path));
    std::vector<std::string> lines = readLines(path);
    std::remove(path.c_str());

    CHECK(!lines.empty());
    CHECK(lines[0] == "Metric,Value");
    CHECK(lines[1] == "Simulation_ID,export");

    bool total = false, steps = false, score = false;
    for (const auto& line : lines) {
        CHECK(fieldCount(line) == 2);
        if (line == "Total_Requests,60000") total = true;
        if (line == "Steps,60") steps = true;
        if (line == "Performance_Score,80") score = true;
    }
    CHECK(total && steps && score);
    std::printf("    %zu metric rows written\n", lines.size() - 1);
}

static void test_unwritable_path() {
    std::printf("  test_unwritable_path...\n");
    SeriesStore store;
    SimulationResult r = seededRun(store);
    std::vector<MetricSample> samples;
    CHECK(store.get(r.id, samples));

    CHECK(!PerformanceSimulator::saveSeriesCsv(samples, "/nonexistent/dir/series.csv"));
    CHECK(!PerformanceSimulator::saveStatistics(r, "/nonexistent/dir/stats.csv"));
    std::printf("    open failures reported\n");
}

int main() {
    std::printf("export_test\n");
    test_series_csv();
    test_statistics_csv();
    test_unwritable_path();
    std::printf("OK: all export tests passed\n");
    return 0;
}
