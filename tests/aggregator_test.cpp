/**
 * @file aggregator_test.cpp
 * @brief Means, nearest-rank percentiles and request-count reconciliation.
 */

#include "Common.hpp"
#include "Simulation.hpp"
#include "test_common.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <random>

static std::vector<MetricSample> latencySeries(const std::vector<double>& latencies, double error_rate) {
    std::vector<MetricSample> samples;
    for (double l : latencies) {
        MetricSample s;
        s.latency_ms = l;
        s.throughput_rps = 10.0;
        s.error_rate = error_rate;
        samples.push_back(s);
    }
    return samples;
}

static void test_nearest_rank_percentiles() {
    std::printf("  test_nearest_rank_percentiles...\n");
    PerformanceSimulator sim;
    Topology topo = sampleTopology();
    RunConfig cfg;

    // 1..100 in descending order, so the aggregator has to sort
    std::vector<double> latencies;
    for (int i = 100; i >= 1; --i) latencies.push_back(i);
    AggregateMetrics m = sim.aggregate(latencySeries(latencies, 0.01), cfg, topo);

    CHECK_NEAR(m.average_latency, 50.5, 1e-9);
    CHECK(m.p95_latency == 96.0);
    CHECK(m.p99_latency == 100.0);
    CHECK_NEAR(m.throughput, 10.0, 1e-12);
    CHECK_NEAR(m.error_rate, 0.01, 1e-12);
    std::printf("    floor(0.95n) and floor(0.99n) indexing verified\n");
}

static void test_single_sample() {
    std::printf("  test_single_sample...\n");
    PerformanceSimulator sim;
    Topology topo = sampleTopology();
    RunConfig cfg;
    AggregateMetrics m = sim.aggregate(latencySeries({42.0}, 0.0), cfg, topo);
    CHECK(m.p95_latency == 42.0);
    CHECK(m.p99_latency == 42.0);
    CHECK(m.average_latency == 42.0);
    std::printf("    single sample verified\n");
}

static void test_request_totals() {
    std::printf("  test_request_totals...\n");
    PerformanceSimulator sim;
    Topology topo = sampleTopology();

    RunConfig cfg;
    cfg.duration = 60.0;
    cfg.users = 100;
    cfg.requests_per_second = 10.0;
    AggregateMetrics m = sim.aggregate(latencySeries({10, 20, 30}, 0.01), cfg, topo);
    CHECK(m.total_requests == 60000);
    CHECK(m.failed_requests == 600);
    CHECK(m.successful_requests == 59400);

    // Awkward rates and counts still reconcile exactly
    std::mt19937 rng(5);
    std::uniform_real_distribution<double> err(0.0, 0.5);
    for (int i = 0; i < 200; ++i) {
        cfg.users = 1 + i;
        cfg.requests_per_second = 0.7 * i;
        cfg.duration = 3.0 + i;
        m = sim.aggregate(latencySeries({10, 20}, err(rng)), cfg, topo);
        CHECK(m.successful_requests + m.failed_requests == m.total_requests);
        CHECK(m.failed_requests >= 0 && m.successful_requests >= 0);
    }
    std::printf("    successful + failed == total\n");
}

static void test_percentiles_within_range() {
    std::printf("  test_percentiles_within_range...\n");
    PerformanceSimulator sim;
    Topology topo = sampleTopology();
    RunConfig cfg;
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> lat(1.0, 900.0);

    for (int n = 1; n <= 300; n += 7) {
        std::vector<double> latencies;
        for (int i = 0; i < n; ++i) latencies.push_back(lat(rng));
        AggregateMetrics m = sim.aggregate(latencySeries(latencies, 0.01), cfg, topo);
        double lo = *std::min_element(latencies.begin(), latencies.end());
        double hi = *std::max_element(latencies.begin(), latencies.end());
        CHECK(0.0 <= m.p95_latency);
        CHECK(m.p95_latency <= m.p99_latency);
        CHECK(m.p95_latency >= lo && m.p99_latency <= hi);
    }
    std::printf("    0 <= p95 <= p99 within sample range\n");
}

static void test_degenerate_inputs() {
    std::printf("  test_degenerate_inputs...\n");
    PerformanceSimulator sim;
    RunConfig cfg;

    AggregateMetrics none = sim.aggregate({}, cfg, sampleTopology());
    CHECK(none.total_requests == 0 && none.average_latency == 0.0 && none.p99_latency == 0.0);

    AggregateMetrics empty = sim.aggregate(latencySeries({0, 0}, 0.0), cfg, Topology{});
    CHECK(empty.total_requests == 0);
    CHECK(empty.successful_requests == 0 && empty.failed_requests == 0);
    std::printf("    zero-valued aggregates verified\n");
}

static void test_request_totals_saturate() {
    std::printf("  test_request_totals_saturate...\n");
    const int64_t max = std::numeric_limits<int64_t>::max();
    CHECK(saturatingRound(1e20) == max);
    CHECK(saturatingRound(-1e20) == std::numeric_limits<int64_t>::min());
    CHECK(saturatingRound(std::numeric_limits<double>::infinity()) == max);
    CHECK(saturatingRound(std::numeric_limits<double>::quiet_NaN()) == 0);
    CHECK(saturatingRound(2.5) == 3);

    PerformanceSimulator sim;
    Topology topo = sampleTopology();
    RunConfig cfg;
    cfg.users = 1000000;
    cfg.requests_per_second = 1e300;

    AggregateMetrics half = sim.aggregate(latencySeries({10.0, 20.0}, 0.5), cfg, topo);
    CHECK(half.total_requests == max);
    CHECK(half.failed_requests > 0 && half.successful_requests > 0);
    CHECK(half.successful_requests + half.failed_requests == max);

    // users * rps overflows to infinity before the duration is applied
    cfg.requests_per_second = 1e308;
    AggregateMetrics all = sim.aggregate(latencySeries({10.0}, 1.0), cfg, topo);
    CHECK(all.total_requests == max);
    CHECK(all.failed_requests == max);
    CHECK(all.successful_requests == 0);
    std::printf("    request counts saturate instead of wrapping\n");
}

int main() {
    std::printf("aggregator_test\n");
    test_nearest_rank_percentiles();
    test_single_sample();
    test_request_totals();
    test_percentiles_within_range();
    test_degenerate_inputs();
    test_request_totals_saturate();
    std::printf("OK: all aggregator tests passed\n");
    return 0;
}
