// File: SeriesStore.hpp
#pragma once

#include "Metrics.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Keyed in-memory store of per-run step series, shared by concurrent runs.
// Entries live until erased or swept by purgeOlderThan; nothing here runs on
// its own schedule.
class SeriesStore {
public:
    void put(const std::string& simulation_id, std::vector<MetricSample> samples);

    // Copies the series into |out|. Returns false when the id is unknown.
    bool get(const std::string& simulation_id, std::vector<MetricSample>& out) const;

    bool erase(const std::string& simulation_id);
    size_t size() const;

    // Removes entries whose oldest sample is more than |max_age_seconds| older
    // than |now|. Entries without samples are removed as well.
    size_t purgeOlderThan(int max_age_seconds,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::vector<MetricSample>> series;
};
