#include "SeriesStore.hpp"
#include <algorithm>
#include <utility>

void SeriesStore::put(const std::string& simulation_id, std::vector<MetricSample> samples) {
    std::lock_guard<std::mutex> lock(mtx);
    series[simulation_id] = std::move(samples);
}

bool SeriesStore::get(const std::string& simulation_id, std::vector<MetricSample>& out) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = series.find(simulation_id);
    if (it == series.end()) return false;
    out = it->second;
    return true;
}

bool SeriesStore::erase(const std::string& simulation_id) {
    std::lock_guard<std::mutex> lock(mtx);
    return series.erase(simulation_id) > 0;
}

size_t SeriesStore::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return series.size();
}

size_t SeriesStore::purgeOlderThan(int max_age_seconds, std::chrono::system_clock::time_point now) {
    int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
    int64_t cutoff = now_ms - static_cast<int64_t>(max_age_seconds) * 1000;

    std::lock_guard<std::mutex> lock(mtx);
    size_t removed = 0;
    for (auto it = series.begin(); it != series.end(); ) {
        const auto& samples = it->second;
        bool expired = samples.empty();
        if (!expired) {
            auto oldest = std::min_element(samples.begin(), samples.end(),
                [](const MetricSample& a, const MetricSample& b) { return a.timestamp < b.timestamp; });
            expired = oldest->timestamp < cutoff;
        }

        if (expired) {
            it = series.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}
