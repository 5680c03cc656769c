#include "JsonIO.hpp"
#include <fstream>
#include <iostream>

namespace {
    SimulationError inputError(const std::string& what, const json::exception& e) {
        return SimulationError(ErrorKind::INVALID_INPUT, what + ": " + e.what());
    }
}

Topology topologyFromJson(const json& j) {
    Topology topo;
    try {
        for (const auto& cj : j.value("components", json::array())) {
            Component c;
            c.id = cj.at("id").get<std::string>();
            c.type_name = cj.value("type", std::string{});
            c.type = parseComponentType(c.type_name);
            c.name = cj.value("name", c.id);
            if (cj.contains("position")) {
                c.position.x = cj["position"].value("x", 0.0);
                c.position.y = cj["position"].value("y", 0.0);
            }
            if (c.type == ComponentType::UNKNOWN) {
                std::cerr << "Warning: component " << c.id << " has unknown type '" << c.type_name
                          << "', using default coefficients\n";
            }
            topo.components.push_back(c);
        }

        for (const auto& kj : j.value("connections", json::array())) {
            Connection conn;
            conn.source = kj.contains("source") ? kj.at("source").get<std::string>() : kj.at("from").get<std::string>();
            conn.target = kj.contains("target") ? kj.at("target").get<std::string>() : kj.at("to").get<std::string>();
            conn.id = kj.value("id", conn.source + "->" + conn.target);
            conn.type = kj.value("type", std::string("sync"));
            topo.connections.push_back(conn);
        }
    } catch (const json::exception& e) {
        throw inputError("invalid topology", e);
    }
    return topo;
}

RunConfig runConfigFromJson(const json& j) {
    RunConfig cfg;
    try {
        cfg.id = j.value("id", std::string{});
        cfg.system_id = j.value("systemId", std::string{});
        cfg.duration = j.value("duration", cfg.duration);
        cfg.users = j.value("users", cfg.users);
        cfg.requests_per_second = j.value("requestsPerSecond", cfg.requests_per_second);

        std::string pattern = j.value("trafficPattern", std::string("constant"));
        bool recognized = true;
        cfg.traffic_pattern = parseTrafficPattern(pattern, &recognized);
        if (!recognized) {
            std::cerr << "Warning: unknown traffic pattern '" << pattern << "', using constant\n";
        }

        for (const auto& fj : j.value("failureScenarios", json::array())) {
            FailureScenario fs;
            fs.type_name = fj.contains("type") ? fj.at("type").get<std::string>()
                                               : fj.value("failureType", std::string{});
            fs.type = parseFailureType(fs.type_name);
            fs.component_id = fj.value("componentId", std::string{});
            fs.probability = fj.value("probability", 1.0);
            if (fs.type == FailureType::UNKNOWN) {
                std::cerr << "Warning: ignoring unknown failure scenario '" << fs.type_name << "'\n";
            }
            cfg.failure_scenarios.push_back(fs);
        }

        if (j.contains("seed") && !j["seed"].is_null()) {
            cfg.seed = j["seed"].get<uint64_t>();
            cfg.has_seed = true;
        }
    } catch (const json::exception& e) {
        throw inputError("invalid run configuration", e);
    }
    return cfg;
}

EngineParameters engineParametersFromJson(const json& j, EngineParameters base) {
    EngineParameters p = base;
    try {
        p.max_steps = j.value("maxSteps", p.max_steps);
        p.latency_jitter_ms = j.value("latencyJitterMs", p.latency_jitter_ms);
        p.cpu_jitter_pct = j.value("cpuJitterPct", p.cpu_jitter_pct);
        p.memory_jitter_pct = j.value("memoryJitterPct", p.memory_jitter_pct);
        p.error_rate_cap = j.value("errorRateCap", p.error_rate_cap);
        p.connection_latency_ms = j.value("connectionLatencyMs", p.connection_latency_ms);
        p.retention_seconds = j.value("retentionSeconds", p.retention_seconds);
        p.verbose = j.value("verbose", p.verbose);

        if (j.contains("provider")) {
            std::string provider = j["provider"].get<std::string>();
            bool recognized = true;
            p.cost_model = CostModel::forProvider(provider, &recognized);
            if (!recognized) {
                std::cerr << "Warning: unknown cost provider '" << provider << "', using aws rates\n";
            }
        }
        if (j.contains("costModel")) {
            const auto& cm = j["costModel"];
            p.cost_model.cpu_per_hour = cm.value("cpuPerHour", p.cost_model.cpu_per_hour);
            p.cost_model.memory_per_gb_hour = cm.value("memoryPerGbHour", p.cost_model.memory_per_gb_hour);
            p.cost_model.storage_per_gb_hour = cm.value("storagePerGbHour", p.cost_model.storage_per_gb_hour);
            p.cost_model.network_per_mb_hour = cm.value("networkPerMbHour", p.cost_model.network_per_mb_hour);
        }
    } catch (const json::exception& e) {
        throw inputError("invalid engine parameters", e);
    }
    return p;
}

json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw SimulationError(ErrorKind::INVALID_INPUT, "cannot open " + path);
    }
    try {
        json j;
        in >> j;
        return j;
    } catch (const json::exception& e) {
        throw inputError("cannot parse " + path, e);
    }
}

Topology loadTopology(const std::string& path) {
    return topologyFromJson(readJsonFile(path));
}

RunConfig loadRunConfig(const std::string& path) {
    return runConfigFromJson(readJsonFile(path));
}

EngineParameters loadEngineParameters(const std::string& path) {
    return engineParametersFromJson(readJsonFile(path));
}

json toJson(const std::vector<MetricSample>& samples) {
    json arr = json::array();
    for (const auto& s : samples) {
        arr.push_back({
            {"timestamp", s.timestamp},
            {"latencyMs", s.latency_ms},
            {"throughputRps", s.throughput_rps},
            {"errorRate", s.error_rate},
            {"cpuPct", s.cpu_pct},
            {"memoryPct", s.memory_pct},
            {"networkKBps", s.network_kbps}
        });
    }
    return arr;
}

json toJson(const Topology& topology) {
    json j;
    j["components"] = json::array();
    for (const auto& c : topology.components) {
        j["components"].push_back({
            {"id", c.id},
            {"type", c.type_name.empty() ? componentTypeName(c.type) : c.type_name},
            {"name", c.name},
            {"position", {{"x", c.position.x}, {"y", c.position.y}}}
        });
    }
    j["connections"] = json::array();
    for (const auto& conn : topology.connections) {
        j["connections"].push_back({
            {"id", conn.id}, {"source", conn.source}, {"target", conn.target}, {"type", conn.type}
        });
    }
    return j;
}

json toJson(const SimulationResult& result) {
    const auto& m = result.metrics;
    const auto& r = result.resources;

    json j;
    j["id"] = result.id;
    j["configId"] = result.config_id;
    j["systemId"] = result.system_id;
    j["seed"] = result.seed;
    j["executedAt"] = result.executed_at;
    j["duration"] = result.duration;
    j["steps"] = result.steps;

    j["metrics"] = {
        {"totalRequests", m.total_requests},
        {"successfulRequests", m.successful_requests},
        {"failedRequests", m.failed_requests},
        {"averageLatency", m.average_latency},
        {"p95Latency", m.p95_latency},
        {"p99Latency", m.p99_latency},
        {"throughput", m.throughput},
        {"errorRate", m.error_rate},
        {"averageCpu", m.average_cpu},
        {"averageMemory", m.average_memory},
        {"averageNetwork", m.average_network}
    };

    j["componentMetrics"] = json::object();
    for (const auto& kv : result.component_metrics) {
        const auto& c = kv.second;
        json bottlenecks = json::array();
        for (const auto& b : c.bottlenecks) bottlenecks.push_back(b.message);
        j["componentMetrics"][kv.first] = {
            {"type", componentTypeName(c.type)},
            {"loadFactor", c.load_factor},
            {"requestsHandled", c.requests_handled},
            {"averageLatency", c.average_latency_ms},
            {"errorRate", c.error_rate},
            {"cpu", c.cpu_pct},
            {"memory", c.memory_pct},
            {"networkIn", c.network_in_kbps},
            {"networkOut", c.network_out_kbps},
            {"bottlenecks", bottlenecks},
            {"recommendations", c.recommendations}
        };
    }

    j["resourceUtilization"] = {
        {"totalCPU", r.total_cpu},
        {"totalMemory", r.total_memory_mb},
        {"totalStorage", r.total_storage_gb},
        {"networkBandwidth", r.network_bandwidth_kbps},
        {"activeConnections", r.active_connections},
        {"hourlyRate", r.hourly_rate},
        {"estimatedCost", r.estimated_cost}
    };

    j["bottlenecks"] = json::array();
    for (const auto& b : result.bottlenecks) {
        json bj = {
            {"componentId", b.component_id},
            {"type", bottleneckCategoryName(b.category)},
            {"severity", severityName(b.severity)},
            {"value", b.value},
            {"description", b.description}
        };
        if (!b.target_id.empty()) bj["targetId"] = b.target_id;
        j["bottlenecks"].push_back(bj);
    }

    j["recommendations"] = json::array();
    for (const auto& rec : result.recommendations) {
        j["recommendations"].push_back({
            {"category", recommendationCategoryName(rec.category)},
            {"advice", rec.advice}
        });
    }

    j["performanceScore"] = result.performance_score;
    return j;
}

bool saveJson(const json& j, const std::string& path) {
    std::ofstream out(path);
    if (!out) return false;
    out << j.dump(2) << "\n";
    return static_cast<bool>(out);
}
