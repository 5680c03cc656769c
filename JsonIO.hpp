// File: JsonIO.hpp
#pragma once

#include "Config.hpp"
#include "Metrics.hpp"
#include "Topology.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

// Readers throw SimulationError(INVALID_INPUT) on unreadable files, malformed
// JSON or mistyped fields. Missing optional fields keep their defaults.
Topology topologyFromJson(const json& j);
RunConfig runConfigFromJson(const json& j);
EngineParameters engineParametersFromJson(const json& j, EngineParameters base = EngineParameters{});

json readJsonFile(const std::string& path);
Topology loadTopology(const std::string& path);
RunConfig loadRunConfig(const std::string& path);
EngineParameters loadEngineParameters(const std::string& path);

// camelCase field names throughout.
json toJson(const SimulationResult& result);
json toJson(const std::vector<MetricSample>& samples);
json toJson(const Topology& topology);

bool saveJson(const json& j, const std::string& path);
