// File: Topology.hpp
#pragma once

#include <string>
#include <vector>

enum class ComponentType {
    LOAD_BALANCER, API_GATEWAY, MICROSERVICE, DATABASE, CACHE,
    MESSAGE_QUEUE, ML_MODEL, CDN, UNKNOWN
};

struct Position {
    double x = 0.0;
    double y = 0.0;
};

struct Component {
    std::string id;
    ComponentType type = ComponentType::UNKNOWN;
    std::string type_name;   // as supplied by the designer
    std::string name;
    Position position;       // cosmetic, not used by the engine
};

struct Connection {
    std::string id;
    std::string source;
    std::string target;
    std::string type;
};

// Accepts "api_gateway", "api-gateway", "API_GATEWAY". Anything else is UNKNOWN.
ComponentType parseComponentType(const std::string& text);
std::string componentTypeName(ComponentType type);

// Static per-type coefficients. Unknown types use the default arm.
double baseLatencyMs(ComponentType type);
double baseErrorRate(ComponentType type);

class Topology {
public:
    std::vector<Component> components;
    std::vector<Connection> connections;

    Topology() = default;
    Topology(std::vector<Component> comps, std::vector<Connection> conns);

    bool empty() const { return components.empty(); }

    const Component* findComponent(const std::string& id) const;
    int incomingConnectionCount(const std::string& id) const;
    int countOfType(ComponentType type) const;

    // Sum of per-type base latency plus the per-hop connection overhead.
    double baseLatencySum(double per_connection_ms = 2.0) const;
};
