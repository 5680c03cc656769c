#include "Topology.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

ComponentType parseComponentType(const std::string& text) {
    std::string key;
    key.reserve(text.size());
    for (char c : text) {
        if (c == '-' || c == ' ') key.push_back('_');
        else key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    static const std::unordered_map<std::string, ComponentType> types = {
        {"load_balancer", ComponentType::LOAD_BALANCER},
        {"api_gateway", ComponentType::API_GATEWAY},
        {"microservice", ComponentType::MICROSERVICE},
        {"database", ComponentType::DATABASE},
        {"cache", ComponentType::CACHE},
        {"message_queue", ComponentType::MESSAGE_QUEUE},
        {"ml_model", ComponentType::ML_MODEL},
        {"cdn", ComponentType::CDN}
    };

    auto it = types.find(key);
    return it == types.end() ? ComponentType::UNKNOWN : it->second;
}

std::string componentTypeName(ComponentType type) {
    switch (type) {
        case ComponentType::LOAD_BALANCER: return "load_balancer";
        case ComponentType::API_GATEWAY:   return "api_gateway";
        case ComponentType::MICROSERVICE:  return "microservice";
        case ComponentType::DATABASE:      return "database";
        case ComponentType::CACHE:         return "cache";
        case ComponentType::MESSAGE_QUEUE: return "message_queue";
        case ComponentType::ML_MODEL:      return "ml_model";
        case ComponentType::CDN:           return "cdn";
        default:                           return "unknown";
    }
}

double baseLatencyMs(ComponentType type) {
    switch (type) {
        case ComponentType::LOAD_BALANCER: return 5.0;
        case ComponentType::API_GATEWAY:   return 10.0;
        case ComponentType::MICROSERVICE:  return 50.0;
        case ComponentType::DATABASE:      return 20.0;
        case ComponentType::CACHE:         return 2.0;
        case ComponentType::MESSAGE_QUEUE: return 5.0;
        case ComponentType::ML_MODEL:      return 200.0;
        case ComponentType::CDN:           return 20.0;
        default:                           return 30.0;
    }
}

double baseErrorRate(ComponentType type) {
    switch (type) {
        case ComponentType::LOAD_BALANCER: return 0.001;
        case ComponentType::API_GATEWAY:   return 0.005;
        case ComponentType::MICROSERVICE:  return 0.02;
        case ComponentType::DATABASE:      return 0.01;
        case ComponentType::CACHE:         return 0.001;
        case ComponentType::MESSAGE_QUEUE: return 0.005;
        case ComponentType::ML_MODEL:      return 0.03;
        case ComponentType::CDN:           return 0.005;
        default:                           return 0.02;
    }
}

Topology::Topology(std::vector<Component> comps, std::vector<Connection> conns)
    : components(std::move(comps)), connections(std::move(conns)) {}

const Component* Topology::findComponent(const std::string& id) const {
    for (const auto& c : components) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

int Topology::incomingConnectionCount(const std::string& id) const {
    return static_cast<int>(std::count_if(connections.begin(), connections.end(),
        [&id](const Connection& conn) { return conn.target == id; }));
}

int Topology::countOfType(ComponentType type) const {
    return static_cast<int>(std::count_if(components.begin(), components.end(),
        [type](const Component& c) { return c.type == type; }));
}

double Topology::baseLatencySum(double per_connection_ms) const {
    double total = 0.0;
    for (const auto& c : components) {
        total += baseLatencyMs(c.type);
    }
    return total + per_connection_ms * connections.size();
}
