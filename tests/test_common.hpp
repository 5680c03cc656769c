/**
 * @file test_common.hpp
 * @brief Shared CHECK macros and fixtures for the perfsim tests.
 */
#pragma once

#include "Topology.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

/* CHECK macro, safe in Release builds (unlike assert) */
#define CHECK(expr) do { if (!(expr)) { \
    std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
    std::abort(); } } while(0)

#define CHECK_NEAR(a, b, tol) do { double _a = (a), _b = (b); \
    if (std::fabs(_a - _b) > (tol)) { \
    std::fprintf(stderr, "CHECK_NEAR FAILED: %s = %g, %s = %g (%s:%d)\n", \
                 #a, _a, #b, _b, __FILE__, __LINE__); \
    std::abort(); } } while(0)

inline Component makeComponent(const std::string& id, ComponentType type, const std::string& name = "") {
    Component c;
    c.id = id;
    c.type = type;
    c.type_name = componentTypeName(type);
    c.name = name.empty() ? id : name;
    return c;
}

inline Connection makeConnection(const std::string& source, const std::string& target) {
    Connection conn;
    conn.id = source + "->" + target;
    conn.source = source;
    conn.target = target;
    conn.type = "sync";
    return conn;
}

/* lb -> gw -> svc -> db, plus svc -> cache */
inline Topology sampleTopology() {
    Topology topo;
    topo.components = {
        makeComponent("lb", ComponentType::LOAD_BALANCER, "Edge LB"),
        makeComponent("gw", ComponentType::API_GATEWAY, "Gateway"),
        makeComponent("svc", ComponentType::MICROSERVICE, "Orders"),
        makeComponent("db", ComponentType::DATABASE, "Orders DB"),
        makeComponent("cache", ComponentType::CACHE, "Orders Cache")
    };
    topo.connections = {
        makeConnection("lb", "gw"),
        makeConnection("gw", "svc"),
        makeConnection("svc", "db"),
        makeConnection("svc", "cache")
    };
    return topo;
}

/* |n| microservices fed by a single gateway */
inline Topology chainTopology(int n) {
    Topology topo;
    for (int i = 0; i < n; ++i) {
        topo.components.push_back(makeComponent("svc-" + std::to_string(i), ComponentType::MICROSERVICE));
        if (i > 0) topo.connections.push_back(makeConnection("svc-0", "svc-" + std::to_string(i)));
    }
    return topo;
}
