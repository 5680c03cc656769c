/**
 * @file topology_test.cpp
 * @brief Component type parsing, coefficient tables and topology queries.
 */

#include "Topology.hpp"
#include "test_common.hpp"

#include <cstdio>

static void test_parse_component_type() {
    std::printf("  test_parse_component_type...\n");
    CHECK(parseComponentType("load_balancer") == ComponentType::LOAD_BALANCER);
    CHECK(parseComponentType("api-gateway") == ComponentType::API_GATEWAY);
    CHECK(parseComponentType("API_GATEWAY") == ComponentType::API_GATEWAY);
    CHECK(parseComponentType("Message-Queue") == ComponentType::MESSAGE_QUEUE);
    CHECK(parseComponentType("ml-model") == ComponentType::ML_MODEL);
    CHECK(parseComponentType("cdn") == ComponentType::CDN);
    CHECK(parseComponentType("quantum_router") == ComponentType::UNKNOWN);
    CHECK(parseComponentType("") == ComponentType::UNKNOWN);

    CHECK(componentTypeName(ComponentType::MESSAGE_QUEUE) == "message_queue");
    CHECK(componentTypeName(ComponentType::UNKNOWN) == "unknown");
    std::printf("    type names verified\n");
}

static void test_coefficient_tables() {
    std::printf("  test_coefficient_tables...\n");
    CHECK(baseLatencyMs(ComponentType::LOAD_BALANCER) == 5.0);
    CHECK(baseLatencyMs(ComponentType::API_GATEWAY) == 10.0);
    CHECK(baseLatencyMs(ComponentType::MICROSERVICE) == 50.0);
    CHECK(baseLatencyMs(ComponentType::DATABASE) == 20.0);
    CHECK(baseLatencyMs(ComponentType::CACHE) == 2.0);
    CHECK(baseLatencyMs(ComponentType::MESSAGE_QUEUE) == 5.0);
    CHECK(baseLatencyMs(ComponentType::UNKNOWN) == 30.0);

    CHECK(baseErrorRate(ComponentType::DATABASE) == 0.01);
    CHECK(baseErrorRate(ComponentType::MICROSERVICE) == 0.02);
    CHECK(baseErrorRate(ComponentType::ML_MODEL) == 0.03);
    CHECK(baseErrorRate(ComponentType::CACHE) == 0.001);
    CHECK(baseErrorRate(ComponentType::LOAD_BALANCER) == 0.001);
    CHECK(baseErrorRate(ComponentType::API_GATEWAY) == 0.005);
    CHECK(baseErrorRate(ComponentType::MESSAGE_QUEUE) == 0.005);
    CHECK(baseErrorRate(ComponentType::UNKNOWN) == 0.02);
    std::printf("    defaults verified\n");
}

static void test_topology_queries() {
    std::printf("  test_topology_queries...\n");
    Topology topo = sampleTopology();

    CHECK(!topo.empty());
    CHECK(topo.incomingConnectionCount("lb") == 0);
    CHECK(topo.incomingConnectionCount("gw") == 1);
    CHECK(topo.incomingConnectionCount("cache") == 1);
    CHECK(topo.incomingConnectionCount("missing") == 0);
    CHECK(topo.countOfType(ComponentType::CACHE) == 1);
    CHECK(topo.countOfType(ComponentType::ML_MODEL) == 0);

    const Component* svc = topo.findComponent("svc");
    CHECK(svc != nullptr);
    CHECK(svc->name == "Orders");
    CHECK(topo.findComponent("nope") == nullptr);

    // 5 + 10 + 50 + 20 + 2 plus 2ms for each of the 4 hops
    CHECK_NEAR(topo.baseLatencySum(), 95.0, 1e-9);
    CHECK_NEAR(topo.baseLatencySum(0.0), 87.0, 1e-9);

    Topology empty;
    CHECK(empty.empty());
    CHECK(empty.baseLatencySum() == 0.0);
    std::printf("    queries verified\n");
}

static void test_fan_in_counts_duplicates() {
    std::printf("  test_fan_in_counts_duplicates...\n");
    Topology topo = sampleTopology();
    topo.connections.push_back(makeConnection("gw", "svc"));
    topo.connections.push_back(makeConnection("lb", "svc"));
    CHECK(topo.incomingConnectionCount("svc") == 3);
    std::printf("    flat count verified\n");
}

int main() {
    std::printf("topology_test\n");
    test_parse_component_type();
    test_coefficient_tables();
    test_topology_queries();
    test_fan_in_counts_duplicates();
    std::printf("OK: all topology tests passed\n");
    return 0;
}
