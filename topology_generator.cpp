// File: topology_generator.cpp
#include "JsonIO.hpp"
#include "Topology.hpp"
#include <cstdlib>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace std;

const vector<string> SERVICE_NAMES = {
    "UserService",
    "OrderService",
    "PaymentService",
    "InventoryService",
    "SearchService",
    "NotificationService",
    "CatalogService",
    "ReviewService",
    "ShippingService",
    "AuthService"
};

const vector<string> STORE_TYPES = {
    "database",
    "cache",
    "message_queue"
};

mt19937 gen;

Component makeComponent(const string& id, const string& type, const string& name, int layer, int slot) {
    Component c;
    c.id = id;
    c.type_name = type;
    c.type = parseComponentType(type);
    c.name = name;
    c.position.x = 200.0 * slot;
    c.position.y = 150.0 * layer;
    return c;
}

Connection makeConnection(const string& source, const string& target, const string& type) {
    Connection conn;
    conn.id = source + "->" + target;
    conn.source = source;
    conn.target = target;
    conn.type = type;
    return conn;
}

Topology generateTopology(int service_count) {
    Topology topo;
    topo.components.push_back(makeComponent("lb-1", "load_balancer", "Edge Load Balancer", 0, 0));
    topo.components.push_back(makeComponent("gw-1", "api_gateway", "API Gateway", 1, 0));
    topo.connections.push_back(makeConnection("lb-1", "gw-1", "sync"));

    uniform_int_distribution<> store_dist(0, STORE_TYPES.size() - 1);
    uniform_int_distribution<> percent(0, 99);
    map<string, int> name_uses;
    int store_count = 0;

    for (int i = 0; i < service_count; i++) {
        string base = SERVICE_NAMES[i % SERVICE_NAMES.size()];
        int use = ++name_uses[base];
        string name = use > 1 ? base + " " + to_string(use) : base;
        string id = "svc-" + to_string(i + 1);

        // One in ten services is a model endpoint
        string type = (percent(gen) < 10) ? "ml_model" : "microservice";
        topo.components.push_back(makeComponent(id, type, name, 2, i));
        topo.connections.push_back(makeConnection("gw-1", id, "sync"));

        // 60% chance of a backing store per service
        if (percent(gen) < 60) {
            string store_type = STORE_TYPES[store_dist(gen)];
            string store_id = store_type.substr(0, 2) + "-" + to_string(++store_count);
            topo.components.push_back(makeComponent(store_id, store_type, name + " " + store_type, 3, i));
            string conn_type = store_type == "message_queue" ? "async" : store_type;
            topo.connections.push_back(makeConnection(id, store_id, conn_type));
        }

        // 25% chance of calling the previous service
        if (i > 0 && percent(gen) < 25) {
            topo.connections.push_back(makeConnection(id, "svc-" + to_string(i), "sync"));
        }
    }

    return topo;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        cout << "Usage: " << argv[0] << " <service-count> [seed]\n";
        return 1;
    }

    int count = atoi(argv[1]);
    if (count <= 0) {
        cout << "Invalid count. Exiting.\n";
        return 1;
    }
    if (argc > 2) {
        gen.seed(static_cast<mt19937::result_type>(strtoul(argv[2], nullptr, 10)));
    } else {
        random_device rd;
        gen.seed(rd());
    }

    Topology topo = generateTopology(count);

    string filename = "topology_" + to_string(count) + ".json";
    if (!saveJson(toJson(topo), filename)) {
        cout << "Error creating output file.\n";
        return 1;
    }

    cout << "Generated " << topo.components.size() << " components and "
         << topo.connections.size() << " connections in " << filename << "\n";

    map<string, int> type_distribution;
    for (const auto& c : topo.components) {
        type_distribution[componentTypeName(c.type)]++;
    }

    cout << "\nComponent Type Distribution:\n";
    for (const auto& kv : type_distribution) {
        cout << "  " << kv.first << ": " << kv.second << "\n";
    }

    return 0;
}
