// ExecutionOrder.cpp
#include "ExecutionOrder.hpp"
#include <deque>
#include <unordered_map>

namespace BlockFlow {

ExecutionOrder resolveExecutionOrder(const std::vector<BlockInstance>& instances,
                                     const std::vector<Connection>& connections) {
    ExecutionOrder result;
    if (instances.empty()) return result;

    std::unordered_map<InstanceId, std::vector<InstanceId>> graph;
    std::unordered_map<InstanceId, int> inDegree;
    for (const auto& inst : instances) {
        // duplicate ids mean the model is corrupted, not merely cyclic
        if (!inDegree.emplace(inst.instanceId, 0).second) {
            throw InvariantViolation("Duplicate instance id in graph: " + inst.instanceId);
        }
    }
    for (const auto& conn : connections) {
        if (conn.fromInstance == conn.toInstance) continue; // self-loops are not dependencies
        auto from = inDegree.find(conn.fromInstance);
        auto to = inDegree.find(conn.toInstance);
        if (from == inDegree.end() || to == inDegree.end()) continue;
        graph[conn.fromInstance].push_back(conn.toInstance);
        ++to->second;
    }

    std::deque<InstanceId> queue;
    for (const auto& inst : instances) {
        if (inDegree[inst.instanceId] == 0) queue.push_back(inst.instanceId);
    }

    result.order.reserve(instances.size());
    while (!queue.empty()) {
        InstanceId current = std::move(queue.front());
        queue.pop_front();
        auto edges = graph.find(current);
        if (edges != graph.end()) {
            for (const auto& next : edges->second) {
                if (--inDegree[next] == 0) queue.push_back(next);
            }
        }
        result.order.push_back(std::move(current));
    }

    if (result.order.size() != instances.size()) {
        // Whatever still has in-degree > 0 sits on or behind a cycle.
        for (const auto& inst : instances) {
            if (inDegree[inst.instanceId] > 0) {
                result.unresolved.push_back(inst.instanceId);
                result.order.push_back(inst.instanceId);
            }
        }
    }
    return result;
}

} // namespace BlockFlow
