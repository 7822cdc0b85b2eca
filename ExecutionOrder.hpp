// ExecutionOrder.hpp
//
// Dependency ordering of block instances (Kahn's algorithm). Cycles do not
// abort: instances the sort cannot place are appended in insertion order and
// reported in `unresolved` so the caller can warn.
#pragma once
#include "BlockTypes.hpp"
#include <vector>

namespace BlockFlow {

struct ExecutionOrder {
    std::vector<InstanceId> order;      // every instance exactly once
    std::vector<InstanceId> unresolved; // cycle members (suffix of order)

    bool hasCycle() const { return !unresolved.empty(); }
};

ExecutionOrder resolveExecutionOrder(const std::vector<BlockInstance>& instances,
                                     const std::vector<Connection>& connections);

} // namespace BlockFlow
