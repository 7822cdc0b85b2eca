// LogicExecutor.hpp
//
// Runs one full logic pass over the graph: resolve the execution order, run
// every instance's behavior against a tick-scoped output table, and publish
// all resulting changes to the store in a single batched update.
#pragma once
#include "AudioBackend.hpp"
#include "Behavior.hpp"
#include "BlockStore.hpp"
#include "ExecutionOrder.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace BlockFlow {

// Instance id -> port id -> value, for the duration of one tick.
using TickOutputTable = std::unordered_map<InstanceId, ValueMap>;

// Well-known state flags translated into backend envelope calls.
namespace StateFlags {
constexpr const char* EnvelopeNeedsTriggering = "envelopeNeedsTriggering";
constexpr const char* GateChangedToHigh = "gateStateChangedToHigh";
constexpr const char* GateChangedToLow = "gateStateChangedToLow";
} // namespace StateFlags

struct TickReport {
    size_t executed = 0;  // behaviors invoked successfully
    size_t skipped = 0;   // no behavior (backend-managed)
    size_t failed = 0;    // definition missing or behavior threw
    size_t published = 0; // instances in the batched update
    bool cycle = false;
};

class LogicExecutor {
public:
    LogicExecutor(StateStore& store, DefinitionLookup lookup, const BehaviorRegistry& registry,
                  AudioBackend* backend = nullptr);

    void setBackend(AudioBackend* b) { backend = b; }

    TickReport runTick(const BlockContext& context);

    void clearBlockFromCache(const InstanceId& instanceId) { cache.evict(instanceId); }
    void clearCache() { cache.clear(); }
    const BehaviorCache& behaviorCache() const { return cache; }

    // Incoming connection feeding an input port, in connection-set order.
    static const Connection* findIncoming(const std::vector<Connection>& connections,
                                          const InstanceId& instanceId, const PortId& portId);

private:
    std::optional<InstanceUpdate> executeInstance(const BlockInstance& instance,
                                                  const std::vector<Connection>& connections,
                                                  TickOutputTable& table, const BlockContext& context,
                                                  TickReport& report);
    ValueMap resolveInputs(const BlockInstance& instance, const BlockDefinition& definition,
                           const std::vector<Connection>& connections, const TickOutputTable& table) const;
    void applyResourceSideEffects(const BlockInstance& instance, const BlockDefinition& definition,
                                  StateBag& state, const ValueMap& params, const ValueMap& inputs,
                                  const BlockContext& context);
    std::optional<InstanceUpdate> failure(const BlockInstance& instance, TickOutputTable& table,
                                          const std::string& message);

    StateStore& store;
    DefinitionLookup lookup;
    AudioBackend* backend;
    BehaviorCache cache;
    std::vector<InstanceId> lastUnresolved;
    // Errors this executor published; a successful run clears only these.
    std::unordered_map<InstanceId, std::string> ownErrors;
};

} // namespace BlockFlow
