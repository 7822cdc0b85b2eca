// LogicExecutor.cpp
//
// Per-instance steps: input resolution with type defaults, parameter snapshot,
// invocation of the cached behavior, output assembly, shallow state merge,
// state-flag side effects on the backend, and failure isolation. Only
// instances whose error, outputs or state changed are published.
#include "LogicExecutor.hpp"
#include "Log.hpp"
#include <unordered_set>

namespace BlockFlow {

namespace {
const char* kComponent = "LogicExecutor";

bool readParam(const ValueMap& params, const char* id, double& out) {
    auto it = params.find(id);
    if (it == params.end()) return false;
    out = toNumber(it->second);
    return true;
}

bool flagSet(const StateBag& state, const char* key) {
    auto it = state.find(key);
    return it != state.end() && toBool(it->second);
}
} // namespace

LogicExecutor::LogicExecutor(StateStore& store, DefinitionLookup lookup, const BehaviorRegistry& registry,
                             AudioBackend* backend)
    : store(store), lookup(std::move(lookup)), backend(backend), cache(registry) {}

const Connection* LogicExecutor::findIncoming(const std::vector<Connection>& connections,
                                              const InstanceId& instanceId, const PortId& portId) {
    for (const auto& c : connections) {
        if (c.toInstance == instanceId && c.toPort == portId) return &c;
    }
    return nullptr;
}

TickReport LogicExecutor::runTick(const BlockContext& context) {
    TickReport report;
    const std::vector<BlockInstance> instances = store.getInstances();
    const std::vector<Connection> connections = store.getConnections();

    ExecutionOrder order = resolveExecutionOrder(instances, connections);
    report.cycle = order.hasCycle();
    if (order.unresolved != lastUnresolved) {
        if (order.hasCycle()) {
            std::string ids;
            for (const auto& id : order.unresolved) ids += (ids.empty() ? "" : ", ") + id;
            log::warn(kComponent, "cycle in block graph; executing in insertion order: {}", ids);
        } else if (!lastUnresolved.empty()) {
            log::info(kComponent, "block graph is acyclic again");
        }
        lastUnresolved = order.unresolved;
    }

    std::unordered_map<InstanceId, const BlockInstance*> byId;
    TickOutputTable table;
    for (const auto& inst : instances) {
        byId[inst.instanceId] = &inst;
        table[inst.instanceId] = inst.lastRunOutputs;
    }

    std::vector<InstanceUpdate> updates;
    for (const auto& id : order.order) {
        auto it = byId.find(id);
        if (it == byId.end()) {
            throw InvariantViolation("Execution order names unknown instance " + id);
        }
        auto update = executeInstance(*it->second, connections, table, context, report);
        if (update) updates.push_back(std::move(*update));
    }

    // Compiled behaviors of deleted instances are released with them.
    std::unordered_set<InstanceId> live;
    for (const auto& inst : instances) live.insert(inst.instanceId);
    cache.retainOnly(live);
    for (auto it = ownErrors.begin(); it != ownErrors.end();) {
        if (live.count(it->first)) ++it;
        else it = ownErrors.erase(it);
    }

    report.published = updates.size();
    if (!updates.empty()) store.updateInstances(updates);
    return report;
}

ValueMap LogicExecutor::resolveInputs(const BlockInstance& instance, const BlockDefinition& definition,
                                      const std::vector<Connection>& connections,
                                      const TickOutputTable& table) const {
    ValueMap inputs;
    for (const auto& port : definition.inputs) {
        Value value = defaultValueFor(port.type);
        if (const Connection* conn = findIncoming(connections, instance.instanceId, port.id)) {
            auto src = table.find(conn->fromInstance);
            if (src != table.end()) {
                auto v = src->second.find(conn->fromPort);
                if (v != src->second.end() && !isNull(v->second)) value = v->second;
            }
        }
        inputs[port.id] = std::move(value);
    }
    return inputs;
}

std::optional<InstanceUpdate> LogicExecutor::failure(const BlockInstance& instance, TickOutputTable& table,
                                                     const std::string& message) {
    table[instance.instanceId] = ValueMap{};
    ownErrors[instance.instanceId] = message;
    if (instance.error != message) store.addLog(instance.instanceId, message);
    if (instance.error == message && instance.lastRunOutputs.empty()) return std::nullopt;
    InstancePatch patch;
    patch.error = message;
    patch.lastRunOutputs = ValueMap{};
    return InstanceUpdate{instance.instanceId, patch};
}

std::optional<InstanceUpdate> LogicExecutor::executeInstance(const BlockInstance& instance,
                                                             const std::vector<Connection>& connections,
                                                             TickOutputTable& table,
                                                             const BlockContext& context, TickReport& report) {
    DefinitionPtr definition = lookup(instance);
    if (!definition) {
        ++report.failed;
        return failure(instance, table, "Error: Definition " + instance.definitionId + " not found.");
    }
    if (!definition->hasBehavior()) {
        ++report.skipped;
        return std::nullopt;
    }

    const ValueMap inputs = resolveInputs(instance, *definition, connections, table);
    try {
        const ValueMap params = instance.parameters;
        const BlockBehavior& behavior = cache.get(instance.instanceId, definition->behaviorId);

        ValueMap produced;
        const OutputSetter setOutput = [&produced](const PortId& port, Value v) { produced[port] = std::move(v); };
        const InstanceId id = instance.instanceId;
        const BlockLogger logger = [this, id](const std::string& message) { store.addLog(id, message); };
        const MessageSender postMessage = [this, id](const nlohmann::json& payload) {
            if (backend) backend->sendMessage(id, payload);
            else log::warn(kComponent, "message for {} dropped: no audio backend", id);
        };

        BehaviorCall call{inputs, params, instance.internalState, setOutput, logger, context, postMessage};
        StateBag partial = behavior(call);

        ValueMap outputs;
        for (const auto& port : definition->outputs) {
            auto v = produced.find(port.id);
            outputs[port.id] = (v != produced.end() && !isNull(v->second)) ? v->second : defaultValueFor(port.type);
        }
        table[instance.instanceId] = outputs;

        StateBag state = instance.internalState;
        mergeState(state, partial);
        applyResourceSideEffects(instance, *definition, state, params, inputs, context);

        ++report.executed;
        // Errors raised elsewhere (node setup) stay until their owner clears them.
        bool clearError = false;
        auto own = ownErrors.find(instance.instanceId);
        if (own != ownErrors.end()) {
            clearError = instance.error == own->second;
            ownErrors.erase(own);
        }
        const bool changed = clearError || outputs != instance.lastRunOutputs || state != instance.internalState;
        if (!changed) return std::nullopt;
        InstancePatch patch;
        patch.internalState = std::move(state);
        patch.lastRunOutputs = std::move(outputs);
        if (clearError) patch.error = std::optional<std::string>{};
        return InstanceUpdate{instance.instanceId, patch};
    } catch (const InvariantViolation&) {
        throw;
    } catch (const std::exception& e) {
        ++report.failed;
        return failure(instance, table, "Runtime error in '" + instance.name + "': " + e.what());
    } catch (...) {
        ++report.failed;
        return failure(instance, table, "Runtime error in '" + instance.name + "': unknown exception");
    }
}

void LogicExecutor::applyResourceSideEffects(const BlockInstance& instance, const BlockDefinition& definition,
                                             StateBag& state, const ValueMap& params, const ValueMap& inputs,
                                             const BlockContext& context) {
    const bool nodeLive = backend && backend->isReady() && !instance.needsResourceSetup;
    const InstanceId& id = instance.instanceId;

    if (flagSet(state, StateFlags::EnvelopeNeedsTriggering)) {
        double attack = 0, decay = 0, peak = 0;
        if (nodeLive && readParam(params, "attackTime", attack) && readParam(params, "decayTime", decay) &&
            readParam(params, "peakLevel", peak)) {
            backend->triggerAttackDecay(id, attack, decay, peak);
        }
        state[StateFlags::EnvelopeNeedsTriggering] = false;
    }
    if (flagSet(state, StateFlags::GateChangedToHigh)) {
        double attack = 0, sustain = 0;
        if (nodeLive && readParam(params, "attackTime", attack) && readParam(params, "sustainLevel", sustain)) {
            backend->triggerAttackHold(id, attack, sustain);
        }
        state[StateFlags::GateChangedToHigh] = false;
    } else if (flagSet(state, StateFlags::GateChangedToLow)) {
        double release = 0;
        if (nodeLive && readParam(params, "releaseTime", release)) {
            backend->triggerRelease(id, release);
        }
        state[StateFlags::GateChangedToLow] = false;
    }

    if (nodeLive && definition.forwardsInputsToNode) {
        backend->updateNodeParams(id, params, inputs, context.bpm);
    }
}

} // namespace BlockFlow
