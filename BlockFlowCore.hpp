// BlockFlow engine
//
// FlowEngine wires the execution core together for one graph: the logic
// executor behind a cooperative tick loop, the audio graph synchronizer and
// the resource lifecycle manager, all sharing one store and one backend.
// Graph edits go through the engine so backend nodes and connections follow
// the logical graph; the host drives time by calling pump().
#pragma once
#include "AudioBackend.hpp"
#include "AudioGraphSync.hpp"
#include "Behavior.hpp"
#include "BlockStore.hpp"
#include "LogicExecutor.hpp"
#include "ResourceManager.hpp"
#include "TickLoop.hpp"

namespace BlockFlow {

struct EngineConfig {
    double tickPeriodMs = TickLoop::kDefaultPeriodMs;
    double bpm = 120.0;
    bool systemEnabled = false;
};

class FlowEngine {
public:
    FlowEngine(BlockStore& store, const BehaviorRegistry& registry, AudioBackend& backend,
               EngineConfig config = EngineConfig{});

    FlowEngine(const FlowEngine&) = delete;
    FlowEngine& operator=(const FlowEngine&) = delete;

    // Global enable flag: drives the tick loop and backend connectivity.
    void setSystemEnabled(bool enabled, double nowMs);
    bool systemEnabled() const { return config.systemEnabled; }
    void setBpm(double bpm);
    double bpm() const { return config.bpm; }

    // Call whenever the backend's readiness flips.
    void onBackendReadinessChanged();
    // Sets up whatever the current graph still needs, then re-synchronizes.
    void reconcile();
    SyncReport syncAudioGraph();

    InstanceId addInstance(const DefinitionId& definitionId, const std::string& name = {},
                           const InstanceId& instanceId = {});
    bool deleteInstance(const InstanceId& instanceId);
    ConnectionId connect(Connection connection);
    bool disconnect(const ConnectionId& connectionId);
    void setParameter(const InstanceId& instanceId, const std::string& paramId, Value value);

    // Runs a due logic tick. Returns true when one ran.
    bool pump(double nowMs);
    const TickReport& lastTick() const { return lastReport; }

    void clearBlockFromCache(const InstanceId& instanceId) { executor.clearBlockFromCache(instanceId); }
    void clearCache() { executor.clearCache(); }

    // Stops ticking and releases every backend connection and node.
    void shutdown(double nowMs = 0.0);

    BlockStore& blockStore() { return store; }
    const LogicExecutor& logicExecutor() const { return executor; }
    const TickLoop& tickLoop() const { return loop; }
    const AudioGraphSync& audioSync() const { return sync; }
    const ResourceManager& resources() const { return resourceManager; }

private:
    void runTick(double nowMs);

    BlockStore& store;
    AudioBackend& backend;
    EngineConfig config;
    LogicExecutor executor;
    AudioGraphSync sync;
    ResourceManager resourceManager;
    TickLoop loop;
    TickReport lastReport;
};

} // namespace BlockFlow
