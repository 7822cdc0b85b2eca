// BlockFlowCore.cpp
//
// Ordering matters when the graph shrinks: the synchronizer drops a deleted
// instance's connections while its node still exists, then the resource
// manager destroys the node.
#include "BlockFlowCore.hpp"
#include "Log.hpp"

namespace BlockFlow {

FlowEngine::FlowEngine(BlockStore& store, const BehaviorRegistry& registry, AudioBackend& backend,
                       EngineConfig config)
    : store(store),
      backend(backend),
      config(config),
      executor(store, store.lookup(), registry, &backend),
      sync(backend),
      resourceManager(store, store.lookup(), backend),
      loop([this](double nowMs) { runTick(nowMs); }, config.tickPeriodMs) {
    resourceManager.setReadyCallback([this](const InstanceId&) { syncAudioGraph(); });
}

void FlowEngine::runTick(double nowMs) {
    BlockContext context;
    const double rate = backend.isReady() ? backend.sampleRate() : 0.0;
    if (rate > 0) context.sampleRate = rate;
    context.bpm = config.bpm;
    context.tickTimeMs = nowMs;
    context.tickIndex = loop.tickCount();
    lastReport = executor.runTick(context);
}

bool FlowEngine::pump(double nowMs) {
    return loop.pump(nowMs);
}

void FlowEngine::setSystemEnabled(bool enabled, double nowMs) {
    if (config.systemEnabled != enabled) {
        log::info("FlowEngine", "system {}", enabled ? "enabled" : "disabled");
    }
    config.systemEnabled = enabled;
    loop.setEnabled(enabled, nowMs);
    syncAudioGraph();
}

void FlowEngine::setBpm(double bpm) {
    if (!(bpm > 0)) throw std::invalid_argument("bpm must be positive");
    config.bpm = bpm;
    resourceManager.syncParameters(bpm);
}

void FlowEngine::onBackendReadinessChanged() {
    log::info("FlowEngine", "audio backend {}", backend.isReady() ? "ready" : "unavailable");
    if (backend.isReady()) {
        resourceManager.onBackendReadinessChanged();
        syncAudioGraph();
        resourceManager.syncParameters(config.bpm);
    } else {
        syncAudioGraph();
        resourceManager.onBackendReadinessChanged();
    }
}

void FlowEngine::reconcile() {
    resourceManager.reconcile();
    syncAudioGraph();
}

SyncReport FlowEngine::syncAudioGraph() {
    return sync.synchronize(config.systemEnabled, store.getConnections(), store.getInstances(), store.lookup());
}

InstanceId FlowEngine::addInstance(const DefinitionId& definitionId, const std::string& name,
                                   const InstanceId& instanceId) {
    InstanceId id = store.addInstance(definitionId, name, instanceId);
    if (const BlockInstance* inst = store.findInstance(id)) {
        // copy: setup may publish updates that reallocate the instance list
        BlockInstance snapshot = *inst;
        resourceManager.setup(snapshot);
    }
    syncAudioGraph();
    return id;
}

bool FlowEngine::deleteInstance(const InstanceId& instanceId) {
    if (!store.deleteInstance(instanceId)) return false;
    executor.clearBlockFromCache(instanceId);
    syncAudioGraph();
    resourceManager.teardown(instanceId);
    return true;
}

ConnectionId FlowEngine::connect(Connection connection) {
    ConnectionId id = store.addConnection(std::move(connection));
    syncAudioGraph();
    return id;
}

bool FlowEngine::disconnect(const ConnectionId& connectionId) {
    if (!store.removeConnection(connectionId)) return false;
    syncAudioGraph();
    return true;
}

void FlowEngine::setParameter(const InstanceId& instanceId, const std::string& paramId, Value value) {
    store.setParameter(instanceId, paramId, std::move(value));
    resourceManager.syncParameters(config.bpm);
}

void FlowEngine::shutdown(double nowMs) {
    loop.setEnabled(false, nowMs);
    sync.disconnectAll();
    resourceManager.teardownAll();
}

} // namespace BlockFlow
