// ResourceManager.hpp
//
// One backend node per audio-rate instance while the instance exists and the
// backend is ready. Setup is deferred (never retried eagerly) while the
// backend is unavailable; completions of asynchronous setups re-validate the
// instance and backend before touching any state.
#pragma once
#include "AudioBackend.hpp"
#include "BlockStore.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace BlockFlow {

class ResourceManager {
public:
    // Fired after a node becomes usable, so the graph can be re-synchronized.
    using ReadyCallback = std::function<void(const InstanceId&)>;

    ResourceManager(StateStore& store, DefinitionLookup lookup, AudioBackend& backend);
    ~ResourceManager();

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // Brings backend nodes in line with the current instances and readiness.
    void reconcile();
    // Readiness flipped: failed setups become eligible again, then reconcile.
    void onBackendReadinessChanged();
    // Setup for one instance. No-op when configured or already pending.
    void setup(const BlockInstance& instance);
    // Idempotent teardown; also cancels a pending setup.
    void teardown(const InstanceId& instanceId);
    void teardownAll();
    // Pushes parameter changes of configured nodes to the backend.
    void syncParameters(double bpm);

    bool isConfigured(const InstanceId& id) const { return configured.count(id) != 0; }
    bool isPending(const InstanceId& id) const { return pendingSetups.count(id) != 0; }
    bool hasFailed(const InstanceId& id) const { return failedSetups.count(id) != 0; }
    size_t configuredCount() const { return configured.size(); }

    void setReadyCallback(ReadyCallback fn) { onReady = std::move(fn); }

private:
    void completeSetup(const InstanceId& id, unsigned long long generation, bool ok, const std::string& error);
    bool instanceExists(const InstanceId& id) const;
    // Marks an audio-rate instance as waiting for the backend; logs once per instance.
    void deferSetup(const BlockInstance& instance, std::vector<InstanceUpdate>& updates);

    StateStore& store;
    DefinitionLookup lookup;
    AudioBackend& backend;
    ReadyCallback onReady;

    std::unordered_set<InstanceId> configured;
    std::unordered_map<InstanceId, unsigned long long> pendingSetups; // id -> generation
    std::unordered_set<InstanceId> failedSetups;
    std::unordered_map<InstanceId, std::string> setupErrors; // error text this manager published
    std::unordered_set<InstanceId> loggedDeferred;
    struct Pushed {
        ValueMap params;
        double bpm = 0.0;
    };
    std::unordered_map<InstanceId, Pushed> pushedParams;
    unsigned long long nextGeneration = 1;
    // Completions hold a weak_ptr to this; expired once the manager is gone.
    std::shared_ptr<bool> alive;
};

} // namespace BlockFlow
