// ResourceManager.cpp
#include "ResourceManager.hpp"
#include "Log.hpp"

namespace BlockFlow {

namespace {
const char* kComponent = "ResourceManager";

InstanceUpdate needsSetup(const InstanceId& id, bool needs) {
    InstancePatch patch;
    patch.needsResourceSetup = needs;
    return InstanceUpdate{id, patch};
}
} // namespace

ResourceManager::ResourceManager(StateStore& store, DefinitionLookup lookup, AudioBackend& backend)
    : store(store), lookup(std::move(lookup)), backend(backend), alive(std::make_shared<bool>(true)) {}

ResourceManager::~ResourceManager() {
    *alive = false;
}

bool ResourceManager::instanceExists(const InstanceId& id) const {
    for (const auto& inst : store.getInstances()) {
        if (inst.instanceId == id) return true;
    }
    return false;
}

void ResourceManager::deferSetup(const BlockInstance& instance, std::vector<InstanceUpdate>& updates) {
    if (!instance.needsResourceSetup) updates.push_back(needsSetup(instance.instanceId, true));
    if (loggedDeferred.insert(instance.instanceId).second) {
        store.addLog(instance.instanceId, "Audio backend not ready; deferring node setup.");
    }
}

void ResourceManager::onBackendReadinessChanged() {
    failedSetups.clear();
    reconcile();
}

void ResourceManager::reconcile() {
    const std::vector<BlockInstance> instances = store.getInstances();
    std::unordered_set<InstanceId> live;
    for (const auto& inst : instances) live.insert(inst.instanceId);

    // Deleted instances release their node exactly once.
    std::vector<InstanceId> gone;
    for (const auto& id : configured) if (!live.count(id)) gone.push_back(id);
    for (const auto& kv : pendingSetups) if (!live.count(kv.first)) gone.push_back(kv.first);
    for (const auto& id : gone) teardown(id);
    for (auto it = setupErrors.begin(); it != setupErrors.end();) {
        if (live.count(it->first)) ++it;
        else it = setupErrors.erase(it);
    }

    if (!backend.isReady()) {
        teardownAll();
        std::vector<InstanceUpdate> updates;
        for (const auto& inst : instances) {
            DefinitionPtr def = lookup(inst);
            if (!def || !def->runsAtAudioRate) continue;
            deferSetup(inst, updates);
        }
        if (!updates.empty()) store.updateInstances(updates);
        return;
    }

    for (const auto& inst : instances) {
        DefinitionPtr def = lookup(inst);
        if (!def || !def->runsAtAudioRate) continue;
        if (failedSetups.count(inst.instanceId)) continue;
        setup(inst);
    }
}

void ResourceManager::setup(const BlockInstance& instance) {
    const InstanceId& id = instance.instanceId;
    if (configured.count(id) || pendingSetups.count(id)) return;
    DefinitionPtr def = lookup(instance);
    if (!def || !def->runsAtAudioRate) return;
    if (!backend.isReady()) {
        std::vector<InstanceUpdate> updates;
        deferSetup(instance, updates);
        if (!updates.empty()) store.updateInstances(updates);
        return;
    }

    const unsigned long long generation = nextGeneration++;
    pendingSetups[id] = generation;
    loggedDeferred.erase(id);
    store.addLog(id, "Node setup initiated.");
    log::debug(kComponent, "creating node for {} ({})", id, def->id);

    std::weak_ptr<bool> token = alive;
    try {
        backend.createNode(*def, id, instance.parameters,
                           [this, token, id, generation](bool ok, const std::string& error) {
                               auto guard = token.lock();
                               if (!guard || !*guard) return;
                               completeSetup(id, generation, ok, error);
                           });
    } catch (const std::exception& e) {
        // The callback never runs when createNode throws.
        if (pendingSetups.count(id) && pendingSetups[id] == generation) {
            completeSetup(id, generation, false, e.what());
        }
    }
}

void ResourceManager::completeSetup(const InstanceId& id, unsigned long long generation, bool ok,
                                    const std::string& error) {
    auto it = pendingSetups.find(id);
    if (it == pendingSetups.end() || it->second != generation) {
        // Cancelled or superseded. Release an orphan node unless a newer one owns the id.
        log::debug(kComponent, "stale setup completion for {} ignored", id);
        if (ok && !configured.count(id) && !pendingSetups.count(id)) backend.destroyNode(id);
        return;
    }
    pendingSetups.erase(it);

    if (!instanceExists(id)) {
        if (ok) backend.destroyNode(id);
        return;
    }
    if (!backend.isReady()) {
        // Readiness dropped while creating; the next readiness change retries.
        if (ok) backend.destroyNode(id);
        return;
    }
    if (!ok) {
        failedSetups.insert(id);
        const std::string message = "Node setup failed: " + error;
        setupErrors[id] = message;
        log::warn(kComponent, "{}: {}", id, message);
        InstancePatch patch;
        patch.error = message;
        store.updateInstances({InstanceUpdate{id, patch}});
        store.addLog(id, message);
        return;
    }

    configured.insert(id);
    InstancePatch done;
    done.needsResourceSetup = false;
    auto previous = setupErrors.find(id);
    if (previous != setupErrors.end()) {
        // a retry succeeded: withdraw our own failure message
        for (const auto& inst : store.getInstances()) {
            if (inst.instanceId == id && inst.error == previous->second) done.error = std::optional<std::string>{};
        }
        setupErrors.erase(previous);
    }
    store.updateInstances({InstanceUpdate{id, done}});
    store.addLog(id, "Node setup successful.");
    log::debug(kComponent, "node ready for {}", id);
    if (onReady) onReady(id);
}

void ResourceManager::teardown(const InstanceId& instanceId) {
    pendingSetups.erase(instanceId);
    failedSetups.erase(instanceId);
    loggedDeferred.erase(instanceId);
    pushedParams.erase(instanceId);
    if (!configured.erase(instanceId)) return;
    try {
        backend.destroyNode(instanceId);
    } catch (const std::exception& e) {
        log::warn(kComponent, "destroyNode failed for {}: {}", instanceId, e.what());
    }
    log::debug(kComponent, "node released for {}", instanceId);
}

void ResourceManager::teardownAll() {
    pendingSetups.clear();
    std::vector<InstanceId> ids(configured.begin(), configured.end());
    for (const auto& id : ids) teardown(id);
}

void ResourceManager::syncParameters(double bpm) {
    if (!backend.isReady() || configured.empty()) return;
    for (const auto& inst : store.getInstances()) {
        if (!configured.count(inst.instanceId)) continue;
        auto it = pushedParams.find(inst.instanceId);
        if (it != pushedParams.end() && it->second.params == inst.parameters && it->second.bpm == bpm) continue;
        backend.updateNodeParams(inst.instanceId, inst.parameters, ValueMap{}, bpm);
        pushedParams[inst.instanceId] = Pushed{inst.parameters, bpm};
    }
}

} // namespace BlockFlow
