// Behavior.cpp
#include "Behavior.hpp"
#include "Log.hpp"

namespace BlockFlow {

unsigned BehaviorRegistry::registerBehavior(const std::string& id, BehaviorFactory factory) {
    if (!factory) throw std::invalid_argument("Behavior '" + id + "' has no factory");
    auto& entry = entries[id];
    entry.factory = std::move(factory);
    ++entry.version;
    return entry.version;
}

bool BehaviorRegistry::contains(const std::string& id) const {
    return entries.count(id) != 0;
}

unsigned BehaviorRegistry::version(const std::string& id) const {
    auto it = entries.find(id);
    if (it == entries.end()) throw BehaviorNotFound(id);
    return it->second.version;
}

BlockBehavior BehaviorRegistry::compile(const std::string& id) const {
    auto it = entries.find(id);
    if (it == entries.end()) throw BehaviorNotFound(id);
    BlockBehavior fn = it->second.factory();
    if (!fn) throw std::runtime_error("Behavior '" + id + "' factory produced an empty callable");
    return fn;
}

const BlockBehavior& BehaviorCache::get(const InstanceId& instanceId, const std::string& behaviorId) {
    const unsigned current = registry.version(behaviorId);
    auto it = entries.find(instanceId);
    if (it != entries.end() && it->second.behaviorId == behaviorId && it->second.version == current) {
        return it->second.fn;
    }
    Entry entry{behaviorId, current, registry.compile(behaviorId)};
    ++compiles;
    log::debug("BehaviorCache", "compiled '{}' v{} for {}", behaviorId, current, instanceId);
    auto& slot = entries[instanceId];
    slot = std::move(entry);
    return slot.fn;
}

void BehaviorCache::evict(const InstanceId& instanceId) {
    if (entries.erase(instanceId)) {
        log::debug("BehaviorCache", "cleared compiled behavior for {}", instanceId);
    }
}

void BehaviorCache::retainOnly(const std::unordered_set<InstanceId>& live) {
    for (auto it = entries.begin(); it != entries.end();) {
        if (live.count(it->first)) ++it;
        else it = entries.erase(it);
    }
}

void BehaviorCache::clear() {
    entries.clear();
    log::debug("BehaviorCache", "cache cleared");
}

} // namespace BlockFlow
