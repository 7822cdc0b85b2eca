// Behavior.hpp
//
// Per-block logic as registered, versioned function objects. A behavior is
// "compiled" per instance by calling its factory, so closures may keep
// instance-private data. The cache re-compiles an instance when the registered
// version of its behavior changes.
#pragma once
#include "BlockTypes.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace BlockFlow {

// Global context handed to every behavior each tick.
struct BlockContext {
    double sampleRate = 44100.0;
    double bpm = 120.0;
    double tickTimeMs = 0.0;
    unsigned long long tickIndex = 0;
};

using OutputSetter = std::function<void(const PortId&, Value)>;
using BlockLogger = std::function<void(const std::string&)>;
using MessageSender = std::function<void(const nlohmann::json&)>;

struct BehaviorCall {
    const ValueMap& inputs;
    const ValueMap& params;
    const StateBag& state;
    const OutputSetter& setOutput;
    const BlockLogger& log;
    const BlockContext& context;
    const MessageSender& postMessage;
};

// Returns the partial state to merge into the instance's state bag.
using BlockBehavior = std::function<StateBag(const BehaviorCall&)>;
using BehaviorFactory = std::function<BlockBehavior()>;

class BehaviorNotFound : public std::runtime_error {
public:
    explicit BehaviorNotFound(const std::string& id)
        : std::runtime_error("Behavior '" + id + "' is not registered") {}
};

class BehaviorRegistry {
public:
    // Re-registering an id replaces its source and bumps its version.
    unsigned registerBehavior(const std::string& id, BehaviorFactory factory);
    bool contains(const std::string& id) const;
    unsigned version(const std::string& id) const;
    BlockBehavior compile(const std::string& id) const;

private:
    struct Entry {
        BehaviorFactory factory;
        unsigned version = 0;
    };
    std::unordered_map<std::string, Entry> entries;
};

// Compiled behaviors keyed by instance id.
class BehaviorCache {
public:
    explicit BehaviorCache(const BehaviorRegistry& registry) : registry(registry) {}

    const BlockBehavior& get(const InstanceId& instanceId, const std::string& behaviorId);
    void evict(const InstanceId& instanceId);
    void clear();
    // Drops entries for instances that no longer exist.
    void retainOnly(const std::unordered_set<InstanceId>& live);

    bool contains(const InstanceId& instanceId) const { return entries.count(instanceId) != 0; }
    size_t size() const { return entries.size(); }
    unsigned long long compileCount() const { return compiles; }

private:
    struct Entry {
        std::string behaviorId;
        unsigned version = 0;
        BlockBehavior fn;
    };
    const BehaviorRegistry& registry;
    std::unordered_map<InstanceId, Entry> entries;
    unsigned long long compiles = 0;
};

} // namespace BlockFlow
