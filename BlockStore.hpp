// BlockStore.hpp
//
// StateStore is the boundary the core reads the graph through and publishes
// tick results to. BlockStore is the in-memory implementation used by the
// host: it owns definitions, instances and connections, validates wiring, and
// notifies an observer once per mutating call.
#pragma once
#include "BlockTypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace BlockFlow {

class StateStore {
public:
    virtual ~StateStore() = default;

    virtual std::vector<BlockInstance> getInstances() const = 0;
    virtual std::vector<Connection> getConnections() const = 0;
    // One call per tick; observers see a single coherent change.
    virtual void updateInstances(const std::vector<InstanceUpdate>& updates) = 0;
    virtual void addLog(const InstanceId& instanceId, const std::string& message) = 0;
};

class BlockStore : public StateStore {
public:
    static constexpr size_t kMaxLogLines = 50;

    using Observer = std::function<void()>;

    std::vector<BlockInstance> getInstances() const override { return instances; }
    std::vector<Connection> getConnections() const override { return connections; }
    void updateInstances(const std::vector<InstanceUpdate>& updates) override;
    void addLog(const InstanceId& instanceId, const std::string& message) override;

    // Definitions
    void addDefinition(BlockDefinition definition);
    DefinitionPtr findDefinition(const DefinitionId& id) const;
    DefinitionPtr definitionFor(const BlockInstance& instance) const;
    DefinitionLookup lookup() const;

    // Instances
    InstanceId addInstance(const DefinitionId& definitionId, const std::string& name,
                           const InstanceId& instanceId = {});
    bool deleteInstance(const InstanceId& instanceId);
    const BlockInstance* findInstance(const InstanceId& instanceId) const;
    void setParameter(const InstanceId& instanceId, const std::string& paramId, Value value);

    // Connections
    ConnectionId addConnection(Connection connection);
    bool removeConnection(const ConnectionId& connectionId);

    void setObserver(Observer fn) { observer = std::move(fn); }

private:
    BlockInstance* findMutable(const InstanceId& instanceId);
    void notify();

    std::vector<DefinitionPtr> definitions;
    std::vector<BlockInstance> instances;
    std::vector<Connection> connections;
    Observer observer;
    unsigned long long nextInstanceSeq = 1;
    unsigned long long nextConnectionSeq = 1;
};

} // namespace BlockFlow
