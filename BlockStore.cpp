// BlockStore.cpp
#include "BlockStore.hpp"
#include "Log.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace BlockFlow {

namespace {
std::string timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return fmt::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}
} // namespace

void BlockStore::updateInstances(const std::vector<InstanceUpdate>& updates) {
    if (updates.empty()) return;
    for (const auto& u : updates) {
        BlockInstance* inst = findMutable(u.instanceId);
        if (!inst) {
            log::debug("BlockStore", "update for unknown instance {} ignored", u.instanceId);
            continue;
        }
        if (std::holds_alternative<InstancePatch>(u.change)) {
            applyPatch(*inst, std::get<InstancePatch>(u.change));
        } else {
            const auto& fn = std::get<InstanceTransform>(u.change);
            BlockInstance next = fn(*inst);
            if (next.instanceId != inst->instanceId) {
                throw InvariantViolation("Instance update changed id of " + inst->instanceId);
            }
            *inst = std::move(next);
        }
    }
    notify();
}

void BlockStore::addLog(const InstanceId& instanceId, const std::string& message) {
    BlockInstance* inst = findMutable(instanceId);
    if (!inst) return;
    inst->logs.insert(inst->logs.begin(), timestamp() + " - " + message);
    if (inst->logs.size() > kMaxLogLines) inst->logs.resize(kMaxLogLines);
    notify();
}

void BlockStore::addDefinition(BlockDefinition definition) {
    auto ptr = std::make_shared<const BlockDefinition>(std::move(definition));
    auto it = std::find_if(definitions.begin(), definitions.end(),
                           [&](const DefinitionPtr& d) { return d->id == ptr->id; });
    if (it != definitions.end()) *it = ptr;
    else definitions.push_back(ptr);
}

DefinitionPtr BlockStore::findDefinition(const DefinitionId& id) const {
    auto it = std::find_if(definitions.begin(), definitions.end(),
                           [&](const DefinitionPtr& d) { return d->id == id; });
    return it == definitions.end() ? nullptr : *it;
}

DefinitionPtr BlockStore::definitionFor(const BlockInstance& instance) const {
    return findDefinition(instance.definitionId);
}

DefinitionLookup BlockStore::lookup() const {
    return [this](const BlockInstance& instance) { return definitionFor(instance); };
}

InstanceId BlockStore::addInstance(const DefinitionId& definitionId, const std::string& name,
                                   const InstanceId& instanceId) {
    DefinitionPtr def = findDefinition(definitionId);
    if (!def) throw std::invalid_argument("Unknown block definition: " + definitionId);

    BlockInstance inst;
    inst.instanceId = instanceId.empty() ? fmt::format("inst_{}", nextInstanceSeq++) : instanceId;
    if (findInstance(inst.instanceId)) {
        throw std::invalid_argument("Instance id already in use: " + inst.instanceId);
    }
    inst.definitionId = def->id;
    inst.name = name.empty() ? def->name : name;
    for (const auto& p : def->parameters) inst.parameters[p.id] = p.defaultValue;
    for (const auto& out : def->outputs) inst.lastRunOutputs[out.id] = defaultValueFor(out.type);
    inst.needsResourceSetup = def->runsAtAudioRate;
    inst.logs.push_back(timestamp() + " - Instance '" + inst.name + "' created.");
    InstanceId id = inst.instanceId;
    instances.push_back(std::move(inst));
    notify();
    return id;
}

bool BlockStore::deleteInstance(const InstanceId& instanceId) {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [&](const BlockInstance& b) { return b.instanceId == instanceId; });
    if (it == instances.end()) return false;
    instances.erase(it);
    // Connections must never dangle
    connections.erase(std::remove_if(connections.begin(), connections.end(),
                                     [&](const Connection& c) {
                                         return c.fromInstance == instanceId || c.toInstance == instanceId;
                                     }),
                      connections.end());
    notify();
    return true;
}

const BlockInstance* BlockStore::findInstance(const InstanceId& instanceId) const {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [&](const BlockInstance& b) { return b.instanceId == instanceId; });
    return it == instances.end() ? nullptr : &*it;
}

BlockInstance* BlockStore::findMutable(const InstanceId& instanceId) {
    auto it = std::find_if(instances.begin(), instances.end(),
                           [&](const BlockInstance& b) { return b.instanceId == instanceId; });
    return it == instances.end() ? nullptr : &*it;
}

void BlockStore::setParameter(const InstanceId& instanceId, const std::string& paramId, Value value) {
    BlockInstance* inst = findMutable(instanceId);
    if (!inst) throw std::invalid_argument("Unknown instance: " + instanceId);
    inst->parameters[paramId] = std::move(value);
    notify();
}

ConnectionId BlockStore::addConnection(Connection connection) {
    const BlockInstance* from = findInstance(connection.fromInstance);
    const BlockInstance* to = findInstance(connection.toInstance);
    if (!from || !to) {
        throw std::invalid_argument("Connection endpoint does not exist: " + connection.fromInstance +
                                    " -> " + connection.toInstance);
    }
    if (from == to) throw std::invalid_argument("Cannot connect instance to itself: " + from->instanceId);
    DefinitionPtr fromDef = definitionFor(*from);
    DefinitionPtr toDef = definitionFor(*to);
    if (!fromDef || !toDef) throw std::invalid_argument("Connection endpoint has no definition");
    const Port* out = fromDef->findOutput(connection.fromPort);
    const Port* in = toDef->findInput(connection.toPort);
    if (!out) throw std::invalid_argument("No output port '" + connection.fromPort + "' on " + from->instanceId);
    if (!in) throw std::invalid_argument("No input port '" + connection.toPort + "' on " + to->instanceId);
    if (!arePortTypesCompatible(out->type, in->type)) {
        throw std::invalid_argument(fmt::format("Type mismatch in connection: {} -> {}",
                                                portTypeName(out->type), portTypeName(in->type)));
    }
    // Fan-in is rejected: each input port has at most one source.
    for (const auto& c : connections) {
        if (c.toInstance == connection.toInstance && c.toPort == connection.toPort) {
            throw std::invalid_argument("Input " + connection.toInstance + ":" + connection.toPort +
                                        " is already connected by " + c.id);
        }
    }
    if (connection.id.empty()) connection.id = fmt::format("conn_{}", nextConnectionSeq++);
    for (const auto& c : connections) {
        if (c.id == connection.id) throw std::invalid_argument("Connection id already in use: " + c.id);
    }
    ConnectionId id = connection.id;
    connections.push_back(std::move(connection));
    notify();
    return id;
}

bool BlockStore::removeConnection(const ConnectionId& connectionId) {
    auto it = std::find_if(connections.begin(), connections.end(),
                           [&](const Connection& c) { return c.id == connectionId; });
    if (it == connections.end()) return false;
    connections.erase(it);
    notify();
    return true;
}

void BlockStore::notify() {
    if (observer) observer();
}

} // namespace BlockFlow
