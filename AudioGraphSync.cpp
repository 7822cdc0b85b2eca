// AudioGraphSync.cpp
#include "AudioGraphSync.hpp"
#include "Log.hpp"
#include <unordered_map>

namespace BlockFlow {

namespace {
const char* kComponent = "AudioGraphSync";

std::string describeEndpoint(const BackendEndpoint& endpoint) {
    if (std::holds_alternative<NodeHandle>(endpoint)) {
        return fmt::format("node#{}", std::get<NodeHandle>(endpoint));
    }
    const auto& p = std::get<ParamHandle>(endpoint);
    return fmt::format("node#{}.{}", p.node, p.name);
}

// Clears the in-pass flag on every exit path.
struct PassGuard {
    bool& flag;
    explicit PassGuard(bool& f) : flag(f) { flag = true; }
    ~PassGuard() { flag = false; }
};
} // namespace

std::string AudioGraphSync::pathKey(const ConnectionId& id, size_t pathIndex) {
    return fmt::format("{}-path{}", id, pathIndex);
}

SyncReport AudioGraphSync::synchronize(bool systemEnabled, const std::vector<Connection>& connections,
                                       const std::vector<BlockInstance>& instances,
                                       const DefinitionLookup& lookup) {
    if (syncing) {
        // Called back from inside a pass: replay once the current pass is done.
        pending = PendingPass{systemEnabled, connections, instances, lookup};
        SyncReport report;
        report.deferred = true;
        log::debug(kComponent, "re-entrant synchronize deferred");
        return report;
    }

    PassGuard guard(syncing);
    SyncReport report = runPass(systemEnabled, connections, instances, lookup);
    while (pending) {
        PendingPass next = std::move(*pending);
        pending.reset();
        SyncReport again = runPass(next.systemEnabled, next.connections, next.instances, next.lookup);
        report.connected += again.connected;
        report.disconnected += again.disconnected;
        report.failed += again.failed;
        report.kept = again.kept;
    }
    return report;
}

SyncReport AudioGraphSync::disconnectAll() {
    SyncReport report;
    if (syncing) {
        pending = PendingPass{false, {}, {}, DefinitionLookup{}};
        report.deferred = true;
        return report;
    }
    PassGuard guard(syncing);
    if (!active.empty()) log::info(kComponent, "disconnecting all {} backend connections", active.size());
    for (const auto& kv : active) {
        if (tearDown(kv.first, kv.second)) ++report.disconnected;
        else ++report.failed;
    }
    active.clear();
    return report;
}

SyncReport AudioGraphSync::runPass(bool systemEnabled, const std::vector<Connection>& connections,
                                   const std::vector<BlockInstance>& instances, const DefinitionLookup& lookup) {
    SyncReport report;
    if (!systemEnabled || !backend.isReady()) {
        // Fail safe to silence rather than stale audio.
        if (!active.empty()) {
            log::info(kComponent, "backend unavailable or system disabled; dropping {} connections", active.size());
        }
        for (const auto& kv : active) {
            if (tearDown(kv.first, kv.second)) ++report.disconnected;
            else ++report.failed;
        }
        active.clear();
        return report;
    }

    std::unordered_map<InstanceId, const BlockInstance*> byId;
    for (const auto& inst : instances) byId[inst.instanceId] = &inst;

    std::map<std::string, ActiveBackendConnection> confirmed;
    for (const auto& conn : connections) {
        auto fromIt = byId.find(conn.fromInstance);
        auto toIt = byId.find(conn.toInstance);
        if (fromIt == byId.end() || toIt == byId.end()) continue;
        const BlockInstance& from = *fromIt->second;
        const BlockInstance& to = *toIt->second;
        // Pending setup: no backend node to target yet.
        if (from.needsResourceSetup || to.needsResourceSetup) continue;

        DefinitionPtr fromDef = lookup(from);
        DefinitionPtr toDef = lookup(to);
        if (!fromDef || !toDef) continue;
        const Port* outPort = fromDef->findOutput(conn.fromPort);
        const Port* inPort = toDef->findInput(conn.toPort);
        if (!outPort || !inPort || outPort->type != PortType::Audio || inPort->type != PortType::Audio) continue;

        auto sourceHandles = backend.resolveHandles(from.instanceId);
        if (!sourceHandles) continue;
        NodeHandle source = sourceHandles->output != kInvalidNode ? sourceHandles->output : sourceHandles->input;
        if (source == kInvalidNode) continue;

        auto target = resolveTarget(conn, *inPort);
        if (!target) continue;

        if (std::holds_alternative<NodeTarget>(*target)) {
            establish(conn.id, conn.id, source, std::get<NodeTarget>(*target).node, confirmed, report);
        } else if (std::holds_alternative<ParamTarget>(*target)) {
            establish(conn.id, conn.id, source, std::get<ParamTarget>(*target).param, confirmed, report);
        } else {
            const auto& paths = std::get<MultiPathTarget>(*target).paths;
            for (size_t i = 0; i < paths.size(); ++i) {
                establish(pathKey(conn.id, i + 1), conn.id, source, paths[i], confirmed, report);
            }
        }
    }

    for (const auto& kv : active) {
        if (confirmed.count(kv.first)) continue;
        if (tearDown(kv.first, kv.second)) ++report.disconnected;
        else ++report.failed;
    }
    active = std::move(confirmed);
    if (report.connected || report.disconnected || report.failed) {
        log::debug(kComponent, "pass: +{} -{} ={} failed={}", report.connected, report.disconnected,
                   report.kept, report.failed);
    }
    return report;
}

std::optional<SyncTarget> AudioGraphSync::resolveTarget(const Connection& conn, const Port& inputPort) const {
    auto handles = backend.resolveHandles(conn.toInstance);
    if (!handles) return std::nullopt;

    if (inputPort.paramTarget) {
        auto p = handles->params.find(*inputPort.paramTarget);
        if (p == handles->params.end()) {
            log::debug(kComponent, "{}: {} has no parameter '{}'", conn.id, conn.toInstance, *inputPort.paramTarget);
            return std::nullopt;
        }
        return SyncTarget{ParamTarget{p->second.node, p->second}};
    }
    if (!handles->inputPaths.empty()) {
        return SyncTarget{MultiPathTarget{handles->inputPaths}};
    }
    if (handles->input == kInvalidNode) return std::nullopt;
    return SyncTarget{NodeTarget{handles->input}};
}

bool AudioGraphSync::establish(const std::string& key, const ConnectionId& connectionId, NodeHandle source,
                               const BackendEndpoint& endpoint,
                               std::map<std::string, ActiveBackendConnection>& confirmed, SyncReport& report) {
    auto existing = active.find(key);
    if (existing != active.end()) {
        if (existing->second.source == source && existing->second.target == endpoint) {
            confirmed[key] = existing->second;
            ++report.kept;
            return true;
        }
        // Handles changed underneath (node recreated): replace the route.
        if (tearDown(key, existing->second)) ++report.disconnected;
        else ++report.failed;
        active.erase(existing);
    }
    try {
        backend.connect(source, endpoint);
    } catch (const std::exception& e) {
        ++report.failed;
        log::warn(kComponent, "connect failed for {} (node#{} -> {}): {}", key, source, describeEndpoint(endpoint),
                  e.what());
        return false;
    }
    confirmed[key] = ActiveBackendConnection{connectionId, source, endpoint};
    ++report.connected;
    log::debug(kComponent, "connected {} (node#{} -> {})", key, source, describeEndpoint(endpoint));
    return true;
}

bool AudioGraphSync::tearDown(const std::string& key, const ActiveBackendConnection& record) {
    try {
        backend.disconnect(record.source, record.target);
    } catch (const std::exception& e) {
        // Expected when the node is already gone.
        log::debug(kComponent, "disconnect failed for {}: {}", key, e.what());
        return false;
    }
    log::debug(kComponent, "disconnected {}", key);
    return true;
}

} // namespace BlockFlow
