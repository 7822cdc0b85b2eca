// AudioGraphSync.hpp
//
// Keeps the backend's physical connections matched to the logical audio
// connections. Each pass resolves every audio->audio connection into a tagged
// target, connects only what is not already live, and tears down whatever
// was not reconfirmed. A pass over an unchanged graph makes no backend calls.
#pragma once
#include "AudioBackend.hpp"
#include "BlockTypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace BlockFlow {

// Resolved input side of one logical connection.
struct NodeTarget {
    NodeHandle node = kInvalidNode;
};
struct ParamTarget {
    NodeHandle node = kInvalidNode;
    ParamHandle param;
};
struct MultiPathTarget {
    std::vector<NodeHandle> paths; // one physical connection per internal stage
};
using SyncTarget = std::variant<NodeTarget, ParamTarget, MultiPathTarget>;

// Synchronizer-owned record of one physical connection.
struct ActiveBackendConnection {
    ConnectionId connectionId; // logical connection it realizes
    NodeHandle source = kInvalidNode;
    BackendEndpoint target;
};

struct SyncReport {
    size_t connected = 0;
    size_t disconnected = 0;
    size_t kept = 0;
    size_t failed = 0;
    bool deferred = false; // re-entrant call queued behind a running pass
};

class AudioGraphSync {
public:
    explicit AudioGraphSync(AudioBackend& backend) : backend(backend) {}

    SyncReport synchronize(bool systemEnabled, const std::vector<Connection>& connections,
                           const std::vector<BlockInstance>& instances, const DefinitionLookup& lookup);
    SyncReport disconnectAll();

    // Keyed by connection id, or "<id>-pathN" for multi-path routes.
    const std::map<std::string, ActiveBackendConnection>& activeConnections() const { return active; }
    bool isSyncing() const { return syncing; }

    static std::string pathKey(const ConnectionId& id, size_t pathIndex);

private:
    struct PendingPass {
        bool systemEnabled;
        std::vector<Connection> connections;
        std::vector<BlockInstance> instances;
        DefinitionLookup lookup;
    };

    SyncReport runPass(bool systemEnabled, const std::vector<Connection>& connections,
                       const std::vector<BlockInstance>& instances, const DefinitionLookup& lookup);
    std::optional<SyncTarget> resolveTarget(const Connection& conn, const Port& inputPort) const;
    bool establish(const std::string& key, const ConnectionId& connectionId, NodeHandle source,
                   const BackendEndpoint& endpoint, std::map<std::string, ActiveBackendConnection>& confirmed,
                   SyncReport& report);
    bool tearDown(const std::string& key, const ActiveBackendConnection& record);

    AudioBackend& backend;
    std::map<std::string, ActiveBackendConnection> active;
    bool syncing = false;
    std::optional<PendingPass> pending;
};

} // namespace BlockFlow
