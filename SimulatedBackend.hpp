// SimulatedBackend.hpp
//
// Stand-in audio backend for the headless host. It allocates node handles,
// tracks physical connections and logs every operation, but renders no audio.
// Readiness can be delayed and node creation made asynchronous so the host
// exercises deferred setup the way a real audio device start-up would.
#pragma once
#include "AudioBackend.hpp"
#include <deque>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BlockFlow {

class SimulatedBackend : public AudioBackend {
public:
    struct Options {
        double sampleRate = 44100.0;
        double readyAfterMs = 0.0;    // becomes ready once advance() reaches this time
        double createLatencyMs = 0.0; // 0 = createNode completes synchronously
    };

    explicit SimulatedBackend(Options options);

    // Moves the simulated clock. Returns true when readiness flipped.
    bool advance(double nowMs);
    // Forces readiness (device lost / regained). Returns true when it flipped.
    bool setReady(bool ready);

    bool isReady() const override { return ready; }
    double sampleRate() const override { return options.sampleRate; }

    void createNode(const BlockDefinition& definition, const InstanceId& instanceId, const ValueMap& initialParams,
                    CreateCallback done) override;
    void destroyNode(const InstanceId& instanceId) override;
    void connect(NodeHandle source, const BackendEndpoint& target) override;
    void disconnect(NodeHandle source, const BackendEndpoint& target) override;
    void sendMessage(const InstanceId& instanceId, const nlohmann::json& payload) override;
    std::optional<NodeHandles> resolveHandles(const InstanceId& instanceId) const override;
    void updateNodeParams(const InstanceId& instanceId, const ValueMap& params, const ValueMap& inputs,
                          double bpm) override;
    void triggerAttackDecay(const InstanceId& instanceId, double attack, double decay, double peak) override;
    void triggerAttackHold(const InstanceId& instanceId, double attack, double sustain) override;
    void triggerRelease(const InstanceId& instanceId, double release) override;

    size_t nodeCount() const { return nodes.size(); }
    size_t connectionCount() const { return links.size(); }
    size_t pendingCreates() const { return pending.size(); }

private:
    struct PendingCreate {
        double dueMs;
        InstanceId instanceId;
        NodeHandles handles;
        CreateCallback done;
    };

    NodeHandles allocate(const BlockDefinition& definition);
    bool ownsNode(NodeHandle handle) const;

    Options options;
    bool ready = false;
    double nowMs = 0.0;
    NodeHandle nextHandle = 1;
    std::unordered_map<InstanceId, NodeHandles> nodes;
    std::deque<PendingCreate> pending;
    std::vector<std::pair<NodeHandle, BackendEndpoint>> links;
};

} // namespace BlockFlow
