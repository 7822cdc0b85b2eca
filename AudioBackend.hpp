// AudioBackend.hpp
//
// What the core requires from the external real-time audio backend: node
// creation/destruction, node-to-node and node-to-parameter wiring, parameter
// automation and out-of-band messages. The backend owns the actual DSP.
#pragma once
#include "BlockTypes.hpp"
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace BlockFlow {

using NodeHandle = std::uint64_t;
constexpr NodeHandle kInvalidNode = 0;

// Automation parameter on a backend node.
struct ParamHandle {
    NodeHandle node = kInvalidNode;
    std::string name;
};

inline bool operator==(const ParamHandle& a, const ParamHandle& b) {
    return a.node == b.node && a.name == b.name;
}

// Where a connection lands: a node input or an automation parameter.
using BackendEndpoint = std::variant<NodeHandle, ParamHandle>;

// Handles currently backing one block instance.
struct NodeHandles {
    NodeHandle input = kInvalidNode;  // where plain audio inputs land
    NodeHandle output = kInvalidNode; // what outgoing connections leave from
    std::unordered_map<std::string, ParamHandle> params;
    // Internal stages a single logical input feeds (multi-path routing).
    std::vector<NodeHandle> inputPaths;
};

// Failure of an individual backend call (connect/disconnect/create).
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AudioBackend {
public:
    // ok=false carries a reason in `error`.
    using CreateCallback = std::function<void(bool ok, const std::string& error)>;

    virtual ~AudioBackend() = default;

    virtual bool isReady() const = 0;
    virtual double sampleRate() const = 0;

    // May complete synchronously or later from the host loop.
    virtual void createNode(const BlockDefinition& definition, const InstanceId& instanceId,
                            const ValueMap& initialParams, CreateCallback done) = 0;
    virtual void destroyNode(const InstanceId& instanceId) = 0;

    virtual void connect(NodeHandle source, const BackendEndpoint& target) = 0;
    virtual void disconnect(NodeHandle source, const BackendEndpoint& target) = 0;

    virtual void sendMessage(const InstanceId& instanceId, const nlohmann::json& payload) = 0;
    virtual std::optional<NodeHandles> resolveHandles(const InstanceId& instanceId) const = 0;

    virtual void updateNodeParams(const InstanceId& instanceId, const ValueMap& params,
                                  const ValueMap& inputs, double bpm) = 0;

    // Envelope automation on the instance's node.
    virtual void triggerAttackDecay(const InstanceId& instanceId, double attack, double decay, double peak) = 0;
    virtual void triggerAttackHold(const InstanceId& instanceId, double attack, double sustain) = 0;
    virtual void triggerRelease(const InstanceId& instanceId, double release) = 0;
};

} // namespace BlockFlow
