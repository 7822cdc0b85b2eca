// mock_audio_backend.hpp
//
// GoogleMock AudioBackend with a small fake node table behind the default
// actions, so tests only set expectations on the calls they care about.
#pragma once
#include "AudioBackend.hpp"
#include <gmock/gmock.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BlockFlowTest {

using namespace BlockFlow;

class MockAudioBackend : public AudioBackend {
public:
    MockAudioBackend() {
        using ::testing::_;
        using ::testing::Invoke;
        ON_CALL(*this, isReady()).WillByDefault(Invoke([this] { return ready; }));
        ON_CALL(*this, sampleRate()).WillByDefault(::testing::Return(48000.0));
        ON_CALL(*this, resolveHandles(_)).WillByDefault(Invoke([this](const InstanceId& id) {
            auto it = nodes.find(id);
            return it == nodes.end() ? std::optional<NodeHandles>() : std::optional<NodeHandles>(it->second);
        }));
        ON_CALL(*this, createNode(_, _, _, _))
            .WillByDefault(Invoke([this](const BlockDefinition&, const InstanceId& id, const ValueMap&,
                                         CreateCallback done) {
                if (deferCreates) {
                    pendingCreates.emplace_back(id, std::move(done));
                    return;
                }
                addNode(id);
                done(true, std::string());
            }));
        ON_CALL(*this, destroyNode(_)).WillByDefault(Invoke([this](const InstanceId& id) { nodes.erase(id); }));
    }

    MOCK_METHOD(bool, isReady, (), (const, override));
    MOCK_METHOD(double, sampleRate, (), (const, override));
    MOCK_METHOD(void, createNode, (const BlockDefinition&, const InstanceId&, const ValueMap&, CreateCallback),
                (override));
    MOCK_METHOD(void, destroyNode, (const InstanceId&), (override));
    MOCK_METHOD(void, connect, (NodeHandle, const BackendEndpoint&), (override));
    MOCK_METHOD(void, disconnect, (NodeHandle, const BackendEndpoint&), (override));
    MOCK_METHOD(void, sendMessage, (const InstanceId&, const nlohmann::json&), (override));
    MOCK_METHOD(std::optional<NodeHandles>, resolveHandles, (const InstanceId&), (const, override));
    MOCK_METHOD(void, updateNodeParams, (const InstanceId&, const ValueMap&, const ValueMap&, double), (override));
    MOCK_METHOD(void, triggerAttackDecay, (const InstanceId&, double, double, double), (override));
    MOCK_METHOD(void, triggerAttackHold, (const InstanceId&, double, double), (override));
    MOCK_METHOD(void, triggerRelease, (const InstanceId&, double), (override));

    // Gives `id` a fresh single-node handle set (input == output).
    NodeHandle addNode(const InstanceId& id) {
        NodeHandle h = nextHandle++;
        NodeHandles& entry = nodes[id];
        entry.input = h;
        entry.output = h;
        return h;
    }

    // Finishes the oldest deferred createNode.
    void completeNextCreate(bool ok, const std::string& error = {}) {
        auto job = std::move(pendingCreates.front());
        pendingCreates.erase(pendingCreates.begin());
        if (ok) addNode(job.first);
        job.second(ok, error);
    }

    bool ready = true;
    bool deferCreates = false;
    std::unordered_map<InstanceId, NodeHandles> nodes;
    std::vector<std::pair<InstanceId, CreateCallback>> pendingCreates;

private:
    NodeHandle nextHandle = 100;
};

} // namespace BlockFlowTest
