#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ResourceManager.hpp"
#include "mock_audio_backend.hpp"
#include "test_helpers.hpp"

#include <memory>

using namespace BlockFlow;
using namespace BlockFlowTest;
using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::Mock;
using ::testing::NiceMock;
using ::testing::Pair;
using ::testing::Throw;

class ResourceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        BlockDefinition osc = makeDefinition("osc", {}, {{"audio_out", PortType::Audio}}, "", true);
        osc.parameters = {{"frequency", 220.0}};
        store.addDefinition(osc);
        store.addDefinition(makeDefinition("logic", {}, {{"out", PortType::Number}}, "x"));
        manager = std::make_unique<ResourceManager>(store, store.lookup(), backend);
        manager->setReadyCallback([this](const InstanceId& id) { readied.push_back(id); });
    }

    const BlockInstance& instance(const InstanceId& id) { return *store.findInstance(id); }

    size_t countLogs(const InstanceId& id, const std::string& needle) {
        size_t n = 0;
        for (const auto& line : instance(id).logs) n += line.find(needle) != std::string::npos;
        return n;
    }

    BlockStore store;
    NiceMock<MockAudioBackend> backend;
    std::unique_ptr<ResourceManager> manager;
    std::vector<InstanceId> readied;
};

TEST_F(ResourceManagerTest, SetupWhenReady) {
    store.addInstance("osc", "Osc", "o");
    EXPECT_CALL(backend, createNode(Field(&BlockDefinition::id, "osc"), "o", _, _));
    manager->reconcile();

    EXPECT_TRUE(manager->isConfigured("o"));
    EXPECT_FALSE(instance("o").needsResourceSetup);
    EXPECT_EQ(countLogs("o", "Node setup successful."), 1u);
    EXPECT_THAT(readied, ElementsAre("o"));
}

TEST_F(ResourceManagerTest, LogicOnlyInstancesGetNoNode) {
    store.addInstance("logic", "L", "l");
    EXPECT_CALL(backend, createNode(_, _, _, _)).Times(0);
    manager->reconcile();
    EXPECT_EQ(manager->configuredCount(), 0u);
}

TEST_F(ResourceManagerTest, SetupIsIdempotent) {
    store.addInstance("osc", "Osc", "o");
    EXPECT_CALL(backend, createNode(_, _, _, _)).Times(1);
    manager->reconcile();
    manager->setup(instance("o"));
    manager->reconcile();
}

TEST_F(ResourceManagerTest, TeardownIsIdempotent) {
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();
    EXPECT_CALL(backend, destroyNode("o")).Times(1);
    manager->teardown("o");
    manager->teardown("o");
    EXPECT_FALSE(manager->isConfigured("o"));
}

TEST_F(ResourceManagerTest, DeferredWhileBackendUnavailable) {
    backend.ready = false;
    store.addInstance("osc", "Osc", "o");
    EXPECT_CALL(backend, createNode(_, _, _, _)).Times(0);
    manager->reconcile();
    manager->reconcile();

    EXPECT_TRUE(instance("o").needsResourceSetup);
    EXPECT_FALSE(manager->isConfigured("o"));
    EXPECT_EQ(countLogs("o", "deferring"), 1u);
    Mock::VerifyAndClearExpectations(&backend);

    backend.ready = true;
    EXPECT_CALL(backend, createNode(_, "o", _, _)).Times(1);
    manager->onBackendReadinessChanged();
    EXPECT_TRUE(manager->isConfigured("o"));
    EXPECT_FALSE(instance("o").needsResourceSetup);
}

TEST_F(ResourceManagerTest, DirectSetupWhileUnavailableLogsDeferralOnce) {
    backend.ready = false;
    store.addInstance("osc", "Osc", "o");
    EXPECT_CALL(backend, createNode(_, _, _, _)).Times(0);
    manager->setup(instance("o"));
    manager->setup(instance("o"));
    manager->reconcile();

    EXPECT_TRUE(instance("o").needsResourceSetup);
    EXPECT_EQ(countLogs("o", "Audio backend not ready; deferring node setup."), 1u);
}

TEST_F(ResourceManagerTest, BackendLossTearsDownOnceAndMarksForSetup) {
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();

    backend.ready = false;
    EXPECT_CALL(backend, destroyNode("o")).Times(1);
    manager->onBackendReadinessChanged();
    manager->reconcile();
    EXPECT_TRUE(instance("o").needsResourceSetup);
    EXPECT_FALSE(manager->isConfigured("o"));
}

TEST_F(ResourceManagerTest, DeletedInstanceIsTornDownOnReconcile) {
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();
    store.deleteInstance("o");
    EXPECT_CALL(backend, destroyNode("o")).Times(1);
    manager->reconcile();
    manager->reconcile();
}

TEST_F(ResourceManagerTest, StaleCompletionAfterDeletionDestroysOrphan) {
    backend.deferCreates = true;
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();
    EXPECT_TRUE(manager->isPending("o"));

    store.deleteInstance("o");
    manager->reconcile();
    EXPECT_FALSE(manager->isPending("o"));

    EXPECT_CALL(backend, destroyNode("o")).Times(1);
    backend.completeNextCreate(true);
    EXPECT_FALSE(manager->isConfigured("o"));
    EXPECT_TRUE(readied.empty());
}

TEST_F(ResourceManagerTest, CompletionAfterBackendLossIsDiscarded) {
    backend.deferCreates = true;
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();

    backend.ready = false;
    EXPECT_CALL(backend, destroyNode("o")).Times(1);
    backend.completeNextCreate(true);
    EXPECT_FALSE(manager->isConfigured("o"));
    EXPECT_TRUE(instance("o").needsResourceSetup);
}

TEST_F(ResourceManagerTest, OnlyLatestGenerationCounts) {
    backend.deferCreates = true;
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();
    manager->teardown("o");
    manager->setup(instance("o"));
    ASSERT_EQ(backend.pendingCreates.size(), 2u);

    // first (cancelled) completion must not configure the instance
    backend.completeNextCreate(true);
    EXPECT_FALSE(manager->isConfigured("o"));
    EXPECT_TRUE(manager->isPending("o"));

    backend.completeNextCreate(true);
    EXPECT_TRUE(manager->isConfigured("o"));
    EXPECT_EQ(readied.size(), 1u);
}

TEST_F(ResourceManagerTest, FailureSetsErrorAndWaitsForReadinessChange) {
    backend.deferCreates = true;
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();
    backend.completeNextCreate(false, "no voices left");

    EXPECT_EQ(instance("o").error, std::optional<std::string>("Node setup failed: no voices left"));
    EXPECT_TRUE(manager->hasFailed("o"));
    EXPECT_TRUE(instance("o").needsResourceSetup);

    manager->reconcile();
    EXPECT_TRUE(backend.pendingCreates.empty());

    manager->onBackendReadinessChanged();
    EXPECT_EQ(backend.pendingCreates.size(), 1u);

    // the retry succeeds and withdraws the failure
    backend.completeNextCreate(true);
    EXPECT_TRUE(manager->isConfigured("o"));
    EXPECT_FALSE(instance("o").error.has_value());
    EXPECT_FALSE(instance("o").needsResourceSetup);
}

TEST_F(ResourceManagerTest, ThrowingCreateIsRecordedAsFailure) {
    store.addInstance("osc", "Osc", "o");
    EXPECT_CALL(backend, createNode(_, _, _, _)).WillOnce(Throw(BackendError("device busy")));
    manager->reconcile();
    EXPECT_TRUE(manager->hasFailed("o"));
    EXPECT_FALSE(manager->isPending("o"));
    EXPECT_EQ(instance("o").error, std::optional<std::string>("Node setup failed: device busy"));
}

TEST_F(ResourceManagerTest, ParametersPushedOnlyWhenChanged) {
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();

    EXPECT_CALL(backend, updateNodeParams("o", Contains(Pair("frequency", Value(220.0))), _, 120.0)).Times(1);
    manager->syncParameters(120);
    manager->syncParameters(120);
    Mock::VerifyAndClearExpectations(&backend);

    store.setParameter("o", "frequency", 440.0);
    EXPECT_CALL(backend, updateNodeParams("o", Contains(Pair("frequency", Value(440.0))), _, 120.0)).Times(1);
    manager->syncParameters(120);
    Mock::VerifyAndClearExpectations(&backend);

    EXPECT_CALL(backend, updateNodeParams("o", _, _, 90.0)).Times(1);
    manager->syncParameters(90);
}

TEST_F(ResourceManagerTest, CompletionAfterManagerDestroyedIsIgnored) {
    backend.deferCreates = true;
    store.addInstance("osc", "Osc", "o");
    manager->reconcile();
    manager.reset();
    backend.completeNextCreate(true);
    EXPECT_TRUE(instance("o").needsResourceSetup);
}
