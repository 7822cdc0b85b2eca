#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "test_helpers.hpp"

using namespace BlockFlow;
using namespace BlockFlowTest;
using ::testing::EndsWith;
using ::testing::HasSubstr;

class BlockStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        BlockDefinition src = makeDefinition("src", {}, {{"num", PortType::Number}, {"trig", PortType::Trigger}});
        src.parameters = {{"value", 3.0}};
        store.addDefinition(src);
        store.addDefinition(makeDefinition("sink", {{"in", PortType::Number}, {"gate", PortType::Gate}}, {}));
        store.addDefinition(makeDefinition("osc", {{"audio_in", PortType::Audio}}, {{"audio_out", PortType::Audio}},
                                           "", true));
        store.setObserver([this] { ++notifications; });
    }

    BlockStore store;
    int notifications = 0;
};

TEST_F(BlockStoreTest, AddInstanceSeedsFromDefinition) {
    InstanceId id = store.addInstance("src", "Source");
    const BlockInstance* inst = store.findInstance(id);
    ASSERT_NE(inst, nullptr);
    EXPECT_EQ(inst->name, "Source");
    EXPECT_EQ(inst->parameters.at("value"), Value(3.0));
    EXPECT_EQ(inst->lastRunOutputs.at("num"), Value(0.0));
    EXPECT_TRUE(isNull(inst->lastRunOutputs.at("trig")));
    EXPECT_FALSE(inst->needsResourceSetup);
    ASSERT_EQ(inst->logs.size(), 1u);
    EXPECT_THAT(inst->logs.front(), HasSubstr("Instance 'Source' created."));

    InstanceId osc = store.addInstance("osc", "");
    EXPECT_TRUE(store.findInstance(osc)->needsResourceSetup);
    EXPECT_EQ(store.findInstance(osc)->name, "osc");
}

TEST_F(BlockStoreTest, UnknownDefinitionOrDuplicateIdRejected) {
    EXPECT_THROW(store.addInstance("nope", "x"), std::invalid_argument);
    store.addInstance("src", "a", "fixed");
    EXPECT_THROW(store.addInstance("src", "b", "fixed"), std::invalid_argument);
}

TEST_F(BlockStoreTest, DeleteInstancePrunesConnections) {
    store.addInstance("src", "a", "a");
    store.addInstance("sink", "b", "b");
    store.addInstance("src", "c", "c");
    store.addConnection(makeConnection("ab", "a", "num", "b", "in"));
    store.addConnection(makeConnection("cb", "c", "trig", "b", "gate"));

    EXPECT_TRUE(store.deleteInstance("a"));
    ASSERT_EQ(store.getConnections().size(), 1u);
    EXPECT_EQ(store.getConnections().front().id, "cb");
    EXPECT_FALSE(store.deleteInstance("a"));
}

TEST_F(BlockStoreTest, ConnectionValidation) {
    store.addInstance("src", "a", "a");
    store.addInstance("sink", "b", "b");
    store.addInstance("osc", "o", "o");

    EXPECT_THROW(store.addConnection(makeConnection("", "a", "num", "ghost", "in")), std::invalid_argument);
    EXPECT_THROW(store.addConnection(makeConnection("", "a", "nope", "b", "in")), std::invalid_argument);
    EXPECT_THROW(store.addConnection(makeConnection("", "a", "num", "b", "nope")), std::invalid_argument);
    EXPECT_THROW(store.addConnection(makeConnection("", "o", "audio_out", "o", "audio_in")), std::invalid_argument);
    try {
        store.addConnection(makeConnection("", "a", "num", "o", "audio_in"));
        FAIL() << "number -> audio accepted";
    } catch (const std::invalid_argument& e) {
        EXPECT_THAT(e.what(), HasSubstr("Type mismatch in connection: number -> audio"));
    }
    EXPECT_TRUE(store.getConnections().empty());

    // trigger and gate are interchangeable
    EXPECT_EQ(store.addConnection(makeConnection("", "a", "trig", "b", "gate")), "conn_1");
}

TEST_F(BlockStoreTest, FanInRejected) {
    store.addInstance("src", "a", "a");
    store.addInstance("src", "c", "c");
    store.addInstance("sink", "b", "b");
    store.addConnection(makeConnection("first", "a", "num", "b", "in"));
    EXPECT_THROW(store.addConnection(makeConnection("second", "c", "num", "b", "in")), std::invalid_argument);
    EXPECT_THROW(store.addConnection(makeConnection("first", "c", "trig", "b", "gate")), std::invalid_argument);
}

TEST_F(BlockStoreTest, LogsNewestFirstAndCapped) {
    InstanceId id = store.addInstance("src", "a");
    for (int i = 0; i < 60; ++i) store.addLog(id, "line " + std::to_string(i));
    const auto& logs = store.findInstance(id)->logs;
    ASSERT_EQ(logs.size(), BlockStore::kMaxLogLines);
    EXPECT_THAT(logs.front(), EndsWith(" - line 59"));
    EXPECT_THAT(logs.back(), EndsWith(" - line 10"));
}

TEST_F(BlockStoreTest, BatchedUpdateNotifiesOnce) {
    store.addInstance("src", "a", "a");
    store.addInstance("src", "b", "b");
    notifications = 0;

    InstancePatch patch;
    patch.lastRunOutputs = ValueMap{{"num", 1.0}};
    InstanceTransform rename = [](const BlockInstance& in) {
        BlockInstance out = in;
        out.internalState["touched"] = true;
        return out;
    };
    store.updateInstances({InstanceUpdate{"a", patch}, InstanceUpdate{"b", rename}});
    EXPECT_EQ(notifications, 1);
    EXPECT_EQ(store.findInstance("a")->lastRunOutputs.at("num"), Value(1.0));
    EXPECT_EQ(store.findInstance("b")->internalState.at("touched"), Value(true));
}

TEST_F(BlockStoreTest, TransformMayNotChangeId) {
    store.addInstance("src", "a", "a");
    InstanceTransform bad = [](const BlockInstance& in) {
        BlockInstance out = in;
        out.instanceId = "other";
        return out;
    };
    EXPECT_THROW(store.updateInstances({InstanceUpdate{"a", bad}}), InvariantViolation);
}

TEST_F(BlockStoreTest, SetParameter) {
    store.addInstance("src", "a", "a");
    store.setParameter("a", "value", 9.0);
    EXPECT_EQ(store.findInstance("a")->parameters.at("value"), Value(9.0));
    EXPECT_THROW(store.setParameter("ghost", "value", 1.0), std::invalid_argument);
}
