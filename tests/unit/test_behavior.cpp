#include <gtest/gtest.h>

#include "Behavior.hpp"

using namespace BlockFlow;

namespace {

BehaviorFactory constant(double v) {
    return [v] {
        return BlockBehavior([v](const BehaviorCall& call) {
            call.setOutput("out", v);
            return StateBag{};
        });
    };
}

double runOnce(const BlockBehavior& fn) {
    ValueMap inputs, params, produced;
    StateBag state;
    OutputSetter set = [&produced](const PortId& p, Value v) { produced[p] = std::move(v); };
    BlockLogger logger = [](const std::string&) {};
    MessageSender sender = [](const nlohmann::json&) {};
    BlockContext context;
    fn(BehaviorCall{inputs, params, state, set, logger, context, sender});
    return toNumber(produced["out"]);
}

} // namespace

class BehaviorCacheTest : public ::testing::Test {
protected:
    void SetUp() override { registry.registerBehavior("k", constant(1)); }

    BehaviorRegistry registry;
};

TEST_F(BehaviorCacheTest, RegisterBumpsVersion) {
    EXPECT_EQ(registry.version("k"), 1u);
    EXPECT_EQ(registry.registerBehavior("k", constant(2)), 2u);
    EXPECT_TRUE(registry.contains("k"));
    EXPECT_FALSE(registry.contains("missing"));
}

TEST_F(BehaviorCacheTest, UnknownBehaviorThrows) {
    EXPECT_THROW(registry.compile("missing"), BehaviorNotFound);
    BehaviorCache cache(registry);
    EXPECT_THROW(cache.get("i1", "missing"), BehaviorNotFound);
}

TEST_F(BehaviorCacheTest, CompilesOncePerInstance) {
    BehaviorCache cache(registry);
    cache.get("i1", "k");
    cache.get("i1", "k");
    cache.get("i2", "k");
    EXPECT_EQ(cache.compileCount(), 2u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(BehaviorCacheTest, SourceChangeRecompiles) {
    BehaviorCache cache(registry);
    EXPECT_DOUBLE_EQ(runOnce(cache.get("i1", "k")), 1.0);
    registry.registerBehavior("k", constant(5));
    EXPECT_DOUBLE_EQ(runOnce(cache.get("i1", "k")), 5.0);
    EXPECT_EQ(cache.compileCount(), 2u);
}

TEST_F(BehaviorCacheTest, EvictAndClear) {
    BehaviorCache cache(registry);
    cache.get("i1", "k");
    cache.get("i2", "k");
    cache.evict("i1");
    EXPECT_FALSE(cache.contains("i1"));
    EXPECT_TRUE(cache.contains("i2"));
    cache.get("i1", "k");
    EXPECT_EQ(cache.compileCount(), 3u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(BehaviorCacheTest, RetainOnlyDropsDeadInstances) {
    BehaviorCache cache(registry);
    cache.get("i1", "k");
    cache.get("i2", "k");
    cache.retainOnly({"i2"});
    EXPECT_FALSE(cache.contains("i1"));
    EXPECT_TRUE(cache.contains("i2"));
}

TEST_F(BehaviorCacheTest, EachInstanceGetsItsOwnClosure) {
    registry.registerBehavior("counter", [] {
        auto calls = std::make_shared<int>(0);
        return BlockBehavior([calls](const BehaviorCall& call) {
            call.setOutput("out", static_cast<double>(++*calls));
            return StateBag{};
        });
    });
    BehaviorCache cache(registry);
    runOnce(cache.get("a", "counter"));
    EXPECT_DOUBLE_EQ(runOnce(cache.get("a", "counter")), 2.0);
    EXPECT_DOUBLE_EQ(runOnce(cache.get("b", "counter")), 1.0);
}
