#include <gtest/gtest.h>
#include "kgviz/layout/force_layout.hpp"
#include "snapshot_builder.hpp"
#include <limits>

using namespace kgviz;
using kgviz::testing_support::SnapshotBuilder;

class ForceLayoutTest : public ::testing::Test {
protected:
    GraphSnapshot snapshot;
    GraphIndex index;
    LayoutConfig config;

    void SetUp() override {
        snapshot = testing_support::two_cluster_snapshot();
        index.build(snapshot);
    }
};

// ==========================================
// Lifecycle Tests
// ==========================================

TEST_F(ForceLayoutTest, StartRunsWarmup) {
    ForceLayout3D layout(config);
    layout.start(index);

    EXPECT_EQ(layout.nodes().size(), 6);
    EXPECT_EQ(layout.tick_count(), config.warmup_ticks);
    EXPECT_TRUE(layout.is_running());
    EXPECT_LT(layout.alpha(), config.alpha_start);
}

TEST_F(ForceLayoutTest, StopsAfterTickBudget) {
    ForceLayout3D layout(config);
    layout.start(index);
    layout.step(10000);

    EXPECT_FALSE(layout.is_running());
    EXPECT_LE(layout.tick_count(), config.cooldown_ticks);
    EXPECT_FALSE(layout.tick());
    EXPECT_EQ(layout.step(5), 0);
}

TEST_F(ForceLayoutTest, ReheatRestartsCooling) {
    ForceLayout3D layout(config);
    layout.start(index);
    layout.step(10000);

    layout.reheat();
    EXPECT_TRUE(layout.is_running());
    EXPECT_DOUBLE_EQ(layout.alpha(), config.alpha_start);
    EXPECT_EQ(layout.tick_count(), 0);
}

TEST_F(ForceLayoutTest, GhostAndDanglingEdgesAreNotSprings) {
    snapshot.edges.push_back(Edge{"ghost", "a1", "b2", 0.0, "POTENTIAL", true, 0.9});
    snapshot.edges.push_back(Edge{"dangling", "a1", "nobody", 1.0, "RELATED_TO", false, 0.0});
    index.build(snapshot);

    ForceLayout3D layout(config);
    layout.start(index);
    EXPECT_EQ(layout.links().size(), 5);
}

TEST_F(ForceLayoutTest, DeterministicForSeed) {
    ForceLayout3D first(config);
    ForceLayout3D second(config);
    first.start(index);
    second.start(index);
    first.step(20);
    second.step(20);

    for (const auto& id : index.node_ids) {
        auto a = first.position_of(id);
        auto b = second.position_of(id);
        ASSERT_TRUE(a && b);
        EXPECT_DOUBLE_EQ(a->x, b->x);
        EXPECT_DOUBLE_EQ(a->y, b->y);
        EXPECT_DOUBLE_EQ(a->z, b->z);
    }
}

// ==========================================
// Degenerate Input Tests
// ==========================================

TEST(ForceLayoutEdgeCaseTest, SingleNodeAtOrigin) {
    GraphSnapshot s = SnapshotBuilder().node("only").build();
    GraphIndex index;
    index.build(s);

    ForceLayout3D layout;
    layout.start(index);

    auto p = layout.position_of("only");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, 0.0);
    EXPECT_DOUBLE_EQ(p->y, 0.0);
    EXPECT_DOUBLE_EQ(p->z, 0.0);
    EXPECT_FALSE(layout.is_running());
}

TEST(ForceLayoutEdgeCaseTest, EmptyGraph) {
    GraphIndex index;
    index.build(GraphSnapshot());

    ForceLayout3D layout;
    layout.start(index);
    EXPECT_TRUE(layout.nodes().empty());
    EXPECT_FALSE(layout.is_running());
    EXPECT_FALSE(layout.position_of("x").has_value());
}

TEST(ForceLayoutEdgeCaseTest, NonFinitePositionsAreRepaired) {
    GraphSnapshot s = SnapshotBuilder().node("a").node("b").node("c").edge("a", "b").build();
    GraphIndex index;
    index.build(s);

    LayoutConfig config;
    config.repulsion_strength = std::numeric_limits<double>::infinity();
    config.warmup_ticks = 0;

    ForceLayout3D layout(config);
    layout.start(index);
    layout.step(3);

    EXPECT_GT(layout.repaired_positions(), 0);
    for (const auto& node : layout.nodes()) {
        EXPECT_TRUE(node.position.is_finite()) << node.id;
    }
}

// ==========================================
// Pinning Tests
// ==========================================

TEST_F(ForceLayoutTest, FixedNodeStaysPut) {
    ForceLayout3D layout(config);
    layout.start(index);

    Vec3 anchor{10.0, -20.0, 30.0};
    ASSERT_TRUE(layout.fix_node("a1", anchor));
    layout.step(20);

    auto p = layout.position_of("a1");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->x, 10.0);
    EXPECT_DOUBLE_EQ(p->y, -20.0);
    EXPECT_DOUBLE_EQ(p->z, 30.0);

    EXPECT_TRUE(layout.release_node("a1"));
    EXPECT_FALSE(layout.fix_node("nobody", anchor));
    EXPECT_FALSE(layout.fix_node("a2", Vec3{std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0}));
}

// ==========================================
// Force Law Tests
// ==========================================

namespace {

// Speed of a free pair one tick after being released `gap` apart
double release_speed(double gap) {
    GraphSnapshot s = SnapshotBuilder().node("p").node("q").build();
    GraphIndex index;
    index.build(s);

    LayoutConfig config;
    config.warmup_ticks = 0;
    config.centering_strength = 0.0;
    config.max_speed = 1e9;

    ForceLayout3D layout(config);
    layout.start(index);
    layout.fix_node("p", Vec3{-gap / 2.0, 0.0, 0.0});
    layout.fix_node("q", Vec3{gap / 2.0, 0.0, 0.0});
    layout.tick();
    layout.release_node("p");
    layout.release_node("q");
    layout.tick();
    return layout.nodes()[0].velocity.length();
}

} // namespace

TEST(ForceLayoutRepulsionTest, FallsOffWithDistance) {
    double near = release_speed(20.0);
    double far = release_speed(40.0);

    ASSERT_GT(far, 0.0);
    EXPECT_NEAR(near / far, 2.0, 1e-9);
}

TEST(ForceLayoutRepulsionTest, PushesPairApart) {
    GraphSnapshot s = SnapshotBuilder().node("p").node("q").build();
    GraphIndex index;
    index.build(s);

    LayoutConfig config;
    config.warmup_ticks = 0;
    config.centering_strength = 0.0;

    ForceLayout3D layout(config);
    layout.start(index);
    layout.fix_node("p", Vec3{-10.0, 0.0, 0.0});
    layout.fix_node("q", Vec3{10.0, 0.0, 0.0});
    layout.tick();
    layout.release_node("p");
    layout.release_node("q");
    layout.tick();

    EXPECT_LT(layout.position_of("p")->x, -10.0);
    EXPECT_GT(layout.position_of("q")->x, 10.0);
}
