#include <gtest/gtest.h>
#include "kgviz/interaction/highlight_coordinator.hpp"
#include "snapshot_builder.hpp"

using namespace kgviz;
using kgviz::testing_support::MapPositionSource;
using kgviz::testing_support::SnapshotBuilder;

class HighlightCoordinatorTest : public ::testing::Test {
protected:
    GraphSnapshot snapshot;
    GraphIndex index;
    std::map<int, std::set<int>> adjacency;
    HighlightCoordinator coordinator;

    void SetUp() override {
        snapshot = testing_support::two_cluster_snapshot();
        snapshot.edges.push_back(Edge{"broken", "a1", "nobody", 1.0, "RELATED_TO", false, 0.0});
        index.build(snapshot);
        adjacency = {{0, {1}}, {1, {0}}, {2, {}}};
        coordinator.set_dataset(snapshot, index, adjacency);
    }
};

// ==========================================
// Click Tests
// ==========================================

TEST_F(HighlightCoordinatorTest, ClickHighlightsNeighborhood) {
    ASSERT_TRUE(coordinator.click_node("a3"));

    const auto& state = coordinator.state();
    EXPECT_EQ(state.nodes, (std::unordered_set<std::string>{"a3", "a1", "a2", "b1"}));
    EXPECT_EQ(state.edges, (std::unordered_set<std::string>{"a2-a3", "a1-a3", "a3-b1"}));
    EXPECT_EQ(coordinator.selected_node(), std::optional<std::string>("a3"));
}

TEST_F(HighlightCoordinatorTest, HighlightIsSymmetric) {
    for (const auto& edge : index.edges) {
        coordinator.click_node(edge.source);
        EXPECT_TRUE(coordinator.state().is_node_highlighted(edge.target)) << edge.id;
        coordinator.click_node(edge.target);
        EXPECT_TRUE(coordinator.state().is_node_highlighted(edge.source)) << edge.id;
    }
}

TEST_F(HighlightCoordinatorTest, DanglingEdgeNotHighlighted) {
    coordinator.click_node("a1");
    EXPECT_FALSE(coordinator.state().is_edge_highlighted("broken"));
    EXPECT_FALSE(coordinator.state().is_node_highlighted("nobody"));
}

TEST_F(HighlightCoordinatorTest, IsolatedNodeHighlightsOnlyItself) {
    coordinator.click_node("loner");
    EXPECT_EQ(coordinator.state().nodes.size(), 1);
    EXPECT_TRUE(coordinator.state().edges.empty());
}

TEST_F(HighlightCoordinatorTest, UnknownNodeLeavesStateAlone) {
    coordinator.click_node("b2");
    auto before = coordinator.state().nodes;

    EXPECT_FALSE(coordinator.click_node("nobody"));
    EXPECT_EQ(coordinator.state().nodes, before);
}

TEST_F(HighlightCoordinatorTest, BackgroundClickClears) {
    coordinator.click_node("a1");
    coordinator.click_background();

    EXPECT_FALSE(coordinator.state().has_highlights());
    EXPECT_FALSE(coordinator.selected_node().has_value());
}

TEST_F(HighlightCoordinatorTest, PinsSurviveClearing) {
    coordinator.pin("b2");
    coordinator.click_node("a1");
    coordinator.click_background();
    coordinator.set_dataset(snapshot, index, adjacency);

    EXPECT_TRUE(coordinator.state().is_pinned("b2"));
    EXPECT_FALSE(coordinator.toggle_pin("b2"));
    EXPECT_TRUE(coordinator.toggle_pin("b2"));
    coordinator.clear_pins();
    EXPECT_TRUE(coordinator.pinned().empty());
}

// ==========================================
// Gap Tests
// ==========================================

class GapSelectionTest : public ::testing::Test {
protected:
    GraphSnapshot snapshot;
    GraphIndex index;
    HighlightCoordinator coordinator;
    CameraController camera;
    MapPositionSource positions;

    void SetUp() override {
        snapshot = SnapshotBuilder()
            .node("n1", 0).node("n2", 0).node("n3", 1).node("n4", 2).node("n5", 2)
            .edge("n1", "n2").edge("n4", "n5")
            .cluster(0, "Left", {"n1", "n2"})
            .cluster(1, "Right", {"n3"})
            .cluster(2, "Bridge", {"n4", "n5"})
            .gap("gap-0-1", 0, 1, 0.7, {"n1", "n2"}, {"n3"}, {"n4"})
            .build();
        index.build(snapshot);

        positions.positions["n1"] = Vec3{0.0, 0.0, 0.0};
        positions.positions["n2"] = Vec3{40.0, 0.0, 0.0};
        positions.positions["n3"] = Vec3{0.0, 40.0, 0.0};
        positions.positions["n4"] = Vec3{40.0, 40.0, 0.0};
        camera.set_position_source(&positions);
        camera.set_targets(snapshot, index);

        coordinator.set_dataset(snapshot, index, {});
        coordinator.set_camera(&camera);
    }
};

TEST_F(GapSelectionTest, HighlightsBothSidesAndBridges) {
    ASSERT_TRUE(coordinator.select_gap("gap-0-1"));

    EXPECT_EQ(coordinator.state().nodes,
              (std::unordered_set<std::string>{"n1", "n2", "n3", "n4"}));
    EXPECT_EQ(coordinator.selected_gap(), std::optional<std::string>("gap-0-1"));
}

TEST_F(GapSelectionTest, MovesCameraToGap) {
    coordinator.select_gap("gap-0-1");
    EXPECT_TRUE(camera.is_animating());
    EXPECT_DOUBLE_EQ(camera.target_pose().look_at.x, 20.0);
    EXPECT_DOUBLE_EQ(camera.target_pose().look_at.y, 20.0);
}

TEST_F(GapSelectionTest, UnknownGapRejected) {
    EXPECT_FALSE(coordinator.select_gap("gap-9-9"));
    EXPECT_FALSE(coordinator.state().has_highlights());
    EXPECT_FALSE(camera.is_animating());
}

TEST_F(GapSelectionTest, NodeClickReplacesGapSelection) {
    coordinator.select_gap("gap-0-1");
    coordinator.click_node("n5");

    EXPECT_FALSE(coordinator.selected_gap().has_value());
    EXPECT_EQ(coordinator.state().nodes, (std::unordered_set<std::string>{"n5", "n4"}));
}

// ==========================================
// Hover Tests
// ==========================================

TEST_F(HighlightCoordinatorTest, ClusterHoverStates) {
    EXPECT_EQ(coordinator.cluster_state(0), ClusterHoverState::Neutral);

    coordinator.hover_cluster(0);
    EXPECT_EQ(coordinator.cluster_state(0), ClusterHoverState::Focused);
    EXPECT_EQ(coordinator.cluster_state(1), ClusterHoverState::Connected);
    EXPECT_EQ(coordinator.cluster_state(2), ClusterHoverState::Faded);

    EXPECT_DOUBLE_EQ(coordinator.link_opacity(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(coordinator.link_opacity(1, 2), 0.15);

    coordinator.hover_cluster(std::nullopt);
    EXPECT_EQ(coordinator.cluster_state(2), ClusterHoverState::Neutral);
    EXPECT_DOUBLE_EQ(coordinator.link_opacity(1, 2), 1.0);
}

TEST(ClusterHoverStyleTest, Styles) {
    EXPECT_DOUBLE_EQ(cluster_hover_style(ClusterHoverState::Neutral).opacity, 1.0);
    EXPECT_DOUBLE_EQ(cluster_hover_style(ClusterHoverState::Focused).scale, 1.02);
    EXPECT_DOUBLE_EQ(cluster_hover_style(ClusterHoverState::Connected).opacity, 0.85);
    EXPECT_FALSE(cluster_hover_style(ClusterHoverState::Faded).show_label);
    EXPECT_EQ(to_string(ClusterHoverState::Faded), "faded");
}

TEST_F(HighlightCoordinatorTest, NodeHoverTracksKnownNodes) {
    coordinator.hover_node(std::string("a2"));
    EXPECT_EQ(coordinator.hovered_node(), std::optional<std::string>("a2"));

    coordinator.hover_node(std::string("nobody"));
    EXPECT_FALSE(coordinator.hovered_node().has_value());
}

// ==========================================
// Dataset and Callback Tests
// ==========================================

TEST_F(HighlightCoordinatorTest, CallbacksFire) {
    std::string clicked;
    int background = 0;
    int hover_leaves = 0;
    std::optional<int> hovered_cluster;

    InteractionCallbacks callbacks;
    callbacks.on_node_click = [&](const Node& node) { clicked = node.id; };
    callbacks.on_background_click = [&]() { ++background; };
    callbacks.on_node_hover = [&](const Node* node) { if (!node) ++hover_leaves; };
    callbacks.on_cluster_hover = [&](std::optional<int> id) { hovered_cluster = id; };
    coordinator.set_callbacks(callbacks);

    coordinator.click_node("b1");
    coordinator.click_background();
    coordinator.hover_node(std::nullopt);
    coordinator.hover_cluster(1);

    EXPECT_EQ(clicked, "b1");
    EXPECT_EQ(background, 1);
    EXPECT_EQ(hover_leaves, 1);
    EXPECT_EQ(hovered_cluster, std::optional<int>(1));
}

TEST_F(HighlightCoordinatorTest, MissingCallbacksAreSkipped) {
    EXPECT_NO_THROW(coordinator.click_node("a1"));
    EXPECT_NO_THROW(coordinator.click_background());
    EXPECT_NO_THROW(coordinator.hover_cluster(0));
}

TEST_F(HighlightCoordinatorTest, NewDatasetClearsSelection) {
    coordinator.click_node("a1");
    coordinator.hover_cluster(0);
    coordinator.set_dataset(snapshot, index, adjacency);

    EXPECT_FALSE(coordinator.state().has_highlights());
    EXPECT_FALSE(coordinator.hovered_cluster().has_value());
}

TEST_F(HighlightCoordinatorTest, SameShapeRefreshKeepsSelection) {
    coordinator.click_node("a1");
    coordinator.set_dataset(snapshot, index, adjacency, true);

    EXPECT_TRUE(coordinator.state().is_node_highlighted("a2"));
    EXPECT_EQ(coordinator.selected_node(), std::optional<std::string>("a1"));
}
