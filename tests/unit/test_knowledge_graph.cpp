#include <gtest/gtest.h>
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "snapshot_builder.hpp"
#include <cstdio>

using namespace kgviz;
using kgviz::testing_support::SnapshotBuilder;

class KnowledgeGraphTest : public ::testing::Test {
protected:
    GraphSnapshot snapshot;

    void SetUp() override {
        snapshot = testing_support::two_cluster_snapshot();
    }
};

// ==========================================
// Lookup Tests
// ==========================================

TEST_F(KnowledgeGraphTest, FindNode) {
    const Node* node = snapshot.find_node("a1");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->id, "a1");
    EXPECT_EQ(snapshot.find_node("missing"), nullptr);
    EXPECT_TRUE(snapshot.has_node("loner"));
}

TEST_F(KnowledgeGraphTest, FindClusterAndGap) {
    ASSERT_NE(snapshot.find_cluster(1), nullptr);
    EXPECT_EQ(snapshot.find_cluster(1)->label, "Beta");
    EXPECT_EQ(snapshot.find_cluster(7), nullptr);
    EXPECT_EQ(snapshot.find_gap("nope"), nullptr);
}

TEST_F(KnowledgeGraphTest, CentralityMapDefaultsToZero) {
    auto map = snapshot.centrality_map();
    EXPECT_DOUBLE_EQ(map["a1"], 0.9);
    EXPECT_EQ(map.count("unknown"), 0);
}

TEST_F(KnowledgeGraphTest, NodeClusterMapPrefersExplicitAssignment) {
    GraphSnapshot s = SnapshotBuilder()
        .node("x", 2).node("y")
        .cluster(1, "One", {"x", "y"})
        .build();

    auto map = s.node_cluster_map();
    EXPECT_EQ(map["x"], 2);
    EXPECT_EQ(map["y"], 1);
}

// ==========================================
// Cluster Label Tests
// ==========================================

TEST(ClusterTest, SynthesizedLabel) {
    Cluster c;
    c.cluster_id = 4;
    EXPECT_FALSE(c.has_label());
    EXPECT_EQ(c.display_label(), "Cluster 5");
    EXPECT_EQ(c.color_key(), "cluster-4");
}

TEST(ClusterTest, PunctuationOnlyLabelIsAbsent) {
    Cluster c;
    c.cluster_id = 0;
    c.label = " / , ";
    EXPECT_FALSE(c.has_label());
    EXPECT_EQ(c.display_label(), "Cluster 1");
}

TEST(ClusterTest, RealLabelIsKept) {
    Cluster c;
    c.cluster_id = 3;
    c.label = "Graph Learning";
    EXPECT_TRUE(c.has_label());
    EXPECT_EQ(c.display_label(), "Graph Learning");
    EXPECT_EQ(c.color_key(), "Graph Learning");
}

TEST(StructuralGapTest, AllNodeIdsDeduplicated) {
    StructuralGap gap;
    gap.cluster_a_concepts = {"n1", "n2"};
    gap.cluster_b_concepts = {"n3", "n1"};
    gap.bridge_candidates = {"n4", "n3"};

    std::vector<std::string> expected = {"n1", "n2", "n3", "n4"};
    EXPECT_EQ(gap.all_node_ids(), expected);
}

// ==========================================
// Structure Tests
// ==========================================

TEST_F(KnowledgeGraphTest, ValidEdgesDropDangling) {
    snapshot.edges.push_back(Edge{"dangling", "a1", "ghost-node", 1.0, "RELATED_TO", false, 0.0});
    auto valid = snapshot.valid_edges();
    EXPECT_EQ(valid.size(), 5);
    for (const auto& e : valid) {
        EXPECT_NE(e.id, "dangling");
    }
}

TEST_F(KnowledgeGraphTest, StructuralEquality) {
    GraphSnapshot copy = snapshot;
    copy.centrality.clear();
    copy.clusters.clear();
    EXPECT_TRUE(snapshot.structurally_equal(copy));

    copy.edges.back().target = "b2";
    EXPECT_FALSE(snapshot.structurally_equal(copy));
}

TEST_F(KnowledgeGraphTest, ComputeStatistics) {
    snapshot.edges.push_back(Edge{"dangling", "a1", "zzz", 1.0, "RELATED_TO", false, 0.0});
    auto stats = snapshot.compute_statistics();

    EXPECT_EQ(stats.num_nodes, 6);
    EXPECT_EQ(stats.num_edges, 5);
    EXPECT_EQ(stats.num_dangling_edges, 1);
    EXPECT_EQ(stats.num_clusters, 2);
    EXPECT_EQ(stats.num_unclustered_nodes, 1);
    EXPECT_DOUBLE_EQ(stats.max_centrality, 0.9);
}

// ==========================================
// JSON Tests
// ==========================================

TEST(SnapshotJsonTest, ParsesOptionalFieldsAndPotentialEdges) {
    nlohmann::json j = {
        {"nodes", {
            {{"id", "p"}, {"name", "Paper"}, {"entity_type", "Paper"},
             {"properties", {{"cluster_id", "2"}, {"is_gap_bridge", "true"}}}},
            {{"id", 42}}
        }},
        {"edges", {{{"id", "e1"}, {"source", "p"}, {"target", 42}, {"weight", -3.0}}}},
        {"potential_edges", {{{"source_id", "p"}, {"target_id", "42"}, {"similarity", 1.7}}}},
        {"clusters", {{{"cluster_id", 2}, {"concepts", {"p"}}}}},
        {"centrality", {{"p", 0.4}, {"42", "n/a"}}}
    };

    GraphSnapshot s = GraphSnapshot::from_json(j);
    ASSERT_EQ(s.nodes.size(), 2);
    EXPECT_EQ(s.nodes[0].cluster_id, 2);
    EXPECT_TRUE(s.nodes[0].is_bridge);
    EXPECT_EQ(s.nodes[1].id, "42");
    EXPECT_EQ(s.nodes[1].name, "42");

    ASSERT_EQ(s.edges.size(), 2);
    EXPECT_DOUBLE_EQ(s.edges[0].weight, 0.0);
    EXPECT_TRUE(s.edges[1].is_ghost);
    EXPECT_DOUBLE_EQ(s.edges[1].similarity, 1.0);

    ASSERT_EQ(s.clusters.size(), 1);
    EXPECT_EQ(s.clusters[0].size, 1);
    EXPECT_EQ(s.clusters[0].display_label(), "Cluster 3");

    auto centrality = s.centrality_map();
    EXPECT_DOUBLE_EQ(centrality["p"], 0.4);
    EXPECT_DOUBLE_EQ(centrality["42"], 0.0);
}

TEST(SnapshotJsonTest, OutOfRangeClusterIdsRejected) {
    nlohmann::json j = {
        {"nodes", {
            {{"id", "huge"}, {"cluster_id", 1e20}},
            {{"id", "half"}, {"cluster_id", 2.5}},
            {{"id", "wide"}, {"cluster_id", 4294967296LL}},
            {{"id", "whole"}, {"cluster_id", 3.0}},
            {{"id", "negative"}, {"properties", {{"cluster_id", -7}}}}
        }}
    };

    GraphSnapshot s = GraphSnapshot::from_json(j);
    ASSERT_EQ(s.nodes.size(), 5);
    EXPECT_FALSE(s.nodes[0].cluster_id.has_value());
    EXPECT_FALSE(s.nodes[1].cluster_id.has_value());
    EXPECT_FALSE(s.nodes[2].cluster_id.has_value());
    EXPECT_EQ(s.nodes[3].cluster_id, 3);
    EXPECT_EQ(s.nodes[4].cluster_id, -7);

    nlohmann::json bad_cluster = {{"clusters", {{{"cluster_id", 1e20}, {"concepts", {"x"}}}}}};
    EXPECT_THROW(GraphSnapshot::from_json(bad_cluster), std::runtime_error);
}

TEST(SnapshotJsonTest, MissingNodeIdThrows) {
    nlohmann::json j = {{"nodes", {{{"name", "no id"}}}}};
    EXPECT_THROW(GraphSnapshot::from_json(j), std::runtime_error);
}

TEST(SnapshotJsonTest, NonObjectThrows) {
    EXPECT_THROW(GraphSnapshot::from_json(nlohmann::json::array()), std::runtime_error);
}

TEST_F(KnowledgeGraphTest, ExportImportRoundtrip) {
    std::string path = "/tmp/kgviz_test_snapshot.json";
    snapshot.export_to_json(path);

    GraphSnapshot loaded = GraphSnapshot::load_from_json(path);
    EXPECT_TRUE(snapshot.structurally_equal(loaded));
    EXPECT_EQ(loaded.clusters.size(), snapshot.clusters.size());
    EXPECT_EQ(loaded.centrality_map(), snapshot.centrality_map());

    std::remove(path.c_str());
}

TEST(SnapshotJsonTest, MissingFileThrows) {
    EXPECT_THROW(GraphSnapshot::load_from_json("/nonexistent/snapshot.json"), std::runtime_error);
}

// ==========================================
// GraphIndex Tests
// ==========================================

TEST_F(KnowledgeGraphTest, IndexDropsDanglingEdges) {
    snapshot.edges.push_back(Edge{"dangling", "a1", "missing", 1.0, "RELATED_TO", false, 0.0});
    GraphIndex index;
    index.build(snapshot);

    EXPECT_EQ(index.dropped_edges, 1);
    EXPECT_EQ(index.edges.size(), 5);
    EXPECT_EQ(index.edge_index.count("dangling"), 0);
    EXPECT_EQ(index.neighbors_of("a1").count("missing"), 0);
}

TEST_F(KnowledgeGraphTest, IndexNeighborsAreSymmetric) {
    GraphIndex index;
    index.build(snapshot);

    for (const auto& [node, neighbours] : index.neighbors) {
        for (const auto& other : neighbours) {
            EXPECT_EQ(index.neighbors_of(other).count(node), 1) << node << " / " << other;
        }
    }
    EXPECT_TRUE(index.neighbors_of("loner").empty());
}

TEST_F(KnowledgeGraphTest, IndexSeparatesGhostEdges) {
    snapshot.edges.push_back(Edge{"g", "a1", "b2", 0.0, "POTENTIAL", true, 0.6});
    GraphIndex index;
    index.build(snapshot);

    EXPECT_EQ(index.ghost_edges.size(), 1);
    EXPECT_EQ(index.neighbors_of("a1").count("b2"), 0);
}

TEST_F(KnowledgeGraphTest, IndexClusterMembers) {
    GraphIndex index;
    index.build(snapshot);

    std::vector<std::string> alpha = {"a1", "a2", "a3"};
    EXPECT_EQ(index.members_of(0), alpha);
    EXPECT_TRUE(index.members_of(9).empty());
    EXPECT_EQ(index.cluster_of("b1"), 1);
    EXPECT_FALSE(index.cluster_of("loner").has_value());
}

TEST(GraphIndexTest, DuplicateNodeIdsFirstWins) {
    GraphSnapshot s = SnapshotBuilder().node("x", 0).node("x", 1).build();
    GraphIndex index;
    index.build(s);
    EXPECT_EQ(index.num_nodes(), 1);
}
