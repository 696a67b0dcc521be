#include <gtest/gtest.h>
#include "kgviz/render/visual_encoder.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

using namespace kgviz;

// ==========================================
// Color Tests
// ==========================================

TEST(ColorTest, HexParsing) {
    Color c = Color::from_hex("#FF6B6B");
    EXPECT_EQ(c.r, 255);
    EXPECT_EQ(c.g, 107);
    EXPECT_EQ(c.b, 107);
    EXPECT_EQ(c.to_hex(), "#FF6B6B");
    EXPECT_EQ(Color::from_hex("#0d1117"), colors::kBackground);
}

TEST(ColorTest, MalformedHexThrows) {
    EXPECT_THROW(Color::from_hex("FF6B6B"), std::invalid_argument);
    EXPECT_THROW(Color::from_hex("#FF6B6"), std::invalid_argument);
    EXPECT_THROW(Color::from_hex("#GG0000"), std::invalid_argument);
}

TEST(ColorTest, AlphaIsClamped) {
    EXPECT_DOUBLE_EQ(colors::kWhite.with_alpha(1.5).a, 1.0);
    EXPECT_DOUBLE_EQ(colors::kWhite.with_alpha(-1.0).a, 0.0);
    EXPECT_EQ(colors::kWhite.with_alpha(0.3).to_rgba(), "rgba(255, 255, 255, 0.3)");
}

TEST(ColorTest, BlendEndpoints) {
    Color a = Color::from_hex("#000000");
    Color b = Color::from_hex("#FFFFFF");
    EXPECT_EQ(blend(a, b, 0.0), a);
    EXPECT_EQ(blend(a, b, 1.0), b);
    EXPECT_EQ(blend(a, b, 0.5).r, 128);
}

// ==========================================
// Cluster Color Determinism
// ==========================================

TEST(ClusterColorTest, SameKeySameColor) {
    EXPECT_EQ(cluster_color("Graph Learning"), cluster_color("Graph Learning"));
    EXPECT_EQ(cluster_color("cluster-3"), cluster_color(std::string("cluster-") + "3"));
}

TEST(ClusterColorTest, ColorComesFromPalette) {
    const auto& palette = colors::cluster_palette();
    ASSERT_EQ(palette.size(), 12);

    for (const std::string key : {"a", "Language Models", "cluster-0", ""}) {
        Color c = cluster_color(key);
        EXPECT_EQ(c, palette[fnv1a_hash(key) % palette.size()]);
    }
}

TEST(ClusterColorTest, Fnv1aKnownValues) {
    EXPECT_EQ(fnv1a_hash(""), 2166136261u);
    EXPECT_EQ(fnv1a_hash("a"), 0xE40C292Cu);
}

TEST(ClusterColorTest, IndependentOfClusterOrder) {
    std::vector<std::string> keys = {"Alpha", "Beta", "Gamma", "Delta"};
    std::vector<Color> forward;
    for (const auto& k : keys) forward.push_back(cluster_color(k));

    std::vector<std::string> reversed(keys.rbegin(), keys.rend());
    for (size_t i = 0; i < reversed.size(); ++i) {
        EXPECT_EQ(cluster_color(reversed[i]), forward[keys.size() - 1 - i]);
    }
}

// ==========================================
// Sizing Tests
// ==========================================

TEST(SizingTest, RadiusIsMonotonic) {
    double previous = node_radius(0.0, false);
    for (double c = 0.01; c <= 1.0; c += 0.01) {
        double r = node_radius(c, false);
        EXPECT_GE(r, previous);
        previous = r;
    }
}

TEST(SizingTest, RadiusGrowsWithSquareRoot) {
    // r(4c) = 2 r(c) - base
    for (double c : {0.01, 0.1, 0.2}) {
        EXPECT_NEAR(node_radius(4.0 * c, false),
                    2.0 * node_radius(c, false) - sizing::kNodeBase, 1e-9);
    }
}

TEST(SizingTest, BridgeBoostAndBadInput) {
    EXPECT_DOUBLE_EQ(node_radius(0.25, true) - node_radius(0.25, false), sizing::kBridgeBoost);
    EXPECT_DOUBLE_EQ(node_radius(-1.0, false), sizing::kNodeBase);
    EXPECT_DOUBLE_EQ(node_radius(std::numeric_limits<double>::quiet_NaN(), false), sizing::kNodeBase);
}

TEST(SizingTest, ClusterRadius) {
    EXPECT_DOUBLE_EQ(cluster_radius(0), sizing::kClusterBase);
    EXPECT_DOUBLE_EQ(cluster_radius(16), sizing::kClusterBase + 4.0 * sizing::kClusterScale);
}

// ==========================================
// Node Encoding Tests
// ==========================================

TEST(VisualEncoderTest, NodeColorPriority) {
    VisualEncoder encoder;

    NodeStyleInput input;
    input.entity_type = "Paper";
    EXPECT_EQ(encoder.node_color(input), Color::from_hex("#6366F1"));

    input.entity_type = "Unknown";
    EXPECT_EQ(encoder.node_color(input), colors::kNeutral);

    input.color_key = "Alpha";
    EXPECT_EQ(encoder.node_color(input), cluster_color("Alpha"));

    input.is_highlighted = true;
    EXPECT_EQ(encoder.node_color(input), colors::kHighlight);
}

TEST(VisualEncoderTest, PlainNodeHasOnlyCore) {
    VisualEncoder encoder;
    NodeStyleInput input;
    input.centrality = 0.5;

    NodeVisual visual = encoder.encode_node(input);
    ASSERT_EQ(visual.layers.size(), 1);
    EXPECT_EQ(visual.layers[0].kind, LayerKind::Core);
    EXPECT_DOUBLE_EQ(visual.layers[0].opacity, 0.85);
    EXPECT_DOUBLE_EQ(visual.layers[0].emissive, 0.2);
    EXPECT_DOUBLE_EQ(visual.radius, node_radius(0.5, false));
}

TEST(VisualEncoderTest, HighlightedBridgeLayers) {
    VisualEncoder encoder;
    NodeStyleInput input;
    input.is_bridge = true;
    input.is_highlighted = true;

    NodeVisual visual = encoder.encode_node(input);
    EXPECT_EQ(visual.layers[0].kind, LayerKind::Core);
    EXPECT_DOUBLE_EQ(visual.layers[0].opacity, 1.0);
    EXPECT_TRUE(visual.has_layer(LayerKind::BridgeHalo));
    EXPECT_FALSE(visual.has_layer(LayerKind::Bloom));

    const VisualLayer* ring = visual.layer(LayerKind::SelectionRing);
    ASSERT_NE(ring, nullptr);
    EXPECT_DOUBLE_EQ(ring->inner_radius, visual.radius * 1.3);
    EXPECT_NEAR(ring->radius, visual.radius * 1.5, 1e-9);
    EXPECT_EQ(ring->color, colors::kHighlight);
}

TEST(VisualEncoderTest, BloomAddsGlowAndClampsSettings) {
    BloomConfig bloom;
    bloom.enabled = true;
    bloom.intensity = 3.0;
    bloom.glow_size = 5.0;
    VisualEncoder encoder(bloom);

    EXPECT_DOUBLE_EQ(encoder.bloom().intensity, 1.0);
    EXPECT_DOUBLE_EQ(encoder.bloom().glow_size, 2.0);

    NodeVisual visual = encoder.encode_node(NodeStyleInput{});
    const VisualLayer* glow = visual.layer(LayerKind::Bloom);
    ASSERT_NE(glow, nullptr);
    EXPECT_DOUBLE_EQ(glow->radius, visual.radius * 2.0);
    EXPECT_DOUBLE_EQ(glow->opacity, 0.2);
}

// ==========================================
// Edge Encoding Tests
// ==========================================

TEST(EdgeStyleTest, KindPriority) {
    EdgeStyleInput input;
    EXPECT_EQ(input.kind(), EdgeColorKind::Neutral);

    input.source_cluster = 1;
    input.target_cluster = 2;
    EXPECT_EQ(input.kind(), EdgeColorKind::CrossCluster);

    input.target_cluster = 1;
    EXPECT_EQ(input.kind(), EdgeColorKind::IntraCluster);

    input.is_highlighted = true;
    EXPECT_EQ(input.kind(), EdgeColorKind::Highlighted);

    input.is_ghost = true;
    EXPECT_EQ(input.kind(), EdgeColorKind::Ghost);
}

TEST(EdgeStyleTest, GhostOpacityFollowsSimilarity) {
    VisualEncoder encoder;
    EdgeStyleInput input;
    input.is_ghost = true;

    input.similarity = 0.0;
    EXPECT_NEAR(encoder.edge_color(input).a, 0.4, 1e-9);
    input.similarity = 1.0;
    EXPECT_NEAR(encoder.edge_color(input).a, 0.8, 1e-9);
    input.similarity = std::numeric_limits<double>::quiet_NaN();
    EXPECT_NEAR(encoder.edge_color(input).a, 0.6, 1e-9);
}

TEST(EdgeStyleTest, CrossClusterBlendsEndpoints) {
    VisualEncoder encoder;
    EdgeStyleInput input;
    input.source_cluster = 0;
    input.target_cluster = 1;
    input.source_color_key = "Alpha";
    input.target_color_key = "Beta";

    Color expected = blend(cluster_color("Alpha"), cluster_color("Beta"), 0.5).with_alpha(0.35);
    EXPECT_EQ(encoder.edge_color(input), expected);
}

// ==========================================
// Label Policy Tests
// ==========================================

TEST(LabelPolicyTest, ImportantThreshold) {
    std::vector<CentralityMetric> metrics;
    for (int i = 0; i < 10; ++i) {
        metrics.push_back({"n" + std::to_string(i), i / 10.0});
    }
    LabelPolicy policy(LabelVisibility::Important, metrics);

    // Sorted descending: index floor(10 * 0.2) = 2 -> 0.7
    EXPECT_DOUBLE_EQ(policy.threshold(), 0.7);
    EXPECT_TRUE(policy.should_label(0.7, false, "x"));
    EXPECT_FALSE(policy.should_label(0.6, false, "x"));
    EXPECT_TRUE(policy.should_label(0.0, true, "x"));
}

TEST(LabelPolicyTest, FailsOpenWithoutCentrality) {
    LabelPolicy policy(LabelVisibility::Important, {});
    EXPECT_FALSE(policy.has_centrality());
    EXPECT_TRUE(policy.should_label(0.0, false, "x"));
}

TEST(LabelPolicyTest, HiddenAndAllModes) {
    std::vector<CentralityMetric> metrics = {{"a", 1.0}};
    EXPECT_FALSE(LabelPolicy(LabelVisibility::Hidden, metrics).should_label(1.0, false, "a"));
    EXPECT_TRUE(LabelPolicy(LabelVisibility::Hidden, metrics).should_label(1.0, true, "a"));
    EXPECT_TRUE(LabelPolicy(LabelVisibility::All, metrics).should_label(0.0, false, "a"));
    EXPECT_FALSE(LabelPolicy(LabelVisibility::All, metrics).should_label(0.0, false, ""));
}

TEST(LabelPolicyTest, Truncation) {
    EXPECT_EQ(LabelPolicy::truncate("Short name"), "Short name");
    EXPECT_EQ(LabelPolicy::truncate("Exactly twenty chars"), "Exactly twenty chars");
    EXPECT_EQ(LabelPolicy::truncate("Twenty-one characters"), "Twenty-one charac...");

    std::string long_label(35, 'x');
    EXPECT_EQ(LabelPolicy::truncate_topic(long_label), std::string(30, 'x') + "...");
}

TEST(LabelPolicyTest, TruncationCountsCodePoints) {
    // 11 code points, 33 bytes
    const std::string korean = "\xea\xb7\xb8\xeb\x9e\x98\xed\x94\x84\xea\xb8\xb0\xeb\xb0\x98"
                               "\xea\xb2\x80\xec\x83\x89\xec\xa6\x9d\xea\xb0\x95\xec\x83\x9d"
                               "\xec\x84\xb1";
    EXPECT_EQ(LabelPolicy::truncate(korean), korean);

    std::string accented = "\xc3\x89l\xc3\xa9ments de th\xc3\xa9orie des graphes";
    EXPECT_EQ(LabelPolicy::truncate(accented), "\xc3\x89l\xc3\xa9ments de th\xc3\xa9or...");

    std::string doubled = korean + korean;
    std::string cut = LabelPolicy::truncate(doubled);
    EXPECT_EQ(cut, korean + korean.substr(0, 18) + "...");
    EXPECT_NO_THROW(nlohmann::json(cut).dump());
}

TEST(LabelPolicyTest, TopicTruncationCountsCodePoints) {
    const std::string syllable = "\xea\xb0\x80";
    std::string label;
    for (int i = 0; i < 35; ++i) label += syllable;

    std::string expected;
    for (int i = 0; i < 30; ++i) expected += syllable;
    expected += "...";

    EXPECT_EQ(LabelPolicy::truncate_topic(label), expected);
    EXPECT_NO_THROW(nlohmann::json(LabelPolicy::truncate_topic(label)).dump());
}
