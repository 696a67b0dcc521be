#pragma once

#include "kgviz/config/engine_config.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kgviz {

// ============================================================================
// Colors
// ============================================================================

/**
 * @brief 8-bit RGB color with a floating-point alpha
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    double a = 1.0;

    /**
     * @brief Parse "#RRGGBB"
     * @throws std::invalid_argument for malformed input
     */
    static Color from_hex(const std::string& hex);

    std::string to_hex() const;                     // "#RRGGBB", alpha dropped
    std::string to_rgba() const;                    // "rgba(r, g, b, a)"

    Color with_alpha(double alpha) const;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

/**
 * @brief Channel-wise mix; ratio 0 gives a, 1 gives b
 */
Color blend(const Color& a, const Color& b, double ratio = 0.5);

namespace colors {

const Color kHighlight{255, 215, 0, 1.0};           // #FFD700
const Color kNeutral{136, 136, 136, 1.0};           // #888888
const Color kGhost{255, 170, 0, 1.0};               // #FFAA00
const Color kWhite{255, 255, 255, 1.0};
const Color kBackground{13, 17, 23, 1.0};           // #0D1117

/**
 * @brief The fixed 12-entry cluster palette
 */
const std::vector<Color>& cluster_palette();

/**
 * @brief Color for an entity type tag, if the type is known
 */
std::optional<Color> entity_type_color(const std::string& entity_type);

} // namespace colors

/**
 * @brief 32-bit FNV-1a hash
 */
uint32_t fnv1a_hash(const std::string& text);

/**
 * @brief Palette entry for a cluster color key; independent of cluster order
 */
Color cluster_color(const std::string& color_key);

// ============================================================================
// Sizing
// ============================================================================

namespace sizing {

const double kNodeBase = 3.0;
const double kNodeScale = 2.0;
const double kBridgeBoost = 2.0;
const double kClusterBase = 4.0;
const double kClusterScale = 2.0;

} // namespace sizing

/**
 * @brief Sphere radius: base + sqrt(centrality * 100) * scale (+ bridge boost)
 *
 * Negative or non-finite centralities count as 0.
 */
double node_radius(double centrality, bool is_bridge);

/**
 * @brief Badge radius for a cluster of the given concept count (sqrt scaling)
 */
double cluster_radius(int concept_count);

// ============================================================================
// Node layers
// ============================================================================

enum class LayerKind {
    Core,           ///< The node itself
    Bloom,          ///< Outer glow, only with bloom enabled
    BridgeHalo,     ///< Gold halo on bridge candidates
    SelectionRing   ///< Gold ring on highlighted nodes
};

std::string to_string(LayerKind kind);

struct VisualLayer {
    LayerKind kind = LayerKind::Core;
    double radius = 0.0;
    double inner_radius = 0.0;      // Rings only
    Color color;
    double opacity = 1.0;
    double emissive = 0.0;          // Core only

    nlohmann::json to_json() const;
};

/**
 * @brief Input the encoder needs about one node
 */
struct NodeStyleInput {
    std::string color_key;          // Empty when the node has no cluster
    std::string entity_type;
    double centrality = 0.0;
    bool is_bridge = false;
    bool is_highlighted = false;
    bool is_hovered = false;
};

/**
 * @brief Fully resolved look of one node; layers[0] is always the core
 */
struct NodeVisual {
    Color color;
    double radius = 0.0;
    std::vector<VisualLayer> layers;

    const VisualLayer* layer(LayerKind kind) const;
    bool has_layer(LayerKind kind) const { return layer(kind) != nullptr; }
};

enum class EdgeColorKind {
    Highlighted,
    Ghost,
    IntraCluster,
    CrossCluster,
    Neutral
};

std::string to_string(EdgeColorKind kind);

/**
 * @brief Input the encoder needs about one edge
 */
struct EdgeStyleInput {
    bool is_ghost = false;
    double similarity = 0.0;
    bool is_highlighted = false;
    std::optional<int> source_cluster;
    std::optional<int> target_cluster;
    std::string source_color_key;
    std::string target_color_key;

    /**
     * @brief Ghost > highlighted > intra-cluster > cross-cluster > neutral
     */
    EdgeColorKind kind() const;
};

// ============================================================================
// Label policy
// ============================================================================

/**
 * @brief Decides which nodes carry a persistent label
 *
 * Important mode keeps nodes whose centrality reaches the value found at
 * index floor(n * 0.2) of the descending-sorted centrality list. Without any
 * centrality data every node is labelled.
 */
class LabelPolicy {
public:
    LabelPolicy() = default;
    LabelPolicy(LabelVisibility mode, const std::vector<CentralityMetric>& centrality);

    bool should_label(double centrality, bool is_hovered, const std::string& name) const;

    double threshold() const { return threshold_; }
    bool has_centrality() const { return has_centrality_; }
    LabelVisibility mode() const { return mode_; }

    static constexpr size_t kMaxLength = 20;
    static constexpr size_t kTopicMaxLength = 30;

    /**
     * @brief Shorten names longer than 20 code points to 17 + "..."
     *
     * Lengths are counted in UTF-8 code points and cuts never split one.
     */
    static std::string truncate(const std::string& name);

    /**
     * @brief Topic view variant: longer than 30 becomes 30 + "..."
     */
    static std::string truncate_topic(const std::string& label);

private:
    LabelVisibility mode_ = LabelVisibility::All;
    double threshold_ = 0.0;
    bool has_centrality_ = false;
};

// ============================================================================
// Encoder
// ============================================================================

/**
 * @brief Deterministic mapping from graph attributes to visual attributes
 */
class VisualEncoder {
public:
    explicit VisualEncoder(BloomConfig bloom = BloomConfig());

    /**
     * @brief Highlight > cluster palette > entity type > neutral grey
     */
    Color node_color(const NodeStyleInput& input) const;

    /**
     * @brief Core plus the optional bloom, bridge and selection layers
     */
    NodeVisual encode_node(const NodeStyleInput& input) const;

    Color edge_color(const EdgeStyleInput& input) const;

    double core_emissive(bool highlighted) const;

    const BloomConfig& bloom() const { return bloom_; }

private:
    BloomConfig bloom_;
};

} // namespace kgviz
