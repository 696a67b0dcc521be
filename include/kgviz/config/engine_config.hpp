#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <set>
#include <string>

namespace kgviz {

// ============================================================================
// Enumerations shared by the engine modules
// ============================================================================

enum class ViewMode {
    Graph3D,    ///< Node-level 3-D view (spheres)
    Topic2D     ///< Cluster-level 2-D topic view (rectangles + hulls)
};

enum class LabelVisibility {
    Hidden,     ///< Labels only on hover
    Important,  ///< Nodes at or above the 80th centrality percentile
    All         ///< Every node
};

enum class DetailLevel {
    All,        ///< 100% of nodes
    Important,  ///< Top 75% by centrality
    Key,        ///< Top 50%
    Hub         ///< Top 25%
};

std::string to_string(ViewMode mode);
std::string to_string(LabelVisibility mode);
std::string to_string(DetailLevel level);

/**
 * @throws std::invalid_argument for unknown names
 */
ViewMode view_mode_from_string(const std::string& name);
LabelVisibility label_visibility_from_string(const std::string& name);
DetailLevel detail_level_from_string(const std::string& name);

/**
 * @brief Next label mode in the cycle Hidden -> Important -> All -> Hidden
 */
LabelVisibility next_label_visibility(LabelVisibility mode);

// ============================================================================
// Per-frame render configuration
// ============================================================================

/**
 * @brief Level-of-detail setting: fraction of nodes kept by centrality rank
 */
struct LodConfig {
    double visible_fraction = 1.0;          ///< [0, 1]
    bool enabled = true;

    static LodConfig from_detail_level(DetailLevel level, bool enabled = true);

    /**
     * @brief Fraction actually applied (1 when disabled, clamped, NaN -> 1)
     */
    double effective_fraction() const;
};

/**
 * @brief Bloom / glow settings
 */
struct BloomConfig {
    bool enabled = false;
    double intensity = 0.5;                 ///< [0, 1]
    double glow_size = 1.3;                 ///< Outer glow multiplier [1, 2]

    /**
     * @brief Copy with intensity and glow size clamped to their ranges
     */
    BloomConfig clamped() const;
};

/**
 * @brief Externally owned, read-only settings consumed on every frame
 *
 * Passed by value into each recompute; the engine never stores a hidden
 * global copy.
 */
struct RenderConfig {
    LodConfig lod;
    LabelVisibility label_visibility = LabelVisibility::Important;
    BloomConfig bloom;
    bool show_ghost_edges = false;
    std::set<std::string> visible_entity_types;   ///< Empty = all types
    std::set<std::string> sliced_node_ids;        ///< Nodes removed from the view

    nlohmann::json to_json() const;
    static RenderConfig from_json(const nlohmann::json& j);
};

// ============================================================================
// Layout configuration
// ============================================================================

/**
 * @brief Tunables of the node-level 3-D force simulation
 */
struct LayoutConfig {
    double repulsion_strength = 120.0;      ///< Pairwise repulsion magnitude
    double min_repulsion_distance = 1.0;    ///< Distance floor for repulsion
    double link_distance = 40.0;            ///< Spring rest length
    double link_strength = 0.7;             ///< Spring stiffness at max weight
    double centering_strength = 0.02;       ///< Pull toward the origin
    double velocity_retention = 0.3;        ///< Velocity kept per tick at alpha = 1
    double max_speed = 60.0;                ///< Per-tick displacement cap
    double alpha_start = 1.0;
    double alpha_decay = 0.05;              ///< alpha *= (1 - alpha_decay) each tick
    double alpha_min = 0.001;
    int cooldown_ticks = 100;               ///< Hard tick budget per run
    int warmup_ticks = 50;                  ///< Ticks run synchronously on start
    int ticks_per_frame = 1;
    double initial_radius = 100.0;          ///< Radius of the seeded start sphere
    uint32_t seed = 1337;
    bool verbose = false;

    nlohmann::json to_json() const;
    static LayoutConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Tunables of the cluster-level 2-D topic simulation
 */
struct TopicLayoutConfig {
    double width = 800.0;                   ///< Canvas width
    double height = 600.0;                  ///< Canvas height
    double padding = 40.0;                  ///< Boundary clamp inset

    double min_link_distance = 120.0;       ///< Distance at maximum weight
    double max_link_distance = 260.0;       ///< Distance at minimum weight
    double min_link_strength = 0.1;
    double max_link_strength = 0.6;
    double gap_strength_factor = 0.3;       ///< Gap-only links pull weaker

    double gravity_strength = 0.06;         ///< Radial pull toward canvas center
    double charge_strength = 500.0;         ///< Base many-body repulsion
    double collision_padding = 20.0;
    int collision_iterations = 3;
    double collision_strength = 0.7;

    double min_node_width = 60.0;
    double max_node_width = 150.0;
    double node_aspect = 0.6;               ///< height = width * aspect
    double hull_margin = 15.0;
    double member_radius = 4.0;             ///< Radius of a concept dot inside a cluster

    double velocity_retention = 0.6;
    double alpha_start = 1.0;
    double alpha_decay = 0.0228;
    double alpha_min = 0.001;
    int max_ticks = 300;
    int ticks_per_frame = 1;
    uint32_t seed = 7;
    bool verbose = false;

    nlohmann::json to_json() const;
    static TopicLayoutConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Camera transition settings
 */
struct CameraConfig {
    double transition_ms = 1000.0;
    double node_standoff = 200.0;
    double cluster_standoff = 400.0;
    double gap_standoff = 350.0;
    double default_distance = 500.0;        ///< Reset pose: (0, 0, distance)

    nlohmann::json to_json() const;
    static CameraConfig from_json(const nlohmann::json& j);
};

// ============================================================================
// Engine configuration
// ============================================================================

/**
 * @brief Complete engine configuration
 */
struct EngineConfig {
    ViewMode view_mode = ViewMode::Graph3D;
    RenderConfig render;
    LayoutConfig layout;
    TopicLayoutConfig topic;
    CameraConfig camera;
    bool verbose = false;                   ///< Propagated to both layouts

    /**
     * @brief Set the verbose flag here and on both layout configs
     */
    void set_verbose(bool enabled);

    nlohmann::json to_json() const;
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables (KGVIZ_VIEW_MODE, KGVIZ_DETAIL_LEVEL,
     * KGVIZ_LABELS, KGVIZ_BLOOM, KGVIZ_BLOOM_INTENSITY, KGVIZ_VERBOSE)
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

} // namespace kgviz
