#pragma once

#include "kgviz/config/engine_config.hpp"
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "kgviz/interaction/highlight_state.hpp"
#include "kgviz/render/visual_encoder.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kgviz {

/**
 * @brief Node record consumed by the render strategies
 */
struct RenderNode {
    std::string id;
    std::string name;
    std::string entity_type;
    double size_weight = 0.0;           // centrality * 100, fed to the sqrt sizing
    std::string color_key;              // Empty when unclustered
    std::optional<int> cluster_id;
    bool is_highlighted = false;
    bool is_bridge = false;
    double centrality = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Edge record consumed by the render strategies
 */
struct RenderEdge {
    std::string id;
    std::string source;
    std::string target;
    std::string relationship_type;
    double width_weight = 0.0;
    EdgeColorKind color_kind = EdgeColorKind::Neutral;
    bool is_ghost = false;
    bool is_highlighted = false;
    double similarity = 0.0;

    // Kept for color resolution
    std::optional<int> source_cluster;
    std::optional<int> target_cluster;
    std::string source_color_key;
    std::string target_color_key;

    EdgeStyleInput style_input() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Filters applied while adapting
 */
struct AdapterOptions {
    bool show_ghost_edges = false;
    std::set<std::string> visible_entity_types;     // Empty = all types
    std::set<std::string> sliced_node_ids;

    static AdapterOptions from_render_config(const RenderConfig& config);
};

struct AdaptedGraph {
    std::vector<RenderNode> nodes;
    std::vector<RenderEdge> edges;
    size_t filtered_nodes = 0;          // Removed by type filter or slicing
    size_t dropped_edges = 0;           // Dangling in the snapshot

    const RenderNode* find_node(const std::string& id) const;
    const RenderEdge* find_edge(const std::string& id) const;
};

/**
 * @brief Maps the domain model onto render records
 *
 * Pure function of its inputs. Edges whose endpoints are missing or filtered
 * out are omitted without error.
 */
class GraphAdapter {
public:
    static AdaptedGraph adapt(const GraphSnapshot& snapshot,
                              const GraphIndex& index,
                              const std::map<std::string, double>& centrality,
                              const HighlightState& highlight,
                              const AdapterOptions& options = AdapterOptions());

    /**
     * @brief Ghost 1.5; otherwise max(0.3, weight * 0.5), doubled when highlighted
     */
    static double edge_width(const Edge& edge, bool highlighted);

    /**
     * @brief Color key of a cluster id, "cluster-{id}" when it is not listed
     */
    static std::string color_key_for(const GraphSnapshot& snapshot, int cluster_id);

    /**
     * @brief Node flag or bridge candidate of any structural gap
     */
    static std::set<std::string> bridge_node_ids(const GraphSnapshot& snapshot);
};

} // namespace kgviz
