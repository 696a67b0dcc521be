#pragma once

#include "kgviz/config/engine_config.hpp"
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "kgviz/layout/position_source.hpp"
#include "kgviz/layout/vec.hpp"
#include "kgviz/render/convex_hull.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgviz {

/**
 * @brief One non-empty cluster laid out as a rounded rectangle
 */
struct TopicNode {
    std::string id;                         // "cluster-{cluster_id}"
    int cluster_id = 0;
    std::string label;                      // Display label (synthesized if absent)
    std::string color_key;
    int size = 0;                           // Concept count
    double density = 0.0;
    std::vector<std::string> concept_names;

    double width = 0.0;
    double height = 0.0;
    double collision_radius = 0.0;

    Vec2 position;
    Vec2 velocity;
    std::optional<Vec2> fixed;
    int degree = 0;

    // Concept nodes of this cluster present in the snapshot, drawn as dots
    std::vector<std::string> member_ids;
    std::vector<Vec2> member_positions;
};

enum class TopicLinkType {
    Connection,     ///< Aggregated inter-cluster edges
    Gap             ///< Structural gap without observed connections
};

/**
 * @brief Link between two topic nodes
 *
 * A connection link that also carries a structural gap keeps its type and
 * weight, sets is_gap and records the gap id.
 */
struct TopicLink {
    std::string id;                         // "connection-{a}-{b}" or "gap-{gap_id}"
    size_t source = 0;                      // Index into TopicGraph::nodes
    size_t target = 0;
    int source_cluster = 0;
    int target_cluster = 0;
    TopicLinkType type = TopicLinkType::Connection;
    double weight = 0.0;                    // Connection count, or gap strength
    int connection_count = 0;
    bool is_gap = false;
    std::string gap_id;

    double distance = 0.0;                  // Resolved at layout start
    double strength = 0.0;
};

/**
 * @brief Cluster-level graph derived from one snapshot
 */
struct TopicGraph {
    std::vector<TopicNode> nodes;
    std::vector<TopicLink> links;
    std::unordered_map<int, size_t> cluster_index;          // cluster_id -> node slot
    std::map<int, std::set<int>> cluster_adjacency;         // Via any link
    double max_weight = 0.0;                                // Over connection links
    int max_size = 0;

    /**
     * @brief Build topic nodes and links
     *
     * Clusters without concepts and without assigned nodes are excluded.
     * Inter-cluster edges are counted per unordered cluster pair. Each gap
     * whose clusters both exist becomes a gap link unless a connection link
     * already joins the pair, in which case that link is flagged instead.
     */
    static TopicGraph build(const GraphSnapshot& snapshot, const GraphIndex& index,
                            const TopicLayoutConfig& config);

    const TopicNode* find_node(int cluster_id) const;
    const TopicLink* find_link(const std::string& link_id) const;

    /**
     * @brief Clusters sharing a link with cluster_id (empty if unknown)
     */
    const std::set<int>& adjacent_clusters(int cluster_id) const;

    size_t num_nodes() const { return nodes.size(); }
    size_t num_links() const { return links.size(); }
};

/**
 * @brief Rectangle size of a topic node: width grows linearly with size
 */
Vec2 topic_node_dimensions(int size, int max_size, const TopicLayoutConfig& config);

/**
 * @brief Cluster-level 2-D force simulation
 *
 * Links pull clusters to a weight-dependent distance, clusters repel each
 * other in proportion to their size, a radial gravity keeps them around the
 * canvas center and a collision pass keeps rectangles apart. Positions are
 * clamped inside the canvas after every tick. Member dots and hull polygons
 * are refreshed on every tick.
 *
 * position_of() answers for "cluster-{id}" (the rectangle center) and for
 * member node ids (their dot), with z = 0.
 */
class TopicLayout : public PositionSource {
public:
    explicit TopicLayout(TopicLayoutConfig config = TopicLayoutConfig());

    /**
     * @brief Take ownership of a topic graph and start the simulation
     *
     * A single node is placed at the canvas center and no simulation runs.
     * An empty graph leaves the layout stopped.
     */
    void start(TopicGraph graph);

    void stop();

    bool tick();
    int step(int max_ticks);
    void reheat();

    bool fix_node(int cluster_id, const Vec2& position);
    bool release_node(int cluster_id);

    std::optional<Vec3> position_of(const std::string& node_id) const override;
    std::optional<Vec2> cluster_position(int cluster_id) const;

    /**
     * @brief Padded hulls of clusters with at least three member dots
     */
    const std::vector<ClusterHull>& hulls() const { return hulls_; }

    /**
     * @brief Hull padding: member dot radius plus hull margin
     */
    double hull_padding() const;

    const TopicGraph& graph() const { return graph_; }
    const std::vector<TopicNode>& nodes() const { return graph_.nodes; }
    const std::vector<TopicLink>& links() const { return graph_.links; }

    bool is_running() const { return running_; }
    int tick_count() const { return ticks_; }
    double alpha() const { return alpha_; }
    size_t repaired_positions() const { return repaired_; }
    Vec2 center() const { return {config_.width / 2.0, config_.height / 2.0}; }

    const TopicLayoutConfig& config() const { return config_; }

private:
    TopicLayoutConfig config_;
    TopicGraph graph_;
    HullBuilder hull_builder_;
    std::vector<ClusterHull> hulls_;

    // Member node id -> (node slot, dot slot)
    std::unordered_map<std::string, std::pair<size_t, size_t>> member_index_;

    double alpha_ = 0.0;
    int ticks_ = 0;
    bool running_ = false;
    size_t repaired_ = 0;

    void resolve_links();
    void apply_links();
    void apply_charge();
    void apply_gravity();
    void integrate();
    void resolve_collisions();
    void clamp_to_canvas();
    void repair_non_finite();
    void update_members();
    void finish();
};

} // namespace kgviz
