#ifndef KGVIZ_GRAPH_KNOWLEDGE_GRAPH_HPP
#define KGVIZ_GRAPH_KNOWLEDGE_GRAPH_HPP

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace kgviz {

/**
 * @brief A concept, paper or author vertex of the knowledge graph
 *
 * Nodes are immutable for the lifetime of a snapshot. The cluster assignment
 * and the bridge flag are computed upstream and only carried here.
 */
struct Node {
    std::string id;                                    // Unique, opaque identifier
    std::string name;                                  // Display name
    std::string entity_type;                           // "Paper", "Concept", ...
    std::optional<int> cluster_id;                     // Topic cluster, if assigned
    bool is_bridge = false;                            // Bridge candidate for a structural gap
    std::map<std::string, std::string> properties;     // Additional metadata

    /**
     * @brief Convert node to JSON representation
     */
    nlohmann::json to_json() const;

    /**
     * @brief Create node from JSON
     *
     * Accepts "cluster_id" / "is_gap_bridge" either as top-level fields or
     * inside "properties".
     */
    static Node from_json(const nlohmann::json& j);
};

/**
 * @brief A weighted, typed relationship between two nodes
 *
 * Ghost edges are potential (not yet observed) links suggested by embedding
 * similarity. They are drawn dashed and never take part in the layout.
 */
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    double weight = 1.0;                               // >= 0
    std::string relationship_type;
    bool is_ghost = false;
    double similarity = 0.0;                           // [0, 1], ghost edges only

    /**
     * @brief Check whether this edge touches a node
     */
    bool is_incident_to(const std::string& node_id) const {
        return source == node_id || target == node_id;
    }

    nlohmann::json to_json() const;
    static Edge from_json(const nlohmann::json& j);
};

/**
 * @brief An upstream-computed topic grouping of nodes
 */
struct Cluster {
    int cluster_id = 0;
    std::string label;                                 // May be empty; see display_label()
    int size = 0;
    double density = 0.0;                              // [0, 1]
    std::vector<std::string> concepts;                 // Member node IDs
    std::vector<std::string> concept_names;            // Representative names

    /**
     * @brief Check whether the upstream label carries any text
     *
     * Labels made only of whitespace, '/' and ',' are treated as absent.
     */
    bool has_label() const;

    /**
     * @brief Label shown to the user ("Cluster N" when absent, N = id + 1)
     */
    std::string display_label() const;

    /**
     * @brief Key hashed into the color palette ("cluster-{id}" when absent)
     */
    std::string color_key() const;

    nlohmann::json to_json() const;
    static Cluster from_json(const nlohmann::json& j);
};

/**
 * @brief Betweenness centrality of a single node
 */
struct CentralityMetric {
    std::string node_id;
    double betweenness = 0.0;

    nlohmann::json to_json() const;
    static CentralityMetric from_json(const nlohmann::json& j);
};

/**
 * @brief A weakly connected pair of clusters flagged as a research opportunity
 */
struct StructuralGap {
    std::string id;
    int cluster_a_id = 0;
    int cluster_b_id = 0;
    double gap_strength = 0.0;                         // 0 = weakest connection
    std::vector<std::string> cluster_a_concepts;
    std::vector<std::string> cluster_b_concepts;
    std::vector<std::string> bridge_candidates;
    std::vector<std::string> research_questions;

    /**
     * @brief Both sides plus bridge candidates, duplicates removed, in order
     */
    std::vector<std::string> all_node_ids() const;

    nlohmann::json to_json() const;
    static StructuralGap from_json(const nlohmann::json& j);
};

/**
 * @brief Summary numbers about a snapshot (used by the CLI)
 */
struct SnapshotStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_ghost_edges = 0;
    size_t num_dangling_edges = 0;
    size_t num_clusters = 0;
    size_t num_empty_clusters = 0;
    size_t num_gaps = 0;
    size_t num_bridge_nodes = 0;
    size_t num_unclustered_nodes = 0;
    double max_centrality = 0.0;
    double avg_degree = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief One atomic, immutable dataset delivered by the data layer
 *
 * All five lists arrive together; the engine never receives deltas. A
 * snapshot may contain dangling edges; they are filtered when the snapshot
 * is consumed, never rejected here.
 */
class GraphSnapshot {
public:
    GraphSnapshot() = default;

    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::vector<Cluster> clusters;
    std::vector<CentralityMetric> centrality;
    std::vector<StructuralGap> gaps;

    // ==========================================
    // Lookups
    // ==========================================

    /**
     * @brief Get a node by ID (linear scan; use GraphIndex on hot paths)
     */
    const Node* find_node(const std::string& node_id) const;

    const Cluster* find_cluster(int cluster_id) const;

    const StructuralGap* find_gap(const std::string& gap_id) const;

    bool has_node(const std::string& node_id) const { return find_node(node_id) != nullptr; }

    /**
     * @brief Node id -> betweenness; absent entries mean 0
     */
    std::map<std::string, double> centrality_map() const;

    /**
     * @brief Resolve each node's cluster
     *
     * Explicit Node::cluster_id wins; otherwise the first cluster listing the
     * node as a member. Nodes without a cluster are absent from the map.
     */
    std::map<std::string, int> node_cluster_map() const;

    /**
     * @brief Edges whose endpoints both exist in the node set
     */
    std::vector<Edge> valid_edges(bool include_ghost = true) const;

    // ==========================================
    // Structural comparison
    // ==========================================

    /**
     * @brief Compare graph shape with another snapshot
     *
     * Nodes are compared by id/type/name and edges by id/source/target/type,
     * in order. Equal shape means the running layout can be kept.
     */
    bool structurally_equal(const GraphSnapshot& other) const;

    SnapshotStatistics compute_statistics() const;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @brief Load a snapshot from its JSON representation
     *
     * "potential_edges" entries are appended as ghost edges.
     * @throws std::runtime_error on missing required keys
     */
    static GraphSnapshot from_json(const nlohmann::json& j);

    /**
     * @brief Load snapshot from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static GraphSnapshot load_from_json(const std::string& filename);

    void export_to_json(const std::string& filename) const;

    size_t num_nodes() const { return nodes.size(); }
    size_t num_edges() const { return edges.size(); }
    bool empty() const { return nodes.empty(); }
};

} // namespace kgviz

#endif // KGVIZ_GRAPH_KNOWLEDGE_GRAPH_HPP
