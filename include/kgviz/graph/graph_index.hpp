#pragma once

#include "kgviz/graph/knowledge_graph.hpp"
#include <unordered_map>
#include <unordered_set>
#include <map>
#include <vector>
#include <string>
#include <optional>

namespace kgviz {

// Edge with endpoints resolved to node indices once per snapshot
struct ResolvedEdge {
    size_t edge_pos = 0;        // Position in GraphIndex::edges
    size_t source = 0;
    size_t target = 0;
};

/**
 * @brief Lookup tables derived from one snapshot
 *
 * Built once per dataset so that interaction-time queries (neighbours of a
 * node, members of a cluster) are O(1) map lookups. Dangling edges are
 * dropped while building; everything here refers only to existing nodes.
 */
struct GraphIndex {
    std::vector<std::string> node_ids;                              // Snapshot order
    std::unordered_map<std::string, size_t> node_index;             // id -> position

    std::vector<Edge> edges;                                        // Valid regular edges
    std::vector<Edge> ghost_edges;                                  // Valid ghost edges
    std::vector<ResolvedEdge> resolved_edges;                       // Parallel to edges
    std::unordered_map<std::string, size_t> edge_index;             // id -> position in edges

    // Node id -> ids of nodes sharing a regular edge with it
    std::unordered_map<std::string, std::unordered_set<std::string>> neighbors;

    // Node id -> ids of incident regular edges
    std::unordered_map<std::string, std::vector<std::string>> incident_edges;

    // Cluster membership, restricted to nodes present in the snapshot
    std::unordered_map<std::string, int> node_cluster;
    std::map<int, std::vector<std::string>> cluster_members;

    size_t dropped_edges = 0;

    void build(const GraphSnapshot& snapshot) {
        clear();

        node_ids.reserve(snapshot.nodes.size());
        for (const auto& node : snapshot.nodes) {
            // First occurrence wins for duplicated ids
            if (node_index.emplace(node.id, node_ids.size()).second) {
                node_ids.push_back(node.id);
            }
        }

        for (const auto& edge : snapshot.edges) {
            auto src = node_index.find(edge.source);
            auto tgt = node_index.find(edge.target);
            if (src == node_index.end() || tgt == node_index.end()) {
                ++dropped_edges;
                continue;
            }
            if (edge.is_ghost) {
                ghost_edges.push_back(edge);
                continue;
            }

            size_t pos = edges.size();
            edges.push_back(edge);
            edge_index.emplace(edge.id, pos);
            resolved_edges.push_back({pos, src->second, tgt->second});

            incident_edges[edge.source].push_back(edge.id);
            if (edge.target != edge.source) {
                incident_edges[edge.target].push_back(edge.id);
                neighbors[edge.source].insert(edge.target);
                neighbors[edge.target].insert(edge.source);
            }
        }

        for (const auto& [node_id, cluster_id] : snapshot.node_cluster_map()) {
            if (node_index.count(node_id)) {
                node_cluster[node_id] = cluster_id;
            }
        }
        // Members are listed in snapshot node order so centroids are stable
        for (const auto& id : node_ids) {
            auto it = node_cluster.find(id);
            if (it != node_cluster.end()) {
                cluster_members[it->second].push_back(id);
            }
        }
    }

    void clear() {
        node_ids.clear();
        node_index.clear();
        edges.clear();
        ghost_edges.clear();
        resolved_edges.clear();
        edge_index.clear();
        neighbors.clear();
        incident_edges.clear();
        node_cluster.clear();
        cluster_members.clear();
        dropped_edges = 0;
    }

    bool has_node(const std::string& id) const {
        return node_index.count(id) > 0;
    }

    std::optional<size_t> index_of(const std::string& id) const {
        auto it = node_index.find(id);
        if (it == node_index.end()) return std::nullopt;
        return it->second;
    }

    std::optional<int> cluster_of(const std::string& id) const {
        auto it = node_cluster.find(id);
        if (it == node_cluster.end()) return std::nullopt;
        return it->second;
    }

    const std::vector<std::string>& members_of(int cluster_id) const {
        static const std::vector<std::string> kEmpty;
        auto it = cluster_members.find(cluster_id);
        return it != cluster_members.end() ? it->second : kEmpty;
    }

    const std::unordered_set<std::string>& neighbors_of(const std::string& id) const {
        static const std::unordered_set<std::string> kEmpty;
        auto it = neighbors.find(id);
        return it != neighbors.end() ? it->second : kEmpty;
    }

    const std::vector<std::string>& incident_edges_of(const std::string& id) const {
        static const std::vector<std::string> kEmpty;
        auto it = incident_edges.find(id);
        return it != incident_edges.end() ? it->second : kEmpty;
    }

    size_t num_nodes() const { return node_ids.size(); }
};

} // namespace kgviz
