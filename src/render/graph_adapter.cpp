#include "kgviz/render/graph_adapter.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace kgviz {

using json = nlohmann::json;

json RenderNode::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["entity_type"] = entity_type;
    j["size_weight"] = size_weight;
    j["color_key"] = color_key;
    j["cluster_id"] = cluster_id ? json(*cluster_id) : json(nullptr);
    j["is_highlighted"] = is_highlighted;
    j["is_bridge"] = is_bridge;
    j["centrality"] = centrality;
    return j;
}

EdgeStyleInput RenderEdge::style_input() const {
    EdgeStyleInput input;
    input.is_ghost = is_ghost;
    input.similarity = similarity;
    input.is_highlighted = is_highlighted;
    input.source_cluster = source_cluster;
    input.target_cluster = target_cluster;
    input.source_color_key = source_color_key;
    input.target_color_key = target_color_key;
    return input;
}

json RenderEdge::to_json() const {
    json j;
    j["id"] = id;
    j["source"] = source;
    j["target"] = target;
    j["relationship_type"] = relationship_type;
    j["width_weight"] = width_weight;
    j["color_kind"] = to_string(color_kind);
    j["is_ghost"] = is_ghost;
    j["is_highlighted"] = is_highlighted;
    if (is_ghost) {
        j["similarity"] = similarity;
    }
    return j;
}

AdapterOptions AdapterOptions::from_render_config(const RenderConfig& config) {
    AdapterOptions options;
    options.show_ghost_edges = config.show_ghost_edges;
    options.visible_entity_types = config.visible_entity_types;
    options.sliced_node_ids = config.sliced_node_ids;
    return options;
}

const RenderNode* AdaptedGraph::find_node(const std::string& id) const {
    for (const auto& node : nodes) {
        if (node.id == id) return &node;
    }
    return nullptr;
}

const RenderEdge* AdaptedGraph::find_edge(const std::string& id) const {
    for (const auto& edge : edges) {
        if (edge.id == id) return &edge;
    }
    return nullptr;
}

double GraphAdapter::edge_width(const Edge& edge, bool highlighted) {
    if (edge.is_ghost) {
        return 1.5;
    }
    double weight = std::isfinite(edge.weight) && edge.weight > 0.0 ? edge.weight : 0.0;
    double width = std::max(0.3, weight * 0.5);
    return highlighted ? width * 2.0 : width;
}

std::string GraphAdapter::color_key_for(const GraphSnapshot& snapshot, int cluster_id) {
    const Cluster* cluster = snapshot.find_cluster(cluster_id);
    if (cluster) {
        return cluster->color_key();
    }
    return "cluster-" + std::to_string(cluster_id);
}

std::set<std::string> GraphAdapter::bridge_node_ids(const GraphSnapshot& snapshot) {
    std::set<std::string> ids;
    for (const auto& node : snapshot.nodes) {
        if (node.is_bridge) ids.insert(node.id);
    }
    for (const auto& gap : snapshot.gaps) {
        ids.insert(gap.bridge_candidates.begin(), gap.bridge_candidates.end());
    }
    return ids;
}

AdaptedGraph GraphAdapter::adapt(const GraphSnapshot& snapshot,
                                 const GraphIndex& index,
                                 const std::map<std::string, double>& centrality,
                                 const HighlightState& highlight,
                                 const AdapterOptions& options) {
    AdaptedGraph result;
    result.dropped_edges = index.dropped_edges;

    const auto bridges = bridge_node_ids(snapshot);

    // Color keys resolved once per cluster
    std::map<int, std::string> color_keys;
    for (const auto& [cluster_id, members] : index.cluster_members) {
        color_keys.emplace(cluster_id, color_key_for(snapshot, cluster_id));
    }

    std::unordered_map<std::string, const Node*> by_id;
    for (const auto& node : snapshot.nodes) {
        by_id.emplace(node.id, &node);
    }

    std::unordered_set<std::string> kept;
    for (const auto& id : index.node_ids) {
        auto found = by_id.find(id);
        if (found == by_id.end()) continue;
        const Node* node = found->second;

        bool type_hidden = !options.visible_entity_types.empty() &&
                           !options.visible_entity_types.count(node->entity_type);
        if (type_hidden || options.sliced_node_ids.count(id)) {
            ++result.filtered_nodes;
            continue;
        }

        RenderNode render;
        render.id = id;
        render.name = node->name;
        render.entity_type = node->entity_type;

        auto c = centrality.find(id);
        double value = c != centrality.end() ? c->second : 0.0;
        render.centrality = std::isfinite(value) && value > 0.0 ? value : 0.0;
        render.size_weight = render.centrality * 100.0;

        render.cluster_id = index.cluster_of(id);
        if (render.cluster_id) {
            render.color_key = color_keys[*render.cluster_id];
        }
        render.is_highlighted = highlight.is_node_highlighted(id);
        render.is_bridge = bridges.count(id) > 0;

        kept.insert(id);
        result.nodes.push_back(std::move(render));
    }

    auto add_edge = [&](const Edge& edge) {
        if (!kept.count(edge.source) || !kept.count(edge.target)) {
            return;
        }

        RenderEdge render;
        render.id = edge.id;
        render.source = edge.source;
        render.target = edge.target;
        render.relationship_type = edge.relationship_type;
        render.is_ghost = edge.is_ghost;
        render.similarity = edge.similarity;
        render.is_highlighted = !edge.is_ghost && highlight.is_edge_highlighted(edge.id);
        render.width_weight = edge_width(edge, render.is_highlighted);

        render.source_cluster = index.cluster_of(edge.source);
        render.target_cluster = index.cluster_of(edge.target);
        if (render.source_cluster) render.source_color_key = color_keys[*render.source_cluster];
        if (render.target_cluster) render.target_color_key = color_keys[*render.target_cluster];
        render.color_kind = render.style_input().kind();

        result.edges.push_back(std::move(render));
    };

    for (const auto& edge : index.edges) {
        add_edge(edge);
    }
    if (options.show_ghost_edges) {
        for (const auto& edge : index.ghost_edges) {
            add_edge(edge);
        }
    }

    return result;
}

} // namespace kgviz
