#include "kgviz/graph/knowledge_graph.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace kgviz {

namespace {

// Property bags arrive with arbitrary JSON values; keep them as text.
std::string json_value_to_string(const nlohmann::json& v) {
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_null()) {
        return "";
    }
    return v.dump();
}

// Ids outside the int range or with a fractional part are rejected.
std::optional<int> parse_cluster_id(const nlohmann::json& v) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();

    if (v.is_number_unsigned()) {
        auto id = v.get<std::uint64_t>();
        if (id > static_cast<std::uint64_t>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(id);
    }
    if (v.is_number_integer()) {
        auto id = v.get<std::int64_t>();
        if (id < kMin || id > kMax) {
            return std::nullopt;
        }
        return static_cast<int>(id);
    }
    if (v.is_number()) {
        double id = v.get<double>();
        if (!std::isfinite(id) || id != std::floor(id) ||
            id < static_cast<double>(kMin) || id > static_cast<double>(kMax)) {
            return std::nullopt;
        }
        return static_cast<int>(id);
    }
    if (v.is_string()) {
        try {
            return std::stoi(v.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool parse_flag(const nlohmann::json& v) {
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        return s == "true" || s == "1";
    }
    if (v.is_number()) {
        return v.get<double>() != 0.0;
    }
    return false;
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array()) {
        return {};
    }
    std::vector<std::string> out;
    for (const auto& v : j[key]) {
        out.push_back(json_value_to_string(v));
    }
    return out;
}

} // namespace

// ==========================================
// Node Implementation
// ==========================================

nlohmann::json Node::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["entity_type"] = entity_type;
    if (cluster_id.has_value()) {
        j["cluster_id"] = cluster_id.value();
    }
    if (is_bridge) {
        j["is_gap_bridge"] = true;
    }
    j["properties"] = properties;
    return j;
}

Node Node::from_json(const nlohmann::json& j) {
    if (!j.contains("id")) {
        throw std::runtime_error("Node is missing required field 'id'");
    }

    Node node;
    node.id = json_value_to_string(j.at("id"));
    node.name = j.contains("name") ? json_value_to_string(j["name"]) : node.id;
    node.entity_type = j.value("entity_type", std::string("Concept"));

    if (j.contains("properties") && j["properties"].is_object()) {
        for (const auto& [key, value] : j["properties"].items()) {
            node.properties[key] = json_value_to_string(value);
        }
        if (j["properties"].contains("cluster_id")) {
            node.cluster_id = parse_cluster_id(j["properties"]["cluster_id"]);
        }
        if (j["properties"].contains("is_gap_bridge")) {
            node.is_bridge = parse_flag(j["properties"]["is_gap_bridge"]);
        }
    }

    // Top-level fields take precedence over the property bag
    if (j.contains("cluster_id")) {
        node.cluster_id = parse_cluster_id(j["cluster_id"]);
    }
    if (j.contains("is_gap_bridge")) {
        node.is_bridge = parse_flag(j["is_gap_bridge"]);
    }

    return node;
}

// ==========================================
// Edge Implementation
// ==========================================

nlohmann::json Edge::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["source"] = source;
    j["target"] = target;
    j["weight"] = weight;
    j["relationship_type"] = relationship_type;
    if (is_ghost) {
        j["is_ghost"] = true;
        j["similarity"] = similarity;
    }
    return j;
}

Edge Edge::from_json(const nlohmann::json& j) {
    if (!j.contains("id") || !j.contains("source") || !j.contains("target")) {
        throw std::runtime_error("Edge requires 'id', 'source' and 'target'");
    }

    Edge edge;
    edge.id = json_value_to_string(j.at("id"));
    edge.source = json_value_to_string(j.at("source"));
    edge.target = json_value_to_string(j.at("target"));
    edge.relationship_type = j.value("relationship_type", std::string("RELATED_TO"));

    // A missing or null weight means 1
    if (j.contains("weight") && j["weight"].is_number()) {
        edge.weight = std::max(0.0, j["weight"].get<double>());
    }
    edge.is_ghost = j.contains("is_ghost") && parse_flag(j["is_ghost"]);
    edge.similarity = std::clamp(j.value("similarity", 0.0), 0.0, 1.0);

    return edge;
}

// ==========================================
// Cluster Implementation
// ==========================================

bool Cluster::has_label() const {
    return std::any_of(label.begin(), label.end(), [](char c) {
        return !(c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '/' || c == ',');
    });
}

std::string Cluster::display_label() const {
    if (has_label()) {
        return label;
    }
    return "Cluster " + std::to_string(cluster_id + 1);
}

std::string Cluster::color_key() const {
    if (has_label()) {
        return label;
    }
    return "cluster-" + std::to_string(cluster_id);
}

nlohmann::json Cluster::to_json() const {
    nlohmann::json j;
    j["cluster_id"] = cluster_id;
    j["label"] = label;
    j["size"] = size;
    j["density"] = density;
    j["concepts"] = concepts;
    j["concept_names"] = concept_names;
    return j;
}

Cluster Cluster::from_json(const nlohmann::json& j) {
    if (!j.contains("cluster_id")) {
        throw std::runtime_error("Cluster is missing required field 'cluster_id'");
    }

    Cluster cluster;
    auto id = parse_cluster_id(j.at("cluster_id"));
    if (!id.has_value()) {
        throw std::runtime_error("Cluster has a non-integral or out-of-range 'cluster_id'");
    }
    cluster.cluster_id = id.value();
    if (j.contains("label") && j["label"].is_string()) {
        cluster.label = j["label"].get<std::string>();
    }
    cluster.concepts = string_list(j, "concepts");
    cluster.concept_names = string_list(j, "concept_names");
    cluster.size = j.value("size", static_cast<int>(cluster.concepts.size()));
    if (j.contains("density") && j["density"].is_number()) {
        cluster.density = std::clamp(j["density"].get<double>(), 0.0, 1.0);
    }
    return cluster;
}

// ==========================================
// CentralityMetric Implementation
// ==========================================

nlohmann::json CentralityMetric::to_json() const {
    return {{"concept_id", node_id}, {"betweenness_centrality", betweenness}};
}

CentralityMetric CentralityMetric::from_json(const nlohmann::json& j) {
    CentralityMetric metric;
    if (j.contains("concept_id")) {
        metric.node_id = json_value_to_string(j["concept_id"]);
    } else if (j.contains("node_id")) {
        metric.node_id = json_value_to_string(j["node_id"]);
    } else {
        throw std::runtime_error("Centrality metric is missing 'concept_id'");
    }
    metric.betweenness = std::max(0.0, j.value("betweenness_centrality", 0.0));
    return metric;
}

// ==========================================
// StructuralGap Implementation
// ==========================================

std::vector<std::string> StructuralGap::all_node_ids() const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto* list : {&cluster_a_concepts, &cluster_b_concepts, &bridge_candidates}) {
        for (const auto& id : *list) {
            if (seen.insert(id).second) {
                result.push_back(id);
            }
        }
    }
    return result;
}

nlohmann::json StructuralGap::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["cluster_a_id"] = cluster_a_id;
    j["cluster_b_id"] = cluster_b_id;
    j["gap_strength"] = gap_strength;
    j["cluster_a_concepts"] = cluster_a_concepts;
    j["cluster_b_concepts"] = cluster_b_concepts;
    j["bridge_candidates"] = bridge_candidates;
    if (!research_questions.empty()) {
        j["research_questions"] = research_questions;
    }
    return j;
}

StructuralGap StructuralGap::from_json(const nlohmann::json& j) {
    if (!j.contains("id")) {
        throw std::runtime_error("Structural gap is missing required field 'id'");
    }

    StructuralGap gap;
    gap.id = json_value_to_string(j.at("id"));
    gap.cluster_a_id = parse_cluster_id(j.value("cluster_a_id", nlohmann::json(0))).value_or(0);
    gap.cluster_b_id = parse_cluster_id(j.value("cluster_b_id", nlohmann::json(0))).value_or(0);
    gap.gap_strength = std::clamp(j.value("gap_strength", 0.0), 0.0, 1.0);
    gap.cluster_a_concepts = string_list(j, "cluster_a_concepts");
    gap.cluster_b_concepts = string_list(j, "cluster_b_concepts");
    gap.bridge_candidates = string_list(j, "bridge_candidates");
    gap.research_questions = string_list(j, "research_questions");
    return gap;
}

// ==========================================
// SnapshotStatistics Implementation
// ==========================================

nlohmann::json SnapshotStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["num_ghost_edges"] = num_ghost_edges;
    j["num_dangling_edges"] = num_dangling_edges;
    j["num_clusters"] = num_clusters;
    j["num_empty_clusters"] = num_empty_clusters;
    j["num_gaps"] = num_gaps;
    j["num_bridge_nodes"] = num_bridge_nodes;
    j["num_unclustered_nodes"] = num_unclustered_nodes;
    j["max_centrality"] = max_centrality;
    j["avg_degree"] = avg_degree;
    return j;
}

// ==========================================
// GraphSnapshot Implementation
// ==========================================

const Node* GraphSnapshot::find_node(const std::string& node_id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&](const Node& n) { return n.id == node_id; });
    return it != nodes.end() ? &*it : nullptr;
}

const Cluster* GraphSnapshot::find_cluster(int cluster_id) const {
    auto it = std::find_if(clusters.begin(), clusters.end(),
                           [&](const Cluster& c) { return c.cluster_id == cluster_id; });
    return it != clusters.end() ? &*it : nullptr;
}

const StructuralGap* GraphSnapshot::find_gap(const std::string& gap_id) const {
    auto it = std::find_if(gaps.begin(), gaps.end(),
                           [&](const StructuralGap& g) { return g.id == gap_id; });
    return it != gaps.end() ? &*it : nullptr;
}

std::map<std::string, double> GraphSnapshot::centrality_map() const {
    std::map<std::string, double> result;
    for (const auto& metric : centrality) {
        result[metric.node_id] = std::max(0.0, metric.betweenness);
    }
    return result;
}

std::map<std::string, int> GraphSnapshot::node_cluster_map() const {
    std::map<std::string, int> result;
    for (const auto& node : nodes) {
        if (node.cluster_id.has_value()) {
            result[node.id] = node.cluster_id.value();
        }
    }
    for (const auto& cluster : clusters) {
        for (const auto& member : cluster.concepts) {
            // emplace keeps an earlier assignment
            result.emplace(member, cluster.cluster_id);
        }
    }
    return result;
}

std::vector<Edge> GraphSnapshot::valid_edges(bool include_ghost) const {
    std::unordered_set<std::string> ids;
    ids.reserve(nodes.size());
    for (const auto& node : nodes) {
        ids.insert(node.id);
    }

    std::vector<Edge> result;
    result.reserve(edges.size());
    for (const auto& edge : edges) {
        if (edge.is_ghost && !include_ghost) {
            continue;
        }
        if (ids.count(edge.source) && ids.count(edge.target)) {
            result.push_back(edge);
        }
    }
    return result;
}

bool GraphSnapshot::structurally_equal(const GraphSnapshot& other) const {
    if (nodes.size() != other.nodes.size() || edges.size() != other.edges.size()) {
        return false;
    }
    for (size_t i = 0; i < nodes.size(); ++i) {
        const auto& a = nodes[i];
        const auto& b = other.nodes[i];
        if (a.id != b.id || a.entity_type != b.entity_type || a.name != b.name) {
            return false;
        }
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        const auto& a = edges[i];
        const auto& b = other.edges[i];
        if (a.id != b.id || a.source != b.source || a.target != b.target ||
            a.relationship_type != b.relationship_type) {
            return false;
        }
    }
    return true;
}

SnapshotStatistics GraphSnapshot::compute_statistics() const {
    SnapshotStatistics stats;
    stats.num_nodes = nodes.size();
    stats.num_clusters = clusters.size();
    stats.num_gaps = gaps.size();

    auto valid = valid_edges(true);
    for (const auto& edge : valid) {
        if (edge.is_ghost) {
            ++stats.num_ghost_edges;
        } else {
            ++stats.num_edges;
        }
    }
    stats.num_dangling_edges = edges.size() - valid.size();

    for (const auto& cluster : clusters) {
        if (cluster.concepts.empty()) {
            ++stats.num_empty_clusters;
        }
    }

    auto memberships = node_cluster_map();
    for (const auto& node : nodes) {
        if (node.is_bridge) {
            ++stats.num_bridge_nodes;
        }
        if (!memberships.count(node.id)) {
            ++stats.num_unclustered_nodes;
        }
    }

    for (const auto& metric : centrality) {
        stats.max_centrality = std::max(stats.max_centrality, metric.betweenness);
    }

    if (!nodes.empty()) {
        stats.avg_degree = 2.0 * static_cast<double>(stats.num_edges) /
                           static_cast<double>(nodes.size());
    }

    return stats;
}

nlohmann::json GraphSnapshot::to_json() const {
    nlohmann::json j;

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& node : nodes) {
        nodes_json.push_back(node.to_json());
    }
    j["nodes"] = nodes_json;

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    nlohmann::json clusters_json = nlohmann::json::array();
    for (const auto& cluster : clusters) {
        clusters_json.push_back(cluster.to_json());
    }
    j["clusters"] = clusters_json;

    nlohmann::json centrality_json = nlohmann::json::array();
    for (const auto& metric : centrality) {
        centrality_json.push_back(metric.to_json());
    }
    j["centrality"] = centrality_json;

    nlohmann::json gaps_json = nlohmann::json::array();
    for (const auto& gap : gaps) {
        gaps_json.push_back(gap.to_json());
    }
    j["gaps"] = gaps_json;

    return j;
}

GraphSnapshot GraphSnapshot::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Snapshot JSON must be an object");
    }

    GraphSnapshot snapshot;

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            snapshot.nodes.push_back(Node::from_json(node_json));
        }
    }
    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            snapshot.edges.push_back(Edge::from_json(edge_json));
        }
    }
    if (j.contains("potential_edges")) {
        size_t index = 0;
        for (const auto& pe : j["potential_edges"]) {
            Edge ghost;
            ghost.source = json_value_to_string(pe.at("source_id"));
            ghost.target = json_value_to_string(pe.at("target_id"));
            ghost.similarity = std::clamp(pe.value("similarity", 0.0), 0.0, 1.0);
            ghost.weight = ghost.similarity;
            ghost.relationship_type = "POTENTIAL";
            ghost.is_ghost = true;
            ghost.id = "ghost-" + ghost.source + "-" + ghost.target + "-" + std::to_string(index++);
            snapshot.edges.push_back(ghost);
        }
    }
    if (j.contains("clusters")) {
        for (const auto& cluster_json : j["clusters"]) {
            snapshot.clusters.push_back(Cluster::from_json(cluster_json));
        }
    }

    // Both the list form and the {id: score} map form are accepted
    const char* centrality_key = j.contains("centrality") ? "centrality" : "centrality_metrics";
    if (j.contains(centrality_key)) {
        const auto& cj = j[centrality_key];
        if (cj.is_array()) {
            for (const auto& metric_json : cj) {
                snapshot.centrality.push_back(CentralityMetric::from_json(metric_json));
            }
        } else if (cj.is_object()) {
            for (const auto& [id, score] : cj.items()) {
                CentralityMetric metric;
                metric.node_id = id;
                metric.betweenness = score.is_number() ? std::max(0.0, score.get<double>()) : 0.0;
                snapshot.centrality.push_back(metric);
            }
        }
    }

    if (j.contains("gaps")) {
        for (const auto& gap_json : j["gaps"]) {
            snapshot.gaps.push_back(StructuralGap::from_json(gap_json));
        }
    }

    return snapshot;
}

GraphSnapshot GraphSnapshot::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open snapshot file: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse snapshot file " + filename + ": " + e.what());
    }

    try {
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed snapshot in " + filename + ": " + e.what());
    }
}

void GraphSnapshot::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

} // namespace kgviz
