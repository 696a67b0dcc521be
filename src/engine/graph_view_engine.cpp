#include "kgviz/engine/graph_view_engine.hpp"
#include <iostream>
#include <stdexcept>

namespace kgviz {

namespace {

// Same clusters and same links: the running topic simulation stays valid
bool same_topic_shape(const TopicGraph& a, const TopicGraph& b) {
    if (a.nodes.size() != b.nodes.size() || a.links.size() != b.links.size()) {
        return false;
    }
    for (size_t i = 0; i < a.nodes.size(); ++i) {
        if (a.nodes[i].cluster_id != b.nodes[i].cluster_id ||
            a.nodes[i].member_ids != b.nodes[i].member_ids) {
            return false;
        }
    }
    for (size_t i = 0; i < a.links.size(); ++i) {
        if (a.links[i].id != b.links[i].id || a.links[i].is_gap != b.links[i].is_gap) {
            return false;
        }
    }
    return true;
}

} // namespace

nlohmann::json EngineStatistics::to_json() const {
    nlohmann::json j;
    j["snapshots_received"] = snapshots_received;
    j["layout_restarts"] = layout_restarts;
    j["structural_skips"] = structural_skips;
    j["frames"] = frames;
    j["last_visible_nodes"] = last_visible_nodes;
    j["last_visible_edges"] = last_visible_edges;
    j["last_filtered_nodes"] = last_filtered_nodes;
    j["last_dropped_edges"] = last_dropped_edges;
    return j;
}

// ============================================================================
// GraphViewEngine
// ============================================================================

GraphViewEngine::GraphViewEngine(const EngineConfig& config)
    : config_(config),
      view_mode_(config.view_mode),
      layout_(config.layout),
      topic_(config.topic),
      camera_(config.camera) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    coordinator_.set_camera(&camera_);
    strategy_ = make_render_strategy(view_mode_);
    bind_camera();
}

bool GraphViewEngine::set_snapshot(GraphSnapshot snapshot) {
    stats_.snapshots_received++;

    bool same_shape = has_snapshot_ && snapshot_.structurally_equal(snapshot);

    snapshot_ = std::move(snapshot);
    has_snapshot_ = true;
    index_.build(snapshot_);
    centrality_ = snapshot_.centrality_map();

    if (config_.verbose) {
        std::cout << "Loaded snapshot: " << index_.num_nodes() << " nodes, "
                  << index_.edges.size() << " edges, " << snapshot_.clusters.size()
                  << " clusters, " << snapshot_.gaps.size() << " gaps\n";
        if (index_.dropped_edges > 0) {
            std::cerr << "Warning: dropped " << index_.dropped_edges
                      << " edges with missing endpoints\n";
        }
    }

    if (same_shape) {
        stats_.structural_skips++;
        if (config_.verbose) {
            std::cout << "Snapshot shape unchanged, keeping layout\n";
        }
    } else {
        layout_.start(index_);
        stats_.layout_restarts++;
    }

    restart_topic_layout();

    coordinator_.set_dataset(snapshot_, index_, topic_.graph().cluster_adjacency, same_shape);
    camera_.set_targets(snapshot_, index_);
    return !same_shape;
}

void GraphViewEngine::restart_topic_layout() {
    TopicGraph graph = TopicGraph::build(snapshot_, index_, config_.topic);
    if (topic_.nodes().size() > 0 && same_topic_shape(graph, topic_.graph())) {
        return;
    }
    topic_.start(std::move(graph));
}

void GraphViewEngine::set_view_mode(ViewMode mode) {
    if (mode == view_mode_ && strategy_) {
        return;
    }
    view_mode_ = mode;
    strategy_ = make_render_strategy(mode);
    bind_camera();

    // Hover on clusters has no meaning in the node view
    if (mode == ViewMode::Graph3D) {
        coordinator_.hover_cluster(std::nullopt);
    }
}

void GraphViewEngine::bind_camera() {
    camera_.set_position_source(&positions());
}

const PositionSource& GraphViewEngine::positions() const {
    if (view_mode_ == ViewMode::Topic2D) {
        return topic_;
    }
    return layout_;
}

bool GraphViewEngine::is_simulating() const {
    return view_mode_ == ViewMode::Topic2D ? topic_.is_running() : layout_.is_running();
}

int GraphViewEngine::settle(int max_ticks) {
    if (view_mode_ == ViewMode::Topic2D) {
        return topic_.step(max_ticks);
    }
    return layout_.step(max_ticks);
}

Scene GraphViewEngine::frame(const RenderConfig& config, double elapsed_ms) {
    stats_.frames++;

    if (view_mode_ == ViewMode::Topic2D) {
        topic_.step(config_.topic.ticks_per_frame);
    } else {
        layout_.step(config_.layout.ticks_per_frame);
    }
    camera_.advance(elapsed_ms);

    AdaptedGraph graph = GraphAdapter::adapt(snapshot_, index_, centrality_, coordinator_.state(),
                                             AdapterOptions::from_render_config(config));

    std::vector<std::string> node_ids;
    node_ids.reserve(graph.nodes.size());
    for (const auto& node : graph.nodes) {
        node_ids.push_back(node.id);
    }
    LodSelection lod = LodSelector::select(node_ids, centrality_, config.lod, coordinator_.pinned());

    VisualEncoder encoder(config.bloom);
    LabelPolicy labels(config.label_visibility, snapshot_.centrality);

    RenderContext context{graph, lod, config, coordinator_, labels, encoder,
                          &layout_, &topic_, camera_.pose()};
    Scene scene = strategy_->render(context);

    stats_.last_visible_nodes = lod.visible_nodes.size();
    stats_.last_visible_edges = 0;
    for (const auto& edge : graph.edges) {
        if (lod.is_edge_visible(edge.source, edge.target)) {
            stats_.last_visible_edges++;
        }
    }
    stats_.last_filtered_nodes = graph.filtered_nodes;
    stats_.last_dropped_edges = graph.dropped_edges;

    return scene;
}

} // namespace kgviz
