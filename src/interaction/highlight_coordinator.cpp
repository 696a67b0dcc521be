#include "kgviz/interaction/highlight_coordinator.hpp"

namespace kgviz {

std::string to_string(ClusterHoverState state) {
    switch (state) {
        case ClusterHoverState::Neutral: return "neutral";
        case ClusterHoverState::Focused: return "focused";
        case ClusterHoverState::Connected: return "connected";
        case ClusterHoverState::Faded: return "faded";
    }
    return "neutral";
}

ClusterHoverStyle cluster_hover_style(ClusterHoverState state) {
    ClusterHoverStyle style;
    switch (state) {
        case ClusterHoverState::Neutral:
            break;
        case ClusterHoverState::Focused:
            style.scale = 1.02;
            style.border_width = 3.0;
            break;
        case ClusterHoverState::Connected:
            style.opacity = 0.85;
            break;
        case ClusterHoverState::Faded:
            style.opacity = 0.15;
            style.show_label = false;
            break;
    }
    return style;
}

void HighlightCoordinator::set_dataset(const GraphSnapshot& snapshot, const GraphIndex& index,
                                       const std::map<int, std::set<int>>& cluster_adjacency,
                                       bool preserve_selection) {
    nodes_.clear();
    for (const auto& node : snapshot.nodes) {
        nodes_.emplace(node.id, node);
    }
    neighbors_ = index.neighbors;
    incident_edges_ = index.incident_edges;
    cluster_adjacency_ = cluster_adjacency;

    gap_nodes_.clear();
    for (const auto& gap : snapshot.gaps) {
        gap_nodes_.emplace(gap.id, gap.all_node_ids());
    }

    if (preserve_selection) {
        return;
    }
    state_.clear_highlights();
    hovered_node_.reset();
    hovered_cluster_.reset();
    selected_node_.reset();
    selected_gap_.reset();
}

bool HighlightCoordinator::click_node(const std::string& node_id) {
    auto node = nodes_.find(node_id);
    if (node == nodes_.end()) {
        return false;
    }

    state_.clear_highlights();
    state_.nodes.insert(node_id);

    auto n = neighbors_.find(node_id);
    if (n != neighbors_.end()) {
        state_.nodes.insert(n->second.begin(), n->second.end());
    }
    auto e = incident_edges_.find(node_id);
    if (e != incident_edges_.end()) {
        state_.edges.insert(e->second.begin(), e->second.end());
    }

    selected_node_ = node_id;
    selected_gap_.reset();

    if (callbacks_.on_node_click) {
        callbacks_.on_node_click(node->second);
    }
    return true;
}

void HighlightCoordinator::click_background() {
    state_.clear_highlights();
    selected_node_.reset();
    selected_gap_.reset();

    if (callbacks_.on_background_click) {
        callbacks_.on_background_click();
    }
}

void HighlightCoordinator::hover_node(const std::optional<std::string>& node_id) {
    const Node* node = nullptr;
    if (node_id) {
        auto it = nodes_.find(*node_id);
        if (it != nodes_.end()) {
            node = &it->second;
        }
    }

    if (node) {
        hovered_node_ = node->id;
    } else {
        hovered_node_.reset();
    }

    if (callbacks_.on_node_hover) {
        callbacks_.on_node_hover(node);
    }
}

void HighlightCoordinator::hover_cluster(const std::optional<int>& cluster_id) {
    hovered_cluster_ = cluster_id;
    if (callbacks_.on_cluster_hover) {
        callbacks_.on_cluster_hover(cluster_id);
    }
}

bool HighlightCoordinator::select_gap(const std::string& gap_id) {
    auto gap = gap_nodes_.find(gap_id);
    if (gap == gap_nodes_.end()) {
        return false;
    }

    state_.clear_highlights();
    state_.nodes.insert(gap->second.begin(), gap->second.end());
    selected_gap_ = gap_id;
    selected_node_.reset();

    if (camera_) {
        camera_->focus_on_gap(gap_id);
    }
    return true;
}

void HighlightCoordinator::pin(const std::string& node_id) {
    state_.pinned.insert(node_id);
}

void HighlightCoordinator::unpin(const std::string& node_id) {
    state_.pinned.erase(node_id);
}

bool HighlightCoordinator::toggle_pin(const std::string& node_id) {
    if (state_.pinned.erase(node_id) > 0) {
        return false;
    }
    state_.pinned.insert(node_id);
    return true;
}

void HighlightCoordinator::clear_pins() {
    state_.pinned.clear();
}

ClusterHoverState HighlightCoordinator::cluster_state(int cluster_id) const {
    if (!hovered_cluster_) {
        return ClusterHoverState::Neutral;
    }
    if (*hovered_cluster_ == cluster_id) {
        return ClusterHoverState::Focused;
    }

    auto it = cluster_adjacency_.find(*hovered_cluster_);
    if (it != cluster_adjacency_.end() && it->second.count(cluster_id)) {
        return ClusterHoverState::Connected;
    }
    return ClusterHoverState::Faded;
}

double HighlightCoordinator::link_opacity(int source_cluster, int target_cluster) const {
    if (!hovered_cluster_) {
        return 1.0;
    }
    if (*hovered_cluster_ == source_cluster || *hovered_cluster_ == target_cluster) {
        return 1.0;
    }
    return cluster_hover_style(ClusterHoverState::Faded).opacity;
}

} // namespace kgviz
