#pragma once

#include "kgviz/camera/camera_controller.hpp"
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "kgviz/interaction/highlight_state.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace kgviz {

enum class ClusterHoverState {
    Neutral,    ///< Nothing hovered
    Focused,    ///< The hovered cluster
    Connected,  ///< Shares a link with the hovered cluster
    Faded       ///< Everything else
};

std::string to_string(ClusterHoverState state);

/**
 * @brief Visual treatment of a topic node for a hover state
 */
struct ClusterHoverStyle {
    double opacity = 1.0;
    double scale = 1.0;
    double border_width = 2.0;
    bool show_label = true;
};

ClusterHoverStyle cluster_hover_style(ClusterHoverState state);

/**
 * @brief Outbound notifications; any of them may be empty
 */
struct InteractionCallbacks {
    std::function<void(const Node&)> on_node_click;
    std::function<void()> on_background_click;
    std::function<void(const Node*)> on_node_hover;             // nullptr on leave
    std::function<void(std::optional<int>)> on_cluster_hover;   // nullopt on leave
};

/**
 * @brief Turns pointer events into highlight state and camera moves
 *
 * Every handler recomputes the highlight sets synchronously, so the next
 * frame sees a consistent state. Adjacency used by the handlers is copied
 * once per dataset.
 */
class HighlightCoordinator {
public:
    HighlightCoordinator() = default;

    /**
     * @brief Adopt a new dataset
     *
     * Clears highlights, hover and selection unless preserve_selection is
     * set (same-shape refresh). Pins survive.
     */
    void set_dataset(const GraphSnapshot& snapshot, const GraphIndex& index,
                     const std::map<int, std::set<int>>& cluster_adjacency,
                     bool preserve_selection = false);

    /**
     * @brief Camera driven by select_gap (not owned, may be null)
     */
    void set_camera(CameraController* camera) { camera_ = camera; }

    void set_callbacks(InteractionCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    // ------------------------------------------------------------------
    // Events
    // ------------------------------------------------------------------

    /**
     * @brief Highlight the node, its direct neighbours and its incident edges
     * @return false for an unknown node (state unchanged)
     */
    bool click_node(const std::string& node_id);

    /**
     * @brief Clear both highlight sets
     */
    void click_background();

    /**
     * @brief Track the hovered node; nullopt means the pointer left
     */
    void hover_node(const std::optional<std::string>& node_id);

    /**
     * @brief Topic view hover; nullopt restores every cluster to Neutral
     */
    void hover_cluster(const std::optional<int>& cluster_id);

    /**
     * @brief Highlight both gap sides and the bridge candidates, then focus
     * the camera on them
     */
    bool select_gap(const std::string& gap_id);

    // ------------------------------------------------------------------
    // Pins
    // ------------------------------------------------------------------

    void pin(const std::string& node_id);
    void unpin(const std::string& node_id);
    bool toggle_pin(const std::string& node_id);        // Returns the new state
    void clear_pins();

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    const HighlightState& state() const { return state_; }
    const std::unordered_set<std::string>& pinned() const { return state_.pinned; }

    const std::optional<std::string>& hovered_node() const { return hovered_node_; }
    const std::optional<int>& hovered_cluster() const { return hovered_cluster_; }
    const std::optional<std::string>& selected_node() const { return selected_node_; }
    const std::optional<std::string>& selected_gap() const { return selected_gap_; }

    ClusterHoverState cluster_state(int cluster_id) const;

    /**
     * @brief Opacity factor of a topic link under the current hover
     */
    double link_opacity(int source_cluster, int target_cluster) const;

private:
    HighlightState state_;
    InteractionCallbacks callbacks_;
    CameraController* camera_ = nullptr;

    std::unordered_map<std::string, Node> nodes_;
    std::unordered_map<std::string, std::unordered_set<std::string>> neighbors_;
    std::unordered_map<std::string, std::vector<std::string>> incident_edges_;
    std::unordered_map<std::string, std::vector<std::string>> gap_nodes_;
    std::map<int, std::set<int>> cluster_adjacency_;

    std::optional<std::string> hovered_node_;
    std::optional<int> hovered_cluster_;
    std::optional<std::string> selected_node_;
    std::optional<std::string> selected_gap_;
};

} // namespace kgviz
