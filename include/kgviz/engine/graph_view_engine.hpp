#pragma once

#include "kgviz/camera/camera_controller.hpp"
#include "kgviz/config/engine_config.hpp"
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "kgviz/interaction/highlight_coordinator.hpp"
#include "kgviz/layout/force_layout.hpp"
#include "kgviz/layout/topic_layout.hpp"
#include "kgviz/lod/lod_selector.hpp"
#include "kgviz/render/graph_adapter.hpp"
#include "kgviz/render/render_strategy.hpp"
#include <map>
#include <memory>
#include <string>

namespace kgviz {

/**
 * @brief Counters about the engine and the last produced frame
 */
struct EngineStatistics {
    size_t snapshots_received = 0;
    size_t layout_restarts = 0;
    size_t structural_skips = 0;        // Snapshots that kept the running layout
    size_t frames = 0;

    size_t last_visible_nodes = 0;
    size_t last_visible_edges = 0;
    size_t last_filtered_nodes = 0;
    size_t last_dropped_edges = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Owns one dataset and drives layout, camera and rendering per frame
 *
 * Single-threaded: the host calls frame() once per display refresh. The
 * engine performs no I/O.
 */
class GraphViewEngine {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit GraphViewEngine(const EngineConfig& config = EngineConfig());

    // The camera and coordinator hold pointers into this object
    GraphViewEngine(const GraphViewEngine&) = delete;
    GraphViewEngine& operator=(const GraphViewEngine&) = delete;

    /**
     * @brief Replace the dataset
     *
     * A snapshot with the same shape as the current one (see
     * GraphSnapshot::structurally_equal) keeps the running 3-D simulation
     * and the highlight state; clusters, centrality and gaps are still
     * replaced.
     *
     * @return true if the 3-D simulation was restarted
     */
    bool set_snapshot(GraphSnapshot snapshot);

    /**
     * @brief Switch views; picks the matching render strategy
     */
    void set_view_mode(ViewMode mode);
    ViewMode view_mode() const { return view_mode_; }

    /**
     * @brief Advance the active simulation and the camera, then build a scene
     */
    Scene frame(const RenderConfig& config, double elapsed_ms);

    /**
     * @brief Run the active simulation until it stops or max_ticks is hit
     * @return Number of ticks run
     */
    int settle(int max_ticks);

    bool is_simulating() const;

    // ==========================================
    // Handles
    // ==========================================

    CameraController& camera() { return camera_; }
    const CameraController& camera() const { return camera_; }

    HighlightCoordinator& coordinator() { return coordinator_; }
    const HighlightCoordinator& coordinator() const { return coordinator_; }

    const ForceLayout3D& layout() const { return layout_; }
    const TopicLayout& topic_layout() const { return topic_; }

    /**
     * @brief Layout of the active view
     */
    const PositionSource& positions() const;

    const GraphSnapshot& snapshot() const { return snapshot_; }
    const GraphIndex& index() const { return index_; }
    const std::map<std::string, double>& centrality() const { return centrality_; }
    const RenderStrategy& strategy() const { return *strategy_; }
    const EngineConfig& config() const { return config_; }
    const EngineStatistics& statistics() const { return stats_; }

private:
    EngineConfig config_;
    ViewMode view_mode_;

    GraphSnapshot snapshot_;
    GraphIndex index_;
    std::map<std::string, double> centrality_;
    bool has_snapshot_ = false;

    ForceLayout3D layout_;
    TopicLayout topic_;
    CameraController camera_;
    HighlightCoordinator coordinator_;
    std::unique_ptr<RenderStrategy> strategy_;

    EngineStatistics stats_;

    void restart_topic_layout();
    void bind_camera();
};

} // namespace kgviz
