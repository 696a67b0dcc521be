#pragma once

#include "kgviz/config/engine_config.hpp"
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "kgviz/layout/position_source.hpp"
#include "kgviz/layout/vec.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kgviz {

struct CameraPose {
    Vec3 position;
    Vec3 look_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Cubic ease-in-out on [0, 1]
 */
double ease_in_out_cubic(double t);

/**
 * @brief Animated camera focus on nodes, clusters and gaps
 *
 * Each focus call starts a tween from the current (possibly mid-tween) pose
 * to look_at = target, position = target + (0, 0, standoff). Time only moves
 * when the host calls advance(). Positions are looked up by id through a
 * PositionSource on every call.
 */
class CameraController {
public:
    explicit CameraController(CameraConfig config = CameraConfig());

    /**
     * @brief Set the layout to read positions from (not owned, may be null)
     */
    void set_position_source(const PositionSource* source) { source_ = source; }

    /**
     * @brief Copy cluster membership and gap node lists for one dataset
     */
    void set_targets(const GraphSnapshot& snapshot, const GraphIndex& index);

    /**
     * @return false (and no tween) when the node has no position
     */
    bool focus_on_node(const std::string& node_id);

    /**
     * @brief Focus the centroid of the cluster's resolved member positions
     */
    bool focus_on_cluster(int cluster_id);

    /**
     * @brief Focus the centroid of both gap sides plus bridge candidates
     */
    bool focus_on_gap(const std::string& gap_id);

    /**
     * @brief Tween back to (0, 0, default_distance) looking at the origin
     */
    void reset_camera();

    /**
     * @brief Advance the running tween
     */
    void advance(double elapsed_ms);

    /**
     * @brief Centroid of the resolvable positions, duplicates counted once
     */
    std::optional<Vec3> centroid(const std::vector<std::string>& ids) const;

    const CameraPose& pose() const { return pose_; }
    const CameraPose& target_pose() const { return to_; }
    bool is_animating() const { return animating_; }

    /**
     * @brief Distance from the camera to the point it looks at
     */
    double distance() const { return (pose_.position - pose_.look_at).length(); }

    static CameraPose default_pose(const CameraConfig& config);

    const CameraConfig& config() const { return config_; }
    void set_config(const CameraConfig& config) { config_ = config; }

private:
    CameraConfig config_;
    const PositionSource* source_ = nullptr;

    std::map<int, std::vector<std::string>> cluster_members_;
    std::map<std::string, std::vector<std::string>> gap_nodes_;

    CameraPose pose_;
    CameraPose from_;
    CameraPose to_;
    double elapsed_ms_ = 0.0;
    bool animating_ = false;

    void start_tween(const Vec3& target, double standoff);
    void start_tween(const CameraPose& target);
};

} // namespace kgviz
