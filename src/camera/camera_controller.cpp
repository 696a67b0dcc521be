#include "kgviz/camera/camera_controller.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace kgviz {

nlohmann::json CameraPose::to_json() const {
    nlohmann::json j;
    j["position"] = {position.x, position.y, position.z};
    j["look_at"] = {look_at.x, look_at.y, look_at.z};
    return j;
}

double ease_in_out_cubic(double t) {
    t = std::clamp(t, 0.0, 1.0);
    if (t < 0.5) {
        return 4.0 * t * t * t;
    }
    double f = -2.0 * t + 2.0;
    return 1.0 - f * f * f / 2.0;
}

CameraController::CameraController(CameraConfig config)
    : config_(config) {
    pose_ = default_pose(config_);
    from_ = pose_;
    to_ = pose_;
}

CameraPose CameraController::default_pose(const CameraConfig& config) {
    CameraPose pose;
    pose.position = Vec3{0.0, 0.0, config.default_distance};
    pose.look_at = Vec3{};
    return pose;
}

void CameraController::set_targets(const GraphSnapshot& snapshot, const GraphIndex& index) {
    cluster_members_.clear();
    gap_nodes_.clear();

    for (const auto& [cluster_id, members] : index.cluster_members) {
        cluster_members_[cluster_id] = members;
    }
    for (const auto& gap : snapshot.gaps) {
        gap_nodes_.emplace(gap.id, gap.all_node_ids());
    }
}

std::optional<Vec3> CameraController::centroid(const std::vector<std::string>& ids) const {
    if (!source_) {
        return std::nullopt;
    }

    std::unordered_set<std::string> seen;
    Vec3 sum;
    size_t count = 0;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) continue;
        auto position = source_->position_of(id);
        if (!position || !position->is_finite()) continue;
        sum += *position;
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return sum * (1.0 / static_cast<double>(count));
}

bool CameraController::focus_on_node(const std::string& node_id) {
    if (!source_) {
        return false;
    }
    auto position = source_->position_of(node_id);
    if (!position || !position->is_finite()) {
        return false;
    }
    start_tween(*position, config_.node_standoff);
    return true;
}

bool CameraController::focus_on_cluster(int cluster_id) {
    std::optional<Vec3> target;

    auto it = cluster_members_.find(cluster_id);
    if (it != cluster_members_.end()) {
        target = centroid(it->second);
    }
    // Topic view: fall back to the cluster rectangle itself
    if (!target && source_) {
        target = source_->position_of("cluster-" + std::to_string(cluster_id));
    }

    if (!target) {
        return false;
    }
    start_tween(*target, config_.cluster_standoff);
    return true;
}

bool CameraController::focus_on_gap(const std::string& gap_id) {
    auto it = gap_nodes_.find(gap_id);
    if (it == gap_nodes_.end()) {
        return false;
    }
    auto target = centroid(it->second);
    if (!target) {
        return false;
    }
    start_tween(*target, config_.gap_standoff);
    return true;
}

void CameraController::reset_camera() {
    start_tween(default_pose(config_));
}

void CameraController::advance(double elapsed_ms) {
    if (!animating_ || !(elapsed_ms > 0.0)) {
        return;
    }

    elapsed_ms_ += elapsed_ms;
    double t = config_.transition_ms > 0.0 ? elapsed_ms_ / config_.transition_ms : 1.0;
    if (t >= 1.0) {
        pose_ = to_;
        animating_ = false;
        return;
    }

    double eased = ease_in_out_cubic(t);
    pose_.position = lerp(from_.position, to_.position, eased);
    pose_.look_at = lerp(from_.look_at, to_.look_at, eased);
}

void CameraController::start_tween(const Vec3& target, double standoff) {
    CameraPose pose;
    pose.look_at = target;
    pose.position = target + Vec3{0.0, 0.0, standoff};
    start_tween(pose);
}

void CameraController::start_tween(const CameraPose& target) {
    from_ = pose_;
    to_ = target;
    elapsed_ms_ = 0.0;
    animating_ = true;

    if (config_.transition_ms <= 0.0) {
        pose_ = to_;
        animating_ = false;
    }
}

} // namespace kgviz
