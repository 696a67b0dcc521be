#pragma once

#include "kgviz/config/engine_config.hpp"
#include "kgviz/graph/graph_index.hpp"
#include "kgviz/layout/position_source.hpp"
#include "kgviz/layout/vec.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgviz {

/**
 * @brief Mutable physics record of one node (arena slot)
 */
struct PhysicsNode {
    std::string id;
    Vec3 position;
    Vec3 velocity;
    std::optional<Vec3> fixed;      // Set while the node is pinned/dragged
    int degree = 0;
};

/**
 * @brief Spring between two arena slots, resolved once at start
 */
struct PhysicsLink {
    size_t source = 0;
    size_t target = 0;
    double rest_length = 0.0;
    double strength = 0.0;
    double source_bias = 0.5;       // Share of the correction applied to the source
};

/**
 * @brief Node-level 3-D force simulation
 *
 * Owns an index-stable arena of PhysicsNode records for one run. Each tick
 * applies pairwise repulsion, weighted springs along edges and a mild pull
 * toward the origin, then integrates with a velocity retention that shrinks
 * as the simulation cools. The run stops after a fixed tick budget; the
 * layout is tuned to look settled quickly, not to converge.
 *
 * Ghost edges never take part in the simulation.
 */
class ForceLayout3D : public PositionSource {
public:
    explicit ForceLayout3D(LayoutConfig config = LayoutConfig());

    /**
     * @brief Build the arena for a dataset and run the warmup ticks
     *
     * Replaces any previous run. A single node is placed at the origin and
     * the simulation does not run.
     */
    void start(const GraphIndex& index);

    /**
     * @brief Tear down the current run
     */
    void stop();

    /**
     * @brief Advance one tick
     * @return true while the simulation is still running afterwards
     */
    bool tick();

    /**
     * @brief Advance up to max_ticks ticks (one frame's worth)
     * @return Number of ticks actually run
     */
    int step(int max_ticks);

    /**
     * @brief Restart cooling from alpha_start with a fresh tick budget
     */
    void reheat();

    /**
     * @brief Pin a node at a position; it stops responding to forces
     */
    bool fix_node(const std::string& node_id, const Vec3& position);

    bool release_node(const std::string& node_id);

    std::optional<Vec3> position_of(const std::string& node_id) const override;

    bool is_running() const { return running_; }
    int tick_count() const { return ticks_; }
    double alpha() const { return alpha_; }
    size_t repaired_positions() const { return repaired_; }

    const std::vector<PhysicsNode>& nodes() const { return nodes_; }
    const std::vector<PhysicsLink>& links() const { return links_; }
    const LayoutConfig& config() const { return config_; }
    void set_config(const LayoutConfig& config) { config_ = config; }

private:
    LayoutConfig config_;
    std::vector<PhysicsNode> nodes_;
    std::vector<PhysicsLink> links_;
    std::unordered_map<std::string, size_t> index_;

    double alpha_ = 0.0;
    int ticks_ = 0;
    bool running_ = false;
    size_t repaired_ = 0;

    void apply_repulsion();
    void apply_links();
    void apply_centering();
    void integrate();
    void repair_non_finite();
    void finish();
};

} // namespace kgviz
