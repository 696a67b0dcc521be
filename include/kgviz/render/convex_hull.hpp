#pragma once

#include "kgviz/layout/vec.hpp"
#include <map>
#include <vector>

namespace kgviz {

/**
 * @brief Convex hull of a point set, counter-clockwise, without collinear points
 *
 * Returns an empty polygon when the points span no area.
 */
std::vector<Vec2> convex_hull(std::vector<Vec2> points);

/**
 * @brief Hull around square footprints of half-size `pad` centred on each point
 *
 * Each point contributes its four padded corners. Fewer than three points
 * produce an empty polygon.
 */
std::vector<Vec2> padded_hull(const std::vector<Vec2>& centers, double pad);

struct ClusterHull {
    int cluster_id = 0;
    std::vector<Vec2> polygon;
};

/**
 * @brief Per-cluster point buffers filled during a simulation tick
 *
 * Buffers keep their capacity between ticks so that rebuilding the hulls
 * costs O(cluster size) per cluster and never touches other clusters.
 */
class HullBuilder {
public:
    /**
     * @brief Empty every buffer, keeping allocations
     */
    void begin_tick();

    void add_point(int cluster_id, const Vec2& point);

    /**
     * @brief Padded hull of every cluster with at least three points
     */
    std::vector<ClusterHull> build(double pad) const;

    size_t point_count(int cluster_id) const;

private:
    std::map<int, std::vector<Vec2>> buffers_;
};

} // namespace kgviz
