#pragma once

#include "kgviz/config/engine_config.hpp"
#include <map>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kgviz {

/**
 * @brief Result of a level-of-detail pass
 */
struct LodSelection {
    std::unordered_set<std::string> visible_nodes;
    std::vector<std::string> ranked_nodes;      // Kept ids in rank order, pins last
    size_t kept_by_rank = 0;                    // ceil(p * N)
    size_t kept_by_pin = 0;                     // Pins below the rank cut
    double applied_fraction = 1.0;

    bool is_visible(const std::string& id) const { return visible_nodes.count(id) > 0; }

    /**
     * @brief An edge is visible when both endpoints are
     */
    bool is_edge_visible(const std::string& source, const std::string& target) const {
        return is_visible(source) && is_visible(target);
    }
};

/**
 * @brief Keeps the most central fraction of nodes
 *
 * Ranking is by centrality descending with node id ascending as the tie
 * break, so the kept set for a fraction p is always a prefix of the kept set
 * for any larger p. Pinned nodes are kept regardless of rank.
 */
class LodSelector {
public:
    /**
     * @brief Select visible nodes
     *
     * Missing centrality data or a disabled config keeps everything.
     * Fractions outside [0, 1] are clamped and NaN means 1.
     */
    static LodSelection select(const std::vector<std::string>& node_ids,
                               const std::map<std::string, double>& centrality,
                               const LodConfig& config,
                               const std::unordered_set<std::string>& pinned);

    /**
     * @brief Stable rank order used by select()
     */
    static std::vector<std::string> rank(const std::vector<std::string>& node_ids,
                                         const std::map<std::string, double>& centrality);

    /**
     * @brief ceil(p * n) with p clamped to [0, 1]
     */
    static size_t keep_count(size_t n, double fraction);

    // ------------------------------------------------------------------
    // Zoom-driven LOD
    // ------------------------------------------------------------------

    /**
     * @brief Map a camera distance to [0, 1]; 1 = fully zoomed in
     */
    static double normalize_zoom(double distance, double min_distance = 100.0,
                                 double max_distance = 1000.0);

    /**
     * @brief Fraction of nodes shown at a normalized zoom level
     */
    static double visible_fraction_for_zoom(double zoom);

    /**
     * @brief Opacity of a node near the zoom cut
     *
     * `normalized_centrality` is the node's rank position mapped to [0, 1]
     * (1 = most central). Nodes within kFadeDistance below the cut fade but
     * keep at least kMinOpacity; nodes further below are hidden (0).
     */
    static double node_opacity(double zoom, double normalized_centrality);

    static constexpr double kFadeDistance = 0.1;
    static constexpr double kMinOpacity = 0.2;
};

} // namespace kgviz
