#pragma once

#include <string>
#include <unordered_set>

namespace kgviz {

/**
 * @brief Highlighted node and edge ids plus the pinned-node set
 *
 * Pins are independent of highlights: clearing a selection leaves them alone.
 */
struct HighlightState {
    std::unordered_set<std::string> nodes;
    std::unordered_set<std::string> edges;
    std::unordered_set<std::string> pinned;

    bool is_node_highlighted(const std::string& id) const { return nodes.count(id) > 0; }
    bool is_edge_highlighted(const std::string& id) const { return edges.count(id) > 0; }
    bool is_pinned(const std::string& id) const { return pinned.count(id) > 0; }

    void clear_highlights() {
        nodes.clear();
        edges.clear();
    }

    bool has_highlights() const { return !nodes.empty() || !edges.empty(); }
};

} // namespace kgviz
