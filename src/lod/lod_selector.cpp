#include "kgviz/lod/lod_selector.hpp"
#include <algorithm>
#include <cmath>

namespace kgviz {

namespace {

double score_of(const std::map<std::string, double>& centrality, const std::string& id) {
    auto it = centrality.find(id);
    if (it == centrality.end() || !std::isfinite(it->second)) {
        return 0.0;
    }
    return std::max(0.0, it->second);
}

} // namespace

std::vector<std::string> LodSelector::rank(const std::vector<std::string>& node_ids,
                                           const std::map<std::string, double>& centrality) {
    std::vector<std::pair<double, std::string>> scored;
    scored.reserve(node_ids.size());
    for (const auto& id : node_ids) {
        scored.emplace_back(score_of(centrality, id), id);
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second < b.second;
    });

    std::vector<std::string> ranked;
    ranked.reserve(scored.size());
    for (auto& [score, id] : scored) {
        ranked.push_back(std::move(id));
    }
    return ranked;
}

size_t LodSelector::keep_count(size_t n, double fraction) {
    if (std::isnan(fraction)) {
        fraction = 1.0;
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    double product = fraction * static_cast<double>(n);
    double count = std::ceil(product);
    // Snap products within rounding noise of a whole count, never down to 0
    double nearest = std::round(product);
    if (nearest >= 1.0 && std::abs(product - nearest) < 1e-9) {
        count = nearest;
    }
    return std::min(n, static_cast<size_t>(std::max(0.0, count)));
}

LodSelection LodSelector::select(const std::vector<std::string>& node_ids,
                                 const std::map<std::string, double>& centrality,
                                 const LodConfig& config,
                                 const std::unordered_set<std::string>& pinned) {
    LodSelection selection;

    // Fail open without centrality data
    double fraction = centrality.empty() ? 1.0 : config.effective_fraction();
    selection.applied_fraction = fraction;

    std::vector<std::string> ranked = rank(node_ids, centrality);
    selection.kept_by_rank = keep_count(ranked.size(), fraction);

    for (size_t i = 0; i < selection.kept_by_rank; ++i) {
        selection.visible_nodes.insert(ranked[i]);
        selection.ranked_nodes.push_back(ranked[i]);
    }

    for (size_t i = selection.kept_by_rank; i < ranked.size(); ++i) {
        if (pinned.count(ranked[i])) {
            selection.visible_nodes.insert(ranked[i]);
            selection.ranked_nodes.push_back(ranked[i]);
            ++selection.kept_by_pin;
        }
    }

    return selection;
}

double LodSelector::normalize_zoom(double distance, double min_distance, double max_distance) {
    if (!std::isfinite(distance) || max_distance <= min_distance) {
        return 1.0;
    }
    double normalized = 1.0 - (distance - min_distance) / (max_distance - min_distance);
    return std::clamp(normalized, 0.0, 1.0);
}

double LodSelector::visible_fraction_for_zoom(double zoom) {
    if (std::isnan(zoom)) return 1.0;
    if (zoom >= 1.0) return 1.0;
    if (zoom >= 0.6) return 0.8;
    if (zoom >= 0.3) return 0.5;
    if (zoom >= 0.1) return 0.3;
    return 0.2;
}

double LodSelector::node_opacity(double zoom, double normalized_centrality) {
    double visible = visible_fraction_for_zoom(zoom);
    if (normalized_centrality >= visible) {
        return 1.0;
    }

    double fade_start = visible - kFadeDistance;
    if (normalized_centrality >= fade_start) {
        double progress = (normalized_centrality - fade_start) / kFadeDistance;
        return std::max(kMinOpacity, progress);
    }
    return 0.0;
}

} // namespace kgviz
