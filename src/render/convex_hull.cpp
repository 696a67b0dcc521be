#include "kgviz/render/convex_hull.hpp"
#include <algorithm>

namespace kgviz {

namespace {

// > 0 for a left turn o -> a -> b
double cross(const Vec2& o, const Vec2& a, const Vec2& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

} // namespace

std::vector<Vec2> convex_hull(std::vector<Vec2> points) {
    points.erase(std::remove_if(points.begin(), points.end(),
                                [](const Vec2& p) { return !p.is_finite(); }),
                 points.end());
    if (points.size() < 3) {
        return {};
    }

    std::sort(points.begin(), points.end(), [](const Vec2& a, const Vec2& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });

    // Monotone chain: lower hull then upper hull
    std::vector<Vec2> hull(2 * points.size());
    size_t k = 0;
    for (size_t i = 0; i < points.size(); ++i) {
        while (k >= 2 && cross(hull[k - 2], hull[k - 1], points[i]) <= 0.0) {
            --k;
        }
        hull[k++] = points[i];
    }
    for (size_t i = points.size() - 1, lower = k + 1; i > 0; --i) {
        while (k >= lower && cross(hull[k - 2], hull[k - 1], points[i - 1]) <= 0.0) {
            --k;
        }
        hull[k++] = points[i - 1];
    }

    // Last point repeats the first
    hull.resize(k > 0 ? k - 1 : 0);
    if (hull.size() < 3) {
        return {};
    }
    return hull;
}

std::vector<Vec2> padded_hull(const std::vector<Vec2>& centers, double pad) {
    if (centers.size() < 3) {
        return {};
    }

    std::vector<Vec2> corners;
    corners.reserve(centers.size() * 4);
    for (const auto& c : centers) {
        corners.push_back({c.x - pad, c.y - pad});
        corners.push_back({c.x + pad, c.y - pad});
        corners.push_back({c.x - pad, c.y + pad});
        corners.push_back({c.x + pad, c.y + pad});
    }
    return convex_hull(std::move(corners));
}

void HullBuilder::begin_tick() {
    for (auto& [cluster_id, points] : buffers_) {
        points.clear();
    }
}

void HullBuilder::add_point(int cluster_id, const Vec2& point) {
    buffers_[cluster_id].push_back(point);
}

std::vector<ClusterHull> HullBuilder::build(double pad) const {
    std::vector<ClusterHull> hulls;
    for (const auto& [cluster_id, points] : buffers_) {
        if (points.size() < 3) {
            continue;
        }
        ClusterHull hull;
        hull.cluster_id = cluster_id;
        hull.polygon = padded_hull(points, pad);
        if (!hull.polygon.empty()) {
            hulls.push_back(std::move(hull));
        }
    }
    return hulls;
}

size_t HullBuilder::point_count(int cluster_id) const {
    auto it = buffers_.find(cluster_id);
    return it != buffers_.end() ? it->second.size() : 0;
}

} // namespace kgviz
