#include "kgviz/layout/force_layout.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>

namespace kgviz {

namespace {

// Small deterministic offset used to separate coincident points and to
// re-seed non-finite ones. Never zero.
Vec3 jitter(size_t i) {
    double a = static_cast<double>(i % 7) - 3.0;
    double b = static_cast<double>((i / 7) % 5) - 2.0;
    double c = static_cast<double>((i / 35) % 3) - 1.0;
    if (a == 0.0 && b == 0.0 && c == 0.0) {
        a = 1.0;
    }
    return Vec3{a, b, c} * 1e-2;
}

Vec3 random_in_ball(std::mt19937& rng, double radius) {
    std::uniform_real_distribution<double> uniform(-1.0, 1.0);
    while (true) {
        double x = uniform(rng), y = uniform(rng), z = uniform(rng);
        double r2 = x * x + y * y + z * z;
        if (r2 > 1e-6 && r2 <= 1.0) {
            return Vec3{x, y, z} * radius;
        }
    }
}

} // namespace

ForceLayout3D::ForceLayout3D(LayoutConfig config)
    : config_(config) {}

void ForceLayout3D::start(const GraphIndex& index) {
    stop();

    std::mt19937 rng(config_.seed);

    nodes_.reserve(index.node_ids.size());
    for (const auto& id : index.node_ids) {
        PhysicsNode node;
        node.id = id;
        node.position = random_in_ball(rng, config_.initial_radius);
        index_.emplace(id, nodes_.size());
        nodes_.push_back(std::move(node));
    }

    if (nodes_.size() == 1) {
        nodes_[0].position = Vec3{};
        return;
    }
    if (nodes_.empty()) {
        return;
    }

    // Resolve endpoints once; degree drives the spring bias
    double max_weight = 0.0;
    for (const auto& resolved : index.resolved_edges) {
        if (resolved.source == resolved.target) continue;
        nodes_[resolved.source].degree++;
        nodes_[resolved.target].degree++;
        max_weight = std::max(max_weight, index.edges[resolved.edge_pos].weight);
    }

    for (const auto& resolved : index.resolved_edges) {
        if (resolved.source == resolved.target) continue;
        const auto& edge = index.edges[resolved.edge_pos];
        const auto& s = nodes_[resolved.source];
        const auto& t = nodes_[resolved.target];

        double ratio = max_weight > 0.0 ? edge.weight / max_weight : 1.0;
        int min_degree = std::max(1, std::min(s.degree, t.degree));

        PhysicsLink link;
        link.source = resolved.source;
        link.target = resolved.target;
        link.rest_length = config_.link_distance;
        link.strength = config_.link_strength * (0.25 + 0.75 * ratio) / min_degree;
        link.source_bias = static_cast<double>(t.degree) / (s.degree + t.degree);
        links_.push_back(link);
    }

    alpha_ = config_.alpha_start;
    running_ = true;

    for (int i = 0; i < config_.warmup_ticks && running_; ++i) {
        tick();
    }
}

void ForceLayout3D::stop() {
    nodes_.clear();
    links_.clear();
    index_.clear();
    alpha_ = 0.0;
    ticks_ = 0;
    running_ = false;
    repaired_ = 0;
}

bool ForceLayout3D::tick() {
    if (!running_) {
        return false;
    }

    apply_repulsion();
    apply_links();
    apply_centering();
    integrate();
    repair_non_finite();

    alpha_ *= (1.0 - config_.alpha_decay);
    ++ticks_;

    if (ticks_ >= config_.cooldown_ticks || alpha_ < config_.alpha_min) {
        finish();
    }
    return running_;
}

int ForceLayout3D::step(int max_ticks) {
    int done = 0;
    while (done < max_ticks && running_) {
        tick();
        ++done;
    }
    return done;
}

void ForceLayout3D::reheat() {
    if (nodes_.size() < 2) {
        return;
    }
    alpha_ = config_.alpha_start;
    ticks_ = 0;
    running_ = true;
}

bool ForceLayout3D::fix_node(const std::string& node_id, const Vec3& position) {
    auto it = index_.find(node_id);
    if (it == index_.end() || !position.is_finite()) {
        return false;
    }
    auto& node = nodes_[it->second];
    node.fixed = position;
    node.position = position;
    node.velocity = Vec3{};
    return true;
}

bool ForceLayout3D::release_node(const std::string& node_id) {
    auto it = index_.find(node_id);
    if (it == index_.end()) {
        return false;
    }
    nodes_[it->second].fixed.reset();
    return true;
}

std::optional<Vec3> ForceLayout3D::position_of(const std::string& node_id) const {
    auto it = index_.find(node_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return nodes_[it->second].position;
}

void ForceLayout3D::apply_repulsion() {
    const double min_dist = std::max(1e-3, config_.min_repulsion_distance);
    const double k = config_.repulsion_strength * alpha_;

    for (size_t i = 0; i < nodes_.size(); ++i) {
        for (size_t j = i + 1; j < nodes_.size(); ++j) {
            Vec3 delta = nodes_[i].position - nodes_[j].position;
            double dist_sq = delta.length_sq();
            if (dist_sq < 1e-12) {
                // Coincident nodes: push apart along a fixed direction
                delta = jitter(i * 31 + j);
                dist_sq = delta.length_sq();
            }
            double dist = std::sqrt(dist_sq);
            Vec3 dir = delta * (1.0 / dist);
            double force = k / std::max(dist, min_dist);

            nodes_[i].velocity += dir * force;
            nodes_[j].velocity -= dir * force;
        }
    }
}

void ForceLayout3D::apply_links() {
    for (const auto& link : links_) {
        auto& s = nodes_[link.source];
        auto& t = nodes_[link.target];

        Vec3 delta = (t.position + t.velocity) - (s.position + s.velocity);
        double dist = delta.length();
        if (dist < 1e-9) {
            delta = jitter(link.source * 17 + link.target);
            dist = delta.length();
        }

        double l = (dist - link.rest_length) / dist * alpha_ * link.strength;
        Vec3 correction = delta * l;
        t.velocity -= correction * (1.0 - link.source_bias);
        s.velocity += correction * link.source_bias;
    }
}

void ForceLayout3D::apply_centering() {
    const double k = config_.centering_strength * alpha_;
    for (auto& node : nodes_) {
        node.velocity -= node.position * k;
    }
}

void ForceLayout3D::integrate() {
    // Retention shrinks with alpha so late ticks barely move anything
    double cooling = config_.alpha_start > 0.0 ? alpha_ / config_.alpha_start : 0.0;
    double retention = config_.velocity_retention * (0.5 + 0.5 * cooling);

    for (auto& node : nodes_) {
        if (node.fixed.has_value()) {
            node.position = node.fixed.value();
            node.velocity = Vec3{};
            continue;
        }

        node.velocity = node.velocity * retention;
        double speed = node.velocity.length();
        if (speed > config_.max_speed && speed > 0.0) {
            node.velocity = node.velocity * (config_.max_speed / speed);
        }
        node.position += node.velocity;
    }
}

void ForceLayout3D::repair_non_finite() {
    size_t repaired_now = 0;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        auto& node = nodes_[i];
        if (!node.position.is_finite() || !node.velocity.is_finite()) {
            node.position = jitter(i) * 100.0;
            node.velocity = Vec3{};
            ++repaired_now;
        }
    }

    if (repaired_now > 0) {
        repaired_ += repaired_now;
        if (config_.verbose) {
            std::cerr << "Warning: repaired " << repaired_now
                      << " non-finite node positions at tick " << ticks_ << "\n";
        }
    }
}

void ForceLayout3D::finish() {
    running_ = false;
    if (config_.verbose) {
        std::cout << "Force simulation stabilized after " << ticks_ << " ticks ("
                  << nodes_.size() << " nodes, " << links_.size() << " links)\n";
    }
}

} // namespace kgviz
