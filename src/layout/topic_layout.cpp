#include "kgviz/layout/topic_layout.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>

namespace kgviz {

namespace {

const double kGoldenAngle = 2.399963229728653;   // pi * (3 - sqrt(5))

std::string cluster_node_id(int cluster_id) {
    return "cluster-" + std::to_string(cluster_id);
}

std::string pair_key(int a, int b) {
    return std::to_string(std::min(a, b)) + "-" + std::to_string(std::max(a, b));
}

Vec2 jitter(size_t i) {
    double a = static_cast<double>(i % 5) - 2.0;
    double b = static_cast<double>((i / 5) % 3) - 1.0;
    if (a == 0.0 && b == 0.0) {
        a = 1.0;
    }
    return Vec2{a, b};
}

} // namespace

// ============================================================================
// TopicGraph
// ============================================================================

Vec2 topic_node_dimensions(int size, int max_size, const TopicLayoutConfig& config) {
    double ratio = max_size > 0 ? static_cast<double>(std::max(0, size)) / max_size : 0.0;
    double width = config.min_node_width + ratio * (config.max_node_width - config.min_node_width);
    return Vec2{width, width * config.node_aspect};
}

TopicGraph TopicGraph::build(const GraphSnapshot& snapshot, const GraphIndex& index,
                             const TopicLayoutConfig& config) {
    TopicGraph graph;

    for (const auto& cluster : snapshot.clusters) {
        const auto& members = index.members_of(cluster.cluster_id);
        if (cluster.concepts.empty() && members.empty()) {
            continue;
        }
        if (graph.cluster_index.count(cluster.cluster_id)) {
            continue;   // Duplicated cluster id: first wins
        }

        TopicNode node;
        node.id = cluster_node_id(cluster.cluster_id);
        node.cluster_id = cluster.cluster_id;
        node.label = cluster.display_label();
        node.color_key = cluster.color_key();
        node.size = cluster.size > 0 ? cluster.size
                                     : static_cast<int>(std::max(cluster.concepts.size(), members.size()));
        node.density = cluster.density;
        node.concept_names = cluster.concept_names;
        node.member_ids = members;
        node.member_positions.resize(members.size());

        graph.max_size = std::max(graph.max_size, node.size);
        graph.cluster_index.emplace(cluster.cluster_id, graph.nodes.size());
        graph.nodes.push_back(std::move(node));
    }

    for (auto& node : graph.nodes) {
        Vec2 dims = topic_node_dimensions(node.size, graph.max_size, config);
        node.width = dims.x;
        node.height = dims.y;
        node.collision_radius = std::max(dims.x, dims.y) / 2.0 + config.collision_padding;
    }

    // Count inter-cluster edges per unordered pair, in first-seen order
    std::unordered_map<std::string, size_t> link_by_pair;
    for (const auto& edge : index.edges) {
        auto source_cluster = index.cluster_of(edge.source);
        auto target_cluster = index.cluster_of(edge.target);
        if (!source_cluster || !target_cluster || *source_cluster == *target_cluster) {
            continue;
        }
        auto s = graph.cluster_index.find(*source_cluster);
        auto t = graph.cluster_index.find(*target_cluster);
        if (s == graph.cluster_index.end() || t == graph.cluster_index.end()) {
            continue;
        }

        std::string key = pair_key(*source_cluster, *target_cluster);
        auto it = link_by_pair.find(key);
        if (it == link_by_pair.end()) {
            int a = std::min(*source_cluster, *target_cluster);
            int b = std::max(*source_cluster, *target_cluster);

            TopicLink link;
            link.id = "connection-" + key;
            link.source = graph.cluster_index.at(a);
            link.target = graph.cluster_index.at(b);
            link.source_cluster = a;
            link.target_cluster = b;
            link.type = TopicLinkType::Connection;
            it = link_by_pair.emplace(key, graph.links.size()).first;
            graph.links.push_back(std::move(link));
        }

        auto& link = graph.links[it->second];
        link.connection_count++;
        link.weight = link.connection_count;
    }

    for (const auto& gap : snapshot.gaps) {
        if (gap.cluster_a_id == gap.cluster_b_id) {
            continue;
        }
        auto s = graph.cluster_index.find(gap.cluster_a_id);
        auto t = graph.cluster_index.find(gap.cluster_b_id);
        if (s == graph.cluster_index.end() || t == graph.cluster_index.end()) {
            continue;
        }

        std::string key = pair_key(gap.cluster_a_id, gap.cluster_b_id);
        auto it = link_by_pair.find(key);
        if (it != link_by_pair.end()) {
            auto& existing = graph.links[it->second];
            if (!existing.is_gap) {
                existing.is_gap = true;
                existing.gap_id = gap.id;
            }
            continue;
        }

        TopicLink link;
        link.id = "gap-" + gap.id;
        link.source = s->second;
        link.target = t->second;
        link.source_cluster = gap.cluster_a_id;
        link.target_cluster = gap.cluster_b_id;
        link.type = TopicLinkType::Gap;
        link.weight = std::clamp(gap.gap_strength, 0.0, 1.0);
        link.is_gap = true;
        link.gap_id = gap.id;
        link_by_pair.emplace(key, graph.links.size());
        graph.links.push_back(std::move(link));
    }

    for (const auto& link : graph.links) {
        graph.cluster_adjacency[link.source_cluster].insert(link.target_cluster);
        graph.cluster_adjacency[link.target_cluster].insert(link.source_cluster);
        graph.nodes[link.source].degree++;
        graph.nodes[link.target].degree++;
        if (link.type == TopicLinkType::Connection) {
            graph.max_weight = std::max(graph.max_weight, link.weight);
        }
    }

    return graph;
}

const TopicNode* TopicGraph::find_node(int cluster_id) const {
    auto it = cluster_index.find(cluster_id);
    return it != cluster_index.end() ? &nodes[it->second] : nullptr;
}

const TopicLink* TopicGraph::find_link(const std::string& link_id) const {
    for (const auto& link : links) {
        if (link.id == link_id) {
            return &link;
        }
    }
    return nullptr;
}

const std::set<int>& TopicGraph::adjacent_clusters(int cluster_id) const {
    static const std::set<int> kEmpty;
    auto it = cluster_adjacency.find(cluster_id);
    return it != cluster_adjacency.end() ? it->second : kEmpty;
}

// ============================================================================
// TopicLayout
// ============================================================================

TopicLayout::TopicLayout(TopicLayoutConfig config)
    : config_(config) {}

void TopicLayout::start(TopicGraph graph) {
    stop();
    graph_ = std::move(graph);

    for (size_t n = 0; n < graph_.nodes.size(); ++n) {
        const auto& node = graph_.nodes[n];
        for (size_t m = 0; m < node.member_ids.size(); ++m) {
            member_index_.emplace(node.member_ids[m], std::make_pair(n, m));
        }
    }

    if (graph_.nodes.empty()) {
        return;
    }

    const Vec2 c = center();
    if (graph_.nodes.size() == 1) {
        graph_.nodes[0].position = c;
        update_members();
        return;
    }

    // Phyllotaxis start around the center, lightly perturbed by the seed
    std::mt19937 rng(config_.seed);
    std::uniform_real_distribution<double> noise(-1.0, 1.0);
    double spacing = std::min(config_.width, config_.height) / 20.0;
    for (size_t i = 0; i < graph_.nodes.size(); ++i) {
        double radius = spacing * std::sqrt(0.5 + static_cast<double>(i));
        double angle = static_cast<double>(i) * kGoldenAngle;
        graph_.nodes[i].position = Vec2{c.x + radius * std::cos(angle) + noise(rng),
                                        c.y + radius * std::sin(angle) + noise(rng)};
    }

    resolve_links();
    clamp_to_canvas();
    update_members();

    alpha_ = config_.alpha_start;
    running_ = true;
}

void TopicLayout::stop() {
    graph_ = TopicGraph();
    member_index_.clear();
    hulls_.clear();
    hull_builder_ = HullBuilder();
    alpha_ = 0.0;
    ticks_ = 0;
    running_ = false;
    repaired_ = 0;
}

bool TopicLayout::tick() {
    if (!running_) {
        return false;
    }

    apply_links();
    apply_charge();
    apply_gravity();
    integrate();
    resolve_collisions();
    clamp_to_canvas();
    repair_non_finite();
    update_members();

    alpha_ *= (1.0 - config_.alpha_decay);
    ++ticks_;

    if (ticks_ >= config_.max_ticks || alpha_ < config_.alpha_min) {
        finish();
    }
    return running_;
}

int TopicLayout::step(int max_ticks) {
    int done = 0;
    while (done < max_ticks && running_) {
        tick();
        ++done;
    }
    return done;
}

void TopicLayout::reheat() {
    if (graph_.nodes.size() < 2) {
        return;
    }
    alpha_ = config_.alpha_start;
    ticks_ = 0;
    running_ = true;
}

bool TopicLayout::fix_node(int cluster_id, const Vec2& position) {
    auto it = graph_.cluster_index.find(cluster_id);
    if (it == graph_.cluster_index.end() || !position.is_finite()) {
        return false;
    }
    auto& node = graph_.nodes[it->second];
    node.fixed = position;
    node.position = position;
    node.velocity = Vec2{};
    clamp_to_canvas();
    update_members();
    return true;
}

bool TopicLayout::release_node(int cluster_id) {
    auto it = graph_.cluster_index.find(cluster_id);
    if (it == graph_.cluster_index.end()) {
        return false;
    }
    graph_.nodes[it->second].fixed.reset();
    return true;
}

std::optional<Vec3> TopicLayout::position_of(const std::string& node_id) const {
    auto member = member_index_.find(node_id);
    if (member != member_index_.end()) {
        const auto& p = graph_.nodes[member->second.first].member_positions[member->second.second];
        return Vec3{p.x, p.y, 0.0};
    }

    for (const auto& node : graph_.nodes) {
        if (node.id == node_id) {
            return Vec3{node.position.x, node.position.y, 0.0};
        }
    }
    return std::nullopt;
}

std::optional<Vec2> TopicLayout::cluster_position(int cluster_id) const {
    auto it = graph_.cluster_index.find(cluster_id);
    if (it == graph_.cluster_index.end()) {
        return std::nullopt;
    }
    return graph_.nodes[it->second].position;
}

double TopicLayout::hull_padding() const {
    return config_.member_radius + config_.hull_margin;
}

void TopicLayout::resolve_links() {
    const double distance_span = config_.max_link_distance - config_.min_link_distance;
    const double strength_span = config_.max_link_strength - config_.min_link_strength;

    for (auto& link : graph_.links) {
        if (link.type == TopicLinkType::Gap) {
            link.distance = config_.max_link_distance;
            link.strength = config_.gap_strength_factor *
                            (config_.min_link_strength + link.weight * strength_span);
            continue;
        }
        double ratio = graph_.max_weight > 0.0 ? link.weight / graph_.max_weight : 0.0;
        link.distance = config_.max_link_distance - ratio * distance_span;
        link.strength = config_.min_link_strength + ratio * strength_span;
    }
}

void TopicLayout::apply_links() {
    for (const auto& link : graph_.links) {
        auto& s = graph_.nodes[link.source];
        auto& t = graph_.nodes[link.target];

        Vec2 delta = (t.position + t.velocity) - (s.position + s.velocity);
        double dist = delta.length();
        if (dist < 1e-9) {
            delta = jitter(link.source * 13 + link.target) * 1e-2;
            dist = delta.length();
        }

        double bias = static_cast<double>(s.degree) / std::max(1, s.degree + t.degree);
        double l = (dist - link.distance) / dist * alpha_ * link.strength;
        Vec2 correction = delta * l;
        t.velocity -= correction * bias;
        s.velocity += correction * (1.0 - bias);
    }
}

void TopicLayout::apply_charge() {
    const double max_size = std::max(1, graph_.max_size);

    for (size_t i = 0; i < graph_.nodes.size(); ++i) {
        for (size_t j = i + 1; j < graph_.nodes.size(); ++j) {
            auto& a = graph_.nodes[i];
            auto& b = graph_.nodes[j];

            Vec2 delta = b.position - a.position;
            double dist_sq = delta.length_sq();
            if (dist_sq < 1e-12) {
                delta = jitter(i * 7 + j) * 1e-2;
                dist_sq = delta.length_sq();
            }
            dist_sq = std::max(dist_sq, 1.0);

            // Larger clusters push harder
            double charge_a = config_.charge_strength * (0.5 + 0.5 * a.size / max_size);
            double charge_b = config_.charge_strength * (0.5 + 0.5 * b.size / max_size);

            b.velocity += delta * (charge_a * alpha_ / dist_sq);
            a.velocity -= delta * (charge_b * alpha_ / dist_sq);
        }
    }
}

void TopicLayout::apply_gravity() {
    const Vec2 c = center();
    const double k = config_.gravity_strength * alpha_;
    for (auto& node : graph_.nodes) {
        node.velocity += (c - node.position) * k;
    }
}

void TopicLayout::integrate() {
    for (auto& node : graph_.nodes) {
        if (node.fixed.has_value()) {
            node.position = node.fixed.value();
            node.velocity = Vec2{};
            continue;
        }
        node.velocity = node.velocity * config_.velocity_retention;
        node.position += node.velocity;
    }
}

void TopicLayout::resolve_collisions() {
    for (int pass = 0; pass < config_.collision_iterations; ++pass) {
        for (size_t i = 0; i < graph_.nodes.size(); ++i) {
            for (size_t j = i + 1; j < graph_.nodes.size(); ++j) {
                auto& a = graph_.nodes[i];
                auto& b = graph_.nodes[j];

                double min_dist = a.collision_radius + b.collision_radius;
                Vec2 delta = b.position - a.position;
                double dist = delta.length();
                if (dist >= min_dist) {
                    continue;
                }
                if (dist < 1e-9) {
                    delta = jitter(i * 7 + j);
                    dist = delta.length();
                }

                double overlap = (min_dist - dist) / dist * config_.collision_strength;
                bool a_fixed = a.fixed.has_value();
                bool b_fixed = b.fixed.has_value();
                if (a_fixed && b_fixed) {
                    continue;
                }

                // The smaller node moves more
                double ra = a.collision_radius * a.collision_radius;
                double rb = b.collision_radius * b.collision_radius;
                double share_b = a_fixed ? 1.0 : (b_fixed ? 0.0 : ra / (ra + rb));

                b.position += delta * (overlap * share_b);
                a.position -= delta * (overlap * (1.0 - share_b));
            }
        }
    }
}

void TopicLayout::clamp_to_canvas() {
    const double min_x = config_.padding;
    const double max_x = std::max(min_x, config_.width - config_.padding);
    const double min_y = config_.padding;
    const double max_y = std::max(min_y, config_.height - config_.padding);

    for (auto& node : graph_.nodes) {
        if (!node.position.is_finite()) {
            continue;
        }
        node.position.x = std::clamp(node.position.x, min_x, max_x);
        node.position.y = std::clamp(node.position.y, min_y, max_y);
    }
}

void TopicLayout::repair_non_finite() {
    const Vec2 c = center();
    size_t repaired_now = 0;

    for (size_t i = 0; i < graph_.nodes.size(); ++i) {
        auto& node = graph_.nodes[i];
        if (!node.position.is_finite() || !node.velocity.is_finite()) {
            node.position = c + jitter(i);
            node.velocity = Vec2{};
            ++repaired_now;
        }
    }

    if (repaired_now > 0) {
        repaired_ += repaired_now;
        if (config_.verbose) {
            std::cerr << "Warning: repaired " << repaired_now
                      << " non-finite topic positions at tick " << ticks_ << "\n";
        }
    }
}

void TopicLayout::update_members() {
    hull_builder_.begin_tick();

    for (auto& node : graph_.nodes) {
        const size_t count = node.member_ids.size();
        const double rx = node.width / 2.0;
        const double ry = node.height / 2.0;

        // Sunflower spiral inside the rectangle's inscribed ellipse
        for (size_t k = 0; k < count; ++k) {
            double t = std::sqrt((static_cast<double>(k) + 0.5) / static_cast<double>(count));
            double angle = static_cast<double>(k) * kGoldenAngle;
            Vec2 dot{node.position.x + t * rx * std::cos(angle),
                     node.position.y + t * ry * std::sin(angle)};
            node.member_positions[k] = dot;
            hull_builder_.add_point(node.cluster_id, dot);
        }
    }

    hulls_ = hull_builder_.build(hull_padding());
}

void TopicLayout::finish() {
    running_ = false;
    if (config_.verbose) {
        std::cout << "Topic simulation stabilized after " << ticks_ << " ticks ("
                  << graph_.nodes.size() << " clusters, " << graph_.links.size() << " links)\n";
    }
}

} // namespace kgviz
