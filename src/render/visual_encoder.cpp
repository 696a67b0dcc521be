#include "kgviz/render/visual_encoder.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>

namespace kgviz {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

double sanitize(double value) {
    return std::isfinite(value) && value > 0.0 ? value : 0.0;
}

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t code_point_count(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (!is_continuation(c)) ++count;
    }
    return count;
}

// Byte offset of the first `count` code points.
size_t code_point_prefix(const std::string& text, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_continuation(text[i])) continue;
        if (seen == count) return i;
        ++seen;
    }
    return text.size();
}

} // namespace

// ============================================================================
// Color
// ============================================================================

Color Color::from_hex(const std::string& hex) {
    if (hex.size() != 7 || hex[0] != '#') {
        throw std::invalid_argument("Invalid hex color: " + hex);
    }

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(hex[1 + 2 * i]);
        int lo = hex_digit(hex[2 + 2 * i]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex color: " + hex);
        }
        channels[i] = hi * 16 + lo;
    }

    Color c;
    c.r = static_cast<uint8_t>(channels[0]);
    c.g = static_cast<uint8_t>(channels[1]);
    c.b = static_cast<uint8_t>(channels[2]);
    return c;
}

std::string Color::to_hex() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", r, g, b);
    return buffer;
}

std::string Color::to_rgba() const {
    std::ostringstream out;
    out << "rgba(" << static_cast<int>(r) << ", " << static_cast<int>(g) << ", "
        << static_cast<int>(b) << ", " << a << ")";
    return out.str();
}

Color Color::with_alpha(double alpha) const {
    Color c = *this;
    c.a = std::isfinite(alpha) ? std::clamp(alpha, 0.0, 1.0) : 1.0;
    return c;
}

Color blend(const Color& a, const Color& b, double ratio) {
    ratio = std::isfinite(ratio) ? std::clamp(ratio, 0.0, 1.0) : 0.5;
    auto mix = [ratio](uint8_t x, uint8_t y) {
        return static_cast<uint8_t>(std::lround(x * (1.0 - ratio) + y * ratio));
    };

    Color c;
    c.r = mix(a.r, b.r);
    c.g = mix(a.g, b.g);
    c.b = mix(a.b, b.b);
    c.a = a.a * (1.0 - ratio) + b.a * ratio;
    return c;
}

namespace colors {

const std::vector<Color>& cluster_palette() {
    static const std::vector<Color> palette = {
        Color::from_hex("#FF6B6B"),   // Coral red
        Color::from_hex("#4ECDC4"),   // Turquoise
        Color::from_hex("#45B7D1"),   // Sky blue
        Color::from_hex("#96CEB4"),   // Sage green
        Color::from_hex("#FFEAA7"),   // Soft yellow
        Color::from_hex("#DDA0DD"),   // Plum
        Color::from_hex("#98D8C8"),   // Mint
        Color::from_hex("#F7DC6F"),   // Gold
        Color::from_hex("#BB8FCE"),   // Lavender
        Color::from_hex("#85C1E9"),   // Light blue
        Color::from_hex("#F8B500"),   // Amber
        Color::from_hex("#82E0AA"),   // Light green
    };
    return palette;
}

std::optional<Color> entity_type_color(const std::string& entity_type) {
    static const std::map<std::string, Color> by_type = {
        {"Paper", Color::from_hex("#6366F1")},
        {"Author", Color::from_hex("#A855F7")},
        {"Concept", Color::from_hex("#8B5CF6")},
        {"Method", Color::from_hex("#F59E0B")},
        {"Finding", Color::from_hex("#10B981")},
        {"Problem", Color::from_hex("#EF4444")},
        {"Dataset", Color::from_hex("#3B82F6")},
        {"Metric", Color::from_hex("#EC4899")},
        {"Innovation", Color::from_hex("#14B8A6")},
        {"Limitation", Color::from_hex("#F97316")},
        {"Result", Color::from_hex("#EF4444")},
        {"Claim", Color::from_hex("#EC4899")},
    };

    auto it = by_type.find(entity_type);
    if (it == by_type.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace colors

uint32_t fnv1a_hash(const std::string& text) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

Color cluster_color(const std::string& color_key) {
    const auto& palette = colors::cluster_palette();
    return palette[fnv1a_hash(color_key) % palette.size()];
}

// ============================================================================
// Sizing
// ============================================================================

double node_radius(double centrality, bool is_bridge) {
    double radius = sizing::kNodeBase + std::sqrt(sanitize(centrality) * 100.0) * sizing::kNodeScale;
    if (is_bridge) {
        radius += sizing::kBridgeBoost;
    }
    return radius;
}

double cluster_radius(int concept_count) {
    return sizing::kClusterBase +
           std::sqrt(sanitize(static_cast<double>(concept_count))) * sizing::kClusterScale;
}

// ============================================================================
// Layers
// ============================================================================

std::string to_string(LayerKind kind) {
    switch (kind) {
        case LayerKind::Core: return "core";
        case LayerKind::Bloom: return "bloom";
        case LayerKind::BridgeHalo: return "bridge_halo";
        case LayerKind::SelectionRing: return "selection_ring";
    }
    return "core";
}

nlohmann::json VisualLayer::to_json() const {
    nlohmann::json j;
    j["kind"] = to_string(kind);
    j["radius"] = radius;
    if (kind == LayerKind::SelectionRing) {
        j["inner_radius"] = inner_radius;
    }
    j["color"] = color.to_hex();
    j["opacity"] = opacity;
    if (kind == LayerKind::Core) {
        j["emissive"] = emissive;
    }
    return j;
}

const VisualLayer* NodeVisual::layer(LayerKind kind) const {
    for (const auto& l : layers) {
        if (l.kind == kind) {
            return &l;
        }
    }
    return nullptr;
}

// ============================================================================
// Edges
// ============================================================================

std::string to_string(EdgeColorKind kind) {
    switch (kind) {
        case EdgeColorKind::Highlighted: return "highlighted";
        case EdgeColorKind::Ghost: return "ghost";
        case EdgeColorKind::IntraCluster: return "intra_cluster";
        case EdgeColorKind::CrossCluster: return "cross_cluster";
        case EdgeColorKind::Neutral: return "neutral";
    }
    return "neutral";
}

EdgeColorKind EdgeStyleInput::kind() const {
    if (is_ghost) return EdgeColorKind::Ghost;
    if (is_highlighted) return EdgeColorKind::Highlighted;
    if (source_cluster && target_cluster) {
        return *source_cluster == *target_cluster ? EdgeColorKind::IntraCluster
                                                  : EdgeColorKind::CrossCluster;
    }
    return EdgeColorKind::Neutral;
}

// ============================================================================
// LabelPolicy
// ============================================================================

LabelPolicy::LabelPolicy(LabelVisibility mode, const std::vector<CentralityMetric>& centrality)
    : mode_(mode) {
    if (centrality.empty()) {
        return;
    }

    std::vector<double> values;
    values.reserve(centrality.size());
    for (const auto& metric : centrality) {
        values.push_back(sanitize(metric.betweenness));
    }
    std::sort(values.begin(), values.end(), std::greater<double>());

    size_t top = static_cast<size_t>(std::floor(values.size() * 0.2));
    threshold_ = values[std::min(top, values.size() - 1)];
    has_centrality_ = true;
}

bool LabelPolicy::should_label(double centrality, bool is_hovered, const std::string& name) const {
    if (name.empty()) {
        return false;
    }
    if (is_hovered) {
        return true;
    }

    switch (mode_) {
        case LabelVisibility::All:
            return true;
        case LabelVisibility::Hidden:
            return false;
        case LabelVisibility::Important:
            // No centrality data: fail open
            return !has_centrality_ || sanitize(centrality) >= threshold_;
    }
    return true;
}

std::string LabelPolicy::truncate(const std::string& name) {
    if (code_point_count(name) <= kMaxLength) {
        return name;
    }
    return name.substr(0, code_point_prefix(name, kMaxLength - 3)) + "...";
}

std::string LabelPolicy::truncate_topic(const std::string& label) {
    if (code_point_count(label) <= kTopicMaxLength) {
        return label;
    }
    return label.substr(0, code_point_prefix(label, kTopicMaxLength)) + "...";
}

// ============================================================================
// VisualEncoder
// ============================================================================

VisualEncoder::VisualEncoder(BloomConfig bloom)
    : bloom_(bloom.clamped()) {}

Color VisualEncoder::node_color(const NodeStyleInput& input) const {
    if (input.is_highlighted) {
        return colors::kHighlight;
    }
    if (!input.color_key.empty()) {
        return cluster_color(input.color_key);
    }
    return colors::entity_type_color(input.entity_type).value_or(colors::kNeutral);
}

double VisualEncoder::core_emissive(bool highlighted) const {
    if (bloom_.enabled) {
        return highlighted ? 0.4 + bloom_.intensity * 0.6
                           : 0.15 + bloom_.intensity * 0.45;
    }
    return highlighted ? 0.6 : 0.2;
}

NodeVisual VisualEncoder::encode_node(const NodeStyleInput& input) const {
    NodeVisual visual;
    visual.color = node_color(input);
    visual.radius = node_radius(input.centrality, input.is_bridge);

    const double size = visual.radius;
    const double i = bloom_.intensity;

    VisualLayer core;
    core.kind = LayerKind::Core;
    core.radius = size;
    core.color = visual.color;
    core.opacity = input.is_highlighted || input.is_hovered ? 1.0 : 0.85;
    core.emissive = core_emissive(input.is_highlighted);
    visual.layers.push_back(core);

    if (bloom_.enabled) {
        VisualLayer glow;
        glow.kind = LayerKind::Bloom;
        glow.radius = size * bloom_.glow_size;
        glow.color = visual.color;
        glow.opacity = 0.08 + i * 0.12;
        visual.layers.push_back(glow);
    }

    if (input.is_bridge) {
        VisualLayer halo;
        halo.kind = LayerKind::BridgeHalo;
        halo.radius = bloom_.enabled ? size * bloom_.glow_size * 1.2 : size * 1.4;
        halo.color = colors::kHighlight;
        halo.opacity = bloom_.enabled ? 0.15 + i * 0.15 : 0.2;
        visual.layers.push_back(halo);
    }

    if (input.is_highlighted) {
        VisualLayer ring;
        ring.kind = LayerKind::SelectionRing;
        ring.inner_radius = bloom_.enabled ? size * bloom_.glow_size * 0.95 : size * 1.3;
        ring.radius = ring.inner_radius + size * 0.2;
        ring.color = colors::kHighlight;
        ring.opacity = bloom_.enabled ? 0.4 + i * 0.3 : 0.6;
        visual.layers.push_back(ring);
    }

    return visual;
}

Color VisualEncoder::edge_color(const EdgeStyleInput& input) const {
    switch (input.kind()) {
        case EdgeColorKind::Ghost: {
            double similarity = std::isfinite(input.similarity)
                                    ? std::clamp(input.similarity, 0.0, 1.0) : 0.5;
            return colors::kGhost.with_alpha(0.4 + similarity * 0.4);
        }
        case EdgeColorKind::Highlighted:
            return colors::kHighlight.with_alpha(0.8);
        case EdgeColorKind::IntraCluster:
            return cluster_color(input.source_color_key).with_alpha(0.35);
        case EdgeColorKind::CrossCluster:
            return blend(cluster_color(input.source_color_key),
                         cluster_color(input.target_color_key), 0.5).with_alpha(0.35);
        case EdgeColorKind::Neutral:
            break;
    }
    return colors::kWhite.with_alpha(0.15);
}

} // namespace kgviz
