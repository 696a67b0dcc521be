#include "kgviz/config/engine_config.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kgviz {

// ============================================================================
// Enum names
// ============================================================================

std::string to_string(ViewMode mode) {
    return mode == ViewMode::Topic2D ? "topic" : "3d";
}

std::string to_string(LabelVisibility mode) {
    switch (mode) {
        case LabelVisibility::Hidden: return "none";
        case LabelVisibility::Important: return "important";
        case LabelVisibility::All: return "all";
    }
    return "important";
}

std::string to_string(DetailLevel level) {
    switch (level) {
        case DetailLevel::All: return "all";
        case DetailLevel::Important: return "important";
        case DetailLevel::Key: return "key";
        case DetailLevel::Hub: return "hub";
    }
    return "all";
}

ViewMode view_mode_from_string(const std::string& name) {
    if (name == "3d" || name == "graph") return ViewMode::Graph3D;
    if (name == "topic" || name == "2d") return ViewMode::Topic2D;
    throw std::invalid_argument("Unknown view mode: " + name);
}

LabelVisibility label_visibility_from_string(const std::string& name) {
    if (name == "none" || name == "hidden") return LabelVisibility::Hidden;
    if (name == "important") return LabelVisibility::Important;
    if (name == "all") return LabelVisibility::All;
    throw std::invalid_argument("Unknown label visibility: " + name);
}

DetailLevel detail_level_from_string(const std::string& name) {
    if (name == "all") return DetailLevel::All;
    if (name == "important") return DetailLevel::Important;
    if (name == "key") return DetailLevel::Key;
    if (name == "hub") return DetailLevel::Hub;
    throw std::invalid_argument("Unknown detail level: " + name);
}

LabelVisibility next_label_visibility(LabelVisibility mode) {
    switch (mode) {
        case LabelVisibility::Hidden: return LabelVisibility::Important;
        case LabelVisibility::Important: return LabelVisibility::All;
        case LabelVisibility::All: return LabelVisibility::Hidden;
    }
    return LabelVisibility::Important;
}

// ============================================================================
// LodConfig / BloomConfig
// ============================================================================

LodConfig LodConfig::from_detail_level(DetailLevel level, bool enabled) {
    LodConfig config;
    config.enabled = enabled;
    switch (level) {
        case DetailLevel::All: config.visible_fraction = 1.0; break;
        case DetailLevel::Important: config.visible_fraction = 0.75; break;
        case DetailLevel::Key: config.visible_fraction = 0.5; break;
        case DetailLevel::Hub: config.visible_fraction = 0.25; break;
    }
    return config;
}

double LodConfig::effective_fraction() const {
    if (!enabled || std::isnan(visible_fraction)) {
        return 1.0;
    }
    return std::clamp(visible_fraction, 0.0, 1.0);
}

BloomConfig BloomConfig::clamped() const {
    BloomConfig c = *this;
    c.intensity = std::isfinite(intensity) ? std::clamp(intensity, 0.0, 1.0) : 0.5;
    c.glow_size = std::isfinite(glow_size) ? std::clamp(glow_size, 1.0, 2.0) : 1.3;
    return c;
}

// ============================================================================
// RenderConfig
// ============================================================================

json RenderConfig::to_json() const {
    json j;
    j["lod_enabled"] = lod.enabled;
    j["lod_visible_fraction"] = lod.visible_fraction;
    j["label_visibility"] = to_string(label_visibility);
    j["bloom_enabled"] = bloom.enabled;
    j["bloom_intensity"] = bloom.intensity;
    j["glow_size"] = bloom.glow_size;
    j["show_ghost_edges"] = show_ghost_edges;
    j["visible_entity_types"] = visible_entity_types;
    j["sliced_node_ids"] = sliced_node_ids;
    return j;
}

RenderConfig RenderConfig::from_json(const json& j) {
    RenderConfig config;

    if (j.contains("lod_enabled")) config.lod.enabled = j["lod_enabled"];
    if (j.contains("detail_level")) {
        config.lod = LodConfig::from_detail_level(
            detail_level_from_string(j["detail_level"].get<std::string>()), config.lod.enabled);
    }
    if (j.contains("lod_visible_fraction")) config.lod.visible_fraction = j["lod_visible_fraction"];

    if (j.contains("label_visibility")) {
        config.label_visibility = label_visibility_from_string(j["label_visibility"].get<std::string>());
    }

    if (j.contains("bloom_enabled")) config.bloom.enabled = j["bloom_enabled"];
    if (j.contains("bloom_intensity")) config.bloom.intensity = j["bloom_intensity"];
    if (j.contains("glow_size")) config.bloom.glow_size = j["glow_size"];

    if (j.contains("show_ghost_edges")) config.show_ghost_edges = j["show_ghost_edges"];
    if (j.contains("visible_entity_types")) {
        config.visible_entity_types = j["visible_entity_types"].get<std::set<std::string>>();
    }
    if (j.contains("sliced_node_ids")) {
        config.sliced_node_ids = j["sliced_node_ids"].get<std::set<std::string>>();
    }

    return config;
}

// ============================================================================
// LayoutConfig
// ============================================================================

json LayoutConfig::to_json() const {
    json j;
    j["repulsion_strength"] = repulsion_strength;
    j["min_repulsion_distance"] = min_repulsion_distance;
    j["link_distance"] = link_distance;
    j["link_strength"] = link_strength;
    j["centering_strength"] = centering_strength;
    j["velocity_retention"] = velocity_retention;
    j["max_speed"] = max_speed;
    j["alpha_start"] = alpha_start;
    j["alpha_decay"] = alpha_decay;
    j["alpha_min"] = alpha_min;
    j["cooldown_ticks"] = cooldown_ticks;
    j["warmup_ticks"] = warmup_ticks;
    j["ticks_per_frame"] = ticks_per_frame;
    j["initial_radius"] = initial_radius;
    j["seed"] = seed;
    return j;
}

LayoutConfig LayoutConfig::from_json(const json& j) {
    LayoutConfig config;
    if (j.contains("repulsion_strength")) config.repulsion_strength = j["repulsion_strength"];
    if (j.contains("min_repulsion_distance")) config.min_repulsion_distance = j["min_repulsion_distance"];
    if (j.contains("link_distance")) config.link_distance = j["link_distance"];
    if (j.contains("link_strength")) config.link_strength = j["link_strength"];
    if (j.contains("centering_strength")) config.centering_strength = j["centering_strength"];
    if (j.contains("velocity_retention")) config.velocity_retention = j["velocity_retention"];
    if (j.contains("max_speed")) config.max_speed = j["max_speed"];
    if (j.contains("alpha_start")) config.alpha_start = j["alpha_start"];
    if (j.contains("alpha_decay")) config.alpha_decay = j["alpha_decay"];
    if (j.contains("alpha_min")) config.alpha_min = j["alpha_min"];
    if (j.contains("cooldown_ticks")) config.cooldown_ticks = j["cooldown_ticks"];
    if (j.contains("warmup_ticks")) config.warmup_ticks = j["warmup_ticks"];
    if (j.contains("ticks_per_frame")) config.ticks_per_frame = j["ticks_per_frame"];
    if (j.contains("initial_radius")) config.initial_radius = j["initial_radius"];
    if (j.contains("seed")) config.seed = j["seed"];
    return config;
}

// ============================================================================
// TopicLayoutConfig
// ============================================================================

json TopicLayoutConfig::to_json() const {
    json j;
    j["width"] = width;
    j["height"] = height;
    j["padding"] = padding;
    j["min_link_distance"] = min_link_distance;
    j["max_link_distance"] = max_link_distance;
    j["min_link_strength"] = min_link_strength;
    j["max_link_strength"] = max_link_strength;
    j["gap_strength_factor"] = gap_strength_factor;
    j["gravity_strength"] = gravity_strength;
    j["charge_strength"] = charge_strength;
    j["collision_padding"] = collision_padding;
    j["collision_iterations"] = collision_iterations;
    j["collision_strength"] = collision_strength;
    j["min_node_width"] = min_node_width;
    j["max_node_width"] = max_node_width;
    j["node_aspect"] = node_aspect;
    j["hull_margin"] = hull_margin;
    j["member_radius"] = member_radius;
    j["velocity_retention"] = velocity_retention;
    j["alpha_start"] = alpha_start;
    j["alpha_decay"] = alpha_decay;
    j["alpha_min"] = alpha_min;
    j["max_ticks"] = max_ticks;
    j["ticks_per_frame"] = ticks_per_frame;
    j["seed"] = seed;
    return j;
}

TopicLayoutConfig TopicLayoutConfig::from_json(const json& j) {
    TopicLayoutConfig config;
    if (j.contains("width")) config.width = j["width"];
    if (j.contains("height")) config.height = j["height"];
    if (j.contains("padding")) config.padding = j["padding"];
    if (j.contains("min_link_distance")) config.min_link_distance = j["min_link_distance"];
    if (j.contains("max_link_distance")) config.max_link_distance = j["max_link_distance"];
    if (j.contains("min_link_strength")) config.min_link_strength = j["min_link_strength"];
    if (j.contains("max_link_strength")) config.max_link_strength = j["max_link_strength"];
    if (j.contains("gap_strength_factor")) config.gap_strength_factor = j["gap_strength_factor"];
    if (j.contains("gravity_strength")) config.gravity_strength = j["gravity_strength"];
    if (j.contains("charge_strength")) config.charge_strength = j["charge_strength"];
    if (j.contains("collision_padding")) config.collision_padding = j["collision_padding"];
    if (j.contains("collision_iterations")) config.collision_iterations = j["collision_iterations"];
    if (j.contains("collision_strength")) config.collision_strength = j["collision_strength"];
    if (j.contains("min_node_width")) config.min_node_width = j["min_node_width"];
    if (j.contains("max_node_width")) config.max_node_width = j["max_node_width"];
    if (j.contains("node_aspect")) config.node_aspect = j["node_aspect"];
    if (j.contains("hull_margin")) config.hull_margin = j["hull_margin"];
    if (j.contains("member_radius")) config.member_radius = j["member_radius"];
    if (j.contains("velocity_retention")) config.velocity_retention = j["velocity_retention"];
    if (j.contains("alpha_start")) config.alpha_start = j["alpha_start"];
    if (j.contains("alpha_decay")) config.alpha_decay = j["alpha_decay"];
    if (j.contains("alpha_min")) config.alpha_min = j["alpha_min"];
    if (j.contains("max_ticks")) config.max_ticks = j["max_ticks"];
    if (j.contains("ticks_per_frame")) config.ticks_per_frame = j["ticks_per_frame"];
    if (j.contains("seed")) config.seed = j["seed"];
    return config;
}

// ============================================================================
// CameraConfig
// ============================================================================

json CameraConfig::to_json() const {
    json j;
    j["transition_ms"] = transition_ms;
    j["node_standoff"] = node_standoff;
    j["cluster_standoff"] = cluster_standoff;
    j["gap_standoff"] = gap_standoff;
    j["default_distance"] = default_distance;
    return j;
}

CameraConfig CameraConfig::from_json(const json& j) {
    CameraConfig config;
    if (j.contains("transition_ms")) config.transition_ms = j["transition_ms"];
    if (j.contains("node_standoff")) config.node_standoff = j["node_standoff"];
    if (j.contains("cluster_standoff")) config.cluster_standoff = j["cluster_standoff"];
    if (j.contains("gap_standoff")) config.gap_standoff = j["gap_standoff"];
    if (j.contains("default_distance")) config.default_distance = j["default_distance"];
    return config;
}

// ============================================================================
// EngineConfig
// ============================================================================

json EngineConfig::to_json() const {
    json j;
    j["view_mode"] = to_string(view_mode);
    j["verbose"] = verbose;
    j["render"] = render.to_json();
    j["layout"] = layout.to_json();
    j["topic"] = topic.to_json();
    j["camera"] = camera.to_json();
    return j;
}

void EngineConfig::set_verbose(bool enabled) {
    verbose = enabled;
    layout.verbose = enabled;
    topic.verbose = enabled;
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;
    if (j.contains("view_mode")) config.view_mode = view_mode_from_string(j["view_mode"].get<std::string>());
    if (j.contains("verbose")) config.verbose = j["verbose"];
    if (j.contains("render")) config.render = RenderConfig::from_json(j["render"]);
    if (j.contains("layout")) config.layout = LayoutConfig::from_json(j["layout"]);
    if (j.contains("topic")) config.topic = TopicLayoutConfig::from_json(j["topic"]);
    if (j.contains("camera")) config.camera = CameraConfig::from_json(j["camera"]);

    config.set_verbose(config.verbose);
    return config;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
        return from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    const char* view_mode = std::getenv("KGVIZ_VIEW_MODE");
    if (view_mode) config.view_mode = view_mode_from_string(view_mode);

    const char* detail = std::getenv("KGVIZ_DETAIL_LEVEL");
    if (detail) config.render.lod = LodConfig::from_detail_level(detail_level_from_string(detail));

    const char* labels = std::getenv("KGVIZ_LABELS");
    if (labels) config.render.label_visibility = label_visibility_from_string(labels);

    const char* bloom = std::getenv("KGVIZ_BLOOM");
    if (bloom) config.render.bloom.enabled = std::string(bloom) == "1" || std::string(bloom) == "true";

    const char* intensity = std::getenv("KGVIZ_BLOOM_INTENSITY");
    if (intensity) config.render.bloom.intensity = std::atof(intensity);

    const char* verbose = std::getenv("KGVIZ_VERBOSE");
    if (verbose) config.verbose = std::string(verbose) == "1" || std::string(verbose) == "true";

    config.set_verbose(config.verbose);
    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    double fraction = render.lod.visible_fraction;
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        error_message = "LOD visible fraction must be between 0.0 and 1.0";
        return false;
    }

    if (!(render.bloom.intensity >= 0.0 && render.bloom.intensity <= 1.0)) {
        error_message = "Bloom intensity must be between 0.0 and 1.0";
        return false;
    }

    if (!(render.bloom.glow_size >= 1.0 && render.bloom.glow_size <= 2.0)) {
        error_message = "Glow size must be between 1.0 and 2.0";
        return false;
    }

    if (layout.cooldown_ticks <= 0 || topic.max_ticks <= 0) {
        error_message = "Simulation tick budgets must be positive";
        return false;
    }

    if (layout.warmup_ticks < 0 || layout.ticks_per_frame <= 0 || topic.ticks_per_frame <= 0) {
        error_message = "Warmup ticks must be >= 0 and ticks per frame > 0";
        return false;
    }

    if (layout.alpha_decay <= 0.0 || layout.alpha_decay >= 1.0 ||
        topic.alpha_decay <= 0.0 || topic.alpha_decay >= 1.0) {
        error_message = "Alpha decay must be in (0, 1)";
        return false;
    }

    if (layout.velocity_retention < 0.0 || layout.velocity_retention > 1.0 ||
        topic.velocity_retention < 0.0 || topic.velocity_retention > 1.0) {
        error_message = "Velocity retention must be between 0.0 and 1.0";
        return false;
    }

    if (topic.width <= 2.0 * topic.padding || topic.height <= 2.0 * topic.padding) {
        error_message = "Topic canvas must be larger than twice the padding";
        return false;
    }

    if (topic.min_link_distance > topic.max_link_distance) {
        error_message = "min_link_distance must not exceed max_link_distance";
        return false;
    }

    if (topic.min_link_strength > topic.max_link_strength) {
        error_message = "min_link_strength must not exceed max_link_strength";
        return false;
    }

    if (topic.collision_iterations < 1) {
        error_message = "Collision iterations must be at least 1";
        return false;
    }

    if (topic.min_node_width <= 0.0 || topic.max_node_width < topic.min_node_width) {
        error_message = "Invalid topic node width range";
        return false;
    }

    if (camera.transition_ms < 0.0) {
        error_message = "Camera transition duration must be >= 0";
        return false;
    }

    return true;
}

} // namespace kgviz
