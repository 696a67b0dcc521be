#include "kgviz/render/render_strategy.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace kgviz {

using json = nlohmann::json;

namespace {

json vec_json(const Vec3& v) {
    return json::array({v.x, v.y, v.z});
}

json vec_json(const Vec2& v) {
    return json::array({v.x, v.y});
}

std::string escape_xml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

std::vector<std::string> preview_names(const std::vector<std::string>& names, size_t limit) {
    std::vector<std::string> preview;
    for (const auto& name : names) {
        if (preview.size() >= limit) break;
        if (name.find_first_not_of(" \t\n\r") != std::string::npos) {
            preview.push_back(name);
        }
    }
    return preview;
}

} // namespace

// ============================================================================
// Scene
// ============================================================================

const SceneSphere* Scene::find_sphere(const std::string& node_id) const {
    for (const auto& s : spheres) {
        if (s.node_id == node_id) return &s;
    }
    return nullptr;
}

const SceneRect* Scene::find_rect(int cluster_id) const {
    for (const auto& r : rects) {
        if (r.cluster_id == cluster_id) return &r;
    }
    return nullptr;
}

const SceneLabel* Scene::find_label(const std::string& target_id) const {
    for (const auto& l : labels) {
        if (l.target_id == target_id) return &l;
    }
    return nullptr;
}

const SceneLine* Scene::find_line(const std::string& id) const {
    for (const auto& l : lines) {
        if (l.id == id) return &l;
    }
    return nullptr;
}

json Scene::to_json() const {
    json j;
    j["view_mode"] = to_string(view_mode);
    j["camera"] = camera.to_json();
    if (view_mode == ViewMode::Topic2D) {
        j["width"] = width;
        j["height"] = height;
    }

    j["hulls"] = json::array();
    for (const auto& hull : hulls) {
        json points = json::array();
        for (const auto& p : hull.points) points.push_back(vec_json(p));
        j["hulls"].push_back({
            {"cluster_id", hull.cluster_id},
            {"points", points},
            {"color", hull.color.to_hex()},
            {"fill_opacity", hull.fill_opacity},
            {"stroke_opacity", hull.stroke_opacity}
        });
    }

    j["lines"] = json::array();
    for (const auto& line : lines) {
        j["lines"].push_back({
            {"id", line.id},
            {"from", vec_json(line.from)},
            {"to", vec_json(line.to)},
            {"color", line.color.to_rgba()},
            {"width", line.width},
            {"opacity", line.opacity},
            {"dashed", line.dashed}
        });
    }

    j["spheres"] = json::array();
    for (const auto& sphere : spheres) {
        json layers = json::array();
        for (const auto& layer : sphere.visual.layers) layers.push_back(layer.to_json());
        j["spheres"].push_back({
            {"node_id", sphere.node_id},
            {"center", vec_json(sphere.center)},
            {"radius", sphere.visual.radius},
            {"color", sphere.visual.color.to_hex()},
            {"layers", layers}
        });
    }

    j["rects"] = json::array();
    for (const auto& rect : rects) {
        j["rects"].push_back({
            {"id", rect.id},
            {"cluster_id", rect.cluster_id},
            {"center", vec_json(rect.center)},
            {"width", rect.width},
            {"height", rect.height},
            {"color", rect.color.to_hex()},
            {"opacity", rect.opacity},
            {"scale", rect.scale},
            {"stroke_width", rect.stroke_width},
            {"state", rect.state}
        });
    }

    j["circles"] = json::array();
    for (const auto& circle : circles) {
        j["circles"].push_back({
            {"id", circle.id},
            {"center", vec_json(circle.center)},
            {"radius", circle.radius},
            {"color", circle.color.to_hex()},
            {"opacity", circle.opacity}
        });
    }

    j["labels"] = json::array();
    for (const auto& label : labels) {
        j["labels"].push_back({
            {"target_id", label.target_id},
            {"text", label.text},
            {"position", vec_json(label.position)},
            {"color", label.color.to_hex()},
            {"font_size", label.font_size},
            {"opacity", label.opacity}
        });
    }

    return j;
}

std::string Scene::to_svg() const {
    double min_x = 0.0, min_y = 0.0, view_w = width, view_h = height;

    if (view_mode == ViewMode::Graph3D || view_w <= 0.0 || view_h <= 0.0) {
        // Fit the projected spheres plus a margin
        double lo_x = std::numeric_limits<double>::max(), lo_y = lo_x;
        double hi_x = std::numeric_limits<double>::lowest(), hi_y = hi_x;
        for (const auto& s : spheres) {
            lo_x = std::min(lo_x, s.center.x - s.visual.radius);
            lo_y = std::min(lo_y, s.center.y - s.visual.radius);
            hi_x = std::max(hi_x, s.center.x + s.visual.radius);
            hi_y = std::max(hi_y, s.center.y + s.visual.radius);
        }
        if (spheres.empty()) {
            lo_x = lo_y = -100.0;
            hi_x = hi_y = 100.0;
        }
        min_x = lo_x - 40.0;
        min_y = lo_y - 40.0;
        view_w = (hi_x - lo_x) + 80.0;
        view_h = (hi_y - lo_y) + 80.0;
    }

    std::ostringstream svg;
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"" << min_x << " " << min_y
        << " " << view_w << " " << view_h << "\">\n";
    svg << "  <rect x=\"" << min_x << "\" y=\"" << min_y << "\" width=\"" << view_w
        << "\" height=\"" << view_h << "\" fill=\"" << colors::kBackground.to_hex() << "\"/>\n";

    for (const auto& hull : hulls) {
        svg << "  <path d=\"";
        for (size_t i = 0; i < hull.points.size(); ++i) {
            svg << (i == 0 ? "M" : "L") << hull.points[i].x << "," << hull.points[i].y;
        }
        svg << "Z\" fill=\"" << hull.color.to_hex() << "\" fill-opacity=\"" << hull.fill_opacity
            << "\" stroke=\"" << hull.color.to_hex() << "\" stroke-opacity=\"" << hull.stroke_opacity
            << "\" stroke-width=\"" << hull.stroke_width << "\" stroke-linejoin=\"round\"/>\n";
    }

    for (const auto& line : lines) {
        svg << "  <line x1=\"" << line.from.x << "\" y1=\"" << line.from.y << "\" x2=\""
            << line.to.x << "\" y2=\"" << line.to.y << "\" stroke=\"" << line.color.to_rgba()
            << "\" stroke-width=\"" << line.width << "\" opacity=\"" << line.opacity << "\"";
        if (line.dashed) {
            svg << " stroke-dasharray=\"8,4\"";
        }
        svg << "/>\n";
    }

    for (const auto& sphere : spheres) {
        // Halos first so the core stays on top
        for (auto it = sphere.visual.layers.rbegin(); it != sphere.visual.layers.rend(); ++it) {
            const auto& layer = *it;
            svg << "  <circle cx=\"" << sphere.center.x << "\" cy=\"" << sphere.center.y
                << "\" r=\"" << layer.radius << "\"";
            if (layer.kind == LayerKind::SelectionRing) {
                svg << " fill=\"none\" stroke=\"" << layer.color.to_hex() << "\" stroke-width=\""
                    << (layer.radius - layer.inner_radius) << "\" stroke-opacity=\"" << layer.opacity << "\"";
            } else {
                svg << " fill=\"" << layer.color.to_hex() << "\" fill-opacity=\"" << layer.opacity << "\"";
            }
            svg << "/>\n";
        }
    }

    for (const auto& rect : rects) {
        double w = rect.width * rect.scale;
        double h = rect.height * rect.scale;
        svg << "  <rect x=\"" << rect.center.x - w / 2.0 << "\" y=\"" << rect.center.y - h / 2.0
            << "\" width=\"" << w << "\" height=\"" << h << "\" rx=\"" << rect.corner_radius
            << "\" ry=\"" << rect.corner_radius << "\" fill=\"" << rect.color.to_hex()
            << "\" fill-opacity=\"" << rect.fill_opacity << "\" stroke=\"" << rect.color.to_hex()
            << "\" stroke-width=\"" << rect.stroke_width << "\" opacity=\"" << rect.opacity << "\"/>\n";
    }

    for (const auto& circle : circles) {
        svg << "  <circle cx=\"" << circle.center.x << "\" cy=\"" << circle.center.y << "\" r=\""
            << circle.radius << "\" fill=\"" << circle.color.to_hex() << "\" opacity=\""
            << circle.opacity << "\"/>\n";
    }

    for (const auto& label : labels) {
        svg << "  <text x=\"" << label.position.x << "\" y=\"" << label.position.y
            << "\" text-anchor=\"middle\" dominant-baseline=\"middle\" fill=\"" << label.color.to_hex()
            << "\" font-size=\"" << label.font_size << "px\" font-family=\"monospace\"";
        if (label.bold) {
            svg << " font-weight=\"bold\"";
        }
        svg << " opacity=\"" << label.opacity << "\">" << escape_xml(label.text) << "</text>\n";
    }

    svg << "</svg>\n";
    return svg.str();
}

// ============================================================================
// NodeSphereStrategy
// ============================================================================

Scene NodeSphereStrategy::render(const RenderContext& context) const {
    Scene scene;
    scene.view_mode = ViewMode::Graph3D;
    scene.camera = context.camera;

    if (!context.layout) {
        return scene;
    }

    const auto& hovered = context.coordinator.hovered_node();

    for (const auto& node : context.graph.nodes) {
        if (!context.lod.is_visible(node.id)) continue;
        auto position = context.layout->position_of(node.id);
        if (!position) continue;

        bool is_hovered = hovered && *hovered == node.id;

        NodeStyleInput input;
        input.color_key = node.color_key;
        input.entity_type = node.entity_type;
        input.centrality = node.centrality;
        input.is_bridge = node.is_bridge;
        input.is_highlighted = node.is_highlighted;
        input.is_hovered = is_hovered;

        SceneSphere sphere;
        sphere.node_id = node.id;
        sphere.center = *position;
        sphere.visual = context.encoder.encode_node(input);

        if (context.labels.should_label(node.centrality, is_hovered, node.name)) {
            SceneLabel label;
            label.target_id = node.id;
            label.text = LabelPolicy::truncate(node.name);
            label.position = *position + Vec3{0.0, sphere.visual.radius + 8.0, 0.0};
            label.color = node.is_highlighted ? colors::kHighlight : colors::kWhite;
            label.font_size = 14.0;
            scene.labels.push_back(std::move(label));
        }

        scene.spheres.push_back(std::move(sphere));
    }

    for (const auto& edge : context.graph.edges) {
        if (!context.lod.is_edge_visible(edge.source, edge.target)) continue;
        auto from = context.layout->position_of(edge.source);
        auto to = context.layout->position_of(edge.target);
        if (!from || !to) continue;

        SceneLine line;
        line.id = edge.id;
        line.from = *from;
        line.to = *to;
        line.color = context.encoder.edge_color(edge.style_input());
        line.width = edge.width_weight;
        line.dashed = edge.is_ghost;
        scene.lines.push_back(std::move(line));
    }

    return scene;
}

// ============================================================================
// ClusterRectStrategy
// ============================================================================

Scene ClusterRectStrategy::render(const RenderContext& context) const {
    Scene scene;
    scene.view_mode = ViewMode::Topic2D;
    scene.camera = context.camera;

    if (!context.topic) {
        return scene;
    }

    const TopicLayout& topic = *context.topic;
    const auto& coordinator = context.coordinator;
    scene.width = topic.config().width;
    scene.height = topic.config().height;

    std::unordered_map<std::string, const RenderNode*> adapted;
    for (const auto& node : context.graph.nodes) {
        adapted.emplace(node.id, &node);
    }

    for (const auto& hull : topic.hulls()) {
        const TopicNode* node = topic.graph().find_node(hull.cluster_id);
        if (!node) continue;

        ScenePolygon polygon;
        polygon.cluster_id = hull.cluster_id;
        polygon.points = hull.polygon;
        polygon.color = cluster_color(node->color_key);
        double opacity = cluster_hover_style(coordinator.cluster_state(hull.cluster_id)).opacity;
        polygon.fill_opacity *= opacity;
        polygon.stroke_opacity *= opacity;
        scene.hulls.push_back(std::move(polygon));
    }

    for (const auto& link : topic.links()) {
        const auto& s = topic.nodes()[link.source];
        const auto& t = topic.nodes()[link.target];

        SceneLine line;
        line.id = link.id;
        line.from = Vec3{s.position.x, s.position.y, 0.0};
        line.to = Vec3{t.position.x, t.position.y, 0.0};
        if (link.is_gap) {
            line.color = colors::kGhost;
            line.width = 2.0;
            line.opacity = 0.8;
            line.dashed = true;
        } else {
            line.color = colors::kWhite.with_alpha(0.3);
            line.width = std::min(std::max(link.weight, 1.0), 5.0);
            line.opacity = 0.5;
        }
        line.opacity *= coordinator.link_opacity(link.source_cluster, link.target_cluster);
        scene.lines.push_back(std::move(line));
    }

    for (const auto& node : topic.nodes()) {
        ClusterHoverState state = coordinator.cluster_state(node.cluster_id);
        ClusterHoverStyle style = cluster_hover_style(state);
        Color color = cluster_color(node.color_key);

        SceneRect rect;
        rect.id = node.id;
        rect.cluster_id = node.cluster_id;
        rect.center = node.position;
        rect.width = node.width;
        rect.height = node.height;
        rect.color = color;
        rect.stroke_width = style.border_width;
        rect.opacity = style.opacity;
        rect.scale = style.scale;
        rect.state = to_string(state);
        scene.rects.push_back(rect);

        // Concept dots, subject to the node-level LOD and filters
        for (size_t k = 0; k < node.member_ids.size(); ++k) {
            const auto& member = node.member_ids[k];
            if (!context.lod.is_visible(member)) continue;
            auto render = adapted.find(member);
            if (render == adapted.end()) continue;

            SceneCircle dot;
            dot.id = member;
            dot.center = node.member_positions[k];
            dot.radius = topic.config().member_radius;
            dot.color = render->second->is_highlighted ? colors::kHighlight : color;
            dot.opacity = 0.6 * style.opacity;
            scene.circles.push_back(std::move(dot));
        }

        if (!style.show_label) continue;

        SceneLabel title;
        title.target_id = node.id;
        title.text = LabelPolicy::truncate_topic(node.label);
        title.position = Vec3{node.position.x, node.position.y, 0.0};
        title.color = color;
        title.font_size = 16.0;
        title.bold = true;
        title.opacity = style.opacity;
        scene.labels.push_back(title);

        SceneLabel count;
        count.target_id = node.id + "/size";
        count.text = std::to_string(node.size) + " concepts";
        count.position = Vec3{node.position.x, node.position.y + 18.0, 0.0};
        count.color = colors::kWhite;
        count.font_size = 11.0;
        count.opacity = 0.6 * style.opacity;
        scene.labels.push_back(count);

        if (state == ClusterHoverState::Focused) {
            auto names = preview_names(node.concept_names, 3);
            if (!names.empty()) {
                std::string text = names[0];
                for (size_t i = 1; i < names.size(); ++i) text += ", " + names[i];

                SceneLabel preview;
                preview.target_id = node.id + "/preview";
                preview.text = text;
                preview.position = Vec3{node.position.x, node.position.y + 32.0, 0.0};
                preview.color = colors::kWhite;
                preview.font_size = 9.0;
                preview.opacity = 0.4;
                scene.labels.push_back(preview);
            }
        }
    }

    return scene;
}

std::unique_ptr<RenderStrategy> make_render_strategy(ViewMode mode) {
    switch (mode) {
        case ViewMode::Graph3D:
            return std::make_unique<NodeSphereStrategy>();
        case ViewMode::Topic2D:
            return std::make_unique<ClusterRectStrategy>();
    }
    return std::make_unique<NodeSphereStrategy>();
}

} // namespace kgviz
