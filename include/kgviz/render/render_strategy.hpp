#pragma once

#include "kgviz/camera/camera_controller.hpp"
#include "kgviz/config/engine_config.hpp"
#include "kgviz/interaction/highlight_coordinator.hpp"
#include "kgviz/layout/force_layout.hpp"
#include "kgviz/layout/topic_layout.hpp"
#include "kgviz/lod/lod_selector.hpp"
#include "kgviz/render/graph_adapter.hpp"
#include "kgviz/render/visual_encoder.hpp"
#include <memory>
#include <string>
#include <vector>

namespace kgviz {

// ============================================================================
// Draw list
// ============================================================================

struct SceneSphere {
    std::string node_id;
    Vec3 center;
    NodeVisual visual;
};

struct SceneLine {
    std::string id;
    Vec3 from;
    Vec3 to;
    Color color;
    double width = 1.0;
    double opacity = 1.0;
    bool dashed = false;
};

struct SceneRect {
    std::string id;
    int cluster_id = 0;
    Vec2 center;
    double width = 0.0;
    double height = 0.0;
    double corner_radius = 8.0;
    Color color;
    double fill_opacity = 0.15;
    double stroke_width = 2.0;
    double opacity = 1.0;
    double scale = 1.0;
    std::string state;                  // Cluster hover state
};

struct SceneCircle {
    std::string id;
    Vec2 center;
    double radius = 0.0;
    Color color;
    double opacity = 1.0;
};

struct ScenePolygon {
    int cluster_id = 0;
    std::vector<Vec2> points;
    Color color;
    double fill_opacity = 0.04;
    double stroke_opacity = 0.15;
    double stroke_width = 1.0;
};

struct SceneLabel {
    std::string target_id;
    std::string text;
    Vec3 position;
    Color color;
    double font_size = 14.0;
    bool bold = false;
    double opacity = 1.0;
};

/**
 * @brief Everything a frame draws, back to front by vector
 */
struct Scene {
    ViewMode view_mode = ViewMode::Graph3D;
    CameraPose camera;
    double width = 0.0;                 // Topic canvas size; 0 for the 3-D view
    double height = 0.0;

    std::vector<ScenePolygon> hulls;
    std::vector<SceneLine> lines;
    std::vector<SceneSphere> spheres;
    std::vector<SceneRect> rects;
    std::vector<SceneCircle> circles;
    std::vector<SceneLabel> labels;

    const SceneSphere* find_sphere(const std::string& node_id) const;
    const SceneRect* find_rect(int cluster_id) const;
    const SceneLabel* find_label(const std::string& target_id) const;
    const SceneLine* find_line(const std::string& id) const;

    nlohmann::json to_json() const;

    /**
     * @brief Flat SVG rendering; 3-D positions are projected onto x/y
     */
    std::string to_svg() const;
};

// ============================================================================
// Strategies
// ============================================================================

/**
 * @brief Read-only inputs of one frame
 *
 * Layout pointers are null when that view has no running layout.
 */
struct RenderContext {
    const AdaptedGraph& graph;
    const LodSelection& lod;
    const RenderConfig& config;
    const HighlightCoordinator& coordinator;
    const LabelPolicy& labels;
    const VisualEncoder& encoder;
    const ForceLayout3D* layout = nullptr;
    const TopicLayout* topic = nullptr;
    CameraPose camera;
};

/**
 * @brief Turns the frame inputs into a draw list for one view
 */
class RenderStrategy {
public:
    virtual ~RenderStrategy() = default;

    virtual ViewMode view_mode() const = 0;
    virtual std::string name() const = 0;
    virtual Scene render(const RenderContext& context) const = 0;
};

/**
 * @brief Node-level 3-D view: one sphere stack per visible node
 */
class NodeSphereStrategy : public RenderStrategy {
public:
    ViewMode view_mode() const override { return ViewMode::Graph3D; }
    std::string name() const override { return "node_sphere"; }
    Scene render(const RenderContext& context) const override;
};

/**
 * @brief Cluster-level 2-D view: rounded rectangles, hulls and dashed gaps
 */
class ClusterRectStrategy : public RenderStrategy {
public:
    ViewMode view_mode() const override { return ViewMode::Topic2D; }
    std::string name() const override { return "cluster_rect"; }
    Scene render(const RenderContext& context) const override;
};

std::unique_ptr<RenderStrategy> make_render_strategy(ViewMode mode);

} // namespace kgviz
