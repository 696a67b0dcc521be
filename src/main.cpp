#include "kgviz/cli/cli.hpp"
#include "kgviz/config/engine_config.hpp"
#include "kgviz/engine/graph_view_engine.hpp"
#include "kgviz/graph/knowledge_graph.hpp"
#include "kgviz/lod/lod_selector.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

using namespace kgviz;

// ============== Helper Functions ==============

// Config file first, then KGVIZ_* environment overrides, then flags
EngineConfig load_engine_config(const Args& args) {
    EngineConfig config;
    if (args.has("config")) {
        config = EngineConfig::from_json_file(args.get("config").value);
    } else {
        config = EngineConfig::from_environment();
    }
    if (args.has("verbose")) {
        config.set_verbose(true);
    }
    return config;
}

void write_output(const std::string& path, const std::string& content) {
    if (path.empty() || path == "-") {
        std::cout << content << "\n";
        return;
    }
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << content;
    std::cerr << "Wrote " << path << "\n";
}

bool wants_svg(const Args& args) {
    std::string format = args.get("format", "auto").value;
    if (format == "svg") return true;
    if (format == "json") return false;
    std::string output = args.get("output", "").value;
    return fs::path(output).extension() == ".svg";
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// Apply the per-frame flags shared by the scene-producing commands
RenderConfig render_config_from_args(const EngineConfig& config, const Args& args) {
    RenderConfig render = config.render;
    if (args.has("detail")) {
        render.lod = LodConfig::from_detail_level(
            detail_level_from_string(args.get("detail").value));
    }
    if (args.has("labels")) {
        render.label_visibility = label_visibility_from_string(args.get("labels").value);
    }
    if (args.has("bloom")) {
        render.bloom.enabled = true;
    }
    if (args.has("ghost-edges")) {
        render.show_ghost_edges = true;
    }
    for (const auto& type : args.get("types").as_list()) {
        render.visible_entity_types.insert(type);
    }
    return render;
}

// ============== kgviz layout ==============
int cmd_layout(const Args& args) {
    std::string input_path = args.require("input");
    int max_ticks = args.get("max-ticks", "1000").as_int();

    EngineConfig config = load_engine_config(args);
    config.view_mode = ViewMode::Graph3D;

    std::cerr << "Loading snapshot from: " << input_path << "\n";
    GraphSnapshot snapshot = GraphSnapshot::load_from_json(input_path);

    auto start = std::chrono::steady_clock::now();
    GraphViewEngine engine(config);
    engine.set_snapshot(std::move(snapshot));
    int ticks = engine.settle(max_ticks);
    auto elapsed = std::chrono::steady_clock::now() - start;

    const ForceLayout3D& layout = engine.layout();
    std::cerr << "Layout: " << layout.nodes().size() << " nodes, " << layout.tick_count()
              << " ticks (" << ticks << " after warmup) in " << format_duration(elapsed) << "\n";
    if (layout.repaired_positions() > 0) {
        std::cerr << "Warning: repaired " << layout.repaired_positions()
                  << " non-finite positions\n";
    }

    nlohmann::json out;
    out["ticks"] = layout.tick_count();
    out["alpha"] = layout.alpha();
    out["nodes"] = nlohmann::json::array();
    for (const auto& node : layout.nodes()) {
        out["nodes"].push_back({
            {"id", node.id},
            {"x", node.position.x},
            {"y", node.position.y},
            {"z", node.position.z}
        });
    }

    write_output(args.get("output", "").value, out.dump(2));
    return 0;
}

// ============== kgviz topic ==============
int cmd_topic(const Args& args) {
    std::string input_path = args.require("input");
    int max_ticks = args.get("max-ticks", "1000").as_int();

    EngineConfig config = load_engine_config(args);
    config.view_mode = ViewMode::Topic2D;

    std::cerr << "Loading snapshot from: " << input_path << "\n";
    GraphSnapshot snapshot = GraphSnapshot::load_from_json(input_path);

    GraphViewEngine engine(config);
    engine.set_snapshot(std::move(snapshot));
    engine.settle(max_ticks);

    if (args.has("hover")) {
        engine.coordinator().hover_cluster(args.get("hover").as_int());
    }

    RenderConfig render = render_config_from_args(engine.config(), args);
    Scene scene = engine.frame(render, 0.0);

    const TopicLayout& topic = engine.topic_layout();
    std::cerr << "Topic view: " << topic.nodes().size() << " topics, "
              << topic.links().size() << " links, " << scene.hulls.size() << " hulls\n";

    write_output(args.get("output", "").value, wants_svg(args) ? scene.to_svg() : scene.to_json().dump(2));
    return 0;
}

// ============== kgviz lod ==============
int cmd_lod(const Args& args) {
    std::string input_path = args.require("input");

    GraphSnapshot snapshot = GraphSnapshot::load_from_json(input_path);
    auto centrality = snapshot.centrality_map();

    LodConfig lod;
    if (args.has("zoom")) {
        lod.visible_fraction = LodSelector::visible_fraction_for_zoom(args.get("zoom").as_double());
    } else {
        lod = LodConfig::from_detail_level(
            detail_level_from_string(args.get("detail", "all").value));
    }

    std::vector<std::string> node_ids;
    node_ids.reserve(snapshot.nodes.size());
    for (const auto& node : snapshot.nodes) {
        node_ids.push_back(node.id);
    }

    std::unordered_set<std::string> pinned;
    for (const auto& id : args.get("pin").as_list()) {
        pinned.insert(id);
    }

    LodSelection selection = LodSelector::select(node_ids, centrality, lod, pinned);

    nlohmann::json out;
    out["fraction"] = selection.applied_fraction;
    out["total_nodes"] = node_ids.size();
    out["kept_by_rank"] = selection.kept_by_rank;
    out["kept_by_pin"] = selection.kept_by_pin;
    out["visible"] = nlohmann::json::array();
    for (const auto& id : selection.ranked_nodes) {
        if (selection.is_visible(id)) {
            out["visible"].push_back(id);
        }
    }

    size_t visible_edges = 0;
    for (const auto& edge : snapshot.edges) {
        if (selection.is_edge_visible(edge.source, edge.target)) {
            visible_edges++;
        }
    }
    out["visible_edges"] = visible_edges;

    write_output(args.get("output", "").value, out.dump(2));
    return 0;
}

// ============== kgviz scene ==============
int cmd_scene(const Args& args) {
    std::string input_path = args.require("input");
    int max_ticks = args.get("max-ticks", "300").as_int();

    EngineConfig config = load_engine_config(args);
    if (args.has("view")) {
        config.view_mode = view_mode_from_string(args.get("view").value);
    }

    GraphSnapshot snapshot = GraphSnapshot::load_from_json(input_path);

    GraphViewEngine engine(config);
    engine.set_snapshot(std::move(snapshot));
    engine.settle(max_ticks);

    // Interactions replayed before the frame
    if (args.has("select")) {
        std::string node_id = args.get("select").value;
        if (!engine.coordinator().click_node(node_id)) {
            std::cerr << "Warning: unknown node '" << node_id << "'\n";
        } else {
            engine.camera().focus_on_node(node_id);
        }
    }
    if (args.has("gap")) {
        std::string gap_id = args.get("gap").value;
        if (!engine.coordinator().select_gap(gap_id)) {
            std::cerr << "Warning: unknown gap '" << gap_id << "'\n";
        }
    }
    if (args.has("focus-cluster")) {
        engine.camera().focus_on_cluster(args.get("focus-cluster").as_int());
    }
    for (const auto& id : args.get("pin").as_list()) {
        engine.coordinator().pin(id);
    }

    // Let the camera finish its transition
    engine.camera().advance(engine.config().camera.transition_ms);

    RenderConfig render = render_config_from_args(engine.config(), args);
    Scene scene = engine.frame(render, 0.0);

    const EngineStatistics& stats = engine.statistics();
    std::cerr << "Scene (" << engine.strategy().name() << "): "
              << stats.last_visible_nodes << " visible nodes, "
              << stats.last_visible_edges << " visible edges, "
              << stats.last_filtered_nodes << " filtered, "
              << stats.last_dropped_edges << " dropped edges\n";

    write_output(args.get("output", "").value, wants_svg(args) ? scene.to_svg() : scene.to_json().dump(2));
    return 0;
}

// ============== kgviz stats ==============
int cmd_stats(const Args& args) {
    std::string input_path = args.require("input");

    std::cout << "Loading snapshot from: " << input_path << "\n";
    GraphSnapshot snapshot = GraphSnapshot::load_from_json(input_path);

    auto stats = snapshot.compute_statistics();

    std::cout << "\nSnapshot Statistics:\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Edges: " << stats.num_edges << " (" << stats.num_ghost_edges << " ghost, "
              << stats.num_dangling_edges << " dangling)\n";
    std::cout << "  Clusters: " << stats.num_clusters << " (" << stats.num_empty_clusters
              << " empty)\n";
    std::cout << "  Unclustered nodes: " << stats.num_unclustered_nodes << "\n";
    std::cout << "  Structural gaps: " << stats.num_gaps << "\n";
    std::cout << "  Bridge nodes: " << stats.num_bridge_nodes << "\n";
    std::cout << "  Max centrality: " << stats.max_centrality << "\n";
    std::cout << "  Avg degree: " << stats.avg_degree << "\n";

    // Top hubs by centrality
    auto ranked = LodSelector::rank([&] {
        std::vector<std::string> ids;
        for (const auto& node : snapshot.nodes) ids.push_back(node.id);
        return ids;
    }(), snapshot.centrality_map());

    size_t limit = std::min<size_t>(10, ranked.size());
    auto centrality = snapshot.centrality_map();
    std::cout << "\nTop " << limit << " Nodes by Centrality:\n";
    for (size_t i = 0; i < limit; ++i) {
        const Node* node = snapshot.find_node(ranked[i]);
        std::string name = node ? node->name : "?";
        auto c = centrality.find(ranked[i]);
        std::cout << "  " << name << " (" << (c != centrality.end() ? c->second : 0.0) << ")\n";
    }

    return 0;
}

// ============== kgviz config ==============
int cmd_config(const Args& args) {
    EngineConfig config = load_engine_config(args);
    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }
    write_output(args.get("output", "").value, config.to_json().dump(2));
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("kgviz", "1.0.0");

    const ArgDef input_arg{"input", "i", "Input graph snapshot JSON file", "", true, false};
    const ArgDef config_arg{"config", "c", "Engine config JSON file (default: KGVIZ_* environment)", "", false, false};
    const ArgDef verbose_arg{"verbose", "v", "Print layout progress", "", false, true};

    // kgviz layout
    cli.register_command({
        "layout",
        "Run the 3-D force layout and print node positions",
        {
            input_arg,
            {"output", "o", "Output JSON file (default: stdout)", "", false, false},
            {"max-ticks", "t", "Tick budget after warmup", "1000", false, false},
            config_arg,
            verbose_arg
        },
        cmd_layout
    });

    // kgviz topic
    cli.register_command({
        "topic",
        "Lay out the cluster overview and export it",
        {
            input_arg,
            {"output", "o", "Output file (.svg or .json, default: stdout)", "", false, false},
            {"format", "f", "Output format: auto, json, svg", "auto", false, false},
            {"hover", "H", "Cluster id rendered as hovered", "", false, false},
            {"max-ticks", "t", "Tick budget", "1000", false, false},
            {"labels", "l", "Label mode: none, important, all", "", false, false},
            config_arg,
            verbose_arg
        },
        cmd_topic
    });

    // kgviz lod
    cli.register_command({
        "lod",
        "List the nodes kept at a detail level or zoom",
        {
            input_arg,
            {"detail", "d", "Detail level: all, important, key, hub", "all", false, false},
            {"zoom", "z", "Normalized zoom in [0, 1] (overrides --detail)", "", false, false},
            {"pin", "p", "Comma-separated node ids that stay visible", "", false, false},
            {"output", "o", "Output JSON file (default: stdout)", "", false, false}
        },
        cmd_lod
    });

    // kgviz scene
    cli.register_command({
        "scene",
        "Render one frame of either view to JSON or SVG",
        {
            input_arg,
            {"output", "o", "Output file (.svg or .json, default: stdout)", "", false, false},
            {"format", "f", "Output format: auto, json, svg", "auto", false, false},
            {"view", "w", "View mode: 3d, topic", "", false, false},
            {"detail", "d", "Detail level: all, important, key, hub", "", false, false},
            {"labels", "l", "Label mode: none, important, all", "", false, false},
            {"types", "y", "Comma-separated entity types to show", "", false, false},
            {"select", "s", "Node id to click before rendering", "", false, false},
            {"gap", "g", "Structural gap id to select", "", false, false},
            {"focus-cluster", "k", "Cluster id to focus the camera on", "", false, false},
            {"pin", "p", "Comma-separated node ids to pin", "", false, false},
            {"bloom", "b", "Enable bloom", "", false, true},
            {"ghost-edges", "e", "Show ghost edges", "", false, true},
            {"max-ticks", "t", "Tick budget", "300", false, false},
            config_arg,
            verbose_arg
        },
        cmd_scene
    });

    // kgviz stats
    cli.register_command({
        "stats",
        "Print statistics about a graph snapshot",
        {
            input_arg
        },
        cmd_stats
    });

    // kgviz config
    cli.register_command({
        "config",
        "Print the effective engine configuration",
        {
            config_arg,
            {"output", "o", "Output JSON file (default: stdout)", "", false, false}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
