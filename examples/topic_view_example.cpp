#include "kgviz/engine/graph_view_engine.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

using namespace kgviz;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

Node make_concept(const std::string& id, const std::string& name, int cluster) {
    Node node;
    node.id = id;
    node.name = name;
    node.entity_type = "Concept";
    node.cluster_id = cluster;
    return node;
}

Edge make_edge(const std::string& source, const std::string& target, double weight,
               const std::string& type) {
    Edge edge;
    edge.id = source + "->" + target;
    edge.source = source;
    edge.target = target;
    edge.weight = weight;
    edge.relationship_type = type;
    return edge;
}

// Two research areas that rarely cite each other, plus a bridging concept
GraphSnapshot build_snapshot() {
    GraphSnapshot snapshot;

    snapshot.nodes = {
        make_concept("transformer", "Transformer", 0),
        make_concept("attention", "Self-Attention", 0),
        make_concept("bert", "BERT", 0),
        make_concept("tokenizer", "Subword Tokenization", 0),
        make_concept("gnn", "Graph Neural Network", 1),
        make_concept("message-passing", "Message Passing", 1),
        make_concept("gcn", "Graph Convolution", 1),
        make_concept("graph-transformer", "Graph Transformer", 2),
    };
    snapshot.nodes.back().is_bridge = true;

    snapshot.edges = {
        make_edge("transformer", "attention", 3.0, "USES"),
        make_edge("bert", "transformer", 2.0, "EXTENDS"),
        make_edge("bert", "tokenizer", 1.0, "USES"),
        make_edge("gnn", "message-passing", 3.0, "USES"),
        make_edge("gcn", "gnn", 2.0, "EXTENDS"),
        make_edge("graph-transformer", "attention", 1.0, "USES"),
        make_edge("graph-transformer", "message-passing", 1.0, "USES"),
    };

    Edge ghost = make_edge("bert", "gcn", 0.0, "SIMILAR_TO");
    ghost.is_ghost = true;
    ghost.similarity = 0.72;
    snapshot.edges.push_back(ghost);

    Cluster language;
    language.cluster_id = 0;
    language.label = "Language Models";
    language.concepts = {"transformer", "attention", "bert", "tokenizer"};
    language.concept_names = {"Transformer", "Self-Attention", "BERT"};
    language.size = 4;
    language.density = 0.5;

    Cluster graphs;
    graphs.cluster_id = 1;
    graphs.label = "Graph Learning";
    graphs.concepts = {"gnn", "message-passing", "gcn"};
    graphs.concept_names = {"Graph Neural Network", "Message Passing", "Graph Convolution"};
    graphs.size = 3;
    graphs.density = 0.66;

    Cluster bridge;
    bridge.cluster_id = 2;
    bridge.concepts = {"graph-transformer"};
    bridge.concept_names = {"Graph Transformer"};
    bridge.size = 1;

    snapshot.clusters = {language, graphs, bridge};

    snapshot.centrality = {
        {"transformer", 0.42}, {"attention", 0.55}, {"bert", 0.18}, {"tokenizer", 0.02},
        {"gnn", 0.37}, {"message-passing", 0.41}, {"gcn", 0.05}, {"graph-transformer", 0.63},
    };

    StructuralGap gap;
    gap.id = "gap-0-1";
    gap.cluster_a_id = 0;
    gap.cluster_b_id = 1;
    gap.gap_strength = 0.15;
    gap.cluster_a_concepts = {"transformer", "attention"};
    gap.cluster_b_concepts = {"gnn", "message-passing"};
    gap.bridge_candidates = {"graph-transformer"};
    gap.research_questions = {"Can attention replace neighbourhood aggregation?"};
    snapshot.gaps = {gap};

    return snapshot;
}

void save(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
    std::cout << "  Saved " << path << "\n";
}

int main() {
    print_separator("Knowledge Graph Visual Exploration - Topic View");

    const std::string output_dir = "output_scenes";
    mkdir(output_dir.c_str(), 0755);

    EngineConfig config;
    config.view_mode = ViewMode::Topic2D;
    config.set_verbose(true);

    GraphViewEngine engine(config);
    engine.set_snapshot(build_snapshot());

    auto stats = engine.snapshot().compute_statistics();
    std::cout << "Snapshot: " << stats.num_nodes << " nodes, " << stats.num_edges << " edges, "
              << stats.num_clusters << " clusters, " << stats.num_gaps << " gaps\n";

    // =========================================================================
    // Topic overview
    // =========================================================================

    print_separator("Topic Layout");

    int ticks = engine.settle(500);
    std::cout << "Settled after " << ticks << " ticks\n\n";

    for (const auto& topic : engine.topic_layout().nodes()) {
        std::cout << "  " << std::left << std::setw(20) << topic.label
                  << " size=" << topic.size
                  << " at (" << std::fixed << std::setprecision(1)
                  << topic.position.x << ", " << topic.position.y << ")\n";
    }
    std::cout << "\nLinks:\n";
    for (const auto& link : engine.topic_layout().links()) {
        std::cout << "  " << link.id << (link.is_gap ? " [gap]" : "")
                  << " weight=" << link.weight << "\n";
    }

    RenderConfig render = engine.config().render;
    render.label_visibility = LabelVisibility::All;
    save(output_dir + "/topic_overview.svg", engine.frame(render, 16.0).to_svg());

    engine.coordinator().hover_cluster(0);
    std::cout << "\nHovering 'Language Models':\n";
    for (const auto& topic : engine.topic_layout().nodes()) {
        std::cout << "  " << topic.label << ": "
                  << to_string(engine.coordinator().cluster_state(topic.cluster_id)) << "\n";
    }
    save(output_dir + "/topic_hover.svg", engine.frame(render, 16.0).to_svg());
    engine.coordinator().hover_cluster(std::nullopt);

    // =========================================================================
    // Node view with gap selection
    // =========================================================================

    print_separator("3-D Node View");

    engine.set_view_mode(ViewMode::Graph3D);
    engine.settle(300);

    engine.coordinator().select_gap("gap-0-1");
    engine.camera().advance(engine.config().camera.transition_ms);

    CameraPose pose = engine.camera().pose();
    std::cout << "Camera after gap focus: position (" << pose.position.x << ", "
              << pose.position.y << ", " << pose.position.z << ")\n";
    std::cout << "Highlighted nodes: " << engine.coordinator().state().nodes.size() << "\n";

    render.lod = LodConfig::from_detail_level(DetailLevel::Key);
    render.show_ghost_edges = true;
    Scene scene = engine.frame(render, 16.0);
    std::cout << "Visible spheres at 'key' detail: " << scene.spheres.size() << "\n";
    save(output_dir + "/node_view.json", scene.to_json().dump(2));

    print_separator("Done");
    return 0;
}
