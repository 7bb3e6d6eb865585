#include "cli/cli.hpp"
#include "graph/hypergraph.hpp"
#include "analytics/analytics_engine.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <chrono>
#include <iomanip>
#include <sstream>

using namespace bsm;

// ============== Helper Functions ==============

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

RecordSet load_records(const std::string& input_path) {
    std::cout << "Loading records from: " << input_path << "\n";
    RecordSet records = RecordSet::load_from_json(input_path);
    std::cout << "Loaded " << records.change_records.size() << " change rows and "
              << records.incidents.size() << " incidents\n";
    return records;
}

Hypergraph build_graph(const RecordSet& records, bool transposed) {
    Hypergraph graph = Hypergraph::build(records.change_records);
    return transposed ? graph.transpose() : graph;
}

AnalyticsConfig load_config(const Args& args) {
    std::string config_path = args.get("config", "").value;
    if (config_path.empty()) {
        return AnalyticsConfig{};
    }
    std::cout << "Loading config from: " << config_path << "\n";
    return AnalyticsConfig::load_from_file(config_path);
}

void print_stats(const HypergraphStatistics& stats) {
    std::cout << "\nHypergraph Statistics:\n";
    std::cout << "  Nodes: " << stats.total_nodes << "\n";
    std::cout << "  Edges: " << stats.total_edges << "\n";
    std::cout << "  Incidences: " << stats.incidence_count << "\n";
    std::cout << "  Density: " << stats.density << "\n";
    std::cout << "  Avg node degree: " << stats.avg_degree << "\n";
    std::cout << "  Degree range: " << stats.min_degree << " - " << stats.max_degree << "\n";
    std::cout << "  Avg edge size: " << stats.avg_edge_size << "\n";
    std::cout << "  Edge size range: " << stats.min_edge_size << " - " << stats.max_edge_size << "\n";
}

// ============== bsmhg stats ==============
int cmd_stats(const Args& args) {
    RecordSet records = load_records(args.require("input"));
    Hypergraph graph = build_graph(records, args.has("transpose"));

    print_stats(graph.compute_statistics());

    // Busiest nodes
    std::vector<std::pair<std::string, size_t>> hubs;
    for (const auto& node : graph.nodes()) {
        hubs.emplace_back(node.uid, graph.degree(node.uid));
    }
    std::stable_sort(hubs.begin(), hubs.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    if (hubs.size() > 10) hubs.resize(10);

    std::cout << "\nTop " << hubs.size() << " Hubs:\n";
    for (const auto& [uid, degree] : hubs) {
        const auto* node = graph.get_node(uid);
        std::string name = node && !node->name.empty() ? node->name : uid;
        std::cout << "  " << name << " [" << uid << "] (degree " << degree << ")\n";
    }

    return 0;
}

// ============== bsmhg export ==============
int cmd_export(const Args& args) {
    RecordSet records = load_records(args.require("input"));
    std::string output_path = args.require("output");
    Hypergraph graph = build_graph(records, args.has("transpose"));

    if (args.has("matrix")) {
        std::ofstream file(output_path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + output_path);
        }
        file << graph.to_incidence_matrix().dump(2);
        std::cout << "Incidence matrix written to: " << output_path << "\n";
        return 0;
    }

    graph.export_to_json(output_path);
    std::cout << "Hypergraph (" << graph.num_nodes() << " nodes, " << graph.num_edges()
              << " edges) written to: " << output_path << "\n";
    return 0;
}

// ============== bsmhg cooccurrence ==============
int cmd_cooccurrence(const Args& args) {
    RecordSet records = load_records(args.require("input"));
    Hypergraph graph = build_graph(records, false);

    std::string type = args.get("type", "ci").value;
    size_t top_n = args.get("top", "20").as_size();

    std::optional<NodeType> filter;
    if (type != "any") {
        filter = string_to_node_type(type);
    }

    auto pairs = graph.cooccurrence(filter, top_n);
    std::cout << "\nTop " << pairs.size() << " co-occurring pairs (" << type << "):\n";
    for (const auto& pair : pairs) {
        std::cout << "  " << pair.a << " + " << pair.b << " : " << pair.count << " shared changes\n";
    }
    return 0;
}

// ============== bsmhg neighbors ==============
int cmd_neighbors(const Args& args) {
    RecordSet records = load_records(args.require("input"));
    std::string uid = args.require("uid");
    Hypergraph graph = build_graph(records, false);

    if (!graph.has_node(uid)) {
        std::cerr << "Error: node not found: " << uid << "\n";
        return 1;
    }

    auto neighbors = graph.neighbors(uid);
    std::cout << "\n" << uid << " appears in " << graph.degree(uid) << " changes with "
              << neighbors.size() << " neighbors:\n";
    for (const auto& n : neighbors) {
        const auto* node = graph.get_node(n);
        std::cout << "  " << n;
        if (node && !node->name.empty()) std::cout << " (" << node->name << ")";
        std::cout << "\n";
    }
    return 0;
}

// ============== bsmhg analyze ==============
int cmd_analyze(const Args& args) {
    std::string input_path = args.require("input");
    std::string output_path = args.require("output");
    auto modules = args.get("modules", "all").as_list();
    std::string run_id = args.get("run-id", "").value;

    RecordSet records = load_records(input_path);
    Hypergraph graph = build_graph(records, false);
    std::cout << "Built hypergraph with " << graph.num_nodes() << " nodes and "
              << graph.num_edges() << " edges\n";

    AnalyticsConfig config = load_config(args);
    if (args.has("parallel")) config.parallel = true;
    if (args.has("target")) config.impact_target = args.get("target").value;

    AnalyticsEngine engine(graph, records);
    engine.set_config(config);
    engine.set_source(input_path);
    if (!run_id.empty()) engine.set_run_id(run_id);
    engine.set_progress_callback([](const std::string& stage, int current, int total) {
        std::cout << "  [" << current << "/" << total << "] " << stage << "\n";
    });

    std::cout << "Running analytics...\n";
    auto start = std::chrono::steady_clock::now();
    AnalyticsReport report = engine.run_modules(modules);
    auto elapsed = std::chrono::steady_clock::now() - start;

    report.save_to_json(output_path);

    std::cout << "\nCompleted " << report.modules.size() << " modules in " << format_duration(elapsed) << "\n";
    for (const auto& skipped : report.skipped) {
        std::cout << "  Skipped: " << skipped << "\n";
    }
    std::cout << "Report written to: " << output_path << "\n";
    return 0;
}

// ============== bsmhg impact ==============
int cmd_impact(const Args& args) {
    RecordSet records = load_records(args.require("input"));
    std::string target = args.require("ci");
    Hypergraph graph = build_graph(records, false);

    AnalyticsEngine engine(graph, records);
    engine.set_config(load_config(args));

    auto predictions = engine.impact(target);
    if (predictions.empty()) {
        std::cout << "No impacted CIs predicted for " << target << "\n";
        return 0;
    }

    size_t top_n = args.get("top", "20").as_size();
    std::cout << "\nPredicted impact of changing " << target << ":\n";
    for (size_t i = 0; i < std::min(top_n, predictions.size()); ++i) {
        const auto& p = predictions[i];
        std::cout << "  " << std::fixed << std::setprecision(3) << p.probability << "  "
                  << p.name << " [" << p.ci << "] - " << p.reason << "\n";
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("bsmhg", "1.0.0");

    // bsmhg stats
    cli.register_command({
        "stats",
        "Print statistics about the change hypergraph",
        {
            {"input", "i", "Input records JSON file", "", true, false},
            {"transpose", "t", "Use the transposed view (entities become hyperedges)", "", false, true}
        },
        cmd_stats
    });

    // bsmhg export
    cli.register_command({
        "export",
        "Build the hypergraph and write it as JSON",
        {
            {"input", "i", "Input records JSON file", "", true, false},
            {"output", "o", "Output path for the hypergraph JSON", "", true, false},
            {"transpose", "t", "Export the transposed view", "", false, true},
            {"matrix", "m", "Write the dense node x edge incidence matrix instead", "", false, true}
        },
        cmd_export
    });

    // bsmhg cooccurrence
    cli.register_command({
        "cooccurrence",
        "Rank entity pairs by shared change requests",
        {
            {"input", "i", "Input records JSON file", "", true, false},
            {"type", "y", "Entity type to rank: ci, group, service, change or any", "ci", false, false},
            {"top", "n", "Number of pairs to show", "20", false, false}
        },
        cmd_cooccurrence
    });

    // bsmhg neighbors
    cli.register_command({
        "neighbors",
        "List entities sharing a change request with a node",
        {
            {"input", "i", "Input records JSON file", "", true, false},
            {"uid", "u", "Node uid (e.g. ci:web01)", "", true, false}
        },
        cmd_neighbors
    });

    // bsmhg analyze
    cli.register_command({
        "analyze",
        "Run analytics modules and write a JSON report",
        {
            {"input", "i", "Input records JSON file", "", true, false},
            {"output", "o", "Output path for the report JSON", "", true, false},
            {"modules", "p", "Modules: centrality,critical_nodes,cascades,velocity,cooccurrence,weighted_cooccurrence,anomalies,communities,impact,link_prediction,incidents,risk (or 'all')", "all", false, false},
            {"config", "c", "Analytics config JSON file", "", false, false},
            {"target", "g", "Target CI uid for the impact module", "", false, false},
            {"run-id", "r", "Run ID for tracking", "", false, false},
            {"parallel", "j", "Run modules concurrently", "", false, true}
        },
        cmd_analyze
    });

    // bsmhg impact
    cli.register_command({
        "impact",
        "Predict which CIs are affected when a CI changes",
        {
            {"input", "i", "Input records JSON file", "", true, false},
            {"ci", "u", "Target CI uid", "", true, false},
            {"config", "c", "Analytics config JSON file", "", false, false},
            {"top", "n", "Number of predictions to show", "20", false, false}
        },
        cmd_impact
    });

    return cli.run(argc, argv);
}
