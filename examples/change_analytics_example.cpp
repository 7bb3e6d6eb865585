#include "analytics/analytics_engine.hpp"
#include "graph/hypergraph.hpp"
#include <iostream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>

using namespace bsm;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

ChangeRecord make_row(const std::string& change, const std::string& ci, const std::string& cls,
                      const std::string& created_at, const std::string& service, const std::string& group) {
    ChangeRecord rec;
    rec.change_number = change;
    rec.entity_id = ci;
    rec.entity_name = ci;
    rec.entity_class = cls;
    rec.created_at = created_at;
    rec.business_service = service;
    rec.assignment_group = group;
    return rec;
}

IncidentRecord make_incident(const std::string& number, const std::string& ci, const std::string& service,
                             int priority, const std::string& created_at, const std::string& resolved_at) {
    IncidentRecord inc;
    inc.number = number;
    inc.priority = priority;
    inc.affected_ci = {ci, ci};
    inc.business_service = {service, service};
    inc.created_at = created_at;
    inc.resolved_at = resolved_at;
    return inc;
}

int main() {
    print_separator("Change Analytics Example - Checkout Platform");

    // Create output directory
    const std::string output_dir = "output_json";
    #ifdef _WIN32
        _mkdir(output_dir.c_str());
    #else
        mkdir(output_dir.c_str(), 0755);
    #endif

    RecordSet records;

    std::cout << "1. Recording change requests:\n";
    std::cout << "   CHG100 [web-01, app-01] (Checkout)\n";
    records.change_records.push_back(make_row("CHG100", "web-01", "web_server", "2024-03-01T09:00:00Z", "Checkout", "Web Ops"));
    records.change_records.push_back(make_row("CHG100", "app-01", "app_server", "2024-03-01T09:00:00Z", "Checkout", "Web Ops"));

    std::cout << "   CHG101 [app-01, db-01] (Checkout)\n";
    records.change_records.push_back(make_row("CHG101", "app-01", "app_server", "2024-03-03T14:00:00Z", "Checkout", "DBA"));
    records.change_records.push_back(make_row("CHG101", "db-01", "database", "2024-03-03T14:00:00Z", "Checkout", "DBA"));

    std::cout << "   CHG102 [web-01, app-01, lb-01] (Checkout, emergency)\n";
    records.change_records.push_back(make_row("CHG102", "web-01", "web_server", "2024-03-08T22:00:00Z", "Checkout", "Web Ops"));
    records.change_records.push_back(make_row("CHG102", "app-01", "app_server", "2024-03-08T22:00:00Z", "Checkout", "Web Ops"));
    records.change_records.push_back(make_row("CHG102", "lb-01", "load_balancer", "2024-03-08T22:00:00Z", "Checkout", "Web Ops"));
    for (size_t i = 4; i < records.change_records.size(); ++i) {
        records.change_records[i].change_type = "Emergency";
        records.change_records[i].risk = "High";
    }

    std::cout << "   CHG103 [db-01, backup-01] (Reporting)\n";
    records.change_records.push_back(make_row("CHG103", "db-01", "database", "2024-03-10T02:00:00Z", "Reporting", "DBA"));
    records.change_records.push_back(make_row("CHG103", "backup-01", "storage", "2024-03-10T02:00:00Z", "Reporting", "DBA"));

    std::cout << "\n2. Recording incidents:\n";
    records.incidents.push_back(make_incident("INC200", "app-01", "Checkout", 2, "2024-03-09T01:00:00Z", "2024-03-09T03:30:00Z"));
    records.incidents.push_back(make_incident("INC201", "db-01", "Checkout", 1, "2024-03-09T05:00:00Z", "2024-03-09T06:00:00Z"));
    std::cout << "   " << records.incidents.size() << " incidents\n";

    // Build the hypergraph
    Hypergraph graph = Hypergraph::build(records.change_records);
    auto stats = graph.compute_statistics();

    print_separator("Hypergraph Statistics");
    std::cout << "Nodes:          " << stats.total_nodes << "\n";
    std::cout << "Hyperedges:     " << stats.total_edges << "\n";
    std::cout << "Incidences:     " << stats.incidence_count << "\n";
    std::cout << "Avg edge size:  " << std::fixed << std::setprecision(2) << stats.avg_edge_size << "\n";

    graph.export_to_json(output_dir + "/change_hypergraph.json");
    std::cout << "\nExported hypergraph to " << output_dir << "/change_hypergraph.json\n";

    // Run the analytics
    AnalyticsEngine engine(graph, records);
    AnalyticsConfig config;
    config.impact_target = "ci:app-01";
    engine.set_config(config);
    engine.set_source("change_analytics_example");
    engine.set_progress_callback([](const std::string& stage, int current, int total) {
        std::cout << "  [" << current << "/" << total << "] " << stage << "\n";
    });

    print_separator("Running Analytics");
    AnalyticsReport report = engine.run_all();

    print_separator("Risk Heatmap");
    for (const auto& entry : engine.risk()) {
        std::cout << "  " << std::setw(12) << std::left << entry.name
                  << " score " << std::setw(3) << std::right << entry.risk_score
                  << "  changes " << entry.factors.change_frequency
                  << "  incidents " << entry.factors.incident_rate << "\n";
    }

    print_separator("Impact of changing app-01");
    for (const auto& pred : engine.impact(config.impact_target)) {
        std::cout << "  " << std::setw(12) << std::left << pred.name
                  << std::setprecision(3) << pred.probability << "  (" << pred.reason << ")\n";
    }

    print_separator("Fault Propagation");
    for (const auto& fp : engine.incidents().fault_propagation) {
        std::cout << "  " << fp.source << " -> " << fp.target
                  << " after " << std::setprecision(1) << fp.avg_lag_hours << "h\n";
    }

    report.save_to_json(output_dir + "/change_analytics_report.json");
    std::cout << "\nSaved report to " << output_dir << "/change_analytics_report.json\n";

    return 0;
}
