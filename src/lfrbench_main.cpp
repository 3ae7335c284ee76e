#include <iostream>
#include <fstream>
#include <optional>
#include <random>
#include <stdexcept>

#include <tlx/cmdline_parser.hpp>
#include <tlx/logger.hpp>

#include <lfrbench/AdjacencyGraph.hpp>
#include <lfrbench/LFRGenerator.hpp>
#include <lfrbench/NetworkExport.hpp>
#include <lfrbench/QualityAnalyzer.hpp>

namespace lfrbench {

struct Config {
    unsigned num_nodes{1000};
    bool directed{false};

    LFRParameters params;
    unsigned min_degree{5};
    unsigned max_degree{20};
    double avg_degree{0};
    unsigned min_community{10};
    unsigned max_community{50};
    unsigned iteration_factor{3};
    size_t seed{std::random_device{}()};

    std::string gml_path;
    std::string csv_nodes_path;
    std::string csv_edges_path;
    bool skip_modularity{false};

    static std::optional<Config> parse(int argc, char *argv[]) {
        tlx::CmdlineParser parser;
        parser.set_description("Generates LFR benchmark graphs with power-law degrees and community sizes");

        Config config;

        parser.add_unsigned('n', "nodes", config.num_nodes, "Number of nodes; default 1000");
        parser.add_bool('d', "directed", config.directed, "Generate a directed graph");
        parser.add_bool('y', "symmetrical", config.params.symmetrical, "Mirror every edge of a directed graph");

        parser.add_double('t', "tau1", config.params.tau1, "Power law exponent of the degrees; default 2.5");
        parser.add_double('T', "tau2", config.params.tau2, "Power law exponent of the community sizes; default 1.5");
        parser.add_double('m', "mu", config.params.mu, "Mixing parameter in [0, 1]; default 0.2");

        parser.add_unsigned('a', "mindegree", config.min_degree, "Minimal degree; default 5");
        parser.add_unsigned('b', "maxdegree", config.max_degree, "Maximal degree; default 20");
        parser.add_double('k', "avgdegree", config.avg_degree,
                          "Target average degree; if not provided, the midpoint of min and max degree");

        parser.add_unsigned('c', "mincommunity", config.min_community, "Minimal community size; default 10");
        parser.add_unsigned('C', "maxcommunity", config.max_community, "Maximal community size; default 50");

        parser.add_size_t('s', "seed", config.seed, "Seed of the random generator; random if not provided");
        parser.add_unsigned('r', "rounds", config.iteration_factor,
                            "Edge construction rounds per target edge; default 3");

        parser.add_string('g', "gml", config.gml_path, "Path of the GML output");
        parser.add_string('o', "nodes-csv", config.csv_nodes_path, "Path of the CSV node output");
        parser.add_string('e', "edges-csv", config.csv_edges_path, "Path of the CSV edge output");
        parser.add_bool('q', "no-modularity", config.skip_modularity, "Skip the quadratic modularity computation");

        if (!parser.process(argc, argv))
            return {};

        if (config.num_nodes < LFRGenerator::kMinNodes) {
            std::cout << "Invalid number of nodes (-n); at least " << LFRGenerator::kMinNodes << " are required" << std::endl;
            return {};
        }

        if (config.csv_nodes_path.empty() != config.csv_edges_path.empty()) {
            std::cout << "CSV output requires both a node (-o) and an edge (-e) path" << std::endl;
            return {};
        }

        config.params.min_degree = config.min_degree;
        config.params.max_degree = config.max_degree;
        config.params.min_community = config.min_community;
        config.params.max_community = config.max_community;
        config.params.iteration_factor = config.iteration_factor;
        config.params.seed = config.seed;

        if (config.avg_degree > 0) {
            config.params.avg_degree = config.avg_degree;
        } else {
            config.params.with_default_average_degree();
        }

        try {
            config.params.validate();
        } catch (const ParameterError &e) {
            std::cout << "Invalid parameter " << e.parameter() << ": " << e.what() << std::endl;
            return {};
        }

        return {config};
    }
};

void export_network(const Config &config, const LFRGenerator &generator, const AdjacencyGraph &graph) {
    if (!config.gml_path.empty()) {
        std::ofstream file{config.gml_path};
        if (!file)
            throw std::runtime_error("Cannot open " + config.gml_path);

        ExportMetadata meta;
        meta.avg_degree = generator.target_average_degree();
        meta.mu = config.params.mu;
        write_gml(file, graph, generator.community_assignment(), meta);
        std::cout << "Network exported to: " << config.gml_path << "\n";
    }

    if (!config.csv_nodes_path.empty()) {
        std::ofstream nodes{config.csv_nodes_path};
        std::ofstream edges{config.csv_edges_path};
        if (!nodes || !edges)
            throw std::runtime_error("Cannot open " + config.csv_nodes_path + " or " + config.csv_edges_path);

        write_csv_nodes(nodes, graph, generator.community_assignment(), generator.degree_sequence());
        write_csv_edges(edges, graph, generator.community_assignment());
        std::cout << "Network exported to: " << config.csv_nodes_path << " and " << config.csv_edges_path << "\n";
    }
}

int run(const Config &config) {
    LFRGenerator generator(config.params);
    AdjacencyGraph graph(config.num_nodes, config.directed);

    generator.generate(graph);

    const auto &stats = generator.statistics();
    std::cout << "Generated " << stats.edges.edges_created << " of " << stats.edges.target_edges
              << " target edges in " << stats.edges.rounds << " rounds (seed " << config.params.seed << ")\n";
    if (stats.edges.round_limit_reached)
        std::cout << "Round limit of " << stats.edges.max_rounds << " reached; "
                  << stats.edges.unsaturated_nodes << " nodes stay below their target degree\n";
    if (!stats.degree_sequence.graphical && !config.directed)
        std::cout << "Note: the sampled degree sequence is not graphical\n";
    if (generator.communities().size() < 2)
        std::cout << "Warning: only " << generator.communities().size() << " community was generated\n";

    std::cout << analyze_network(graph, generator.community_assignment(), generator.degree_sequence(),
                                 !config.skip_modularity);

    export_network(config, generator, graph);
    return 0;
}

}

int main(int argc, char* argv[]) {
    auto config_opt = lfrbench::Config::parse(argc, argv);
    if (!config_opt)
        return -1;

    try {
        return lfrbench::run(config_opt.value());
    } catch (const std::exception &e) {
        LOG1 << "Error: " << e.what();
        return 1;
    }
}
