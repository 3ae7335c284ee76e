#include <lfrbench/LFRGenerator.hpp>

#include <sstream>

#include <tlx/logger.hpp>

#include <lfrbench/CommunitySizes.hpp>
#include <lfrbench/QualityAnalyzer.hpp>

namespace lfrbench {

static constexpr bool debug = false;

static const LFRParameters &validated(const LFRParameters &params) {
    params.validate();
    return params;
}

LFRGenerator::LFRGenerator(const LFRParameters &params) : params_(validated(params)), gen_(params.seed) {}

void LFRGenerator::check_graph(const GraphHandle &graph) const {
    const count n = graph.num_nodes();

    if (n < kMinNodes)
        throw GenerationError("Number of nodes must be at least " + std::to_string(kMinNodes) + " but is " +
                              std::to_string(n));

    if (params_.avg_degree >= static_cast<double>(n)) {
        std::ostringstream msg;
        msg << "Average degree " << params_.avg_degree << " must be less than the number of nodes " << n;
        throw GenerationError(msg.str());
    }
}

void LFRGenerator::generate(GraphHandle &graph) {
    check_graph(graph);

    const count n = graph.num_nodes();
    const bool directed = graph.is_directed();
    gen_.seed(params_.seed);

    GenerationStatistics stats;

    auto degree_sequence = generate_degree_sequence(gen_, n, directed, params_, &stats.degree_sequence);
    auto community_sizes = generate_community_sizes(gen_, n, params_.min_community, params_.max_community,
                                                    params_.tau2);
    auto assignment = CommunityAssignment::from_sizes(n, community_sizes, gen_);
    stats.num_communities = assignment.num_communities();

    {
        EdgeConstructor constructor(degree_sequence, assignment, params_.mu, params_.symmetrical,
                                    params_.iteration_factor);
        stats.edges = constructor.construct(graph, gen_);
    }

    LOG << "generated " << stats.edges.edges_created << " edges over " << stats.num_communities
        << " communities for " << n << " nodes (" << params_ << ")";

    degree_sequence_ = std::move(degree_sequence);
    community_sizes_ = std::move(community_sizes);
    assignment_ = std::move(assignment);
    stats_ = stats;
    generated_ = true;
}

double LFRGenerator::actual_average_degree(const GraphHandle &graph) const {
    return average_degree(graph);
}

double LFRGenerator::modularity(const GraphHandle &graph) const {
    if (!generated_) return 0.0;
    return lfrbench::modularity(graph, assignment_);
}

}
