#pragma once
#ifndef LFRBENCH_LFR_GENERATOR_HPP
#define LFRBENCH_LFR_GENERATOR_HPP

#include <random>
#include <vector>

#include <lfrbench/defs.hpp>
#include <lfrbench/CommunityAssignment.hpp>
#include <lfrbench/DegreeSequenceHelper.hpp>
#include <lfrbench/EdgeConstructor.hpp>
#include <lfrbench/GraphHandle.hpp>
#include <lfrbench/LFRParameters.hpp>

namespace lfrbench {

struct GenerationStatistics {
    DegreeSequenceStatistics degree_sequence;
    EdgeConstructionStatistics edges;
    count num_communities{0};
};

/**
 * LFR benchmark generator. Each call to generate() reseeds the internal random generator from
 * the configured seed and runs the whole pipeline: degree sequence, community sizes, community
 * assignment and edge construction. Identical parameters produce identical graphs.
 */
class LFRGenerator {
public:
    static constexpr count kMinNodes = 10;

    //! throws ParameterError if params.validate() fails
    explicit LFRGenerator(const LFRParameters &params);

    //! wires the nodes of graph; throws GenerationError before any sampling if the graph has
    //! fewer than kMinNodes nodes or avg_degree >= number of nodes
    void generate(GraphHandle &graph);

    [[nodiscard]] const LFRParameters &parameters() const noexcept { return params_; }
    [[nodiscard]] bool has_generated() const noexcept { return generated_; }

    [[nodiscard]] const std::vector<count> &degree_sequence() const noexcept { return degree_sequence_; }

    //! community sizes as sampled (before assignment)
    [[nodiscard]] const std::vector<count> &community_sizes() const noexcept { return community_sizes_; }

    [[nodiscard]] const CommunityAssignment &community_assignment() const noexcept { return assignment_; }
    [[nodiscard]] const std::vector<community_id> &node_communities() const noexcept {
        return assignment_.node_communities();
    }
    [[nodiscard]] const std::vector<std::vector<node>> &communities() const noexcept {
        return assignment_.communities();
    }

    [[nodiscard]] double target_average_degree() const noexcept { return params_.avg_degree; }
    [[nodiscard]] double actual_average_degree(const GraphHandle &graph) const;

    //! modularity of graph under the generated communities; 0 before the first generate()
    [[nodiscard]] double modularity(const GraphHandle &graph) const;

    [[nodiscard]] const GenerationStatistics &statistics() const noexcept { return stats_; }

private:
    LFRParameters params_;
    std::mt19937_64 gen_;

    bool generated_{false};
    std::vector<count> degree_sequence_;
    std::vector<count> community_sizes_;
    CommunityAssignment assignment_;
    GenerationStatistics stats_;

    void check_graph(const GraphHandle &graph) const;
};

}

#endif // LFRBENCH_LFR_GENERATOR_HPP
