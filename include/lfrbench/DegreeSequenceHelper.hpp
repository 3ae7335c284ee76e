#pragma once
#ifndef LFRBENCH_DEGREE_SEQUENCE_HELPER_H
#define LFRBENCH_DEGREE_SEQUENCE_HELPER_H

#include <random>
#include <vector>

#include "defs.hpp"
#include "LFRParameters.hpp"

namespace lfrbench {

    struct DegreeSequenceStatistics {
        double sampled_mean{0};  // mean before rescaling
        double final_mean{0};
        double rescale_factor{1.0};
        bool rescaled{false};
        bool parity_fixed{true}; // false only if an undirected sequence kept an odd sum
        bool graphical{false};
    };

    //! samples one target degree per node from PowerlawVariate(min_degree, max_degree, tau1),
    //! rescales gently toward avg_degree and restores an even sum for undirected graphs
    std::vector<count> generate_degree_sequence(std::mt19937_64 &gen, std::size_t n, bool directed,
                                                const LFRParameters &params,
                                                DegreeSequenceStatistics *stats = nullptr);

    //! multiplies every degree by clamp(target / mean, 0.8, 1.3) if the mean deviates from target
    //! by at least threshold (relative); returns the factor applied (1.0 if untouched)
    double rescale_degree_sequence(std::vector<count> &degree_sequence, double target_mean, double threshold,
                                   count min_degree, count max_degree);

    //! adds one to a node below max_degree if the sum is odd; returns false if parity could not be fixed
    bool fix_degree_sum_parity(std::vector<count> &degree_sequence, std::mt19937_64 &gen,
                               count min_degree, count max_degree);

    double mean_degree(const std::vector<count> &degree_sequence);

    bool is_degree_sequence_graphical(const std::vector<count> &deg_seq);
}

#endif
