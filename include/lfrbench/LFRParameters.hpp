#pragma once
#ifndef LFRBENCH_LFR_PARAMETERS_HPP
#define LFRBENCH_LFR_PARAMETERS_HPP

#include <iosfwd>

#include <lfrbench/defs.hpp>

namespace lfrbench {

struct LFRParameters {
    double tau1{2.5};       // exponent of the degree distribution
    double tau2{1.5};       // exponent of the community size distribution
    double mu{0.2};         // target fraction of inter-community edges per node
    count min_degree{5};
    count max_degree{20};
    double avg_degree{12.5};
    count min_community{10};
    count max_community{50};
    bool symmetrical{false}; // directed graphs only: mirror every edge

    uint64_t seed{0};

    //! relative deviation of the sampled mean degree from avg_degree that triggers rescaling
    double rescale_threshold{0.15};
    //! edge construction stops after iteration_factor * target_edges rounds
    count iteration_factor{3};

    //! throws ParameterError naming the first violated constraint
    void validate() const;

    //! sets avg_degree to the midpoint of [min_degree, max_degree]
    LFRParameters &with_default_average_degree() {
        avg_degree = (static_cast<double>(min_degree) + static_cast<double>(max_degree)) / 2.0;
        return *this;
    }
};

std::ostream &operator<<(std::ostream &os, const LFRParameters &params);

}

#endif // LFRBENCH_LFR_PARAMETERS_HPP
