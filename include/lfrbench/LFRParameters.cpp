#include <lfrbench/LFRParameters.hpp>

#include <ostream>

namespace lfrbench {

void LFRParameters::validate() const {
    if (!(tau1 > 1.0))
        throw ParameterError("tau1", "tau1 must be greater than 1");
    if (!(tau2 > 1.0))
        throw ParameterError("tau2", "tau2 must be greater than 1");
    if (!(mu >= 0.0 && mu <= 1.0))
        throw ParameterError("mu", "mu must be between 0 and 1");
    if (min_degree < 1)
        throw ParameterError("min_degree", "min_degree must be at least 1");
    if (max_degree < min_degree)
        throw ParameterError("max_degree", "max_degree must be >= min_degree");
    if (!(avg_degree >= static_cast<double>(min_degree) && avg_degree <= static_cast<double>(max_degree)))
        throw ParameterError("avg_degree", "avg_degree must be between min_degree and max_degree");
    if (min_community < 1)
        throw ParameterError("min_community", "min_community must be at least 1");
    if (max_community < min_community)
        throw ParameterError("max_community", "max_community must be >= min_community");
    if (!(rescale_threshold > 0.0))
        throw ParameterError("rescale_threshold", "rescale_threshold must be positive");
    if (iteration_factor < 1)
        throw ParameterError("iteration_factor", "iteration_factor must be at least 1");
}

std::ostream &operator<<(std::ostream &os, const LFRParameters &params) {
    return os << "tau1=" << params.tau1
              << " tau2=" << params.tau2
              << " mu=" << params.mu
              << " deg=[" << params.min_degree << "," << params.max_degree << "]"
              << " avg_deg=" << params.avg_degree
              << " com=[" << params.min_community << "," << params.max_community << "]"
              << " sym=" << params.symmetrical
              << " seed=" << params.seed;
}

}
