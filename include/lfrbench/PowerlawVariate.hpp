#ifndef LFRBENCH_POWERLAW_VARIATE_HPP
#define LFRBENCH_POWERLAW_VARIATE_HPP

#include <vector>
#include <random>

#include <lfrbench/defs.hpp>

namespace lfrbench {

/**
 * Bounded power law P(x) ~ x^-tau on [lo, hi], sampled by inverse transform of the continuous
 * distribution followed by rounding and clamping. Exponents within kDegenerateTolerance of 1
 * degrade to a discrete uniform distribution on [lo, hi].
 */
class PowerlawVariate {
public:
    static constexpr double kDegenerateTolerance = 1e-10;

    PowerlawVariate(count lo, count hi, double tau);

    //! maps a uniform draw u in [0, 1) onto the distribution; pure
    [[nodiscard]] count from_uniform(double u) const noexcept;

    count operator()(std::mt19937_64 &gen) const {
        return from_uniform(std::uniform_real_distribution<double>{0, 1}(gen));
    }

    std::vector<count> sample(count num_samples, std::mt19937_64 &gen) const;

    [[nodiscard]] count lo() const noexcept { return lo_; }
    [[nodiscard]] count hi() const noexcept { return hi_; }
    [[nodiscard]] double tau() const noexcept { return tau_; }
    [[nodiscard]] bool is_uniform() const noexcept { return uniform_; }

    //! probability mass the sampler assigns to value x; used to check the fit
    [[nodiscard]] double probability(count x) const noexcept;

private:
    count lo_, hi_;
    double tau_;
    double exponent_; // 1 - tau
    double lo_pow_, hi_pow_;
    bool uniform_;

    [[nodiscard]] double cdf(double x) const noexcept;
};

}

#endif //LFRBENCH_POWERLAW_VARIATE_HPP
