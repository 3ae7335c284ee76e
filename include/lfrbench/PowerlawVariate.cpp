#include <lfrbench/PowerlawVariate.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lfrbench {

PowerlawVariate::PowerlawVariate(count lo, count hi, double tau)
    : lo_(lo), hi_(hi), tau_(tau), exponent_(1.0 - tau), lo_pow_(0), hi_pow_(0),
      uniform_(std::abs(1.0 - tau) < kDegenerateTolerance) {
    if (lo > hi) throw std::invalid_argument("Error: lo must not be larger than hi");
    if (!uniform_ && lo == 0) throw std::invalid_argument("Error: a power law needs a positive lower bound");

    if (!uniform_) {
        lo_pow_ = std::pow(static_cast<double>(lo_), exponent_);
        hi_pow_ = std::pow(static_cast<double>(hi_), exponent_);
    }
}

count PowerlawVariate::from_uniform(double u) const noexcept {
    if (uniform_) {
        const count span = hi_ - lo_ + 1;
        const auto offset = static_cast<count>(std::floor(u * static_cast<double>(span)));
        return lo_ + std::min(offset, span - 1);
    }

    const double x = lo_pow_ + u * (hi_pow_ - lo_pow_);
    const double value = std::round(std::pow(x, 1.0 / exponent_));

    if (!(value >= static_cast<double>(lo_))) return lo_; // also catches NaN
    if (value >= static_cast<double>(hi_)) return hi_;
    return static_cast<count>(value);
}

std::vector<count> PowerlawVariate::sample(count num_samples, std::mt19937_64 &gen) const {
    std::vector<count> values;
    values.reserve(num_samples);
    for (count i = 0; i < num_samples; ++i)
        values.push_back((*this)(gen));
    return values;
}

double PowerlawVariate::cdf(double x) const noexcept {
    if (x <= static_cast<double>(lo_)) return 0.0;
    if (x >= static_cast<double>(hi_)) return 1.0;
    return (std::pow(x, exponent_) - lo_pow_) / (hi_pow_ - lo_pow_);
}

double PowerlawVariate::probability(count x) const noexcept {
    if (x < lo_ || x > hi_) return 0.0;
    if (uniform_) return 1.0 / static_cast<double>(hi_ - lo_ + 1);
    if (lo_ == hi_) return 1.0;

    // rounding maps [x - 0.5, x + 0.5) onto x
    const double center = static_cast<double>(x);
    return cdf(center + 0.5) - cdf(center - 0.5);
}

}
