/// @file src/realization/occupation_sampler.cpp
/// @brief Poisson / clipped-Gaussian draws of discrete binary counts.

#include "gwbkit/realization.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gwbkit::realization {

OccupationSampler::OccupationSampler(double threshold, std::uint64_t seed)
    : threshold_(threshold), rng_(seed) {}

OccupationSampler::OccupationSampler(double threshold, std::seed_seq& seq)
    : threshold_(threshold), rng_(seq) {}

double OccupationSampler::draw(double num) {
    if (!std::isfinite(num) || num < 0.0) {
        throw std::domain_error(fmt::format(
            "OccupationSampler: expected occupation must be finite and non-negative (got {})",
            num));
    }
    if (num == 0.0) {
        return 0.0;
    }

    if (num > threshold_) {
        ++gaussian_draws_;
        std::normal_distribution<double> gauss(num, std::sqrt(num));
        return std::max(0.0, gauss(rng_));
    }

    ++poisson_draws_;
    std::poisson_distribution<long long> poisson(num);
    return static_cast<double>(poisson(rng_));
}

} // namespace gwbkit::realization
