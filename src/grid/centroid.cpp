/// @file src/grid/centroid.cpp
/// @brief Centroid and point sampling of multilinear densities on a box.

#include "gwbkit/density_grid.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gwbkit::grid {

namespace {

constexpr std::size_t MAX_DIMS = 16;

void check_shape(std::span<const double> corners, std::span<const double> lo,
                 std::span<const double> hi) {
    const std::size_t ndim = lo.size();
    if (ndim == 0 || ndim > MAX_DIMS || hi.size() != ndim
        || corners.size() != (std::size_t{1} << ndim)) {
        throw std::invalid_argument(fmt::format(
            "multilinear cell: {} corners do not match bounds of size {} and {}",
            corners.size(), lo.size(), hi.size()));
    }
}

/// Mean corner value on the low and high face of dimension `dim`.
void face_means(std::span<const double> corners, std::size_t ndim, std::size_t dim,
                double& rho0, double& rho1) noexcept {
    const std::size_t bit = std::size_t{1} << (ndim - 1 - dim);
    double s0 = 0.0;
    double s1 = 0.0;
    for (std::size_t c = 0; c < corners.size(); ++c) {
        ((c & bit) ? s1 : s0) += corners[c];
    }
    const double half = static_cast<double>(corners.size() / 2);
    rho0 = s0 / half;
    rho1 = s1 / half;
}

/// Inverse CDF of the density a + (b - a) t on [0, 1], at quantile u.
[[nodiscard]] double linear_inverse_cdf(double a, double b, double u) noexcept {
    const double sum = a + b;
    if (!(sum > 0.0)) {
        return u;
    }
    const double slope = b - a;
    if (std::abs(slope) <= 1e-12 * sum) {
        return u;
    }
    const double disc = a * a + slope * u * sum;
    const double t = (-a + std::sqrt(std::max(disc, 0.0))) / slope;
    return std::clamp(t, 0.0, 1.0);
}

}  // namespace

std::vector<double> multilinear_centroid(std::span<const double> corners,
                                         std::span<const double> lo,
                                         std::span<const double> hi) {
    check_shape(corners, lo, hi);
    const std::size_t ndim = lo.size();

    std::vector<double> centroid(ndim);
    for (std::size_t d = 0; d < ndim; ++d) {
        double rho0 = 0.0;
        double rho1 = 0.0;
        face_means(corners, ndim, d, rho0, rho1);
        const double width = hi[d] - lo[d];
        const double sum = rho0 + rho1;
        if (sum > 0.0) {
            centroid[d] = lo[d] + width * (rho0 + 2.0 * rho1) / (3.0 * sum);
        } else {
            centroid[d] = lo[d] + 0.5 * width;
        }
    }
    return centroid;
}

std::vector<double> sample_in_cell(std::span<const double> corners,
                                   std::span<const double> lo,
                                   std::span<const double> hi,
                                   std::mt19937_64& rng) {
    check_shape(corners, lo, hi);
    const std::size_t ndim = lo.size();
    std::uniform_real_distribution<double> unif(0.0, 1.0);

    // Marginal along the leading dimension is linear; conditioning on the
    // drawn value collapses the corners onto the remaining dimensions.
    std::vector<double> work(corners.begin(), corners.end());
    std::vector<double> point(ndim);
    for (std::size_t d = 0; d < ndim; ++d) {
        const std::size_t remaining = ndim - d;
        double rho0 = 0.0;
        double rho1 = 0.0;
        face_means(work, remaining, 0, rho0, rho1);

        const double t = linear_inverse_cdf(rho0, rho1, unif(rng));
        point[d] = std::clamp(lo[d] + t * (hi[d] - lo[d]), lo[d], hi[d]);

        const std::size_t half = work.size() / 2;
        for (std::size_t c = 0; c < half; ++c) {
            work[c] = (1.0 - t) * work[c] + t * work[c + half];
        }
        work.resize(half);
    }
    return point;
}

} // namespace gwbkit::grid
