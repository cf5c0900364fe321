/**
 * @file  prop_centroid_bounds.cpp
 * @brief Property: cell centroids and in-cell samples never leave the cell.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_centroid_bounds
 *
 * The density inside a cell is the multilinear interpolant of its 2^D
 * non-negative corner values. Its centroid is a convex combination of
 * points in the box, and the sequential inverse-CDF sampler maps [0, 1)
 * onto each edge, so both must stay inside [lo, hi] in every dimension.
 */

#include <rapidcheck.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "gwbkit/density_grid.hpp"

using namespace gwbkit::grid;

namespace {

struct Box {
    std::vector<double> corners;
    std::vector<double> lo;
    std::vector<double> hi;
};

/// Random D-dimensional cell with integer-valued corner densities, some of
/// them zero.
Box gen_box(std::size_t ndim) {
    Box box;
    const std::size_t ncorners = std::size_t{1} << ndim;
    for (std::size_t c = 0; c < ncorners; ++c) {
        const int v = *rc::gen::inRange(-20, 100);
        box.corners.push_back(v < 0 ? 0.0 : static_cast<double>(v));
    }
    for (std::size_t d = 0; d < ndim; ++d) {
        const double lo = static_cast<double>(*rc::gen::inRange(-1000, 1000)) / 10.0;
        const double width = static_cast<double>(*rc::gen::inRange(1, 500)) / 100.0;
        box.lo.push_back(lo);
        box.hi.push_back(lo + width);
    }
    return box;
}

}  // namespace

int main() {
    // ── Property 1: centroid inside the cell ────────────────────────────────
    rc::check(
        "centroid_bounds: lo <= centroid <= hi",
        []() {
            const auto ndim = *rc::gen::inRange<std::size_t>(1, 5);
            const auto box = gen_box(ndim);
            const auto c = multilinear_centroid(box.corners, box.lo, box.hi);
            RC_ASSERT(c.size() == ndim);
            for (std::size_t d = 0; d < ndim; ++d) {
                RC_ASSERT(std::isfinite(c[d]));
                RC_ASSERT(c[d] >= box.lo[d]);
                RC_ASSERT(c[d] <= box.hi[d]);
            }
        }
    );

    // ── Property 2: samples inside the cell ─────────────────────────────────
    rc::check(
        "centroid_bounds: sampled points stay in the cell",
        []() {
            const auto ndim = *rc::gen::inRange<std::size_t>(1, 5);
            const auto box = gen_box(ndim);
            std::mt19937_64 rng(*rc::gen::arbitrary<std::uint64_t>());
            for (int i = 0; i < 50; ++i) {
                const auto p = sample_in_cell(box.corners, box.lo, box.hi, rng);
                RC_ASSERT(p.size() == ndim);
                for (std::size_t d = 0; d < ndim; ++d) {
                    RC_ASSERT(std::isfinite(p[d]));
                    RC_ASSERT(p[d] >= box.lo[d]);
                    RC_ASSERT(p[d] <= box.hi[d]);
                }
            }
        }
    );

    // ── Property 3: scaling every corner leaves the centroid unchanged ──────
    rc::check(
        "centroid_bounds: centroid is invariant under density scaling",
        []() {
            const auto ndim = *rc::gen::inRange<std::size_t>(1, 5);
            auto box = gen_box(ndim);
            const auto c1 = multilinear_centroid(box.corners, box.lo, box.hi);
            for (double& v : box.corners) v *= 7.5;
            const auto c2 = multilinear_centroid(box.corners, box.lo, box.hi);
            for (std::size_t d = 0; d < ndim; ++d) {
                const double width = box.hi[d] - box.lo[d];
                RC_ASSERT(std::abs(c1[d] - c2[d]) <= 1e-12 * (std::abs(c1[d]) + width));
            }
        }
    );

    return 0;
}
