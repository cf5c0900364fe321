#pragma once

/// @file include/gwbkit/density_grid.hpp
/// @brief Grid/Sample reconciliation: semi-analytic population grids.
///
/// # Module: Grid/Sample Reconciliation
///
/// ## Responsibility
/// Compute the GW background of a population given as a number density on a
/// regular (log10 M, q, z, f_gw) grid, by three independent pathways:
///   (a) direct integration of every cell at its centroid,
///   (b) analytic treatment of dense cells plus discrete sampling of sparse
///       ("outlier") cells,
///   (c) cell centroids fed through the GWB Realization Engine.
/// Pathways (b) and (c) scatter around (a) with O(1/sqrt(R)) noise.
///
/// The density is interpolated multilinearly inside each cell, with the
/// frequency axis taken in ln f.
///
/// ## Guarantees
/// - `DensityGrid::validate()` runs before any computation.
/// - All pathways are deterministic for a fixed seed.
///
/// ## NOT Responsible For
/// - Building the density from a population model.

#include "gwbkit/cosmology.hpp"
#include "gwbkit/realization.hpp"

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace gwbkit::grid {

/// Number of grid dimensions: log10 M, q, z, f_gw.
inline constexpr std::size_t NDIM = 4;

/// Number of corners of one grid cell.
inline constexpr std::size_t NCORNERS = std::size_t{1} << NDIM;

// ─── DensityGrid ──────────────────────────────────────────────────────────────

/// Differential number density `d4N / (dlog10M dq dz dlnf)` tabulated at the
/// grid points, in C order with shape (nM+1, nq+1, nz+1, nf+1).
struct DensityGrid {
    std::vector<double> log10_mass_edges;  ///< log10 of total mass [g]
    std::vector<double> mrat_edges;        ///< Mass ratio q = m2 / m1
    std::vector<double> redz_edges;        ///< Redshift
    std::vector<double> fobs_gw_edges;     ///< Observed GW frequency [Hz]
    std::vector<double> density;

    [[nodiscard]] std::array<std::size_t, NDIM> num_points() const noexcept {
        return {log10_mass_edges.size(), mrat_edges.size(),
                redz_edges.size(), fobs_gw_edges.size()};
    }

    [[nodiscard]] std::size_t num_freq_bins() const noexcept {
        return fobs_gw_edges.empty() ? 0 : fobs_gw_edges.size() - 1;
    }

    /// Flat index of grid point (i, j, k, l).
    [[nodiscard]] std::size_t index(std::size_t i, std::size_t j,
                                    std::size_t k, std::size_t l) const noexcept {
        return ((i * mrat_edges.size() + j) * redz_edges.size() + k)
               * fobs_gw_edges.size() + l;
    }

    /// # Throws
    /// `std::invalid_argument` if any edge array has fewer than 2 entries or
    /// is not strictly increasing and positive, or the density has the wrong
    /// size or holds negative or non-finite values.
    void validate() const;
};

// ─── Multilinear cells ────────────────────────────────────────────────────────

/// Mass-weighted centre of the multilinear density defined by `corners` on
/// the box [lo, hi].
///
/// `corners` holds 2^D values; bit (D-1-d) of the corner index selects the
/// low (0) or high (1) face of dimension d, i.e. C order. Per dimension,
///
///     x_d = lo_d + (hi_d - lo_d) (rho0 + 2 rho1) / (3 (rho0 + rho1))
///
/// with rho0 / rho1 the mean corner value on the low / high face. An empty
/// cell (all corners zero) yields the midpoint.
///
/// # Throws
/// `std::invalid_argument` if the sizes are inconsistent.
[[nodiscard]] std::vector<double>
multilinear_centroid(std::span<const double> corners,
                     std::span<const double> lo,
                     std::span<const double> hi);

/// Draw one point from the multilinear density on [lo, hi] by sequential
/// conditional inverse-CDF sampling. Empty cells are sampled uniformly.
[[nodiscard]] std::vector<double>
sample_in_cell(std::span<const double> corners,
               std::span<const double> lo,
               std::span<const double> hi,
               std::mt19937_64& rng);

/// One cell of a `DensityGrid`.
struct GridCell {
    std::array<std::size_t, NDIM> index;  ///< Low-corner grid indices
    std::array<double, NDIM> lo;          ///< (log10 M, q, z, ln f) lower bounds
    std::array<double, NDIM> hi;          ///< (log10 M, q, z, ln f) upper bounds
    std::array<double, NCORNERS> corners; ///< Density at the 16 corners
    std::array<double, NDIM> centroid;    ///< (log10 M, q, z, f_gw)
    double number;                        ///< Expected number of binaries
    double dlnf;                          ///< ln f width of the frequency bin
};

/// Expected number (trapezoid rule) and centroid of every cell.
[[nodiscard]] std::vector<GridCell> integrate_cells(const DensityGrid& grid);

// ─── GridIntegrator ───────────────────────────────────────────────────────────

/// Three pathways from a density grid to `h_c^2(f)`.
///
/// Binaries are circular: only the n = 2 harmonic radiates, at rest-frame
/// orbital frequency f_gw (1 + z) / 2.
class GridIntegrator {
public:
    explicit GridIntegrator(cosmology::Cosmology cosmo);

    /// Squared source strain of a circular binary at a grid-space point
    /// (log10 M, q, z, f_gw).
    [[nodiscard]] double source_strain2(std::span<const double> point) const;

    /// Pathway (a): expected `h_c^2` per frequency bin, every cell evaluated
    /// at its centroid.
    [[nodiscard]] Eigen::VectorXd strain2(const DensityGrid& grid) const;

    /// Pathway (b): cells whose expected number is at least `threshold`
    /// contribute analytically at their centroid; sparser cells draw a
    /// Poisson count and place each binary inside the cell.
    ///
    /// # Returns
    /// `h_c^2` with shape (nfreqs, nreals).
    [[nodiscard]] Eigen::MatrixXd
    sample_outliers(const DensityGrid& grid, double threshold,
                    std::size_t nreals, std::uint64_t seed) const;

    /// Pathway (c): cell centroids as occupation cells, drawn by
    /// `GwbRealizer::realize_occupations` with `config`.
    [[nodiscard]] Eigen::MatrixXd
    realize(const DensityGrid& grid, const realization::RealizationConfig& config) const;

private:
    cosmology::Cosmology cosmo_;
};

} // namespace gwbkit::grid
