/// @file src/grid/density_grid.cpp
/// @brief Cell integration and the three grid-to-GWB pathways.

#include "gwbkit/density_grid.hpp"
#include "gwbkit/physics.hpp"
#include "gwbkit/types.hpp"

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace gwbkit::grid {

// ─── DensityGrid ──────────────────────────────────────────────────────────────

void DensityGrid::validate() const {
    const std::array<std::pair<const std::vector<double>*, const char*>, NDIM> axes{{
        {&log10_mass_edges, "DensityGrid: log10 mass edges"},
        {&mrat_edges,       "DensityGrid: mass-ratio edges"},
        {&redz_edges,       "DensityGrid: redshift edges"},
        {&fobs_gw_edges,    "DensityGrid: frequency edges"},
    }};
    std::size_t expected = 1;
    for (const auto& [edges, what] : axes) {
        if (edges->size() < 2) {
            throw std::invalid_argument(fmt::format("{} need at least 2 entries (got {})",
                                                    what, edges->size()));
        }
        require_increasing(*edges, what);
        expected *= edges->size();
    }
    if (density.size() != expected) {
        throw std::invalid_argument(fmt::format(
            "DensityGrid: density has {} values, grid has {} points", density.size(), expected));
    }
    for (std::size_t i = 0; i < density.size(); ++i) {
        if (!std::isfinite(density[i]) || density[i] < 0.0) {
            throw std::invalid_argument(fmt::format(
                "DensityGrid: density[{}] = {} is not a finite non-negative number",
                i, density[i]));
        }
    }
}

// ─── Cell integration ─────────────────────────────────────────────────────────

std::vector<GridCell> integrate_cells(const DensityGrid& grid) {
    grid.validate();
    const auto npts = grid.num_points();

    std::vector<GridCell> cells;
    cells.reserve((npts[0] - 1) * (npts[1] - 1) * (npts[2] - 1) * (npts[3] - 1));

    for (std::size_t i = 0; i + 1 < npts[0]; ++i) {
    for (std::size_t j = 0; j + 1 < npts[1]; ++j) {
    for (std::size_t k = 0; k + 1 < npts[2]; ++k) {
    for (std::size_t l = 0; l + 1 < npts[3]; ++l) {
        GridCell cell{};
        cell.index = {i, j, k, l};
        cell.lo = {grid.log10_mass_edges[i], grid.mrat_edges[j], grid.redz_edges[k],
                   std::log(grid.fobs_gw_edges[l])};
        cell.hi = {grid.log10_mass_edges[i + 1], grid.mrat_edges[j + 1],
                   grid.redz_edges[k + 1], std::log(grid.fobs_gw_edges[l + 1])};

        double sum = 0.0;
        for (std::size_t c = 0; c < NCORNERS; ++c) {
            const double rho = grid.density[grid.index(i + ((c >> 3) & 1U),
                                                       j + ((c >> 2) & 1U),
                                                       k + ((c >> 1) & 1U),
                                                       l + (c & 1U))];
            cell.corners[c] = rho;
            sum += rho;
        }

        double volume = 1.0;
        for (std::size_t d = 0; d < NDIM; ++d) {
            volume *= cell.hi[d] - cell.lo[d];
        }
        cell.dlnf   = cell.hi[3] - cell.lo[3];
        cell.number = sum / static_cast<double>(NCORNERS) * volume;

        const auto centroid = multilinear_centroid(cell.corners, cell.lo, cell.hi);
        cell.centroid = {centroid[0], centroid[1], centroid[2], std::exp(centroid[3])};
        cells.push_back(cell);
    }
    }
    }
    }
    return cells;
}

// ─── GridIntegrator ───────────────────────────────────────────────────────────

GridIntegrator::GridIntegrator(cosmology::Cosmology cosmo)
    : cosmo_(std::move(cosmo)) {}

double GridIntegrator::source_strain2(std::span<const double> point) const {
    if (point.size() != NDIM) {
        throw std::invalid_argument(fmt::format(
            "GridIntegrator: grid point needs {} coordinates (got {})", NDIM, point.size()));
    }
    const double redz = point[2];
    if (!(redz > 0.0)) {
        return 0.0;
    }
    const double mtot   = std::pow(10.0, point[0]);
    const auto   masses = physics::m1m2_from_mtmr(mtot, point[1]);
    const double mchirp = physics::chirp_mass(masses.m1, masses.m2);
    const double frst_orb = physics::frst_from_fobs(point[3], redz) / 2.0;
    const double hs = physics::gw_strain_source(mchirp, cosmo_.comoving_distance(redz), frst_orb);
    return hs * hs;
}

Eigen::VectorXd GridIntegrator::strain2(const DensityGrid& grid) const {
    const auto cells = integrate_cells(grid);
    Eigen::VectorXd hc2 = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(grid.num_freq_bins()));
    for (const auto& cell : cells) {
        hc2(static_cast<Eigen::Index>(cell.index[3])) +=
            cell.number * source_strain2(cell.centroid) / cell.dlnf;
    }
    return hc2;
}

Eigen::MatrixXd GridIntegrator::sample_outliers(const DensityGrid& grid, double threshold,
                                                std::size_t nreals, std::uint64_t seed) const {
    if (nreals == 0) {
        throw std::invalid_argument("GridIntegrator::sample_outliers: nreals must be positive");
    }
    if (!std::isfinite(threshold) || threshold < 0.0) {
        throw std::invalid_argument(fmt::format(
            "GridIntegrator::sample_outliers: invalid threshold {}", threshold));
    }

    const auto cells = integrate_cells(grid);
    const std::size_t nfreqs = grid.num_freq_bins();
    Eigen::MatrixXd hc2 = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nfreqs),
                                                static_cast<Eigen::Index>(nreals));

    std::vector<std::vector<const GridCell*>> sparse(nfreqs);
    for (const auto& cell : cells) {
        const auto f = static_cast<Eigen::Index>(cell.index[3]);
        if (cell.number >= threshold) {
            hc2.row(f).array() += cell.number * source_strain2(cell.centroid) / cell.dlnf;
        } else if (cell.number > 0.0) {
            sparse[cell.index[3]].push_back(&cell);
        }
    }

#pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t fi = 0; fi < static_cast<std::ptrdiff_t>(nfreqs); ++fi) {
        std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffULL),
                          static_cast<std::uint32_t>(seed >> 32),
                          static_cast<std::uint32_t>(fi)};
        std::mt19937_64 rng(seq);

        for (const GridCell* cell : sparse[static_cast<std::size_t>(fi)]) {
            std::poisson_distribution<long long> poisson(cell->number);
            for (std::size_t r = 0; r < nreals; ++r) {
                const long long count = poisson(rng);
                for (long long b = 0; b < count; ++b) {
                    const auto p = sample_in_cell(cell->corners, cell->lo, cell->hi, rng);
                    const std::array<double, NDIM> point{p[0], p[1], p[2], std::exp(p[3])};
                    hc2(fi, static_cast<Eigen::Index>(r)) += source_strain2(point) / cell->dlnf;
                }
            }
        }
    }
    return hc2;
}

Eigen::MatrixXd GridIntegrator::realize(const DensityGrid& grid,
                                        const realization::RealizationConfig& config) const {
    const auto cells = integrate_cells(grid);

    std::vector<realization::OccupationCell> occ;
    occ.reserve(cells.size());
    for (const auto& cell : cells) {
        occ.push_back(realization::OccupationCell{
            .freq_index     = cell.index[3],
            .harmonic_index = 0,
            .strain2        = source_strain2(cell.centroid),
            .num_binaries   = cell.number,
            .dlnf           = cell.dlnf,
        });
    }

    realization::GwbRealizer realizer(config, cosmo_);
    return realizer.realize_occupations(occ, grid.num_freq_bins(), 1).harmonic_sum();
}

} // namespace gwbkit::grid
