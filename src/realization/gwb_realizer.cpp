/// @file src/realization/gwb_realizer.cpp
/// @brief Occupation cells, realization draws and foreground/background split.

#include "gwbkit/realization.hpp"
#include "gwbkit/physics.hpp"
#include "gwbkit/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace gwbkit::realization {

namespace {

void validate_grid(std::span<const double> fobs_gw_edges, std::span<const int> harmonics) {
    if (fobs_gw_edges.size() < 2) {
        throw std::invalid_argument(fmt::format(
            "GwbRealizer: need at least 2 frequency edges (got {})", fobs_gw_edges.size()));
    }
    require_increasing(fobs_gw_edges, "GwbRealizer: frequency edges");
    if (harmonics.empty()) {
        throw std::invalid_argument("GwbRealizer: harmonics must not be empty");
    }
    for (int n : harmonics) {
        if (n < 1) {
            throw std::invalid_argument(fmt::format(
                "GwbRealizer: harmonic numbers must be positive (got {})", n));
        }
    }
}

}  // namespace

// ─── GwbRealizations ──────────────────────────────────────────────────────────

GwbRealizations::GwbRealizations(std::size_t nfreqs, std::size_t nharms, std::size_t nreals)
    : nfreqs_(nfreqs), nharms_(nharms), nreals_(nreals),
      values_(Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nfreqs * nharms),
                                    static_cast<Eigen::Index>(nreals))) {}

Eigen::MatrixXd GwbRealizations::harmonic_sum() const {
    Eigen::MatrixXd out = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nfreqs_),
                                                static_cast<Eigen::Index>(nreals_));
    for (std::size_t f = 0; f < nfreqs_; ++f) {
        out.row(static_cast<Eigen::Index>(f)) =
            values_.middleRows(row(f, 0), static_cast<Eigen::Index>(nharms_)).colwise().sum();
    }
    return out;
}

Eigen::MatrixXd GwbRealizations::characteristic_strain() const {
    return harmonic_sum().array().sqrt().matrix();
}

Eigen::VectorXd median_over_realizations(const Eigen::MatrixXd& values) {
    Eigen::VectorXd med = Eigen::VectorXd::Zero(values.rows());
    if (values.cols() == 0) {
        return med;
    }
    std::vector<double> buf(static_cast<std::size_t>(values.cols()));
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        for (Eigen::Index r = 0; r < values.cols(); ++r) {
            buf[static_cast<std::size_t>(r)] = values(i, r);
        }
        const std::size_t mid = buf.size() / 2;
        std::nth_element(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(mid), buf.end());
        double m = buf[mid];
        if (buf.size() % 2 == 0) {
            const double below = *std::max_element(buf.begin(),
                                                   buf.begin() + static_cast<std::ptrdiff_t>(mid));
            m = 0.5 * (m + below);
        }
        med(i) = m;
    }
    return med;
}

// ─── GwbRealizer ──────────────────────────────────────────────────────────────

GwbRealizer::GwbRealizer(RealizationConfig config, cosmology::Cosmology cosmo)
    : config_(std::move(config)), cosmo_(std::move(cosmo)) {
    if (config_.nreals == 0) {
        throw std::invalid_argument("GwbRealizer: nreals must be positive");
    }
    if (!(config_.gaussian_threshold > 0.0)) {
        throw std::invalid_argument(fmt::format(
            "GwbRealizer: gaussian_threshold must be positive (got {})",
            config_.gaussian_threshold));
    }
    if (!(config_.survey_volume > 0.0) || !std::isfinite(config_.survey_volume)) {
        throw std::invalid_argument(fmt::format(
            "GwbRealizer: survey_volume must be positive and finite (got {})",
            config_.survey_volume));
    }
}

OccupationSet GwbRealizer::occupations(const resample::EventTable& events,
                                       std::span<const double> fobs_gw_edges,
                                       std::span<const int> harmonics) const {
    validate_grid(fobs_gw_edges, harmonics);
    const auto centers = bin_centers(fobs_gw_edges);
    const auto dlnf    = bin_dlnf(fobs_gw_edges);

    if (events.num_targets != centers.size() || events.num_harmonics != harmonics.size()) {
        throw std::invalid_argument(fmt::format(
            "GwbRealizer::occupations: event table is {} x {} but the grid is {} x {}",
            events.num_targets, events.num_harmonics, centers.size(), harmonics.size()));
    }

    OccupationSet set;
    set.nfreqs = centers.size();
    set.nharms = harmonics.size();
    set.cells.reserve(events.size());

    for (const auto& ev : events.events) {
        if (ev.freq_index >= set.nfreqs || ev.harmonic_index >= set.nharms) {
            throw std::invalid_argument(fmt::format(
                "GwbRealizer::occupations: event index ({}, {}) outside {} x {} grid",
                ev.freq_index, ev.harmonic_index, set.nfreqs, set.nharms));
        }
        if (!(ev.redz > 0.0)) {
            ++set.stats.excluded_future;
            continue;
        }

        const int    nharm    = harmonics[ev.harmonic_index];
        const double zp1      = 1.0 + ev.redz;
        const double frst_orb = centers[ev.freq_index] * zp1 / nharm;

        const double mchirp = physics::chirp_mass(ev.mass1, ev.mass2);
        const double dcom   = cosmo_.comoving_distance(ev.redz);
        const double hs     = physics::gw_strain_source(mchirp, dcom, frst_orb);
        const double gne    = physics::eccentricity_harmonic_weight(
            nharm, ev.eccen, config_.min_eccen_circular);
        const double two_over_n = 2.0 / nharm;
        const double strain2 = hs * hs * gne * two_over_n * two_over_n;

        const auto deriv  = physics::dfdt_from_dadt(ev.dadt, ev.sepa, frst_orb);
        const auto lambda = physics::lambda_factor_dlnf(frst_orb, std::abs(deriv.dfdt),
                                                        ev.redz, dcom);
        if (!lambda || !std::isfinite(strain2)) {
            ++set.stats.excluded_nonfinite;
            continue;
        }

        const double num = *lambda / config_.survey_volume * dlnf[ev.freq_index];
        if (!std::isfinite(num)) {
            ++set.stats.excluded_nonfinite;
            continue;
        }

        set.cells.push_back(OccupationCell{
            .freq_index     = ev.freq_index,
            .harmonic_index = ev.harmonic_index,
            .strain2        = strain2,
            .num_binaries   = num,
            .dlnf           = dlnf[ev.freq_index],
        });
        ++set.stats.events_used;
    }

    if (config_.verbose) {
        fmt::print(stderr,
                   "[realizer] {} events used, {} excluded (non-finite), {} excluded (z <= 0)\n",
                   set.stats.events_used, set.stats.excluded_nonfinite,
                   set.stats.excluded_future);
    }
    return set;
}

GwbRealizer::DrawOutput GwbRealizer::draw_cells(std::span<const OccupationCell> cells,
                                                std::size_t nfreqs, std::size_t nharms) const {
    // ── Validate everything before entering the parallel region ──────────────
    std::vector<std::vector<std::size_t>> by_freq(nfreqs);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        const auto& c = cells[i];
        if (c.freq_index >= nfreqs || c.harmonic_index >= nharms) {
            throw std::invalid_argument(fmt::format(
                "GwbRealizer: cell {} index ({}, {}) outside {} x {} grid",
                i, c.freq_index, c.harmonic_index, nfreqs, nharms));
        }
        if (!(c.dlnf > 0.0) || !std::isfinite(c.dlnf)) {
            throw std::invalid_argument(fmt::format(
                "GwbRealizer: cell {} has invalid dlnf {}", i, c.dlnf));
        }
        if (!(c.strain2 >= 0.0) || !std::isfinite(c.strain2)) {
            throw std::invalid_argument(fmt::format(
                "GwbRealizer: cell {} has invalid strain2 {}", i, c.strain2));
        }
        if (!std::isfinite(c.num_binaries) || c.num_binaries < 0.0) {
            throw std::domain_error(fmt::format(
                "GwbRealizer: cell {} has invalid occupation {}", i, c.num_binaries));
        }
        by_freq[c.freq_index].push_back(i);
    }

    const std::size_t nreals = config_.nreals;
    const std::size_t nloud  = config_.nloudest;
    // The foreground needs rank 0 even when no loudest list is requested.
    const std::size_t ntop   = std::max<std::size_t>(nloud, 1);
    DrawOutput out{
        .total      = GwbRealizations(nfreqs, nharms, nreals),
        .foreground = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nfreqs),
                                            static_cast<Eigen::Index>(nreals)),
        .loudest    = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nfreqs * nloud),
                                            static_cast<Eigen::Index>(nreals)),
    };
    std::vector<std::size_t> gaussian(nfreqs, 0);
    std::vector<std::size_t> poisson(nfreqs, 0);

    // One independent stream per frequency bin; every bin writes only its own
    // rows, so the result is the same for any thread count.
#pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t fi = 0; fi < static_cast<std::ptrdiff_t>(nfreqs); ++fi) {
        const auto f = static_cast<std::size_t>(fi);
        std::seed_seq seq{static_cast<std::uint32_t>(config_.seed & 0xffffffffULL),
                          static_cast<std::uint32_t>(config_.seed >> 32),
                          static_cast<std::uint32_t>(f)};
        OccupationSampler sampler(config_.gaussian_threshold, seq);

        // Descending top-`ntop` list of occupied sources per realization.
        std::vector<double> top(nreals * ntop, 0.0);

        for (std::size_t idx : by_freq[f]) {
            const auto& c = cells[idx];
            const double per_source = c.strain2 / c.dlnf;
            for (std::size_t r = 0; r < nreals; ++r) {
                const double count = sampler.draw(c.num_binaries);
                if (count <= 0.0) continue;
                out.total.at(f, c.harmonic_index, r) += count * per_source;

                double* list = top.data() + r * ntop;
                if (per_source > list[ntop - 1]) {
                    std::size_t pos = ntop - 1;
                    while (pos > 0 && list[pos - 1] < per_source) {
                        list[pos] = list[pos - 1];
                        --pos;
                    }
                    list[pos] = per_source;
                }
            }
        }

        for (std::size_t r = 0; r < nreals; ++r) {
            const auto col = static_cast<Eigen::Index>(r);
            out.foreground(fi, col) = top[r * ntop];
            for (std::size_t l = 0; l < nloud; ++l) {
                out.loudest(static_cast<Eigen::Index>(f * nloud + l), col) = top[r * ntop + l];
            }
        }
        gaussian[f] = sampler.gaussian_draws();
        poisson[f]  = sampler.poisson_draws();
    }

    for (std::size_t f = 0; f < nfreqs; ++f) {
        out.gaussian_draws += gaussian[f];
        out.poisson_draws  += poisson[f];
    }
    return out;
}

GwbRealizations GwbRealizer::realize_occupations(std::span<const OccupationCell> cells,
                                                 std::size_t nfreqs, std::size_t nharms) const {
    return draw_cells(cells, nfreqs, nharms).total;
}

GwbResult GwbRealizer::realize(const resample::EventTable& events,
                               std::span<const double> fobs_gw_edges,
                               std::span<const int> harmonics) const {
    OccupationSet set = occupations(events, fobs_gw_edges, harmonics);
    DrawOutput drawn  = draw_cells(set.cells, set.nfreqs, set.nharms);

    GwbResult result;
    result.expected = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(set.nfreqs),
                                            static_cast<Eigen::Index>(set.nharms));
    for (const auto& c : set.cells) {
        result.expected(static_cast<Eigen::Index>(c.freq_index),
                        static_cast<Eigen::Index>(c.harmonic_index)) +=
            c.strain2 * c.num_binaries / c.dlnf;
    }

    result.background = drawn.total.harmonic_sum() - drawn.foreground;
    result.foreground = std::move(drawn.foreground);
    result.total      = std::move(drawn.total);
    result.loudest    = std::move(drawn.loudest);
    result.nloudest   = config_.nloudest;

    result.stats = set.stats;
    result.stats.degenerate_segments = events.degenerate_segments;
    result.stats.gaussian_draws = drawn.gaussian_draws;
    result.stats.poisson_draws  = drawn.poisson_draws;

    if (config_.verbose) {
        fmt::print(stderr, "[realizer] {} Poisson and {} Gaussian draws over {} realizations\n",
                   result.stats.poisson_draws, result.stats.gaussian_draws, config_.nreals);
    }
    return result;
}

} // namespace gwbkit::realization
