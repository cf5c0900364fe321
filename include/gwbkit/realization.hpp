#pragma once

/// @file include/gwbkit/realization.hpp
/// @brief GWB Realization Engine public API.
///
/// # Module: GWB Realization Engine
///
/// ## Responsibility
/// Turn interpolation events into discrete realizations of the
/// gravitational-wave background. Each event defines an occupation cell: the
/// squared strain of one binary at one frequency and harmonic, and the
/// expected number of such binaries in the frequency bin. A count is drawn
/// per cell and realization, and `count * strain2 / dlnf` is accumulated into
/// a `(freq, harm, real)` array.
///
/// ## Guarantees
/// - Validation throws before any random number is drawn.
/// - Results depend only on the inputs and `RealizationConfig::seed`, never on
///   the number of worker threads.
/// - Excluded events are counted in `RealizationStats`; NaN is never
///   accumulated.
///
/// ## NOT Responsible For
/// - Finding where binaries cross frequencies (see resampler.hpp)
/// - Population synthesis of the tracks themselves

#include "gwbkit/constants.hpp"
#include "gwbkit/cosmology.hpp"
#include "gwbkit/resampler.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace gwbkit::realization {

// ─── Config ───────────────────────────────────────────────────────────────────

struct RealizationConfig {
    /// Number of realizations R.
    std::size_t nreals = constants::DEFAULT_NREALS;

    /// Expected counts above this value are drawn from a Gaussian instead of
    /// a Poisson distribution.
    double gaussian_threshold = constants::DEFAULT_GAUSSIAN_THRESHOLD;

    /// Eccentricities below this are treated as circular in g(n, e).
    double min_eccen_circular = constants::DEFAULT_MIN_ECCEN_CIRCULAR;

    /// Comoving volume [cm^3] the simulated population represents.
    double survey_volume = constants::DEFAULT_SURVEY_VOLUME;

    /// Number of loudest occupied sources recorded per bin and realization.
    std::size_t nloudest = constants::DEFAULT_NLOUDEST;

    /// Master seed; each frequency bin derives its own stream from it.
    std::uint64_t seed = constants::DEFAULT_SEED;

    /// If true, report exclusion counts to stderr.
    bool verbose = false;
};

// ─── OccupationSampler ────────────────────────────────────────────────────────

/// Draws discrete binary counts from expected occupation numbers.
///
/// Poisson with mean `num` up to the threshold; above it, Gaussian with mean
/// and variance `num`, clipped at zero. The random stream is owned by the
/// sampler and advanced only by non-zero draws.
class OccupationSampler {
public:
    OccupationSampler(double threshold, std::uint64_t seed);
    OccupationSampler(double threshold, std::seed_seq& seq);

    /// Draw one count for expected occupation `num`.
    ///
    /// # Throws
    /// `std::domain_error` if `num` is negative or not finite.
    [[nodiscard]] double draw(double num);

    [[nodiscard]] double threshold() const noexcept { return threshold_; }
    [[nodiscard]] std::size_t gaussian_draws() const noexcept { return gaussian_draws_; }
    [[nodiscard]] std::size_t poisson_draws()  const noexcept { return poisson_draws_; }

private:
    double threshold_;
    std::mt19937_64 rng_;
    std::size_t gaussian_draws_ = 0;
    std::size_t poisson_draws_  = 0;
};

// ─── Occupation cells ─────────────────────────────────────────────────────────

/// One binary's contribution to one (frequency, harmonic) element.
struct OccupationCell {
    std::size_t freq_index;
    std::size_t harmonic_index;
    double strain2;       ///< Sky- and polarization-averaged h_s^2 at this harmonic
    double num_binaries;  ///< Expected number of such binaries in the bin
    double dlnf;          ///< Logarithmic width of the frequency bin
};

/// Bookkeeping for one realization run.
struct RealizationStats {
    std::size_t events_used         = 0;  ///< Events that became occupation cells
    std::size_t excluded_nonfinite  = 0;  ///< Non-finite or undefined lambda factor
    std::size_t excluded_future     = 0;  ///< Target reached after redshift zero
    std::size_t degenerate_segments = 0;  ///< Track segments with no defined direction
    std::size_t gaussian_draws      = 0;
    std::size_t poisson_draws       = 0;
};

struct OccupationSet {
    std::vector<OccupationCell> cells;
    std::size_t nfreqs = 0;
    std::size_t nharms = 0;
    RealizationStats stats;
};

// ─── GwbRealizations ──────────────────────────────────────────────────────────

/// Dense `(freq, harm, real)` array of `h_c^2` contributions, stored as an
/// Eigen matrix with one row per (freq, harm) pair and one column per
/// realization.
class GwbRealizations {
public:
    GwbRealizations() = default;
    GwbRealizations(std::size_t nfreqs, std::size_t nharms, std::size_t nreals);

    [[nodiscard]] std::size_t nfreqs() const noexcept { return nfreqs_; }
    [[nodiscard]] std::size_t nharms() const noexcept { return nharms_; }
    [[nodiscard]] std::size_t nreals() const noexcept { return nreals_; }

    [[nodiscard]] double& at(std::size_t freq, std::size_t harm, std::size_t real) {
        return values_(row(freq, harm), static_cast<Eigen::Index>(real));
    }
    [[nodiscard]] double at(std::size_t freq, std::size_t harm, std::size_t real) const {
        return values_(row(freq, harm), static_cast<Eigen::Index>(real));
    }

    [[nodiscard]] const Eigen::MatrixXd& values() const noexcept { return values_; }
    [[nodiscard]] Eigen::MatrixXd& values() noexcept { return values_; }

    /// Sum over harmonics: `h_c^2` with shape (nfreqs, nreals).
    [[nodiscard]] Eigen::MatrixXd harmonic_sum() const;

    /// `sqrt(harmonic_sum())`.
    [[nodiscard]] Eigen::MatrixXd characteristic_strain() const;

private:
    [[nodiscard]] Eigen::Index row(std::size_t freq, std::size_t harm) const noexcept {
        return static_cast<Eigen::Index>(freq * nharms_ + harm);
    }

    std::size_t nfreqs_ = 0;
    std::size_t nharms_ = 0;
    std::size_t nreals_ = 0;
    Eigen::MatrixXd values_;
};

/// Full output of `GwbRealizer::realize`.
struct GwbResult {
    GwbRealizations total;       ///< All contributions, (freq, harm, real)
    Eigen::MatrixXd expected;    ///< Expectation value of h_c^2, (freq, harm)
    Eigen::MatrixXd foreground;  ///< Loudest single source per bin, (freq, real)
    Eigen::MatrixXd background;  ///< harmonic_sum(total) - foreground

    /// `strain2 / dlnf` of the `nloudest` loudest occupied sources, in
    /// descending order; row `freq * nloudest + rank`, one column per
    /// realization. Ranks with no occupied source hold zero.
    Eigen::MatrixXd loudest;
    std::size_t nloudest = 0;

    RealizationStats stats;

    [[nodiscard]] double loud(std::size_t freq, std::size_t rank, std::size_t real) const {
        return loudest(static_cast<Eigen::Index>(freq * nloudest + rank),
                       static_cast<Eigen::Index>(real));
    }
};

/// Median over realizations of each row of `values`.
[[nodiscard]] Eigen::VectorXd median_over_realizations(const Eigen::MatrixXd& values);

// ─── GwbRealizer ──────────────────────────────────────────────────────────────

/// Builds occupation cells from interpolation events and draws realizations.
///
/// # Example
/// ```cpp
/// auto cosmo = gwbkit::cosmology::Cosmology::make_flat_lcdm();
/// gwbkit::realization::GwbRealizer realizer({.nreals = 200}, cosmo);
/// auto result = realizer.realize(table, fobs_gw_edges, harmonics);
/// auto hc = result.total.characteristic_strain();
/// ```
class GwbRealizer {
public:
    /// # Throws
    /// `std::invalid_argument` for zero realizations or a non-positive
    /// threshold or survey volume.
    GwbRealizer(RealizationConfig config, cosmology::Cosmology cosmo);

    /// Per-event strain and expected number.
    ///
    /// `events` must come from `TrackResampler::resample_harmonics` with the
    /// bin centres of `fobs_gw_edges` and the same `harmonics` (or from
    /// `resample` at `centres / 2` with `harmonics == {2}`).
    ///
    /// # Throws
    /// `std::invalid_argument` when the event table does not match the grid.
    [[nodiscard]] OccupationSet
    occupations(const resample::EventTable& events,
                std::span<const double> fobs_gw_edges,
                std::span<const int> harmonics) const;

    /// Draw `nreals` counts for every cell and accumulate
    /// `count * strain2 / dlnf`.
    ///
    /// # Throws
    /// `std::invalid_argument` for out-of-range indices or a bad `dlnf` or
    /// `strain2`; `std::domain_error` for a negative or non-finite occupation.
    [[nodiscard]] GwbRealizations
    realize_occupations(std::span<const OccupationCell> cells,
                        std::size_t nfreqs, std::size_t nharms) const;

    /// `occupations` followed by `realize_occupations`, plus expectation
    /// values, the foreground/background split and the loudest sources.
    /// `events.degenerate_segments` is carried into the returned stats.
    [[nodiscard]] GwbResult
    realize(const resample::EventTable& events,
            std::span<const double> fobs_gw_edges,
            std::span<const int> harmonics) const;

    [[nodiscard]] const RealizationConfig& config() const noexcept { return config_; }

private:
    struct DrawOutput {
        GwbRealizations total;
        Eigen::MatrixXd foreground;
        Eigen::MatrixXd loudest;
        std::size_t gaussian_draws = 0;
        std::size_t poisson_draws  = 0;
    };

    /// Validates `cells`, then draws in parallel over frequency bins.
    [[nodiscard]] DrawOutput
    draw_cells(std::span<const OccupationCell> cells,
               std::size_t nfreqs, std::size_t nharms) const;

    RealizationConfig     config_;
    cosmology::Cosmology  cosmo_;
};

} // namespace gwbkit::realization
