#pragma once

/// @file include/gwbkit/resampler.hpp
/// @brief Binary Track Resampler public API.
///
/// # Module: Binary Track Resampler
///
/// ## Responsibility
/// Interpolate every binary's evolution track onto a fixed grid of target
/// observer-frame orbital frequencies. For each track segment (pair of
/// consecutive samples) the observed frequency at both ends decides whether
/// the segment is ascending (hardening), descending (softening) or
/// degenerate, and one `InterpolationEvent` is emitted for every target the
/// segment crosses. Quantities are interpolated linearly in observed
/// frequency, not in time.
///
/// ## Crossing rule
///   ascending  (f_l < f_r): targets in [f_l, f_r)
///   descending (f_l > f_r): targets in (f_r, f_l]
///   degenerate (f_l == f_r, or either is not finite): no events, counted
///   and reported
///
/// A target crossed several times by one binary yields one event per
/// crossing.
///
/// ## Guarantees
/// - Input shape errors throw `std::invalid_argument` before any work.
/// - The returned table is identical for any number of worker threads.
/// - `resample` is const and may be called concurrently.
///
/// ## NOT Responsible For
/// - Occupation numbers or strains (see include/gwbkit/realization.hpp)

#include "gwbkit/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace gwbkit::resample {

// ─── Config ───────────────────────────────────────────────────────────────────

struct ResamplerConfig {
    /// Reset the target pointer to the band edge whenever a track reverses
    /// direction. Tables are identical either way; the reset only costs
    /// extra pointer moves.
    bool reset_on_reversal = false;

    /// Number of binaries per parallel work block.
    std::size_t block_size = 256;

    /// If true, report degenerate segments to stderr.
    bool verbose = false;
};

// ─── EventTable ───────────────────────────────────────────────────────────────

/// Sparse table of interpolation events, owned by the caller after
/// resampling.
struct EventTable {
    std::vector<InterpolationEvent> events;
    std::size_t num_targets   = 0;  ///< Number of target frequencies / bins
    std::size_t num_harmonics = 1;  ///< Size of the harmonic dimension
    std::size_t degenerate_segments = 0;  ///< Segments with equal or non-finite ends

    [[nodiscard]] std::size_t size()  const noexcept { return events.size(); }
    [[nodiscard]] bool        empty() const noexcept { return events.empty(); }

    /// Stable sort by (freq_index, harmonic_index, binary).
    void sort_by_frequency();

    /// Number of events with the given frequency index.
    [[nodiscard]] std::size_t count_at(std::size_t freq_index) const noexcept;
};

// ─── TrackResampler ───────────────────────────────────────────────────────────

/// Resamples evolution tracks onto target frequencies.
///
/// # Example
/// ```cpp
/// gwbkit::resample::TrackResampler resampler;
/// auto table = resampler.resample(tracks, targets);
/// fmt::print("{} events, {} degenerate segments\n",
///            table.size(), table.degenerate_segments);
/// ```
class TrackResampler {
public:
    explicit TrackResampler(ResamplerConfig config = ResamplerConfig{});

    /// Interpolate all tracks to the given observed orbital frequencies.
    ///
    /// # Arguments
    /// * `tracks`  — evolution tracks (validated here)
    /// * `targets` — strictly increasing observer-frame orbital frequencies [Hz]
    ///
    /// # Returns
    /// Events with `freq_index` indexing `targets` and `harmonic_index == 0`,
    /// ordered by binary and then by track position.
    ///
    /// # Throws
    /// `std::invalid_argument` if the tracks fail validation or `targets` is
    /// not strictly increasing.
    [[nodiscard]] EventTable
    resample(const BinaryTracks& tracks, std::span<const double> targets) const;

    /// Interpolate all tracks to the orbital frequencies `f_gw / n` of every
    /// GW frequency and harmonic.
    ///
    /// # Arguments
    /// * `tracks`          — evolution tracks
    /// * `fobs_gw_centers` — strictly increasing observer-frame GW frequencies
    /// * `harmonics`       — positive harmonic numbers
    ///
    /// # Returns
    /// Events over (binary, frequency, harmonic): `freq_index` indexes
    /// `fobs_gw_centers`, `harmonic_index` indexes `harmonics`.
    ///
    /// # Throws
    /// `std::invalid_argument` on invalid tracks, frequencies or harmonics.
    [[nodiscard]] EventTable
    resample_harmonics(const BinaryTracks& tracks,
                       std::span<const double> fobs_gw_centers,
                       std::span<const int> harmonics) const;

    [[nodiscard]] const ResamplerConfig& config() const noexcept { return config_; }

private:
    /// Single left-to-right pass over one binary's track, appending events to
    /// `out`. Returns the number of degenerate segments.
    [[nodiscard]] std::size_t
    resample_binary(const BinaryTracks& tracks, std::size_t binary,
                    std::span<const double> targets,
                    std::vector<InterpolationEvent>& out) const;

    ResamplerConfig config_;
};

} // namespace gwbkit::resample
