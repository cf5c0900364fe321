#pragma once

/// @file include/gwbkit/types.hpp
/// @brief Shared data types for gwbkit: binary evolution tracks, interpolation
///        events and frequency-grid helpers.
///
/// Every module includes this file. Tracks are stored as flat
/// structure-of-arrays over all samples of all binaries; each binary owns an
/// inclusive `[first_index, last_index]` range into those arrays.

#include <cstddef>
#include <span>
#include <vector>

namespace gwbkit {

// ─── Binary Tracks ────────────────────────────────────────────────────────────

/// Time-ordered evolution tracks of a population of binaries.
///
/// Units: separation [cm], masses [g], hardening rate [cm/s] (negative while
/// the binary hardens), eccentricity and redshift dimensionless, time [s].
///
/// `eccen`, `dedt` and `time` may be left empty; an empty `eccen` means the
/// population is circular.
struct BinaryTracks {
    std::vector<double> sepa;
    std::vector<double> eccen;
    std::vector<double> redz;
    std::vector<double> mass1;
    std::vector<double> mass2;
    std::vector<double> dadt;
    std::vector<double> dedt;
    std::vector<double> time;

    std::vector<std::size_t> first_index;  ///< First sample of each binary
    std::vector<std::size_t> last_index;   ///< Last sample of each binary (inclusive)

    [[nodiscard]] std::size_t num_binaries() const noexcept { return first_index.size(); }
    [[nodiscard]] std::size_t num_samples()  const noexcept { return sepa.size(); }
    [[nodiscard]] bool has_eccen() const noexcept { return !eccen.empty(); }
    [[nodiscard]] bool has_dedt()  const noexcept { return !dedt.empty(); }
    [[nodiscard]] bool has_time()  const noexcept { return !time.empty(); }

    /// Append one binary's samples and register its index range.
    ///
    /// Optional arrays must be either empty in every call or filled in every
    /// call; `validate()` reports any mix.
    void append_binary(std::span<const double> b_sepa,
                       std::span<const double> b_eccen,
                       std::span<const double> b_redz,
                       std::span<const double> b_mass1,
                       std::span<const double> b_mass2,
                       std::span<const double> b_dadt,
                       std::span<const double> b_dedt = {},
                       std::span<const double> b_time = {});

    /// Check the shape invariants of the flat arrays and index ranges.
    ///
    /// # Throws
    /// `std::invalid_argument` when array lengths disagree, a range is empty,
    /// reversed, out of bounds or overlaps another binary, or `time` is not
    /// strictly increasing inside a track.
    void validate() const;
};

// ─── Interpolation Event ──────────────────────────────────────────────────────

/// State of one binary at the moment it crosses one target frequency
/// (optionally for one eccentricity harmonic).
struct InterpolationEvent {
    std::size_t binary;          ///< Index of the binary in `BinaryTracks`
    std::size_t freq_index;      ///< Target / frequency-bin index
    std::size_t harmonic_index;  ///< Harmonic index (0 without harmonics)
    double sepa;                 ///< Separation [cm]
    double mass1;                ///< Primary mass [g]
    double mass2;                ///< Secondary mass [g]
    double redz;                 ///< Redshift
    double eccen;                ///< Eccentricity (0 for circular tracks)
    double dadt;                 ///< Hardening rate [cm/s]
    double dedt;                 ///< Eccentricity rate [1/s] (0 when absent)
};

// ─── Frequency Grids ──────────────────────────────────────────────────────────

/// Throw `std::invalid_argument` unless `values` is non-empty, finite,
/// positive and strictly increasing. `what` names the array in the message.
void require_increasing(std::span<const double> values, const char* what);

/// `nbins + 1` logarithmically spaced bin edges spanning [fmin, fmax].
[[nodiscard]] std::vector<double>
log_spaced_edges(double fmin, double fmax, std::size_t nbins);

/// Frequencies `k / duration` for k = 1 .. floor(duration / cadence), i.e.
/// the Fourier frequencies of an evenly sampled series.
[[nodiscard]] std::vector<double>
nyquist_frequencies(double duration, double cadence);

/// Arithmetic midpoints of consecutive edges.
[[nodiscard]] std::vector<double> bin_centers(std::span<const double> edges);

/// Logarithmic widths ln(edge[j+1] / edge[j]).
[[nodiscard]] std::vector<double> bin_dlnf(std::span<const double> edges);

} // namespace gwbkit
