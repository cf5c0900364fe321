/// @file src/resample/track_resampler.cpp
/// @brief Binary Track Resampler: frequency-crossing detection and linear
///        interpolation of track quantities onto target frequencies.

#include "gwbkit/resampler.hpp"
#include "gwbkit/physics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace gwbkit::resample {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Direction of travel in observed frequency along one segment.
enum class Direction { Unknown, Ascending, Descending };

[[nodiscard]] double observed_frequency_at(const BinaryTracks& tracks, std::size_t s) noexcept {
    return physics::observed_frequency(tracks.sepa[s], tracks.mass1[s] + tracks.mass2[s],
                                       tracks.redz[s]);
}

[[nodiscard]] inline double lerp(double y0, double y1, double frac) noexcept {
    return y0 + frac * (y1 - y0);
}

/// Grow `out` geometrically when it cannot hold another `max_events` rows.
void ensure_headroom(std::vector<InterpolationEvent>& out, std::size_t max_events) {
    if (out.capacity() - out.size() < max_events) {
        out.reserve(std::max(2 * out.capacity(), out.size() + max_events));
    }
}

/// Build the event for `target` lying between samples `left` and `right`
/// whose observed frequencies are `f_left` and `f_right`.
[[nodiscard]] InterpolationEvent
interpolate_event(const BinaryTracks& tracks, std::size_t binary, std::size_t freq_index,
                  std::size_t left, std::size_t right,
                  double f_left, double f_right, double target) noexcept {
    const double frac = (target - f_left) / (f_right - f_left);
    return InterpolationEvent{
        .binary         = binary,
        .freq_index     = freq_index,
        .harmonic_index = 0,
        .sepa  = lerp(tracks.sepa[left],  tracks.sepa[right],  frac),
        .mass1 = lerp(tracks.mass1[left], tracks.mass1[right], frac),
        .mass2 = lerp(tracks.mass2[left], tracks.mass2[right], frac),
        .redz  = lerp(tracks.redz[left],  tracks.redz[right],  frac),
        .eccen = tracks.has_eccen() ? lerp(tracks.eccen[left], tracks.eccen[right], frac) : 0.0,
        .dadt  = lerp(tracks.dadt[left],  tracks.dadt[right],  frac),
        .dedt  = tracks.has_dedt() ? lerp(tracks.dedt[left], tracks.dedt[right], frac) : 0.0,
    };
}

void validate_harmonics(std::span<const int> harmonics) {
    if (harmonics.empty()) {
        throw std::invalid_argument("resample_harmonics: harmonics must not be empty");
    }
    for (std::size_t i = 0; i < harmonics.size(); ++i) {
        if (harmonics[i] < 1) {
            throw std::invalid_argument(fmt::format(
                "resample_harmonics: harmonic {} at index {} is not positive", harmonics[i], i));
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (harmonics[j] == harmonics[i]) {
                throw std::invalid_argument(fmt::format(
                    "resample_harmonics: harmonic {} listed twice", harmonics[i]));
            }
        }
    }
}

}  // namespace

// ─── EventTable ───────────────────────────────────────────────────────────────

void EventTable::sort_by_frequency() {
    std::stable_sort(events.begin(), events.end(),
                     [](const InterpolationEvent& a, const InterpolationEvent& b) {
                         return std::tie(a.freq_index, a.harmonic_index, a.binary)
                              < std::tie(b.freq_index, b.harmonic_index, b.binary);
                     });
}

std::size_t EventTable::count_at(std::size_t freq_index) const noexcept {
    return static_cast<std::size_t>(std::count_if(
        events.begin(), events.end(),
        [freq_index](const InterpolationEvent& ev) { return ev.freq_index == freq_index; }));
}

// ─── TrackResampler ───────────────────────────────────────────────────────────

TrackResampler::TrackResampler(ResamplerConfig config)
    : config_(std::move(config)) {
    if (config_.block_size == 0) {
        config_.block_size = 1;
    }
}

std::size_t TrackResampler::resample_binary(const BinaryTracks& tracks, std::size_t binary,
                                            std::span<const double> targets,
                                            std::vector<InterpolationEvent>& out) const {
    const std::size_t first = tracks.first_index[binary];
    const std::size_t last  = tracks.last_index[binary];
    const auto ntargets = static_cast<std::ptrdiff_t>(targets.size());

    std::size_t degenerate = 0;
    Direction prev = Direction::Unknown;
    // Pointer into `targets`. After an ascending segment it sits on the first
    // target >= f_right; after a descending one, on the last target <= f_right.
    std::ptrdiff_t ptr = 0;

    double f_left = observed_frequency_at(tracks, first);
    for (std::size_t right = first + 1; right <= last; ++right) {
        const std::size_t left = right - 1;
        const double f_right = observed_frequency_at(tracks, right);

        ensure_headroom(out, targets.size());
        const bool finite = std::isfinite(f_left) && std::isfinite(f_right);

        if (finite && f_right > f_left) {
            // ── Ascending (hardening): targets in [f_left, f_right) ──────────
            if (prev == Direction::Unknown ||
                (config_.reset_on_reversal && prev == Direction::Descending)) {
                ptr = 0;
            }
            ptr = std::max<std::ptrdiff_t>(ptr, 0);
            while (ptr < ntargets && targets[ptr] < f_left) {
                ++ptr;
            }
            while (ptr < ntargets && targets[ptr] < f_right) {
                out.push_back(interpolate_event(tracks, binary, static_cast<std::size_t>(ptr),
                                                left, right, f_left, f_right, targets[ptr]));
                ++ptr;
            }
            prev = Direction::Ascending;
        } else if (finite && f_right < f_left) {
            // ── Descending (softening): targets in (f_right, f_left] ─────────
            if (prev == Direction::Unknown ||
                (config_.reset_on_reversal && prev == Direction::Ascending)) {
                ptr = ntargets - 1;
            }
            ptr = std::min<std::ptrdiff_t>(ptr, ntargets - 1);
            while (ptr >= 0 && targets[ptr] > f_left) {
                --ptr;
            }
            while (ptr >= 0 && targets[ptr] > f_right) {
                out.push_back(interpolate_event(tracks, binary, static_cast<std::size_t>(ptr),
                                                left, right, f_left, f_right, targets[ptr]));
                --ptr;
            }
            prev = Direction::Descending;
        } else {
            // Equal or non-finite endpoints: direction undefined, no events.
            // Across a non-finite sample the pointer no longer tracks the
            // frequency, so the next finite segment starts from the band edge.
            ++degenerate;
            if (!finite) {
                prev = Direction::Unknown;
            }
            if (config_.verbose) {
                fmt::print(stderr,
                           "[resampler] binary {}: degenerate segment [{}, {}] at f = {:.6e} Hz\n",
                           binary, left, right, f_right);
            }
        }

        f_left = f_right;
    }

    return degenerate;
}

EventTable TrackResampler::resample(const BinaryTracks& tracks,
                                    std::span<const double> targets) const {
    tracks.validate();
    require_increasing(targets, "resample: targets");

    const std::size_t nbins   = tracks.num_binaries();
    const std::size_t nblocks = (nbins + config_.block_size - 1) / config_.block_size;

    std::vector<std::vector<InterpolationEvent>> block_events(nblocks);
    std::vector<std::size_t> block_degenerate(nblocks, 0);

    // Each block of consecutive binaries owns its buffer; blocks are merged in
    // order afterwards so the result does not depend on scheduling.
#pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t b = 0; b < static_cast<std::ptrdiff_t>(nblocks); ++b) {
        const std::size_t lo = static_cast<std::size_t>(b) * config_.block_size;
        const std::size_t hi = std::min(nbins, lo + config_.block_size);

        auto& out = block_events[static_cast<std::size_t>(b)];
        out.reserve(targets.size() * (hi - lo));

        std::size_t degenerate = 0;
        for (std::size_t bin = lo; bin < hi; ++bin) {
            degenerate += resample_binary(tracks, bin, targets, out);
        }
        out.shrink_to_fit();
        block_degenerate[static_cast<std::size_t>(b)] = degenerate;
    }

    EventTable table;
    table.num_targets   = targets.size();
    table.num_harmonics = 1;

    std::size_t total = 0;
    for (const auto& blk : block_events) total += blk.size();
    table.events.reserve(total);
    for (std::size_t b = 0; b < nblocks; ++b) {
        auto& blk = block_events[b];
        table.events.insert(table.events.end(),
                            std::make_move_iterator(blk.begin()),
                            std::make_move_iterator(blk.end()));
        std::vector<InterpolationEvent>().swap(blk);
        table.degenerate_segments += block_degenerate[b];
    }

    if (config_.verbose && table.degenerate_segments > 0) {
        fmt::print(stderr, "[resampler] {} degenerate segments skipped across {} binaries\n",
                   table.degenerate_segments, nbins);
    }
    return table;
}

EventTable TrackResampler::resample_harmonics(const BinaryTracks& tracks,
                                              std::span<const double> fobs_gw_centers,
                                              std::span<const int> harmonics) const {
    require_increasing(fobs_gw_centers, "resample_harmonics: frequencies");
    validate_harmonics(harmonics);

    // Orbital-frequency target of every (frequency, harmonic) pair.
    struct PairTarget {
        double fobs_orb;
        std::size_t freq_index;
        std::size_t harmonic_index;
    };
    std::vector<PairTarget> pairs;
    pairs.reserve(fobs_gw_centers.size() * harmonics.size());
    for (std::size_t i = 0; i < fobs_gw_centers.size(); ++i) {
        for (std::size_t h = 0; h < harmonics.size(); ++h) {
            pairs.push_back(PairTarget{
                .fobs_orb       = fobs_gw_centers[i] / static_cast<double>(harmonics[h]),
                .freq_index     = i,
                .harmonic_index = h,
            });
        }
    }
    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const PairTarget& a, const PairTarget& b) { return a.fobs_orb < b.fobs_orb; });

    // Distinct orbital targets; group_start[u] .. group_start[u+1] are the
    // pairs sharing target u.
    std::vector<double> targets;
    std::vector<std::size_t> group_start;
    for (std::size_t p = 0; p < pairs.size(); ++p) {
        if (targets.empty() || pairs[p].fobs_orb != targets.back()) {
            targets.push_back(pairs[p].fobs_orb);
            group_start.push_back(p);
        }
    }
    group_start.push_back(pairs.size());

    EventTable orbital = resample(tracks, targets);

    EventTable table;
    table.num_targets         = fobs_gw_centers.size();
    table.num_harmonics       = harmonics.size();
    table.degenerate_segments = orbital.degenerate_segments;
    table.events.reserve(orbital.size());

    for (const auto& ev : orbital.events) {
        for (std::size_t p = group_start[ev.freq_index]; p < group_start[ev.freq_index + 1]; ++p) {
            InterpolationEvent out = ev;
            out.freq_index     = pairs[p].freq_index;
            out.harmonic_index = pairs[p].harmonic_index;
            table.events.push_back(out);
        }
    }
    return table;
}

} // namespace gwbkit::resample
