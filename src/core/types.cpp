/// @file src/core/types.cpp
/// @brief BinaryTracks validation and frequency-grid helpers.

#include "gwbkit/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace gwbkit {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

void check_size(const std::vector<double>& v, std::size_t n, const char* name,
                bool optional) {
    if (optional && v.empty()) return;
    if (v.size() != n) {
        throw std::invalid_argument(fmt::format(
            "BinaryTracks: '{}' has {} samples, expected {}", name, v.size(), n));
    }
}

void append_span(std::vector<double>& dst, std::span<const double> src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

}  // namespace

// ─── BinaryTracks ─────────────────────────────────────────────────────────────

void BinaryTracks::append_binary(std::span<const double> b_sepa,
                                 std::span<const double> b_eccen,
                                 std::span<const double> b_redz,
                                 std::span<const double> b_mass1,
                                 std::span<const double> b_mass2,
                                 std::span<const double> b_dadt,
                                 std::span<const double> b_dedt,
                                 std::span<const double> b_time) {
    if (b_sepa.empty()) {
        throw std::invalid_argument("BinaryTracks: cannot append an empty track");
    }
    const std::size_t first = sepa.size();
    append_span(sepa,  b_sepa);
    append_span(eccen, b_eccen);
    append_span(redz,  b_redz);
    append_span(mass1, b_mass1);
    append_span(mass2, b_mass2);
    append_span(dadt,  b_dadt);
    append_span(dedt,  b_dedt);
    append_span(time,  b_time);
    first_index.push_back(first);
    last_index.push_back(first + b_sepa.size() - 1);
}

void BinaryTracks::validate() const {
    const std::size_t n = sepa.size();
    check_size(redz,  n, "redz",  false);
    check_size(mass1, n, "mass1", false);
    check_size(mass2, n, "mass2", false);
    check_size(dadt,  n, "dadt",  false);
    check_size(eccen, n, "eccen", true);
    check_size(dedt,  n, "dedt",  true);
    check_size(time,  n, "time",  true);

    if (first_index.size() != last_index.size()) {
        throw std::invalid_argument(fmt::format(
            "BinaryTracks: {} first indices but {} last indices",
            first_index.size(), last_index.size()));
    }

    // Ranges must be ordered and disjoint; they need not cover every sample.
    std::vector<std::size_t> order(first_index.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return first_index[a] < first_index[b];
    });

    bool have_prev = false;
    std::size_t prev_last = 0;
    for (std::size_t bin : order) {
        const std::size_t lo = first_index[bin];
        const std::size_t hi = last_index[bin];
        if (lo > hi || hi >= n) {
            throw std::invalid_argument(fmt::format(
                "BinaryTracks: binary {} has invalid range [{}, {}] for {} samples",
                bin, lo, hi, n));
        }
        if (have_prev && lo <= prev_last) {
            throw std::invalid_argument(fmt::format(
                "BinaryTracks: binary {} range [{}, {}] overlaps a previous track",
                bin, lo, hi));
        }
        have_prev = true;
        prev_last = hi;

        if (!time.empty()) {
            for (std::size_t s = lo + 1; s <= hi; ++s) {
                if (!(time[s] > time[s - 1])) {
                    throw std::invalid_argument(fmt::format(
                        "BinaryTracks: time is not increasing in binary {} at sample {}",
                        bin, s));
                }
            }
        }
    }
}

// ─── Frequency Grids ──────────────────────────────────────────────────────────

void require_increasing(std::span<const double> values, const char* what) {
    if (values.empty()) {
        throw std::invalid_argument(fmt::format("{}: must not be empty", what));
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i]) || values[i] <= 0.0) {
            throw std::invalid_argument(fmt::format(
                "{}: value {} at index {} is not finite and positive", what, values[i], i));
        }
        if (i > 0 && !(values[i] > values[i - 1])) {
            throw std::invalid_argument(fmt::format(
                "{}: not strictly increasing at index {}", what, i));
        }
    }
}

std::vector<double> log_spaced_edges(double fmin, double fmax, std::size_t nbins) {
    if (nbins == 0 || !(fmin > 0.0) || !(fmax > fmin)) {
        throw std::invalid_argument(fmt::format(
            "log_spaced_edges: need 0 < fmin < fmax and nbins > 0 (got {}, {}, {})",
            fmin, fmax, nbins));
    }
    const double lo = std::log(fmin);
    const double step = (std::log(fmax) - lo) / static_cast<double>(nbins);
    std::vector<double> edges(nbins + 1);
    for (std::size_t i = 0; i <= nbins; ++i) {
        edges[i] = std::exp(lo + step * static_cast<double>(i));
    }
    // Pin the end points so they are exact.
    edges.front() = fmin;
    edges.back()  = fmax;
    return edges;
}

std::vector<double> nyquist_frequencies(double duration, double cadence) {
    if (!(duration > 0.0) || !(cadence > 0.0) || cadence > duration) {
        throw std::invalid_argument(fmt::format(
            "nyquist_frequencies: need 0 < cadence <= duration (got {}, {})",
            cadence, duration));
    }
    const double fmin = 1.0 / duration;
    const double fmax = 1.0 / cadence;
    std::vector<double> freqs;
    for (std::size_t k = 1; fmin * static_cast<double>(k) <= fmax * (1.0 + 1e-12); ++k) {
        freqs.push_back(fmin * static_cast<double>(k));
    }
    return freqs;
}

std::vector<double> bin_centers(std::span<const double> edges) {
    std::vector<double> out;
    if (edges.size() < 2) return out;
    out.reserve(edges.size() - 1);
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
        out.push_back(0.5 * (edges[i] + edges[i + 1]));
    }
    return out;
}

std::vector<double> bin_dlnf(std::span<const double> edges) {
    std::vector<double> out;
    if (edges.size() < 2) return out;
    out.reserve(edges.size() - 1);
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
        out.push_back(std::log(edges[i + 1] / edges[i]));
    }
    return out;
}

} // namespace gwbkit
