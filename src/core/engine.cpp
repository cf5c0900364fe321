/// @file src/core/engine.cpp
/// @brief Pipeline orchestration.

#include "gwbkit/engine.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace gwbkit::core {

namespace {

EngineConfig propagate_verbose(EngineConfig config) {
    if (config.verbose) {
        config.resampler.verbose   = true;
        config.realization.verbose = true;
    }
    return config;
}

}  // namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(propagate_verbose(std::move(config))),
      cosmo_(cosmology::Cosmology::make_flat_lcdm(config_.hubble_const, config_.omega_matter)),
      resampler_(config_.resampler),
      realizer_(config_.realization, cosmo_)
{}

// ─── Engine::resample ─────────────────────────────────────────────────────────

resample::EventTable
Engine::resample(const BinaryTracks& tracks, std::span<const double> fobs_gw_edges) const {
    if (fobs_gw_edges.size() < 2) {
        throw std::invalid_argument(fmt::format(
            "Engine: need at least 2 frequency edges (got {})", fobs_gw_edges.size()));
    }
    require_increasing(fobs_gw_edges, "Engine: frequency edges");
    const auto centers = bin_centers(fobs_gw_edges);
    return resampler_.resample_harmonics(tracks, centers, config_.harmonics);
}

// ─── Engine::run ──────────────────────────────────────────────────────────────

realization::GwbResult
Engine::run(const BinaryTracks& tracks, std::span<const double> fobs_gw_edges) const {
    // ── Step 1: crossings of every bin centre and harmonic ───────────────────
    const auto table = resample(tracks, fobs_gw_edges);

    if (config_.verbose) {
        fmt::print(stderr, "[engine] {} binaries, {} samples -> {} events\n",
                   tracks.num_binaries(), tracks.num_samples(), table.size());
    }

    // ── Step 2: occupation numbers and realizations ──────────────────────────
    return realize(table, fobs_gw_edges);
}

realization::GwbResult
Engine::realize(const resample::EventTable& events, std::span<const double> fobs_gw_edges) const {
    return realizer_.realize(events, fobs_gw_edges, config_.harmonics);
}

} // namespace gwbkit::core
