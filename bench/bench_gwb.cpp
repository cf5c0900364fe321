/**
 * @file  bench/bench_gwb.cpp
 * @brief Google Benchmark suite for track resampling and GWB realizations.
 *
 * Benchmarks
 * ----------
 *   BM_Resample            binaries x 200 samples onto 30 targets
 *   BM_ResampleHarmonics   same population, harmonics {1..4}
 *   BM_RealizeOccupations  one cell per binary and bin, 100 realizations
 *   BM_GridOutliers        4-D grid, sparse cells sampled
 *
 * Build (CMake):
 *   cmake -DGWBKIT_BENCH=ON ..
 *   cmake --build build --target bench_gwb
 *   ./build/bench_gwb --benchmark_format=json
 *
 * Throughput units: items/second (binaries or cells processed).
 * Custom counter "Mbinaries_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "gwbkit/constants.hpp"
#include "gwbkit/cosmology.hpp"
#include "gwbkit/density_grid.hpp"
#include "gwbkit/physics.hpp"
#include "gwbkit/realization.hpp"
#include "gwbkit/resampler.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// `n` GW-driven circular binaries sampled at 200 log-spaced frequencies.
static gwbkit::BinaryTracks make_population(std::size_t n) {
    using namespace gwbkit;
    BinaryTracks tracks;
    for (std::size_t b = 0; b < n; ++b) {
        const double m1 = (1.0e8 + 2.0e7 * static_cast<double>(b % 40)) * constants::MSOL;
        const double m2 = 0.3 * m1;
        const double redz = 0.05 + 0.02 * static_cast<double>(b % 100);
        std::vector<double> sepa, zz, mm1, mm2, dadt;
        for (std::size_t s = 0; s < 200; ++s) {
            const double fobs = 5.0e-10 * std::pow(100.0, static_cast<double>(s) / 199.0);
            const double a = physics::kepler_sepa_from_freq(m1 + m2, fobs * (1.0 + redz));
            sepa.push_back(a);
            zz.push_back(redz);
            mm1.push_back(m1);
            mm2.push_back(m2);
            dadt.push_back(physics::gw_hardening_rate_dadt(m1, m2, a));
        }
        tracks.append_binary(sepa, {}, zz, mm1, mm2, dadt);
    }
    return tracks;
}

static void set_rate(benchmark::State& state, std::size_t n) {
    const auto items = static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n);
    state.SetItemsProcessed(items);
    state.counters["Mbinaries_per_sec"] = benchmark::Counter(
        static_cast<double>(items) / 1e6, benchmark::Counter::kIsRate);
}

// ── Resampler ──────────────────────────────────────────────────────────────────

static void BM_Resample(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto tracks = make_population(n);
    const auto targets = gwbkit::log_spaced_edges(1.0e-9, 2.0e-8, 30);
    const gwbkit::resample::TrackResampler resampler;
    for (auto _ : state) {
        auto table = resampler.resample(tracks, targets);
        benchmark::DoNotOptimize(table.events.data());
        benchmark::ClobberMemory();
    }
    set_rate(state, n);
}
BENCHMARK(BM_Resample)->RangeMultiplier(4)->Range(64, 16384)->Unit(benchmark::kMillisecond);

static void BM_ResampleHarmonics(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto tracks = make_population(n);
    const auto centers = gwbkit::bin_centers(gwbkit::log_spaced_edges(2.0e-9, 3.0e-8, 20));
    const std::vector<int> harmonics{1, 2, 3, 4};
    const gwbkit::resample::TrackResampler resampler;
    for (auto _ : state) {
        auto table = resampler.resample_harmonics(tracks, centers, harmonics);
        benchmark::DoNotOptimize(table.events.data());
        benchmark::ClobberMemory();
    }
    set_rate(state, n);
}
BENCHMARK(BM_ResampleHarmonics)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMillisecond);

// ── Realizations ───────────────────────────────────────────────────────────────

static void BM_RealizeOccupations(benchmark::State& state) {
    using namespace gwbkit::realization;
    const auto ncells = static_cast<std::size_t>(state.range(0));
    const std::size_t nfreqs = 20;
    std::vector<OccupationCell> cells;
    cells.reserve(ncells);
    for (std::size_t i = 0; i < ncells; ++i) {
        cells.push_back(OccupationCell{
            .freq_index     = i % nfreqs,
            .harmonic_index = 0,
            .strain2        = 1.0e-32,
            .num_binaries   = 0.01 * static_cast<double>(i % 1000),
            .dlnf           = 0.15,
        });
    }
    const GwbRealizer realizer(RealizationConfig{.nreals = 100},
                               gwbkit::cosmology::Cosmology::make_flat_lcdm());
    for (auto _ : state) {
        auto hc2 = realizer.realize_occupations(cells, nfreqs, 1);
        benchmark::DoNotOptimize(hc2.values().data());
        benchmark::ClobberMemory();
    }
    set_rate(state, ncells);
}
BENCHMARK(BM_RealizeOccupations)->RangeMultiplier(4)->Range(1024, 262144)->Unit(benchmark::kMillisecond);

// ── Grid ───────────────────────────────────────────────────────────────────────

static void BM_GridOutliers(benchmark::State& state) {
    using namespace gwbkit::grid;
    const auto nedge = static_cast<std::size_t>(state.range(0));
    const double lm = std::log10(gwbkit::constants::MSOL);
    DensityGrid grid;
    for (std::size_t i = 0; i < nedge; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(nedge - 1);
        grid.log10_mass_edges.push_back(lm + 7.5 + 2.0 * t);
        grid.mrat_edges.push_back(0.1 + 0.9 * t);
        grid.redz_edges.push_back(0.1 + 2.0 * t);
        grid.fobs_gw_edges.push_back(2.0e-9 * std::pow(15.0, t));
    }
    grid.density.assign(nedge * nedge * nedge * nedge, 1.0e3);
    const GridIntegrator integ(gwbkit::cosmology::Cosmology::make_flat_lcdm());
    for (auto _ : state) {
        auto hc2 = integ.sample_outliers(grid, 10.0, 20, 7);
        benchmark::DoNotOptimize(hc2.data());
        benchmark::ClobberMemory();
    }
    set_rate(state, (nedge - 1) * (nedge - 1) * (nedge - 1) * (nedge - 1));
}
BENCHMARK(BM_GridOutliers)->DenseRange(4, 10, 3)->Unit(benchmark::kMillisecond);

// ── Micro: g(n, e) for a single harmonic ──────────────────────────────────────

static void BM_HarmonicWeight(benchmark::State& state) {
    volatile double eccen = 0.5;
    int n = 1;
    for (auto _ : state) {
        const double g = gwbkit::physics::eccentricity_harmonic_weight(n, eccen);
        benchmark::DoNotOptimize(g);
        n = (n % 40) + 1;
    }
}
BENCHMARK(BM_HarmonicWeight);

BENCHMARK_MAIN();
