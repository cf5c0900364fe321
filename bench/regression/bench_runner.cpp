/**
 * @file  bench_runner.cpp
 * @brief Standalone micro-benchmark runner for the performance regression suite.
 *
 * Usage:
 *   ./bench_runner <benchmark_name>
 *
 * Outputs a single double: nanoseconds per operation, to stdout.
 * Returns 0 on success, 1 on unknown benchmark name.
 *
 * Each benchmark runs for a wall-clock duration of at least 500ms to get
 * stable measurements, then divides total time by iteration count.
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

#include "gwbkit/constants.hpp"
#include "gwbkit/cosmology.hpp"
#include "gwbkit/density_grid.hpp"
#include "gwbkit/engine.hpp"
#include "gwbkit/physics.hpp"
#include "gwbkit/resampler.hpp"

using namespace gwbkit;
using namespace std::chrono;

// ── Timing harness ────────────────────────────────────────────────────────────

template<typename Fn>
double measure_ns_per_op(Fn&& fn, long min_iters = 100) {
    // Warmup
    for (long i = 0; i < std::min(min_iters / 10L, 1000L); ++i) fn();

    // Measure until we have at least 500ms of wall time
    long iters      = 0;
    double total_ns = 0.0;

    const auto deadline = steady_clock::now() + milliseconds(500);
    do {
        const auto t0 = steady_clock::now();
        fn();
        fn(); fn(); fn(); fn(); fn();  // batch 5 to reduce timer overhead
        const auto t1 = steady_clock::now();
        total_ns += static_cast<double>(duration_cast<nanoseconds>(t1 - t0).count());
        iters += 5;
    } while (steady_clock::now() < deadline || iters < min_iters);

    return total_ns / static_cast<double>(iters);
}

// ── Fixtures ──────────────────────────────────────────────────────────────────

/// `nbin` GW-driven circular binaries with `nsamp` samples each, spread in
/// mass and redshift.
BinaryTracks make_population(std::size_t nbin, std::size_t nsamp) {
    BinaryTracks tracks;
    for (std::size_t b = 0; b < nbin; ++b) {
        const double m1 = (2.0e8 + 1.0e7 * static_cast<double>(b % 50)) * constants::MSOL;
        const double m2 = 0.4 * m1;
        const double redz = 0.1 + 0.01 * static_cast<double>(b % 100);
        std::vector<double> sepa, zz, mm1, mm2, dadt;
        const double step = std::log(100.0) / static_cast<double>(nsamp - 1);
        for (std::size_t s = 0; s < nsamp; ++s) {
            const double fobs = 5.0e-10 * std::exp(step * static_cast<double>(s));
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

// ── Benchmark implementations ─────────────────────────────────────────────────

double bench_harmonic_weight_1M() {
    volatile double sink = 0.0;
    int n = 1;
    return measure_ns_per_op([&]() {
        sink += physics::eccentricity_harmonic_weight(n, 0.5);
        n = (n % 40) + 1;
    }, 1'000'000);
}

double bench_lambda_factor_1M() {
    volatile double sink = 0.0;
    return measure_ns_per_op([&]() {
        const auto lam = physics::lambda_factor_dlnf(1.0e-8, 1.0e-18, 0.5, 1.0e28);
        sink += lam ? *lam : 0.0;
    }, 1'000'000);
}

double bench_comoving_distance_1M() {
    const auto cosmo = cosmology::Cosmology::make_flat_lcdm();
    volatile double sink = 0.0;
    double z = 0.01;
    return measure_ns_per_op([&]() {
        sink += cosmo.comoving_distance(z);
        z = (z > 5.0) ? 0.01 : z * 1.01;
    }, 1'000'000);
}

double bench_resample_1k_binaries() {
    const auto tracks = make_population(1000, 200);
    const auto targets = log_spaced_edges(1.0e-9, 2.0e-8, 30);
    const resample::TrackResampler resampler;
    volatile std::size_t sink = 0;
    return measure_ns_per_op([&]() {
        sink += resampler.resample(tracks, targets).size();
    }, 10);
}

double bench_full_pipeline_1k_binaries() {
    const auto tracks = make_population(1000, 200);
    const auto edges = log_spaced_edges(2.0e-9, 3.0e-8, 20);
    core::EngineConfig cfg;
    cfg.realization.nreals = 100;
    const core::Engine engine(cfg);
    volatile double sink = 0.0;
    return measure_ns_per_op([&]() {
        sink += engine.run(tracks, edges).expected.sum();
    }, 10);
}

double bench_sample_in_cell_1M() {
    const std::vector<double> corners{1.0, 2.0, 0.5, 3.0, 1.5, 0.2, 0.8, 2.5,
                                      1.1, 0.9, 1.7, 2.2, 0.3, 0.6, 1.9, 1.0};
    const std::vector<double> lo{0.0, 0.0, 0.0, 0.0};
    const std::vector<double> hi{1.0, 1.0, 1.0, 1.0};
    std::mt19937_64 rng(1);
    volatile double sink = 0.0;
    return measure_ns_per_op([&]() {
        sink += grid::sample_in_cell(corners, lo, hi, rng)[0];
    }, 1'000'000);
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <benchmark_name>\n", argv[0]);
        return 1;
    }

    const std::string name = argv[1];
    double result = -1.0;

    if (name == "harmonic_weight_1M")            result = bench_harmonic_weight_1M();
    else if (name == "lambda_factor_1M")         result = bench_lambda_factor_1M();
    else if (name == "comoving_distance_1M")     result = bench_comoving_distance_1M();
    else if (name == "resample_1k_binaries")     result = bench_resample_1k_binaries();
    else if (name == "full_pipeline_1k_binaries") result = bench_full_pipeline_1k_binaries();
    else if (name == "sample_in_cell_1M")        result = bench_sample_in_cell_1M();
    else {
        std::fprintf(stderr, "Unknown benchmark: %s\n", name.c_str());
        return 1;
    }

    std::printf("%.2f\n", result);
    return 0;
}
