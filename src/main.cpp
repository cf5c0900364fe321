/// @file src/main.cpp
/// @brief gwbkit CLI entry point.
///
/// Usage:
///   gwbkit --tracks <csv_file> [options]   Realize the GWB of a track population
///   gwbkit --help                          Print usage

#include "gwbkit/data_loader.hpp"
#include "gwbkit/engine.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  gwbkit --tracks <csv_file> [options]\n"
        "  gwbkit --help\n"
        "\n"
        "Options:\n"
        "  --fmin <Hz>          lowest GW bin edge        (default 1/(16 yr))\n"
        "  --fmax <Hz>          highest GW bin edge       (default 30/(16 yr))\n"
        "  --nbins <n>          number of log-spaced bins (default 30)\n"
        "  --nreals <n>         realizations              (default 100)\n"
        "  --seed <n>           master random seed\n"
        "  --harmonics <list>   comma separated, e.g. 1,2,3 (default 2)\n"
        "  --threshold <x>      Poisson/Gaussian switch   (default 1e8)\n"
        "  --volume <cm^3>      survey comoving volume\n"
        "  --events-out <path>  also write the event table as CSV\n"
        "  --verbose            stage diagnostics on stderr\n"
        "\n"
        "CSV format (header required, time optional):\n"
        "  binary,sepa,eccen,redz,mass1,mass2,dadt,dedt[,time]\n"
    );
}

template <typename T>
[[nodiscard]] std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<std::vector<int>> parse_harmonics(std::string_view text) {
    std::vector<int> out;
    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto item  = text.substr(0, comma);
        auto n = parse_number<int>(item);
        if (!n) {
            return std::nullopt;
        }
        out.push_back(*n);
        if (comma == std::string_view::npos) break;
        text.remove_prefix(comma + 1);
    }
    return out;
}

struct CliOptions {
    std::string tracks_path;
    std::string events_out;
    double fmin = 1.0 / (16.0 * gwbkit::constants::YR);
    double fmax = 30.0 / (16.0 * gwbkit::constants::YR);
    std::size_t nbins = 30;
    gwbkit::core::EngineConfig engine;
};

/// Parse flags after argv[1]. Returns nullopt (after printing why) on error.
[[nodiscard]] std::optional<CliOptions> parse_options(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view flag(argv[i]);
        if (flag == "--verbose") {
            opts.engine.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);
        bool ok = true;

        if (flag == "--tracks") {
            opts.tracks_path = std::string(value);
        } else if (flag == "--events-out") {
            opts.events_out = std::string(value);
        } else if (flag == "--fmin") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) opts.fmin = *v;
        } else if (flag == "--fmax") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) opts.fmax = *v;
        } else if (flag == "--nbins") {
            auto v = parse_number<std::size_t>(value);
            ok = v.has_value();
            if (ok) opts.nbins = *v;
        } else if (flag == "--nreals") {
            auto v = parse_number<std::size_t>(value);
            ok = v.has_value();
            if (ok) opts.engine.realization.nreals = *v;
        } else if (flag == "--seed") {
            auto v = parse_number<std::uint64_t>(value);
            ok = v.has_value();
            if (ok) opts.engine.realization.seed = *v;
        } else if (flag == "--threshold") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) opts.engine.realization.gaussian_threshold = *v;
        } else if (flag == "--volume") {
            auto v = parse_number<double>(value);
            ok = v.has_value();
            if (ok) opts.engine.realization.survey_volume = *v;
        } else if (flag == "--harmonics") {
            auto v = parse_harmonics(value);
            ok = v.has_value();
            if (ok) opts.engine.harmonics = std::move(*v);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }

        if (!ok) {
            fmt::print(stderr, "Error: invalid value '{}' for {}\n", value, flag);
            return std::nullopt;
        }
    }
    if (opts.tracks_path.empty()) {
        fmt::print(stderr, "Error: --tracks <csv_file> is required\n");
        return std::nullopt;
    }
    return opts;
}

/// Load tracks, run the pipeline and print the per-bin report.
/// Returns 0 on success, 1 on error.
int run_tracks(const CliOptions& opts) {
    auto tracks = gwbkit::core::DataLoader::load_csv(opts.tracks_path);
    if (!tracks) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.tracks_path);
        return 1;
    }
    if (tracks->num_binaries() == 0) {
        fmt::print(stderr, "Error: no valid track rows loaded from '{}'\n", opts.tracks_path);
        return 1;
    }
    fmt::print("Loaded {} binaries ({} samples) from '{}'\n",
               tracks->num_binaries(), tracks->num_samples(), opts.tracks_path);

    const auto edges   = gwbkit::log_spaced_edges(opts.fmin, opts.fmax, opts.nbins);
    const auto centers = gwbkit::bin_centers(edges);

    gwbkit::core::Engine engine(opts.engine);
    const auto table  = engine.resample(*tracks, edges);
    if (!opts.events_out.empty()) {
        gwbkit::core::DataLoader::write_events_csv(table, opts.events_out);
        fmt::print("Wrote {} events to '{}'\n", table.size(), opts.events_out);
    }
    const auto result = engine.realize(table, edges);

    const Eigen::MatrixXd hc2 = result.total.harmonic_sum();
    const Eigen::VectorXd hc2_med = gwbkit::realization::median_over_realizations(hc2);
    const Eigen::VectorXd fg_med  = gwbkit::realization::median_over_realizations(result.foreground);

    fmt::print("\n{:>12}  {:>12}  {:>12}  {:>10}\n", "f_gw [Hz]", "hc (median)", "hc (expect)",
               "fg frac");
    for (std::size_t f = 0; f < centers.size(); ++f) {
        const auto fi = static_cast<Eigen::Index>(f);
        const double expect = std::sqrt(result.expected.row(fi).sum());
        const double frac   = hc2_med(fi) > 0.0 ? fg_med(fi) / hc2_med(fi) : 0.0;
        fmt::print("{:12.4e}  {:12.4e}  {:12.4e}  {:10.4f}\n",
                   centers[f], std::sqrt(hc2_med(fi)), expect, frac);
    }

    fmt::print("\nEvents used: {}  excluded (non-finite): {}  excluded (z <= 0): {}  "
               "degenerate segments: {}\n",
               result.stats.events_used, result.stats.excluded_nonfinite,
               result.stats.excluded_future, result.stats.degenerate_segments);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    auto opts = parse_options(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        return run_tracks(*opts);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
