/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end integration tests for the full gwbkit pipeline.
///
/// These tests exercise the complete path:
///   CSV -> DataLoader -> BinaryTracks -> TrackResampler (harmonics) ->
///   GwbRealizer -> GwbResult

#include "gwbkit/constants.hpp"
#include "gwbkit/data_loader.hpp"
#include "gwbkit/engine.hpp"
#include "gwbkit/physics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gwbkit;
using namespace gwbkit::core;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// Append a circular binary hardening purely by GW emission, sampled at
/// `nsamp` log-spaced observed orbital frequencies in [fobs_lo, fobs_hi].
void add_gw_binary(BinaryTracks& tracks, double m1, double m2, double redz,
                   double fobs_lo, double fobs_hi, std::size_t nsamp = 200) {
    std::vector<double> sepa, zz, mm1, mm2, dadt, time;
    const double step = std::log(fobs_hi / fobs_lo) / static_cast<double>(nsamp - 1);
    for (std::size_t i = 0; i < nsamp; ++i) {
        const double fobs = fobs_lo * std::exp(step * static_cast<double>(i));
        const double a = physics::kepler_sepa_from_freq(m1 + m2, fobs * (1.0 + redz));
        sepa.push_back(a);
        zz.push_back(redz);
        mm1.push_back(m1);
        mm2.push_back(m2);
        dadt.push_back(physics::gw_hardening_rate_dadt(m1, m2, a));
        time.push_back(static_cast<double>(i));
    }
    tracks.append_binary(sepa, {}, zz, mm1, mm2, dadt, {}, time);
}

/// Small population spanning the default test band.
BinaryTracks make_population() {
    BinaryTracks tracks;
    const double msol = constants::MSOL;
    add_gw_binary(tracks, 1.0e9 * msol, 1.0e9 * msol, 0.5, 5.0e-10, 3.0e-8);
    add_gw_binary(tracks, 8.0e8 * msol, 2.0e8 * msol, 1.0, 5.0e-10, 3.0e-8);
    add_gw_binary(tracks, 3.0e9 * msol, 1.5e9 * msol, 0.2, 5.0e-10, 3.0e-8);
    return tracks;
}

std::vector<double> default_edges() {
    return log_spaced_edges(2.0e-9, 3.0e-8, 6);
}

/// Engine with a survey volume small enough that every cell holds millions
/// of binaries.
EngineConfig dense_config(std::size_t nreals = 20) {
    EngineConfig cfg;
    cfg.realization.nreals = nreals;
    cfg.realization.survey_volume = 1.0e72;
    cfg.realization.seed = 99;
    return cfg;
}

std::string tracks_to_csv(const BinaryTracks& tracks) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "binary,sepa,eccen,redz,mass1,mass2,dadt,dedt,time\n";
    for (std::size_t b = 0; b < tracks.num_binaries(); ++b) {
        for (std::size_t s = tracks.first_index[b]; s <= tracks.last_index[b]; ++s) {
            ss << b << ","
               << tracks.sepa[s]  << ","
               << 0.0             << ","
               << tracks.redz[s]  << ","
               << tracks.mass1[s] << ","
               << tracks.mass2[s] << ","
               << tracks.dadt[s]  << ","
               << 0.0             << ","
               << tracks.time[s]  << "\n";
        }
    }
    return ss.str();
}

const char* const HEADER8 = "binary,sepa,eccen,redz,mass1,mass2,dadt,dedt\n";
const char* const HEADER9 = "binary,sepa,eccen,redz,mass1,mass2,dadt,dedt,time\n";

}  // anonymous namespace

// ─── Engine::run ──────────────────────────────────────────────────────────────

TEST(EngineRun, ShapesFollowGridAndConfig) {
    Engine engine(dense_config());
    const auto edges = default_edges();
    const auto result = engine.run(make_population(), edges);
    EXPECT_EQ(result.total.nfreqs(), 6u);
    EXPECT_EQ(result.total.nharms(), 1u);
    EXPECT_EQ(result.total.nreals(), 20u);
    EXPECT_EQ(result.expected.rows(), 6);
    EXPECT_EQ(result.expected.cols(), 1);
    EXPECT_EQ(result.foreground.rows(), 6);
    EXPECT_EQ(result.foreground.cols(), 20);
    EXPECT_EQ(result.background.rows(), 6);
    EXPECT_EQ(result.nloudest, constants::DEFAULT_NLOUDEST);
    EXPECT_EQ(result.loudest.rows(), static_cast<Eigen::Index>(6 * constants::DEFAULT_NLOUDEST));
    EXPECT_EQ(result.loudest.cols(), 20);
    EXPECT_EQ(result.stats.degenerate_segments, 0u);
    // One crossing per binary per bin centre.
    EXPECT_EQ(result.stats.events_used, 18u);
    EXPECT_EQ(result.stats.excluded_future, 0u);
    EXPECT_EQ(result.stats.excluded_nonfinite, 0u);
}

TEST(EngineRun, AllValuesFiniteAndNonNegative) {
    Engine engine(dense_config());
    const auto result = engine.run(make_population(), default_edges());
    const auto& v = result.total.values();
    for (Eigen::Index i = 0; i < v.rows(); ++i) {
        for (Eigen::Index j = 0; j < v.cols(); ++j) {
            EXPECT_TRUE(std::isfinite(v(i, j)));
            EXPECT_GE(v(i, j), 0.0);
        }
    }
}

TEST(EngineRun, DeterministicForFixedSeed) {
    Engine a(dense_config());
    Engine b(dense_config());
    const auto tracks = make_population();
    const auto edges = default_edges();
    EXPECT_EQ(a.run(tracks, edges).total.values(), b.run(tracks, edges).total.values());

    auto cfg = dense_config();
    cfg.realization.seed = 100;
    Engine c(cfg);
    EXPECT_NE(a.run(tracks, edges).total.values(), c.run(tracks, edges).total.values());
}

TEST(EngineRun, MeanOverRealizationsApproachesExpectation) {
    Engine engine(dense_config(40));
    const auto result = engine.run(make_population(), default_edges());
    const Eigen::MatrixXd hc2 = result.total.harmonic_sum();
    for (Eigen::Index f = 0; f < hc2.rows(); ++f) {
        const double expected = result.expected.row(f).sum();
        ASSERT_GT(expected, 0.0);
        EXPECT_NEAR(hc2.row(f).mean() / expected, 1.0, 0.01) << "bin " << f;
    }
}

TEST(EngineRun, GwDrivenSpectrumFollowsMinusFourThirds) {
    // A single GW-driven population at fixed redshift has
    // h_c^2 proportional to f^(-4/3).
    BinaryTracks tracks;
    add_gw_binary(tracks, 1.0e9 * constants::MSOL, 5.0e8 * constants::MSOL, 0.3,
                  5.0e-10, 3.0e-8, 800);
    Engine engine(dense_config(2));
    const auto edges = default_edges();
    const auto centers = bin_centers(edges);
    const auto result = engine.run(tracks, edges);
    for (std::size_t f = 1; f < centers.size(); ++f) {
        const double ratio = result.expected(static_cast<Eigen::Index>(f), 0) /
                             result.expected(0, 0);
        const double model = std::pow(centers[f] / centers[0], -4.0 / 3.0);
        EXPECT_NEAR(ratio / model, 1.0, 0.01) << "bin " << f;
    }
}

TEST(EngineRun, SparsePopulationSplitsForegroundAndBackground) {
    EngineConfig cfg;
    cfg.realization.nreals = 200;
    cfg.realization.survey_volume = 1.0e82;
    Engine engine(cfg);
    const auto result = engine.run(make_population(), default_edges());
    const Eigen::MatrixXd hc2 = result.total.harmonic_sum();
    bool saw_empty = false;
    for (Eigen::Index f = 0; f < hc2.rows(); ++f) {
        for (Eigen::Index r = 0; r < hc2.cols(); ++r) {
            EXPECT_LE(result.foreground(f, r), hc2(f, r) * (1.0 + 1e-12));
            EXPECT_GE(result.background(f, r), -1e-12 * hc2(f, r));
            saw_empty = saw_empty || hc2(f, r) == 0.0;
        }
    }
    // Small occupations leave some realizations empty.
    EXPECT_TRUE(saw_empty);
    EXPECT_GT(result.stats.poisson_draws, 0u);
}

TEST(EngineRun, EccentricHarmonicsSpreadPower) {
    auto cfg = dense_config(2);
    cfg.harmonics = {1, 2, 3, 4};
    Engine engine(cfg);
    const auto base = make_population();

    // Same tracks with a constant eccentricity of 0.5.
    BinaryTracks ecc = base;
    ecc.eccen.assign(ecc.num_samples(), 0.5);
    ecc.dedt.assign(ecc.num_samples(), 0.0);

    const auto result = engine.run(ecc, default_edges());
    EXPECT_EQ(result.total.nharms(), 4u);
    for (Eigen::Index f = 0; f < result.expected.rows(); ++f) {
        for (Eigen::Index h = 0; h < 4; ++h) {
            EXPECT_GT(result.expected(f, h), 0.0) << "bin " << f << " harmonic " << h;
        }
    }

    // Circular tracks radiate only into n = 2.
    const auto circ = engine.run(base, default_edges());
    for (Eigen::Index f = 0; f < circ.expected.rows(); ++f) {
        EXPECT_EQ(circ.expected(f, 0), 0.0);
        EXPECT_GT(circ.expected(f, 1), 0.0);
        EXPECT_EQ(circ.expected(f, 2), 0.0);
        EXPECT_EQ(circ.expected(f, 3), 0.0);
    }
}

TEST(EngineRun, InvalidInputThrows) {
    Engine engine(dense_config());
    const auto tracks = make_population();
    const std::vector<double> one_edge{1e-9};
    const std::vector<double> reversed{3e-8, 2e-9};
    EXPECT_THROW((void)engine.run(tracks, one_edge), std::invalid_argument);
    EXPECT_THROW((void)engine.run(tracks, reversed), std::invalid_argument);

    auto broken = tracks;
    broken.mass1.pop_back();
    EXPECT_THROW((void)engine.run(broken, default_edges()), std::invalid_argument);

    auto cfg = dense_config();
    cfg.realization.nreals = 0;
    EXPECT_THROW(Engine{cfg}, std::invalid_argument);
}

TEST(EngineRun, FlatSegmentIsReportedWithTheStrain) {
    // A binary that stalls: two identical samples mid-band form one segment
    // with no frequency direction.
    const double m = 1.0e9 * constants::MSOL;
    const double redz = 0.4;
    std::vector<double> fobs{1.0e-9, 4.0e-9, 4.0e-9, 2.0e-8};
    std::vector<double> sepa, zz, mm, dadt;
    for (double f : fobs) {
        const double a = physics::kepler_sepa_from_freq(2.0 * m, f * (1.0 + redz));
        sepa.push_back(a);
        zz.push_back(redz);
        mm.push_back(m);
        dadt.push_back(physics::gw_hardening_rate_dadt(m, m, a));
    }
    BinaryTracks tracks;
    tracks.append_binary(sepa, {}, zz, mm, mm, dadt);

    Engine engine(dense_config());
    const auto edges = default_edges();
    const auto result = engine.run(tracks, edges);
    EXPECT_EQ(result.stats.degenerate_segments, 1u);
    EXPECT_EQ(result.stats.degenerate_segments, engine.resample(tracks, edges).degenerate_segments);
    EXPECT_GT(result.stats.events_used, 0u);
}

TEST(EngineRun, ResampleThenRealizeMatchesRun) {
    Engine engine(dense_config());
    const auto tracks = make_population();
    const auto edges = default_edges();
    const auto table = engine.resample(tracks, edges);
    EXPECT_EQ(engine.realize(table, edges).total.values(),
              engine.run(tracks, edges).total.values());
}

// ─── DataLoader ───────────────────────────────────────────────────────────────

TEST(DataLoaderParseCsv, EmptyStringGivesEmptyTracks) {
    EXPECT_EQ(DataLoader::parse_csv_string("").num_binaries(), 0u);
}

TEST(DataLoaderParseCsv, HeaderOnlyGivesEmptyTracks) {
    EXPECT_EQ(DataLoader::parse_csv_string(HEADER9).num_samples(), 0u);
}

TEST(DataLoaderParseCsv, UnknownHeaderGivesEmptyTracks) {
    const auto tracks = DataLoader::parse_csv_string(
        "timestamp,open,high,low,close,volume\n1,2,3,4,5,6\n");
    EXPECT_EQ(tracks.num_samples(), 0u);
}

TEST(DataLoaderParseCsv, RowsGroupedByBinaryColumn) {
    const std::string csv = std::string(HEADER9) +
        "0,3e17,0.1,0.5,2e41,1e41,-200,-1e-12,0\n"
        "0,2.9e17,0.09,0.5,2e41,1e41,-240,-1.1e-12,1e14\n"
        "7,1e17,0,1.0,4e41,4e41,-50,0,0\n"
        "0,5e17,0,0.2,1e41,1e41,-10,0,0\n";
    const auto tracks = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(tracks.num_binaries(), 3u);
    EXPECT_EQ(tracks.first_index, (std::vector<std::size_t>{0, 2, 3}));
    EXPECT_EQ(tracks.last_index, (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_DOUBLE_EQ(tracks.sepa[1], 2.9e17);
    EXPECT_DOUBLE_EQ(tracks.dedt[1], -1.1e-12);
    EXPECT_DOUBLE_EQ(tracks.time[1], 1e14);
    EXPECT_TRUE(tracks.has_time());
    EXPECT_NO_THROW(tracks.validate());
}

TEST(DataLoaderParseCsv, TimeColumnIsOptional) {
    const std::string csv = std::string(HEADER8) +
        "0,3e17,0.1,0.5,2e41,1e41,-200,-1e-12\n"
        "0,2.9e17,0.09,0.5,2e41,1e41,-240,-1.1e-12\n";
    const auto tracks = DataLoader::parse_csv_string(csv);
    EXPECT_EQ(tracks.num_samples(), 2u);
    EXPECT_FALSE(tracks.has_time());
    EXPECT_TRUE(tracks.has_eccen());
    EXPECT_NO_THROW(tracks.validate());
}

TEST(DataLoaderParseCsv, MalformedRowsSkipped) {
    const std::string csv = std::string(HEADER9) +
        "0,3e17,0.1,0.5,2e41,1e41,-200,-1e-12,0\n"
        "0,abc,0.1,0.5,2e41,1e41,-200,-1e-12,1\n"     // not a number
        "0,3e17,0.1,0.5,2e41,1e41,-200\n"             // too few columns
        "0,3e17,0.1,0.5,2e41,1e41,-200,0,1,9\n"       // too many columns
        "0,nan,0.1,0.5,2e41,1e41,-200,-1e-12,1\n"     // non-finite
        "0,3e17,1.0,0.5,2e41,1e41,-200,-1e-12,1\n"    // eccen >= 1
        "0,3e17,0.1,0.5,-2e41,1e41,-200,-1e-12,1\n"   // negative mass
        "1.5,3e17,0.1,0.5,2e41,1e41,-200,-1e-12,1\n"  // fractional id
        "0,3e17,0.1,,2e41,1e41,-200,-1e-12,1\n"       // empty field
        "# comment line\n"
        "0,2.8e17,0.1,0.5,2e41,1e41,-200,-1e-12,2\n";
    const auto tracks = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(tracks.num_samples(), 2u);
    EXPECT_EQ(tracks.num_binaries(), 1u);
    EXPECT_DOUBLE_EQ(tracks.sepa[1], 2.8e17);
}

TEST(DataLoaderParseCsv, CarriageReturnsAndSpacesTolerated) {
    const std::string csv =
        "binary, sepa, eccen, redz, mass1, mass2, dadt, dedt\r\n"
        "0, 3e17, 0.1, 0.5, 2e41, 1e41, -200, -1e-12\r\n";
    const auto tracks = DataLoader::parse_csv_string(csv);
    EXPECT_EQ(tracks.num_samples(), 1u);
}

TEST(DataLoaderValidateRow, Rules) {
    const TrackRow good{.binary = 0, .sepa = 1e17, .eccen = 0.3, .redz = 0.5,
                        .mass1 = 1e41, .mass2 = 1e41, .dadt = -1.0, .dedt = 0.0,
                        .time = 0.0};
    EXPECT_TRUE(DataLoader::validate_row(good));

    auto r = good;
    r.sepa = 0.0;
    EXPECT_FALSE(DataLoader::validate_row(r));
    r = good;
    r.redz = -1.0;
    EXPECT_FALSE(DataLoader::validate_row(r));
    r = good;
    r.eccen = -0.1;
    EXPECT_FALSE(DataLoader::validate_row(r));
    r = good;
    r.dadt = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(DataLoader::validate_row(r));
}

TEST(DataLoaderLoadCsv, MissingFileReturnsNullopt) {
    EXPECT_FALSE(DataLoader::load_csv("/nonexistent/gwbkit/tracks.csv").has_value());
}

TEST(DataLoaderLoadCsv, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "gwbkit_test_tracks.csv";
    {
        std::ofstream out(path);
        out << tracks_to_csv(make_population());
    }
    const auto loaded = DataLoader::load_csv(path.string());
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->num_binaries(), 3u);
    EXPECT_EQ(loaded->num_samples(), 600u);
}

TEST(DataLoaderEvents, FormatHasHeaderAndOneLinePerEvent) {
    Engine engine(dense_config());
    const auto table = engine.resample(make_population(), default_edges());
    const std::string csv = DataLoader::format_events_csv(table);
    std::istringstream ss(csv);
    std::string line;
    std::getline(ss, line);
    EXPECT_EQ(line, "binary,freq_index,harmonic_index,sepa,mass1,mass2,redz,eccen,dadt,dedt");
    std::size_t rows = 0;
    while (std::getline(ss, line)) ++rows;
    EXPECT_EQ(rows, table.size());
}

TEST(DataLoaderEvents, WriteToBadPathThrows) {
    resample::EventTable table;
    EXPECT_THROW(DataLoader::write_events_csv(table, "/nonexistent/gwbkit/events.csv"),
                 std::runtime_error);
}

// ─── End-to-end: DataLoader -> Engine ─────────────────────────────────────────

TEST(EndToEnd, CsvRoundtripThroughEngine) {
    const auto tracks = make_population();
    const auto parsed = DataLoader::parse_csv_string(tracks_to_csv(tracks));
    ASSERT_EQ(parsed.num_samples(), tracks.num_samples());

    Engine engine(dense_config());
    const auto edges = default_edges();
    EXPECT_EQ(engine.run(parsed, edges).total.values(),
              engine.run(tracks, edges).total.values());
}

TEST(EndToEnd, MedianStrainIsFiniteAndDecreasing) {
    Engine engine(dense_config(11));
    const auto result = engine.run(make_population(), default_edges());
    const Eigen::VectorXd med =
        realization::median_over_realizations(result.total.harmonic_sum());
    for (Eigen::Index f = 0; f < med.size(); ++f) {
        EXPECT_TRUE(std::isfinite(med(f)));
        EXPECT_GT(med(f), 0.0);
        if (f > 0) EXPECT_LT(med(f), med(f - 1));
    }
}
