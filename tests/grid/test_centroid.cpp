/// @file tests/grid/test_centroid.cpp
/// @brief Unit tests for multilinear cell centroids and in-cell sampling.

#include <gtest/gtest.h>
#include "gwbkit/density_grid.hpp"

#include <random>
#include <stdexcept>
#include <vector>

using namespace gwbkit::grid;

TEST(Centroid_OneDim, LinearDensity) {
    const std::vector<double> corners{1.0, 3.0};
    const std::vector<double> lo{0.0};
    const std::vector<double> hi{1.0};
    const auto c = multilinear_centroid(corners, lo, hi);
    ASSERT_EQ(c.size(), 1u);
    EXPECT_DOUBLE_EQ(c[0], 7.0 / 12.0);
}

TEST(Centroid_OneDim, ScalesWithBox) {
    const std::vector<double> corners{1.0, 3.0};
    const std::vector<double> lo{2.0};
    const std::vector<double> hi{6.0};
    EXPECT_DOUBLE_EQ(multilinear_centroid(corners, lo, hi)[0], 2.0 + 4.0 * 7.0 / 12.0);
}

TEST(Centroid_Uniform, IsMidpoint) {
    const std::vector<double> corners(16, 2.5);
    const std::vector<double> lo{0.0, 1.0, 2.0, 3.0};
    const std::vector<double> hi{1.0, 3.0, 5.0, 7.0};
    const auto c = multilinear_centroid(corners, lo, hi);
    for (std::size_t d = 0; d < 4; ++d) {
        EXPECT_DOUBLE_EQ(c[d], 0.5 * (lo[d] + hi[d]));
    }
}

TEST(Centroid_Empty, IsMidpoint) {
    const std::vector<double> corners(4, 0.0);
    const std::vector<double> lo{0.0, 0.0};
    const std::vector<double> hi{2.0, 4.0};
    const auto c = multilinear_centroid(corners, lo, hi);
    EXPECT_DOUBLE_EQ(c[0], 1.0);
    EXPECT_DOUBLE_EQ(c[1], 2.0);
}

TEST(Centroid_TwoDim, CornerOrderIsRowMajor) {
    // Density only at corner (1, 0): pulled high in dim 0, low in dim 1.
    const std::vector<double> corners{0.0, 0.0, 1.0, 0.0};
    const std::vector<double> lo{0.0, 0.0};
    const std::vector<double> hi{1.0, 1.0};
    const auto c = multilinear_centroid(corners, lo, hi);
    EXPECT_DOUBLE_EQ(c[0], 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(c[1], 1.0 / 3.0);
}

TEST(Centroid_Validation, RejectsShapeMismatch) {
    const std::vector<double> three(3, 1.0);
    const std::vector<double> lo{0.0, 0.0};
    const std::vector<double> hi{1.0, 1.0};
    const std::vector<double> hi1{1.0};
    EXPECT_THROW((void)multilinear_centroid(three, lo, hi), std::invalid_argument);
    EXPECT_THROW((void)multilinear_centroid(std::vector<double>(4, 1.0), lo, hi1),
                 std::invalid_argument);
}

TEST(Sample_InCell, StaysInsideBox) {
    std::mt19937_64 rng(4);
    const std::vector<double> corners{0.1, 2.0, 0.0, 5.0, 1.0, 0.3, 0.7, 0.0};
    const std::vector<double> lo{1.0, -2.0, 10.0};
    const std::vector<double> hi{2.0, -1.0, 10.5};
    for (int i = 0; i < 2000; ++i) {
        const auto p = sample_in_cell(corners, lo, hi, rng);
        for (std::size_t d = 0; d < 3; ++d) {
            EXPECT_GE(p[d], lo[d]);
            EXPECT_LE(p[d], hi[d]);
        }
    }
}

TEST(Sample_InCell, MeanConvergesToCentroid) {
    std::mt19937_64 rng(8);
    const std::vector<double> corners{1.0, 4.0, 0.5, 2.0, 3.0, 0.2, 1.0, 6.0};
    const std::vector<double> lo{0.0, 0.0, 0.0};
    const std::vector<double> hi{1.0, 1.0, 1.0};
    const auto centroid = multilinear_centroid(corners, lo, hi);

    const int n = 40000;
    std::vector<double> mean(3, 0.0);
    for (int i = 0; i < n; ++i) {
        const auto p = sample_in_cell(corners, lo, hi, rng);
        for (std::size_t d = 0; d < 3; ++d) mean[d] += p[d] / n;
    }
    // Uniform-ish marginals have sigma ~ 0.29; 5 sigma / sqrt(n) ~ 0.007.
    for (std::size_t d = 0; d < 3; ++d) {
        EXPECT_NEAR(mean[d], centroid[d], 0.01) << "dim " << d;
    }
}

TEST(Sample_InCell, EmptyCellIsUniform) {
    std::mt19937_64 rng(15);
    const std::vector<double> corners(2, 0.0);
    const std::vector<double> lo{0.0};
    const std::vector<double> hi{1.0};
    double mean = 0.0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) mean += sample_in_cell(corners, lo, hi, rng)[0] / n;
    EXPECT_NEAR(mean, 0.5, 0.01);
}
