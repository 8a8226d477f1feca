#include <gtest/gtest.h>
#include <stats/quintile_classifier.hpp>

#include <random>

using namespace atlas::stats;

// === BOUNDARY COMPUTATION ===

TEST(QuintileClassifierTest, FiveEvenlySpacedValues) {
    auto b = compute_boundaries({10, 20, 30, 40, 50});
    ASSERT_EQ(b.size(), 4u);
    EXPECT_DOUBLE_EQ(b[0], 18.0);
    EXPECT_DOUBLE_EQ(b[1], 26.0);
    EXPECT_DOUBLE_EQ(b[2], 34.0);
    EXPECT_DOUBLE_EQ(b[3], 42.0);
}

TEST(QuintileClassifierTest, InputOrderDoesNotMatter) {
    auto sorted = compute_boundaries({10, 20, 30, 40, 50});
    auto shuffled = compute_boundaries({40, 10, 50, 30, 20});
    EXPECT_EQ(sorted.thresholds, shuffled.thresholds);
}

TEST(QuintileClassifierTest, IntegralIndexUsesOrderStatistic) {
    // n = 11: p * (n - 1) = 2, 4, 6, 8 exactly
    auto b = compute_boundaries({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11});
    ASSERT_EQ(b.size(), 4u);
    EXPECT_DOUBLE_EQ(b[0], 3.0);
    EXPECT_DOUBLE_EQ(b[1], 5.0);
    EXPECT_DOUBLE_EQ(b[2], 7.0);
    EXPECT_DOUBLE_EQ(b[3], 9.0);
}

TEST(QuintileClassifierTest, NonPositiveValuesExcludedFromBasis) {
    auto with_noise = compute_boundaries({0, -5, 10, 20, -1, 30, 40, 50, 0});
    auto clean = compute_boundaries({10, 20, 30, 40, 50});
    EXPECT_EQ(with_noise.thresholds, clean.thresholds);
}

TEST(QuintileClassifierTest, FewerThanFivePositiveValuesGiveEmptyBoundaries) {
    EXPECT_TRUE(compute_boundaries({}).empty());
    EXPECT_TRUE(compute_boundaries({1, 2, 3, 4}).empty());
    // Five entries but only four positive
    EXPECT_TRUE(compute_boundaries({1, 2, 3, 4, 0}).empty());
    EXPECT_TRUE(compute_boundaries({1, 2, 3, 4, -7}).empty());
}

TEST(QuintileClassifierTest, StatsKeepSortedPositiveBasis) {
    auto stats = compute_stats({30, -2, 10, 20});
    EXPECT_EQ(stats.sorted_values, (std::vector<double>{10, 20, 30}));
    EXPECT_TRUE(stats.boundaries.empty());
}

TEST(QuintileClassifierTest, BoundariesAreNonDecreasing) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dist(-100.0, 1000.0);
    for (int trial = 0; trial < 50; ++trial) {
        std::vector<double> values(5 + trial * 3);
        for (auto& v : values) v = dist(rng);
        auto b = compute_boundaries(values);
        if (b.empty()) continue;
        ASSERT_EQ(b.size(), 4u);
        for (size_t i = 1; i < b.size(); ++i) {
            EXPECT_LE(b[i - 1], b[i]) << "trial " << trial;
        }
    }
}

// === CLASSIFICATION ===

TEST(QuintileClassifierTest, ClassifiesWithLessOrEqualRule) {
    auto b = compute_boundaries({10, 20, 30, 40, 50});
    EXPECT_EQ(classify(10, b), 0);
    EXPECT_EQ(classify(18, b), 0);
    EXPECT_EQ(classify(18.5, b), 1);
    // Exactly on boundary[1] stays in bin 1
    EXPECT_EQ(classify(26, b), 1);
    EXPECT_EQ(classify(27, b), 2);
    EXPECT_EQ(classify(34, b), 2);
    EXPECT_EQ(classify(40, b), 3);
    EXPECT_EQ(classify(50, b), 4);
}

TEST(QuintileClassifierTest, BoundaryValuesClassifyIntoTheirOwnBin) {
    auto b = compute_boundaries({3, 8, 13, 21, 34, 55, 89});
    ASSERT_EQ(b.size(), 4u);
    for (size_t i = 0; i < b.size(); ++i) {
        EXPECT_EQ(classify(b[i], b), static_cast<int>(i));
    }
    EXPECT_EQ(classify(b[3] + 1e-9, b), 4);
}

TEST(QuintileClassifierTest, EmptyBoundariesFallBackToMiddleBin) {
    QuantileBoundaries empty;
    EXPECT_EQ(classify(-1000, empty), FALLBACK_BIN);
    EXPECT_EQ(classify(0, empty), FALLBACK_BIN);
    EXPECT_EQ(classify(1e12, empty), 2);
}

TEST(QuintileClassifierTest, NegativeValuesLandInLowestBin) {
    auto b = compute_boundaries({10, 20, 30, 40, 50});
    EXPECT_EQ(classify(-50, b), 0);
}

TEST(QuintileClassifierTest, BinNames) {
    EXPECT_STREQ(bin_name(0), "Lowest");
    EXPECT_STREQ(bin_name(2), "Medium");
    EXPECT_STREQ(bin_name(4), "Highest");
    EXPECT_STREQ(bin_name(7), "Unknown");
}

// === NEAREST-RANK (CHART) THRESHOLDS ===

TEST(QuintileClassifierTest, NearestRankThresholds) {
    // n = 5: ranks floor(5p) = 1, 2, 3, 4
    auto b = nearest_rank_boundaries({50, 10, 40, 20, 30});
    ASSERT_EQ(b.size(), 4u);
    EXPECT_DOUBLE_EQ(b[0], 20.0);
    EXPECT_DOUBLE_EQ(b[1], 30.0);
    EXPECT_DOUBLE_EQ(b[2], 40.0);
    EXPECT_DOUBLE_EQ(b[3], 50.0);
}

TEST(QuintileClassifierTest, NearestRankKeepsNonPositiveAndSmallSets) {
    auto b = nearest_rank_boundaries({-3, 0});
    ASSERT_EQ(b.size(), 4u);
    EXPECT_DOUBLE_EQ(b[0], -3.0);   // floor(0.4) = 0
    EXPECT_DOUBLE_EQ(b[1], -3.0);   // floor(0.8) = 0
    EXPECT_DOUBLE_EQ(b[2], 0.0);    // floor(1.2) = 1
    EXPECT_DOUBLE_EQ(b[3], 0.0);    // floor(1.6) = 1
    EXPECT_TRUE(nearest_rank_boundaries({}).empty());
}
