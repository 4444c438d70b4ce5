#include "MathUtils.h"
#include "Statistics.h"
#include <gtest/gtest.h>
#include <cmath>

TEST(math_utils, chi_square_survival_matches_reference_values) {
    EXPECT_NEAR(MathUtils::chiSquareSurvival(3.841458820694124, 1.0), 0.05, 1e-9);
    EXPECT_NEAR(MathUtils::chiSquareSurvival(2.0, 2.0), std::exp(-1.0), 1e-12);
    EXPECT_NEAR(MathUtils::chiSquareSurvival(18.307038053275146, 10.0), 0.05, 1e-9);
    EXPECT_DOUBLE_EQ(MathUtils::chiSquareSurvival(0.0, 3.0), 1.0);
}

TEST(math_utils, regularized_gamma_rejects_invalid_arguments) {
    EXPECT_TRUE(std::isnan(MathUtils::regularizedGammaQ(0.0, 1.0)));
    EXPECT_TRUE(std::isnan(MathUtils::regularizedGammaQ(1.0, -1.0)));
    EXPECT_NEAR(MathUtils::regularizedGammaQ(1.0, 3.0), std::exp(-3.0), 1e-12);
}

TEST(math_utils, kolmogorov_survival_reference_values) {
    EXPECT_NEAR(MathUtils::kolmogorovSurvival(1.0), 0.26999967167735456, 1e-9);
    EXPECT_NEAR(MathUtils::kolmogorovSurvival(1.3580986393225505), 0.05, 1e-6);
    EXPECT_DOUBLE_EQ(MathUtils::kolmogorovSurvival(0.1), 1.0);
}

TEST(math_utils, exact_ks_matches_lattice_enumeration) {
    // Complete separation of two 3-point samples: 2 of the 20 orderings.
    EXPECT_NEAR(MathUtils::ksExactPValue(1.0, 3, 3), 0.1, 1e-12);
    EXPECT_NEAR(MathUtils::ksExactPValue(0.6, 5, 5), 0.35714285714285715, 1e-12);
    EXPECT_NEAR(MathUtils::ksExactPValue(0.5, 4, 6), 0.5523809523809524, 1e-12);
    EXPECT_DOUBLE_EQ(MathUtils::ksExactPValue(0.0, 4, 6), 1.0);
}

TEST(math_utils, average_ranks_share_ties) {
    const auto ranks = MathUtils::averageRanks({10.0, 20.0, 10.0, 30.0});
    ASSERT_EQ(ranks.size(), 4u);
    EXPECT_DOUBLE_EQ(ranks[0], 1.5);
    EXPECT_DOUBLE_EQ(ranks[1], 3.0);
    EXPECT_DOUBLE_EQ(ranks[2], 1.5);
    EXPECT_DOUBLE_EQ(ranks[3], 4.0);
}

TEST(math_utils, roc_auc_perfect_inverse_and_tied) {
    EXPECT_DOUBLE_EQ(MathUtils::rocAuc({0, 0, 1, 1}, {0.1, 0.2, 0.8, 0.9}), 1.0);
    EXPECT_DOUBLE_EQ(MathUtils::rocAuc({1, 1, 0, 0}, {0.1, 0.2, 0.8, 0.9}), 0.0);
    EXPECT_DOUBLE_EQ(MathUtils::rocAuc({0, 1, 0, 1}, {0.5, 0.5, 0.5, 0.5}), 0.5);
    EXPECT_DOUBLE_EQ(MathUtils::rocAuc({1, 1}, {0.3, 0.7}), 0.5);
}

TEST(statistics, sample_moments_skip_non_finite_values) {
    const ColumnStats stats = Statistics::calculateStats({2.0, 4.0, std::nan(""), 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    EXPECT_EQ(stats.count, 8u);
    EXPECT_DOUBLE_EQ(stats.mean, 5.0);
    EXPECT_NEAR(stats.variance, 32.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.min, 2.0);
    EXPECT_DOUBLE_EQ(stats.max, 9.0);
}

TEST(statistics, single_value_has_zero_spread) {
    const ColumnStats stats = Statistics::calculateStats({3.0});
    EXPECT_EQ(stats.count, 1u);
    EXPECT_DOUBLE_EQ(stats.stddev, 0.0);
}

TEST(statistics, pearson_uses_pairwise_complete_rows) {
    const auto r = Statistics::pearson({1.0, 2.0, std::nan(""), 4.0}, {2.0, 4.0, 100.0, 8.0});
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(*r, 1.0, 1e-12);
    EXPECT_FALSE(Statistics::pearson({1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}).has_value());
    EXPECT_FALSE(Statistics::pearson({1.0}, {2.0}).has_value());
}

TEST(statistics, correlation_matrix_zeroes_undefined_entries) {
    const auto m = Statistics::correlationMatrix({{1.0, 2.0, 3.0}, {3.0, 2.0, 1.0}, {5.0, 5.0, 5.0}});
    ASSERT_EQ(m.size(), 3u);
    EXPECT_NEAR(m[0][0], 1.0, 1e-12);
    EXPECT_NEAR(m[0][1], -1.0, 1e-12);
    EXPECT_DOUBLE_EQ(m[2][2], 0.0);
    EXPECT_DOUBLE_EQ(m[0][2], 0.0);
}
