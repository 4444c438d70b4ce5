#include "StatisticalEvaluator.h"
#include "MathUtils.h"
#include "SchemaInferrer.h"
#include "SynthraExceptions.h"
#include <gtest/gtest.h>

#include <cmath>

namespace {

std::vector<std::string> repeat(const std::string& label, size_t times) {
    return std::vector<std::string>(times, label);
}

std::vector<std::string> concat(std::vector<std::string> a, const std::vector<std::string>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

TypedDataset pairData(const std::vector<double>& x, const std::vector<double>& y) {
    TypedDataset data;
    data.addColumn(TypedDataset::floatColumn("x", x));
    data.addColumn(TypedDataset::floatColumn("y", y));
    return data;
}

} // namespace

TEST(statistical_evaluator, ks_identical_samples_do_not_differ) {
    const std::vector<double> values = {1.0, 2.5, 3.0, 4.0, 7.5};
    const auto ks = StatisticalEvaluator::ksTest(values, values);
    ASSERT_TRUE(ks.has_value());
    EXPECT_DOUBLE_EQ(ks->statistic, 0.0);
    EXPECT_DOUBLE_EQ(ks->pValue, 1.0);
}

TEST(statistical_evaluator, ks_separated_samples_use_exact_p_value) {
    const auto ks = StatisticalEvaluator::ksTest({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0});
    ASSERT_TRUE(ks.has_value());
    EXPECT_DOUBLE_EQ(ks->statistic, 1.0);
    EXPECT_NEAR(ks->pValue, 0.1, 1e-12);
}

TEST(statistical_evaluator, ks_samples_up_to_the_limit_use_exact_p_value) {
    std::vector<double> a;
    std::vector<double> b;
    for (int i = 0; i < 500; ++i) {
        a.push_back(i);
        b.push_back(i + 43);
    }
    const auto ks = StatisticalEvaluator::ksTest(a, b);
    ASSERT_TRUE(ks.has_value());
    EXPECT_NEAR(ks->statistic, 0.086, 1e-12);
    // Closed form for equal sizes: 2 * sum_j (-1)^(j+1) C(1000, 500 - 43j) / C(1000, 500).
    EXPECT_NEAR(ks->pValue, 0.0495026117489019, 1e-10);
    EXPECT_GT(std::abs(ks->pValue - MathUtils::kolmogorovSurvival(ks->statistic * std::sqrt(250.0))), 1e-5);
}

TEST(statistical_evaluator, ks_samples_over_the_limit_use_asymptotic_p_value) {
    const size_t n = StatisticalEvaluator::kExactKsLimit + 1;
    std::vector<double> a;
    std::vector<double> b;
    for (size_t i = 0; i < n; ++i) {
        a.push_back(static_cast<double>(i));
        b.push_back(static_cast<double>(i + n / 2));
    }
    const auto ks = StatisticalEvaluator::ksTest(a, b);
    ASSERT_TRUE(ks.has_value());
    EXPECT_NEAR(ks->statistic, 5000.0 / 10001.0, 1e-12);
    const double en = static_cast<double>(n) / 2.0;
    EXPECT_NEAR(ks->pValue, MathUtils::kolmogorovSurvival(ks->statistic * std::sqrt(en)), 1e-15);
    EXPECT_LT(ks->pValue, 1e-6);
}

TEST(statistical_evaluator, ks_ignores_nan_and_needs_values_on_both_sides) {
    EXPECT_FALSE(StatisticalEvaluator::ksTest({std::nan("")}, {1.0}).has_value());
    const auto ks = StatisticalEvaluator::ksTest({1.0, std::nan(""), 2.0}, {1.0, 2.0});
    ASSERT_TRUE(ks.has_value());
    EXPECT_DOUBLE_EQ(ks->statistic, 0.0);
}

TEST(statistical_evaluator, chi_square_applies_yates_on_two_labels) {
    const auto real = concat(repeat("a", 30), repeat("b", 10));
    const auto synth = concat(repeat("a", 10), repeat("b", 30));
    const auto chi = StatisticalEvaluator::chiSquareTest(real, synth);
    ASSERT_TRUE(chi.has_value());
    EXPECT_EQ(chi->degreesOfFreedom, 1u);
    EXPECT_NEAR(chi->statistic, 18.05, 1e-9);
    EXPECT_NEAR(chi->pValue, MathUtils::chiSquareSurvival(18.05, 1.0), 1e-15);
    EXPECT_LT(chi->pValue, 0.001);
}

TEST(statistical_evaluator, chi_square_is_symmetric) {
    const auto real = concat(concat(repeat("x", 12), repeat("y", 7)), repeat("z", 3));
    const auto synth = concat(concat(repeat("x", 5), repeat("y", 9)), repeat("w", 4));
    const auto ab = StatisticalEvaluator::chiSquareTest(real, synth);
    const auto ba = StatisticalEvaluator::chiSquareTest(synth, real);
    ASSERT_TRUE(ab && ba);
    EXPECT_EQ(ab->degreesOfFreedom, 3u);
    EXPECT_NEAR(ab->statistic, ba->statistic, 1e-12);
    EXPECT_NEAR(ab->pValue, ba->pValue, 1e-12);
}

TEST(statistical_evaluator, chi_square_matching_proportions_pass) {
    const auto real = concat(repeat("a", 10), repeat("b", 20));
    const auto synth = concat(repeat("a", 20), repeat("b", 40));
    const auto chi = StatisticalEvaluator::chiSquareTest(real, synth);
    ASSERT_TRUE(chi.has_value());
    EXPECT_DOUBLE_EQ(chi->statistic, 0.0);
    EXPECT_DOUBLE_EQ(chi->pValue, 1.0);
}

TEST(statistical_evaluator, chi_square_single_label_and_empty_side) {
    const auto chi = StatisticalEvaluator::chiSquareTest(repeat("only", 4), repeat("only", 9));
    ASSERT_TRUE(chi.has_value());
    EXPECT_DOUBLE_EQ(chi->statistic, 0.0);
    EXPECT_DOUBLE_EQ(chi->pValue, 1.0);
    EXPECT_EQ(chi->degreesOfFreedom, 0u);
    EXPECT_FALSE(StatisticalEvaluator::chiSquareTest({}, repeat("a", 2)).has_value());
}

TEST(statistical_evaluator, correlation_mse_is_zero_against_itself) {
    const TypedDataset data = pairData({1, 2, 3, 4, 5}, {2, 1, 4, 3, 6});
    EXPECT_DOUBLE_EQ(StatisticalEvaluator::correlationMse(data, data, {"x", "y"}), 0.0);
}

TEST(statistical_evaluator, correlation_mse_perfect_versus_uncorrelated) {
    const TypedDataset real = pairData({1, 2, 3, 4}, {2, 4, 6, 8});
    const TypedDataset synth = pairData({1, 2, 3, 4}, {1, -1, -1, 1});
    EXPECT_NEAR(StatisticalEvaluator::correlationMse(real, synth, {"x", "y"}), 0.5, 1e-12);
}

TEST(statistical_evaluator, correlation_mse_needs_two_columns) {
    const TypedDataset real = pairData({1, 2, 3}, {3, 2, 1});
    const TypedDataset synth = pairData({1, 2, 3}, {1, 2, 3});
    EXPECT_DOUBLE_EQ(StatisticalEvaluator::correlationMse(real, synth, {"x"}), 0.0);
}

TEST(statistical_evaluator, evaluate_skips_identifiers_and_non_numeric_synthetic) {
    TypedDataset real;
    std::vector<int64_t> ids;
    std::vector<double> amount;
    std::vector<std::string> tier;
    for (int i = 0; i < 30; ++i) {
        ids.push_back(i + 1);
        amount.push_back(10.0 + i * 1.25);
        tier.push_back(i % 3 == 0 ? "gold" : "silver");
    }
    real.addColumn(TypedDataset::integerColumn("id", ids));
    real.addColumn(TypedDataset::floatColumn("amount", amount));
    real.addColumn(TypedDataset::textColumn("tier", tier));
    const Schema schema = SchemaInferrer().infer(real);

    TypedDataset synth;
    synth.addColumn(TypedDataset::textColumn("amount", std::vector<std::string>(30, "oops")));
    synth.addColumn(TypedDataset::textColumn("tier", tier));

    const StatisticalSimilarity result = StatisticalEvaluator().evaluate(real, synth, schema);
    EXPECT_TRUE(result.ks.empty());
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0].column, "amount");
    EXPECT_EQ(result.skipped[0].reason, "synthetic values are not numeric");
    ASSERT_EQ(result.chiSquare.count("tier"), 1u);
    EXPECT_DOUBLE_EQ(result.chiSquare.at("tier").pValue, 1.0);
}

TEST(statistical_evaluator, evaluate_rejects_missing_synthetic_column) {
    TypedDataset real;
    real.addColumn(TypedDataset::textColumn("tier", {"a", "b", "a"}));
    const Schema schema = SchemaInferrer().infer(real);
    TypedDataset synth;
    synth.addColumn(TypedDataset::textColumn("other", {"a", "b", "a"}));
    EXPECT_THROW(StatisticalEvaluator().evaluate(real, synth, schema), Synthra::DatasetException);
}
