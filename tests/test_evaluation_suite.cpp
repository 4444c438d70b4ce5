#include "EvaluationSuite.h"
#include "SchemaInferrer.h"
#include "SynthraExceptions.h"
#include <gtest/gtest.h>

#include <cmath>

namespace {

TypedDataset sample(size_t rows) {
    const std::vector<std::string> names = {"north", "south", "east", "west"};
    std::vector<double> x;
    std::vector<double> y;
    std::vector<std::string> g;
    for (size_t i = 0; i < rows; ++i) {
        x.push_back(0.25 + 0.5 * static_cast<double>(i));
        y.push_back(std::sin(static_cast<double>(i)) + 0.125);
        g.push_back(names[i % names.size()]);
    }
    TypedDataset data;
    data.addColumn(TypedDataset::floatColumn("x", x));
    data.addColumn(TypedDataset::floatColumn("y", y));
    data.addColumn(TypedDataset::textColumn("g", g));
    return data;
}

AdversarialOptions quickForest() {
    AdversarialOptions options;
    options.treeCount = 20;
    return options;
}

} // namespace

TEST(evaluation_suite, distribution_interpretation_lists_failing_columns) {
    EXPECT_EQ(EvaluationSuite::interpretDistribution({}, "numeric"),
              "PASS - All numeric distributions match (p > 0.05)");
    EXPECT_EQ(EvaluationSuite::interpretDistribution({{"a", 0.5}}, "categorical"),
              "PASS - All categorical distributions match (p > 0.05)");
    EXPECT_EQ(EvaluationSuite::interpretDistribution({{"a", 0.01}, {"b", 0.05}, {"c", 0.9}}, "numeric"),
              "FAIL - Distributions differ for: a, b");
}

TEST(evaluation_suite, correlation_interpretation_thresholds) {
    EXPECT_EQ(EvaluationSuite::interpretCorrelation(0.01), "PASS - Relationships well-preserved (MSE=0.010000)");
    EXPECT_EQ(EvaluationSuite::interpretCorrelation(0.05), "WARNING - Minor distortion (MSE=0.050000)");
    EXPECT_EQ(EvaluationSuite::interpretCorrelation(0.2), "FAIL - Relationships distorted (MSE=0.200000)");
}

TEST(evaluation_suite, auc_interpretation_bands) {
    EXPECT_EQ(EvaluationSuite::interpretAuc(0.5), "EXCELLENT - Synthetic indistinguishable from real (AUC=0.5000)");
    EXPECT_EQ(EvaluationSuite::interpretAuc(0.42), "GOOD - Limited distinguishability (AUC=0.4200)");
    EXPECT_EQ(EvaluationSuite::interpretAuc(0.58), "GOOD - Limited distinguishability (AUC=0.5800)");
    EXPECT_EQ(EvaluationSuite::interpretAuc(0.61), "WARNING - Easily distinguishable (AUC=0.6100)");
    EXPECT_EQ(EvaluationSuite::interpretAuc(0.3), "WARNING - Easily distinguishable (AUC=0.3000)");
}

TEST(evaluation_suite, identical_data_passes_distribution_and_correlation_checks) {
    const TypedDataset data = sample(120);
    const Schema schema = SchemaInferrer().infer(data);
    const EvaluationReport report = EvaluationSuite(quickForest()).run(data, data, schema);

    ASSERT_EQ(report.ksTest.count("x"), 1u);
    ASSERT_EQ(report.ksTest.count("y"), 1u);
    EXPECT_DOUBLE_EQ(report.ksTest.at("x").statistic, 0.0);
    EXPECT_DOUBLE_EQ(report.ksTest.at("x").pValue, 1.0);
    ASSERT_EQ(report.chiSquare.count("g"), 1u);
    EXPECT_NEAR(report.chiSquare.at("g").pValue, 1.0, 1e-12);
    EXPECT_EQ(report.chiSquare.at("g").degreesOfFreedom, 3u);
    EXPECT_NEAR(report.correlationMse, 0.0, 1e-12);
    EXPECT_TRUE(report.skipped.empty());

    EXPECT_EQ(report.interpretation.at("ks_test"), "PASS - All numeric distributions match (p > 0.05)");
    EXPECT_EQ(report.interpretation.at("chi_square"), "PASS - All categorical distributions match (p > 0.05)");
    EXPECT_EQ(report.interpretation.at("correlation_mse"), "PASS - Relationships well-preserved (MSE=0.000000)");
    EXPECT_EQ(report.interpretation.count("adversarial_auc"), 1u);
    EXPECT_EQ(report.message, "Evaluation completed successfully");
}

TEST(evaluation_suite, json_report_carries_every_metric) {
    const TypedDataset data = sample(60);
    const Schema schema = SchemaInferrer().infer(data);
    const Json::Value json = EvaluationSuite(quickForest()).run(data, data, schema).toJson();

    EXPECT_TRUE(json.isMember("ks_test"));
    EXPECT_TRUE(json.isMember("chi_square"));
    EXPECT_TRUE(json.isMember("correlation_mse"));
    EXPECT_TRUE(json.isMember("adversarial_auc"));
    EXPECT_TRUE(json.isMember("interpretation"));
    EXPECT_DOUBLE_EQ(json["ks_test"]["x"]["statistic"].asDouble(), 0.0);
    EXPECT_EQ(json["chi_square"]["g"]["dof"].asUInt64(), 3u);
    EXPECT_TRUE(json["skipped"].isArray());
    EXPECT_EQ(json["message"].asString(), "Evaluation completed successfully");
}

TEST(evaluation_suite, skipped_columns_are_reported_not_thrown) {
    const TypedDataset real = sample(40);
    TypedDataset synthetic;
    synthetic.addColumn(TypedDataset::floatColumn("x", std::vector<double>(40, std::nan(""))));
    synthetic.addColumn(real.columns()[1]);
    synthetic.addColumn(real.columns()[2]);
    const Schema schema = SchemaInferrer().infer(real);

    const EvaluationReport report = EvaluationSuite(quickForest()).run(real, synthetic, schema);
    EXPECT_EQ(report.ksTest.count("x"), 0u);
    ASSERT_EQ(report.skipped.size(), 1u);
    EXPECT_EQ(report.skipped[0].column, "x");
    EXPECT_EQ(report.skipped[0].metric, MetricKind::KS_TEST);

    const Json::Value json = report.toJson();
    ASSERT_EQ(json["skipped"].size(), 1u);
    EXPECT_EQ(json["skipped"][0]["metric"].asString(), "ks_test");
    EXPECT_NE(report.toMarkdown().find("### Skipped"), std::string::npos);
}

TEST(evaluation_suite, markdown_report_has_sections) {
    const TypedDataset data = sample(40);
    const Schema schema = SchemaInferrer().infer(data);
    const std::string markdown = EvaluationSuite(quickForest()).run(data, data, schema).toMarkdown();

    EXPECT_EQ(markdown.rfind("# Synthetic Data Evaluation", 0), 0u);
    EXPECT_NE(markdown.find("Kolmogorov-Smirnov"), std::string::npos);
    EXPECT_NE(markdown.find("| x |"), std::string::npos);
    EXPECT_NE(markdown.find("Adversarial AUC: "), std::string::npos);
    EXPECT_EQ(markdown.find("### Skipped"), std::string::npos);
}

TEST(evaluation_suite, missing_trainable_column_throws) {
    const TypedDataset real = sample(20);
    const Schema schema = SchemaInferrer().infer(real);
    const TypedDataset synthetic = real.select({"x", "y"});
    EXPECT_THROW(EvaluationSuite(quickForest()).run(real, synthetic, schema), Synthra::DatasetException);
}
