#pragma once

#include "AdversarialEvaluator.h"
#include "StatisticalEvaluator.h"

#include <json/json.h>

#include <map>
#include <string>
#include <vector>

struct EvaluationReport {
    std::map<std::string, KsResult> ksTest;
    std::map<std::string, ChiSquareResult> chiSquare;
    double correlationMse = 0.0;
    double adversarialAuc = 0.5;
    std::map<std::string, std::string> interpretation;
    std::vector<MetricSkip> skipped;
    std::string message = "Evaluation completed successfully";

    Json::Value toJson() const;
    std::string toMarkdown() const;
};

class EvaluationSuite {
public:
    static constexpr double kSignificance = 0.05;

    explicit EvaluationSuite(AdversarialOptions options = {}, bool verbose = false)
        : adversarial_(options), verbose_(verbose) {}

    /**
     * @brief Scores synthetic data against real data on the schema's trainable columns.
     * @throws Synthra::DatasetException when a trainable column is absent or a side has fewer than two rows.
     */
    EvaluationReport run(const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema) const;

    static std::string interpretDistribution(const std::vector<std::pair<std::string, double>>& pValues,
                                             const std::string& family);
    static std::string interpretCorrelation(double mse);
    static std::string interpretAuc(double auc);

private:
    StatisticalEvaluator statistical_;
    AdversarialEvaluator adversarial_;
    bool verbose_;
};
