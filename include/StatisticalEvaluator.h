#pragma once

#include "Schema.h"
#include "TypedDataset.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct KsResult {
    double statistic = 0.0;
    double pValue = 1.0;
};

struct ChiSquareResult {
    double statistic = 0.0;
    double pValue = 1.0;
    size_t degreesOfFreedom = 0;
};

enum class MetricKind { KS_TEST, CHI_SQUARE, CORRELATION, ADVERSARIAL };

std::string metricKindName(MetricKind kind);

/// A per-column test that could not be computed. Recorded, never thrown.
struct MetricSkip {
    std::string column;
    MetricKind metric = MetricKind::KS_TEST;
    std::string reason;
};

struct StatisticalSimilarity {
    std::map<std::string, KsResult> ks;
    std::map<std::string, ChiSquareResult> chiSquare;
    double correlationMse = 0.0;
    std::vector<MetricSkip> skipped;
};

class StatisticalEvaluator {
public:
    static constexpr size_t kExactKsLimit = 10000;

    /**
     * @brief Two-sample Kolmogorov-Smirnov test on the finite values of each side.
     * @post Empty when either side has no finite values.
     */
    static std::optional<KsResult> ksTest(const std::vector<double>& real, const std::vector<double>& synthetic);

    /**
     * @brief Pearson chi-square on the 2 x k table over the union of labels.
     * @details Yates' correction applies when the table has one degree of freedom. A single
     *          label gives statistic 0 and p-value 1.
     * @post Empty when either side has no labels.
     */
    static std::optional<ChiSquareResult> chiSquareTest(const std::vector<std::string>& real,
                                                        const std::vector<std::string>& synthetic);

    /// Mean squared elementwise difference of the two correlation matrices; 0 with fewer than two columns.
    static double correlationMse(const TypedDataset& real,
                                 const TypedDataset& synthetic,
                                 const std::vector<std::string>& numericColumns);

    /**
     * @brief Runs KS on numeric, chi-square on categorical trainable columns and the correlation MSE.
     * @throws Synthra::DatasetException when either dataset lacks a trainable schema column.
     */
    StatisticalSimilarity evaluate(const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema) const;
};
