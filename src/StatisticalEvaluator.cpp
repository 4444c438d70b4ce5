#include "StatisticalEvaluator.h"

#include "CommonUtils.h"
#include "MathUtils.h"
#include "Statistics.h"
#include "SynthraExceptions.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace {
std::vector<double> finiteSorted(const std::vector<double>& values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) out.push_back(v);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<double> columnAsNumbers(const TypedDataset& data, size_t col) {
    if (data.column(col).isNumeric()) return data.numericValues(col);
    std::vector<double> out(data.rowCount(), std::nan(""));
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (data.isMissing(col, r)) continue;
        double v = 0.0;
        if (CommonUtils::parseDouble(CommonUtils::trim(data.cellText(col, r)), v)) out[r] = v;
    }
    return out;
}

std::vector<std::string> presentLabels(const TypedDataset& data, size_t col) {
    std::vector<std::string> out;
    out.reserve(data.rowCount());
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!data.isMissing(col, r)) out.push_back(data.cellText(col, r));
    }
    return out;
}

size_t requireColumn(const TypedDataset& data, const std::string& name, const char* side) {
    const int idx = data.findColumnIndex(name);
    if (idx < 0) throw Synthra::DatasetException(std::string(side) + " dataset is missing column: " + name);
    return static_cast<size_t>(idx);
}
} // namespace

std::string metricKindName(MetricKind kind) {
    switch (kind) {
        case MetricKind::KS_TEST: return "ks_test";
        case MetricKind::CHI_SQUARE: return "chi_square";
        case MetricKind::CORRELATION: return "correlation_mse";
        case MetricKind::ADVERSARIAL: return "adversarial_auc";
    }
    return "unknown";
}

std::optional<KsResult> StatisticalEvaluator::ksTest(const std::vector<double>& real, const std::vector<double>& synthetic) {
    const std::vector<double> a = finiteSorted(real);
    const std::vector<double> b = finiteSorted(synthetic);
    if (a.empty() || b.empty()) return std::nullopt;

    const size_t n = a.size();
    const size_t m = b.size();
    size_t i = 0;
    size_t j = 0;
    double d = 0.0;
    while (i < n && j < m) {
        const double v = std::min(a[i], b[j]);
        while (i < n && a[i] == v) ++i;
        while (j < m && b[j] == v) ++j;
        const double gap = std::abs(static_cast<double>(i) / static_cast<double>(n) -
                                    static_cast<double>(j) / static_cast<double>(m));
        d = std::max(d, gap);
    }

    KsResult result;
    result.statistic = d;
    if (std::max(n, m) <= kExactKsLimit) {
        result.pValue = MathUtils::ksExactPValue(d, n, m);
    } else {
        const double en = static_cast<double>(n) * static_cast<double>(m) / static_cast<double>(n + m);
        result.pValue = MathUtils::kolmogorovSurvival(d * std::sqrt(en));
    }
    return result;
}

std::optional<ChiSquareResult> StatisticalEvaluator::chiSquareTest(const std::vector<std::string>& real,
                                                                   const std::vector<std::string>& synthetic) {
    if (real.empty() || synthetic.empty()) return std::nullopt;

    std::set<std::string> labelSet(real.begin(), real.end());
    labelSet.insert(synthetic.begin(), synthetic.end());
    const std::vector<std::string> labels(labelSet.begin(), labelSet.end());
    const size_t k = labels.size();

    std::vector<double> observed[2] = {std::vector<double>(k, 0.0), std::vector<double>(k, 0.0)};
    auto tally = [&](const std::vector<std::string>& values, std::vector<double>& counts) {
        for (const auto& v : values) {
            const auto it = std::lower_bound(labels.begin(), labels.end(), v);
            counts[static_cast<size_t>(it - labels.begin())] += 1.0;
        }
    };
    tally(real, observed[0]);
    tally(synthetic, observed[1]);

    ChiSquareResult result;
    result.degreesOfFreedom = k - 1;
    if (k < 2) return result;

    const double rowTotals[2] = {static_cast<double>(real.size()), static_cast<double>(synthetic.size())};
    const double grand = rowTotals[0] + rowTotals[1];
    const bool yates = result.degreesOfFreedom == 1;

    double statistic = 0.0;
    for (size_t c = 0; c < k; ++c) {
        const double colTotal = observed[0][c] + observed[1][c];
        for (int r = 0; r < 2; ++r) {
            const double expected = rowTotals[r] * colTotal / grand;
            double diff = observed[r][c] - expected;
            if (yates) {
                const double shrink = std::min(0.5, std::abs(diff));
                diff = diff > 0.0 ? diff - shrink : diff + shrink;
            }
            statistic += diff * diff / expected;
        }
    }
    result.statistic = statistic;
    result.pValue = MathUtils::chiSquareSurvival(statistic, static_cast<double>(result.degreesOfFreedom));
    return result;
}

double StatisticalEvaluator::correlationMse(const TypedDataset& real,
                                            const TypedDataset& synthetic,
                                            const std::vector<std::string>& numericColumns) {
    if (numericColumns.size() < 2) return 0.0;

    std::vector<std::vector<double>> realCols;
    std::vector<std::vector<double>> synthCols;
    for (const auto& name : numericColumns) {
        realCols.push_back(columnAsNumbers(real, requireColumn(real, name, "Real")));
        synthCols.push_back(columnAsNumbers(synthetic, requireColumn(synthetic, name, "Synthetic")));
    }

    const auto realCorr = Statistics::correlationMatrix(realCols);
    const auto synthCorr = Statistics::correlationMatrix(synthCols);
    const size_t p = numericColumns.size();
    double sum = 0.0;
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = 0; j < p; ++j) {
            const double diff = realCorr[i][j] - synthCorr[i][j];
            sum += diff * diff;
        }
    }
    return sum / static_cast<double>(p * p);
}

StatisticalSimilarity StatisticalEvaluator::evaluate(const TypedDataset& real,
                                                     const TypedDataset& synthetic,
                                                     const Schema& schema) const {
    StatisticalSimilarity out;
    std::vector<std::string> numeric;

    for (const auto& info : schema.columns) {
        if (info.isIdentifier) continue;
        const size_t rc = requireColumn(real, info.name, "Real");
        const size_t sc = requireColumn(synthetic, info.name, "Synthetic");

        if (info.isNumeric()) {
            numeric.push_back(info.name);
            if (!synthetic.column(sc).isNumeric()) {
                out.skipped.push_back(MetricSkip{info.name, MetricKind::KS_TEST, "synthetic values are not numeric"});
                continue;
            }
            const auto ks = ksTest(columnAsNumbers(real, rc), synthetic.numericValues(sc));
            if (!ks) {
                out.skipped.push_back(MetricSkip{info.name, MetricKind::KS_TEST, "no non-null values on one side"});
                continue;
            }
            out.ks[info.name] = *ks;
        } else {
            const auto chi = chiSquareTest(presentLabels(real, rc), presentLabels(synthetic, sc));
            if (!chi) {
                out.skipped.push_back(MetricSkip{info.name, MetricKind::CHI_SQUARE, "empty contingency row"});
                continue;
            }
            out.chiSquare[info.name] = *chi;
        }
    }

    out.correlationMse = correlationMse(real, synthetic, numeric);
    return out;
}
