#include "AdversarialEvaluator.h"

#include "CommonUtils.h"
#include "MathUtils.h"
#include "SynthraExceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <set>

namespace {
size_t requireColumn(const TypedDataset& data, const std::string& name) {
    const int idx = data.findColumnIndex(name);
    if (idx < 0) throw Synthra::DatasetException("Adversarial evaluation: missing column: " + name);
    return static_cast<size_t>(idx);
}

std::vector<double> numbersOf(const TypedDataset& data, size_t col) {
    if (data.column(col).isNumeric()) return data.numericValues(col);
    std::vector<double> out(data.rowCount(), std::nan(""));
    for (size_t r = 0; r < data.rowCount(); ++r) {
        double v = 0.0;
        if (!data.isMissing(col, r) && CommonUtils::parseDouble(CommonUtils::trim(data.cellText(col, r)), v)) out[r] = v;
    }
    return out;
}
} // namespace

AdversarialDesign AdversarialEvaluator::buildDesign(const TypedDataset& real,
                                                    const TypedDataset& synthetic,
                                                    const Schema& schema) {
    const size_t nReal = real.rowCount();
    const size_t total = nReal + synthetic.rowCount();

    AdversarialDesign design;
    design.features.assign(total, {});
    design.labels.assign(total, 0);
    std::fill(design.labels.begin(), design.labels.begin() + static_cast<std::ptrdiff_t>(nReal), 1);

    for (const auto& info : schema.columns) {
        if (info.isIdentifier) continue;
        const size_t rc = requireColumn(real, info.name);
        const size_t sc = requireColumn(synthetic, info.name);

        if (info.isCategorical()) {
            std::vector<std::string> cells(total);
            MissingMask missing(total, static_cast<uint8_t>(0));
            std::set<std::string> labels;
            for (size_t r = 0; r < total; ++r) {
                const bool fromReal = r < nReal;
                const TypedDataset& src = fromReal ? real : synthetic;
                const size_t col = fromReal ? rc : sc;
                const size_t row = fromReal ? r : r - nReal;
                if (src.isMissing(col, row)) {
                    missing[r] = 1;
                    continue;
                }
                cells[r] = src.cellText(col, row);
                labels.insert(cells[r]);
            }
            if (labels.size() < 2) continue;
            // The first sorted label is the reference level.
            for (auto it = std::next(labels.begin()); it != labels.end(); ++it) {
                design.featureNames.push_back(info.name + "_" + *it);
                for (size_t r = 0; r < total; ++r) {
                    design.features[r].push_back(!missing[r] && cells[r] == *it ? 1.0 : 0.0);
                }
            }
            continue;
        }

        std::vector<double> values = numbersOf(real, rc);
        const std::vector<double> synthValues = numbersOf(synthetic, sc);
        values.insert(values.end(), synthValues.begin(), synthValues.end());

        double sum = 0.0;
        size_t count = 0;
        for (double v : values) {
            if (!std::isfinite(v)) continue;
            sum += v;
            ++count;
        }
        const double fill = count > 0 ? sum / static_cast<double>(count) : 0.0;
        design.featureNames.push_back(info.name);
        for (size_t r = 0; r < total; ++r) {
            design.features[r].push_back(std::isfinite(values[r]) ? values[r] : fill);
        }
    }
    return design;
}

void AdversarialEvaluator::stratifiedSplit(const std::vector<int>& labels,
                                           double testFraction,
                                           uint32_t seed,
                                           std::vector<size_t>& trainIdx,
                                           std::vector<size_t>& testIdx) {
    trainIdx.clear();
    testIdx.clear();
    std::mt19937 rng(seed);
    for (int cls : {0, 1}) {
        std::vector<size_t> members;
        for (size_t i = 0; i < labels.size(); ++i) {
            if (labels[i] == cls) members.push_back(i);
        }
        if (members.size() < 2) {
            throw Synthra::DatasetException("Adversarial evaluation needs at least two " +
                                            std::string(cls == 1 ? "real" : "synthetic") + " rows");
        }
        std::shuffle(members.begin(), members.end(), rng);
        const auto wanted = static_cast<size_t>(std::llround(testFraction * static_cast<double>(members.size())));
        const size_t testCount = std::clamp<size_t>(wanted, 1, members.size() - 1);
        testIdx.insert(testIdx.end(), members.begin(), members.begin() + static_cast<std::ptrdiff_t>(testCount));
        trainIdx.insert(trainIdx.end(), members.begin() + static_cast<std::ptrdiff_t>(testCount), members.end());
    }
    std::sort(trainIdx.begin(), trainIdx.end());
    std::sort(testIdx.begin(), testIdx.end());
}

double AdversarialEvaluator::score(const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema) const {
    const AdversarialDesign design = buildDesign(real, synthetic, schema);

    std::vector<size_t> trainIdx;
    std::vector<size_t> testIdx;
    stratifiedSplit(design.labels, options_.testFraction, options_.seed, trainIdx, testIdx);

    if (design.featureNames.empty()) {
        std::cout << "[Synthra][Warning] No usable features for adversarial evaluation; AUC set to 0.5\n";
        return 0.5;
    }

    Matrix trainX;
    std::vector<int> trainY;
    trainX.reserve(trainIdx.size());
    for (size_t i : trainIdx) {
        trainX.push_back(design.features[i]);
        trainY.push_back(design.labels[i]);
    }
    Matrix testX;
    std::vector<int> testY;
    for (size_t i : testIdx) {
        testX.push_back(design.features[i]);
        testY.push_back(design.labels[i]);
    }

    RandomForestOptions forestOptions;
    forestOptions.treeCount = options_.treeCount;
    forestOptions.seed = options_.seed;
    RandomForestClassifier forest(forestOptions);
    forest.fit(trainX, trainY);
    return MathUtils::rocAuc(testY, forest.predictProba(testX));
}
