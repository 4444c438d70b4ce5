#pragma once

#include "RandomForest.h"
#include "Schema.h"
#include "TypedDataset.h"

#include <cstdint>
#include <string>
#include <vector>

struct AdversarialOptions {
    uint32_t seed = 42;
    size_t treeCount = 100;
    double testFraction = 0.30;
};

/// Real rows (label 1) stacked over synthetic rows (label 0), one-hot encoded and imputed.
struct AdversarialDesign {
    Matrix features;
    std::vector<int> labels;
    std::vector<std::string> featureNames;
};

class AdversarialEvaluator {
public:
    explicit AdversarialEvaluator(AdversarialOptions options = {}) : options_(options) {}

    /**
     * @brief ROC-AUC of a random forest separating real from synthetic rows on a held-out split.
     * @details 0.5 means indistinguishable. A design without features scores 0.5.
     * @throws Synthra::DatasetException when a side has fewer than two rows or lacks a trainable column.
     */
    double score(const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema) const;

    /**
     * @brief Builds the design matrix from trainable columns.
     * @details Categorical columns become indicators over the sorted label union with the first label
     *          dropped; a missing label sets no indicator. Missing numeric cells take the combined mean.
     */
    static AdversarialDesign buildDesign(const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema);

    /// Per-class shuffle and split; each class keeps at least one row on each side.
    static void stratifiedSplit(const std::vector<int>& labels,
                                double testFraction,
                                uint32_t seed,
                                std::vector<size_t>& trainIdx,
                                std::vector<size_t>& testIdx);

    const AdversarialOptions& options() const noexcept { return options_; }

private:
    AdversarialOptions options_;
};
