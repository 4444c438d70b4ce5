#pragma once

#include <cstdint>
#include <random>
#include <vector>

using Matrix = std::vector<std::vector<double>>;

struct RandomForestOptions {
    size_t treeCount = 100;
    size_t maxFeatures = 0;  // 0 selects floor(sqrt(p))
    size_t minSamplesSplit = 2;
    size_t minSamplesLeaf = 1;
    size_t maxDepth = 0;     // 0 grows until leaves are pure
    uint32_t seed = 42;
    bool bootstrap = true;
};

/**
 * Binary random forest on Gini impurity. Labels are 0/1.
 * Tree t draws from an engine seeded with (seed, t), so results do not depend on thread count.
 */
class RandomForestClassifier {
public:
    explicit RandomForestClassifier(RandomForestOptions options = {});

    /**
     * @brief Grows the forest.
     * @pre X.size() == y.size() and every row has the same width.
     * @throws Synthra::DatasetException on empty or ragged input.
     */
    void fit(const Matrix& X, const std::vector<int>& y);

    /// Mean positive-class leaf fraction across trees.
    std::vector<double> predictProba(const Matrix& X) const;

    size_t treeCount() const noexcept { return trees_.size(); }

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        double positiveFraction = 0.0;
    };
    using Tree = std::vector<Node>;

    Tree buildTree(const Matrix& X, const std::vector<int>& y, std::mt19937& rng) const;
    static double predictTree(const Tree& tree, const std::vector<double>& row);

    RandomForestOptions options_;
    std::vector<Tree> trees_;
    size_t featureCount_ = 0;
};
