#include "RandomForest.h"

#include "SynthraExceptions.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct SplitCandidate {
    bool found = false;
    int feature = -1;
    double threshold = 0.0;
    double impurity = 0.0;
};

double gini(double positives, double total) {
    if (total <= 0.0) return 0.0;
    const double p = positives / total;
    return 2.0 * p * (1.0 - p);
}

struct WorkItem {
    int node;
    std::vector<size_t> samples;
    size_t depth;
};
} // namespace

RandomForestClassifier::RandomForestClassifier(RandomForestOptions options) : options_(options) {
    if (options_.treeCount == 0) options_.treeCount = 1;
    if (options_.minSamplesSplit < 2) options_.minSamplesSplit = 2;
    if (options_.minSamplesLeaf < 1) options_.minSamplesLeaf = 1;
}

void RandomForestClassifier::fit(const Matrix& X, const std::vector<int>& y) {
    if (X.empty() || X.size() != y.size()) {
        throw Synthra::DatasetException("Random forest needs a non-empty design matrix matching the labels");
    }
    featureCount_ = X.front().size();
    for (const auto& row : X) {
        if (row.size() != featureCount_) throw Synthra::DatasetException("Random forest design matrix is ragged");
    }

    trees_.assign(options_.treeCount, Tree{});
    const int treeCount = static_cast<int>(options_.treeCount);

#ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int t = 0; t < treeCount; ++t) {
        std::seed_seq seq{options_.seed, static_cast<uint32_t>(t)};
        std::mt19937 rng(seq);
        trees_[static_cast<size_t>(t)] = buildTree(X, y, rng);
    }
}

RandomForestClassifier::Tree RandomForestClassifier::buildTree(const Matrix& X,
                                                               const std::vector<int>& y,
                                                               std::mt19937& rng) const {
    const size_t n = X.size();
    const size_t p = featureCount_;
    const size_t maxFeatures = options_.maxFeatures > 0
        ? std::min(options_.maxFeatures, p)
        : std::max<size_t>(1, static_cast<size_t>(std::sqrt(static_cast<double>(p))));

    std::vector<size_t> rootSamples(n);
    if (options_.bootstrap) {
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        for (size_t i = 0; i < n; ++i) rootSamples[i] = pick(rng);
    } else {
        std::iota(rootSamples.begin(), rootSamples.end(), 0);
    }

    Tree tree;
    tree.push_back(Node{});
    std::vector<WorkItem> stack;
    stack.push_back(WorkItem{0, std::move(rootSamples), 0});

    std::vector<size_t> features(p);
    std::iota(features.begin(), features.end(), 0);
    std::vector<size_t> order;

    while (!stack.empty()) {
        WorkItem item = std::move(stack.back());
        stack.pop_back();

        const std::vector<size_t>& samples = item.samples;
        double positives = 0.0;
        for (size_t s : samples) positives += (y[s] == 1) ? 1.0 : 0.0;
        const double total = static_cast<double>(samples.size());
        tree[static_cast<size_t>(item.node)].positiveFraction = total > 0.0 ? positives / total : 0.0;

        const bool pure = positives == 0.0 || positives == total;
        const bool depthReached = options_.maxDepth > 0 && item.depth >= options_.maxDepth;
        if (pure || depthReached || samples.size() < options_.minSamplesSplit || p == 0) continue;

        // Visit features in random order; keep drawing past maxFeatures only while no split is valid.
        std::shuffle(features.begin(), features.end(), rng);
        SplitCandidate best;
        size_t visited = 0;
        for (size_t f : features) {
            if (visited >= maxFeatures && best.found) break;
            ++visited;

            order = samples;
            std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return X[a][f] < X[b][f]; });
            if (X[order.front()][f] == X[order.back()][f]) continue;

            double leftPositives = 0.0;
            for (size_t i = 0; i + 1 < order.size(); ++i) {
                leftPositives += (y[order[i]] == 1) ? 1.0 : 0.0;
                const double lo = X[order[i]][f];
                const double hi = X[order[i + 1]][f];
                if (lo == hi) continue;
                const size_t leftCount = i + 1;
                const size_t rightCount = order.size() - leftCount;
                if (leftCount < options_.minSamplesLeaf || rightCount < options_.minSamplesLeaf) continue;

                const double nl = static_cast<double>(leftCount);
                const double nr = static_cast<double>(rightCount);
                const double impurity = (nl * gini(leftPositives, nl) + nr * gini(positives - leftPositives, nr)) / total;
                if (!best.found || impurity < best.impurity) {
                    double threshold = lo + (hi - lo) / 2.0;
                    if (threshold >= hi) threshold = lo;
                    best = SplitCandidate{true, static_cast<int>(f), threshold, impurity};
                }
            }
        }
        if (!best.found) continue;

        std::vector<size_t> left;
        std::vector<size_t> right;
        for (size_t s : samples) {
            if (X[s][static_cast<size_t>(best.feature)] <= best.threshold) {
                left.push_back(s);
            } else {
                right.push_back(s);
            }
        }

        const int leftIndex = static_cast<int>(tree.size());
        tree.push_back(Node{});
        const int rightIndex = static_cast<int>(tree.size());
        tree.push_back(Node{});

        Node& node = tree[static_cast<size_t>(item.node)];
        node.feature = best.feature;
        node.threshold = best.threshold;
        node.left = leftIndex;
        node.right = rightIndex;

        stack.push_back(WorkItem{leftIndex, std::move(left), item.depth + 1});
        stack.push_back(WorkItem{rightIndex, std::move(right), item.depth + 1});
    }
    return tree;
}

double RandomForestClassifier::predictTree(const Tree& tree, const std::vector<double>& row) {
    size_t idx = 0;
    while (tree[idx].feature >= 0) {
        const Node& node = tree[idx];
        idx = static_cast<size_t>(row[static_cast<size_t>(node.feature)] <= node.threshold ? node.left : node.right);
    }
    return tree[idx].positiveFraction;
}

std::vector<double> RandomForestClassifier::predictProba(const Matrix& X) const {
    std::vector<double> out(X.size(), 0.0);
    if (trees_.empty()) return out;
    for (size_t i = 0; i < X.size(); ++i) {
        if (X[i].size() != featureCount_) throw Synthra::DatasetException("Prediction row width does not match training data");
        double sum = 0.0;
        for (const auto& tree : trees_) sum += predictTree(tree, X[i]);
        out[i] = sum / static_cast<double>(trees_.size());
    }
    return out;
}
