#pragma once
#include <cstddef>
#include <vector>

class MathUtils {
public:
    /**
     * @brief Regularized upper incomplete gamma Q(a, x) = Gamma(a, x) / Gamma(a).
     * @pre a > 0, x >= 0.
     * @post Returns a value clamped to [0, 1]; NaN for invalid arguments.
     */
    static double regularizedGammaQ(double a, double x);

    /**
     * @brief Survival function of the chi-square distribution, P(X >= statistic).
     * @pre dof > 0.
     */
    static double chiSquareSurvival(double statistic, double dof);

    /**
     * @brief Kolmogorov limiting distribution tail Q_KS(lambda).
     */
    static double kolmogorovSurvival(double lambda);

    /**
     * @brief Exact two-sided P(D >= d) for the two-sample KS statistic.
     * @details Walks the n x m lattice of merged-sample orderings and keeps the probability mass
     *          of paths that never reach |i/n - j/m| >= d.
     * @pre n > 0, m > 0.
     */
    static double ksExactPValue(double d, size_t n, size_t m);

    /// Ranks starting at 1 with ties sharing their mean rank.
    static std::vector<double> averageRanks(const std::vector<double>& values);

    /**
     * @brief Area under the ROC curve via the Mann-Whitney rank-sum identity.
     * @pre labels.size() == scores.size(); label 1 marks the positive class.
     * @post Returns 0.5 when either class is absent.
     */
    static double rocAuc(const std::vector<int>& labels, const std::vector<double>& scores);
};
