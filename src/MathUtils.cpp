#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace {
constexpr double kEps = 3e-14;
constexpr double kFpMin = 1e-300;
constexpr int kMaxIter = 1000;

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

// Series expansion of P(a, x), valid for x < a + 1.
double gammaSeries(double a, double x) {
    double ap = a;
    double sum = 1.0 / a;
    double del = sum;
    for (int n = 1; n <= kMaxIter; ++n) {
        ap += 1.0;
        del *= x / ap;
        sum += del;
        if (std::abs(del) < std::abs(sum) * kEps) break;
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

// Continued fraction for Q(a, x) (Lentz's method), valid for x >= a + 1.
double gammaContinuedFraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / kFpMin;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= kMaxIter; ++i) {
        const double an = -i * (i - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < kFpMin) d = kFpMin;
        c = b + an / c;
        if (std::abs(c) < kFpMin) c = kFpMin;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < kEps) break;
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}
} // namespace

double MathUtils::regularizedGammaQ(double a, double x) {
    if (!(a > 0.0) || x < 0.0 || std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    if (x == 0.0) return 1.0;
    if (std::isinf(x)) return 0.0;
    if (x < a + 1.0) return clamp01(1.0 - gammaSeries(a, x));
    return clamp01(gammaContinuedFraction(a, x));
}

double MathUtils::chiSquareSurvival(double statistic, double dof) {
    if (!(dof > 0.0)) return std::numeric_limits<double>::quiet_NaN();
    if (statistic <= 0.0) return 1.0;
    return regularizedGammaQ(dof / 2.0, statistic / 2.0);
}

double MathUtils::kolmogorovSurvival(double lambda) {
    if (lambda <= 0.0) return 1.0;
    // Below this the alternating series converges too slowly and the tail is 1 to double precision.
    if (lambda < 0.18) return 1.0;
    double sum = 0.0;
    double sign = 1.0;
    for (int k = 1; k <= 100; ++k) {
        const double term = std::exp(-2.0 * k * k * lambda * lambda);
        sum += sign * term;
        if (term < 1e-16) break;
        sign = -sign;
    }
    return clamp01(2.0 * sum);
}

double MathUtils::ksExactPValue(double d, size_t n, size_t m) {
    if (n == 0 || m == 0) return 1.0;
    if (d <= 0.0) return 1.0;
    const double tol = 1e-12;
    const double dn = static_cast<double>(n);
    const double dm = static_cast<double>(m);
    auto outside = [&](size_t i, size_t j) {
        return std::abs(static_cast<double>(i) / dn - static_cast<double>(j) / dm) >= d - tol;
    };

    // w[j] holds the probability that a uniformly random path reaches (i, j) without leaving the band.
    std::vector<double> w(m + 1, 0.0);
    w[0] = 1.0;
    for (size_t j = 1; j <= m; ++j) {
        w[j] = outside(0, j) ? 0.0 : w[j - 1];
    }
    for (size_t i = 1; i <= n; ++i) {
        w[0] = outside(i, 0) ? 0.0 : w[0];
        for (size_t j = 1; j <= m; ++j) {
            if (outside(i, j)) {
                w[j] = 0.0;
                continue;
            }
            const double total = static_cast<double>(i + j);
            w[j] = (static_cast<double>(i) / total) * w[j] + (static_cast<double>(j) / total) * w[j - 1];
        }
    }
    return clamp01(1.0 - w[m]);
}

std::vector<double> MathUtils::averageRanks(const std::vector<double>& values) {
    std::vector<size_t> idx(values.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        if (values[a] == values[b]) return a < b;
        return values[a] < values[b];
    });

    std::vector<double> ranks(values.size(), 0.0);
    size_t i = 0;
    while (i < idx.size()) {
        size_t j = i + 1;
        while (j < idx.size() && values[idx[j]] == values[idx[i]]) ++j;
        const double rank = (static_cast<double>(i + 1) + static_cast<double>(j)) * 0.5;
        for (size_t k = i; k < j; ++k) ranks[idx[k]] = rank;
        i = j;
    }
    return ranks;
}

double MathUtils::rocAuc(const std::vector<int>& labels, const std::vector<double>& scores) {
    const size_t n = std::min(labels.size(), scores.size());
    const std::vector<double> ranks = averageRanks(std::vector<double>(scores.begin(), scores.begin() + n));
    double positiveRankSum = 0.0;
    size_t positives = 0;
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] == 1) {
            positiveRankSum += ranks[i];
            ++positives;
        }
    }
    const size_t negatives = n - positives;
    if (positives == 0 || negatives == 0) return 0.5;
    const double p = static_cast<double>(positives);
    const double q = static_cast<double>(negatives);
    return (positiveRankSum - p * (p + 1.0) / 2.0) / (p * q);
}
