#include "Statistics.h"

#include <algorithm>
#include <cmath>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats;
    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : col) {
        if (!std::isfinite(value)) continue;
        if (count == 0) {
            stats.min = value;
            stats.max = value;
        } else {
            stats.min = std::min(stats.min, value);
            stats.max = std::max(stats.max, value);
        }
        ++count;
        const double delta = value - mean;
        mean += delta / static_cast<double>(count);
        const double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.count = count;
    if (count == 0) return stats;

    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);
    return stats;
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    double meanX = 0.0;
    double meanY = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        ++pairs;
        meanX += (x[i] - meanX) / static_cast<double>(pairs);
        meanY += (y[i] - meanY) / static_cast<double>(pairs);
    }
    if (pairs < 2) return std::nullopt;

    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        const double dx = x[i] - meanX;
        const double dy = y[i] - meanY;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return std::nullopt;
    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

std::vector<std::vector<double>> Statistics::correlationMatrix(const std::vector<std::vector<double>>& columns) {
    const size_t p = columns.size();
    std::vector<std::vector<double>> out(p, std::vector<double>(p, 0.0));
    for (size_t i = 0; i < p; ++i) {
        for (size_t j = i; j < p; ++j) {
            const double r = pearson(columns[i], columns[j]).value_or(0.0);
            out[i][j] = r;
            out[j][i] = r;
        }
    }
    return out;
}
