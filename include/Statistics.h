#pragma once

#include <cstddef>
#include <optional>
#include <vector>

struct ColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double variance = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

namespace Statistics {
/// Welford moments over the finite entries; sample variance (n - 1), 0 with fewer than two values.
ColumnStats calculateStats(const std::vector<double>& col);

/// Pearson r over rows where both sides are finite. Empty when fewer than two pairs or zero variance.
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

/// Square correlation matrix; undefined coefficients are reported as 0.
std::vector<std::vector<double>> correlationMatrix(const std::vector<std::vector<double>>& columns);
}
