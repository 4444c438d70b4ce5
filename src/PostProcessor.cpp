#include "PostProcessor.h"

#include "CommonUtils.h"
#include "Statistics.h"
#include "SynthraExceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace {
std::vector<double> rawNumeric(const TypedDataset& raw, size_t col) {
    if (raw.column(col).isNumeric()) return raw.numericValues(col);
    std::vector<double> out(raw.rowCount(), std::numeric_limits<double>::quiet_NaN());
    for (size_t r = 0; r < raw.rowCount(); ++r) {
        if (raw.isMissing(col, r)) continue;
        double v = 0.0;
        if (CommonUtils::parseDouble(CommonUtils::trim(raw.cellText(col, r)), v)) out[r] = v;
    }
    return out;
}

TypedColumn castCategorical(const TypedDataset& raw, size_t col) {
    const size_t n = raw.rowCount();
    std::vector<std::string> labels(n);
    MissingMask missing(n, static_cast<uint8_t>(0));
    for (size_t r = 0; r < n; ++r) {
        if (raw.isMissing(col, r)) {
            missing[r] = 1;
            continue;
        }
        labels[r] = raw.cellText(col, r);
    }
    return TypedDataset::textColumn(raw.column(col).name, std::move(labels), std::move(missing));
}

TypedColumn castNumeric(const ColumnInfo& info, std::vector<double> values) {
    for (double& v : values) {
        if (!std::isfinite(v)) continue;
        if (info.minValue) v = std::max(v, *info.minValue);
        if (info.maxValue) v = std::min(v, *info.maxValue);
    }

    if (info.kind == ColumnKind::INT) {
        MissingMask missing(values.size(), static_cast<uint8_t>(0));
        std::vector<int64_t> ints(values.size(), 0);
        for (size_t i = 0; i < values.size(); ++i) {
            if (!std::isfinite(values[i])) {
                missing[i] = 1;
                continue;
            }
            ints[i] = static_cast<int64_t>(std::llround(values[i]));
        }
        return TypedDataset::integerColumn(info.name, std::move(ints), std::move(missing));
    }
    for (double& v : values) {
        if (!std::isfinite(v)) v = std::numeric_limits<double>::quiet_NaN();
    }
    return TypedDataset::floatColumn(info.name, std::move(values));
}
} // namespace

std::vector<double> PostProcessor::matchMoments(const std::vector<double>& values, const MomentStats& target) {
    const ColumnStats synth = Statistics::calculateStats(values);
    std::vector<double> out = values;
    if (synth.count == 0) return out;

    if (synth.stddev < kDegenerateStd) {
        std::fill(out.begin(), out.end(), target.mean);
        return out;
    }
    for (double& v : out) {
        if (!std::isfinite(v)) continue;
        v = (v - synth.mean) / synth.stddev * target.stddev + target.mean;
    }
    return out;
}

bool PostProcessor::identifierRangeFits(int64_t start, size_t rowCount) noexcept {
    if (rowCount == 0) return true;
    // Unsigned wrap gives the exact distance from start to INT64_MAX.
    const uint64_t headroom = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) - static_cast<uint64_t>(start);
    return static_cast<uint64_t>(rowCount - 1) <= headroom;
}

TypedColumn PostProcessor::sequentialIdentifier(const std::string& name, int64_t start, size_t rowCount) {
    if (!identifierRangeFits(start, rowCount)) {
        throw Synthra::DatasetException("Identifier column '" + name + "' starting at " + std::to_string(start) +
                                        " overflows int64 for " + std::to_string(rowCount) + " rows");
    }
    std::vector<int64_t> ids(rowCount);
    for (size_t i = 0; i < rowCount; ++i) ids[i] = start + static_cast<int64_t>(i);
    return TypedDataset::integerColumn(name, std::move(ids));
}

ReconcileOutcome PostProcessor::reconcile(const TypedDataset& raw,
                                          const Schema& schema,
                                          const OriginalStatistics& stats,
                                          size_t rowCount) const {
    if (raw.colCount() > 0 && raw.rowCount() != rowCount) {
        throw Synthra::DatasetException("Generated " + std::to_string(raw.rowCount()) +
                                        " rows, expected " + std::to_string(rowCount));
    }

    ReconcileOutcome outcome;
    for (const auto& info : schema.columns) {
        if (info.isIdentifier) {
            const int64_t start = info.minValue ? static_cast<int64_t>(std::llround(*info.minValue)) : 1;
            outcome.data.addColumn(sequentialIdentifier(info.name, start, rowCount));
            continue;
        }

        const int idx = raw.findColumnIndex(info.name);
        if (idx < 0) {
            outcome.missingColumns.push_back(info.name);
            std::cout << "[Synthra][Warning] Generated data has no column '" << info.name << "'; skipped\n";
            continue;
        }
        const size_t col = static_cast<size_t>(idx);

        if (info.isCategorical()) {
            outcome.data.addColumn(castCategorical(raw, col));
            continue;
        }

        std::vector<double> values = rawNumeric(raw, col);
        const auto it = stats.find(info.name);
        if (it != stats.end()) values = matchMoments(values, it->second);
        outcome.data.addColumn(castNumeric(info, std::move(values)));
    }
    return outcome;
}
