#include "SchemaInferrer.h"

#include "CommonUtils.h"

#include <algorithm>
#include <set>
#include <unordered_set>

namespace {
constexpr double kIdentifierUniquenessRatio = 0.95;

std::vector<std::string> sortedLabels(const TypedDataset& data, size_t col) {
    std::set<std::string> labels;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (!data.isMissing(col, r)) labels.insert(data.cellText(col, r));
    }
    return std::vector<std::string>(labels.begin(), labels.end());
}
} // namespace

Schema SchemaInferrer::infer(const TypedDataset& data) const {
    Schema schema;
    schema.rowCount = data.rowCount();
    schema.columnCount = data.colCount();
    schema.columns.reserve(data.colCount());
    for (size_t c = 0; c < data.colCount(); ++c) {
        schema.columns.push_back(inferColumn(data, c));
    }
    return schema;
}

ColumnInfo SchemaInferrer::inferColumn(const TypedDataset& data, size_t col) const {
    const TypedColumn& column = data.column(col);
    ColumnInfo info;
    info.name = column.name;

    const size_t rows = data.rowCount();
    const size_t missing = data.missingCount(col);
    info.missingRate = rows == 0 ? 0.0 : static_cast<double>(missing) / static_cast<double>(rows);
    const size_t present = rows - missing;

    if (column.type == ColumnType::TEXT || present == 0) {
        info.kind = ColumnKind::CATEGORICAL;
        info.categories = sortedLabels(data, col);
        return info;
    }

    const std::vector<double> values = data.numericValues(col);
    std::unordered_set<double> distinct;
    double lo = 0.0;
    double hi = 0.0;
    bool first = true;
    bool allIntegral = true;
    for (size_t r = 0; r < rows; ++r) {
        if (column.missing[r]) continue;
        const double v = values[r];
        distinct.insert(v);
        if (first || v < lo) lo = v;
        if (first || v > hi) hi = v;
        first = false;
        if (!CommonUtils::isIntegral(v)) allIntegral = false;
    }

    const double uniquenessRatio = static_cast<double>(distinct.size()) / static_cast<double>(present);
    if (uniquenessRatio > kIdentifierUniquenessRatio && column.type == ColumnType::INTEGER) {
        info.kind = ColumnKind::IDENTIFIER;
        info.isIdentifier = true;
        info.minValue = lo;
        info.maxValue = hi;
        return info;
    }

    if (distinct.size() <= categoricalThreshold_) {
        info.kind = ColumnKind::CATEGORICAL;
        info.categories = sortedLabels(data, col);
        return info;
    }

    info.kind = allIntegral ? ColumnKind::INT : ColumnKind::FLOAT;
    info.minValue = lo;
    info.maxValue = hi;
    return info;
}
