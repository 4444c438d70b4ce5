#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

enum class ColumnKind { INT, FLOAT, CATEGORICAL, IDENTIFIER };

std::string columnKindName(ColumnKind kind);

struct ColumnInfo {
    std::string name;
    ColumnKind kind = ColumnKind::CATEGORICAL;
    std::optional<double> minValue;
    std::optional<double> maxValue;
    std::vector<std::string> categories;
    double missingRate = 0.0;
    bool isIdentifier = false;

    bool isNumeric() const noexcept { return kind == ColumnKind::INT || kind == ColumnKind::FLOAT; }
    bool isCategorical() const noexcept { return kind == ColumnKind::CATEGORICAL; }
};

/// Inferred description of a dataset. Column order matches the source dataset.
struct Schema {
    std::vector<ColumnInfo> columns;
    size_t rowCount = 0;
    size_t columnCount = 0;

    const ColumnInfo* findColumn(const std::string& name) const;

    std::vector<std::string> columnNames() const;
    std::vector<std::string> trainableColumns() const;
    std::vector<std::string> identifierColumns() const;
    std::vector<std::string> numericColumns() const;
    std::vector<std::string> categoricalColumns() const;

    Json::Value toJson() const;
};
