#include "Schema.h"

std::string columnKindName(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::INT: return "int";
        case ColumnKind::FLOAT: return "float";
        case ColumnKind::CATEGORICAL: return "categorical";
        case ColumnKind::IDENTIFIER: return "identifier";
    }
    return "categorical";
}

const ColumnInfo* Schema::findColumn(const std::string& name) const {
    for (const auto& col : columns) {
        if (col.name == name) return &col;
    }
    return nullptr;
}

std::vector<std::string> Schema::columnNames() const {
    std::vector<std::string> out;
    for (const auto& col : columns) out.push_back(col.name);
    return out;
}

std::vector<std::string> Schema::trainableColumns() const {
    std::vector<std::string> out;
    for (const auto& col : columns) {
        if (!col.isIdentifier) out.push_back(col.name);
    }
    return out;
}

std::vector<std::string> Schema::identifierColumns() const {
    std::vector<std::string> out;
    for (const auto& col : columns) {
        if (col.isIdentifier) out.push_back(col.name);
    }
    return out;
}

std::vector<std::string> Schema::numericColumns() const {
    std::vector<std::string> out;
    for (const auto& col : columns) {
        if (col.isNumeric()) out.push_back(col.name);
    }
    return out;
}

std::vector<std::string> Schema::categoricalColumns() const {
    std::vector<std::string> out;
    for (const auto& col : columns) {
        if (col.isCategorical()) out.push_back(col.name);
    }
    return out;
}

Json::Value Schema::toJson() const {
    Json::Value root(Json::objectValue);
    root["num_rows"] = static_cast<Json::UInt64>(rowCount);
    root["num_columns"] = static_cast<Json::UInt64>(columnCount);

    Json::Value cols(Json::arrayValue);
    for (const auto& col : columns) {
        Json::Value c(Json::objectValue);
        c["name"] = col.name;
        c["dtype"] = columnKindName(col.kind);
        c["is_categorical"] = col.isCategorical();
        c["is_identifier"] = col.isIdentifier;
        c["min_value"] = col.minValue ? Json::Value(*col.minValue) : Json::Value(Json::nullValue);
        c["max_value"] = col.maxValue ? Json::Value(*col.maxValue) : Json::Value(Json::nullValue);
        if (col.isCategorical()) {
            Json::Value cats(Json::arrayValue);
            for (const auto& label : col.categories) cats.append(label);
            c["categories"] = cats;
        } else {
            c["categories"] = Json::Value(Json::nullValue);
        }
        c["has_missing"] = col.missingRate > 0.0;
        c["missing_rate"] = col.missingRate;
        cols.append(c);
    }
    root["columns"] = cols;
    return root;
}
