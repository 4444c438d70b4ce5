#include "SchemaConsistencyValidator.h"

#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <unordered_set>

namespace {
bool holdsIntegers(const TypedDataset& data, size_t col) {
    const TypedColumn& column = data.column(col);
    if (column.type == ColumnType::INTEGER) return true;
    if (column.type == ColumnType::TEXT) return false;
    const auto& values = std::get<std::vector<double>>(column.values);
    for (size_t r = 0; r < values.size(); ++r) {
        if (!column.missing[r] && !CommonUtils::isIntegral(values[r])) return false;
    }
    return true;
}

template <class Bound>
size_t countOutOfRange(const TypedDataset& data, size_t col, const std::optional<Bound>& lo, const std::optional<Bound>& hi) {
    const std::vector<double> values = data.numericValues(col);
    size_t count = 0;
    for (size_t r = 0; r < values.size(); ++r) {
        if (data.isMissing(col, r)) continue;
        if (lo && values[r] < static_cast<double>(*lo)) ++count;
        if (hi && values[r] > static_cast<double>(*hi)) ++count;
    }
    return count;
}

// Declared labels match a cell by text, or by value when both sides are numbers ("2" matches 2.0).
class CategoryMembership {
public:
    explicit CategoryMembership(const std::vector<std::string>& labels) : texts_(labels.begin(), labels.end()) {
        for (const auto& label : labels) {
            double v = 0.0;
            if (CommonUtils::parseDouble(CommonUtils::trim(label), v) && !std::isnan(v)) numbers_.insert(v);
        }
    }

    bool contains(const std::string& cell) const {
        if (texts_.count(cell)) return true;
        if (numbers_.empty()) return false;
        double v = 0.0;
        return CommonUtils::parseDouble(CommonUtils::trim(cell), v) && numbers_.count(v) > 0;
    }

private:
    std::set<std::string> texts_;
    std::set<double> numbers_;
};
} // namespace

std::string SchemaConsistencyReport::typeConsistency() const {
    if (typeIssues.empty()) return "All columns match declared types";
    return CommonUtils::join(typeIssues, "; ");
}

Json::Value SchemaConsistencyReport::toJson() const {
    Json::Value root(Json::objectValue);
    root["schema_validity"] = validityLabel();
    root["type_consistency"] = typeConsistency();
    root["range_violations"] = static_cast<Json::UInt64>(rangeViolations);
    root["category_violations"] = static_cast<Json::UInt64>(categoryViolations);
    Json::Value rates(Json::objectValue);
    for (const auto& [name, rate] : nullRate) rates[name] = rate;
    root["null_rate"] = rates;
    root["identifier_issues"] = identifierIssue ? Json::Value(*identifierIssue) : Json::Value(Json::nullValue);
    root["message"] = message;
    return root;
}

std::optional<std::string> SchemaConsistencyValidator::checkIdentifier(const TypedDataset& data, size_t col, int64_t start) {
    const size_t n = data.rowCount();
    if (data.missingCount(col) > 0) return std::string("Identifier contains null values");
    if (n == 0) return std::nullopt;

    std::vector<int64_t> ids(n, 0);
    const TypedColumn& column = data.column(col);
    for (size_t r = 0; r < n; ++r) {
        if (column.type == ColumnType::INTEGER) {
            ids[r] = std::get<std::vector<int64_t>>(column.values)[r];
        } else if (column.type == ColumnType::FLOAT) {
            const double v = std::get<std::vector<double>>(column.values)[r];
            if (!CommonUtils::isIntegral(v)) return std::string("Identifier contains non-integer values");
            ids[r] = static_cast<int64_t>(v);
        } else if (!CommonUtils::parseInt64(CommonUtils::trim(data.cellText(col, r)), ids[r])) {
            return std::string("Identifier contains non-integer values");
        }
    }

    const std::unordered_set<int64_t> unique(ids.begin(), ids.end());
    if (unique.size() != n) return std::string("Identifier contains duplicate values");

    const auto [minIt, maxIt] = std::minmax_element(ids.begin(), ids.end());
    if (*minIt != start) return "Identifier does not start from " + std::to_string(start);
    if (*maxIt != start + static_cast<int64_t>(n) - 1) return std::string("Identifier is not continuous");
    return std::nullopt;
}

SchemaConsistencyReport SchemaConsistencyValidator::validate(const TypedDataset& data, const SchemaDefinition& definition) const {
    SchemaConsistencyReport report;

    for (const auto& decl : definition.columns) {
        if (!decl.isSupported()) {
            report.typeIssues.push_back("Unsupported type for " + decl.name);
            continue;
        }
        const int idx = data.findColumnIndex(decl.name);
        if (idx < 0) {
            report.typeIssues.push_back("Missing column: " + decl.name);
            continue;
        }
        const size_t col = static_cast<size_t>(idx);
        const size_t rows = data.rowCount();
        report.nullRate[decl.name] = rows == 0 ? 0.0 : static_cast<double>(data.missingCount(col)) / static_cast<double>(rows);

        std::visit(CommonUtils::Overloaded{
            [&](const IntColumnSpec& s) {
                if (!holdsIntegers(data, col)) report.typeIssues.push_back("Column " + decl.name + " is not integer");
                if (data.column(col).isNumeric()) report.rangeViolations += countOutOfRange(data, col, s.min, s.max);
            },
            [&](const FloatColumnSpec& s) {
                if (!data.column(col).isNumeric()) {
                    report.typeIssues.push_back("Column " + decl.name + " is not numeric");
                    return;
                }
                report.rangeViolations += countOutOfRange(data, col, s.min, s.max);
            },
            [&](const CategoricalColumnSpec& s) {
                const CategoryMembership allowed(s.values);
                for (size_t r = 0; r < rows; ++r) {
                    if (!data.isMissing(col, r) && !allowed.contains(data.cellText(col, r))) ++report.categoryViolations;
                }
            },
            [&](const IdentifierColumnSpec& s) {
                if (auto issue = checkIdentifier(data, col, s.start)) {
                    std::cout << "[Synthra][Warning] Identifier column '" << decl.name << "': " << *issue << "\n";
                    report.identifierIssue = std::move(issue);
                }
            },
            [&](const UnsupportedColumnSpec&) {},
        }, decl.spec);
    }

    if (verbose_) {
        std::cout << "[Synthra] Schema consistency: " << report.validityLabel() << " ("
                  << report.typeIssues.size() << " type issue(s), " << report.rangeViolations
                  << " range, " << report.categoryViolations << " category violation(s))\n";
    }
    return report;
}
