#include "TerminalUI.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iostream>
#include <iomanip>

namespace {
std::string rangeText(const ColumnInfo& col) {
    if (!col.minValue || !col.maxValue) return "-";
    return CommonUtils::formatDouble(*col.minValue) + " .. " + CommonUtils::formatDouble(*col.maxValue);
}

int nameWidth(const std::vector<std::string>& names) {
    size_t maxNameLen = 15;
    for (const auto& name : names) maxNameLen = std::max(maxNameLen, name.length());
    return static_cast<int>(maxNameLen) + 2;
}
}

void TerminalUI::printSchemaTable(const Schema& schema) {
    const int w = nameWidth(schema.columnNames());
    std::cout << "\n=============================================== INFERRED SCHEMA ===============================================\n";
    std::cout << "Rows: " << schema.rowCount << " | Columns: " << schema.columnCount << "\n";
    std::cout << std::left
              << std::setw(w) << "Column"
              << std::setw(14) << "Kind"
              << std::setw(28) << "Range"
              << std::setw(12) << "Missing"
              << "Categories\n";
    std::cout << std::string(w + 14 + 28 + 12 + 10, '-') << "\n";

    for (const auto& col : schema.columns) {
        std::string categories = "-";
        if (col.isCategorical()) {
            categories = std::to_string(col.categories.size()) + " level(s)";
        }
        std::cout << std::left << std::setw(w) << col.name
                  << std::setw(14) << columnKindName(col.kind)
                  << std::setw(28) << rangeText(col)
                  << std::setw(12) << CommonUtils::toFixed(col.missingRate, 4)
                  << categories << "\n";
    }
    std::cout << "===============================================================================================================\n";
}

void TerminalUI::printEvaluationReport(const EvaluationReport& report) {
    std::vector<std::string> names;
    for (const auto& [name, _] : report.ksTest) names.push_back(name);
    for (const auto& [name, _] : report.chiSquare) names.push_back(name);
    const int w = nameWidth(names);

    std::cout << "\n============================================== EVALUATION REPORT ==============================================\n";
    std::cout << std::left
              << std::setw(w) << "Column"
              << std::setw(14) << "Test"
              << std::setw(14) << "Statistic"
              << std::setw(12) << "p-value"
              << "Match\n";
    std::cout << std::string(w + 14 + 14 + 12 + 5, '-') << "\n";
    for (const auto& [name, r] : report.ksTest) {
        std::cout << std::left << std::setw(w) << name << std::setw(14) << "KS"
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(10) << r.statistic << "    "
                  << std::setw(10) << r.pValue << "  "
                  << (r.pValue > EvaluationSuite::kSignificance ? "yes" : "no (*)") << "\n";
    }
    for (const auto& [name, r] : report.chiSquare) {
        std::cout << std::left << std::setw(w) << name << std::setw(14) << "Chi-square"
                  << std::right << std::fixed << std::setprecision(4)
                  << std::setw(10) << r.statistic << "    "
                  << std::setw(10) << r.pValue << "  "
                  << (r.pValue > EvaluationSuite::kSignificance ? "yes" : "no (*)") << "\n";
    }
    std::cout << std::left;

    std::cout << "\n    [Correlation MSE] " << std::fixed << std::setprecision(6) << report.correlationMse << "\n";
    std::cout << "    [Adversarial AUC] " << std::fixed << std::setprecision(4) << report.adversarialAuc << "\n";

    if (!report.skipped.empty()) {
        std::cout << "\n    [Skipped]:\n";
        for (const auto& skip : report.skipped) {
            std::cout << "        - " << skip.column << " (" << metricKindName(skip.metric) << "): " << skip.reason << "\n";
        }
    }

    std::cout << "\n    [Interpretation]:\n";
    for (const auto& [metric, text] : report.interpretation) {
        std::cout << "        " << std::setw(24) << metric << text << "\n";
    }
    std::cout << "\n[Synthra] " << report.message << "\n";
    std::cout << "===============================================================================================================\n";
}

void TerminalUI::printReconcileWarnings(const std::vector<std::string>& missingColumns) {
    if (missingColumns.empty()) return;
    std::cout << "[Synthra][Warning] Generated output lacked " << missingColumns.size()
              << " schema column(s): " << CommonUtils::join(missingColumns, ", ") << "\n";
}

void TerminalUI::printSchemaViolations(const std::vector<Synthra::SchemaViolation>& violations) {
    std::cout << "\n[Synthra] Schema definition has " << violations.size() << " violation(s):\n";
    for (const auto& v : violations) {
        std::cout << "        -> " << v.message << "\n";
    }
}

void TerminalUI::printConsistencyReport(const SchemaConsistencyReport& report) {
    std::cout << "\n============================================= SCHEMA CONSISTENCY ==============================================\n";
    std::cout << std::left << std::setw(24) << "Schema validity" << report.validityLabel() << "\n"
              << std::setw(24) << "Type consistency" << report.typeConsistency() << "\n"
              << std::setw(24) << "Range violations" << report.rangeViolations << "\n"
              << std::setw(24) << "Category violations" << report.categoryViolations << "\n"
              << std::setw(24) << "Identifier issues" << (report.identifierIssue ? *report.identifierIssue : "none") << "\n";

    if (!report.nullRate.empty()) {
        std::vector<std::string> names;
        for (const auto& [name, _] : report.nullRate) names.push_back(name);
        const int w = nameWidth(names);
        std::cout << "\n" << std::setw(w) << "Column" << "Null rate\n";
        std::cout << std::string(w + 10, '-') << "\n";
        for (const auto& [name, rate] : report.nullRate) {
            std::cout << std::setw(w) << name << CommonUtils::toFixed(rate, 4) << "\n";
        }
    }
    std::cout << "\n[Synthra] " << report.message << "\n";
    std::cout << "===============================================================================================================\n";
}
