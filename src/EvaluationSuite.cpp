#include "EvaluationSuite.h"

#include "CommonUtils.h"
#include "ReportEngine.h"

#include <iostream>

Json::Value EvaluationReport::toJson() const {
    Json::Value root(Json::objectValue);

    Json::Value ks(Json::objectValue);
    for (const auto& [col, r] : ksTest) {
        Json::Value entry(Json::objectValue);
        entry["statistic"] = r.statistic;
        entry["p_value"] = r.pValue;
        ks[col] = entry;
    }
    root["ks_test"] = ks;

    Json::Value chi(Json::objectValue);
    for (const auto& [col, r] : chiSquare) {
        Json::Value entry(Json::objectValue);
        entry["statistic"] = r.statistic;
        entry["p_value"] = r.pValue;
        entry["dof"] = static_cast<Json::UInt64>(r.degreesOfFreedom);
        chi[col] = entry;
    }
    root["chi_square"] = chi;

    root["correlation_mse"] = correlationMse;
    root["adversarial_auc"] = adversarialAuc;

    Json::Value interp(Json::objectValue);
    for (const auto& [metric, text] : interpretation) interp[metric] = text;
    root["interpretation"] = interp;

    Json::Value skips(Json::arrayValue);
    for (const auto& s : skipped) {
        Json::Value entry(Json::objectValue);
        entry["column"] = s.column;
        entry["metric"] = metricKindName(s.metric);
        entry["reason"] = s.reason;
        skips.append(entry);
    }
    root["skipped"] = skips;
    root["message"] = message;
    return root;
}

std::string EvaluationReport::toMarkdown() const {
    ReportEngine report;
    report.addTitle("Synthetic Data Evaluation");
    report.addParagraph(message);

    std::vector<std::vector<std::string>> summary;
    for (const auto& [metric, text] : interpretation) summary.push_back({metric, text});
    report.addTable("Summary", {"Metric", "Interpretation"}, summary);

    std::vector<std::vector<std::string>> ksRows;
    for (const auto& [col, r] : ksTest) {
        ksRows.push_back({col, CommonUtils::toFixed(r.statistic, 4), CommonUtils::toFixed(r.pValue, 4)});
    }
    report.addTable("Kolmogorov-Smirnov (numeric columns)", {"Column", "Statistic", "p-value"}, ksRows);

    std::vector<std::vector<std::string>> chiRows;
    for (const auto& [col, r] : chiSquare) {
        chiRows.push_back({col, CommonUtils::toFixed(r.statistic, 4), CommonUtils::toFixed(r.pValue, 4),
                           std::to_string(r.degreesOfFreedom)});
    }
    report.addTable("Chi-square (categorical columns)", {"Column", "Statistic", "p-value", "dof"}, chiRows);

    report.addParagraph("Correlation MSE: " + CommonUtils::toFixed(correlationMse, 6) +
                        "  \nAdversarial AUC: " + CommonUtils::toFixed(adversarialAuc, 4));

    if (!skipped.empty()) {
        std::vector<std::vector<std::string>> skipRows;
        for (const auto& s : skipped) skipRows.push_back({s.column, metricKindName(s.metric), s.reason});
        report.addTable("Skipped", {"Column", "Metric", "Reason"}, skipRows);
    }
    return report.str();
}

std::string EvaluationSuite::interpretDistribution(const std::vector<std::pair<std::string, double>>& pValues,
                                                   const std::string& family) {
    std::vector<std::string> failed;
    for (const auto& [col, p] : pValues) {
        if (!(p > kSignificance)) failed.push_back(col);
    }
    if (failed.empty()) return "PASS - All " + family + " distributions match (p > 0.05)";
    return "FAIL - Distributions differ for: " + CommonUtils::join(failed, ", ");
}

std::string EvaluationSuite::interpretCorrelation(double mse) {
    const std::string shown = "(MSE=" + CommonUtils::toFixed(mse, 6) + ")";
    if (mse < 0.05) return "PASS - Relationships well-preserved " + shown;
    if (mse < 0.10) return "WARNING - Minor distortion " + shown;
    return "FAIL - Relationships distorted " + shown;
}

std::string EvaluationSuite::interpretAuc(double auc) {
    const std::string shown = "(AUC=" + CommonUtils::toFixed(auc, 4) + ")";
    if (auc >= 0.45 && auc <= 0.55) return "EXCELLENT - Synthetic indistinguishable from real " + shown;
    if ((auc >= 0.40 && auc < 0.45) || (auc > 0.55 && auc <= 0.60)) return "GOOD - Limited distinguishability " + shown;
    return "WARNING - Easily distinguishable " + shown;
}

EvaluationReport EvaluationSuite::run(const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema) const {
    if (verbose_) {
        std::cout << "[Synthra][Evaluate] Comparing " << real.rowCount() << " real rows with "
                  << synthetic.rowCount() << " synthetic rows\n";
    }

    const StatisticalSimilarity similarity = statistical_.evaluate(real, synthetic, schema);
    if (verbose_) {
        std::cout << "[Synthra][Evaluate] KS on " << similarity.ks.size() << " column(s), chi-square on "
                  << similarity.chiSquare.size() << " column(s), " << similarity.skipped.size() << " skipped\n";
    }

    EvaluationReport report;
    report.ksTest = similarity.ks;
    report.chiSquare = similarity.chiSquare;
    report.correlationMse = similarity.correlationMse;
    report.skipped = similarity.skipped;

    report.adversarialAuc = adversarial_.score(real, synthetic, schema);
    if (verbose_) {
        std::cout << "[Synthra][Evaluate] Adversarial AUC " << CommonUtils::toFixed(report.adversarialAuc, 4)
                  << " (" << adversarial_.options().treeCount << " trees)\n";
    }

    std::vector<std::pair<std::string, double>> ksP;
    std::vector<std::pair<std::string, double>> chiP;
    for (const auto& info : schema.columns) {
        if (const auto it = report.ksTest.find(info.name); it != report.ksTest.end()) {
            ksP.emplace_back(info.name, it->second.pValue);
        }
        if (const auto it = report.chiSquare.find(info.name); it != report.chiSquare.end()) {
            chiP.emplace_back(info.name, it->second.pValue);
        }
    }
    report.interpretation["ks_test"] = interpretDistribution(ksP, "numeric");
    report.interpretation["chi_square"] = interpretDistribution(chiP, "categorical");
    report.interpretation["correlation_mse"] = interpretCorrelation(report.correlationMse);
    report.interpretation["adversarial_auc"] = interpretAuc(report.adversarialAuc);
    return report;
}
