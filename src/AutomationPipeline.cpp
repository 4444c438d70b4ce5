#include "AutomationPipeline.h"

#include "CommonUtils.h"
#include "DatasetWriter.h"
#include "EvaluationSuite.h"
#include "ReportEngine.h"
#include "SchemaConsistencyValidator.h"
#include "SchemaDataGenerator.h"
#include "SchemaInferrer.h"
#include "SynthesisEngine.h"
#include "SynthraExceptions.h"
#include "TerminalUI.h"
#include "TypedDataset.h"

#include <fstream>
#include <iostream>
#include <memory>

namespace {
constexpr const char* kDefaultSyntheticPath = "synthetic.csv";
constexpr const char* kDefaultGeneratedPath = "generated.csv";

TypedDataset loadDataset(const std::string& path, char delimiter) {
    TypedDataset data = TypedDataset::fromCsv(path, delimiter);
    std::cout << "[Synthra] Loaded " << data.rowCount() << " rows x " << data.colCount()
              << " columns from " << path << "\n";
    return data;
}

SchemaDefinition loadDefinition(const std::string& path, bool strict) {
    SchemaParseResult parsed = SchemaDefinition::fromFile(path);
    if (!parsed.ok()) {
        TerminalUI::printSchemaViolations(parsed.violations);
        if (strict) throw Synthra::SchemaValidationException(std::move(parsed.violations));
    }
    return std::move(parsed.definition);
}

EvaluationReport evaluate(const AutoConfig& config, const TypedDataset& real, const TypedDataset& synthetic, const Schema& schema) {
    AdversarialOptions adversarial;
    adversarial.seed = config.evaluationSeed;
    adversarial.treeCount = config.forestTrees;
    adversarial.testFraction = config.testFraction;

    std::cout << "[Synthra][Evaluate] Scoring " << synthetic.rowCount() << " synthetic rows against "
              << real.rowCount() << " real rows\n";
    EvaluationSuite suite(adversarial, config.verbose);
    EvaluationReport report = suite.run(real, synthetic, schema);
    TerminalUI::printEvaluationReport(report);

    if (!config.reportFile.empty()) {
        std::ofstream out(config.reportFile);
        if (!out) throw Synthra::IOException("Could not open report file: " + config.reportFile);
        out << report.toMarkdown();
        if (!out) throw Synthra::IOException("Failed while writing report file: " + config.reportFile);
        std::cout << "[Synthra] Report written to " << config.reportFile << "\n";
    }
    if (!config.jsonOut.empty()) {
        AutomationPipeline::writeJson(report.toJson(), config.jsonOut);
        std::cout << "[Synthra] JSON report written to " << config.jsonOut << "\n";
    }
    return report;
}

void saveConsistencyMarkdown(const SchemaConsistencyReport& report, const std::string& path) {
    ReportEngine md;
    md.addTitle("Schema Consistency");
    md.addParagraph(report.message);
    md.addTable("Summary", {"Check", "Result"}, {
        {"Schema validity", report.validityLabel()},
        {"Type consistency", report.typeConsistency()},
        {"Range violations", std::to_string(report.rangeViolations)},
        {"Category violations", std::to_string(report.categoryViolations)},
        {"Identifier issues", report.identifierIssue ? *report.identifierIssue : "none"},
    });
    std::vector<std::vector<std::string>> rates;
    for (const auto& [name, rate] : report.nullRate) rates.push_back({name, CommonUtils::toFixed(rate, 4)});
    md.addTable("Null rate", {"Column", "Rate"}, rates);
    md.save(path);
}
} // namespace

void AutomationPipeline::writeJson(const Json::Value& value, const std::string& path) {
    std::ofstream out(path);
    if (!out) throw Synthra::IOException("Could not open output file: " + path);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &out);
    out << "\n";
    if (!out) throw Synthra::IOException("Failed while writing: " + path);
}

int AutomationPipeline::run(const AutoConfig& config) {
    if (config.verbose) {
        std::cout << "[Synthra] Command: " << AutoConfig::commandName(config.command) << "\n";
    }
    switch (config.command) {
        case CommandKind::INFER: return runInfer(config);
        case CommandKind::SYNTHESIZE: return runSynthesize(config);
        case CommandKind::EVALUATE: return runEvaluate(config);
        case CommandKind::GENERATE: return runGenerate(config);
        case CommandKind::VALIDATE: return runValidate(config);
    }
    throw Synthra::ConfigurationException("Unhandled command");
}

int AutomationPipeline::runInfer(const AutoConfig& config) {
    const TypedDataset data = loadDataset(config.datasetPath, config.delimiter);
    const Schema schema = SchemaInferrer(config.categoricalThreshold).infer(data);
    TerminalUI::printSchemaTable(schema);

    const std::string out = config.outputPath.empty() ? config.jsonOut : config.outputPath;
    if (!out.empty()) {
        writeJson(schema.toJson(), out);
        std::cout << "[Synthra] Schema written to " << out << "\n";
    }
    return 0;
}

int AutomationPipeline::runSynthesize(const AutoConfig& config) {
    const TypedDataset data = loadDataset(config.datasetPath, config.delimiter);

    std::shared_ptr<const GenerativeModel> model = makeGenerativeModel(config.model);
    EngineOptions options;
    options.categoricalThreshold = config.categoricalThreshold;
    options.verbose = config.verbose;
    SynthesisEngine engine(model, options);

    const FittedSession session = engine.fit(data);
    if (config.verbose) TerminalUI::printSchemaTable(session.schema());

    if (!config.sessionOut.empty()) {
        writeJson(session.toJson(), config.sessionOut);
        std::cout << "[Synthra] Session written to " << config.sessionOut << "\n";
    }

    const size_t rows = config.rows < 0 ? data.rowCount() : static_cast<size_t>(config.rows);
    TypedDataset synthetic;
    if (config.applyConstraints) {
        ReconcileOutcome outcome = engine.generateWithOutcome(session, rows, config.modelSeed);
        TerminalUI::printReconcileWarnings(outcome.missingColumns);
        synthetic = std::move(outcome.data);
    } else {
        synthetic = engine.generate(session, rows, config.modelSeed, false);
    }

    const std::string target = config.outputPath.empty() ? kDefaultSyntheticPath : config.outputPath;
    const std::string written = DatasetWriter::write(synthetic, target, DatasetWriter::parseFormat(config.exportFormat), config.delimiter);
    std::cout << "[Synthra] Wrote " << synthetic.rowCount() << " synthetic rows to " << written << "\n";

    if (config.evaluateAfterSynthesis) evaluate(config, data, synthetic, session.schema());
    return 0;
}

int AutomationPipeline::runEvaluate(const AutoConfig& config) {
    const TypedDataset real = loadDataset(config.datasetPath, config.delimiter);
    const TypedDataset synthetic = loadDataset(config.syntheticPath, config.delimiter);
    const Schema schema = SchemaInferrer(config.categoricalThreshold).infer(real);
    evaluate(config, real, synthetic, schema);
    return 0;
}

int AutomationPipeline::runGenerate(const AutoConfig& config) {
    const SchemaDefinition definition = loadDefinition(config.schemaPath, true);

    GenerationOptions options;
    options.sequentialIdOverride = config.sequentialIdOverride;
    const TypedDataset data = SchemaDataGenerator(options).generate(definition, static_cast<size_t>(config.rows));

    const std::string target = config.outputPath.empty() ? kDefaultGeneratedPath : config.outputPath;
    const std::string written = DatasetWriter::write(data, target, DatasetWriter::parseFormat(config.exportFormat), config.delimiter);
    std::cout << "[Synthra] Generated " << data.rowCount() << " rows (seed " << definition.seed << ") to " << written << "\n";
    return 0;
}

int AutomationPipeline::runValidate(const AutoConfig& config) {
    const TypedDataset data = loadDataset(config.datasetPath, config.delimiter);
    const SchemaDefinition definition = loadDefinition(config.schemaPath, false);

    const SchemaConsistencyReport report = SchemaConsistencyValidator(config.verbose).validate(data, definition);
    TerminalUI::printConsistencyReport(report);

    if (!config.jsonOut.empty()) {
        writeJson(report.toJson(), config.jsonOut);
        std::cout << "[Synthra] JSON report written to " << config.jsonOut << "\n";
    }
    if (!config.reportFile.empty()) {
        saveConsistencyMarkdown(report, config.reportFile);
        std::cout << "[Synthra] Report written to " << config.reportFile << "\n";
    }
    return report.valid() ? 0 : kValidationFailedExitCode;
}
