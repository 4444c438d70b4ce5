#include "SynthesisEngine.h"

#include "SchemaInferrer.h"
#include "Statistics.h"
#include "SynthraExceptions.h"

#include <iostream>

Json::Value FittedSession::toJson() const {
    Json::Value root(Json::objectValue);
    root["model"] = modelName_;
    root["schema"] = schema_.toJson();
    Json::Value stats(Json::objectValue);
    for (const auto& [name, moments] : statistics_) {
        Json::Value entry(Json::objectValue);
        entry["mean"] = moments.mean;
        entry["std"] = moments.stddev;
        stats[name] = entry;
    }
    root["original_stats"] = stats;
    return root;
}

SynthesisEngine::SynthesisEngine(std::shared_ptr<const GenerativeModel> model, EngineOptions options)
    : model_(std::move(model)), options_(options) {
    if (!model_) throw Synthra::ConfigurationException("SynthesisEngine requires a generative model");
}

OriginalStatistics SynthesisEngine::computeStatistics(const TypedDataset& data, const Schema& schema) {
    OriginalStatistics out;
    for (const auto& info : schema.columns) {
        if (info.isIdentifier || !info.isNumeric()) continue;
        const int idx = data.findColumnIndex(info.name);
        if (idx < 0) continue;
        const ColumnStats stats = Statistics::calculateStats(data.numericValues(static_cast<size_t>(idx)));
        out[info.name] = MomentStats{stats.mean, stats.stddev};
    }
    return out;
}

FittedSession SynthesisEngine::fit(const TypedDataset& data) const {
    if (data.colCount() == 0) throw Synthra::DatasetException("Cannot fit on a dataset without columns");

    Schema schema = SchemaInferrer(options_.categoricalThreshold).infer(data);
    OriginalStatistics stats = computeStatistics(data, schema);

    const std::vector<std::string> discrete = schema.categoricalColumns();
    const TypedDataset trainable = data.select(schema.trainableColumns());

    if (options_.verbose) {
        std::cout << "[Synthra][Engine] Schema: " << schema.columnCount << " columns, "
                  << schema.identifierColumns().size() << " identifier(s), "
                  << discrete.size() << " discrete\n";
        std::cout << "[Synthra][Engine] Training '" << model_->name() << "' on "
                  << trainable.colCount() << " columns x " << trainable.rowCount() << " rows\n";
    }

    std::unique_ptr<TrainedGenerator> trained = model_->fit(trainable, discrete);
    if (!trained) throw Synthra::GenerativeModelException("model '" + model_->name() + "' returned no generator");

    return FittedSession(std::move(schema), std::move(stats),
                         std::shared_ptr<const TrainedGenerator>(std::move(trained)), model_->name());
}

ReconcileOutcome SynthesisEngine::generateWithOutcome(const FittedSession& session, size_t n, uint64_t seed) const {
    if (!session.generator_) throw Synthra::UnfittedSessionException("generate called without a fitted model");

    if (options_.verbose) std::cout << "[Synthra][Engine] Sampling " << n << " rows (seed " << seed << ")\n";
    const TypedDataset raw = session.generator_->sample(n, seed);

    ReconcileOutcome outcome = postProcessor_.reconcile(raw, session.schema_, session.statistics_, n);
    if (options_.verbose) {
        std::cout << "[Synthra][Engine] Post-processed " << outcome.data.colCount() << " columns";
        if (!outcome.missingColumns.empty()) std::cout << " (" << outcome.missingColumns.size() << " missing)";
        std::cout << "\n";
    }
    return outcome;
}

TypedDataset SynthesisEngine::generate(const FittedSession& session, size_t n, uint64_t seed, bool applyConstraints) const {
    if (!session.generator_) throw Synthra::UnfittedSessionException("generate called without a fitted model");
    if (!applyConstraints) {
        if (options_.verbose) std::cout << "[Synthra][Engine] Sampling " << n << " raw rows (seed " << seed << ")\n";
        return session.generator_->sample(n, seed);
    }
    return generateWithOutcome(session, n, seed).data;
}
