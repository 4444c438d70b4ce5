#pragma once

#include "GenerativeModel.h"
#include "PostProcessor.h"
#include "Schema.h"

#include <json/json.h>

#include <memory>
#include <string>

struct EngineOptions {
    size_t categoricalThreshold = 10;
    bool verbose = false;
};

/// Immutable product of SynthesisEngine::fit. Only the engine can create one.
class FittedSession {
public:
    FittedSession(FittedSession&&) = default;
    FittedSession& operator=(FittedSession&&) = default;
    FittedSession(const FittedSession&) = delete;
    FittedSession& operator=(const FittedSession&) = delete;

    const Schema& schema() const noexcept { return schema_; }
    const OriginalStatistics& statistics() const noexcept { return statistics_; }
    const std::string& modelName() const noexcept { return modelName_; }
    bool hasGenerator() const noexcept { return static_cast<bool>(generator_); }

    /// Schema, original statistics and model name. Trained model internals are not exported.
    Json::Value toJson() const;

private:
    friend class SynthesisEngine;
    FittedSession(Schema schema,
                  OriginalStatistics statistics,
                  std::shared_ptr<const TrainedGenerator> generator,
                  std::string modelName)
        : schema_(std::move(schema)),
          statistics_(std::move(statistics)),
          generator_(std::move(generator)),
          modelName_(std::move(modelName)) {}

    Schema schema_;
    OriginalStatistics statistics_;
    std::shared_ptr<const TrainedGenerator> generator_;
    std::string modelName_;
};

class SynthesisEngine {
public:
    explicit SynthesisEngine(std::shared_ptr<const GenerativeModel> model, EngineOptions options = {});

    /**
     * @brief Infers the schema, captures moments and trains the model on trainable columns.
     * @throws Synthra::DatasetException for a dataset without columns.
     * @throws Synthra::GenerativeModelException when training fails.
     */
    FittedSession fit(const TypedDataset& data) const;

    /**
     * @brief Samples n rows and, when applyConstraints is set, reconciles them with the schema.
     * @throws Synthra::UnfittedSessionException when the session holds no trained generator.
     */
    TypedDataset generate(const FittedSession& session, size_t n, uint64_t seed, bool applyConstraints = true) const;

    /// Same as generate but also returns the post-processing record.
    ReconcileOutcome generateWithOutcome(const FittedSession& session, size_t n, uint64_t seed) const;

    static OriginalStatistics computeStatistics(const TypedDataset& data, const Schema& schema);

private:
    std::shared_ptr<const GenerativeModel> model_;
    EngineOptions options_;
    PostProcessor postProcessor_;
};
