#pragma once

#include "TypedDataset.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/// Handle to a trained model. Sampling never mutates it.
class TrainedGenerator {
public:
    virtual ~TrainedGenerator() = default;

    /**
     * @brief Draws n rows with the trained column layout.
     * @throws Synthra::GenerativeModelException on sampling failure.
     */
    virtual TypedDataset sample(size_t n, uint64_t seed) const = 0;
};

class GenerativeModel {
public:
    virtual ~GenerativeModel() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Trains on the trainable columns.
     * @param discreteColumns names of columns to be treated as categorical.
     * @throws Synthra::GenerativeModelException on training failure.
     */
    virtual std::unique_ptr<TrainedGenerator> fit(const TypedDataset& trainable,
                                                  const std::vector<std::string>& discreteColumns) const = 0;
};

/**
 * Baseline model that reproduces each column's marginal independently.
 * Discrete columns are resampled from their observed frequencies. Continuous columns use a
 * smoothed bootstrap with Silverman's bandwidth. Missing cells keep their observed rate.
 */
class MarginalSampler : public GenerativeModel {
public:
    std::string name() const override { return "marginal"; }
    std::unique_ptr<TrainedGenerator> fit(const TypedDataset& trainable,
                                          const std::vector<std::string>& discreteColumns) const override;
};

/// Resolves a model by name. Throws Synthra::ConfigurationException for unknown names.
std::unique_ptr<GenerativeModel> makeGenerativeModel(const std::string& name);
