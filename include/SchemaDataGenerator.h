#pragma once

#include "SchemaDefinition.h"
#include "TypedDataset.h"

struct GenerationOptions {
    /// Rewrite a column literally named "id" as 1..rowCount whatever its declared type.
    bool sequentialIdOverride = false;
};

/**
 * Rule-based Mode-B generator. One engine seeded from the definition drives every draw:
 * each column's values first, then that column's null mask.
 */
class SchemaDataGenerator {
public:
    explicit SchemaDataGenerator(GenerationOptions options = {}) : options_(options) {}

    /**
     * @brief Samples rowCount rows from the declarations.
     * @throws Synthra::SchemaValidationException listing every violation, before any sampling.
     */
    TypedDataset generate(const SchemaDefinition& definition, size_t rowCount) const;

private:
    GenerationOptions options_;
};
