#pragma once

#include "Schema.h"
#include "TypedDataset.h"

class SchemaInferrer {
public:
    explicit SchemaInferrer(size_t categoricalThreshold = 10) : categoricalThreshold_(categoricalThreshold) {}

    /**
     * @brief Classifies every column as int, float, categorical or identifier.
     * @details Identifier detection (distinct ratio > 0.95 on integer storage) runs before the
     *          low-cardinality categorical rule, so it wins when both apply.
     * @post Schema column order equals dataset column order; categories are sorted string labels.
     */
    Schema infer(const TypedDataset& data) const;

    size_t categoricalThreshold() const noexcept { return categoricalThreshold_; }

private:
    ColumnInfo inferColumn(const TypedDataset& data, size_t col) const;

    size_t categoricalThreshold_;
};
