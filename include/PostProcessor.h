#pragma once

#include "Schema.h"
#include "TypedDataset.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct MomentStats {
    double mean = 0.0;
    double stddev = 0.0;
};

/// Mean and sample std of each numeric trainable column, captured at fit time.
using OriginalStatistics = std::map<std::string, MomentStats>;

struct ReconcileOutcome {
    TypedDataset data;
    /// Schema columns that the raw model output did not contain.
    std::vector<std::string> missingColumns;
};

class PostProcessor {
public:
    static constexpr double kDegenerateStd = 1e-6;

    /**
     * @brief Repairs raw model output into schema-conformant rows.
     * @details Categorical columns are cast to their text form. Numeric columns are moment matched
     *          against the original statistics, clipped to the schema range and cast to the column
     *          kind. Identifier columns are rebuilt as start..start+rowCount-1. Output follows
     *          schema column order.
     * @throws Synthra::DatasetException when raw row count differs from rowCount.
     */
    ReconcileOutcome reconcile(const TypedDataset& raw,
                               const Schema& schema,
                               const OriginalStatistics& stats,
                               size_t rowCount) const;

    /**
     * @brief Rescales finite values to the target mean and std.
     * @post When the sample std is below kDegenerateStd every entry becomes target.mean.
     */
    static std::vector<double> matchMoments(const std::vector<double>& values, const MomentStats& target);

    /// True when start..start+rowCount-1 stays within int64.
    static bool identifierRangeFits(int64_t start, size_t rowCount) noexcept;

    /// @throws Synthra::DatasetException when the ids would overflow int64.
    static TypedColumn sequentialIdentifier(const std::string& name, int64_t start, size_t rowCount);
};
