#include "GenerativeModel.h"

#include "CommonUtils.h"
#include "Statistics.h"
#include "SynthraExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <type_traits>

namespace {
struct MarginalColumn {
    TypedColumn source;
    bool discrete = false;
    std::vector<double> observed;
    double missingRate = 0.0;
    double bandwidth = 0.0;
};

class TrainedMarginalSampler : public TrainedGenerator {
public:
    explicit TrainedMarginalSampler(std::vector<MarginalColumn> columns) : columns_(std::move(columns)) {}

    TypedDataset sample(size_t n, uint64_t seed) const override {
        std::mt19937_64 rng(seed);
        TypedDataset out;
        for (const auto& col : columns_) {
            out.addColumn(col.discrete ? sampleDiscrete(col, n, rng) : sampleContinuous(col, n, rng));
        }
        return out;
    }

private:
    static TypedColumn sampleDiscrete(const MarginalColumn& col, size_t n, std::mt19937_64& rng) {
        const size_t rows = col.source.size();
        std::uniform_int_distribution<size_t> pick(0, rows - 1);
        std::vector<size_t> drawn(n);
        for (size_t i = 0; i < n; ++i) drawn[i] = pick(rng);

        MissingMask missing(n, static_cast<uint8_t>(0));
        for (size_t i = 0; i < n; ++i) missing[i] = col.source.missing[drawn[i]];

        return std::visit([&](const auto& values) {
            using Storage = std::decay_t<decltype(values)>;
            Storage picked;
            picked.reserve(n);
            for (size_t i = 0; i < n; ++i) picked.push_back(values[drawn[i]]);
            TypedColumn c;
            c.name = col.source.name;
            c.type = col.source.type;
            c.values = std::move(picked);
            c.missing = missing;
            return c;
        }, col.source.values);
    }

    static TypedColumn sampleContinuous(const MarginalColumn& col, size_t n, std::mt19937_64& rng) {
        std::bernoulli_distribution isMissing(col.missingRate);
        std::normal_distribution<double> noise(0.0, 1.0);
        std::vector<double> values(n, std::numeric_limits<double>::quiet_NaN());
        MissingMask missing(n, static_cast<uint8_t>(1));
        if (!col.observed.empty()) {
            std::uniform_int_distribution<size_t> pick(0, col.observed.size() - 1);
            for (size_t i = 0; i < n; ++i) {
                if (isMissing(rng)) continue;
                values[i] = col.observed[pick(rng)] + col.bandwidth * noise(rng);
                missing[i] = 0;
            }
        }

        if (col.source.type == ColumnType::INTEGER) {
            std::vector<int64_t> rounded(n, 0);
            for (size_t i = 0; i < n; ++i) {
                if (!missing[i]) rounded[i] = static_cast<int64_t>(std::llround(values[i]));
            }
            return TypedDataset::integerColumn(col.source.name, std::move(rounded), std::move(missing));
        }
        return TypedDataset::floatColumn(col.source.name, std::move(values), std::move(missing));
    }

    std::vector<MarginalColumn> columns_;
};
} // namespace

std::unique_ptr<TrainedGenerator> MarginalSampler::fit(const TypedDataset& trainable,
                                                       const std::vector<std::string>& discreteColumns) const {
    if (trainable.colCount() > 0 && trainable.rowCount() == 0) {
        throw Synthra::GenerativeModelException("marginal sampler cannot fit on zero rows");
    }
    for (const auto& name : discreteColumns) {
        if (trainable.findColumnIndex(name) < 0) {
            throw Synthra::GenerativeModelException("discrete column not in training data: " + name);
        }
    }

    std::vector<MarginalColumn> columns;
    columns.reserve(trainable.colCount());
    for (size_t c = 0; c < trainable.colCount(); ++c) {
        MarginalColumn mc;
        mc.source = trainable.column(c);
        mc.discrete = !mc.source.isNumeric() ||
                      std::find(discreteColumns.begin(), discreteColumns.end(), mc.source.name) != discreteColumns.end();
        if (!mc.discrete) {
            const std::vector<double> values = trainable.numericValues(c);
            for (size_t r = 0; r < values.size(); ++r) {
                if (!mc.source.missing[r]) mc.observed.push_back(values[r]);
            }
            mc.missingRate = static_cast<double>(trainable.missingCount(c)) / static_cast<double>(trainable.rowCount());
            const ColumnStats stats = Statistics::calculateStats(mc.observed);
            if (stats.count > 1) {
                mc.bandwidth = 1.06 * stats.stddev * std::pow(static_cast<double>(stats.count), -0.2);
            }
        }
        columns.push_back(std::move(mc));
    }
    return std::make_unique<TrainedMarginalSampler>(std::move(columns));
}

std::unique_ptr<GenerativeModel> makeGenerativeModel(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key == "marginal") return std::make_unique<MarginalSampler>();
    throw Synthra::ConfigurationException("Unknown generative model: " + name);
}
