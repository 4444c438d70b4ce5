#include "SchemaDataGenerator.h"

#include "CommonUtils.h"
#include "PostProcessor.h"
#include "SynthraExceptions.h"

#include <limits>
#include <random>

namespace {
MissingMask drawNulls(size_t rowCount, double nullRate, std::mt19937_64& rng) {
    MissingMask mask(rowCount, static_cast<uint8_t>(0));
    if (nullRate <= 0.0) return mask;
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (size_t i = 0; i < rowCount; ++i) mask[i] = unit(rng) < nullRate ? 1 : 0;
    return mask;
}

TypedColumn sampleColumn(const ColumnDeclaration& decl, size_t rowCount, std::mt19937_64& rng) {
    return std::visit(CommonUtils::Overloaded{
        [&](const IdentifierColumnSpec& s) {
            return PostProcessor::sequentialIdentifier(decl.name, s.start, rowCount);
        },
        [&](const IntColumnSpec& s) {
            std::uniform_int_distribution<int64_t> dist(*s.min, *s.max);
            std::vector<int64_t> values(rowCount);
            for (auto& v : values) v = dist(rng);
            return TypedDataset::integerColumn(decl.name, std::move(values));
        },
        [&](const FloatColumnSpec& s) {
            std::vector<double> values(rowCount, *s.min);
            if (*s.max > *s.min) {
                std::uniform_real_distribution<double> dist(*s.min, *s.max);
                for (auto& v : values) v = dist(rng);
            }
            return TypedDataset::floatColumn(decl.name, std::move(values));
        },
        [&](const CategoricalColumnSpec& s) {
            std::uniform_int_distribution<size_t> pick(0, s.values.size() - 1);
            std::vector<std::string> values(rowCount);
            for (auto& v : values) v = s.values[pick(rng)];
            return TypedDataset::textColumn(decl.name, std::move(values));
        },
        [&](const UnsupportedColumnSpec& s) -> TypedColumn {
            throw Synthra::SchemaValidationException({SchemaViolation{
                Synthra::SchemaViolationCode::UNSUPPORTED_TYPE, decl.name, "Unsupported type for " + decl.name + ": " + s.typeName}});
        },
    }, decl.spec);
}

void applyNulls(TypedColumn& column, const MissingMask& mask) {
    for (size_t i = 0; i < mask.size(); ++i) {
        if (!mask[i]) continue;
        column.missing[i] = 1;
        if (column.type == ColumnType::FLOAT) {
            std::get<std::vector<double>>(column.values)[i] = std::numeric_limits<double>::quiet_NaN();
        } else if (column.type == ColumnType::TEXT) {
            std::get<std::vector<std::string>>(column.values)[i].clear();
        }
    }
}
} // namespace

TypedDataset SchemaDataGenerator::generate(const SchemaDefinition& definition, size_t rowCount) const {
    std::vector<SchemaViolation> violations = definition.validate();
    for (const auto& decl : definition.columns) {
        const auto* id = std::get_if<IdentifierColumnSpec>(&decl.spec);
        if (id && !PostProcessor::identifierRangeFits(id->start, rowCount)) {
            violations.push_back(SchemaViolation{Synthra::SchemaViolationCode::INVALID_FIELD, decl.name,
                                                 "Identifier column '" + decl.name + "' starting at " +
                                                     std::to_string(id->start) + " cannot hold " +
                                                     std::to_string(rowCount) + " rows"});
        }
    }
    if (!violations.empty()) throw Synthra::SchemaValidationException(std::move(violations));

    std::mt19937_64 rng(definition.seed);
    TypedDataset out;
    for (const auto& decl : definition.columns) {
        TypedColumn column = sampleColumn(decl, rowCount, rng);
        if (decl.nullRate > 0.0) applyNulls(column, drawNulls(rowCount, decl.nullRate, rng));

        if (options_.sequentialIdOverride && decl.name == "id") {
            column = PostProcessor::sequentialIdentifier(decl.name, 1, rowCount);
        }
        out.addColumn(std::move(column));
    }
    return out;
}
