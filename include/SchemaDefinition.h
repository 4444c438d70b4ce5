#pragma once

#include "SynthraExceptions.h"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using Synthra::SchemaViolation;

struct IntColumnSpec {
    std::optional<int64_t> min;
    std::optional<int64_t> max;
};

struct FloatColumnSpec {
    std::optional<double> min;
    std::optional<double> max;
};

struct CategoricalColumnSpec {
    std::vector<std::string> values;
};

struct IdentifierColumnSpec {
    int64_t start = 1;
};

/// Declared type outside {int, float, categorical, identifier}; kept so validation can report it.
struct UnsupportedColumnSpec {
    std::string typeName;
};

using ColumnSpec = std::variant<IntColumnSpec, FloatColumnSpec, CategoricalColumnSpec, IdentifierColumnSpec, UnsupportedColumnSpec>;

struct ColumnDeclaration {
    std::string name;
    ColumnSpec spec = UnsupportedColumnSpec{};
    double nullRate = 0.0;

    std::string typeName() const;
    bool isSupported() const noexcept { return !std::holds_alternative<UnsupportedColumnSpec>(spec); }
};

struct SchemaParseResult;

/// Declarative Mode-B schema: ordered column declarations and a sampling seed.
class SchemaDefinition {
public:
    static constexpr uint64_t kDefaultSeed = 42;

    std::vector<ColumnDeclaration> columns;
    uint64_t seed = kDefaultSeed;

    /**
     * @brief Reads {seed, columns: [{name, type, min, max, values, start, nullRate|null_rate}]}.
     * @post result.violations holds malformed fields plus everything validate() reports.
     */
    static SchemaParseResult parse(const Json::Value& root);
    static SchemaParseResult fromJsonText(const std::string& text);

    /// Throws Synthra::IOException when the file cannot be read.
    static SchemaParseResult fromFile(const std::string& path);

    /// Constraint check: names, supported types, bounds, non-empty values, null rates in [0, 1].
    std::vector<SchemaViolation> validate() const;

    const ColumnDeclaration* findColumn(const std::string& name) const;

    Json::Value toJson() const;
};

struct SchemaParseResult {
    SchemaDefinition definition;
    std::vector<SchemaViolation> violations;

    bool ok() const noexcept { return violations.empty(); }
};
