#include "SchemaDefinition.h"

#include "CommonUtils.h"

#include <cmath>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

namespace {
constexpr double kInt64Limit = 9223372036854775808.0; // 2^63

bool readNumber(const Json::Value& v, double& out) {
    if (v.isNumeric() && !v.isBool()) {
        out = v.asDouble();
        return std::isfinite(out);
    }
    if (v.isString()) return CommonUtils::parseDouble(CommonUtils::trim(v.asString()), out);
    return false;
}

std::string labelText(const Json::Value& v) {
    if (v.isString()) return v.asString();
    if (v.isBool()) return v.asBool() ? "True" : "False";
    if (v.type() == Json::realValue) return CommonUtils::formatDouble(v.asDouble());
    if (v.isInt64()) return CommonUtils::formatInt(v.asInt64());
    if (v.isUInt64()) return std::to_string(v.asUInt64());
    return "";
}

const Json::Value* member(const Json::Value& obj, const char* key) {
    return obj.isMember(key) ? &obj[key] : nullptr;
}

void invalid(std::vector<SchemaViolation>& out, const std::string& column, const std::string& message) {
    out.push_back(SchemaViolation{Synthra::SchemaViolationCode::INVALID_FIELD, column, message});
}

std::optional<int64_t> readIntBound(const Json::Value* v, const std::string& column, const char* key,
                                    std::vector<SchemaViolation>& issues) {
    if (v == nullptr || v->isNull()) return std::nullopt;
    const std::string outOfRange = std::string(key) + " for int column '" + column + "' is outside the 64-bit integer range";
    // Integer literals are read exactly; doubles only hold 53 bits.
    if (v->type() == Json::intValue) return v->asInt64();
    if (v->type() == Json::uintValue) {
        if (v->isInt64()) return v->asInt64();
        invalid(issues, column, outOfRange);
        return std::nullopt;
    }
    int64_t exact = 0;
    if (v->isString() && CommonUtils::parseInt64(CommonUtils::trim(v->asString()), exact)) return exact;

    double d = 0.0;
    if (!readNumber(*v, d)) {
        invalid(issues, column, std::string(key) + " for column '" + column + "' is not a number");
        return std::nullopt;
    }
    if (!CommonUtils::isIntegral(d)) {
        invalid(issues, column, std::string(key) + " for int column '" + column + "' must be a whole number");
        return std::nullopt;
    }
    if (d < -kInt64Limit || d >= kInt64Limit) {
        invalid(issues, column, outOfRange);
        return std::nullopt;
    }
    return static_cast<int64_t>(d);
}

std::optional<double> readFloatBound(const Json::Value* v, const std::string& column, const char* key,
                                     std::vector<SchemaViolation>& issues) {
    if (v == nullptr || v->isNull()) return std::nullopt;
    double d = 0.0;
    if (!readNumber(*v, d)) {
        invalid(issues, column, std::string(key) + " for column '" + column + "' is not a number");
        return std::nullopt;
    }
    return d;
}

ColumnDeclaration parseColumn(const Json::Value& col, size_t index, std::vector<SchemaViolation>& issues) {
    ColumnDeclaration decl;
    const std::string fallbackLabel = "#" + std::to_string(index + 1);
    if (!col.isObject()) {
        invalid(issues, fallbackLabel, "Column definition " + fallbackLabel + " is not an object");
        return decl;
    }

    if (const Json::Value* name = member(col, "name"); name && !name->isNull()) {
        if (name->isString()) {
            decl.name = name->asString();
        } else {
            invalid(issues, fallbackLabel, "Column name " + fallbackLabel + " is not a string");
        }
    }
    const std::string label = decl.name.empty() ? fallbackLabel : decl.name;

    std::string type;
    if (const Json::Value* t = member(col, "type"); t && t->isString()) type = CommonUtils::trim(t->asString());

    if (type == "int") {
        decl.spec = IntColumnSpec{readIntBound(member(col, "min"), label, "min", issues),
                                  readIntBound(member(col, "max"), label, "max", issues)};
    } else if (type == "float") {
        decl.spec = FloatColumnSpec{readFloatBound(member(col, "min"), label, "min", issues),
                                    readFloatBound(member(col, "max"), label, "max", issues)};
    } else if (type == "categorical") {
        CategoricalColumnSpec spec;
        if (const Json::Value* values = member(col, "values"); values && !values->isNull()) {
            if (!values->isArray()) {
                invalid(issues, label, "values for column '" + label + "' must be a list");
            } else {
                for (const auto& v : *values) {
                    if (v.isNull() || v.isArray() || v.isObject()) {
                        invalid(issues, label, "values for column '" + label + "' must be scalars");
                        continue;
                    }
                    spec.values.push_back(labelText(v));
                }
            }
        }
        decl.spec = std::move(spec);
    } else if (type == "identifier") {
        IdentifierColumnSpec spec;
        if (const auto start = readIntBound(member(col, "start"), label, "start", issues)) spec.start = *start;
        decl.spec = spec;
    } else {
        decl.spec = UnsupportedColumnSpec{type};
    }

    const Json::Value* rate = member(col, "nullRate");
    if (rate == nullptr || rate->isNull()) rate = member(col, "null_rate");
    if (rate != nullptr && !rate->isNull()) {
        double r = 0.0;
        if (readNumber(*rate, r)) {
            decl.nullRate = r;
        } else {
            invalid(issues, label, "nullRate for column '" + label + "' is not a number");
        }
    }
    return decl;
}
} // namespace

std::string ColumnDeclaration::typeName() const {
    return std::visit(CommonUtils::Overloaded{
        [](const IntColumnSpec&) { return std::string("int"); },
        [](const FloatColumnSpec&) { return std::string("float"); },
        [](const CategoricalColumnSpec&) { return std::string("categorical"); },
        [](const IdentifierColumnSpec&) { return std::string("identifier"); },
        [](const UnsupportedColumnSpec& s) { return s.typeName; },
    }, spec);
}

SchemaParseResult SchemaDefinition::parse(const Json::Value& root) {
    SchemaParseResult result;
    std::vector<SchemaViolation> issues;

    if (!root.isObject()) {
        invalid(issues, "", "Schema must be a JSON object");
    } else {
        if (const Json::Value* seed = member(root, "seed"); seed && !seed->isNull()) {
            if (seed->isUInt64()) {
                result.definition.seed = seed->asUInt64();
            } else if (seed->isDouble() && CommonUtils::isIntegral(seed->asDouble()) && seed->asDouble() >= 0.0 &&
                       seed->asDouble() < 2.0 * kInt64Limit) {
                result.definition.seed = static_cast<uint64_t>(seed->asDouble());
            } else {
                invalid(issues, "", "seed must be a non-negative integer");
            }
        }

        if (const Json::Value* cols = member(root, "columns"); cols && !cols->isNull()) {
            if (!cols->isArray()) {
                invalid(issues, "", "columns must be a list");
            } else {
                for (Json::ArrayIndex i = 0; i < cols->size(); ++i) {
                    result.definition.columns.push_back(parseColumn((*cols)[i], i, issues));
                }
            }
        }
    }

    result.violations = std::move(issues);
    const auto semantic = result.definition.validate();
    result.violations.insert(result.violations.end(), semantic.begin(), semantic.end());
    return result;
}

SchemaParseResult SchemaDefinition::fromJsonText(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        SchemaParseResult result;
        invalid(result.violations, "", "Schema is not valid JSON: " + CommonUtils::trim(errors));
        const auto semantic = result.definition.validate();
        result.violations.insert(result.violations.end(), semantic.begin(), semantic.end());
        return result;
    }
    return parse(root);
}

SchemaParseResult SchemaDefinition::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw Synthra::IOException("Could not open schema file: " + path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return fromJsonText(buffer.str());
}

std::vector<SchemaViolation> SchemaDefinition::validate() const {
    using Synthra::SchemaViolationCode;
    std::vector<SchemaViolation> out;
    if (columns.empty()) {
        out.push_back(SchemaViolation{SchemaViolationCode::MISSING_COLUMNS, "", "Schema must include a non-empty 'columns' list"});
        return out;
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < columns.size(); ++i) {
        const ColumnDeclaration& col = columns[i];
        const std::string label = col.name.empty() ? "#" + std::to_string(i + 1) : col.name;

        if (col.name.empty()) {
            out.push_back(SchemaViolation{SchemaViolationCode::MISSING_NAME, label, "Column " + label + " has no name"});
        } else if (!seen.insert(col.name).second) {
            out.push_back(SchemaViolation{SchemaViolationCode::INVALID_FIELD, label, "Duplicate column name: " + label});
        }

        std::visit(CommonUtils::Overloaded{
            [&](const IntColumnSpec& s) {
                if (!s.min || !s.max) {
                    out.push_back(SchemaViolation{SchemaViolationCode::MISSING_BOUNDS, label, "Numeric column '" + label + "' requires min/max"});
                } else if (*s.min > *s.max) {
                    out.push_back(SchemaViolation{SchemaViolationCode::INVERTED_BOUNDS, label, "min must be <= max for column '" + label + "'"});
                }
            },
            [&](const FloatColumnSpec& s) {
                if (!s.min || !s.max) {
                    out.push_back(SchemaViolation{SchemaViolationCode::MISSING_BOUNDS, label, "Numeric column '" + label + "' requires min/max"});
                } else if (*s.min > *s.max) {
                    out.push_back(SchemaViolation{SchemaViolationCode::INVERTED_BOUNDS, label, "min must be <= max for column '" + label + "'"});
                }
            },
            [&](const CategoricalColumnSpec& s) {
                if (s.values.empty()) {
                    out.push_back(SchemaViolation{SchemaViolationCode::EMPTY_VALUES, label, "Categorical column '" + label + "' requires values list"});
                }
            },
            [&](const IdentifierColumnSpec&) {},
            [&](const UnsupportedColumnSpec& s) {
                const std::string shown = s.typeName.empty() ? "(none)" : s.typeName;
                out.push_back(SchemaViolation{SchemaViolationCode::UNSUPPORTED_TYPE, label, "Unsupported type for " + label + ": " + shown});
            },
        }, col.spec);

        if (!(col.nullRate >= 0.0 && col.nullRate <= 1.0)) {
            out.push_back(SchemaViolation{SchemaViolationCode::NULL_RATE_OUT_OF_RANGE, label, "nullRate must be 0-1 for column '" + label + "'"});
        }
    }
    return out;
}

const ColumnDeclaration* SchemaDefinition::findColumn(const std::string& name) const {
    for (const auto& col : columns) {
        if (col.name == name) return &col;
    }
    return nullptr;
}

Json::Value SchemaDefinition::toJson() const {
    Json::Value root(Json::objectValue);
    root["seed"] = static_cast<Json::UInt64>(seed);
    Json::Value cols(Json::arrayValue);
    for (const auto& col : columns) {
        Json::Value c(Json::objectValue);
        c["name"] = col.name;
        c["type"] = col.typeName();
        std::visit(CommonUtils::Overloaded{
            [&](const IntColumnSpec& s) {
                if (s.min) c["min"] = static_cast<Json::Int64>(*s.min);
                if (s.max) c["max"] = static_cast<Json::Int64>(*s.max);
            },
            [&](const FloatColumnSpec& s) {
                if (s.min) c["min"] = *s.min;
                if (s.max) c["max"] = *s.max;
            },
            [&](const CategoricalColumnSpec& s) {
                Json::Value values(Json::arrayValue);
                for (const auto& v : s.values) values.append(v);
                c["values"] = values;
            },
            [&](const IdentifierColumnSpec& s) { c["start"] = static_cast<Json::Int64>(s.start); },
            [&](const UnsupportedColumnSpec&) {},
        }, col.spec);
        c["nullRate"] = col.nullRate;
        cols.append(c);
    }
    root["columns"] = cols;
    return root;
}
