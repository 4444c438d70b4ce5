#include "SchemaConsistencyValidator.h"
#include "SchemaDataGenerator.h"
#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

namespace {

SchemaDefinition definitionFrom(const std::string& json) {
    SchemaParseResult result = SchemaDefinition::fromJsonText(json);
    EXPECT_TRUE(result.ok());
    return result.definition;
}

const char* kCustomers = R"({
  "columns": [
    {"name": "id", "type": "identifier"},
    {"name": "age", "type": "int", "min": 18, "max": 65},
    {"name": "income", "type": "float", "min": 0, "max": 1000},
    {"name": "tier", "type": "categorical", "values": ["gold", "silver"]}
  ]
})";

TypedDataset customers() {
    TypedDataset data;
    data.addColumn(TypedDataset::integerColumn("id", {1, 2, 3, 4}));
    data.addColumn(TypedDataset::integerColumn("age", {18, 30, 65, 40}));
    data.addColumn(TypedDataset::floatColumn("income", {0.0, 120.5, std::nan(""), 1000.0}));
    data.addColumn(TypedDataset::textColumn("tier", {"gold", "silver", "gold", ""}, {0, 0, 0, 1}));
    return data;
}

} // namespace

TEST(schema_consistency_validator, conforming_data_passes) {
    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(customers(), definitionFrom(kCustomers));
    EXPECT_TRUE(report.valid());
    EXPECT_EQ(report.validityLabel(), "PASS");
    EXPECT_EQ(report.typeConsistency(), "All columns match declared types");
    EXPECT_EQ(report.rangeViolations, 0u);
    EXPECT_EQ(report.categoryViolations, 0u);
    EXPECT_FALSE(report.identifierIssue.has_value());
    EXPECT_DOUBLE_EQ(report.nullRate.at("income"), 0.25);
    EXPECT_DOUBLE_EQ(report.nullRate.at("tier"), 0.25);
    EXPECT_DOUBLE_EQ(report.nullRate.at("id"), 0.0);
}

TEST(schema_consistency_validator, generated_data_passes_its_own_schema) {
    const SchemaDefinition def = definitionFrom(kCustomers);
    const TypedDataset data = SchemaDataGenerator().generate(def, 300);
    EXPECT_TRUE(SchemaConsistencyValidator().validate(data, def).valid());
}

TEST(schema_consistency_validator, missing_column_fails) {
    const TypedDataset data = customers().select({"id", "age", "tier"});
    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(data, definitionFrom(kCustomers));
    EXPECT_FALSE(report.valid());
    EXPECT_EQ(report.validityLabel(), "FAIL");
    EXPECT_EQ(report.typeIssues, (std::vector<std::string>{"Missing column: income"}));
    EXPECT_EQ(report.typeConsistency(), "Missing column: income");
    EXPECT_EQ(report.nullRate.count("income"), 0u);
}

TEST(schema_consistency_validator, type_mismatches_are_listed) {
    TypedDataset data;
    data.addColumn(TypedDataset::integerColumn("id", {1, 2}));
    data.addColumn(TypedDataset::floatColumn("age", {18.5, 20.0}));
    data.addColumn(TypedDataset::textColumn("income", {"rich", "poor"}));
    data.addColumn(TypedDataset::textColumn("tier", {"gold", "gold"}));

    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(data, definitionFrom(kCustomers));
    EXPECT_EQ(report.typeIssues,
              (std::vector<std::string>{"Column age is not integer", "Column income is not numeric"}));
    EXPECT_EQ(report.typeConsistency(), "Column age is not integer; Column income is not numeric");
}

TEST(schema_consistency_validator, whole_floats_count_as_integers) {
    TypedDataset data;
    data.addColumn(TypedDataset::integerColumn("id", {1, 2}));
    data.addColumn(TypedDataset::floatColumn("age", {18.0, std::nan("")}));
    data.addColumn(TypedDataset::floatColumn("income", {1.0, 2.0}));
    data.addColumn(TypedDataset::textColumn("tier", {"gold", "silver"}));
    EXPECT_TRUE(SchemaConsistencyValidator().validate(data, definitionFrom(kCustomers)).typeIssues.empty());
}

TEST(schema_consistency_validator, counts_range_and_category_violations) {
    TypedDataset data;
    data.addColumn(TypedDataset::integerColumn("id", {1, 2, 3}));
    data.addColumn(TypedDataset::integerColumn("age", {17, 66, 40}));
    data.addColumn(TypedDataset::floatColumn("income", {-1.0, 1000.5, std::nan("")}));
    data.addColumn(TypedDataset::textColumn("tier", {"bronze", "gold", "Gold"}));

    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(data, definitionFrom(kCustomers));
    EXPECT_EQ(report.rangeViolations, 4u);
    EXPECT_EQ(report.categoryViolations, 2u);
    EXPECT_TRUE(report.typeIssues.empty());
    EXPECT_FALSE(report.valid());
}

TEST(schema_consistency_validator, numeric_categories_match_by_value) {
    const SchemaDefinition def = definitionFrom(R"({"columns": [
        {"name": "c", "type": "categorical", "values": [1, 2]},
        {"name": "k", "type": "categorical", "values": [1.0, "x"]}
    ]})");

    std::istringstream csv("c,k\n1.0,1\n2.0,1\n");
    const SchemaConsistencyReport fromText = SchemaConsistencyValidator().validate(TypedDataset::fromCsvStream(csv), def);
    EXPECT_EQ(fromText.categoryViolations, 0u);
    EXPECT_EQ(fromText.validityLabel(), "PASS");

    TypedDataset data;
    data.addColumn(TypedDataset::floatColumn("c", {1.0, 2.0, 3.0}));
    data.addColumn(TypedDataset::textColumn("k", {"x", "1", "y"}));
    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(data, def);
    EXPECT_EQ(report.categoryViolations, 2u);
    EXPECT_FALSE(report.valid());
}

TEST(schema_consistency_validator, unsupported_declared_type_is_a_type_issue) {
    SchemaDefinition def = definitionFrom(kCustomers);
    def.columns.push_back(ColumnDeclaration{"when", UnsupportedColumnSpec{"datetime"}, 0.0});
    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(customers(), def);
    EXPECT_EQ(report.typeIssues, (std::vector<std::string>{"Unsupported type for when"}));
}

TEST(schema_consistency_validator, identifier_problems) {
    auto check = [](TypedColumn column, int64_t start) {
        TypedDataset data;
        data.addColumn(std::move(column));
        return SchemaConsistencyValidator::checkIdentifier(data, 0, start);
    };

    EXPECT_FALSE(check(TypedDataset::integerColumn("id", {3, 1, 2}), 1).has_value());
    EXPECT_EQ(check(TypedDataset::integerColumn("id", {1, 2, 0}, {0, 0, 1}), 1),
              std::optional<std::string>("Identifier contains null values"));
    EXPECT_EQ(check(TypedDataset::integerColumn("id", {1, 2, 2}), 1),
              std::optional<std::string>("Identifier contains duplicate values"));
    EXPECT_EQ(check(TypedDataset::integerColumn("id", {2, 3, 4}), 1),
              std::optional<std::string>("Identifier does not start from 1"));
    EXPECT_EQ(check(TypedDataset::integerColumn("id", {1, 2, 5}), 1),
              std::optional<std::string>("Identifier is not continuous"));
    EXPECT_EQ(check(TypedDataset::floatColumn("id", {1.0, 2.5}), 1),
              std::optional<std::string>("Identifier contains non-integer values"));
    EXPECT_EQ(check(TypedDataset::textColumn("id", {"1", "two"}), 1),
              std::optional<std::string>("Identifier contains non-integer values"));
    EXPECT_FALSE(check(TypedDataset::textColumn("id", {"100", "101"}), 100).has_value());
    EXPECT_FALSE(check(TypedDataset::integerColumn("id", {}), 1).has_value());
}

TEST(schema_consistency_validator, identifier_issue_fails_the_report) {
    TypedDataset data = customers().select({"age", "income", "tier"});
    data.addColumn(TypedDataset::integerColumn("id", {1, 1, 2, 3}));
    const SchemaConsistencyReport report = SchemaConsistencyValidator().validate(data, definitionFrom(kCustomers));
    EXPECT_TRUE(report.typeIssues.empty());
    ASSERT_TRUE(report.identifierIssue.has_value());
    EXPECT_EQ(*report.identifierIssue, "Identifier contains duplicate values");
    EXPECT_EQ(report.validityLabel(), "FAIL");
}

TEST(schema_consistency_validator, json_report_fields) {
    const Json::Value passing = SchemaConsistencyValidator().validate(customers(), definitionFrom(kCustomers)).toJson();
    EXPECT_EQ(passing["schema_validity"].asString(), "PASS");
    EXPECT_EQ(passing["range_violations"].asUInt64(), 0u);
    EXPECT_TRUE(passing["identifier_issues"].isNull());
    EXPECT_DOUBLE_EQ(passing["null_rate"]["income"].asDouble(), 0.25);
    EXPECT_EQ(passing["message"].asString(), "Schema-only evaluation completed");

    TypedDataset broken = customers().select({"age", "income", "tier"});
    broken.addColumn(TypedDataset::integerColumn("id", {5, 6, 7, 8}));
    const Json::Value failing = SchemaConsistencyValidator().validate(broken, definitionFrom(kCustomers)).toJson();
    EXPECT_EQ(failing["schema_validity"].asString(), "FAIL");
    EXPECT_EQ(failing["identifier_issues"].asString(), "Identifier does not start from 1");
}
