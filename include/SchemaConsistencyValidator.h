#pragma once

#include "SchemaDefinition.h"
#include "TypedDataset.h"

#include <json/json.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

struct SchemaConsistencyReport {
    std::vector<std::string> typeIssues;
    size_t rangeViolations = 0;
    size_t categoryViolations = 0;
    std::map<std::string, double> nullRate;
    std::optional<std::string> identifierIssue;
    std::string message = "Schema-only evaluation completed";

    bool valid() const noexcept {
        return typeIssues.empty() && rangeViolations == 0 && categoryViolations == 0 && !identifierIssue;
    }
    std::string validityLabel() const { return valid() ? "PASS" : "FAIL"; }
    std::string typeConsistency() const;

    Json::Value toJson() const;
};

class SchemaConsistencyValidator {
public:
    explicit SchemaConsistencyValidator(bool verbose = false) : verbose_(verbose) {}

    /**
     * @brief Checks a dataset against declared types, ranges, category sets and identifier rules.
     * @details Unsupported or absent columns become type issues and are not inspected further.
     *          Only the last identifier problem is kept in the report; all are logged.
     */
    SchemaConsistencyReport validate(const TypedDataset& data, const SchemaDefinition& definition) const;

    /// Empty when the column holds start..start+n-1 with no nulls or duplicates.
    static std::optional<std::string> checkIdentifier(const TypedDataset& data, size_t col, int64_t start);

private:
    bool verbose_;
};
