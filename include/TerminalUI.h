#pragma once
#include "EvaluationSuite.h"
#include "Schema.h"
#include "SchemaConsistencyValidator.h"
#include "SynthraExceptions.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printSchemaTable(const Schema& schema);

    // Mode A display
    static void printEvaluationReport(const EvaluationReport& report);
    static void printReconcileWarnings(const std::vector<std::string>& missingColumns);

    // Mode B display
    static void printSchemaViolations(const std::vector<Synthra::SchemaViolation>& violations);
    static void printConsistencyReport(const SchemaConsistencyReport& report);
};
