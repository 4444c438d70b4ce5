#pragma once

#include "AutoConfig.h"

#include <json/json.h>

#include <string>

class AutomationPipeline final {
public:
    /// Exit status of a FAIL schema consistency report.
    static constexpr int kValidationFailedExitCode = 2;

    /**
     * @brief Runs the configured command end to end.
     * @return 0 on success, kValidationFailedExitCode when `validate` finds violations.
     * @throws Synthra::SynthraException on IO, dataset, schema or model failures.
     */
    int run(const AutoConfig& config);

    /// Writes indented JSON. Throws Synthra::IOException on failure.
    static void writeJson(const Json::Value& value, const std::string& path);

private:
    int runInfer(const AutoConfig& config);
    int runSynthesize(const AutoConfig& config);
    int runEvaluate(const AutoConfig& config);
    int runGenerate(const AutoConfig& config);
    int runValidate(const AutoConfig& config);
};
