#pragma once
#include <cstdint>
#include <string>

enum class CommandKind { INFER, SYNTHESIZE, EVALUATE, GENERATE, VALIDATE };

struct AutoConfig {
    CommandKind command = CommandKind::INFER;

    std::string datasetPath;
    std::string syntheticPath;
    std::string schemaPath;
    std::string outputPath;      // empty => command default
    std::string reportFile;      // markdown report, optional
    std::string jsonOut;         // machine-readable report, optional
    std::string sessionOut;      // fitted session export, optional
    char delimiter = ',';

    size_t categoricalThreshold = 10;
    std::string model = "marginal";
    uint64_t modelSeed = 42;
    long long rows = -1;         // -1 => input row count (synthesize), required for generate
    bool applyConstraints = true;
    bool evaluateAfterSynthesis = false;
    std::string exportFormat = "csv"; // csv|parquet

    uint32_t evaluationSeed = 42;
    size_t forestTrees = 100;
    double testFraction = 0.30;

    bool sequentialIdOverride = false;
    bool verbose = false;

    /**
     * @brief Builds config from `synthra <command> [path] [options]`.
     * @pre argv[1] names a command.
     * @post Returns a validated config; CLI flags take precedence over --config file values.
     * @throws Synthra::ConfigurationException on unknown commands, flags or invalid values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults. Not validated; callers validate after merging.
     * @throws Synthra::ConfigurationException on unreadable files, unknown keys or bad values.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Validates per-command requirements and value ranges.
     * @throws Synthra::ConfigurationException on invalid values.
     */
    void validate() const;

    static CommandKind parseCommand(const std::string& name);
    static std::string commandName(CommandKind command);
    static std::string usage();
};
