#include "AutoConfig.h"
#include "CommonUtils.h"
#include "SynthraExceptions.h"
#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Synthra::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Synthra::SynthraException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Synthra::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    if (key.rfind("--", 0) == 0) key.erase(0, 2);
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

void rejectNegative(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v.front() == '-') {
        throw Synthra::ConfigurationException("Value for " + key + " must be non-negative: " + value);
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    rejectNegative(value, key);
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw Synthra::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

uint64_t parseUInt64Strict(const std::string& value, const std::string& key) {
    rejectNegative(value, key);
    return parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    const uint64_t parsed = parseUInt64Strict(value, key);
    if (parsed > static_cast<uint64_t>(std::numeric_limits<uint32_t>::max())) {
        throw Synthra::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Synthra::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

bool isBoolLiteral(const std::string& value) {
    static const std::unordered_set<std::string> literals = {
        "1", "true", "yes", "on", "0", "false", "no", "off"
    };
    return literals.count(CommonUtils::toLower(CommonUtils::trim(value))) > 0;
}

bool isSwitchKey(const std::string& key) {
    return key == "apply_constraints" || key == "evaluate" || key == "sequential_id_override" || key == "verbose";
}

char parseDelimiter(const std::string& value, const std::string& label) {
    const std::string lowered = CommonUtils::toLower(value);
    if (lowered == "tab" || value == "\\t") return '\t';
    if (value.size() != 1) throw Synthra::ConfigurationException(label + " expects a single character");
    return value[0];
}

// `label` is the flag or config key shown in errors.
void assignKeyValue(AutoConfig& config, const std::string& key, const std::string& value, const std::string& label) {
    if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, label);
        return;
    }

    struct PathRule {
        std::string AutoConfig::*member;
    };
    static const std::unordered_map<std::string, PathRule> pathFields = {
        {"dataset", {&AutoConfig::datasetPath}},
        {"synthetic", {&AutoConfig::syntheticPath}},
        {"schema", {&AutoConfig::schemaPath}},
        {"output", {&AutoConfig::outputPath}},
        {"report", {&AutoConfig::reportFile}},
        {"json_out", {&AutoConfig::jsonOut}},
        {"session_out", {&AutoConfig::sessionOut}},
    };
    if (const auto it = pathFields.find(key); it != pathFields.end()) {
        config.*(it->second.member) = value;
        return;
    }

    struct BoolRule {
        bool AutoConfig::*member;
    };
    static const std::unordered_map<std::string, BoolRule> boolFields = {
        {"apply_constraints", {&AutoConfig::applyConstraints}},
        {"evaluate", {&AutoConfig::evaluateAfterSynthesis}},
        {"sequential_id_override", {&AutoConfig::sequentialIdOverride}},
        {"verbose", {&AutoConfig::verbose}},
    };
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second.member) = parseBoolStrict(value, label);
        return;
    }

    if (key == "model") {
        config.model = CommonUtils::toLower(CommonUtils::trim(value));
    } else if (key == "export_format") {
        config.exportFormat = CommonUtils::toLower(CommonUtils::trim(value));
    } else if (key == "categorical_threshold") {
        config.categoricalThreshold = parseSizeStrict(value, label, 0);
    } else if (key == "model_seed") {
        config.modelSeed = parseUInt64Strict(value, label);
    } else if (key == "evaluation_seed") {
        config.evaluationSeed = parseUIntStrict(value, label);
    } else if (key == "forest_trees") {
        config.forestTrees = parseSizeStrict(value, label, 1);
    } else if (key == "test_fraction") {
        config.testFraction = parseDoubleStrict(value, label);
    } else if (key == "rows") {
        config.rows = static_cast<long long>(parseSizeStrict(value, label, 0));
    } else {
        throw Synthra::ConfigurationException("Unknown option: " + label);
    }
}
} // namespace

CommandKind AutoConfig::parseCommand(const std::string& name) {
    const std::string c = CommonUtils::toLower(CommonUtils::trim(name));
    if (c == "infer") return CommandKind::INFER;
    if (c == "synthesize") return CommandKind::SYNTHESIZE;
    if (c == "evaluate") return CommandKind::EVALUATE;
    if (c == "generate") return CommandKind::GENERATE;
    if (c == "validate") return CommandKind::VALIDATE;
    throw Synthra::ConfigurationException("Unknown command: " + name + "\n" + usage());
}

std::string AutoConfig::commandName(CommandKind command) {
    switch (command) {
        case CommandKind::INFER: return "infer";
        case CommandKind::SYNTHESIZE: return "synthesize";
        case CommandKind::EVALUATE: return "evaluate";
        case CommandKind::GENERATE: return "generate";
        case CommandKind::VALIDATE: return "validate";
    }
    return "unknown";
}

std::string AutoConfig::usage() {
    return "Usage: synthra <command> [options]\n"
           "  infer <data.csv> [--output schema.json]\n"
           "  synthesize <data.csv> [--rows N] [--output synthetic.csv] [--evaluate true|false] [--session-out session.json]\n"
           "  evaluate <real.csv> --synthetic <synthetic.csv>\n"
           "  generate --schema <schema.json> --rows N [--output generated.csv] [--sequential-id-override]\n"
           "  validate <data.csv> --schema <schema.json>\n"
           "Options: [--config path] [--delimiter ,] [--categorical-threshold N] [--model marginal] [--model-seed N]"
           " [--evaluation-seed N] [--forest-trees N] [--test-fraction 0..1] [--apply-constraints true|false]"
           " [--export-format csv|parquet] [--report file.md] [--json-out file.json] [--verbose]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) throw Synthra::ConfigurationException(usage());

    AutoConfig config;
    config.command = parseCommand(argv[1]);

    int firstOption = 2;
    std::string positional;
    if (argc > 2 && std::string(argv[2]).rfind("--", 0) != 0) {
        positional = argv[2];
        firstOption = 3;
    }

    std::string configPath;
    for (int i = firstOption; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Synthra::ConfigurationException("--config expects a path");
            configPath = argv[++i];
        }
    }
    if (!configPath.empty()) config = fromFile(configPath, config);
    if (!positional.empty()) config.datasetPath = positional;

    for (int i = firstOption; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw Synthra::ConfigurationException("Unexpected argument: " + arg);
        }

        const std::string key = normalizeConfigKey(arg);
        if (isSwitchKey(key)) {
            if (i + 1 < argc && isBoolLiteral(argv[i + 1])) {
                assignKeyValue(config, key, argv[++i], arg);
            } else {
                assignKeyValue(config, key, "true", arg);
            }
            continue;
        }
        if (i + 1 >= argc) throw Synthra::ConfigurationException(arg + " expects a value");
        assignKeyValue(config, key, argv[++i], arg);
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Synthra::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value, key);
        } catch (const Synthra::SynthraException& ex) {
            throw Synthra::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void AutoConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };
    const std::string name = commandName(command);

    if (command != CommandKind::GENERATE && datasetPath.empty()) {
        throw Synthra::ConfigurationException(name + " requires a dataset path");
    }
    if (command == CommandKind::EVALUATE && syntheticPath.empty()) {
        throw Synthra::ConfigurationException("evaluate requires --synthetic <file>");
    }
    if ((command == CommandKind::GENERATE || command == CommandKind::VALIDATE) && schemaPath.empty()) {
        throw Synthra::ConfigurationException(name + " requires --schema <file>");
    }
    if (command == CommandKind::GENERATE && rows < 0) {
        throw Synthra::ConfigurationException("generate requires --rows N");
    }

    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Synthra::ConfigurationException("delimiter cannot be a quote or newline");
    }
    if (model.empty()) {
        throw Synthra::ConfigurationException("model must not be empty");
    }
    if (!isIn(exportFormat, {"csv", "parquet"})) {
        throw Synthra::ConfigurationException("export_format must be one of: csv, parquet");
    }
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        throw Synthra::ConfigurationException("test_fraction must be within (0,1)");
    }
    if (forestTrees == 0) {
        throw Synthra::ConfigurationException("forest_trees must be >= 1");
    }
}
