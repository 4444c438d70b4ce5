#ifndef SYNTHRA_EXCEPTIONS_H
#define SYNTHRA_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Synthra {

class SynthraException : public std::runtime_error {
public:
    explicit SynthraException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public SynthraException {
public:
    explicit IOException(const std::string& message) : SynthraException("IO Error: " + message) {}
};

class DatasetException : public SynthraException {
public:
    explicit DatasetException(const std::string& message) : SynthraException("Dataset Error: " + message) {}
};

class ConfigurationException : public SynthraException {
public:
    explicit ConfigurationException(const std::string& message) : SynthraException("Configuration Error: " + message) {}
};

class UnfittedSessionException : public SynthraException {
public:
    explicit UnfittedSessionException(const std::string& message) : SynthraException("Session Error: " + message) {}
};

class GenerativeModelException : public SynthraException {
public:
    explicit GenerativeModelException(const std::string& message) : SynthraException("Model Error: " + message) {}
};

enum class SchemaViolationCode {
    MISSING_COLUMNS,
    MISSING_NAME,
    UNSUPPORTED_TYPE,
    MISSING_BOUNDS,
    INVERTED_BOUNDS,
    EMPTY_VALUES,
    NULL_RATE_OUT_OF_RANGE,
    INVALID_FIELD
};

struct SchemaViolation {
    SchemaViolationCode code = SchemaViolationCode::INVALID_FIELD;
    std::string column;
    std::string message;
};

class SchemaValidationException : public SynthraException {
public:
    explicit SchemaValidationException(std::vector<SchemaViolation> violations)
        : SynthraException("Schema Error: " + joinMessages(violations)), violations_(std::move(violations)) {}

    const std::vector<SchemaViolation>& violations() const noexcept { return violations_; }

private:
    static std::string joinMessages(const std::vector<SchemaViolation>& violations) {
        std::string out;
        for (const auto& v : violations) {
            if (!out.empty()) out += "; ";
            out += v.message;
        }
        return out.empty() ? "invalid schema definition" : out;
    }

    std::vector<SchemaViolation> violations_;
};

} // namespace Synthra

#endif // SYNTHRA_EXCEPTIONS_H
