#include "CSVUtils.h"

#include "SynthraExceptions.h"

#include <unordered_set>

namespace CSVUtils {
namespace {
std::string trimUnquoted(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}
} // namespace

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    const char bom[3] = {'\xEF', '\xBB', '\xBF'};
    for (int i = 0; i < 3; ++i) {
        const int next = is.peek();
        if (next == EOF || static_cast<char>(next) != bom[i]) {
            is.clear(is.rdstate() & ~std::ios::eofbit);
            for (int k = 0; k < i; ++k) is.unget();
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    bool sawContent = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquoted(val));
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) {
            throw Synthra::DatasetException("record exceeds " + std::to_string(limits.maxColumns) + " columns");
        }
        val.clear();
        fieldQuoted = false;
    };

    auto append = [&](char ch) {
        val += ch;
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            throw Synthra::DatasetException("field exceeds " + std::to_string(limits.maxFieldBytes) + " bytes");
        }
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    append('"');
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                append('\n');
            } else {
                append(c);
            }
            continue;
        }

        if (c == '"' && trimUnquoted(val).empty() && !fieldQuoted) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
            sawContent = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            // Text after a closing quote is kept verbatim.
            append(c);
            sawContent = true;
        }
    }

    if (inQuotes && malformed) *malformed = true;

    if (!sawContent && !sawDelimiter && val.empty()) return {};
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        const std::string base = out[i];
        if (seen.count(out[i])) {
            size_t suffix = 2;
            while (seen.count(base + "_" + std::to_string(suffix))) ++suffix;
            out[i] = base + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find_first_of("\"\r\n") != std::string::npos ||
                             (!value.empty() && (value.front() == ' ' || value.back() == ' '));
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char ch : value) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) os << delimiter;
        os << escapeField(fields[i], delimiter);
    }
    os << '\n';
}
} // namespace CSVUtils
