#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC-4180 tokenization and emission. No type inference happens here.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;
    size_t maxColumns = 20000;
};

void skipBOM(std::istream& is);

/// Reads one logical record. Quoted fields may span physical lines.
/// Sets *malformed when the record ends inside an open quote.
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

/// Empty names become column_<i>; repeated names get _2, _3 suffixes.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

std::string escapeField(const std::string& value, char delimiter);
void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
