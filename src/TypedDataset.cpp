#include "TypedDataset.h"

#include "CSVUtils.h"
#include "CommonUtils.h"
#include "SynthraExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>

namespace {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

MissingMask normalizeMask(MissingMask missing, size_t n, const std::string& name) {
    if (missing.empty()) return MissingMask(n, static_cast<uint8_t>(0));
    if (missing.size() != n) {
        throw Synthra::DatasetException("Missing mask size mismatch for column: " + name);
    }
    return missing;
}

TypedColumn buildColumn(const std::string& name,
                        const std::vector<std::vector<std::string>>& rows,
                        size_t c) {
    const size_t n = rows.size();
    MissingMask missing(n, static_cast<uint8_t>(0));
    size_t present = 0;
    bool allInt = true;
    bool allDouble = true;

    for (size_t r = 0; r < n; ++r) {
        const std::string& cell = rows[r][c];
        if (isMissingToken(cell)) {
            missing[r] = 1;
            continue;
        }
        ++present;
        const std::string t = CommonUtils::trim(cell);
        int64_t iv = 0;
        double dv = 0.0;
        if (allInt && !CommonUtils::parseInt64(t, iv)) allInt = false;
        if (allDouble && !CommonUtils::parseDouble(t, dv)) allDouble = false;
        if (!allInt && !allDouble) break;
    }
    if (!allDouble) {
        // The early break above may have left later missing flags unset.
        for (size_t r = 0; r < n; ++r) missing[r] = isMissingToken(rows[r][c]) ? 1 : 0;
    }

    TypedColumn col;
    col.name = name;
    col.missing = missing;

    if (present == 0 && n == 0) {
        col.type = ColumnType::TEXT;
        col.values = std::vector<std::string>{};
    } else if (present > 0 && allInt) {
        std::vector<int64_t> values(n, 0);
        for (size_t r = 0; r < n; ++r) {
            if (!missing[r]) CommonUtils::parseInt64(CommonUtils::trim(rows[r][c]), values[r]);
        }
        col.type = ColumnType::INTEGER;
        col.values = std::move(values);
    } else if (allDouble) {
        std::vector<double> values(n, std::numeric_limits<double>::quiet_NaN());
        for (size_t r = 0; r < n; ++r) {
            if (!missing[r]) CommonUtils::parseDouble(CommonUtils::trim(rows[r][c]), values[r]);
        }
        col.type = ColumnType::FLOAT;
        col.values = std::move(values);
    } else {
        std::vector<std::string> values(n);
        for (size_t r = 0; r < n; ++r) {
            if (!missing[r]) values[r] = rows[r][c];
        }
        col.type = ColumnType::TEXT;
        col.values = std::move(values);
    }
    return col;
}
} // namespace

TypedDataset TypedDataset::fromCsv(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Synthra::IOException("Could not open file: " + path);
    return fromCsvStream(in, delimiter);
}

TypedDataset TypedDataset::fromCsvStream(std::istream& in, char delimiter) {
    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter, &malformed);
    if (malformed || header.empty()) throw Synthra::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> rows;
    size_t skipped = 0;
    while (in.peek() != EOF) {
        bool rowMalformed = false;
        auto row = CSVUtils::parseCSVLine(in, delimiter, &rowMalformed);
        if (rowMalformed) {
            ++skipped;
            continue;
        }
        if (row.empty()) continue;
        row.resize(header.size());
        rows.push_back(std::move(row));
    }
    if (skipped > 0) {
        std::cout << "[Synthra][Warning] Skipped " << skipped << " malformed CSV record(s)\n";
    }

    TypedDataset out;
    for (size_t c = 0; c < header.size(); ++c) {
        out.addColumn(buildColumn(header[c], rows, c));
    }
    out.rowCount_ = rows.size();
    return out;
}

TypedColumn TypedDataset::integerColumn(std::string name, std::vector<int64_t> values, MissingMask missing) {
    TypedColumn col;
    col.missing = normalizeMask(std::move(missing), values.size(), name);
    col.name = std::move(name);
    col.type = ColumnType::INTEGER;
    col.values = std::move(values);
    return col;
}

TypedColumn TypedDataset::floatColumn(std::string name, std::vector<double> values, MissingMask missing) {
    TypedColumn col;
    if (missing.empty()) {
        missing.assign(values.size(), static_cast<uint8_t>(0));
        for (size_t i = 0; i < values.size(); ++i) missing[i] = std::isnan(values[i]) ? 1 : 0;
    }
    col.missing = normalizeMask(std::move(missing), values.size(), name);
    for (size_t i = 0; i < values.size(); ++i) {
        if (col.missing[i]) values[i] = std::numeric_limits<double>::quiet_NaN();
    }
    col.name = std::move(name);
    col.type = ColumnType::FLOAT;
    col.values = std::move(values);
    return col;
}

TypedColumn TypedDataset::textColumn(std::string name, std::vector<std::string> values, MissingMask missing) {
    TypedColumn col;
    col.missing = normalizeMask(std::move(missing), values.size(), name);
    col.name = std::move(name);
    col.type = ColumnType::TEXT;
    col.values = std::move(values);
    return col;
}

void TypedDataset::addColumn(TypedColumn column) {
    if (findColumnIndex(column.name) >= 0) {
        throw Synthra::DatasetException("Duplicate column name: " + column.name);
    }
    const size_t n = column.missing.size();
    const size_t stored = std::visit([](const auto& v) { return v.size(); }, column.values);
    if (stored != n) {
        throw Synthra::DatasetException("Column " + column.name + " has inconsistent storage");
    }
    if (!columns_.empty() && n != rowCount_) {
        throw Synthra::DatasetException("Column " + column.name + " has " + std::to_string(n) +
                                        " rows, expected " + std::to_string(rowCount_));
    }
    if (columns_.empty()) rowCount_ = n;
    columns_.push_back(std::move(column));
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::vector<std::string> TypedDataset::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}

TypedDataset TypedDataset::select(const std::vector<std::string>& names) const {
    TypedDataset out;
    for (const auto& name : names) {
        const int idx = findColumnIndex(name);
        if (idx < 0) throw Synthra::DatasetException("Missing column: " + name);
        out.addColumn(columns_[static_cast<size_t>(idx)]);
    }
    return out;
}

std::vector<double> TypedDataset::numericValues(size_t col) const {
    const TypedColumn& c = columns_.at(col);
    if (c.type == ColumnType::FLOAT) return std::get<std::vector<double>>(c.values);
    if (c.type == ColumnType::TEXT) {
        throw Synthra::DatasetException("Column " + c.name + " is not numeric");
    }
    const auto& ints = std::get<std::vector<int64_t>>(c.values);
    std::vector<double> out(ints.size(), std::numeric_limits<double>::quiet_NaN());
    for (size_t i = 0; i < ints.size(); ++i) {
        if (!c.missing[i]) out[i] = static_cast<double>(ints[i]);
    }
    return out;
}

std::string TypedDataset::cellText(size_t col, size_t row) const {
    const TypedColumn& c = columns_.at(col);
    if (c.missing.at(row)) return "";
    switch (c.type) {
        case ColumnType::INTEGER:
            return CommonUtils::formatInt(std::get<std::vector<int64_t>>(c.values)[row]);
        case ColumnType::FLOAT:
            return CommonUtils::formatDouble(std::get<std::vector<double>>(c.values)[row]);
        case ColumnType::TEXT:
            return std::get<std::vector<std::string>>(c.values)[row];
    }
    return "";
}

size_t TypedDataset::missingCount(size_t col) const {
    const auto& m = columns_.at(col).missing;
    return static_cast<size_t>(std::count(m.begin(), m.end(), static_cast<uint8_t>(1)));
}
