#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { INTEGER, FLOAT, TEXT };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t size() const noexcept { return missing.size(); }
    bool isNumeric() const noexcept { return type != ColumnType::TEXT; }
};

class TypedDataset {
public:
    TypedDataset() = default;

    /**
     * @brief Loads a CSV file and types every column.
     * @details Tokenization is delegated to CSVUtils. A column is INTEGER when every non-missing
     *          cell parses as int64, FLOAT when every one parses as a double, TEXT otherwise.
     * @pre file exists and is readable.
     * @throws Synthra::IOException when the file cannot be opened.
     * @throws Synthra::DatasetException on a malformed or empty header.
     */
    static TypedDataset fromCsv(const std::string& path, char delimiter = ',');
    static TypedDataset fromCsvStream(std::istream& in, char delimiter = ',');

    static TypedColumn integerColumn(std::string name, std::vector<int64_t> values, MissingMask missing = {});
    /// NaN entries are marked missing when no mask is given.
    static TypedColumn floatColumn(std::string name, std::vector<double> values, MissingMask missing = {});
    static TypedColumn textColumn(std::string name, std::vector<std::string> values, MissingMask missing = {});

    /**
     * @brief Appends a column.
     * @throws Synthra::DatasetException on a duplicate name or a row-count mismatch.
     */
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    const TypedColumn& column(size_t index) const { return columns_.at(index); }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    std::vector<std::string> columnNames() const;

    /// Projection in the given order. Throws Synthra::DatasetException on an unknown name.
    TypedDataset select(const std::vector<std::string>& names) const;

    /// Numeric view of a column, NaN for missing cells. Throws for TEXT columns.
    std::vector<double> numericValues(size_t col) const;

    /// Canonical string form of a cell ("" when missing).
    std::string cellText(size_t col, size_t row) const;
    bool isMissing(size_t col, size_t row) const { return columns_.at(col).missing.at(row) != 0; }
    size_t missingCount(size_t col) const;

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
