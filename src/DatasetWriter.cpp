#include "DatasetWriter.h"

#include "CSVUtils.h"
#include "CommonUtils.h"
#include "SynthraExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

#ifdef SYNTHRA_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
std::string withExtension(const std::string& path, const std::string& ext) {
    std::filesystem::path p(path);
    p.replace_extension(ext);
    return p.string();
}

#ifdef SYNTHRA_USE_NATIVE_PARQUET
template <class Builder, class Value>
bool finishColumn(const TypedColumn& col,
                  const std::vector<Value>& values,
                  const std::shared_ptr<arrow::DataType>& type,
                  std::vector<std::shared_ptr<arrow::Field>>& fields,
                  std::vector<std::shared_ptr<arrow::Array>>& arrays,
                  std::string& errorOut) {
    Builder builder;
    for (size_t r = 0; r < values.size(); ++r) {
        const arrow::Status st = col.missing[r] ? builder.AppendNull() : builder.Append(values[r]);
        if (!st.ok()) {
            errorOut = "Failed to append value for column '" + col.name + "': " + st.ToString();
            return false;
        }
    }
    std::shared_ptr<arrow::Array> arr;
    const arrow::Status status = builder.Finish(&arr);
    if (!status.ok()) {
        errorOut = "Failed to finalize Arrow array for column '" + col.name + "': " + status.ToString();
        return false;
    }
    fields.push_back(arrow::field(col.name, type, true));
    arrays.push_back(arr);
    return true;
}

bool exportParquetNative(const TypedDataset& data, const std::string& parquetPath, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(data.colCount());
    arrays.reserve(data.colCount());

    for (const auto& col : data.columns()) {
        bool ok = false;
        switch (col.type) {
            case ColumnType::INTEGER:
                ok = finishColumn<arrow::Int64Builder>(col, std::get<std::vector<int64_t>>(col.values), arrow::int64(), fields, arrays, errorOut);
                break;
            case ColumnType::FLOAT:
                ok = finishColumn<arrow::DoubleBuilder>(col, std::get<std::vector<double>>(col.values), arrow::float64(), fields, arrays, errorOut);
                break;
            case ColumnType::TEXT:
                ok = finishColumn<arrow::StringBuilder>(col, std::get<std::vector<std::string>>(col.values), arrow::utf8(), fields, arrays, errorOut);
                break;
        }
        if (!ok) return false;
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(data.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(data.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif
} // namespace

namespace DatasetWriter {
Format parseFormat(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key == "csv") return Format::CSV;
    if (key == "parquet") return Format::PARQUET;
    throw Synthra::ConfigurationException("Unsupported export format: " + name);
}

void writeCsv(const TypedDataset& data, const std::string& path, char delimiter) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Synthra::IOException("Could not open output file: " + path);

    CSVUtils::writeRow(out, data.columnNames(), delimiter);
    std::vector<std::string> cells(data.colCount());
    for (size_t r = 0; r < data.rowCount(); ++r) {
        for (size_t c = 0; c < data.colCount(); ++c) cells[c] = data.cellText(c, r);
        CSVUtils::writeRow(out, cells, delimiter);
    }
    out.flush();
    if (!out) throw Synthra::IOException("Failed while writing: " + path);
}

std::string write(const TypedDataset& data, const std::string& path, Format format, char delimiter) {
    if (format == Format::CSV) {
        writeCsv(data, path, delimiter);
        return path;
    }

    const std::string csvPath = withExtension(path, ".csv");
#ifdef SYNTHRA_USE_NATIVE_PARQUET
    const std::string parquetPath = withExtension(path, ".parquet");
    std::string parquetError;
    if (exportParquetNative(data, parquetPath, parquetError)) return parquetPath;
    std::cout << "[Synthra][Warning] Native parquet export failed: " << parquetError
              << ". Writing CSV to " << csvPath << "\n";
#else
    std::cout << "[Synthra][Warning] Parquet export requested, but this build was compiled without native parquet support. "
              << "Writing CSV to " << csvPath << "\n";
#endif
    writeCsv(data, csvPath, delimiter);
    return csvPath;
}
}
