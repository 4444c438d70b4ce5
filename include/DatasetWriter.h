#pragma once

#include "TypedDataset.h"

#include <string>

namespace DatasetWriter {
enum class Format { CSV, PARQUET };

/// "csv" or "parquet", case-insensitive. Throws Synthra::ConfigurationException otherwise.
Format parseFormat(const std::string& name);

/**
 * @brief Writes header and rows with canonical cell text; missing cells are left empty.
 * @throws Synthra::IOException on open or write failure.
 */
void writeCsv(const TypedDataset& data, const std::string& path, char delimiter = ',');

/**
 * @brief Writes data in the requested format and returns the path written.
 * @details Parquet needs a build with SYNTHRA_USE_NATIVE_PARQUET. Without it, or when the
 *          native writer fails, a warning is logged and CSV is written beside the requested path.
 */
std::string write(const TypedDataset& data, const std::string& path, Format format, char delimiter = ',');
}
