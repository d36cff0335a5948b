#pragma once

#include <string>
#include <vector>

#include "sceneql/value.h"

namespace sceneql::cli {

enum class ExportKind { None, Csv, Json, Ndjson, Parquet };

/// Chooses the export format from a file extension (case-insensitive).
ExportKind export_kind_from_path(const std::string& path);
/// Display label such as "CSV" or "NDJSON".
const char* export_kind_label(ExportKind kind);

/// Column names: keys of the first row, then keys first seen in later rows.
std::vector<std::string> export_columns(const std::vector<Row>& rows);

bool write_csv(const std::vector<Row>& rows, const std::string& path, std::string& error);
bool write_json(const std::vector<Row>& rows, const std::string& path, std::string& error);
bool write_ndjson(const std::vector<Row>& rows, const std::string& path, std::string& error);
/// Writes string columns through Apache Arrow; fails when built without Arrow.
bool write_parquet(const std::vector<Row>& rows, const std::string& path, std::string& error);

/// Dispatches on the path's extension. MUST fail for unsupported extensions.
bool export_rows(const std::vector<Row>& rows, const std::string& path, std::string& error);

}  // namespace sceneql::cli
