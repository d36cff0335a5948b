#include "export/export_sinks.h"

#include <cctype>
#include <fstream>
#include <memory>
#include <unordered_set>

#ifdef SCENEQL_USE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

#include "sceneql/formatters.h"
#include "sceneql/json.h"

namespace sceneql::cli {

namespace {

bool ends_with_ci(const std::string& value, const std::string& suffix) {
  if (value.size() < suffix.size()) return false;
  for (size_t i = 0; i < suffix.size(); ++i) {
    char a = static_cast<char>(std::tolower(static_cast<unsigned char>(value[value.size() - suffix.size() + i])));
    if (a != suffix[i]) return false;
  }
  return true;
}

bool open_output(std::ofstream& out, const std::string& path, std::string& error) {
  out.open(path, std::ios::binary);
  if (!out) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  return true;
}

Json row_to_json(const Row& row) {
  Json out = Json::object();
  for (const auto& entry : row) {
    out[entry.first] = value_to_json(entry.second);
  }
  return out;
}

}  // namespace

ExportKind export_kind_from_path(const std::string& path) {
  if (ends_with_ci(path, ".csv")) return ExportKind::Csv;
  if (ends_with_ci(path, ".ndjson")) return ExportKind::Ndjson;
  if (ends_with_ci(path, ".json")) return ExportKind::Json;
  if (ends_with_ci(path, ".parquet")) return ExportKind::Parquet;
  return ExportKind::None;
}

const char* export_kind_label(ExportKind kind) {
  switch (kind) {
    case ExportKind::Csv:
      return "CSV";
    case ExportKind::Json:
      return "JSON";
    case ExportKind::Ndjson:
      return "NDJSON";
    case ExportKind::Parquet:
      return "PARQUET";
    case ExportKind::None:
      break;
  }
  return "NONE";
}

std::vector<std::string> export_columns(const std::vector<Row>& rows) {
  std::vector<std::string> columns;
  std::unordered_set<std::string> seen;
  for (const auto& row : rows) {
    for (const auto& entry : row) {
      if (seen.insert(entry.first).second) columns.push_back(entry.first);
    }
  }
  return columns;
}

bool write_csv(const std::vector<Row>& rows, const std::string& path, std::string& error) {
  std::ofstream out;
  if (!open_output(out, path, error)) return false;
  std::vector<std::string> columns = export_columns(rows);
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) out << ",";
    out << csv_escape(columns[i]);
  }
  out << "\n";
  for (const auto& row : rows) {
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) out << ",";
      const Value* value = row.find(columns[i]);
      out << csv_escape(value ? format_cell(*value) : "");
    }
    out << "\n";
  }
  return true;
}

bool write_json(const std::vector<Row>& rows, const std::string& path, std::string& error) {
  std::ofstream out;
  if (!open_output(out, path, error)) return false;
  // WHY: write delimiters incrementally so large results do not require buffering.
  out << "[";
  bool first = true;
  for (const auto& row : rows) {
    if (!first) out << ",";
    first = false;
    out << row_to_json(row).dump(-1, ' ', false, Json::error_handler_t::replace);
  }
  out << "]\n";
  return true;
}

bool write_ndjson(const std::vector<Row>& rows, const std::string& path, std::string& error) {
  std::ofstream out;
  if (!open_output(out, path, error)) return false;
  for (const auto& row : rows) {
    out << row_to_json(row).dump(-1, ' ', false, Json::error_handler_t::replace) << "\n";
  }
  return true;
}

bool write_parquet(const std::vector<Row>& rows, const std::string& path, std::string& error) {
#ifdef SCENEQL_USE_ARROW
  std::vector<std::string> columns = export_columns(rows);
  if (columns.empty()) {
    error = "Parquet export requires at least one column";
    return false;
  }
  std::vector<std::shared_ptr<arrow::StringBuilder>> builders;
  builders.reserve(columns.size());
  for (size_t i = 0; i < columns.size(); ++i) {
    builders.push_back(std::make_shared<arrow::StringBuilder>());
  }
  for (const auto& row : rows) {
    for (size_t i = 0; i < columns.size(); ++i) {
      const Value* value = row.find(columns[i]);
      arrow::Status st = (!value || value->is_null()) ? builders[i]->AppendNull()
                                                      : builders[i]->Append(format_cell(*value));
      if (!st.ok()) {
        error = st.ToString();
        return false;
      }
    }
  }
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  fields.reserve(columns.size());
  arrays.reserve(columns.size());
  for (size_t i = 0; i < columns.size(); ++i) {
    fields.push_back(arrow::field(columns[i], arrow::utf8(), true));
    std::shared_ptr<arrow::Array> array;
    auto st = builders[i]->Finish(&array);
    if (!st.ok()) {
      error = st.ToString();
      return false;
    }
    arrays.push_back(array);
  }
  auto table = arrow::Table::Make(arrow::schema(fields), arrays);
  auto output_res = arrow::io::FileOutputStream::Open(path);
  if (!output_res.ok()) {
    error = output_res.status().ToString();
    return false;
  }
  auto output = *output_res;
  auto st = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), output, 1024);
  if (!st.ok()) {
    error = st.ToString();
    return false;
  }
  return true;
#else
  (void)rows;
  (void)path;
  error = "Parquet export requires Apache Arrow feature";
  return false;
#endif
}

bool export_rows(const std::vector<Row>& rows, const std::string& path, std::string& error) {
  switch (export_kind_from_path(path)) {
    case ExportKind::Csv:
      return write_csv(rows, path, error);
    case ExportKind::Json:
      return write_json(rows, path, error);
    case ExportKind::Ndjson:
      return write_ndjson(rows, path, error);
    case ExportKind::Parquet:
      return write_parquet(rows, path, error);
    case ExportKind::None:
      break;
  }
  error = "Unsupported export file extension (use .csv, .json, .ndjson or .parquet): " + path;
  return false;
}

}  // namespace sceneql::cli
