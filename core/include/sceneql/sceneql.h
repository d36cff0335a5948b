#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sceneql/table_provider.h"
#include "sceneql/value.h"

namespace sceneql {

/// Outcome of one query call, ready to be serialized for the caller.
/// MUST carry data only on success and an error message only on failure.
/// Inputs are populated by execute_query; count is the number of final rows.
struct QueryResponse {
  enum class Status { Success, Error } status = Status::Error;
  std::string format;
  size_t count = 0;
  /// JSON format: a Sequence of row Maps. CSV/table formats: a String.
  std::optional<Value> data;
  std::string error;

  bool ok() const { return status == Status::Success; }
};

/// Runs one query against a table provider and formats the result.
/// MUST NOT throw; every failure becomes an Error response naming the failing stage.
/// limit > 0 truncates the result; limit <= 0 leaves it to the query's LIMIT clause.
QueryResponse execute_query(const std::string& query,
                            int64_t limit,
                            const std::string& format,
                            const TableProvider& provider);

/// Checks query syntax without touching any provider.
/// Returns the first clause-qualified error, or nullopt for a valid query.
std::optional<std::string> lint_query(const std::string& query);

struct FieldInfo {
  std::string name;
  std::string type = "unknown";
  bool nullable = false;
  std::vector<Value> sample_values;
};

/// Field-level summary of one table.
struct TableSchema {
  std::string table;
  size_t row_count = 0;
  std::vector<FieldInfo> fields;
};

struct TableCounts {
  std::vector<std::pair<std::string, size_t>> counts;
  size_t total_rows = 0;
  std::vector<std::string> errors;
};

/// Lists dotted field paths found in the first rows, sorted.
/// Descends into maps and into the first element of sequences of maps.
std::vector<std::string> list_available_fields(const std::vector<Row>& rows, size_t max_depth = 3);
/// Inspects every row of a table. Throws std::runtime_error for unknown tables.
TableSchema describe_table(const TableProvider& provider,
                           const std::string& table,
                           size_t max_samples = 3);
/// Counts rows per table; load failures are recorded and counted as zero.
TableCounts count_tables(const TableProvider& provider);
/// Flattens a schema into rows ({field, type, nullable, samples}) for the formatters.
std::vector<Row> schema_rows(const TableSchema& schema);

}  // namespace sceneql
