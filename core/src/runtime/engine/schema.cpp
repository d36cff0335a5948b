#include "sceneql/sceneql.h"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>

#include "../../util/string_util.h"

namespace sceneql {

namespace {

/// Rows sampled when listing available field paths.
constexpr size_t kFieldListingRows = 3;

void collect_paths(const Map& map,
                   const std::string& prefix,
                   size_t depth,
                   size_t max_depth,
                   std::set<std::string>& out) {
  if (depth > max_depth) return;
  for (const auto& entry : map) {
    std::string path = prefix.empty() ? entry.first : prefix + "." + entry.first;
    out.insert(path);
    const Value& value = entry.second;
    if (value.is_map()) {
      collect_paths(value.as_map(), path, depth + 1, max_depth, out);
    } else if (value.is_sequence() && !value.as_sequence().empty() &&
               value.as_sequence().front().is_map()) {
      collect_paths(value.as_sequence().front().as_map(), path, depth + 1, max_depth, out);
    }
  }
}

std::string friendly_type(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::Null:
      return "null";
    case Value::Kind::Bool:
      return "boolean";
    case Value::Kind::Int:
      return "integer";
    case Value::Kind::Float:
      return "float";
    case Value::Kind::String:
      return "string";
    case Value::Kind::Sequence:
      if (value.as_sequence().empty()) return "array";
      return "array[" + friendly_type(value.as_sequence().front()) + "]";
    case Value::Kind::Map:
      return "object";
  }
  return "unknown";
}

FieldInfo& field_entry(std::vector<FieldInfo>& fields, const std::string& name) {
  for (auto& field : fields) {
    if (field.name == name) return field;
  }
  FieldInfo info;
  info.name = name;
  fields.push_back(std::move(info));
  return fields.back();
}

}  // namespace

std::vector<std::string> list_available_fields(const std::vector<Row>& rows, size_t max_depth) {
  std::set<std::string> paths;
  size_t limit = std::min(rows.size(), kFieldListingRows);
  for (size_t i = 0; i < limit; ++i) {
    collect_paths(rows[i], "", 0, max_depth, paths);
  }
  return std::vector<std::string>(paths.begin(), paths.end());
}

TableSchema describe_table(const TableProvider& provider, const std::string& table, size_t max_samples) {
  std::string name = table;
  if (!provider.has_table(name)) {
    name = util::to_lower(table);
  }
  if (!provider.has_table(name)) {
    std::vector<std::string> names;
    for (const auto& known : provider.get_table_names()) names.push_back(known);
    throw std::runtime_error("Unknown table: '" + table + "'. Available tables: " + util::join(names, ", "));
  }

  std::vector<Row> rows = provider.get_rows(name);
  TableSchema schema;
  schema.table = name;
  schema.row_count = rows.size();
  for (const auto& row : rows) {
    for (const auto& entry : row) {
      FieldInfo& info = field_entry(schema.fields, entry.first);
      const Value& value = entry.second;
      if (value.is_null()) {
        info.nullable = true;
        continue;
      }
      std::string type = friendly_type(value);
      if (info.type == "unknown") {
        info.type = type;
      } else if (info.type != type) {
        info.type = "mixed";
      }
      if (info.sample_values.size() < max_samples &&
          std::find(info.sample_values.begin(), info.sample_values.end(), value) ==
              info.sample_values.end()) {
        info.sample_values.push_back(value);
      }
    }
  }
  for (auto& info : schema.fields) {
    if (info.type == "unknown" && info.nullable) info.type = "null";
  }
  return schema;
}

TableCounts count_tables(const TableProvider& provider) {
  TableCounts counts;
  for (const auto& name : provider.get_table_names()) {
    size_t rows = 0;
    try {
      rows = provider.get_rows(name).size();
    } catch (const std::exception& e) {
      counts.errors.push_back(name + ": " + e.what());
    }
    counts.counts.emplace_back(name, rows);
    counts.total_rows += rows;
  }
  return counts;
}

std::vector<Row> schema_rows(const TableSchema& schema) {
  std::vector<Row> out;
  out.reserve(schema.fields.size());
  for (const auto& field : schema.fields) {
    Row row;
    row.set("field", Value::string(field.name));
    row.set("type", Value::string(field.type));
    row.set("nullable", Value::boolean(field.nullable));
    row.set("samples", Value::sequence(field.sample_values));
    out.push_back(std::move(row));
  }
  return out;
}

}  // namespace sceneql
