#include "sceneql/table_provider.h"

#include <stdexcept>

#include "io.h"
#include "sceneql/json.h"

namespace sceneql {

void MemoryTableProvider::add_table(const std::string& name, std::vector<Row> rows) {
  tables_[name] = std::move(rows);
}

bool MemoryTableProvider::has_table(const std::string& name) const {
  return tables_.count(name) > 0 || name == kMetaTable;
}

std::set<std::string> MemoryTableProvider::get_table_names() const {
  std::set<std::string> names;
  for (const auto& entry : tables_) names.insert(entry.first);
  names.insert(kMetaTable);
  return names;
}

std::vector<Row> MemoryTableProvider::get_rows(const std::string& name) const {
  auto it = tables_.find(name);
  if (it != tables_.end()) return it->second;
  if (name == kMetaTable) return meta_rows();
  throw std::runtime_error("No such table: " + name);
}

std::vector<Row> MemoryTableProvider::meta_rows() const {
  std::vector<Row> rows;
  rows.reserve(tables_.size());
  for (const auto& entry : tables_) {
    Row row;
    row.set("table", Value::string(entry.first));
    row.set("row_count", Value::integer(static_cast<int64_t>(entry.second.size())));
    rows.push_back(std::move(row));
  }
  return rows;
}

MemoryTableProvider MemoryTableProvider::from_json_text(const std::string& text) {
  Json document;
  try {
    document = Json::parse(text);
  } catch (const Json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid JSON input: ") + e.what());
  }
  if (!document.is_object()) {
    throw std::runtime_error("JSON input must be an object mapping table names to row arrays");
  }
  MemoryTableProvider provider;
  for (auto it = document.begin(); it != document.end(); ++it) {
    const Json& table = it.value();
    if (!table.is_array()) {
      throw std::runtime_error("Table '" + it.key() + "' must be an array of objects");
    }
    std::vector<Row> rows;
    rows.reserve(table.size());
    for (size_t i = 0; i < table.size(); ++i) {
      if (!table[i].is_object()) {
        throw std::runtime_error("Row " + std::to_string(i) + " of table '" + it.key() +
                                 "' is not an object");
      }
      rows.push_back(value_from_json(table[i]).as_map());
    }
    provider.add_table(it.key(), std::move(rows));
  }
  return provider;
}

MemoryTableProvider MemoryTableProvider::load_from_file(const std::string& path) {
  return from_json_text(io::read_file(path));
}

MemoryTableProvider MemoryTableProvider::load_from_url(const std::string& url, int timeout_ms) {
  return from_json_text(io::fetch_url(url, timeout_ms));
}

}  // namespace sceneql
