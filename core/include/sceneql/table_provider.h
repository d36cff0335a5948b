#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "sceneql/value.h"

namespace sceneql {

/// Supplies rows for named tables to the query engine.
/// get_rows MUST return a fresh, self-contained snapshot; the engine never mutates it.
/// Implementations used from several threads MUST be reentrant for const access.
class TableProvider {
 public:
  virtual ~TableProvider() = default;

  virtual bool has_table(const std::string& name) const = 0;
  virtual std::set<std::string> get_table_names() const = 0;
  /// Throws std::runtime_error (or a subclass) when the table cannot be loaded.
  virtual std::vector<Row> get_rows(const std::string& name) const = 0;
};

/// Provider backed by in-memory row vectors, typically loaded from a JSON document.
/// Serves a `tables` meta-table ({table, row_count}) unless a table of that name exists.
class MemoryTableProvider : public TableProvider {
 public:
  static constexpr const char* kMetaTable = "tables";

  MemoryTableProvider() = default;

  /// Adds or replaces a table.
  void add_table(const std::string& name, std::vector<Row> rows);

  bool has_table(const std::string& name) const override;
  std::set<std::string> get_table_names() const override;
  std::vector<Row> get_rows(const std::string& name) const override;

  /// Builds a provider from JSON text shaped as {"table": [{...}, ...], ...}.
  /// MUST throw std::runtime_error on malformed JSON or non-object rows.
  static MemoryTableProvider from_json_text(const std::string& text);
  /// Loads a JSON document from disk. Throws on IO or parse errors.
  static MemoryTableProvider load_from_file(const std::string& path);
  /// Fetches a JSON document over HTTP(S). Requires libcurl support.
  static MemoryTableProvider load_from_url(const std::string& url, int timeout_ms);

 private:
  std::vector<Row> meta_rows() const;

  std::map<std::string, std::vector<Row>> tables_;
};

}  // namespace sceneql
