#include "test_harness.h"

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "sceneql/sceneql.h"
#include "test_utils.h"

namespace {

const sceneql::FieldInfo* find_field(const sceneql::TableSchema& schema, const std::string& name) {
  for (const auto& field : schema.fields) {
    if (field.name == name) return &field;
  }
  return nullptr;
}

void test_list_available_fields() {
  auto rows = rows_from_json(R"([{"name": "A", "mods": [{"kind": "ARRAY", "opts": {"count": 2}}],
                                  "stats": {"verts": 8}}])");
  auto fields = sceneql::list_available_fields(rows);
  std::set<std::string> found(fields.begin(), fields.end());
  expect_true(found.count("name") == 1, "top-level field");
  expect_true(found.count("stats.verts") == 1, "nested map field");
  expect_true(found.count("mods.kind") == 1, "first element of list of maps");
  expect_true(found.count("mods.opts.count") == 1, "nested inside list element");
  expect_true(fields.front() <= fields.back(), "sorted output");
  auto shallow = sceneql::list_available_fields(rows, 0);
  expect_true(std::set<std::string>(shallow.begin(), shallow.end()).count("stats.verts") == 0,
              "max depth stops descent");
}

void test_describe_table_types() {
  auto provider = make_scene_provider();
  auto schema = sceneql::describe_table(provider, "objects");
  expect_str_eq(schema.table, "objects", "table name");
  expect_eq(schema.row_count, 3, "row count");
  expect_eq(schema.fields.size(), 5, "five top-level fields");
  const auto* name = find_field(schema, "name");
  expect_true(name && name->type == "string" && !name->nullable, "name is string");
  expect_true(name && name->sample_values.size() == 3, "three samples");
  const auto* visible = find_field(schema, "visible");
  expect_true(visible && visible->type == "boolean", "visible is boolean");
  expect_true(visible && visible->sample_values.size() == 2, "samples are distinct");
  const auto* stats = find_field(schema, "stats");
  expect_true(stats && stats->type == "object" && stats->nullable, "stats is nullable object");
  const auto* location = find_field(schema, "location");
  expect_true(location && location->type == "array[float]", "location element type");
}

void test_describe_mixed_and_null() {
  auto provider = sceneql::MemoryTableProvider::from_json_text(
      R"({"t": [{"a": 1, "b": null}, {"a": "x", "b": null}, {"a": 2.5}]})");
  auto schema = sceneql::describe_table(provider, "T");
  expect_str_eq(schema.table, "t", "case fallback");
  const auto* a = find_field(schema, "a");
  expect_true(a && a->type == "mixed", "mixed types");
  const auto* b = find_field(schema, "b");
  expect_true(b && b->type == "null" && b->nullable, "all-null field");
}

void test_describe_unknown_table() {
  auto provider = make_scene_provider();
  bool threw = false;
  try {
    sceneql::describe_table(provider, "cameras");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "Unknown table: 'cameras'. Available tables: materials, objects, tables";
  }
  expect_true(threw, "unknown table listed");
}

void test_count_tables_and_schema_rows() {
  auto provider = make_scene_provider();
  auto counts = sceneql::count_tables(provider);
  expect_eq(counts.counts.size(), 3, "materials, objects, tables");
  expect_eq(counts.total_rows, 2 + 3 + 2, "total rows include meta table");
  expect_true(counts.errors.empty(), "no errors");
  auto rows = sceneql::schema_rows(sceneql::describe_table(provider, "materials"));
  expect_eq(rows.size(), 2, "one row per field");
  if (!rows.empty()) {
    std::vector<std::string> keys = rows[0].keys();
    expect_true(keys.size() == 4 && keys[0] == "field" && keys[3] == "samples", "schema row columns");
  }
}

}  // namespace

void register_schema_tests(std::vector<TestCase>& tests) {
  tests.push_back({"list_available_fields", test_list_available_fields});
  tests.push_back({"describe_table_types", test_describe_table_types});
  tests.push_back({"describe_mixed_and_null", test_describe_mixed_and_null});
  tests.push_back({"describe_unknown_table", test_describe_unknown_table});
  tests.push_back({"count_tables_and_schema_rows", test_count_tables_and_schema_rows});
}
