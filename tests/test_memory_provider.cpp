#include "test_harness.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "io.h"
#include "sceneql/table_provider.h"
#include "test_utils.h"

namespace {

std::string load_error(const std::string& text) {
  try {
    sceneql::MemoryTableProvider::from_json_text(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return "";
}

void test_from_json_text_tables() {
  auto provider = make_scene_provider();
  expect_true(provider.has_table("objects"), "objects table");
  expect_true(provider.has_table("materials"), "materials table");
  expect_true(provider.has_table("tables"), "meta table");
  expect_true(!provider.has_table("cameras"), "unknown table");
  expect_eq(provider.get_table_names().size(), 3, "names include meta table");
  auto rows = provider.get_rows("objects");
  expect_eq(rows.size(), 3, "objects rows");
  expect_true(rows[0].keys()[0] == "name", "row keys keep document order");
}

void test_from_json_text_errors() {
  expect_true(load_error("{not json").rfind("Invalid JSON input: ", 0) == 0, "parse error prefixed");
  expect_str_eq(load_error("[1, 2]"), "JSON input must be an object mapping table names to row arrays",
                "top level must be object");
  expect_str_eq(load_error(R"({"t": {"a": 1}})"), "Table 't' must be an array of objects", "table must be array");
  expect_str_eq(load_error(R"({"t": [{"a": 1}, 5]})"), "Row 1 of table 't' is not an object", "row must be object");
}

void test_add_table_shadows_meta() {
  sceneql::MemoryTableProvider provider;
  provider.add_table("lights", rows_from_json(R"([{"name": "Sun"}])"));
  expect_eq(provider.get_rows("tables").size(), 1, "meta table lists one table");
  provider.add_table("tables", rows_from_json(R"([{"custom": true}, {"custom": false}])"));
  auto rows = provider.get_rows("tables");
  expect_eq(rows.size(), 2, "real table named tables wins");
  expect_true(rows[0].contains("custom"), "custom rows served");
}

void test_get_rows_unknown_throws() {
  sceneql::MemoryTableProvider provider;
  bool threw = false;
  try {
    provider.get_rows("nope");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "No such table: nope";
  }
  expect_true(threw, "unknown table throws");
}

void test_load_from_file() {
  auto path = std::filesystem::temp_directory_path() / "sceneql_provider_test.json";
  {
    std::ofstream out(path);
    out << R"({"cameras": [{"name": "Cam", "lens": 50}]})";
  }
  auto provider = sceneql::MemoryTableProvider::load_from_file(path.string());
  std::filesystem::remove(path);
  expect_eq(provider.get_rows("cameras").size(), 1, "rows loaded from file");
  bool threw = false;
  try {
    sceneql::MemoryTableProvider::load_from_file(path.string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Failed to open file: ", 0) == 0;
  }
  expect_true(threw, "missing file reported");
}

void test_is_url() {
  expect_true(sceneql::io::is_url("http://localhost:8000/scene.json"), "http url");
  expect_true(sceneql::io::is_url("HTTPS://example.com/x"), "https url, any case");
  expect_true(!sceneql::io::is_url("scene.json"), "plain path");
}

}  // namespace

void register_memory_provider_tests(std::vector<TestCase>& tests) {
  tests.push_back({"from_json_text_tables", test_from_json_text_tables});
  tests.push_back({"from_json_text_errors", test_from_json_text_errors});
  tests.push_back({"add_table_shadows_meta", test_add_table_shadows_meta});
  tests.push_back({"get_rows_unknown_throws", test_get_rows_unknown_throws});
  tests.push_back({"load_from_file", test_load_from_file});
  tests.push_back({"is_url", test_is_url});
}
