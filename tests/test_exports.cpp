#include "test_harness.h"
#include "test_utils.h"

#include <filesystem>
#include <string>
#include <vector>

#include "export/export_sinks.h"
#include "io.h"

namespace {

std::string write_and_read(const std::vector<sceneql::Row>& rows, const std::string& file_name) {
  auto path = std::filesystem::temp_directory_path() / file_name;
  std::string error;
  bool ok = sceneql::cli::export_rows(rows, path.string(), error);
  expect_true(ok, "export ok for " + file_name);
  expect_true(error.empty(), "export no error for " + file_name);
  std::string content = ok ? sceneql::io::read_file(path.string()) : "";
  std::filesystem::remove(path);
  return content;
}

void test_export_kind_from_path() {
  expect_true(sceneql::cli::export_kind_from_path("out.CSV") == sceneql::cli::ExportKind::Csv, "csv any case");
  expect_true(sceneql::cli::export_kind_from_path("out.ndjson") == sceneql::cli::ExportKind::Ndjson, "ndjson");
  expect_true(sceneql::cli::export_kind_from_path("out.json") == sceneql::cli::ExportKind::Json, "json");
  expect_true(sceneql::cli::export_kind_from_path("out.parquet") == sceneql::cli::ExportKind::Parquet, "parquet");
  expect_true(sceneql::cli::export_kind_from_path("out.txt") == sceneql::cli::ExportKind::None, "unknown");
  expect_true(std::string(sceneql::cli::export_kind_label(sceneql::cli::ExportKind::Ndjson)) == "NDJSON",
              "label");
}

void test_csv_escaping() {
  auto rows = rows_from_json(R"([{"col1": "a,b", "col2": "He said \"hi\""},
                                 {"col1": "line1\nline2", "col2": "plain"}])");
  std::string expected =
      "col1,col2\n"
      "\"a,b\",\"He said \"\"hi\"\"\"\n"
      "\"line1\nline2\",plain\n";
  expect_str_eq(write_and_read(rows, "sceneql_csv_escape_test.csv"), expected, "csv escaping content");
}

void test_csv_export_uses_column_union() {
  auto rows = rows_from_json(R"([{"name": "A", "v": 1.5}, {"name": "B", "extra": null, "v": 2}])");
  std::string expected =
      "name,v,extra\n"
      "A,1.5,\n"
      "B,2,\n";
  expect_str_eq(write_and_read(rows, "sceneql_csv_union_test.csv"), expected, "later columns appended");
}

void test_json_and_ndjson_export() {
  auto rows = rows_from_json(R"([{"name": "A", "stats": {"verts": 8}}, {"name": "B", "stats": null}])");
  expect_str_eq(write_and_read(rows, "sceneql_json_test.json"),
                "[{\"name\":\"A\",\"stats\":{\"verts\":8}},{\"name\":\"B\",\"stats\":null}]\n", "json array");
  expect_str_eq(write_and_read(rows, "sceneql_ndjson_test.ndjson"),
                "{\"name\":\"A\",\"stats\":{\"verts\":8}}\n{\"name\":\"B\",\"stats\":null}\n", "ndjson lines");
  expect_str_eq(write_and_read({}, "sceneql_empty_test.json"), "[]\n", "empty json array");
}

void test_unsupported_extension() {
  std::string error;
  bool ok = sceneql::cli::export_rows(rows_from_json(R"([{"a": 1}])"), "result.txt", error);
  expect_true(!ok, "unsupported extension rejected");
  expect_true(error.find("Unsupported export file extension") != std::string::npos, "clear error");
}

void test_engine_rows_export() {
  auto response = run_scene_query("SELECT name, stats.verts AS verts FROM objects WHERE type = 'MESH'");
  std::string expected =
      "name,verts\n"
      "A,8\n"
      "B,24\n";
  expect_str_eq(write_and_read(response_rows(response), "sceneql_engine_export.csv"), expected,
                "query result exported");
}

#ifdef SCENEQL_USE_ARROW
void test_parquet_export_smoke() {
  auto path = std::filesystem::temp_directory_path() / "sceneql_parquet_smoke.parquet";
  std::string error;
  bool ok = sceneql::cli::write_parquet(rows_from_json(R"([{"name": "A"}])"), path.string(), error);
  expect_true(ok, "parquet export ok");
  expect_true(std::filesystem::exists(path), "parquet file written");
  std::filesystem::remove(path);
}
#else
void test_parquet_requires_arrow() {
  std::string error;
  bool ok = sceneql::cli::write_parquet(rows_from_json(R"([{"name": "A"}])"), "unused.parquet", error);
  expect_true(!ok, "parquet unavailable without arrow");
  expect_str_eq(error, "Parquet export requires Apache Arrow feature", "arrow error text");
}
#endif

}  // namespace

void register_export_tests(std::vector<TestCase>& tests) {
  tests.push_back({"export_kind_from_path", test_export_kind_from_path});
  tests.push_back({"export_csv_escaping", test_csv_escaping});
  tests.push_back({"csv_export_uses_column_union", test_csv_export_uses_column_union});
  tests.push_back({"json_and_ndjson_export", test_json_and_ndjson_export});
  tests.push_back({"unsupported_extension", test_unsupported_extension});
  tests.push_back({"engine_rows_export", test_engine_rows_export});
#ifdef SCENEQL_USE_ARROW
  tests.push_back({"parquet_export_smoke", test_parquet_export_smoke});
#else
  tests.push_back({"parquet_requires_arrow", test_parquet_requires_arrow});
#endif
}
