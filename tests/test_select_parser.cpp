#include "test_harness.h"

#include <string>
#include <vector>

#include "query_parser.h"

namespace {

std::string select_error(const std::string& body) {
  sceneql::ParsedQuery parsed;
  try {
    sceneql::parse_select(body, parsed);
  } catch (const sceneql::SyntaxError& e) {
    return e.what();
  }
  return "";
}

void test_plain_fields_and_paths() {
  sceneql::ParsedQuery parsed;
  sceneql::parse_select("name, stats.verts", parsed);
  expect_eq(parsed.fields.size(), 2, "two fields");
  expect_true(parsed.fields[1] == "stats.verts", "dotted path kept");
  expect_true(!parsed.distinct, "not distinct");
  expect_true(!parsed.has_aggregates(), "no aggregates");
}

void test_star_select() {
  sceneql::ParsedQuery parsed;
  sceneql::parse_select("*", parsed);
  expect_true(parsed.select_all(), "star selects all");
  expect_str_eq(select_error("*, name"), "Cannot combine * with other fields in SELECT clause",
                "star cannot mix with fields");
  expect_str_eq(select_error("* AS everything"), "Cannot alias * in SELECT clause", "star alias rejected");
}

void test_distinct_prefix() {
  sceneql::ParsedQuery parsed;
  sceneql::parse_select("DISTINCT type", parsed);
  expect_true(parsed.distinct, "distinct flag set");
  expect_eq(parsed.fields.size(), 1, "one distinct field");
  expect_str_eq(select_error("DISTINCT"), "Empty field list after DISTINCT", "bare DISTINCT rejected");
}

void test_aggregate_auto_alias() {
  sceneql::ParsedQuery parsed;
  sceneql::parse_select("type, count(*), sum(stats.verts)", parsed);
  expect_eq(parsed.aggregates.size(), 2, "two aggregates");
  expect_true(parsed.aggregates[0].alias == "COUNT(*)", "count alias upper-cased");
  expect_true(parsed.aggregates[0].field == "*", "count star field");
  expect_true(parsed.aggregates[1].alias == "SUM(stats.verts)", "sum alias");
  expect_true(parsed.aggregates[1].function == sceneql::AggregateFunction::Sum, "sum function");
  expect_true(parsed.fields[1] == "COUNT(*)", "aggregate alias recorded in fields");
}

void test_aliases() {
  sceneql::ParsedQuery parsed;
  sceneql::parse_select("name AS label, AVG(stats.faces) as mean_faces", parsed);
  expect_true(parsed.fields[0] == "label" && parsed.fields[1] == "mean_faces", "aliases are output names");
  expect_true(parsed.aliases["label"] == "name", "field alias source");
  expect_true(parsed.aliases["mean_faces"] == "AVG(stats.faces)", "aggregate alias source");
  expect_true(parsed.aggregates[0].alias == "mean_faces", "aggregate uses user alias");
  expect_str_eq(select_error("name AS 1bad"), "Invalid alias: 1bad", "bad alias rejected");
  expect_str_eq(select_error("name AS"), "Invalid alias in SELECT item: name AS", "dangling AS rejected");
}

void test_aggregate_errors() {
  expect_str_eq(select_error("MEDIAN(x)"), "Unsupported aggregate function: MEDIAN", "unknown function");
  expect_str_eq(select_error("SUM(*)"), "Function SUM cannot be used with *", "sum star rejected");
  expect_str_eq(select_error("MAX()"), "Missing argument for MAX", "missing argument");
  expect_str_eq(select_error("MIN(a b)"), "Invalid field name in MIN: a b", "bad argument");
  expect_str_eq(select_error("COUNT(*), count(*)"), "Duplicate column in SELECT clause: COUNT(*)",
                "duplicate aggregate");
}

void test_invalid_fields() {
  expect_str_eq(select_error(""), "Empty SELECT clause", "empty select");
  expect_str_eq(select_error("name-1"), "Invalid field name: name-1", "bad identifier");
  expect_str_eq(select_error("stats..verts"), "Invalid field name: stats..verts", "empty path segment");
  expect_str_eq(select_error(" , "), "No valid fields found in SELECT clause", "only separators");
}

}  // namespace

void register_select_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"select_plain_fields_and_paths", test_plain_fields_and_paths});
  tests.push_back({"select_star", test_star_select});
  tests.push_back({"select_distinct_prefix", test_distinct_prefix});
  tests.push_back({"select_aggregate_auto_alias", test_aggregate_auto_alias});
  tests.push_back({"select_aliases", test_aliases});
  tests.push_back({"select_aggregate_errors", test_aggregate_errors});
  tests.push_back({"select_invalid_fields", test_invalid_fields});
}
