#include "test_harness.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_utils.h"
#include "script_runner.h"

namespace {

void test_split_script_ignores_empty_statements() {
  auto split = sceneql::cli::split_sql_script(";; SELECT name FROM objects; ; SELECT type FROM objects;;");
  expect_true(!split.error_message.has_value(), "split script has no lexer error");
  expect_eq(split.statements.size(), 2, "empty statements are ignored");
}

void test_split_script_with_comments() {
  std::string script =
      "-- leading\n"
      "SELECT name FROM objects;\n"
      "/* block */\n"
      "SELECT type FROM objects;";
  auto split = sceneql::cli::split_sql_script(script);
  expect_true(!split.error_message.has_value(), "split with comments has no lexer error");
  expect_eq(split.statements.size(), 2, "comments between statements are ignored");
  if (split.statements.size() == 2) {
    expect_eq(split.statements[0].start_pos, script.find("SELECT name"), "first statement offset");
  }
}

void test_split_script_unterminated_block_comment() {
  auto split = sceneql::cli::split_sql_script("SELECT name FROM objects; /* not closed");
  expect_true(split.error_message.has_value(), "unterminated block comment reports split error");
  if (split.error_message.has_value()) {
    expect_true(*split.error_message == "Unterminated block comment", "split error message is deterministic");
    expect_eq(split.error_position, 26, "error points at comment start");
  }
}

void test_split_script_unterminated_string() {
  auto split = sceneql::cli::split_sql_script("SELECT name FROM objects WHERE name = 'abc");
  expect_true(split.error_message.has_value() && *split.error_message == "Unterminated string literal",
              "unterminated string reported");
}

void test_split_script_markers_inside_string_literals() {
  std::string script =
      "SELECT name FROM objects WHERE name = 'a;--b/*c*/';\n"
      "SELECT type FROM objects;";
  auto split = sceneql::cli::split_sql_script(script);
  expect_true(!split.error_message.has_value(), "split handles markers in string literals");
  expect_eq(split.statements.size(), 2, "string literal markers do not break statement boundaries");
  if (!split.statements.empty()) {
    expect_true(split.statements[0].text.find("'a;--b/*c*/'") != std::string::npos, "literal kept intact");
  }
}

void test_run_script_executes_each_statement() {
  std::vector<std::string> executed;
  std::ostringstream out;
  std::ostringstream err;
  int code = sceneql::cli::run_sql_script(
      "SELECT name FROM objects;\nSELECT type FROM objects;", {},
      [&](const std::string& statement) { executed.push_back(statement); }, out, err);
  expect_eq(static_cast<size_t>(code), 0, "script succeeds");
  expect_eq(executed.size(), 2, "both statements executed");
  expect_true(out.str().find("== stmt 1/2 ==") != std::string::npos, "progress header printed");
  expect_true(err.str().empty(), "no errors");
}

void test_run_script_stops_on_syntax_error() {
  std::vector<std::string> executed;
  std::ostringstream out;
  std::ostringstream err;
  int code = sceneql::cli::run_sql_script(
      "SELECT name FROM objects;\nSELECT FROM objects;\nSELECT type FROM objects;", {},
      [&](const std::string& statement) { executed.push_back(statement); }, out, err);
  expect_eq(static_cast<size_t>(code), 1, "script fails");
  expect_eq(executed.size(), 1, "stopped after syntax error");
  expect_true(err.str().find("Error: statement 2/3 at line 2, column 1") != std::string::npos,
              "error location reported");
  expect_true(err.str().find("SELECT clause error: Empty SELECT clause") != std::string::npos,
              "syntax message reported");
}

void test_run_script_continue_on_error() {
  std::vector<std::string> executed;
  std::ostringstream out;
  std::ostringstream err;
  sceneql::cli::ScriptRunOptions options;
  options.continue_on_error = true;
  options.quiet = true;
  int code = sceneql::cli::run_sql_script(
      "SELECT a FROM t; SELECT b FROM t; SELECT c FROM t;", options,
      [&](const std::string& statement) {
        executed.push_back(statement);
        if (statement.find(" b ") != std::string::npos) throw std::runtime_error("boom");
      },
      out, err);
  expect_eq(static_cast<size_t>(code), 1, "error still reported in exit code");
  expect_eq(executed.size(), 3, "all statements attempted");
  expect_true(out.str().empty(), "quiet suppresses headers");
  expect_true(err.str().find("boom") != std::string::npos, "runtime error reported");
}

}  // namespace

void register_script_runner_tests(std::vector<TestCase>& tests) {
  tests.push_back({"split_script_ignores_empty_statements", test_split_script_ignores_empty_statements});
  tests.push_back({"split_script_with_comments", test_split_script_with_comments});
  tests.push_back({"split_script_unterminated_block_comment", test_split_script_unterminated_block_comment});
  tests.push_back({"split_script_unterminated_string", test_split_script_unterminated_string});
  tests.push_back({"split_script_markers_inside_string_literals", test_split_script_markers_inside_string_literals});
  tests.push_back({"run_script_executes_each_statement", test_run_script_executes_each_statement});
  tests.push_back({"run_script_stops_on_syntax_error", test_run_script_stops_on_syntax_error});
  tests.push_back({"run_script_continue_on_error", test_run_script_continue_on_error});
}
