#include "script_runner.h"

#include <cctype>
#include <exception>

#include "cli_utils.h"
#include "sceneql/sceneql.h"

namespace sceneql::cli {

namespace {

bool is_blank(const std::string& text) {
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

ScriptSplitResult split_sql_script(const std::string& script) {
  ScriptSplitResult out;
  std::string current;
  size_t statement_start = 0;
  bool has_content = false;

  auto flush = [&]() {
    if (has_content && !is_blank(current)) {
      out.statements.push_back(ScriptStatement{current, statement_start});
    }
    current.clear();
    has_content = false;
  };

  size_t i = 0;
  while (i < script.size()) {
    char c = script[i];
    if (c == '\'' || c == '"') {
      size_t quote_start = i;
      if (!has_content) {
        has_content = true;
        statement_start = i;
      }
      current.push_back(c);
      ++i;
      bool closed = false;
      while (i < script.size()) {
        current.push_back(script[i]);
        if (script[i] == c) {
          if (i + 1 < script.size() && script[i + 1] == c) {
            current.push_back(c);
            i += 2;
            continue;
          }
          ++i;
          closed = true;
          break;
        }
        ++i;
      }
      if (!closed) {
        out.statements.clear();
        out.error_message = "Unterminated string literal";
        out.error_position = quote_start;
        return out;
      }
      continue;
    }
    if (c == '-' && i + 1 < script.size() && script[i + 1] == '-') {
      while (i < script.size() && script[i] != '\n') ++i;
      current.push_back(' ');
      continue;
    }
    if (c == '/' && i + 1 < script.size() && script[i + 1] == '*') {
      size_t end = script.find("*/", i + 2);
      if (end == std::string::npos) {
        out.statements.clear();
        out.error_message = "Unterminated block comment";
        out.error_position = i;
        return out;
      }
      i = end + 2;
      current.push_back(' ');
      continue;
    }
    if (c == ';') {
      flush();
      ++i;
      continue;
    }
    if (!has_content && !std::isspace(static_cast<unsigned char>(c))) {
      has_content = true;
      statement_start = i;
    }
    current.push_back(c);
    ++i;
  }
  flush();
  return out;
}

int run_sql_script(const std::string& script,
                   const ScriptRunOptions& options,
                   const ScriptExecutor& execute_statement,
                   std::ostream& out,
                   std::ostream& err) {
  ScriptSplitResult split = split_sql_script(script);
  if (split.error_message.has_value()) {
    auto [line, col] = line_col_from_offset(script, split.error_position);
    err << "Error: " << *split.error_message << " at line " << line << ", column " << col << "\n";
    return 1;
  }
  if (split.statements.empty()) {
    return 0;
  }

  bool had_error = false;
  const size_t total = split.statements.size();
  for (size_t i = 0; i < total; ++i) {
    const ScriptStatement& statement = split.statements[i];
    const size_t statement_index = i + 1;
    if (!options.quiet) {
      out << "== stmt " << statement_index << "/" << total << " ==\n";
    }

    auto [line, col] = line_col_from_offset(script, statement.start_pos);
    if (auto syntax_error = lint_query(statement.text)) {
      err << "Error: statement " << statement_index << "/" << total << " at line " << line
          << ", column " << col << "\n";
      err << *syntax_error << "\n";
      had_error = true;
      if (!options.continue_on_error) return 1;
      continue;
    }

    try {
      execute_statement(statement.text);
    } catch (const std::exception& ex) {
      err << "Error: statement " << statement_index << "/" << total << " at line " << line
          << ", column " << col << "\n";
      err << ex.what() << "\n";
      had_error = true;
      if (!options.continue_on_error) return 1;
    }
  }

  return had_error ? 1 : 0;
}

}  // namespace sceneql::cli
