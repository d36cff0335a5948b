#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sceneql::cli {

struct ScriptStatement {
  /// Statement text with comments replaced by spaces and the terminator removed.
  std::string text;
  size_t start_pos = 0;
};

struct ScriptSplitResult {
  std::vector<ScriptStatement> statements;
  std::optional<std::string> error_message;
  size_t error_position = 0;
};

struct ScriptRunOptions {
  bool continue_on_error = false;
  bool quiet = false;
};

/// Runs one statement; MUST throw std::exception subclasses on failure.
using ScriptExecutor = std::function<void(const std::string&)>;

/// Splits an SQL script into executable statements on ';' outside quotes and comments.
/// MUST ignore empty statements and preserve statement start offsets.
ScriptSplitResult split_sql_script(const std::string& script);
/// Executes script statements sequentially, checking syntax before each one.
/// MUST stop on first error unless continue_on_error is enabled.
int run_sql_script(const std::string& script,
                   const ScriptRunOptions& options,
                   const ScriptExecutor& execute_statement,
                   std::ostream& out,
                   std::ostream& err);

}  // namespace sceneql::cli
