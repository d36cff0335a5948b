#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace sceneql::cli {

/// Options collected from argv; defaults describe a plain table query over stdin.
struct CliOptions {
  std::string query;
  std::string query_file;
  std::string input;
  std::string format = "table";
  std::string output;
  std::string describe;
  int64_t limit = 0;
  int timeout_ms = 5000;
  bool list_tables = false;
  bool lint = false;
  bool continue_on_error = false;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

/// Prints the overview shown when the binary runs without arguments.
void print_startup_help(std::ostream& os);
/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false with a message for missing values, unknown flags and invalid values.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sceneql::cli
