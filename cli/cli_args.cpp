#include "cli_args.h"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

#include "sceneql/formatters.h"

namespace sceneql::cli {

namespace {

std::optional<long long> parse_integer(const std::string& text) {
  if (text.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) return std::nullopt;
  return value;
}

}  // namespace

void print_startup_help(std::ostream& os) {
  os << "sceneql - SQL queries over structured table data\n\n";
  os << "Usage:\n";
  os << "  sceneql --query <query> [--input <path|url>] [--format json|csv|table]\n";
  os << "  sceneql --query-file <file> [--input <path|url>]\n";
  os << "          [--continue-on-error] [--quiet]\n";
  os << "  sceneql --lint \"<query>\"\n";
  os << "  sceneql --tables [--input <path|url>]\n";
  os << "  sceneql --describe <table> [--input <path|url>]\n";
  os << "  sceneql --version\n\n";
  os << "Notes:\n";
  os << "  - Input is a JSON object mapping table names to arrays of objects.\n";
  os << "  - If --input is omitted, JSON is read from stdin.\n";
  os << "  - URLs are supported when libcurl is available.\n";
  os << "  - Exit codes: 0=success, 1=query/runtime error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  sceneql --query \"SELECT type, COUNT(*) FROM objects GROUP BY type\" --input scene.json\n";
  os << "  sceneql --query \"SELECT name FROM objects WHERE type = 'MESH' ORDER BY name\" --format csv\n";
  os << "  sceneql --lint \"SELECT FROM objects\"\n";
}

void print_help(std::ostream& os) {
  os << "Usage: sceneql --query <query> [--input <path|url>]\n";
  os << "       sceneql --query-file <file> [--input <path|url>]\n";
  os << "               [--continue-on-error] [--quiet]\n";
  os << "       sceneql --lint [\"<query>\"]\n";
  os << "       sceneql --tables | --describe <table>\n";
  os << "Options:\n";
  os << "  --format json|csv|table   output format (default: table)\n";
  os << "  --limit <n>               keep at most n rows (0 keeps all)\n";
  os << "  --output <file>           export rows; .csv, .json, .ndjson or .parquet\n";
  os << "  --timeout-ms <n>          timeout for URL inputs (default: 5000)\n";
  os << "  --version                 print version and exit\n";
  os << "If --input is omitted, JSON is read from stdin.\n";
  os << "Scripts support SQL comments: -- ... and /* ... */; statements end with ';'.\n";
  os << "Exit codes: 0=success, 1=query/runtime error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  auto take_value = [&](int& i, const std::string& flag, std::string& out) {
    if (i + 1 >= argc) {
      error = "Missing value for " + flag;
      return false;
    }
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--query") {
      if (!take_value(i, arg, parsed.query)) return false;
    } else if (arg == "--query-file") {
      if (!take_value(i, arg, parsed.query_file)) return false;
    } else if (arg == "--input") {
      if (!take_value(i, arg, parsed.input)) return false;
    } else if (arg == "--format") {
      if (!take_value(i, arg, parsed.format)) return false;
    } else if (arg == "--output") {
      if (!take_value(i, arg, parsed.output)) return false;
    } else if (arg == "--describe") {
      if (!take_value(i, arg, parsed.describe)) return false;
    } else if (arg == "--limit") {
      std::string value;
      if (!take_value(i, arg, value)) return false;
      auto limit = parse_integer(value);
      if (!limit.has_value() || *limit < 0) {
        error = "Invalid --limit value (use a non-negative integer)";
        return false;
      }
      parsed.limit = static_cast<int64_t>(*limit);
    } else if (arg == "--timeout-ms") {
      std::string value;
      if (!take_value(i, arg, value)) return false;
      auto timeout = parse_integer(value);
      if (!timeout.has_value() || *timeout <= 0 || *timeout > 3600000) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
      parsed.timeout_ms = static_cast<int>(*timeout);
    } else if (arg == "--lint") {
      parsed.lint = true;
      if (i + 1 < argc) {
        std::string maybe_query = argv[i + 1];
        if (!maybe_query.empty() && maybe_query[0] != '-') {
          parsed.query = maybe_query;
          ++i;
        }
      }
    } else if (arg == "--tables") {
      parsed.list_tables = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (arg == "--continue-on-error") {
      parsed.continue_on_error = true;
    } else if (arg == "--quiet") {
      parsed.quiet = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }

  if (!parse_output_format(parsed.format).has_value()) {
    error = "Invalid --format value (use json|csv|table)";
    return false;
  }
  if (!parsed.query.empty() && !parsed.query_file.empty()) {
    error = "--query and --query-file are mutually exclusive";
    return false;
  }
  if (parsed.list_tables && !parsed.describe.empty()) {
    error = "--tables and --describe are mutually exclusive";
    return false;
  }
  if (parsed.lint && (parsed.list_tables || !parsed.describe.empty())) {
    error = "--lint cannot be combined with --tables or --describe";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace sceneql::cli
