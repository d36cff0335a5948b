#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli_args.h"
#include "cli_utils.h"
#include "export/export_sinks.h"
#include "io.h"
#include "sceneql/formatters.h"
#include "sceneql/json.h"
#include "sceneql/sceneql.h"
#include "sceneql/version.h"
#include "script_runner.h"

using namespace sceneql::cli;

namespace {

sceneql::MemoryTableProvider load_provider(const CliOptions& options) {
  if (options.input.empty()) {
    return sceneql::MemoryTableProvider::from_json_text(sceneql::io::read_stream(std::cin));
  }
  if (sceneql::io::is_url(options.input)) {
    return sceneql::MemoryTableProvider::load_from_url(options.input, options.timeout_ms);
  }
  return sceneql::MemoryTableProvider::load_from_file(options.input);
}

std::vector<sceneql::Row> rows_of(const sceneql::QueryResponse& response) {
  std::vector<sceneql::Row> rows;
  if (!response.data.has_value() || !response.data->is_sequence()) return rows;
  for (const auto& item : response.data->as_sequence()) {
    if (item.is_map()) rows.push_back(item.as_map());
  }
  return rows;
}

void print_rows(const std::vector<sceneql::Row>& rows, sceneql::OutputFormat format) {
  sceneql::Value rendered = sceneql::format_rows(rows, format);
  if (format == sceneql::OutputFormat::Json) {
    std::cout << sceneql::value_to_json(rendered).dump(2) << std::endl;
  } else {
    std::cout << rendered.as_string();
    if (format == sceneql::OutputFormat::Table) std::cout << std::endl;
  }
}

int lint_main(const CliOptions& options) {
  std::vector<std::string> problems;
  if (!options.query_file.empty()) {
    std::string script;
    try {
      script = sceneql::io::read_file(options.query_file);
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
    ScriptSplitResult split = split_sql_script(script);
    if (split.error_message.has_value()) {
      auto [line, col] = line_col_from_offset(script, split.error_position);
      problems.push_back(*split.error_message + " at line " + std::to_string(line) + ", column " +
                         std::to_string(col));
    } else {
      const size_t total = split.statements.size();
      for (size_t i = 0; i < total; ++i) {
        if (auto error = sceneql::lint_query(split.statements[i].text)) {
          problems.push_back("statement " + std::to_string(i + 1) + "/" + std::to_string(total) +
                             ": " + *error);
        }
      }
    }
  } else {
    if (options.query.empty()) {
      std::cerr << "Missing query for --lint (use --lint \"...\" or --query/--query-file)\n";
      return 2;
    }
    if (auto error = sceneql::lint_query(options.query)) problems.push_back(*error);
  }

  if (problems.empty()) {
    std::cout << "No diagnostics." << std::endl;
    return 0;
  }
  for (const auto& problem : problems) {
    std::cout << "Error: " << problem << std::endl;
  }
  return 1;
}

}  // namespace

/// Entry point that parses CLI options and dispatches to lint, schema, query or script modes.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "sceneql " << sceneql::version_string() << std::endl;
    return 0;
  }
  if (options.lint) {
    return lint_main(options);
  }

  const sceneql::OutputFormat format = *sceneql::parse_output_format(options.format);
  std::optional<sceneql::MemoryTableProvider> provider;
  try {
    provider = load_provider(options);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }

  try {
    if (options.list_tables) {
      sceneql::TableCounts counts = sceneql::count_tables(*provider);
      std::vector<sceneql::Row> rows;
      for (const auto& entry : counts.counts) {
        sceneql::Row row;
        row.set("table", sceneql::Value::string(entry.first));
        row.set("row_count", sceneql::Value::integer(static_cast<int64_t>(entry.second)));
        rows.push_back(std::move(row));
      }
      print_rows(rows, format);
      for (const auto& error : counts.errors) {
        std::cerr << "Warning: " << error << std::endl;
      }
      return counts.errors.empty() ? 0 : 1;
    }

    if (!options.describe.empty()) {
      sceneql::TableSchema schema = sceneql::describe_table(*provider, options.describe);
      print_rows(sceneql::schema_rows(schema), format);
      if (format == sceneql::OutputFormat::Table) {
        std::cout << "Rows: " << schema.row_count << std::endl;
      }
      return 0;
    }

    auto execute_and_render = [&](const std::string& statement) {
      // WHY: exports need structured rows, so the engine formats as JSON and the sink renders.
      const std::string engine_format = options.output.empty() ? options.format : "json";
      sceneql::QueryResponse response =
          sceneql::execute_query(statement, options.limit, engine_format, *provider);
      if (!response.ok()) {
        throw std::runtime_error(response.error);
      }
      if (!options.output.empty()) {
        std::string export_error;
        if (!export_rows(rows_of(response), options.output, export_error)) {
          throw std::runtime_error(export_error);
        }
        std::cout << "Wrote " << export_kind_label(export_kind_from_path(options.output)) << ": "
                  << options.output << std::endl;
        return;
      }
      switch (format) {
        case sceneql::OutputFormat::Json:
          std::cout << sceneql::response_to_json(response).dump(2) << std::endl;
          break;
        case sceneql::OutputFormat::Csv:
          std::cout << response.data->as_string();
          break;
        case sceneql::OutputFormat::Table:
          std::cout << response.data->as_string() << std::endl;
          std::cout << "Rows: " << response.count << std::endl;
          break;
      }
    };

    if (!options.query_file.empty()) {
      std::string script;
      try {
        script = sceneql::io::read_file(options.query_file);
      } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 2;
      }
      if (!is_valid_utf8(script)) {
        std::cerr << "Error: query file is not valid UTF-8: " << options.query_file << std::endl;
        return 2;
      }
      ScriptRunOptions script_options;
      script_options.continue_on_error = options.continue_on_error;
      script_options.quiet = options.quiet;
      return run_sql_script(script, script_options, execute_and_render, std::cout, std::cerr);
    }

    if (options.query.empty()) {
      std::cerr << "Missing --query or --query-file\n";
      return 2;
    }
    execute_and_render(options.query);
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 1;
  }
}
