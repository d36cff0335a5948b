#include "sceneql/sceneql.h"

#include <algorithm>
#include <exception>

#include "../../query_parser.h"
#include "../../util/string_util.h"
#include "../executor.h"
#include "sceneql/formatters.h"

namespace sceneql {

namespace {

/// Rows inspected when checking that selected fields exist.
constexpr size_t kFieldCheckRows = 5;
/// Field names listed in an unknown-field error before truncation.
constexpr size_t kMaxListedFields = 20;

QueryResponse error_response(const std::string& format, const std::string& message) {
  QueryResponse response;
  response.status = QueryResponse::Status::Error;
  response.format = format;
  response.error = message;
  return response;
}

/// Runs one pipeline stage; a thrown exception becomes `prefix + what()` in `error`.
template <typename Fn>
bool run_stage(const std::string& prefix, std::string& error, Fn&& fn) {
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    error = prefix + e.what();
    return false;
  }
}

std::optional<std::string> resolve_table(const TableProvider& provider, const std::string& name) {
  if (provider.has_table(name)) return name;
  std::string lowered = util::to_lower(name);
  if (lowered != name && provider.has_table(lowered)) return lowered;
  return std::nullopt;
}

bool field_in_sample(const std::string& field, const std::vector<Row>& rows) {
  size_t limit = std::min(rows.size(), kFieldCheckRows);
  std::vector<std::string> path = split_path(field);
  for (size_t i = 0; i < limit; ++i) {
    if (resolve_path(rows[i], path).has_value()) return true;
  }
  return false;
}

bool is_aggregate_alias(const ParsedQuery& query, const std::string& name) {
  for (const auto& spec : query.aggregates) {
    if (spec.alias == name) return true;
  }
  return false;
}

/// Returns an error message for the first selected field absent from the sampled rows.
std::optional<std::string> find_missing_field(const ParsedQuery& query,
                                              const std::string& table,
                                              const std::vector<Row>& rows) {
  if (rows.empty() || query.select_all()) return std::nullopt;
  for (const auto& field : query.fields) {
    if (is_aggregate_alias(query, field) || query.aliases.count(field) > 0) continue;
    if (field_in_sample(field, rows)) continue;
    std::vector<std::string> available = list_available_fields(rows);
    if (available.size() > kMaxListedFields) {
      available.resize(kMaxListedFields);
      available.push_back("...");
    }
    return "Field '" + field + "' not found in table '" + table +
           "'. Available fields: " + util::join(available, ", ");
  }
  return std::nullopt;
}

/// Maps ORDER BY names onto the columns present at sort time.
std::vector<OrderItem> resolve_order_fields(const ParsedQuery& query) {
  std::vector<OrderItem> out = query.order_by;
  for (auto& item : out) {
    if (is_aggregate_alias(query, item.field)) continue;
    auto alias = query.aliases.find(item.field);
    if (alias != query.aliases.end()) item.field = alias->second;
  }
  return out;
}

/// Fields DISTINCT compares, with SELECT aliases replaced by their source paths.
std::vector<std::string> distinct_fields(const ParsedQuery& query) {
  std::vector<std::string> out;
  out.reserve(query.fields.size());
  for (const auto& field : query.fields) {
    auto alias = query.aliases.find(field);
    bool source = alias != query.aliases.end() && !is_aggregate_alias(query, field);
    out.push_back(source ? alias->second : field);
  }
  return out;
}

std::optional<size_t> effective_limit(const ParsedQuery& query, int64_t caller_limit) {
  std::optional<size_t> limit;
  if (query.limit.has_value() && *query.limit >= 0) {
    limit = static_cast<size_t>(*query.limit);
  }
  if (caller_limit > 0) {
    size_t caller = static_cast<size_t>(caller_limit);
    limit = limit.has_value() ? std::min(*limit, caller) : caller;
  }
  return limit;
}

}  // namespace

QueryResponse execute_query(const std::string& query,
                            int64_t limit,
                            const std::string& format,
                            const TableProvider& provider) {
  std::optional<OutputFormat> output_format = parse_output_format(format);
  if (!output_format.has_value()) {
    return error_response(format, "Unknown format: " + format +
                                      ". Available formats: " + util::join(supported_formats(), ", "));
  }
  std::string format_name = util::to_lower(util::trim_ws(format));

  ParseResult parsed = parse_query(query);
  if (parsed.error.has_value()) {
    return error_response(format_name, "Query syntax error: " + describe_parse_error(*parsed.error));
  }
  const ParsedQuery& q = *parsed.query;

  std::optional<std::string> table = resolve_table(provider, q.table);
  if (!table.has_value()) {
    std::vector<std::string> names;
    for (const auto& name : provider.get_table_names()) names.push_back(name);
    return error_response(format_name, "Unknown table: '" + q.table +
                                           "'. Available tables: " + util::join(names, ", "));
  }

  std::vector<Row> rows;
  std::string error;
  if (!run_stage("Error loading data from table '" + *table + "': ", error,
                 [&] { rows = provider.get_rows(*table); })) {
    return error_response(format_name, error);
  }

  if (auto missing = find_missing_field(q, *table, rows)) {
    return error_response(format_name, *missing);
  }

  if (!run_stage("WHERE clause error: ", error, [&] { rows = filter_rows(rows, q.where); })) {
    return error_response(format_name, error);
  }

  if (!q.group_by.empty()) {
    if (!run_stage("GROUP BY error: ", error,
                   [&] { rows = group_rows(rows, q.group_by, q.aggregates); })) {
      return error_response(format_name, error);
    }
  } else if (q.has_aggregates()) {
    if (!run_stage("Aggregate error: ", error, [&] { rows = aggregate_rows(rows, q.aggregates); })) {
      return error_response(format_name, error);
    }
  }

  if (q.distinct && q.group_by.empty()) {
    if (!run_stage("DISTINCT error: ", error,
                   [&] { rows = distinct_rows(rows, distinct_fields(q)); })) {
      return error_response(format_name, error);
    }
  }

  if (!q.order_by.empty()) {
    if (!run_stage("ORDER BY error: ", error,
                   [&] { rows = order_rows(rows, resolve_order_fields(q)); })) {
      return error_response(format_name, error);
    }
  }

  if (auto n = effective_limit(q, limit)) {
    rows = limit_rows(std::move(rows), *n);
  }

  if (!q.select_all() && !q.has_aggregates()) {
    if (!run_stage("Projection error: ", error,
                   [&] { rows = project_rows(rows, q.fields, q.aliases); })) {
      return error_response(format_name, error);
    }
  }

  QueryResponse response;
  if (!run_stage("Formatting error: ", error,
                 [&] { response.data = format_rows(rows, *output_format); })) {
    return error_response(format_name, error);
  }
  response.status = QueryResponse::Status::Success;
  response.format = format_name;
  response.count = rows.size();
  return response;
}

std::optional<std::string> lint_query(const std::string& query) {
  ParseResult parsed = parse_query(query);
  if (!parsed.error.has_value()) return std::nullopt;
  return describe_parse_error(*parsed.error);
}

}  // namespace sceneql
