#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sceneql/value.h"

namespace sceneql {

enum class OutputFormat { Json, Csv, Table };

/// Case-insensitive lookup of "json", "csv" or "table".
std::optional<OutputFormat> parse_output_format(const std::string& name);
/// Lower-case format names in display order.
const std::vector<std::string>& supported_formats();

/// Text of one CSV or table cell.
/// Null is empty, floats are rounded to 6 decimals, containers are JSON text.
std::string format_cell(const Value& value);
/// Quotes a CSV field when it contains a comma, quote, CR or LF.
std::string csv_escape(const std::string& value);

/// CSV with the first row's keys as header and "\n" line endings; "" for no rows.
std::string format_csv(const std::vector<Row>& rows);
/// Left-justified ASCII table joined with " | "; "No data" for no rows.
std::string format_table(const std::vector<Row>& rows);
/// Rows as a Sequence of Maps, unchanged.
Value format_json(const std::vector<Row>& rows);

/// Dispatches to the formatter for `format`: a Sequence for JSON, a String otherwise.
Value format_rows(const std::vector<Row>& rows, OutputFormat format);

}  // namespace sceneql
