#include "sceneql/formatters.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "../util/string_util.h"

namespace sceneql {

namespace {

std::vector<std::string> header_of(const std::vector<Row>& rows) {
  if (rows.empty()) return {};
  return rows.front().keys();
}

std::string cell_at(const Row& row, const std::string& column) {
  const Value* value = row.find(column);
  return value ? format_cell(*value) : "";
}

std::string pad_right(const std::string& text, size_t width) {
  if (text.size() >= width) return text;
  return text + std::string(width - text.size(), ' ');
}

}  // namespace

std::optional<OutputFormat> parse_output_format(const std::string& name) {
  std::string lowered = util::to_lower(util::trim_ws(name));
  if (lowered == "json") return OutputFormat::Json;
  if (lowered == "csv") return OutputFormat::Csv;
  if (lowered == "table") return OutputFormat::Table;
  return std::nullopt;
}

const std::vector<std::string>& supported_formats() {
  static const std::vector<std::string> kFormats = {"json", "csv", "table"};
  return kFormats;
}

std::string format_cell(const Value& value) {
  if (value.is_float()) {
    double d = value.as_float();
    if (!std::isfinite(d)) return format_float(d);
    double rounded = std::round(d * 1e6) / 1e6;
    return format_float(rounded);
  }
  return to_text(value);
}

std::string csv_escape(const std::string& value) {
  bool needs_quotes = false;
  for (char c : value) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      needs_quotes = true;
      break;
    }
  }
  if (!needs_quotes) return value;
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_csv(const std::vector<Row>& rows) {
  if (rows.empty()) return "";
  std::vector<std::string> header = header_of(rows);
  std::ostringstream out;
  for (size_t i = 0; i < header.size(); ++i) {
    if (i > 0) out << ",";
    out << csv_escape(header[i]);
  }
  out << "\n";
  // Keys absent from the first row are not part of the header and are dropped.
  for (const auto& row : rows) {
    for (size_t i = 0; i < header.size(); ++i) {
      if (i > 0) out << ",";
      out << csv_escape(cell_at(row, header[i]));
    }
    out << "\n";
  }
  return out.str();
}

std::string format_table(const std::vector<Row>& rows) {
  if (rows.empty()) return "No data";
  std::vector<std::string> header = header_of(rows);
  std::vector<std::vector<std::string>> cells;
  cells.reserve(rows.size());
  std::vector<size_t> widths;
  widths.reserve(header.size());
  for (const auto& column : header) widths.push_back(column.size());
  for (const auto& row : rows) {
    std::vector<std::string> line;
    line.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
      line.push_back(cell_at(row, header[i]));
      widths[i] = std::max(widths[i], line.back().size());
    }
    cells.push_back(std::move(line));
  }

  auto render_line = [&](const std::vector<std::string>& values) {
    std::string line;
    for (size_t i = 0; i < values.size(); ++i) {
      if (i > 0) line += " | ";
      line += pad_right(values[i], widths[i]);
    }
    return line;
  };

  std::string header_line = render_line(header);
  std::string out = header_line;
  out += "\n";
  out += std::string(header_line.size(), '-');
  for (const auto& line : cells) {
    out += "\n";
    out += render_line(line);
  }
  return out;
}

Value format_json(const std::vector<Row>& rows) {
  Sequence items;
  items.reserve(rows.size());
  for (const auto& row : rows) {
    items.push_back(Value::map(row));
  }
  return Value::sequence(std::move(items));
}

Value format_rows(const std::vector<Row>& rows, OutputFormat format) {
  switch (format) {
    case OutputFormat::Json:
      return format_json(rows);
    case OutputFormat::Csv:
      return Value::string(format_csv(rows));
    case OutputFormat::Table:
      return Value::string(format_table(rows));
  }
  return format_json(rows);
}

}  // namespace sceneql
