#include "../query_parser.h"

#include <cerrno>
#include <cstdlib>

#include "../util/string_util.h"
#include "parser_internal.h"
#include "scanner.h"

namespace sceneql {

namespace {

/// Accepts a field path or an aggregate column such as `count(*)`, normalized to `COUNT(*)`.
std::string normalize_order_field(const std::string& field) {
  if (util::is_field_path(field)) return field;
  if (auto call = match_call(field)) {
    auto function = aggregate_from_name(call->name);
    if (function.has_value() && (call->arg == "*" || util::is_field_path(call->arg))) {
      return aggregate_alias(aggregate_name(*function), call->arg);
    }
  }
  throw SyntaxError("Invalid field name in ORDER BY: " + field);
}

}  // namespace

std::vector<std::string> parse_group_by(const std::string& body) {
  std::string text = util::trim_ws(body);
  if (text.empty()) {
    throw SyntaxError("Empty GROUP BY clause");
  }
  std::vector<std::string> fields;
  for (const auto& part : split_top_level(text, ',', "GROUP BY clause")) {
    if (part.empty()) {
      throw SyntaxError("Empty field in GROUP BY clause");
    }
    if (!util::is_field_path(part)) {
      throw SyntaxError("Invalid field name in GROUP BY: " + part);
    }
    fields.push_back(part);
  }
  return fields;
}

std::vector<OrderItem> parse_order_by(const std::string& body) {
  std::string text = util::trim_ws(body);
  if (text.empty()) {
    throw SyntaxError("Empty ORDER BY clause");
  }
  std::vector<OrderItem> items;
  for (const auto& part : split_top_level(text, ',', "ORDER BY clause")) {
    if (part.empty()) {
      throw SyntaxError("Empty field in ORDER BY clause");
    }
    std::vector<Word> words = top_level_words(part);
    OrderItem item;
    if (words.size() == 2) {
      std::string direction = util::to_upper(words[1].text);
      if (direction == "DESC") {
        item.direction = SortDirection::Desc;
      } else if (direction != "ASC") {
        throw SyntaxError("Invalid sort direction: " + words[1].text + ". Use ASC or DESC");
      }
    } else if (words.size() != 1) {
      throw SyntaxError("Invalid ORDER BY specification: " + part);
    }
    item.field = normalize_order_field(words[0].text);
    items.push_back(item);
  }
  return items;
}

int64_t parse_limit(const std::string& body) {
  std::string text = util::trim_ws(body);
  bool digits = !text.empty();
  for (char c : text) {
    if (c < '0' || c > '9') digits = false;
  }
  if (!digits) {
    throw SyntaxError("LIMIT must be a non-negative integer, got: " + text);
  }
  errno = 0;
  long long value = std::strtoll(text.c_str(), nullptr, 10);
  if (errno == ERANGE) {
    throw SyntaxError("LIMIT value out of range: " + text);
  }
  return static_cast<int64_t>(value);
}

}  // namespace sceneql
