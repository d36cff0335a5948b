#include "../query_parser.h"

#include <algorithm>

#include "../util/string_util.h"
#include "parser_internal.h"
#include "scanner.h"

namespace sceneql {

std::optional<CallExpr> match_call(const std::string& text) {
  std::string expr = util::trim_ws(text);
  size_t open = expr.find('(');
  if (open == std::string::npos || expr.empty() || expr.back() != ')') return std::nullopt;
  std::string name = util::trim_ws(expr.substr(0, open));
  if (!util::is_identifier(name)) return std::nullopt;
  CallExpr call;
  call.name = name;
  call.arg = util::trim_ws(expr.substr(open + 1, expr.size() - open - 2));
  return call;
}

std::string aggregate_alias(const std::string& function_upper, const std::string& field) {
  return function_upper + "(" + field + ")";
}

namespace {

struct SelectItem {
  std::string expr;
  std::optional<std::string> alias;
};

/// Splits `expr AS alias`; AS is matched as a top-level word.
SelectItem split_alias(const std::string& item) {
  std::vector<Word> words = top_level_words(item);
  for (size_t i = 0; i < words.size(); ++i) {
    if (!is_keyword(words[i], "AS")) continue;
    if (i == 0 || i + 2 != words.size()) {
      throw SyntaxError("Invalid alias in SELECT item: " + item);
    }
    const std::string& alias = words[i + 1].text;
    if (!util::is_identifier(alias)) {
      throw SyntaxError("Invalid alias: " + alias);
    }
    SelectItem out;
    out.expr = util::trim_ws(item.substr(0, words[i].start));
    out.alias = alias;
    return out;
  }
  return SelectItem{util::trim_ws(item), std::nullopt};
}

void add_aggregate(ParsedQuery& out, const AggregateSpec& spec) {
  auto existing = std::find_if(out.aggregates.begin(), out.aggregates.end(),
                               [&](const AggregateSpec& a) { return a.alias == spec.alias; });
  if (existing != out.aggregates.end()) {
    throw SyntaxError("Duplicate column in SELECT clause: " + spec.alias);
  }
  out.aggregates.push_back(spec);
}

}  // namespace

void parse_select(const std::string& body, ParsedQuery& out) {
  std::string list = util::trim_ws(body);
  if (list.empty()) {
    throw SyntaxError("Empty SELECT clause");
  }
  std::vector<Word> words = top_level_words(list);
  if (!words.empty() && is_keyword(words.front(), "DISTINCT")) {
    out.distinct = true;
    list = util::trim_ws(list.substr(words.front().end));
    if (list.empty()) {
      throw SyntaxError("Empty field list after DISTINCT");
    }
  }

  std::vector<std::string> parts = split_top_level(list, ',', "SELECT clause");
  bool saw_star = false;
  for (const auto& part : parts) {
    if (part.empty()) continue;
    SelectItem item = split_alias(part);
    if (auto call = match_call(item.expr)) {
      auto function = aggregate_from_name(call->name);
      if (!function.has_value()) {
        throw SyntaxError("Unsupported aggregate function: " + util::to_upper(call->name));
      }
      std::string func_upper = aggregate_name(*function);
      if (call->arg.empty()) {
        throw SyntaxError("Missing argument for " + func_upper);
      }
      if (call->arg == "*" && *function != AggregateFunction::Count) {
        throw SyntaxError("Function " + func_upper + " cannot be used with *");
      }
      if (call->arg != "*" && !util::is_field_path(call->arg)) {
        throw SyntaxError("Invalid field name in " + func_upper + ": " + call->arg);
      }
      std::string canonical = aggregate_alias(func_upper, call->arg);
      std::string alias = item.alias.value_or(canonical);
      add_aggregate(out, AggregateSpec{alias, *function, call->arg});
      if (item.alias.has_value()) {
        out.aliases[alias] = canonical;
      }
      out.fields.push_back(alias);
      continue;
    }
    if (item.expr == "*") {
      if (item.alias.has_value()) {
        throw SyntaxError("Cannot alias * in SELECT clause");
      }
      saw_star = true;
      out.fields.push_back("*");
      continue;
    }
    if (!util::is_field_path(item.expr)) {
      throw SyntaxError("Invalid field name: " + item.expr);
    }
    if (item.alias.has_value()) {
      out.aliases[*item.alias] = item.expr;
      out.fields.push_back(*item.alias);
    } else {
      out.fields.push_back(item.expr);
    }
  }

  if (out.fields.empty()) {
    throw SyntaxError("No valid fields found in SELECT clause");
  }
  if (saw_star && out.fields.size() > 1) {
    throw SyntaxError("Cannot combine * with other fields in SELECT clause");
  }
}

}  // namespace sceneql
