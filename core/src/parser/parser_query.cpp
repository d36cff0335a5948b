#include "../query_parser.h"

#include "scanner.h"

namespace sceneql {

namespace {

ParseResult fail(const std::string& clause, const std::string& message) {
  ParseResult result;
  result.error = ParseError{clause, message};
  return result;
}

}  // namespace

ParseResult parse_query(const std::string& query) {
  if (!has_balanced_parentheses(query)) {
    return fail("", "Unbalanced parentheses in query");
  }
  if (!has_balanced_quotes(query)) {
    return fail("", "Unbalanced quotes in query");
  }
  QueryClauses clauses;
  try {
    clauses = extract_clauses(query);
  } catch (const SyntaxError& e) {
    return fail("", e.what());
  }

  ParsedQuery parsed;
  parsed.table = clauses.from;
  try {
    parse_select(clauses.select, parsed);
  } catch (const SyntaxError& e) {
    return fail("SELECT", e.what());
  }
  if (clauses.where.has_value()) {
    try {
      parsed.where = parse_where(*clauses.where);
    } catch (const SyntaxError& e) {
      return fail("WHERE", e.what());
    }
  }
  if (clauses.group_by.has_value()) {
    try {
      parsed.group_by = parse_group_by(*clauses.group_by);
    } catch (const SyntaxError& e) {
      return fail("GROUP BY", e.what());
    }
  }
  if (clauses.order_by.has_value()) {
    try {
      parsed.order_by = parse_order_by(*clauses.order_by);
    } catch (const SyntaxError& e) {
      return fail("ORDER BY", e.what());
    }
  }
  if (clauses.limit.has_value()) {
    try {
      parsed.limit = parse_limit(*clauses.limit);
    } catch (const SyntaxError& e) {
      return fail("LIMIT", e.what());
    }
  }
  ParseResult result;
  result.query = std::move(parsed);
  return result;
}

std::string describe_parse_error(const ParseError& error) {
  if (error.clause.empty()) return error.message;
  return error.clause + " clause error: " + error.message;
}

}  // namespace sceneql
