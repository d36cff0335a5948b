#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lang/ast.h"
#include "parser/syntax_error.h"

namespace sceneql {

/// Raw clause bodies sliced out of one query text.
struct QueryClauses {
  std::string select;
  std::string from;
  std::optional<std::string> where;
  std::optional<std::string> group_by;
  std::optional<std::string> order_by;
  std::optional<std::string> limit;
};

/// Error reported by parse_query; `clause` is empty for whole-query shape errors.
struct ParseError {
  std::string clause;
  std::string message;
};

struct ParseResult {
  std::optional<ParsedQuery> query;
  std::optional<ParseError> error;
};

/// Locates SELECT, FROM, WHERE, GROUP BY, ORDER BY and LIMIT at top level.
/// MUST match keywords case-insensitively as whole words outside quotes and parentheses.
/// Throws SyntaxError when the SELECT ... FROM <table> shape is missing.
QueryClauses extract_clauses(const std::string& query);

/// Parses a SELECT body into fields, distinct flag, aggregates and aliases.
/// Throws SyntaxError with a message describing the offending item.
void parse_select(const std::string& body, ParsedQuery& out);
/// Parses a WHERE body into a flat left-to-right expression. Throws SyntaxError.
WhereExpression parse_where(const std::string& body);
/// Parses one WHERE condition. Throws SyntaxError.
WhereCondition parse_condition(const std::string& text);
/// Parses a GROUP BY body into field paths. Throws SyntaxError.
std::vector<std::string> parse_group_by(const std::string& body);
/// Parses an ORDER BY body into (field, direction) items. Throws SyntaxError.
std::vector<OrderItem> parse_order_by(const std::string& body);
/// Parses a LIMIT body; MUST be a non-negative integer. Throws SyntaxError.
int64_t parse_limit(const std::string& body);

/// Parses a literal token: NULL, TRUE/FALSE, quoted string, Int, Float, else bare string.
Value parse_literal(const std::string& text);
/// Parses numeric text: Int unless it contains '.', 'e' or 'E' (or overflows), then Float.
std::optional<Value> parse_number(const std::string& text);
/// Resolves doubled quotes and the \n, \t, \r, \\ escapes of a quoted string body.
std::string unescape_string(const std::string& body);

/// Runs every syntax check and every clause parser; never throws.
/// MUST report the first failure with the clause it came from.
ParseResult parse_query(const std::string& query);
/// Formats a ParseError as "<CLAUSE> clause error: <message>".
std::string describe_parse_error(const ParseError& error);

}  // namespace sceneql
