#include "../query_parser.h"

#include <cctype>

#include "../util/string_util.h"
#include "scanner.h"

namespace sceneql {

namespace {

struct OperatorMatch {
  size_t start = 0;
  size_t end = 0;
  CompareOp op = CompareOp::Eq;
  bool negated = false;
};

bool is_space_at(const std::string& text, size_t i) {
  return i < text.size() && std::isspace(static_cast<unsigned char>(text[i]));
}

/// Matches a word (case-insensitive) at pos, requiring whitespace or end after it.
bool word_at(const std::string& text, size_t pos, const char* word) {
  size_t n = std::char_traits<char>::length(word);
  if (pos + n > text.size()) return false;
  if (!util::iequals(text.substr(pos, n), word)) return false;
  return pos + n == text.size() || is_space_at(text, pos + n);
}

/// Tries LIKE, ILIKE and their NOT forms at pos. pos MUST follow whitespace.
std::optional<OperatorMatch> match_word_operator(const std::string& text, size_t pos) {
  size_t cursor = pos;
  bool negated = false;
  if (word_at(text, cursor, "NOT")) {
    negated = true;
    cursor += 3;
    while (is_space_at(text, cursor)) ++cursor;
  }
  OperatorMatch match;
  match.start = pos;
  match.negated = negated;
  if (word_at(text, cursor, "LIKE")) {
    match.op = CompareOp::Like;
    match.end = cursor + 4;
    return match;
  }
  if (word_at(text, cursor, "ILIKE")) {
    match.op = CompareOp::ILike;
    match.end = cursor + 5;
    return match;
  }
  return std::nullopt;
}

std::optional<OperatorMatch> match_symbol_operator(const std::string& text, size_t pos) {
  struct Symbol {
    const char* text;
    CompareOp op;
  };
  // Two-character operators first so the longest match wins at a position.
  static const Symbol kSymbols[] = {
      {">=", CompareOp::Gte}, {"<=", CompareOp::Lte}, {"!=", CompareOp::NotEq},
      {"<>", CompareOp::NotEq}, {">", CompareOp::Gt}, {"<", CompareOp::Lt},
      {"=", CompareOp::Eq},
  };
  for (const auto& symbol : kSymbols) {
    size_t n = std::char_traits<char>::length(symbol.text);
    if (text.compare(pos, n, symbol.text) == 0) {
      return OperatorMatch{pos, pos + n, symbol.op, false};
    }
  }
  return std::nullopt;
}

/// Finds the leftmost comparison operator outside quotes.
std::optional<OperatorMatch> find_operator(const std::string& text) {
  ScanState state;
  size_t i = 0;
  while (i < text.size()) {
    if (!state.in_quote()) {
      if (auto symbol = match_symbol_operator(text, i)) return symbol;
      if (i > 0 && is_space_at(text, i - 1)) {
        if (auto word = match_word_operator(text, i)) return word;
      }
    }
    i = state.feed(text, i);
  }
  return std::nullopt;
}

std::string require_field(const std::string& raw, const std::string& condition) {
  std::string field = util::trim_ws(raw);
  if (field.empty()) {
    throw SyntaxError("Missing field name in condition: " + condition);
  }
  if (!util::is_field_path(field)) {
    throw SyntaxError("Invalid field name: " + field);
  }
  return field;
}

WhereCondition make_condition(const std::string& field, CompareOp op, Value value, bool negated) {
  WhereCondition cond;
  cond.field = field;
  cond.path = split_path(field);
  cond.op = op;
  cond.value = std::move(value);
  cond.negated = negated;
  return cond;
}

std::optional<WhereCondition> parse_is_null(const std::vector<Word>& words,
                                            const std::string& text) {
  if (words.size() < 2 || !is_keyword(words[1], "IS")) return std::nullopt;
  std::string field = require_field(words[0].text, text);
  if (words.size() == 3 && is_keyword(words[2], "NULL")) {
    return make_condition(field, CompareOp::Is, Value::null(), false);
  }
  if (words.size() == 4 && is_keyword(words[2], "NOT") && is_keyword(words[3], "NULL")) {
    return make_condition(field, CompareOp::IsNot, Value::null(), false);
  }
  throw SyntaxError("IS must be followed by NULL or NOT NULL: " + text);
}

/// Index of the word that may hold IN / BETWEEN: right after the field, or after `field NOT`.
size_t keyword_index(const std::vector<Word>& words) {
  if (words.size() > 2 && is_keyword(words[1], "NOT")) return 2;
  return 1;
}

std::optional<WhereCondition> parse_between(const std::vector<Word>& words,
                                            const std::string& text) {
  size_t i = keyword_index(words);
  if (i < words.size() && is_keyword(words[i], "BETWEEN")) {
    bool negated = i == 2;
    size_t field_end = negated ? words[i - 1].start : words[i].start;
    std::string field = require_field(text.substr(0, field_end), text);
    size_t and_index = i + 1;
    while (and_index < words.size() && !is_keyword(words[and_index], "AND")) {
      ++and_index;
    }
    if (and_index >= words.size()) {
      throw SyntaxError("BETWEEN requires AND: " + text);
    }
    std::string lower = util::trim_ws(
        text.substr(words[i].end, words[and_index].start - words[i].end));
    std::string upper = util::trim_ws(text.substr(words[and_index].end));
    if (lower.empty() || upper.empty()) {
      throw SyntaxError("BETWEEN requires two bounds: " + text);
    }
    Sequence bounds{parse_literal(lower), parse_literal(upper)};
    return make_condition(field, CompareOp::Between, Value::sequence(std::move(bounds)), negated);
  }
  return std::nullopt;
}

bool starts_in_list(const Word& word) {
  if (is_keyword(word, "IN")) return true;
  return word.text.size() > 2 && util::iequals(word.text.substr(0, 2), "IN") &&
         word.text[2] == '(';
}

std::optional<WhereCondition> parse_in(const std::vector<Word>& words, const std::string& text) {
  size_t i = keyword_index(words);
  if (i < words.size() && starts_in_list(words[i])) {
    bool negated = i == 2;
    size_t field_end = negated ? words[i - 1].start : words[i].start;
    std::string field = require_field(text.substr(0, field_end), text);
    std::string list = util::trim_ws(text.substr(words[i].start + 2));
    if (list.size() < 2 || list.front() != '(' || list.back() != ')') {
      throw SyntaxError("IN requires a parenthesized value list: " + text);
    }
    Sequence values;
    for (const auto& part : split_top_level(list.substr(1, list.size() - 2), ',', "IN list")) {
      if (part.empty()) continue;
      values.push_back(parse_literal(part));
    }
    return make_condition(field, CompareOp::In, Value::sequence(std::move(values)), negated);
  }
  return std::nullopt;
}

}  // namespace

WhereCondition parse_condition(const std::string& raw) {
  std::string text = util::trim_ws(raw);
  if (text.empty()) {
    throw SyntaxError("Empty condition");
  }
  std::vector<Word> words = top_level_words(text);
  if (auto cond = parse_is_null(words, text)) return *cond;
  if (auto cond = parse_between(words, text)) return *cond;
  if (auto cond = parse_in(words, text)) return *cond;

  auto match = find_operator(text);
  if (!match.has_value()) {
    throw SyntaxError("No valid operator found in condition: " + text);
  }
  std::string field = require_field(text.substr(0, match->start), text);
  std::string value_text = util::trim_ws(text.substr(match->end));
  if (value_text.empty()) {
    throw SyntaxError("Missing value in condition: " + text);
  }
  return make_condition(field, match->op, parse_literal(value_text), match->negated);
}

WhereExpression parse_where(const std::string& body) {
  std::string text = util::trim_ws(body);
  if (text.empty()) {
    throw SyntaxError("Empty WHERE clause");
  }
  if (!has_balanced_quotes(text)) {
    throw SyntaxError("Unclosed quote in WHERE clause");
  }
  if (!has_balanced_parentheses(text)) {
    throw SyntaxError("Mismatched parentheses in WHERE clause");
  }

  WhereExpression expr;
  std::vector<Word> words = top_level_words(text);
  size_t cond_start = 0;
  bool between_pending = false;
  for (const auto& word : words) {
    if (is_keyword(word, "BETWEEN")) {
      between_pending = true;
      continue;
    }
    bool is_and = is_keyword(word, "AND");
    if (is_and && between_pending) {
      // The first AND after BETWEEN separates its bounds.
      between_pending = false;
      continue;
    }
    if (!is_and && !is_keyword(word, "OR")) continue;
    expr.conditions.push_back(parse_condition(text.substr(cond_start, word.start - cond_start)));
    expr.combinators.push_back(is_and ? Combinator::And : Combinator::Or);
    cond_start = word.end;
  }
  expr.conditions.push_back(parse_condition(text.substr(cond_start)));
  return expr;
}

}  // namespace sceneql
