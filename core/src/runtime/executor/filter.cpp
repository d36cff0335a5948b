#include "../executor.h"

#include "../../query_parser.h"
#include "../../util/string_util.h"

namespace sceneql {

namespace {

const char* kTruthy[] = {"true", "1", "yes", "on"};

/// Orders two values, falling back to their text forms when they are not mutually orderable.
Ordering compare_with_fallback(const Value& left, const Value& right) {
  if (auto ordering = compare_values(left, right)) return *ordering;
  int cmp = to_text(left).compare(to_text(right));
  if (cmp < 0) return Ordering::Less;
  if (cmp > 0) return Ordering::Greater;
  return Ordering::Equal;
}

/// Applies the literal coercion rules for scalar comparisons against `actual`.
Value comparable_literal(const Value& actual, const Value& literal) {
  if (actual.is_bool()) {
    if (auto coerced = coerce(literal, CoercionTarget::Boolean)) return *coerced;
  } else if (actual.is_number()) {
    if (auto coerced = coerce(literal, CoercionTarget::Numeric)) return *coerced;
  }
  return literal;
}

bool compare_scalar(CompareOp op, const Value& actual, const Value& literal) {
  Value rhs = comparable_literal(actual, literal);
  switch (op) {
    case CompareOp::Eq:
      return values_equal(actual, rhs);
    case CompareOp::NotEq:
      return !values_equal(actual, rhs);
    case CompareOp::Gt:
      return compare_with_fallback(actual, rhs) == Ordering::Greater;
    case CompareOp::Lt:
      return compare_with_fallback(actual, rhs) == Ordering::Less;
    case CompareOp::Gte:
      return compare_with_fallback(actual, rhs) != Ordering::Less;
    case CompareOp::Lte:
      return compare_with_fallback(actual, rhs) != Ordering::Greater;
    default:
      return false;
  }
}

bool in_list(const Value& actual, const Value& list) {
  if (!list.is_sequence()) return false;
  for (const auto& item : list.as_sequence()) {
    if (values_equal(actual, item)) return true;
  }
  return false;
}

bool between(const Value& actual, const Value& bounds) {
  if (!bounds.is_sequence() || bounds.as_sequence().size() != 2) return false;
  const Value& lower = bounds.as_sequence()[0];
  const Value& upper = bounds.as_sequence()[1];
  auto low = compare_values(lower, actual);
  auto high = compare_values(actual, upper);
  if (low.has_value() && high.has_value()) {
    return *low != Ordering::Greater && *high != Ordering::Greater;
  }
  std::string text = to_text(actual);
  return to_text(lower) <= text && text <= to_text(upper);
}

}  // namespace

std::optional<Value> coerce(const Value& literal, CoercionTarget target) {
  if (!literal.is_string()) return std::nullopt;
  switch (target) {
    case CoercionTarget::Boolean: {
      std::string lowered = util::to_lower(util::trim_ws(literal.as_string()));
      for (const char* truthy : kTruthy) {
        if (lowered == truthy) return Value::boolean(true);
      }
      return Value::boolean(false);
    }
    case CoercionTarget::Numeric:
      return parse_number(literal.as_string());
  }
  return std::nullopt;
}

// WHY: LIKE is unanchored, so the pattern is wrapped in '%' and matched iteratively.
bool like_match(const std::string& text, const std::string& pattern) {
  std::string s = util::to_lower(text);
  std::string p = "%" + util::to_lower(pattern) + "%";
  size_t si = 0;
  size_t pi = 0;
  size_t star = std::string::npos;
  size_t match = 0;
  while (si < s.size()) {
    if (pi < p.size() && (p[pi] == '_' || p[pi] == s[si])) {
      ++si;
      ++pi;
      continue;
    }
    if (pi < p.size() && p[pi] == '%') {
      star = pi++;
      match = si;
      continue;
    }
    if (star != std::string::npos) {
      pi = star + 1;
      si = ++match;
      continue;
    }
    return false;
  }
  while (pi < p.size() && p[pi] == '%') ++pi;
  return pi == p.size();
}

bool evaluate_condition(const WhereCondition& condition, const Row& row) {
  std::optional<Value> resolved = resolve_path(row, condition.path);
  bool is_null_test = condition.op == CompareOp::Is || condition.op == CompareOp::IsNot;
  if (!resolved.has_value() && !is_null_test) {
    return condition.negated;
  }
  Value actual = resolved.value_or(Value::null());

  bool result = false;
  switch (condition.op) {
    case CompareOp::Is:
      result = actual.is_null();
      break;
    case CompareOp::IsNot:
      result = !actual.is_null();
      break;
    case CompareOp::Like:
    case CompareOp::ILike:
      result = like_match(to_text(actual), to_text(condition.value));
      break;
    case CompareOp::In:
      result = in_list(actual, condition.value);
      break;
    case CompareOp::Between:
      result = between(actual, condition.value);
      break;
    default:
      result = compare_scalar(condition.op, actual, condition.value);
      break;
  }
  return condition.negated ? !result : result;
}

bool evaluate_where(const WhereExpression& where, const Row& row) {
  if (where.conditions.empty()) return true;
  bool result = evaluate_condition(where.conditions[0], row);
  for (size_t i = 1; i < where.conditions.size(); ++i) {
    Combinator combinator = where.combinators[i - 1];
    bool next = evaluate_condition(where.conditions[i], row);
    result = combinator == Combinator::And ? (result && next) : (result || next);
  }
  return result;
}

std::vector<Row> filter_rows(const std::vector<Row>& rows, const WhereExpression& where) {
  if (where.empty()) return rows;
  std::vector<Row> out;
  for (const auto& row : rows) {
    if (evaluate_where(where, row)) out.push_back(row);
  }
  return out;
}

}  // namespace sceneql
