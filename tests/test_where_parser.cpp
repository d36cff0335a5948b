#include "test_harness.h"

#include <string>
#include <vector>

#include "query_parser.h"

using sceneql::CompareOp;

namespace {

std::string where_error(const std::string& body) {
  try {
    sceneql::parse_where(body);
  } catch (const sceneql::SyntaxError& e) {
    return e.what();
  }
  return "";
}

void test_symbol_operators() {
  struct Case {
    const char* text;
    CompareOp op;
  };
  const Case cases[] = {
      {"a = 1", CompareOp::Eq},   {"a != 1", CompareOp::NotEq}, {"a <> 1", CompareOp::NotEq},
      {"a > 1", CompareOp::Gt},   {"a < 1", CompareOp::Lt},     {"a >= 1", CompareOp::Gte},
      {"a <= 1", CompareOp::Lte},
  };
  for (const auto& c : cases) {
    auto cond = sceneql::parse_condition(c.text);
    expect_true(cond.op == c.op, std::string("operator parsed for ") + c.text);
    expect_true(cond.field == "a", std::string("field parsed for ") + c.text);
    expect_true(cond.value.is_int() && cond.value.as_int() == 1, std::string("value parsed for ") + c.text);
  }
}

void test_literal_kinds() {
  expect_true(sceneql::parse_condition("name = 'Cube'").value.as_string() == "Cube", "quoted string");
  expect_true(sceneql::parse_condition("name = \"Cube\"").value.as_string() == "Cube", "double-quoted string");
  expect_true(sceneql::parse_condition("name = 'it''s'").value.as_string() == "it's", "doubled quote escape");
  expect_true(sceneql::parse_condition("x = 1.5").value.is_float(), "float literal");
  expect_true(sceneql::parse_condition("x = 1e3").value.is_float(), "exponent literal is float");
  expect_true(sceneql::parse_condition("x = -4").value.as_int() == -4, "negative int");
  expect_true(sceneql::parse_condition("flag = TRUE").value.is_bool(), "boolean literal");
  expect_true(sceneql::parse_condition("x = null").value.is_null(), "null literal");
  expect_true(sceneql::parse_condition("type = MESH").value.as_string() == "MESH", "bare word is string");
}

void test_operator_inside_quotes_ignored() {
  auto cond = sceneql::parse_condition("name = 'a>=b'");
  expect_true(cond.op == CompareOp::Eq, "first operator outside quotes wins");
  expect_true(cond.value.as_string() == "a>=b", "quoted operator text kept");
}

void test_like_forms() {
  auto like = sceneql::parse_condition("name LIKE 'Cu%'");
  expect_true(like.op == CompareOp::Like && !like.negated, "LIKE parsed");
  auto not_like = sceneql::parse_condition("name not like '%be'");
  expect_true(not_like.op == CompareOp::Like && not_like.negated, "NOT LIKE sets negated");
  auto ilike = sceneql::parse_condition("name ILIKE 'cube'");
  expect_true(ilike.op == CompareOp::ILike, "ILIKE parsed");
  auto word_field = sceneql::parse_condition("likes = 3");
  expect_true(word_field.field == "likes" && word_field.op == CompareOp::Eq,
              "field starting with like is not an operator");
}

void test_in_lists() {
  auto in = sceneql::parse_condition("type IN ('MESH', 'LIGHT')");
  expect_true(in.op == CompareOp::In && !in.negated, "IN parsed");
  expect_eq(in.value.as_sequence().size(), 2, "two IN values");
  auto compact = sceneql::parse_condition("id in(1,2,3)");
  expect_eq(compact.value.as_sequence().size(), 3, "IN( without space");
  auto not_in = sceneql::parse_condition("type NOT IN ('CAMERA')");
  expect_true(not_in.op == CompareOp::In && not_in.negated, "NOT IN sets negated");
  expect_str_eq(where_error("type IN 'MESH'"), "IN requires a parenthesized value list: type IN 'MESH'",
                "IN without list");
}

void test_between_and_is_null() {
  auto between = sceneql::parse_condition("stats.verts BETWEEN 4 AND 10");
  expect_true(between.op == CompareOp::Between, "BETWEEN parsed");
  expect_true(between.path.size() == 2, "dotted field split into path");
  expect_true(between.value.as_sequence()[0].as_int() == 4 && between.value.as_sequence()[1].as_int() == 10,
              "BETWEEN bounds");
  auto not_between = sceneql::parse_condition("x NOT BETWEEN 1 AND 2");
  expect_true(not_between.negated, "NOT BETWEEN sets negated");
  auto is_null = sceneql::parse_condition("parent IS NULL");
  expect_true(is_null.op == CompareOp::Is, "IS NULL");
  auto is_not_null = sceneql::parse_condition("parent is not null");
  expect_true(is_not_null.op == CompareOp::IsNot, "IS NOT NULL");
  expect_str_eq(where_error("parent IS 3"), "IS must be followed by NULL or NOT NULL: parent IS 3",
                "IS with value rejected");
  expect_str_eq(where_error("x BETWEEN 1"), "BETWEEN requires AND: x BETWEEN 1", "BETWEEN without AND");
}

void test_combinators_left_to_right() {
  auto expr = sceneql::parse_where("type = 'MESH' OR type = 'LIGHT' AND name = 'C'");
  expect_eq(expr.conditions.size(), 3, "three conditions");
  expect_eq(expr.combinators.size(), 2, "two combinators");
  expect_true(expr.combinators[0] == sceneql::Combinator::Or, "first combinator OR");
  expect_true(expr.combinators[1] == sceneql::Combinator::And, "second combinator AND");
}

void test_between_and_is_not_a_combinator() {
  auto expr = sceneql::parse_where("x BETWEEN 1 AND 5 AND name = 'A'");
  expect_eq(expr.conditions.size(), 2, "BETWEEN consumes its own AND");
  expect_true(expr.conditions[0].op == CompareOp::Between, "first is BETWEEN");
  expect_true(expr.conditions[1].field == "name", "second is name");
}

void test_quoted_and_is_not_a_combinator() {
  auto expr = sceneql::parse_where("name = 'salt and pepper'");
  expect_eq(expr.conditions.size(), 1, "quoted AND stays in literal");
  expect_true(expr.conditions[0].value.as_string() == "salt and pepper", "literal intact");
}

void test_keyword_words_as_values() {
  auto in_value = sceneql::parse_condition("status = in");
  expect_true(in_value.op == CompareOp::Eq, "bare in after = is a value");
  expect_true(in_value.field == "status" && in_value.value.as_string() == "in", "in kept as string");
  auto between_value = sceneql::parse_condition("kind = between");
  expect_true(between_value.op == CompareOp::Eq, "bare between after = is a value");
  expect_true(between_value.value.as_string() == "between", "between kept as string");
  auto quoted = sceneql::parse_condition("kind != 'x' ");
  expect_true(quoted.op == CompareOp::NotEq, "plain comparison unaffected");
  auto negated_in = sceneql::parse_condition("kind NOT IN ('a')");
  expect_true(negated_in.op == CompareOp::In && negated_in.negated, "NOT IN still recognized");
}

void test_where_errors() {
  expect_str_eq(where_error(""), "Empty WHERE clause", "empty where");
  expect_str_eq(where_error("name 'A'"), "No valid operator found in condition: name 'A'", "no operator");
  expect_str_eq(where_error("name ="), "Missing value in condition: name =", "no value");
  expect_str_eq(where_error("= 3"), "Missing field name in condition: = 3", "no field");
  expect_str_eq(where_error("a = 1 AND"), "Empty condition", "dangling AND");
  expect_str_eq(where_error("9x = 1"), "Invalid field name: 9x", "invalid field");
}

}  // namespace

void register_where_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"where_symbol_operators", test_symbol_operators});
  tests.push_back({"where_literal_kinds", test_literal_kinds});
  tests.push_back({"where_operator_inside_quotes_ignored", test_operator_inside_quotes_ignored});
  tests.push_back({"where_like_forms", test_like_forms});
  tests.push_back({"where_in_lists", test_in_lists});
  tests.push_back({"where_between_and_is_null", test_between_and_is_null});
  tests.push_back({"where_combinators_left_to_right", test_combinators_left_to_right});
  tests.push_back({"where_between_and_is_not_a_combinator", test_between_and_is_not_a_combinator});
  tests.push_back({"where_quoted_and_is_not_a_combinator", test_quoted_and_is_not_a_combinator});
  tests.push_back({"where_keyword_words_as_values", test_keyword_words_as_values});
  tests.push_back({"where_errors", test_where_errors});
}
