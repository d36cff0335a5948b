#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sceneql/value.h"

namespace sceneql {

enum class AggregateFunction { Count, Sum, Avg, Min, Max, Stddev, Variance };

/// One aggregate call in the SELECT list, e.g. `SUM(stats.verts) AS total`.
struct AggregateSpec {
  std::string alias;
  AggregateFunction function = AggregateFunction::Count;
  /// Field path, or "*" for COUNT(*).
  std::string field;
};

enum class CompareOp { Eq, NotEq, Gt, Lt, Gte, Lte, Like, ILike, In, Between, Is, IsNot };

/// A single WHERE predicate.
/// MUST keep `value` immutable; In holds a Sequence, Between a Sequence of two bounds.
struct WhereCondition {
  std::string field;
  std::vector<std::string> path;
  CompareOp op = CompareOp::Eq;
  Value value;
  bool negated = false;
};

enum class Combinator { And, Or };

/// Flat condition list folded left to right.
/// MUST hold exactly conditions.size() - 1 combinators when non-empty.
struct WhereExpression {
  std::vector<WhereCondition> conditions;
  std::vector<Combinator> combinators;

  bool empty() const { return conditions.empty(); }
};

enum class SortDirection { Asc, Desc };

struct OrderItem {
  std::string field;
  SortDirection direction = SortDirection::Asc;
};

/// Everything the pipeline needs from one query text.
struct ParsedQuery {
  /// Projected expressions in SELECT order; {"*"} for SELECT *.
  std::vector<std::string> fields;
  bool distinct = false;
  std::vector<AggregateSpec> aggregates;
  /// alias -> source expression text.
  std::unordered_map<std::string, std::string> aliases;
  WhereExpression where;
  std::vector<std::string> group_by;
  std::vector<OrderItem> order_by;
  std::optional<int64_t> limit;
  std::string table;

  bool select_all() const { return fields.size() == 1 && fields[0] == "*"; }
  bool has_aggregates() const { return !aggregates.empty(); }
};

/// Upper-case SQL name of an aggregate function.
const char* aggregate_name(AggregateFunction function);
/// Case-insensitive lookup of an aggregate by name.
std::optional<AggregateFunction> aggregate_from_name(const std::string& name);

}  // namespace sceneql
