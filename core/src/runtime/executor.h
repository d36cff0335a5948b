#pragma once

#include <optional>
#include <unordered_map>
#include <string>
#include <vector>

#include "../lang/ast.h"
#include "sceneql/value.h"

namespace sceneql {

/// What a comparison site needs a literal to become.
enum class CoercionTarget { Numeric, Boolean };

/// Converts a literal for comparison against a row value of the given target kind.
/// Returns nullopt when the literal cannot or need not be converted; never mutates it.
std::optional<Value> coerce(const Value& literal, CoercionTarget target);

/// Case-insensitive unanchored LIKE search: `%` matches any run, `_` one character.
bool like_match(const std::string& text, const std::string& pattern);

/// Evaluates one condition against a row, honouring absent-field and negation rules.
bool evaluate_condition(const WhereCondition& condition, const Row& row);
/// Folds conditions strictly left to right; an empty expression matches every row.
bool evaluate_where(const WhereExpression& where, const Row& row);

/// Computes one aggregate over rows. COUNT(*) counts rows; others skip non-numeric values.
Value apply_aggregate(AggregateFunction function, const std::string& field, const std::vector<Row>& rows);
/// Name-based entry point; throws SyntaxError for unknown function names.
Value apply_aggregate(const std::string& function, const std::string& field, const std::vector<Row>& rows);

/// Reads an output column or a dotted path: an exact top-level key wins, so aggregate
/// columns such as `SUM(stats.verts)` resolve before path splitting.
std::optional<Value> lookup_field(const Row& row, const std::string& name);

/// Pipeline stages. Each takes the rows of the previous stage and returns new rows.
std::vector<Row> filter_rows(const std::vector<Row>& rows, const WhereExpression& where);
/// One row per distinct group tuple in first-seen order: group fields, then aggregate aliases.
std::vector<Row> group_rows(const std::vector<Row>& rows,
                            const std::vector<std::string>& group_by,
                            const std::vector<AggregateSpec>& aggregates);
/// Single aggregate record over all rows; empty when rows is empty.
std::vector<Row> aggregate_rows(const std::vector<Row>& rows, const std::vector<AggregateSpec>& aggregates);
/// Keeps the first row of each distinct key (whole row for `*`, selected paths otherwise).
std::vector<Row> distinct_rows(const std::vector<Row>& rows, const std::vector<std::string>& fields);
/// Stable multi-key sort; Null and absent values sort last in both directions.
std::vector<Row> order_rows(const std::vector<Row>& rows, const std::vector<OrderItem>& order_by);
/// Keeps the first `limit` rows.
std::vector<Row> limit_rows(std::vector<Row> rows, size_t limit);
/// Builds output rows holding only the selected fields; aliases read their source path.
std::vector<Row> project_rows(const std::vector<Row>& rows,
                              const std::vector<std::string>& fields,
                              const std::unordered_map<std::string, std::string>& aliases);

/// Sort comparison with direction applied; missing values compare greater than present ones.
Ordering compare_sort_keys(const std::optional<Value>& left,
                           const std::optional<Value>& right,
                           SortDirection direction);

}  // namespace sceneql
