#include "../executor.h"

#include <algorithm>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace sceneql {

namespace {

bool is_missing(const std::optional<Value>& value) {
  return !value.has_value() || value->is_null();
}

/// Rank used when two values of different kinds meet in a sort: numbers, strings, sequences, maps.
int kind_rank(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::Bool:
    case Value::Kind::Int:
    case Value::Kind::Float:
      return 0;
    case Value::Kind::String:
      return 1;
    case Value::Kind::Sequence:
      return 2;
    case Value::Kind::Map:
      return 3;
    case Value::Kind::Null:
      return 4;
  }
  return 4;
}

Ordering compare_present(const Value& left, const Value& right) {
  if (auto ordering = compare_values(left, right)) return *ordering;
  int left_rank = kind_rank(left);
  int right_rank = kind_rank(right);
  if (left_rank != right_rank) return left_rank < right_rank ? Ordering::Less : Ordering::Greater;
  int cmp = to_text(left).compare(to_text(right));
  if (cmp < 0) return Ordering::Less;
  if (cmp > 0) return Ordering::Greater;
  return Ordering::Equal;
}

std::string row_key(const Row& row, const std::vector<std::string>& fields) {
  std::string key;
  for (const auto& field : fields) {
    key += canonical_key(lookup_field(row, field).value_or(Value::null()));
    key += '|';
  }
  return key;
}

}  // namespace

std::optional<Value> lookup_field(const Row& row, const std::string& name) {
  if (const Value* direct = row.find(name)) return *direct;
  return resolve_path(row, name);
}

Ordering compare_sort_keys(const std::optional<Value>& left,
                           const std::optional<Value>& right,
                           SortDirection direction) {
  bool left_missing = is_missing(left);
  bool right_missing = is_missing(right);
  // Missing values stay last regardless of direction.
  if (left_missing || right_missing) {
    if (left_missing && right_missing) return Ordering::Equal;
    return left_missing ? Ordering::Greater : Ordering::Less;
  }
  Ordering base = compare_present(*left, *right);
  if (direction == SortDirection::Asc || base == Ordering::Equal) return base;
  return base == Ordering::Less ? Ordering::Greater : Ordering::Less;
}

std::vector<Row> group_rows(const std::vector<Row>& rows,
                            const std::vector<std::string>& group_by,
                            const std::vector<AggregateSpec>& aggregates) {
  std::vector<std::vector<Row>> groups;
  std::unordered_map<std::string, size_t> index;
  for (const auto& row : rows) {
    std::string key = row_key(row, group_by);
    auto it = index.find(key);
    if (it == index.end()) {
      index.emplace(key, groups.size());
      groups.push_back({row});
    } else {
      groups[it->second].push_back(row);
    }
  }

  std::vector<Row> out;
  out.reserve(groups.size());
  for (const auto& members : groups) {
    Row record;
    for (const auto& field : group_by) {
      record.set(field, resolve_path(members.front(), field).value_or(Value::null()));
    }
    for (const auto& spec : aggregates) {
      record.set(spec.alias, apply_aggregate(spec.function, spec.field, members));
    }
    out.push_back(std::move(record));
  }
  return out;
}

std::vector<Row> aggregate_rows(const std::vector<Row>& rows, const std::vector<AggregateSpec>& aggregates) {
  if (rows.empty()) return {};
  Row record;
  for (const auto& spec : aggregates) {
    record.set(spec.alias, apply_aggregate(spec.function, spec.field, rows));
  }
  return {record};
}

std::vector<Row> distinct_rows(const std::vector<Row>& rows, const std::vector<std::string>& fields) {
  bool whole_row = fields.size() == 1 && fields[0] == "*";
  std::unordered_set<std::string> seen;
  std::vector<Row> out;
  for (const auto& row : rows) {
    std::string key = whole_row ? canonical_key(Value::map(row)) : row_key(row, fields);
    if (seen.insert(key).second) out.push_back(row);
  }
  return out;
}

std::vector<Row> order_rows(const std::vector<Row>& rows, const std::vector<OrderItem>& order_by) {
  if (order_by.empty()) return rows;
  std::vector<std::vector<std::optional<Value>>> keys;
  keys.reserve(rows.size());
  for (const auto& row : rows) {
    std::vector<std::optional<Value>> row_keys;
    row_keys.reserve(order_by.size());
    for (const auto& item : order_by) {
      row_keys.push_back(lookup_field(row, item.field));
    }
    keys.push_back(std::move(row_keys));
  }

  std::vector<size_t> order(rows.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    for (size_t i = 0; i < order_by.size(); ++i) {
      Ordering cmp = compare_sort_keys(keys[a][i], keys[b][i], order_by[i].direction);
      if (cmp != Ordering::Equal) return cmp == Ordering::Less;
    }
    return false;
  });

  std::vector<Row> out;
  out.reserve(rows.size());
  for (size_t i : order) out.push_back(rows[i]);
  return out;
}

std::vector<Row> limit_rows(std::vector<Row> rows, size_t limit) {
  if (rows.size() > limit) rows.resize(limit);
  return rows;
}

std::vector<Row> project_rows(const std::vector<Row>& rows,
                              const std::vector<std::string>& fields,
                              const std::unordered_map<std::string, std::string>& aliases) {
  std::vector<Row> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    Row projected;
    for (const auto& field : fields) {
      auto alias = aliases.find(field);
      const std::string& source = alias == aliases.end() ? field : alias->second;
      projected.set(field, lookup_field(row, source).value_or(Value::null()));
    }
    out.push_back(std::move(projected));
  }
  return out;
}

}  // namespace sceneql
