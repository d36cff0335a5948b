#include "../executor.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "../../query_parser.h"
#include "../../util/string_util.h"

namespace sceneql {

namespace {

/// Numeric values gathered for one aggregate.
struct NumericSample {
  std::vector<double> values;
  std::vector<int64_t> ints;
  bool all_integral = true;

  bool empty() const { return values.empty(); }
  size_t size() const { return values.size(); }

  void add(const Value& value) {
    if (value.is_int()) {
      values.push_back(static_cast<double>(value.as_int()));
      ints.push_back(value.as_int());
    } else if (value.is_bool()) {
      values.push_back(value.as_bool() ? 1.0 : 0.0);
      ints.push_back(value.as_bool() ? 1 : 0);
    } else if (value.is_float()) {
      values.push_back(value.as_float());
      all_integral = false;
    } else if (value.is_string()) {
      if (auto number = parse_number(value.as_string())) add(*number);
    }
  }
};

NumericSample collect(const std::string& field, const std::vector<Row>& rows) {
  NumericSample sample;
  std::vector<std::string> path = split_path(field);
  for (const auto& row : rows) {
    auto value = resolve_path(row, path);
    if (value.has_value()) sample.add(*value);
  }
  return sample;
}

double sample_variance(const NumericSample& sample) {
  if (sample.size() < 2) return 0.0;
  double mean = 0.0;
  for (double v : sample.values) mean += v;
  mean /= static_cast<double>(sample.size());
  double squares = 0.0;
  for (double v : sample.values) squares += (v - mean) * (v - mean);
  return squares / static_cast<double>(sample.size() - 1);
}

}  // namespace

Value apply_aggregate(AggregateFunction function, const std::string& field, const std::vector<Row>& rows) {
  if (function == AggregateFunction::Count) {
    if (field == "*") return Value::integer(static_cast<int64_t>(rows.size()));
    std::vector<std::string> path = split_path(field);
    int64_t count = 0;
    for (const auto& row : rows) {
      auto value = resolve_path(row, path);
      if (value.has_value() && !value->is_null()) ++count;
    }
    return Value::integer(count);
  }

  NumericSample sample = collect(field, rows);
  if (sample.empty()) return Value::null();

  switch (function) {
    case AggregateFunction::Sum: {
      if (sample.all_integral) {
        int64_t total = 0;
        bool overflowed = false;
        for (int64_t v : sample.ints) {
          if ((v > 0 && total > std::numeric_limits<int64_t>::max() - v) ||
              (v < 0 && total < std::numeric_limits<int64_t>::min() - v)) {
            overflowed = true;
            break;
          }
          total += v;
        }
        // Out-of-range integer sums are reported as a float total.
        if (!overflowed) return Value::integer(total);
      }
      double total = 0.0;
      for (double v : sample.values) total += v;
      return Value::floating(total);
    }
    case AggregateFunction::Avg: {
      double total = 0.0;
      for (double v : sample.values) total += v;
      return Value::floating(total / static_cast<double>(sample.size()));
    }
    case AggregateFunction::Min:
      if (sample.all_integral) {
        return Value::integer(*std::min_element(sample.ints.begin(), sample.ints.end()));
      }
      return Value::floating(*std::min_element(sample.values.begin(), sample.values.end()));
    case AggregateFunction::Max:
      if (sample.all_integral) {
        return Value::integer(*std::max_element(sample.ints.begin(), sample.ints.end()));
      }
      return Value::floating(*std::max_element(sample.values.begin(), sample.values.end()));
    case AggregateFunction::Variance:
      return Value::floating(sample_variance(sample));
    case AggregateFunction::Stddev:
      return Value::floating(std::sqrt(sample_variance(sample)));
    case AggregateFunction::Count:
      break;
  }
  return Value::null();
}

Value apply_aggregate(const std::string& function, const std::string& field, const std::vector<Row>& rows) {
  auto parsed = aggregate_from_name(function);
  if (!parsed.has_value()) {
    throw SyntaxError("Unsupported aggregate function: " + util::to_upper(function));
  }
  return apply_aggregate(*parsed, field, rows);
}

}  // namespace sceneql
