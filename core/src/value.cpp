#include "sceneql/value.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "sceneql/json.h"

namespace sceneql {

namespace {

bool is_numeric_kind(const Value& value) {
  return value.is_number() || value.is_bool();
}

Ordering compare_doubles(double left, double right) {
  if (left < right) return Ordering::Less;
  if (left > right) return Ordering::Greater;
  return Ordering::Equal;
}

Ordering compare_strings(const std::string& left, const std::string& right) {
  int cmp = left.compare(right);
  if (cmp < 0) return Ordering::Less;
  if (cmp > 0) return Ordering::Greater;
  return Ordering::Equal;
}

}  // namespace

Value Value::null() { return Value(); }

Value Value::boolean(bool value) {
  Value out;
  out.kind_ = Kind::Bool;
  out.bool_value_ = value;
  return out;
}

Value Value::integer(int64_t value) {
  Value out;
  out.kind_ = Kind::Int;
  out.int_value_ = value;
  return out;
}

Value Value::floating(double value) {
  Value out;
  out.kind_ = Kind::Float;
  out.float_value_ = value;
  return out;
}

Value Value::string(std::string value) {
  Value out;
  out.kind_ = Kind::String;
  out.string_value_ = std::move(value);
  return out;
}

Value Value::sequence(Sequence values) {
  Value out;
  out.kind_ = Kind::Sequence;
  out.sequence_value_ = std::make_shared<const Sequence>(std::move(values));
  return out;
}

Value Value::map(Map fields) {
  Value out;
  out.kind_ = Kind::Map;
  out.map_value_ = std::make_shared<const Map>(std::move(fields));
  return out;
}

double Value::as_float() const {
  switch (kind_) {
    case Kind::Float:
      return float_value_;
    case Kind::Int:
      return static_cast<double>(int_value_);
    case Kind::Bool:
      return bool_value_ ? 1.0 : 0.0;
    default:
      return 0.0;
  }
}

const Sequence& Value::as_sequence() const {
  if (kind_ != Kind::Sequence || !sequence_value_) {
    throw std::logic_error("Value is not a sequence");
  }
  return *sequence_value_;
}

const Map& Value::as_map() const {
  if (kind_ != Kind::Map || !map_value_) {
    throw std::logic_error("Value is not a map");
  }
  return *map_value_;
}

Map::Map(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    set(entry.first, entry.second);
  }
}

const Value* Map::find(const std::string& key) const {
  for (const auto& entry : entries_) {
    if (entry.first == key) return &entry.second;
  }
  return nullptr;
}

void Map::set(const std::string& key, Value value) {
  for (auto& entry : entries_) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  entries_.emplace_back(key, std::move(value));
}

std::vector<std::string> Map::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    out.push_back(entry.first);
  }
  return out;
}

bool values_equal(const Value& left, const Value& right) {
  // Bool counts as 0/1 against numbers, matching compare_values.
  if (is_numeric_kind(left) && is_numeric_kind(right) && (left.is_number() || right.is_number())) {
    if (left.is_int() && right.is_int()) return left.as_int() == right.as_int();
    return left.as_float() == right.as_float();
  }
  if (left.kind() != right.kind()) return false;
  switch (left.kind()) {
    case Value::Kind::Null:
      return true;
    case Value::Kind::Bool:
      return left.as_bool() == right.as_bool();
    case Value::Kind::String:
      return left.as_string() == right.as_string();
    case Value::Kind::Sequence: {
      const Sequence& a = left.as_sequence();
      const Sequence& b = right.as_sequence();
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); ++i) {
        if (!values_equal(a[i], b[i])) return false;
      }
      return true;
    }
    case Value::Kind::Map: {
      const Map& a = left.as_map();
      const Map& b = right.as_map();
      if (a.size() != b.size()) return false;
      for (const auto& entry : a) {
        const Value* other = b.find(entry.first);
        if (!other || !values_equal(entry.second, *other)) return false;
      }
      return true;
    }
    default:
      return false;
  }
}

bool operator==(const Value& left, const Value& right) { return values_equal(left, right); }

bool operator!=(const Value& left, const Value& right) { return !values_equal(left, right); }

std::optional<Ordering> compare_values(const Value& left, const Value& right) {
  if (is_numeric_kind(left) && is_numeric_kind(right)) {
    if (left.is_int() && right.is_int()) {
      if (left.as_int() < right.as_int()) return Ordering::Less;
      if (left.as_int() > right.as_int()) return Ordering::Greater;
      return Ordering::Equal;
    }
    return compare_doubles(left.as_float(), right.as_float());
  }
  if (left.is_string() && right.is_string()) {
    return compare_strings(left.as_string(), right.as_string());
  }
  if (left.is_sequence() && right.is_sequence()) {
    const Sequence& a = left.as_sequence();
    const Sequence& b = right.as_sequence();
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
      if (values_equal(a[i], b[i])) continue;
      return compare_values(a[i], b[i]);
    }
    if (a.size() < b.size()) return Ordering::Less;
    if (a.size() > b.size()) return Ordering::Greater;
    return Ordering::Equal;
  }
  return std::nullopt;
}

std::string format_float(double value) {
  if (std::isnan(value)) return "nan";
  if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
  char buffer[40];
  for (int precision = 0; precision < 17; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*e", precision, value);
    if (std::strtod(buffer, nullptr) == value) break;
  }
  // buffer holds "[-]d[.ddd]e[+-]xx" with the fewest digits that round-trip.
  std::string text(buffer);
  std::string sign;
  size_t pos = 0;
  if (text[pos] == '-') {
    sign = "-";
    ++pos;
  }
  size_t e_pos = text.find('e', pos);
  std::string digits;
  for (size_t i = pos; i < e_pos; ++i) {
    if (text[i] != '.') digits += text[i];
  }
  int exponent = std::atoi(text.c_str() + e_pos + 1);
  while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

  if (exponent >= -4 && exponent < 16) {
    std::string out = sign;
    if (exponent < 0) {
      out += "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
      return out;
    }
    size_t int_len = static_cast<size_t>(exponent) + 1;
    if (digits.size() <= int_len) {
      out += digits + std::string(int_len - digits.size(), '0') + ".0";
    } else {
      out += digits.substr(0, int_len) + "." + digits.substr(int_len);
    }
    return out;
  }

  std::string out = sign + digits.substr(0, 1);
  if (digits.size() > 1) out += "." + digits.substr(1);
  int magnitude = exponent < 0 ? -exponent : exponent;
  out += exponent < 0 ? "e-" : "e+";
  if (magnitude < 10) out += "0";
  out += std::to_string(magnitude);
  return out;
}

std::string to_text(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::Null:
      return "";
    case Value::Kind::Bool:
      return value.as_bool() ? "true" : "false";
    case Value::Kind::Int:
      return std::to_string(value.as_int());
    case Value::Kind::Float:
      return format_float(value.as_float());
    case Value::Kind::String:
      return value.as_string();
    case Value::Kind::Sequence:
    case Value::Kind::Map:
      return to_json_text(value);
  }
  return "";
}

std::string canonical_key(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::Null:
      return "n";
    case Value::Kind::Bool:
      return value.as_bool() ? "#1" : "#0";
    case Value::Kind::Int:
      return "#" + std::to_string(value.as_int());
    case Value::Kind::Float: {
      // Integral floats share the Int key so 2 and 2.0 land in one group.
      double d = value.as_float();
      if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.2e18) {
        return "#" + std::to_string(static_cast<int64_t>(d));
      }
      return "#" + format_float(d);
    }
    case Value::Kind::String:
      return "s" + std::to_string(value.as_string().size()) + ":" + value.as_string();
    case Value::Kind::Sequence: {
      std::string out = "[";
      for (const auto& item : value.as_sequence()) {
        out += canonical_key(item);
        out += ",";
      }
      out += "]";
      return out;
    }
    case Value::Kind::Map: {
      std::vector<std::string> parts;
      for (const auto& entry : value.as_map()) {
        parts.push_back(std::to_string(entry.first.size()) + ":" + entry.first + "=" +
                        canonical_key(entry.second));
      }
      std::sort(parts.begin(), parts.end());
      std::string out = "{";
      for (const auto& part : parts) {
        out += part;
        out += ",";
      }
      out += "}";
      return out;
    }
  }
  return "";
}

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t dot = path.find('.', start);
    if (dot == std::string::npos) {
      out.push_back(path.substr(start));
      break;
    }
    out.push_back(path.substr(start, dot - start));
    start = dot + 1;
  }
  return out;
}

std::optional<Value> resolve_path(const Row& row, const std::vector<std::string>& segments) {
  if (segments.empty()) return std::nullopt;
  const Value* current = row.find(segments[0]);
  if (!current) return std::nullopt;
  for (size_t i = 1; i < segments.size(); ++i) {
    if (!current->is_map()) return std::nullopt;
    current = current->as_map().find(segments[i]);
    if (!current) return std::nullopt;
  }
  return *current;
}

std::optional<Value> resolve_path(const Row& row, const std::string& path) {
  return resolve_path(row, split_path(path));
}

}  // namespace sceneql
