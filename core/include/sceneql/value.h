#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sceneql {

class Value;
class Map;

using Sequence = std::vector<Value>;

/// Dynamic field value shared by table providers, literals and results.
/// MUST be immutable once constructed; sequence and map payloads are shared on copy.
/// Inputs are the factory arguments; accessors never mutate and never allocate.
class Value {
 public:
  enum class Kind { Null, Bool, Int, Float, String, Sequence, Map };

  Value() = default;

  static Value null();
  static Value boolean(bool value);
  static Value integer(int64_t value);
  static Value floating(double value);
  static Value string(std::string value);
  static Value sequence(Sequence values);
  static Value map(Map fields);

  Kind kind() const { return kind_; }
  bool is_null() const { return kind_ == Kind::Null; }
  bool is_bool() const { return kind_ == Kind::Bool; }
  bool is_int() const { return kind_ == Kind::Int; }
  bool is_float() const { return kind_ == Kind::Float; }
  bool is_number() const { return kind_ == Kind::Int || kind_ == Kind::Float; }
  bool is_string() const { return kind_ == Kind::String; }
  bool is_sequence() const { return kind_ == Kind::Sequence; }
  bool is_map() const { return kind_ == Kind::Map; }

  bool as_bool() const { return bool_value_; }
  int64_t as_int() const { return int_value_; }
  /// Returns the numeric payload widened to double (Int and Bool included).
  double as_float() const;
  const std::string& as_string() const { return string_value_; }
  /// MUST only be called on Sequence values; throws std::logic_error otherwise.
  const Sequence& as_sequence() const;
  /// MUST only be called on Map values; throws std::logic_error otherwise.
  const Map& as_map() const;

 private:
  Kind kind_ = Kind::Null;
  bool bool_value_ = false;
  int64_t int_value_ = 0;
  double float_value_ = 0.0;
  std::string string_value_;
  std::shared_ptr<const Sequence> sequence_value_;
  std::shared_ptr<const Map> map_value_;
};

/// String-keyed map that iterates in insertion order.
/// MUST keep keys unique; set() replaces in place so column order stays stable.
class Map {
 public:
  using Entry = std::pair<std::string, Value>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Map() = default;
  Map(std::initializer_list<Entry> entries);

  const Value* find(const std::string& key) const;
  bool contains(const std::string& key) const { return find(key) != nullptr; }
  void set(const std::string& key, Value value);
  std::vector<std::string> keys() const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<Entry> entries_;
};

/// One record of a table.
using Row = Map;

/// Result of comparing two orderable values.
enum class Ordering { Less, Equal, Greater };

/// Deep equality; Int and Float compare numerically, maps ignore key order.
bool values_equal(const Value& left, const Value& right);
bool operator==(const Value& left, const Value& right);
bool operator!=(const Value& left, const Value& right);

/// Orders numbers (Bool counts as 0/1), strings, and sequences element-wise.
/// Returns nullopt when the two values are not mutually orderable.
std::optional<Ordering> compare_values(const Value& left, const Value& right);

/// Text form used for string fallbacks and LIKE matching.
/// Null is empty, floats use the shortest round-trip form, containers are JSON text.
std::string to_text(const Value& value);
/// Shortest round-trip decimal text: fixed notation with a fraction for 1e-4 <= |x| < 1e16,
/// exponent notation (`1e+16`) outside that range.
std::string format_float(double value);
/// Stable key for hashing, equal for values_equal() values.
std::string canonical_key(const Value& value);

/// Splits a dotted field path into its segments.
std::vector<std::string> split_path(const std::string& path);
/// Walks dotted segments through nested maps.
/// Returns nullopt when any segment is missing or traverses a non-map.
std::optional<Value> resolve_path(const Row& row, const std::vector<std::string>& segments);
std::optional<Value> resolve_path(const Row& row, const std::string& path);

}  // namespace sceneql
