#include "sceneql/json.h"

#include <cmath>
#include <cstdint>
#include <limits>

namespace sceneql {

Value value_from_json(const Json& json) {
  switch (json.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
      return Value::null();
    case Json::value_t::boolean:
      return Value::boolean(json.get<bool>());
    case Json::value_t::number_integer:
      return Value::integer(json.get<int64_t>());
    case Json::value_t::number_unsigned: {
      uint64_t raw = json.get<uint64_t>();
      if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Value::floating(static_cast<double>(raw));
      }
      return Value::integer(static_cast<int64_t>(raw));
    }
    case Json::value_t::number_float:
      return Value::floating(json.get<double>());
    case Json::value_t::string:
      return Value::string(json.get<std::string>());
    case Json::value_t::array: {
      Sequence items;
      items.reserve(json.size());
      for (const auto& item : json) {
        items.push_back(value_from_json(item));
      }
      return Value::sequence(std::move(items));
    }
    case Json::value_t::object: {
      Map fields;
      for (auto it = json.begin(); it != json.end(); ++it) {
        fields.set(it.key(), value_from_json(it.value()));
      }
      return Value::map(std::move(fields));
    }
    case Json::value_t::binary:
      return Value::null();
  }
  return Value::null();
}

Json value_to_json(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::Null:
      return nullptr;
    case Value::Kind::Bool:
      return value.as_bool();
    case Value::Kind::Int:
      return value.as_int();
    case Value::Kind::Float: {
      double d = value.as_float();
      if (!std::isfinite(d)) return nullptr;
      return d;
    }
    case Value::Kind::String:
      return value.as_string();
    case Value::Kind::Sequence: {
      Json out = Json::array();
      for (const auto& item : value.as_sequence()) {
        out.push_back(value_to_json(item));
      }
      return out;
    }
    case Value::Kind::Map: {
      Json out = Json::object();
      for (const auto& entry : value.as_map()) {
        out[entry.first] = value_to_json(entry.second);
      }
      return out;
    }
  }
  return nullptr;
}

std::string to_json_text(const Value& value) {
  // WHY: replace keeps invalid UTF-8 from provider strings from throwing mid-format.
  return value_to_json(value).dump(-1, ' ', false, Json::error_handler_t::replace);
}

Json response_to_json(const QueryResponse& response) {
  Json out = Json::object();
  out["status"] = response.ok() ? "success" : "error";
  out["format"] = response.format;
  out["count"] = response.count;
  if (response.ok()) {
    out["data"] = response.data.has_value() ? value_to_json(*response.data) : Json(nullptr);
  } else {
    out["error"] = response.error;
  }
  return out;
}

}  // namespace sceneql
