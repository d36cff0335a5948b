#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "sceneql/sceneql.h"
#include "sceneql/value.h"

namespace sceneql {

/// JSON type used at every boundary; ordered so object keys keep document order.
using Json = nlohmann::ordered_json;

/// Converts parsed JSON into a Value tree.
/// MUST keep object key order; unsigned integers beyond int64 become Float.
Value value_from_json(const Json& json);
/// Converts a Value tree into JSON. Non-finite floats become null.
Json value_to_json(const Value& value);
/// Compact JSON text of a value, used for container cells in CSV and table output.
std::string to_json_text(const Value& value);
/// Serializes a response as {status, format, count, data | error}.
Json response_to_json(const QueryResponse& response);

}  // namespace sceneql
