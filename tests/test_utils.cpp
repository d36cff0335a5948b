#include "test_utils.h"

#include "sceneql/json.h"

sceneql::MemoryTableProvider make_scene_provider() {
  return sceneql::MemoryTableProvider::from_json_text(R"({
    "objects": [
      {"name": "A", "type": "MESH", "visible": true,
       "stats": {"verts": 8, "faces": 6}, "location": [0.0, 0.0, 1.5]},
      {"name": "B", "type": "MESH", "visible": false,
       "stats": {"verts": 24, "faces": 12}, "location": [2.0, 0.0, 0.0]},
      {"name": "C", "type": "LIGHT", "visible": true,
       "stats": null, "location": [0.0, 4.0, 3.0]}
    ],
    "materials": [
      {"name": "Steel", "users": 2},
      {"name": "Glass", "users": 0}
    ]
  })");
}

std::vector<sceneql::Row> rows_from_json(const std::string& json_array) {
  sceneql::Value parsed = sceneql::value_from_json(sceneql::Json::parse(json_array));
  std::vector<sceneql::Row> rows;
  for (const auto& item : parsed.as_sequence()) {
    rows.push_back(item.as_map());
  }
  return rows;
}

sceneql::QueryResponse run_scene_query(const std::string& query) {
  sceneql::MemoryTableProvider provider = make_scene_provider();
  return sceneql::execute_query(query, 0, "json", provider);
}

std::vector<sceneql::Row> response_rows(const sceneql::QueryResponse& response) {
  std::vector<sceneql::Row> rows;
  if (!response.ok() || !response.data.has_value() || !response.data->is_sequence()) {
    return rows;
  }
  for (const auto& item : response.data->as_sequence()) {
    rows.push_back(item.as_map());
  }
  return rows;
}

std::string field_text(const sceneql::Row& row, const std::string& field) {
  const sceneql::Value* value = row.find(field);
  if (!value) return "<absent>";
  return sceneql::to_text(*value);
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}
