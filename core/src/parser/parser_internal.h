#pragma once

#include <optional>
#include <string>

namespace sceneql {

/// A `name(arg)` expression as written in a projection or ORDER BY item.
struct CallExpr {
  std::string name;
  std::string arg;
};

/// Matches `identifier ( arg )` with optional inner whitespace; arg is trimmed.
std::optional<CallExpr> match_call(const std::string& text);

/// Canonical aggregate column name, e.g. `SUM(stats.verts)`.
std::string aggregate_alias(const std::string& function_upper, const std::string& field);

}  // namespace sceneql
