#include "ast.h"

#include "../util/string_util.h"

namespace sceneql {

const char* aggregate_name(AggregateFunction function) {
  switch (function) {
    case AggregateFunction::Count:
      return "COUNT";
    case AggregateFunction::Sum:
      return "SUM";
    case AggregateFunction::Avg:
      return "AVG";
    case AggregateFunction::Min:
      return "MIN";
    case AggregateFunction::Max:
      return "MAX";
    case AggregateFunction::Stddev:
      return "STDDEV";
    case AggregateFunction::Variance:
      return "VARIANCE";
  }
  return "COUNT";
}

std::optional<AggregateFunction> aggregate_from_name(const std::string& name) {
  std::string upper = util::to_upper(name);
  if (upper == "COUNT") return AggregateFunction::Count;
  if (upper == "SUM") return AggregateFunction::Sum;
  if (upper == "AVG") return AggregateFunction::Avg;
  if (upper == "MIN") return AggregateFunction::Min;
  if (upper == "MAX") return AggregateFunction::Max;
  if (upper == "STDDEV") return AggregateFunction::Stddev;
  if (upper == "VARIANCE") return AggregateFunction::Variance;
  return std::nullopt;
}

}  // namespace sceneql
