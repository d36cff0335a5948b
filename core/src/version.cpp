#include "sceneql/version.h"

#ifndef SCENEQL_VERSION
#define SCENEQL_VERSION "0.0.0"
#endif

#ifndef SCENEQL_GIT_COMMIT
#define SCENEQL_GIT_COMMIT "unknown"
#endif

#ifndef SCENEQL_GIT_DIRTY
#define SCENEQL_GIT_DIRTY 0
#endif

namespace sceneql {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = SCENEQL_VERSION;
  info.git_commit = SCENEQL_GIT_COMMIT;
  info.git_dirty = (SCENEQL_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace sceneql
