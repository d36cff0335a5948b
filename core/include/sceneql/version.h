#pragma once

#include <string>

namespace sceneql {

/// Build version and source provenance of the core library.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current core build.
/// MUST not perform IO and MUST be safe to call frequently.
VersionInfo get_version_info();
/// Returns "<version> (<commit>[-dirty])".
std::string version_string();

}  // namespace sceneql
