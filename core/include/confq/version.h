#pragma once

#include <string>

namespace confq {

/// Build version and source provenance of confq itself (not of the query tool).
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance.
/// MUST not perform IO.
VersionInfo get_version_info();
/// Returns "<version> (<commit>[-dirty])".
std::string version_string();

}  // namespace confq
