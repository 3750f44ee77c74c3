#include "confq/version.h"

#ifndef CONFQ_VERSION
#define CONFQ_VERSION "0.0.0"
#endif

#ifndef CONFQ_GIT_COMMIT
#define CONFQ_GIT_COMMIT "unknown"
#endif

#ifndef CONFQ_GIT_DIRTY
#define CONFQ_GIT_DIRTY 0
#endif

namespace confq {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = CONFQ_VERSION;
  info.git_commit = CONFQ_GIT_COMMIT;
  info.git_dirty = (CONFQ_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace confq
