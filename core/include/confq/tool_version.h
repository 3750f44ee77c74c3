#pragma once

#include <string>

namespace confq {

/// Dotted numeric version of the external query tool.
/// Pre-release and build suffixes are dropped at parse time.
struct Version {
  int major = 0;
  int minor = 0;
  int patch = 0;
};

bool operator==(const Version& a, const Version& b);
bool operator!=(const Version& a, const Version& b);
bool operator<(const Version& a, const Version& b);

/// Extracts the first dotted numeric token from free-form text such as
/// "yq (https://github.com/mikefarah/yq/) version v4.52.2" or "1.2.3-rc1".
/// Missing minor/patch components default to 0.
/// MUST throw VersionParseError when no numeric token exists.
Version parse_version(const std::string& raw);

/// Returns true when v >= min, comparing components left to right.
bool meets_minimum(const Version& v, const Version& min);

/// Renders "v<major>.<minor>.<patch>", the release tag spelling.
std::string to_string(const Version& v);

}  // namespace confq
