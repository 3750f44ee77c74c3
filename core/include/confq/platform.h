#pragma once

#include <string>
#include <vector>

#include "confq/tool_version.h"

namespace confq {

/// Static metadata for one published build of the query tool.
/// MUST be derived from the fixed platform table and never mutated.
struct BinaryDescriptor {
  std::string os;                     // "linux", "darwin", "windows"
  std::string arch;                   // "amd64", "arm64"
  std::string platform_key;           // "<os>-<arch>", the cache directory name
  std::string filename;               // release asset name, e.g. "yq_linux_amd64"
  std::string binary_name;            // installed file name, "yq" or "yq.exe"
  std::string download_url_template;  // contains "{version}"
  Version minimum_version;
};

/// Oldest release whose TOML output handles nested tables.
Version default_minimum_version();

/// Resolves the descriptor for the running host.
/// MUST throw UnsupportedPlatformError when no binary is published for the host.
BinaryDescriptor resolve();

/// Resolves the descriptor for an explicit OS/arch pair, normalizing common aliases
/// (x86_64, aarch64, macos, ...).
BinaryDescriptor resolve(const std::string& os, const std::string& arch);

/// Lists every supported platform key in table order.
std::vector<std::string> supported_platform_keys();

/// Substitutes the release tag into the descriptor's URL template.
std::string download_url(const BinaryDescriptor& descriptor, const Version& version);

/// Returns the host OS name as the platform table spells it.
std::string host_os();
/// Returns the raw host machine name (uname -m on POSIX).
std::string host_machine();

}  // namespace confq
