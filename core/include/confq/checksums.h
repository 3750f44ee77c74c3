#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "confq/tool_version.h"

namespace confq {

/// Known-good SHA-256 for one (version, platform) artifact.
struct ChecksumRecord {
  Version version;
  std::string platform_key;
  std::string sha256;
};

/// Immutable lookup of pinned artifact checksums.
/// Built once at construction; lookups never mutate it.
class ChecksumTable {
 public:
  ChecksumTable() = default;
  explicit ChecksumTable(const std::vector<ChecksumRecord>& records);

  /// Records shipped for the default pinned release.
  static ChecksumTable bundled_defaults();

  std::optional<ChecksumRecord> find(const Version& version,
                                     const std::string& platform_key) const;
  bool empty() const { return records_.empty(); }
  size_t size() const { return records_.size(); }

  /// Returns a new table holding this table's records plus `extra`.
  /// Existing records win on conflict.
  ChecksumTable merged_with(const std::vector<ChecksumRecord>& extra) const;

 private:
  std::map<std::pair<std::string, std::string>, ChecksumRecord> records_;
};

/// Default pinned release of the query tool.
Version default_pinned_version();

/// Maps a release asset name ("yq_linux_amd64", "yq_windows_amd64.exe") to its
/// platform key, or nullopt for assets that are not raw binaries.
std::optional<std::string> platform_key_for_asset(const std::string& asset);

/// Parses the release "checksums" manifest. Each line lists the asset name followed by
/// one digest per algorithm; the SHA-256 digest is field 18 (0-based) and lines with
/// fewer than 19 fields are skipped.
std::vector<ChecksumRecord> parse_release_checksums(const std::string& manifest,
                                                   const Version& version);

}  // namespace confq
