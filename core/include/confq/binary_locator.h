#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "confq/checksums.h"
#include "confq/platform.h"
#include "confq/tool_version.h"

namespace confq {

enum class BinarySource { Override, System, Cache, Bundled, Downloaded };

const char* binary_source_name(BinarySource source);

/// A usable query tool binary. Never mutated once produced.
struct ResolvedBinary {
  std::string path;
  Version version;
  BinarySource source = BinarySource::System;
};

/// Runs a candidate and reports its version, or nullopt when the candidate is not
/// the expected tool or does not report a parseable version.
using VersionProbe = std::function<std::optional<Version>(const std::string& path)>;

/// Identity string printed by "yq --version" for the supported implementation.
constexpr const char* kToolIdentity = "mikefarah/yq";

/// Default probe: "<path> --version" with a short timeout; requires kToolIdentity in
/// the output so an unrelated program named "yq" is never accepted.
std::optional<Version> probe_tool_version(const std::string& path);

/// {cache_root}/{platform_key}/{version}/{binary_name}
std::filesystem::path cache_binary_path(const std::string& cache_root,
                                        const BinaryDescriptor& descriptor,
                                        const Version& version);
/// Sidecar holding the verified hex digest: "<binary>.sha256".
std::filesystem::path checksum_marker_path(const std::filesystem::path& binary);

/// Checks a cached binary against an expected digest. A matching marker skips hashing;
/// otherwise the binary is re-hashed and the marker refreshed on success.
bool validate_cached_binary(const std::filesystem::path& binary, const std::string& expected_sha256);

struct LocatorOptions {
  std::string search_path;
  std::string cache_dir;
  std::string bundled_dir;
};

/// Searches local candidates in priority order: search path, cache, bundled copy.
/// Candidates failing identity, checksum, or version checks are skipped, not fatal.
class BinaryLocator {
 public:
  BinaryLocator(BinaryDescriptor descriptor,
                LocatorOptions options,
                ChecksumTable checksums,
                VersionProbe probe = probe_tool_version);

  /// Returns the first candidate whose version meets min_version, or nullopt after
  /// every candidate was tried. Performs no network access.
  std::optional<ResolvedBinary> locate(const Version& min_version) const;

  std::optional<ResolvedBinary> find_on_search_path(const Version& min_version) const;
  std::optional<ResolvedBinary> find_in_cache(const Version& min_version) const;
  std::optional<ResolvedBinary> find_bundled(const Version& min_version) const;

  const BinaryDescriptor& descriptor() const { return descriptor_; }
  const LocatorOptions& options() const { return options_; }

 private:
  std::optional<ResolvedBinary> accept(const std::string& path,
                                       BinarySource source,
                                       const Version& min_version) const;

  BinaryDescriptor descriptor_;
  LocatorOptions options_;
  ChecksumTable checksums_;
  VersionProbe probe_;
};

}  // namespace confq
