#include "confq/binary_locator.h"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

#include "confq/errors.h"
#include "confq/logging.h"
#include "confq/sha256.h"
#include "confq/subprocess.h"
#include "util/fs_util.h"
#include "util/string_util.h"

namespace confq {

namespace {

namespace fs = std::filesystem;

constexpr std::chrono::milliseconds kProbeTimeout{5000};

#if defined(_WIN32)
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

}  // namespace

const char* binary_source_name(BinarySource source) {
  switch (source) {
    case BinarySource::Override:
      return "override";
    case BinarySource::System:
      return "system";
    case BinarySource::Cache:
      return "cache";
    case BinarySource::Bundled:
      return "bundled";
    case BinarySource::Downloaded:
      return "downloaded";
  }
  return "unknown";
}

std::optional<Version> probe_tool_version(const std::string& path) {
  ProcessOptions options;
  options.timeout = kProbeTimeout;
  ProcessResult result;
  try {
    result = run_process({path, "--version"}, options);
  } catch (const ProcessSpawnError& ex) {
    log::logger()->debug("Cannot run candidate {}: {}", path, ex.what());
    return std::nullopt;
  }
  if (result.timed_out || result.exit_code != 0) {
    log::logger()->debug("Candidate {} failed --version (exit {}, timed out {})", path,
                         result.exit_code, result.timed_out);
    return std::nullopt;
  }
  const std::string& output = result.stdout_data;
  if (output.find(kToolIdentity) == std::string::npos) {
    log::logger()->info("Skipping {}: not {} (reported '{}')", path, kToolIdentity,
                        util::trim_ws(output));
    return std::nullopt;
  }
  // Skip past the identity URL so its digits cannot be mistaken for the version.
  size_t marker = output.find("version");
  std::string tail = marker == std::string::npos ? output : output.substr(marker);
  try {
    return parse_version(tail);
  } catch (const VersionParseError& ex) {
    log::logger()->info("Skipping {}: {}", path, ex.what());
    return std::nullopt;
  }
}

fs::path cache_binary_path(const std::string& cache_root,
                           const BinaryDescriptor& descriptor,
                           const Version& version) {
  return fs::path(cache_root) / descriptor.platform_key / to_string(version) / descriptor.binary_name;
}

fs::path checksum_marker_path(const fs::path& binary) {
  return fs::path(binary.string() + ".sha256");
}

bool validate_cached_binary(const fs::path& binary, const std::string& expected_sha256) {
  std::error_code ec;
  if (!fs::is_regular_file(binary, ec) || ec) return false;
  const fs::path marker = checksum_marker_path(binary);
  std::string recorded;
  if (util::read_file(marker, recorded) && util::trim_ws(recorded) == expected_sha256) {
    return true;
  }
  std::string actual;
  try {
    actual = sha256_file_hex(binary.string());
  } catch (const std::exception& ex) {
    log::logger()->warn("Cannot hash cached binary {}: {}", binary.string(), ex.what());
    return false;
  }
  if (actual != expected_sha256) {
    log::logger()->warn("Cached binary {} does not match its checksum", binary.string());
    return false;
  }
  try {
    util::write_file_atomic(marker, actual + "\n");
  } catch (const std::exception& ex) {
    log::logger()->warn("Cannot refresh checksum marker {}: {}", marker.string(), ex.what());
  }
  return true;
}

BinaryLocator::BinaryLocator(BinaryDescriptor descriptor,
                             LocatorOptions options,
                             ChecksumTable checksums,
                             VersionProbe probe)
    : descriptor_(std::move(descriptor)),
      options_(std::move(options)),
      checksums_(std::move(checksums)),
      probe_(std::move(probe)) {}

std::optional<ResolvedBinary> BinaryLocator::locate(const Version& min_version) const {
  if (auto found = find_on_search_path(min_version)) return found;
  if (auto found = find_in_cache(min_version)) return found;
  if (auto found = find_bundled(min_version)) return found;
  log::logger()->info("No local {} >= {} found", descriptor_.binary_name, to_string(min_version));
  return std::nullopt;
}

std::optional<ResolvedBinary> BinaryLocator::accept(const std::string& path,
                                                    BinarySource source,
                                                    const Version& min_version) const {
  std::optional<Version> version = probe_(path);
  if (!version.has_value()) return std::nullopt;
  if (!meets_minimum(*version, min_version)) {
    log::logger()->info("Skipping {} {}: need >= {}", path, to_string(*version),
                        to_string(min_version));
    return std::nullopt;
  }
  log::logger()->debug("Using {} binary {} ({})", binary_source_name(source), path,
                       to_string(*version));
  return ResolvedBinary{path, *version, source};
}

std::optional<ResolvedBinary> BinaryLocator::find_on_search_path(const Version& min_version) const {
  std::set<std::string> seen;
  for (const auto& dir : util::split_trimmed(options_.search_path, kPathListSeparator)) {
    fs::path candidate = fs::path(dir) / descriptor_.binary_name;
    if (!util::is_executable_file(candidate)) continue;
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(candidate, ec);
    if (!seen.insert(ec ? candidate.string() : canonical.string()).second) continue;
    if (auto found = accept(candidate.string(), BinarySource::System, min_version)) {
      return found;
    }
  }
  return std::nullopt;
}

std::optional<ResolvedBinary> BinaryLocator::find_in_cache(const Version& min_version) const {
  if (options_.cache_dir.empty()) return std::nullopt;
  const fs::path platform_dir = fs::path(options_.cache_dir) / descriptor_.platform_key;
  std::error_code ec;
  if (!fs::is_directory(platform_dir, ec)) return std::nullopt;

  std::vector<Version> versions;
  for (fs::directory_iterator it(platform_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_directory(ec)) continue;
    const std::string name = it->path().filename().string();
    try {
      Version v = parse_version(name);
      if (to_string(v) != name) continue;
      if (meets_minimum(v, min_version)) versions.push_back(v);
    } catch (const VersionParseError&) {
      log::logger()->debug("Ignoring non-version cache entry {}", it->path().string());
    }
  }
  std::sort(versions.begin(), versions.end(),
            [](const Version& a, const Version& b) { return b < a; });

  for (const auto& version : versions) {
    const fs::path binary = cache_binary_path(options_.cache_dir, descriptor_, version);
    std::string expected;
    if (auto record = checksums_.find(version, descriptor_.platform_key)) {
      expected = record->sha256;
    } else if (util::read_file(checksum_marker_path(binary), expected)) {
      // No pinned record: trust only a binary that still matches what was verified at install.
      expected = util::trim_ws(expected);
      std::string actual;
      try {
        actual = sha256_file_hex(binary.string());
      } catch (const std::exception& ex) {
        log::logger()->warn("Cannot hash cached binary {}: {}", binary.string(), ex.what());
        continue;
      }
      if (actual != expected) {
        log::logger()->warn("Cached binary {} does not match its marker", binary.string());
        continue;
      }
    } else {
      log::logger()->debug("Skipping unverifiable cache entry {}", binary.string());
      continue;
    }
    if (!validate_cached_binary(binary, expected)) continue;
    if (auto found = accept(binary.string(), BinarySource::Cache, min_version)) {
      return found;
    }
  }
  return std::nullopt;
}

std::optional<ResolvedBinary> BinaryLocator::find_bundled(const Version& min_version) const {
  if (options_.bundled_dir.empty()) return std::nullopt;
  fs::path candidate = fs::path(options_.bundled_dir) / descriptor_.binary_name;
  if (!util::is_executable_file(candidate)) {
    candidate = fs::path(options_.bundled_dir) / descriptor_.filename;
    if (!util::is_executable_file(candidate)) return std::nullopt;
  }
  return accept(candidate.string(), BinarySource::Bundled, min_version);
}

}  // namespace confq
