#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "confq/binary_locator.h"
#include "confq/checksums.h"
#include "confq/downloader.h"
#include "confq/platform.h"
#include "confq/tool_version.h"

namespace confq {

struct FetcherOptions {
  std::string cache_dir;
  int max_attempts = 3;
  std::chrono::milliseconds backoff_base{500};
  std::chrono::milliseconds timeout{60000};
  /// Download the release "checksums" manifest when no pinned record exists.
  bool allow_remote_checksums = true;
  bool prune_old_versions = true;
};

/// Exclusive advisory lock on a file, held for the object's lifetime.
/// Serializes installs of one version across processes.
class FileLock {
 public:
  /// Blocks until the lock is acquired unless `wait` is false, in which case held()
  /// reports whether another holder was present.
  /// MUST throw BinaryFetchError when the lock file cannot be opened or locked.
  explicit FileLock(const std::filesystem::path& path, bool wait = true);
  ~FileLock();
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool held() const { return fd_ >= 0; }

 private:
  int fd_ = -1;
};

/// URL of the release "checksums" manifest that sits beside the descriptor's asset.
std::string checksums_manifest_url(const BinaryDescriptor& descriptor, const Version& version);

/// Downloads, verifies, and installs a pinned release into the cache.
/// A binary is never made executable or moved into place before its digest matches.
class BinaryFetcher {
 public:
  BinaryFetcher(FetcherOptions options,
                ChecksumTable checksums,
                std::shared_ptr<Downloader> downloader);

  /// Installs `version` for `descriptor` under the cache root and returns it with
  /// source=downloaded (or source=cache when another process finished first).
  /// MUST throw ChecksumVerificationError after two mismatching downloads and
  /// BinaryFetchError when downloads fail max_attempts times or no digest is known.
  ResolvedBinary fetch(const BinaryDescriptor& descriptor, const Version& version);

  /// Pinned record for (version, platform); consults the remote manifest when allowed.
  ChecksumRecord checksum_for(const BinaryDescriptor& descriptor, const Version& version);

  /// Removes cached versions of the descriptor's platform other than `keep`, skipping any
  /// whose install lock is held by another fetch.
  /// Returns how many version directories were removed. Never throws.
  size_t prune_other_versions(const BinaryDescriptor& descriptor, const Version& keep) const;

  const FetcherOptions& options() const { return options_; }

 private:
  std::string download_with_retry(const std::string& url);
  /// Writes bytes to a temp file beside dest and moves it into place only when its
  /// digest matches. Returns false (temp file removed) on mismatch.
  bool install_verified(const std::filesystem::path& dest,
                        const std::string& bytes,
                        const std::string& expected_sha256,
                        std::string& actual_sha256);

  FetcherOptions options_;
  std::mutex checksums_mutex_;
  ChecksumTable checksums_;
  std::shared_ptr<Downloader> downloader_;
};

}  // namespace confq
