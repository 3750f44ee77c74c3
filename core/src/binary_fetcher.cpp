#include "confq/binary_fetcher.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "confq/errors.h"
#include "confq/logging.h"
#include "confq/sha256.h"
#include "util/fs_util.h"

namespace confq {

namespace {

namespace fs = std::filesystem;

constexpr int kChecksumAttempts = 2;

/// Removes the temp file on scope exit unless released.
class TempFileGuard {
 public:
  explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
  ~TempFileGuard() {
    if (path_.empty()) return;
    std::error_code ignored;
    fs::remove(path_, ignored);
  }
  void release() { path_.clear(); }

 private:
  fs::path path_;
};

}  // namespace

FileLock::FileLock(const fs::path& path, bool wait) {
  fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw BinaryFetchError("Failed to open lock file " + path.string() + ": " +
                           std::strerror(errno));
  }
  const int operation = wait ? LOCK_EX : (LOCK_EX | LOCK_NB);
  while (flock(fd_, operation) != 0) {
    if (errno == EINTR) continue;
    int code = errno;
    close(fd_);
    fd_ = -1;
    if (!wait && code == EWOULDBLOCK) return;
    throw BinaryFetchError("Failed to lock " + path.string() + ": " + std::strerror(code));
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    flock(fd_, LOCK_UN);
    close(fd_);
  }
}

std::string checksums_manifest_url(const BinaryDescriptor& descriptor, const Version& version) {
  std::string url = download_url(descriptor, version);
  size_t slash = url.rfind('/');
  if (slash == std::string::npos) return url + "/checksums";
  return url.substr(0, slash + 1) + "checksums";
}

BinaryFetcher::BinaryFetcher(FetcherOptions options,
                             ChecksumTable checksums,
                             std::shared_ptr<Downloader> downloader)
    : options_(std::move(options)),
      checksums_(std::move(checksums)),
      downloader_(std::move(downloader)) {
  if (options_.max_attempts < 1) options_.max_attempts = 1;
}

ChecksumRecord BinaryFetcher::checksum_for(const BinaryDescriptor& descriptor,
                                           const Version& version) {
  {
    std::lock_guard<std::mutex> guard(checksums_mutex_);
    if (auto record = checksums_.find(version, descriptor.platform_key)) {
      return *record;
    }
  }
  if (!options_.allow_remote_checksums) {
    throw BinaryFetchError("No pinned checksum for " + to_string(version) + " on " +
                           descriptor.platform_key + " and remote checksums are disabled");
  }
  const std::string url = checksums_manifest_url(descriptor, version);
  log::logger()->info("Fetching checksum manifest {}", url);
  const std::vector<ChecksumRecord> remote =
      parse_release_checksums(download_with_retry(url), version);

  std::lock_guard<std::mutex> guard(checksums_mutex_);
  checksums_ = checksums_.merged_with(remote);
  if (auto record = checksums_.find(version, descriptor.platform_key)) {
    return *record;
  }
  throw BinaryFetchError("Checksum manifest for " + to_string(version) + " lists no " +
                         descriptor.filename + " digest");
}

std::string BinaryFetcher::download_with_retry(const std::string& url) {
  std::string last_error;
  for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    try {
      return downloader_->download(url, options_.timeout);
    } catch (const NetworkError& ex) {
      last_error = ex.what();
      log::logger()->warn("Download attempt {}/{} failed: {}", attempt, options_.max_attempts,
                          last_error);
    }
    if (attempt < options_.max_attempts) {
      std::this_thread::sleep_for(options_.backoff_base * (1LL << (attempt - 1)));
    }
  }
  throw BinaryFetchError("Failed to download " + url + " after " +
                         std::to_string(options_.max_attempts) + " attempts: " + last_error);
}

bool BinaryFetcher::install_verified(const fs::path& dest,
                                     const std::string& bytes,
                                     const std::string& expected_sha256,
                                     std::string& actual_sha256) {
  const fs::path temp = util::unique_temp_path(dest);
  TempFileGuard guard(temp);
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw BinaryFetchError("Failed to create " + temp.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      throw BinaryFetchError("Failed to write " + temp.string());
    }
  }
  try {
    actual_sha256 = sha256_file_hex(temp.string());
  } catch (const std::exception& ex) {
    throw BinaryFetchError(ex.what());
  }
  if (actual_sha256 != expected_sha256) {
    return false;
  }

  std::error_code ec;
  fs::permissions(temp,
                  fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                      fs::perms::others_read | fs::perms::others_exec,
                  fs::perm_options::replace, ec);
  if (ec) {
    throw BinaryFetchError("Failed to mark " + temp.string() + " executable: " + ec.message());
  }
  fs::rename(temp, dest, ec);
  if (ec) {
    throw BinaryFetchError("Failed to install " + dest.string() + ": " + ec.message());
  }
  guard.release();
  return true;
}

ResolvedBinary BinaryFetcher::fetch(const BinaryDescriptor& descriptor, const Version& version) {
  if (options_.cache_dir.empty()) {
    throw BinaryFetchError("No cache directory configured for downloads");
  }
  const ChecksumRecord record = checksum_for(descriptor, version);
  const fs::path dest = cache_binary_path(options_.cache_dir, descriptor, version);

  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    throw BinaryFetchError("Failed to create " + dest.parent_path().string() + ": " +
                           ec.message());
  }

  FileLock lock(dest.parent_path() / ".lock");
  if (validate_cached_binary(dest, record.sha256)) {
    log::logger()->info("{} was installed by another process", dest.string());
    return ResolvedBinary{dest.string(), version, BinarySource::Cache};
  }

  const std::string url = download_url(descriptor, version);
  std::string actual;
  for (int attempt = 1; attempt <= kChecksumAttempts; ++attempt) {
    log::logger()->info("Downloading {} {} from {}", descriptor.filename, to_string(version), url);
    const std::string bytes = download_with_retry(url);
    if (install_verified(dest, bytes, record.sha256, actual)) {
      try {
        util::write_file_atomic(checksum_marker_path(dest), actual + "\n");
      } catch (const std::exception& ex) {
        log::logger()->warn("Cannot write checksum marker for {}: {}", dest.string(), ex.what());
      }
      if (options_.prune_old_versions) {
        prune_other_versions(descriptor, version);
      }
      return ResolvedBinary{dest.string(), version, BinarySource::Downloaded};
    }
    log::logger()->warn("Checksum mismatch for {} (attempt {}/{}): expected {}, got {}",
                        descriptor.filename, attempt, kChecksumAttempts, record.sha256, actual);
  }
  throw ChecksumVerificationError("Checksum mismatch for " + descriptor.filename + " " +
                                  to_string(version) + ": expected " + record.sha256 +
                                  ", got " + actual);
}

size_t BinaryFetcher::prune_other_versions(const BinaryDescriptor& descriptor,
                                           const Version& keep) const {
  const fs::path platform_dir = fs::path(options_.cache_dir) / descriptor.platform_key;
  const std::string keep_name = to_string(keep);
  std::vector<fs::path> doomed;
  std::error_code ec;
  for (fs::directory_iterator it(platform_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_directory(ec)) continue;
    const std::string name = it->path().filename().string();
    if (name == keep_name) continue;
    try {
      if (to_string(parse_version(name)) != name) continue;
    } catch (const VersionParseError&) {
      continue;
    }
    doomed.push_back(it->path());
  }
  size_t removed = 0;
  for (const auto& dir : doomed) {
    std::error_code remove_ec;
    try {
      FileLock lock(dir / ".lock", false);
      if (!lock.held()) {
        log::logger()->info("Not pruning {}: an install is in progress", dir.string());
        continue;
      }
      fs::remove_all(dir, remove_ec);
    } catch (const BinaryFetchError& ex) {
      log::logger()->warn("Cannot prune {}: {}", dir.string(), ex.what());
      continue;
    }
    if (remove_ec) {
      log::logger()->warn("Cannot prune {}: {}", dir.string(), remove_ec.message());
      continue;
    }
    log::logger()->info("Pruned cached {}", dir.string());
    ++removed;
  }
  return removed;
}

}  // namespace confq
