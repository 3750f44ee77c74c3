#include "confq/binary_resolver.h"

#include <exception>
#include <utility>

#include "confq/errors.h"
#include "confq/logging.h"
#include "util/fs_util.h"

namespace confq {

BinaryResolver::BinaryResolver(ResolverOptions options,
                               BinaryDescriptor descriptor,
                               BinaryLocator locator,
                               std::shared_ptr<BinaryFetcher> fetcher,
                               VersionProbe probe)
    : options_(std::move(options)),
      descriptor_(std::move(descriptor)),
      locator_(std::move(locator)),
      fetcher_(std::move(fetcher)),
      probe_(std::move(probe)) {}

ResolvedBinary BinaryResolver::resolve() {
  std::promise<ResolvedBinary> promise;
  std::shared_future<ResolvedBinary> future;
  bool leader = false;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (resolved_.has_value()) return *resolved_;
    if (in_flight_.valid()) {
      future = in_flight_;
    } else {
      future = promise.get_future().share();
      in_flight_ = future;
      leader = true;
    }
  }
  if (!leader) return future.get();

  try {
    ResolvedBinary binary = resolve_uncached();
    {
      std::lock_guard<std::mutex> guard(mutex_);
      resolved_ = binary;
      in_flight_ = std::shared_future<ResolvedBinary>();
    }
    promise.set_value(binary);
    return binary;
  } catch (...) {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      in_flight_ = std::shared_future<ResolvedBinary>();
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

std::optional<ResolvedBinary> BinaryResolver::cached() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return resolved_;
}

void BinaryResolver::reset() {
  std::lock_guard<std::mutex> guard(mutex_);
  resolved_.reset();
}

ResolvedBinary BinaryResolver::resolve_override() {
  const std::string& path = options_.binary_override;
  if (!util::is_executable_file(path)) {
    throw QueryExecutionError(QueryErrorKind::BinaryMissing,
                              "Configured yq binary is missing or not executable: " + path);
  }
  std::optional<Version> version = probe_(path);
  if (!version.has_value()) {
    throw QueryExecutionError(QueryErrorKind::BinaryMissing,
                              "Configured binary " + path + " did not report a " +
                                  kToolIdentity + " version");
  }
  if (!meets_minimum(*version, options_.pinned_version)) {
    throw QueryExecutionError(QueryErrorKind::BinaryMissing,
                              "Configured binary " + path + " is " + to_string(*version) +
                                  ", need " + to_string(options_.pinned_version) + " or newer");
  }
  return ResolvedBinary{path, *version, BinarySource::Override};
}

ResolvedBinary BinaryResolver::resolve_uncached() {
  if (!options_.binary_override.empty()) {
    return resolve_override();
  }
  const Version& min_version = options_.pinned_version;
  if (min_version < descriptor_.minimum_version) {
    log::logger()->warn("Pinned {} is older than {}; TOML output may be incomplete",
                        to_string(min_version), to_string(descriptor_.minimum_version));
  }
  if (auto found = locator_.locate(min_version)) {
    return *found;
  }
  if (options_.offline || !fetcher_) {
    throw QueryExecutionError(QueryErrorKind::BinaryMissing,
                              "No usable yq " + to_string(min_version) +
                                  " or newer found locally and downloads are disabled");
  }
  return fetcher_->fetch(descriptor_, options_.pinned_version);
}

std::unique_ptr<BinaryResolver> make_resolver(const Config& config,
                                              std::shared_ptr<Downloader> downloader) {
  BinaryDescriptor descriptor = resolve();
  ChecksumTable checksums = ChecksumTable::bundled_defaults();

  LocatorOptions locator_options;
  locator_options.search_path = config.search_path;
  locator_options.cache_dir = config.cache_dir;
  locator_options.bundled_dir = config.bundled_dir;
  BinaryLocator locator(descriptor, locator_options, checksums);

  std::shared_ptr<BinaryFetcher> fetcher;
  if (!config.offline) {
    if (!downloader) downloader = std::make_shared<CurlDownloader>(config.auth_token);
    FetcherOptions fetcher_options;
    fetcher_options.cache_dir = config.cache_dir;
    fetcher_options.timeout = config.download_timeout;
    fetcher_options.allow_remote_checksums = config.allow_remote_checksums;
    fetcher = std::make_shared<BinaryFetcher>(fetcher_options, checksums, std::move(downloader));
  }

  ResolverOptions options;
  options.pinned_version = config.pinned_version;
  options.binary_override = config.binary_override;
  options.offline = config.offline;
  return std::make_unique<BinaryResolver>(options, std::move(descriptor), std::move(locator),
                                          std::move(fetcher));
}

}  // namespace confq
