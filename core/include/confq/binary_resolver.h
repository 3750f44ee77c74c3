#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "confq/binary_fetcher.h"
#include "confq/binary_locator.h"
#include "confq/config.h"
#include "confq/platform.h"
#include "confq/tool_version.h"

namespace confq {

struct ResolverOptions {
  Version pinned_version;
  /// Explicit binary path; bypasses search, cache, and download when set.
  std::string binary_override;
  bool offline = false;
};

/// Locator→Fetcher chain, memoized per instance.
/// Concurrent callers share one in-flight resolution; a failure is delivered to every
/// waiter and clears the slot so a later call retries from scratch.
class BinaryResolver {
 public:
  BinaryResolver(ResolverOptions options,
                 BinaryDescriptor descriptor,
                 BinaryLocator locator,
                 std::shared_ptr<BinaryFetcher> fetcher,
                 VersionProbe probe = probe_tool_version);

  /// Returns a usable binary, resolving it on first use.
  /// MUST throw QueryExecutionError(BinaryMissing) when the override is missing, is not
  /// the expected tool, or is older than the pinned version, and when offline mode leaves
  /// no candidate; fetch errors propagate unchanged.
  ResolvedBinary resolve();

  /// The memoized result, if resolution already succeeded.
  std::optional<ResolvedBinary> cached() const;
  /// Forgets the memoized result; the next resolve() starts over.
  void reset();

  const BinaryDescriptor& descriptor() const { return descriptor_; }
  const ResolverOptions& options() const { return options_; }

 private:
  ResolvedBinary resolve_uncached();
  ResolvedBinary resolve_override();

  ResolverOptions options_;
  BinaryDescriptor descriptor_;
  BinaryLocator locator_;
  std::shared_ptr<BinaryFetcher> fetcher_;
  VersionProbe probe_;

  mutable std::mutex mutex_;
  std::optional<ResolvedBinary> resolved_;
  std::shared_future<ResolvedBinary> in_flight_;
};

/// Builds the production chain for the host platform from configuration.
/// A null downloader selects CurlDownloader with the configured auth token.
/// MUST throw UnsupportedPlatformError on hosts without a published binary.
std::unique_ptr<BinaryResolver> make_resolver(const Config& config,
                                              std::shared_ptr<Downloader> downloader = nullptr);

}  // namespace confq
