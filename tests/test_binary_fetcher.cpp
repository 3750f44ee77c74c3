#include "test_harness.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "confq/binary_fetcher.h"
#include "confq/errors.h"
#include "confq/sha256.h"
#include "test_utils.h"

namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

const confq::Version kPinned{4, 52, 2};

confq::BinaryDescriptor linux_descriptor() {
  return confq::resolve("linux", "amd64");
}

std::string payload() {
  return "#!/bin/sh\n" + fake_yq_body("v4.52.2", "exit 0\n");
}

confq::ChecksumTable pinned_table(const std::string& digest) {
  return confq::ChecksumTable({confq::ChecksumRecord{kPinned, "linux-amd64", digest}});
}

confq::FetcherOptions fast_options(const fs::path& cache) {
  confq::FetcherOptions options;
  options.cache_dir = cache.string();
  options.backoff_base = 1ms;
  return options;
}

std::vector<std::string> entries_of(const fs::path& dir) {
  std::vector<std::string> out;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    out.push_back(it->path().filename().string());
  }
  return out;
}

void test_fetch_installs_verified_binary() {
  TempDir dir;
  auto downloader = std::make_shared<FakeDownloader>();
  const std::string url = confq::download_url(linux_descriptor(), kPinned);
  downloader->serve(url, payload());

  confq::BinaryFetcher fetcher(fast_options(dir.path()), pinned_table(confq::sha256_hex(payload())),
                               downloader);
  confq::ResolvedBinary got = fetcher.fetch(linux_descriptor(), kPinned);
  const fs::path expected = dir.path() / "linux-amd64" / "v4.52.2" / "yq";
  expect_eq(got.path, expected.string(), "installed into the cache layout");
  expect_true(got.source == confq::BinarySource::Downloaded, "source is downloaded");
  expect_true(access(expected.c_str(), X_OK) == 0, "installed binary is executable");

  std::string marker;
  std::ifstream in(confq::checksum_marker_path(expected));
  std::getline(in, marker);
  expect_eq(marker, confq::sha256_hex(payload()), "marker holds the verified digest");
  expect_eq(static_cast<size_t>(downloader->calls()), 1, "one download");
}

void test_fetch_reuses_install_finished_elsewhere() {
  TempDir dir;
  auto downloader = std::make_shared<FakeDownloader>();
  downloader->serve(confq::download_url(linux_descriptor(), kPinned), payload());
  confq::ChecksumTable table = pinned_table(confq::sha256_hex(payload()));

  confq::BinaryFetcher first(fast_options(dir.path()), table, downloader);
  first.fetch(linux_descriptor(), kPinned);
  confq::BinaryFetcher second(fast_options(dir.path()), table, downloader);
  confq::ResolvedBinary got = second.fetch(linux_descriptor(), kPinned);
  expect_true(got.source == confq::BinarySource::Cache, "re-check after lock finds the install");
  expect_eq(static_cast<size_t>(downloader->calls()), 1, "no second download");
}

void test_fetch_checksum_mismatch_refetches_once_then_fails() {
  TempDir dir;
  auto downloader = std::make_shared<FakeDownloader>();
  downloader->serve(confq::download_url(linux_descriptor(), kPinned), payload());
  confq::BinaryFetcher fetcher(fast_options(dir.path()), pinned_table(std::string(64, '0')),
                               downloader);
  bool threw = false;
  try {
    fetcher.fetch(linux_descriptor(), kPinned);
  } catch (const confq::ChecksumVerificationError& ex) {
    threw = std::string(ex.what()).find(std::string(64, '0')) != std::string::npos;
  }
  expect_true(threw, "ChecksumVerificationError names the expected digest");
  expect_eq(static_cast<size_t>(downloader->calls()), 2, "exactly one refetch");

  const fs::path version_dir = dir.path() / "linux-amd64" / "v4.52.2";
  expect_true(!fs::exists(version_dir / "yq"), "nothing installed");
  for (const auto& name : entries_of(version_dir)) {
    expect_eq(name, ".lock", "only the lock file remains");
  }
}

void test_fetch_retries_network_failures_with_bound() {
  TempDir dir;
  auto downloader = std::make_shared<FakeDownloader>();
  downloader->fail_first(100);
  confq::FetcherOptions options = fast_options(dir.path());
  options.max_attempts = 3;
  confq::BinaryFetcher fetcher(options, pinned_table(confq::sha256_hex(payload())), downloader);
  bool threw = false;
  try {
    fetcher.fetch(linux_descriptor(), kPinned);
  } catch (const confq::BinaryFetchError& ex) {
    threw = std::string(ex.what()).find("simulated failure") != std::string::npos;
  }
  expect_true(threw, "BinaryFetchError carries the last cause");
  expect_eq(static_cast<size_t>(downloader->calls()), 3, "max_attempts honored");
}

void test_fetch_recovers_from_transient_failures() {
  TempDir dir;
  auto downloader = std::make_shared<FakeDownloader>();
  downloader->serve(confq::download_url(linux_descriptor(), kPinned), payload());
  downloader->fail_first(2);
  confq::BinaryFetcher fetcher(fast_options(dir.path()), pinned_table(confq::sha256_hex(payload())),
                               downloader);
  confq::ResolvedBinary got = fetcher.fetch(linux_descriptor(), kPinned);
  expect_true(fs::exists(got.path), "installed after retries");
  expect_eq(static_cast<size_t>(downloader->calls()), 3, "two failures then success");
}

void test_fetch_uses_remote_manifest_for_unpinned_version() {
  TempDir dir;
  const confq::Version version{4, 60, 0};
  auto downloader = std::make_shared<FakeDownloader>();
  downloader->serve(confq::download_url(linux_descriptor(), version), payload());
  std::string line = "yq_linux_amd64";
  for (int i = 1; i < 18; ++i) line += " x";
  line += " " + confq::sha256_hex(payload()) + "\n";
  const std::string manifest_url = confq::checksums_manifest_url(linux_descriptor(), version);
  expect_eq(manifest_url, "https://github.com/mikefarah/yq/releases/download/v4.60.0/checksums",
            "manifest sits beside the asset");
  downloader->serve(manifest_url, line);

  confq::BinaryFetcher fetcher(fast_options(dir.path()), confq::ChecksumTable(), downloader);
  confq::ResolvedBinary got = fetcher.fetch(linux_descriptor(), version);
  expect_eq(confq::to_string(got.version), "v4.60.0", "requested version installed");
  expect_eq(static_cast<size_t>(downloader->calls_for(manifest_url)), 1, "manifest fetched once");
}

void test_fetch_without_digest_refuses_to_download() {
  TempDir dir;
  auto downloader = std::make_shared<FakeDownloader>();
  confq::FetcherOptions options = fast_options(dir.path());
  options.allow_remote_checksums = false;
  confq::BinaryFetcher fetcher(options, confq::ChecksumTable(), downloader);
  bool threw = false;
  try {
    fetcher.fetch(linux_descriptor(), confq::Version{4, 60, 0});
  } catch (const confq::BinaryFetchError&) {
    threw = true;
  }
  expect_true(threw, "no digest means no install");
  expect_eq(static_cast<size_t>(downloader->calls()), 0, "nothing downloaded");
}

void test_fetch_prunes_other_versions() {
  TempDir dir;
  const fs::path old_dir = dir.path() / "linux-amd64" / "v4.40.0";
  fs::create_directories(old_dir);
  write_text(old_dir / "yq", "old");
  const fs::path unrelated = dir.path() / "linux-amd64" / "notes";
  fs::create_directories(unrelated);

  auto downloader = std::make_shared<FakeDownloader>();
  downloader->serve(confq::download_url(linux_descriptor(), kPinned), payload());
  confq::BinaryFetcher fetcher(fast_options(dir.path()), pinned_table(confq::sha256_hex(payload())),
                               downloader);
  fetcher.fetch(linux_descriptor(), kPinned);
  expect_true(!fs::exists(old_dir), "old version pruned");
  expect_true(fs::exists(unrelated), "non-version directories untouched");
}

void test_prune_skips_version_being_installed() {
  TempDir dir;
  const fs::path busy_dir = dir.path() / "linux-amd64" / "v4.40.0";
  fs::create_directories(busy_dir);
  write_text(busy_dir / "yq.tmp", "partial");

  auto downloader = std::make_shared<FakeDownloader>();
  downloader->serve(confq::download_url(linux_descriptor(), kPinned), payload());
  confq::BinaryFetcher fetcher(fast_options(dir.path()), pinned_table(confq::sha256_hex(payload())),
                               downloader);
  {
    confq::FileLock installing(busy_dir / ".lock");
    fetcher.fetch(linux_descriptor(), kPinned);
    expect_true(fs::exists(busy_dir / "yq.tmp"), "locked version left alone");
  }
  expect_eq(fetcher.prune_other_versions(linux_descriptor(), kPinned), 1,
            "pruned once the install lock is released");
  expect_true(!fs::exists(busy_dir), "old version removed");
}

void test_checksum_lookup_not_blocked_by_manifest_download() {
  TempDir dir;
  const confq::Version unpinned{4, 60, 0};
  auto downloader = std::make_shared<FakeDownloader>();
  downloader->set_delay(1500ms);
  std::string line = "yq_linux_amd64";
  for (int i = 1; i < 18; ++i) line += " x";
  line += " " + confq::sha256_hex(payload()) + "\n";
  downloader->serve(confq::checksums_manifest_url(linux_descriptor(), unpinned), line);
  confq::BinaryFetcher fetcher(fast_options(dir.path()), pinned_table("abc123"), downloader);

  std::thread slow([&]() { fetcher.checksum_for(linux_descriptor(), unpinned); });
  std::this_thread::sleep_for(100ms);
  const auto started = std::chrono::steady_clock::now();
  confq::ChecksumRecord pinned = fetcher.checksum_for(linux_descriptor(), kPinned);
  const auto waited = std::chrono::steady_clock::now() - started;
  slow.join();
  expect_eq(pinned.sha256, "abc123", "pinned record returned");
  expect_true(waited < 1000ms, "pinned lookup does not wait for the manifest download");
  expect_eq(fetcher.checksum_for(linux_descriptor(), unpinned).sha256, confq::sha256_hex(payload()),
            "manifest record merged");
}

}  // namespace

void register_binary_fetcher_tests(std::vector<TestCase>& tests) {
  tests.push_back({"fetch_installs_verified_binary", test_fetch_installs_verified_binary});
  tests.push_back({"fetch_reuses_install_finished_elsewhere",
                   test_fetch_reuses_install_finished_elsewhere});
  tests.push_back({"fetch_checksum_mismatch_refetches_once_then_fails",
                   test_fetch_checksum_mismatch_refetches_once_then_fails});
  tests.push_back({"fetch_retries_network_failures_with_bound",
                   test_fetch_retries_network_failures_with_bound});
  tests.push_back({"fetch_recovers_from_transient_failures",
                   test_fetch_recovers_from_transient_failures});
  tests.push_back({"fetch_uses_remote_manifest_for_unpinned_version",
                   test_fetch_uses_remote_manifest_for_unpinned_version});
  tests.push_back({"fetch_without_digest_refuses_to_download",
                   test_fetch_without_digest_refuses_to_download});
  tests.push_back({"fetch_prunes_other_versions", test_fetch_prunes_other_versions});
  tests.push_back({"prune_skips_version_being_installed", test_prune_skips_version_being_installed});
  tests.push_back({"checksum_lookup_not_blocked_by_manifest_download",
                   test_checksum_lookup_not_blocked_by_manifest_download});
}
