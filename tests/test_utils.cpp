#include "test_utils.h"

#include <fstream>
#include <random>
#include <stdexcept>
#include <thread>

#include "confq/errors.h"

namespace fs = std::filesystem;

TempDir::TempDir() {
  std::random_device rd;
  std::uniform_int_distribution<unsigned long long> dist;
  path_ = fs::temp_directory_path() / ("confq-test-" + std::to_string(dist(rd)));
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ignored;
  fs::remove_all(path_, ignored);
}

void write_text(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to write " + path.string());
  }
  out << content;
}

fs::path write_script(const fs::path& dir, const std::string& name, const std::string& body) {
  fs::path path = dir / name;
  write_text(path, "#!/bin/sh\n" + body);
  fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                  fs::perm_options::replace);
  return path;
}

std::string fake_yq_body(const std::string& version, const std::string& rest) {
  return "if [ \"$1\" = \"--version\" ]; then\n"
         "  echo \"yq (https://github.com/mikefarah/yq/) version " + version + "\"\n"
         "  exit 0\n"
         "fi\n" + rest;
}

fs::path write_fake_yq(const fs::path& dir, const std::string& version, const std::string& rest) {
  return write_script(dir, "yq", fake_yq_body(version, rest));
}

std::shared_ptr<confq::BinaryResolver> make_override_resolver(const std::string& binary) {
  confq::ResolverOptions options;
  options.pinned_version = confq::Version{4, 52, 2};
  options.binary_override = binary;
  confq::BinaryDescriptor descriptor = confq::resolve("linux", "amd64");
  confq::BinaryLocator locator(descriptor, confq::LocatorOptions{}, confq::ChecksumTable());
  return std::make_shared<confq::BinaryResolver>(options, descriptor, std::move(locator), nullptr);
}

void FakeDownloader::serve(const std::string& url, const std::string& payload) {
  std::lock_guard<std::mutex> lock(mu_);
  payloads_[url] = payload;
}

int FakeDownloader::calls_for(const std::string& url) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = per_url_.find(url);
  return it == per_url_.end() ? 0 : it->second;
}

std::string FakeDownloader::download(const std::string& url, std::chrono::milliseconds) {
  ++calls_;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ++per_url_[url];
  }
  if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
  if (failures_left_.fetch_sub(1) > 0) {
    throw confq::NetworkError("simulated failure for " + url);
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto it = payloads_.find(url);
  if (it == payloads_.end()) {
    throw confq::NetworkError("HTTP 404 for " + url);
  }
  return it->second;
}
