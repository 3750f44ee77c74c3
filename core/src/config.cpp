#include "confq/config.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include "confq/checksums.h"
#include "confq/errors.h"
#include "confq/logging.h"
#include "util/string_util.h"

namespace confq {

namespace {

namespace fs = std::filesystem;

std::string env_or_empty(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) return "";
  return util::trim_ws(raw);
}

std::string default_cache_dir() {
  std::string xdg = env_or_empty("XDG_CACHE_HOME");
  if (!xdg.empty()) {
    return (fs::path(xdg) / "confq").string();
  }
  std::string home = env_or_empty("HOME");
  if (!home.empty()) {
    return (fs::path(home) / ".cache" / "confq").string();
  }
  return (fs::temp_directory_path() / "confq-cache").string();
}

std::string default_bundled_dir() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec || exe.empty()) return "";
  return (exe.parent_path() / "binaries").string();
}

std::chrono::milliseconds parse_millis(const char* name,
                                       const std::string& raw,
                                       std::chrono::milliseconds fallback) {
  if (raw.empty()) return fallback;
  try {
    size_t used = 0;
    long long value = std::stoll(raw, &used);
    if (used == raw.size() && value > 0) {
      return std::chrono::milliseconds(value);
    }
  } catch (const std::exception&) {
  }
  log::logger()->warn("Ignoring invalid {}='{}'", name, raw);
  return fallback;
}

}  // namespace

std::vector<std::string> default_enabled_formats() {
  return {"json", "yaml", "toml"};
}

const std::vector<std::string>& known_formats() {
  static const std::vector<std::string> formats = {"json", "yaml", "toml", "xml",
                                                   "csv",  "tsv",  "props"};
  return formats;
}

std::vector<std::string> parse_enabled_formats(const std::string& raw) {
  std::vector<std::string> out;
  const auto& known = known_formats();
  for (const auto& piece : util::split_trimmed(raw, ',')) {
    std::string name = util::to_lower(piece);
    if (std::find(known.begin(), known.end(), name) == known.end()) continue;
    if (std::find(out.begin(), out.end(), name) != out.end()) continue;
    out.push_back(name);
  }
  if (out.empty()) return default_enabled_formats();
  return out;
}

bool is_format_enabled(const Config& config, const std::string& format) {
  const std::string name = util::to_lower(format);
  return std::find(config.enabled_formats.begin(), config.enabled_formats.end(), name) !=
         config.enabled_formats.end();
}

Config load_config_from_env() {
  Config config;
  config.pinned_version = default_pinned_version();
  std::string version = env_or_empty("CONFQ_YQ_VERSION");
  if (!version.empty()) {
    try {
      config.pinned_version = parse_version(version);
    } catch (const VersionParseError& ex) {
      log::logger()->warn("Ignoring CONFQ_YQ_VERSION: {}", ex.what());
    }
  }
  config.binary_override = env_or_empty("CONFQ_YQ_BINARY");
  config.cache_dir = env_or_empty("CONFQ_CACHE_DIR");
  if (config.cache_dir.empty()) config.cache_dir = default_cache_dir();
  config.bundled_dir = env_or_empty("CONFQ_BUNDLED_DIR");
  if (config.bundled_dir.empty()) config.bundled_dir = default_bundled_dir();
  config.search_path = env_or_empty("PATH");
  config.offline = util::is_truthy(env_or_empty("CONFQ_OFFLINE"));
  config.enabled_formats = parse_enabled_formats(env_or_empty("CONFQ_FORMATS"));
  config.query_timeout =
      parse_millis("CONFQ_TIMEOUT_MS", env_or_empty("CONFQ_TIMEOUT_MS"), config.query_timeout);
  std::string level = env_or_empty("CONFQ_LOG_LEVEL");
  if (!level.empty()) config.log_level = level;
  config.auth_token = env_or_empty("GITHUB_TOKEN");
  if (config.auth_token.empty()) config.auth_token = env_or_empty("GH_TOKEN");
  return config;
}

}  // namespace confq
