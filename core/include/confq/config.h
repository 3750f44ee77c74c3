#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "confq/tool_version.h"

namespace confq {

/// Runtime settings shared by the resolver, fetcher, and backend.
/// Loaded once; components take the values they need by copy.
struct Config {
  Version pinned_version;
  std::string binary_override;
  std::string cache_dir;
  std::string bundled_dir;
  std::string search_path;
  bool offline = false;
  bool allow_remote_checksums = true;
  std::vector<std::string> enabled_formats;
  std::chrono::milliseconds query_timeout{30000};
  std::chrono::milliseconds download_timeout{60000};
  std::string log_level = "warn";
  std::string auth_token;
};

/// Formats enabled when CONFQ_FORMATS is unset or names nothing valid.
std::vector<std::string> default_enabled_formats();
/// Every format name the query tool accepts for -p/-o.
const std::vector<std::string>& known_formats();

/// Builds a Config from CONFQ_* variables.
/// MUST NOT throw on malformed values; they fall back to defaults with a warning.
Config load_config_from_env();

/// Parses a CONFQ_FORMATS style list. Unknown names are dropped; an empty
/// result yields the defaults.
std::vector<std::string> parse_enabled_formats(const std::string& raw);

bool is_format_enabled(const Config& config, const std::string& format);

}  // namespace confq
