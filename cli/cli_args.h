#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace confq::cli {

struct CliOptions {
  std::string query;
  std::string input;
  std::string input_format;
  std::string output_format;
  std::string cursor;
  size_t page_size = 10000;
  bool summary = false;
  int summary_depth = 1;
  bool full_keys = false;
  bool keys = false;
  bool null_input = false;
  bool check_binary = false;
  bool offline = false;
  std::optional<long long> timeout_ms;
  std::string log_level;
  std::string yq_binary;
  std::string cache_dir;
  bool show_help = false;
  bool show_version = false;
};

void print_help(std::ostream& os);

/// Parses argv into typed options.
/// MUST return false with a message for unknown flags, missing or malformed values,
/// and conflicting modes.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace confq::cli
