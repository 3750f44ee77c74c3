#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace confq::cli {

namespace {

bool parse_integer(const std::string& raw, long long min_value, long long& out) {
  try {
    size_t used = 0;
    long long value = std::stoll(raw, &used);
    if (used != raw.size() || value < min_value) return false;
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

void print_help(std::ostream& os) {
  os << "Usage: confq --query <expression> [--input <path>]\n";
  os << "             [--input-format <fmt>] [--output-format <fmt>]\n";
  os << "             [--cursor <token>] [--page-size <bytes>]\n";
  os << "             [--summary [--depth <n>] [--full-keys]] [--keys]\n";
  os << "       confq --query <expression> --null-input\n";
  os << "       confq --check-binary\n";
  os << "       confq --version\n";
  os << "Options:\n";
  os << "  --offline          never download the yq binary\n";
  os << "  --yq-binary <path> use this yq binary\n";
  os << "  --cache-dir <dir>  where downloaded binaries are kept\n";
  os << "  --timeout-ms <n>   query timeout (default 30000)\n";
  os << "  --log-level <lvl>  trace|debug|info|warn|error|off (logs go to stderr)\n";
  os << "Formats: json, yaml, toml, xml, csv, tsv, props (enabled via CONFQ_FORMATS).\n";
  os << "If --input is omitted, data is read from stdin and --input-format is required.\n";
  os << "Output format defaults to the input format; TOML results that cannot be\n"
        "encoded as TOML fall back to JSON.\n";
  os << "Results larger than --page-size are paged; pass nextCursor back as --cursor.\n";
  os << "Exit codes: 0=success, 1=query/runtime error, 2=usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  auto take_value = [&](int& i, const std::string& flag, std::string& out) {
    if (i + 1 >= argc) {
      error = "Missing value for " + flag;
      return false;
    }
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--query" || arg == "-q") {
      if (!take_value(i, "--query", parsed.query)) return false;
    } else if (arg == "--input" || arg == "-i") {
      if (!take_value(i, "--input", parsed.input)) return false;
    } else if (arg == "--input-format") {
      if (!take_value(i, arg, parsed.input_format)) return false;
    } else if (arg == "--output-format") {
      if (!take_value(i, arg, parsed.output_format)) return false;
    } else if (arg == "--cursor") {
      if (!take_value(i, arg, parsed.cursor)) return false;
    } else if (arg == "--page-size") {
      std::string raw;
      long long value = 0;
      if (!take_value(i, arg, raw)) return false;
      if (!parse_integer(raw, 1, value)) {
        error = "Invalid --page-size value (use a positive integer)";
        return false;
      }
      parsed.page_size = static_cast<size_t>(value);
    } else if (arg == "--depth") {
      std::string raw;
      long long value = 0;
      if (!take_value(i, arg, raw)) return false;
      if (!parse_integer(raw, 0, value) || value > 64) {
        error = "Invalid --depth value (use 0-64)";
        return false;
      }
      parsed.summary_depth = static_cast<int>(value);
    } else if (arg == "--timeout-ms") {
      std::string raw;
      long long value = 0;
      if (!take_value(i, arg, raw)) return false;
      if (!parse_integer(raw, 1, value)) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
      parsed.timeout_ms = value;
    } else if (arg == "--log-level") {
      if (!take_value(i, arg, parsed.log_level)) return false;
    } else if (arg == "--yq-binary") {
      if (!take_value(i, arg, parsed.yq_binary)) return false;
    } else if (arg == "--cache-dir") {
      if (!take_value(i, arg, parsed.cache_dir)) return false;
    } else if (arg == "--summary") {
      parsed.summary = true;
    } else if (arg == "--full-keys") {
      parsed.full_keys = true;
    } else if (arg == "--keys") {
      parsed.keys = true;
    } else if (arg == "--null-input" || arg == "-n") {
      parsed.null_input = true;
    } else if (arg == "--check-binary") {
      parsed.check_binary = true;
    } else if (arg == "--offline") {
      parsed.offline = true;
    } else if (arg == "--help" || arg == "-h") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }

  if (parsed.summary && parsed.keys) {
    error = "--summary and --keys are mutually exclusive";
    return false;
  }
  if (parsed.full_keys && !parsed.summary) {
    error = "--full-keys is only supported with --summary";
    return false;
  }
  if (!parsed.cursor.empty() && (parsed.summary || parsed.keys)) {
    error = "--cursor cannot be combined with --summary or --keys";
    return false;
  }
  if (parsed.null_input && !parsed.input.empty()) {
    error = "--null-input and --input are mutually exclusive";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace confq::cli
