#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "cli_args.h"
#include "confq/binary_resolver.h"
#include "confq/config.h"
#include "confq/errors.h"
#include "confq/logging.h"
#include "confq/query_backend.h"
#include "confq/version.h"
#include "response_builder.h"

using namespace confq::cli;

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitUsageError = 2;

std::string read_stdin() {
  return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

int emit_error(const std::string& kind, const std::string& message, int exit_code) {
  std::cout << error_envelope(kind, message).dump(2) << std::endl;
  return exit_code;
}

void apply_overrides(const CliOptions& options, confq::Config& config) {
  if (options.offline) config.offline = true;
  if (options.timeout_ms.has_value()) config.query_timeout = std::chrono::milliseconds(*options.timeout_ms);
  if (!options.log_level.empty()) config.log_level = options.log_level;
  if (!options.yq_binary.empty()) config.binary_override = options.yq_binary;
  if (!options.cache_dir.empty()) config.cache_dir = options.cache_dir;
}

/// Resolves a format flag, or returns nullopt and sets error.
std::optional<confq::FormatType> format_from_flag(const std::string& flag,
                                                  const std::string& value,
                                                  std::string& error) {
  std::optional<confq::FormatType> format = confq::parse_format(value);
  if (!format.has_value()) error = "Invalid " + flag + " value: " + value;
  return format;
}

}  // namespace

/// Entry point: resolves the yq binary, runs one query, and prints a JSON envelope.
/// MUST keep stdout for the envelope only; diagnostics go to stderr via the logger.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_help(std::cout);
    return 0;
  }
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return kExitUsageError;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "confq " << confq::version_string() << std::endl;
    return 0;
  }

  confq::Config config = confq::load_config_from_env();
  apply_overrides(options, config);
  confq::log::init(config.log_level);

  try {
    std::shared_ptr<confq::BinaryResolver> resolver = confq::make_resolver(config);
    confq::QueryBackend backend(resolver, config.enabled_formats);

    if (options.check_binary) {
      confq::ValidationResult check = backend.validate();
      nlohmann::json out = {{"ok", check.ok}, {"message", check.message}};
      std::cout << out.dump(2) << std::endl;
      return check.ok ? 0 : kExitRuntimeError;
    }

    if (options.query.empty()) {
      std::cerr << "Missing --query\n";
      return kExitUsageError;
    }

    confq::QueryRequest request;
    request.expression = options.query;
    request.timeout = config.query_timeout;
    request.null_input = options.null_input;

    std::string format_error;
    if (!options.input_format.empty()) {
      auto format = format_from_flag("--input-format", options.input_format, format_error);
      if (!format.has_value()) {
        std::cerr << format_error << "\n";
        return kExitUsageError;
      }
      request.input_format = *format;
    } else if (!options.input.empty()) {
      request.input_format = confq::detect_format_from_path(options.input);
    } else if (!options.null_input) {
      std::cerr << "--input-format is required when reading stdin\n";
      return kExitUsageError;
    }

    const bool output_explicit = !options.output_format.empty();
    request.output_format = request.input_format;
    if (output_explicit) {
      auto format = format_from_flag("--output-format", options.output_format, format_error);
      if (!format.has_value()) {
        std::cerr << format_error << "\n";
        return kExitUsageError;
      }
      request.output_format = *format;
    }

    std::string source = "null";
    if (!options.input.empty()) {
      request.input_path = options.input;
      source = options.input;
    } else if (!options.null_input) {
      request.input_data = read_stdin();
      source = "stdin";
    }

    confq::FallbackResult outcome = backend.execute_with_fallback(request, output_explicit);

    ResponseOptions response_options;
    if (!options.cursor.empty()) response_options.cursor_token = options.cursor;
    response_options.page_size = options.page_size;
    response_options.summary = options.summary;
    response_options.summary_depth = options.summary_depth;
    response_options.full_keys = options.full_keys;
    response_options.keys = options.keys;
    std::cout << build_query_response(outcome, source, response_options).dump(2) << std::endl;
    return 0;
  } catch (const confq::Error& ex) {
    return emit_error(ex.kind_name(), ex.what(), kExitRuntimeError);
  } catch (const std::invalid_argument& ex) {
    return emit_error("InvalidArgument", ex.what(), kExitUsageError);
  } catch (const std::exception& ex) {
    return emit_error("Internal", ex.what(), kExitRuntimeError);
  }
}
