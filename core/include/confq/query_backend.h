#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "confq/binary_resolver.h"
#include "confq/errors.h"

namespace confq {

enum class FormatType { Json, Yaml, Toml, Xml, Csv, Tsv, Props };

/// Returns the name the query tool uses for -p/-o ("json", "yaml", ...).
const char* format_name(FormatType format);
/// Case-insensitive; accepts "yml" for yaml.
std::optional<FormatType> parse_format(const std::string& name);
/// Detects the format from the file extension.
/// MUST throw QueryExecutionError(UnsupportedFormat) for unknown extensions.
FormatType detect_format_from_path(const std::string& path);

/// One query invocation. input_path, input_data, and null_input are mutually exclusive.
struct QueryRequest {
  std::string input_path;
  std::string expression;
  FormatType input_format = FormatType::Yaml;
  FormatType output_format = FormatType::Json;
  std::chrono::milliseconds timeout{30000};
  /// Fed to the tool on stdin.
  std::optional<std::string> input_data;
  /// Evaluate without reading any input (-n).
  bool null_input = false;
};

/// Raw, undecoded output of a successful invocation.
struct QueryResult {
  std::string raw_bytes;
  int exit_code = 0;
  std::string stderr_text;
};

struct FallbackResult {
  QueryResult result;
  FormatType effective_format = FormatType::Json;
  bool fell_back = false;
};

struct ClassifierRule {
  std::string needle;
  QueryErrorKind kind;
};

/// Maps stderr of a failed run to an error kind by case-insensitive substring rules,
/// first match wins. Anything unmatched is NonZeroExit.
/// The default table is tied to the pinned tool release and MUST be reviewed whenever
/// that release changes.
class StderrClassifier {
 public:
  StderrClassifier();
  explicit StderrClassifier(std::vector<ClassifierRule> rules);

  static const std::vector<ClassifierRule>& default_rules();

  QueryErrorKind classify(const std::string& stderr_text) const;

 private:
  std::vector<ClassifierRule> rules_;
};

/// First non-blank stderr line without its "Error: " prefix, followed by up to two
/// context lines as " (a | b)".
std::string clean_error_message(const std::string& stderr_text);

struct ValidationResult {
  bool ok = false;
  std::string message;
};

/// Executes query requests against the resolved binary, one child process per call.
class QueryBackend {
 public:
  QueryBackend(std::shared_ptr<BinaryResolver> resolver,
               std::vector<std::string> enabled_formats,
               StderrClassifier classifier = StderrClassifier());

  /// Runs the request and returns raw stdout.
  /// MUST throw std::invalid_argument for conflicting inputs,
  /// QueryExecutionError(UnsupportedFormat) for disabled formats, and
  /// QueryExecutionError with the classified kind for any failed run.
  QueryResult execute(const QueryRequest& request);

  /// Like execute(); when TOML output of TOML input was implied rather than requested and
  /// the tool cannot encode the result as TOML, retries once with JSON output.
  FallbackResult execute_with_fallback(const QueryRequest& request, bool output_format_explicit);

  /// Resolves the binary and checks that it runs.
  ValidationResult validate();

  /// [binary, -p, in, -o, out, (-n), expression, (path)] as discrete arguments.
  static std::vector<std::string> build_argv(const std::string& binary, const QueryRequest& request);

  /// MUST throw on conflicting inputs or disabled formats; performs no IO.
  void validate_request(const QueryRequest& request) const;

  bool format_enabled(FormatType format) const;

 private:
  std::shared_ptr<BinaryResolver> resolver_;
  std::vector<std::string> enabled_formats_;
  StderrClassifier classifier_;
};

}  // namespace confq
