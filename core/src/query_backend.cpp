#include "confq/query_backend.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "confq/logging.h"
#include "confq/subprocess.h"
#include "util/string_util.h"

namespace confq {

namespace {

constexpr std::chrono::milliseconds kValidateTimeout{5000};
constexpr size_t kContextLines = 2;

struct FormatRow {
  FormatType format;
  const char* name;
};

constexpr FormatRow kFormats[] = {
    {FormatType::Json, "json"}, {FormatType::Yaml, "yaml"}, {FormatType::Toml, "toml"},
    {FormatType::Xml, "xml"},   {FormatType::Csv, "csv"},   {FormatType::Tsv, "tsv"},
    {FormatType::Props, "props"},
};

std::string format_list(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}

}  // namespace

const char* format_name(FormatType format) {
  for (const auto& row : kFormats) {
    if (row.format == format) return row.name;
  }
  return "unknown";
}

std::optional<FormatType> parse_format(const std::string& name) {
  std::string lower = util::to_lower(util::trim_ws(name));
  if (lower == "yml") lower = "yaml";
  if (lower == "properties") lower = "props";
  for (const auto& row : kFormats) {
    if (lower == row.name) return row.format;
  }
  return std::nullopt;
}

FormatType detect_format_from_path(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
  if (auto format = parse_format(ext)) return *format;
  throw QueryExecutionError(QueryErrorKind::UnsupportedFormat,
                            "Cannot detect format from extension '." + ext + "' of " + path);
}

StderrClassifier::StderrClassifier() : rules_(default_rules()) {}

StderrClassifier::StderrClassifier(std::vector<ClassifierRule> rules) : rules_(std::move(rules)) {}

const std::vector<ClassifierRule>& StderrClassifier::default_rules() {
  // Diagnostics of yq v4.52.x.
  static const std::vector<ClassifierRule> rules = {
      {"only scalars", QueryErrorKind::UnsupportedFormat},
      {"unknown input format", QueryErrorKind::UnsupportedFormat},
      {"unknown output format", QueryErrorKind::UnsupportedFormat},
      {"unknown format", QueryErrorKind::UnsupportedFormat},
      {"bad expression", QueryErrorKind::MalformedExpression},
      {"invalid input text", QueryErrorKind::MalformedExpression},
      {"lexer error", QueryErrorKind::MalformedExpression},
      {"parsing expression", QueryErrorKind::MalformedExpression},
      {"could not match text", QueryErrorKind::MalformedExpression},
      {"expects 2 args", QueryErrorKind::MalformedExpression},
  };
  return rules;
}

QueryErrorKind StderrClassifier::classify(const std::string& stderr_text) const {
  const std::string haystack = util::to_lower(stderr_text);
  for (const auto& rule : rules_) {
    if (haystack.find(util::to_lower(rule.needle)) != std::string::npos) {
      return rule.kind;
    }
  }
  return QueryErrorKind::NonZeroExit;
}

std::string clean_error_message(const std::string& stderr_text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= stderr_text.size()) {
    size_t end = stderr_text.find('\n', start);
    if (end == std::string::npos) end = stderr_text.size();
    std::string line = util::trim_ws(stderr_text.substr(start, end - start));
    if (!line.empty()) lines.push_back(line);
    start = end + 1;
  }
  if (lines.empty()) return "Unknown error (no stderr output)";

  std::string main = lines.front();
  const std::string prefix = "Error: ";
  if (main.compare(0, prefix.size(), prefix) == 0) main.erase(0, prefix.size());
  if (lines.size() == 1) return main;

  std::string context;
  for (size_t i = 1; i < lines.size() && i <= kContextLines; ++i) {
    if (!context.empty()) context += " | ";
    context += lines[i];
  }
  return main + " (" + context + ")";
}

QueryBackend::QueryBackend(std::shared_ptr<BinaryResolver> resolver,
                           std::vector<std::string> enabled_formats,
                           StderrClassifier classifier)
    : resolver_(std::move(resolver)),
      enabled_formats_(std::move(enabled_formats)),
      classifier_(std::move(classifier)) {}

bool QueryBackend::format_enabled(FormatType format) const {
  return std::find(enabled_formats_.begin(), enabled_formats_.end(), format_name(format)) !=
         enabled_formats_.end();
}

void QueryBackend::validate_request(const QueryRequest& request) const {
  if (request.expression.empty()) {
    throw std::invalid_argument("Query expression must not be empty");
  }
  if (request.input_data.has_value() && !request.input_path.empty()) {
    throw std::invalid_argument("Cannot specify both input data and an input file");
  }
  if (request.null_input && (request.input_data.has_value() || !request.input_path.empty())) {
    throw std::invalid_argument("Null input cannot be combined with input data or an input file");
  }
  if (request.timeout.count() <= 0) {
    throw std::invalid_argument("Query timeout must be positive");
  }
  for (FormatType format : {request.input_format, request.output_format}) {
    if (!format_enabled(format)) {
      throw QueryExecutionError(QueryErrorKind::UnsupportedFormat,
                                std::string("Format '") + format_name(format) +
                                    "' is not enabled. Enabled formats: " +
                                    format_list(enabled_formats_));
    }
  }
}

std::vector<std::string> QueryBackend::build_argv(const std::string& binary,
                                                  const QueryRequest& request) {
  std::vector<std::string> argv = {binary,
                                   "-p",
                                   format_name(request.input_format),
                                   "-o",
                                   format_name(request.output_format)};
  if (request.null_input) argv.push_back("-n");
  argv.push_back(request.expression);
  if (!request.input_path.empty()) argv.push_back(request.input_path);
  return argv;
}

QueryResult QueryBackend::execute(const QueryRequest& request) {
  validate_request(request);
  ResolvedBinary binary = resolver_->resolve();

  ProcessOptions options;
  options.timeout = request.timeout;
  options.stdin_data = request.input_data;

  ProcessResult run;
  try {
    run = run_process(build_argv(binary.path, request), options);
  } catch (const ProcessSpawnError& ex) {
    // The binary vanished or lost its execute bit since it was resolved.
    resolver_->reset();
    throw QueryExecutionError(QueryErrorKind::BinaryMissing,
                              std::string("Failed to execute yq binary: ") + ex.what());
  }

  if (run.timed_out) {
    log::logger()->warn("yq timed out after {} ms: {}", request.timeout.count(),
                        request.expression);
    throw QueryExecutionError(QueryErrorKind::Timeout,
                              "yq command timed out after " +
                                  std::to_string(request.timeout.count()) + " ms",
                              run.stderr_data, -1);
  }
  if (run.exit_code != 0) {
    QueryErrorKind kind = classifier_.classify(run.stderr_data);
    log::logger()->debug("yq exited {} ({}): {}", run.exit_code, query_error_kind_name(kind),
                         util::trim_ws(run.stderr_data));
    throw QueryExecutionError(kind, clean_error_message(run.stderr_data), run.stderr_data,
                              run.exit_code);
  }

  QueryResult result;
  result.raw_bytes = std::move(run.stdout_data);
  result.exit_code = run.exit_code;
  result.stderr_text = std::move(run.stderr_data);
  return result;
}

FallbackResult QueryBackend::execute_with_fallback(const QueryRequest& request,
                                                   bool output_format_explicit) {
  FallbackResult out;
  out.effective_format = request.output_format;
  try {
    out.result = execute(request);
    return out;
  } catch (const QueryExecutionError& ex) {
    const bool eligible = !output_format_explicit &&
                          request.input_format == FormatType::Toml &&
                          request.output_format == FormatType::Toml &&
                          ex.kind() == QueryErrorKind::UnsupportedFormat &&
                          format_enabled(FormatType::Json);
    if (!eligible) throw;
    log::logger()->info("TOML output not representable, retrying with JSON: {}", ex.what());
  }
  QueryRequest retry = request;
  retry.output_format = FormatType::Json;
  out.result = execute(retry);
  out.effective_format = FormatType::Json;
  out.fell_back = true;
  return out;
}

ValidationResult QueryBackend::validate() {
  ValidationResult out;
  ResolvedBinary binary;
  try {
    binary = resolver_->resolve();
  } catch (const Error& ex) {
    out.message = ex.what();
    return out;
  }
  ProcessOptions options;
  options.timeout = kValidateTimeout;
  ProcessResult run;
  try {
    run = run_process({binary.path, "--version"}, options);
  } catch (const ProcessSpawnError& ex) {
    resolver_->reset();
    out.message = std::string("Binary failed to execute: ") + ex.what();
    return out;
  }
  if (run.timed_out) {
    out.message = "Binary at " + binary.path + " did not answer --version in time";
    return out;
  }
  if (run.exit_code != 0) {
    out.message = "Binary failed to execute: " + util::trim_ws(run.stderr_data);
    return out;
  }
  out.ok = true;
  out.message = "yq " + to_string(binary.version) + " at " + binary.path + " (" +
                binary_source_name(binary.source) + ")";
  return out;
}

}  // namespace confq
