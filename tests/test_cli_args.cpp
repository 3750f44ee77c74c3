#include "test_harness.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cli_args.h"
#include "confq/errors.h"
#include "confq/paginator.h"
#include "response_builder.h"

namespace {

bool parse(std::vector<const char*> argv, confq::cli::CliOptions& options, std::string& error) {
  argv.insert(argv.begin(), "confq");
  return confq::cli::parse_cli_args(static_cast<int>(argv.size()), const_cast<char**>(argv.data()),
                                    options, error);
}

confq::FallbackResult json_outcome(const std::string& raw) {
  confq::FallbackResult outcome;
  outcome.result.raw_bytes = raw;
  outcome.effective_format = confq::FormatType::Json;
  return outcome;
}

void test_parse_cli_args_accepts_query_flags() {
  confq::cli::CliOptions options;
  std::string error;
  bool ok = parse({"--query", ".a", "--input", "c.toml", "--output-format", "json", "--cursor",
                   "abc", "--page-size", "500", "--timeout-ms", "2000", "--offline"},
                  options, error);
  expect_true(ok, "query flags accepted");
  expect_eq(options.query, ".a", "query parsed");
  expect_eq(options.input, "c.toml", "input parsed");
  expect_eq(options.output_format, "json", "output format parsed");
  expect_eq(options.cursor, "abc", "cursor parsed");
  expect_eq(options.page_size, 500, "page size parsed");
  expect_true(options.timeout_ms.has_value() && *options.timeout_ms == 2000, "timeout parsed");
  expect_true(options.offline, "offline parsed");
}

void test_parse_cli_args_rejects_missing_value() {
  confq::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--query"}, options, error), "missing value rejected");
  expect_true(error.find("Missing value for --query") != std::string::npos, "clear error");
}

void test_parse_cli_args_rejects_bad_numbers() {
  confq::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--page-size", "0"}, options, error), "zero page size rejected");
  expect_true(!parse({"--timeout-ms", "12abc"}, options, error), "trailing junk rejected");
  expect_true(!parse({"--depth", "-1"}, options, error), "negative depth rejected");
  expect_true(parse({"--summary", "--depth", "0"}, options, error), "depth 0 accepted");
}

void test_parse_cli_args_rejects_conflicts() {
  confq::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--summary", "--keys"}, options, error), "summary and keys exclusive");
  expect_true(!parse({"--full-keys"}, options, error), "full-keys needs summary");
  expect_true(!parse({"--keys", "--cursor", "x"}, options, error), "cursor with keys rejected");
  expect_true(!parse({"-n", "--input", "a.json"}, options, error), "null input with file rejected");
  expect_true(!parse({"--bogus"}, options, error), "unknown flag rejected");
  expect_true(error.find("Unknown argument: --bogus") != std::string::npos, "names the flag");
}

void test_parse_cli_args_leaves_options_on_failure() {
  confq::cli::CliOptions options;
  std::string error;
  expect_true(!parse({"--query", ".a", "--bogus"}, options, error), "fails");
  expect_true(options.query.empty(), "options untouched on failure");
}

void test_response_small_json_is_structured() {
  nlohmann::json response =
      confq::cli::build_query_response(json_outcome("{\"a\": [1, 2]}\n"), "c.json", {});
  expect_true(response["success"].get<bool>(), "success flag");
  expect_eq(response["result"].dump(), R"({"a":[1,2]})", "decoded result inline");
  expect_true(!response.contains("nextCursor"), "no cursor for one page");
}

void test_response_large_json_is_paged() {
  nlohmann::json big = nlohmann::json::array();
  for (int i = 0; i < 2000; ++i) big.push_back({{"id", i}});
  confq::cli::ResponseOptions options;
  options.page_size = 1000;
  nlohmann::json first = confq::cli::build_query_response(json_outcome(big.dump()), "big.json", options);
  expect_true(first["paginated"].get<bool>(), "paginated");
  expect_true(first.contains("nextCursor"), "cursor issued");
  expect_true(first["advisory"].get<std::string>().find("'.[start:end]'") != std::string::npos,
              "advisory carries the list hint");

  options.cursor_token = first["nextCursor"].get<std::string>();
  nlohmann::json second = confq::cli::build_query_response(json_outcome(big.dump()), "big.json", options);
  std::string expected = confq::canonical_serialization(big).substr(
      first["result"].get<std::string>().size(), second["result"].get<std::string>().size());
  expect_eq(second["result"].get<std::string>(), expected, "second page continues the first");
}

void test_response_cursor_for_changed_result_is_stale() {
  confq::cli::ResponseOptions options;
  options.page_size = 4;
  options.cursor_token = confq::encode_cursor(confq::Cursor{4, 999});
  bool stale = false;
  try {
    confq::cli::build_query_response(json_outcome("[1,2,3,4,5]"), "x.json", options);
  } catch (const confq::StaleCursorError&) {
    stale = true;
  }
  expect_true(stale, "stale cursor surfaced");
}

void test_response_summary_and_keys() {
  confq::cli::ResponseOptions options;
  options.keys = true;
  nlohmann::json keys =
      confq::cli::build_query_response(json_outcome(R"({"b":1,"a":2})"), "x.json", options);
  expect_eq(keys["keys"].dump(), R"(["a","b"])", "top-level keys");

  confq::FallbackResult yaml;
  yaml.result.raw_bytes = "a: 1\n";
  yaml.effective_format = confq::FormatType::Yaml;
  options.keys = false;
  options.summary = true;
  bool threw = false;
  try {
    confq::cli::build_query_response(yaml, "x.yaml", options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect_true(threw, "summary needs JSON output");
}

void test_error_envelope_shape() {
  nlohmann::json envelope = confq::cli::error_envelope("Timeout", "took too long");
  expect_eq(envelope.dump(), R"({"error":{"kind":"Timeout","message":"took too long"}})",
            "kind and message");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_accepts_query_flags", test_parse_cli_args_accepts_query_flags});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_bad_numbers", test_parse_cli_args_rejects_bad_numbers});
  tests.push_back({"parse_cli_args_rejects_conflicts", test_parse_cli_args_rejects_conflicts});
  tests.push_back({"parse_cli_args_leaves_options_on_failure",
                   test_parse_cli_args_leaves_options_on_failure});
  tests.push_back({"response_small_json_is_structured", test_response_small_json_is_structured});
  tests.push_back({"response_large_json_is_paged", test_response_large_json_is_paged});
  tests.push_back({"response_cursor_for_changed_result_is_stale",
                   test_response_cursor_for_changed_result_is_stale});
  tests.push_back({"response_summary_and_keys", test_response_summary_and_keys});
  tests.push_back({"error_envelope_shape", test_error_envelope_shape});
}
