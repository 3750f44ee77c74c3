#include "test_harness.h"

#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "confq/errors.h"
#include "confq/subprocess.h"
#include "test_utils.h"

namespace {

using namespace std::chrono_literals;

bool wait_until_dead(int pid) {
  for (int i = 0; i < 100; ++i) {
    if (!confq::process_alive(pid)) return true;
    std::this_thread::sleep_for(10ms);
  }
  return false;
}

void test_run_process_captures_streams_and_exit_code() {
  confq::ProcessResult r =
      confq::run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, {});
  expect_eq(r.stdout_data, "out\n", "stdout captured");
  expect_eq(r.stderr_data, "err\n", "stderr captured separately");
  expect_eq(static_cast<size_t>(r.exit_code), 3, "exit code reported");
  expect_true(!r.timed_out, "not timed out");
}

void test_run_process_feeds_stdin() {
  confq::ProcessOptions options;
  options.stdin_data = std::string("a: 1\nb: [x, y]\n");
  confq::ProcessResult r = confq::run_process({"/bin/sh", "-c", "cat"}, options);
  expect_eq(r.stdout_data, "a: 1\nb: [x, y]\n", "stdin echoed back");
  expect_eq(static_cast<size_t>(r.exit_code), 0, "cat exits cleanly");
}

void test_run_process_large_output_does_not_deadlock() {
  confq::ProcessOptions options;
  options.timeout = 10s;
  confq::ProcessResult r = confq::run_process(
      {"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done"},
      options);
  expect_eq(r.stdout_data.size(), 220000, "all output drained");
  expect_true(!r.timed_out, "finished before timeout");
}

void test_run_process_timeout_kills_process_group() {
  TempDir dir;
  const std::string pid_file = (dir.path() / "grandchild.pid").string();
  confq::ProcessOptions options;
  options.timeout = 1ms;
  const auto started = std::chrono::steady_clock::now();
  confq::ProcessResult r = confq::run_process(
      {"/bin/sh", "-c", "sleep 30 & echo $! > '" + pid_file + "'; sleep 30"}, options);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  expect_true(r.timed_out, "1ms timeout reported");
  expect_true(r.exit_code == -1, "timed out run has no exit code");
  expect_true(elapsed < 5s, "returns promptly");
  expect_true(wait_until_dead(r.pid), "child is gone");

  // The grandchild may not have been forked before the kill; check it only if it was.
  std::ifstream in(pid_file);
  int grandchild = 0;
  if (in >> grandchild) {
    expect_true(wait_until_dead(grandchild), "grandchild in the same group is gone");
  }
}

void test_run_process_timeout_with_descendant_holding_pipes() {
  TempDir dir;
  const std::string pid_file = (dir.path() / "bg.pid").string();
  confq::ProcessOptions options;
  options.timeout = 300ms;
  confq::ProcessResult r = confq::run_process(
      {"/bin/sh", "-c", "sleep 30 & echo $! > '" + pid_file + "'; sleep 30"}, options);
  expect_true(r.timed_out, "timeout reported");
  std::ifstream in(pid_file);
  int background = 0;
  expect_true(static_cast<bool>(in >> background), "background pid recorded");
  expect_true(wait_until_dead(background), "background sleeper killed with the group");
}

void test_run_process_exit_with_detached_descendant_is_not_timeout() {
  confq::ProcessOptions options;
  options.timeout = 3000ms;
  confq::ProcessResult r = confq::run_process(
      {"/bin/sh", "-c", "echo done; setsid sleep 5 & exit 0"}, options);
  expect_true(!r.timed_out, "child exited on its own");
  expect_eq(static_cast<size_t>(r.exit_code), 0, "exit status kept");
  expect_eq(r.stdout_data, "done\n", "output before exit captured");
  expect_true(r.elapsed < 2000ms, "returns without waiting for the detached process");
}

void test_run_process_missing_binary_throws() {
  bool threw = false;
  try {
    confq::run_process({"/nonexistent/confq/yq", "--version"}, {});
  } catch (const confq::ProcessSpawnError& ex) {
    threw = std::string(ex.what()).find("/nonexistent/confq/yq") != std::string::npos;
  }
  expect_true(threw, "missing binary raises ProcessSpawnError naming the path");
}

void test_run_process_non_executable_throws() {
  TempDir dir;
  write_text(dir.path() / "plain", "#!/bin/sh\necho hi\n");
  bool threw = false;
  try {
    confq::run_process({(dir.path() / "plain").string()}, {});
  } catch (const confq::ProcessSpawnError&) {
    threw = true;
  }
  expect_true(threw, "file without execute bit raises ProcessSpawnError");
}

void test_run_process_passes_arguments_verbatim() {
  TempDir dir;
  auto script = write_script(dir.path(), "args", "for a in \"$@\"; do printf '%s\\n' \"$a\"; done\n");
  confq::ProcessResult r =
      confq::run_process({script.string(), "a b", "$(echo pwned)", "; rm -rf /", "'q'"}, {});
  expect_eq(r.stdout_data, "a b\n$(echo pwned)\n; rm -rf /\n'q'\n",
            "metacharacters reach the child as literal arguments");
}

}  // namespace

void register_subprocess_tests(std::vector<TestCase>& tests) {
  tests.push_back({"run_process_captures_streams_and_exit_code",
                   test_run_process_captures_streams_and_exit_code});
  tests.push_back({"run_process_feeds_stdin", test_run_process_feeds_stdin});
  tests.push_back({"run_process_large_output_does_not_deadlock",
                   test_run_process_large_output_does_not_deadlock});
  tests.push_back({"run_process_timeout_kills_process_group",
                   test_run_process_timeout_kills_process_group});
  tests.push_back({"run_process_timeout_with_descendant_holding_pipes",
                   test_run_process_timeout_with_descendant_holding_pipes});
  tests.push_back({"run_process_exit_with_detached_descendant_is_not_timeout",
                   test_run_process_exit_with_detached_descendant_is_not_timeout});
  tests.push_back({"run_process_missing_binary_throws", test_run_process_missing_binary_throws});
  tests.push_back({"run_process_non_executable_throws", test_run_process_non_executable_throws});
  tests.push_back({"run_process_passes_arguments_verbatim",
                   test_run_process_passes_arguments_verbatim});
}
