#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace confq {

struct ProcessOptions {
  std::chrono::milliseconds timeout{30000};
  /// Bytes written to the child's stdin; stdin is /dev/null when unset.
  std::optional<std::string> stdin_data;
};

struct ProcessResult {
  int exit_code = -1;
  int term_signal = 0;
  bool timed_out = false;
  int pid = -1;
  std::string stdout_data;
  std::string stderr_data;
  std::chrono::milliseconds elapsed{0};
};

/// Runs argv[0] (a path, not looked up on PATH) with argv as discrete arguments.
/// The child leads its own process group; on timeout, and after a normal exit, the whole
/// group is killed with SIGKILL and the child is reaped before returning, so no
/// descendant outlives the call. Output still held open by a process that left the group
/// is read only briefly after the child exits; that case is not reported as a timeout.
/// MUST throw ProcessSpawnError when the program cannot be started.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options);

/// Returns true when pid names a live, non-zombie process.
bool process_alive(int pid);

}  // namespace confq
