#include "confq/subprocess.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "confq/errors.h"

namespace confq {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 10;
// Bound on reading leftover output once the child has exited and its group is gone.
constexpr std::chrono::milliseconds kPostExitDrain{100};

void ignore_sigpipe_once() {
  // A child that exits without draining stdin must not kill the host with SIGPIPE.
  static std::once_flag flag;
  std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

bool make_pipe(int fds[2]) {
#if defined(__linux__)
  return pipe2(fds, O_CLOEXEC) == 0;
#else
  if (pipe(fds) != 0) return false;
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

void close_fd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

/// Owns every descriptor of one spawn so early returns cannot leak them.
struct PipeSet {
  int out[2] = {-1, -1};
  int err[2] = {-1, -1};
  int in[2] = {-1, -1};
  int status[2] = {-1, -1};

  ~PipeSet() {
    for (int* p : {out, err, in, status}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  }
};

/// Reads what is available. Returns false on EOF or hard error.
bool drain_fd(int fd, std::string& sink) {
  char buf[8192];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      sink.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/// Child has terminated; leaves it as a zombie so its pid, and so its process group id,
/// cannot be reused before the group is killed.
bool child_exited(pid_t pid) {
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno == ECHILD;
  }
  return info.si_pid == pid;
}

int reap(pid_t pid, ProcessResult& result) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }
  return 0;
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
  if (argv.empty() || argv.front().empty()) {
    throw ProcessSpawnError("Empty command line");
  }
  ignore_sigpipe_once();

  std::vector<char*> c_args;
  c_args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_args.push_back(const_cast<char*>(arg.c_str()));
  }
  c_args.push_back(nullptr);

  PipeSet pipes;
  const bool feed_stdin = options.stdin_data.has_value();
  if (!make_pipe(pipes.out) || !make_pipe(pipes.err) || !make_pipe(pipes.status) ||
      (feed_stdin && !make_pipe(pipes.in))) {
    throw ProcessSpawnError(std::string("Failed to create pipes: ") + std::strerror(errno));
  }

  const auto started = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    throw ProcessSpawnError(std::string("Failed to fork: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // Only async-signal-safe calls until exec.
    setpgid(0, 0);
    int stdin_fd = feed_stdin ? pipes.in[0] : open("/dev/null", O_RDONLY);
    if (stdin_fd < 0 || dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(pipes.out[1], STDOUT_FILENO) < 0 || dup2(pipes.err[1], STDERR_FILENO) < 0) {
      int code = errno;
      ssize_t ignored = write(pipes.status[1], &code, sizeof(code));
      (void)ignored;
      _exit(127);
    }
    execv(c_args[0], c_args.data());
    int code = errno;
    ssize_t ignored = write(pipes.status[1], &code, sizeof(code));
    (void)ignored;
    _exit(127);
  }

  // Also set from the parent so a kill issued before the child runs still hits the group.
  setpgid(pid, pid);

  close_fd(pipes.out[1]);
  close_fd(pipes.err[1]);
  close_fd(pipes.status[1]);
  close_fd(pipes.in[0]);

  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = read(pipes.status[0], &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(pipes.status[0]);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    ProcessResult ignored;
    reap(pid, ignored);
    throw ProcessSpawnError("Failed to execute " + argv.front() + ": " +
                            std::strerror(exec_errno));
  }

  ProcessResult result;
  result.pid = static_cast<int>(pid);

  set_nonblocking(pipes.out[0]);
  set_nonblocking(pipes.err[0]);
  if (feed_stdin) set_nonblocking(pipes.in[1]);

  const std::string stdin_bytes = feed_stdin ? *options.stdin_data : std::string();
  size_t stdin_written = 0;
  if (feed_stdin && stdin_bytes.empty()) close_fd(pipes.in[1]);

  const auto deadline = started + options.timeout;
  bool exited = false;
  bool group_killed = false;
  Clock::time_point drain_deadline = deadline;

  while (true) {
    if (!exited) exited = child_exited(pid);
    if (exited && pipes.out[0] < 0 && pipes.err[0] < 0) break;
    if (exited && !group_killed) {
      // Descendants that inherited the pipes would otherwise keep them open.
      killpg(pid, SIGKILL);
      group_killed = true;
      close_fd(pipes.in[1]);
      drain_deadline = Clock::now() + kPostExitDrain;
    }

    const auto now = Clock::now();
    if (exited && now >= drain_deadline) {
      // A process outside the group still holds the pipes; the child itself is done.
      close_fd(pipes.out[0]);
      close_fd(pipes.err[0]);
      break;
    }
    if (!exited && now >= deadline) {
      result.timed_out = true;
      break;
    }

    pollfd fds[3];
    nfds_t count = 0;
    int out_slot = -1;
    int err_slot = -1;
    int in_slot = -1;
    if (pipes.out[0] >= 0) {
      out_slot = static_cast<int>(count);
      fds[count++] = pollfd{pipes.out[0], POLLIN, 0};
    }
    if (pipes.err[0] >= 0) {
      err_slot = static_cast<int>(count);
      fds[count++] = pollfd{pipes.err[0], POLLIN, 0};
    }
    if (pipes.in[1] >= 0) {
      in_slot = static_cast<int>(count);
      fds[count++] = pollfd{pipes.in[1], POLLOUT, 0};
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        (exited ? drain_deadline : deadline) - now);
    int wait_ms = static_cast<int>(std::min<long long>(remaining.count() + 1, kPollSliceMs));
    int ready = count > 0 ? poll(fds, count, wait_ms) : poll(nullptr, 0, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      const int poll_errno = errno;
      killpg(pid, SIGKILL);
      kill(pid, SIGKILL);
      reap(pid, result);
      throw ProcessSpawnError("Lost contact with " + argv.front() + ": poll failed: " +
                              std::strerror(poll_errno));
    }
    if (out_slot >= 0 && fds[out_slot].revents != 0 && !drain_fd(pipes.out[0], result.stdout_data)) {
      close_fd(pipes.out[0]);
    }
    if (err_slot >= 0 && fds[err_slot].revents != 0 && !drain_fd(pipes.err[0], result.stderr_data)) {
      close_fd(pipes.err[0]);
    }
    if (in_slot >= 0 && fds[in_slot].revents != 0) {
      if ((fds[in_slot].revents & (POLLERR | POLLHUP)) != 0) {
        close_fd(pipes.in[1]);
      } else {
        ssize_t n = write(pipes.in[1], stdin_bytes.data() + stdin_written,
                          stdin_bytes.size() - stdin_written);
        if (n > 0) stdin_written += static_cast<size_t>(n);
        if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_written >= stdin_bytes.size()) {
          close_fd(pipes.in[1]);
        }
      }
    }
  }

  if (result.timed_out) {
    killpg(pid, SIGKILL);
    kill(pid, SIGKILL);
  }
  reap(pid, result);
  if (result.timed_out) {
    result.exit_code = -1;
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  return result;
}

bool process_alive(int pid) {
  if (pid <= 0) return false;
#if defined(__linux__)
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return false;
  std::string line;
  std::getline(stat, line);
  size_t close_paren = line.rfind(')');
  if (close_paren == std::string::npos || close_paren + 2 >= line.size()) return false;
  char state = line[close_paren + 2];
  return state != 'Z' && state != 'X';
#else
  return kill(pid, 0) == 0 || errno == EPERM;
#endif
}

}  // namespace confq
