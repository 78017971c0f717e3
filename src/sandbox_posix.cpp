#ifndef _WIN32

#include "arbiter/sandbox.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <thread>

namespace arbiter {

namespace {

constexpr int kExecFailedExitCode = 127;

void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n))
    truncated = true;
}

// Read everything currently available on a non-blocking fd.
// Returns false once the write end is closed (EOF).
bool drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  if (fd < 0)
    return false;
  std::array<char, 4096> buf;
  while (true) {
    ssize_t n = read(fd, buf.data(), buf.size());
    if (n > 0) {
      append_limited(dst, buf.data(), n, limit, truncated);
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void set_cloexec(int fd) { fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC); }

bool make_pipe(int fds[2]) {
  if (pipe(fds) != 0)
    return false;
  set_cloexec(fds[0]);
  set_cloexec(fds[1]);
  return true;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Child side: report errno through the status pipe and exit.
[[noreturn]] void child_fail(int status_fd) {
  const int err = errno;
  ssize_t ignored = write(status_fd, &err, sizeof(err));
  (void)ignored;
  _exit(kExecFailedExitCode);
}

std::uint64_t maxrss_kb(const struct rusage &ru) {
#if defined(__APPLE__)
  return static_cast<std::uint64_t>(ru.ru_maxrss) / 1024u;  // bytes on macOS
#else
  return static_cast<std::uint64_t>(ru.ru_maxrss);  // kilobytes on Linux/BSD
#endif
}

} // namespace

bool RlimitResourceLimiter::apply_in_child(
    const ResourceLimits &limits) const noexcept {
  if (limits.cpu_time_ms > 0) {
    struct rlimit rl;
    rl.rlim_cur = limits.cpu_time_ms / 1000 + (limits.cpu_time_ms % 1000 != 0); // ceil to seconds
    rl.rlim_max = rl.rlim_cur + 1; // hard limit slightly above soft
    if (setrlimit(RLIMIT_CPU, &rl) != 0)
      return false;
  }
  if (limits.address_space_bytes > 0) {
    struct rlimit rl;
    rl.rlim_cur = limits.address_space_bytes;
    rl.rlim_max = limits.address_space_bytes;
    if (setrlimit(RLIMIT_AS, &rl) != 0)
      return false;
  }
  if (limits.file_size_bytes > 0) {
    struct rlimit rl;
    rl.rlim_cur = limits.file_size_bytes;
    rl.rlim_max = limits.file_size_bytes;
    if (setrlimit(RLIMIT_FSIZE, &rl) != 0)
      return false;
  }
  return true;
}

std::vector<std::string>
RlimitResourceLimiter::describe(const ResourceLimits &limits) const {
  std::vector<std::string> out;
  if (limits.cpu_time_ms > 0)
    out.push_back("rlimit_cpu");
  if (limits.address_space_bytes > 0)
    out.push_back("rlimit_as");
  if (limits.file_size_bytes > 0)
    out.push_back("rlimit_fsize");
  return out;
}

std::shared_ptr<const ResourceLimiter> platform_resource_limiter() {
  static const auto limiter = std::make_shared<RlimitResourceLimiter>();
  return limiter;
}

bool killed_by_cpu_limit(const ProcessResult &result) {
  // The kernel's SIGKILL at the hard limit is indistinguishable from other
  // kills; the watchdog deadline normally fires before it anyway.
  return result.term_signal == SIGXCPU;
}

bool killed_by_output_limit(const ProcessResult &result) {
  return result.term_signal == SIGXFSZ;
}

ProcessResult run_process(const ProcessSpec &spec,
                          const ResourceLimiter &limiter) {
  ProcessResult result;

  // Everything the child needs is built before fork(): after fork() only
  // async-signal-safe calls are allowed.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs;
  for (const auto &[k, v] : spec.env)
    envs.push_back(k + "=" + v);
  std::vector<char *> envp;
  for (auto &e : envs)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int stdin_fd = open(spec.stdin_path.empty() ? "/dev/null"
                                              : spec.stdin_path.c_str(),
                      O_RDONLY | O_CLOEXEC);
  if (stdin_fd < 0) {
    result.error_message = "cannot open stdin: " + std::string(std::strerror(errno));
    return result;
  }
  int stdout_file_fd = -1;
  if (!spec.stdout_path.empty()) {
    stdout_file_fd = open(spec.stdout_path.c_str(),
                          O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (stdout_file_fd < 0) {
      result.error_message = "cannot open stdout file: " + std::string(std::strerror(errno));
      close_fd(stdin_fd);
      return result;
    }
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if ((stdout_file_fd < 0 && !make_pipe(out_pipe)) || !make_pipe(err_pipe) ||
      !make_pipe(status_pipe)) {
    result.error_message = "spawn_failed: pipe: " + std::string(std::strerror(errno));
    for (int *fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1], &stdin_fd, &stdout_file_fd})
      close_fd(*fd);
    return result;
  }

  const auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = "spawn_failed: fork: " + std::string(std::strerror(errno));
    for (int *fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1], &stdin_fd, &stdout_file_fd})
      close_fd(*fd);
    return result;
  }

  if (pid == 0) {
    // New session: the watchdog kills the whole group with kill(-pid).
    setsid();
    const int out_fd = stdout_file_fd >= 0 ? stdout_file_fd : out_pipe[1];
    if (dup2(stdin_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 ||
        dup2(err_pipe[1], STDERR_FILENO) < 0)
      child_fail(status_pipe[1]);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0)
      child_fail(status_pipe[1]);

    if (!limiter.apply_in_child(spec.limits))
      child_fail(status_pipe[1]);

    execve(spec.command.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1]);
  }

  close_fd(stdin_fd);
  close_fd(stdout_file_fd);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  // Blocks until exec succeeds (CLOEXEC closes the pipe) or the child
  // reports an errno.
  int child_errno = 0;
  ssize_t got;
  do {
    got = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    result.error_message =
        "spawn_failed: " + spec.command + ": " + std::strerror(child_errno);
    result.exit_code = kExecFailedExitCode;
    return result;
  }
  result.launched = true;
  result.limits_enforced = limiter.describe(spec.limits);

  if (out_pipe[0] >= 0)
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = start + std::chrono::milliseconds(spec.timeout_ms);
  struct rusage ru;
  std::memset(&ru, 0, sizeof(ru));
  int status = 0;
  while (true) {
    drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
          result.stdout_truncated);
    drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
          result.stderr_truncated);

    pid_t w = wait4(pid, &status, WNOHANG, &ru);
    if (w == pid)
      break;
    if (w < 0 && errno != EINTR) {
      result.error_message = "wait4: " + std::string(std::strerror(errno));
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      while (wait4(pid, &status, 0, &ru) < 0 && errno == EINTR) {
      }
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  const auto end = std::chrono::steady_clock::now();
  // Background children of a normally exiting program die with the group.
  if (!result.timed_out)
    kill(-pid, SIGKILL);

  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes,
        result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes,
        result.stderr_truncated);
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  if (result.stdout_truncated)
    result.stdout_text += "(truncated)";
  if (result.stderr_truncated)
    result.stderr_text += "(truncated)";

  result.elapsed_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count());
  result.peak_memory_kb = maxrss_kb(ru);

  if (result.timed_out) {
    result.exit_code = 124;
    result.term_signal = SIGKILL;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + result.term_signal;
  }
  return result;
}

SandboxCapabilities detect_platform_sandbox_capabilities() {
  SandboxCapabilities caps;
  caps.workspace_confinement = true; // PathGuard::confine()
  caps.rlimits_cpu = true;           // setrlimit(RLIMIT_CPU)
  caps.rlimits_mem = true;           // setrlimit(RLIMIT_AS)
  caps.process_group_kill = true;    // setsid() + kill(-pid)
  caps.job_objects = false;
  caps.inband_memory_usage = true;   // wait4() rusage
  return caps;
}

} // namespace arbiter

#endif
