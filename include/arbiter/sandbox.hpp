#pragma once

// arbiter/sandbox.hpp — Child process spawning under a watchdog and OS limits.
//
// ENFORCEMENT MODEL:
//   1. ResourceLimiter (capability interface) applies OS limits inside the
//      child before exec, so they hold from the program's first instruction.
//        - RlimitResourceLimiter: POSIX setrlimit(RLIMIT_CPU, RLIMIT_AS,
//          RLIMIT_FSIZE).
//        - NoopResourceLimiter: platforms without rlimits (Windows). Limits
//          are then advisory and only the watchdog enforces anything.
//   2. The wall-clock watchdog is always present, on every platform,
//      regardless of which limiter is active. When it fires the whole
//      process group (POSIX) or job object (Windows) is killed. The child is
//      never trusted to terminate on its own.
//
// PLATFORM GUARDS:
//   sandbox_posix.cpp  -> everything except _WIN32
//   sandbox_win.cpp    -> _WIN32 (job objects, no rlimits)
//
// THREAD SAFETY:
//   run_process() keeps no shared state and may be called concurrently.
//   Limiters are immutable after construction.

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "arbiter/types.hpp"

namespace arbiter {

struct ResourceLimits {
  std::uint64_t cpu_time_ms{0};      // 0 = unlimited
  std::uint64_t address_space_bytes{0};  // 0 = unlimited
  std::uint64_t file_size_bytes{0};  // largest file the child may write; 0 = unlimited
};

class ResourceLimiter {
 public:
  virtual ~ResourceLimiter() = default;

  // Called in the child between fork() and exec(). Must only use
  // async-signal-safe calls. Returns false if a requested limit could not be
  // installed; the child then exits instead of running unconstrained.
  virtual bool apply_in_child(const ResourceLimits& limits) const noexcept = 0;

  // Names of the limits this limiter would enforce for the given request,
  // e.g. {"rlimit_cpu", "rlimit_as", "rlimit_fsize"}. Empty for the no-op
  // limiter.
  virtual std::vector<std::string> describe(const ResourceLimits& limits) const = 0;

  virtual std::string name() const = 0;
};

class RlimitResourceLimiter final : public ResourceLimiter {
 public:
  bool apply_in_child(const ResourceLimits& limits) const noexcept override;
  std::vector<std::string> describe(const ResourceLimits& limits) const override;
  std::string name() const override { return "rlimit"; }
};

class NoopResourceLimiter final : public ResourceLimiter {
 public:
  bool apply_in_child(const ResourceLimits&) const noexcept override { return true; }
  std::vector<std::string> describe(const ResourceLimits&) const override { return {}; }
  std::string name() const override { return "noop"; }
};

// The limiter appropriate for this platform build.
std::shared_ptr<const ResourceLimiter> platform_resource_limiter();

struct ProcessSpec {
  std::string command;  // absolute path; no PATH search
  std::vector<std::string> argv;
  std::map<std::string, std::string> env;
  std::string cwd;
  std::uint64_t timeout_ms{5000};  // wall-clock watchdog deadline
  std::size_t max_output_bytes{4096};  // cap for piped stdout/stderr
  // Empty: child reads an empty stdin. Otherwise the file is bound to fd 0.
  std::string stdin_path;
  // Empty: stdout is piped and captured. Otherwise the file is bound to fd 1.
  std::string stdout_path;
  ResourceLimits limits;
};

struct ProcessResult {
  bool launched{false};
  int exit_code{0};
  int term_signal{0};  // POSIX signal that killed the child, 0 otherwise
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;  // only when stdout was piped
  std::string stderr_text;
  std::string error_message;
  std::uint64_t elapsed_ms{0};
  std::uint64_t peak_memory_kb{0};  // in-band from wait4/job accounting, 0 if unknown
  std::vector<std::string> limits_enforced;
};

// Spawn, supervise and reap one child process.
ProcessResult run_process(const ProcessSpec& spec, const ResourceLimiter& limiter);

// True if term_signal indicates the CPU-time rlimit fired.
bool killed_by_cpu_limit(const ProcessResult& result);

// True if the child died writing past ResourceLimits::file_size_bytes.
bool killed_by_output_limit(const ProcessResult& result);

SandboxCapabilities detect_platform_sandbox_capabilities();

}  // namespace arbiter
