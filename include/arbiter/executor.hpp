#pragma once

// arbiter/executor.hpp — Runs a compiled binary once under time and memory limits.
//
// ENFORCEMENT:
//   - Limits above kMaxTimeLimitMs / kMaxMemoryLimitMb: limit_out_of_range,
//     nothing is run.
//   - CPU time, address space and stdout file size: ResourceLimiter, in the
//     child before exec.
//   - Wall clock: watchdog at time_limit + kWatchdogGraceMs, kills the group.
//   A CPU-rlimit death is reported exactly like a watchdog kill. A program
//   that outgrows output_file_limit() dies with SIGXFSZ and fails with
//   execution_failure and truncated stdout.
//
// FILES:
//   stdin  <- inputs/<ts>_<hex>.in   (the caller's input, verbatim)
//   stdout -> outputs/<ts>_<hex>.out (same stem), at most max_output_size + 1
//             bytes read back after exit
//   stderr -> pipe, capped at execution.max_output_size
//   Both files stay on disk and are reported in the result.

#include <memory>
#include <optional>
#include <string>

#include "arbiter/config.hpp"
#include "arbiter/path_guard.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/types.hpp"
#include "arbiter/workspace.hpp"

namespace arbiter {

constexpr std::uint64_t kWatchdogGraceMs = 1000;
constexpr const char* kTruncationMarker = "\n... (output truncated)";
constexpr std::uint64_t kMinOutputFileBytes = 1u << 20;

// RLIMIT_FSIZE for the stdout file: four times max_output_bytes, at least
// kMinOutputFileBytes.
std::uint64_t output_file_limit(std::uint64_t max_output_bytes);

// Keep the first max_bytes/4 bytes and append kTruncationMarker when text is
// longer than max_bytes. Returns true if it truncated.
bool truncate_output(std::string& text, std::size_t max_bytes);

class Executor {
 public:
  Executor(const Config& config, const Workspace& workspace, const PathGuard& guard,
           std::shared_ptr<const ResourceLimiter> limiter);

  // Unset limits fall back to execution.max_time / execution.max_memory.
  ExecutionResult execute(const std::string& binary_path, const std::string& input,
                          std::optional<std::uint64_t> time_limit_ms,
                          std::optional<std::uint64_t> memory_limit_mb) const;

 private:
  const Config& config_;
  const Workspace& workspace_;
  const PathGuard& guard_;
  std::shared_ptr<const ResourceLimiter> limiter_;
};

}  // namespace arbiter
