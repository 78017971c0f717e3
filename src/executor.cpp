#include "arbiter/executor.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace arbiter {

std::uint64_t output_file_limit(std::uint64_t max_output_bytes) {
  return std::max<std::uint64_t>(max_output_bytes * 4, kMinOutputFileBytes);
}

bool truncate_output(std::string& text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) return false;
  text.resize(max_bytes / 4);
  text += kTruncationMarker;
  return true;
}

Executor::Executor(const Config& config, const Workspace& workspace, const PathGuard& guard,
                   std::shared_ptr<const ResourceLimiter> limiter)
    : config_(config), workspace_(workspace), guard_(guard), limiter_(std::move(limiter)) {}

ExecutionResult Executor::execute(const std::string& binary_path, const std::string& input,
                                  std::optional<std::uint64_t> time_limit_ms,
                                  std::optional<std::uint64_t> memory_limit_mb) const {
  ExecutionResult result;

  if (!guard_.validate_command(binary_path)) {
    result.error_code = ErrorCode::unsafe_command;
    result.error_message = "command rejected by security policy: " + binary_path;
    return result;
  }
  const ConfinedPath confined = guard_.confine(binary_path);
  if (!confined.ok) {
    result.error_code = ErrorCode::unsafe_command;
    result.error_message = "path outside the workspace: " + binary_path;
    return result;
  }
  std::error_code ec;
  if (!fs::is_regular_file(confined.resolved, ec)) {
    result.error_code = ErrorCode::workspace_io_error;
    result.error_message = "binary not found: " + confined.resolved;
    return result;
  }

  const std::uint64_t time_limit = time_limit_ms.value_or(config_.max_time_ms);
  const std::uint64_t memory_limit = memory_limit_mb.value_or(config_.max_memory_mb);
  if (time_limit == 0 || time_limit > kMaxTimeLimitMs) {
    result.error_code = ErrorCode::limit_out_of_range;
    result.error_message = "time limit must be between 1 and " + std::to_string(kMaxTimeLimitMs) +
                           " ms, got " + std::to_string(time_limit);
    return result;
  }
  if (memory_limit == 0 || memory_limit > kMaxMemoryLimitMb) {
    result.error_code = ErrorCode::limit_out_of_range;
    result.error_message = "memory limit must be between 1 and " + std::to_string(kMaxMemoryLimitMb) +
                           " MB, got " + std::to_string(memory_limit);
    return result;
  }

  const std::string base = workspace_.allocate_temp_path(category::kInputs);
  result.input_path = base + ".in";
  if (!workspace_.ensure_dir(category::kOutputs)) {
    result.error_code = ErrorCode::workspace_io_error;
    result.error_message = "cannot create " + workspace_.dir(category::kOutputs);
    return result;
  }
  result.output_path =
      (fs::path(workspace_.dir(category::kOutputs)) / fs::path(base).filename()).string() + ".out";
  {
    std::ofstream ofs(result.input_path, std::ios::binary | std::ios::trunc);
    ofs.write(input.data(), static_cast<std::streamsize>(input.size()));
    if (!ofs) {
      result.error_code = ErrorCode::workspace_io_error;
      result.error_message = "cannot write input file " + result.input_path;
      return result;
    }
  }

  ProcessSpec spec;
  spec.command = confined.resolved;
  spec.cwd = workspace_.dir(category::kExecute);
  spec.timeout_ms = time_limit + kWatchdogGraceMs;
  spec.max_output_bytes = static_cast<std::size_t>(config_.max_output_bytes);
  spec.stdin_path = result.input_path;
  spec.stdout_path = result.output_path;
  spec.limits.cpu_time_ms = time_limit;
  spec.limits.address_space_bytes = memory_limit << 20;
  spec.limits.file_size_bytes = output_file_limit(config_.max_output_bytes);

  const ProcessResult proc = run_process(spec, *limiter_);
  if (!proc.launched) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = proc.error_message;
    result.exit_code = proc.exit_code;
    return result;
  }

  result.stderr_text = proc.stderr_text;
  result.peak_memory_kb = proc.peak_memory_kb;
  result.limits_enforced = proc.limits_enforced;
  result.exit_code = proc.exit_code;
  result.elapsed_ms = proc.elapsed_ms;

  {
    // One byte past the cap is enough to know truncation is due.
    std::ifstream ifs(result.output_path, std::ios::binary);
    if (ifs) {
      result.stdout_text.resize(static_cast<std::size_t>(config_.max_output_bytes) + 1);
      ifs.read(result.stdout_text.data(), static_cast<std::streamsize>(result.stdout_text.size()));
      result.stdout_text.resize(static_cast<std::size_t>(ifs.gcount()));
    }
  }
  result.stdout_truncated =
      truncate_output(result.stdout_text, static_cast<std::size_t>(config_.max_output_bytes));

  if (proc.timed_out || killed_by_cpu_limit(proc)) {
    result.timed_out = true;
    result.elapsed_ms = time_limit;
    result.exit_code = -1;
    result.error_code = ErrorCode::execution_timeout;
    result.error_message = "time limit exceeded (" + std::to_string(time_limit) + " ms)";
    return result;
  }

  if (killed_by_output_limit(proc)) {
    result.error_code = ErrorCode::execution_failure;
    result.error_message = "output limit exceeded (" +
                           std::to_string(spec.limits.file_size_bytes) + " bytes written to stdout)";
    return result;
  }

  result.success = proc.exit_code == 0;
  if (!result.success) {
    result.error_code = ErrorCode::execution_failure;
    result.error_message = proc.term_signal != 0
                               ? "terminated by signal " + std::to_string(proc.term_signal)
                               : "exited with code " + std::to_string(proc.exit_code);
  }
  return result;
}

}  // namespace arbiter
