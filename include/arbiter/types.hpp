#pragma once

// arbiter/types.hpp — Core data structures for the arbiter compile/execute/debug engine.
//
// MEMORY OWNERSHIP:
//   - All result types are value types. Every string member is value-owned.
//   - Engine entry points return results by value. Caller owns them.
//   - No raw pointer members in any public API type.
//
// ERROR REPORTING:
//   - Every engine operation reports failure through error_code/error_message
//     in its result struct. Nothing is thrown across the engine API.
//   - error_code == ErrorCode::none on success.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

enum class ErrorCode {
  none,
  compile_failure,
  compile_timeout,
  unsafe_command,
  execution_timeout,
  execution_failure,
  debugger_misconfigured,
  debug_timeout,
  workspace_io_error,
  spawn_failed,
  config_invalid,
  limit_out_of_range,
};

std::string to_string(ErrorCode code);

// Sandbox capabilities of the current platform build.
struct SandboxCapabilities {
  bool workspace_confinement{false};
  bool rlimits_cpu{false};
  bool rlimits_mem{false};
  bool process_group_kill{false};
  bool job_objects{false};
  bool inband_memory_usage{false};

  std::vector<std::string> enforced() const;
  std::vector<std::string> unsupported() const;
};

struct CompileResult {
  bool success{false};
  std::optional<std::string> binary_path;  // present iff success
  std::string source_path;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
  bool from_cache{false};
  bool stored_in_cache{false};
  ErrorCode error_code{ErrorCode::none};
};

struct ExecutionResult {
  bool success{false};
  std::string stdout_text;
  std::string stderr_text;
  std::uint64_t elapsed_ms{0};
  std::uint64_t peak_memory_kb{0};
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  std::string input_path;
  std::string output_path;
  // OS-level limits actually applied before the first instruction ran.
  // Empty on platforms where the wall-clock watchdog is the only enforcement.
  std::vector<std::string> limits_enforced;
};

struct LineDifference {
  std::size_t line{0};  // 1-indexed
  std::string actual;
  std::string expected;
};

struct ComparisonResult {
  bool match{false};
  std::vector<LineDifference> differences;
  std::size_t actual_line_count{0};
  std::size_t expected_line_count{0};
};

struct DebugResult {
  bool success{false};
  std::string stdout_text;
  std::string stderr_text;
  int exit_code{0};
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;
  std::string script_path;
};

struct TestCase {
  bool found{false};
  std::string id;
  std::string description;
  std::string input;
  std::string output;
  std::string raw;  // file-backed cases are returned verbatim
  bool builtin{false};
  std::string error_message;
};

}  // namespace arbiter
