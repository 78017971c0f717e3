#include "arbiter/types.hpp"

#include <utility>

namespace arbiter {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::compile_failure: return "compile_failure";
    case ErrorCode::compile_timeout: return "compile_timeout";
    case ErrorCode::unsafe_command: return "unsafe_command";
    case ErrorCode::execution_timeout: return "execution_timeout";
    case ErrorCode::execution_failure: return "execution_failure";
    case ErrorCode::debugger_misconfigured: return "debugger_misconfigured";
    case ErrorCode::debug_timeout: return "debug_timeout";
    case ErrorCode::workspace_io_error: return "workspace_io_error";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::limit_out_of_range: return "limit_out_of_range";
  }
  return "";
}

namespace {

std::vector<std::string> capabilities_with(const SandboxCapabilities& caps, bool wanted) {
  const std::pair<const char*, bool> all[] = {
      {"workspace_confinement", caps.workspace_confinement},
      {"rlimits_cpu", caps.rlimits_cpu},
      {"rlimits_mem", caps.rlimits_mem},
      {"process_group_kill", caps.process_group_kill},
      {"job_objects", caps.job_objects},
      {"inband_memory_usage", caps.inband_memory_usage},
  };
  std::vector<std::string> out;
  for (const auto& [name, present] : all) {
    if (present == wanted) out.emplace_back(name);
  }
  return out;
}

}  // namespace

std::vector<std::string> SandboxCapabilities::enforced() const { return capabilities_with(*this, true); }

std::vector<std::string> SandboxCapabilities::unsupported() const { return capabilities_with(*this, false); }

}  // namespace arbiter
