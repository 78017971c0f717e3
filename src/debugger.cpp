#include "arbiter/debugger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace arbiter {

ToolchainDebuggerResolver::ToolchainDebuggerResolver(std::string toolchain_root,
                                                     std::string relative_binary,
                                                     const PathGuard& guard)
    : toolchain_root_(std::move(toolchain_root)),
      relative_binary_(std::move(relative_binary)),
      guard_(guard) {}

DebuggerResolution ToolchainDebuggerResolver::resolve() const {
  DebuggerResolution r;
  if (toolchain_root_.empty()) {
    r.error = "paths.toolchain_dir is not configured";
    return r;
  }
  const std::string candidate = (fs::path(toolchain_root_) / relative_binary_).string();
  const ConfinedPath confined = guard_.confine(candidate);
  if (!confined.ok) {
    r.error = "debugger path escapes the toolchain root: " + candidate;
    return r;
  }
  std::error_code ec;
  if (!fs::is_regular_file(confined.resolved, ec)) {
    r.error = "debugger not found at " + confined.resolved;
    return r;
  }
  r.ok = true;
  r.path = confined.resolved;
  return r;
}

Debugger::Debugger(const Workspace& workspace, const PathGuard& guard,
                   std::shared_ptr<const DebuggerResolver> resolver,
                   std::shared_ptr<const ResourceLimiter> limiter, ResourceLimits limits,
                   std::size_t max_output_bytes)
    : workspace_(workspace),
      guard_(guard),
      resolver_(std::move(resolver)),
      limiter_(std::move(limiter)),
      limits_(limits),
      max_output_bytes_(max_output_bytes) {}

const std::string& Debugger::default_script() {
  static const std::string script =
      "set pagination off\n"
      "break main\n"
      "run\n"
      "backtrace\n"
      "info registers\n"
      "x/10i $pc\n"
      "quit\n";
  return script;
}

DebugResult Debugger::debug(const std::string& binary_path,
                            const std::optional<std::string>& script) const {
  DebugResult result;

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

  result.script_path = workspace_.allocate_temp_path(category::kDebugger) + ".gdb";
  {
    const std::string& text = (script && !script->empty()) ? *script : default_script();
    std::ofstream ofs(result.script_path, std::ios::binary | std::ios::trunc);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!ofs) {
      result.error_code = ErrorCode::workspace_io_error;
      result.error_message = "cannot write debugger script " + result.script_path;
      return result;
    }
  }

  const DebuggerResolution gdb = resolver_->resolve();
  if (!gdb.ok) {
    result.error_code = ErrorCode::debugger_misconfigured;
    result.error_message = gdb.error;
    return result;
  }

  ProcessSpec spec;
  spec.command = gdb.path;
  spec.argv = {"--batch", "-nx", "-x", result.script_path, confined.resolved};
#ifndef _WIN32
  const char* path = std::getenv("PATH");
  spec.env["PATH"] = (path && path[0]) ? path : "/usr/bin:/bin";
  spec.env["TERM"] = "dumb";
#endif
  spec.cwd = workspace_.dir(category::kExecute);
  spec.timeout_ms = kDebugTimeoutMs;
  spec.max_output_bytes = max_output_bytes_;
  spec.limits = limits_;

  const ProcessResult proc = run_process(spec, *limiter_);
  if (!proc.launched) {
    result.error_code = ErrorCode::spawn_failed;
    result.error_message = proc.error_message;
    return result;
  }
  result.stdout_text = proc.stdout_text;
  result.stderr_text = proc.stderr_text;
  result.exit_code = proc.exit_code;
  if (proc.timed_out) {
    result.error_code = ErrorCode::debug_timeout;
    result.error_message = "debugger timed out after " + std::to_string(kDebugTimeoutMs) + " ms";
    return result;
  }
  result.success = proc.exit_code == 0;
  return result;
}

}  // namespace arbiter
