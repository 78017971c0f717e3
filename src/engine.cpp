#include "arbiter/engine.hpp"

#include <algorithm>

#include "arbiter/observability.hpp"

namespace arbiter {

namespace {

// gdb's register dumps and disassembly outgrow typical program-output caps.
constexpr std::size_t kMinDebuggerOutputBytes = 64 * 1024;

std::shared_ptr<const DebuggerResolver> default_resolver(
    std::shared_ptr<const DebuggerResolver> injected, const Config& config, const PathGuard& guard) {
  if (injected) return injected;
  return std::make_shared<ToolchainDebuggerResolver>(config.toolchain_root,
                                                           config.debugger_binary, guard);
}

ResourceLimits debugger_limits(const Config& config) {
  ResourceLimits limits;
  limits.cpu_time_ms = kDebugTimeoutMs;
  limits.address_space_bytes = (config.max_memory_mb + kDebuggerHeadroomMb) << 20;
  limits.file_size_bytes = output_file_limit(config.max_output_bytes);
  return limits;
}

}  // namespace

std::unique_ptr<Engine> Engine::create(const Config& config, std::string* error,
                                       std::shared_ptr<const DebuggerResolver> resolver) {
  auto workspace = Workspace::open(config.workspace_root, error);
  if (!workspace) return nullptr;
  set_event_log_path(config.event_log_path);
  return std::unique_ptr<Engine>(new Engine(config, std::move(*workspace), std::move(resolver)));
}

Engine::Engine(const Config& config, Workspace workspace,
               std::shared_ptr<const DebuggerResolver> resolver)
    : config_(config),
      workspace_(std::move(workspace)),
      guard_(workspace_.root(), config_.toolchain_root, config_.forbidden_commands),
      limiter_(platform_resource_limiter()),
      cache_(config_.cache_enabled
                 ? std::make_unique<ArtifactCache>(workspace_.dir(category::kCache),
                                                   config_.cache_compression)
                 : nullptr),
      compiler_(config_, workspace_, cache_.get(), limiter_),
      executor_(config_, workspace_, guard_, limiter_),
      debugger_(workspace_, guard_, default_resolver(std::move(resolver), config_, guard_), limiter_,
                debugger_limits(config_),
                std::max<std::size_t>(static_cast<std::size_t>(config_.max_output_bytes),
                                      kMinDebuggerOutputBytes)),
      test_cases_(workspace_, guard_) {}

CompileResult Engine::compile(const std::string& source,
                              const std::optional<std::string>& name) const {
  OperationEvent ev;
  ev.operation = "compile";
  ev.bytes_in = source.size();
  CompileResult r;
  {
    ScopeTimer t(ev.duration_ns);
    r = compiler_.compile(source, name);
  }
  ev.ok = r.success;
  ev.error_code = r.error_code;
  ev.bytes_stdout = r.stdout_text.size();
  ev.bytes_stderr = r.stderr_text.size();
  ev.cache_hit = r.from_cache;
  ev.cache_put = r.stored_in_cache;
  ev.timed_out = r.error_code == ErrorCode::compile_timeout;
  emit_operation_event(ev);
  return r;
}

ExecutionResult Engine::execute(const std::string& binary_path, const std::string& input,
                                std::optional<std::uint64_t> time_limit_ms,
                                std::optional<std::uint64_t> memory_limit_mb) const {
  OperationEvent ev;
  ev.operation = "execute";
  ev.bytes_in = input.size();
  ExecutionResult r;
  {
    ScopeTimer t(ev.duration_ns);
    r = executor_.execute(binary_path, input, time_limit_ms, memory_limit_mb);
  }
  ev.ok = r.success;
  ev.error_code = r.error_code;
  ev.bytes_stdout = r.stdout_text.size();
  ev.bytes_stderr = r.stderr_text.size();
  ev.timed_out = r.timed_out;
  ev.peak_memory_kb = r.peak_memory_kb;
  emit_operation_event(ev);
  return r;
}

ComparisonResult Engine::compare(const std::string& actual, const std::string& expected,
                                 bool ignore_whitespace, bool ignore_case) const {
  OperationEvent ev;
  ev.operation = "compare";
  ev.bytes_in = actual.size() + expected.size();
  ComparisonResult r;
  {
    ScopeTimer t(ev.duration_ns);
    r = compare_outputs(actual, expected, ignore_whitespace, ignore_case);
  }
  // A mismatch is a valid answer, not a failed operation.
  ev.ok = true;
  emit_operation_event(ev);
  return r;
}

DebugResult Engine::debug(const std::string& binary_path,
                          const std::optional<std::string>& script) const {
  OperationEvent ev;
  ev.operation = "debug";
  ev.bytes_in = script ? script->size() : 0;
  DebugResult r;
  {
    ScopeTimer t(ev.duration_ns);
    r = debugger_.debug(binary_path, script);
  }
  ev.ok = r.success;
  ev.error_code = r.error_code;
  ev.bytes_stdout = r.stdout_text.size();
  ev.bytes_stderr = r.stderr_text.size();
  ev.timed_out = r.error_code == ErrorCode::debug_timeout;
  emit_operation_event(ev);
  return r;
}

std::string Engine::sanitize_identifier(const std::string& raw) const {
  return arbiter::sanitize_identifier(raw);
}

TestCase Engine::read_test_case(const std::string& id) const {
  OperationEvent ev;
  ev.operation = "read_test_case";
  ev.bytes_in = id.size();
  TestCase tc;
  {
    ScopeTimer t(ev.duration_ns);
    tc = test_cases_.read(id);
  }
  ev.ok = tc.found;
  ev.bytes_stdout = tc.raw.size() + tc.input.size() + tc.output.size();
  emit_operation_event(ev);
  return tc;
}

SandboxCapabilities Engine::capabilities() const { return detect_platform_sandbox_capabilities(); }

}  // namespace arbiter
