#pragma once

// arbiter/engine.hpp — Facade over the compile/execute/debug pipeline.
//
// OWNERSHIP:
//   Engine owns the immutable Config, the Workspace, the PathGuard, the
//   artifact cache and the per-stage components. Components hold references
//   into the Engine, so it is neither copyable nor movable; create() hands it
//   out behind a unique_ptr.
//
// THREAD SAFETY:
//   All entry points are const and may be called concurrently. Each call
//   works on its own allocated paths and its own child process.
//
// ERRORS:
//   Entry points never throw. Failures are reported in the result structs.
//   create() is the only place a startup failure (unwritable workspace) is
//   surfaced; it returns nullptr and fills *error.

#include <memory>
#include <optional>
#include <string>

#include "arbiter/artifact_cache.hpp"
#include "arbiter/comparator.hpp"
#include "arbiter/compiler.hpp"
#include "arbiter/config.hpp"
#include "arbiter/debugger.hpp"
#include "arbiter/executor.hpp"
#include "arbiter/path_guard.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/testcases.hpp"
#include "arbiter/types.hpp"
#include "arbiter/workspace.hpp"

namespace arbiter {

class Engine {
 public:
  // resolver: null selects the ToolchainDebuggerResolver built from config.
  static std::unique_ptr<Engine> create(const Config& config, std::string* error,
                                        std::shared_ptr<const DebuggerResolver> resolver = nullptr);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  CompileResult compile(const std::string& source,
                        const std::optional<std::string>& name = std::nullopt) const;

  ExecutionResult execute(const std::string& binary_path, const std::string& input,
                          std::optional<std::uint64_t> time_limit_ms = std::nullopt,
                          std::optional<std::uint64_t> memory_limit_mb = std::nullopt) const;

  ComparisonResult compare(const std::string& actual, const std::string& expected,
                           bool ignore_whitespace = true, bool ignore_case = false) const;

  DebugResult debug(const std::string& binary_path,
                    const std::optional<std::string>& script = std::nullopt) const;

  std::string sanitize_identifier(const std::string& raw) const;

  TestCase read_test_case(const std::string& id) const;

  SandboxCapabilities capabilities() const;

  const Config& config() const { return config_; }
  const Workspace& workspace() const { return workspace_; }
  const PathGuard& guard() const { return guard_; }
  const ArtifactCache* cache() const { return cache_.get(); }

 private:
  Engine(const Config& config, Workspace workspace,
         std::shared_ptr<const DebuggerResolver> resolver);

  const Config config_;
  const Workspace workspace_;
  const PathGuard guard_;
  std::shared_ptr<const ResourceLimiter> limiter_;
  std::unique_ptr<ArtifactCache> cache_;
  Compiler compiler_;
  Executor executor_;
  Debugger debugger_;
  TestCaseStore test_cases_;
};

}  // namespace arbiter
