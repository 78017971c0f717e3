#pragma once

// arbiter/debugger.hpp — Batch debugger sessions against a compiled binary.
//
// RESOLUTION:
//   The debugger binary comes from a DebuggerResolver. The shipped resolver
//   (ToolchainDebuggerResolver) joins paths.toolchain_dir with
//   debugger.binary, confines the result and requires it to exist. There is
//   no fallback to a debugger found elsewhere on the system: an unset or
//   broken toolchain is reported as debugger_misconfigured.
//
// INVOCATION:
//   [gdb, --batch, -nx, -x, <script>, <binary>], cwd = execute/, 30 s watchdog.
//   The script is written to gdb/<ts>_<hex>.gdb and left on disk.
//
// LIMITS:
//   The ResourceLimits given at construction are installed on gdb and
//   inherited by the program it starts. The engine passes a CPU limit equal to
//   the watchdog, execution.max_memory plus kDebuggerHeadroomMb of address
//   space (gdb shares the ceiling) and the executor's stdout file cap.

#include <memory>
#include <optional>
#include <string>

#include "arbiter/path_guard.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/types.hpp"
#include "arbiter/workspace.hpp"

namespace arbiter {

constexpr std::uint64_t kDebugTimeoutMs = 30000;
constexpr std::uint64_t kDebuggerHeadroomMb = 1024;

struct DebuggerResolution {
  bool ok{false};
  std::string path;
  std::string error;
};

class DebuggerResolver {
 public:
  virtual ~DebuggerResolver() = default;
  virtual DebuggerResolution resolve() const = 0;
};

class ToolchainDebuggerResolver final : public DebuggerResolver {
 public:
  ToolchainDebuggerResolver(std::string toolchain_root, std::string relative_binary,
                            const PathGuard& guard);
  DebuggerResolution resolve() const override;

 private:
  std::string toolchain_root_;
  std::string relative_binary_;
  const PathGuard& guard_;
};

class Debugger {
 public:
  Debugger(const Workspace& workspace, const PathGuard& guard,
           std::shared_ptr<const DebuggerResolver> resolver,
           std::shared_ptr<const ResourceLimiter> limiter, ResourceLimits limits,
           std::size_t max_output_bytes);

  // Empty or absent script: default_script().
  DebugResult debug(const std::string& binary_path, const std::optional<std::string>& script) const;

  static const std::string& default_script();

 private:
  const Workspace& workspace_;
  const PathGuard& guard_;
  std::shared_ptr<const DebuggerResolver> resolver_;
  std::shared_ptr<const ResourceLimiter> limiter_;
  ResourceLimits limits_;
  std::size_t max_output_bytes_;
};

}  // namespace arbiter
