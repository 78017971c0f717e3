#pragma once

// arbiter/compiler.hpp — Compiles one translation unit with fixed toolchain flags.
//
// FLAG POLICY:
//   argv = [compiler, src, -std=<std>, <opt>, -o, exe, -Wall, -Wextra, -Werror]
//   Standard and optimization level come from the validated Config only.
//   Nothing in a compile request can add, remove or reorder flags.
//
// NAMING:
//   named:     sources/<sanitized>.cpp  -> execute/<sanitized>.exe
//   anonymous: compile/<ts>_<hex>.cpp   -> compile/<ts>_<hex>.exe
//   The source file always stays on disk. A failed or timed-out compile
//   leaves no binary at the target path.

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/artifact_cache.hpp"
#include "arbiter/config.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/types.hpp"
#include "arbiter/workspace.hpp"

namespace arbiter {

constexpr std::uint64_t kCompileTimeoutMs = 30000;

class Compiler {
 public:
  // cache may be null (cache.enabled = false).
  Compiler(const Config& config, const Workspace& workspace, ArtifactCache* cache,
           std::shared_ptr<const ResourceLimiter> limiter,
           std::uint64_t timeout_ms = kCompileTimeoutMs);

  CompileResult compile(const std::string& source, const std::optional<std::string>& name) const;

  // Flags appended after "-o exe".
  static const std::vector<std::string>& warning_flags();

  // Full argv (without argv[0]) for one compile.
  std::vector<std::string> build_argv(const std::string& source_path,
                                      const std::string& binary_path) const;

 private:
  const Config& config_;
  const Workspace& workspace_;
  ArtifactCache* cache_;
  std::shared_ptr<const ResourceLimiter> limiter_;
  std::uint64_t timeout_ms_;
};

}  // namespace arbiter
