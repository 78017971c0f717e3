#pragma once

// arbiter/path_guard.hpp — Identifier sanitization and path confinement.
//
// SECURITY GATES (all callers must go through these before open/exec):
//   - sanitize_identifier(): caller-supplied names → filesystem-safe names.
//   - PathGuard::confine(): resolved path must lie under an allow-listed root.
//   - PathGuard::validate_command(): denylist screen for command strings.
//     This complements confine(); it never replaces it.

#include <string>
#include <vector>

namespace arbiter {

constexpr std::size_t kMaxIdentifierLength = 100;

// Replace every char outside [A-Za-z0-9_.-] with '_', strip leading dots,
// truncate to kMaxIdentifierLength. Total and idempotent.
std::string sanitize_identifier(const std::string& raw);

struct ConfinedPath {
  bool ok{false};
  std::string resolved;  // empty unless ok
};

class PathGuard {
 public:
  // toolchain_root may be empty (no second allow-listed root).
  PathGuard(const std::string& workspace_root, const std::string& toolchain_root,
            std::vector<std::string> forbidden_commands);

  // Resolve symlinks and relative segments, then require the result to lie
  // under the workspace root or the toolchain root.
  ConfinedPath confine(const std::string& path) const;

  // False if the command contains a forbidden substring (case-insensitive)
  // or matches a dangerous shell pattern.
  bool validate_command(const std::string& command_line) const;

  const std::string& workspace_root() const { return workspace_root_; }
  const std::string& toolchain_root() const { return toolchain_root_; }

 private:
  std::string workspace_root_;
  std::string toolchain_root_;
  std::vector<std::string> forbidden_lower_;
};

}  // namespace arbiter
