#pragma once

// arbiter/workspace.hpp — The confined directory tree the engine may touch.
//
// LAYOUT:
//   <root>/sources/   named sources (<sanitized>.cpp)
//   <root>/execute/   named binaries (<sanitized>.exe), cwd of executed programs
//   <root>/inputs/    materialized stdin (<ts>_<hex>.in)
//   <root>/outputs/   captured stdout (<ts>_<hex>.out)
//   <root>/cache/     artifact cache (see artifact_cache.hpp)
//   <root>/compile/   anonymous compile units
//   <root>/gdb/       debugger scripts (created lazily)
//
// CONCURRENCY:
//   The fixed directories are created once in open(). Afterwards every writer
//   uses a distinct allocated path or sanitized name, so concurrent calls do
//   not contend on files. Category directories are created with
//   create_directories(), which is idempotent under races.

#include <optional>
#include <string>
#include <vector>

namespace arbiter {

namespace category {
constexpr const char* kSources = "sources";
constexpr const char* kExecute = "execute";
constexpr const char* kInputs = "inputs";
constexpr const char* kOutputs = "outputs";
constexpr const char* kCache = "cache";
constexpr const char* kCompile = "compile";
constexpr const char* kDebugger = "gdb";
constexpr const char* kTests = "tests";
}  // namespace category

class Workspace {
 public:
  // Create (idempotently) the fixed layout under root, mode 0700 on POSIX.
  // Returns nullopt and sets *error if the root is not writable.
  static std::optional<Workspace> open(const std::string& root, std::string* error);

  const std::string& root() const { return root_; }

  // <root>/<category>. Does not touch the filesystem.
  std::string dir(const std::string& category) const;

  // Reserve "<root>/<category>/<millis>_<8hex>". Creates the category
  // directory if needed; never creates the file itself. Unique across threads
  // of this process even within the same millisecond.
  std::string allocate_temp_path(const std::string& category) const;

  // Idempotent; false on filesystem error.
  bool ensure_dir(const std::string& category) const;

  static const std::vector<std::string>& fixed_directories();

 private:
  explicit Workspace(std::string root) : root_(std::move(root)) {}
  std::string root_;
};

}  // namespace arbiter
