#pragma once

// arbiter/artifact_cache.hpp — Content-keyed cache of compiled binaries.
//
// LAYOUT (under <workspace>/cache):
//   objects/AB/CD/<key>        stored blob (identity or zstd)
//   objects/AB/CD/<key>.meta   JSON sidecar, see ArtifactInfo
//
// KEY:
//   key_for() = BLAKE3("cache:" + canonical build description). The
//   description covers compiler path, standard, optimization level, the fixed
//   warning flags, the cache format version and the source text. Two compiles
//   with the same key produce interchangeable binaries.
//
// INVARIANTS:
//   1. Writes are atomic: tmp+rename in the target directory.
//   2. Reads verify the stored blob hash, the decoded size and the content
//      hash before returning anything.
//   3. Fail-closed: any integrity or I/O failure is a miss, never corrupted
//      data and never an error surfaced to the compile caller.
//
// THREAD SAFETY:
//   No in-memory index; all state is on disk. Concurrent put() of the same
//   key is safe because both writers rename identical content into place.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

struct ArtifactInfo {
  std::string key;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;  // plain BLAKE3 of the stored bytes
  std::string content_hash;      // "cache:" domain hash of the decoded bytes
  std::uint64_t created_at_unix_ts{0};
};

class ArtifactCache {
 public:
  // compression: "off" or "zstd". zstd silently degrades to identity when the
  // build has no zstd support.
  ArtifactCache(std::string root, std::string compression);

  static std::string key_for(const std::string& compiler_path, const std::string& cpp_standard,
                             const std::string& optimization_level,
                             const std::vector<std::string>& flags, const std::string& source);

  // False on any I/O failure; the cache is then unchanged.
  bool put(const std::string& key, const std::string& bytes);

  std::optional<std::string> get(const std::string& key) const;

  bool contains(const std::string& key) const;

  std::optional<ArtifactInfo> info(const std::string& key) const;

  std::string object_path(const std::string& key) const;
  std::string meta_path(const std::string& key) const;

  const std::string& root() const { return root_; }

 private:
  std::string root_;
  std::string compression_;
};

}  // namespace arbiter
