#pragma once

#include <string>
#include <string_view>

namespace arbiter {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// BLAKE3-256 of payload as 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing. Prefixes used in this codebase:
//   "tmp:"   temp-path digests (workspace.cpp)
//   "cache:" artifact cache keys and content digests (artifact_cache.cpp)
//   "sess:"  session id suffixes (session.cpp)
std::string hash_domain(std::string_view domain, std::string_view payload);

HashRuntimeInfo hash_runtime_info();

}  // namespace arbiter
