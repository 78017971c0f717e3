#pragma once

// arbiter/version.hpp — Version manifest for the persisted and wire formats.
//
// Every component that writes a versioned format records the constant here.
// Changing a format without bumping its constant is a bug.

#include <cstdint>
#include <string>

namespace arbiter {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// Version 1 = BLAKE3-256, hex-encoded to 64 chars.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Layout of cache/objects/AB/CD/<digest> blobs and their .meta sidecars.
// Folded into every cache key, so a bump invalidates old entries.
constexpr uint32_t CACHE_FORMAT_VERSION = 1;

// NDJSON request/response schema of `arbiter serve`.
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

// Schema of the JSONL operation event log.
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  std::string engine_semver{ENGINE_SEMVER};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cache_format{CACHE_FORMAT_VERSION};
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace arbiter
