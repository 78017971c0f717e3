#include "arbiter/version.hpp"

#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"

namespace arbiter {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = hash_runtime_info().primitive;
  // Deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["engine_semver"] = m.engine_semver;
  o["hash_algorithm"] = static_cast<std::uint64_t>(m.hash_algorithm);
  o["cache_format"] = static_cast<std::uint64_t>(m.cache_format);
  o["protocol_framing"] = static_cast<std::uint64_t>(m.protocol_framing);
  o["event_log"] = static_cast<std::uint64_t>(m.event_log);
  o["hash_primitive"] = m.hash_primitive;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace arbiter
