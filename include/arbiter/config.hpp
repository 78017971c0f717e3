#pragma once

// arbiter/config.hpp — Typed, immutable engine configuration.
//
// LIFECYCLE:
//   load_config() is called once at startup. Every required key is checked
//   there; a missing or mistyped key fails the load with a message naming it.
//   After load, Config is passed by const reference and never mutated, so no
//   compile/execute/debug call can hit a missing-key fault.
//
// FILE FORMAT (JSON):
//   {
//     "compilation": {"compiler_path": "g++", "cpp_standard": "c++17",
//                     "optimization_level": "-O2"},
//     "execution":   {"max_time": 1000, "max_memory": 256, "max_output_size": 10240},
//     "paths":       {"temp_dir": "./tmp", "toolchain_dir": "/usr"},
//     "debugger":    {"binary": "bin/gdb"},
//     "security":    {"forbidden_commands": ["rm -rf", "format", "del /"]},
//     "cache":       {"enabled": true, "compression": "off"},
//     "observability": {"event_log": "./tmp/events.jsonl"}
//   }

#include <cstdint>
#include <string>
#include <vector>

namespace arbiter {

// Ceilings for execution limits, configured defaults and per-call values
// alike. Anything above is rejected, never clamped.
constexpr std::uint64_t kMaxTimeLimitMs = 60000;
constexpr std::uint64_t kMaxMemoryLimitMb = 16384;
constexpr std::uint64_t kMaxOutputBytes = 64ull << 20;

struct Config {
  // compilation
  std::string compiler_path;       // absolute after load
  std::string cpp_standard;        // e.g. "c++17"
  std::string optimization_level;  // e.g. "-O2"

  // execution defaults
  std::uint64_t max_time_ms{1000};
  std::uint64_t max_memory_mb{256};
  std::uint64_t max_output_bytes{10240};

  // paths
  std::string workspace_root;      // absolute after load
  std::string toolchain_root;      // absolute after load; empty = unset
  std::string debugger_binary;     // relative to toolchain_root

  std::vector<std::string> forbidden_commands;

  bool cache_enabled{true};
  std::string cache_compression{"off"};

  std::string event_log_path;
};

struct ConfigLoadResult {
  bool ok{false};
  Config config;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Parse and validate configuration text. base_dir anchors relative paths
// (normally the directory containing the config file).
ConfigLoadResult parse_config(const std::string& json_text, const std::string& base_dir);

// Read the file at path and parse it.
ConfigLoadResult load_config(const std::string& path);

// Default debugger binary path relative to the toolchain root.
std::string default_debugger_binary();

}  // namespace arbiter
