#pragma once

// arbiter/observability.hpp — Per-operation events and in-process engine stats.
//
// DESIGN:
//   OperationEvent is the observable unit. Every engine entry point
//   (compile, execute, compare, debug, read_test_case) emits exactly one,
//   which is:
//     - recorded into the global EngineStats (always), and
//     - appended as one JSONL line to the event log, if one is configured.
//   Event log path: ARBITER_EVENT_LOG env var if set, else the path installed
//   with set_event_log_path() (observability.event_log in the config).
//
// CONTENT RULE:
//   Events carry sizes, codes and timings only. Never program stdout/stderr
//   or source text.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "arbiter/types.hpp"

namespace arbiter {

struct OperationEvent {
  std::string operation;  // "compile", "execute", "compare", "debug", "read_test_case"
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  uint64_t duration_ns{0};

  size_t bytes_in{0};      // source / stdin / script size
  size_t bytes_stdout{0};
  size_t bytes_stderr{0};

  bool cache_hit{false};   // compile only
  bool cache_put{false};   // compile only
  bool timed_out{false};
  uint64_t peak_memory_kb{0};
};

// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Microseconds; 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// Thread-safe. Counters are atomic; the failure map uses a mutex.
// Resets on process restart.
class EngineStats {
 public:
  void record(const OperationEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> total_operations{0};
  std::atomic<uint64_t> successful_operations{0};
  std::atomic<uint64_t> failed_operations{0};

  std::atomic<uint64_t> compiles{0};
  std::atomic<uint64_t> executions{0};
  std::atomic<uint64_t> comparisons{0};
  std::atomic<uint64_t> debug_sessions{0};
  std::atomic<uint64_t> test_case_reads{0};

  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> cache_hits{0};
  std::atomic<uint64_t> cache_misses{0};
  std::atomic<uint64_t> cache_puts{0};

  std::atomic<uint64_t> peak_memory_kb_max{0};

  LatencyHistogram latency_histogram;

  uint64_t failures_for(ErrorCode code) const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failure_categories_;
};

EngineStats& global_engine_stats();

// Path used when ARBITER_EVENT_LOG is unset. Empty disables the log.
void set_event_log_path(const std::string& path);

// Record into global stats and append to the event log. Never throws and
// never fails the calling operation.
void emit_operation_event(const OperationEvent& ev);

std::string event_to_json(const OperationEvent& ev);

// RAII duration capture.
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace arbiter
