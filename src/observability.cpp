#include "arbiter/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#include "arbiter/jsonlite.hpp"
#include "arbiter/version.hpp"

namespace arbiter {

namespace {

// floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string format_double(const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

void update_max(std::atomic<uint64_t>& target, uint64_t value) {
  uint64_t cur = target.load(std::memory_order_relaxed);
  while (value > cur && !target.compare_exchange_weak(cur, value, std::memory_order_relaxed)) {
  }
}

std::mutex g_log_mu;
std::string g_log_path;

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      // Midpoint of the bucket.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_us\":" + format_double("%.2f", mean_us());
  out += ",\"p50_ms\":" + format_double("%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":" + format_double("%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":" + format_double("%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const OperationEvent& ev) {
  total_operations.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_operations.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_operations.fetch_add(1, std::memory_order_relaxed);
  }

  if (ev.operation == "compile") {
    compiles.fetch_add(1, std::memory_order_relaxed);
    (ev.cache_hit ? cache_hits : cache_misses).fetch_add(1, std::memory_order_relaxed);
    if (ev.cache_put) cache_puts.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "execute") {
    executions.fetch_add(1, std::memory_order_relaxed);
    update_max(peak_memory_kb_max, ev.peak_memory_kb);
  } else if (ev.operation == "compare") {
    comparisons.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "debug") {
    debug_sessions.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "read_test_case") {
    test_case_reads.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.timed_out) timeouts.fetch_add(1, std::memory_order_relaxed);

  latency_histogram.record(ev.duration_ns);

  if (ev.error_code != ErrorCode::none) {
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failure_categories_[to_string(ev.error_code)];
  }
}

uint64_t EngineStats::failures_for(ErrorCode code) const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  auto it = failure_categories_.find(to_string(code));
  return it == failure_categories_.end() ? 0 : it->second;
}

std::string EngineStats::to_json() const {
  const auto load = [](const std::atomic<uint64_t>& a) {
    return static_cast<std::uint64_t>(a.load(std::memory_order_relaxed));
  };
  jsonlite::Object ops;
  ops["compile"] = load(compiles);
  ops["execute"] = load(executions);
  ops["compare"] = load(comparisons);
  ops["debug"] = load(debug_sessions);
  ops["read_test_case"] = load(test_case_reads);

  const uint64_t hits = load(cache_hits);
  const uint64_t lookups = hits + load(cache_misses);
  jsonlite::Object cache;
  cache["hits"] = hits;
  cache["misses"] = load(cache_misses);
  cache["puts"] = load(cache_puts);
  cache["hit_rate"] = lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;

  jsonlite::Object failures;
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    for (const auto& [code, n] : failure_categories_) failures[code] = static_cast<std::uint64_t>(n);
  }

  jsonlite::Object o;
  o["total_operations"] = load(total_operations);
  o["successful_operations"] = load(successful_operations);
  o["failed_operations"] = load(failed_operations);
  o["timeouts"] = load(timeouts);
  o["operations"] = std::move(ops);
  o["cache"] = std::move(cache);
  o["peak_memory_kb_max"] = load(peak_memory_kb_max);
  o["failure_categories"] = std::move(failures);

  // Splice the histogram in; it serializes itself.
  std::string out = jsonlite::to_json(o);
  out.pop_back();
  out += ",\"latency\":" + latency_histogram.to_json() + "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_log_path = path;
}

std::string event_to_json(const OperationEvent& ev) {
  jsonlite::Object o;
  o["v"] = static_cast<std::uint64_t>(version::EVENT_LOG_VERSION);
  o["ts"] = static_cast<std::uint64_t>(std::time(nullptr));
  o["operation"] = ev.operation;
  o["ok"] = ev.ok;
  o["error_code"] = to_string(ev.error_code);
  o["duration_ns"] = static_cast<std::uint64_t>(ev.duration_ns);
  o["bytes_in"] = static_cast<std::uint64_t>(ev.bytes_in);
  o["bytes_stdout"] = static_cast<std::uint64_t>(ev.bytes_stdout);
  o["bytes_stderr"] = static_cast<std::uint64_t>(ev.bytes_stderr);
  o["cache_hit"] = ev.cache_hit;
  o["timed_out"] = ev.timed_out;
  o["peak_memory_kb"] = static_cast<std::uint64_t>(ev.peak_memory_kb);
  return jsonlite::to_json(o);
}

void emit_operation_event(const OperationEvent& ev) {
  global_engine_stats().record(ev);

  std::lock_guard<std::mutex> lk(g_log_mu);
  const char* env_path = std::getenv("ARBITER_EVENT_LOG");
  const std::string path = (env_path && env_path[0]) ? std::string(env_path) : g_log_path;
  if (path.empty()) return;

  const std::string line = event_to_json(ev) + "\n";
  // A log that cannot be opened is skipped; events never fail an operation.
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace arbiter
