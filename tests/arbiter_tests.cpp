#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "arbiter/artifact_cache.hpp"
#include "arbiter/comparator.hpp"
#include "arbiter/compiler.hpp"
#include "arbiter/config.hpp"
#include "arbiter/dispatcher.hpp"
#include "arbiter/engine.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/path_guard.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/session.hpp"
#include "arbiter/version.hpp"
#include "arbiter/workspace.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
int g_tests_skipped = 0;
std::string g_compiler;  // g++ found on PATH, empty if none

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Tests that invoke the real toolchain.
void run_toolchain_test(const std::string& name, void (*fn)()) {
  if (g_compiler.empty()) {
    std::cout << "  " << name << "... SKIPPED (no g++ on PATH)\n";
    g_tests_skipped++;
    return;
  }
  run_test(name, fn);
}

std::string find_on_path(const std::string& program) {
  const char* path_env = std::getenv("PATH");
  if (!path_env) return {};
#ifdef _WIN32
  const char sep = ';';
  const std::string exe = program + ".exe";
#else
  const char sep = ':';
  const std::string exe = program;
#endif
  std::string paths = path_env;
  size_t start = 0;
  while (start <= paths.size()) {
    size_t end = paths.find(sep, start);
    if (end == std::string::npos) end = paths.size();
    const std::string dir = paths.substr(start, end - start);
    start = end + 1;
    if (dir.empty()) continue;
    std::error_code ec;
    const fs::path candidate = fs::path(dir) / exe;
    if (fs::is_regular_file(candidate, ec)) return candidate.string();
  }
  return {};
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / name;
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_text(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << text;
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

arbiter::Config base_config(const fs::path& root) {
  arbiter::Config c;
  c.compiler_path = g_compiler.empty() ? "/nonexistent/g++" : g_compiler;
  c.cpp_standard = "c++17";
  c.optimization_level = "-O2";
  c.max_time_ms = 1000;
  c.max_memory_mb = 256;
  c.max_output_bytes = 10240;
  c.workspace_root = root.string();
  c.debugger_binary = arbiter::default_debugger_binary();
  return c;
}

std::unique_ptr<arbiter::Engine> make_engine(const arbiter::Config& cfg) {
  std::string error;
  auto engine = arbiter::Engine::create(cfg, &error);
  expect(engine != nullptr, "engine create: " + error);
  return engine;
}

#ifndef _WIN32
// Executable shell script inside the workspace; stands in for a compiled binary.
std::string install_script(const fs::path& path, const std::string& body) {
  write_text(path, "#!/bin/sh\n" + body);
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path.string();
}
#endif

const char* kSumProgram =
    "#include <iostream>\n"
    "int main() {\n"
    "  int a = 0, b = 0;\n"
    "  std::cin >> a >> b;\n"
    "  std::cout << a + b << \"\\n\";\n"
    "  return 0;\n"
    "}\n";

const char* kInfiniteLoopProgram =
    "int main() {\n"
    "  volatile unsigned long x = 0;\n"
    "  for (;;) ++x;\n"
    "}\n";

// ============================================================================
// Phase 1: Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(arbiter::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(arbiter::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const auto a = arbiter::hash_domain("tmp:", "payload");
  const auto b = arbiter::hash_domain("cache:", "payload");
  const auto c = arbiter::hash_domain("sess:", "payload");
  expect(a.size() == 64 && b.size() == 64 && c.size() == 64, "domain hashes are 64 hex chars");
  expect(a != b && b != c && a != c, "domains separate digests");
  expect(a != arbiter::blake3_hex("payload"), "domain hash differs from plain hash");
}

void test_json_duplicate_key_rejected() {
  std::optional<arbiter::jsonlite::JsonError> err;
  arbiter::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");
}

void test_json_round_trip_escapes() {
  arbiter::jsonlite::Object o;
  o["text"] = std::string("line1\nline2 \"quoted\" \\ tab\t");
  o["n"] = static_cast<std::uint64_t>(42);
  std::optional<arbiter::jsonlite::JsonError> err;
  const auto back = arbiter::jsonlite::parse(arbiter::jsonlite::to_json(o), &err);
  expect(!err, "serialized JSON parses");
  expect(arbiter::jsonlite::get_string(back, "text") == "line1\nline2 \"quoted\" \\ tab\t",
         "escapes survive");
  expect(arbiter::jsonlite::get_u64(back, "n") == 42, "integer survives");
  expect(arbiter::jsonlite::type_name(back, "missing") == "missing", "type_name missing");
}

// ============================================================================
// Phase 2: Configuration
// ============================================================================

std::string config_json(const std::string& compiler, const std::string& extra = "") {
  return R"({"compilation":{"compiler_path":")" + compiler +
         R"(","cpp_standard":"c++17","optimization_level":"-O2"},)"
         R"("execution":{"max_time":1000,"max_memory":256,"max_output_size":10240},)"
         R"("paths":{"temp_dir":"./ws"})" +
         extra + "}";
}

// An existing regular file is all the loader requires of the compiler path.
std::string fake_compiler(const fs::path& dir) {
  const fs::path p = dir / "fake-g++";
  write_text(p, "");
  return p.generic_string();
}

void test_config_valid_loads() {
  const fs::path tmp = fresh_dir("arbiter_cfg_valid");
  const auto r = arbiter::parse_config(config_json(fake_compiler(tmp)), tmp.string());
  expect(r.ok, "valid config loads");
  expect(r.errors.empty(), "no errors");
  expect(r.config.max_time_ms == 1000 && r.config.max_memory_mb == 256, "execution values");
  expect(fs::path(r.config.workspace_root).is_absolute(), "temp_dir anchored to absolute path");
  expect(fs::path(r.config.workspace_root).filename() == "ws", "temp_dir resolved under base dir");
  expect(r.config.cache_enabled && r.config.cache_compression == "off", "cache defaults");
  expect(r.config.debugger_binary == arbiter::default_debugger_binary(), "debugger default");
  expect(r.config.toolchain_root.empty(), "toolchain unset by default");
  fs::remove_all(tmp);
}

void test_config_missing_key_named() {
  const fs::path tmp = fresh_dir("arbiter_cfg_missing");
  const std::string text = R"({"compilation":{"compiler_path":")" + fake_compiler(tmp) +
                           R"(","cpp_standard":"c++17","optimization_level":"-O2"},)"
                           R"("execution":{"max_time":1000,"max_output_size":10240},)"
                           R"("paths":{"temp_dir":"./ws"}})";
  const auto r = arbiter::parse_config(text, tmp.string());
  expect(!r.ok, "missing key fails the load");
  bool named = false;
  for (const auto& e : r.errors) named = named || contains(e, "execution.max_memory");
  expect(named, "error names execution.max_memory");
  fs::remove_all(tmp);
}

void test_config_unknown_key_warns() {
  const fs::path tmp = fresh_dir("arbiter_cfg_unknown");
  const auto r = arbiter::parse_config(
      config_json(fake_compiler(tmp), R"(,"debugger":{"binary":"bin/gdb","colour":true},"extras":{})"),
      tmp.string());
  expect(r.ok, "unknown keys do not fail the load");
  bool key_warned = false, section_warned = false;
  for (const auto& w : r.warnings) {
    key_warned = key_warned || contains(w, "debugger.colour");
    section_warned = section_warned || contains(w, "extras");
  }
  expect(key_warned && section_warned, "unknown key and section reported as warnings");
  fs::remove_all(tmp);
}

void test_config_invalid_values() {
  const fs::path tmp = fresh_dir("arbiter_cfg_invalid");
  const std::string text = R"({"compilation":{"compiler_path":")" + fake_compiler(tmp) +
                           R"(","cpp_standard":"c++17; rm -rf /","optimization_level":"-O9"},)"
                           R"("execution":{"max_time":0,"max_memory":"lots","max_output_size":10},)"
                           R"("paths":{"temp_dir":"./ws"},"debugger":{"binary":"/usr/bin/gdb"}})";
  const auto r = arbiter::parse_config(text, tmp.string());
  expect(!r.ok, "invalid values fail the load");
  expect(r.errors.size() >= 6, "every invalid value reported");
  fs::remove_all(tmp);
}

void test_config_limit_ceilings() {
  const fs::path tmp = fresh_dir("arbiter_cfg_ceiling");
  const std::string text = R"({"compilation":{"compiler_path":")" + fake_compiler(tmp) +
                           R"(","cpp_standard":"c++17","optimization_level":"-O2"},)"
                           R"("execution":{"max_time":1000000000000000,"max_memory":17592186044416,)"
                           R"("max_output_size":10240},"paths":{"temp_dir":"./ws"}})";
  const auto r = arbiter::parse_config(text, tmp.string());
  expect(!r.ok, "oversized limits fail the load");
  bool time_named = false, memory_named = false;
  for (const auto& e : r.errors) {
    time_named = time_named || (contains(e, "execution.max_time") && contains(e, "at most"));
    memory_named = memory_named || (contains(e, "execution.max_memory") && contains(e, "at most"));
  }
  expect(time_named && memory_named, "both ceilings reported");
  fs::remove_all(tmp);
}

void test_config_toolchain_alias() {
  const fs::path tmp = fresh_dir("arbiter_cfg_alias");
  fs::create_directories(tmp / "mingw");
  const std::string text = R"({"compilation":{"compiler_path":")" + fake_compiler(tmp) +
                           R"(","cpp_standard":"c++17","optimization_level":"-O2"},)"
                           R"("execution":{"max_time":1000,"max_memory":256,"max_output_size":10240},)"
                           R"("paths":{"temp_dir":"./ws","mingw_dir":"./mingw"}})";
  const auto r = arbiter::parse_config(text, tmp.string());
  expect(r.ok, "mingw_dir accepted");
  expect(fs::path(r.config.toolchain_root).filename() == "mingw", "mingw_dir maps to toolchain root");
  fs::remove_all(tmp);
}

void test_config_load_missing_file() {
  const auto r = arbiter::load_config("/nonexistent/arbiter/config.json");
  expect(!r.ok && !r.errors.empty(), "missing config file fails");
}

// ============================================================================
// Phase 3: Path Guard
// ============================================================================

void test_sanitize_identifier() {
  expect(arbiter::sanitize_identifier("hello world!") == "hello_world_", "unsafe chars replaced");
  expect(arbiter::sanitize_identifier("../../etc/passwd") == "_.._etc_passwd", "traversal neutralized");
  expect(arbiter::sanitize_identifier("...hidden") == "hidden", "leading dots stripped");
  expect(arbiter::sanitize_identifier("a+b") == "a_b", "plus replaced");
  expect(arbiter::sanitize_identifier("") == "", "empty stays empty");
  expect(arbiter::sanitize_identifier(std::string(300, 'x')).size() == arbiter::kMaxIdentifierLength,
         "truncated to max length");
}

void test_sanitize_idempotent() {
  const std::vector<std::string> inputs = {"a b c", "../x", "..", ".a.b", std::string(150, '.') + "z",
                                           "name\twith\nnewlines", "\xc3\xa9t\xc3\xa9", "ok-name_1.cpp"};
  for (const auto& in : inputs) {
    const auto once = arbiter::sanitize_identifier(in);
    expect(arbiter::sanitize_identifier(once) == once, "sanitize idempotent for '" + in + "'");
  }
}

void test_confine_blocks_escapes() {
  const fs::path tmp = fresh_dir("arbiter_guard");
  fs::create_directories(tmp / "ws" / "execute");
  fs::create_directories(tmp / "ws-evil");
  fs::create_directories(tmp / "toolchain" / "bin");
  arbiter::PathGuard guard((tmp / "ws").string(), (tmp / "toolchain").string(), {});

  expect(guard.confine((tmp / "ws" / "execute" / "a.exe").string()).ok, "inside workspace ok");
  expect(guard.confine((tmp / "ws").string()).ok, "root itself ok");
  expect(guard.confine((tmp / "toolchain" / "bin" / "gdb").string()).ok, "inside toolchain ok");
  expect(!guard.confine((tmp / "ws" / ".." / "outside").string()).ok, "../ escape blocked");
  expect(!guard.confine((tmp / "ws" / "execute" / ".." / ".." / "ws-evil" / "x").string()).ok,
         "deep traversal blocked");
  expect(!guard.confine((tmp / "ws-evil" / "x").string()).ok, "sibling prefix blocked");
  expect(!guard.confine("/etc/passwd").ok, "absolute outside blocked");
  const auto r = guard.confine((tmp / "ws" / "execute" / "." / "b.exe").string());
  expect(r.ok && r.resolved.find("/./") == std::string::npos, "resolved path normalized");
  fs::remove_all(tmp);
}

void test_confine_symlink_escape() {
#ifndef _WIN32
  const fs::path tmp = fresh_dir("arbiter_guard_symlink");
  fs::create_directories(tmp / "ws");
  fs::create_directories(tmp / "secret");
  write_text(tmp / "secret" / "key", "k");
  fs::create_directory_symlink(tmp / "secret", tmp / "ws" / "link");
  arbiter::PathGuard guard((tmp / "ws").string(), "", {});
  expect(!guard.confine((tmp / "ws" / "link" / "key").string()).ok, "symlink escape blocked");
  fs::remove_all(tmp);
#endif
}

void test_validate_command() {
  arbiter::PathGuard guard("/tmp", "", {"rm -rf", "Format", "del /"});
  expect(guard.validate_command("/tmp/ws/execute/prog.exe"), "plain path allowed");
  expect(!guard.validate_command("rm -rf /"), "forbidden substring");
  expect(!guard.validate_command("FORMAT c:"), "forbidden substring case-insensitive");
  expect(!guard.validate_command("a.exe && rm x"), "&& rm");
  expect(!guard.validate_command("a.exe; rm x"), "; rm");
  expect(!guard.validate_command("a.exe | rm"), "| rm");
  expect(!guard.validate_command("echo `id`"), "backticks");
  expect(!guard.validate_command("echo $(id)"), "command substitution");
  expect(!guard.validate_command("a.exe > /dev/sda"), "redirect to /dev");
  expect(!guard.validate_command("a.exe >> /dev/null"), "append to /dev");
}

// ============================================================================
// Phase 4: Workspace
// ============================================================================

void test_workspace_layout() {
  const fs::path tmp = fresh_dir("arbiter_ws_layout");
  std::string error;
  auto ws = arbiter::Workspace::open((tmp / "root").string(), &error);
  expect(ws.has_value(), "workspace opens: " + error);
  for (const auto& d : arbiter::Workspace::fixed_directories()) {
    expect(fs::is_directory(fs::path(ws->root()) / d), "fixed directory exists: " + d);
#ifndef _WIN32
    const auto perms = fs::status(fs::path(ws->root()) / d).permissions();
    expect((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none,
           "directory is owner-only: " + d);
#endif
  }
  // Idempotent reopen.
  expect(arbiter::Workspace::open((tmp / "root").string(), &error).has_value(), "reopen succeeds");
  fs::remove_all(tmp);
}

void test_workspace_unwritable_root() {
#ifndef _WIN32
  std::string error;
  auto ws = arbiter::Workspace::open("/proc/arbiter_cannot_exist", &error);
  expect(!ws.has_value(), "unwritable root rejected");
  expect(!error.empty(), "error message set");
#endif
}

void test_temp_paths_unique_across_threads() {
  const fs::path tmp = fresh_dir("arbiter_ws_unique");
  std::string error;
  auto ws = arbiter::Workspace::open(tmp.string(), &error);
  expect(ws.has_value(), "workspace opens");

  constexpr int kThreads = 8;
  constexpr int kPerThread = 125;
  std::mutex mu;
  std::set<std::string> seen;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) local.push_back(ws->allocate_temp_path(arbiter::category::kCompile));
      std::lock_guard<std::mutex> lk(mu);
      seen.insert(local.begin(), local.end());
    });
  }
  for (auto& th : threads) th.join();
  expect(seen.size() == static_cast<size_t>(kThreads * kPerThread), "1000 temp paths are unique");

  const std::string name = fs::path(*seen.begin()).filename().string();
  const auto us = name.find('_');
  expect(us != std::string::npos && name.size() - us - 1 == 8, "name is <millis>_<8hex>");
  expect(fs::path(*seen.begin()).parent_path().filename() == arbiter::category::kCompile,
         "temp path under its category");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 5: Output Comparator
// ============================================================================

void test_compare_identity() {
  const std::vector<std::string> samples = {"", "x", "8\n", "a\nb\n\n", "  padded  ", "MiXeD\r\n"};
  for (const auto& s : samples) {
    expect(arbiter::compare_outputs(s, s, false, false).match, "compare(a, a) matches");
    expect(arbiter::compare_outputs(s, s, true, true).match, "compare(a, a) matches with flags");
  }
}

void test_compare_trailing_newline() {
  const auto r = arbiter::compare_outputs("8\n", "8", true, false);
  expect(r.match, "trailing newline ignored");
  expect(r.differences.empty(), "no differences");
}

void test_compare_extra_line() {
  const auto r = arbiter::compare_outputs("8\n9\n", "8\n", false, false);
  expect(!r.match, "extra line mismatches");
  expect(r.differences.size() == 1, "one difference");
  expect(r.differences[0].line == 2, "difference on line 2");
  expect(r.differences[0].actual == "9" && r.differences[0].expected.empty(), "difference content");
  expect(r.actual_line_count == 2 && r.expected_line_count == 1, "line counts");
}

void test_compare_whitespace_and_case() {
  expect(arbiter::compare_outputs("1  2\n3", "1 2 3", true, false).match, "whitespace runs collapse");
  expect(!arbiter::compare_outputs("1  2\n3", "1 2 3", false, false).match, "whitespace kept when not ignored");
  expect(arbiter::compare_outputs("YES", "yes", true, true).match, "case ignored");
  expect(!arbiter::compare_outputs("YES", "yes", true, false).match, "case kept by default");
  const auto empty = arbiter::compare_outputs("", "", false, false);
  expect(empty.match && empty.actual_line_count == 1, "empty string is one empty line");
}

// ============================================================================
// Phase 6: Artifact Cache
// ============================================================================

std::string sample_key(const std::string& source) {
  return arbiter::ArtifactCache::key_for("/usr/bin/g++", "c++17", "-O2", {"-Wall", "-Wextra", "-Werror"},
                                         source);
}

void test_cache_put_get() {
  const fs::path tmp = fresh_dir("arbiter_cache_putget");
  arbiter::ArtifactCache cache(tmp.string(), "off");
  const std::string key = sample_key("int main(){}");
  const std::string blob(4096, '\x7f');
  expect(!cache.contains(key), "empty cache misses");
  expect(cache.put(key, blob), "put succeeds");
  expect(cache.contains(key), "contains after put");
  const auto back = cache.get(key);
  expect(back.has_value() && *back == blob, "get returns stored bytes");
  const auto info = cache.info(key);
  expect(info.has_value() && info->original_size == blob.size(), "meta records size");
  expect(fs::exists(cache.meta_path(key)), "meta sidecar written");
  fs::remove_all(tmp);
}

void test_cache_corruption_is_miss() {
  const fs::path tmp = fresh_dir("arbiter_cache_corrupt");
  arbiter::ArtifactCache cache(tmp.string(), "off");
  const std::string key = sample_key("int main(){return 1;}");
  expect(cache.put(key, "binary-bytes-0123456789"), "put succeeds");
  {
    std::fstream file(cache.object_path(key), std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0xFF;
    file.seekp(0);
    file.write(&byte, 1);
  }
  expect(!cache.get(key).has_value(), "corrupted blob is a miss");

  const std::string key2 = sample_key("int main(){return 2;}");
  expect(cache.put(key2, "other-bytes"), "second put succeeds");
  write_text(cache.meta_path(key2), "{not json");
  expect(!cache.get(key2).has_value(), "unreadable meta is a miss");
  fs::remove_all(tmp);
}

void test_cache_key_sensitivity() {
  const auto base = sample_key("int main(){}");
  expect(base.size() == 64, "key is 64 hex chars");
  expect(base == sample_key("int main(){}"), "key deterministic");
  expect(base != sample_key("int main(){ }"), "source changes key");
  expect(base != arbiter::ArtifactCache::key_for("/usr/bin/g++", "c++20", "-O2", {"-Wall", "-Wextra", "-Werror"},
                                                 "int main(){}"),
         "standard changes key");
  expect(base != arbiter::ArtifactCache::key_for("/usr/bin/g++", "c++17", "-O0", {"-Wall", "-Wextra", "-Werror"},
                                                 "int main(){}"),
         "optimization changes key");
  arbiter::ArtifactCache cache(fs::temp_directory_path().string(), "off");
  expect(!cache.put("../../etc/passwd", "x"), "invalid key rejected");
  expect(!cache.get("ABC").has_value(), "invalid key misses");
}

// ============================================================================
// Phase 7: Process Runner
// ============================================================================

#ifndef _WIN32
void test_runner_captures_output() {
  arbiter::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo out; echo err 1>&2; exit 3"};
  spec.timeout_ms = 5000;
  const auto r = arbiter::run_process(spec, arbiter::NoopResourceLimiter());
  expect(r.launched, "child launched");
  expect(r.stdout_text == "out\n", "stdout captured");
  expect(r.stderr_text == "err\n", "stderr captured");
  expect(r.exit_code == 3, "exit code propagated");
  expect(!r.timed_out, "no timeout");
}

void test_runner_watchdog_kills_group() {
  arbiter::ProcessSpec spec;
  spec.command = "/bin/sh";
  // Background child keeps the pipe open; only a group kill ends it.
  spec.argv = {"-c", "sleep 30 & while :; do :; done"};
  spec.env = {{"PATH", "/usr/bin:/bin"}};
  spec.timeout_ms = 300;
  const auto start = std::chrono::steady_clock::now();
  const auto r = arbiter::run_process(spec, arbiter::NoopResourceLimiter());
  const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start).count();
  expect(r.timed_out, "watchdog fired");
  expect(r.exit_code == 124, "timeout exit code");
  expect(wall < 3000, "killed promptly");
}

void test_runner_spawn_failure() {
  arbiter::ProcessSpec spec;
  spec.command = "/nonexistent/arbiter/binary";
  const auto r = arbiter::run_process(spec, arbiter::NoopResourceLimiter());
  expect(!r.launched, "not launched");
  expect(contains(r.error_message, "spawn_failed"), "spawn_failed reported");
}

void test_runner_output_cap() {
  arbiter::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done"};
  spec.max_output_bytes = 100;
  const auto r = arbiter::run_process(spec, arbiter::NoopResourceLimiter());
  expect(r.stdout_truncated, "pipe output truncated");
  expect(r.stdout_text.size() <= 100 + std::string("(truncated)").size(), "pipe output capped");
}

void test_rlimit_limiter_describes() {
  arbiter::RlimitResourceLimiter limiter;
  arbiter::ResourceLimits limits;
  expect(limiter.describe(limits).empty(), "no limits requested");
  limits.cpu_time_ms = 500;
  limits.address_space_bytes = 64u * 1024u * 1024u;
  limits.file_size_bytes = 1u << 20;
  const auto names = limiter.describe(limits);
  expect(names.size() == 3 && names[0] == "rlimit_cpu" && names[1] == "rlimit_as" &&
             names[2] == "rlimit_fsize",
         "limits named");
  expect(arbiter::platform_resource_limiter()->name() == "rlimit", "POSIX uses rlimits");
}
#endif

void test_capabilities_consistent() {
  const auto caps = arbiter::detect_platform_sandbox_capabilities();
  expect(caps.workspace_confinement, "confinement always available");
  expect(caps.enforced().size() + caps.unsupported().size() == 6, "every capability classified");
}

// ============================================================================
// Phase 8: Engine
// ============================================================================

#ifndef _WIN32
void test_execute_script_sum() {
  const fs::path tmp = fresh_dir("arbiter_engine_exec");
  auto engine = make_engine(base_config(tmp));
  const auto bin = install_script(fs::path(engine->workspace().dir("execute")) / "sum.sh",
                                  "read a b\necho $((a + b))\n");
  const auto r = engine->execute(bin, "3 5\n");
  expect(r.success, "script runs: " + r.error_message);
  expect(r.stdout_text == "8\n", "stdout is 8");
  expect(r.exit_code == 0 && !r.timed_out, "clean exit");
  expect(fs::exists(r.input_path) && read_text(r.input_path) == "3 5\n", "input file kept verbatim");
  expect(fs::exists(r.output_path), "output file kept");
  expect(fs::path(r.input_path).stem() == fs::path(r.output_path).stem(), "input and output share a stem");
  expect(r.limits_enforced.size() == 3, "rlimits reported");
  fs::remove_all(tmp);
}

void test_execute_nonzero_exit() {
  const fs::path tmp = fresh_dir("arbiter_engine_fail");
  auto engine = make_engine(base_config(tmp));
  const auto bin = install_script(fs::path(engine->workspace().dir("execute")) / "fail.sh",
                                  "echo oops 1>&2\nexit 7\n");
  const auto r = engine->execute(bin, "");
  expect(!r.success, "non-zero exit fails");
  expect(r.exit_code == 7, "exit code 7");
  expect(r.error_code == arbiter::ErrorCode::execution_failure, "execution_failure");
  expect(r.stderr_text == "oops\n", "stderr captured");
  fs::remove_all(tmp);
}

void test_execute_timeout_script() {
  const fs::path tmp = fresh_dir("arbiter_engine_timeout");
  auto engine = make_engine(base_config(tmp));
  const auto bin = install_script(fs::path(engine->workspace().dir("execute")) / "spin.sh",
                                  "while :; do :; done\n");
  const auto start = std::chrono::steady_clock::now();
  const auto r = engine->execute(bin, "", 500);
  const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start).count();
  expect(r.timed_out, "timed out");
  expect(!r.success, "not successful");
  expect(r.error_code == arbiter::ErrorCode::execution_timeout, "execution_timeout");
  expect(r.elapsed_ms == 500, "elapsed pinned to the limit");
  expect(wall < 500 + static_cast<long long>(arbiter::kWatchdogGraceMs) + 1000, "terminated within limit + grace");
  fs::remove_all(tmp);
}

void test_execute_truncates_output() {
  const fs::path tmp = fresh_dir("arbiter_engine_trunc");
  auto cfg = base_config(tmp);
  cfg.max_output_bytes = 1024;
  auto engine = make_engine(cfg);
  const auto bin = install_script(fs::path(engine->workspace().dir("execute")) / "loud.sh",
                                  "i=0; while [ $i -lt 500 ]; do echo 0123456789; i=$((i+1)); done\n");
  const auto r = engine->execute(bin, "");
  expect(r.success, "loud script exits 0");
  expect(r.stdout_truncated, "stdout truncated");
  std::string full;
  for (int i = 0; i < 500; ++i) full += "0123456789\n";
  expect(r.stdout_text == full.substr(0, 256) + arbiter::kTruncationMarker, "first quarter kept plus marker");
  expect(r.stdout_text.size() == 256 + std::string(arbiter::kTruncationMarker).size(), "truncated size");
  fs::remove_all(tmp);
}

void test_execute_memory_ceiling_applied() {
  const fs::path tmp = fresh_dir("arbiter_engine_ulimit");
  auto engine = make_engine(base_config(tmp));
  const auto bin = install_script(fs::path(engine->workspace().dir("execute")) / "ulimit.sh", "ulimit -v\n");
  auto r = engine->execute(bin, "", std::nullopt, 64);
  expect(r.success, "ulimit script runs: " + r.error_message);
  expect(r.stdout_text == "65536\n", "64 MB address space installed (KB): " + r.stdout_text);
  r = engine->execute(bin, "");
  expect(r.stdout_text == "262144\n", "configured 256 MB applied by default: " + r.stdout_text);
  fs::remove_all(tmp);
}

void test_execute_output_file_capped() {
  const fs::path tmp = fresh_dir("arbiter_engine_flood");
  auto cfg = base_config(tmp);
  cfg.max_output_bytes = 1024;
  auto engine = make_engine(cfg);
  const auto bin = install_script(fs::path(engine->workspace().dir("execute")) / "flood.sh",
                                  "while :; do echo 0123456789012345678901234567890123456789; done\n");
  const auto r = engine->execute(bin, "");
  expect(!r.success, "flooding program fails");
  expect(r.error_code == arbiter::ErrorCode::execution_failure, "execution_failure");
  expect(contains(r.error_message, "output limit exceeded"), "output limit named: " + r.error_message);
  expect(fs::file_size(r.output_path) <= arbiter::output_file_limit(1024), "output file capped on disk");
  expect(r.stdout_truncated, "stdout truncated");
  expect(r.stdout_text.size() == 256 + std::string(arbiter::kTruncationMarker).size(), "first quarter kept");
  bool fsize_listed = false;
  for (const auto& l : r.limits_enforced) fsize_listed = fsize_listed || l == "rlimit_fsize";
  expect(fsize_listed, "rlimit_fsize reported");
  fs::remove_all(tmp);
}

void test_compile_timeout() {
  const fs::path tmp = fresh_dir("arbiter_compile_timeout");
  auto cfg = base_config(tmp / "ws");
  // Creates the output binary, then hangs past the deadline.
  cfg.compiler_path = install_script(tmp / "slow-cc", ": > \"$5\"\nsleep 5\n");
  std::string error;
  auto ws = arbiter::Workspace::open(cfg.workspace_root, &error);
  expect(ws.has_value(), "workspace opens: " + error);
  const arbiter::Compiler compiler(cfg, *ws, nullptr, arbiter::platform_resource_limiter(), 300);

  const auto start = std::chrono::steady_clock::now();
  const auto r = compiler.compile("int main() {}\n", std::string("slow"));
  const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start).count();
  expect(!r.success, "timed-out compile fails");
  expect(r.error_code == arbiter::ErrorCode::compile_timeout, "compile_timeout");
  expect(contains(r.stderr_text, "timed out after 300 ms"), "timeout reported in diagnostics");
  expect(!r.binary_path.has_value(), "no binary reported");
  expect(!fs::exists(fs::path(ws->dir("execute")) / "slow.exe"), "no binary left behind");
  expect(fs::exists(r.source_path), "source kept");
  expect(wall < 3000, "compiler killed at the deadline");
  fs::remove_all(tmp);
}
#endif

void test_execute_rejects_out_of_range_limits() {
  const fs::path tmp = fresh_dir("arbiter_engine_limits");
  auto engine = make_engine(base_config(tmp));
  const fs::path bin = fs::path(engine->workspace().dir("execute")) / "prog.exe";
  write_text(bin, "x");
  // 2^44 MB is 2^64 bytes: zero after a shift into bytes.
  auto r = engine->execute(bin.string(), "", std::nullopt, 17592186044416ull);
  expect(r.error_code == arbiter::ErrorCode::limit_out_of_range, "memory beyond ceiling rejected");
  expect(r.input_path.empty(), "nothing run for a rejected memory limit");
  r = engine->execute(bin.string(), "", 18446744073709551000ull);
  expect(r.error_code == arbiter::ErrorCode::limit_out_of_range, "time that would wrap rejected");
  r = engine->execute(bin.string(), "", arbiter::kMaxTimeLimitMs + 1);
  expect(r.error_code == arbiter::ErrorCode::limit_out_of_range, "time beyond ceiling rejected");
  expect(contains(r.error_message, std::to_string(arbiter::kMaxTimeLimitMs)), "ceiling named");
  r = engine->execute(bin.string(), "", std::nullopt, 0);
  expect(r.error_code == arbiter::ErrorCode::limit_out_of_range, "zero memory rejected");
  expect(!r.success, "never successful");
  fs::remove_all(tmp);
}

void test_execute_rejects_outside_paths() {
  const fs::path tmp = fresh_dir("arbiter_engine_unsafe");
  auto cfg = base_config(tmp / "ws");
  cfg.forbidden_commands = {"rm -rf"};
  auto engine = make_engine(cfg);
  write_text(tmp / "outside.exe", "x");
  auto r = engine->execute((tmp / "outside.exe").string(), "");
  expect(r.error_code == arbiter::ErrorCode::unsafe_command, "outside binary rejected");
  r = engine->execute(engine->workspace().dir("execute") + "/../../outside.exe", "");
  expect(r.error_code == arbiter::ErrorCode::unsafe_command, "traversal rejected");
  r = engine->execute(engine->workspace().dir("execute") + "/x; rm -rf /", "");
  expect(r.error_code == arbiter::ErrorCode::unsafe_command, "forbidden command rejected");
  r = engine->execute(engine->workspace().dir("execute") + "/missing.exe", "");
  expect(r.error_code == arbiter::ErrorCode::workspace_io_error, "missing binary is an I/O error");
  expect(!r.success, "never successful");
  fs::remove_all(tmp);
}

void test_debug_misconfigured() {
  const fs::path tmp = fresh_dir("arbiter_debug_misconf");
  auto engine = make_engine(base_config(tmp));
  const fs::path bin = fs::path(engine->workspace().dir("execute")) / "prog.exe";
  write_text(bin, "x");
  const auto r = engine->debug(bin.string());
  expect(!r.success, "no debugger");
  expect(r.error_code == arbiter::ErrorCode::debugger_misconfigured, "unset toolchain is misconfigured");
  expect(fs::exists(r.script_path), "script still written");
  expect(read_text(r.script_path) == arbiter::Debugger::default_script(), "default script used");

  auto cfg = base_config(tmp / "ws2");
  fs::create_directories(tmp / "empty_toolchain");
  cfg.toolchain_root = fs::weakly_canonical(tmp / "empty_toolchain").string();
  auto engine2 = make_engine(cfg);
  const fs::path bin2 = fs::path(engine2->workspace().dir("execute")) / "prog.exe";
  write_text(bin2, "x");
  const auto r2 = engine2->debug(bin2.string());
  expect(r2.error_code == arbiter::ErrorCode::debugger_misconfigured, "missing gdb is misconfigured");
  expect(contains(r2.error_message, "not found"), "message says not found");
  fs::remove_all(tmp);
}

void test_debug_unsafe_path() {
  const fs::path tmp = fresh_dir("arbiter_debug_unsafe");
  auto engine = make_engine(base_config(tmp / "ws"));
  write_text(tmp / "elsewhere.exe", "x");
  const auto r = engine->debug((tmp / "elsewhere.exe").string());
  expect(r.error_code == arbiter::ErrorCode::unsafe_command, "outside binary rejected");
  expect(r.script_path.empty(), "nothing written for rejected binary");
  fs::remove_all(tmp);
}

#ifndef _WIN32
void test_debug_with_stub_debugger() {
  const fs::path tmp = fresh_dir("arbiter_debug_stub");
  const fs::path toolchain = tmp / "toolchain";
  install_script(toolchain / "bin" / "gdb", "echo \"stub-gdb $*\"\ncat \"$4\"\n");
  auto cfg = base_config(tmp / "ws");
  cfg.toolchain_root = fs::weakly_canonical(toolchain).string();
  cfg.debugger_binary = "bin/gdb";
  auto engine = make_engine(cfg);
  const fs::path bin = fs::path(engine->workspace().dir("execute")) / "prog.exe";
  write_text(bin, "x");

  const auto r = engine->debug(bin.string(), std::string("info frame\nquit\n"));
  expect(r.success, "stub debugger succeeds: " + r.error_message);
  expect(contains(r.stdout_text, "stub-gdb --batch -nx -x " + r.script_path), "fixed argv order");
  expect(contains(r.stdout_text, "info frame"), "custom script passed");
  expect(fs::path(r.script_path).extension() == ".gdb", "script has .gdb extension");
  fs::remove_all(tmp);
}

void test_debug_limits_inherited() {
  const fs::path tmp = fresh_dir("arbiter_debug_limits");
  const fs::path toolchain = tmp / "toolchain";
  install_script(toolchain / "bin" / "gdb", "ulimit -v\nulimit -t\n");
  auto cfg = base_config(tmp / "ws");
  cfg.toolchain_root = fs::weakly_canonical(toolchain).string();
  cfg.debugger_binary = "bin/gdb";
  auto engine = make_engine(cfg);
  const fs::path bin = fs::path(engine->workspace().dir("execute")) / "prog.exe";
  write_text(bin, "x");

  const auto r = engine->debug(bin.string());
  expect(r.success, "stub debugger succeeds: " + r.error_message);
  const std::string as_kb = std::to_string((cfg.max_memory_mb + arbiter::kDebuggerHeadroomMb) * 1024);
  const std::string cpu_s = std::to_string(arbiter::kDebugTimeoutMs / 1000);
  expect(r.stdout_text == as_kb + "\n" + cpu_s + "\n", "address space and CPU limits installed: " + r.stdout_text);
  fs::remove_all(tmp);
}
#endif

void test_scenario_compile_success() {
  const fs::path tmp = fresh_dir("arbiter_scn_a");
  auto engine = make_engine(base_config(tmp));
  const auto r = engine->compile("int main(){return 0;}");
  expect(r.success, "compiles: " + r.stderr_text);
  expect(r.binary_path.has_value() && fs::exists(*r.binary_path), "binary present");
  expect(fs::exists(r.source_path), "source kept");
  expect(r.error_code == arbiter::ErrorCode::none, "no error code");
  fs::remove_all(tmp);
}

void test_scenario_compile_error() {
  const fs::path tmp = fresh_dir("arbiter_scn_b");
  auto engine = make_engine(base_config(tmp));
  const auto r = engine->compile("int main() { return }", std::string("broken"));
  expect(!r.success, "syntax error fails");
  expect(!r.stderr_text.empty(), "diagnostics reported");
  expect(!r.binary_path.has_value(), "no binary path");
  expect(r.error_code == arbiter::ErrorCode::compile_failure, "compile_failure");
  expect(!fs::exists(engine->workspace().dir("execute") + "/broken.exe"), "no stale binary");
  expect(fs::exists(engine->workspace().dir("sources") + "/broken.cpp"), "source kept");
  fs::remove_all(tmp);
}

void test_warnings_are_errors() {
  const fs::path tmp = fresh_dir("arbiter_werror");
  auto engine = make_engine(base_config(tmp));
  const auto r = engine->compile("int main(){ int unused = 0; return 0; }");
  expect(!r.success, "-Werror turns warnings into failures");
  fs::remove_all(tmp);
}

void test_scenario_run_sum() {
  const fs::path tmp = fresh_dir("arbiter_scn_c");
  auto engine = make_engine(base_config(tmp));
  const auto c = engine->compile(kSumProgram, std::string("sum"));
  expect(c.success, "sum compiles: " + c.stderr_text);
  const auto r = engine->execute(*c.binary_path, "3 5\n");
  expect(r.stdout_text == "8\n", "stdout is 8");
  expect(r.exit_code == 0, "exit 0");
  expect(!r.timed_out && r.success, "not timed out");
  fs::remove_all(tmp);
}

void test_scenario_infinite_loop() {
  const fs::path tmp = fresh_dir("arbiter_scn_f");
  auto engine = make_engine(base_config(tmp));
  const auto c = engine->compile(kInfiniteLoopProgram);
  expect(c.success, "loop compiles: " + c.stderr_text);
  const auto start = std::chrono::steady_clock::now();
  const auto r = engine->execute(*c.binary_path, "", 500);
  const auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start).count();
  expect(r.timed_out, "timed out");
  expect(!r.success, "not successful");
  expect(wall < 2500, "result within ~1.5s");
  fs::remove_all(tmp);
}

void test_compile_cache_hit() {
  const fs::path tmp = fresh_dir("arbiter_cache_hit");
  auto engine = make_engine(base_config(tmp));
  const auto first = engine->compile(kSumProgram, std::string("first"));
  expect(first.success && !first.from_cache, "first compile is real");
  expect(first.stored_in_cache, "binary stored in cache");
  const auto second = engine->compile(kSumProgram, std::string("second"));
  expect(second.success && second.from_cache, "second compile is a cache hit");
  const auto r = engine->execute(*second.binary_path, "40 2\n");
  expect(r.stdout_text == "42\n", "cached binary runs");

  auto cfg = base_config(tmp / "nocache");
  cfg.cache_enabled = false;
  auto uncached = make_engine(cfg);
  expect(uncached->cache() == nullptr, "cache disabled");
  const auto third = uncached->compile(kSumProgram);
  expect(third.success && !third.from_cache, "disabled cache always compiles");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 9: Test Cases
// ============================================================================

void test_builtin_test_cases() {
  const fs::path tmp = fresh_dir("arbiter_tc_builtin");
  auto engine = make_engine(base_config(tmp));
  for (const std::string id : {"a+b", "a_b"}) {
    const auto tc = engine->read_test_case(id);
    expect(tc.found && tc.builtin, "a+b found as " + id);
    expect(tc.input == "3 5\n" && tc.output == "8\n", "a+b content");
  }
  const auto fib = engine->read_test_case("fibonacci");
  expect(fib.found && fib.input == "10\n" && fib.output == "55\n", "fibonacci content");
  fs::remove_all(tmp);
}

void test_file_test_cases() {
  const fs::path tmp = fresh_dir("arbiter_tc_file");
  auto engine = make_engine(base_config(tmp / "ws"));
  write_text(fs::path(engine->workspace().root()) / "tests" / "custom.txt", "input: 1\noutput: 2\n");
  write_text(tmp / "secret.txt", "top secret");
  const auto tc = engine->read_test_case("custom");
  expect(tc.found && !tc.builtin, "file case found");
  expect(tc.raw == "input: 1\noutput: 2\n", "raw content verbatim");
  const auto missing = engine->read_test_case("nope");
  expect(!missing.found, "missing case not found");
  const auto escape = engine->read_test_case("../../secret");
  expect(!escape.found, "traversal id does not reach outside files");
  expect(escape.raw.empty(), "no outside content returned");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 10: Sessions & Dispatcher
// ============================================================================

void test_session_scope_cleanup() {
  arbiter::SessionRegistry registry;
  std::string id;
  {
    arbiter::SessionScope scope(registry, "compare_outputs", "{}");
    id = scope.id();
    expect(registry.size() == 1, "session registered");
    expect(registry.find(id).has_value(), "session findable");
    expect(id.rfind("session_", 0) == 0, "session id prefix");
  }
  expect(registry.size() == 0, "session removed on scope exit");
  expect(!registry.find(id).has_value(), "session gone");

  arbiter::SessionScope a(registry, "t", "{\"same\":1}");
  arbiter::SessionScope b(registry, "t", "{\"same\":1}");
  expect(a.id() != b.id(), "colliding ids disambiguated");

  std::string earlier;
  {
    arbiter::SessionScope first(registry, "t", "{\"again\":1}");
    earlier = first.id();
  }
  arbiter::SessionScope second(registry, "t", "{\"again\":1}");
  expect(second.id() != earlier, "closed id not reissued");
}

void test_dispatcher_compare_report() {
  const fs::path tmp = fresh_dir("arbiter_dispatch_compare");
  auto engine = make_engine(base_config(tmp));
  arbiter::Dispatcher dispatcher(*engine, arbiter::ReportFormat::markdown);
  arbiter::jsonlite::Object args;
  args["actual"] = "8\n9\n";
  args["expected"] = "8\n";
  args["ignore_whitespace"] = false;
  const auto resp = dispatcher.dispatch("compare_outputs", args);
  expect(resp.ok, "compare dispatched");
  expect(contains(resp.text, "does not match"), "mismatch reported");
  expect(contains(resp.text, "Line 2"), "difference line shown");
  expect(resp.session.rfind("session_", 0) == 0, "session id returned");
  expect(dispatcher.sessions().size() == 0, "registry empty after dispatch");
  fs::remove_all(tmp);
}

void test_dispatcher_failures_clean_up() {
  const fs::path tmp = fresh_dir("arbiter_dispatch_fail");
  auto engine = make_engine(base_config(tmp));
  arbiter::Dispatcher dispatcher(*engine, arbiter::ReportFormat::markdown);
  auto resp = dispatcher.dispatch("no_such_tool", {});
  expect(!resp.ok && contains(resp.text, "unknown tool"), "unknown tool rejected");
  resp = dispatcher.dispatch("compile_and_run", {});
  expect(!resp.ok && contains(resp.text, "code"), "missing argument named");
  arbiter::jsonlite::Object bad;
  bad["code"] = "int main(){}";
  bad["input"] = "";
  bad["time_limit"] = "fast";
  resp = dispatcher.dispatch("compile_and_run", bad);
  expect(!resp.ok && contains(resp.text, "time_limit"), "mistyped argument named");
  bad["time_limit"] = static_cast<std::uint64_t>(arbiter::kMaxTimeLimitMs + 1);
  resp = dispatcher.dispatch("compile_and_run", bad);
  expect(!resp.ok && contains(resp.text, "time_limit") && contains(resp.text, "at most"),
         "time_limit above ceiling rejected");
  bad["time_limit"] = static_cast<std::uint64_t>(500);
  bad["memory_limit"] = static_cast<std::uint64_t>(17592186044416ull);
  resp = dispatcher.dispatch("compile_and_run", bad);
  expect(!resp.ok && contains(resp.text, "memory_limit"), "memory_limit above ceiling rejected");
  expect(dispatcher.sessions().size() == 0, "registry empty after failed dispatches");
  fs::remove_all(tmp);
}

void test_dispatcher_serve_lines() {
  const fs::path tmp = fresh_dir("arbiter_dispatch_serve");
  auto engine = make_engine(base_config(tmp));
  arbiter::Dispatcher dispatcher(*engine, arbiter::ReportFormat::json);

  std::optional<arbiter::jsonlite::JsonError> err;
  auto resp = arbiter::jsonlite::parse(
      dispatcher.handle_line(R"({"tool":"read_test_case","arguments":{"test_case_id":"fibonacci"}})"), &err);
  expect(!err, "response is JSON");
  expect(arbiter::jsonlite::get_bool(resp, "ok"), "read_test_case ok");
  const auto report = arbiter::jsonlite::parse(arbiter::jsonlite::get_string(resp, "text"), &err);
  expect(!err && arbiter::jsonlite::get_string(report, "output") == "55\n", "JSON report content");

  resp = arbiter::jsonlite::parse(dispatcher.handle_line("{broken"), &err);
  expect(!err && !arbiter::jsonlite::get_bool(resp, "ok", true), "malformed line answered with ok=false");
  resp = arbiter::jsonlite::parse(dispatcher.handle_line(R"({"tool":"bogus"})"), &err);
  expect(!err && !arbiter::jsonlite::get_bool(resp, "ok", true), "unknown tool answered with ok=false");
  resp = arbiter::jsonlite::parse(dispatcher.handle_line(R"({"tool":"list_tools"})"), &err);
  expect(!err && contains(arbiter::jsonlite::get_string(resp, "text"), "compile_and_run"), "tools listed");
  expect(dispatcher.sessions().size() == 0, "registry empty after serve lines");
  fs::remove_all(tmp);
}

void test_dispatcher_compile_and_run() {
  const fs::path tmp = fresh_dir("arbiter_dispatch_run");
  auto engine = make_engine(base_config(tmp));
  arbiter::Dispatcher dispatcher(*engine, arbiter::ReportFormat::markdown);
  arbiter::jsonlite::Object args;
  args["code"] = kSumProgram;
  args["input"] = "3 5\n";
  args["expected_output"] = "8";
  const auto resp = dispatcher.dispatch("compile_and_run", args);
  expect(resp.ok, "compile_and_run dispatched");
  expect(contains(resp.text, "Compilation succeeded"), "compile section");
  expect(contains(resp.text, "Status: success"), "run section");
  expect(contains(resp.text, "Output matches."), "comparison section");
  expect(contains(resp.text, "program_" + resp.session), "default filename derived from session");
  expect(dispatcher.sessions().size() == 0, "registry empty");

  args["code"] = "int main() { return }";
  const auto failed = dispatcher.dispatch("compile_and_run", args);
  expect(failed.ok && contains(failed.text, "Compilation failed"), "compile failure reported");
  fs::remove_all(tmp);
}

// ============================================================================
// Phase 11: Observability
// ============================================================================

void test_latency_histogram() {
  arbiter::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(1000000);  // 1ms
  expect(h.count() == 100, "count");
  const double p50 = h.percentile(0.5);
  expect(p50 >= 512.0 && p50 <= 2048.0, "p50 near 1ms");
}

void test_events_logged_and_counted() {
  const fs::path tmp = fresh_dir("arbiter_events");
  auto cfg = base_config(tmp / "ws");
  cfg.event_log_path = (tmp / "events.jsonl").string();
  auto engine = make_engine(cfg);
  const auto before = arbiter::global_engine_stats().comparisons.load();
  engine->compare("1", "1");
  engine->compare("1", "2");
  expect(arbiter::global_engine_stats().comparisons.load() == before + 2, "comparisons counted");

  const char* env = std::getenv("ARBITER_EVENT_LOG");
  if (!env || !env[0]) {
    const std::string log = read_text(tmp / "events.jsonl");
    expect(contains(log, "\"operation\":\"compare\""), "event line written");
    expect(log.find("\"1\"") == std::string::npos, "event carries no payload text");
  }
  std::optional<arbiter::jsonlite::JsonError> err;
  arbiter::jsonlite::parse(arbiter::global_engine_stats().to_json(), &err);
  expect(!err, "stats serialize to valid JSON");
  arbiter::set_event_log_path("");
  fs::remove_all(tmp);
}

void test_version_manifest() {
  const auto m = arbiter::version::current_manifest();
  expect(m.hash_primitive == "blake3", "hash primitive");
  std::optional<arbiter::jsonlite::JsonError> err;
  const auto o = arbiter::jsonlite::parse(arbiter::version::manifest_to_json(m), &err);
  expect(!err, "manifest is JSON");
  expect(arbiter::jsonlite::get_u64(o, "cache_format") == arbiter::version::CACHE_FORMAT_VERSION,
         "cache format version");
}

}  // namespace

int main() {
  g_compiler = find_on_path("g++");
  std::cout << "=== Arbiter Engine Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing & JSON\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON duplicate key rejected", test_json_duplicate_key_rejected);
  run_test("JSON escapes round trip", test_json_round_trip_escapes);

  std::cout << "\n[Phase 2] Configuration\n";
  run_test("valid config loads", test_config_valid_loads);
  run_test("missing key named", test_config_missing_key_named);
  run_test("unknown key warns", test_config_unknown_key_warns);
  run_test("invalid values rejected", test_config_invalid_values);
  run_test("limit ceilings enforced", test_config_limit_ceilings);
  run_test("mingw_dir alias", test_config_toolchain_alias);
  run_test("missing config file", test_config_load_missing_file);

  std::cout << "\n[Phase 3] Path Guard\n";
  run_test("sanitize identifier", test_sanitize_identifier);
  run_test("sanitize idempotent", test_sanitize_idempotent);
  run_test("confine blocks escapes", test_confine_blocks_escapes);
  run_test("confine blocks symlink escape", test_confine_symlink_escape);
  run_test("validate command", test_validate_command);

  std::cout << "\n[Phase 4] Workspace\n";
  run_test("workspace layout", test_workspace_layout);
  run_test("unwritable root rejected", test_workspace_unwritable_root);
  run_test("temp paths unique across threads", test_temp_paths_unique_across_threads);

  std::cout << "\n[Phase 5] Output Comparator\n";
  run_test("compare identity", test_compare_identity);
  run_test("trailing newline ignored", test_compare_trailing_newline);
  run_test("extra line reported", test_compare_extra_line);
  run_test("whitespace and case flags", test_compare_whitespace_and_case);

  std::cout << "\n[Phase 6] Artifact Cache\n";
  run_test("cache put/get", test_cache_put_get);
  run_test("cache corruption is a miss", test_cache_corruption_is_miss);
  run_test("cache key sensitivity", test_cache_key_sensitivity);

  std::cout << "\n[Phase 7] Process Runner\n";
#ifndef _WIN32
  run_test("captures output", test_runner_captures_output);
  run_test("watchdog kills process group", test_runner_watchdog_kills_group);
  run_test("spawn failure", test_runner_spawn_failure);
  run_test("pipe output cap", test_runner_output_cap);
  run_test("rlimit limiter describes", test_rlimit_limiter_describes);
#endif
  run_test("capabilities consistent", test_capabilities_consistent);

  std::cout << "\n[Phase 8] Engine\n";
#ifndef _WIN32
  run_test("execute script sum", test_execute_script_sum);
  run_test("execute non-zero exit", test_execute_nonzero_exit);
  run_test("execute timeout", test_execute_timeout_script);
  run_test("execute truncates output", test_execute_truncates_output);
  run_test("memory ceiling applied", test_execute_memory_ceiling_applied);
  run_test("stdout file capped", test_execute_output_file_capped);
  run_test("compile timeout", test_compile_timeout);
  run_test("debug with stub debugger", test_debug_with_stub_debugger);
  run_test("debug limits inherited", test_debug_limits_inherited);
#endif
  run_test("out-of-range limits rejected", test_execute_rejects_out_of_range_limits);
  run_test("execute rejects outside paths", test_execute_rejects_outside_paths);
  run_test("debug misconfigured", test_debug_misconfigured);
  run_test("debug unsafe path", test_debug_unsafe_path);
  run_toolchain_test("compile success", test_scenario_compile_success);
  run_toolchain_test("compile error", test_scenario_compile_error);
  run_toolchain_test("warnings are errors", test_warnings_are_errors);
  run_toolchain_test("run sum program", test_scenario_run_sum);
  run_toolchain_test("infinite loop times out", test_scenario_infinite_loop);
  run_toolchain_test("compile cache hit", test_compile_cache_hit);

  std::cout << "\n[Phase 9] Test Cases\n";
  run_test("built-in test cases", test_builtin_test_cases);
  run_test("file test cases", test_file_test_cases);

  std::cout << "\n[Phase 10] Sessions & Dispatcher\n";
  run_test("session scope cleanup", test_session_scope_cleanup);
  run_test("compare report", test_dispatcher_compare_report);
  run_test("failed dispatches clean up", test_dispatcher_failures_clean_up);
  run_test("serve lines", test_dispatcher_serve_lines);
  run_toolchain_test("compile_and_run report", test_dispatcher_compile_and_run);

  std::cout << "\n[Phase 11] Observability\n";
  run_test("latency histogram", test_latency_histogram);
  run_test("events logged and counted", test_events_logged_and_counted);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed";
  if (g_tests_skipped > 0) std::cout << ", " << g_tests_skipped << " SKIPPED";
  std::cout << " ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
