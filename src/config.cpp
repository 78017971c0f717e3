#include "arbiter/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>

#include "arbiter/jsonlite.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {

constexpr std::uint64_t kMinOutputBytes = 64;

#ifdef _WIN32
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

const std::set<std::string> kKnownSections = {
    "compilation", "execution", "paths", "debugger", "security", "cache", "observability"};

// Search PATH for a bare program name. Returns "" if not found.
std::string search_path(const std::string& program) {
  const char* path_env = std::getenv("PATH");
  if (!path_env) return {};
  const std::string paths = path_env;
  size_t start = 0;
  while (start <= paths.size()) {
    size_t end = paths.find(kPathListSeparator, start);
    if (end == std::string::npos) end = paths.size();
    const std::string dir = paths.substr(start, end - start);
    start = end + 1;
    if (dir.empty()) continue;
    std::error_code ec;
    fs::path candidate = fs::path(dir) / program;
    if (fs::is_regular_file(candidate, ec)) return candidate.string();
#ifdef _WIN32
    candidate += ".exe";
    if (fs::is_regular_file(candidate, ec)) return candidate.string();
#endif
  }
  return {};
}

fs::path anchor(const std::string& p, const std::string& base_dir) {
  fs::path path(p);
  if (path.is_relative()) path = fs::path(base_dir) / path;
  return fs::absolute(path).lexically_normal();
}

void warn_unknown_keys(const jsonlite::Object& section, const std::string& section_name,
                       const std::set<std::string>& known, std::vector<std::string>& warnings) {
  for (const auto& [key, value] : section) {
    (void)value;
    if (!known.contains(key)) warnings.push_back("unknown key: " + section_name + "." + key);
  }
}

// Required string: present, a string, non-empty.
bool require_string(const jsonlite::Object& section, const std::string& section_name,
                    const std::string& key, std::string& out, std::vector<std::string>& errors) {
  const std::string type = jsonlite::type_name(section, key);
  if (type == "missing") {
    errors.push_back("missing required key: " + section_name + "." + key);
    return false;
  }
  if (type != "string") {
    errors.push_back(section_name + "." + key + " must be a string, got " + type);
    return false;
  }
  out = jsonlite::get_string(section, key);
  if (out.empty()) {
    errors.push_back(section_name + "." + key + " must not be empty");
    return false;
  }
  return true;
}

bool require_positive(const jsonlite::Object& section, const std::string& section_name,
                      const std::string& key, std::uint64_t& out, std::vector<std::string>& errors) {
  const std::string type = jsonlite::type_name(section, key);
  if (type == "missing") {
    errors.push_back("missing required key: " + section_name + "." + key);
    return false;
  }
  if (type != "integer") {
    errors.push_back(section_name + "." + key + " must be a non-negative integer, got " + type);
    return false;
  }
  out = jsonlite::get_u64(section, key);
  if (out == 0) {
    errors.push_back(section_name + "." + key + " must be greater than zero");
    return false;
  }
  return true;
}

}  // namespace

std::string default_debugger_binary() {
#ifdef _WIN32
  return "bin/gdb.exe";
#else
  return "bin/gdb";
#endif
}

ConfigLoadResult parse_config(const std::string& json_text, const std::string& base_dir) {
  ConfigLoadResult result;
  std::optional<jsonlite::JsonError> err;
  const auto root = jsonlite::parse(json_text, &err);
  if (err) {
    result.errors.push_back(err->code + ": " + err->message);
    return result;
  }

  for (const auto& [key, value] : root) {
    (void)value;
    if (!kKnownSections.contains(key)) result.warnings.push_back("unknown section: " + key);
  }

  Config& cfg = result.config;
  auto& errors = result.errors;
  auto& warnings = result.warnings;

  // --- compilation ---
  const auto compilation = jsonlite::get_object(root, "compilation");
  warn_unknown_keys(compilation, "compilation",
                    {"compiler_path", "cpp_standard", "optimization_level"}, warnings);
  std::string compiler;
  if (require_string(compilation, "compilation", "compiler_path", compiler, errors)) {
    if (compiler.find('/') == std::string::npos && compiler.find('\\') == std::string::npos) {
      cfg.compiler_path = search_path(compiler);
      if (cfg.compiler_path.empty())
        errors.push_back("compilation.compiler_path: '" + compiler + "' not found on PATH");
    } else {
      cfg.compiler_path = anchor(compiler, base_dir).string();
      std::error_code ec;
      if (!fs::is_regular_file(cfg.compiler_path, ec))
        errors.push_back("compilation.compiler_path: no such file: " + cfg.compiler_path);
    }
  }
  if (require_string(compilation, "compilation", "cpp_standard", cfg.cpp_standard, errors)) {
    static const std::regex kStd("^(c|gnu)\\+\\+[0-9a-z]{2}$");
    if (!std::regex_match(cfg.cpp_standard, kStd))
      errors.push_back("compilation.cpp_standard: unrecognized standard '" + cfg.cpp_standard + "'");
  }
  if (require_string(compilation, "compilation", "optimization_level", cfg.optimization_level, errors)) {
    static const std::regex kOpt("^-O([0-3sgz]|fast)$");
    if (!std::regex_match(cfg.optimization_level, kOpt))
      errors.push_back("compilation.optimization_level: unrecognized flag '" + cfg.optimization_level + "'");
  }

  // --- execution ---
  const auto execution = jsonlite::get_object(root, "execution");
  warn_unknown_keys(execution, "execution", {"max_time", "max_memory", "max_output_size"}, warnings);
  if (require_positive(execution, "execution", "max_time", cfg.max_time_ms, errors) &&
      cfg.max_time_ms > kMaxTimeLimitMs) {
    errors.push_back("execution.max_time must be at most " + std::to_string(kMaxTimeLimitMs));
  }
  if (require_positive(execution, "execution", "max_memory", cfg.max_memory_mb, errors) &&
      cfg.max_memory_mb > kMaxMemoryLimitMb) {
    errors.push_back("execution.max_memory must be at most " + std::to_string(kMaxMemoryLimitMb));
  }
  if (require_positive(execution, "execution", "max_output_size", cfg.max_output_bytes, errors)) {
    if (cfg.max_output_bytes < kMinOutputBytes)
      errors.push_back("execution.max_output_size must be at least " + std::to_string(kMinOutputBytes));
    else if (cfg.max_output_bytes > kMaxOutputBytes)
      errors.push_back("execution.max_output_size must be at most " + std::to_string(kMaxOutputBytes));
  }

  // --- paths ---
  const auto paths = jsonlite::get_object(root, "paths");
  warn_unknown_keys(paths, "paths", {"temp_dir", "toolchain_dir", "mingw_dir"}, warnings);
  std::string temp_dir;
  if (require_string(paths, "paths", "temp_dir", temp_dir, errors)) {
    cfg.workspace_root = anchor(temp_dir, base_dir).string();
  }
  std::string toolchain = jsonlite::get_string(paths, "toolchain_dir");
  if (toolchain.empty()) toolchain = jsonlite::get_string(paths, "mingw_dir");
  if (!toolchain.empty()) {
    std::error_code ec;
    const fs::path canon = fs::weakly_canonical(anchor(toolchain, base_dir), ec);
    if (ec) errors.push_back("paths.toolchain_dir: cannot resolve '" + toolchain + "'");
    else cfg.toolchain_root = canon.string();
  }

  // --- debugger ---
  const auto debugger = jsonlite::get_object(root, "debugger");
  warn_unknown_keys(debugger, "debugger", {"binary"}, warnings);
  cfg.debugger_binary = jsonlite::get_string(debugger, "binary", default_debugger_binary());
  if (fs::path(cfg.debugger_binary).is_absolute())
    errors.push_back("debugger.binary must be relative to paths.toolchain_dir");

  // --- security ---
  const auto security = jsonlite::get_object(root, "security");
  warn_unknown_keys(security, "security", {"forbidden_commands"}, warnings);
  const std::string fc_type = jsonlite::type_name(security, "forbidden_commands");
  if (fc_type != "missing" && fc_type != "array")
    errors.push_back("security.forbidden_commands must be an array of strings");
  cfg.forbidden_commands = jsonlite::get_string_array(security, "forbidden_commands");

  // --- cache ---
  const auto cache = jsonlite::get_object(root, "cache");
  warn_unknown_keys(cache, "cache", {"enabled", "compression"}, warnings);
  cfg.cache_enabled = jsonlite::get_bool(cache, "enabled", true);
  cfg.cache_compression = jsonlite::get_string(cache, "compression", "off");
  if (cfg.cache_compression != "off" && cfg.cache_compression != "zstd")
    errors.push_back("cache.compression must be \"off\" or \"zstd\"");
#if !defined(ARBITER_WITH_ZSTD)
  if (cfg.cache_compression == "zstd") {
    warnings.push_back("cache.compression=zstd requested but built without zstd; storing identity");
    cfg.cache_compression = "off";
  }
#endif

  // --- observability ---
  const auto observability = jsonlite::get_object(root, "observability");
  warn_unknown_keys(observability, "observability", {"event_log"}, warnings);
  const std::string event_log = jsonlite::get_string(observability, "event_log");
  if (!event_log.empty()) cfg.event_log_path = anchor(event_log, base_dir).string();

  result.ok = errors.empty();
  return result;
}

ConfigLoadResult load_config(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    ConfigLoadResult result;
    result.errors.push_back("cannot open config file: " + path);
    return result;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  std::error_code ec;
  fs::path base = fs::absolute(fs::path(path), ec).parent_path();
  if (ec) base = fs::current_path();
  return parse_config(text, base.string());
}

}  // namespace arbiter
