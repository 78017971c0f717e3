#include "arbiter/compiler.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "arbiter/path_guard.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {

// Compiler diagnostics are not program output; keep them whole up to 1 MiB.
constexpr std::size_t kDiagnosticsCap = 1u << 20;

bool write_file(const std::string& path, const std::string& data, std::string& error) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    error = "cannot open " + path + " for writing";
    return false;
  }
  ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!ofs) {
    error = "short write to " + path;
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void make_owner_executable(const std::string& path) {
#ifndef _WIN32
  std::error_code ec;
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
#else
  (void)path;
#endif
}

// g++ needs PATH to find as/ld and a scratch dir inside the workspace.
std::map<std::string, std::string> compiler_env(const Workspace& ws) {
  std::map<std::string, std::string> env;
#ifndef _WIN32
  const char* path = std::getenv("PATH");
  env["PATH"] = (path && path[0]) ? path : "/usr/bin:/bin";
  env["TMPDIR"] = ws.dir(category::kCompile);
  env["LANG"] = "C";
#else
  (void)ws;  // empty env inherits the parent's on Windows
#endif
  return env;
}

}  // namespace

Compiler::Compiler(const Config& config, const Workspace& workspace, ArtifactCache* cache,
                   std::shared_ptr<const ResourceLimiter> limiter, std::uint64_t timeout_ms)
    : config_(config),
      workspace_(workspace),
      cache_(cache),
      limiter_(std::move(limiter)),
      timeout_ms_(timeout_ms) {}

const std::vector<std::string>& Compiler::warning_flags() {
  static const std::vector<std::string> flags = {"-Wall", "-Wextra", "-Werror"};
  return flags;
}

std::vector<std::string> Compiler::build_argv(const std::string& source_path,
                                              const std::string& binary_path) const {
  std::vector<std::string> argv = {source_path, "-std=" + config_.cpp_standard,
                                   config_.optimization_level, "-o", binary_path};
  argv.insert(argv.end(), warning_flags().begin(), warning_flags().end());
  return argv;
}

CompileResult Compiler::compile(const std::string& source,
                                const std::optional<std::string>& name) const {
  CompileResult result;

  std::string src_path;
  std::string exe_path;
  const std::string sanitized = name ? sanitize_identifier(*name) : std::string();
  if (!sanitized.empty()) {
    if (!workspace_.ensure_dir(category::kSources) || !workspace_.ensure_dir(category::kExecute)) {
      result.error_code = ErrorCode::workspace_io_error;
      result.stderr_text = "cannot create workspace directories under " + workspace_.root();
      return result;
    }
    src_path = (fs::path(workspace_.dir(category::kSources)) / (sanitized + ".cpp")).string();
    exe_path = (fs::path(workspace_.dir(category::kExecute)) / (sanitized + ".exe")).string();
  } else {
    const std::string base = workspace_.allocate_temp_path(category::kCompile);
    src_path = base + ".cpp";
    exe_path = base + ".exe";
  }
  result.source_path = src_path;

  std::string io_error;
  if (!write_file(src_path, source, io_error)) {
    result.error_code = ErrorCode::workspace_io_error;
    result.stderr_text = io_error;
    return result;
  }

  std::string cache_key;
  if (cache_) {
    cache_key = ArtifactCache::key_for(config_.compiler_path, config_.cpp_standard,
                                       config_.optimization_level, warning_flags(), source);
    if (auto bytes = cache_->get(cache_key)) {
      // A failed materialization falls through to a real compile.
      if (write_file(exe_path, *bytes, io_error)) {
        make_owner_executable(exe_path);
        result.success = true;
        result.binary_path = exe_path;
        result.from_cache = true;
        return result;
      }
    }
  }

  ProcessSpec spec;
  spec.command = config_.compiler_path;
  spec.argv = build_argv(src_path, exe_path);
  spec.env = compiler_env(workspace_);
  spec.cwd = fs::path(src_path).parent_path().string();
  spec.timeout_ms = timeout_ms_;
  spec.max_output_bytes = kDiagnosticsCap;

  const ProcessResult proc = run_process(spec, *limiter_);
  result.stdout_text = proc.stdout_text;
  result.stderr_text = proc.stderr_text;
  result.exit_code = proc.exit_code;

  std::error_code ec;
  if (!proc.launched) {
    result.error_code = ErrorCode::spawn_failed;
    result.stderr_text = proc.error_message;
    return result;
  }
  if (proc.timed_out) {
    fs::remove(exe_path, ec);
    result.error_code = ErrorCode::compile_timeout;
    if (!result.stderr_text.empty()) result.stderr_text += "\n";
    result.stderr_text += "compilation timed out after " + std::to_string(timeout_ms_) + " ms";
    return result;
  }
  if (proc.exit_code != 0) {
    fs::remove(exe_path, ec);
    result.error_code = ErrorCode::compile_failure;
    return result;
  }
  if (!fs::is_regular_file(exe_path, ec)) {
    result.error_code = ErrorCode::compile_failure;
    result.stderr_text += "compiler exited 0 but produced no binary at " + exe_path;
    return result;
  }

  result.success = true;
  result.binary_path = exe_path;

  if (cache_) {
    // Cache failures only cost a future miss.
    if (auto bytes = read_file(exe_path)) result.stored_in_cache = cache_->put(cache_key, *bytes);
  }
  return result;
}

}  // namespace arbiter
