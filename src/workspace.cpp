#include "arbiter/workspace.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

#ifndef _WIN32
#include <unistd.h>
#else
#include <process.h>
#endif

#include "arbiter/hash.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {

std::atomic<std::uint64_t> g_temp_seq{0};

long current_pid() {
#ifdef _WIN32
  return static_cast<long>(_getpid());
#else
  return static_cast<long>(getpid());
#endif
}

std::uint64_t now_millis() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// Probe writability with a real file; permissions alone lie on some mounts.
bool probe_writable(const fs::path& dir) {
  const fs::path probe = dir / ".arbiter_probe";
  {
    std::ofstream ofs(probe, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs << "ok";
    if (!ofs) return false;
  }
  std::error_code ec;
  fs::remove(probe, ec);
  return true;
}

}  // namespace

const std::vector<std::string>& Workspace::fixed_directories() {
  static const std::vector<std::string> dirs = {
      category::kCompile, category::kExecute, category::kCache,
      category::kInputs,  category::kOutputs, category::kSources};
  return dirs;
}

std::optional<Workspace> Workspace::open(const std::string& root, std::string* error) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(fs::absolute(fs::path(root)), ec);
  if (ec) {
    if (error) *error = "cannot resolve workspace root '" + root + "': " + ec.message();
    return std::nullopt;
  }
  for (const auto& d : fixed_directories()) {
    const fs::path p = base / d;
    fs::create_directories(p, ec);
    if (ec) {
      if (error) *error = "cannot create " + p.string() + ": " + ec.message();
      return std::nullopt;
    }
#ifndef _WIN32
    fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
      if (error) *error = "cannot restrict permissions on " + p.string() + ": " + ec.message();
      return std::nullopt;
    }
#endif
  }
  if (!probe_writable(base / category::kCompile)) {
    if (error) *error = "workspace root is not writable: " + base.string();
    return std::nullopt;
  }
  return Workspace(base.string());
}

std::string Workspace::dir(const std::string& category) const {
  return (fs::path(root_) / category).string();
}

bool Workspace::ensure_dir(const std::string& category) const {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / category, ec);
  return !ec;
}

std::string Workspace::allocate_temp_path(const std::string& category) const {
  const std::uint64_t ts = now_millis();
  const std::uint64_t seq = g_temp_seq.fetch_add(1, std::memory_order_relaxed);
  const std::string seed =
      std::to_string(ts) + ":" + std::to_string(current_pid()) + ":" + std::to_string(seq);
  const std::string digest = hash_domain("tmp:", seed).substr(0, 8);
  // A failure here surfaces as a write error at the caller.
  ensure_dir(category);
  return (fs::path(root_) / category / (std::to_string(ts) + "_" + digest)).string();
}

}  // namespace arbiter
