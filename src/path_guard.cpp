#include "arbiter/path_guard.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace arbiter {

namespace {

inline bool starts_with(const std::string& v, const std::string& prefix) {
  return v.size() >= prefix.size() && v.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline bool is_safe_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '.' || c == '-';
}

std::string canonical_root(const std::string& root) {
  if (root.empty()) return {};
  std::error_code ec;
  const fs::path p = fs::weakly_canonical(fs::path(root), ec);
  if (ec) return {};
  return p.string();
}

// Component-wise containment: "/ws-evil" is not under "/ws".
bool is_under(const std::string& candidate, const std::string& root) {
  if (root.empty()) return false;
  if (candidate == root) return true;
  constexpr char kSep = static_cast<char>(fs::path::preferred_separator);
  std::string prefix = root;
  if (prefix.back() != kSep) prefix += kSep;
  return starts_with(candidate, prefix);
}

const std::vector<std::regex>& dangerous_patterns() {
  static const std::vector<std::regex> patterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    return std::vector<std::regex>{
        std::regex(R"(&&\s*rm)", flags),
        std::regex(R"(;\s*rm)", flags),
        std::regex(R"(\|\s*rm)", flags),
        std::regex(R"(`.*`)", flags),
        std::regex(R"(\$\(.*\))", flags),
        std::regex(R"(>\s*/dev/)", flags),
        std::regex(R"(>>\s*/dev/)", flags),
    };
  }();
  return patterns;
}

}  // namespace

std::string sanitize_identifier(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) out.push_back(is_safe_char(c) ? c : '_');
  const auto first = out.find_first_not_of('.');
  out.erase(0, first == std::string::npos ? out.size() : first);
  if (out.size() > kMaxIdentifierLength) out.resize(kMaxIdentifierLength);
  return out;
}

PathGuard::PathGuard(const std::string& workspace_root, const std::string& toolchain_root,
                     std::vector<std::string> forbidden_commands)
    : workspace_root_(canonical_root(workspace_root)),
      toolchain_root_(canonical_root(toolchain_root)) {
  for (auto& f : forbidden_commands) {
    if (!f.empty()) forbidden_lower_.push_back(to_lower(std::move(f)));
  }
}

ConfinedPath PathGuard::confine(const std::string& path) const {
  ConfinedPath out;
  if (path.empty()) return out;
  std::error_code ec;
  const fs::path abs = fs::absolute(fs::path(path), ec);
  if (ec) return out;
  const fs::path resolved = fs::weakly_canonical(abs, ec);
  if (ec) return out;
  const std::string s = resolved.string();
  if (is_under(s, workspace_root_) || is_under(s, toolchain_root_)) {
    out.ok = true;
    out.resolved = s;
  }
  return out;
}

bool PathGuard::validate_command(const std::string& command_line) const {
  const std::string lowered = to_lower(command_line);
  for (const auto& f : forbidden_lower_) {
    if (lowered.find(f) != std::string::npos) return false;
  }
  for (const auto& re : dangerous_patterns()) {
    if (std::regex_search(command_line, re)) return false;
  }
  return true;
}

}  // namespace arbiter
