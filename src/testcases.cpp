#include "arbiter/testcases.hpp"

#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

namespace arbiter {

namespace {

struct BuiltinCase {
  const char* description;
  const char* input;
  const char* output;
};

// Keyed by sanitized id; "a+b" sanitizes to "a_b".
const std::map<std::string, BuiltinCase>& builtin_cases() {
  static const std::map<std::string, BuiltinCase> cases = {
      {"a_b", {"A+B problem", "3 5\n", "8\n"}},
      {"fibonacci", {"10th Fibonacci number", "10\n", "55\n"}},
  };
  return cases;
}

}  // namespace

TestCaseStore::TestCaseStore(const Workspace& workspace, const PathGuard& guard)
    : workspace_(workspace), guard_(guard) {}

TestCase TestCaseStore::read(const std::string& id) const {
  TestCase tc;
  tc.id = sanitize_identifier(id);
  if (tc.id.empty()) {
    tc.error_message = "empty test case id";
    return tc;
  }

  const auto& builtins = builtin_cases();
  if (auto it = builtins.find(tc.id); it != builtins.end()) {
    tc.found = true;
    tc.builtin = true;
    tc.description = it->second.description;
    tc.input = it->second.input;
    tc.output = it->second.output;
    return tc;
  }

  const std::string path =
      (fs::path(workspace_.dir(category::kTests)) / (tc.id + ".txt")).string();
  const ConfinedPath confined = guard_.confine(path);
  if (!confined.ok) {
    tc.error_message = "test case path outside the workspace";
    return tc;
  }
  std::ifstream ifs(confined.resolved, std::ios::binary);
  if (!ifs) {
    tc.error_message = "test case not found: " + tc.id;
    return tc;
  }
  tc.raw.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  tc.found = true;
  return tc;
}

}  // namespace arbiter
