#include "arbiter/comparator.hpp"

#include <cctype>
#include <vector>

namespace arbiter {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string collapse_whitespace(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char c : s) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out += ' ';
    pending_space = false;
    out += c;
  }
  return out;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    const size_t nl = s.find('\n', start);
    if (nl == std::string::npos) {
      lines.push_back(s.substr(start));
      return lines;
    }
    lines.push_back(s.substr(start, nl - start));
    start = nl + 1;
  }
}

std::string normalize(const std::string& s, bool ignore_whitespace, bool ignore_case) {
  std::string out = ignore_whitespace ? collapse_whitespace(s) : s;
  if (ignore_case) {
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return trim(out);
}

}  // namespace

ComparisonResult compare_outputs(const std::string& actual, const std::string& expected,
                                 bool ignore_whitespace, bool ignore_case) {
  ComparisonResult result;
  const auto a = split_lines(normalize(actual, ignore_whitespace, ignore_case));
  const auto e = split_lines(normalize(expected, ignore_whitespace, ignore_case));
  result.actual_line_count = a.size();
  result.expected_line_count = e.size();

  const size_t n = a.size() > e.size() ? a.size() : e.size();
  for (size_t i = 0; i < n; ++i) {
    const std::string& al = i < a.size() ? a[i] : std::string();
    const std::string& el = i < e.size() ? e[i] : std::string();
    if (al != el) result.differences.push_back({i + 1, al, el});
  }
  result.match = result.differences.empty();
  return result;
}

}  // namespace arbiter
