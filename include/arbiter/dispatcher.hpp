#pragma once

// arbiter/dispatcher.hpp — Tool-call front end over the Engine.
//
// TOOLS:
//   compile_and_run  {code, input, expected_output?, filename?, time_limit?, memory_limit?}
//   debug_with_gdb   {code, gdb_script?}
//   compare_outputs  {actual, expected, ignore_whitespace?, ignore_case?}
//   read_test_case   {test_case_id}
//   list_tools       {}
//
// Every call runs inside a SessionScope. Reports are markdown by default or
// JSON (ReportFormat::json). ToolResponse::ok is false only when the call
// could not be dispatched: unknown tool, invalid arguments, malformed
// request line. A failed compile or run still produces a report with ok=true.
//
// WIRE FORMAT (serve):
//   request  {"tool":"<name>","arguments":{...}}
//   response {"ok":bool,"session":"<id>","text":"<report>"}
//   one JSON object per line in both directions.

#include <cstdint>
#include <string>
#include <vector>

#include "arbiter/engine.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/session.hpp"

namespace arbiter {

enum class ReportFormat { markdown, json };

struct ToolResponse {
  bool ok{false};
  std::string session;
  std::string text;
};

struct ToolParameter {
  std::string name;
  std::string type;  // "string", "integer" or "bool"
  bool required{false};
  std::string description;
  std::uint64_t max{0};  // integers only; 0 = no upper bound
};

struct ToolDescriptor {
  std::string name;
  std::string description;
  std::vector<ToolParameter> parameters;
};

// Markdown shows at most this many differences per report.
constexpr std::size_t kRunReportDifferences = 5;
constexpr std::size_t kCompareReportDifferences = 10;

class Dispatcher {
 public:
  Dispatcher(const Engine& engine, ReportFormat format);

  ToolResponse dispatch(const std::string& tool, const jsonlite::Object& arguments);

  // One request line in, one response line out (without trailing newline).
  std::string handle_line(const std::string& line);

  static const std::vector<ToolDescriptor>& tools();
  static std::string response_to_json(const ToolResponse& response);

  const SessionRegistry& sessions() const { return sessions_; }

 private:
  std::string compile_and_run(const jsonlite::Object& args, const std::string& session) const;
  std::string debug_with_gdb(const jsonlite::Object& args, const std::string& session) const;
  std::string compare(const jsonlite::Object& args) const;
  std::string read_test_case(const jsonlite::Object& args) const;
  std::string list_tools() const;

  const Engine& engine_;
  ReportFormat format_;
  SessionRegistry sessions_;
};

}  // namespace arbiter
