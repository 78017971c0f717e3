#include "arbiter/dispatcher.hpp"

#include <exception>
#include <optional>
#include <sstream>

namespace arbiter {

namespace {

const ToolDescriptor* find_tool(const std::string& name) {
  for (const auto& t : Dispatcher::tools()) {
    if (t.name == name) return &t;
  }
  return nullptr;
}

// Returns an error message, or nullopt if the arguments fit the descriptor.
std::optional<std::string> check_arguments(const ToolDescriptor& tool, const jsonlite::Object& args) {
  for (const auto& p : tool.parameters) {
    const std::string type = jsonlite::type_name(args, p.name);
    if (type == "missing" || type == "null") {
      if (p.required) return "missing required argument: " + p.name;
      continue;
    }
    if (type != p.type) return "argument '" + p.name + "' must be " + p.type + ", got " + type;
    if (p.type != "integer") continue;
    const std::uint64_t v = jsonlite::get_u64(args, p.name);
    if (v == 0) return "argument '" + p.name + "' must be greater than zero";
    if (p.max > 0 && v > p.max)
      return "argument '" + p.name + "' must be at most " + std::to_string(p.max);
  }
  return std::nullopt;
}

std::optional<std::uint64_t> optional_u64(const jsonlite::Object& args, const std::string& key) {
  if (jsonlite::type_name(args, key) != "integer") return std::nullopt;
  return static_cast<std::uint64_t>(jsonlite::get_u64(args, key));
}

void fenced(std::ostringstream& o, const std::string& text) {
  o << "```\n" << text;
  if (text.empty() || text.back() != '\n') o << "\n";
  o << "```\n";
}

jsonlite::Array differences_json(const ComparisonResult& cmp, std::size_t limit) {
  jsonlite::Array out;
  for (std::size_t i = 0; i < cmp.differences.size() && i < limit; ++i) {
    const auto& d = cmp.differences[i];
    jsonlite::Object o;
    o["line"] = static_cast<std::uint64_t>(d.line);
    o["actual"] = d.actual;
    o["expected"] = d.expected;
    out.emplace_back(std::move(o));
  }
  return out;
}

jsonlite::Object comparison_json(const ComparisonResult& cmp, std::size_t limit) {
  jsonlite::Object o;
  o["match"] = cmp.match;
  o["actual_line_count"] = static_cast<std::uint64_t>(cmp.actual_line_count);
  o["expected_line_count"] = static_cast<std::uint64_t>(cmp.expected_line_count);
  o["differences_total"] = static_cast<std::uint64_t>(cmp.differences.size());
  o["differences"] = differences_json(cmp, limit);
  return o;
}

void comparison_markdown(std::ostringstream& o, const ComparisonResult& cmp, std::size_t limit) {
  if (cmp.match) {
    o << "Output matches.\n";
    return;
  }
  o << "Output does not match.\n";
  o << "Actual lines: " << cmp.actual_line_count << "\n";
  o << "Expected lines: " << cmp.expected_line_count << "\n";
  for (std::size_t i = 0; i < cmp.differences.size() && i < limit; ++i) {
    const auto& d = cmp.differences[i];
    o << "Line " << d.line << ":\n";
    o << "  actual:   `" << d.actual << "`\n";
    o << "  expected: `" << d.expected << "`\n";
  }
  if (cmp.differences.size() > limit) {
    o << "... " << (cmp.differences.size() - limit) << " more differences not shown\n";
  }
}

jsonlite::Object compile_json(const CompileResult& c) {
  jsonlite::Object o;
  o["success"] = c.success;
  o["from_cache"] = c.from_cache;
  o["exit_code"] = static_cast<double>(c.exit_code);
  o["error_code"] = to_string(c.error_code);
  o["stdout"] = c.stdout_text;
  o["stderr"] = c.stderr_text;
  o["source_path"] = c.source_path;
  o["binary_path"] = c.binary_path ? jsonlite::Value(*c.binary_path) : jsonlite::Value(nullptr);
  return o;
}

jsonlite::Object run_json(const ExecutionResult& r) {
  jsonlite::Array limits;
  for (const auto& l : r.limits_enforced) limits.emplace_back(l);
  jsonlite::Object o;
  o["success"] = r.success;
  o["timed_out"] = r.timed_out;
  o["elapsed_ms"] = static_cast<std::uint64_t>(r.elapsed_ms);
  o["peak_memory_kb"] = static_cast<std::uint64_t>(r.peak_memory_kb);
  o["exit_code"] = static_cast<double>(r.exit_code);
  o["stdout"] = r.stdout_text;
  o["stderr"] = r.stderr_text;
  o["stdout_truncated"] = r.stdout_truncated;
  o["error_code"] = to_string(r.error_code);
  o["error_message"] = r.error_message;
  o["input_path"] = r.input_path;
  o["output_path"] = r.output_path;
  o["limits_enforced"] = std::move(limits);
  return o;
}

}  // namespace

Dispatcher::Dispatcher(const Engine& engine, ReportFormat format) : engine_(engine), format_(format) {}

const std::vector<ToolDescriptor>& Dispatcher::tools() {
  static const std::vector<ToolDescriptor> kTools = {
      {"compile_and_run",
       "Compile C++ source, run it on the given input, optionally compare with an expected output",
       {{"code", "string", true, "C++ source code"},
        {"input", "string", true, "stdin for the program"},
        {"expected_output", "string", false, "expected stdout"},
        {"filename", "string", false, "base name for the source and binary"},
        {"time_limit", "integer", false, "time limit in milliseconds", kMaxTimeLimitMs},
        {"memory_limit", "integer", false, "memory limit in MB", kMaxMemoryLimitMb}}},
      {"debug_with_gdb",
       "Compile C++ source and run a batch gdb script against it",
       {{"code", "string", true, "C++ source code"},
        {"gdb_script", "string", false, "gdb commands, one per line"}}},
      {"compare_outputs",
       "Compare two outputs line by line",
       {{"actual", "string", true, "actual output"},
        {"expected", "string", true, "expected output"},
        {"ignore_whitespace", "bool", false, "collapse whitespace runs (default true)"},
        {"ignore_case", "bool", false, "compare case-insensitively (default false)"}}},
      {"read_test_case",
       "Read a built-in or workspace test case",
       {{"test_case_id", "string", true, "test case id"}}},
      {"list_tools", "List available tools", {}},
  };
  return kTools;
}

ToolResponse Dispatcher::dispatch(const std::string& tool, const jsonlite::Object& arguments) {
  SessionScope scope(sessions_, tool, jsonlite::to_json(arguments));
  ToolResponse resp;
  resp.session = scope.id();

  const ToolDescriptor* desc = find_tool(tool);
  if (!desc) {
    resp.text = "unknown tool: " + tool;
    return resp;
  }
  if (auto err = check_arguments(*desc, arguments)) {
    resp.text = *err;
    return resp;
  }

  try {
    if (tool == "compile_and_run") {
      resp.text = compile_and_run(arguments, scope.id());
    } else if (tool == "debug_with_gdb") {
      resp.text = debug_with_gdb(arguments, scope.id());
    } else if (tool == "compare_outputs") {
      resp.text = compare(arguments);
    } else if (tool == "read_test_case") {
      resp.text = read_test_case(arguments);
    } else {
      resp.text = list_tools();
    }
    resp.ok = true;
  } catch (const std::exception& e) {
    resp.text = "tool error: " + std::string(e.what());
  }
  return resp;
}

std::string Dispatcher::response_to_json(const ToolResponse& response) {
  jsonlite::Object o;
  o["ok"] = response.ok;
  o["session"] = response.session;
  o["text"] = response.text;
  return jsonlite::to_json(o);
}

std::string Dispatcher::handle_line(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const auto req = jsonlite::parse(line, &err);
  ToolResponse resp;
  if (err) {
    resp.text = "invalid request: " + err->code + ": " + err->message;
    return response_to_json(resp);
  }
  if (jsonlite::type_name(req, "tool") != "string") {
    resp.text = "invalid request: \"tool\" must be a string";
    return response_to_json(resp);
  }
  const std::string args_type = jsonlite::type_name(req, "arguments");
  if (args_type != "missing" && args_type != "object") {
    resp.text = "invalid request: \"arguments\" must be an object";
    return response_to_json(resp);
  }
  return response_to_json(dispatch(jsonlite::get_string(req, "tool"), jsonlite::get_object(req, "arguments")));
}

std::string Dispatcher::compile_and_run(const jsonlite::Object& args, const std::string& session) const {
  const std::string code = jsonlite::get_string(args, "code");
  const std::string input = jsonlite::get_string(args, "input");
  const std::string expected = jsonlite::get_string(args, "expected_output");
  const std::string filename = jsonlite::get_string(args, "filename", "program_" + session);

  const CompileResult c = engine_.compile(code, filename);
  std::optional<ExecutionResult> run;
  std::optional<ComparisonResult> cmp;
  if (c.success) {
    run = engine_.execute(*c.binary_path, input, optional_u64(args, "time_limit"),
                          optional_u64(args, "memory_limit"));
    if (!expected.empty()) cmp = engine_.compare(run->stdout_text, expected);
  }

  if (format_ == ReportFormat::json) {
    jsonlite::Object o;
    o["session"] = session;
    o["filename"] = engine_.sanitize_identifier(filename);
    o["compile"] = compile_json(c);
    if (run) o["run"] = run_json(*run);
    if (cmp) o["comparison"] = comparison_json(*cmp, kRunReportDifferences);
    return jsonlite::to_json(o);
  }

  std::ostringstream o;
  o << "## Compile and run report\n";
  o << "Session: " << session << "\n";
  o << "Filename: " << engine_.sanitize_identifier(filename) << "\n";

  o << "\n### 1. Compile\n";
  if (c.success) {
    o << "Compilation succeeded" << (c.from_cache ? " (cached)" : "") << ".\n";
    if (!c.stdout_text.empty()) {
      o << "Compiler output:\n";
      fenced(o, c.stdout_text);
    }
  } else {
    o << "Compilation failed (" << to_string(c.error_code) << ").\n";
    if (!c.stderr_text.empty()) {
      o << "Errors:\n";
      fenced(o, c.stderr_text);
    }
    return o.str();
  }

  o << "\n### 2. Run\n";
  o << "Status: " << (run->success ? "success" : "failure");
  if (run->error_code != ErrorCode::none) o << " (" << to_string(run->error_code) << ")";
  o << "\n";
  if (!run->error_message.empty()) o << "Error: " << run->error_message << "\n";
  o << "Time: " << run->elapsed_ms << "ms\n";
  o << "Memory: " << run->peak_memory_kb << "KB\n";
  o << "Exit code: " << run->exit_code << "\n";
  if (!run->stdout_text.empty()) {
    o << "\nProgram output:\n";
    fenced(o, run->stdout_text);
  }
  if (!run->stderr_text.empty()) {
    o << "\nError output:\n";
    fenced(o, run->stderr_text);
  }

  if (cmp) {
    o << "\n### 3. Comparison\n";
    comparison_markdown(o, *cmp, kRunReportDifferences);
  }

  o << "\n### 4. Files\n";
  o << "Source: `" << c.source_path << "`\n";
  o << "Binary: `" << *c.binary_path << "`\n";
  o << "Input: `" << run->input_path << "`\n";
  o << "Output: `" << run->output_path << "`\n";
  return o.str();
}

std::string Dispatcher::debug_with_gdb(const jsonlite::Object& args, const std::string& session) const {
  const std::string code = jsonlite::get_string(args, "code");
  std::optional<std::string> script;
  if (jsonlite::type_name(args, "gdb_script") == "string") script = jsonlite::get_string(args, "gdb_script");

  const CompileResult c = engine_.compile(code, "debug_" + session);
  std::optional<DebugResult> d;
  if (c.success) d = engine_.debug(*c.binary_path, script);

  if (format_ == ReportFormat::json) {
    jsonlite::Object o;
    o["session"] = session;
    o["compile"] = compile_json(c);
    if (d) {
      jsonlite::Object dbg;
      dbg["success"] = d->success;
      dbg["exit_code"] = static_cast<double>(d->exit_code);
      dbg["error_code"] = to_string(d->error_code);
      dbg["error_message"] = d->error_message;
      dbg["stdout"] = d->stdout_text;
      dbg["stderr"] = d->stderr_text;
      dbg["script_path"] = d->script_path;
      o["debug"] = std::move(dbg);
    }
    return jsonlite::to_json(o);
  }

  std::ostringstream o;
  if (!c.success) {
    o << "Compilation failed, cannot debug:\n";
    fenced(o, c.stderr_text);
    return o.str();
  }
  o << "## Debugger report\n";
  o << "Session: " << session << "\n";
  if (d->success) {
    o << "Debugging finished.\n";
    if (!d->stdout_text.empty()) {
      o << "**gdb output**:\n";
      fenced(o, d->stdout_text);
    }
  } else {
    o << "Debugging failed";
    if (d->error_code != ErrorCode::none) o << " (" << to_string(d->error_code) << ")";
    o << ".\n";
    const std::string err = !d->error_message.empty() ? d->error_message : d->stderr_text;
    if (!err.empty()) {
      o << "Error:\n";
      fenced(o, err);
    }
  }
  return o.str();
}

std::string Dispatcher::compare(const jsonlite::Object& args) const {
  const ComparisonResult cmp = engine_.compare(jsonlite::get_string(args, "actual"),
                                               jsonlite::get_string(args, "expected"),
                                               jsonlite::get_bool(args, "ignore_whitespace", true),
                                               jsonlite::get_bool(args, "ignore_case", false));
  if (format_ == ReportFormat::json) {
    return jsonlite::to_json(comparison_json(cmp, kCompareReportDifferences));
  }
  std::ostringstream o;
  o << "## Output comparison\n\n";
  comparison_markdown(o, cmp, kCompareReportDifferences);
  return o.str();
}

std::string Dispatcher::read_test_case(const jsonlite::Object& args) const {
  const std::string id = jsonlite::get_string(args, "test_case_id");
  const TestCase tc = engine_.read_test_case(id);

  if (format_ == ReportFormat::json) {
    jsonlite::Object o;
    o["found"] = tc.found;
    o["id"] = tc.id;
    o["builtin"] = tc.builtin;
    if (tc.builtin) {
      o["description"] = tc.description;
      o["input"] = tc.input;
      o["output"] = tc.output;
    } else if (tc.found) {
      o["raw"] = tc.raw;
    } else {
      o["error_message"] = tc.error_message;
    }
    return jsonlite::to_json(o);
  }

  std::ostringstream o;
  if (!tc.found) {
    o << "Test case not found: " << id << "\n";
  } else if (tc.builtin) {
    o << "## Test case: " << id << "\n";
    o << "Description: " << tc.description << "\n";
    o << "Input:\n";
    fenced(o, tc.input);
    o << "Output:\n";
    fenced(o, tc.output);
  } else {
    o << "## Test case file: " << id << "\n";
    fenced(o, tc.raw);
  }
  return o.str();
}

std::string Dispatcher::list_tools() const {
  if (format_ == ReportFormat::json) {
    jsonlite::Array arr;
    for (const auto& t : tools()) {
      jsonlite::Array params;
      for (const auto& p : t.parameters) {
        jsonlite::Object po;
        po["name"] = p.name;
        po["type"] = p.type;
        po["required"] = p.required;
        po["description"] = p.description;
        if (p.max > 0) po["max"] = p.max;
        params.emplace_back(std::move(po));
      }
      jsonlite::Object to;
      to["name"] = t.name;
      to["description"] = t.description;
      to["parameters"] = std::move(params);
      arr.emplace_back(std::move(to));
    }
    jsonlite::Object o;
    o["tools"] = std::move(arr);
    return jsonlite::to_json(o);
  }
  std::ostringstream o;
  o << "## Tools\n";
  for (const auto& t : tools()) {
    o << "\n### " << t.name << "\n" << t.description << "\n";
    for (const auto& p : t.parameters) {
      o << "- `" << p.name << "` (" << p.type << (p.required ? ", required" : "") << "): "
        << p.description << "\n";
    }
  }
  return o.str();
}

}  // namespace arbiter
