#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "arbiter/config.hpp"
#include "arbiter/dispatcher.hpp"
#include "arbiter/engine.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/sandbox.hpp"
#include "arbiter/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitStartup = 2;

struct CliOptions {
  std::string command;
  std::string config_path;
  std::string request_path;
  bool json{false};
};

void print_usage() {
  std::cerr << "usage: arbiter [--config PATH] [--json] <command> [--request FILE]\n"
               "commands:\n"
               "  health         hash primitive, version and compression support\n"
               "  capabilities   sandbox features enforced on this platform\n"
               "  stats          engine statistics for this process\n"
               "  serve          NDJSON tool calls on stdin, one response per line\n"
               "  compile_and_run | debug_with_gdb | compare_outputs | read_test_case | list_tools\n"
               "                 one tool call; arguments object from --request FILE or stdin\n";
}

bool parse_args(int argc, char** argv, CliOptions& opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if (arg == "--request" && i + 1 < argc) {
      opts.request_path = argv[++i];
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "[arbiter] unknown option: " << arg << "\n";
      return false;
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      std::cerr << "[arbiter] unexpected argument: " << arg << "\n";
      return false;
    }
  }
  return !opts.command.empty();
}

std::string resolve_config_path(const CliOptions& opts) {
  if (!opts.config_path.empty()) return opts.config_path;
  const char* env = std::getenv("ARBITER_CONFIG");
  if (env && env[0]) return env;
  return "config.json";
}

std::string read_stream(std::istream& in) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string json_string_array(const std::vector<std::string>& items) {
  arbiter::jsonlite::Array arr;
  for (const auto& s : items) arr.emplace_back(s);
  return arbiter::jsonlite::to_json(arr);
}

int cmd_health() {
  const auto h = arbiter::hash_runtime_info();
  arbiter::jsonlite::Array compression{arbiter::jsonlite::Value("identity")};
#if defined(ARBITER_WITH_ZSTD)
  compression.emplace_back("zstd");
#endif
  arbiter::jsonlite::Object o;
  o["ok"] = true;
  o["hash_primitive"] = h.primitive;
  o["hash_version"] = h.version;
  o["compression_capabilities"] = std::move(compression);
  std::string out = arbiter::jsonlite::to_json(o);
  out.pop_back();
  out += ",\"version\":" +
         arbiter::version::manifest_to_json(arbiter::version::current_manifest()) + "}";
  std::cout << out << "\n";
  return kExitOk;
}

int cmd_capabilities() {
  const auto caps = arbiter::detect_platform_sandbox_capabilities();
  const auto limiter = arbiter::platform_resource_limiter();
  std::cout << "{\"resource_limiter\":\"" << limiter->name() << "\""
            << ",\"enforced\":" << json_string_array(caps.enforced())
            << ",\"unsupported\":" << json_string_array(caps.unsupported()) << "}\n";
  return kExitOk;
}

std::unique_ptr<arbiter::Engine> start_engine(const CliOptions& opts) {
  const std::string path = resolve_config_path(opts);
  const auto loaded = arbiter::load_config(path);
  for (const auto& w : loaded.warnings) std::cerr << "[arbiter] warning: " << w << "\n";
  if (!loaded.ok) {
    for (const auto& e : loaded.errors) std::cerr << "[arbiter] config error: " << e << "\n";
    std::cerr << "[arbiter] " << arbiter::to_string(arbiter::ErrorCode::config_invalid) << ": "
              << path << "\n";
    return nullptr;
  }
  std::string error;
  auto engine = arbiter::Engine::create(loaded.config, &error);
  if (!engine) std::cerr << "[arbiter] workspace error: " << error << "\n";
  return engine;
}

int cmd_serve(arbiter::Dispatcher& dispatcher) {
  std::string line;
  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    std::cout << dispatcher.handle_line(line) << "\n" << std::flush;
  }
  return kExitOk;
}

int cmd_tool(arbiter::Dispatcher& dispatcher, const CliOptions& opts) {
  std::string text;
  if (!opts.request_path.empty()) {
    std::ifstream ifs(opts.request_path, std::ios::binary);
    if (!ifs) {
      std::cerr << "[arbiter] cannot open request file: " << opts.request_path << "\n";
      return kExitUsage;
    }
    text = read_stream(ifs);
  } else if (opts.command != "list_tools") {
    text = read_stream(std::cin);
  }

  arbiter::jsonlite::Object args;
  if (!text.empty()) {
    std::optional<arbiter::jsonlite::JsonError> err;
    args = arbiter::jsonlite::parse(text, &err);
    if (err) {
      std::cerr << "[arbiter] invalid request: " << err->code << ": " << err->message << "\n";
      return kExitUsage;
    }
  }

  const auto resp = dispatcher.dispatch(opts.command, args);
  if (!resp.ok) {
    std::cerr << "[arbiter] " << resp.text << "\n";
    return kExitUsage;
  }
  std::cout << resp.text;
  if (resp.text.empty() || resp.text.back() != '\n') std::cout << "\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  if (!parse_args(argc, argv, opts)) {
    print_usage();
    return kExitUsage;
  }

  if (opts.command == "health") return cmd_health();
  if (opts.command == "capabilities") return cmd_capabilities();

  bool known = opts.command == "serve" || opts.command == "stats";
  for (const auto& t : arbiter::Dispatcher::tools()) known = known || t.name == opts.command;
  if (!known) {
    std::cerr << "[arbiter] unknown command: " << opts.command << "\n";
    print_usage();
    return kExitUsage;
  }

  auto engine = start_engine(opts);
  if (!engine) return kExitStartup;

  if (opts.command == "stats") {
    std::cout << arbiter::global_engine_stats().to_json() << "\n";
    return kExitOk;
  }

  arbiter::Dispatcher dispatcher(*engine, opts.json ? arbiter::ReportFormat::json
                                                     : arbiter::ReportFormat::markdown);
  if (opts.command == "serve") return cmd_serve(dispatcher);
  return cmd_tool(dispatcher, opts);
}
