#ifdef _WIN32
#include "arbiter/sandbox.hpp"

#include <windows.h>

#include <chrono>
#include <string>
#include <thread>

namespace arbiter {
namespace {
void append_limited(std::string& dst, const char* src, size_t n, std::size_t limit, bool& truncated) {
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = n < avail ? n : avail;
  dst.append(src, take);
  if (take < n) truncated = true;
}

std::wstring widen(const std::string& s) {
  if (s.empty()) return {};
  const int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
  std::wstring out(static_cast<size_t>(n), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
  return out;
}

std::string last_error_message(const char* what) {
  return std::string(what) + " failed (error " + std::to_string(GetLastError()) + ")";
}

// Quote one argument for CommandLineToArgvW-compatible parsing.
void append_quoted(std::wstring& cmd, const std::wstring& arg) {
  cmd += L'"';
  size_t backslashes = 0;
  for (wchar_t c : arg) {
    if (c == L'\\') {
      ++backslashes;
      continue;
    }
    if (c == L'"') cmd.append(backslashes * 2 + 1, L'\\');
    else cmd.append(backslashes, L'\\');
    backslashes = 0;
    cmd += c;
  }
  cmd.append(backslashes * 2, L'\\');
  cmd += L'"';
}

// Pipes on Windows have no non-blocking mode; one reader thread per pipe.
std::thread start_reader(HANDLE pipe, std::string& dst, std::size_t limit, bool& truncated) {
  return std::thread([pipe, &dst, limit, &truncated] {
    char buf[4096];
    DWORD n = 0;
    while (ReadFile(pipe, buf, sizeof(buf), &n, nullptr) && n > 0) {
      append_limited(dst, buf, n, limit, truncated);
    }
  });
}

HANDLE open_inheritable(const std::string& path, bool for_write) {
  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
  const std::wstring wpath = path.empty() ? std::wstring(L"NUL") : widen(path);
  return CreateFileW(wpath.c_str(), for_write ? GENERIC_WRITE : GENERIC_READ,
                     FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                     for_write ? CREATE_ALWAYS : OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
}

}  // namespace

bool RlimitResourceLimiter::apply_in_child(const ResourceLimits&) const noexcept { return false; }
std::vector<std::string> RlimitResourceLimiter::describe(const ResourceLimits&) const { return {}; }

// No fork/exec hook on Windows: limits are advisory, the watchdog enforces.
std::shared_ptr<const ResourceLimiter> platform_resource_limiter() {
  static const auto limiter = std::make_shared<NoopResourceLimiter>();
  return limiter;
}

bool killed_by_cpu_limit(const ProcessResult&) { return false; }

bool killed_by_output_limit(const ProcessResult&) { return false; }

ProcessResult run_process(const ProcessSpec& spec, const ResourceLimiter& limiter) {
  ProcessResult result;
  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};

  HANDLE in_h = open_inheritable(spec.stdin_path, false);
  if (in_h == INVALID_HANDLE_VALUE) {
    result.error_message = last_error_message("open stdin");
    return result;
  }
  HANDLE out_r = nullptr, out_w = nullptr, err_r = nullptr, err_w = nullptr;
  if (!spec.stdout_path.empty()) {
    out_w = open_inheritable(spec.stdout_path, true);
    if (out_w == INVALID_HANDLE_VALUE) {
      result.error_message = last_error_message("open stdout file");
      CloseHandle(in_h);
      return result;
    }
  } else if (!CreatePipe(&out_r, &out_w, &sa, 0)) {
    result.error_message = "spawn_failed: " + last_error_message("CreatePipe");
    CloseHandle(in_h);
    return result;
  }
  if (!CreatePipe(&err_r, &err_w, &sa, 0)) {
    result.error_message = "spawn_failed: " + last_error_message("CreatePipe");
    CloseHandle(in_h);
    CloseHandle(out_w);
    if (out_r) CloseHandle(out_r);
    return result;
  }
  // Parent-side read ends must not leak into the child.
  if (out_r) SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(err_r, HANDLE_FLAG_INHERIT, 0);

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = in_h;
  si.hStdOutput = out_w;
  si.hStdError = err_w;

  // Job object: kill-on-close gives process-tree termination.
  HANDLE job = CreateJobObjectW(nullptr, nullptr);
  JOBOBJECT_EXTENDED_LIMIT_INFORMATION jeli{};
  jeli.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
  SetInformationJobObject(job, JobObjectExtendedLimitInformation, &jeli, sizeof(jeli));

  std::wstring cmd;
  append_quoted(cmd, widen(spec.command));
  for (const auto& a : spec.argv) {
    cmd += L' ';
    append_quoted(cmd, widen(a));
  }

  std::wstring env_block;
  DWORD creation_flags = CREATE_NO_WINDOW | CREATE_SUSPENDED;
  if (!spec.env.empty()) {
    for (const auto& [k, v] : spec.env) {
      env_block += widen(k + "=" + v);
      env_block += L'\0';
    }
    env_block += L'\0';
    creation_flags |= CREATE_UNICODE_ENVIRONMENT;
  }

  const auto cwd = widen(spec.cwd);
  const auto start = std::chrono::steady_clock::now();
  PROCESS_INFORMATION pi{};
  const BOOL created = CreateProcessW(nullptr, cmd.data(), nullptr, nullptr, TRUE, creation_flags,
                                      env_block.empty() ? nullptr : env_block.data(),
                                      cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
  CloseHandle(in_h);
  CloseHandle(out_w);
  CloseHandle(err_w);

  if (!created) {
    result.error_message = "spawn_failed: " + last_error_message("CreateProcessW");
    result.exit_code = 127;
    if (out_r) CloseHandle(out_r);
    CloseHandle(err_r);
    CloseHandle(job);
    return result;
  }

  // Assign while suspended so no grandchild escapes the job.
  AssignProcessToJobObject(job, pi.hProcess);
  ResumeThread(pi.hThread);
  result.launched = true;
  result.limits_enforced = limiter.describe(spec.limits);

  std::thread out_reader;
  if (out_r) out_reader = start_reader(out_r, result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
  std::thread err_reader = start_reader(err_r, result.stderr_text, spec.max_output_bytes, result.stderr_truncated);

  const DWORD wait = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(spec.timeout_ms));
  if (wait == WAIT_TIMEOUT) {
    TerminateJobObject(job, 1);
    WaitForSingleObject(pi.hProcess, INFINITE);
    result.timed_out = true;
    result.exit_code = 124;
  } else {
    DWORD ec = 0;
    GetExitCodeProcess(pi.hProcess, &ec);
    result.exit_code = static_cast<int>(ec);
  }
  const auto end = std::chrono::steady_clock::now();

  JOBOBJECT_EXTENDED_LIMIT_INFORMATION usage{};
  if (QueryInformationJobObject(job, JobObjectExtendedLimitInformation, &usage, sizeof(usage), nullptr)) {
    result.peak_memory_kb = static_cast<std::uint64_t>(usage.PeakProcessMemoryUsed) / 1024u;
  }
  // Closing the job kills any survivors, which closes the pipes for the readers.
  CloseHandle(job);
  if (out_reader.joinable()) out_reader.join();
  err_reader.join();

  if (result.stdout_truncated) result.stdout_text += "(truncated)";
  if (result.stderr_truncated) result.stderr_text += "(truncated)";
  result.elapsed_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

  if (out_r) CloseHandle(out_r);
  CloseHandle(err_r);
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
  return result;
}

SandboxCapabilities detect_platform_sandbox_capabilities() {
  SandboxCapabilities caps;
  caps.workspace_confinement = true;  // PathGuard::confine()
  caps.rlimits_cpu = false;           // Not available on Windows
  caps.rlimits_mem = false;           // Not applied: limiter is a no-op here
  caps.process_group_kill = true;     // TerminateJobObject
  caps.job_objects = true;
  caps.inband_memory_usage = true;    // PeakProcessMemoryUsed
  return caps;
}

}  // namespace arbiter
#endif
