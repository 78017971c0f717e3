#pragma once

// arbiter/session.hpp — Registry of in-flight tool calls.
//
// Sessions exist for the front end only: they name a call in reports and let
// `arbiter stats` show what is running. The engine never reads them.
// SessionScope guarantees removal on every exit path, including exceptions
// thrown by a report formatter.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arbiter {

struct Session {
  std::string id;
  std::uint64_t started_at_unix{0};
  std::string tool;
  std::string arguments_json;
};

class SessionRegistry {
 public:
  // Registers a session and returns its id, "session_<unix>_<n>" where n is
  // derived from the arguments. An id already issued in the same second, open
  // or closed, gets a "_<k>" suffix, so ids never repeat within a process.
  std::string open(const std::string& tool, const std::string& arguments_json);
  void close(const std::string& id);

  std::optional<Session> find(const std::string& id) const;
  std::vector<Session> snapshot() const;
  std::size_t size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, Session> sessions_;
  std::uint64_t issued_second_{0};
  std::set<std::string> issued_;  // ids handed out during issued_second_
};

class SessionScope {
 public:
  SessionScope(SessionRegistry& registry, const std::string& tool, const std::string& arguments_json)
      : registry_(registry), id_(registry.open(tool, arguments_json)) {}
  ~SessionScope() { registry_.close(id_); }

  SessionScope(const SessionScope&) = delete;
  SessionScope& operator=(const SessionScope&) = delete;

  const std::string& id() const { return id_; }

 private:
  SessionRegistry& registry_;
  std::string id_;
};

}  // namespace arbiter
