#include "arbiter/session.hpp"

#include <ctime>

#include "arbiter/hash.hpp"

namespace arbiter {

std::string SessionRegistry::open(const std::string& tool, const std::string& arguments_json) {
  Session s;
  s.started_at_unix = static_cast<std::uint64_t>(std::time(nullptr));
  s.tool = tool;
  s.arguments_json = arguments_json;

  const std::string digest = hash_domain("sess:", arguments_json);
  const std::uint64_t n = std::stoull(digest.substr(0, 8), nullptr, 16) % 10000u;
  const std::string base = "session_" + std::to_string(s.started_at_unix) + "_" + std::to_string(n);

  std::lock_guard<std::mutex> lk(mu_);
  if (s.started_at_unix != issued_second_) {
    issued_second_ = s.started_at_unix;
    issued_.clear();
  }
  s.id = base;
  for (unsigned k = 1; sessions_.contains(s.id) || issued_.contains(s.id); ++k)
    s.id = base + "_" + std::to_string(k);
  const std::string id = s.id;
  issued_.insert(id);
  sessions_.emplace(id, std::move(s));
  return id;
}

void SessionRegistry::close(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  sessions_.erase(id);
}

std::optional<Session> SessionRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

std::vector<Session> SessionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Session> out;
  out.reserve(sessions_.size());
  for (const auto& [id, s] : sessions_) out.push_back(s);
  return out;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

}  // namespace arbiter
