#pragma once

#include <string>

#include "arbiter/path_guard.hpp"
#include "arbiter/types.hpp"
#include "arbiter/workspace.hpp"

namespace arbiter {

// Named test cases: two built-in samples ("a+b", "fibonacci") plus plain text
// files under <workspace>/tests/<id>.txt, returned verbatim in TestCase::raw.
class TestCaseStore {
 public:
  TestCaseStore(const Workspace& workspace, const PathGuard& guard);

  TestCase read(const std::string& id) const;

 private:
  const Workspace& workspace_;
  const PathGuard& guard_;
};

}  // namespace arbiter
