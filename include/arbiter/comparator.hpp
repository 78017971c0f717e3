#pragma once

#include <string>

#include "arbiter/types.hpp"

namespace arbiter {

// Line-by-line comparison of program output against an expected answer.
//
// ignore_whitespace collapses every whitespace run, newlines included, to one
// space, so both sides become a single logical line. ignore_case lowercases
// ASCII after that. Both sides are then trimmed, split on '\n' and padded
// with empty lines to equal length. Pure; no filesystem access.
ComparisonResult compare_outputs(const std::string& actual, const std::string& expected,
                                 bool ignore_whitespace = true, bool ignore_case = false);

}  // namespace arbiter
