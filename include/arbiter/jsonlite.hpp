#pragma once

// arbiter/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for the configuration file, dispatcher requests/responses, cache
// metadata sidecars and the event log. Objects are std::map, so serialization
// order is always sorted by key.
//
// STRICTNESS:
//   - Duplicate object keys are rejected (json_duplicate_key).
//   - NaN/Infinity are rejected.
//   - Trailing data after the top-level value is rejected.
//   - Raw control characters inside strings are rejected.
//   - Nesting deeper than kMaxDepth is rejected.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arbiter::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

constexpr std::size_t kMaxDepth = 64;

struct JsonError {
  std::string code;
  std::string message;
};

// Parse a JSON document whose top-level value is an object.
// On error returns an empty object and sets *error (if non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& value);

// Type-safe extractors. A present key of the wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);

// Name of the JSON type held by obj[key], or "missing".
std::string type_name(const Object& obj, const std::string& key);

}  // namespace arbiter::jsonlite
