#include "arbiter/jsonlite.hpp"

// Serialization is deterministic: objects iterate in key order and doubles
// are printed with "%.6f" minus trailing zeros, independent of locale.

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <type_traits>
#include <variant>

namespace arbiter::jsonlite {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

void put_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  // Top-level entry: one value, then only whitespace.
  Value document() {
    Value v = value(0);
    skip_ws();
    if (ok() && pos_ != text_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

  bool ok() const { return !error_.has_value(); }
  const std::optional<JsonError>& error() const { return error_; }

 private:
  void fail(const char* code, std::string message) {
    if (!error_) error_ = JsonError{code, std::move(message) + " at offset " + std::to_string(pos_)};
  }

  void skip_ws() {
    while (pos_ < text_.size() && is_ws(text_[pos_])) ++pos_;
  }

  bool at_end() const { return pos_ >= text_.size(); }
  char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  bool literal(const char* word) {
    std::size_t n = 0;
    while (word[n] != '\0') ++n;
    if (text_.compare(pos_, n, word) != 0) return false;
    pos_ += n;
    return true;
  }

  Value value(std::size_t depth) {
    skip_ws();
    if (depth > kMaxDepth) {
      fail("json_parse_error", "nesting too deep");
      return {};
    }
    switch (peek()) {
      case '{': return Value{object(depth + 1)};
      case '[': return Value{array(depth + 1)};
      case '"': return Value{string()};
      case '\0':
        if (at_end()) {
          fail("json_parse_error", "unexpected end of input");
          return {};
        }
        break;
      default: break;
    }
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    if (peek() == '-' || is_digit(peek())) return number();
    if (peek() == 'N' || peek() == 'I') {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return {};
    }
    fail("json_parse_error", "unexpected token");
    return {};
  }

  Object object(std::size_t depth) {
    Object out;
    ++pos_;  // '{'
    if (consume('}')) return out;
    while (ok()) {
      skip_ws();
      if (peek() != '"') {
        fail("json_parse_error", "expected string key");
        break;
      }
      std::string key = string();
      if (!ok()) break;
      if (out.contains(key)) {
        fail("json_duplicate_key", "duplicate key: " + key);
        break;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected ':'");
        break;
      }
      Value v = value(depth);
      if (!ok()) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("json_parse_error", "expected ',' or '}'");
    }
    return out;
  }

  Array array(std::size_t depth) {
    Array out;
    ++pos_;  // '['
    if (consume(']')) return out;
    while (ok()) {
      out.push_back(value(depth));
      if (!ok()) break;
      if (consume(']')) break;
      if (!consume(',')) fail("json_parse_error", "expected ',' or ']'");
    }
    return out;
  }

  bool hex4(std::uint32_t& cp) {
    if (pos_ + 4 > text_.size()) return false;
    cp = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = text_[pos_ + k];
      std::uint32_t d;
      if (c >= '0' && c <= '9') d = static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') d = static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') d = static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
      cp = (cp << 4) | d;
    }
    pos_ += 4;
    return true;
  }

  std::string string() {
    std::string out;
    ++pos_;  // opening quote
    while (!at_end()) {
      const char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "control character in string");
        return {};
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) break;
      const char esc = text_[pos_++];
      switch (esc) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!hex4(cp)) {
            fail("json_parse_error", "invalid \\u escape");
            return {};
          }
          // Combine a surrogate pair when the low half follows.
          if (cp >= 0xD800 && cp <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
            const std::size_t save = pos_;
            pos_ += 2;
            std::uint32_t lo = 0;
            if (hex4(lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              pos_ = save;
            }
          }
          put_utf8(out, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("invalid escape \\") + esc);
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  Value number() {
    const std::size_t start = pos_;
    bool integral = true;
    if (peek() == '-') {
      integral = false;  // negatives are kept as double to preserve the sign
      ++pos_;
    }
    if (!is_digit(peek())) {
      fail("json_parse_error", "invalid number");
      return {};
    }
    while (is_digit(peek())) ++pos_;
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "invalid number");
        return {};
      }
      while (is_digit(peek())) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!is_digit(peek())) {
        fail("json_parse_error", "invalid exponent");
        return {};
      }
      while (is_digit(peek())) ++pos_;
    }

    const std::string digits = text_.substr(start, pos_ - start);
    errno = 0;
    if (integral) {
      const unsigned long long u = std::strtoull(digits.c_str(), nullptr, 10);
      if (errno == ERANGE) {
        fail("json_parse_error", "number out of range");
        return {};
      }
      return Value{static_cast<std::uint64_t>(u)};
    }
    const double d = std::strtod(digits.c_str(), nullptr);
    if (errno == ERANGE) {
      fail("json_parse_error", "number out of range");
      return {};
    }
    return Value{d};
  }

  const std::string& text_;
  std::size_t pos_{0};
  std::optional<JsonError> error_;
};

void write_escaped(std::string& out, const std::string& s) {
  out += '"';
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_double(std::string& out, double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    out += "0.0";
    return;
  }
  std::string s(buf, static_cast<std::size_t>(n));
  while (s.back() == '0') s.pop_back();
  if (s.back() == '.') s += '0';
  out += s;
}

void write_value(std::string& out, const Value& value) {
  std::visit(
      [&out](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
          out += std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          write_double(out, x);
        } else if constexpr (std::is_same_v<T, std::string>) {
          write_escaped(out, x);
        } else if constexpr (std::is_same_v<T, Object>) {
          out += '{';
          bool first = true;
          for (const auto& [k, v] : x) {
            if (!first) out += ',';
            first = false;
            write_escaped(out, k);
            out += ':';
            write_value(out, v);
          }
          out += '}';
        } else {
          out += '[';
          for (std::size_t i = 0; i < x.size(); ++i) {
            if (i) out += ',';
            write_value(out, x[i]);
          }
          out += ']';
        }
      },
      value.v);
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<T>(&it->second.v);
}

}  // namespace

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader reader(text);
  Value v = reader.document();
  std::optional<JsonError> err = reader.error();
  if (!err && !std::holds_alternative<Object>(v.v))
    err = JsonError{"json_parse_error", "top-level value must be an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string to_json(const Value& value) {
  std::string out;
  write_value(out, value);
  return out;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = find_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* u = find_as<std::uint64_t>(obj, key);
  return u ? *u : def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  const auto* o = find_as<Object>(obj, key);
  return o ? *o : Object{};
}

std::string type_name(const Object& obj, const std::string& key) {
  const auto it = obj.find(key);
  if (it == obj.end()) return "missing";
  static const char* const kNames[] = {"null", "bool", "integer", "number", "string", "object", "array"};
  return kNames[it->second.v.index()];
}

}  // namespace arbiter::jsonlite
