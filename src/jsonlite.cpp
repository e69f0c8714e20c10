#include "tribunal/jsonlite.hpp"

// DETERMINISM:
//   - to_json() output has sorted keys (std::map iteration).
//   - format_double() always uses 6 decimal places with trailing-zero trimming,
//     so confidence values serialize identically across platforms.
//   - std::stod() is locale-sensitive. It is used only for input parsing, never
//     for output.

#include <cctype>
#include <cstdio>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace tribunal::jsonlite {

namespace {

void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool parse_hex4(unsigned& cp) {
    if (i + 4 > s.size()) {
      err = JsonError{"json_parse_error", "truncated \\u escape"};
      return false;
    }
    cp = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      cp <<= 4;
      if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
      else { err = JsonError{"json_parse_error", "invalid \\u escape"}; return false; }
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) {
      err = JsonError{"json_parse_error", "expected string"};
      return {};
    }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') {
          unsigned cp = 0;
          if (!parse_hex4(cp)) return {};
          // Surrogates must pair: high D800-DBFF followed by \uDC00-DFFF.
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            unsigned low = 0;
            if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
              err = JsonError{"json_parse_error", "unpaired surrogate in \\u escape"};
              return {};
            }
            i += 2;
            if (!parse_hex4(low)) return {};
            if (low < 0xDC00 || low > 0xDFFF) {
              err = JsonError{"json_parse_error", "unpaired surrogate in \\u escape"};
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            err = JsonError{"json_parse_error", "unpaired surrogate in \\u escape"};
            return {};
          }
          append_utf8(o, cp);
        }
        else o += n;
      } else {
        o += c;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      has_exp = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    std::string num_str = s.substr(start, i - start);
    try {
      if (has_frac || has_exp || num_str[0] == '-') {
        out_val = Value{std::stod(num_str)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num_str))};
      }
      return true;
    } catch (const std::exception& e) {
      err = JsonError{"json_parse_error", std::string("invalid number: ") + e.what()};
      return false;
    }
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    if (!err) err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Value parse_document() {
    auto v = parse_value();
    ws();
    if (!err && i != s.size()) err = JsonError{"json_parse_error", "trailing data"};
    return v;
  }
};

}  // namespace

// Fast path: most strings (ids, rule names) need no escaping.
std::string escape(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else                 o += c;
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) { if (!first) oss << ","; first = false; oss << "\"" << escape(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  p.parse_document();
  return p.err;
}

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (error) *error = p.err;
  if (p.err) return {};
  return to_json(v);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) {
    p.err = JsonError{"json_parse_error", "top-level value must be an object"};
  }
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(v.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

long long get_i64(const Object& obj, const std::string& key, long long def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (const auto* n = std::get_if<std::uint64_t>(&it->second.v)) {
    if (*n > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) return def;
    return static_cast<long long>(*n);
  }
  if (const auto* d = std::get_if<double>(&it->second.v)) {
    // 2^63 is exactly representable; anything at or past it does not fit.
    if (!(*d >= -9223372036854775808.0 && *d < 9223372036854775808.0)) return def;
    return static_cast<long long>(*d);
  }
  return def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::string>(v.v)) {
      out[k] = std::get<std::string>(v.v);
    } else if (!std::holds_alternative<Object>(v.v) && !std::holds_alternative<Array>(v.v)) {
      // Scalars are kept in their JSON spelling so rule conditions can compare them.
      out[k] = to_json(v);
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return nullptr;
  return &std::get<Object>(it->second.v);
}

const Array* get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return nullptr;
  return &std::get<Array>(it->second.v);
}

bool has_key(const Object& obj, const std::string& key) {
  return obj.contains(key);
}

}  // namespace tribunal::jsonlite
