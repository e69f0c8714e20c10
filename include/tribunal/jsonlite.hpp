#pragma once

// tribunal/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// Used for case files, configuration files and the JSON projections of the
// domain types. Objects are std::map so serialized output has sorted keys.
//
// Numbers: non-negative integers are stored as uint64, everything else
// (fractions, exponents, negative integers) as double.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tribunal::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;
};

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parse a document whose top level must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys or mismatched types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
long long get_i64(const Object& obj, const std::string& key, long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);

}  // namespace tribunal::jsonlite
