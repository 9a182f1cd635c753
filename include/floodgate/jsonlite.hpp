#pragma once

// floodgate/jsonlite.hpp - Minimal JSON value model, strict parser and
// deterministic serializer used for journal indexes, key index entries,
// markers and configuration documents.
//
// DETERMINISM GUARANTEES:
//   - Object keys serialize in sorted order (std::map iteration).
//   - Integers are unsigned 64-bit and serialize without a fraction.
//   - Duplicate keys are rejected with "json_duplicate_key".

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace floodgate::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

std::optional<JsonError> validate_strict(const std::string& text);

// Parse a JSON object. On error returns an empty object and sets *error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);

// Type-safe extractors. Missing or mistyped keys yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

Value make_string_map(const std::map<std::string, std::string>& m);

std::string escape(const std::string& s);

}  // namespace floodgate::jsonlite
