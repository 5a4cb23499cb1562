#pragma once

// warden/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for the policy wire form, encoded capability tokens, configuration
// files and audit event rendering. Objects are std::map so serialization is
// key-sorted and therefore canonical: the same Value always renders to the
// same bytes, which the token digest and the audit chain depend on.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key" | "json_too_deep"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Nesting limit for arrays/objects. Deeper input is rejected, not truncated.
constexpr std::size_t kMaxDepth = 64;

// Parse any JSON value. On failure *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Non-object input is an error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing key or wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);

const Array* get_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);

// Numeric view of a Value: u64 and double both convert. nullopt otherwise.
std::optional<double> as_number(const Value& v);

}  // namespace warden::jsonlite
