#pragma once

// strata/jsonlite.hpp — Minimal strict JSON for wire frames, cache archives
// and configuration.
//
// DETERMINISM GUARANTEES:
//   - to_json() emits canonical JSON: object keys sorted (std::map iteration),
//     no insignificant whitespace, doubles via format_double().
//   - Content references (revision, invocation, schema) are BLAKE3 digests of
//     this canonical form, so two peers that agree on a value agree on its hash.
//
// NUMBERS:
//   Non-negative integers are held as uint64, negative integers as int64
//   (e.g. the unclaimed since=-1), everything else as double. The Value
//   constructors normalize the same way so a parsed 7 and a constructed 7
//   serialize and compare identically.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, std::int64_t,
               double, Object, Array>
      v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(int n) : Value(static_cast<std::int64_t>(n)) {}
  Value(unsigned n) : v(static_cast<std::uint64_t>(n)) {}
  Value(std::uint64_t n) : v(n) {}
  Value(std::int64_t n) {
    if (n >= 0) v = static_cast<std::uint64_t>(n);
    else v = n;
  }
  Value(double d) : v(d) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
};

// Parse a complete document. Trailing data, duplicate keys, NaN/Infinity are
// rejected. On error returns null and fills *error when given.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);

// Structural equality through the canonical form.
bool equal(const Value& a, const Value& b);

// Type-safe extractors. Missing keys and type mismatches yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
long long get_i64(const Object& obj, const std::string& key, long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// Borrowing accessors. Return nullptr when the key is missing or of another type.
const Value* find(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);
const Object* as_object(const Value& v);
const Array* as_array(const Value& v);

std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace strata::jsonlite
