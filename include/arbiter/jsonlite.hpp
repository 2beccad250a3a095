#pragma once

// arbiter/jsonlite.hpp — Minimal JSON value model, strict parser and
// canonical serializer.
//
// DETERMINISM GUARANTEES:
//   - Objects are std::map, so serialization always emits sorted keys.
//   - Numbers: non-negative integers are kept as uint64_t; everything else
//     (negative integers, fractions, exponents) is a double and is formatted
//     with format_double(), which is locale independent and round-trips:
//     parse(to_json(x)) yields the same double bits.
//   - Duplicate keys are rejected at parse time (json_duplicate_key), so two
//     different texts cannot canonicalize to the same object by accident.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace arbiter::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  // Integers: non-negative values are uint64, negative values become double
  // (the same representation the parser produces).
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T i) {
    if constexpr (std::is_signed_v<T>) {
      if (i >= 0) v = static_cast<std::uint64_t>(i);
      else v = static_cast<double>(i);
    } else {
      v = static_cast<std::uint64_t>(i);
    }
  }
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) || std::holds_alternative<double>(v);
  }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }

  // Numeric view of uint64/double; nullopt for non-numbers.
  std::optional<double> as_number() const;
};

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

// Parse any JSON value. On error, returns null and fills *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parse a JSON object. On error (or non-object top level) returns {} and fills *error.
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

std::optional<JsonError> validate_strict(const std::string& text);

// Canonical serialization (sorted keys, no whitespace).
std::string to_json(const Value& v);
std::string to_json(const Object& o);

// Parse then re-serialize canonically. Returns "" on error.
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error = nullptr);

std::string format_double(double d);
std::string escape(const std::string& s);

// Type name used in diagnostics ("string", "number", ...).
std::string type_name(const Value& v);

// Structural equality on canonical form (1 == 1.0).
bool equal(const Value& a, const Value& b);

// Type-safe extractors
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

// Dotted-path lookup ("applicant.address.zip"). nullptr if any segment is missing.
const Value* find_path(const Object& obj, const std::string& dotted_path);

}  // namespace arbiter::jsonlite
