#pragma once

// agentreplay/jsonlite.hpp: Minimal JSON value model, parser and writer.
//
// DESIGN:
//   Object is a std::map, so serialization emits keys in sorted order and two
//   payloads with the same content always serialize to the same bytes.
//   Integers keep their signedness: non-negative literals parse to uint64_t,
//   negative literals to int64_t, anything with a fraction or exponent to double.
//
// DETERMINISM GUARANTEES:
//   - to_json() is a pure function of the value.
//   - format_double() emits the shortest decimal form that reads back to the
//     same IEEE 754 double, so timestamps survive a save/load cycle bit-exact.
//
// COMPATIBILITY:
//   - \uXXXX escapes (including surrogate pairs) decode to UTF-8. Files written
//     with ASCII-only escaping load unchanged.
//   - Duplicate object keys are rejected (json_duplicate_key) unless the
//     caller asks for DuplicateKeys::last_wins.
//   - Nesting deeper than kMaxNestingDepth fails with json_parse_error instead
//     of exhausting the stack.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentreplay::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, std::int64_t, double,
               std::string, Object, Array>
      v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : Value(static_cast<long long>(i)) {}
  Value(long i) : Value(static_cast<long long>(i)) {}
  Value(long long i) {
    if (i < 0) v = static_cast<std::int64_t>(i);
    else v = static_cast<std::uint64_t>(i);
  }
  Value(unsigned i) : v(static_cast<std::uint64_t>(i)) {}
  Value(unsigned long i) : v(static_cast<std::uint64_t>(i)) {}
  Value(unsigned long long i) : v(static_cast<std::uint64_t>(i)) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) ||
           std::holds_alternative<std::int64_t>(v) ||
           std::holds_alternative<double>(v);
  }
};

struct JsonError {
  std::string code;
  std::string message;
};

// Structural equality. Numbers compare by value across integer/double kinds,
// so 1 and 1.0 are equal.
bool equal(const Value& a, const Value& b);
inline bool operator==(const Value& a, const Value& b) { return equal(a, b); }
inline bool operator!=(const Value& a, const Value& b) { return !equal(a, b); }

constexpr int kMaxNestingDepth = 512;

enum class DuplicateKeys {
  reject,     // json_duplicate_key; for content that gets hashed
  last_wins,  // later value replaces the earlier one
};

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error,
                  DuplicateKeys duplicates = DuplicateKeys::reject);

// Parse a JSON object. Returns an empty object on failure or when the text is
// a valid non-object value (reported as json_not_object).
Object parse(const std::string& text, std::optional<JsonError>* error,
             DuplicateKeys duplicates = DuplicateKeys::reject);

// Compact single-line serialization.
std::string to_json(const Value& v);
// Indented serialization for human-facing exports.
std::string to_json_pretty(const Value& v, int indent = 2);

std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. A missing key or a value of the wrong kind yields def.
const Value* find(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::optional<double> get_optional_double(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);

}  // namespace agentreplay::jsonlite
