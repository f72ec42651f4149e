#include "agentreplay/jsonlite.hpp"

// Architecture notes on jsonlite:
//
// DETERMINISM GUARANTEES:
//   - to_json() iterates std::map, so object keys are always emitted sorted.
//   - format_double() tries %.15g, %.16g, %.17g in order and keeps the first
//     form that strtod() reads back bit-exact. The result is the shortest
//     round-trippable decimal for every finite IEEE 754 double.
//   - snprintf digit output does not depend on the locale for the C locale
//     the engine runs under.
//
// DETERMINISM RISKS:
//   - std::strtod() is locale-sensitive. The CLI never calls setlocale(), so
//     the "C" locale applies and '.' is the decimal separator.

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace agentreplay::jsonlite {

namespace {

void append_utf8(std::string& out, std::uint32_t cp) {
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

struct Parser {
  const std::string& s;
  DuplicateKeys duplicates{DuplicateKeys::reject};
  size_t i{0};
  int depth{0};
  std::optional<JsonError> err;

  // Guards the recursive descent; false once the limit is hit.
  bool enter() {
    if (++depth > kMaxNestingDepth) {
      err = JsonError{"json_parse_error", "nesting too deep"};
      return false;
    }
    return true;
  }

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool parse_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (size_t k = 0; k < 4; ++k) {
      const char c = s[i + k];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    i += 4;
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      if (n == 'n') o += '\n';
      else if (n == 't') o += '\t';
      else if (n == 'r') o += '\r';
      else if (n == 'b') o += '\b';
      else if (n == 'f') o += '\f';
      else if (n == 'u') {
        std::uint32_t cp = 0;
        if (!parse_hex4(cp)) { err = JsonError{"json_parse_error", "invalid \\u escape"}; return {}; }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate: a low surrogate must follow.
          std::uint32_t lo = 0;
          if (i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            if (!parse_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              err = JsonError{"json_parse_error", "invalid surrogate pair"};
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else {
            cp = 0xFFFD;
          }
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          cp = 0xFFFD;
        }
        append_utf8(o, cp);
      }
      else o += n;
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

    bool negative = false;
    if (i < s.size() && s[i] == '-') { negative = true; ++i; }

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

    const std::string num_str = s.substr(start, i - start);
    const char* begin = num_str.c_str();
    char* end = nullptr;

    if (!has_frac && !has_exp) {
      errno = 0;
      if (negative) {
        const long long n = std::strtoll(begin, &end, 10);
        if (errno == 0 && end && *end == '\0') { out_val = Value{n}; return true; }
      } else {
        const unsigned long long n = std::strtoull(begin, &end, 10);
        if (errno == 0 && end && *end == '\0') { out_val = Value{n}; return true; }
      }
      // Out of 64-bit range: fall through to double.
    }
    const double d = std::strtod(begin, &end);
    if (!end || *end != '\0') {
      err = JsonError{"json_parse_error", "invalid number"};
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (!enter()) return {};
      Value nested = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return nested;
    }
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
      if (duplicates == DuplicateKeys::reject && out.count(k)) {
        err = JsonError{"json_duplicate_key", "duplicate key: " + k};
        break;
      }
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
};

// Fast path for strings with no escape characters (the common case): the
// pre-scan returns the input untouched.
std::string escape_inner(const std::string& s) {
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

bool numeric_value(const Value& v, long double& out) {
  if (std::holds_alternative<std::uint64_t>(v.v)) { out = static_cast<long double>(std::get<std::uint64_t>(v.v)); return true; }
  if (std::holds_alternative<std::int64_t>(v.v)) { out = static_cast<long double>(std::get<std::int64_t>(v.v)); return true; }
  if (std::holds_alternative<double>(v.v)) { out = static_cast<long double>(std::get<double>(v.v)); return true; }
  return false;
}

void write_json(std::ostringstream& oss, const Value& v, int indent, int depth);

void newline(std::ostringstream& oss, int indent, int depth) {
  if (indent <= 0) return;
  oss << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
}

void write_json(std::ostringstream& oss, const Value& v, int indent, int depth) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) { oss << "null"; return; }
  if (std::holds_alternative<bool>(v.v)) { oss << (std::get<bool>(v.v) ? "true" : "false"); return; }
  if (std::holds_alternative<std::string>(v.v)) { oss << '"' << escape_inner(std::get<std::string>(v.v)) << '"'; return; }
  if (std::holds_alternative<std::uint64_t>(v.v)) { oss << std::get<std::uint64_t>(v.v); return; }
  if (std::holds_alternative<std::int64_t>(v.v)) { oss << std::get<std::int64_t>(v.v); return; }
  if (std::holds_alternative<double>(v.v)) { oss << format_double(std::get<double>(v.v)); return; }
  const char* sep = indent > 0 ? ": " : ":";
  if (std::holds_alternative<Object>(v.v)) {
    const auto& obj = std::get<Object>(v.v);
    if (obj.empty()) { oss << "{}"; return; }
    oss << '{';
    bool first = true;
    for (const auto& [k, vv] : obj) {
      if (!first) oss << ',';
      first = false;
      newline(oss, indent, depth + 1);
      oss << '"' << escape_inner(k) << '"' << sep;
      write_json(oss, vv, indent, depth + 1);
    }
    newline(oss, indent, depth);
    oss << '}';
    return;
  }
  const auto& arr = std::get<Array>(v.v);
  if (arr.empty()) { oss << "[]"; return; }
  oss << '[';
  bool first = true;
  for (const auto& vv : arr) {
    if (!first) oss << ',';
    first = false;
    newline(oss, indent, depth + 1);
    write_json(oss, vv, indent, depth + 1);
  }
  newline(oss, indent, depth);
  oss << ']';
}

}  // namespace

bool equal(const Value& a, const Value& b) {
  long double na = 0, nb = 0;
  if (numeric_value(a, na) && numeric_value(b, nb)) return na == nb;
  if (a.v.index() != b.v.index()) return false;
  if (a.is_null()) return true;
  if (std::holds_alternative<bool>(a.v)) return std::get<bool>(a.v) == std::get<bool>(b.v);
  if (a.is_string()) return std::get<std::string>(a.v) == std::get<std::string>(b.v);
  if (a.is_object()) {
    const auto& oa = std::get<Object>(a.v);
    const auto& ob = std::get<Object>(b.v);
    if (oa.size() != ob.size()) return false;
    auto ia = oa.begin();
    auto ib = ob.begin();
    for (; ia != oa.end(); ++ia, ++ib) {
      if (ia->first != ib->first || !equal(ia->second, ib->second)) return false;
    }
    return true;
  }
  const auto& xa = std::get<Array>(a.v);
  const auto& xb = std::get<Array>(b.v);
  if (xa.size() != xb.size()) return false;
  for (size_t k = 0; k < xa.size(); ++k) {
    if (!equal(xa[k], xb[k])) return false;
  }
  return true;
}

std::string format_double(double d) {
  if (!std::isfinite(d)) return "null";
  char buf[64];
  int n = 0;
  for (int precision = 15; precision <= 17; ++precision) {
    n = std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
    if (std::strtod(buf, nullptr) == d) break;
  }
  std::string result(buf, static_cast<size_t>(n));
  // Keep the value recognisably a double on the next parse.
  if (result.find_first_of(".eE") == std::string::npos) result += ".0";
  return result;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error,
                  DuplicateKeys duplicates) {
  Parser p{text, duplicates};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error,
             DuplicateKeys duplicates) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err, duplicates);
  if (!err && !v.is_object()) err = JsonError{"json_not_object", "top-level value is not an object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string to_json(const Value& v) {
  std::ostringstream oss;
  write_json(oss, v, 0, 0);
  return oss.str();
}

std::string to_json_pretty(const Value& v, int indent) {
  std::ostringstream oss;
  write_json(oss, v, indent, 0);
  return oss.str();
}

std::string escape(const std::string& s) { return escape_inner(s); }

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
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
double get_double(const Object& obj, const std::string& key, double def) {
  return get_optional_double(obj, key).value_or(def);
}
std::optional<double> get_optional_double(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  long double n = 0;
  if (!numeric_value(it->second, n)) return std::nullopt;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  return static_cast<double>(n);
}
Object get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return {};
  return std::get<Object>(it->second.v);
}

}  // namespace agentreplay::jsonlite
