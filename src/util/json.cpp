#include "storyloom/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace storyloom::json {
namespace {

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {
    // Tolerate a UTF-8 byte order mark.
    if (s_.size() >= 3 && static_cast<unsigned char>(s_[0]) == 0xEF &&
        static_cast<unsigned char>(s_[1]) == 0xBB && static_cast<unsigned char>(s_[2]) == 0xBF) {
      pos_ = 3;
    }
  }

  Value document() {
    Value v = value();
    skip_ws();
    if (pos_ != s_.size()) fail("trailing characters after document");
    return v;
  }

 private:
  const std::string& s_;
  std::size_t pos_{0};

  char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
  char take() { return pos_ < s_.size() ? s_[pos_++] : '\0'; }

  void skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  }

  [[noreturn]] void fail(const std::string& what) const {
    int line = 1;
    int col = 1;
    const std::size_t end = std::min(pos_, s_.size());
    for (std::size_t k = 0; k < end; ++k) {
      if (s_[k] == '\n') {
        ++line;
        col = 1;
      } else if (s_[k] != '\r') {
        ++col;
      }
    }
    std::ostringstream ss;
    ss << "JSON parse error (line " << line << ", col " << col << "): " << what;
    throw std::runtime_error(ss.str());
  }

  void expect(char c) {
    skip_ws();
    if (take() != c) fail(std::string("expected '") + c + "'");
  }

  bool accept(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  Value value() {
    skip_ws();
    switch (peek()) {
      case 'n': return literal("null", nullptr);
      case 't': return literal("true", true);
      case 'f': return literal("false", false);
      case '"': return string();
      case '[': return array();
      case '{': return object();
      default: break;
    }
    const char c = peek();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return number();
    fail("unexpected character");
  }

  Value literal(const char* word, Value v) {
    for (const char* p = word; *p; ++p) {
      if (take() != *p) fail("invalid literal");
    }
    return v;
  }

  void digits() {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
  }

  Value number() {
    const std::size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (peek() == '0') {
      ++pos_;
    } else {
      digits();
    }
    if (peek() == '.') {
      ++pos_;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      digits();
    }
    std::istringstream in(s_.substr(start, pos_ - start));
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    if (in.fail()) fail("number out of range");
    return d;
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = take();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string raw_string() {
    expect('"');
    std::string out;
    for (;;) {
      if (pos_ >= s_.size()) fail("unterminated string");
      const char c = take();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = take();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          std::uint32_t cp = hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (take() != '\\' || take() != 'u') fail("expected low surrogate");
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + ((cp - 0xD800u) << 10u) + (lo - 0xDC00u);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unexpected low surrogate");
          }
          put_utf8(cp, out);
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value string() { return raw_string(); }

  Value array() {
    expect('[');
    Array out;
    if (accept(']')) return out;
    do {
      out.push_back(value());
    } while (accept(','));
    expect(']');
    return out;
  }

  Value object() {
    expect('{');
    Object out;
    if (accept('}')) return out;
    do {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = raw_string();
      expect(':');
      out[std::move(key)] = value();
    } while (accept(','));
    expect('}');
    return out;
  }
};

void write_escaped(const std::string& in, std::string& out) {
  out.push_back('"');
  for (const char c : in) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

void write_number(double d, std::string& out) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  if (d == std::floor(d) && std::fabs(d) < 9.0e15) {
    out += std::to_string(static_cast<long long>(d));
    return;
  }
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss.precision(17);
  ss << d;
  out += ss.str();
}

void write_value(const Value& v, std::string& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out.push_back('\n');
    out.append(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out += "null";
  } else if (v.is_bool()) {
    out += std::get<bool>(v) ? "true" : "false";
  } else if (v.is_number()) {
    write_number(std::get<double>(v), out);
  } else if (v.is_string()) {
    write_escaped(std::get<std::string>(v), out);
  } else if (const Array* a = v.as_array()) {
    out.push_back('[');
    for (std::size_t k = 0; k < a->size(); ++k) {
      if (k) out.push_back(',');
      newline(depth + 1);
      write_value((*a)[k], out, indent, depth + 1);
    }
    if (!a->empty()) newline(depth);
    out.push_back(']');
  } else {
    const Object& o = std::get<Object>(v);
    std::vector<const Object::value_type*> members;
    members.reserve(o.size());
    for (const auto& kv : o) members.push_back(&kv);
    std::sort(members.begin(), members.end(),
              [](const auto* l, const auto* r) { return l->first < r->first; });

    out.push_back('{');
    for (std::size_t k = 0; k < members.size(); ++k) {
      if (k) out.push_back(',');
      newline(depth + 1);
      write_escaped(members[k]->first, out);
      out += indent > 0 ? ": " : ":";
      write_value(members[k]->second, out, indent, depth + 1);
    }
    if (!members.empty()) newline(depth);
    out.push_back('}');
  }
}

} // namespace

const Value* Value::find(const std::string& key) const {
  const Object* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

const Value& Value::at(const std::string& key) const {
  if (!is_object()) throw std::runtime_error("JSON value is not an object");
  const Value* v = find(key);
  if (!v) throw std::runtime_error("JSON object missing key: " + key);
  return *v;
}

bool Value::bool_value(bool def) const {
  if (const auto* p = std::get_if<bool>(this)) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (const auto* p = std::get_if<double>(this)) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const auto* p = std::get_if<double>(this);
  if (!p || !std::isfinite(*p)) return def;
  return static_cast<std::int64_t>(*p);
}

std::string Value::string_value(const std::string& def) const {
  if (const auto* p = std::get_if<std::string>(this)) return *p;
  return def;
}

const Object& Value::object() const {
  if (const Object* o = as_object()) return *o;
  throw std::runtime_error("JSON value is not an object");
}

const Array& Value::array() const {
  if (const Array* a = as_array()) return *a;
  throw std::runtime_error("JSON value is not an array");
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  std::string out;
  write_value(v, out, indent, 0);
  return out;
}

double number_or(const Object& o, const std::string& key, double def) {
  const auto it = o.find(key);
  return it == o.end() ? def : it->second.number_value(def);
}

std::int64_t int_or(const Object& o, const std::string& key, std::int64_t def) {
  const auto it = o.find(key);
  return it == o.end() ? def : it->second.int_value(def);
}

bool bool_or(const Object& o, const std::string& key, bool def) {
  const auto it = o.find(key);
  return it == o.end() ? def : it->second.bool_value(def);
}

std::string string_or(const Object& o, const std::string& key, const std::string& def) {
  const auto it = o.find(key);
  return it == o.end() ? def : it->second.string_value(def);
}

} // namespace storyloom::json
