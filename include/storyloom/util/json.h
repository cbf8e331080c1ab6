#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace storyloom::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// JSON document node: null, bool, number, string, array or object.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
  bool is_bool() const { return std::holds_alternative<bool>(*this); }
  bool is_number() const { return std::holds_alternative<double>(*this); }
  bool is_string() const { return std::holds_alternative<std::string>(*this); }
  bool is_array() const { return std::holds_alternative<Array>(*this); }
  bool is_object() const { return std::holds_alternative<Object>(*this); }

  const Array* as_array() const { return std::get_if<Array>(this); }
  const Object* as_object() const { return std::get_if<Object>(this); }

  // Member lookup on an object. Returns nullptr when this is not an object or
  // the key is absent.
  const Value* find(const std::string& key) const;

  // Throws std::runtime_error if not an object / key missing.
  const Value& at(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document. Errors carry line/column information.
Value parse(const std::string& text);

// Serialize with object keys sorted so identical trees produce identical text.
// Non-finite numbers are written as null.
std::string stringify(const Value& v, int indent = 2);

// Convenience accessors for optional object members.
double number_or(const Object& o, const std::string& key, double def);
std::int64_t int_or(const Object& o, const std::string& key, std::int64_t def);
bool bool_or(const Object& o, const std::string& key, bool def);
std::string string_or(const Object& o, const std::string& key, const std::string& def = "");

} // namespace storyloom::json
