// core/json.hpp - Minimal JSON value, parser and serializer
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace uuidfix {
namespace json {

// Strict JSON (no comments, no trailing commas). Numbers are doubles and
// objects keep their member order.
class Value {
public:
  enum class Type { Null, Bool, Number, String, Array, Object };

  Value() = default;
  Value(bool b) : type_(Type::Bool), bool_(b) {}
  Value(int n) : type_(Type::Number), number_(n) {}
  Value(double n) : type_(Type::Number), number_(n) {}
  Value(const char *s) : type_(Type::String), string_(s) {}
  Value(std::string s) : type_(Type::String), string_(std::move(s)) {}

  static Value array();
  static Value object();

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_number() const { return type_ == Type::Number; }
  bool is_string() const { return type_ == Type::String; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_object() const { return type_ == Type::Object; }

  bool as_bool() const { return bool_; }
  double as_number() const { return number_; }
  const std::string &as_string() const { return string_; }
  const std::vector<Value> &items() const { return items_; }
  const std::vector<std::pair<std::string, Value>> &members() const {
    return members_;
  }

  // Object access; inserts a null member if missing. Turns a null value
  // into an object.
  Value &operator[](const std::string &key);
  const Value *find(const std::string &key) const;

  // Array append. Turns a null value into an array.
  void push_back(Value v);

  size_t size() const;

private:
  Type type_ = Type::Null;
  bool bool_ = false;
  double number_ = 0.0;
  std::string string_;
  std::vector<Value> items_;
  std::vector<std::pair<std::string, Value>> members_;
};

class ParseError : public std::runtime_error {
public:
  ParseError(const std::string &message, size_t offset)
      : std::runtime_error(message + " at offset " + std::to_string(offset)),
        offset_(offset) {}

  size_t offset() const { return offset_; }

private:
  size_t offset_;
};

// Throws ParseError on malformed input.
Value parse(const std::string &text);

// indent < 0 produces compact output.
std::string dump(const Value &value, int indent = -1);

std::string escape(const std::string &s);

} // namespace json
} // namespace uuidfix
