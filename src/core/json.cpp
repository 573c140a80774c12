// core/json.cpp - Minimal JSON implementation
#include "json.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace uuidfix {
namespace json {

Value Value::array() {
  Value v;
  v.type_ = Type::Array;
  return v;
}

Value Value::object() {
  Value v;
  v.type_ = Type::Object;
  return v;
}

Value &Value::operator[](const std::string &key) {
  if (type_ == Type::Null) {
    type_ = Type::Object;
  }
  for (auto &member : members_) {
    if (member.first == key) {
      return member.second;
    }
  }
  members_.emplace_back(key, Value());
  return members_.back().second;
}

const Value *Value::find(const std::string &key) const {
  if (type_ != Type::Object) {
    return nullptr;
  }
  for (const auto &member : members_) {
    if (member.first == key) {
      return &member.second;
    }
  }
  return nullptr;
}

void Value::push_back(Value v) {
  if (type_ == Type::Null) {
    type_ = Type::Array;
  }
  items_.push_back(std::move(v));
}

size_t Value::size() const {
  if (type_ == Type::Array)
    return items_.size();
  if (type_ == Type::Object)
    return members_.size();
  return 0;
}

namespace {

constexpr int MAX_DEPTH = 256;

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Value parse_document() {
    skip_ws();
    Value v = parse_value(0);
    skip_ws();
    if (pos_ != text_.size()) {
      fail("Trailing characters");
    }
    return v;
  }

private:
  [[noreturn]] void fail(const std::string &message) const {
    throw ParseError(message, pos_);
  }

  void skip_ws() {
    while (pos_ < text_.size()) {
      char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
        break;
      ++pos_;
    }
  }

  bool consume_literal(const char *literal) {
    size_t len = std::char_traits<char>::length(literal);
    if (text_.compare(pos_, len, literal) == 0) {
      pos_ += len;
      return true;
    }
    return false;
  }

  Value parse_value(int depth) {
    if (depth > MAX_DEPTH) {
      fail("Nesting too deep");
    }
    if (pos_ >= text_.size()) {
      fail("Unexpected end of input");
    }

    char c = text_[pos_];
    if (c == '{')
      return parse_object(depth);
    if (c == '[')
      return parse_array(depth);
    if (c == '"')
      return Value(parse_string());
    if (c == '-' || (c >= '0' && c <= '9'))
      return Value(parse_number());
    if (consume_literal("true"))
      return Value(true);
    if (consume_literal("false"))
      return Value(false);
    if (consume_literal("null"))
      return Value();

    fail("Unexpected character");
  }

  Value parse_object(int depth) {
    Value obj = Value::object();
    ++pos_; // '{'
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return obj;
    }

    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        fail("Expected object key");
      }
      std::string key = parse_string();
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        fail("Expected ':'");
      }
      ++pos_;
      skip_ws();
      obj[key] = parse_value(depth + 1);
      skip_ws();

      if (pos_ >= text_.size()) {
        fail("Unterminated object");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return obj;
      }
      fail("Expected ',' or '}'");
    }
  }

  Value parse_array(int depth) {
    Value arr = Value::array();
    ++pos_; // '['
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return arr;
    }

    while (true) {
      skip_ws();
      arr.push_back(parse_value(depth + 1));
      skip_ws();

      if (pos_ >= text_.size()) {
        fail("Unterminated array");
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return arr;
      }
      fail("Expected ',' or ']'");
    }
  }

  unsigned parse_hex4() {
    if (pos_ + 4 > text_.size()) {
      fail("Truncated \\u escape");
    }
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
      char h = text_[pos_++];
      code <<= 4;
      if (h >= '0' && h <= '9')
        code |= static_cast<unsigned>(h - '0');
      else if (h >= 'a' && h <= 'f')
        code |= static_cast<unsigned>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F')
        code |= static_cast<unsigned>(h - 'A' + 10);
      else
        fail("Invalid \\u escape");
    }
    return code;
  }

  static void append_utf8(std::string &out, unsigned cp) {
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

  std::string parse_string() {
    ++pos_; // opening quote
    std::string out;
    while (true) {
      if (pos_ >= text_.size()) {
        fail("Unterminated string");
      }
      char c = text_[pos_++];
      if (c == '"') {
        return out;
      }
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("Control character in string");
      }
      if (c != '\\') {
        out += c;
        continue;
      }

      if (pos_ >= text_.size()) {
        fail("Unterminated escape");
      }
      char e = text_[pos_++];
      switch (e) {
      case '"':
        out += '"';
        break;
      case '\\':
        out += '\\';
        break;
      case '/':
        out += '/';
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u': {
        unsigned cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          if (!consume_literal("\\u")) {
            fail("Unpaired surrogate");
          }
          unsigned low = parse_hex4();
          if (low < 0xDC00 || low > 0xDFFF) {
            fail("Invalid low surrogate");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          fail("Unpaired surrogate");
        }
        append_utf8(out, cp);
        break;
      }
      default:
        fail("Invalid escape");
      }
    }
  }

  double parse_number() {
    size_t start = pos_;
    if (text_[pos_] == '-')
      ++pos_;
    auto digits = [this]() {
      size_t from = pos_;
      while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9')
        ++pos_;
      return pos_ - from;
    };

    if (digits() == 0) {
      fail("Invalid number");
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (digits() == 0)
        fail("Invalid fraction");
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-'))
        ++pos_;
      if (digits() == 0)
        fail("Invalid exponent");
    }

    std::string literal = text_.substr(start, pos_ - start);
    return std::strtod(literal.c_str(), nullptr);
  }

  const std::string &text_;
  size_t pos_ = 0;
};

void write_value(std::ostringstream &out, const Value &value, int indent,
                 int depth) {
  auto newline = [&](int level) {
    if (indent < 0)
      return;
    out << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
  };

  switch (value.type()) {
  case Value::Type::Null:
    out << "null";
    break;
  case Value::Type::Bool:
    out << (value.as_bool() ? "true" : "false");
    break;
  case Value::Type::Number: {
    double n = value.as_number();
    if (!std::isfinite(n)) {
      out << "null";
    } else if (n == std::floor(n) && std::fabs(n) < 1e15) {
      out << static_cast<long long>(n);
    } else {
      char buf[32];
      snprintf(buf, sizeof(buf), "%.17g", n);
      out << buf;
    }
    break;
  }
  case Value::Type::String:
    out << '"' << escape(value.as_string()) << '"';
    break;
  case Value::Type::Array: {
    if (value.items().empty()) {
      out << "[]";
      break;
    }
    out << '[';
    for (size_t i = 0; i < value.items().size(); ++i) {
      if (i > 0)
        out << ',';
      newline(depth + 1);
      write_value(out, value.items()[i], indent, depth + 1);
    }
    newline(depth);
    out << ']';
    break;
  }
  case Value::Type::Object: {
    if (value.members().empty()) {
      out << "{}";
      break;
    }
    out << '{';
    for (size_t i = 0; i < value.members().size(); ++i) {
      if (i > 0)
        out << ',';
      newline(depth + 1);
      const auto &member = value.members()[i];
      out << '"' << escape(member.first) << '"' << (indent < 0 ? ":" : ": ");
      write_value(out, member.second, indent, depth + 1);
    }
    newline(depth);
    out << '}';
    break;
  }
  }
}

} // namespace

Value parse(const std::string &text) { return Parser(text).parse_document(); }

std::string dump(const Value &value, int indent) {
  std::ostringstream out;
  write_value(out, value, indent, 0);
  return out.str();
}

std::string escape(const std::string &s) {
  std::ostringstream o;
  for (char c : s) {
    if (c == '"')
      o << "\\\"";
    else if (c == '\\')
      o << "\\\\";
    else if (c == '\b')
      o << "\\b";
    else if (c == '\f')
      o << "\\f";
    else if (c == '\n')
      o << "\\n";
    else if (c == '\r')
      o << "\\r";
    else if (c == '\t')
      o << "\\t";
    else if ((unsigned char)c < 0x20) {
      char buf[7];
      snprintf(buf, sizeof(buf), "\\u%04x", c);
      o << buf;
    } else
      o << c;
  }
  return o.str();
}

} // namespace json
} // namespace uuidfix
