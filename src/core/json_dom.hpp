#ifndef KBAKE_CORE_JSON_DOM_HPP_
#define KBAKE_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace kbake::core::json {

// Small STL-only DOM for reading tool self-reports (`kubectl version -o json`).
// Numbers keep their source text next to the parsed double so callers can
// apply their own integer rules.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  std::string number_text;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }

  // Returns the member named `key`, or nullptr when this is not an object or
  // the member is absent.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

// Recursive-descent parser. Diagnostics carry line/column of the failure.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, 0U, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ < input_.size()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    value = Value{};
    const char c = input_[pos_];
    switch (c) {
    case '{':
      value.type = Value::Type::kObject;
      return ParseObject(value.object_value, depth, error);
    case '[':
      value.type = Value::Type::kArray;
      return ParseArray(value.array_value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    default:
      break;
    }

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value, error);
    }
    if (ConsumeLiteral("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeLiteral("false")) {
      value.type = Value::Type::kBool;
      return true;
    }
    if (ConsumeLiteral("null")) {
      return true;
    }
    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value::Object& object, std::size_t depth, std::string& error) {
    Advance();  // '{'
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      if (Peek() != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!TryConsume(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1U, error)) {
        return false;
      }
      object[std::move(key)] = std::move(member);

      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ParseArray(Value::Array& array, std::size_t depth, std::string& error) {
    Advance();  // '['
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      array.push_back(std::move(item));

      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ParseString(std::string& out, std::string& error) {
    out.clear();
    Advance();  // opening quote

    while (pos_ < input_.size()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (pos_ >= input_.size()) {
        break;
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(out, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Decodes one \uXXXX escape into UTF-8. Surrogate pairs are not joined;
  // tool version documents never carry them.
  bool ParseUnicodeEscape(std::string& out, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    std::uint32_t code = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = Advance();
      code <<= 4U;
      if (h >= '0' && h <= '9') {
        code |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }

    if (code < 0x80U) {
      out.push_back(static_cast<char>(code));
    } else if (code < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(Value& value, std::string& error) {
    const std::size_t start = pos_;
    TryConsume('-');
    if (!TryConsume('0') && SkipDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (TryConsume('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (TryConsume('e') || TryConsume('E')) {
      if (!TryConsume('+')) {
        TryConsume('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    value.number_text = std::string(input_.substr(start, pos_ - start));
    char* end = nullptr;
    value.number_value = std::strtod(value.number_text.c_str(), &end);
    if (end == nullptr || *end != '\0') {
      return Fail("invalid number token", error);
    }
    return true;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Advance();
    }
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Advance();
      ++count;
    }
    return count;
  }

  bool ConsumeLiteral(std::string_view literal) {
    if (input_.substr(pos_, literal.size()) != literal) {
      return false;
    }
    for (std::size_t i = 0; i < literal.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool TryConsume(char expected) {
    if (pos_ >= input_.size() || input_[pos_] != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return pos_ < input_.size() ? input_[pos_] : '\0';
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace kbake::core::json

#endif // KBAKE_CORE_JSON_DOM_HPP_
