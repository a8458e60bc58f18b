#include "estimap/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace estimap {

JsonValue JsonValue::MakeNull()
{
  JsonValue v;
  v.type = Type::Null;
  return v;
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

void JsonValue::add(std::string key, JsonValue v)
{
  objectValue.emplace_back(std::move(key), std::move(v));
}

const char* JsonTypeName(JsonValue::Type t)
{
  switch (t) {
  case JsonValue::Type::Null: return "null";
  case JsonValue::Type::Bool: return "boolean";
  case JsonValue::Type::Number: return "number";
  case JsonValue::Type::String: return "string";
  case JsonValue::Type::Array: return "array";
  case JsonValue::Type::Object: return "object";
  default: return "unknown";
  }
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  std::ostringstream oss;
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': oss << "\\\\"; break;
    case '"': oss << "\\\""; break;
    case '\b': oss << "\\b"; break;
    case '\f': oss << "\\f"; break;
    case '\n': oss << "\\n"; break;
    case '\r': oss << "\\r"; break;
    case '\t': oss << "\\t"; break;
    default:
      if (ch < 0x20) {
        static const char* hex = "0123456789abcdef";
        oss << "\\u00" << hex[(ch >> 4) & 0xF] << hex[ch & 0xF];
      } else {
        oss << static_cast<char>(ch);
      }
      break;
    }
  }
  return oss.str();
}

namespace {

struct Parser {
  const std::string& s;
  std::size_t i = 0;
  std::string err;

  explicit Parser(const std::string& str) : s(str) {}

  void skipWs()
  {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < i && k < s.size(); ++k) {
      if (s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream oss;
    oss << "JSON parse error at line " << line << ", column " << col << ": " << msg;
    err = oss.str();
    return false;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > 64) return fail("nesting too deep");
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue::MakeNull(), out);
    if (c == 't') return parseLiteral("true", JsonValue::MakeBool(true), out);
    if (c == 'f') return parseLiteral("false", JsonValue::MakeBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[') return parseArray(out, depth);
    if (c == '{') return parseObject(out, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseLiteral(const char* word, JsonValue value, JsonValue& out)
  {
    const std::string w(word);
    if (s.compare(i, w.size(), w) != 0) return fail("expected '" + w + "'");
    i += w.size();
    out = std::move(value);
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    if (peek() == '-') ++i;

    if (peek() == '0') {
      ++i;
    } else {
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == '.') {
      ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit after '.'");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected exponent digits");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno != 0 || end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  static void AppendUtf8(std::string& out, unsigned int cp)
  {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool parseString(std::string& out)
  {
    skipWs();
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        if (i + 4 > s.size()) return fail("invalid \\u escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
          const char h = s[i++];
          code <<= 4;
          if (h >= '0' && h <= '9') code |= static_cast<unsigned int>(h - '0');
          else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned int>(h - 'a' + 10);
          else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned int>(h - 'A' + 10);
          else return fail("invalid hex digit in \\u escape");
        }
        // Paths and rule text are BMP-only; surrogate pairs are not combined.
        AppendUtf8(result, code);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    if (!consume('[')) return fail("expected '['");

    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v, depth + 1)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out, int depth)
  {
    if (!consume('{')) return fail("expected '{'");

    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
      std::string key;
      if (!parseString(key)) return false;
      if (FindJsonMember(obj, key)) return fail("duplicate key '" + key + "'");

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val, depth + 1)) return false;
      obj.add(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }
};

void Indent(std::ostringstream& oss, int n)
{
  for (int i = 0; i < n; ++i) oss << ' ';
}

void WriteValue(std::ostringstream& oss, const JsonValue& v, int indent, int depth)
{
  switch (v.type) {
  case JsonValue::Type::Null: oss << "null"; break;
  case JsonValue::Type::Bool: oss << (v.boolValue ? "true" : "false"); break;
  case JsonValue::Type::Number:
    if (std::isfinite(v.numberValue)) {
      oss << std::setprecision(17) << v.numberValue;
    } else {
      oss << "null";
    }
    break;
  case JsonValue::Type::String: oss << '"' << JsonEscape(v.stringValue) << '"'; break;
  case JsonValue::Type::Array:
    if (v.arrayValue.empty()) {
      oss << "[]";
      break;
    }
    oss << "[\n";
    for (std::size_t k = 0; k < v.arrayValue.size(); ++k) {
      Indent(oss, indent * (depth + 1));
      WriteValue(oss, v.arrayValue[k], indent, depth + 1);
      if (k + 1 < v.arrayValue.size()) oss << ",";
      oss << "\n";
    }
    Indent(oss, indent * depth);
    oss << "]";
    break;
  case JsonValue::Type::Object:
    if (v.objectValue.empty()) {
      oss << "{}";
      break;
    }
    oss << "{\n";
    for (std::size_t k = 0; k < v.objectValue.size(); ++k) {
      Indent(oss, indent * (depth + 1));
      oss << '"' << JsonEscape(v.objectValue[k].first) << "\": ";
      WriteValue(oss, v.objectValue[k].second, indent, depth + 1);
      if (k + 1 < v.objectValue.size()) oss << ",";
      oss << "\n";
    }
    Indent(oss, indent * depth);
    oss << "}";
    break;
  }
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v, 0)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    p.fail("trailing characters");
    outError = p.err;
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, int indentSpaces)
{
  std::ostringstream oss;
  WriteValue(oss, value, indentSpaces < 0 ? 0 : indentSpaces, 0);
  oss << "\n";
  return oss.str();
}

} // namespace estimap
