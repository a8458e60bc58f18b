#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace estimap {

// Minimal JSON value representation and parser, used for run configuration
// files and run reports.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects keep their keys in document order.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Append a member (objects only).
  void add(std::string key, JsonValue v);
};

const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

// Parse a complete document. Errors read "JSON parse error at line L, column C: ...".
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape a string for use inside a JSON string literal (without quotes).
std::string JsonEscape(const std::string& s);

// Pretty-printed serialization with deterministic formatting. Non-finite
// numbers are written as null.
std::string JsonStringify(const JsonValue& value, int indentSpaces = 2);

} // namespace estimap
