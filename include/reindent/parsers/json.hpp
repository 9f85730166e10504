// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json.hpp
/// \brief Single-header JSON value, parser, and serializer for Reindent.
///
/// Features
/// --------
/// - Header-only, C++17, no third-party deps
/// - DOM-like \c Json value: null, bool, int64, double, string, array, object
/// - Objects keep member insertion order (\c OrderedMap); duplicate keys keep
///   the first position and the last value
/// - Numbers that do not fit int64 or double keep their literal text, so
///   re-serialization never rounds them
/// - Strict RFC 8259 parser with line/column error reporting, no exceptions
///   by default; optional throwing parse (parseOrThrow)
/// - Serializer with pretty-printing, arbitrary indent unit and key sorting;
///   non-ASCII text is written literally
///

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace reindent
{
namespace parsers
{
/// \brief JSON type tags. Order matches the alternatives of Json's variant.
enum class JsonType
{
  Null,
  Boolean,
  Int,
  Double,
  String,
  Array,
  Object,
  RawNumber
};

/// \brief Location of a parse error in the source text.
struct JsonLocation
{
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
};

/// \brief Error information produced by the parser.
struct JsonError
{
  std::string message;
  JsonLocation where;
};

/// \brief Parse limits to prevent resource exhaustion.
struct ParseLimits
{
  std::size_t depthMax{512};                 ///< Maximum nesting depth
  std::size_t stringLengthMax{64u << 20};    ///< Maximum decoded string length
  std::size_t membersMax{1u << 24};          ///< Maximum object members
  std::size_t arrayItemsMax{1u << 24};       ///< Maximum array elements
};

/// \brief Serialization options.
struct SerializeOptions
{
  bool pretty{false};       ///< One member per line, indented by depth
  bool sortKeys{false};     ///< Sort object keys by byte value
  std::string indent{"  "}; ///< Indent unit for pretty printing (may be empty)
};

/// \brief Literal text of a number outside the int64/double range.
struct RawNumber
{
  std::string text;

  bool operator==(const RawNumber &other) const { return text == other.text; }
};

/// \brief Insertion-ordered string-keyed map used for JSON objects.
template <typename V> class OrderedMap
{
public:
  using value_type = std::pair<std::string, V>;
  using container_type = std::vector<value_type>;
  using iterator = typename container_type::iterator;
  using const_iterator = typename container_type::const_iterator;

  V &operator[](const std::string &key)
  {
    auto it = find(key);
    if (it != _items.end())
    {
      return it->second;
    }
    _items.emplace_back(key, V{});
    return _items.back().second;
  }

  /// \brief Insert a member at the end, or replace the value of an existing
  /// member in place. Returns true if the key was new.
  bool insertOrAssign(std::string key, V &&value)
  {
    auto it = find(key);
    if (it != _items.end())
    {
      it->second = std::move(value);
      return false;
    }
    _items.emplace_back(std::move(key), std::move(value));
    return true;
  }

  iterator find(const std::string &key)
  {
    return std::find_if(_items.begin(), _items.end(),
                        [&key](const value_type &item) { return item.first == key; });
  }

  const_iterator find(const std::string &key) const
  {
    return std::find_if(_items.begin(), _items.end(),
                        [&key](const value_type &item) { return item.first == key; });
  }

  std::size_t count(const std::string &key) const { return find(key) != _items.end() ? 1 : 0; }

  std::size_t erase(const std::string &key)
  {
    auto it = find(key);
    if (it == _items.end())
    {
      return 0;
    }
    _items.erase(it);
    return 1;
  }

  const V &at(const std::string &key) const
  {
    auto it = find(key);
    if (it == _items.end())
    {
      throw std::out_of_range("key not found: " + key);
    }
    return it->second;
  }

  std::size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }
  void clear() { _items.clear(); }

  iterator begin() { return _items.begin(); }
  iterator end() { return _items.end(); }
  const_iterator begin() const { return _items.begin(); }
  const_iterator end() const { return _items.end(); }

  /// \brief Member-wise equality; member order is not significant.
  bool operator==(const OrderedMap &other) const
  {
    if (_items.size() != other._items.size())
    {
      return false;
    }
    for (const auto &item : _items)
    {
      auto it = other.find(item.first);
      if (it == other.end() || !(it->second == item.second))
      {
        return false;
      }
    }
    return true;
  }

  bool operator!=(const OrderedMap &other) const { return !(*this == other); }

private:
  container_type _items;
};

struct ParseResult;

// =============================================================
// Json class - main JSON value representation
// =============================================================
class Json
{
public:
  using Array = std::vector<Json>;
  using Object = OrderedMap<Json>;

private:
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
  using Value = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array,
                             Object, RawNumber>;
  Value _value;
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

public:
  // Constructors
  Json() : _value(nullptr) {}
  Json(std::nullptr_t) : _value(nullptr) {}
  Json(bool b) : _value(b) {}
  // Unified integer constructor to avoid overload conflicts
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Json(T i) : _value(static_cast<std::int64_t>(i))
  {
  }
  Json(double d) : _value(d) {}
  Json(const char *s) : _value(std::string(s)) {}
  Json(const std::string &s) : _value(s) {}
  Json(std::string &&s) : _value(std::move(s)) {}
  Json(const Array &a) : _value(a) {}
  Json(Array &&a) : _value(std::move(a)) {}
  Json(const Object &o) : _value(o) {}
  Json(Object &&o) : _value(std::move(o)) {}
  Json(RawNumber n) : _value(std::move(n)) {}

  // Type queries
  JsonType type() const { return static_cast<JsonType>(_value.index()); }

  bool isNull() const { return std::holds_alternative<std::nullptr_t>(_value); }
  bool isBool() const { return std::holds_alternative<bool>(_value); }
  bool isInt() const { return std::holds_alternative<std::int64_t>(_value); }
  bool isDouble() const { return std::holds_alternative<double>(_value); }
  bool isRawNumber() const { return std::holds_alternative<RawNumber>(_value); }
  bool isNumber() const { return isInt() || isDouble() || isRawNumber(); }
  bool isString() const { return std::holds_alternative<std::string>(_value); }
  bool isArray() const { return std::holds_alternative<Array>(_value); }
  bool isObject() const { return std::holds_alternative<Object>(_value); }

  // Value accessors
  bool getBool() const { return std::get<bool>(_value); }
  std::int64_t getInt() const { return std::get<std::int64_t>(_value); }
  double getDouble() const { return std::get<double>(_value); }
  const RawNumber &getRawNumber() const { return std::get<RawNumber>(_value); }
  const std::string &getString() const { return std::get<std::string>(_value); }
  const Array &getArray() const { return std::get<Array>(_value); }
  const Object &getObject() const { return std::get<Object>(_value); }

  // Mutable accessors
  std::string &getString() { return std::get<std::string>(_value); }
  Array &getArray() { return std::get<Array>(_value); }
  Object &getObject() { return std::get<Object>(_value); }

  // Array operations
  const Json &operator[](std::size_t index) const
  {
    static const Json nullJson;
    if (!isArray() || index >= getArray().size())
    {
      return nullJson;
    }
    return getArray()[index];
  }

  // Object operations
  Json &operator[](const std::string &key)
  {
    if (!isObject())
    {
      _value = Object{};
    }
    return getObject()[key];
  }

  Json &operator[](const char *key) { return operator[](std::string(key)); }

  const Json &operator[](const std::string &key) const
  {
    static const Json nullJson;
    if (!isObject())
    {
      return nullJson;
    }
    auto it = getObject().find(key);
    return (it != getObject().end()) ? it->second : nullJson;
  }

  const Json &operator[](const char *key) const { return operator[](std::string(key)); }

  bool contains(const std::string &key) const
  {
    return isObject() && getObject().find(key) != getObject().end();
  }

  const Json &at(const std::string &key) const
  {
    if (!isObject())
    {
      throw type_error("cannot use at() with non-object");
    }
    auto it = getObject().find(key);
    if (it == getObject().end())
    {
      throw out_of_range("key '" + key + "' not found");
    }
    return it->second;
  }

  const Json &at(std::size_t index) const
  {
    if (!isArray())
    {
      throw type_error("cannot use at() with non-array");
    }
    if (index >= getArray().size())
    {
      throw out_of_range("array index " + std::to_string(index) + " is out of range");
    }
    return getArray()[index];
  }

  std::size_t size() const
  {
    if (isArray())
      return getArray().size();
    if (isObject())
      return getObject().size();
    if (isNull())
      return 0;
    return 1;
  }

  bool empty() const
  {
    if (isArray())
      return getArray().empty();
    if (isObject())
      return getObject().empty();
    return isNull();
  }

  void push_back(Json &&val)
  {
    if (!isArray())
    {
      _value = Array{};
    }
    getArray().push_back(std::move(val));
  }

  // Serialization
  std::string serialize(const SerializeOptions &options = {}) const
  {
    std::string out;
    _serialize(options, 0, out);
    return out;
  }

  /// \brief Serialize; a non-negative \p indent pretty-prints with that many
  /// \p indentChar per level.
  std::string dump(int indent = -1, char indentChar = ' ', bool sortKeys = false) const
  {
    SerializeOptions opts;
    if (indent >= 0)
    {
      opts.pretty = true;
      opts.indent = std::string(static_cast<std::size_t>(indent), indentChar);
    }
    opts.sortKeys = sortKeys;
    return serialize(opts);
  }

  static ParseResult parse(std::string_view text, const ParseLimits &limits = ParseLimits{});
  static Json parseOrThrow(std::string_view text, const ParseLimits &limits = {});

  static Json object() { return Json(Object{}); }
  static Json array() { return Json(Array{}); }

  bool operator==(const Json &other) const { return _value == other._value; }
  bool operator!=(const Json &other) const { return !(*this == other); }

  // Exception types for JSON operations
  class parse_error : public std::runtime_error
  {
  public:
    explicit parse_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  class type_error : public std::runtime_error
  {
  public:
    explicit type_error(const std::string &msg) : std::runtime_error(msg) {}
  };

  class out_of_range : public std::out_of_range
  {
  public:
    explicit out_of_range(const std::string &msg) : std::out_of_range(msg) {}
  };

  /// \brief Shortest text that reads back as \p d, in Python's repr style:
  /// fixed notation for decimal exponents in [-4, 16) with at least one
  /// fractional digit, scientific notation otherwise.
  static std::string formatDouble(double d)
  {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    std::size_t ePos = sci.find('e');
    if (ePos == std::string::npos)
    {
      return sci; // inf / nan; never produced by the parser
    }
    int exponent = std::atoi(sci.c_str() + ePos + 1);
    if (exponent < -4 || exponent >= 16)
    {
      return sci;
    }

    std::string sign;
    std::size_t start = 0;
    if (sci[0] == '-')
    {
      sign = "-";
      start = 1;
    }
    std::string digits;
    for (std::size_t i = start; i < ePos; ++i)
    {
      if (sci[i] != '.')
      {
        digits.push_back(sci[i]);
      }
    }

    std::string out = sign;
    if (exponent < 0)
    {
      out += "0.";
      out.append(static_cast<std::size_t>(-exponent - 1), '0');
      out += digits;
    }
    else
    {
      std::size_t intLen = static_cast<std::size_t>(exponent) + 1;
      if (digits.size() <= intLen)
      {
        out += digits;
        out.append(intLen - digits.size(), '0');
        out += ".0";
      }
      else
      {
        out += digits.substr(0, intLen);
        out += '.';
        out += digits.substr(intLen);
      }
    }
    return out;
  }

  /// \brief Quote and escape a string. Only '"', '\\' and control
  /// characters are escaped; everything else, UTF-8 included, is copied.
  static void escapeString(const std::string &str, std::string &out)
  {
    out.push_back('"');
    for (char c : str)
    {
      switch (c)
      {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 32)
        {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          out += buf;
        }
        else
        {
          out.push_back(c);
        }
      }
    }
    out.push_back('"');
  }

private:
  static void _newline(const SerializeOptions &options, int depth, std::string &out)
  {
    if (!options.pretty)
    {
      return;
    }
    out.push_back('\n');
    for (int j = 0; j < depth; ++j)
    {
      out += options.indent;
    }
  }

  void _serialize(const SerializeOptions &options, int depth, std::string &out) const
  {
    switch (type())
    {
    case JsonType::Null:
      out += "null";
      break;
    case JsonType::Boolean:
      out += getBool() ? "true" : "false";
      break;
    case JsonType::Int:
      out += std::to_string(getInt());
      break;
    case JsonType::Double:
      out += formatDouble(getDouble());
      break;
    case JsonType::RawNumber:
      out += getRawNumber().text;
      break;
    case JsonType::String:
      escapeString(getString(), out);
      break;
    case JsonType::Array:
      _serializeArray(options, depth, out);
      break;
    case JsonType::Object:
      _serializeObject(options, depth, out);
      break;
    }
  }

  void _serializeArray(const SerializeOptions &options, int depth, std::string &out) const
  {
    const auto &arr = getArray();
    if (arr.empty())
    {
      out += "[]";
      return;
    }

    out.push_back('[');
    for (std::size_t i = 0; i < arr.size(); ++i)
    {
      if (i > 0)
      {
        out.push_back(',');
      }
      _newline(options, depth + 1, out);
      arr[i]._serialize(options, depth + 1, out);
    }
    _newline(options, depth, out);
    out.push_back(']');
  }

  void _serializeObject(const SerializeOptions &options, int depth, std::string &out) const
  {
    const auto &obj = getObject();
    if (obj.empty())
    {
      out += "{}";
      return;
    }

    std::vector<const Object::value_type *> members;
    members.reserve(obj.size());
    for (const auto &member : obj)
    {
      members.push_back(&member);
    }
    if (options.sortKeys)
    {
      std::stable_sort(members.begin(), members.end(),
                       [](const Object::value_type *a, const Object::value_type *b)
                       { return a->first < b->first; });
    }

    out.push_back('{');
    for (std::size_t i = 0; i < members.size(); ++i)
    {
      if (i > 0)
      {
        out.push_back(',');
      }
      _newline(options, depth + 1, out);
      escapeString(members[i]->first, out);
      out += options.pretty ? ": " : ":";
      members[i]->second._serialize(options, depth + 1, out);
    }
    _newline(options, depth, out);
    out.push_back('}');
  }
};

/// \brief Result of a non-throwing parse operation.
struct ParseResult
{
  Json value;      ///< Parsed JSON value (null if ok == false)
  bool ok{false};  ///< True if parsing succeeded
  JsonError error; ///< Error info when ok == false
};

// =============================================================
// JSON Parser implementation
// =============================================================
class JsonParser
{
public:
  explicit JsonParser(std::string_view text, const ParseLimits &limits)
      : _text(text), _pos(0), _limits(limits)
  {
  }

  ParseResult parse()
  {
    ParseResult result;
    _skipWhitespace();

    if (_pos >= _text.size())
    {
      result.error.message = "Unexpected end of input";
      result.error.where = _getLocation();
      return result;
    }

    if (_parseValue(result.value, 0U))
    {
      _skipWhitespace();
      if (_pos < _text.size())
      {
        result.value = Json();
        result.error.message = "Extra characters after JSON value";
        result.error.where = _getLocation();
        return result;
      }
      result.ok = true;
    }
    else
    {
      result.value = Json();
      result.error.message = _error.empty() ? "Parse error" : _error;
      result.error.where = _getLocation();
    }

    return result;
  }

private:
  std::string_view _text;
  std::size_t _pos;
  ParseLimits _limits;
  std::string _error;

  JsonLocation _getLocation() const
  {
    JsonLocation loc;
    loc.offset = _pos;
    for (std::size_t i = 0; i < _pos && i < _text.size(); ++i)
    {
      if (_text[i] == '\n')
      {
        ++loc.line;
        loc.column = 1;
      }
      else
      {
        ++loc.column;
      }
    }
    return loc;
  }

  bool _fail(const char *message)
  {
    _error = message;
    return false;
  }

  static bool _isDigit(char c) { return c >= '0' && c <= '9'; }

  void _skipWhitespace()
  {
    while (_pos < _text.size() &&
           (_text[_pos] == ' ' || _text[_pos] == '\t' || _text[_pos] == '\n' ||
            _text[_pos] == '\r'))
    {
      ++_pos;
    }
  }

  bool _parseValue(Json &out, std::size_t depth)
  {
    if (depth > _limits.depthMax)
    {
      return _fail("Maximum nesting depth exceeded");
    }

    _skipWhitespace();
    if (_pos >= _text.size())
    {
      return _fail("Unexpected end of input");
    }

    char c = _text[_pos];
    switch (c)
    {
    case 'n':
      return _parseLiteral("null", Json(), out);
    case 't':
      return _parseLiteral("true", Json(true), out);
    case 'f':
      return _parseLiteral("false", Json(false), out);
    case '"':
    {
      std::string str;
      if (!_parseString(str))
      {
        return false;
      }
      out = Json(std::move(str));
      return true;
    }
    case '[':
      return _parseArray(out, depth);
    case '{':
      return _parseObject(out, depth);
    default:
      if (c == '-' || _isDigit(c))
      {
        return _parseNumber(out);
      }
      return _fail("Unexpected character");
    }
  }

  bool _parseLiteral(std::string_view word, Json value, Json &out)
  {
    if (_text.substr(_pos, word.size()) == word)
    {
      _pos += word.size();
      out = std::move(value);
      return true;
    }
    return _fail("Invalid literal");
  }

  bool _parseNumber(Json &out)
  {
    std::size_t start = _pos;
    if (_text[_pos] == '-')
      ++_pos;

    if (_pos >= _text.size() || !_isDigit(_text[_pos]))
    {
      return _fail("Invalid number format");
    }

    // Integer part; a leading zero may not be followed by more digits
    if (_text[_pos] == '0')
    {
      ++_pos;
    }
    else
    {
      while (_pos < _text.size() && _isDigit(_text[_pos]))
      {
        ++_pos;
      }
    }

    bool isInteger = true;
    if (_pos < _text.size() && _text[_pos] == '.')
    {
      isInteger = false;
      ++_pos;
      if (_pos >= _text.size() || !_isDigit(_text[_pos]))
      {
        return _fail("Invalid number format");
      }
      while (_pos < _text.size() && _isDigit(_text[_pos]))
      {
        ++_pos;
      }
    }

    if (_pos < _text.size() && (_text[_pos] == 'e' || _text[_pos] == 'E'))
    {
      isInteger = false;
      ++_pos;
      if (_pos < _text.size() && (_text[_pos] == '+' || _text[_pos] == '-'))
      {
        ++_pos;
      }
      if (_pos >= _text.size() || !_isDigit(_text[_pos]))
      {
        return _fail("Invalid number format");
      }
      while (_pos < _text.size() && _isDigit(_text[_pos]))
      {
        ++_pos;
      }
    }

    std::string_view numStr = _text.substr(start, _pos - start);

    if (isInteger)
    {
      std::int64_t i = 0;
      auto result = std::from_chars(numStr.data(), numStr.data() + numStr.size(), i);
      if (result.ec == std::errc{})
      {
        out = Json(i);
      }
      else
      {
        out = Json(RawNumber{std::string(numStr)});
      }
      return true;
    }

    double d = std::strtod(std::string(numStr).c_str(), nullptr);
    if (std::isinf(d))
    {
      out = Json(RawNumber{std::string(numStr)});
    }
    else
    {
      out = Json(d);
    }
    return true;
  }

  bool _parseHex4(std::uint32_t &code)
  {
    if (_pos + 4 > _text.size())
    {
      return _fail("Incomplete unicode escape");
    }
    code = 0;
    for (std::size_t i = 0; i < 4; ++i)
    {
      char c = _text[_pos + i];
      std::uint32_t v = 0;
      if (c >= '0' && c <= '9')
        v = static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f')
        v = static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        v = static_cast<std::uint32_t>(c - 'A' + 10);
      else
        return _fail("Invalid unicode escape");
      code = (code << 4) | v;
    }
    _pos += 4;
    return true;
  }

  static void _appendUtf8(std::uint32_t cp, std::string &out)
  {
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
  }

  // _pos is just past "\u"
  bool _parseUnicodeEscape(std::string &str)
  {
    std::uint32_t code = 0;
    if (!_parseHex4(code))
    {
      return false;
    }
    if (code >= 0xDC00u && code <= 0xDFFFu)
    {
      return _fail("Unpaired low surrogate in unicode escape");
    }
    if (code >= 0xD800u && code <= 0xDBFFu)
    {
      if (_pos + 2 > _text.size() || _text[_pos] != '\\' || _text[_pos + 1] != 'u')
      {
        return _fail("Unpaired high surrogate in unicode escape");
      }
      _pos += 2;
      std::uint32_t low = 0;
      if (!_parseHex4(low))
      {
        return false;
      }
      if (low < 0xDC00u || low > 0xDFFFu)
      {
        return _fail("Invalid low surrogate in unicode escape");
      }
      code = 0x10000u + ((code - 0xD800u) << 10) + (low - 0xDC00u);
    }
    _appendUtf8(code, str);
    return true;
  }

  bool _parseString(std::string &str)
  {
    if (_pos >= _text.size() || _text[_pos] != '"')
    {
      return _fail("Expected '\"'");
    }
    ++_pos;

    while (_pos < _text.size() && _text[_pos] != '"')
    {
      if (str.size() > _limits.stringLengthMax)
      {
        return _fail("String length exceeds limit");
      }

      char c = _text[_pos];
      if (static_cast<unsigned char>(c) < 0x20)
      {
        return _fail("Invalid control character in string");
      }
      if (c != '\\')
      {
        str.push_back(c);
        ++_pos;
        continue;
      }

      ++_pos;
      if (_pos >= _text.size())
      {
        return _fail("Unexpected end of string");
      }
      char esc = _text[_pos++];
      switch (esc)
      {
      case '"':
        str.push_back('"');
        break;
      case '\\':
        str.push_back('\\');
        break;
      case '/':
        str.push_back('/');
        break;
      case 'b':
        str.push_back('\b');
        break;
      case 'f':
        str.push_back('\f');
        break;
      case 'n':
        str.push_back('\n');
        break;
      case 'r':
        str.push_back('\r');
        break;
      case 't':
        str.push_back('\t');
        break;
      case 'u':
        if (!_parseUnicodeEscape(str))
        {
          return false;
        }
        break;
      default:
        --_pos;
        return _fail("Invalid escape sequence");
      }
    }

    if (_pos >= _text.size())
    {
      return _fail("Unterminated string");
    }

    ++_pos; // closing quote
    return true;
  }

  bool _parseArray(Json &out, std::size_t depth)
  {
    ++_pos; // '['

    Json::Array arr;
    _skipWhitespace();

    if (_pos < _text.size() && _text[_pos] == ']')
    {
      ++_pos;
      out = Json(std::move(arr));
      return true;
    }

    while (true)
    {
      if (arr.size() >= _limits.arrayItemsMax)
      {
        return _fail("Array size exceeds limit");
      }

      Json element;
      if (!_parseValue(element, depth + 1))
      {
        return false;
      }
      arr.push_back(std::move(element));

      _skipWhitespace();
      if (_pos >= _text.size())
      {
        return _fail("Unexpected end of array");
      }

      if (_text[_pos] == ']')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
      {
        return _fail("Expected ',' or ']'");
      }
      ++_pos;
    }

    out = Json(std::move(arr));
    return true;
  }

  bool _parseObject(Json &out, std::size_t depth)
  {
    ++_pos; // '{'

    Json::Object obj;
    _skipWhitespace();

    if (_pos < _text.size() && _text[_pos] == '}')
    {
      ++_pos;
      out = Json(std::move(obj));
      return true;
    }

    while (true)
    {
      if (obj.size() >= _limits.membersMax)
      {
        return _fail("Object size exceeds limit");
      }

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != '"')
      {
        return _fail("Expected string key");
      }
      std::string key;
      if (!_parseString(key))
      {
        return false;
      }

      _skipWhitespace();
      if (_pos >= _text.size() || _text[_pos] != ':')
      {
        return _fail("Expected ':'");
      }
      ++_pos;

      Json value;
      if (!_parseValue(value, depth + 1))
      {
        return false;
      }
      obj.insertOrAssign(std::move(key), std::move(value));

      _skipWhitespace();
      if (_pos >= _text.size())
      {
        return _fail("Unexpected end of object");
      }

      if (_text[_pos] == '}')
      {
        ++_pos;
        break;
      }
      if (_text[_pos] != ',')
      {
        return _fail("Expected ',' or '}'");
      }
      ++_pos;
    }

    out = Json(std::move(obj));
    return true;
  }
};

inline ParseResult Json::parse(std::string_view text, const ParseLimits &limits)
{
  JsonParser parser(text, limits);
  return parser.parse();
}

inline Json Json::parseOrThrow(std::string_view text, const ParseLimits &limits)
{
  auto result = parse(text, limits);
  if (!result.ok)
  {
    throw parse_error("JSON parse error at line " + std::to_string(result.error.where.line) +
                      ", column " + std::to_string(result.error.where.column) + ": " +
                      result.error.message);
  }
  return std::move(result.value);
}

} // namespace parsers
} // namespace reindent
