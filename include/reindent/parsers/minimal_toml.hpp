// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace reindent
{
namespace parsers
{
namespace toml
{

class table;
class array;
class node;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Thrown for malformed TOML; the message carries the line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &msg, std::size_t line)
      : std::runtime_error("line " + std::to_string(line) + ": " + msg), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type &&val) { _values.push_back(std::move(val)); }

  size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  const value_type &operator[](size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(const value_type &val) : _value(val) {}
  node(value_type &&val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto *val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return is_value(); }

  const value_type &get_value() const { return _value; }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Look up a dotted path ("format.json_indent"); returns an empty
  /// node when any segment is missing.
  node at_path(const std::string &dottedPath) const
  {
    std::vector<std::string> parts;
    std::stringstream ss(dottedPath);
    std::string part;
    while (std::getline(ss, part, '.'))
      parts.push_back(part);

    const table *current = this;
    for (size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
        return node();

      if (i == parts.size() - 1)
        return it->second;

      current = it->second.as_table();
      if (!current)
        return node();
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node &&value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by configuration files: tables,
/// dotted table headers, bare keys, basic and literal strings, integers,
/// floats, booleans, single-line arrays and '#' comments.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)), _pos(0) {}

  table parse()
  {
    table root;
    table *currentTable = &root;

    skipWhitespaceAndComments();
    while (!isEnd())
    {
      if (peek() == '[')
      {
        currentTable = ensureTable(&root, parseSection());
      }
      else
      {
        auto [key, value] = parseKeyValue();
        if (currentTable->contains(key))
          fail("duplicate key '" + key + "'");
        currentTable->insert(key, std::move(value));
      }
      skipTrailing();
      skipWhitespaceAndComments();
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos;
  size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, _line); }

  void skipWhitespace()
  {
    while (!isEnd() && (peek() == ' ' || peek() == '\t'))
      advance();
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        advance();
      }
      else if (c == '#')
      {
        while (!isEnd() && peek() != '\n')
          advance();
      }
      else
      {
        break;
      }
    }
  }

  // After a key/value or header only a comment may follow on the same line.
  void skipTrailing()
  {
    skipWhitespace();
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
    if (!isEnd() && peek() != '\n' && peek() != '\r')
      fail("unexpected text after value");
  }

  std::string parseSection()
  {
    advance(); // '['
    std::string section;
    while (!isEnd() && peek() != ']' && peek() != '\n')
    {
      char c = advance();
      if (c != ' ' && c != '\t')
        section += c;
    }
    if (peek() != ']')
      fail("unterminated table header");
    advance();
    if (section.empty())
      fail("empty table header");
    return section;
  }

  std::pair<std::string, node> parseKeyValue()
  {
    std::string key = parseKey();
    if (key.empty())
      fail("expected key");

    skipWhitespace();
    if (peek() != '=')
      fail("expected '=' after key '" + key + "'");
    advance();
    skipWhitespace();

    return {key, parseValue()};
  }

  std::string parseKey()
  {
    if (peek() == '"' || peek() == '\'')
      return parseString();
    std::string key;
    while (!isEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                        peek() == '-'))
    {
      key += advance();
    }
    return key;
  }

  node parseValue()
  {
    char c = peek();

    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == '[')
      return node(parseArray());
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return node(parseNumber());
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    bool literal = (quote == '\'');
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      if (!literal && peek() == '\\')
      {
        advance();
        char c = advance();
        switch (c)
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        case '\\':
          str += '\\';
          break;
        case '"':
          str += '"';
          break;
        default:
          fail(std::string("invalid escape '\\") + c + "'");
        }
      }
      else
      {
        str += advance();
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipWhitespaceAndComments();

    while (!isEnd() && peek() != ']')
    {
      node element = parseValue();
      arr->push_back(value_type(element.get_value()));
      skipWhitespaceAndComments();
      if (peek() == ',')
      {
        advance();
        skipWhitespaceAndComments();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }

    if (peek() != ']')
      fail("unterminated array");
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (!isEnd() && std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();

    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;

    if (peek() == '+' || peek() == '-')
      num += advance();

    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
      }
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && !num.empty() && (num.back() == 'e' || num.back() == 'E')))
      {
        break;
      }
      num += advance();
    }

    try
    {
      std::size_t used = 0;
      if (isFloat)
      {
        double d = std::stod(num, &used);
        if (used == num.size())
          return d;
      }
      else
      {
        long long i = std::stoll(num, &used);
        if (used == num.size())
          return static_cast<int64_t>(i);
      }
    }
    catch (const std::exception &)
    {
      // fall through to the error below
    }
    fail("invalid number: " + num);
  }

  table *ensureTable(table *root, const std::string &path)
  {
    std::stringstream ss(path);
    std::string part;

    table *current = root;
    while (std::getline(ss, part, '.'))
    {
      if (part.empty())
        fail("invalid table header: " + path);
      if (!current->contains(part))
      {
        current->insert(part, node(value_type(std::make_shared<table>())));
      }
      current = (*current)[part].as_table();
      if (!current)
        fail("key '" + part + "' is not a table");
    }
    return current;
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace reindent
