// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xbelscrub, which is licensed under the Mozilla Public
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
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace xbelscrub
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

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }

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
  node(value_type val) : _value(std::move(val)) {}

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

  /// \brief Look up "a.b.c"; returns an empty node when any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::stringstream ss(dottedPath);
    std::string part;
    std::vector<std::string> parts;
    while (std::getline(ss, part, '.'))
      parts.push_back(part);

    for (size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
        return node();
      if (i + 1 == parts.size())
        return it->second;
      current = it->second.as_table();
      if (!current)
        return node();
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  /// Returns false when the key already exists.
  bool insert(const std::string &key, node value)
  {
    return _values.emplace(key, std::move(value)).second;
  }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by configuration files: [dotted.sections], bare or
/// dotted keys, basic and literal strings, integers, floats, booleans, arrays, # comments.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    while (true)
    {
      skipWhitespaceAndComments();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        current = ensureTable(&root, parseSection());
      }
      else
      {
        parseKeyValue(*current);
      }
      expectLineEnd();
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos{0};
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

  [[noreturn]] void error(const std::string &what) const
  {
    throw std::runtime_error("TOML parse error at line " + std::to_string(_line) + ": " + what);
  }

  void skipWhitespace()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  void skipComment()
  {
    while (!isEnd() && peek() != '\n')
      advance();
  }

  void expectLineEnd()
  {
    skipWhitespace();
    if (peek() == '#')
      skipComment();
    if (!isEnd() && peek() != '\n' && peek() != '\r')
      error("unexpected trailing characters");
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
      error("unterminated section header");
    advance();
    if (section.empty())
      error("empty section name");
    return section;
  }

  void parseKeyValue(table &target)
  {
    std::string key;
    while (!isEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                        peek() == '-' || peek() == '.'))
    {
      key += advance();
    }
    if (key.empty())
      error("expected key");

    skipWhitespace();
    if (peek() != '=')
      error("expected '=' after key '" + key + "'");
    advance();
    skipWhitespace();

    table *owner = &target;
    size_t dot = key.rfind('.');
    if (dot != std::string::npos)
    {
      owner = ensureTable(&target, key.substr(0, dot));
      key = key.substr(dot + 1);
    }
    if (!owner->insert(key, node(parseValue())))
      error("duplicate key '" + key + "'");
  }

  value_type parseValue()
  {
    skipWhitespace();
    char c = peek();
    if (c == '"')
      return parseBasicString();
    if (c == '\'')
      return parseLiteralString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    error("invalid value");
  }

  std::string parseBasicString()
  {
    advance(); // '"'
    std::string str;
    while (!isEnd() && peek() != '"' && peek() != '\n')
    {
      if (peek() != '\\')
      {
        str += advance();
        continue;
      }
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
        error(std::string("unsupported escape '\\") + c + "'");
      }
    }
    if (peek() != '"')
      error("unterminated string");
    advance();
    return str;
  }

  std::string parseLiteralString()
  {
    advance(); // '\''
    std::string str;
    while (!isEnd() && peek() != '\'' && peek() != '\n')
      str += advance();
    if (peek() != '\'')
      error("unterminated string");
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
      arr->push_back(parseValue());
      skipWhitespaceAndComments();
      if (peek() == ',')
      {
        advance();
        skipWhitespaceAndComments();
      }
      else if (peek() != ']')
      {
        error("expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
      error("unterminated array");
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    error("invalid boolean value: " + word);
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
        isFloat = true;
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && (num.back() == 'e' || num.back() == 'E')))
        break;
      num += advance();
    }
    try
    {
      if (isFloat)
        return std::stod(num);
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      error("invalid number: " + num);
    }
  }

  table *ensureTable(table *root, const std::string &path)
  {
    std::stringstream ss(path);
    std::string key;
    table *current = root;
    while (std::getline(ss, key, '.'))
    {
      if (key.empty())
        error("invalid table path: " + path);
      if (!current->contains(key))
        current->insert(key, node(std::make_shared<table>()));
      current = (*current)[key].as_table();
      if (!current)
        error("key '" + key + "' is not a table in: " + path);
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
} // namespace xbelscrub
