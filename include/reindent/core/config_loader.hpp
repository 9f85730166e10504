// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Reindent, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <reindent/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace reindent
{
namespace core
{
/// \brief Loads and parses TOML configuration files for the application.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Reloads the configuration from disk. On failure the previous
  /// table is cleared and lastError() describes the problem.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _lastError.clear();
      return true;
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _lastError = e.what();
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (_table.empty())
    {
      if (!reload())
      {
        throw std::runtime_error("Failed to load configuration file " + _filename + ": " +
                                 _lastError);
      }
    }
    return _table;
  }

  const std::string &filename() const { return _filename; }

  const std::string &lastError() const { return _lastError; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T Must be a TOML native type (int64_t, double, bool,
  /// std::string)
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      if (auto val = node.as<T>())
      {
        return val;
      }
    }
    return std::nullopt;
  }

  /// \brief Gets an int value from the configuration.
  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  /// \brief Gets a bool value from the configuration.
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  /// \brief Gets a string value from the configuration.
  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an indentation unit. An integer value is a width in spaces,
  /// a string value is used literally.
  /// \throws std::runtime_error for negative widths or other value types.
  std::optional<std::string> getIndent(const std::string &key) const
  {
    auto node = _table.at_path(key);
    if (!node)
    {
      return std::nullopt;
    }
    if (auto width = node.as<int64_t>())
    {
      if (*width < 0)
      {
        throw std::runtime_error("ConfigLoader: '" + key + "' must not be negative");
      }
      return std::string(static_cast<std::size_t>(*width), ' ');
    }
    if (auto literal = node.as<std::string>())
    {
      return literal;
    }
    throw std::runtime_error("ConfigLoader: '" + key + "' must be an integer or a string");
  }

private:
  std::string _filename;
  std::string _lastError;
  parsers::toml::table _table;
};

} // namespace core
} // namespace reindent
